#include "penalty_tracker.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace {

const double CLUSTER_THRESHOLD_FACTOR = 1.25;

void tick_map(std::map<std::string, int>& cooldowns, const char* label) {
    for (auto it = cooldowns.begin(); it != cooldowns.end();) {
        if (it->second > 0) it->second--;
        if (it->second <= 0) {
            std::cout << "✅ Cooldown ended for " << label << " " << it->first << std::endl;
            it = cooldowns.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace

PenaltyTracker::PenaltyTracker(const PenaltyConfig& config, const std::string& state_path)
    : Persistable("penalty_tracker", 1, state_path), config_(config) {}

double PenaltyTracker::score(const TradeOutcome& t) const {
    double penalty = 0.0;

    // Confident losses hurt the most
    if (!t.is_win()) {
        double p = t.effective_confidence();
        penalty += config_.w_conf * p * p;
    }
    if (t.stop_hit) {
        penalty += config_.w_sl;
    }
    if (t.duration_seconds < config_.fast_exit_seconds) {
        penalty += config_.w_fast;
    }
    penalty += config_.w_mae * (std::abs(t.mae_bp) / 100.0);
    return penalty;
}

void PenaltyTracker::update_ewma(const std::string& symbol, const std::string& cluster, double penalty) {
    std::lock_guard<std::mutex> lock(mutex_);
    const double alpha = config_.ewma_alpha;

    auto s = symbol_ewma_.find(symbol);
    if (s == symbol_ewma_.end()) {
        symbol_ewma_[symbol] = penalty;
    } else {
        s->second = alpha * penalty + (1.0 - alpha) * s->second;
    }

    if (!cluster.empty()) {
        auto c = cluster_ewma_.find(cluster);
        if (c == cluster_ewma_.end()) {
            cluster_ewma_[cluster] = penalty;
        } else {
            c->second = alpha * penalty + (1.0 - alpha) * c->second;
        }
    }

    last_update_ms_ = now_ms();
    check_cooldown_triggers(symbol, cluster);
}

void PenaltyTracker::check_cooldown_triggers(const std::string& symbol, const std::string& cluster) {
    auto s = symbol_ewma_.find(symbol);
    if (s != symbol_ewma_.end() && s->second > config_.cooldown_threshold) {
        auto cd = symbol_cooldowns_.find(symbol);
        // An active cooldown is neither extended nor restacked
        if (cd == symbol_cooldowns_.end() || cd->second == 0) {
            symbol_cooldowns_[symbol] = config_.cooldown_cycles;
            std::cout << "🚫 Cooldown: " << symbol << " for " << config_.cooldown_cycles << " cycles"
                      << std::fixed << std::setprecision(2)
                      << " (penalty=" << s->second << " > " << config_.cooldown_threshold << ")" << std::endl;
        }
    }

    if (cluster.empty()) return;
    const double cluster_threshold = config_.cooldown_threshold * CLUSTER_THRESHOLD_FACTOR;
    auto c = cluster_ewma_.find(cluster);
    if (c != cluster_ewma_.end() && c->second > cluster_threshold) {
        auto cd = cluster_cooldowns_.find(cluster);
        if (cd == cluster_cooldowns_.end() || cd->second == 0) {
            cluster_cooldowns_[cluster] = config_.cooldown_cycles;
            std::cout << "🚫 Cluster cooldown: " << cluster << " for " << config_.cooldown_cycles << " cycles"
                      << std::fixed << std::setprecision(2)
                      << " (penalty=" << c->second << " > " << cluster_threshold << ")" << std::endl;
        }
    }
}

bool PenaltyTracker::is_cooling_down(const std::string& symbol, const std::string& cluster) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto s = symbol_cooldowns_.find(symbol);
    if (s != symbol_cooldowns_.end() && s->second > 0) return true;

    if (!cluster.empty()) {
        auto c = cluster_cooldowns_.find(cluster);
        if (c != cluster_cooldowns_.end() && c->second > 0) return true;
    }
    return false;
}

CooldownSet PenaltyTracker::cooldown_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CooldownSet set;
    for (const auto& [symbol, cycles] : symbol_cooldowns_) {
        if (cycles > 0) set.symbols.insert(symbol);
    }
    for (const auto& [cluster, cycles] : cluster_cooldowns_) {
        if (cycles > 0) set.clusters.insert(cluster);
    }
    return set;
}

void PenaltyTracker::tick_cooldowns() {
    std::lock_guard<std::mutex> lock(mutex_);
    tick_map(symbol_cooldowns_, "symbol");
    tick_map(cluster_cooldowns_, "cluster");
}

double PenaltyTracker::symbol_penalty(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = symbol_ewma_.find(symbol);
    return it != symbol_ewma_.end() ? it->second : 0.0;
}

double PenaltyTracker::cluster_penalty(const std::string& cluster) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cluster_ewma_.find(cluster);
    return it != cluster_ewma_.end() ? it->second : 0.0;
}

std::map<std::string, double> PenaltyTracker::cluster_penalties() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cluster_ewma_;
}

std::vector<std::pair<std::string, double>> PenaltyTracker::top_penalties(size_t n) const {
    std::vector<std::pair<std::string, double>> sorted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sorted.assign(symbol_ewma_.begin(), symbol_ewma_.end());
    }
    std::sort(sorted.begin(), sorted.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });
    if (sorted.size() > n) sorted.resize(n);
    return sorted;
}

std::vector<std::string> PenaltyTracker::active_cooldowns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> active;
    for (const auto& [symbol, cycles] : symbol_cooldowns_) {
        if (cycles > 0) active.push_back("Symbol:" + symbol);
    }
    for (const auto& [cluster, cycles] : cluster_cooldowns_) {
        if (cycles > 0) active.push_back("Cluster:" + cluster);
    }
    return active;
}

int PenaltyTracker::symbol_cooldown_remaining(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = symbol_cooldowns_.find(symbol);
    return it != symbol_cooldowns_.end() ? it->second : 0;
}

int PenaltyTracker::cluster_cooldown_remaining(const std::string& cluster) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cluster_cooldowns_.find(cluster);
    return it != cluster_cooldowns_.end() ? it->second : 0;
}

void PenaltyTracker::reset() {
    reset_state();
    std::cout << "🔄 Penalty tracker reset" << std::endl;
}

json PenaltyTracker::to_state_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json state;
    state["symbol_ewma"] = symbol_ewma_;
    state["cluster_ewma"] = cluster_ewma_;
    state["symbol_cooldowns"] = symbol_cooldowns_;
    state["cluster_cooldowns"] = cluster_cooldowns_;
    state["last_update"] = last_update_ms_;
    return state;
}

void PenaltyTracker::from_state_json(const json& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    symbol_ewma_ = state.value("symbol_ewma", std::map<std::string, double>());
    cluster_ewma_ = state.value("cluster_ewma", std::map<std::string, double>());
    symbol_cooldowns_ = state.value("symbol_cooldowns", std::map<std::string, int>());
    cluster_cooldowns_ = state.value("cluster_cooldowns", std::map<std::string, int>());
    last_update_ms_ = state.value("last_update", static_cast<int64_t>(0));

    std::cout << "✅ Loaded penalty state: " << symbol_ewma_.size() << " symbols, "
              << cluster_ewma_.size() << " clusters, "
              << symbol_cooldowns_.size() + cluster_cooldowns_.size() << " active cooldowns" << std::endl;
}

void PenaltyTracker::reset_state() {
    std::lock_guard<std::mutex> lock(mutex_);
    symbol_ewma_.clear();
    cluster_ewma_.clear();
    symbol_cooldowns_.clear();
    cluster_cooldowns_.clear();
    last_update_ms_ = 0;
}
