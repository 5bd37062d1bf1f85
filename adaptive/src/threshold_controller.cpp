#include "threshold_controller.hpp"
#include "outcome_store.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace {

double lookup_or(const std::map<std::string, double>& m, const std::string& key, double fallback) {
    auto it = m.find(key);
    return it != m.end() ? it->second : fallback;
}

std::string describe_move(double from, double to, const std::string& why) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << from << " -> " << to;
    if (!why.empty()) ss << " (" << why << ")";
    return ss.str();
}

std::string pct(double x) {
    std::ostringstream ss;
    ss << "WR=" << std::fixed << std::setprecision(1) << x * 100.0 << "%";
    return ss.str();
}

const int64_t MS_PER_HOUR = 3600LL * 1000LL;

}  // namespace

double ThresholdSet::effective(Side side, const std::string& timeframe, const std::string& cluster) const {
    double tau_s = lookup_or(tau_side, side_name(side), tau_global);
    double tau_t = lookup_or(tau_tf, timeframe, tau_global);
    double tau_c = lookup_or(tau_cluster, cluster, tau_global);
    return std::max({tau_global, tau_s, tau_t, tau_c});
}

json threshold_set_to_json(const ThresholdSet& set) {
    json j;
    j["tau_global"] = set.tau_global;
    j["tau_side"] = set.tau_side;
    j["tau_tf"] = set.tau_tf;
    j["tau_cluster"] = set.tau_cluster;
    return j;
}

ThresholdController::ThresholdController(const ThresholdConfig& config, const std::string& state_path)
    : Persistable("threshold_controller", 1, state_path),
      config_(config),
      set_(initial_set()),
      last_update_ms_(now_ms()) {}

std::shared_ptr<const ThresholdSet> ThresholdController::initial_set() const {
    auto set = std::make_shared<ThresholdSet>();
    set->tau_global = config_.tau_global_init;
    set->tau_side = config_.tau_side_init;
    set->tau_tf = config_.tau_tf_init;
    return set;
}

double ThresholdController::clamp(double tau) const {
    return std::max(config_.tau_min, std::min(config_.tau_max, tau));
}

std::shared_ptr<const ThresholdSet> ThresholdController::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_;
}

json ThresholdController::update(const OutcomeStore& store,
                                 const std::map<std::string, double>& cluster_penalties) {
    std::cout << "🎚️ UPDATING THRESHOLDS..." << std::endl;

    int seen = 0;
    ThresholdSet next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seen = trades_since_update_;
        next = *set_;
    }
    json changes = json::object();
    const int window = config_.min_trades_for_update;

    // 1. Global: target 70-80% win rate
    TradeStatistics global = store.statistics(window);
    if (global.count >= config_.min_trades_for_update) {
        double old_tau = next.tau_global;
        if (global.win_rate < 0.70) {
            next.tau_global += 0.02;
        } else if (global.win_rate > 0.80) {
            next.tau_global -= 0.01;
        }
        next.tau_global = clamp(next.tau_global);
        if (next.tau_global != old_tau) {
            changes["tau_global"] = describe_move(old_tau, next.tau_global, pct(global.win_rate));
        }
    } else {
        std::cout << "⚠️ Insufficient trades for global update: " << global.count << std::endl;
    }

    // 2. Sides: target 65-82%
    json side_changes = json::object();
    for (Side side : {Side::LONG, Side::SHORT}) {
        StatsFilter filter;
        filter.side = side;
        TradeStatistics stats = store.statistics(window, filter);
        if (stats.count < config_.min_trades_per_bucket) continue;

        std::string key = side_name(side);
        double old_tau = lookup_or(next.tau_side, key, next.tau_global);
        double tau = old_tau;
        if (stats.win_rate < 0.65) {
            tau += 0.03;
        } else if (stats.win_rate > 0.82) {
            tau -= 0.02;
        }
        next.tau_side[key] = clamp(tau);
        if (next.tau_side[key] != old_tau) {
            side_changes[key] = describe_move(old_tau, next.tau_side[key], pct(stats.win_rate));
        }
    }
    if (!side_changes.empty()) changes["tau_side"] = side_changes;

    // 3. Timeframes: target 68-80%
    std::set<std::string> timeframes;
    for (const auto& kv : config_.tau_tf_init) timeframes.insert(kv.first);
    for (const auto& tf : store.distinct_values("timeframe")) timeframes.insert(tf);

    json tf_changes = json::object();
    for (const auto& tf : timeframes) {
        StatsFilter filter;
        filter.timeframe = tf;
        TradeStatistics stats = store.statistics(window, filter);
        if (stats.count < config_.min_trades_per_bucket) continue;

        double old_tau = lookup_or(next.tau_tf, tf, next.tau_global);
        double tau = old_tau;
        if (stats.win_rate < 0.68) {
            tau += 0.02;
        } else if (stats.win_rate > 0.80) {
            tau -= 0.01;
        }
        next.tau_tf[tf] = clamp(tau);
        if (next.tau_tf[tf] != old_tau) {
            tf_changes[tf] = describe_move(old_tau, next.tau_tf[tf], pct(stats.win_rate));
        }
    }
    if (!tf_changes.empty()) changes["tau_tf"] = tf_changes;

    // 4. Clusters: penalty driven
    json cluster_changes = json::object();
    for (const auto& [cluster, penalty] : cluster_penalties) {
        double old_tau = lookup_or(next.tau_cluster, cluster, next.tau_global);
        std::ostringstream why;
        why << "penalty=" << std::fixed << std::setprecision(2) << penalty;
        if (penalty > 1.5) {
            next.tau_cluster[cluster] = std::min(config_.tau_max, old_tau + 0.05);
            cluster_changes[cluster] = describe_move(old_tau, next.tau_cluster[cluster], why.str());
        } else if (penalty < 0.8) {
            next.tau_cluster[cluster] = std::max(next.tau_global, old_tau - 0.02);
            if (next.tau_cluster[cluster] != old_tau) {
                cluster_changes[cluster] = describe_move(old_tau, next.tau_cluster[cluster], why.str());
            }
        }
    }
    if (!cluster_changes.empty()) changes["tau_cluster"] = cluster_changes;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_ = std::make_shared<const ThresholdSet>(std::move(next));
        // Trades counted during the update carry over to the next one
        trades_since_update_ = std::max(0, trades_since_update_ - seen);
        last_update_ms_ = now_ms();
    }

    if (changes.empty()) {
        std::cout << "🎚️ No threshold changes needed" << std::endl;
    } else {
        std::cout << "🎚️ Threshold updates:" << std::endl;
        for (auto it = changes.begin(); it != changes.end(); ++it) {
            std::cout << "   " << it.key() << ": " << it.value().dump() << std::endl;
        }
    }
    return changes;
}

double ThresholdController::effective_threshold(Side side, const std::string& timeframe,
                                                const std::string& cluster) const {
    return snapshot()->effective(side, timeframe, cluster);
}

double ThresholdController::global_threshold() const {
    return snapshot()->tau_global;
}

void ThresholdController::increment_trade_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    trades_since_update_++;
}

int ThresholdController::trades_since_update() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_since_update_;
}

bool ThresholdController::should_update(int64_t now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (trades_since_update_ >= config_.min_trades_for_update) return true;
    double hours = static_cast<double>(now - last_update_ms_) / MS_PER_HOUR;
    return hours >= config_.update_interval_hours;
}

int64_t ThresholdController::last_update_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_update_ms_;
}

json ThresholdController::all_thresholds() const {
    json j = threshold_set_to_json(*snapshot());
    std::lock_guard<std::mutex> lock(mutex_);
    j["trades_since_update"] = trades_since_update_;
    j["last_update_time"] = last_update_ms_;
    return j;
}

void ThresholdController::reset() {
    reset_state();
    std::cout << "🔄 Thresholds reset to initial values" << std::endl;
}

json ThresholdController::to_state_json() const {
    return all_thresholds();
}

void ThresholdController::from_state_json(const json& state) {
    auto set = std::make_shared<ThresholdSet>();
    set->tau_global = state.value("tau_global", config_.tau_global_init);
    set->tau_side = state.value("tau_side", config_.tau_side_init);
    set->tau_tf = state.value("tau_tf", config_.tau_tf_init);
    set->tau_cluster = state.value("tau_cluster", std::map<std::string, double>());

    std::lock_guard<std::mutex> lock(mutex_);
    trades_since_update_ = state.value("trades_since_update", 0);
    last_update_ms_ = state.value("last_update_time", now_ms());
    set_ = std::move(set);

    std::cout << "✅ Loaded thresholds: global=" << std::fixed << std::setprecision(2)
              << set_->tau_global << ", " << set_->tau_cluster.size() << " clusters" << std::endl;
}

void ThresholdController::reset_state() {
    auto set = initial_set();
    std::lock_guard<std::mutex> lock(mutex_);
    set_ = std::move(set);
    trades_since_update_ = 0;
    last_update_ms_ = now_ms();
}
