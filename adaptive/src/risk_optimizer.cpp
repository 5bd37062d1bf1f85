#include "risk_optimizer.hpp"
#include "outcome_store.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace {

const double SIGNIFICANT_R_MOVE = 0.5;
const double SIGNIFICANT_SIGMA_MOVE = 0.3;
const int64_t MS_PER_DAY = 24LL * 3600LL * 1000LL;

}  // namespace

RiskOptimizer::RiskOptimizer(const RiskConfig& config, const std::string& state_path)
    : Persistable("risk_optimizer", 1, state_path),
      config_(config),
      table_(std::make_shared<const KellyTable>()),
      daily_loss_cap_(config.default_daily_loss_cap) {}

std::shared_ptr<const KellyTable> RiskOptimizer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_;
}

bool RiskOptimizer::cap_exceeded_locked() const {
    return daily_loss_cap_ > 0 && current_daily_loss_ > daily_loss_cap_;
}

Result<KellyBreakdown> RiskOptimizer::kelly_breakdown(double p, const std::string& bucket, double wallet) const {
    KellyBreakdown k;
    if (!std::isfinite(p) || !std::isfinite(wallet)) {
        return Result<KellyBreakdown>::error(ErrorKind::VALIDATION, "non-finite Kelly input", k);
    }
    k.p = p;

    bool cap_hit = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = table_->find(bucket);
        if (it != table_->end()) {
            k.reward_risk = it->second.reward_risk;
            k.sigma = it->second.sigma;
            k.cached = true;
        } else {
            // No I/O on the sizing path: default now, fetched on next refit
            pending_.insert(bucket);
        }
        cap_hit = cap_exceeded_locked();
    }

    // 1. Classic Kelly
    k.f_kelly = k.reward_risk > 0 ? (p * k.reward_risk - (1.0 - p)) / k.reward_risk : 0.0;
    k.f_kelly = std::max(0.0, k.f_kelly);

    // 2. Variance adjustment
    k.vol_ratio = config_.target_sigma / std::max(k.sigma, config_.target_sigma);
    k.f_adjusted = k.f_kelly * k.vol_ratio;

    // 3. Fractional Kelly, 4. hard cap
    k.f_conservative = config_.k_factor * k.f_adjusted;
    k.f_capped = std::min(k.f_conservative, config_.f_max);

    // 5. Daily loss throttle
    if (cap_hit) {
        k.f_capped *= 0.5;
        k.daily_cap_hit = true;
    }

    // 6. Absolute bounds in currency, then back to a fraction
    if (wallet <= 0) {
        k.position_usd = 0.0;
        k.fraction = 0.0;
        return Result<KellyBreakdown>::success(k);
    }
    k.position_usd = k.f_capped * wallet;
    k.position_usd = std::max(config_.min_position_usd, std::min(config_.max_position_usd, k.position_usd));
    k.fraction = k.position_usd / wallet;
    return Result<KellyBreakdown>::success(k);
}

double RiskOptimizer::kelly_fraction(double p, const std::string& bucket, double wallet) const {
    Result<KellyBreakdown> r = kelly_breakdown(p, bucket, wallet);
    if (!r.ok()) {
        std::cerr << "⚠️ Kelly fraction for " << bucket << ": " << r.status.message << std::endl;
        return 0.0;
    }
    return r.value.fraction;
}

json RiskOptimizer::refit(const OutcomeStore& store, int64_t now) {
    json updates = json::object();

    std::set<std::string> buckets;
    for (const auto& t : store.recent(config_.refit_recent_trades)) {
        buckets.insert(t.symbol);
        buckets.insert(t.cluster);
        buckets.insert(t.timeframe);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        buckets.insert(pending_.begin(), pending_.end());
        pending_.clear();
    }
    buckets.erase(UNKNOWN_IDENTITY);
    buckets.erase("");

    auto next = std::make_shared<KellyTable>(*snapshot());
    for (const auto& bucket : buckets) {
        KellyParameters params = store.kelly_parameters(bucket, config_.bucket_window);
        KellyEntry old_entry;
        auto it = next->find(bucket);
        if (it != next->end()) old_entry = it->second;

        KellyEntry entry;
        entry.reward_risk = params.reward_risk;
        entry.sigma = params.sigma;
        (*next)[bucket] = entry;

        if (std::abs(entry.reward_risk - old_entry.reward_risk) > SIGNIFICANT_R_MOVE ||
            std::abs(entry.sigma - old_entry.sigma) > SIGNIFICANT_SIGMA_MOVE) {
            updates[bucket] = {
                {"R", {old_entry.reward_risk, entry.reward_risk}},
                {"sigma", {old_entry.sigma, entry.sigma}}
            };
        }
    }

    // Daily loss cap = 2x median loss over the lookback window
    std::vector<double> losses = store.losses_since(now - config_.loss_lookback_days * MS_PER_DAY);
    double cap = config_.default_daily_loss_cap;
    if (static_cast<int>(losses.size()) >= config_.min_loss_samples) {
        std::sort(losses.begin(), losses.end());
        cap = 2.0 * losses[losses.size() / 2];
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        table_ = std::move(next);
        daily_loss_cap_ = cap;
    }

    if (!updates.empty()) {
        std::cout << "💰 Kelly parameters updated: " << updates.size() << " buckets" << std::endl;
    }
    std::cout << "💰 Daily loss cap: $" << std::fixed << std::setprecision(2) << cap << std::endl;
    return updates;
}

void RiskOptimizer::record_outcome(double pnl_usd, int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Only a later calendar day rolls the counter over
    if (daily_reset_ms_ == 0 || session_id_for(now) > session_id_for(daily_reset_ms_)) {
        current_daily_loss_ = 0.0;
        daily_reset_ms_ = now;
    }

    if (pnl_usd < 0) {
        bool was_exceeded = cap_exceeded_locked();
        current_daily_loss_ += std::abs(pnl_usd);
        if (!was_exceeded && cap_exceeded_locked()) {
            std::cerr << "⚠️ DAILY LOSS CAP REACHED: $" << std::fixed << std::setprecision(2)
                      << current_daily_loss_ << " > $" << daily_loss_cap_
                      << " - reducing position sizes" << std::endl;
        }
    }
}

double RiskOptimizer::max_fraction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cap_exceeded_locked() ? config_.f_max * 0.5 : config_.f_max;
}

bool RiskOptimizer::daily_cap_exceeded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cap_exceeded_locked();
}

double RiskOptimizer::daily_loss_cap() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return daily_loss_cap_;
}

double RiskOptimizer::current_daily_loss() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_daily_loss_;
}

std::set<std::string> RiskOptimizer::pending_buckets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

json RiskOptimizer::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json j;
    j["k_factor"] = config_.k_factor;
    j["f_max"] = config_.f_max;
    j["target_sigma"] = config_.target_sigma;
    j["n_buckets"] = table_->size();
    j["daily_loss_cap"] = daily_loss_cap_;
    j["current_daily_loss"] = current_daily_loss_;
    j["cap_active"] = cap_exceeded_locked();
    return j;
}

void RiskOptimizer::reset() {
    reset_state();
    std::cout << "🔄 Risk optimizer reset" << std::endl;
}

json RiskOptimizer::to_state_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json params = json::object();
    for (const auto& [bucket, entry] : *table_) {
        params[bucket] = {{"R", entry.reward_risk}, {"sigma", entry.sigma}};
    }
    json state;
    state["kelly_params"] = params;
    state["daily_loss_cap"] = daily_loss_cap_;
    state["current_daily_loss"] = current_daily_loss_;
    state["daily_reset_time"] = daily_reset_ms_;
    return state;
}

void RiskOptimizer::from_state_json(const json& state) {
    auto table = std::make_shared<KellyTable>();
    if (state.contains("kelly_params")) {
        for (auto it = state["kelly_params"].begin(); it != state["kelly_params"].end(); ++it) {
            KellyEntry e;
            e.reward_risk = it.value().at("R").get<double>();
            e.sigma = it.value().at("sigma").get<double>();
            (*table)[it.key()] = e;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    table_ = std::move(table);
    daily_loss_cap_ = state.value("daily_loss_cap", config_.default_daily_loss_cap);
    current_daily_loss_ = state.value("current_daily_loss", 0.0);
    daily_reset_ms_ = state.value("daily_reset_time", static_cast<int64_t>(0));

    std::cout << "✅ Loaded Kelly parameters for " << table_->size() << " buckets" << std::endl;
}

void RiskOptimizer::reset_state() {
    std::lock_guard<std::mutex> lock(mutex_);
    table_ = std::make_shared<const KellyTable>();
    daily_loss_cap_ = config_.default_daily_loss_cap;
    current_daily_loss_ = 0.0;
    daily_reset_ms_ = 0;
    pending_.clear();
}
