#pragma once

#include <string>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <cstdint>
#include "adaptive_config.hpp"
#include "adaptive_status.hpp"
#include "persistable.hpp"
#include "trade_outcome.hpp"

class OutcomeStore;

/*
 * RISK OPTIMIZER
 *
 * Variance-adjusted fractional Kelly sizing per bucket, with a daily loss
 * throttle. The (R, sigma) table is a read-through cache of
 * OutcomeStore::kelly_parameters, refreshed only by refit().
 */

struct KellyEntry {
    double reward_risk = 2.0;
    double sigma = 1.0;
};

using KellyTable = std::map<std::string, KellyEntry>;

struct KellyBreakdown {
    double p = 0.0;
    double reward_risk = 2.0;
    double sigma = 1.0;
    bool cached = false;
    double f_kelly = 0.0;
    double vol_ratio = 1.0;
    double f_adjusted = 0.0;
    double f_conservative = 0.0;
    double f_capped = 0.0;           // after f_max and daily-cap halving
    bool daily_cap_hit = false;
    double position_usd = 0.0;       // after absolute bounds
    double fraction = 0.0;           // position_usd / wallet
};

class RiskOptimizer : public Persistable {
public:
    explicit RiskOptimizer(const RiskConfig& config = RiskConfig(),
                           const std::string& state_path = "adaptive_state/risk_optimizer_state.json");

    // Fraction of `wallet` to allocate. 0 for a non-positive wallet.
    double kelly_fraction(double p, const std::string& bucket, double wallet) const;
    // Same computation with every intermediate term. VALIDATION on
    // non-finite inputs.
    Result<KellyBreakdown> kelly_breakdown(double p, const std::string& bucket, double wallet) const;

    // Refreshes every bucket touched by recent outcomes (plus any queued by
    // cache misses) and the daily loss cap. Returns the significant moves.
    json refit(const OutcomeStore& store, int64_t now = now_ms());

    void record_outcome(double pnl_usd, int64_t now = now_ms());

    double max_fraction() const;
    bool daily_cap_exceeded() const;
    double daily_loss_cap() const;
    double current_daily_loss() const;
    std::set<std::string> pending_buckets() const;
    std::shared_ptr<const KellyTable> snapshot() const;

    json info() const;
    void reset();

    const RiskConfig& config() const { return config_; }

protected:
    json to_state_json() const override;
    void from_state_json(const json& state) override;
    void reset_state() override;

private:
    RiskConfig config_;
    std::shared_ptr<const KellyTable> table_;

    double daily_loss_cap_ = 100.0;
    double current_daily_loss_ = 0.0;
    int64_t daily_reset_ms_ = 0;
    mutable std::set<std::string> pending_;

    mutable std::mutex mutex_;

    bool cap_exceeded_locked() const;
};
