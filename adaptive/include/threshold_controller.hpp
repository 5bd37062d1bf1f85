#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <cstdint>
#include "adaptive_config.hpp"
#include "persistable.hpp"
#include "trade_outcome.hpp"

class OutcomeStore;

/*
 * THRESHOLD CONTROLLER
 *
 * Hierarchical acceptance thresholds:
 *   tau_effective = max(tau_global, tau_side, tau_tf, tau_cluster)
 * Global, side and timeframe levels chase a target win-rate band; cluster
 * levels follow the PenaltyTracker's cluster EWMA.
 */

struct ThresholdSet {
    double tau_global = 0.70;
    std::map<std::string, double> tau_side;
    std::map<std::string, double> tau_tf;
    std::map<std::string, double> tau_cluster;

    // Unknown keys resolve to tau_global, so the result is never below it.
    double effective(Side side, const std::string& timeframe, const std::string& cluster) const;
};

json threshold_set_to_json(const ThresholdSet& set);

class ThresholdController : public Persistable {
public:
    explicit ThresholdController(const ThresholdConfig& config = ThresholdConfig(),
                                 const std::string& state_path = "adaptive_state/threshold_state.json");

    // Runs inside an adaptation cycle only. Publishes a whole new set at once
    // and returns a summary of what moved.
    json update(const OutcomeStore& store, const std::map<std::string, double>& cluster_penalties);

    double effective_threshold(Side side, const std::string& timeframe,
                               const std::string& cluster = DEFAULT_CLUSTER) const;
    double global_threshold() const;

    void increment_trade_count();
    int trades_since_update() const;
    bool should_update(int64_t now = now_ms()) const;
    int64_t last_update_ms() const;

    std::shared_ptr<const ThresholdSet> snapshot() const;
    json all_thresholds() const;
    void reset();

    const ThresholdConfig& config() const { return config_; }

protected:
    json to_state_json() const override;
    void from_state_json(const json& state) override;
    void reset_state() override;

private:
    ThresholdConfig config_;
    std::shared_ptr<const ThresholdSet> set_;
    int trades_since_update_ = 0;
    int64_t last_update_ms_ = 0;
    mutable std::mutex mutex_;

    double clamp(double tau) const;
    std::shared_ptr<const ThresholdSet> initial_set() const;
};
