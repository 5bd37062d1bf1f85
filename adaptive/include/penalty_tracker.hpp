#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>
#include <utility>
#include "adaptive_config.hpp"
#include "persistable.hpp"
#include "trade_outcome.hpp"

// Symbols and clusters with a nonzero countdown at one instant.
struct CooldownSet {
    std::set<std::string> symbols;
    std::set<std::string> clusters;

    bool contains(const std::string& symbol, const std::string& cluster = "") const {
        return symbols.count(symbol) > 0 || (!cluster.empty() && clusters.count(cluster) > 0);
    }
};

/*
 * PENALTY TRACKER
 *
 * Scores each closed trade's "quality", keeps an EWMA of those scores per
 * symbol and per cluster, and puts persistently bad ones on cooldown for a
 * fixed number of adaptation cycles.
 */
class PenaltyTracker : public Persistable {
public:
    explicit PenaltyTracker(const PenaltyConfig& config = PenaltyConfig(),
                            const std::string& state_path = "adaptive_state/penalty_state.json");

    // w_conf*p^2*[loss] + w_sl*[stop] + w_fast*[duration < 5min] + w_mae*|mae|/100
    double score(const TradeOutcome& outcome) const;

    // Updates both EWMAs, then arms a cooldown for the symbol (cluster) when
    // its EWMA crosses the threshold and it is not already cooling down.
    void update_ewma(const std::string& symbol, const std::string& cluster, double penalty);

    bool is_cooling_down(const std::string& symbol, const std::string& cluster = "") const;
    CooldownSet cooldown_snapshot() const;

    // Once per adaptation cycle.
    void tick_cooldowns();

    double symbol_penalty(const std::string& symbol) const;
    double cluster_penalty(const std::string& cluster) const;
    std::map<std::string, double> cluster_penalties() const;
    std::vector<std::pair<std::string, double>> top_penalties(size_t n = 10) const;
    // "Symbol:X" / "Cluster:Y" entries with a nonzero countdown.
    std::vector<std::string> active_cooldowns() const;
    int symbol_cooldown_remaining(const std::string& symbol) const;
    int cluster_cooldown_remaining(const std::string& cluster) const;

    void reset();

    const PenaltyConfig& config() const { return config_; }

protected:
    json to_state_json() const override;
    void from_state_json(const json& state) override;
    void reset_state() override;

private:
    PenaltyConfig config_;

    std::map<std::string, double> symbol_ewma_;
    std::map<std::string, double> cluster_ewma_;
    std::map<std::string, int> symbol_cooldowns_;
    std::map<std::string, int> cluster_cooldowns_;
    int64_t last_update_ms_ = 0;

    mutable std::mutex mutex_;

    void check_cooldown_triggers(const std::string& symbol, const std::string& cluster);
};
