#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <cstdint>
#include <sqlite3.h>
#include "adaptive_status.hpp"
#include "trade_outcome.hpp"

/*
 * OUTCOME STORE
 *
 * Durable, append-only log of closed trades backed by SQLite. Every other
 * adaptive component derives its statistics from here; the store is the
 * single source of truth for Kelly parameters.
 */

struct TradeStatistics {
    int count = 0;
    int win_count = 0;
    int loss_count = 0;
    double win_rate = 0.0;
    double avg_return = 0.0;          // mean roe_pct
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double profit_factor = 0.0;
    double reward_risk_ratio = 0.0;
    double avg_duration_minutes = 0.0;
};

json statistics_to_json(const TradeStatistics& stats);

struct StatsFilter {
    std::optional<std::string> symbol;
    std::optional<Side> side;
    std::optional<std::string> timeframe;
    std::optional<std::string> cluster;
    std::optional<std::string> session_id;
};

struct KellyParameters {
    double reward_risk = 2.0;   // R
    double win_prob = 0.70;     // p
    double sigma = 1.0;         // stddev of roe_pct
    int samples = 0;            // 0 = global default
};

struct CalibrationSample {
    double confidence_raw = 0.0;
    int result = 0;
};

class OutcomeStore {
public:
    explicit OutcomeStore(std::string db_path);
    ~OutcomeStore();

    OutcomeStore(const OutcomeStore&) = delete;
    OutcomeStore& operator=(const OutcomeStore&) = delete;

    // Opens (or creates) the database and its schema.
    Status open();
    bool is_open() const;
    const std::string& db_path() const { return db_path_; }

    // Stamps timestamp/session when missing and assigns the row id.
    Result<int64_t> append(TradeOutcome& outcome);

    // Most recent `window` rows matching `filter`. Zero rows -> zero stats.
    TradeStatistics statistics(int window, const StatsFilter& filter = StatsFilter()) const;

    // Fallback chain: symbol (>= 30 rows), then cluster or timeframe
    // (>= 10 rows), else the global default (2.0, 0.70, 1.0).
    KellyParameters kelly_parameters(const std::string& bucket, int window = 200) const;

    std::vector<TradeOutcome> recent(int n) const;
    int count() const;

    std::vector<CalibrationSample> calibration_samples(Side side, const std::string& timeframe,
                                                       int limit = 1000) const;
    // Distinct values of one of: symbol, side, timeframe, cluster.
    std::vector<std::string> distinct_values(const std::string& column) const;

    // Absolute losses (pnl_usd of losing trades) closed at or after `since_ms`.
    std::vector<double> losses_since(int64_t since_ms) const;

    // Keeps at most `max_count` newest rows and drops rows older than
    // `max_age_days`. Returns the number of rows removed.
    Result<int> retention_sweep(int max_count, int max_age_days);

private:
    std::string db_path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex db_mutex_;

    Status create_tables();
    KellyParameters kelly_from_rows(const std::vector<std::pair<double, int>>& rows) const;
    std::vector<std::pair<double, int>> select_returns(const char* sql, const std::string& bucket,
                                                      int binds, int window) const;
};
