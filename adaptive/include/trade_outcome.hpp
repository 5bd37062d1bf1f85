#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <chrono>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

/*
 * TRADE OUTCOME / SIGNAL RECORDS
 *
 * One TradeOutcome per closed position, produced by the execution layer and
 * immutable once appended to the OutcomeStore. Signals are the candidate
 * entries that the AdaptationCore filters and sizes.
 */

enum class Side { LONG, SHORT };

const char* side_name(Side side);
// Accepts LONG/BUY and SHORT/SELL in any case; anything else maps to LONG.
Side parse_side(const std::string& text, bool* recognized = nullptr);

inline const char* const UNKNOWN_IDENTITY = "UNKNOWN";
inline const char* const DEFAULT_CLUSTER = "DEFAULT";
inline const char* const DEFAULT_TIMEFRAME = "15m";

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

struct TradeOutcome {
    // Identity
    int64_t id = 0;                 // assigned by the store
    int64_t timestamp_ms = 0;       // close time; 0 = stamp on append
    std::string session_id;         // empty = derived from close date
    std::string strategy_version = "v1.0";

    // Context
    std::string symbol = UNKNOWN_IDENTITY;
    Side side = Side::LONG;
    std::string timeframe = DEFAULT_TIMEFRAME;
    std::string cluster = DEFAULT_CLUSTER;

    // Prediction
    double confidence_raw = 0.0;
    std::optional<double> confidence_calibrated;
    std::string model_version;

    // Entry / exit
    double entry_price = 0.0;
    double exit_price = 0.0;
    int64_t entry_time_ms = 0;
    int64_t exit_time_ms = 0;
    double position_size = 0.0;
    double margin = 0.0;
    int64_t duration_seconds = 0;
    std::string close_reason;

    // Technical snapshot at entry (atr, volatility, rsi, adx, ...)
    std::map<std::string, double> technical;

    // Outcome (net of fees)
    double roe_pct = 0.0;
    double pnl_usd = 0.0;
    int result = 0;                 // 1 = win, 0 = loss
    bool stop_hit = false;
    bool tp_hit = false;

    // Execution quality
    double fees_usd = 0.0;
    double slippage_bp = 0.0;
    double spread_bp = 0.0;
    int64_t latency_ms = 0;

    // Excursion
    double mfe_bp = 0.0;
    double mae_bp = 0.0;

    // Adaptive state in force at decision time
    double tau_global = 0.70;
    double tau_side = 0.70;
    double tau_tf = 0.70;
    double tau_cluster = 0.70;
    double kelly_fraction = 0.0;
    bool cooldown_applied = false;

    // Filled in by the PenaltyTracker before persistence
    double penalty_score = 0.0;

    bool is_win() const { return result == 1; }
    double effective_confidence() const {
        return confidence_calibrated ? *confidence_calibrated : confidence_raw;
    }
};

struct Signal {
    std::string symbol;
    Side side = Side::LONG;
    double raw_confidence = 0.0;
    std::string timeframe = DEFAULT_TIMEFRAME;
    std::string cluster = DEFAULT_CLUSTER;
};

struct FilteredSignal {
    Signal signal;
    double calibrated_confidence = 0.0;
    double effective_threshold = 0.0;
};

// JSON boundary. Missing numeric fields default to 0, missing identity to
// UNKNOWN_IDENTITY; the names of defaulted required fields are appended to
// `defaulted` when it is non-null.
TradeOutcome outcome_from_json(const json& j, std::vector<std::string>* defaulted = nullptr);
json outcome_to_json(const TradeOutcome& outcome);

Signal signal_from_json(const json& j);
json signal_to_json(const Signal& signal);
json filtered_signal_to_json(const FilteredSignal& filtered);

// Session id convention: local close date as YYYYMMDD.
std::string session_id_for(int64_t timestamp_ms);
