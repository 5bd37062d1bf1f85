#include "trade_outcome.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>

const char* side_name(Side side) {
    return side == Side::SHORT ? "SHORT" : "LONG";
}

Side parse_side(const std::string& text, bool* recognized) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (recognized) *recognized = true;
    if (upper == "LONG" || upper == "BUY") return Side::LONG;
    if (upper == "SHORT" || upper == "SELL") return Side::SHORT;

    if (recognized) *recognized = false;
    return Side::LONG;
}

std::string session_id_for(int64_t timestamp_ms) {
    std::time_t t = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y%m%d", &tm);
    return buf;
}

namespace {

// Required fields of the inbound schema: absent ones are defaulted and reported.
const char* const REQUIRED_FIELDS[] = {
    "symbol", "side", "timeframe", "confidence_raw",
    "entry_price", "entry_time", "position_size", "margin",
    "exit_price", "exit_time", "duration_seconds",
    "roe_pct", "pnl_usd", "result"
};

double number_or(const json& j, const char* key, double fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return fallback;
    return it->get<double>();
}

int64_t integer_or(const json& j, const char* key, int64_t fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return fallback;
    return static_cast<int64_t>(it->get<double>());
}

bool flag_or(const json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    return fallback;
}

std::string string_or(const json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    std::string value = it->get<std::string>();
    return value.empty() ? fallback : value;
}

}  // namespace

TradeOutcome outcome_from_json(const json& j, std::vector<std::string>* defaulted) {
    TradeOutcome t;
    if (!j.is_object()) {
        if (defaulted) defaulted->push_back("<not an object>");
        return t;
    }

    if (defaulted) {
        for (const char* field : REQUIRED_FIELDS) {
            if (!j.contains(field)) defaulted->push_back(field);
        }
    }

    t.id = integer_or(j, "id", 0);
    t.timestamp_ms = integer_or(j, "timestamp", 0);
    t.session_id = string_or(j, "session_id", "");
    t.strategy_version = string_or(j, "strategy_version", "v1.0");

    t.symbol = string_or(j, "symbol", UNKNOWN_IDENTITY);
    t.side = parse_side(string_or(j, "side", "LONG"));
    t.timeframe = string_or(j, "timeframe", DEFAULT_TIMEFRAME);
    t.cluster = string_or(j, "cluster", DEFAULT_CLUSTER);

    t.confidence_raw = number_or(j, "confidence_raw", 0.0);
    if (j.contains("confidence_calibrated") && j["confidence_calibrated"].is_number()) {
        t.confidence_calibrated = j["confidence_calibrated"].get<double>();
    }
    t.model_version = string_or(j, "model_version", "");

    t.entry_price = number_or(j, "entry_price", 0.0);
    t.exit_price = number_or(j, "exit_price", 0.0);
    t.entry_time_ms = integer_or(j, "entry_time", 0);
    t.exit_time_ms = integer_or(j, "exit_time", 0);
    t.position_size = number_or(j, "position_size", 0.0);
    t.margin = number_or(j, "margin", 0.0);
    t.duration_seconds = integer_or(j, "duration_seconds", 0);
    t.close_reason = string_or(j, "close_reason", "");

    if (j.contains("technical") && j["technical"].is_object()) {
        for (auto it = j["technical"].begin(); it != j["technical"].end(); ++it) {
            if (it.value().is_number()) {
                t.technical[it.key()] = it.value().get<double>();
            }
        }
    }

    t.roe_pct = number_or(j, "roe_pct", 0.0);
    t.pnl_usd = number_or(j, "pnl_usd", 0.0);
    t.result = integer_or(j, "result", 0) != 0 ? 1 : 0;
    t.stop_hit = flag_or(j, "stop_hit", false);
    t.tp_hit = flag_or(j, "tp_hit", false);

    t.fees_usd = number_or(j, "fees_usd", 0.0);
    t.slippage_bp = number_or(j, "slippage_bp", 0.0);
    t.spread_bp = number_or(j, "spread_bp", 0.0);
    t.latency_ms = integer_or(j, "latency_ms", 0);

    t.mfe_bp = number_or(j, "mfe_bp", 0.0);
    t.mae_bp = number_or(j, "mae_bp", 0.0);

    t.tau_global = number_or(j, "tau_global", 0.70);
    t.tau_side = number_or(j, "tau_side", 0.70);
    t.tau_tf = number_or(j, "tau_tf", 0.70);
    t.tau_cluster = number_or(j, "tau_cluster", 0.70);
    t.kelly_fraction = number_or(j, "kelly_fraction", 0.0);
    t.cooldown_applied = flag_or(j, "cooldown_applied", false);

    t.penalty_score = number_or(j, "penalty_score", 0.0);
    return t;
}

json outcome_to_json(const TradeOutcome& t) {
    json j;
    j["id"] = t.id;
    j["timestamp"] = t.timestamp_ms;
    j["session_id"] = t.session_id;
    j["strategy_version"] = t.strategy_version;
    j["symbol"] = t.symbol;
    j["side"] = side_name(t.side);
    j["timeframe"] = t.timeframe;
    j["cluster"] = t.cluster;
    j["confidence_raw"] = t.confidence_raw;
    if (t.confidence_calibrated) {
        j["confidence_calibrated"] = *t.confidence_calibrated;
    }
    j["model_version"] = t.model_version;
    j["entry_price"] = t.entry_price;
    j["exit_price"] = t.exit_price;
    j["entry_time"] = t.entry_time_ms;
    j["exit_time"] = t.exit_time_ms;
    j["position_size"] = t.position_size;
    j["margin"] = t.margin;
    j["duration_seconds"] = t.duration_seconds;
    j["close_reason"] = t.close_reason;
    j["technical"] = t.technical;
    j["roe_pct"] = t.roe_pct;
    j["pnl_usd"] = t.pnl_usd;
    j["result"] = t.result;
    j["stop_hit"] = t.stop_hit;
    j["tp_hit"] = t.tp_hit;
    j["fees_usd"] = t.fees_usd;
    j["slippage_bp"] = t.slippage_bp;
    j["spread_bp"] = t.spread_bp;
    j["latency_ms"] = t.latency_ms;
    j["mfe_bp"] = t.mfe_bp;
    j["mae_bp"] = t.mae_bp;
    j["tau_global"] = t.tau_global;
    j["tau_side"] = t.tau_side;
    j["tau_tf"] = t.tau_tf;
    j["tau_cluster"] = t.tau_cluster;
    j["kelly_fraction"] = t.kelly_fraction;
    j["cooldown_applied"] = t.cooldown_applied;
    j["penalty_score"] = t.penalty_score;
    return j;
}

Signal signal_from_json(const json& j) {
    Signal s;
    if (!j.is_object()) return s;

    s.symbol = string_or(j, "symbol", "");
    // Upstream signals carry the side either as "side" or as "signal_name" (BUY/SELL)
    std::string side_text = string_or(j, "side", string_or(j, "signal_name", "LONG"));
    bool recognized = true;
    s.side = parse_side(side_text, &recognized);
    if (!recognized) {
        std::cerr << "⚠️ Unknown signal side '" << side_text << "' for " << s.symbol
                  << " - treating as LONG" << std::endl;
    }
    s.raw_confidence = number_or(j, "confidence", number_or(j, "raw_confidence", 0.0));
    s.timeframe = string_or(j, "timeframe", DEFAULT_TIMEFRAME);
    s.cluster = string_or(j, "cluster", DEFAULT_CLUSTER);
    return s;
}

json signal_to_json(const Signal& s) {
    json j;
    j["symbol"] = s.symbol;
    j["side"] = side_name(s.side);
    j["confidence"] = s.raw_confidence;
    j["timeframe"] = s.timeframe;
    j["cluster"] = s.cluster;
    return j;
}

json filtered_signal_to_json(const FilteredSignal& f) {
    json j = signal_to_json(f.signal);
    j["confidence_raw"] = f.signal.raw_confidence;
    j["confidence_calibrated"] = f.calibrated_confidence;
    j["effective_threshold"] = f.effective_threshold;
    return j;
}
