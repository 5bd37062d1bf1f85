#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <iomanip>
#include <algorithm>
#include <nlohmann/json.hpp>
#include "adaptive_config.hpp"
#include "adaptive_context.hpp"
#include "trade_outcome.hpp"

using json = nlohmann::json;

/*
 * adaptive_replay
 *
 * Replays closed-trade records through the adaptive layer, optionally filters
 * and sizes a batch of candidate signals, prints the resulting state and
 * saves everything under the state directory.
 */

namespace {

struct ReplayOptions {
    std::string config_path = "config/adaptive_config.json";
    std::string outcomes_path;
    std::string signals_path;
    std::string state_dir;
    std::string db_path;
    double wallet = 1000.0;
    bool disable = false;
    bool force_cycle = false;
    bool reset = false;
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "  --config <file>     adaptive config JSON (default config/adaptive_config.json)\n"
              << "  --outcomes <file>   trade outcomes, JSON array or one object per line\n"
              << "  --signals <file>    candidate signals to filter and size\n"
              << "  --wallet <usd>      wallet balance for sizing (default 1000)\n"
              << "  --state-dir <dir>   override state directory\n"
              << "  --db <file>         override trade store path\n"
              << "  --cycle             force an adaptation cycle after the replay\n"
              << "  --disable           run with the adaptive layer disabled\n"
              << "  --reset             reset penalties, thresholds, drift, Kelly and calibration\n";
}

// Accepts a JSON array, a single object, or JSON-lines.
bool read_json_records(const std::string& path, std::vector<json>& records) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "❌ Cannot open " << path << std::endl;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    json doc = json::parse(content, nullptr, false);
    if (!doc.is_discarded()) {
        if (doc.is_array()) {
            for (auto& item : doc) records.push_back(item);
        } else {
            records.push_back(doc);
        }
        return true;
    }

    std::istringstream lines(content);
    std::string line;
    int line_no = 0;
    while (std::getline(lines, line)) {
        line_no++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded()) {
            std::cerr << "⚠️ " << path << ":" << line_no << " is not valid JSON, skipped" << std::endl;
            continue;
        }
        records.push_back(j);
    }
    return true;
}

// 1% of wallet per signal, within the absolute bounds.
std::vector<double> baseline_sizes(const std::vector<FilteredSignal>& signals, double wallet,
                                   const CoreConfig& core) {
    std::vector<double> sizes;
    for (size_t i = 0; i < signals.size(); i++) {
        double usd = wallet > 0 ? wallet * 0.01 : 0.0;
        if (wallet > 0) usd = std::max(core.position_min_absolute, std::min(core.position_max_absolute, usd));
        sizes.push_back(usd);
    }
    return sizes;
}

}  // namespace

int main(int argc, char* argv[]) {
    ReplayOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        try {
            if (arg == "--help" || arg == "-h") { print_usage(argv[0]); return 0; }
            else if (arg == "--config" && i+1 < argc) opts.config_path = argv[++i];
            else if (arg == "--outcomes" && i+1 < argc) opts.outcomes_path = argv[++i];
            else if (arg == "--signals" && i+1 < argc) opts.signals_path = argv[++i];
            else if (arg == "--wallet" && i+1 < argc) opts.wallet = std::stod(argv[++i]);
            else if (arg == "--state-dir" && i+1 < argc) opts.state_dir = argv[++i];
            else if (arg == "--db" && i+1 < argc) opts.db_path = argv[++i];
            else if (arg == "--cycle") opts.force_cycle = true;
            else if (arg == "--disable") opts.disable = true;
            else if (arg == "--reset") opts.reset = true;
            else {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "❌ Invalid value for " << arg << ": " << e.what() << std::endl;
            return 1;
        }
    }

    AdaptiveConfig config;
    Status config_status = load_adaptive_config(opts.config_path, config);
    if (!config_status.ok()) {
        std::cerr << "⚠️ Continuing with default adaptive config" << std::endl;
    }
    if (!opts.state_dir.empty()) {
        config.core.state_dir = opts.state_dir;
        if (opts.db_path.empty()) config.core.db_path = AdaptiveContext::state_file(opts.state_dir, "trade_feedback.db");
    }
    if (!opts.db_path.empty()) config.core.db_path = opts.db_path;

    AdaptiveContext ctx(config);
    Status open_status = ctx.open();
    if (!ctx.store().is_open()) {
        std::cerr << "❌ Trade store unavailable: " << open_status.message << std::endl;
        return 1;
    }
    if (!open_status.ok()) {
        std::cerr << "⚠️ Started with warnings: " << open_status.message << std::endl;
    }

    AdaptationCore& core = ctx.core();
    if (opts.reset) {
        ctx.penalties().reset();
        ctx.thresholds().reset();
        ctx.drift().reset();
        ctx.risk().reset();
        ctx.calibrator().reset();
    }
    if (opts.disable) core.disable();

    if (!opts.outcomes_path.empty()) {
        std::vector<json> records;
        if (!read_json_records(opts.outcomes_path, records)) return 1;

        int logged = 0, failed = 0, defaulted_records = 0;
        for (const auto& record : records) {
            std::vector<std::string> defaulted;
            TradeOutcome outcome = outcome_from_json(record, &defaulted);
            if (!defaulted.empty()) {
                defaulted_records++;
                std::cerr << "⚠️ Outcome for " << outcome.symbol << " missing fields:";
                for (const auto& f : defaulted) std::cerr << " " << f;
                std::cerr << " (defaulted)" << std::endl;
            }
            Result<int64_t> r = core.log_outcome(outcome);
            if (r.ok()) logged++; else failed++;
        }
        std::cout << "📊 Replayed " << logged << " outcomes (" << failed << " failed, "
                  << defaulted_records << " with defaulted fields)" << std::endl;
        if (!core.wait_idle()) {
            std::cerr << "⚠️ Adaptation cycle did not finish in time" << std::endl;
        }
    }

    if (opts.force_cycle && !core.run_adaptation_cycle()) {
        std::cerr << "⚠️ Forced cycle skipped: another cycle is running" << std::endl;
    }

    if (!opts.signals_path.empty()) {
        std::vector<json> records;
        if (!read_json_records(opts.signals_path, records)) return 1;

        std::vector<Signal> signals;
        for (const auto& record : records) signals.push_back(signal_from_json(record));

        std::vector<FilteredSignal> kept = core.filter(signals);
        const CoreConfig core_config = config.core;
        std::vector<double> sizes = core.size_all(kept, opts.wallet,
            [core_config](const std::vector<FilteredSignal>& s, double wallet) {
                return baseline_sizes(s, wallet, core_config);
            });

        json out = json::array();
        for (size_t i = 0; i < kept.size(); i++) {
            json j = filtered_signal_to_json(kept[i]);
            j["margin_usd"] = i < sizes.size() ? sizes[i] : 0.0;
            out.push_back(j);
        }
        std::cout << out.dump(2) << std::endl;
    }

    std::cout << "🧠 Adaptive state:" << std::endl;
    std::cout << core.current_state().dump(2) << std::endl;
    std::cout << "📊 Recent performance:" << std::endl;
    std::cout << core.recent_performance(100).dump(2) << std::endl;

    Status saved = ctx.close();
    HealthStatus health = core.health();
    if (!saved.ok() || !health.storage_ok) {
        std::cerr << "❌ Storage unhealthy: " << health.last_storage_error
                  << " (failed saves: " << health.failed_saves << ")" << std::endl;
        return 2;
    }
    return 0;
}
