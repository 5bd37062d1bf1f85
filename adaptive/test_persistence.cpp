/**
 * State files: round trip, corrupt and mismatched files, config overlay
 */

#include <iostream>
#include <fstream>
#include <cstdlib>
#include "test_helpers.hpp"
#include "adaptive_config.hpp"
#include "outcome_store.hpp"
#include "penalty_tracker.hpp"
#include "confidence_calibrator.hpp"
#include "drift_detector.hpp"
#include "threshold_controller.hpp"
#include "risk_optimizer.hpp"

namespace fs = std::filesystem;

void write_text(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

void test_round_trip() {
    std::cout << "Test 1: Every component restores what it saved" << std::endl;

    std::string dir = make_temp_dir("roundtrip");

    // Penalties and cooldowns
    PenaltyTracker penalties(PenaltyConfig(), dir + "/penalty_state.json");
    penalties.update_ewma("DOGEUSD", "MEME", 2.0);
    penalties.update_ewma("BTCUSD", "L1", 0.4);
    penalties.tick_cooldowns();
    assert(penalties.save().ok());
    assert(!fs::exists(dir + "/penalty_state.json.tmp"));

    PenaltyTracker penalties2(PenaltyConfig(), dir + "/penalty_state.json");
    assert(penalties2.load().ok());
    assert(near(penalties2.symbol_penalty("DOGEUSD"), 2.0));
    assert(near(penalties2.cluster_penalty("L1"), 0.4));
    assert(penalties2.symbol_cooldown_remaining("DOGEUSD") == 2);
    assert(penalties2.cluster_cooldown_remaining("MEME") == 2);

    // Drift tests and prudent countdown
    DriftDetector drift(DriftConfig(), dir + "/drift_detector_state.json");
    assert(drift.update_penalty(2.0));
    drift.update_return(30.0);
    drift.decrement_prudent_mode();
    assert(drift.save().ok());

    DriftDetector drift2(DriftConfig(), dir + "/drift_detector_state.json");
    assert(drift2.load().ok());
    assert(drift2.prudent_mode_active());
    assert(drift2.summary().prudent_cycles_remaining == drift.summary().prudent_cycles_remaining);
    assert(drift2.history().size() == 1);
    assert(drift2.history()[0].metric == DriftMetric::PENALTY);
    assert(near(drift2.metric_state(DriftMetric::RETURN).sum, drift.metric_state(DriftMetric::RETURN).sum));

    // Thresholds including cluster overrides and the trade counter
    ThresholdController thresholds(ThresholdConfig(), dir + "/threshold_state.json");
    OutcomeStore store(":memory:");
    assert(store.open().ok());
    thresholds.update(store, {{"MEME", 1.9}});
    thresholds.increment_trade_count();
    thresholds.increment_trade_count();
    assert(thresholds.save().ok());

    ThresholdController thresholds2(ThresholdConfig(), dir + "/threshold_state.json");
    assert(thresholds2.load().ok());
    assert(near(thresholds2.snapshot()->tau_cluster.at("MEME"), 0.75));
    assert(thresholds2.trades_since_update() == 2);
    assert(thresholds2.last_update_ms() == thresholds.last_update_ms());

    // Calibration bins
    for (int i = 0; i < 60; i++) {
        TradeOutcome t = make_outcome("BTCUSD", i < 45, 0.0, Side::SHORT, "1h");
        t.confidence_raw = 0.82;
        assert(store.append(t).ok());
    }
    ConfidenceCalibrator calibrator(CalibrationConfig(), dir + "/calibration_state.json");
    calibrator.recalibrate_all(store);
    assert(near(calibrator.calibrate(0.82, Side::SHORT, "1h"), 0.75));
    assert(calibrator.save().ok());

    ConfidenceCalibrator calibrator2(CalibrationConfig(), dir + "/calibration_state.json");
    assert(calibrator2.load().ok());
    assert(near(calibrator2.calibrate(0.82, Side::SHORT, "1h"), 0.75));
    assert(near(calibrator2.calibrate(0.65, Side::SHORT, "1h"), 0.65));

    // Kelly table and daily loss accounting
    RiskOptimizer risk(RiskConfig(), dir + "/risk_optimizer_state.json");
    risk.refit(store);
    risk.record_outcome(-42.0);
    assert(risk.save().ok());

    RiskOptimizer risk2(RiskConfig(), dir + "/risk_optimizer_state.json");
    assert(risk2.load().ok());
    assert(risk2.snapshot()->size() == risk.snapshot()->size());
    assert(near(risk2.snapshot()->at("BTCUSD").sigma, risk.snapshot()->at("BTCUSD").sigma));
    assert(near(risk2.current_daily_loss(), 42.0));
    assert(near(risk2.daily_loss_cap(), risk.daily_loss_cap()));

    remove_temp_dir(dir);
    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_missing_and_corrupt_files() {
    std::cout << "Test 2: Missing file is clean, corrupt file falls back with STORAGE" << std::endl;

    std::string dir = make_temp_dir("corrupt");

    PenaltyTracker fresh(PenaltyConfig(), dir + "/nothing_here.json");
    fresh.update_ewma("X", "Y", 1.0);
    Status missing = fresh.load();
    assert(missing.ok());
    assert(near(fresh.symbol_penalty("X"), 0.0));

    write_text(dir + "/penalty_state.json", "{\"schema\": \"penalty_tracker\", \"version\": 1, \"state\": {");
    PenaltyTracker corrupt(PenaltyConfig(), dir + "/penalty_state.json");
    corrupt.update_ewma("X", "Y", 1.0);
    Status bad = corrupt.load();
    assert(!bad.ok());
    assert(bad.kind == ErrorKind::STORAGE);
    assert(corrupt.cluster_penalties().empty());

    // Valid JSON with the wrong value types
    write_text(dir + "/risk_state.json",
               "{\"schema\": \"risk_optimizer\", \"version\": 1, "
               "\"state\": {\"kelly_params\": {\"BTC\": {\"R\": \"two\"}}}}");
    RiskOptimizer risk(RiskConfig(), dir + "/risk_state.json");
    Status typed = risk.load();
    assert(typed.kind == ErrorKind::STORAGE);
    assert(risk.snapshot()->empty());
    assert(near(risk.daily_loss_cap(), 100.0));

    remove_temp_dir(dir);
    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_schema_mismatch() {
    std::cout << "Test 3: Another component's file or version is rejected" << std::endl;

    std::string dir = make_temp_dir("schema");
    std::string path = dir + "/state.json";

    DriftDetector drift(DriftConfig(), path);
    assert(drift.update_penalty(3.0));
    assert(drift.save().ok());

    ThresholdController thresholds(ThresholdConfig(), path);
    Status s = thresholds.load();
    assert(s.kind == ErrorKind::STORAGE);
    assert(near(thresholds.global_threshold(), 0.70));

    write_text(path, "{\"schema\": \"drift_detector\", \"version\": 99, \"state\": {}}");
    DriftDetector future(DriftConfig(), path);
    assert(future.load().kind == ErrorKind::STORAGE);
    assert(!future.prudent_mode_active());

    remove_temp_dir(dir);
    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_unwritable_path() {
    std::cout << "Test 4: Save into an unusable path reports STORAGE" << std::endl;

    std::string dir = make_temp_dir("unwritable");
    // A regular file where the parent directory should be
    write_text(dir + "/blocker", "x");

    PenaltyTracker tracker(PenaltyConfig(), dir + "/blocker/penalty_state.json");
    tracker.update_ewma("BTCUSD", "L1", 0.5);
    Status s = tracker.save();
    assert(!s.ok());
    assert(s.kind == ErrorKind::STORAGE);
    // In-memory state survives the failed write
    assert(near(tracker.symbol_penalty("BTCUSD"), 0.5));

    assert(write_file_atomic(dir + "/plain.txt", "hello").ok());
    assert(fs::exists(dir + "/plain.txt"));
    assert(!fs::exists(dir + "/plain.txt.tmp"));

    remove_temp_dir(dir);
    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_config_overlay() {
    std::cout << "Test 5: Config file overlays defaults, environment overrides paths" << std::endl;

    std::string dir = make_temp_dir("config");

    AdaptiveConfig config;
    assert(load_adaptive_config(dir + "/missing.json", config).ok());
    assert(near(config.threshold.tau_global_init, 0.70));

    write_text(dir + "/adaptive.json",
               "{\"threshold\": {\"tau_min\": 0.55}, \"risk\": {\"f_max\": 0.02}, "
               "\"penalty\": {\"cooldown_cycles\": 5}}");
    assert(load_adaptive_config(dir + "/adaptive.json", config).ok());
    assert(near(config.threshold.tau_min, 0.55));
    assert(near(config.threshold.tau_max, 0.85));
    assert(near(config.risk.f_max, 0.02));
    assert(config.penalty.cooldown_cycles == 5);

    write_text(dir + "/broken.json", "{\"risk\": ");
    Status broken = load_adaptive_config(dir + "/broken.json", config);
    assert(broken.kind == ErrorKind::VALIDATION);
    assert(near(config.risk.f_max, 0.02));

    setenv("ADAPTIVE_STATE_DIR", dir.c_str(), 1);
    unsetenv("ADAPTIVE_DB");
    apply_environment_overrides(config);
    assert(config.core.state_dir == dir);
    assert(config.core.db_path == (fs::path(dir) / "trade_feedback.db").string());
    unsetenv("ADAPTIVE_STATE_DIR");

    remove_temp_dir(dir);
    std::cout << "  ✅ PASSED\n" << std::endl;
}

int main() {
    std::cout << "\n=== Persistence Tests ===\n" << std::endl;

    test_round_trip();
    test_missing_and_corrupt_files();
    test_schema_mismatch();
    test_unwritable_path();
    test_config_overlay();

    std::cout << "=== All tests passed! ✅ ===\n" << std::endl;
    return 0;
}
