#include "adaptive_config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void read_penalty(const json& j, PenaltyConfig& c) {
    c.w_conf = j.value("w_conf", c.w_conf);
    c.w_sl = j.value("w_sl", c.w_sl);
    c.w_fast = j.value("w_fast", c.w_fast);
    c.w_mae = j.value("w_mae", c.w_mae);
    c.fast_exit_seconds = j.value("fast_exit_seconds", c.fast_exit_seconds);
    c.cooldown_threshold = j.value("cooldown_threshold", c.cooldown_threshold);
    c.cooldown_cycles = j.value("cooldown_cycles", c.cooldown_cycles);
    c.ewma_alpha = j.value("ewma_alpha", c.ewma_alpha);
}

void read_threshold(const json& j, ThresholdConfig& c) {
    c.tau_global_init = j.value("tau_global_init", c.tau_global_init);
    if (j.contains("tau_side_init") && j["tau_side_init"].is_object()) {
        c.tau_side_init = j["tau_side_init"].get<std::map<std::string, double>>();
    }
    if (j.contains("tau_tf_init") && j["tau_tf_init"].is_object()) {
        c.tau_tf_init = j["tau_tf_init"].get<std::map<std::string, double>>();
    }
    c.tau_min = j.value("tau_min", c.tau_min);
    c.tau_max = j.value("tau_max", c.tau_max);
    c.min_trades_for_update = j.value("min_trades_for_update", c.min_trades_for_update);
    c.min_trades_per_bucket = j.value("min_trades_per_bucket", c.min_trades_per_bucket);
    c.update_interval_hours = j.value("update_interval_hours", c.update_interval_hours);
}

void read_drift(const json& j, DriftConfig& c) {
    c.lambda = j.value("lambda", c.lambda);
    c.delta = j.value("delta", c.delta);
    c.calibration_delta_factor = j.value("calibration_delta_factor", c.calibration_delta_factor);
    c.prudent_cycles = j.value("prudent_cycles", c.prudent_cycles);
    c.prudent_threshold_bump = j.value("prudent_threshold_bump", c.prudent_threshold_bump);
    c.prudent_kelly_multiplier = j.value("prudent_kelly_multiplier", c.prudent_kelly_multiplier);
    c.max_history = j.value("max_history", c.max_history);
}

void read_risk(const json& j, RiskConfig& c) {
    c.k_factor = j.value("k_factor", c.k_factor);
    c.f_max = j.value("f_max", c.f_max);
    c.target_sigma = j.value("target_sigma", c.target_sigma);
    c.min_position_usd = j.value("min_position_usd", c.min_position_usd);
    c.max_position_usd = j.value("max_position_usd", c.max_position_usd);
    c.refit_recent_trades = j.value("refit_recent_trades", c.refit_recent_trades);
    c.bucket_window = j.value("bucket_window", c.bucket_window);
    c.loss_lookback_days = j.value("loss_lookback_days", c.loss_lookback_days);
    c.min_loss_samples = j.value("min_loss_samples", c.min_loss_samples);
    c.default_daily_loss_cap = j.value("default_daily_loss_cap", c.default_daily_loss_cap);
}

void read_calibration(const json& j, CalibrationConfig& c) {
    if (j.contains("bin_edges") && j["bin_edges"].is_array()) {
        c.bin_edges = j["bin_edges"].get<std::vector<double>>();
    }
    c.min_samples = j.value("min_samples", c.min_samples);
    c.min_bin_samples = j.value("min_bin_samples", c.min_bin_samples);
    c.sample_limit = j.value("sample_limit", c.sample_limit);
}

void read_core(const json& j, CoreConfig& c) {
    c.min_trades_for_update = j.value("min_trades_for_update", c.min_trades_for_update);
    c.update_interval_hours = j.value("update_interval_hours", c.update_interval_hours);
    c.position_min_absolute = j.value("position_min_absolute", c.position_min_absolute);
    c.position_max_absolute = j.value("position_max_absolute", c.position_max_absolute);
    c.retention_max_trades = j.value("retention_max_trades", c.retention_max_trades);
    c.retention_max_days = j.value("retention_max_days", c.retention_max_days);
    c.state_dir = j.value("state_dir", c.state_dir);
    c.db_path = j.value("db_path", c.db_path);
}

}  // namespace

void apply_environment_overrides(AdaptiveConfig& config) {
    // Allow override via env for testing/CI
    const char* env_dir = std::getenv("ADAPTIVE_STATE_DIR");
    if (env_dir && *env_dir) {
        config.core.state_dir = env_dir;
        config.core.db_path = std::string(env_dir) + "/trade_feedback.db";
    }
    const char* env_db = std::getenv("ADAPTIVE_DB");
    if (env_db && *env_db) {
        config.core.db_path = env_db;
    }
}

Status load_adaptive_config(const std::string& path, AdaptiveConfig& config) {
    std::ifstream file(path);
    if (!file.good()) {
        std::cout << "No adaptive config found at " << path << ", using defaults" << std::endl;
        apply_environment_overrides(config);
        return Status::success();
    }

    AdaptiveConfig loaded = config;
    try {
        json j;
        file >> j;
        if (j.contains("penalty")) read_penalty(j["penalty"], loaded.penalty);
        if (j.contains("threshold")) read_threshold(j["threshold"], loaded.threshold);
        if (j.contains("drift")) read_drift(j["drift"], loaded.drift);
        if (j.contains("risk")) read_risk(j["risk"], loaded.risk);
        if (j.contains("calibration")) read_calibration(j["calibration"], loaded.calibration);
        if (j.contains("core")) read_core(j["core"], loaded.core);
    } catch (const json::exception& e) {
        std::cerr << "❌ Error parsing adaptive config " << path << ": " << e.what() << std::endl;
        apply_environment_overrides(config);
        return Status::error(ErrorKind::VALIDATION, e.what());
    }

    config = loaded;
    apply_environment_overrides(config);

    std::cout << "Loaded adaptive config from " << path << std::endl;
    std::cout << "  tau_global_init: " << config.threshold.tau_global_init << std::endl;
    std::cout << "  min_trades_for_update: " << config.core.min_trades_for_update << std::endl;
    std::cout << "  kelly k_factor: " << config.risk.k_factor
              << " | f_max: " << config.risk.f_max << std::endl;
    std::cout << "  state_dir: " << config.core.state_dir << std::endl;
    return Status::success();
}
