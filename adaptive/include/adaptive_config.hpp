#pragma once

#include <string>
#include <vector>
#include <map>
#include "adaptive_status.hpp"

/*
 * ADAPTIVE LAYER CONFIGURATION
 *
 * Construction-time options for every component. Defaults are the values the
 * live agent runs with; load_adaptive_config() overlays a JSON file on top.
 */

struct PenaltyConfig {
    double w_conf = 1.0;              // loss weighted by calibrated confidence^2
    double w_sl = 1.5;                // stop-loss hit
    double w_fast = 0.5;              // closed in under fast_exit_seconds
    double w_mae = 0.3;               // per 100bp of adverse excursion
    int fast_exit_seconds = 300;
    double cooldown_threshold = 1.2;  // clusters use 1.25x this
    int cooldown_cycles = 3;
    double ewma_alpha = 0.15;
};

struct ThresholdConfig {
    double tau_global_init = 0.70;
    std::map<std::string, double> tau_side_init = {{"LONG", 0.70}, {"SHORT", 0.72}};
    std::map<std::string, double> tau_tf_init = {{"15m", 0.70}, {"30m", 0.71}, {"1h", 0.71}};
    double tau_min = 0.60;
    double tau_max = 0.85;
    int min_trades_for_update = 200;
    int min_trades_per_bucket = 50;
    double update_interval_hours = 12.0;
};

struct DriftConfig {
    double lambda = 0.5;
    double delta = 0.02;
    double calibration_delta_factor = 0.5;  // calibration test is twice as sensitive
    int prudent_cycles = 40;
    double prudent_threshold_bump = 0.05;
    double prudent_kelly_multiplier = 0.5;
    size_t max_history = 50;
};

struct RiskConfig {
    double k_factor = 0.25;           // quarter-Kelly
    double f_max = 0.01;              // 1% of wallet
    double target_sigma = 1.0;
    double min_position_usd = 15.0;
    double max_position_usd = 150.0;
    int refit_recent_trades = 200;
    int bucket_window = 100;
    int loss_lookback_days = 10;
    int min_loss_samples = 5;
    double default_daily_loss_cap = 100.0;
};

struct CalibrationConfig {
    std::vector<double> bin_edges = {0.0, 0.6, 0.7, 0.8, 0.9, 1.0};
    int min_samples = 50;             // per (side, timeframe)
    int min_bin_samples = 10;
    int sample_limit = 1000;
};

struct CoreConfig {
    int min_trades_for_update = 200;
    double update_interval_hours = 12.0;
    double position_min_absolute = 15.0;
    double position_max_absolute = 150.0;
    int retention_max_trades = 5000;
    int retention_max_days = 180;
    std::string state_dir = "adaptive_state";
    std::string db_path = "adaptive_state/trade_feedback.db";
};

struct AdaptiveConfig {
    PenaltyConfig penalty;
    ThresholdConfig threshold;
    DriftConfig drift;
    RiskConfig risk;
    CalibrationConfig calibration;
    CoreConfig core;
};

// Overlays values from a JSON file onto `config`. A missing file keeps the
// defaults and returns success; a malformed one returns a VALIDATION status
// and leaves `config` untouched. ADAPTIVE_STATE_DIR / ADAPTIVE_DB environment
// variables are applied afterwards in both cases.
Status load_adaptive_config(const std::string& path, AdaptiveConfig& config);

void apply_environment_overrides(AdaptiveConfig& config);
