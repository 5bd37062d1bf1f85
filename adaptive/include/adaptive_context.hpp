#pragma once

#include <string>
#include <memory>
#include "adaptive_config.hpp"
#include "adaptive_status.hpp"
#include "outcome_store.hpp"
#include "penalty_tracker.hpp"
#include "confidence_calibrator.hpp"
#include "drift_detector.hpp"
#include "threshold_controller.hpp"
#include "risk_optimizer.hpp"
#include "adaptation_core.hpp"

/*
 * ADAPTIVE CONTEXT
 *
 * Owns one instance of every adaptive component, built from a single
 * AdaptiveConfig, and wires them into the AdaptationCore. There is no other
 * process-wide adaptive state.
 */
class AdaptiveContext {
public:
    explicit AdaptiveContext(const AdaptiveConfig& config = AdaptiveConfig());
    ~AdaptiveContext();

    AdaptiveContext(const AdaptiveContext&) = delete;
    AdaptiveContext& operator=(const AdaptiveContext&) = delete;

    // Opens the store, loads state and starts the adaptation worker.
    Status open();
    // Stops the worker and saves all state.
    Status close();

    const AdaptiveConfig& config() const { return config_; }

    OutcomeStore& store() { return store_; }
    PenaltyTracker& penalties() { return penalties_; }
    ConfidenceCalibrator& calibrator() { return calibrator_; }
    DriftDetector& drift() { return drift_; }
    ThresholdController& thresholds() { return thresholds_; }
    RiskOptimizer& risk() { return risk_; }
    AdaptationCore& core() { return *core_; }

    static std::string state_file(const std::string& state_dir, const std::string& name);

private:
    AdaptiveConfig config_;
    OutcomeStore store_;
    PenaltyTracker penalties_;
    ConfidenceCalibrator calibrator_;
    DriftDetector drift_;
    ThresholdController thresholds_;
    RiskOptimizer risk_;
    std::unique_ptr<AdaptationCore> core_;
    bool opened_ = false;
};
