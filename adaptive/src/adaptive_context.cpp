#include "adaptive_context.hpp"
#include <iostream>

std::string AdaptiveContext::state_file(const std::string& state_dir, const std::string& name) {
    if (state_dir.empty()) return name;
    if (state_dir.back() == '/') return state_dir + name;
    return state_dir + "/" + name;
}

AdaptiveContext::AdaptiveContext(const AdaptiveConfig& config)
    : config_(config),
      store_(config.core.db_path),
      penalties_(config.penalty, state_file(config.core.state_dir, "penalty_state.json")),
      calibrator_(config.calibration, state_file(config.core.state_dir, "calibration_state.json")),
      drift_(config.drift, state_file(config.core.state_dir, "drift_detector_state.json")),
      thresholds_(config.threshold, state_file(config.core.state_dir, "threshold_state.json")),
      risk_(config.risk, state_file(config.core.state_dir, "risk_optimizer_state.json")),
      core_(std::make_unique<AdaptationCore>(config.core, store_, penalties_, calibrator_,
                                             drift_, thresholds_, risk_)) {}

AdaptiveContext::~AdaptiveContext() {
    if (opened_) {
        Status status = close();
        if (!status.ok()) {
            std::cerr << "⚠️ Adaptive state not fully saved on shutdown: " << status.message << std::endl;
        }
    }
}

Status AdaptiveContext::open() {
    Status status = core_->initialize();
    core_->start();
    opened_ = true;
    return status;
}

Status AdaptiveContext::close() {
    if (!core_->wait_idle()) {
        std::cerr << "⚠️ Adaptation cycle still running at shutdown" << std::endl;
    }
    core_->stop();
    opened_ = false;
    return core_->save_state();
}
