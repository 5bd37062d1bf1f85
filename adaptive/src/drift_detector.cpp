#include "drift_detector.hpp"
#include "trade_outcome.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

bool PageHinkley::update(double x) {
    state_.sum += (x - lambda_);
    state_.min_sum = std::min(state_.min_sum, state_.sum);

    double magnitude = state_.sum - state_.min_sum;
    if (magnitude > delta_) {
        state_.drift_count++;
        state_.last_drift_ms = now_ms();
        reset();
        return true;
    }
    return false;
}

void PageHinkley::reset() {
    state_.sum = 0.0;
    state_.min_sum = 0.0;
}

const char* drift_metric_name(DriftMetric metric) {
    switch (metric) {
        case DriftMetric::RETURN: return "RETURN";
        case DriftMetric::CALIBRATION: return "CALIBRATION";
        case DriftMetric::PENALTY: return "PENALTY";
    }
    return "UNKNOWN";
}

namespace {

DriftMetric parse_metric(const std::string& name) {
    if (name == "CALIBRATION") return DriftMetric::CALIBRATION;
    if (name == "PENALTY") return DriftMetric::PENALTY;
    return DriftMetric::RETURN;
}

json event_to_json(const DriftEvent& e) {
    return json{
        {"metric", drift_metric_name(e.metric)},
        {"timestamp", e.timestamp_ms},
        {"prudent_cycles", e.prudent_cycles}
    };
}

json ph_to_json(const PageHinkleyState& s) {
    return json{
        {"sum", s.sum},
        {"min_sum", s.min_sum},
        {"drift_count", s.drift_count},
        {"last_drift_time", s.last_drift_ms}
    };
}

PageHinkleyState ph_from_json(const json& j) {
    PageHinkleyState s;
    s.sum = j.value("sum", 0.0);
    s.min_sum = j.value("min_sum", 0.0);
    s.drift_count = j.value("drift_count", 0);
    s.last_drift_ms = j.value("last_drift_time", static_cast<int64_t>(0));
    return s;
}

}  // namespace

json drift_summary_to_json(const DriftSummary& s) {
    json j;
    j["prudent_mode_active"] = s.prudent_mode_active;
    j["prudent_cycles_remaining"] = s.prudent_cycles_remaining;
    j["total_drifts_detected"] = s.total_drifts;
    j["drifts_by_metric"] = {
        {"RETURN", s.return_drifts},
        {"CALIBRATION", s.calibration_drifts},
        {"PENALTY", s.penalty_drifts}
    };
    j["recent_drift_events"] = s.recent_events;
    j["last_drift"] = s.has_last_event ? event_to_json(s.last_event) : json(nullptr);
    return j;
}

DriftDetector::DriftDetector(const DriftConfig& config, const std::string& state_path)
    : Persistable("drift_detector", 1, state_path),
      config_(config),
      return_test_(config.lambda, config.delta),
      calibration_test_(config.lambda, config.delta * config.calibration_delta_factor),
      penalty_test_(config.lambda, config.delta) {}

PageHinkley& DriftDetector::test_for(DriftMetric metric) {
    switch (metric) {
        case DriftMetric::CALIBRATION: return calibration_test_;
        case DriftMetric::PENALTY: return penalty_test_;
        case DriftMetric::RETURN: break;
    }
    return return_test_;
}

const PageHinkley& DriftDetector::test_for(DriftMetric metric) const {
    switch (metric) {
        case DriftMetric::CALIBRATION: return calibration_test_;
        case DriftMetric::PENALTY: return penalty_test_;
        case DriftMetric::RETURN: break;
    }
    return return_test_;
}

bool DriftDetector::observe(PageHinkley& test, DriftMetric metric, double x) {
    if (!std::isfinite(x)) {
        std::cerr << "⚠️ Ignoring non-finite " << drift_metric_name(metric) << " observation" << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    last_update_ms_ = now_ms();
    if (!test.update(x)) return false;

    // Overwrites any running countdown rather than extending it
    prudent_mode_active_ = true;
    prudent_cycles_remaining_ = config_.prudent_cycles;

    DriftEvent event;
    event.metric = metric;
    event.timestamp_ms = last_update_ms_;
    event.prudent_cycles = config_.prudent_cycles;
    history_.push_back(event);
    while (history_.size() > config_.max_history) history_.pop_front();

    std::cerr << "🌊 DRIFT DETECTED in " << drift_metric_name(metric)
              << " - PRUDENT MODE activated for " << config_.prudent_cycles << " cycles" << std::endl;
    return true;
}

bool DriftDetector::update_return(double roe_pct) {
    return observe(return_test_, DriftMetric::RETURN, roe_pct / 100.0);
}

bool DriftDetector::update_calibration_error(double calibrated_confidence, int result) {
    double error = std::abs(calibrated_confidence - static_cast<double>(result));
    return observe(calibration_test_, DriftMetric::CALIBRATION, error);
}

bool DriftDetector::update_penalty(double penalty) {
    return observe(penalty_test_, DriftMetric::PENALTY, penalty);
}

void DriftDetector::decrement_prudent_mode() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (prudent_mode_active_ && prudent_cycles_remaining_ > 0) {
        prudent_cycles_remaining_--;
        if (prudent_cycles_remaining_ == 0) {
            prudent_mode_active_ = false;
            std::cout << "✅ PRUDENT MODE deactivated - returning to normal" << std::endl;
        }
    }
}

bool DriftDetector::prudent_mode_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prudent_mode_active_;
}

PrudentAdjustments DriftDetector::prudent_adjustments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PrudentAdjustments adj;
    if (prudent_mode_active_) {
        adj.threshold_bump = config_.prudent_threshold_bump;
        adj.kelly_multiplier = config_.prudent_kelly_multiplier;
    }
    return adj;
}

DriftSummary DriftDetector::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DriftSummary s;
    s.prudent_mode_active = prudent_mode_active_;
    s.prudent_cycles_remaining = prudent_cycles_remaining_;
    s.return_drifts = return_test_.state().drift_count;
    s.calibration_drifts = calibration_test_.state().drift_count;
    s.penalty_drifts = penalty_test_.state().drift_count;
    s.total_drifts = s.return_drifts + s.calibration_drifts + s.penalty_drifts;
    s.recent_events = history_.size();
    if (!history_.empty()) {
        s.has_last_event = true;
        s.last_event = history_.back();
    }
    return s;
}

std::deque<DriftEvent> DriftDetector::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

PageHinkleyState DriftDetector::metric_state(DriftMetric metric) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return test_for(metric).state();
}

void DriftDetector::reset() {
    reset_state();
    std::cout << "🔄 Drift detector reset" << std::endl;
}

json DriftDetector::to_state_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json state;
    state["return"] = ph_to_json(return_test_.state());
    state["calibration"] = ph_to_json(calibration_test_.state());
    state["penalty"] = ph_to_json(penalty_test_.state());
    state["prudent_mode_active"] = prudent_mode_active_;
    state["prudent_cycles_remaining"] = prudent_cycles_remaining_;
    json history = json::array();
    for (const auto& e : history_) history.push_back(event_to_json(e));
    state["drift_history"] = history;
    state["last_update"] = last_update_ms_;
    return state;
}

void DriftDetector::from_state_json(const json& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state.contains("return")) return_test_.set_state(ph_from_json(state["return"]));
    if (state.contains("calibration")) calibration_test_.set_state(ph_from_json(state["calibration"]));
    if (state.contains("penalty")) penalty_test_.set_state(ph_from_json(state["penalty"]));
    prudent_mode_active_ = state.value("prudent_mode_active", false);
    prudent_cycles_remaining_ = state.value("prudent_cycles_remaining", 0);
    last_update_ms_ = state.value("last_update", static_cast<int64_t>(0));

    history_.clear();
    if (state.contains("drift_history")) {
        for (const auto& je : state["drift_history"]) {
            DriftEvent e;
            e.metric = parse_metric(je.value("metric", std::string("RETURN")));
            e.timestamp_ms = je.value("timestamp", static_cast<int64_t>(0));
            e.prudent_cycles = je.value("prudent_cycles", config_.prudent_cycles);
            history_.push_back(e);
        }
    }
    while (history_.size() > config_.max_history) history_.pop_front();

    std::cout << "✅ Loaded drift state: prudent_mode=" << (prudent_mode_active_ ? "ON" : "OFF")
              << ", drifts=" << history_.size() << std::endl;
}

void DriftDetector::reset_state() {
    std::lock_guard<std::mutex> lock(mutex_);
    return_test_.set_state(PageHinkleyState());
    calibration_test_.set_state(PageHinkleyState());
    penalty_test_.set_state(PageHinkleyState());
    prudent_mode_active_ = false;
    prudent_cycles_remaining_ = 0;
    history_.clear();
    last_update_ms_ = 0;
}
