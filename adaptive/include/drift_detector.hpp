#pragma once

#include <string>
#include <deque>
#include <mutex>
#include <cstdint>
#include "adaptive_config.hpp"
#include "persistable.hpp"

/*
 * DRIFT DETECTOR
 *
 * Three independent Page-Hinkley tests (per-trade return, calibration error,
 * penalty). Any of them firing switches the whole agent into prudent mode
 * for a fixed number of adaptation cycles.
 */

struct PageHinkleyState {
    double sum = 0.0;
    double min_sum = 0.0;
    int drift_count = 0;
    int64_t last_drift_ms = 0;
};

class PageHinkley {
public:
    PageHinkley(double lambda, double delta) : lambda_(lambda), delta_(delta) {}

    // sum += x - lambda; fires when sum - min(sum) exceeds delta, then resets.
    bool update(double x);
    void reset();

    const PageHinkleyState& state() const { return state_; }
    void set_state(const PageHinkleyState& state) { state_ = state; }
    double delta() const { return delta_; }

private:
    double lambda_;
    double delta_;
    PageHinkleyState state_;
};

enum class DriftMetric { RETURN, CALIBRATION, PENALTY };
const char* drift_metric_name(DriftMetric metric);

struct DriftEvent {
    DriftMetric metric = DriftMetric::RETURN;
    int64_t timestamp_ms = 0;
    int prudent_cycles = 0;
};

struct PrudentAdjustments {
    double threshold_bump = 0.0;
    double kelly_multiplier = 1.0;
};

struct DriftSummary {
    bool prudent_mode_active = false;
    int prudent_cycles_remaining = 0;
    int total_drifts = 0;
    int return_drifts = 0;
    int calibration_drifts = 0;
    int penalty_drifts = 0;
    size_t recent_events = 0;
    bool has_last_event = false;
    DriftEvent last_event;
};

json drift_summary_to_json(const DriftSummary& summary);

class DriftDetector : public Persistable {
public:
    explicit DriftDetector(const DriftConfig& config = DriftConfig(),
                           const std::string& state_path = "adaptive_state/drift_detector_state.json");

    // Each returns true when its test fired on this observation.
    bool update_return(double roe_pct);
    bool update_calibration_error(double calibrated_confidence, int result);
    bool update_penalty(double penalty);

    // Once per adaptation cycle.
    void decrement_prudent_mode();

    bool prudent_mode_active() const;
    PrudentAdjustments prudent_adjustments() const;
    DriftSummary summary() const;
    std::deque<DriftEvent> history() const;
    PageHinkleyState metric_state(DriftMetric metric) const;

    void reset();

protected:
    json to_state_json() const override;
    void from_state_json(const json& state) override;
    void reset_state() override;

private:
    DriftConfig config_;

    PageHinkley return_test_;
    PageHinkley calibration_test_;
    PageHinkley penalty_test_;

    bool prudent_mode_active_ = false;
    int prudent_cycles_remaining_ = 0;
    std::deque<DriftEvent> history_;
    int64_t last_update_ms_ = 0;

    mutable std::mutex mutex_;

    bool observe(PageHinkley& test, DriftMetric metric, double x);
    PageHinkley& test_for(DriftMetric metric);
    const PageHinkley& test_for(DriftMetric metric) const;
};
