#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include "adaptive_config.hpp"
#include "persistable.hpp"
#include "trade_outcome.hpp"

class OutcomeStore;
struct CalibrationSample;

/*
 * CONFIDENCE CALIBRATOR
 *
 * Maps raw model confidence to the empirical win rate observed for that
 * confidence range, per (side, timeframe). Refit only inside an adaptation
 * cycle; lookups read an immutable snapshot and never block on a refit.
 */

struct CalibrationBin {
    double lower = 0.0;
    double upper = 0.0;          // exclusive, except for the last bin
    double calibrated = 0.0;     // empirical win rate
    int samples = 0;
    int wins = 0;
};

// bucket key "LONG|15m" -> bins with enough samples
using CalibrationTable = std::map<std::string, std::vector<CalibrationBin>>;

class ConfidenceCalibrator : public Persistable {
public:
    explicit ConfidenceCalibrator(const CalibrationConfig& config = CalibrationConfig(),
                                  const std::string& state_path = "adaptive_state/calibration_state.json");

    // Identity when no bin covers the bucket/range; result clamped to [0,1].
    double calibrate(double raw_confidence, Side side, const std::string& timeframe) const;

    // Refits every (side, timeframe) present in the store with enough samples.
    json recalibrate_all(const OutcomeStore& store);

    json info() const;
    size_t bucket_count() const;

    std::shared_ptr<const CalibrationTable> snapshot() const;
    void reset();

    static std::string bucket_key(Side side, const std::string& timeframe);

protected:
    json to_state_json() const override;
    void from_state_json(const json& state) override;
    void reset_state() override;

private:
    CalibrationConfig config_;
    std::shared_ptr<const CalibrationTable> table_;
    int64_t last_fit_ms_ = 0;
    mutable std::mutex mutex_;

    std::vector<CalibrationBin> fit_bins(const std::vector<CalibrationSample>& samples) const;
    void publish(std::shared_ptr<const CalibrationTable> table);
};

double calibrate_with(const CalibrationTable& table, double raw_confidence, Side side,
                      const std::string& timeframe);
