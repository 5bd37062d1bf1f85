#include "confidence_calibrator.hpp"
#include "outcome_store.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace {

double clamp_unit(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::min(1.0, std::max(0.0, x));
}

json bins_to_json(const std::vector<CalibrationBin>& bins) {
    json arr = json::array();
    for (const auto& b : bins) {
        arr.push_back({
            {"raw_range", {b.lower, b.upper}},
            {"calibrated_value", b.calibrated},
            {"samples", b.samples},
            {"wins", b.wins}
        });
    }
    return arr;
}

}  // namespace

double calibrate_with(const CalibrationTable& table, double raw_confidence, Side side,
                      const std::string& timeframe) {
    auto it = table.find(ConfidenceCalibrator::bucket_key(side, timeframe));
    if (it != table.end()) {
        const auto& bins = it->second;
        for (size_t i = 0; i < bins.size(); i++) {
            const CalibrationBin& bin = bins[i];
            bool last = (i + 1 == bins.size());
            if (raw_confidence >= bin.lower &&
                (raw_confidence < bin.upper || (last && raw_confidence <= bin.upper))) {
                return clamp_unit(bin.calibrated);
            }
        }
    }
    return clamp_unit(raw_confidence);
}

ConfidenceCalibrator::ConfidenceCalibrator(const CalibrationConfig& config, const std::string& state_path)
    : Persistable("confidence_calibrator", 1, state_path),
      config_(config),
      table_(std::make_shared<const CalibrationTable>()) {}

std::string ConfidenceCalibrator::bucket_key(Side side, const std::string& timeframe) {
    return std::string(side_name(side)) + "|" + timeframe;
}

std::shared_ptr<const CalibrationTable> ConfidenceCalibrator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_;
}

void ConfidenceCalibrator::publish(std::shared_ptr<const CalibrationTable> table) {
    std::lock_guard<std::mutex> lock(mutex_);
    table_ = std::move(table);
}

double ConfidenceCalibrator::calibrate(double raw_confidence, Side side, const std::string& timeframe) const {
    auto table = snapshot();
    return calibrate_with(*table, raw_confidence, side, timeframe);
}

std::vector<CalibrationBin> ConfidenceCalibrator::fit_bins(const std::vector<CalibrationSample>& samples) const {
    std::vector<CalibrationBin> bins;
    const auto& edges = config_.bin_edges;
    for (size_t i = 0; i + 1 < edges.size(); i++) {
        CalibrationBin bin;
        bin.lower = edges[i];
        bin.upper = edges[i + 1];
        bool last = (i + 2 == edges.size());
        for (const auto& s : samples) {
            if (s.confidence_raw >= bin.lower &&
                (s.confidence_raw < bin.upper || (last && s.confidence_raw <= bin.upper))) {
                bin.samples++;
                if (s.result == 1) bin.wins++;
            }
        }
        if (bin.samples >= config_.min_bin_samples) {
            bin.calibrated = static_cast<double>(bin.wins) / bin.samples;
            bins.push_back(bin);
        }
    }
    return bins;
}

json ConfidenceCalibrator::recalibrate_all(const OutcomeStore& store) {
    json changes = json::object();
    auto next = std::make_shared<CalibrationTable>(*snapshot());

    std::vector<std::string> timeframes = store.distinct_values("timeframe");
    for (Side side : {Side::LONG, Side::SHORT}) {
        for (const auto& tf : timeframes) {
            auto samples = store.calibration_samples(side, tf, config_.sample_limit);
            if (static_cast<int>(samples.size()) < config_.min_samples) {
                continue;
            }
            auto bins = fit_bins(samples);
            if (bins.empty()) continue;

            std::string key = bucket_key(side, tf);
            (*next)[key] = bins;
            changes[key] = {{"samples", samples.size()}, {"bins", bins.size()}};

            std::cout << "🎯 Calibrated " << key << " from " << samples.size() << " trades:";
            for (const auto& b : bins) {
                std::cout << std::fixed << std::setprecision(2)
                          << " [" << b.lower << "," << b.upper << ")->" << b.calibrated;
            }
            std::cout << std::endl;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_fit_ms_ = now_ms();
    }
    publish(std::move(next));
    return changes;
}

size_t ConfidenceCalibrator::bucket_count() const {
    return snapshot()->size();
}

json ConfidenceCalibrator::info() const {
    auto table = snapshot();
    json j;
    j["bucket_count"] = table->size();
    json buckets = json::array();
    for (const auto& kv : *table) buckets.push_back(kv.first);
    j["buckets"] = buckets;
    return j;
}

void ConfidenceCalibrator::reset() {
    reset_state();
    std::cout << "🔄 Confidence calibration reset to identity" << std::endl;
}

json ConfidenceCalibrator::to_state_json() const {
    auto table = snapshot();
    json state;
    json tables = json::object();
    for (const auto& kv : *table) tables[kv.first] = bins_to_json(kv.second);
    state["tables"] = tables;
    std::lock_guard<std::mutex> lock(mutex_);
    state["last_fit"] = last_fit_ms_;
    return state;
}

void ConfidenceCalibrator::from_state_json(const json& state) {
    auto table = std::make_shared<CalibrationTable>();
    if (state.contains("tables")) {
        for (auto it = state["tables"].begin(); it != state["tables"].end(); ++it) {
            std::vector<CalibrationBin> bins;
            for (const auto& jb : it.value()) {
                CalibrationBin b;
                b.lower = jb.at("raw_range").at(0).get<double>();
                b.upper = jb.at("raw_range").at(1).get<double>();
                b.calibrated = jb.at("calibrated_value").get<double>();
                b.samples = jb.value("samples", 0);
                b.wins = jb.value("wins", 0);
                bins.push_back(b);
            }
            (*table)[it.key()] = bins;
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_fit_ms_ = state.value("last_fit", static_cast<int64_t>(0));
    }
    std::cout << "✅ Loaded calibration for " << table->size() << " buckets" << std::endl;
    publish(std::move(table));
}

void ConfidenceCalibrator::reset_state() {
    publish(std::make_shared<const CalibrationTable>());
    std::lock_guard<std::mutex> lock(mutex_);
    last_fit_ms_ = 0;
}
