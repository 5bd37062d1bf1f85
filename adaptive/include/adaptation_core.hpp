#pragma once

#include <string>
#include <vector>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include "adaptive_config.hpp"
#include "adaptive_status.hpp"
#include "trade_outcome.hpp"

class OutcomeStore;
class PenaltyTracker;
class ConfidenceCalibrator;
class DriftDetector;
class ThresholdController;
class RiskOptimizer;

/*
 * ADAPTATION CORE
 *
 * The only entry point the trading loop talks to. Fans each closed trade out
 * to the trackers, schedules recompute cycles on a single background worker,
 * and answers the two hot-path queries: filter() and size_all().
 *
 * Cycle scheduling: IDLE -> (trigger) -> PENDING -> RUNNING -> IDLE.
 * The request slot holds at most one cycle; a trigger seen while a cycle is
 * pending or running is dropped.
 */

struct HealthStatus {
    bool storage_ok = true;
    std::string last_storage_error;
    int failed_saves = 0;
};

// Caller-supplied fallback sizing: one currency amount per signal.
using BaselineSizer = std::function<std::vector<double>(const std::vector<FilteredSignal>&, double)>;

class AdaptationCore {
public:
    AdaptationCore(const CoreConfig& config,
                   OutcomeStore& store,
                   PenaltyTracker& penalties,
                   ConfidenceCalibrator& calibrator,
                   DriftDetector& drift,
                   ThresholdController& thresholds,
                   RiskOptimizer& risk);
    ~AdaptationCore();

    AdaptationCore(const AdaptationCore&) = delete;
    AdaptationCore& operator=(const AdaptationCore&) = delete;

    // Loads component state, runs the retention sweep and prints the banner.
    Status initialize();

    void start();
    void stop();
    bool running() const { return worker_running_.load(); }

    // Never throws. Returns the stored trade id, or the failure.
    Result<int64_t> log_outcome(TradeOutcome outcome);

    // Runs one full cycle on the calling thread. Returns false (and does
    // nothing) if another cycle is already running.
    bool run_adaptation_cycle();

    // Queues a cycle for the worker. Returns false when the trigger was
    // dropped because a cycle is already pending or running.
    bool request_cycle();

    // Blocks until no cycle is pending or running.
    bool wait_idle(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    std::vector<FilteredSignal> filter(const std::vector<Signal>& signals) const;
    std::vector<double> size_all(const std::vector<FilteredSignal>& signals, double wallet,
                                 const BaselineSizer& baseline = BaselineSizer()) const;

    void enable();
    void disable();
    bool enabled() const { return enabled_.load(); }

    json current_state() const;
    json recent_performance(int window = 100) const;
    json last_cycle_changes() const;
    int cycles_completed() const { return cycles_completed_.load(); }
    int dropped_triggers() const { return dropped_triggers_.load(); }

    Status save_state();
    Status load_state();
    HealthStatus health() const;

private:
    CoreConfig config_;
    OutcomeStore& store_;
    PenaltyTracker& penalties_;
    ConfidenceCalibrator& calibrator_;
    DriftDetector& drift_;
    ThresholdController& thresholds_;
    RiskOptimizer& risk_;

    std::atomic<bool> enabled_{true};

    // log_outcome serializes with itself only
    std::mutex ingest_mutex_;

    // Trigger counters
    mutable std::mutex counters_mutex_;
    int trades_since_adaptation_ = 0;
    int64_t trades_adapted_ = 0;     // consumed by completed cycles
    int64_t last_adaptation_ms_ = 0;

    // Mutual exclusion of cycles
    std::mutex cycle_mutex_;
    std::atomic<int> cycles_completed_{0};
    std::atomic<int> dropped_triggers_{0};
    mutable std::mutex changes_mutex_;
    json last_changes_ = json::object();

    // Worker and its depth-one request slot
    std::thread worker_;
    std::atomic<bool> worker_running_{false};
    mutable std::mutex slot_mutex_;
    std::condition_variable slot_cv_;
    std::condition_variable idle_cv_;
    bool cycle_pending_ = false;
    bool cycle_running_ = false;
    bool stopping_ = false;

    mutable std::mutex health_mutex_;
    HealthStatus health_;

    bool should_run_adaptation(int64_t now) const;
    void worker_loop();
    void record_save(const Status& status);
    std::vector<double> fallback_sizes(const std::vector<FilteredSignal>& signals, double wallet,
                                       const BaselineSizer& baseline) const;
};
