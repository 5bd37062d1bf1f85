#include "adaptation_core.hpp"
#include "outcome_store.hpp"
#include "penalty_tracker.hpp"
#include "confidence_calibrator.hpp"
#include "drift_detector.hpp"
#include "threshold_controller.hpp"
#include "risk_optimizer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace {

const int64_t MS_PER_HOUR = 3600LL * 1000LL;

}  // namespace

AdaptationCore::AdaptationCore(const CoreConfig& config,
                               OutcomeStore& store,
                               PenaltyTracker& penalties,
                               ConfidenceCalibrator& calibrator,
                               DriftDetector& drift,
                               ThresholdController& thresholds,
                               RiskOptimizer& risk)
    : config_(config),
      store_(store),
      penalties_(penalties),
      calibrator_(calibrator),
      drift_(drift),
      thresholds_(thresholds),
      risk_(risk),
      last_adaptation_ms_(now_ms()) {
    std::cout << "🧠 AdaptationCore initialized" << std::endl;
}

AdaptationCore::~AdaptationCore() {
    stop();
}

Status AdaptationCore::initialize() {
    std::cout << "🧠 ADAPTIVE LEARNING SYSTEM: Initializing..." << std::endl;

    Status status = Status::success();
    if (!store_.is_open()) {
        status = store_.open();
        if (!status.ok()) {
            std::lock_guard<std::mutex> lock(health_mutex_);
            health_.storage_ok = false;
            health_.last_storage_error = status.message;
        }
    }

    Status loaded = load_state();
    if (status.ok() && !loaded.ok()) status = loaded;

    if (store_.is_open()) {
        Result<int> swept = store_.retention_sweep(config_.retention_max_trades, config_.retention_max_days);
        if (!swept.ok()) {
            std::cerr << "⚠️ Retention sweep failed: " << swept.status.message << std::endl;
        }
    }

    json state = current_state();
    std::cout << "🧠 ADAPTIVE SYSTEM READY" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "   📊 Global Threshold (τ): " << state["tau_global"].get<double>() << std::endl;
    std::cout << "   💰 Kelly Factor: " << state["kelly_factor"].get<double>() << "×" << std::endl;
    std::cout << "   📈 Total Trades Learned: " << state["total_trades"].get<int>() << std::endl;
    std::cout << "   🎯 Calibrators Active: " << state["n_calibrators"].get<size_t>() << std::endl;
    if (state["prudent_mode_active"].get<bool>()) {
        std::cerr << "   🌊 PRUDENT MODE ACTIVE: " << state["prudent_cycles_remaining"].get<int>()
                  << " cycles remaining" << std::endl;
    }
    return status;
}

void AdaptationCore::start() {
    std::lock_guard<std::mutex> lock(slot_mutex_);
    if (worker_running_.load()) return;
    stopping_ = false;
    worker_running_ = true;
    worker_ = std::thread(&AdaptationCore::worker_loop, this);
}

void AdaptationCore::stop() {
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        if (!worker_running_.load()) return;
        stopping_ = true;
    }
    slot_cv_.notify_all();
    if (worker_.joinable()) worker_.join();

    std::lock_guard<std::mutex> lock(slot_mutex_);
    worker_running_ = false;
    cycle_pending_ = false;
    idle_cv_.notify_all();
}

void AdaptationCore::worker_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(slot_mutex_);
            slot_cv_.wait(lock, [this] { return stopping_ || cycle_pending_; });
            if (stopping_) return;
            cycle_pending_ = false;
            cycle_running_ = true;
        }

        run_adaptation_cycle();

        {
            std::lock_guard<std::mutex> lock(slot_mutex_);
            cycle_running_ = false;
        }
        idle_cv_.notify_all();
    }
}

bool AdaptationCore::request_cycle() {
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        if (cycle_pending_ || cycle_running_) {
            dropped_triggers_++;
            std::cout << "🧠 Adaptation already scheduled - trigger dropped" << std::endl;
            return false;
        }
        cycle_pending_ = true;
    }
    slot_cv_.notify_one();
    return true;
}

bool AdaptationCore::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(slot_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return !cycle_running_ && (!cycle_pending_ || !worker_running_.load());
    });
}

bool AdaptationCore::should_run_adaptation(int64_t now) const {
    {
        std::lock_guard<std::mutex> lock(counters_mutex_);
        if (trades_since_adaptation_ >= config_.min_trades_for_update) return true;
        double hours = static_cast<double>(now - last_adaptation_ms_) / MS_PER_HOUR;
        if (hours >= config_.update_interval_hours) return true;
    }
    return thresholds_.should_update(now);
}

Result<int64_t> AdaptationCore::log_outcome(TradeOutcome trade) {
    std::lock_guard<std::mutex> ingest(ingest_mutex_);
    try {
        if (trade.cluster.empty()) trade.cluster = DEFAULT_CLUSTER;
        if (trade.timeframe.empty()) trade.timeframe = DEFAULT_TIMEFRAME;

        // 1. Penalty score
        double penalty = penalties_.score(trade);
        trade.penalty_score = penalty;

        // 2. Persist
        Result<int64_t> stored = store_.append(trade);
        if (!stored.ok()) {
            std::cerr << "⚠️ Trade logging failed: " << stored.status.message << std::endl;
            std::lock_guard<std::mutex> lock(health_mutex_);
            health_.storage_ok = false;
            health_.last_storage_error = stored.status.message;
            return stored;
        }

        // 3. Penalty EWMA
        penalties_.update_ewma(trade.symbol, trade.cluster, penalty);

        // 4. Drift tests
        drift_.update_return(trade.roe_pct);
        if (trade.confidence_calibrated) {
            drift_.update_calibration_error(*trade.confidence_calibrated, trade.result);
        }
        drift_.update_penalty(penalty);

        // 5. Daily loss, on the wall clock
        risk_.record_outcome(trade.pnl_usd);

        // 6. Counters
        {
            std::lock_guard<std::mutex> lock(counters_mutex_);
            trades_since_adaptation_++;
        }
        thresholds_.increment_trade_count();

        // 7. Trigger
        if (should_run_adaptation(now_ms())) {
            request_cycle();
        }
        return stored;
    } catch (const std::exception& e) {
        std::cerr << "❌ Trade outcome logging failed: " << e.what() << std::endl;
        return Result<int64_t>::error(ErrorKind::VALIDATION, e.what(), -1);
    }
}

bool AdaptationCore::run_adaptation_cycle() {
    std::unique_lock<std::mutex> cycle(cycle_mutex_, std::try_to_lock);
    if (!cycle.owns_lock()) {
        dropped_triggers_++;
        std::cout << "🧠 Adaptation cycle already running - skipped" << std::endl;
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    int seen = 0;
    {
        std::lock_guard<std::mutex> lock(counters_mutex_);
        seen = trades_since_adaptation_;
    }
    std::cout << "🧠 ADAPTIVE CYCLE STARTED" << std::endl;
    json changes = json::object();

    // Each step is independent: a failure is logged and the cycle moves on.
    try {
        std::cout << "   🎚️ Updating thresholds..." << std::endl;
        json t = thresholds_.update(store_, penalties_.cluster_penalties());
        if (!t.empty()) changes["thresholds"] = t;
    } catch (const std::exception& e) {
        std::cerr << "❌ Threshold update failed: " << e.what() << std::endl;
    }

    try {
        std::cout << "   📏 Recalibrating confidence..." << std::endl;
        json c = calibrator_.recalibrate_all(store_);
        if (!c.empty()) changes["calibration"] = std::to_string(c.size()) + " combinations";
    } catch (const std::exception& e) {
        std::cerr << "❌ Recalibration failed: " << e.what() << std::endl;
    }

    try {
        std::cout << "   💰 Updating Kelly parameters..." << std::endl;
        json k = risk_.refit(store_);
        if (!k.empty()) changes["kelly"] = std::to_string(k.size()) + " buckets";
    } catch (const std::exception& e) {
        std::cerr << "❌ Kelly refit failed: " << e.what() << std::endl;
    }

    try {
        std::cout << "   🚫 Managing cooldowns..." << std::endl;
        penalties_.tick_cooldowns();
        auto active = penalties_.active_cooldowns();
        if (!active.empty()) changes["cooldowns"] = std::to_string(active.size()) + " active";
    } catch (const std::exception& e) {
        std::cerr << "❌ Cooldown tick failed: " << e.what() << std::endl;
    }

    try {
        drift_.decrement_prudent_mode();
        DriftSummary summary = drift_.summary();
        if (summary.prudent_mode_active) {
            changes["prudent_mode"] = std::to_string(summary.prudent_cycles_remaining) + " cycles";
        }
    } catch (const std::exception& e) {
        std::cerr << "❌ Prudent mode decrement failed: " << e.what() << std::endl;
    }

    {
        std::lock_guard<std::mutex> lock(counters_mutex_);
        // Trades logged while the cycle ran count toward the next one
        trades_since_adaptation_ = std::max(0, trades_since_adaptation_ - seen);
        trades_adapted_ += seen;
        last_adaptation_ms_ = now_ms();
    }

    save_state();

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::cout << "🧠 ADAPTIVE CYCLE COMPLETED" << std::endl;
    std::cout << "   ⏱️ Duration: " << std::fixed << std::setprecision(1) << elapsed << "s" << std::endl;
    if (changes.empty()) {
        std::cout << "   ℹ️ No parameter changes needed" << std::endl;
    } else {
        for (auto it = changes.begin(); it != changes.end(); ++it) {
            std::cout << "   📊 " << it.key() << ": " << it.value().dump() << std::endl;
        }
    }

    {
        std::lock_guard<std::mutex> lock(changes_mutex_);
        last_changes_ = changes;
    }
    cycles_completed_++;
    return true;
}

std::vector<FilteredSignal> AdaptationCore::filter(const std::vector<Signal>& signals) const {
    std::vector<FilteredSignal> kept;

    if (!enabled_.load()) {
        for (const auto& s : signals) {
            FilteredSignal f;
            f.signal = s;
            f.calibrated_confidence = s.raw_confidence;
            kept.push_back(f);
        }
        return kept;
    }

    try {
        // One consistent view for the whole batch
        auto calibration = calibrator_.snapshot();
        auto threshold_set = thresholds_.snapshot();
        CooldownSet cooldowns = penalties_.cooldown_snapshot();
        PrudentAdjustments adj = drift_.prudent_adjustments();

        int cooled = 0, rejected = 0;
        for (const auto& s : signals) {
            double calibrated = calibrate_with(*calibration, s.raw_confidence, s.side, s.timeframe);

            if (cooldowns.contains(s.symbol, s.cluster)) {
                cooled++;
                std::cerr << "🚫 " << s.symbol << " in cooldown - skipped (cluster=" << s.cluster << ")" << std::endl;
                continue;
            }

            double tau = threshold_set->effective(s.side, s.timeframe, s.cluster) + adj.threshold_bump;
            if (calibrated >= tau) {
                FilteredSignal f;
                f.signal = s;
                f.calibrated_confidence = calibrated;
                f.effective_threshold = tau;
                kept.push_back(f);
            } else {
                rejected++;
            }
        }

        std::cout << "🧠 Adaptive filter: " << signals.size() << " → " << kept.size() << " signals"
                  << " (cooled=" << cooled << ", filtered=" << rejected << ")" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "❌ Adaptive filtering failed: " << e.what() << " - rejecting batch" << std::endl;
        kept.clear();
    }
    return kept;
}

std::vector<double> AdaptationCore::fallback_sizes(const std::vector<FilteredSignal>& signals, double wallet,
                                                   const BaselineSizer& baseline) const {
    if (baseline) {
        try {
            std::vector<double> sizes = baseline(signals, wallet);
            if (sizes.size() == signals.size()) return sizes;
            std::cerr << "⚠️ Baseline sizer returned " << sizes.size() << " sizes for "
                      << signals.size() << " signals" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "❌ Baseline sizer failed: " << e.what() << std::endl;
        }
    }
    return std::vector<double>(signals.size(), 0.0);
}

std::vector<double> AdaptationCore::size_all(const std::vector<FilteredSignal>& signals, double wallet,
                                             const BaselineSizer& baseline) const {
    if (!enabled_.load()) {
        return fallback_sizes(signals, wallet, baseline);
    }
    if (!(wallet > 0) || !std::isfinite(wallet)) {
        return std::vector<double>(signals.size(), 0.0);
    }

    std::vector<double> margins;
    margins.reserve(signals.size());
    try {
        double multiplier = drift_.prudent_adjustments().kelly_multiplier;

        for (const auto& f : signals) {
            Result<KellyBreakdown> k = risk_.kelly_breakdown(f.calibrated_confidence, f.signal.symbol, wallet);
            if (!k.ok()) {
                std::cerr << "❌ Kelly sizing failed for " << f.signal.symbol << ": " << k.status.message
                          << " - using baseline for the batch" << std::endl;
                return fallback_sizes(signals, wallet, baseline);
            }
            double margin = k.value.fraction * multiplier * wallet;
            margin = std::max(config_.position_min_absolute, std::min(config_.position_max_absolute, margin));
            if (!std::isfinite(margin)) {
                return fallback_sizes(signals, wallet, baseline);
            }
            margins.push_back(margin);
        }
    } catch (const std::exception& e) {
        std::cerr << "❌ Kelly margin calculation failed: " << e.what() << " - using baseline" << std::endl;
        return fallback_sizes(signals, wallet, baseline);
    }

    double total = 0.0;
    for (double m : margins) total += m;
    std::cout << "💰 Kelly-based margins: " << margins.size() << " positions, $"
              << std::fixed << std::setprecision(2) << total << " total ("
              << std::setprecision(1) << total / wallet * 100.0 << "% utilization)" << std::endl;
    return margins;
}

void AdaptationCore::enable() {
    enabled_ = true;
    std::cout << "🧠 Adaptive system ENABLED" << std::endl;
}

void AdaptationCore::disable() {
    enabled_ = false;
    std::cerr << "⚠️ Adaptive system DISABLED - using baseline filtering and sizing" << std::endl;
}

json AdaptationCore::current_state() const {
    json state;
    auto thresholds = thresholds_.all_thresholds();
    state["tau_global"] = thresholds["tau_global"];
    state["tau_side"] = thresholds["tau_side"];
    state["tau_tf"] = thresholds["tau_tf"];
    state["tau_cluster"] = thresholds["tau_cluster"];
    state["trades_since_update"] = thresholds["trades_since_update"];

    json kelly = risk_.info();
    state["kelly_factor"] = kelly["k_factor"];
    state["kelly_max_fraction"] = kelly["f_max"];
    state["kelly_buckets"] = kelly["n_buckets"];
    state["daily_cap_active"] = kelly["cap_active"];

    DriftSummary drift = drift_.summary();
    state["prudent_mode_active"] = drift.prudent_mode_active;
    state["prudent_cycles_remaining"] = drift.prudent_cycles_remaining;
    state["total_drifts"] = drift.total_drifts;

    state["n_calibrators"] = calibrator_.bucket_count();
    state["total_trades"] = store_.count();
    {
        std::lock_guard<std::mutex> lock(counters_mutex_);
        state["trades_since_adaptation"] = trades_since_adaptation_;
        state["trades_adapted"] = trades_adapted_;
        state["last_adaptation"] = last_adaptation_ms_;
    }
    state["active_cooldowns"] = penalties_.active_cooldowns();
    state["enabled"] = enabled_.load();
    return state;
}

json AdaptationCore::recent_performance(int window) const {
    return statistics_to_json(store_.statistics(window));
}

json AdaptationCore::last_cycle_changes() const {
    std::lock_guard<std::mutex> lock(changes_mutex_);
    return last_changes_;
}

void AdaptationCore::record_save(const Status& status) {
    std::lock_guard<std::mutex> lock(health_mutex_);
    if (status.ok()) return;
    health_.storage_ok = false;
    health_.last_storage_error = status.message;
    health_.failed_saves++;
}

Status AdaptationCore::save_state() {
    Status first = Status::success();
    const Persistable* components[] = {&penalties_, &thresholds_, &drift_, &risk_, &calibrator_};
    for (const Persistable* component : components) {
        Status s = component->save();
        record_save(s);
        if (first.ok() && !s.ok()) first = s;
    }
    if (first.ok()) {
        std::lock_guard<std::mutex> lock(health_mutex_);
        health_.storage_ok = store_.is_open();
        if (health_.storage_ok) health_.last_storage_error.clear();
        std::cout << "💾 Adaptive state saved to " << config_.state_dir << std::endl;
    }
    return first;
}

Status AdaptationCore::load_state() {
    Status first = Status::success();
    Persistable* components[] = {&penalties_, &thresholds_, &drift_, &risk_, &calibrator_};
    for (Persistable* component : components) {
        Status s = component->load();
        if (first.ok() && !s.ok()) first = s;
    }
    return first;
}

HealthStatus AdaptationCore::health() const {
    std::lock_guard<std::mutex> lock(health_mutex_);
    return health_;
}
