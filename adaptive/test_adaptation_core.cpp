/**
 * End-to-end behaviour of the adaptation core: ingest, cycles, hot path
 */

#include <iostream>
#include <fstream>
#include <thread>
#include <atomic>
#include "test_helpers.hpp"
#include "adaptive_context.hpp"

namespace fs = std::filesystem;

AdaptiveConfig config_for(const std::string& dir) {
    AdaptiveConfig config;
    config.core.state_dir = dir;
    config.core.db_path = dir + "/trades.db";
    return config;
}

Signal make_signal(const std::string& symbol, double conf, Side side = Side::LONG,
                   const std::string& timeframe = "15m", const std::string& cluster = "DEFAULT") {
    Signal s;
    s.symbol = symbol;
    s.side = side;
    s.raw_confidence = conf;
    s.timeframe = timeframe;
    s.cluster = cluster;
    return s;
}

FilteredSignal make_filtered(const std::string& symbol, double calibrated) {
    FilteredSignal f;
    f.signal = make_signal(symbol, calibrated);
    f.calibrated_confidence = calibrated;
    return f;
}

std::vector<double> one_percent(const std::vector<FilteredSignal>& signals, double wallet) {
    return std::vector<double>(signals.size(), wallet * 0.01);
}

void test_log_outcome_fan_out() {
    std::cout << "Test 1: log_outcome updates store, penalties, risk and counters" << std::endl;

    std::string dir = make_temp_dir("ingest");
    AdaptiveContext ctx(config_for(dir));
    assert(ctx.open().ok());

    Result<int64_t> a = ctx.core().log_outcome(make_outcome("BTCUSD", true));
    assert(a.ok());

    TradeOutcome stopped = make_outcome("ETHUSD", false, -8.0, Side::SHORT, "1h", "L1");
    stopped.stop_hit = true;
    stopped.pnl_usd = -12.0;
    Result<int64_t> b = ctx.core().log_outcome(stopped);
    assert(b.ok());
    assert(b.value > a.value);

    assert(ctx.store().count() == 2);
    // 1.5 for the stop plus 1.0 * 0.75^2 for the confident loss
    assert(near(ctx.penalties().symbol_penalty("ETHUSD"), 1.5 + 0.5625));
    assert(ctx.penalties().is_cooling_down("ETHUSD"));
    assert(near(ctx.risk().current_daily_loss(), 12.0));
    assert(ctx.thresholds().trades_since_update() == 2);

    std::vector<TradeOutcome> stored = ctx.store().recent(1);
    assert(near(stored[0].penalty_score, 2.0625));

    json state = ctx.core().current_state();
    assert(state["total_trades"] == 2);
    assert(state["trades_since_adaptation"] == 2);
    assert(state["enabled"] == true);
    // Symbol and its cluster (2.06 > 1.5) are both cooling down
    assert(state["active_cooldowns"].size() == 2);

    json perf = ctx.core().recent_performance(100);
    assert(perf["count"] == 2);
    assert(near(perf["win_rate"].get<double>(), 0.5));

    // A loss that closed days ago but arrives now still counts for today
    TradeOutcome late = make_outcome("ADAUSD", false, -2.0, Side::LONG, "15m", "ALT");
    late.pnl_usd = -5.0;
    late.timestamp_ms = now_ms() - 3LL * 24 * 3600 * 1000;
    assert(ctx.core().log_outcome(late).ok());
    assert(near(ctx.risk().current_daily_loss(), 17.0));

    assert(ctx.close().ok());
    remove_temp_dir(dir);
    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_cycle_triggered_by_count() {
    std::cout << "Test 2: Trade count triggers one background cycle" << std::endl;

    std::string dir = make_temp_dir("trigger");
    AdaptiveConfig config = config_for(dir);
    config.core.min_trades_for_update = 5;
    AdaptiveContext ctx(config);
    assert(ctx.open().ok());

    for (int i = 0; i < 5; i++) {
        assert(ctx.core().log_outcome(make_outcome("BTCUSD", i % 2 == 0)).ok());
    }
    assert(ctx.core().wait_idle(std::chrono::milliseconds(10000)));

    assert(ctx.core().cycles_completed() == 1);
    assert(ctx.core().current_state()["trades_since_adaptation"] == 0);
    assert(ctx.core().health().storage_ok);

    const char* files[] = {"penalty_state.json", "calibration_state.json", "drift_detector_state.json",
                           "threshold_state.json", "risk_optimizer_state.json"};
    for (const char* name : files) {
        assert(fs::exists(AdaptiveContext::state_file(dir, name)));
    }

    assert(ctx.close().ok());
    remove_temp_dir(dir);
    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_trigger_dropped_while_pending() {
    std::cout << "Test 3: Second trigger is dropped while one is pending" << std::endl;

    std::string dir = make_temp_dir("drop");
    AdaptiveContext ctx(config_for(dir));
    // Worker not started: the first request stays pending
    assert(ctx.core().request_cycle());
    assert(!ctx.core().request_cycle());
    assert(ctx.core().dropped_triggers() == 1);

    assert(ctx.core().run_adaptation_cycle());
    assert(ctx.core().cycles_completed() == 1);
    assert(ctx.core().wait_idle(std::chrono::milliseconds(100)));

    remove_temp_dir(dir);
    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_filter() {
    std::cout << "Test 4: Filter applies cooldowns, thresholds and prudent bump" << std::endl;

    std::string dir = make_temp_dir("filter");
    AdaptiveContext ctx(config_for(dir));
    assert(ctx.open().ok());

    ctx.penalties().update_ewma("DOGEUSD", "MEME", 2.0);

    std::vector<Signal> signals = {
        make_signal("BTCUSD", 0.80),
        make_signal("ETHUSD", 0.73),
        make_signal("SOLUSD", 0.65),
        make_signal("DOGEUSD", 0.95, Side::LONG, "15m", "MEME"),
        make_signal("PEPEUSD", 0.95, Side::LONG, "15m", "MEME"),   // cluster cooldown
        make_signal("XRPUSD", 0.71, Side::SHORT)                   // SHORT needs 0.72
    };

    std::vector<FilteredSignal> kept = ctx.core().filter(signals);
    assert(kept.size() == 2);
    assert(kept[0].signal.symbol == "BTCUSD");
    assert(kept[1].signal.symbol == "ETHUSD");
    assert(near(kept[0].calibrated_confidence, 0.80));
    assert(near(kept[0].effective_threshold, 0.70));

    // Prudent mode adds 0.05 to every threshold
    assert(ctx.drift().update_penalty(3.0));
    kept = ctx.core().filter(signals);
    assert(kept.size() == 1);
    assert(kept[0].signal.symbol == "BTCUSD");
    assert(near(kept[0].effective_threshold, 0.75));

    // Disabled: everything through with calibrated = raw
    ctx.core().disable();
    kept = ctx.core().filter(signals);
    assert(kept.size() == signals.size());
    assert(near(kept[3].calibrated_confidence, 0.95));
    ctx.core().enable();

    assert(ctx.core().filter({}).empty());

    assert(ctx.close().ok());
    remove_temp_dir(dir);
    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_size_all() {
    std::cout << "Test 5: Kelly sizing, prudent halving and fallbacks" << std::endl;

    std::string dir = make_temp_dir("size");
    AdaptiveContext ctx(config_for(dir));
    assert(ctx.open().ok());
    AdaptationCore& core = ctx.core();

    std::vector<FilteredSignal> batch = {make_filtered("BTCUSD", 0.80), make_filtered("ETHUSD", 0.80)};

    std::vector<double> sizes = core.size_all(batch, 10000.0, one_percent);
    assert(sizes.size() == 2);
    assert(near(sizes[0], 100.0));
    assert(near(sizes[1], 100.0));

    // Non-positive wallet sizes nothing
    sizes = core.size_all(batch, 0.0, one_percent);
    assert(sizes.size() == 2);
    assert(near(sizes[0], 0.0) && near(sizes[1], 0.0));
    sizes = core.size_all(batch, -100.0);
    assert(near(sizes[0], 0.0) && near(sizes[1], 0.0));

    // One bad signal sends the whole batch to the baseline
    std::vector<FilteredSignal> poisoned = batch;
    poisoned.push_back(make_filtered("BADUSD", std::nan("")));
    sizes = core.size_all(poisoned, 1000.0, one_percent);
    assert(sizes.size() == 3);
    for (double s : sizes) assert(near(s, 10.0));
    // No usable baseline: zeros
    sizes = core.size_all(poisoned, 1000.0);
    for (double s : sizes) assert(near(s, 0.0));
    BaselineSizer short_baseline = [](const std::vector<FilteredSignal>&, double) {
        return std::vector<double>{1.0};
    };
    sizes = core.size_all(poisoned, 1000.0, short_baseline);
    assert(sizes.size() == 3);
    for (double s : sizes) assert(near(s, 0.0));

    // Prudent mode halves the Kelly margin, still inside the absolute bounds
    assert(ctx.drift().update_penalty(3.0));
    sizes = core.size_all(batch, 10000.0);
    assert(near(sizes[0], 50.0));
    sizes = core.size_all(batch, 1000.0);
    assert(near(sizes[0], 15.0));

    core.disable();
    sizes = core.size_all(batch, 1000.0, one_percent);
    assert(near(sizes[0], 10.0) && near(sizes[1], 10.0));
    core.enable();

    assert(ctx.close().ok());
    remove_temp_dir(dir);
    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_consistent_snapshot_during_cycles() {
    std::cout << "Test 6: Concurrent filters see one threshold set per batch" << std::endl;

    std::string dir = make_temp_dir("concurrent");
    AdaptiveContext ctx(config_for(dir));
    assert(ctx.open().ok());

    // 60% win rate: every cycle raises the thresholds
    for (int i = 0; i < 200; i++) {
        TradeOutcome t = make_outcome("BTCUSD", i % 5 < 3);
        assert(ctx.store().append(t).ok());
    }

    std::vector<Signal> batch;
    for (int i = 0; i < 20; i++) batch.push_back(make_signal("SYM" + std::to_string(i), 0.74, Side::LONG, "1h"));

    std::atomic<bool> done{false};
    std::atomic<int> batches{0};
    std::thread reader([&] {
        while (!done.load()) {
            std::vector<FilteredSignal> kept = ctx.core().filter(batch);
            assert(kept.empty() || kept.size() == batch.size());
            for (const auto& f : kept) {
                assert(near(f.effective_threshold, kept[0].effective_threshold));
            }
            batches++;
        }
    });

    for (int i = 0; i < 8; i++) {
        assert(ctx.core().run_adaptation_cycle());
    }
    done = true;
    reader.join();

    std::cout << "  batches filtered: " << batches.load() << std::endl;
    assert(ctx.core().cycles_completed() == 8);
    assert(near(ctx.thresholds().global_threshold(), 0.85));
    assert(ctx.core().filter(batch).empty());
    assert(ctx.core().last_cycle_changes().contains("thresholds"));

    assert(ctx.close().ok());
    remove_temp_dir(dir);
    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_storage_failures() {
    std::cout << "Test 7: Storage failures surface in health, never as exceptions" << std::endl;

    std::string dir = make_temp_dir("health");
    {
        std::ofstream blocker(dir + "/blocker");
        blocker << "x";
    }

    // Store never opened: outcome rejected, trackers untouched
    AdaptiveConfig config = config_for(dir);
    config.core.state_dir = dir + "/blocker";
    AdaptiveContext ctx(config);

    Result<int64_t> r = ctx.core().log_outcome(make_outcome("BTCUSD", false));
    assert(!r.ok());
    assert(r.status.kind == ErrorKind::STORAGE);
    assert(!ctx.core().health().storage_ok);
    assert(ctx.thresholds().trades_since_update() == 0);
    assert(near(ctx.risk().current_daily_loss(), 0.0));

    // State directory is a regular file: every save fails
    Status saved = ctx.core().save_state();
    assert(saved.kind == ErrorKind::STORAGE);
    HealthStatus health = ctx.core().health();
    assert(!health.storage_ok);
    assert(health.failed_saves == 5);
    assert(!health.last_storage_error.empty());

    remove_temp_dir(dir);
    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_trades_logged_during_cycles() {
    std::cout << "Test 8: Trades logged while a cycle runs count toward the next" << std::endl;

    std::string dir = make_temp_dir("carry");
    AdaptiveConfig config = config_for(dir);
    config.core.min_trades_for_update = 5;
    AdaptiveContext ctx(config);
    assert(ctx.open().ok());

    const int total = 120;
    std::thread writer([&] {
        for (int i = 0; i < total; i++) {
            assert(ctx.core().log_outcome(make_outcome("BTCUSD", i % 3 != 0)).ok());
        }
    });
    // Cycles on this thread too, racing the writer
    for (int i = 0; i < 10; i++) ctx.core().run_adaptation_cycle();
    writer.join();
    assert(ctx.core().wait_idle(std::chrono::milliseconds(30000)));

    json state = ctx.core().current_state();
    std::cout << "  cycles: " << ctx.core().cycles_completed()
              << ", adapted: " << state["trades_adapted"]
              << ", pending: " << state["trades_since_adaptation"] << std::endl;
    assert(ctx.store().count() == total);
    assert(state["trades_adapted"].get<int64_t>() + state["trades_since_adaptation"].get<int>() == total);

    assert(ctx.close().ok());
    remove_temp_dir(dir);
    std::cout << "  ✅ PASSED\n" << std::endl;
}

int main() {
    std::cout << "\n=== Adaptation Core Tests ===\n" << std::endl;

    test_log_outcome_fan_out();
    test_cycle_triggered_by_count();
    test_trigger_dropped_while_pending();
    test_filter();
    test_size_all();
    test_consistent_snapshot_during_cycles();
    test_storage_failures();
    test_trades_logged_during_cycles();

    std::cout << "=== All tests passed! ✅ ===\n" << std::endl;
    return 0;
}
