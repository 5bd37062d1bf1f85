/**
 * Penalty scoring, EWMA and cooldown automaton
 */

#include <iostream>
#include "test_helpers.hpp"
#include "penalty_tracker.hpp"

void test_score_terms() {
    std::cout << "Test 1: Penalty score terms" << std::endl;

    PenaltyTracker tracker;

    TradeOutcome clean_win = make_outcome("BTCUSD", true);
    assert(near(tracker.score(clean_win), 0.0));

    // Confidence term only applies to losses: 1.0 * 0.8^2
    TradeOutcome loss = make_outcome("BTCUSD", false);
    loss.confidence_calibrated = 0.8;
    assert(near(tracker.score(loss), 0.64));

    TradeOutcome win_with_conf = make_outcome("BTCUSD", true);
    win_with_conf.confidence_calibrated = 0.9;
    assert(near(tracker.score(win_with_conf), 0.0));

    // Raw confidence is used when there is no calibrated value
    TradeOutcome raw_loss = make_outcome("BTCUSD", false);
    raw_loss.confidence_raw = 0.5;
    assert(near(tracker.score(raw_loss), 0.25));

    TradeOutcome stopped = make_outcome("BTCUSD", true);
    stopped.stop_hit = true;
    assert(near(tracker.score(stopped), 1.5));

    TradeOutcome fast = make_outcome("BTCUSD", true);
    fast.duration_seconds = 299;
    assert(near(tracker.score(fast), 0.5));
    fast.duration_seconds = 300;
    assert(near(tracker.score(fast), 0.0));

    // MAE sign is ignored: 0.3 * 250/100
    TradeOutcome mae = make_outcome("BTCUSD", true);
    mae.mae_bp = -250.0;
    assert(near(tracker.score(mae), 0.75));

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_ewma() {
    std::cout << "Test 2: EWMA initialisation and update" << std::endl;

    PenaltyTracker tracker;
    tracker.update_ewma("ETHUSD", "L1", 1.0);
    assert(near(tracker.symbol_penalty("ETHUSD"), 1.0));
    assert(near(tracker.cluster_penalty("L1"), 1.0));

    tracker.update_ewma("ETHUSD", "L1", 0.0);
    assert(near(tracker.symbol_penalty("ETHUSD"), 0.85));
    assert(near(tracker.cluster_penalty("L1"), 0.85));
    assert(near(tracker.symbol_penalty("UNSEEN"), 0.0));

    auto top = tracker.top_penalties(5);
    assert(top.size() == 1);
    assert(top[0].first == "ETHUSD");

    std::cout << "  ETHUSD ewma: " << tracker.symbol_penalty("ETHUSD") << std::endl;
    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_cooldown_lifecycle() {
    std::cout << "Test 3: Cooldown lasts exactly cooldown_cycles ticks" << std::endl;

    PenaltyConfig config;
    PenaltyTracker tracker(config);

    tracker.update_ewma("DOGEUSD", "MEME", 1.3);   // > 1.2, first value
    assert(tracker.is_cooling_down("DOGEUSD"));
    assert(tracker.symbol_cooldown_remaining("DOGEUSD") == config.cooldown_cycles);
    // Cluster threshold is 1.25 * 1.2 = 1.5, not crossed
    assert(tracker.cluster_cooldown_remaining("MEME") == 0);

    for (int i = 0; i < config.cooldown_cycles; i++) {
        assert(tracker.is_cooling_down("DOGEUSD"));
        tracker.tick_cooldowns();
    }
    assert(!tracker.is_cooling_down("DOGEUSD"));
    assert(tracker.active_cooldowns().empty());

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_retrigger_does_not_extend() {
    std::cout << "Test 4: Re-trigger while cooling down does not extend" << std::endl;

    PenaltyTracker tracker;
    tracker.update_ewma("SOLUSD", "L1", 2.0);
    assert(tracker.symbol_cooldown_remaining("SOLUSD") == 3);

    tracker.tick_cooldowns();
    assert(tracker.symbol_cooldown_remaining("SOLUSD") == 2);

    tracker.update_ewma("SOLUSD", "L1", 3.0);
    assert(tracker.symbol_cooldown_remaining("SOLUSD") == 2);

    tracker.tick_cooldowns();
    tracker.tick_cooldowns();
    assert(!tracker.is_cooling_down("SOLUSD"));

    // Still above threshold with no active cooldown: re-arms
    tracker.update_ewma("SOLUSD", "L1", 3.0);
    assert(tracker.symbol_cooldown_remaining("SOLUSD") == 3);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_cluster_cooldown() {
    std::cout << "Test 5: Cluster cooldown at 1.25x threshold" << std::endl;

    PenaltyTracker tracker;
    tracker.update_ewma("AAA", "RISKY", 1.6);
    assert(tracker.cluster_cooldown_remaining("RISKY") == 3);

    // Another symbol in the same cluster is blocked through the cluster
    assert(tracker.is_cooling_down("BBB", "RISKY"));
    assert(!tracker.is_cooling_down("BBB", "OTHER"));

    auto active = tracker.active_cooldowns();
    assert(active.size() == 2);

    // A snapshot keeps its view while the live countdowns run out
    CooldownSet frozen = tracker.cooldown_snapshot();
    assert(frozen.symbols.count("AAA") == 1);
    assert(frozen.clusters.count("RISKY") == 1);
    for (int i = 0; i < 3; i++) tracker.tick_cooldowns();
    assert(!tracker.is_cooling_down("BBB", "RISKY"));
    assert(frozen.contains("BBB", "RISKY"));
    assert(frozen.contains("AAA"));
    assert(!frozen.contains("BBB", "OTHER"));
    assert(tracker.cooldown_snapshot().clusters.empty());

    tracker.reset();
    assert(!tracker.is_cooling_down("AAA", "RISKY"));
    assert(tracker.cluster_penalties().empty());

    std::cout << "  ✅ PASSED\n" << std::endl;
}

int main() {
    std::cout << "\n=== Penalty Tracker Tests ===\n" << std::endl;

    test_score_terms();
    test_ewma();
    test_cooldown_lifecycle();
    test_retrigger_does_not_extend();
    test_cluster_cooldown();

    std::cout << "=== All tests passed! ✅ ===\n" << std::endl;
    return 0;
}
