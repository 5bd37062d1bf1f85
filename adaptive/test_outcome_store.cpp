/**
 * SQLite trade store: append, statistics, Kelly fallback, retention
 */

#include <iostream>
#include "test_helpers.hpp"
#include "outcome_store.hpp"

void test_append_and_defaults() {
    std::cout << "Test 1: Append assigns ids and stamps missing fields" << std::endl;

    OutcomeStore store(":memory:");
    assert(store.open().ok());
    assert(store.is_open());

    TradeOutcome a = make_outcome("BTCUSD", true);
    a.technical["rsi"] = 61.5;
    Result<int64_t> ra = store.append(a);
    assert(ra.ok());
    assert(ra.value == a.id);
    assert(a.timestamp_ms > 0);
    assert(a.session_id == session_id_for(a.timestamp_ms));

    TradeOutcome b;
    b.side = Side::SHORT;
    b.result = 0;
    b.roe_pct = -3.0;
    b.confidence_calibrated = 0.66;
    Result<int64_t> rb = store.append(b);
    assert(rb.ok());
    assert(rb.value > ra.value);
    assert(b.symbol == UNKNOWN_IDENTITY);
    assert(b.cluster == DEFAULT_CLUSTER);
    assert(b.timeframe == DEFAULT_TIMEFRAME);

    assert(store.count() == 2);

    std::vector<TradeOutcome> recent = store.recent(10);
    assert(recent.size() == 2);
    // Newest first
    assert(recent[0].id == b.id);
    assert(recent[0].side == Side::SHORT);
    assert(recent[0].confidence_calibrated.has_value());
    assert(near(*recent[0].confidence_calibrated, 0.66));
    assert(!recent[1].confidence_calibrated.has_value());
    assert(near(recent[1].technical.at("rsi"), 61.5));

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_statistics() {
    std::cout << "Test 2: Windowed statistics and filters" << std::endl;

    OutcomeStore store(":memory:");
    assert(store.open().ok());

    TradeStatistics empty = store.statistics(100);
    assert(empty.count == 0);
    assert(near(empty.win_rate, 0.0));
    assert(near(empty.profit_factor, 0.0));

    // 3 LONG wins at +10, 1 LONG loss at -5, 2 SHORT losses at -4 on 1h
    for (int i = 0; i < 3; i++) {
        TradeOutcome t = make_outcome("BTCUSD", true, 10.0);
        assert(store.append(t).ok());
    }
    TradeOutcome l = make_outcome("BTCUSD", false, -5.0);
    assert(store.append(l).ok());
    for (int i = 0; i < 2; i++) {
        TradeOutcome t = make_outcome("ETHUSD", false, -4.0, Side::SHORT, "1h", "L1");
        assert(store.append(t).ok());
    }

    TradeStatistics all = store.statistics(100);
    assert(all.count == 6);
    assert(all.win_count == 3);
    assert(all.loss_count == 3);
    assert(near(all.win_rate, 0.5));
    assert(near(all.avg_return, (30.0 - 5.0 - 8.0) / 6.0));
    assert(near(all.avg_win, 10.0));
    assert(near(all.avg_loss, -13.0 / 3.0));
    assert(near(all.profit_factor, 30.0 / 13.0));
    assert(near(all.avg_duration_minutes, 30.0));

    StatsFilter longs;
    longs.side = Side::LONG;
    TradeStatistics ls = store.statistics(100, longs);
    assert(ls.count == 4);
    assert(near(ls.win_rate, 0.75));
    assert(near(ls.reward_risk_ratio, 2.0));

    StatsFilter h1;
    h1.timeframe = "1h";
    h1.cluster = "L1";
    assert(store.statistics(100, h1).count == 2);

    // Window takes the newest rows only
    TradeStatistics last2 = store.statistics(2);
    assert(last2.count == 2);
    assert(last2.win_count == 0);

    json j = statistics_to_json(all);
    assert(j["count"] == 6);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_kelly_fallback_chain() {
    std::cout << "Test 3: Kelly parameters fall back symbol -> cluster/timeframe -> default" << std::endl;

    OutcomeStore store(":memory:");
    assert(store.open().ok());

    KellyParameters none = store.kelly_parameters("BTCUSD");
    assert(none.samples == 0);
    assert(near(none.reward_risk, 2.0));
    assert(near(none.win_prob, 0.70));
    assert(near(none.sigma, 1.0));

    // 12 trades in cluster MEME, spread over several symbols
    for (int i = 0; i < 12; i++) {
        bool win = i % 3 != 0;
        TradeOutcome t = make_outcome("MEME" + std::to_string(i % 4), win, win ? 9.0 : -3.0,
                                      Side::LONG, "5m", "MEME");
        assert(store.append(t).ok());
    }

    // Symbol has 3 rows, cluster has 12
    KellyParameters sym = store.kelly_parameters("MEME0");
    assert(sym.samples == 0);

    KellyParameters cluster = store.kelly_parameters("MEME");
    assert(cluster.samples == 12);
    assert(near(cluster.reward_risk, 3.0));
    assert(near(cluster.win_prob, 8.0 / 12.0));

    // Timeframe matches through the same fallback
    assert(store.kelly_parameters("5m").samples == 12);

    for (int i = 0; i < 30; i++) {
        TradeOutcome t = make_outcome("SOLUSD", i % 2 == 0, i % 2 == 0 ? 6.0 : -2.0);
        assert(store.append(t).ok());
    }
    KellyParameters sol = store.kelly_parameters("SOLUSD");
    assert(sol.samples == 30);
    assert(near(sol.reward_risk, 3.0));
    assert(near(sol.win_prob, 0.5));
    // 15 at +6 and 15 at -2: mean 2, each deviation 4
    assert(near(sol.sigma, std::sqrt(30.0 * 16.0 / 29.0)));

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_queries_for_components() {
    std::cout << "Test 4: Calibration samples, distinct values, recent losses" << std::endl;

    OutcomeStore store(":memory:");
    assert(store.open().ok());

    for (int i = 0; i < 5; i++) {
        TradeOutcome t = make_outcome("BTCUSD", i < 3, 0.0, Side::LONG, "15m");
        t.confidence_raw = 0.6 + 0.05 * i;
        assert(store.append(t).ok());
    }
    TradeOutcome s = make_outcome("ETHUSD", false, 0.0, Side::SHORT, "4h", "L1");
    assert(store.append(s).ok());

    auto samples = store.calibration_samples(Side::LONG, "15m");
    assert(samples.size() == 5);
    int wins = 0;
    for (const auto& sample : samples) {
        assert(sample.confidence_raw >= 0.6 - 1e-9);
        wins += sample.result;
    }
    assert(wins == 3);
    assert(store.calibration_samples(Side::SHORT, "15m").empty());

    auto timeframes = store.distinct_values("timeframe");
    assert(timeframes.size() == 2);
    assert(timeframes[0] == "15m");
    assert(timeframes[1] == "4h");
    assert(store.distinct_values("cluster").size() == 2);
    // Only identity columns are queryable
    assert(store.distinct_values("pnl_usd; DROP TABLE trades").empty());
    assert(store.count() == 6);

    auto losses = store.losses_since(now_ms() - 60 * 1000);
    assert(losses.size() == 3);
    for (double loss : losses) assert(near(loss, 2.5));
    assert(store.losses_since(now_ms() + 60 * 1000).empty());

    std::cout << "  ✅ PASSED\n" << std::endl;
}

void test_retention_and_reopen() {
    std::cout << "Test 5: Retention sweep and durability across reopen" << std::endl;

    std::string dir = make_temp_dir("store");
    std::string path = dir + "/nested/trades.db";

    {
        OutcomeStore store(path);
        assert(store.open().ok());

        // Two rows older than the age cutoff
        for (int i = 0; i < 2; i++) {
            TradeOutcome old = make_outcome("OLDUSD", true);
            old.timestamp_ms = now_ms() - 200LL * 24 * 3600 * 1000;
            assert(store.append(old).ok());
        }
        for (int i = 0; i < 10; i++) {
            TradeOutcome t = make_outcome("BTCUSD", i % 2 == 0);
            assert(store.append(t).ok());
        }
        assert(store.count() == 12);

        Result<int> swept = store.retention_sweep(5000, 180);
        assert(swept.ok());
        assert(swept.value == 2);
        assert(store.count() == 10);

        Result<int> trimmed = store.retention_sweep(4, 180);
        assert(trimmed.ok());
        assert(trimmed.value == 6);
        assert(store.count() == 4);
    }

    {
        OutcomeStore reopened(path);
        assert(reopened.open().ok());
        assert(reopened.count() == 4);
        assert(reopened.recent(1)[0].symbol == "BTCUSD");
    }

    OutcomeStore closed(path);
    TradeOutcome t = make_outcome("BTCUSD", true);
    Result<int64_t> r = closed.append(t);
    assert(!r.ok());
    assert(r.status.kind == ErrorKind::STORAGE);
    assert(!closed.retention_sweep(10, 10).ok());

    remove_temp_dir(dir);

    std::cout << "  ✅ PASSED\n" << std::endl;
}

int main() {
    std::cout << "\n=== Outcome Store Tests ===\n" << std::endl;

    test_append_and_defaults();
    test_statistics();
    test_kelly_fallback_chain();
    test_queries_for_components();
    test_retention_and_reopen();

    std::cout << "=== All tests passed! ✅ ===\n" << std::endl;
    return 0;
}
