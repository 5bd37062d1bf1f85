#include "outcome_store.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <set>

namespace {

const char* const SELECT_COLUMNS =
    "id, timestamp, session_id, strategy_version, symbol, side, timeframe, cluster, "
    "confidence_raw, confidence_calibrated, model_version, entry_price, exit_price, "
    "entry_time, exit_time, position_size, margin, duration_seconds, close_reason, "
    "technical, roe_pct, pnl_usd, result, stop_hit, tp_hit, fees_usd, slippage_bp, "
    "spread_bp, latency_ms, mfe_bp, mae_bp, tau_global, tau_side, tau_tf, tau_cluster, "
    "kelly_fraction, cooldown_applied, penalty_score";

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

TradeOutcome read_outcome_row(sqlite3_stmt* stmt) {
    TradeOutcome t;
    t.id = sqlite3_column_int64(stmt, 0);
    t.timestamp_ms = sqlite3_column_int64(stmt, 1);
    t.session_id = column_text(stmt, 2);
    t.strategy_version = column_text(stmt, 3);
    t.symbol = column_text(stmt, 4);
    t.side = parse_side(column_text(stmt, 5));
    t.timeframe = column_text(stmt, 6);
    t.cluster = column_text(stmt, 7);
    t.confidence_raw = sqlite3_column_double(stmt, 8);
    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL) {
        t.confidence_calibrated = sqlite3_column_double(stmt, 9);
    }
    t.model_version = column_text(stmt, 10);
    t.entry_price = sqlite3_column_double(stmt, 11);
    t.exit_price = sqlite3_column_double(stmt, 12);
    t.entry_time_ms = sqlite3_column_int64(stmt, 13);
    t.exit_time_ms = sqlite3_column_int64(stmt, 14);
    t.position_size = sqlite3_column_double(stmt, 15);
    t.margin = sqlite3_column_double(stmt, 16);
    t.duration_seconds = sqlite3_column_int64(stmt, 17);
    t.close_reason = column_text(stmt, 18);

    std::string technical = column_text(stmt, 19);
    if (!technical.empty()) {
        json j = json::parse(technical, nullptr, false);
        if (j.is_object()) {
            for (auto it = j.begin(); it != j.end(); ++it) {
                if (it.value().is_number()) t.technical[it.key()] = it.value().get<double>();
            }
        }
    }

    t.roe_pct = sqlite3_column_double(stmt, 20);
    t.pnl_usd = sqlite3_column_double(stmt, 21);
    t.result = sqlite3_column_int(stmt, 22);
    t.stop_hit = sqlite3_column_int(stmt, 23) != 0;
    t.tp_hit = sqlite3_column_int(stmt, 24) != 0;
    t.fees_usd = sqlite3_column_double(stmt, 25);
    t.slippage_bp = sqlite3_column_double(stmt, 26);
    t.spread_bp = sqlite3_column_double(stmt, 27);
    t.latency_ms = sqlite3_column_int64(stmt, 28);
    t.mfe_bp = sqlite3_column_double(stmt, 29);
    t.mae_bp = sqlite3_column_double(stmt, 30);
    t.tau_global = sqlite3_column_double(stmt, 31);
    t.tau_side = sqlite3_column_double(stmt, 32);
    t.tau_tf = sqlite3_column_double(stmt, 33);
    t.tau_cluster = sqlite3_column_double(stmt, 34);
    t.kelly_fraction = sqlite3_column_double(stmt, 35);
    t.cooldown_applied = sqlite3_column_int(stmt, 36) != 0;
    t.penalty_score = sqlite3_column_double(stmt, 37);
    return t;
}

const int MIN_SYMBOL_SAMPLES = 30;
const int MIN_FALLBACK_SAMPLES = 10;

}  // namespace

json statistics_to_json(const TradeStatistics& s) {
    return json{
        {"count", s.count},
        {"win_count", s.win_count},
        {"loss_count", s.loss_count},
        {"win_rate", s.win_rate},
        {"avg_return", s.avg_return},
        {"avg_win", s.avg_win},
        {"avg_loss", s.avg_loss},
        {"profit_factor", s.profit_factor},
        {"reward_risk_ratio", s.reward_risk_ratio},
        {"avg_duration_minutes", s.avg_duration_minutes}
    };
}

OutcomeStore::OutcomeStore(std::string db_path) : db_path_(std::move(db_path)) {}

OutcomeStore::~OutcomeStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool OutcomeStore::is_open() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return db_ != nullptr;
}

Status OutcomeStore::open() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) return Status::success();

    if (db_path_ != ":memory:") {
        std::filesystem::path parent = std::filesystem::path(db_path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                std::cerr << "❌ Cannot create directory for trade store " << parent << ": "
                          << ec.message() << std::endl;
                return Status::error(ErrorKind::STORAGE, ec.message());
            }
        }
    }

    int rc = sqlite3_open_v2(db_path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        std::cerr << "❌ Failed to open or create trade store at " << db_path_ << ": " << error << std::endl;
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return Status::error(ErrorKind::STORAGE, error);
    }

    Status status = create_tables();
    if (!status.ok()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return status;
    }
    std::cout << "✅ Trade feedback store initialized: " << db_path_ << std::endl;
    return Status::success();
}

Status OutcomeStore::create_tables() {
    const char* create_table_sql = R"(
        CREATE TABLE IF NOT EXISTS trades (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp INTEGER NOT NULL,
            session_id TEXT,
            strategy_version TEXT,
            symbol TEXT NOT NULL,
            side TEXT NOT NULL,
            timeframe TEXT NOT NULL,
            cluster TEXT DEFAULT 'DEFAULT',
            confidence_raw REAL,
            confidence_calibrated REAL,
            model_version TEXT,
            entry_price REAL,
            exit_price REAL,
            entry_time INTEGER,
            exit_time INTEGER,
            position_size REAL,
            margin REAL,
            duration_seconds INTEGER,
            close_reason TEXT,
            technical TEXT,
            roe_pct REAL,
            pnl_usd REAL,
            result INTEGER,
            stop_hit INTEGER,
            tp_hit INTEGER,
            fees_usd REAL,
            slippage_bp REAL,
            spread_bp REAL,
            latency_ms INTEGER,
            mfe_bp REAL,
            mae_bp REAL,
            tau_global REAL,
            tau_side REAL,
            tau_tf REAL,
            tau_cluster REAL,
            kelly_fraction REAL,
            cooldown_applied INTEGER,
            penalty_score REAL
        );

        CREATE INDEX IF NOT EXISTS idx_trades_symbol ON trades(symbol);
        CREATE INDEX IF NOT EXISTS idx_trades_timestamp ON trades(timestamp);
        CREATE INDEX IF NOT EXISTS idx_trades_cluster ON trades(cluster);
        CREATE INDEX IF NOT EXISTS idx_trades_result ON trades(result);
        CREATE INDEX IF NOT EXISTS idx_trades_side_tf ON trades(side, timeframe);
        CREATE INDEX IF NOT EXISTS idx_trades_session ON trades(session_id);
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, create_table_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string error = err_msg ? err_msg : "unknown error";
        std::cerr << "❌ Failed to create trades table: " << error << std::endl;
        sqlite3_free(err_msg);
        return Status::error(ErrorKind::STORAGE, error);
    }
    return Status::success();
}

Result<int64_t> OutcomeStore::append(TradeOutcome& trade) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        std::cerr << "⚠️ Trade store not initialized, cannot save trade" << std::endl;
        return Result<int64_t>::error(ErrorKind::STORAGE, "trade store not open", -1);
    }

    if (trade.timestamp_ms <= 0) trade.timestamp_ms = now_ms();
    if (trade.session_id.empty()) trade.session_id = session_id_for(trade.timestamp_ms);
    if (trade.symbol.empty()) trade.symbol = UNKNOWN_IDENTITY;
    if (trade.timeframe.empty()) trade.timeframe = DEFAULT_TIMEFRAME;
    if (trade.cluster.empty()) trade.cluster = DEFAULT_CLUSTER;

    const char* insert_sql = R"(
        INSERT INTO trades (
            timestamp, session_id, strategy_version, symbol, side, timeframe, cluster,
            confidence_raw, confidence_calibrated, model_version, entry_price, exit_price,
            entry_time, exit_time, position_size, margin, duration_seconds, close_reason,
            technical, roe_pct, pnl_usd, result, stop_hit, tp_hit, fees_usd, slippage_bp,
            spread_bp, latency_ms, mfe_bp, mae_bp, tau_global, tau_side, tau_tf, tau_cluster,
            kelly_fraction, cooldown_applied, penalty_score
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?,
                  ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        std::cerr << "❌ Failed to prepare insert statement: " << error << std::endl;
        return Result<int64_t>::error(ErrorKind::STORAGE, error, -1);
    }

    std::string technical = json(trade.technical).dump();

    sqlite3_bind_int64(stmt, 1, trade.timestamp_ms);
    sqlite3_bind_text(stmt, 2, trade.session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, trade.strategy_version.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, trade.symbol.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, side_name(trade.side), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 6, trade.timeframe.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, trade.cluster.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 8, trade.confidence_raw);
    if (trade.confidence_calibrated) {
        sqlite3_bind_double(stmt, 9, *trade.confidence_calibrated);
    } else {
        sqlite3_bind_null(stmt, 9);
    }
    sqlite3_bind_text(stmt, 10, trade.model_version.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 11, trade.entry_price);
    sqlite3_bind_double(stmt, 12, trade.exit_price);
    sqlite3_bind_int64(stmt, 13, trade.entry_time_ms);
    sqlite3_bind_int64(stmt, 14, trade.exit_time_ms);
    sqlite3_bind_double(stmt, 15, trade.position_size);
    sqlite3_bind_double(stmt, 16, trade.margin);
    sqlite3_bind_int64(stmt, 17, trade.duration_seconds);
    sqlite3_bind_text(stmt, 18, trade.close_reason.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 19, technical.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 20, trade.roe_pct);
    sqlite3_bind_double(stmt, 21, trade.pnl_usd);
    sqlite3_bind_int(stmt, 22, trade.result);
    sqlite3_bind_int(stmt, 23, trade.stop_hit ? 1 : 0);
    sqlite3_bind_int(stmt, 24, trade.tp_hit ? 1 : 0);
    sqlite3_bind_double(stmt, 25, trade.fees_usd);
    sqlite3_bind_double(stmt, 26, trade.slippage_bp);
    sqlite3_bind_double(stmt, 27, trade.spread_bp);
    sqlite3_bind_int64(stmt, 28, trade.latency_ms);
    sqlite3_bind_double(stmt, 29, trade.mfe_bp);
    sqlite3_bind_double(stmt, 30, trade.mae_bp);
    sqlite3_bind_double(stmt, 31, trade.tau_global);
    sqlite3_bind_double(stmt, 32, trade.tau_side);
    sqlite3_bind_double(stmt, 33, trade.tau_tf);
    sqlite3_bind_double(stmt, 34, trade.tau_cluster);
    sqlite3_bind_double(stmt, 35, trade.kelly_fraction);
    sqlite3_bind_int(stmt, 36, trade.cooldown_applied ? 1 : 0);
    sqlite3_bind_double(stmt, 37, trade.penalty_score);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        std::cerr << "❌ Failed to insert trade: " << error << std::endl;
        return Result<int64_t>::error(ErrorKind::STORAGE, error, -1);
    }

    trade.id = sqlite3_last_insert_rowid(db_);
    return Result<int64_t>::success(trade.id);
}

TradeStatistics OutcomeStore::statistics(int window, const StatsFilter& filter) const {
    TradeStatistics stats;
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_ || window <= 0) return stats;

    std::string sql = "SELECT roe_pct, result, duration_seconds FROM trades WHERE 1=1";
    std::vector<std::string> params;
    if (filter.symbol) { sql += " AND symbol = ?"; params.push_back(*filter.symbol); }
    if (filter.side) { sql += " AND side = ?"; params.push_back(side_name(*filter.side)); }
    if (filter.timeframe) { sql += " AND timeframe = ?"; params.push_back(*filter.timeframe); }
    if (filter.cluster) { sql += " AND cluster = ?"; params.push_back(*filter.cluster); }
    if (filter.session_id) { sql += " AND session_id = ?"; params.push_back(*filter.session_id); }
    sql += " ORDER BY id DESC LIMIT ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "❌ Failed to prepare statistics query: " << sqlite3_errmsg(db_) << std::endl;
        return stats;
    }
    int idx = 1;
    for (const auto& p : params) {
        sqlite3_bind_text(stmt, idx++, p.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int(stmt, idx, window);

    double sum_roe = 0.0, sum_wins = 0.0, sum_losses = 0.0, sum_duration = 0.0;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        double roe = sqlite3_column_double(stmt, 0);
        int result = sqlite3_column_int(stmt, 1);
        sum_roe += roe;
        sum_duration += static_cast<double>(sqlite3_column_int64(stmt, 2));
        if (result == 1) {
            stats.win_count++;
            sum_wins += roe;
        } else {
            stats.loss_count++;
            sum_losses += roe;
        }
        stats.count++;
    }
    sqlite3_finalize(stmt);

    if (stats.count == 0) return stats;

    stats.win_rate = static_cast<double>(stats.win_count) / stats.count;
    stats.avg_return = sum_roe / stats.count;
    stats.avg_win = stats.win_count > 0 ? sum_wins / stats.win_count : 0.0;
    stats.avg_loss = stats.loss_count > 0 ? sum_losses / stats.loss_count : 0.0;
    double total_losses = std::abs(sum_losses);
    stats.profit_factor = total_losses > 0 ? sum_wins / total_losses : 0.0;
    stats.reward_risk_ratio = stats.avg_loss != 0 ? std::abs(stats.avg_win / stats.avg_loss) : 0.0;
    stats.avg_duration_minutes = sum_duration / stats.count / 60.0;
    return stats;
}

std::vector<std::pair<double, int>> OutcomeStore::select_returns(const char* sql, const std::string& bucket,
                                                                 int binds, int window) const {
    std::vector<std::pair<double, int>> rows;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "❌ Failed to prepare Kelly query: " << sqlite3_errmsg(db_) << std::endl;
        return rows;
    }
    for (int i = 1; i <= binds; i++) {
        sqlite3_bind_text(stmt, i, bucket.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int(stmt, binds + 1, window);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.emplace_back(sqlite3_column_double(stmt, 0), sqlite3_column_int(stmt, 1));
    }
    sqlite3_finalize(stmt);
    return rows;
}

KellyParameters OutcomeStore::kelly_from_rows(const std::vector<std::pair<double, int>>& rows) const {
    KellyParameters params;
    double sum_wins = 0.0, sum_losses = 0.0, sum = 0.0;
    int wins = 0, losses = 0;
    for (const auto& row : rows) {
        sum += row.first;
        if (row.second == 1) { sum_wins += row.first; wins++; }
        else { sum_losses += row.first; losses++; }
    }

    double n = static_cast<double>(rows.size());
    double avg_win = wins > 0 ? std::abs(sum_wins / wins) : 1.0;
    double avg_loss = losses > 0 ? std::abs(sum_losses / losses) : 1.0;

    params.reward_risk = avg_loss > 0 ? avg_win / avg_loss : 2.0;
    params.win_prob = wins / n;

    // Sample standard deviation (n - 1)
    double mean = sum / n;
    double sq = 0.0;
    for (const auto& row : rows) sq += (row.first - mean) * (row.first - mean);
    params.sigma = rows.size() > 1 ? std::sqrt(sq / (n - 1.0)) : 1.0;
    params.samples = static_cast<int>(rows.size());
    return params;
}

KellyParameters OutcomeStore::kelly_parameters(const std::string& bucket, int window) const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return KellyParameters{};

    auto rows = select_returns(
        "SELECT roe_pct, result FROM trades WHERE symbol = ? ORDER BY id DESC LIMIT ?",
        bucket, 1, window);

    // Not enough symbol history: widen to cluster or timeframe
    if (static_cast<int>(rows.size()) < MIN_SYMBOL_SAMPLES) {
        rows = select_returns(
            "SELECT roe_pct, result FROM trades WHERE cluster = ? OR timeframe = ? ORDER BY id DESC LIMIT ?",
            bucket, 2, window);
    }

    if (static_cast<int>(rows.size()) < MIN_FALLBACK_SAMPLES) {
        return KellyParameters{};
    }
    return kelly_from_rows(rows);
}

std::vector<TradeOutcome> OutcomeStore::recent(int n) const {
    std::vector<TradeOutcome> trades;
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_ || n <= 0) return trades;

    std::string sql = std::string("SELECT ") + SELECT_COLUMNS + " FROM trades ORDER BY id DESC LIMIT ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "❌ Failed to prepare select statement: " << sqlite3_errmsg(db_) << std::endl;
        return trades;
    }
    sqlite3_bind_int(stmt, 1, n);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        trades.push_back(read_outcome_row(stmt));
    }
    sqlite3_finalize(stmt);
    return trades;
}

int OutcomeStore::count() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM trades", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

std::vector<CalibrationSample> OutcomeStore::calibration_samples(Side side, const std::string& timeframe,
                                                                 int limit) const {
    std::vector<CalibrationSample> samples;
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return samples;

    const char* sql =
        "SELECT confidence_raw, result FROM trades WHERE side = ? AND timeframe = ? ORDER BY id DESC LIMIT ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "❌ Failed to prepare calibration query: " << sqlite3_errmsg(db_) << std::endl;
        return samples;
    }
    sqlite3_bind_text(stmt, 1, side_name(side), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, timeframe.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 3, limit);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        CalibrationSample s;
        s.confidence_raw = sqlite3_column_double(stmt, 0);
        s.result = sqlite3_column_int(stmt, 1);
        samples.push_back(s);
    }
    sqlite3_finalize(stmt);
    return samples;
}

std::vector<std::string> OutcomeStore::distinct_values(const std::string& column) const {
    static const std::set<std::string> allowed = {"symbol", "side", "timeframe", "cluster"};
    std::vector<std::string> values;
    if (allowed.count(column) == 0) {
        std::cerr << "⚠️ distinct_values: unsupported column " << column << std::endl;
        return values;
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return values;

    std::string sql = "SELECT DISTINCT " + column + " FROM trades WHERE " + column +
                      " IS NOT NULL ORDER BY " + column;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return values;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        values.push_back(column_text(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return values;
}

std::vector<double> OutcomeStore::losses_since(int64_t since_ms) const {
    std::vector<double> losses;
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return losses;

    const char* sql = "SELECT pnl_usd FROM trades WHERE result = 0 AND pnl_usd < 0 AND timestamp >= ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "❌ Failed to prepare loss query: " << sqlite3_errmsg(db_) << std::endl;
        return losses;
    }
    sqlite3_bind_int64(stmt, 1, since_ms);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        losses.push_back(std::abs(sqlite3_column_double(stmt, 0)));
    }
    sqlite3_finalize(stmt);
    return losses;
}

Result<int> OutcomeStore::retention_sweep(int max_count, int max_age_days) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return Result<int>::error(ErrorKind::STORAGE, "trade store not open", 0);

    int removed = 0;

    sqlite3_stmt* stmt = nullptr;
    const char* trim_sql =
        "DELETE FROM trades WHERE id NOT IN (SELECT id FROM trades ORDER BY id DESC LIMIT ?)";
    if (sqlite3_prepare_v2(db_, trim_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Result<int>::error(ErrorKind::STORAGE, sqlite3_errmsg(db_), 0);
    }
    sqlite3_bind_int(stmt, 1, max_count);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return Result<int>::error(ErrorKind::STORAGE, sqlite3_errmsg(db_), 0);
    }
    int trimmed = sqlite3_changes(db_);
    if (trimmed > 0) {
        std::cout << "🗑️ Cleaned up " << trimmed << " old trades (limit: " << max_count << ")" << std::endl;
    }
    removed += trimmed;

    int64_t cutoff = now_ms() - static_cast<int64_t>(max_age_days) * 24 * 3600 * 1000;
    if (sqlite3_prepare_v2(db_, "DELETE FROM trades WHERE timestamp < ?", -1, &stmt, nullptr) != SQLITE_OK) {
        return Result<int>::error(ErrorKind::STORAGE, sqlite3_errmsg(db_), removed);
    }
    sqlite3_bind_int64(stmt, 1, cutoff);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return Result<int>::error(ErrorKind::STORAGE, sqlite3_errmsg(db_), removed);
    }
    int expired = sqlite3_changes(db_);
    if (expired > 0) {
        std::cout << "🗑️ Cleaned up " << expired << " trades older than " << max_age_days << " days" << std::endl;
    }
    removed += expired;

    if (removed > 0) {
        char* err_msg = nullptr;
        if (sqlite3_exec(db_, "VACUUM", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::cerr << "⚠️ VACUUM failed: " << (err_msg ? err_msg : "unknown error") << std::endl;
            sqlite3_free(err_msg);
        }
    }
    return Result<int>::success(removed);
}
