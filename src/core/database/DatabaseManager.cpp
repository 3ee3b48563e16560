#include "photo_pairing/database/DatabaseManager.hpp"
#include "photo_pairing/logging.hpp"
#include <sqlite3.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace photo_pairing::database {

namespace {

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::string encodeParameters(const std::map<std::string, std::string>& parameters) {
    std::stringstream params_ss;
    for (const auto& [key, value] : parameters) {
        params_ss << key << "=" << value << ";";
    }
    return params_ss.str();
}

std::map<std::string, std::string> decodeParameters(const std::string& encoded) {
    std::map<std::string, std::string> parameters;
    std::stringstream ss(encoded);
    std::string item;
    while (std::getline(ss, item, ';')) {
        const auto eq = item.find('=');
        if (eq != std::string::npos) {
            parameters[item.substr(0, eq)] = item.substr(eq + 1);
        }
    }
    return parameters;
}

}

// PIMPL implementation to hide SQLite details
class DatabaseManager::Impl {
public:
    sqlite3* db = nullptr;
    DatabaseConfig config;
    bool enabled = false;

    explicit Impl(const DatabaseConfig& cfg) : config(cfg), enabled(cfg.enabled) {
        if (!enabled) {
            LOG_DEBUG("DatabaseManager: Disabled - no placement or run tracking");
            return;
        }

        int rc = sqlite3_open(config.connection_string.c_str(), &db);
        if (rc != SQLITE_OK) {
            LOG_ERROR("DatabaseManager: Failed to open database: " + std::string(sqlite3_errmsg(db)));
            enabled = false;
            if (db) {
                sqlite3_close(db);
                db = nullptr;
            }
        } else {
            sqlite3_busy_timeout(db, 5000);
            LOG_INFO("DatabaseManager: Connected to " + config.connection_string);
        }
    }

    ~Impl() {
        if (db) {
            sqlite3_close(db);
        }
    }

    bool exec(const char* sql, const char* what) const {
        char* error_msg = nullptr;
        if (sqlite3_exec(db, sql, nullptr, nullptr, &error_msg) != SQLITE_OK) {
            LOG_ERROR(std::string("Failed to ") + what + ": " + (error_msg ? error_msg : "unknown error"));
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool initializeTables() const {
        if (!enabled || !db) return !enabled; // Success if disabled

        const auto create_placements_table = R"(
            CREATE TABLE IF NOT EXISTS placements (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                status TEXT NOT NULL,
                stored_path TEXT,
                site TEXT NOT NULL,
                task TEXT NOT NULL,
                phase TEXT NOT NULL,
                captured_at TEXT NOT NULL,
                original_name TEXT,
                reason TEXT,
                timestamp TEXT NOT NULL
            );
        )";

        const auto create_runs_table = R"(
            CREATE TABLE IF NOT EXISTS report_runs (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                site TEXT NOT NULL,
                task TEXT NOT NULL,
                from_month TEXT NOT NULL,
                to_month TEXT NOT NULL,
                status TEXT NOT NULL,
                selection_mode TEXT,
                before_count INTEGER,
                after_count INTEGER,
                pair_count INTEGER,
                failure_count INTEGER,
                elapsed_ms REAL,
                parameters TEXT,
                timestamp TEXT NOT NULL
            );
        )";

        const auto create_pairs_table = R"(
            CREATE TABLE IF NOT EXISTS report_pairs (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                run_id INTEGER NOT NULL,
                before_path TEXT NOT NULL,
                after_path TEXT NOT NULL,
                score REAL NOT NULL,
                match_count INTEGER NOT NULL,
                FOREIGN KEY(run_id) REFERENCES report_runs(id)
            );
        )";

        const auto create_unmatched_table = R"(
            CREATE TABLE IF NOT EXISTS report_unmatched (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                run_id INTEGER NOT NULL,
                side TEXT NOT NULL,
                path TEXT NOT NULL,
                reason TEXT,
                FOREIGN KEY(run_id) REFERENCES report_runs(id)
            );
        )";

        const auto create_indexes = R"(
            CREATE INDEX IF NOT EXISTS idx_placements_group ON placements(site, task);
            CREATE INDEX IF NOT EXISTS idx_pairs_run ON report_pairs(run_id);
            CREATE INDEX IF NOT EXISTS idx_unmatched_run ON report_unmatched(run_id);
        )";

        return exec(create_placements_table, "create placements table") &&
               exec(create_runs_table, "create report_runs table") &&
               exec(create_pairs_table, "create report_pairs table") &&
               exec(create_unmatched_table, "create report_unmatched table") &&
               exec(create_indexes, "create indexes");
    }

    static std::string getCurrentTimestamp() {
        const auto now = std::chrono::system_clock::now();
        const auto time_t = std::chrono::system_clock::to_time_t(now);
        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);
        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }
};

// DatabaseManager implementation
DatabaseManager::DatabaseManager(const DatabaseConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
    if (impl_->enabled && !initializeTables()) {
        LOG_ERROR("DatabaseManager: Failed to initialize tables");
    }
}

DatabaseManager::DatabaseManager(const std::string& db_path, bool enabled)
    : DatabaseManager(enabled ? DatabaseConfig::sqlite(db_path) : DatabaseConfig::disabled()) {
}

DatabaseManager::~DatabaseManager() = default;
DatabaseManager::DatabaseManager(DatabaseManager&&) noexcept = default;
DatabaseManager& DatabaseManager::operator=(DatabaseManager&&) noexcept = default;

bool DatabaseManager::isEnabled() const {
    return impl_ && impl_->enabled && impl_->db != nullptr;
}

bool DatabaseManager::optimizeForBulkOperations() const {
    if (!isEnabled()) return true; // Success if disabled

    const char* optimizations[] = {
        "PRAGMA journal_mode = WAL;",
        "PRAGMA synchronous = NORMAL;",
        "PRAGMA temp_store = MEMORY;"
    };

    for (const char* pragma : optimizations) {
        if (!impl_->exec(pragma, "apply optimization")) {
            return false;
        }
    }
    return true;
}

bool DatabaseManager::initializeTables() const {
    return impl_ ? impl_->initializeTables() : true;
}

bool DatabaseManager::recordPlacement(const PlacementRecord& record) const {
    if (!isEnabled()) return true; // Success if disabled

    const auto sql = R"(
        INSERT INTO placements (status, stored_path, site, task, phase, captured_at,
                                original_name, reason, timestamp)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("Failed to prepare placement insert: " + std::string(sqlite3_errmsg(impl_->db)));
        return false;
    }

    const std::string timestamp = Impl::getCurrentTimestamp();
    sqlite3_bind_text(stmt, 1, record.status.c_str(), -1, SQLITE_STATIC);
    if (!record.stored_path.empty()) {
        sqlite3_bind_text(stmt, 2, record.stored_path.c_str(), -1, SQLITE_STATIC);
    } else {
        sqlite3_bind_null(stmt, 2);
    }
    sqlite3_bind_text(stmt, 3, record.site.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, record.task.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 5, record.phase.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 6, record.captured_at.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 7, record.original_name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 8, record.reason.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 9, timestamp.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    const bool success = (rc == SQLITE_DONE);
    if (!success) {
        LOG_ERROR("Failed to insert placement: " + std::string(sqlite3_errmsg(impl_->db)));
    }
    sqlite3_finalize(stmt);
    return success;
}

std::vector<PlacementRecord> DatabaseManager::getPlacements(int limit) const {
    std::vector<PlacementRecord> placements;
    if (!isEnabled()) return placements;

    const auto sql = R"(
        SELECT id, status, stored_path, site, task, phase, captured_at, original_name, reason, timestamp
        FROM placements ORDER BY id DESC LIMIT ?;
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to query placements: " + std::string(sqlite3_errmsg(impl_->db)));
        return placements;
    }
    sqlite3_bind_int(stmt, 1, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        PlacementRecord record;
        record.id = sqlite3_column_int(stmt, 0);
        record.status = columnText(stmt, 1);
        record.stored_path = columnText(stmt, 2);
        record.site = columnText(stmt, 3);
        record.task = columnText(stmt, 4);
        record.phase = columnText(stmt, 5);
        record.captured_at = columnText(stmt, 6);
        record.original_name = columnText(stmt, 7);
        record.reason = columnText(stmt, 8);
        record.timestamp = columnText(stmt, 9);
        placements.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return placements;
}

int DatabaseManager::recordReportRun(const ReportRunRecord& record) const {
    if (!isEnabled()) return -1;

    const auto sql = R"(
        INSERT INTO report_runs (site, task, from_month, to_month, status, selection_mode,
                                 before_count, after_count, pair_count, failure_count,
                                 elapsed_ms, parameters, timestamp)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("Failed to prepare statement: " + std::string(sqlite3_errmsg(impl_->db)));
        return -1;
    }

    const std::string params_str = encodeParameters(record.parameters);
    const std::string timestamp = Impl::getCurrentTimestamp();

    sqlite3_bind_text(stmt, 1, record.site.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, record.task.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, record.from_month.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, record.to_month.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 5, record.status.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 6, record.selection_mode.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 7, record.before_count);
    sqlite3_bind_int(stmt, 8, record.after_count);
    sqlite3_bind_int(stmt, 9, record.pair_count);
    sqlite3_bind_int(stmt, 10, record.failure_count);
    sqlite3_bind_double(stmt, 11, record.elapsed_ms);
    sqlite3_bind_text(stmt, 12, params_str.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 13, timestamp.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    int run_id = -1;

    if (rc == SQLITE_DONE) {
        run_id = static_cast<int>(sqlite3_last_insert_rowid(impl_->db));
        LOG_INFO("Recorded report run with ID: " + std::to_string(run_id));
    } else {
        LOG_ERROR("Failed to insert report run: " + std::string(sqlite3_errmsg(impl_->db)));
    }

    sqlite3_finalize(stmt);
    return run_id;
}

bool DatabaseManager::storePairs(int run_id, const std::vector<PairRecord>& pairs) const {
    if (!isEnabled()) return true; // Success if disabled
    if (pairs.empty()) return true;

    if (!impl_->exec("BEGIN TRANSACTION", "begin transaction")) {
        return false;
    }

    const auto sql = R"(
        INSERT INTO report_pairs (run_id, before_path, after_path, score, match_count)
        VALUES (?, ?, ?, ?, ?);
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare pair insert: " + std::string(sqlite3_errmsg(impl_->db)));
        impl_->exec("ROLLBACK", "roll back");
        return false;
    }

    bool success = true;
    for (const auto& pair : pairs) {
        sqlite3_bind_int(stmt, 1, run_id);
        sqlite3_bind_text(stmt, 2, pair.before_path.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, pair.after_path.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt, 4, pair.score);
        sqlite3_bind_int(stmt, 5, pair.match_count);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_ERROR("Failed to insert pair: " + std::string(sqlite3_errmsg(impl_->db)));
            success = false;
            break;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);

    if (success) {
        return impl_->exec("COMMIT", "commit pairs");
    }
    impl_->exec("ROLLBACK", "roll back pairs");
    return false;
}

bool DatabaseManager::storeUnmatched(int run_id, const std::vector<UnmatchedRecord>& unmatched) const {
    if (!isEnabled()) return true; // Success if disabled
    if (unmatched.empty()) return true;

    if (!impl_->exec("BEGIN TRANSACTION", "begin transaction")) {
        return false;
    }

    const auto sql = R"(
        INSERT INTO report_unmatched (run_id, side, path, reason)
        VALUES (?, ?, ?, ?);
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare unmatched insert: " + std::string(sqlite3_errmsg(impl_->db)));
        impl_->exec("ROLLBACK", "roll back");
        return false;
    }

    bool success = true;
    for (const auto& entry : unmatched) {
        sqlite3_bind_int(stmt, 1, run_id);
        sqlite3_bind_text(stmt, 2, entry.side.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, entry.path.c_str(), -1, SQLITE_STATIC);
        if (!entry.reason.empty()) {
            sqlite3_bind_text(stmt, 4, entry.reason.c_str(), -1, SQLITE_STATIC);
        } else {
            sqlite3_bind_null(stmt, 4);
        }

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_ERROR("Failed to insert unmatched photo: " + std::string(sqlite3_errmsg(impl_->db)));
            success = false;
            break;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);

    if (success) {
        return impl_->exec("COMMIT", "commit unmatched photos");
    }
    impl_->exec("ROLLBACK", "roll back unmatched photos");
    return false;
}

std::vector<ReportRunRecord> DatabaseManager::getRecentRuns(int limit) const {
    std::vector<ReportRunRecord> runs;
    if (!isEnabled()) return runs;

    const auto sql = R"(
        SELECT id, site, task, from_month, to_month, status, selection_mode,
               before_count, after_count, pair_count, failure_count, elapsed_ms,
               parameters, timestamp
        FROM report_runs ORDER BY id DESC LIMIT ?;
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to query report runs: " + std::string(sqlite3_errmsg(impl_->db)));
        return runs;
    }
    sqlite3_bind_int(stmt, 1, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ReportRunRecord record;
        record.id = sqlite3_column_int(stmt, 0);
        record.site = columnText(stmt, 1);
        record.task = columnText(stmt, 2);
        record.from_month = columnText(stmt, 3);
        record.to_month = columnText(stmt, 4);
        record.status = columnText(stmt, 5);
        record.selection_mode = columnText(stmt, 6);
        record.before_count = sqlite3_column_int(stmt, 7);
        record.after_count = sqlite3_column_int(stmt, 8);
        record.pair_count = sqlite3_column_int(stmt, 9);
        record.failure_count = sqlite3_column_int(stmt, 10);
        record.elapsed_ms = sqlite3_column_double(stmt, 11);
        record.parameters = decodeParameters(columnText(stmt, 12));
        record.timestamp = columnText(stmt, 13);
        runs.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return runs;
}

std::vector<PairRecord> DatabaseManager::getPairsForRun(int run_id) const {
    std::vector<PairRecord> pairs;
    if (!isEnabled()) return pairs;

    const auto sql = R"(
        SELECT before_path, after_path, score, match_count
        FROM report_pairs WHERE run_id = ? ORDER BY before_path;
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return pairs;
    }
    sqlite3_bind_int(stmt, 1, run_id);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        PairRecord record;
        record.run_id = run_id;
        record.before_path = columnText(stmt, 0);
        record.after_path = columnText(stmt, 1);
        record.score = sqlite3_column_double(stmt, 2);
        record.match_count = sqlite3_column_int(stmt, 3);
        pairs.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return pairs;
}

std::vector<UnmatchedRecord> DatabaseManager::getUnmatchedForRun(int run_id) const {
    std::vector<UnmatchedRecord> unmatched;
    if (!isEnabled()) return unmatched;

    const auto sql = R"(
        SELECT side, path, reason
        FROM report_unmatched WHERE run_id = ? ORDER BY side DESC, path;
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return unmatched;
    }
    sqlite3_bind_int(stmt, 1, run_id);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        UnmatchedRecord record;
        record.run_id = run_id;
        record.side = columnText(stmt, 0);
        record.path = columnText(stmt, 1);
        record.reason = columnText(stmt, 2);
        unmatched.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return unmatched;
}

std::map<std::string, double> DatabaseManager::getStatistics() const {
    std::map<std::string, double> stats;
    if (!isEnabled()) return stats;

    const char* placement_sql = R"(
        SELECT
            COUNT(*) as total_placements,
            COALESCE(SUM(CASE WHEN status = 'stored' THEN 1 ELSE 0 END), 0) as stored,
            COALESCE(SUM(CASE WHEN status = 'rejected' THEN 1 ELSE 0 END), 0) as rejected
        FROM placements;
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, placement_sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            stats["total_placements"] = sqlite3_column_double(stmt, 0);
            stats["stored_placements"] = sqlite3_column_double(stmt, 1);
            stats["rejected_placements"] = sqlite3_column_double(stmt, 2);
        }
        sqlite3_finalize(stmt);
    }

    const char* run_sql = R"(
        SELECT
            COUNT(*) as total_runs,
            COALESCE(AVG(pair_count), 0) as avg_pairs,
            COALESCE(AVG(elapsed_ms), 0) as avg_time
        FROM report_runs;
    )";

    stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, run_sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            stats["total_runs"] = sqlite3_column_double(stmt, 0);
            stats["average_pairs"] = sqlite3_column_double(stmt, 1);
            stats["average_time_ms"] = sqlite3_column_double(stmt, 2);
        }
        sqlite3_finalize(stmt);
    }

    return stats;
}

} // namespace photo_pairing::database
