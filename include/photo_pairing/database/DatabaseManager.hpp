#ifndef PHOTO_PAIRING_DATABASE_MANAGER_HPP
#define PHOTO_PAIRING_DATABASE_MANAGER_HPP

#include <string>
#include <memory>
#include <map>
#include <vector>

namespace photo_pairing {
namespace database {

struct DatabaseConfig;

/**
 * @brief Placement attempt as stored in the ledger
 */
struct PlacementRecord {
    int id = -1;
    std::string status;          // stored, rejected, failed
    std::string stored_path;     // empty unless stored
    std::string site;
    std::string task;
    std::string phase;
    std::string captured_at;     // "YYYY-MM-DD HH:MM:SS" in the configured zone
    std::string original_name;
    std::string reason;          // rejection or failure reason
    std::string timestamp;       // filled in by the database
};

/**
 * @brief One report build
 */
struct ReportRunRecord {
    int id = -1;
    std::string site;
    std::string task;
    std::string from_month;
    std::string to_month;
    std::string status;
    std::string selection_mode;
    int before_count = 0;
    int after_count = 0;
    int pair_count = 0;
    int failure_count = 0;
    double elapsed_ms = 0.0;
    std::map<std::string, std::string> parameters;
    std::string timestamp;
};

struct PairRecord {
    int run_id = -1;
    std::string before_path;
    std::string after_path;
    double score = 0.0;
    int match_count = 0;
};

struct UnmatchedRecord {
    int run_id = -1;
    std::string side;            // before or after
    std::string path;
    std::string reason;          // failure message, empty if simply unpaired
};

/**
 * @brief Optional SQLite ledger of placements and report runs
 *
 * All methods are safe to call - if the database is disabled, they do
 * nothing and report success (or -1 / empty results for queries). A
 * database error never aborts a placement or a report build.
 */
class DatabaseManager {
public:
    /**
     * @brief Construct database manager
     * @param config Database configuration (connection string, enabled flag)
     */
    explicit DatabaseManager(const DatabaseConfig& config);

    /**
     * @brief Construct with simple parameters
     * @param db_path Path to SQLite database file
     * @param enabled Whether tracking is enabled
     */
    DatabaseManager(const std::string& db_path, bool enabled = false);

    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;
    DatabaseManager(DatabaseManager&&) noexcept;
    DatabaseManager& operator=(DatabaseManager&&) noexcept;

    /**
     * @brief Check if database is enabled and working
     */
    bool isEnabled() const;

    /**
     * @brief Apply SQLite pragmas for bulk writes (WAL, NORMAL sync)
     * @return true if optimizations were applied (or disabled)
     */
    bool optimizeForBulkOperations() const;

    /**
     * @brief Create tables if they don't exist
     * @return true if successful (or disabled)
     */
    bool initializeTables() const;

    bool recordPlacement(const PlacementRecord& record) const;

    /// Most recent placements first.
    std::vector<PlacementRecord> getPlacements(int limit = 50) const;

    /**
     * @brief Record a report build
     * @return run id for storePairs/storeUnmatched, or -1 if disabled/error
     */
    int recordReportRun(const ReportRunRecord& record) const;

    /// Store the committed pairs of a run in one transaction.
    bool storePairs(int run_id, const std::vector<PairRecord>& pairs) const;

    bool storeUnmatched(int run_id, const std::vector<UnmatchedRecord>& unmatched) const;

    std::vector<ReportRunRecord> getRecentRuns(int limit = 10) const;
    std::vector<PairRecord> getPairsForRun(int run_id) const;
    std::vector<UnmatchedRecord> getUnmatchedForRun(int run_id) const;

    /**
     * @brief Ledger statistics
     * @return total_placements, stored_placements, rejected_placements,
     *         total_runs, average_pairs, average_time_ms
     */
    std::map<std::string, double> getStatistics() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

struct DatabaseConfig {
    std::string connection_string;
    bool enabled = false;

    static DatabaseConfig disabled() {
        return DatabaseConfig{};
    }

    static DatabaseConfig sqlite(const std::string& path) {
        DatabaseConfig config;
        config.connection_string = path;
        config.enabled = true;
        return config;
    }
};

} // namespace database
} // namespace photo_pairing

#endif // PHOTO_PAIRING_DATABASE_MANAGER_HPP
