#include <gtest/gtest.h>
#include <filesystem>
#include "photo_pairing/database/DatabaseManager.hpp"

using namespace photo_pairing::database;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_db_name = "test_gtest_photo_pairing.db";
        // Remove existing test database
        if (std::filesystem::exists(test_db_name)) {
            std::filesystem::remove(test_db_name);
        }
    }

    void TearDown() override {
        // Clean up test database and its WAL side files
        for (const auto& name : {test_db_name, test_db_name + "-wal", test_db_name + "-shm"}) {
            if (std::filesystem::exists(name)) {
                std::filesystem::remove(name);
            }
        }
    }

    static ReportRunRecord sampleRun(int pairs, double elapsed_ms) {
        ReportRunRecord run;
        run.site = "ALPHA";
        run.task = "grass_cutting";
        run.from_month = "2024-05";
        run.to_month = "2024-05";
        run.status = "complete";
        run.selection_mode = "greedy";
        run.before_count = 3;
        run.after_count = 4;
        run.pair_count = pairs;
        run.failure_count = 0;
        run.elapsed_ms = elapsed_ms;
        run.parameters = {{"ratio", "0.75"}, {"top_k", "5"}};
        return run;
    }

    std::string test_db_name;
};

TEST_F(DatabaseTest, DisabledDatabase) {
    DatabaseManager db_disabled("", false);
    EXPECT_FALSE(db_disabled.isEnabled()) << "Disabled database should not be enabled";
}

TEST_F(DatabaseTest, EnabledDatabaseInitialization) {
    DatabaseManager db_enabled(test_db_name, true);
    EXPECT_TRUE(db_enabled.isEnabled()) << "Enabled database should initialize successfully";
    EXPECT_TRUE(db_enabled.initializeTables()) << "Table creation must be idempotent";
    EXPECT_TRUE(db_enabled.optimizeForBulkOperations());
}

TEST_F(DatabaseTest, PlacementRecording) {
    DatabaseManager db(test_db_name, true);
    ASSERT_TRUE(db.isEnabled()) << "Database must be enabled for this test";

    PlacementRecord stored;
    stored.status = "stored";
    stored.stored_path = "/photos/2024-05/ALPHA/grass_cutting/before/a.jpg";
    stored.site = "ALPHA";
    stored.task = "grass_cutting";
    stored.phase = "before";
    stored.captured_at = "2024-05-03 09:00:00";
    stored.original_name = "IMG_0012.jpg";
    EXPECT_TRUE(db.recordPlacement(stored));

    PlacementRecord rejected;
    rejected.status = "rejected";
    rejected.phase = "rejected";
    rejected.captured_at = "2024-05-03 13:00:00";
    rejected.reason = "captured inside the mid-day gap";
    EXPECT_TRUE(db.recordPlacement(rejected));

    const auto placements = db.getPlacements();
    ASSERT_EQ(placements.size(), 2u);
    // Most recent first
    EXPECT_EQ(placements[0].status, "rejected");
    EXPECT_EQ(placements[0].reason, "captured inside the mid-day gap");
    EXPECT_EQ(placements[1].stored_path, stored.stored_path);
    EXPECT_EQ(placements[1].original_name, "IMG_0012.jpg");
    EXPECT_FALSE(placements[1].timestamp.empty());

    EXPECT_EQ(db.getPlacements(1).size(), 1u);
}

TEST_F(DatabaseTest, ReportRunRecording) {
    DatabaseManager db(test_db_name, true);
    ASSERT_TRUE(db.isEnabled()) << "Database must be enabled for this test";

    const int run_id = db.recordReportRun(sampleRun(2, 120.5));
    EXPECT_GT(run_id, 0) << "Run should be recorded with positive ID";

    const auto runs = db.getRecentRuns(5);
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].id, run_id);
    EXPECT_EQ(runs[0].site, "ALPHA");
    EXPECT_EQ(runs[0].selection_mode, "greedy");
    EXPECT_EQ(runs[0].pair_count, 2);
    EXPECT_DOUBLE_EQ(runs[0].elapsed_ms, 120.5);
    EXPECT_EQ(runs[0].parameters.at("ratio"), "0.75");
    EXPECT_EQ(runs[0].parameters.at("top_k"), "5");
}

TEST_F(DatabaseTest, PairsAndUnmatchedRoundTrip) {
    DatabaseManager db(test_db_name, true);
    ASSERT_TRUE(db.isEnabled()) << "Database must be enabled for this test";

    const int run_id = db.recordReportRun(sampleRun(2, 50.0));
    ASSERT_GT(run_id, 0) << "Run recording must succeed first";

    const std::vector<PairRecord> pairs = {
        {run_id, "/b/b2.jpg", "/a/a1.jpg", 0.61, 120},
        {run_id, "/b/b1.jpg", "/a/a2.jpg", 0.83, 210},
    };
    EXPECT_TRUE(db.storePairs(run_id, pairs));

    const std::vector<UnmatchedRecord> unmatched = {
        {run_id, "after", "/a/a3.jpg", "unreadable image"},
        {run_id, "before", "/b/b3.jpg", ""},
    };
    EXPECT_TRUE(db.storeUnmatched(run_id, unmatched));

    const auto loaded_pairs = db.getPairsForRun(run_id);
    ASSERT_EQ(loaded_pairs.size(), 2u);
    EXPECT_EQ(loaded_pairs[0].before_path, "/b/b1.jpg");
    EXPECT_EQ(loaded_pairs[0].after_path, "/a/a2.jpg");
    EXPECT_DOUBLE_EQ(loaded_pairs[0].score, 0.83);
    EXPECT_EQ(loaded_pairs[0].match_count, 210);
    EXPECT_EQ(loaded_pairs[1].before_path, "/b/b2.jpg");

    const auto loaded_unmatched = db.getUnmatchedForRun(run_id);
    ASSERT_EQ(loaded_unmatched.size(), 2u);
    EXPECT_EQ(loaded_unmatched[0].side, "before");
    EXPECT_EQ(loaded_unmatched[1].side, "after");
    EXPECT_EQ(loaded_unmatched[1].reason, "unreadable image");

    EXPECT_TRUE(db.getPairsForRun(run_id + 100).empty());
}

TEST_F(DatabaseTest, RecentRunsNewestFirst) {
    DatabaseManager db(test_db_name, true);
    ASSERT_TRUE(db.isEnabled()) << "Database must be enabled for this test";

    const int first = db.recordReportRun(sampleRun(1, 10.0));
    const int second = db.recordReportRun(sampleRun(3, 30.0));
    ASSERT_GT(second, first);

    const auto runs = db.getRecentRuns(10);
    ASSERT_EQ(runs.size(), 2u);
    EXPECT_EQ(runs[0].id, second);
    EXPECT_EQ(db.getRecentRuns(1).size(), 1u);
}

TEST_F(DatabaseTest, Statistics) {
    DatabaseManager db(test_db_name, true);
    ASSERT_TRUE(db.isEnabled()) << "Database must be enabled for this test";

    PlacementRecord placement;
    placement.status = "stored";
    ASSERT_TRUE(db.recordPlacement(placement));
    placement.status = "rejected";
    ASSERT_TRUE(db.recordPlacement(placement));
    placement.status = "rejected";
    ASSERT_TRUE(db.recordPlacement(placement));

    ASSERT_GT(db.recordReportRun(sampleRun(2, 100.0)), 0);
    ASSERT_GT(db.recordReportRun(sampleRun(4, 300.0)), 0);

    const auto stats = db.getStatistics();
    EXPECT_DOUBLE_EQ(stats.at("total_placements"), 3.0);
    EXPECT_DOUBLE_EQ(stats.at("stored_placements"), 1.0);
    EXPECT_DOUBLE_EQ(stats.at("rejected_placements"), 2.0);
    EXPECT_DOUBLE_EQ(stats.at("total_runs"), 2.0);
    EXPECT_DOUBLE_EQ(stats.at("average_pairs"), 3.0);
    EXPECT_DOUBLE_EQ(stats.at("average_time_ms"), 200.0);
}

TEST_F(DatabaseTest, DisabledDatabaseIsInert) {
    DatabaseManager db("", false);
    EXPECT_TRUE(db.recordPlacement(PlacementRecord{}));
    EXPECT_EQ(db.recordReportRun(sampleRun(1, 1.0)), -1);
    EXPECT_TRUE(db.storePairs(1, {}));
    EXPECT_TRUE(db.storeUnmatched(1, {}));
    EXPECT_TRUE(db.getPlacements().empty());
    EXPECT_TRUE(db.getRecentRuns().empty());
    EXPECT_TRUE(db.getStatistics().empty());
}

TEST_F(DatabaseTest, ConfigFactories) {
    const auto disabled = DatabaseConfig::disabled();
    EXPECT_FALSE(disabled.enabled);
    EXPECT_TRUE(disabled.connection_string.empty());

    const auto sqlite = DatabaseConfig::sqlite(test_db_name);
    EXPECT_TRUE(sqlite.enabled);
    EXPECT_EQ(sqlite.connection_string, test_db_name);

    DatabaseManager db(sqlite);
    EXPECT_TRUE(db.isEnabled());
}

TEST_F(DatabaseTest, MoveKeepsConnection) {
    DatabaseManager db(test_db_name, true);
    ASSERT_TRUE(db.isEnabled());
    DatabaseManager moved(std::move(db));
    EXPECT_TRUE(moved.isEnabled());
    EXPECT_GT(moved.recordReportRun(sampleRun(1, 5.0)), 0);
}
