#include <gtest/gtest.h>
#include "src/core/classification/CaptureTime.hpp"
#include "src/core/storage/StorageLocator.hpp"
#include "photo_pairing/errors.hpp"
#include "support/InMemoryStoragePort.hpp"
#include <set>
#include <thread>

using photo_pairing::Phase;
using photo_pairing::StorageFailure;
using photo_pairing::StorageParams;
using photo_pairing::classification::LocalDateTime;
using photo_pairing::classification::fromLocalDateTime;
using photo_pairing::storage::PlacementRequest;
using photo_pairing::storage::StorageLocator;
using photo_pairing::test_support::InMemoryStoragePort;

namespace {

std::time_t localTime(int year, int month, int day, int hour, int minute, int second, int offset = 0) {
    LocalDateTime t;
    t.year = year;
    t.month = month;
    t.day = day;
    t.hour = hour;
    t.minute = minute;
    t.second = second;
    return fromLocalDateTime(t, offset);
}

class StorageLocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        port = std::make_shared<InMemoryStoragePort>();
        StorageParams params;
        params.save_root = "/store";
        locator = std::make_unique<StorageLocator>(port, params, 0);

        request.captured_at = localTime(2024, 5, 3, 9, 0, 0);
        request.site = "ALPHA";
        request.task = "grass_cutting";
        request.phase = Phase::BEFORE;
        request.original_name = "IMG_0012.JPG";
    }

    std::shared_ptr<InMemoryStoragePort> port;
    std::unique_ptr<StorageLocator> locator;
    PlacementRequest request;
    const std::vector<unsigned char> bytes{1, 2, 3, 4};
};

} // namespace

TEST_F(StorageLocatorTest, DirectoryLayout) {
    EXPECT_EQ(locator->directoryFor(request.captured_at, "ALPHA", "grass_cutting", Phase::BEFORE),
              "/store/2024-05/ALPHA/grass_cutting/before");
    EXPECT_EQ(locator->directoryFor(request.captured_at, "BRAVO", "drainage_cleaning", Phase::AFTER),
              "/store/2024-05/BRAVO/drainage_cleaning/after");
}

TEST_F(StorageLocatorTest, MonthFollowsConfiguredOffset) {
    StorageParams params;
    params.save_root = "/store";
    const StorageLocator malaysia(port, params, 480);

    // 2024-05-31 20:00 UTC is 2024-06-01 04:00 at +08:00
    const auto captured = localTime(2024, 5, 31, 20, 0, 0);
    EXPECT_EQ(malaysia.directoryFor(captured, "ALPHA", "grass_cutting", Phase::BEFORE),
              "/store/2024-06/ALPHA/grass_cutting/before");
    EXPECT_EQ(locator->directoryFor(captured, "ALPHA", "grass_cutting", Phase::BEFORE),
              "/store/2024-05/ALPHA/grass_cutting/before");
}

TEST_F(StorageLocatorTest, RejectsRejectedPhaseAndEmptyLabels) {
    EXPECT_THROW(locator->directoryFor(request.captured_at, "ALPHA", "grass_cutting", Phase::REJECTED),
                 std::invalid_argument);
    EXPECT_THROW(locator->directoryFor(request.captured_at, "", "grass_cutting", Phase::BEFORE),
                 std::invalid_argument);
    EXPECT_THROW(locator->directoryFor(request.captured_at, "ALPHA", "", Phase::AFTER),
                 std::invalid_argument);

    request.phase = Phase::REJECTED;
    EXPECT_THROW(locator->place(request, bytes), std::invalid_argument);
    EXPECT_EQ(port->fileCount(), 0u);
}

TEST_F(StorageLocatorTest, FilenameCarriesSitePhaseStampAndLabel) {
    EXPECT_EQ(locator->baseFilename(request), "alpha_grass_cutting_before_20240503_090000_IMG_0012");

    request.original_name.clear();
    request.caption = "Potong rumput, zone A!";
    EXPECT_EQ(locator->baseFilename(request), "alpha_grass_cutting_before_20240503_090000_Potong_rumput_zone_A_");

    request.caption = "!!!";
    EXPECT_EQ(locator->baseFilename(request), "alpha_grass_cutting_before_20240503_090000");

    request.caption.clear();
    EXPECT_EQ(locator->baseFilename(request), "alpha_grass_cutting_before_20240503_090000");
}

TEST_F(StorageLocatorTest, PlacesBytesUnderComputedPath) {
    const auto path = locator->place(request, bytes);
    EXPECT_EQ(path, "/store/2024-05/ALPHA/grass_cutting/before/alpha_grass_cutting_before_20240503_090000_IMG_0012.jpg");
    EXPECT_EQ(port->contents(path), bytes);
    EXPECT_EQ(port->fileCount(), 1u);
}

TEST_F(StorageLocatorTest, UnknownExtensionFallsBackToJpg) {
    request.original_name = "scan.heic";
    const auto path = locator->place(request, bytes);
    EXPECT_EQ(path.substr(path.size() - 4), ".jpg");
}

TEST_F(StorageLocatorTest, NeverOverwritesExistingPhoto) {
    const auto first = locator->place(request, bytes);
    const std::vector<unsigned char> other{9, 9, 9};
    const auto second = locator->place(request, other);
    const auto third = locator->place(request, other);

    EXPECT_NE(first, second);
    EXPECT_NE(second, third);
    EXPECT_EQ(second, "/store/2024-05/ALPHA/grass_cutting/before/alpha_grass_cutting_before_20240503_090000_IMG_0012-1.jpg");
    EXPECT_EQ(third, "/store/2024-05/ALPHA/grass_cutting/before/alpha_grass_cutting_before_20240503_090000_IMG_0012-2.jpg");
    EXPECT_EQ(port->contents(first), bytes);
    EXPECT_EQ(port->contents(second), other);
}

TEST_F(StorageLocatorTest, SkipsPreexistingFiles) {
    const std::string taken = "/store/2024-05/ALPHA/grass_cutting/before/alpha_grass_cutting_before_20240503_090000_IMG_0012.jpg";
    port->put(taken, {7});
    const auto path = locator->place(request, bytes);
    EXPECT_NE(path, taken);
    EXPECT_EQ(port->contents(taken), std::vector<unsigned char>{7});
}

TEST_F(StorageLocatorTest, ConcurrentPlacementsGetDistinctPaths) {
    constexpr int kThreads = 8;
    std::vector<std::string> paths(kThreads);
    std::vector<std::thread> workers;
    for (int i = 0; i < kThreads; ++i) {
        workers.emplace_back([this, i, &paths]() {
            paths[static_cast<size_t>(i)] = locator->place(request, {static_cast<unsigned char>(i)});
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    const std::set<std::string> unique(paths.begin(), paths.end());
    EXPECT_EQ(unique.size(), static_cast<size_t>(kThreads));
    EXPECT_EQ(port->fileCount(), static_cast<size_t>(kThreads));
}

TEST_F(StorageLocatorTest, FailedWriteLeavesNothingBehind) {
    port->fail_write = true;
    try {
        locator->place(request, bytes);
        FAIL() << "expected StorageFailure";
    } catch (const StorageFailure& e) {
        EXPECT_EQ(e.photo(), "IMG_0012.JPG");
    }
    EXPECT_EQ(port->fileCount(), 0u);
}

TEST_F(StorageLocatorTest, FailedPublishDiscardsTemporary) {
    port->fail_publish = true;
    EXPECT_THROW(locator->place(request, bytes), StorageFailure);
    EXPECT_EQ(port->fileCount(), 0u);

    port->fail_publish = false;
    EXPECT_NO_THROW(locator->place(request, bytes));
    EXPECT_EQ(port->fileCount(), 1u);
}

TEST_F(StorageLocatorTest, FailedDirectoryCreationIsStorageFailure) {
    port->fail_create_directories = true;
    EXPECT_THROW(locator->place(request, bytes), StorageFailure);
    EXPECT_EQ(port->fileCount(), 0u);
}

TEST(StorageLocatorConstruction, RequiresPortAndRoot) {
    StorageParams params;
    params.save_root = "/store";
    EXPECT_THROW(StorageLocator(nullptr, params, 0), std::invalid_argument);

    params.save_root.clear();
    EXPECT_THROW(StorageLocator(std::make_shared<InMemoryStoragePort>(), params, 0),
                 photo_pairing::ConfigurationError);
}

TEST(StorageLabels, SanitizeAndExtensions) {
    using namespace photo_pairing::storage;
    EXPECT_EQ(sanitizeLabel("a b//c"), "a_b_c");
    EXPECT_EQ(sanitizeLabel("keep-this_one"), "keep-this_one");
    EXPECT_EQ(sanitizeLabel("abcdefgh", 5), "abcde");
    EXPECT_EQ(sanitizeLabel(""), "");
    EXPECT_EQ(extensionOf("X.JPEG"), ".jpeg");
    EXPECT_EQ(extensionOf("noext"), "");
    EXPECT_TRUE(isImageExtension(".WEBP"));
    EXPECT_TRUE(isImageExtension(".tif"));
    EXPECT_FALSE(isImageExtension(".gif"));
    EXPECT_FALSE(isImageExtension(""));
}

TEST(StorageLabels, StoreComponentNeedsALetterOrDigit) {
    using namespace photo_pairing::storage;
    EXPECT_EQ(storeComponent("North Park", "site"), "North_Park");
    EXPECT_EQ(storeComponent("drain-2", "task"), "drain-2");
    EXPECT_THROW(storeComponent("", "site"), std::invalid_argument);
    EXPECT_THROW(storeComponent("..", "site"), std::invalid_argument);
    EXPECT_THROW(storeComponent("../", "task"), std::invalid_argument);
    EXPECT_THROW(storeComponent("__", "task"), std::invalid_argument);
}
