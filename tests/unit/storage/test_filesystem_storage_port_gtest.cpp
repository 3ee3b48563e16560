#include <gtest/gtest.h>
#include "src/core/classification/CaptureTime.hpp"
#include "src/core/storage/FileSystemStoragePort.hpp"
#include "src/core/storage/StorageLocator.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <thread>

namespace fs = std::filesystem;

using photo_pairing::Phase;
using photo_pairing::StorageParams;
using photo_pairing::storage::FileSystemStoragePort;
using photo_pairing::storage::PlacementRequest;
using photo_pairing::storage::StorageLocator;

namespace {

std::vector<unsigned char> readAll(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<unsigned char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

size_t countEntries(const fs::path& dir) {
    return static_cast<size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
}

class FileSystemStoragePortTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() /
               ("photo_pairing_fs_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root);
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path root;
    FileSystemStoragePort port;
};

} // namespace

TEST_F(FileSystemStoragePortTest, CreatesNestedDirectories) {
    const auto dir = root / "2024-05" / "ALPHA" / "grass_cutting" / "before";
    port.createDirectories(dir.string());
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_NO_THROW(port.createDirectories(dir.string()));
}

TEST_F(FileSystemStoragePortTest, PublishMovesTemporaryIntoPlace) {
    const std::vector<unsigned char> bytes{10, 20, 30};
    const auto temp = port.writeTemporary(root.string(), bytes);
    EXPECT_TRUE(port.exists(temp));
    EXPECT_EQ(fs::path(temp).filename().string().front(), '.');

    const auto final_path = (root / "photo.jpg").string();
    EXPECT_TRUE(port.publishIfAbsent(temp, final_path));
    EXPECT_FALSE(port.exists(temp));
    EXPECT_EQ(readAll(final_path), bytes);
}

TEST_F(FileSystemStoragePortTest, PublishRefusesExistingTarget) {
    const auto final_path = (root / "photo.jpg").string();
    {
        std::ofstream out(final_path, std::ios::binary);
        out << "original";
    }

    const auto temp = port.writeTemporary(root.string(), {1, 2, 3});
    EXPECT_FALSE(port.publishIfAbsent(temp, final_path));
    EXPECT_TRUE(port.exists(temp));

    const auto content = readAll(final_path);
    EXPECT_EQ(std::string(content.begin(), content.end()), "original");

    port.discard(temp);
    EXPECT_FALSE(port.exists(temp));
}

TEST_F(FileSystemStoragePortTest, DiscardOfMissingFileIsHarmless) {
    EXPECT_NO_THROW(port.discard((root / ".incoming-missing.tmp").string()));
}

TEST_F(FileSystemStoragePortTest, WriteIntoMissingDirectoryThrows) {
    EXPECT_THROW(port.writeTemporary((root / "missing" / "dir").string(), {1}), std::runtime_error);
}

TEST_F(FileSystemStoragePortTest, LocatorKeepsEveryPlacementOnDisk) {
    StorageParams params;
    params.save_root = root.string();
    StorageLocator locator(std::make_shared<FileSystemStoragePort>(), params, 0);

    photo_pairing::classification::LocalDateTime local;
    local.year = 2024;
    local.month = 5;
    local.day = 3;
    local.hour = 16;

    PlacementRequest request;
    request.captured_at = photo_pairing::classification::fromLocalDateTime(local, 0);
    request.site = "BRAVO";
    request.task = "drainage_cleaning";
    request.phase = Phase::AFTER;
    request.original_name = "longkang.png";

    constexpr int kThreads = 6;
    std::vector<std::string> paths(kThreads);
    std::vector<std::thread> workers;
    for (int i = 0; i < kThreads; ++i) {
        workers.emplace_back([&, i]() {
            paths[static_cast<size_t>(i)] = locator.place(request, {static_cast<unsigned char>(i), 42});
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    const std::set<std::string> unique(paths.begin(), paths.end());
    EXPECT_EQ(unique.size(), static_cast<size_t>(kThreads));

    const auto dir = root / "2024-05" / "BRAVO" / "drainage_cleaning" / "after";
    EXPECT_EQ(countEntries(dir), static_cast<size_t>(kThreads)) << "no temporary files may remain";
    for (const auto& path : paths) {
        EXPECT_EQ(fs::path(path).extension().string(), ".png");
        EXPECT_EQ(readAll(path).size(), 2u);
    }
}
