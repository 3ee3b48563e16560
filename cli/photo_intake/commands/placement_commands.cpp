#include "placement_commands.hpp"
#include "src/core/classification/CaptureTime.hpp"
#include "src/core/classification/PhaseClassifier.hpp"
#include "src/core/classification/SiteRegistry.hpp"
#include "src/core/intake/PhotoIntake.hpp"
#include "src/core/storage/FileSystemStoragePort.hpp"
#include "src/core/storage/StorageLocator.hpp"
#include "photo_pairing/logging.hpp"
#include <boost/filesystem.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>

namespace photo_pairing::cli::intake_commands {

namespace {

bool readFile(const std::string& path, std::vector<unsigned char>& bytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

void printOutcome(const std::string& source, const intake::PlacementOutcome& outcome) {
    switch (outcome.status) {
        case intake::PlacementStatus::STORED:
            std::cout << "Saved: " << outcome.stored_path << std::endl;
            break;
        case intake::PlacementStatus::REJECTED:
            std::cout << "Rejected " << source << ": " << outcome.reason << std::endl;
            break;
        case intake::PlacementStatus::FAILED:
            std::cerr << "Failed " << source << ": " << outcome.reason << std::endl;
            break;
    }
}

}

int placeFile(const config::PipelineConfig& config, database::DatabaseManager& db, int argc, char** argv) {
    if (argc < 6 || argc > 7) {
        std::cerr << "Usage: " << argv[0] << " place <image> <site> <task> <YYYY-MM-DD HH:MM:SS> [caption]" << std::endl;
        std::cerr << "  Example: " << argv[0] << " place IMG_0012.jpg ALPHA grass_cutting \"2024-05-03 08:15:00\"" << std::endl;
        return 1;
    }

    const std::string image_path = argv[2];
    const auto local = classification::parseLocalDateTime(argv[5]);
    if (!local) {
        std::cerr << "Invalid capture time: " << argv[5] << std::endl;
        return 1;
    }

    namespace fs = boost::filesystem;
    if (!fs::exists(image_path) || !fs::is_regular_file(image_path)) {
        std::cerr << "Image does not exist: " << image_path << std::endl;
        return 1;
    }

    PhotoSubmission submission;
    if (!readFile(image_path, submission.bytes)) {
        std::cerr << "Cannot read image: " << image_path << std::endl;
        return 1;
    }
    submission.captured_at = classification::fromLocalDateTime(*local, config.classification.utc_offset_minutes);
    submission.site = argv[3];
    submission.task = argv[4];
    submission.caption = (argc == 7) ? argv[6] : "";
    submission.original_name = fs::path(image_path).filename().string();

    const classification::PhaseClassifier classifier(config.classification);
    classification::SiteRegistry sites;
    sites.addSites(config.classification.sites);
    storage::StorageLocator locator(std::make_shared<storage::FileSystemStoragePort>(),
                                    config.storage, config.classification.utc_offset_minutes);
    intake::PhotoIntake intake(classifier, sites, locator, &db);

    const auto outcome = intake.submit(submission);
    printOutcome(image_path, outcome);
    return outcome.status == intake::PlacementStatus::FAILED ? 1 : 0;
}

int placeDirectory(const config::PipelineConfig& config, database::DatabaseManager& db, int argc, char** argv) {
    if (argc != 5) {
        std::cerr << "Usage: " << argv[0] << " place-dir <folder> <site> <task>" << std::endl;
        std::cerr << "  Capture time is taken from each file's modification time." << std::endl;
        return 1;
    }

    namespace fs = boost::filesystem;
    const std::string folder = argv[2];
    if (!fs::exists(folder) || !fs::is_directory(folder)) {
        std::cerr << "Folder does not exist: " << folder << std::endl;
        return 1;
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(folder), end; it != end; ++it) {
        if (fs::is_regular_file(it->status()) &&
            storage::isImageExtension(it->path().extension().string())) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());

    const classification::PhaseClassifier classifier(config.classification);
    classification::SiteRegistry sites;
    sites.addSites(config.classification.sites);
    storage::StorageLocator locator(std::make_shared<storage::FileSystemStoragePort>(),
                                    config.storage, config.classification.utc_offset_minutes);
    intake::PhotoIntake intake(classifier, sites, locator, &db);

    LOG_INFO("Placing " + std::to_string(files.size()) + " images from " + folder);

    int stored = 0, rejected = 0, failed = 0;
    for (const auto& file : files) {
        PhotoSubmission submission;
        if (!readFile(file.string(), submission.bytes)) {
            LOG_ERROR("Cannot read " + file.string());
            ++failed;
            continue;
        }
        submission.captured_at = fs::last_write_time(file);
        submission.site = argv[3];
        submission.task = argv[4];
        submission.original_name = file.filename().string();

        const auto outcome = intake.submit(submission);
        printOutcome(file.string(), outcome);
        switch (outcome.status) {
            case intake::PlacementStatus::STORED: ++stored; break;
            case intake::PlacementStatus::REJECTED: ++rejected; break;
            case intake::PlacementStatus::FAILED: ++failed; break;
        }
    }

    std::cout << "Stored " << stored << ", rejected " << rejected << ", failed " << failed << std::endl;
    return failed > 0 ? 1 : 0;
}

int classifyTime(const config::PipelineConfig& config, int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " classify <YYYY-MM-DD HH:MM:SS>" << std::endl;
        return 1;
    }

    const auto local = classification::parseLocalDateTime(argv[2]);
    if (!local) {
        std::cerr << "Invalid capture time: " << argv[2] << std::endl;
        return 1;
    }

    const classification::PhaseClassifier classifier(config.classification);
    const auto phase = classifier.classifyHour(local->hour);
    std::cout << classification::formatDisplay(*local) << " -> " << toString(phase) << std::endl;
    return 0;
}

} // namespace photo_pairing::cli::intake_commands
