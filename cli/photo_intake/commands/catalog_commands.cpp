#include "catalog_commands.hpp"
#include "src/core/catalog/PhotoCatalog.hpp"
#include "src/core/classification/SiteRegistry.hpp"
#include <boost/filesystem.hpp>
#include <iostream>

namespace photo_pairing::cli::intake_commands {

int listMonths(const config::PipelineConfig& config) {
    const catalog::PhotoCatalog catalog(config.storage.save_root, config.classification.utc_offset_minutes);
    const auto months = catalog.listMonths();
    std::cout << "Months in " << config.storage.save_root << " (" << months.size() << "):" << std::endl;
    for (const auto& month : months) {
        std::cout << "  " << month << std::endl;
    }
    return 0;
}

int listGroups(const config::PipelineConfig& config, int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " list-groups <YYYY-MM>" << std::endl;
        return 1;
    }

    const std::string month = argv[2];
    if (!catalog::PhotoCatalog::isMonthName(month)) {
        std::cerr << "Month must be YYYY-MM, got: " << month << std::endl;
        return 1;
    }

    namespace fs = boost::filesystem;
    const catalog::PhotoCatalog catalog(config.storage.save_root, config.classification.utc_offset_minutes);
    const auto sites = catalog.listSites(month);
    if (sites.empty()) {
        std::cout << "No groups for " << month << std::endl;
        return 0;
    }

    for (const auto& site : sites) {
        for (const auto& task : catalog.listTasks(month, site)) {
            const fs::path base = fs::path(config.storage.save_root) / month / site / task;
            const auto before = catalog.listImages((base / "before").string());
            const auto after = catalog.listImages((base / "after").string());
            std::cout << "  " << site << "/" << task << ": "
                      << before.size() << " before, " << after.size() << " after" << std::endl;
        }
    }
    return 0;
}

int listSites(const std::vector<std::string>& extra_sites) {
    classification::SiteRegistry registry;
    registry.addSites(extra_sites);
    const auto sites = registry.sites();
    std::cout << "Known sites (" << sites.size() << "):" << std::endl;
    for (const auto& site : sites) {
        std::cout << "  " << site << std::endl;
    }
    return 0;
}

int showStatistics(database::DatabaseManager& db) {
    if (!db.isEnabled()) {
        std::cerr << "Database tracking is disabled (set DB_PATH)" << std::endl;
        return 1;
    }
    for (const auto& [name, value] : db.getStatistics()) {
        std::cout << "  " << name << ": " << value << std::endl;
    }
    return 0;
}

} // namespace photo_pairing::cli::intake_commands
