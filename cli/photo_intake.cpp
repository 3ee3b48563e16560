#include "cli/photo_intake/commands/catalog_commands.hpp"
#include "cli/photo_intake/commands/placement_commands.hpp"
#include "src/core/config/EnvConfigLoader.hpp"
#include "photo_pairing/database/DatabaseManager.hpp"
#include "photo_pairing/errors.hpp"
#include "photo_pairing/logging.hpp"
#include <iostream>

static void printUsage(const std::string& binaryName) {
    std::cout << "Usage: " << binaryName << " <command> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help                                  Show this help message and exit" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  Placement:" << std::endl;
    std::cout << "    place <image> <site> <task> <YYYY-MM-DD HH:MM:SS> [caption]" << std::endl;
    std::cout << "                         Classify one photo and file it into the store" << std::endl;
    std::cout << "    place-dir <folder> <site> <task>          - Place every image of a folder (time from mtime)" << std::endl;
    std::cout << "    classify <YYYY-MM-DD HH:MM:SS>            - Print the phase of a capture time" << std::endl;
    std::cout << "  Information:" << std::endl;
    std::cout << "    list-months                               - List months present in the store" << std::endl;
    std::cout << "    list-groups <YYYY-MM>                     - List site/task groups of a month" << std::endl;
    std::cout << "    list-sites                                - List known sites (built-in and SITES)" << std::endl;
    std::cout << "    stats                                     - Show database statistics" << std::endl;
    std::cout << "Configuration is read from the environment (SAVE_ROOT, TIME_BEFORE_HOUR, SITES, ...)." << std::endl;
}

using namespace photo_pairing;

/**
 * @brief CLI tool for placing inspection photos and browsing the store
 */
int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        printUsage(argv[0]);
        return 0;
    }

    try {
        const auto env = config::EnvConfigLoader::captureProcessEnvironment();
        if (command == "list-sites") {
            // Needs only SITES, not a store
            config::PipelineConfig partial;
            config::EnvConfigLoader::applyOverrides(env, partial);
            return cli::intake_commands::listSites(partial.classification.sites);
        }

        const auto config = config::EnvConfigLoader::load(env);
        logging::LogLevel level;
        if (logging::levelFromString(config.logging.level, level)) {
            logging::setLevel(level);
        }

        database::DatabaseManager db(config.database.connection_string, config.database.enabled);

        if (command == "place") {
            return cli::intake_commands::placeFile(config, db, argc, argv);
        } else if (command == "place-dir") {
            return cli::intake_commands::placeDirectory(config, db, argc, argv);
        } else if (command == "classify") {
            return cli::intake_commands::classifyTime(config, argc, argv);
        } else if (command == "list-months") {
            return cli::intake_commands::listMonths(config);
        } else if (command == "list-groups") {
            return cli::intake_commands::listGroups(config, argc, argv);
        } else if (command == "stats") {
            return cli::intake_commands::showStatistics(db);
        }

        std::cerr << "Unknown command: " << command << std::endl;
        printUsage(argv[0]);
        return 1;
    } catch (const ConfigurationError& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Error: " + std::string(e.what()));
        return 1;
    }
}
