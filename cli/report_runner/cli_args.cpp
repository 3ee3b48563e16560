#include "cli_args.hpp"
#include <iostream>
#include <stdexcept>

namespace photo_pairing::cli::report_runner_cli {

void printUsage(const std::string& binaryName) {
    std::cout << "Usage: " << binaryName << " [config.yaml] --site S --task T --month YYYY-MM [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help             Show this help message and exit" << std::endl;
    std::cout << "  --to YYYY-MM           Last month of the range (inclusive)" << std::endl;
    std::cout << "  --timeout-ms N         Stop the build after N milliseconds" << std::endl;
    std::cout << "  --candidates           Print the ranked candidates of every before photo" << std::endl;
    std::cout << "Environment variables override values from config.yaml." << std::endl;
    std::cout << "Example:" << std::endl;
    std::cout << "  " << binaryName << " config/report.yaml --site ALPHA --task grass_cutting --month 2024-05" << std::endl;
}

std::optional<ReportArgs> parseArgs(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return std::nullopt;
    }

    ReportArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return std::nullopt;
        }

        if (arg == "--candidates") {
            args.show_candidates = true;
            continue;
        }

        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                printUsage(argv[0]);
                return std::nullopt;
            }
            const std::string value = argv[++i];
            if (arg == "--site") {
                args.site = value;
            } else if (arg == "--task") {
                args.task = value;
            } else if (arg == "--month") {
                args.from_month = value;
            } else if (arg == "--to") {
                args.to_month = value;
            } else if (arg == "--timeout-ms") {
                try {
                    size_t consumed = 0;
                    args.timeout_ms = std::stoll(value, &consumed);
                    if (consumed != value.size() || args.timeout_ms < 0) {
                        throw std::invalid_argument(value);
                    }
                } catch (const std::exception&) {
                    std::cerr << "--timeout-ms expects a non-negative integer, got: " << value << std::endl;
                    return std::nullopt;
                }
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return std::nullopt;
            }
            continue;
        }

        if (!args.config_path.empty()) {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            printUsage(argv[0]);
            return std::nullopt;
        }
        args.config_path = arg;
    }

    if (args.site.empty() || args.task.empty() || args.from_month.empty()) {
        std::cerr << "--site, --task and --month are required" << std::endl;
        printUsage(argv[0]);
        return std::nullopt;
    }

    return args;
}

} // namespace photo_pairing::cli::report_runner_cli
