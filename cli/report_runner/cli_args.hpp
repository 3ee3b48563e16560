#pragma once

#include <optional>
#include <string>

namespace photo_pairing::cli::report_runner_cli {

struct ReportArgs {
    std::string config_path;      // empty = environment only
    std::string site;
    std::string task;
    std::string from_month;
    std::string to_month;
    long long timeout_ms = 0;     // 0 = no deadline
    bool show_candidates = false;
};

void printUsage(const std::string& binaryName);

// Returns std::nullopt after printing usage on --help or malformed arguments.
std::optional<ReportArgs> parseArgs(int argc, char** argv);

} // namespace photo_pairing::cli::report_runner_cli
