#pragma once

#include "src/core/config/EnvConfigLoader.hpp"
#include "src/core/config/PipelineConfig.hpp"
#include "photo_pairing/database/DatabaseManager.hpp"
#include <memory>
#include <string>

namespace photo_pairing::cli::report_runner_bootstrap {

struct BootstrapResult {
    config::PipelineConfig config;
    std::unique_ptr<photo_pairing::database::DatabaseManager> db;
    bool db_enabled = false;
};

// Load the YAML config (when given), apply environment overrides, validate,
// set the log level and open the database if one is configured.
BootstrapResult loadConfigAndDatabase(const std::string& config_path, const config::EnvironmentMap& env);

} // namespace photo_pairing::cli::report_runner_bootstrap
