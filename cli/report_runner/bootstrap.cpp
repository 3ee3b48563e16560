#include "bootstrap.hpp"
#include "src/core/config/YAMLConfigLoader.hpp"
#include "photo_pairing/logging.hpp"

namespace photo_pairing::cli::report_runner_bootstrap {

BootstrapResult loadConfigAndDatabase(const std::string& config_path, const config::EnvironmentMap& env) {
    BootstrapResult result;
    if (config_path.empty()) {
        result.config = config::EnvConfigLoader::load(env);
    } else {
        result.config = config::YAMLConfigLoader::loadFromFile(config_path);
        config::EnvConfigLoader::applyOverrides(env, result.config);
        config::validate(result.config);
    }

    logging::LogLevel level;
    if (logging::levelFromString(result.config.logging.level, level)) {
        logging::setLevel(level);
    }

    auto normalizeDbPath = [](std::string s) {
        if (const std::string prefix = "sqlite:///"; s.rfind(prefix, 0) == 0) {
            return s.substr(prefix.size());
        }
        return s;
    };

    const bool wanted = result.config.database.enabled && !result.config.database.connection_string.empty();
    result.db = std::make_unique<photo_pairing::database::DatabaseManager>(
        normalizeDbPath(result.config.database.connection_string), wanted);
    result.db_enabled = result.db->isEnabled();

    if (result.db_enabled) {
        LOG_INFO("Database tracking enabled");
    } else if (wanted) {
        LOG_WARNING("Database could not be opened, runs will not be recorded");
    } else {
        LOG_INFO("Database tracking disabled");
    }

    for (const auto& [key, value] : config::describe(result.config)) {
        LOG_DEBUG("  " + key + " = " + value);
    }

    return result;
}

} // namespace photo_pairing::cli::report_runner_bootstrap
