#pragma once

#include "PipelineConfig.hpp"
#include <map>
#include <string>
#include <vector>

namespace photo_pairing::config {

    using EnvironmentMap = std::map<std::string, std::string>;

    /**
     * @brief Builds a PipelineConfig from environment-style KEY=value pairs
     *
     * The loader never reads the process environment itself; callers pass a
     * snapshot (see captureProcessEnvironment) so tests can supply any map.
     */
    class EnvConfigLoader {
    public:
        /**
         * @brief Build and validate a configuration from defaults plus @p env
         * @throws ConfigurationError for missing SAVE_ROOT or unparsable values
         */
        static PipelineConfig load(const EnvironmentMap& env);

        /**
         * @brief Apply recognized keys of @p env on top of @p config
         *
         * Does not validate; load() and the report runner validate afterwards.
         */
        static void applyOverrides(const EnvironmentMap& env, PipelineConfig& config);

        /// Snapshot of the recognized keys present in the process environment.
        static EnvironmentMap captureProcessEnvironment();

        static const std::vector<std::string>& recognizedKeys();
    };

} // namespace photo_pairing::config
