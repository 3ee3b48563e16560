#pragma once

#include "photo_pairing/types.hpp"
#include <map>
#include <string>

namespace photo_pairing::config {

    /**
     * @brief Immutable configuration value threaded into every component
     *
     * Built once by EnvConfigLoader or YAMLConfigLoader and passed by const
     * reference; nothing in the core reads process state.
     */
    struct PipelineConfig {
        StorageParams storage;
        ClassificationParams classification;
        ExtractionParams extraction;
        MatchingParams matching;
        SelectionParams selection;
        PerformanceParams performance;
        DatabaseParams database;

        struct Logging {
            std::string level = "info";
        } logging;
    };

    /**
     * @brief Reject configurations the pipeline cannot run with
     * @throws ConfigurationError naming the first offending key
     */
    void validate(const PipelineConfig& config);

    /**
     * @brief Flatten the tuning knobs for logging and run records
     */
    std::map<std::string, std::string> describe(const PipelineConfig& config);

    /**
     * @brief Format an offset in minutes as "+HH:MM"/"-HH:MM"
     */
    std::string formatUtcOffset(int minutes);

} // namespace photo_pairing::config
