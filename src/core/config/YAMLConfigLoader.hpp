#pragma once

#include "PipelineConfig.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace photo_pairing::config {

    /**
     * @brief Loads a PipelineConfig from a YAML file or string
     *
     * Sections mirror the environment keys:
     * storage, classification, extraction, matching, selection,
     * performance, database, logging. Missing sections keep defaults.
     */
    class YAMLConfigLoader {
    public:
        static PipelineConfig loadFromFile(const std::string& yaml_path);
        static PipelineConfig loadFromString(const std::string& yaml_content);

    private:
        static PipelineConfig loadFromYAML(const YAML::Node& root);

        static void parseStorage(const YAML::Node& node, StorageParams& storage);
        static void parseClassification(const YAML::Node& node, ClassificationParams& classification);
        static void parseExtraction(const YAML::Node& node, ExtractionParams& extraction);
        static void parseMatching(const YAML::Node& node, MatchingParams& matching);
        static void parseSelection(const YAML::Node& node, SelectionParams& selection);
        static void parsePerformance(const YAML::Node& node, PerformanceParams& performance);
        static void parseDatabase(const YAML::Node& node, DatabaseParams& database);
        static void parseLogging(const YAML::Node& node, PipelineConfig::Logging& logging);
    };

} // namespace photo_pairing::config
