#include "YAMLConfigLoader.hpp"
#include "src/core/classification/CaptureTime.hpp"
#include "photo_pairing/errors.hpp"
#include "photo_pairing/logging.hpp"

namespace photo_pairing::config {

    PipelineConfig YAMLConfigLoader::loadFromFile(const std::string& yaml_path) {
        try {
            YAML::Node root = YAML::LoadFile(yaml_path);
            return loadFromYAML(root);
        } catch (const YAML::Exception& e) {
            throw ConfigurationError("YAML parsing error in " + yaml_path + ": " + e.what());
        }
    }

    PipelineConfig YAMLConfigLoader::loadFromString(const std::string& yaml_content) {
        try {
            YAML::Node root = YAML::Load(yaml_content);
            return loadFromYAML(root);
        } catch (const YAML::Exception& e) {
            throw ConfigurationError("YAML parsing error: " + std::string(e.what()));
        }
    }

    PipelineConfig YAMLConfigLoader::loadFromYAML(const YAML::Node& root) {
        PipelineConfig config;

        if (root["storage"]) {
            parseStorage(root["storage"], config.storage);
        }

        if (root["classification"]) {
            parseClassification(root["classification"], config.classification);
        }

        if (root["extraction"]) {
            parseExtraction(root["extraction"], config.extraction);
        }

        if (root["matching"]) {
            parseMatching(root["matching"], config.matching);
        }

        if (root["selection"]) {
            parseSelection(root["selection"], config.selection);
        }

        if (root["performance"]) {
            parsePerformance(root["performance"], config.performance);
        }

        if (root["database"]) {
            parseDatabase(root["database"], config.database);
        }

        if (root["logging"]) {
            parseLogging(root["logging"], config.logging);
        }

        validate(config);

        LOG_DEBUG("Loaded YAML configuration (save_root=" + config.storage.save_root + ")");
        return config;
    }

    void YAMLConfigLoader::parseStorage(const YAML::Node& node, StorageParams& storage) {
        if (node["save_root"]) storage.save_root = node["save_root"].as<std::string>();
    }

    void YAMLConfigLoader::parseClassification(const YAML::Node& node, ClassificationParams& classification) {
        if (node["before_hour"]) classification.before_hour = node["before_hour"].as<int>();
        if (node["after_hour"]) classification.after_hour = node["after_hour"].as<int>();
        if (node["utc_offset"]) {
            classification.utc_offset_minutes =
                classification::parseUtcOffset(node["utc_offset"].as<std::string>());
        }
        if (node["caption_hints"]) classification.caption_hints = node["caption_hints"].as<bool>();
        if (node["sites"]) classification.sites = node["sites"].as<std::vector<std::string>>();
    }

    void YAMLConfigLoader::parseExtraction(const YAML::Node& node, ExtractionParams& extraction) {
        if (node["max_side"]) extraction.max_side = node["max_side"].as<int>();
        if (node["max_features"]) extraction.max_features = node["max_features"].as<int>();
    }

    void YAMLConfigLoader::parseMatching(const YAML::Node& node, MatchingParams& matching) {
        if (node["ratio"]) matching.ratio = node["ratio"].as<float>();
        if (node["top_k"]) matching.top_k = node["top_k"].as<int>();
        if (node["prefilter_size"]) matching.prefilter_size = node["prefilter_size"].as<int>();
    }

    void YAMLConfigLoader::parseSelection(const YAML::Node& node, SelectionParams& selection) {
        if (node["mode"]) {
            const auto mode = node["mode"].as<std::string>();
            try {
                selection.mode = selectionModeFromString(mode);
            } catch (const std::runtime_error& e) {
                throw ConfigurationError(std::string("selection.mode: ") + e.what());
            }
        }
        if (node["min_score"]) selection.min_score = node["min_score"].as<double>();
        if (node["allow_shared_targets"]) selection.allow_shared_targets = node["allow_shared_targets"].as<bool>();
    }

    void YAMLConfigLoader::parsePerformance(const YAML::Node& node, PerformanceParams& performance) {
        if (node["num_threads"]) performance.num_threads = node["num_threads"].as<int>();
        if (node["parallel"]) performance.parallel = node["parallel"].as<bool>();
    }

    void YAMLConfigLoader::parseDatabase(const YAML::Node& node, DatabaseParams& database) {
        if (node["connection_string"]) database.connection_string = node["connection_string"].as<std::string>();
        if (node["enabled"]) {
            database.enabled = node["enabled"].as<bool>();
        } else {
            database.enabled = !database.connection_string.empty();
        }
    }

    void YAMLConfigLoader::parseLogging(const YAML::Node& node, PipelineConfig::Logging& logging) {
        if (node["level"]) logging.level = node["level"].as<std::string>();
    }

} // namespace photo_pairing::config
