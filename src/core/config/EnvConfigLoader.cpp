#include "EnvConfigLoader.hpp"
#include "src/core/classification/CaptureTime.hpp"
#include "photo_pairing/errors.hpp"
#include "photo_pairing/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace photo_pairing::config {

namespace {

std::string trimCopy(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

int parseInt(const std::string& key, const std::string& raw) {
    const auto value = trimCopy(raw);
    try {
        size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError(key + " must be an integer, got '" + raw + "'");
    }
}

double parseDouble(const std::string& key, const std::string& raw) {
    const auto value = trimCopy(raw);
    try {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError(key + " must be a number, got '" + raw + "'");
    }
}

bool parseBool(const std::string& key, const std::string& raw) {
    const auto value = toLowerCopy(trimCopy(raw));
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off" || value.empty()) return false;
    throw ConfigurationError(key + " must be a boolean, got '" + raw + "'");
}

std::vector<std::string> parseList(const std::string& raw) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= raw.size()) {
        const auto comma = raw.find(',', start);
        const auto end = comma == std::string::npos ? raw.size() : comma;
        const auto item = trimCopy(raw.substr(start, end - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return items;
}

}

    PipelineConfig EnvConfigLoader::load(const EnvironmentMap& env) {
        PipelineConfig config;
        applyOverrides(env, config);
        validate(config);
        return config;
    }

    void EnvConfigLoader::applyOverrides(const EnvironmentMap& env, PipelineConfig& config) {
        auto lookup = [&env](const char* key) -> const std::string* {
            const auto it = env.find(key);
            return it == env.end() ? nullptr : &it->second;
        };

        if (const auto* v = lookup("SAVE_ROOT")) config.storage.save_root = trimCopy(*v);

        if (const auto* v = lookup("TIME_BEFORE_HOUR")) config.classification.before_hour = parseInt("TIME_BEFORE_HOUR", *v);
        if (const auto* v = lookup("TIME_AFTER_HOUR")) config.classification.after_hour = parseInt("TIME_AFTER_HOUR", *v);
        if (const auto* v = lookup("TIME_UTC_OFFSET")) {
            config.classification.utc_offset_minutes = classification::parseUtcOffset(trimCopy(*v));
        }
        if (const auto* v = lookup("CAPTION_HINTS")) config.classification.caption_hints = parseBool("CAPTION_HINTS", *v);
        if (const auto* v = lookup("SITES")) config.classification.sites = parseList(*v);

        if (const auto* v = lookup("FAST_MAX_SIDE")) config.extraction.max_side = parseInt("FAST_MAX_SIDE", *v);
        if (const auto* v = lookup("FAST_NFEATURES")) config.extraction.max_features = parseInt("FAST_NFEATURES", *v);

        if (const auto* v = lookup("FAST_TOPK")) config.matching.top_k = parseInt("FAST_TOPK", *v);
        if (const auto* v = lookup("FAST_RATIO")) config.matching.ratio = static_cast<float>(parseDouble("FAST_RATIO", *v));
        if (const auto* v = lookup("FAST_PREFILTER")) config.matching.prefilter_size = parseInt("FAST_PREFILTER", *v);

        if (const auto* v = lookup("PAIR_MIN_SCORE")) config.selection.min_score = parseDouble("PAIR_MIN_SCORE", *v);
        if (const auto* v = lookup("PAIR_MODE")) {
            try {
                config.selection.mode = selectionModeFromString(toLowerCopy(trimCopy(*v)));
            } catch (const std::runtime_error& e) {
                throw ConfigurationError(std::string("PAIR_MODE: ") + e.what());
            }
        }
        if (const auto* v = lookup("PAIR_ALLOW_SHARED")) config.selection.allow_shared_targets = parseBool("PAIR_ALLOW_SHARED", *v);

        if (const auto* v = lookup("NUM_THREADS")) config.performance.num_threads = parseInt("NUM_THREADS", *v);

        if (const auto* v = lookup("DB_PATH")) {
            config.database.connection_string = trimCopy(*v);
            config.database.enabled = !config.database.connection_string.empty();
        }

        if (const auto* v = lookup("LOG_LEVEL")) config.logging.level = toLowerCopy(trimCopy(*v));
    }

    EnvironmentMap EnvConfigLoader::captureProcessEnvironment() {
        EnvironmentMap env;
        for (const auto& key : recognizedKeys()) {
            if (const char* value = std::getenv(key.c_str())) {
                env[key] = value;
            }
        }
        return env;
    }

    const std::vector<std::string>& EnvConfigLoader::recognizedKeys() {
        static const std::vector<std::string> keys = {
            "SAVE_ROOT",
            "TIME_BEFORE_HOUR", "TIME_AFTER_HOUR", "TIME_UTC_OFFSET", "CAPTION_HINTS", "SITES",
            "FAST_MAX_SIDE", "FAST_NFEATURES",
            "FAST_TOPK", "FAST_RATIO", "FAST_PREFILTER",
            "PAIR_MIN_SCORE", "PAIR_MODE", "PAIR_ALLOW_SHARED",
            "NUM_THREADS",
            "DB_PATH",
            "LOG_LEVEL"
        };
        return keys;
    }

} // namespace photo_pairing::config
