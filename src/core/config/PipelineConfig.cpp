#include "PipelineConfig.hpp"
#include "photo_pairing/errors.hpp"
#include "photo_pairing/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace photo_pairing::config {

namespace {

constexpr int kMaxUtcOffsetMinutes = 14 * 60;

std::string formatDouble(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

bool isSiteWord(const std::string& word) {
    return !word.empty() && std::all_of(word.begin(), word.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

// "NAME" or "NAME:shortcut"
bool isSiteEntry(const std::string& entry) {
    const auto colon = entry.find(':');
    if (colon == std::string::npos) {
        return isSiteWord(entry);
    }
    return isSiteWord(entry.substr(0, colon)) && isSiteWord(entry.substr(colon + 1));
}

std::string joinList(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) joined += ",";
        joined += item;
    }
    return joined;
}

}

void validate(const PipelineConfig& config) {
    if (config.storage.save_root.empty()) {
        throw ConfigurationError("SAVE_ROOT is required");
    }

    const auto& cls = config.classification;
    if (cls.before_hour < 0 || cls.before_hour > 23) {
        throw ConfigurationError("TIME_BEFORE_HOUR must be in [0,23], got " + std::to_string(cls.before_hour));
    }
    if (cls.after_hour < 0 || cls.after_hour > 23) {
        throw ConfigurationError("TIME_AFTER_HOUR must be in [0,23], got " + std::to_string(cls.after_hour));
    }
    if (cls.before_hour == cls.after_hour) {
        throw ConfigurationError("TIME_BEFORE_HOUR and TIME_AFTER_HOUR must differ (both " +
                                 std::to_string(cls.before_hour) + ")");
    }
    if (cls.before_hour > cls.after_hour) {
        throw ConfigurationError("TIME_BEFORE_HOUR (" + std::to_string(cls.before_hour) +
                                 ") must be less than TIME_AFTER_HOUR (" + std::to_string(cls.after_hour) + ")");
    }
    if (std::abs(cls.utc_offset_minutes) > kMaxUtcOffsetMinutes) {
        throw ConfigurationError("TIME_UTC_OFFSET must be within +/-14:00");
    }
    for (const auto& entry : cls.sites) {
        if (!isSiteEntry(entry)) {
            throw ConfigurationError("SITES entries must be NAME or NAME:shortcut using letters, digits, _ or -, got '" +
                                     entry + "'");
        }
    }

    if (config.extraction.max_side <= 0) {
        throw ConfigurationError("FAST_MAX_SIDE must be > 0");
    }
    if (config.extraction.max_features <= 0) {
        throw ConfigurationError("FAST_NFEATURES must be > 0");
    }

    if (config.matching.ratio <= 0.0f || config.matching.ratio >= 1.0f) {
        throw ConfigurationError("FAST_RATIO must be in (0,1), got " + formatDouble(config.matching.ratio));
    }
    if (config.matching.top_k < 1) {
        throw ConfigurationError("FAST_TOPK must be >= 1");
    }
    if (config.matching.prefilter_size < 0) {
        throw ConfigurationError("FAST_PREFILTER must be >= 0");
    }

    if (config.selection.min_score < 0.0 || config.selection.min_score > 1.0) {
        throw ConfigurationError("PAIR_MIN_SCORE must be in [0,1], got " + formatDouble(config.selection.min_score));
    }

    if (config.performance.num_threads < 0) {
        throw ConfigurationError("NUM_THREADS must be >= 0");
    }

    logging::LogLevel level;
    if (!logging::levelFromString(config.logging.level, level)) {
        throw ConfigurationError("LOG_LEVEL must be one of debug|info|warning|error, got " + config.logging.level);
    }

    if (config.matching.prefilter_size > 0 && config.matching.prefilter_size < config.matching.top_k) {
        LOG_WARNING("FAST_PREFILTER (" + std::to_string(config.matching.prefilter_size) +
                    ") is smaller than FAST_TOPK (" + std::to_string(config.matching.top_k) +
                    ") - at most " + std::to_string(config.matching.prefilter_size) + " candidates will be ranked");
    }
}

std::map<std::string, std::string> describe(const PipelineConfig& config) {
    return {
        {"save_root", config.storage.save_root},
        {"before_hour", std::to_string(config.classification.before_hour)},
        {"after_hour", std::to_string(config.classification.after_hour)},
        {"utc_offset", formatUtcOffset(config.classification.utc_offset_minutes)},
        {"caption_hints", config.classification.caption_hints ? "true" : "false"},
        {"sites", joinList(config.classification.sites)},
        {"max_side", std::to_string(config.extraction.max_side)},
        {"max_features", std::to_string(config.extraction.max_features)},
        {"ratio", formatDouble(config.matching.ratio)},
        {"top_k", std::to_string(config.matching.top_k)},
        {"prefilter_size", std::to_string(config.matching.prefilter_size)},
        {"selection_mode", toString(config.selection.mode)},
        {"min_score", formatDouble(config.selection.min_score)},
        {"allow_shared_targets", config.selection.allow_shared_targets ? "true" : "false"},
        {"num_threads", std::to_string(config.performance.num_threads)}
    };
}

std::string formatUtcOffset(int minutes) {
    const char sign = minutes < 0 ? '-' : '+';
    const int magnitude = std::abs(minutes);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%c%02d:%02d", sign, magnitude / 60, magnitude % 60);
    return buffer;
}

} // namespace photo_pairing::config
