#include "PhaseClassifier.hpp"
#include "CaptureTime.hpp"
#include "photo_pairing/errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace photo_pairing::classification {

namespace {

const std::array<const char*, 5> kBeforeWords = {"sebelum", "sblm", "sblum", "sebelom", "before"};
const std::array<const char*, 5> kAfterWords = {"selepas", "slps", "slpas", "after", "lepas"};

bool containsAny(const std::string& text, const std::array<const char*, 5>& words) {
    return std::any_of(words.begin(), words.end(),
                       [&text](const char* word) { return text.find(word) != std::string::npos; });
}

}

    PhaseClassifier::PhaseClassifier(const ClassificationParams& params)
        : params_(params) {
        if (params_.before_hour < 0 || params_.before_hour > 23 ||
            params_.after_hour < 0 || params_.after_hour > 23) {
            throw ConfigurationError("phase window hours must be in [0,23] (before=" +
                                     std::to_string(params_.before_hour) + ", after=" +
                                     std::to_string(params_.after_hour) + ")");
        }
        if (params_.before_hour >= params_.after_hour) {
            throw ConfigurationError("TIME_BEFORE_HOUR (" + std::to_string(params_.before_hour) +
                                     ") must be less than TIME_AFTER_HOUR (" +
                                     std::to_string(params_.after_hour) + ")");
        }
    }

    Phase PhaseClassifier::classify(std::time_t captured_at) const {
        const auto local = toLocalDateTime(captured_at, params_.utc_offset_minutes);
        return classifyHour(local.hour);
    }

    Phase PhaseClassifier::classify(std::time_t captured_at, const std::string& caption) const {
        if (params_.caption_hints) {
            if (const auto hinted = phaseFromCaption(caption)) {
                return *hinted;
            }
        }
        return classify(captured_at);
    }

    Phase PhaseClassifier::classifyHour(int hour) const {
        if (hour < params_.before_hour) return Phase::BEFORE;
        if (hour >= params_.after_hour) return Phase::AFTER;
        return Phase::REJECTED;
    }

    std::optional<Phase> PhaseClassifier::phaseFromCaption(const std::string& caption) {
        std::string text = caption;
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        // "before" is checked first, so a caption naming both counts as BEFORE
        if (containsAny(text, kBeforeWords)) return Phase::BEFORE;
        if (containsAny(text, kAfterWords)) return Phase::AFTER;
        return std::nullopt;
    }

} // namespace photo_pairing::classification
