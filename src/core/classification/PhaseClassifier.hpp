#pragma once

#include "photo_pairing/types.hpp"
#include <ctime>
#include <optional>
#include <string>

namespace photo_pairing::classification {

    /**
     * @brief Assigns a Before/After/Rejected phase from the capture time
     *
     * With beforeHour < afterHour, local hour h maps to:
     *   h <  beforeHour           -> BEFORE
     *   h >= afterHour            -> AFTER
     *   beforeHour <= h < after   -> REJECTED
     *
     * Local time uses the configured fixed UTC offset only.
     */
    class PhaseClassifier {
    public:
        /**
         * @throws ConfigurationError if the hour window is invalid
         */
        explicit PhaseClassifier(const ClassificationParams& params);

        Phase classify(std::time_t captured_at) const;

        /**
         * @brief Classify with optional caption hints
         *
         * Hints are only consulted when caption_hints is enabled; otherwise
         * this is identical to classify(captured_at).
         */
        Phase classify(std::time_t captured_at, const std::string& caption) const;

        Phase classifyHour(int hour) const;

        /// BEFORE/AFTER if the caption carries a before or after word.
        static std::optional<Phase> phaseFromCaption(const std::string& caption);

        const ClassificationParams& params() const { return params_; }

    private:
        ClassificationParams params_;
    };

} // namespace photo_pairing::classification
