#pragma once

#include "photo_pairing/types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace photo_pairing {

    /**
     * @brief Interface for turning a photo into a bounded FeatureSet
     *
     * Implementations must be safe to call concurrently from several
     * threads and must use one descriptor type and one distance for
     * every extraction.
     */
    class IFeatureExtractor {
    public:
        virtual ~IFeatureExtractor() = default;

        /**
         * @brief Extract features from a decoded image
         * @param image Grayscale or BGR(A) image
         * @param params Downscale bound and feature cap
         * @throws UnreadableImage if @p image is empty
         */
        virtual FeatureSet extract(const cv::Mat& image, const ExtractionParams& params) const = 0;

        /**
         * @brief Decode encoded bytes (JPEG, PNG, ...) and extract
         * @param source Label used in the UnreadableImage message
         * @throws UnreadableImage if the bytes cannot be decoded
         */
        virtual FeatureSet extractFromBytes(const std::vector<unsigned char>& bytes,
                                            const std::string& source,
                                            const ExtractionParams& params) const = 0;

        /**
         * @throws UnreadableImage if the file is missing or cannot be decoded
         */
        virtual FeatureSet extractFromFile(const std::string& path, const ExtractionParams& params) const = 0;

        virtual std::string name() const = 0;

        /// OpenCV norm used to compare this extractor's descriptors.
        virtual int normType() const = 0;
    };

} // namespace photo_pairing
