#pragma once

#include "interfaces/IFeatureExtractor.hpp"
#include <opencv2/features2d.hpp>

namespace photo_pairing::features {

/**
 * @brief ORB keypoints and 32-byte binary descriptors, compared with Hamming distance
 *
 * The image is decoded as grayscale and downscaled with area interpolation
 * until its longer side is at most max_side. The strongest max_features
 * keypoints by response are kept (ties broken by position) before the
 * descriptors are computed.
 */
class ORBFeatureExtractor final : public IFeatureExtractor {
public:
    /**
     * @param scale_factor Pyramid decimation ratio
     * @param num_levels Number of pyramid levels
     * @param edge_threshold Border where features are not detected
     * @param fast_threshold FAST detection threshold
     */
    explicit ORBFeatureExtractor(
        float scale_factor = 1.2f,
        int num_levels = 8,
        int edge_threshold = 31,
        int fast_threshold = 20
    );

    FeatureSet extract(const cv::Mat& image, const ExtractionParams& params) const override;

    FeatureSet extractFromBytes(const std::vector<unsigned char>& bytes,
                                const std::string& source,
                                const ExtractionParams& params) const override;

    FeatureSet extractFromFile(const std::string& path, const ExtractionParams& params) const override;

    std::string name() const override { return "ORB"; }
    int normType() const override { return cv::NORM_HAMMING; }

    /**
     * @brief Downscale so the longer side is at most @p max_side
     * @return The input itself when no downscaling is needed
     */
    static cv::Mat downscaleToMaxSide(const cv::Mat& gray, int max_side);

    /**
     * @brief Keep the @p max_keypoints strongest keypoints by response
     */
    static std::vector<cv::KeyPoint> applyKeypointLimit(
        std::vector<cv::KeyPoint> keypoints,
        int max_keypoints
    );

private:
    float scale_factor_;
    int num_levels_;
    int edge_threshold_;
    int fast_threshold_;
};

} // namespace photo_pairing::features
