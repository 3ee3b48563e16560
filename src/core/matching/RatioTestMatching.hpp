#pragma once

#include "MatchingStrategy.hpp"
#include <opencv2/features2d.hpp>

namespace photo_pairing::matching {

/**
 * @brief Brute-force two-neighbour matching with Lowe's ratio test
 *
 * Each before-photo descriptor is compared against every after-photo
 * descriptor. Its nearest neighbour counts as a confirmed match only when
 * nearest < ratio * second nearest, so repeated texture (grass, tiles,
 * fences) that matches many places equally well is discarded.
 *
 * An after set with fewer than two rows yields no matches.
 */
class RatioTestMatching : public MatchingStrategy {
public:
    /**
     * @param ratio Acceptance ratio in (0, 1); anything else falls back to 0.75
     * @param normType NORM_HAMMING for ORB descriptors
     */
    explicit RatioTestMatching(float ratio = 0.75f, int normType = cv::NORM_HAMMING);

    std::vector<cv::DMatch> matchDescriptors(const cv::Mat& queryDescriptors,
                                             const cv::Mat& trainDescriptors) const override;

    std::string getName() const override { return "RatioTest"; }
    bool supportsRatioTest() const override { return true; }

    float getRatioThreshold() const { return ratio_; }
    int getNormType() const { return normType_; }

private:
    float ratio_;
    int normType_;
    cv::BFMatcher matcher_;
};

} // namespace photo_pairing::matching
