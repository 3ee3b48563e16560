#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace photo_pairing::matching {

/**
 * @brief Abstract descriptor matching strategy
 *
 * matchDescriptors() must not modify shared state, so one strategy can
 * serve several threads.
 */
class MatchingStrategy {
public:
    virtual ~MatchingStrategy() = default;

    /**
     * @brief Match query descriptors against train descriptors
     * @param queryDescriptors One row per keypoint of the photo being matched
     * @param trainDescriptors Rows of the candidate photo
     * @return Accepted matches, at most one per query row
     */
    virtual std::vector<cv::DMatch> matchDescriptors(
        const cv::Mat& queryDescriptors,
        const cv::Mat& trainDescriptors
    ) const = 0;

    virtual std::string getName() const = 0;

    virtual bool supportsRatioTest() const = 0;
};

} // namespace photo_pairing::matching
