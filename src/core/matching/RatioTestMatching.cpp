#include "RatioTestMatching.hpp"
#include "photo_pairing/logging.hpp"

namespace photo_pairing::matching {

namespace {

constexpr float kDefaultRatio = 0.75f;

}

RatioTestMatching::RatioTestMatching(float ratio, int normType)
    : ratio_(ratio), normType_(normType), matcher_(normType, false) {
    if (!(ratio > 0.0f && ratio < 1.0f)) {
        LOG_WARNING("Ratio must be in (0,1), got " + std::to_string(ratio) + "; using 0.75");
        ratio_ = kDefaultRatio;
    }
}

std::vector<cv::DMatch> RatioTestMatching::matchDescriptors(const cv::Mat& queryDescriptors,
                                                            const cv::Mat& trainDescriptors) const {
    std::vector<cv::DMatch> confirmed;
    if (queryDescriptors.empty() || trainDescriptors.rows < 2) {
        return confirmed;
    }

    std::vector<std::vector<cv::DMatch>> neighbours;
    matcher_.knnMatch(queryDescriptors, trainDescriptors, neighbours, 2);

    confirmed.reserve(neighbours.size() / 2);
    for (const auto& pair : neighbours) {
        if (pair.size() < 2) {
            continue;
        }
        // Strict inequality: equal distances (including two zeros) are ambiguous
        if (pair[0].distance < ratio_ * pair[1].distance) {
            confirmed.push_back(pair[0]);
        }
    }
    return confirmed;
}

} // namespace photo_pairing::matching
