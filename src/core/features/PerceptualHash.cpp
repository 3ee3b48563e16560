#include "PerceptualHash.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <bitset>
#include <vector>

namespace photo_pairing::features {

std::uint64_t perceptualHash(const cv::Mat& gray) {
    if (gray.empty()) {
        return 0;
    }

    cv::Mat small;
    cv::resize(gray, small, cv::Size(32, 32), 0, 0, cv::INTER_AREA);

    cv::Mat floating;
    small.convertTo(floating, CV_32F);

    cv::Mat frequencies;
    cv::dct(floating, frequencies);

    std::vector<float> low;
    low.reserve(64);
    for (int y = 0; y < 8; ++y) {
        for (int x = 0; x < 8; ++x) {
            low.push_back(frequencies.at<float>(y, x));
        }
    }

    std::vector<float> sorted = low;
    std::nth_element(sorted.begin(), sorted.begin() + 32, sorted.end());
    const float upper = sorted[32];
    const float lower = *std::max_element(sorted.begin(), sorted.begin() + 32);
    const float median = 0.5f * (lower + upper);

    std::uint64_t hash = 0;
    for (size_t i = 0; i < low.size(); ++i) {
        if (low[i] > median) {
            hash |= (std::uint64_t{1} << i);
        }
    }
    return hash;
}

int hammingDistance(std::uint64_t a, std::uint64_t b) {
    return static_cast<int>(std::bitset<64>(a ^ b).count());
}

} // namespace photo_pairing::features
