#pragma once

#include <opencv2/core.hpp>
#include <cstdint>

namespace photo_pairing::features {

/**
 * @brief 64-bit DCT perceptual hash of a grayscale image
 *
 * The image is reduced to 32x32, transformed with a 2D DCT, and the 8x8
 * lowest frequencies are thresholded at their median.
 */
std::uint64_t perceptualHash(const cv::Mat& gray);

int hammingDistance(std::uint64_t a, std::uint64_t b);

} // namespace photo_pairing::features
