#include "ORBFeatureExtractor.hpp"
#include "PerceptualHash.hpp"
#include "photo_pairing/errors.hpp"
#include "photo_pairing/logging.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>

namespace photo_pairing::features {

ORBFeatureExtractor::ORBFeatureExtractor(float scale_factor, int num_levels, int edge_threshold, int fast_threshold)
    : scale_factor_(scale_factor),
      num_levels_(num_levels),
      edge_threshold_(edge_threshold),
      fast_threshold_(fast_threshold) {}

FeatureSet ORBFeatureExtractor::extract(const cv::Mat& image, const ExtractionParams& params) const {
    if (image.empty()) {
        throw UnreadableImage("<image>", "empty image");
    }

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image;
    }

    FeatureSet features;
    const int long_side = std::max(gray.cols, gray.rows);
    cv::Mat processed = downscaleToMaxSide(gray, params.max_side);
    features.processing_size = processed.size();
    features.scale_factor = static_cast<double>(long_side) / std::max(processed.cols, processed.rows);
    features.perceptual_hash = perceptualHash(processed);

    // cv::ORB instances are never shared between threads
    auto orb = cv::ORB::create(params.max_features, scale_factor_, num_levels_, edge_threshold_,
                               0, 2, cv::ORB::HARRIS_SCORE, 31, fast_threshold_);

    std::vector<cv::KeyPoint> keypoints;
    orb->detect(processed, keypoints);
    keypoints = applyKeypointLimit(std::move(keypoints), params.max_features);

    if (!keypoints.empty()) {
        orb->compute(processed, keypoints, features.descriptors);
    }
    // compute() drops keypoints it cannot describe, so both stay parallel
    features.keypoints = std::move(keypoints);

    LOG_DEBUG("ORB extracted " + std::to_string(features.size()) + " descriptors at " +
              std::to_string(processed.cols) + "x" + std::to_string(processed.rows));
    return features;
}

FeatureSet ORBFeatureExtractor::extractFromBytes(const std::vector<unsigned char>& bytes,
                                                 const std::string& source,
                                                 const ExtractionParams& params) const {
    if (bytes.empty()) {
        throw UnreadableImage(source, "no data");
    }

    cv::Mat gray;
    try {
        gray = cv::imdecode(bytes, cv::IMREAD_GRAYSCALE);
    } catch (const cv::Exception& e) {
        throw UnreadableImage(source, e.what());
    }
    if (gray.empty()) {
        throw UnreadableImage(source, "cannot decode image data");
    }
    return extract(gray, params);
}

FeatureSet ORBFeatureExtractor::extractFromFile(const std::string& path, const ExtractionParams& params) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw UnreadableImage(path, "file not found");
    }

    cv::Mat gray;
    try {
        gray = cv::imread(path, cv::IMREAD_GRAYSCALE);
    } catch (const cv::Exception& e) {
        throw UnreadableImage(path, e.what());
    }
    if (gray.empty()) {
        throw UnreadableImage(path, "cannot decode image file");
    }
    return extract(gray, params);
}

cv::Mat ORBFeatureExtractor::downscaleToMaxSide(const cv::Mat& gray, int max_side) {
    const int long_side = std::max(gray.cols, gray.rows);
    if (max_side <= 0 || long_side <= max_side) {
        return gray;
    }

    const double scale = static_cast<double>(max_side) / long_side;
    cv::Size target;
    if (gray.cols >= gray.rows) {
        target.width = max_side;
        target.height = std::max(1, static_cast<int>(std::lround(gray.rows * scale)));
    } else {
        target.height = max_side;
        target.width = std::max(1, static_cast<int>(std::lround(gray.cols * scale)));
    }

    cv::Mat resized;
    cv::resize(gray, resized, target, 0, 0, cv::INTER_AREA);
    return resized;
}

std::vector<cv::KeyPoint> ORBFeatureExtractor::applyKeypointLimit(
    std::vector<cv::KeyPoint> keypoints,
    int max_keypoints
) {
    // Sort by response strength (descending), then by position
    std::sort(keypoints.begin(), keypoints.end(),
        [](const cv::KeyPoint& a, const cv::KeyPoint& b) {
            if (a.response != b.response) return a.response > b.response;
            if (a.pt.y != b.pt.y) return a.pt.y < b.pt.y;
            if (a.pt.x != b.pt.x) return a.pt.x < b.pt.x;
            return a.size < b.size;
        });

    if (max_keypoints >= 0 && keypoints.size() > static_cast<size_t>(max_keypoints)) {
        keypoints.resize(static_cast<size_t>(max_keypoints));
    }
    return keypoints;
}

} // namespace photo_pairing::features
