#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace photo_pairing {

    // ================================
    // ENUMS
    // ================================

    /**
     * @brief Time-of-day phase of an inspection photo
     */
    enum class Phase {
        BEFORE,                ///< Captured before the before-hour boundary
        AFTER,                 ///< Captured at or after the after-hour boundary
        REJECTED               ///< Captured inside the mid-day gap
    };

    /**
     * @brief How ranked candidates are resolved into an assignment
     */
    enum class SelectionMode {
        GREEDY,                ///< Highest score first, one-to-one (default)
        OPTIMAL                ///< Maximum total score (Hungarian), slower
    };

    /**
     * @brief Completion state of a report build
     */
    enum class ReportStatus {
        COMPLETE,              ///< Every photo was processed
        PARTIAL,               ///< Finished, but some photos failed
        CANCELLED,             ///< Caller cancelled before the build finished
        TIMED_OUT              ///< Deadline expired before the build finished
    };

    /**
     * @brief Per-photo failure kinds collected during a run
     */
    enum class FailureKind {
        UNREADABLE_IMAGE,
        STORAGE_FAILURE
    };

    // ================================
    // STRING CONVERSION FUNCTIONS
    // ================================

    inline std::string toString(Phase phase) {
        switch (phase) {
            case Phase::BEFORE: return "before";
            case Phase::AFTER: return "after";
            case Phase::REJECTED: return "rejected";
            default: return "unknown";
        }
    }

    inline std::string toString(SelectionMode mode) {
        switch (mode) {
            case SelectionMode::GREEDY: return "greedy";
            case SelectionMode::OPTIMAL: return "optimal";
            default: return "unknown";
        }
    }

    inline std::string toString(ReportStatus status) {
        switch (status) {
            case ReportStatus::COMPLETE: return "complete";
            case ReportStatus::PARTIAL: return "partial";
            case ReportStatus::CANCELLED: return "cancelled";
            case ReportStatus::TIMED_OUT: return "timed_out";
            default: return "unknown";
        }
    }

    inline std::string toString(FailureKind kind) {
        switch (kind) {
            case FailureKind::UNREADABLE_IMAGE: return "unreadable_image";
            case FailureKind::STORAGE_FAILURE: return "storage_failure";
            default: return "unknown";
        }
    }

    inline Phase phaseFromString(const std::string& str) {
        if (str == "before") return Phase::BEFORE;
        if (str == "after") return Phase::AFTER;
        if (str == "rejected") return Phase::REJECTED;
        throw std::runtime_error("Unknown phase: " + str);
    }

    inline SelectionMode selectionModeFromString(const std::string& str) {
        if (str == "greedy") return SelectionMode::GREEDY;
        if (str == "optimal" || str == "hungarian") return SelectionMode::OPTIMAL;
        throw std::runtime_error("Unknown selection mode: " + str);
    }

    // ================================
    // PARAMETER STRUCTURES
    // ================================

    struct StorageParams {
        std::string save_root;              // root of <YYYY>-<MM>/<site>/<task>/<phase>/
    };

    struct ClassificationParams {
        int before_hour = 12;               // hour < before_hour -> BEFORE
        int after_hour = 15;                // hour >= after_hour -> AFTER
        int utc_offset_minutes = 0;         // fixed offset used for every timestamp
        bool caption_hints = false;         // let before/after words in captions override the window
        std::vector<std::string> sites;     // extra sites beyond ALPHA..ECHO, "NAME" or "NAME:shortcut"
    };

    struct ExtractionParams {
        int max_side = 1600;                // longer image side after downscaling
        int max_features = 600;             // keypoint cap per photo
    };

    struct MatchingParams {
        float ratio = 0.75f;                // nearest < ratio * second nearest
        int top_k = 5;                      // candidates kept per before photo
        int prefilter_size = 0;             // perceptual-hash shortlist size, 0 = disabled
    };

    struct SelectionParams {
        SelectionMode mode = SelectionMode::GREEDY;
        double min_score = 0.0;             // pairs below this score are never committed
        bool allow_shared_targets = false;  // permit one after photo for several before photos
    };

    struct PerformanceParams {
        int num_threads = 0;                // 0 = all available cores
        bool parallel = true;               // OpenMP loops for extraction and matching
    };

    struct DatabaseParams {
        std::string connection_string;      // empty = no tracking
        bool enabled = false;
    };

    // ================================
    // DATA MODEL
    // ================================

    /**
     * @brief Stable identity of a stored photo file
     *
     * The modification token and size change whenever the file content is
     * replaced, so cached features keyed by identity are invalidated.
     */
    struct PhotoIdentity {
        std::string path;
        std::int64_t modified_token = 0;
        std::uintmax_t size = 0;

        bool operator==(const PhotoIdentity& other) const {
            return path == other.path && modified_token == other.modified_token && size == other.size;
        }

        bool operator<(const PhotoIdentity& other) const {
            if (path != other.path) return path < other.path;
            if (modified_token != other.modified_token) return modified_token < other.modified_token;
            return size < other.size;
        }
    };

    struct Photo {
        PhotoIdentity identity;
        std::string site;
        std::string task;
        std::string month;                  // "YYYY-MM"
        std::time_t captured_at = 0;        // 0 when unknown
        Phase phase = Phase::REJECTED;
    };

    /**
     * @brief Upload tuple handed over by the messaging adapter
     */
    struct PhotoSubmission {
        std::vector<unsigned char> bytes;
        std::time_t captured_at = 0;        // UTC seconds
        std::string site;                   // empty = detect from caption
        std::string task;                   // empty = infer from caption
        std::string caption;
        std::string original_name;
    };

    /**
     * @brief Keypoints and ORB descriptors of one photo
     */
    struct FeatureSet {
        std::vector<cv::KeyPoint> keypoints;
        cv::Mat descriptors;                // one CV_8U row per keypoint
        double scale_factor = 1.0;          // original long side / processing long side
        cv::Size processing_size;
        std::uint64_t perceptual_hash = 0;

        int size() const { return descriptors.rows; }
        bool empty() const { return descriptors.empty(); }
    };

    struct MatchCandidate {
        std::string before_path;
        std::string after_path;
        int match_count = 0;                // descriptors passing the ratio test
        double score = 0.0;                 // match_count / min(set sizes), in [0, 1]
        int rank = 0;                       // 0 = best candidate of this before photo
    };

    struct RankedCandidates {
        std::string before_path;
        std::vector<MatchCandidate> candidates;
    };

    struct PairedPhotos {
        std::string before_path;
        std::string after_path;
        double score = 0.0;
        int match_count = 0;
    };

    /**
     * @brief Final before/after pairing of one group
     *
     * Pairs are ordered by before path; unmatched lists are sorted.
     */
    struct Assignment {
        std::vector<PairedPhotos> pairs;
        std::vector<std::string> unmatched_before;
        std::vector<std::string> unmatched_after;

        std::optional<std::string> targetOf(const std::string& before_path) const {
            for (const auto& pair : pairs) {
                if (pair.before_path == before_path) {
                    return pair.after_path;
                }
            }
            return std::nullopt;
        }

        bool operator==(const Assignment& other) const {
            if (pairs.size() != other.pairs.size()) return false;
            for (size_t i = 0; i < pairs.size(); ++i) {
                const auto& a = pairs[i];
                const auto& b = other.pairs[i];
                if (a.before_path != b.before_path || a.after_path != b.after_path ||
                    a.score != b.score || a.match_count != b.match_count) {
                    return false;
                }
            }
            return unmatched_before == other.unmatched_before &&
                   unmatched_after == other.unmatched_after;
        }
    };

    struct PhotoFailure {
        std::string path;
        FailureKind kind = FailureKind::UNREADABLE_IMAGE;
        std::string message;
    };

} // namespace photo_pairing
