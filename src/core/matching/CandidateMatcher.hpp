#pragma once

#include "RatioTestMatching.hpp"
#include "photo_pairing/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace photo_pairing::matching {

/**
 * @brief An After-Photo offered to the matcher
 */
struct CandidateFeatures {
    std::string path;
    std::shared_ptr<const FeatureSet> features;
};

/**
 * @brief Ranks the After-Photos of a group for one Before-Photo
 *
 * Score = ratio-test matches / min(before size, after size), clamped to
 * [0, 1]. Candidates are ordered by score descending, then by path, and at
 * most top_k are returned. rank() is const and holds no mutable state.
 */
class CandidateMatcher {
public:
    explicit CandidateMatcher(MatchingParams params, int norm_type = cv::NORM_HAMMING);

    RankedCandidates rank(const std::string& before_path,
                          const FeatureSet& before,
                          const std::vector<CandidateFeatures>& candidates) const;

    /// Score a single pair; rank is left at 0.
    MatchCandidate score(const std::string& before_path,
                         const FeatureSet& before,
                         const CandidateFeatures& candidate) const;

    /**
     * @brief The prefilter_size candidates closest by perceptual hash
     *
     * Ties are broken by path. Returns every candidate when the prefilter
     * is disabled or not smaller than the candidate list.
     */
    std::vector<CandidateFeatures> shortlist(const FeatureSet& before,
                                             const std::vector<CandidateFeatures>& candidates) const;

    static double normalizedScore(int match_count, int before_size, int after_size);

    const MatchingParams& params() const { return params_; }

private:
    MatchingParams params_;
    RatioTestMatching strategy_;
};

} // namespace photo_pairing::matching
