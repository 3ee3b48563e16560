#pragma once

#include "photo_pairing/types.hpp"
#include <string>
#include <vector>

namespace photo_pairing::pairing {

    /**
     * @brief Resolves ranked candidates into a final Assignment
     *
     * A (before, after) pair is eligible when its score is > 0 and
     * >= min_score, and both photos belong to the group being selected.
     *
     * GREEDY: eligible pairs are taken by score descending, then before
     * path, then after path; a pair is committed when neither photo is
     * already committed (only the before photo when allow_shared_targets
     * is set).
     *
     * OPTIMAL: maximum total score over eligible pairs (Hungarian
     * algorithm). With allow_shared_targets every before photo simply
     * takes its best eligible candidate, which greedy already yields.
     */
    class PairSelector {
    public:
        explicit PairSelector(SelectionParams params);

        /**
         * @param before_paths Every Before-Photo of the group, including failed ones
         * @param after_paths Every After-Photo of the group, including failed ones
         * @param ranked Output of CandidateMatcher, one entry per matched Before-Photo
         */
        Assignment select(const std::vector<std::string>& before_paths,
                          const std::vector<std::string>& after_paths,
                          const std::vector<RankedCandidates>& ranked) const;

        const SelectionParams& params() const { return params_; }

    private:
        std::vector<MatchCandidate> eligiblePairs(const std::vector<std::string>& before_paths,
                                                  const std::vector<std::string>& after_paths,
                                                  const std::vector<RankedCandidates>& ranked) const;

        std::vector<PairedPhotos> selectGreedy(const std::vector<MatchCandidate>& eligible) const;

        std::vector<PairedPhotos> selectOptimal(const std::vector<std::string>& before_paths,
                                                const std::vector<std::string>& after_paths,
                                                const std::vector<MatchCandidate>& eligible) const;

        SelectionParams params_;
    };

    /**
     * @brief Minimum-cost perfect assignment on a square matrix
     * @param cost n x n costs, row-major
     * @return column assigned to each row
     */
    std::vector<int> solveAssignment(const std::vector<std::vector<double>>& cost);

} // namespace photo_pairing::pairing
