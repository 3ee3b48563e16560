#include "PairSelector.hpp"
#include "photo_pairing/logging.hpp"
#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>

namespace photo_pairing::pairing {

namespace {

PairedPhotos toPair(const MatchCandidate& candidate) {
    PairedPhotos pair;
    pair.before_path = candidate.before_path;
    pair.after_path = candidate.after_path;
    pair.score = candidate.score;
    pair.match_count = candidate.match_count;
    return pair;
}

}

    PairSelector::PairSelector(SelectionParams params)
        : params_(params) {
        if (params_.min_score < 0.0 || params_.min_score > 1.0) {
            throw std::invalid_argument("min_score must be in [0,1]");
        }
    }

    std::vector<MatchCandidate> PairSelector::eligiblePairs(const std::vector<std::string>& before_paths,
                                                            const std::vector<std::string>& after_paths,
                                                            const std::vector<RankedCandidates>& ranked) const {
        const std::set<std::string> befores(before_paths.begin(), before_paths.end());
        const std::set<std::string> afters(after_paths.begin(), after_paths.end());

        // Best score per (before, after); duplicates keep the higher score
        std::map<std::pair<std::string, std::string>, MatchCandidate> best;
        for (const auto& entry : ranked) {
            if (befores.count(entry.before_path) == 0) {
                LOG_WARNING("Ignoring candidates of " + entry.before_path + ": not in this group");
                continue;
            }
            for (const auto& candidate : entry.candidates) {
                if (afters.count(candidate.after_path) == 0) {
                    continue;
                }
                if (candidate.score <= 0.0 || candidate.score < params_.min_score) {
                    continue;
                }
                MatchCandidate normalized = candidate;
                normalized.before_path = entry.before_path;
                const auto key = std::make_pair(normalized.before_path, normalized.after_path);
                const auto it = best.find(key);
                if (it == best.end() || it->second.score < normalized.score) {
                    best[key] = normalized;
                }
            }
        }

        std::vector<MatchCandidate> eligible;
        eligible.reserve(best.size());
        for (auto& entry : best) {
            eligible.push_back(std::move(entry.second));
        }
        return eligible;
    }

    std::vector<PairedPhotos> PairSelector::selectGreedy(const std::vector<MatchCandidate>& eligible) const {
        std::vector<MatchCandidate> ordered = eligible;
        std::sort(ordered.begin(), ordered.end(),
                  [](const MatchCandidate& a, const MatchCandidate& b) {
                      if (a.score != b.score) return a.score > b.score;
                      if (a.before_path != b.before_path) return a.before_path < b.before_path;
                      return a.after_path < b.after_path;
                  });

        std::set<std::string> used_before;
        std::set<std::string> used_after;
        std::vector<PairedPhotos> pairs;

        for (const auto& candidate : ordered) {
            if (used_before.count(candidate.before_path) > 0) {
                continue;
            }
            if (!params_.allow_shared_targets && used_after.count(candidate.after_path) > 0) {
                continue;
            }
            used_before.insert(candidate.before_path);
            used_after.insert(candidate.after_path);
            pairs.push_back(toPair(candidate));
        }
        return pairs;
    }

    std::vector<PairedPhotos> PairSelector::selectOptimal(const std::vector<std::string>& before_paths,
                                                          const std::vector<std::string>& after_paths,
                                                          const std::vector<MatchCandidate>& eligible) const {
        if (eligible.empty()) {
            return {};
        }

        std::vector<std::string> rows(before_paths.begin(), before_paths.end());
        std::vector<std::string> cols(after_paths.begin(), after_paths.end());
        std::sort(rows.begin(), rows.end());
        rows.erase(std::unique(rows.begin(), rows.end()), rows.end());
        std::sort(cols.begin(), cols.end());
        cols.erase(std::unique(cols.begin(), cols.end()), cols.end());

        std::map<std::string, size_t> row_index;
        std::map<std::string, size_t> col_index;
        for (size_t i = 0; i < rows.size(); ++i) row_index[rows[i]] = i;
        for (size_t j = 0; j < cols.size(); ++j) col_index[cols[j]] = j;

        // Square matrix; ineligible cells cost 0 and are dropped afterwards
        const size_t n = std::max(rows.size(), cols.size());
        std::vector<std::vector<double>> cost(n, std::vector<double>(n, 0.0));
        std::vector<std::vector<const MatchCandidate*>> cell(n, std::vector<const MatchCandidate*>(n, nullptr));
        for (const auto& candidate : eligible) {
            const size_t i = row_index.at(candidate.before_path);
            const size_t j = col_index.at(candidate.after_path);
            cost[i][j] = -candidate.score;
            cell[i][j] = &candidate;
        }

        const auto assignment = solveAssignment(cost);

        std::vector<PairedPhotos> pairs;
        for (size_t i = 0; i < rows.size(); ++i) {
            const int j = assignment[i];
            if (j < 0 || static_cast<size_t>(j) >= cols.size()) {
                continue;
            }
            if (const MatchCandidate* chosen = cell[i][static_cast<size_t>(j)]) {
                pairs.push_back(toPair(*chosen));
            }
        }
        return pairs;
    }

    Assignment PairSelector::select(const std::vector<std::string>& before_paths,
                                    const std::vector<std::string>& after_paths,
                                    const std::vector<RankedCandidates>& ranked) const {
        const auto eligible = eligiblePairs(before_paths, after_paths, ranked);

        Assignment assignment;
        if (params_.mode == SelectionMode::OPTIMAL && !params_.allow_shared_targets) {
            assignment.pairs = selectOptimal(before_paths, after_paths, eligible);
        } else {
            assignment.pairs = selectGreedy(eligible);
        }

        std::sort(assignment.pairs.begin(), assignment.pairs.end(),
                  [](const PairedPhotos& a, const PairedPhotos& b) { return a.before_path < b.before_path; });

        std::set<std::string> paired_before;
        std::set<std::string> paired_after;
        for (const auto& pair : assignment.pairs) {
            paired_before.insert(pair.before_path);
            paired_after.insert(pair.after_path);
        }

        const std::set<std::string> all_before(before_paths.begin(), before_paths.end());
        const std::set<std::string> all_after(after_paths.begin(), after_paths.end());
        for (const auto& path : all_before) {
            if (paired_before.count(path) == 0) assignment.unmatched_before.push_back(path);
        }
        for (const auto& path : all_after) {
            if (paired_after.count(path) == 0) assignment.unmatched_after.push_back(path);
        }

        LOG_INFO("Selected " + std::to_string(assignment.pairs.size()) + " pairs (" + toString(params_.mode) +
                 "), unmatched before=" + std::to_string(assignment.unmatched_before.size()) +
                 " after=" + std::to_string(assignment.unmatched_after.size()));
        return assignment;
    }

    std::vector<int> solveAssignment(const std::vector<std::vector<double>>& cost) {
        const size_t n = cost.size();
        if (n == 0) {
            return {};
        }
        for (const auto& row : cost) {
            if (row.size() != n) {
                throw std::invalid_argument("assignment cost matrix must be square");
            }
        }

        // Potentials method, 1-based with column 0 as the sentinel
        const double inf = std::numeric_limits<double>::infinity();
        std::vector<double> u(n + 1, 0.0), v(n + 1, 0.0);
        std::vector<size_t> p(n + 1, 0), way(n + 1, 0);

        for (size_t i = 1; i <= n; ++i) {
            p[0] = i;
            size_t j0 = 0;
            std::vector<double> minv(n + 1, inf);
            std::vector<bool> used(n + 1, false);
            do {
                used[j0] = true;
                const size_t i0 = p[j0];
                double delta = inf;
                size_t j1 = 0;
                for (size_t j = 1; j <= n; ++j) {
                    if (used[j]) {
                        continue;
                    }
                    const double current = cost[i0 - 1][j - 1] - u[i0] - v[j];
                    if (current < minv[j]) {
                        minv[j] = current;
                        way[j] = j0;
                    }
                    if (minv[j] < delta) {
                        delta = minv[j];
                        j1 = j;
                    }
                }
                for (size_t j = 0; j <= n; ++j) {
                    if (used[j]) {
                        u[p[j]] += delta;
                        v[j] -= delta;
                    } else {
                        minv[j] -= delta;
                    }
                }
                j0 = j1;
            } while (p[j0] != 0);

            do {
                const size_t j1 = way[j0];
                p[j0] = p[j1];
                j0 = j1;
            } while (j0 != 0);
        }

        std::vector<int> assignment(n, -1);
        for (size_t j = 1; j <= n; ++j) {
            if (p[j] != 0) {
                assignment[p[j] - 1] = static_cast<int>(j - 1);
            }
        }
        return assignment;
    }

} // namespace photo_pairing::pairing
