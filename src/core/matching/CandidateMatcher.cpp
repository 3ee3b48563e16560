#include "CandidateMatcher.hpp"
#include "src/core/features/PerceptualHash.hpp"
#include "photo_pairing/logging.hpp"
#include <algorithm>

namespace photo_pairing::matching {

CandidateMatcher::CandidateMatcher(MatchingParams params, int norm_type)
    : params_(params),
      strategy_(params.ratio, norm_type) {}

double CandidateMatcher::normalizedScore(int match_count, int before_size, int after_size) {
    const int denominator = std::min(before_size, after_size);
    if (denominator <= 0 || match_count <= 0) {
        return 0.0;
    }
    return std::min(1.0, static_cast<double>(match_count) / denominator);
}

MatchCandidate CandidateMatcher::score(const std::string& before_path,
                                       const FeatureSet& before,
                                       const CandidateFeatures& candidate) const {
    MatchCandidate result;
    result.before_path = before_path;
    result.after_path = candidate.path;

    if (!candidate.features || before.empty() || candidate.features->empty()) {
        return result;
    }

    const auto matches = strategy_.matchDescriptors(before.descriptors, candidate.features->descriptors);
    result.match_count = static_cast<int>(matches.size());
    result.score = normalizedScore(result.match_count, before.size(), candidate.features->size());
    return result;
}

std::vector<CandidateFeatures> CandidateMatcher::shortlist(const FeatureSet& before,
                                                           const std::vector<CandidateFeatures>& candidates) const {
    const int limit = params_.prefilter_size;
    if (limit <= 0 || static_cast<size_t>(limit) >= candidates.size()) {
        return candidates;
    }

    std::vector<std::pair<int, const CandidateFeatures*>> distances;
    distances.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        if (!candidate.features) {
            continue;
        }
        distances.emplace_back(features::hammingDistance(before.perceptual_hash, candidate.features->perceptual_hash),
                               &candidate);
    }

    std::sort(distances.begin(), distances.end(),
              [](const auto& a, const auto& b) {
                  if (a.first != b.first) return a.first < b.first;
                  return a.second->path < b.second->path;
              });

    std::vector<CandidateFeatures> kept;
    kept.reserve(static_cast<size_t>(limit));
    for (size_t i = 0; i < distances.size() && i < static_cast<size_t>(limit); ++i) {
        kept.push_back(*distances[i].second);
    }
    return kept;
}

RankedCandidates CandidateMatcher::rank(const std::string& before_path,
                                        const FeatureSet& before,
                                        const std::vector<CandidateFeatures>& candidates) const {
    RankedCandidates ranked;
    ranked.before_path = before_path;

    const auto pool = shortlist(before, candidates);
    ranked.candidates.reserve(pool.size());
    for (const auto& candidate : pool) {
        if (!candidate.features) {
            continue;
        }
        ranked.candidates.push_back(score(before_path, before, candidate));
    }

    std::sort(ranked.candidates.begin(), ranked.candidates.end(),
              [](const MatchCandidate& a, const MatchCandidate& b) {
                  if (a.score != b.score) return a.score > b.score;
                  return a.after_path < b.after_path;
              });

    if (params_.top_k > 0 && ranked.candidates.size() > static_cast<size_t>(params_.top_k)) {
        ranked.candidates.resize(static_cast<size_t>(params_.top_k));
    }
    for (size_t i = 0; i < ranked.candidates.size(); ++i) {
        ranked.candidates[i].rank = static_cast<int>(i);
    }

    if (!ranked.candidates.empty()) {
        LOG_DEBUG(before_path + " best candidate " + ranked.candidates.front().after_path +
                  " score " + std::to_string(ranked.candidates.front().score));
    }
    return ranked;
}

} // namespace photo_pairing::matching
