#include "ReportBuilder.hpp"
#include "src/core/features/FeatureCache.hpp"
#include "src/core/features/ORBFeatureExtractor.hpp"
#include "src/core/matching/CandidateMatcher.hpp"
#include "src/core/pairing/PairSelector.hpp"
#include "photo_pairing/errors.hpp"
#include "photo_pairing/logging.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace photo_pairing::report {

namespace {

void notify(const ProgressSink& sink, std::mutex& mutex, const ReportProgress& progress) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex);
    try {
        sink(progress);
    } catch (const std::exception& e) {
        LOG_WARNING("Progress sink failed: " + std::string(e.what()));
    }
}

std::string stateFor(ReportStatus status) {
    switch (status) {
        case ReportStatus::CANCELLED: return "cancelled";
        case ReportStatus::TIMED_OUT: return "timed_out";
        default: return "done";
    }
}

}

    ReportBuilder::ReportBuilder(config::PipelineConfig config,
                                 std::shared_ptr<const IFeatureExtractor> extractor)
        : config_(std::move(config)),
          extractor_(std::move(extractor)) {
        config::validate(config_);
        if (!extractor_) {
            extractor_ = std::make_shared<features::ORBFeatureExtractor>();
        }
    }

    int ReportBuilder::threadCount() const {
        if (config_.performance.num_threads > 0) {
            return config_.performance.num_threads;
        }
#ifdef _OPENMP
        return omp_get_max_threads();
#else
        return 1;
#endif
    }

    ReportOutcome ReportBuilder::build(const catalog::GroupSelector& selector,
                                       const CancellationToken& token,
                                       const ProgressSink& progress) const {
        std::mutex progress_mutex;
        ReportProgress loading;
        loading.state = "loading";
        notify(progress, progress_mutex, loading);

        catalog::PhotoCatalog catalog(config_.storage.save_root, config_.classification.utc_offset_minutes);
        const auto group = catalog.collectGroup(selector);
        return buildFromGroup(selector, group, token, progress);
    }

    ReportOutcome ReportBuilder::buildFromGroup(const catalog::GroupSelector& selector,
                                                const catalog::PhotoGroup& group,
                                                const CancellationToken& token,
                                                const ProgressSink& progress) const {
        const auto start = std::chrono::steady_clock::now();
        auto elapsedMs = [&start]() {
            return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count());
        };

        ReportOutcome outcome;
        outcome.selector = selector;
        outcome.before_count = group.before.size();
        outcome.after_count = group.after.size();

        std::mutex progress_mutex;
        ReportProgress snapshot;
        snapshot.total = group.before.size();
        snapshot.before = group.before.size();
        snapshot.after = group.after.size();

        // Photos in slot order: before photos, then after photos
        std::vector<const Photo*> photos;
        photos.reserve(group.before.size() + group.after.size());
        for (const auto& photo : group.before) photos.push_back(&photo);
        for (const auto& photo : group.after) photos.push_back(&photo);

        const size_t photo_count = photos.size();
        std::vector<std::shared_ptr<const FeatureSet>> feature_slots(photo_count);
        std::vector<std::optional<PhotoFailure>> failure_slots(photo_count);

        features::FeatureCache cache;
        const auto& extraction = config_.extraction;
        const int threads = threadCount();
        const bool parallel = config_.performance.parallel && threads > 1;

        snapshot.state = "extracting";
        notify(progress, progress_mutex, snapshot);
        LOG_INFO("Extracting features for " + std::to_string(photo_count) + " photos of " + selector.label() +
                 " (" + std::to_string(parallel ? threads : 1) + " threads)");

#ifdef _OPENMP
        #pragma omp parallel for schedule(dynamic) num_threads(threads) if(parallel)
#endif
        for (long idx = 0; idx < static_cast<long>(photo_count); ++idx) {
            if (token.shouldStop()) {
                continue;
            }
            const Photo& photo = *photos[static_cast<size_t>(idx)];
            try {
                feature_slots[static_cast<size_t>(idx)] = cache.getOrCompute(photo.identity, [&]() {
                    return extractor_->extractFromFile(photo.identity.path, extraction);
                });
            } catch (const UnreadableImage& e) {
                failure_slots[static_cast<size_t>(idx)] = PhotoFailure{photo.identity.path, FailureKind::UNREADABLE_IMAGE, e.what()};
            } catch (const cv::Exception& e) {
                failure_slots[static_cast<size_t>(idx)] = PhotoFailure{photo.identity.path, FailureKind::UNREADABLE_IMAGE, e.what()};
            } catch (const std::exception& e) {
                failure_slots[static_cast<size_t>(idx)] = PhotoFailure{photo.identity.path, FailureKind::UNREADABLE_IMAGE, e.what()};
            }
        }

        for (const auto& failure : failure_slots) {
            if (failure) {
                LOG_WARNING("Excluded from matching: " + failure->message);
                outcome.failures.push_back(*failure);
            }
        }

        if (const auto reason = token.stopReason()) {
            outcome.status = *reason;
            outcome.elapsed_ms = elapsedMs();
            snapshot.state = stateFor(*reason);
            notify(progress, progress_mutex, snapshot);
            LOG_WARNING("Report build " + toString(*reason) + " during extraction of " + selector.label());
            return outcome;
        }

        std::vector<matching::CandidateFeatures> candidates;
        candidates.reserve(group.after.size());
        for (size_t i = 0; i < group.after.size(); ++i) {
            const auto& features = feature_slots[group.before.size() + i];
            if (features) {
                candidates.push_back({group.after[i].identity.path, features});
            }
        }

        const matching::CandidateMatcher matcher(config_.matching);
        std::vector<std::optional<RankedCandidates>> ranked_slots(group.before.size());
        std::vector<std::optional<PhotoFailure>> match_failures(group.before.size());
        std::atomic<size_t> matched_before{0};

        snapshot.state = "matching";
        notify(progress, progress_mutex, snapshot);

#ifdef _OPENMP
        #pragma omp parallel for schedule(dynamic) num_threads(threads) if(parallel)
#endif
        for (long idx = 0; idx < static_cast<long>(group.before.size()); ++idx) {
            if (token.shouldStop()) {
                continue;
            }
            const auto slot = static_cast<size_t>(idx);
            const auto& features = feature_slots[slot];
            if (features) {
                try {
                    ranked_slots[slot] = matcher.rank(group.before[slot].identity.path, *features, candidates);
                } catch (const std::exception& e) {
                    match_failures[slot] = PhotoFailure{group.before[slot].identity.path,
                                                        FailureKind::UNREADABLE_IMAGE,
                                                        std::string("matching failed: ") + e.what()};
                }
            }

            ReportProgress step = snapshot;
            step.done = matched_before.fetch_add(1) + 1;
            notify(progress, progress_mutex, step);
        }

        for (auto& slot : ranked_slots) {
            if (slot) {
                outcome.ranked.push_back(std::move(*slot));
            }
        }
        for (const auto& failure : match_failures) {
            if (failure) {
                LOG_ERROR(failure->path + ": " + failure->message);
                outcome.failures.push_back(*failure);
            }
        }

        if (const auto reason = token.stopReason()) {
            outcome.status = *reason;
            outcome.elapsed_ms = elapsedMs();
            snapshot.state = stateFor(*reason);
            snapshot.done = matched_before.load();
            notify(progress, progress_mutex, snapshot);
            LOG_WARNING("Report build " + toString(*reason) + " during matching of " + selector.label());
            return outcome;
        }

        snapshot.state = "selecting";
        snapshot.done = group.before.size();
        notify(progress, progress_mutex, snapshot);

        std::vector<std::string> before_paths;
        std::vector<std::string> after_paths;
        before_paths.reserve(group.before.size());
        after_paths.reserve(group.after.size());
        for (const auto& photo : group.before) before_paths.push_back(photo.identity.path);
        for (const auto& photo : group.after) after_paths.push_back(photo.identity.path);

        const pairing::PairSelector selector_stage(config_.selection);
        outcome.assignment = selector_stage.select(before_paths, after_paths, outcome.ranked);
        outcome.status = outcome.failures.empty() ? ReportStatus::COMPLETE : ReportStatus::PARTIAL;
        outcome.elapsed_ms = elapsedMs();

        snapshot.state = "done";
        snapshot.matched = outcome.assignment.pairs.size();
        snapshot.unmatched = outcome.assignment.unmatched_before.size() + outcome.assignment.unmatched_after.size();
        notify(progress, progress_mutex, snapshot);

        LOG_INFO("Report " + selector.label() + ": " + toString(outcome.status) + ", " +
                 std::to_string(snapshot.matched) + " pairs, " + std::to_string(outcome.failures.size()) +
                 " failures, " + std::to_string(outcome.elapsed_ms) + " ms (cache misses " +
                 std::to_string(cache.misses()) + ")");
        return outcome;
    }

} // namespace photo_pairing::report
