#pragma once

#include "CancellationToken.hpp"
#include "interfaces/IFeatureExtractor.hpp"
#include "src/core/catalog/PhotoCatalog.hpp"
#include "src/core/config/PipelineConfig.hpp"
#include "photo_pairing/types.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace photo_pairing::report {

    /**
     * @brief Snapshot of a running build, delivered to a ProgressSink
     */
    struct ReportProgress {
        std::string state;         ///< loading, extracting, matching, selecting, done, cancelled, timed_out
        size_t total = 0;          ///< Before-Photos to match
        size_t done = 0;           ///< Before-Photos matched so far
        size_t matched = 0;        ///< Pairs committed (final state only)
        size_t unmatched = 0;      ///< Unmatched photos on both sides (final state only)
        size_t before = 0;
        size_t after = 0;
    };

    /// Called from worker threads, one call at a time.
    using ProgressSink = std::function<void(const ReportProgress&)>;

    struct ReportOutcome {
        ReportStatus status = ReportStatus::COMPLETE;
        catalog::GroupSelector selector;
        Assignment assignment;
        std::vector<PhotoFailure> failures;       ///< Per-photo failures, before photos first
        std::vector<RankedCandidates> ranked;     ///< One entry per matched Before-Photo
        size_t before_count = 0;
        size_t after_count = 0;
        long long elapsed_ms = 0;

        /// True when selection ran (COMPLETE or PARTIAL).
        bool finished() const {
            return status == ReportStatus::COMPLETE || status == ReportStatus::PARTIAL;
        }
    };

    /**
     * @brief Runs one report build for a (site, task) group
     *
     * Loads the group's photos, extracts features once per photo through a
     * run-local FeatureCache, ranks candidates per Before-Photo in parallel
     * and resolves them with PairSelector after all workers have joined.
     * Unreadable photos are recorded as failures and left unmatched.
     */
    class ReportBuilder {
    public:
        /**
         * @param config Validated pipeline configuration
         * @param extractor Feature extractor; ORB when null
         */
        explicit ReportBuilder(config::PipelineConfig config,
                               std::shared_ptr<const IFeatureExtractor> extractor = nullptr);

        /**
         * @throws std::invalid_argument for a malformed selector
         */
        ReportOutcome build(const catalog::GroupSelector& selector,
                            const CancellationToken& token = CancellationToken(),
                            const ProgressSink& progress = ProgressSink()) const;

        ReportOutcome buildFromGroup(const catalog::GroupSelector& selector,
                                     const catalog::PhotoGroup& group,
                                     const CancellationToken& token = CancellationToken(),
                                     const ProgressSink& progress = ProgressSink()) const;

        const config::PipelineConfig& config() const { return config_; }

    private:
        int threadCount() const;

        config::PipelineConfig config_;
        std::shared_ptr<const IFeatureExtractor> extractor_;
    };

} // namespace photo_pairing::report
