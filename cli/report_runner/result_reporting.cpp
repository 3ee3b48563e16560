#include "result_reporting.hpp"
#include "photo_pairing/logging.hpp"
#include <iomanip>
#include <iostream>
#include <map>

namespace photo_pairing::cli::report_runner_results {

void printOutcome(const report::ReportOutcome& outcome, bool show_candidates) {
    std::cout << "\nReport " << outcome.selector.label() << " [" << toString(outcome.status) << "]" << std::endl;
    std::cout << "  Before photos: " << outcome.before_count
              << ", after photos: " << outcome.after_count
              << ", elapsed: " << outcome.elapsed_ms << " ms" << std::endl;

    if (!outcome.finished()) {
        std::cout << "  Build stopped before selection, no pairing available" << std::endl;
    } else {
        std::cout << "\nPairs (" << outcome.assignment.pairs.size() << "):" << std::endl;
        for (const auto& pair : outcome.assignment.pairs) {
            std::cout << "  " << pair.before_path << " -> " << pair.after_path
                      << "  score=" << std::fixed << std::setprecision(3) << pair.score
                      << " matches=" << pair.match_count << std::endl;
        }

        std::cout << "\nUnmatched before (" << outcome.assignment.unmatched_before.size() << "):" << std::endl;
        for (const auto& path : outcome.assignment.unmatched_before) {
            std::cout << "  " << path << std::endl;
        }
        std::cout << "Unmatched after (" << outcome.assignment.unmatched_after.size() << "):" << std::endl;
        for (const auto& path : outcome.assignment.unmatched_after) {
            std::cout << "  " << path << std::endl;
        }
    }

    if (show_candidates) {
        std::cout << "\nCandidates:" << std::endl;
        for (const auto& ranked : outcome.ranked) {
            std::cout << "  " << ranked.before_path << std::endl;
            for (const auto& candidate : ranked.candidates) {
                std::cout << "    #" << candidate.rank << " " << candidate.after_path
                          << "  score=" << std::fixed << std::setprecision(3) << candidate.score
                          << " matches=" << candidate.match_count << std::endl;
            }
        }
    }

    if (!outcome.failures.empty()) {
        std::cerr << "\nFailures (" << outcome.failures.size() << "):" << std::endl;
        for (const auto& failure : outcome.failures) {
            std::cerr << "  [" << toString(failure.kind) << "] " << failure.path << ": " << failure.message << std::endl;
        }
    }
}

int recordOutcome(const photo_pairing::database::DatabaseManager& db,
                  const config::PipelineConfig& config,
                  const report::ReportOutcome& outcome) {
    if (!db.isEnabled()) {
        return -1;
    }

    photo_pairing::database::ReportRunRecord run;
    run.site = outcome.selector.site;
    run.task = outcome.selector.task;
    run.from_month = outcome.selector.from_month;
    run.to_month = outcome.selector.to_month.empty() ? outcome.selector.from_month : outcome.selector.to_month;
    run.status = toString(outcome.status);
    run.selection_mode = toString(config.selection.mode);
    run.before_count = static_cast<int>(outcome.before_count);
    run.after_count = static_cast<int>(outcome.after_count);
    run.pair_count = static_cast<int>(outcome.assignment.pairs.size());
    run.failure_count = static_cast<int>(outcome.failures.size());
    run.elapsed_ms = static_cast<double>(outcome.elapsed_ms);
    run.parameters = config::describe(config);

    const int run_id = db.recordReportRun(run);
    if (run_id < 0) {
        LOG_WARNING("Failed to record report run for " + outcome.selector.label());
        return -1;
    }

    std::vector<photo_pairing::database::PairRecord> pairs;
    pairs.reserve(outcome.assignment.pairs.size());
    for (const auto& pair : outcome.assignment.pairs) {
        photo_pairing::database::PairRecord record;
        record.run_id = run_id;
        record.before_path = pair.before_path;
        record.after_path = pair.after_path;
        record.score = pair.score;
        record.match_count = pair.match_count;
        pairs.push_back(record);
    }

    std::map<std::string, std::string> failure_messages;
    for (const auto& failure : outcome.failures) {
        failure_messages[failure.path] = failure.message;
    }

    std::vector<photo_pairing::database::UnmatchedRecord> unmatched;
    auto addUnmatched = [&](const std::vector<std::string>& paths, const std::string& side) {
        for (const auto& path : paths) {
            photo_pairing::database::UnmatchedRecord record;
            record.run_id = run_id;
            record.side = side;
            record.path = path;
            const auto it = failure_messages.find(path);
            if (it != failure_messages.end()) {
                record.reason = it->second;
            }
            unmatched.push_back(record);
        }
    };
    addUnmatched(outcome.assignment.unmatched_before, "before");
    addUnmatched(outcome.assignment.unmatched_after, "after");

    if (!db.storePairs(run_id, pairs)) {
        LOG_WARNING("Failed to store pairs for run " + std::to_string(run_id));
    }
    if (!db.storeUnmatched(run_id, unmatched)) {
        LOG_WARNING("Failed to store unmatched photos for run " + std::to_string(run_id));
    }

    LOG_INFO("Recorded report run " + std::to_string(run_id));
    return run_id;
}

} // namespace photo_pairing::cli::report_runner_results
