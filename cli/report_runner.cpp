#include "cli/report_runner/bootstrap.hpp"
#include "cli/report_runner/cli_args.hpp"
#include "cli/report_runner/result_reporting.hpp"
#include "src/core/classification/SiteRegistry.hpp"
#include "src/core/report/ReportBuilder.hpp"
#include "photo_pairing/errors.hpp"
#include "photo_pairing/logging.hpp"
#include <chrono>
#include <iostream>

using namespace photo_pairing;

/**
 * @brief Build a before/after report for one site and task
 */
int main(int argc, char** argv) {
    const auto args = cli::report_runner_cli::parseArgs(argc, argv);
    if (!args) {
        return 1;
    }

    try {
        auto bootstrap = cli::report_runner_bootstrap::loadConfigAndDatabase(
            args->config_path, config::EnvConfigLoader::captureProcessEnvironment());

        // Same alias resolution as intake, so "b" finds BRAVO's photos
        classification::SiteRegistry sites;
        sites.addSites(bootstrap.config.classification.sites);
        const auto resolved = sites.resolveAlias(args->site);

        catalog::GroupSelector selector;
        selector.site = resolved ? *resolved : args->site;
        selector.task = args->task;
        selector.from_month = args->from_month;
        selector.to_month = args->to_month;

        const auto token = args->timeout_ms > 0
            ? report::CancellationToken::withTimeout(std::chrono::milliseconds(args->timeout_ms))
            : report::CancellationToken();

        const report::ReportBuilder builder(bootstrap.config);
        LOG_INFO("Building report " + selector.label());

        size_t last_logged = 0;
        const auto outcome = builder.build(selector, token, [&last_logged](const report::ReportProgress& progress) {
            if (progress.state == "matching") {
                if (progress.done == progress.total || progress.done >= last_logged + 10) {
                    last_logged = progress.done;
                    LOG_INFO("Matched " + std::to_string(progress.done) + "/" + std::to_string(progress.total));
                }
            } else {
                LOG_DEBUG("Report state: " + progress.state);
            }
        });

        cli::report_runner_results::printOutcome(outcome, args->show_candidates);
        cli::report_runner_results::recordOutcome(*bootstrap.db, bootstrap.config, outcome);

        switch (outcome.status) {
            case ReportStatus::COMPLETE:
                return 0;
            case ReportStatus::PARTIAL:
                LOG_WARNING(std::to_string(outcome.failures.size()) + " photos could not be processed");
                return 0;
            case ReportStatus::CANCELLED:
            case ReportStatus::TIMED_OUT:
                LOG_WARNING("Report " + toString(outcome.status));
                return 2;
        }
        return 0;
    } catch (const ConfigurationError& e) {
        LOG_ERROR("Configuration error: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Error: " + std::string(e.what()));
        return 1;
    }
}
