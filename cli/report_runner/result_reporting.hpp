#pragma once

#include "src/core/config/PipelineConfig.hpp"
#include "src/core/report/ReportBuilder.hpp"
#include "photo_pairing/database/DatabaseManager.hpp"

namespace photo_pairing::cli::report_runner_results {

void printOutcome(const report::ReportOutcome& outcome, bool show_candidates);

// Returns the run id, or -1 when the database is disabled or recording failed.
int recordOutcome(const photo_pairing::database::DatabaseManager& db,
                  const config::PipelineConfig& config,
                  const report::ReportOutcome& outcome);

} // namespace photo_pairing::cli::report_runner_results
