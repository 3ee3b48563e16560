#pragma once

#include "src/core/config/PipelineConfig.hpp"
#include "photo_pairing/database/DatabaseManager.hpp"
#include <string>
#include <vector>

namespace photo_pairing::cli::intake_commands {

int listMonths(const config::PipelineConfig& config);
int listGroups(const config::PipelineConfig& config, int argc, char** argv);
int listSites(const std::vector<std::string>& extra_sites);
int showStatistics(database::DatabaseManager& db);

} // namespace photo_pairing::cli::intake_commands
