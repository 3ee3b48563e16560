#pragma once

#include "src/core/config/PipelineConfig.hpp"
#include "photo_pairing/database/DatabaseManager.hpp"

namespace photo_pairing::cli::intake_commands {

int placeFile(const config::PipelineConfig& config, database::DatabaseManager& db, int argc, char** argv);
int placeDirectory(const config::PipelineConfig& config, database::DatabaseManager& db, int argc, char** argv);
int classifyTime(const config::PipelineConfig& config, int argc, char** argv);

} // namespace photo_pairing::cli::intake_commands
