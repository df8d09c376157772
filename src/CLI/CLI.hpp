/**
 * @file CLI.hpp
 * @brief Output helpers for pacfetch's command-line modes.
 */

#pragma once

#include <Pacfetch/Render/Items.hpp>
#include <Pacfetch/Services/Stats.hpp>
#include <Pacfetch/Utils/Types.hpp>

#include "Config/Config.hpp"

namespace pacfetch::cli {
  /**
   * @brief Runs the probes the configured layout needs and formats the results.
   * @param config Application configuration; its stats list and disk path select the probes.
   * @param highlight Color the status words in the values (graphical output only).
   */
  auto CollectSnapshot(const config::Config& config, bool highlight) -> render::StatsSnapshot;

  /**
   * @brief Every stat that has a value, keyed by its config key, as pretty-printed JSON.
   */
  auto FormatJson(const render::StatsSnapshot& snapshot) -> utils::types::Result<utils::types::String>;

  /**
   * @brief Print the stats in JSON format
   * @param snapshot Stats formatted without highlighting
   */
  auto PrintJsonOutput(const render::StatsSnapshot& snapshot) -> utils::types::Unit;
} // namespace pacfetch::cli
