#pragma once

#include <Pacfetch/Render/Items.hpp>
#include <Pacfetch/Render/WarningSink.hpp>
#include <Pacfetch/Utils/Types.hpp>

#include "Config/Config.hpp"

namespace pacfetch::ui {
  namespace types  = ::pacfetch::utils::types;
  namespace config = ::pacfetch::config;
  namespace render = ::pacfetch::render;

  /**
   * @brief Creates the full output block from the configuration and collected stats.
   * @param config The application configuration.
   * @param snapshot The formatted stats.
   * @param sink Receives configuration warnings raised while rendering.
   * @param plain Skip the art, the palette and every color.
   * @return The lines to print, each terminated by a newline.
   */
  auto CreateUI(const config::Config& config, const render::StatsSnapshot& snapshot, render::WarningSink& sink, bool plain) -> types::String;
} // namespace pacfetch::ui
