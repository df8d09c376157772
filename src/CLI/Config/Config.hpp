#pragma once

#include <filesystem> // std::filesystem::path

#include <Pacfetch/Render/Items.hpp>
#include <Pacfetch/Render/Layout.hpp>
#include <Pacfetch/Render/WarningSink.hpp>
#include <Pacfetch/Utils/Types.hpp>

namespace pacfetch::config {
  namespace types = ::pacfetch::utils::types;

  /// Name of the title the default layout references.
  inline constexpr types::StringView DEFAULT_TITLE_NAME = "header";

  /**
   * @struct Display
   * @brief The `[display]` table: what to show and how.
   */
  struct Display {
    types::Vec<render::Declaration>                       stats;
    types::String                                         ascii      = "PACMAN_DEFAULT";
    types::String                                         asciiColor = "yellow";
    types::String                                         glyph      = ": ";
    types::String                                         labelColor = "bright_yellow";
    render::TitleSpec                                     title;  ///< legacy `[display.title]`
    types::UnorderedMap<types::String, render::TitleSpec> titles; ///< `[display.titles.<name>]`
  };

  /**
   * @struct Disk
   * @brief The `[disk]` table.
   */
  struct Disk {
    types::String path = "/"; ///< mount path queried for the disk stat
  };

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    Display display;
    Disk    disk;

    /**
     * @brief The built-in configuration: a "header" title followed by every stat.
     */
    Config();

    /**
     * @brief Default `display.stats` tokens, in display order.
     */
    static auto defaultStatTokens() -> types::Vec<types::String>;

    /**
     * @brief Loads the user's config file, creating it with defaults if it does not exist.
     *
     * Never fails: an unreadable or malformed file is reported and the
     * in-memory defaults are used instead.
     */
    static auto getInstance(render::WarningSink& sink) -> Config;

    /**
     * @brief Parses TOML text into a Config.
     *
     * Unknown keys are ignored. Malformed title shapes (style, width, align)
     * fall back to their defaults with a warning; only unparseable TOML is an error.
     */
    static auto fromToml(types::StringView toml, render::WarningSink& sink) -> types::Result<Config>;

    /**
     * @brief Path of the config file: `$SUDO_USER`'s `~/.config` under sudo, else `$XDG_CONFIG_HOME`, else `~/.config`.
     */
    static auto getConfigPath() -> types::Result<std::filesystem::path>;

    /**
     * @brief Path of the warning log, under `$XDG_CACHE_HOME` or `~/.cache`.
     */
    static auto getLogPath() -> types::Result<std::filesystem::path>;

    [[nodiscard]] auto renderOptions() const -> render::RenderOptions;
  };
} // namespace pacfetch::config
