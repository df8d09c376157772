#include "Config.hpp"

#include <charconv>                  // std::from_chars
#include <filesystem>                // std::filesystem::{path, exists, create_directories}
#include <format>                    // std::format
#include <glaze/toml.hpp>            // glz::{read, write_file_toml, file_to_buffer, format_error}
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_cast
#include <matchit.hpp>               // matchit::{match, is, _}
#include <system_error>              // std::error_code

#include <Pacfetch/Utils/Env.hpp>
#include <Pacfetch/Utils/Error.hpp>
#include <Pacfetch/Utils/Logging.hpp>
#include <Pacfetch/Utils/Types.hpp>

namespace fs = std::filesystem;

using namespace pacfetch::utils::types;
using enum pacfetch::utils::error::PfErrorCode;
using pacfetch::render::TitleAlign;
using pacfetch::render::TitleSpec;
using pacfetch::render::TitleStyle;
using pacfetch::render::TitleTextKind;
using pacfetch::render::WarningSink;
using pacfetch::render::WidthMode;
using pacfetch::utils::env::GetEnv;
using pacfetch::utils::env::GetHomeDir;

// Intermediate structs for TOML parsing with glaze.
// glaze's TOML reader has no std::optional support, so every field starts at
// its default and an empty string means "not provided" where that matters.
namespace {
  struct TomlTitle {
    String text      = "default";
    String textColor = "bright_yellow";
    String lineColor = "none";
    String style     = "stacked";
    String width     = "title";
    String align; // empty = style default
    String line = "-";
    String leftCap;
    String rightCap;
  };

  struct TomlDisplay {
    Vec<String>                stats      = pacfetch::config::Config::defaultStatTokens();
    String                     ascii      = "PACMAN_DEFAULT";
    String                     asciiColor = "yellow";
    String                     glyph      = ": ";
    String                     labelColor = "bright_yellow";
    TomlTitle                  title;
    Map<String, TomlTitle>     titles;
  };

  struct TomlDisk {
    String path = "/";
  };

  struct TomlConfig {
    TomlDisplay display;
    TomlDisk    disk;
  };
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<TomlTitle> {
  using T                     = TomlTitle;
  static constexpr auto value = object(
    "text",
    &T::text,
    "text_color",
    &T::textColor,
    "line_color",
    &T::lineColor,
    "style",
    &T::style,
    "width",
    &T::width,
    "align",
    &T::align,
    "line",
    &T::line,
    "left_cap",
    &T::leftCap,
    "right_cap",
    &T::rightCap
  );
};

template <>
struct glz::meta<TomlDisplay> {
  using T                     = TomlDisplay;
  static constexpr auto value = object(
    "stats",
    &T::stats,
    "ascii",
    &T::ascii,
    "ascii_color",
    &T::asciiColor,
    "glyph",
    &T::glyph,
    "label_color",
    &T::labelColor,
    "title",
    &T::title,
    "titles",
    &T::titles
  );
};

template <>
struct glz::meta<TomlDisk> {
  using T                     = TomlDisk;
  static constexpr auto value = object("path", &T::path);
};

template <>
struct glz::meta<TomlConfig> {
  using T                     = TomlConfig;
  static constexpr auto value = object("display", &T::display, "disk", &T::disk);
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace {
  auto ParseTextKind(const String& text) -> TitleTextKind {
    using matchit::match, matchit::is, matchit::_;

    return match(text)(
      is | "default"      = TitleTextKind::Default,
      is | "pacman_ver"   = TitleTextKind::PacmanVersion,
      is | "pacfetch_ver" = TitleTextKind::PacfetchVersion,
      is | ""             = TitleTextKind::Empty,
      is | _              = TitleTextKind::Literal
    );
  }

  auto ParseWidth(const String& width, const StringView titleName, WarningSink& sink) -> pacfetch::render::TitleWidth {
    if (const Option<WidthMode> mode = magic_enum::enum_cast<WidthMode>(width, magic_enum::case_insensitive); mode && *mode != WidthMode::Fixed)
      return { .mode = *mode, .fixed = 0 };

    usize columns = 0;

    const auto [ptr, errc] = std::from_chars(width.data(), width.data() + width.size(), columns);

    if (errc == std::errc {} && ptr == width.data() + width.size() && columns > 0)
      return { .mode = WidthMode::Fixed, .fixed = columns };

    sink.warn(std::format("invalid width '{}' for title '{}' (expected \"title\", \"content\" or a positive integer); using \"title\"", width, titleName));
    return {};
  }

  auto ConvertTitle(const TomlTitle& toml, const StringView name, WarningSink& sink) -> TitleSpec {
    TitleSpec spec;
    spec.name      = String(name);
    spec.textKind  = ParseTextKind(toml.text);
    spec.literal   = spec.textKind == TitleTextKind::Literal ? toml.text : String {};
    spec.textColor = toml.textColor;
    spec.lineColor = toml.lineColor;
    spec.width     = ParseWidth(toml.width, name, sink);
    spec.line      = toml.line;
    spec.leftCap   = toml.leftCap;
    spec.rightCap  = toml.rightCap;

    if (const Option<TitleStyle> style = magic_enum::enum_cast<TitleStyle>(toml.style, magic_enum::case_insensitive))
      spec.style = *style;
    else
      sink.warn(std::format("invalid style '{}' for title '{}' (expected \"stacked\" or \"embedded\"); using \"stacked\"", toml.style, name));

    if (!toml.align.empty()) {
      if (const Option<TitleAlign> align = magic_enum::enum_cast<TitleAlign>(toml.align, magic_enum::case_insensitive))
        spec.align = *align;
      else
        sink.warn(std::format("invalid align '{}' for title '{}' (expected \"left\", \"center\" or \"right\"); using the style default", toml.align, name));
    }

    return spec;
  }

  auto Convert(const TomlConfig& toml, WarningSink& sink) -> pacfetch::config::Config {
    using pacfetch::config::Config;

    Config cfg;

    cfg.display.stats.clear();
    for (const String& token : toml.display.stats)
      cfg.display.stats.push_back(pacfetch::render::ParseDeclaration(token));

    cfg.display.ascii      = toml.display.ascii;
    cfg.display.asciiColor = toml.display.asciiColor;
    cfg.display.glyph      = toml.display.glyph;
    cfg.display.labelColor = toml.display.labelColor;
    cfg.display.title      = ConvertTitle(toml.display.title, "title", sink);

    for (const auto& [name, title] : toml.display.titles)
      cfg.display.titles.insert_or_assign(name, ConvertTitle(title, name, sink));

    cfg.disk.path = toml.disk.path.empty() ? String("/") : toml.disk.path;

    return cfg;
  }

  auto DefaultTomlConfig() -> TomlConfig {
    TomlConfig defaults;
    defaults.display.titles.emplace(String(pacfetch::config::DEFAULT_TITLE_NAME), TomlTitle {});
    return defaults;
  }

  auto CreateDefaultConfig(const fs::path& configPath) -> Result<> {
    if (std::error_code errc; !fs::create_directories(configPath.parent_path(), errc) && errc)
      ERR_FMT(IoError, "Failed to create config directory '{}': {}", configPath.parent_path().string(), errc.message());

    String     buffer;
    const auto writeError = glz::write_file_toml(DefaultTomlConfig(), configPath.string(), buffer);

    if (writeError)
      ERR_FMT(IoError, "Failed to write default config: {}", glz::format_error(writeError, buffer));

    info_log("Created default config file at {}", configPath.string());
    return {};
  }
} // namespace

namespace pacfetch::config {
  Config::Config() {
    for (const String& token : defaultStatTokens())
      display.stats.push_back(render::ParseDeclaration(token));

    TitleSpec header;
    header.name = String(DEFAULT_TITLE_NAME);
    display.titles.emplace(String(DEFAULT_TITLE_NAME), std::move(header));
    display.title.name = "title";
  }

  auto Config::defaultStatTokens() -> Vec<String> {
    return {
      std::format("title.{}", DEFAULT_TITLE_NAME),
      "installed",
      "upgradable",
      "last_update",
      "download_size",
      "installed_size",
      "net_upgrade_size",
      "orphaned_packages",
      "cache_size",
      "disk",
      "mirror_url",
      "mirror_health",
    };
  }

  auto Config::getConfigPath() -> Result<fs::path> {
    const bool underSudo = GetEnv("SUDO_USER").has_value();

    if (!underSudo)
      if (Result<String> xdg = GetEnv("XDG_CONFIG_HOME"); xdg && !xdg->empty())
        return fs::path(*xdg) / "pacfetch" / "pacfetch.toml";

    const fs::path home = TRY(GetHomeDir());
    return home / ".config" / "pacfetch" / "pacfetch.toml";
  }

  auto Config::getLogPath() -> Result<fs::path> {
    const bool underSudo = GetEnv("SUDO_USER").has_value();

    if (!underSudo)
      if (Result<String> xdg = GetEnv("XDG_CACHE_HOME"); xdg && !xdg->empty())
        return fs::path(*xdg) / "pacfetch" / "pacfetch.log";

    const fs::path home = TRY(GetHomeDir());
    return home / ".cache" / "pacfetch" / "pacfetch.log";
  }

  auto Config::fromToml(const StringView toml, render::WarningSink& sink) -> Result<Config> {
    TomlConfig tomlCfg;
    String     buffer(toml);

    // glaze rejects an empty buffer outright; an empty file is just "all defaults".
    if (buffer.find_first_not_of(" \t\r\n") == String::npos)
      return Convert(tomlCfg, sink);

    if (const auto readError = glz::read<glz::opts { .format = glz::TOML, .error_on_unknown_keys = false }>(tomlCfg, buffer); readError)
      ERR_FMT(ParseError, "Failed to parse config: {}", glz::format_error(readError, buffer));

    return Convert(tomlCfg, sink);
  }

  auto Config::getInstance(render::WarningSink& sink) -> Config {
    Result<fs::path> configPath = getConfigPath();

    if (!configPath) {
      warn_at(configPath.error());
      return {};
    }

    try {
      if (std::error_code errc; !fs::exists(*configPath, errc)) {
        info_log("Config file not found at {}, creating defaults.", configPath->string());

        if (Result<> created = CreateDefaultConfig(*configPath); !created)
          error_at(created.error());

        return {};
      }

      String buffer;
      if (const auto fileError = glz::file_to_buffer(buffer, configPath->string()); bool(fileError)) {
        error_log("Failed to read config file: {}", configPath->string());
        return {};
      }

      Result<Config> cfg = fromToml(buffer, sink);

      if (!cfg) {
        sink.warn(std::format("{} ({}); using defaults", cfg.error().message, configPath->string()));
        return {};
      }

      debug_log("Config loaded from {}", configPath->string());
      return *std::move(cfg);
    } catch (const fs::filesystem_error& fsErr) {
      error_log("Filesystem error while loading config: {}", fsErr.what());
      return {};
    }
  }

  auto Config::renderOptions() const -> render::RenderOptions {
    return { .glyph = display.glyph, .labelColor = display.labelColor, .monochrome = false };
  }
} // namespace pacfetch::config
