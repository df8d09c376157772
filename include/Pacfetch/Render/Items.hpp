#pragma once

#include <variant> // std::variant

#include "Pacfetch/Utils/Types.hpp"

namespace pacfetch::render {
  namespace types = ::pacfetch::utils::types;

  /**
   * @enum StatId
   * @brief Every statistic pacfetch knows how to show, in canonical order.
   */
  enum class StatId : types::u8 {
    Installed,
    Upgradable,
    LastUpdate,
    DownloadSize,
    InstalledSize,
    NetUpgradeSize,
    OrphanedPackages,
    CacheSize,
    MirrorUrl,
    MirrorHealth,
    Disk,
  };

  /**
   * @brief The token used for a stat in `display.stats` and as its JSON key.
   */
  constexpr auto StatConfigKey(const StatId id) -> types::StringView {
    switch (id) {
      case StatId::Installed:        return "installed";
      case StatId::Upgradable:       return "upgradable";
      case StatId::LastUpdate:       return "last_update";
      case StatId::DownloadSize:     return "download_size";
      case StatId::InstalledSize:    return "installed_size";
      case StatId::NetUpgradeSize:   return "net_upgrade_size";
      case StatId::OrphanedPackages: return "orphaned_packages";
      case StatId::CacheSize:        return "cache_size";
      case StatId::MirrorUrl:        return "mirror_url";
      case StatId::MirrorHealth:     return "mirror_health";
      case StatId::Disk:             return "disk";
    }

    return "";
  }

  /**
   * @brief Display label for a stat. The disk label gets the queried path appended by the stats layer.
   */
  constexpr auto StatLabel(const StatId id) -> types::StringView {
    switch (id) {
      case StatId::Installed:        return "Installed";
      case StatId::Upgradable:       return "Upgradable";
      case StatId::LastUpdate:       return "Last System Update";
      case StatId::DownloadSize:     return "Download Size";
      case StatId::InstalledSize:    return "Installed Size";
      case StatId::NetUpgradeSize:   return "Net Upgrade Size";
      case StatId::OrphanedPackages: return "Orphaned Packages";
      case StatId::CacheSize:        return "Package Cache";
      case StatId::MirrorUrl:        return "Mirror URL";
      case StatId::MirrorHealth:     return "Mirror Health";
      case StatId::Disk:             return "Disk";
    }

    return "";
  }

  /**
   * @brief One labelled stat; an empty value renders as a placeholder.
   */
  struct StatEntry {
    StatId                       id;
    types::String                label;
    types::Option<types::String> value;
  };

  enum class TitleTextKind : types::u8 {
    Default,         ///< "<pacman version>" when known, else "pacfetch <version>"
    PacmanVersion,   ///< pacman version, or "Pacman" when unknown
    PacfetchVersion, ///< "pacfetch <version>"
    Empty,           ///< zero-width title text
    Literal,         ///< the configured string itself
  };

  enum class TitleStyle : types::u8 {
    Stacked,  ///< text on one line, a separator line under it
    Embedded, ///< text inlined in the separator line
  };

  enum class TitleAlign : types::u8 {
    Left,
    Center,
    Right,
  };

  enum class WidthMode : types::u8 {
    Title,   ///< the title's own footprint
    Content, ///< the shared stat content width
    Fixed,   ///< an explicit column count
  };

  struct TitleWidth {
    WidthMode    mode  = WidthMode::Title;
    types::usize fixed = 0;
  };

  /**
   * @struct TitleSpec
   * @brief A named title block as configured.
   *
   * Colors are kept as raw tokens and resolved at render time, so a bad token
   * warns at the point it would have been used.
   */
  struct TitleSpec {
    types::String                   name;
    TitleTextKind                   textKind  = TitleTextKind::Default;
    types::String                   literal;
    types::String                   textColor = "bright_yellow";
    types::String                   lineColor = "none";
    TitleStyle                      style     = TitleStyle::Stacked;
    TitleWidth                      width;
    types::Option<TitleAlign>       align;
    types::String                   line = "-";
    types::String                   leftCap;
    types::String                   rightCap;

    /**
     * @brief Stacked titles default to left, embedded titles to center.
     */
    [[nodiscard]] auto effectiveAlign() const -> TitleAlign {
      if (align)
        return *align;

      return style == TitleStyle::Embedded ? TitleAlign::Center : TitleAlign::Left;
    }
  };

  /**
   * @brief Everything the renderer knows about the collected stats.
   */
  struct StatsSnapshot {
    types::Map<StatId, StatEntry> entries;
    types::Option<types::String>  pacmanVersion;
  };

  struct StatItem {
    StatEntry entry;
  };

  struct TitleItem {
    TitleSpec     spec;
    types::String text; ///< resolved title text
  };

  struct UnresolvedItem {
    types::String reference;
  };

  using RenderItem = std::variant<StatItem, TitleItem, UnresolvedItem>;

  /// `title.<name>`
  struct TitleRef {
    types::String name;
  };

  /// a bare `title` entry, served from the legacy single-title table
  struct LegacyTitleRef {};

  struct StatRef {
    StatId id;
  };

  struct UnknownRef {
    types::String token;
  };

  /**
   * @brief One entry of `display.stats`, classified but not yet resolved.
   */
  using Declaration = std::variant<StatRef, TitleRef, LegacyTitleRef, UnknownRef>;

  /**
   * @brief Classifies a `display.stats` token.
   *
   * "title.<name>" is a title reference, "title" the legacy title, any stat
   * key a stat; everything else (including "title." with no name) is unknown.
   */
  auto ParseDeclaration(types::StringView token) -> Declaration;

  /**
   * @brief The stat a `display.stats` key names, if any.
   */
  auto ParseStatId(types::StringView key) -> types::Option<StatId>;
} // namespace pacfetch::render
