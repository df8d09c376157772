#pragma once

#include <chrono> // std::chrono::system_clock

#include "Pacfetch/Render/Items.hpp"
#include "Pacfetch/Utils/Error.hpp"
#include "Pacfetch/Utils/Types.hpp"

namespace pacfetch::services::stats {
  namespace types = ::pacfetch::utils::types;

  using render::StatId;

  /**
   * @struct PacmanStats
   * @brief Raw values gathered from the local pacman installation.
   *
   * Every field is optional: a probe that was not requested, or that failed,
   * leaves its field empty and the stat renders as a placeholder.
   */
  struct PacmanStats {
    types::Option<types::u32>    totalInstalled;
    types::Option<types::u32>    totalUpgradable;
    types::Option<types::i64>    secondsSinceLastUpdate;
    types::Option<types::f64>    downloadSizeMb;
    types::Option<types::f64>    installedSizeMb;
    types::Option<types::f64>    netUpgradeSizeMb;
    types::Option<types::u32>    orphanedPackages;
    types::Option<types::f64>    orphanedSizeMb;
    types::Option<types::f64>    cacheSizeMb;
    types::Option<types::String> mirrorUrl;
    types::Option<types::f64>    mirrorSyncAgeHours;
    types::Option<types::String> pacmanVersion;
    types::Option<types::u64>    diskUsedBytes;
    types::Option<types::u64>    diskTotalBytes;
  };

  /**
   * @brief The subset of one package's local database `desc` file that orphan detection needs.
   */
  struct LocalPackage {
    types::String             name;
    bool                      explicitlyInstalled = true;
    types::u64                installedSize       = 0;
    types::Vec<types::String> depends;     ///< dependency names, version constraints removed
    types::Vec<types::String> optDepends;  ///< optional dependency names, descriptions removed
    types::Vec<types::String> provides;    ///< provided names, versions removed
  };

  /**
   * @brief Size fields of one package record in `pacman -Si` output.
   */
  struct SyncPackage {
    types::String name;
    types::u64    downloadSize  = 0;
    types::u64    installedSize = 0;
  };

  /**
   * @struct UpgradeSizes
   * @brief Totals for the pending upgrades, in MiB.
   *
   * The net size is the change in installed size; values within 0.01 MiB of
   * zero are reported as exactly 0.
   */
  struct UpgradeSizes {
    types::f64 downloadMb  = 0.0;
    types::f64 installedMb = 0.0;
    types::f64 netMb       = 0.0;
  };

  /**
   * @brief "N second(s)", "N minute(s)", "N hour(s)" or "N day(s) M hour(s)".
   */
  auto NormalizeDuration(types::i64 seconds) -> types::String;

  /**
   * @brief Formats one stat for display, or returns nothing if its data is missing.
   *
   * @param highlight Color the status words of mirror health and the disk
   *                  percentage, the way the graphical output shows them.
   */
  auto FormatStatValue(StatId id, const PacmanStats& stats, bool highlight = false) -> types::Option<types::String>;

  /**
   * @brief Label for a stat; the disk label carries the queried path, e.g. "Disk (/)".
   */
  auto StatDisplayLabel(StatId id, types::StringView diskPath) -> types::String;

  /**
   * @brief Every stat, labelled and formatted, plus the pacman version for title resolution.
   */
  auto BuildSnapshot(const PacmanStats& stats, types::StringView diskPath, bool highlight = false) -> render::StatsSnapshot;

  /**
   * @brief Seconds between the start of the most recent completed full system upgrade and @p now.
   *
   * Only upgrades whose "starting full system upgrade" line is followed by a
   * "transaction completed" line count. Timestamps look like
   * "[2024-01-15T10:30:00+0100]"; negative ages clamp to 0.
   */
  auto ParseSecondsSinceUpgrade(types::StringView logContents, std::chrono::system_clock::time_point now) -> types::Result<types::i64>;

  /// First "Server = " URL of a mirrorlist, without its "/$repo" suffix.
  auto ParseMirrorUrl(types::StringView mirrorlist) -> types::Option<types::String>;

  /// The "Pacman vX - libalpm vY" banner line from `pacman --version` output.
  auto ParsePacmanVersion(types::StringView output) -> types::Option<types::String>;

  /// Parses the `%NAME%`, `%SIZE%`, `%REASON%`, `%DEPENDS%`, `%OPTDEPENDS%` and `%PROVIDES%` sections.
  auto ParseLocalPackageDesc(types::StringView contents) -> types::Result<LocalPackage>;

  /**
   * @brief Orphans: installed as a dependency and neither required nor optionally required by anything installed.
   * @return The orphan count and their combined installed size in bytes.
   */
  auto FindOrphans(types::Span<const LocalPackage> packages) -> types::Pair<types::u32, types::u64>;

  /// Package names from `pacman -Qu` output ("name old -> new"), skipping "[ignored]" entries.
  auto ParseUpgradeList(types::StringView output) -> types::Vec<types::String>;

  /// A pacman size field such as "1.50 MiB", in bytes.
  auto ParseSizeField(types::StringView value) -> types::Option<types::u64>;

  /// The name and size fields of every record in `pacman -Si` output; a name seen twice keeps its first record.
  auto ParseSyncPackageInfo(types::StringView output) -> types::Vec<SyncPackage>;

  /**
   * @brief Sums the download and installed sizes of @p upgrades.
   *
   * The net size subtracts the installed size of the local copy, when one is
   * found in @p installed.
   */
  auto SumUpgradeSizes(types::Span<const SyncPackage> upgrades, types::Span<const LocalPackage> installed) -> UpgradeSizes;

  /**
   * @brief Runs only the local probes that @p requested needs.
   *
   * The pacman version is always probed since titles may reference it.
   * Upgrades are read from the sync databases already on disk; nothing is
   * downloaded. A failed probe leaves its value empty.
   */
  auto CollectPacmanStats(types::Span<const render::Declaration> requested, types::StringView diskPath) -> PacmanStats;
} // namespace pacfetch::services::stats
