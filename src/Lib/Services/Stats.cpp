#include "Pacfetch/Services/Stats.hpp"

#include <algorithm>    // std::ranges::any_of
#include <array>        // std::array
#include <cerrno>       // errno
#include <charconv>     // std::from_chars
#include <cmath>        // std::llround
#include <cstdio>       // popen, pclose, fgets
#include <cstring>      // std::strerror
#include <filesystem>   // std::filesystem
#include <format>       // std::format
#include <fstream>      // std::ifstream
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_values
#include <matchit.hpp>  // matchit::{match, is, _}
#include <sstream>      // std::ostringstream
#include <sys/statvfs.h> // statvfs
#include <system_error> // std::error_code
#include <unordered_set> // std::unordered_set

#include "Pacfetch/Utils/Env.hpp"
#include "Pacfetch/Utils/Error.hpp"
#include "Pacfetch/Utils/Logging.hpp"
#include "Pacfetch/Utils/Types.hpp"

namespace fs = std::filesystem;

using namespace pacfetch::utils::types;
using enum pacfetch::utils::error::PfErrorCode;
using pacfetch::render::Declaration;
using pacfetch::render::StatId;
using pacfetch::render::StatRef;
using pacfetch::services::stats::LocalPackage;
using pacfetch::services::stats::PacmanStats;
using pacfetch::services::stats::SyncPackage;
using pacfetch::services::stats::UpgradeSizes;

namespace {
  constexpr f64 BYTES_PER_MIB = 1024.0 * 1024.0;
  constexpr f64 BYTES_PER_GIB = 1024.0 * 1024.0 * 1024.0;

  constexpr PCStr PACMAN_LOCAL_DB   = "/var/lib/pacman/local";
  constexpr PCStr PACMAN_CACHE_DIR  = "/var/cache/pacman/pkg";
  constexpr PCStr PACMAN_LOG        = "/var/log/pacman.log";
  constexpr PCStr PACMAN_MIRRORLIST = "/etc/pacman.d/mirrorlist";

  constexpr StringView UPGRADE_START = "starting full system upgrade";
  constexpr StringView UPGRADE_DONE  = "transaction completed";

  constexpr PCStr RED_CODE    = "\033[38;5;1m";
  constexpr PCStr GREEN_CODE  = "\033[38;5;2m";
  constexpr PCStr YELLOW_CODE = "\033[38;5;3m";
  constexpr PCStr RESET_CODE  = "\033[0m";

  auto Plural(const i64 count) -> StringView {
    return count == 1 ? "" : "s";
  }

  auto Paint(const StringView text, const PCStr code, const bool highlight) -> String {
    if (!highlight)
      return String(text);

    return std::format("{}{}{}", code, text, RESET_CODE);
  }

  auto Trim(const StringView str) -> StringView {
    const usize first = str.find_first_not_of(" \t\r\n");

    if (first == StringView::npos)
      return {};

    return str.substr(first, str.find_last_not_of(" \t\r\n") - first + 1);
  }

  template <typename Fn>
  auto ForEachLine(const StringView text, Fn&& callback) -> Unit {
    usize start = 0;

    while (start <= text.size()) {
      const usize end = text.find('\n', start);

      if (end == StringView::npos) {
        if (start < text.size())
          callback(text.substr(start));
        break;
      }

      callback(text.substr(start, end - start));
      start = end + 1;
    }
  }

  template <typename Tp>
  auto ParseNumber(const StringView digits) -> Option<Tp> {
    Tp value {};

    const auto [ptr, errc] = std::from_chars(digits.data(), digits.data() + digits.size(), value);

    if (errc != std::errc {} || ptr != digits.data() + digits.size())
      return None;

    return value;
  }

  /**
   * @brief Parses "2024-01-15T10:30:00+0100" into seconds since the epoch.
   */
  auto ParseLogTimestamp(const StringView stamp) -> Result<i64> {
    using namespace std::chrono;

    if (stamp.size() != 24 || stamp[4] != '-' || stamp[7] != '-' || stamp[10] != 'T' || stamp[13] != ':' || stamp[16] != ':' ||
        (stamp[19] != '+' && stamp[19] != '-'))
      ERR_FMT(ParseError, "unrecognized pacman.log timestamp '{}'", stamp);

    const Option<i32> yearNum  = ParseNumber<i32>(stamp.substr(0, 4));
    const Option<u32> monthNum = ParseNumber<u32>(stamp.substr(5, 2));
    const Option<u32> dayNum   = ParseNumber<u32>(stamp.substr(8, 2));
    const Option<i64> hourNum  = ParseNumber<i64>(stamp.substr(11, 2));
    const Option<i64> minNum   = ParseNumber<i64>(stamp.substr(14, 2));
    const Option<i64> secNum   = ParseNumber<i64>(stamp.substr(17, 2));
    const Option<i64> offHours = ParseNumber<i64>(stamp.substr(20, 2));
    const Option<i64> offMins  = ParseNumber<i64>(stamp.substr(22, 2));

    if (!yearNum || !monthNum || !dayNum || !hourNum || !minNum || !secNum || !offHours || !offMins)
      ERR_FMT(ParseError, "unrecognized pacman.log timestamp '{}'", stamp);

    const year_month_day date { year { *yearNum }, month { *monthNum }, day { *dayNum } };

    if (!date.ok())
      ERR_FMT(ParseError, "invalid date in pacman.log timestamp '{}'", stamp);

    const i64 offset   = ((*offHours * 3600) + (*offMins * 60)) * (stamp[19] == '-' ? -1 : 1);
    const i64 midnight = duration_cast<seconds>(sys_days(date).time_since_epoch()).count();

    return midnight + (*hourNum * 3600) + (*minNum * 60) + *secNum - offset;
  }

  auto ReadFile(const fs::path& path) -> Result<String> {
    std::error_code errc;

    if (!fs::exists(path, errc))
      ERR_FMT(NotFound, "'{}' does not exist", path.string());

    std::ifstream file(path, std::ios::binary);

    if (!file)
      ERR_FMT(PermissionDenied, "failed to open '{}'", path.string());

    std::ostringstream contents;
    contents << file.rdbuf();

    return contents.str();
  }

  auto RunCommand(const PCStr command) -> Result<String> {
    const UniquePointer<FILE, decltype(&pclose)> pipe(popen(command, "r"), pclose);

    if (!pipe)
      ERR_FMT(IoError, "popen('{}') failed: {}", command, std::strerror(errno));

    String           output;
    Array<char, 256> buffer {};

    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr)
      output += buffer.data();

    return output;
  }

  /// Dependency strings carry version constraints ("glibc>=2.39") or descriptions ("python: for scripts").
  auto BareName(const StringView spec) -> String {
    const usize cut = spec.find_first_of("<>=:");
    return String(Trim(spec.substr(0, cut)));
  }

  auto LocalPackageDirs() -> Result<Vec<fs::path>> {
    std::error_code errc;

    if (!fs::is_directory(PACMAN_LOCAL_DB, errc)) {
      if (errc && errc != std::errc::no_such_file_or_directory)
        ERR_FMT(IoError, "failed to check '{}': {}", PACMAN_LOCAL_DB, errc.message());

      ERR_FMT(NotFound, "pacman local database not found at '{}'", PACMAN_LOCAL_DB);
    }

    const fs::directory_iterator dirIter(PACMAN_LOCAL_DB, fs::directory_options::skip_permission_denied, errc);

    if (errc)
      ERR_FMT(IoError, "failed to read '{}': {}", PACMAN_LOCAL_DB, errc.message());

    // ALPM_DB_VERSION is a plain file next to the package directories.
    Vec<fs::path> dirs;
    for (const fs::directory_entry& entry : dirIter)
      if (std::error_code dirErr; entry.is_directory(dirErr) && !dirErr)
        dirs.push_back(entry.path());

    return dirs;
  }

  auto CountInstalled() -> Result<u32> {
    const Vec<fs::path> dirs = TRY(LocalPackageDirs());
    return static_cast<u32>(dirs.size());
  }

  auto LoadLocalPackages() -> Result<Vec<LocalPackage>> {
    const Vec<fs::path> dirs = TRY(LocalPackageDirs());

    Vec<LocalPackage> packages;
    packages.reserve(dirs.size());

    for (const fs::path& dir : dirs) {
      Result<String> desc = ReadFile(dir / "desc");

      if (!desc) {
        debug_at(desc.error());
        continue;
      }

      if (Result<LocalPackage> pkg = pacfetch::services::stats::ParseLocalPackageDesc(*desc))
        packages.push_back(std::move(*pkg));
      else
        debug_at(pkg.error());
    }

    return packages;
  }

  auto GetOrphans() -> Result<Pair<u32, u64>> {
    const Vec<LocalPackage> packages = TRY(LoadLocalPackages());
    return pacfetch::services::stats::FindOrphans(packages);
  }

  struct UpgradeProbe {
    u32                  count = 0;
    Option<UpgradeSizes> sizes;
  };

  /**
   * @brief Pending upgrades according to the sync databases already on disk.
   *
   * `pacman -Qu` and `pacman -Si` only read those databases, so this never
   * touches the network and needs no lock.
   */
  auto GetUpgrades(const bool wantSizes) -> Result<UpgradeProbe> {
    using namespace pacfetch::services::stats;

    // Also confirms pacman is installed; `pacman -Qu` exits non-zero both when nothing is pending and when it is missing.
    const Vec<LocalPackage> installed = TRY(LoadLocalPackages());

    const String      listing = TRY(RunCommand("LC_ALL=C pacman -Qu 2>/dev/null"));
    const Vec<String> names   = ParseUpgradeList(listing);

    UpgradeProbe probe { .count = static_cast<u32>(names.size()), .sizes = None };

    if (!wantSizes)
      return probe;

    if (names.empty()) {
      probe.sizes = UpgradeSizes {};
      return probe;
    }

    String command = "LC_ALL=C pacman -Si";
    for (const String& name : names)
      command += std::format(" '{}'", name);
    command += " 2>/dev/null";

    const String           info     = TRY(RunCommand(command.c_str()));
    const Vec<SyncPackage> upgrades = ParseSyncPackageInfo(info);

    if (upgrades.empty()) {
      debug_log("pacman -Si returned no package records for {} pending upgrades", names.size());
      return probe;
    }

    probe.sizes = SumUpgradeSizes(upgrades, installed);
    return probe;
  }

  auto GetCacheSizeMb() -> Result<f64> {
    std::error_code errc;

    const fs::directory_iterator dirIter(PACMAN_CACHE_DIR, fs::directory_options::skip_permission_denied, errc);

    if (errc)
      ERR_FMT(errc == std::errc::no_such_file_or_directory ? NotFound : IoError, "failed to read '{}': {}", PACMAN_CACHE_DIR, errc.message());

    u64 total = 0;

    for (const fs::directory_entry& entry : dirIter) {
      std::error_code entryErr;

      if (!entry.is_regular_file(entryErr) || entryErr)
        continue;

      const u64 size = entry.file_size(entryErr);
      if (!entryErr)
        total += size;
    }

    return static_cast<f64>(total) / BYTES_PER_MIB;
  }

  auto GetDiskUsage(const StringView path) -> Result<Pair<u64, u64>> {
    const fs::path expanded = TRY(pacfetch::utils::env::ExpandTilde(path));

    struct statvfs stat {};

    if (statvfs(expanded.c_str(), &stat) == -1)
      ERR_FMT(IoError, "statvfs('{}') failed: {} (errno {})", expanded.string(), std::strerror(errno), errno);

    const u64 blockSize  = stat.f_frsize;
    const u64 totalBytes = stat.f_blocks * blockSize;
    const u64 usedBytes  = (stat.f_blocks - stat.f_bfree) * blockSize;

    return Pair<u64, u64> { usedBytes, totalBytes };
  }

  auto Requests(const Span<const Declaration> requested, const std::initializer_list<StatId> ids) -> bool {
    return std::ranges::any_of(requested, [&](const Declaration& decl) {
      const auto* stat = std::get_if<StatRef>(&decl);
      return stat && std::ranges::find(ids, stat->id) != ids.end();
    });
  }

  /**
   * @brief Stores a probe result, logging a failure at debug level when the data is just not there.
   */
  auto LogProbeFailure(const pacfetch::utils::error::PfError& error) -> Unit {
    using matchit::match, matchit::is, matchit::_;

    match(pacfetch::utils::error::IsExpectedAbsence(error.code))(
      is | true = [&] { debug_at(error); },
      is | _    = [&] { warn_at(error); }
    );
  }

  template <typename Tp, typename Dest>
  auto Assign(Result<Tp> result, Dest& dest) -> Unit {
    if (result)
      dest = std::move(*result);
    else
      LogProbeFailure(result.error());
  }
} // namespace

namespace pacfetch::services::stats {
  auto NormalizeDuration(const i64 seconds) -> String {
    if (seconds < 60)
      return std::format("{} second{}", seconds, Plural(seconds));

    if (seconds < 3600) {
      const i64 minutes = seconds / 60;
      return std::format("{} minute{}", minutes, Plural(minutes));
    }

    if (seconds < 86400) {
      const i64 hours = seconds / 3600;
      return std::format("{} hour{}", hours, Plural(hours));
    }

    const i64 days  = seconds / 86400;
    const i64 hours = (seconds % 86400) / 3600;

    return std::format("{} day{} {} hour{}", days, Plural(days), hours, Plural(hours));
  }

  auto FormatStatValue(const StatId id, const PacmanStats& stats, const bool highlight) -> Option<String> {
    const auto mib = [](const Option<f64>& size) -> Option<String> {
      if (!size)
        return None;

      return std::format("{:.2f} MiB", *size);
    };

    switch (id) {
      case StatId::Installed:
        return stats.totalInstalled.transform([](const u32 count) { return std::format("{}", count); });
      case StatId::Upgradable:
        return stats.totalUpgradable.transform([](const u32 count) { return std::format("{}", count); });
      case StatId::LastUpdate:
        return stats.secondsSinceLastUpdate.transform(NormalizeDuration);
      case StatId::DownloadSize:
        return mib(stats.downloadSizeMb);
      case StatId::InstalledSize:
        return mib(stats.installedSizeMb);
      case StatId::NetUpgradeSize:
        return mib(stats.netUpgradeSizeMb);
      case StatId::OrphanedPackages:
        if (!stats.orphanedPackages)
          return None;

        if (*stats.orphanedPackages == 0)
          return "0";

        if (stats.orphanedSizeMb)
          return std::format("{} ({:.2f} MiB)", *stats.orphanedPackages, *stats.orphanedSizeMb);

        return std::format("{}", *stats.orphanedPackages);
      case StatId::CacheSize:
        return mib(stats.cacheSizeMb);
      case StatId::MirrorUrl:
        return stats.mirrorUrl;
      case StatId::MirrorHealth:
        if (!stats.mirrorUrl)
          return std::format("{} - no mirror found", Paint("Err", RED_CODE, highlight));

        if (!stats.mirrorSyncAgeHours)
          return std::format("{} - could not check sync status", Paint("Err", RED_CODE, highlight));

        return std::format("{} (last sync {:.1f} hours)", Paint("OK", GREEN_CODE, highlight), *stats.mirrorSyncAgeHours);
      case StatId::Disk: {
        if (!stats.diskUsedBytes || !stats.diskTotalBytes)
          return None;

        const u64 used  = *stats.diskUsedBytes;
        const u64 total = *stats.diskTotalBytes;
        const f64 pct   = total > 0 ? (static_cast<f64>(used) / static_cast<f64>(total)) * 100.0 : 0.0;

        const PCStr pctCode = pct > 90.0 ? RED_CODE : pct >= 70.0 ? YELLOW_CODE : GREEN_CODE;

        return std::format(
          "{:.2f} GiB / {:.2f} GiB {}",
          static_cast<f64>(used) / BYTES_PER_GIB,
          static_cast<f64>(total) / BYTES_PER_GIB,
          Paint(std::format("({:.0f}%)", pct), pctCode, highlight)
        );
      }
    }

    return None;
  }

  auto StatDisplayLabel(const StatId id, const StringView diskPath) -> String {
    if (id == StatId::Disk)
      return std::format("{} ({})", render::StatLabel(id), diskPath);

    return String(render::StatLabel(id));
  }

  auto BuildSnapshot(const PacmanStats& stats, const StringView diskPath, const bool highlight) -> render::StatsSnapshot {
    render::StatsSnapshot snapshot;
    snapshot.pacmanVersion = stats.pacmanVersion;

    for (const StatId id : magic_enum::enum_values<StatId>())
      snapshot.entries.emplace(id, render::StatEntry { .id = id, .label = StatDisplayLabel(id, diskPath), .value = FormatStatValue(id, stats, highlight) });

    return snapshot;
  }

  auto ParseSecondsSinceUpgrade(const StringView logContents, const std::chrono::system_clock::time_point now) -> Result<i64> {
    Option<StringView> pendingStart;
    Option<StringView> lastCompleted;

    ForEachLine(logContents, [&](const StringView rawLine) {
      const StringView line = Trim(rawLine);

      if (!line.starts_with('['))
        return;

      const usize      close     = line.find(']');
      const StringView timestamp = close == StringView::npos ? StringView {} : line.substr(1, close - 1);

      if (line.find(UPGRADE_START) != StringView::npos)
        pendingStart = timestamp;

      if (pendingStart && line.find(UPGRADE_DONE) != StringView::npos) {
        lastCompleted = pendingStart;
        pendingStart.reset();
      }
    });

    if (!lastCompleted)
      ERR(NotFound, "no completed full system upgrade in pacman.log");

    const i64 startedAt = TRY(ParseLogTimestamp(*lastCompleted));
    const i64 nowSecs   = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    return std::max<i64>(nowSecs - startedAt, 0);
  }

  auto ParseMirrorUrl(const StringView mirrorlist) -> Option<String> {
    constexpr StringView SERVER_PREFIX = "Server = ";

    Option<String> url;

    ForEachLine(mirrorlist, [&](const StringView rawLine) {
      const StringView line = Trim(rawLine);

      if (url || !line.starts_with(SERVER_PREFIX))
        return;

      const StringView server = line.substr(SERVER_PREFIX.size());
      url                     = String(server.substr(0, server.find("/$repo")));
    });

    return url;
  }

  auto ParsePacmanVersion(const StringView output) -> Option<String> {
    Option<String> version;

    ForEachLine(output, [&](const StringView line) {
      if (version || line.find("libalpm v") == StringView::npos)
        return;

      if (const usize start = line.find("Pacman v"); start != StringView::npos)
        version = String(Trim(line.substr(start)));
    });

    return version;
  }

  auto ParseLocalPackageDesc(const StringView contents) -> Result<LocalPackage> {
    LocalPackage pkg;
    String       section;
    bool         sawName = false;

    ForEachLine(contents, [&](const StringView rawLine) {
      const StringView line = Trim(rawLine);

      if (line.empty()) {
        section.clear();
        return;
      }

      if (line.size() > 2 && line.front() == '%' && line.back() == '%') {
        section = String(line);
        return;
      }

      using matchit::match, matchit::is, matchit::_;

      match(StringView(section))(
        is | "%NAME%" = [&] {
          pkg.name = String(line);
          sawName  = true;
        },
        is | "%SIZE%"       = [&] { pkg.installedSize = ParseNumber<u64>(line).value_or(0); },
        is | "%REASON%"     = [&] { pkg.explicitlyInstalled = line != "1"; },
        is | "%DEPENDS%"    = [&] { pkg.depends.push_back(BareName(line)); },
        is | "%OPTDEPENDS%" = [&] { pkg.optDepends.push_back(BareName(line)); },
        is | "%PROVIDES%"   = [&] { pkg.provides.push_back(BareName(line)); },
        is | _              = [] {}
      );
    });

    if (!sawName || pkg.name.empty())
      ERR(ParseError, "package desc has no %NAME% section");

    return pkg;
  }

  auto FindOrphans(const Span<const LocalPackage> packages) -> Pair<u32, u64> {
    std::unordered_set<String> required;

    for (const LocalPackage& pkg : packages) {
      for (const String& dep : pkg.depends)
        required.insert(dep);
      for (const String& opt : pkg.optDepends)
        required.insert(opt);
    }

    u32 count = 0;
    u64 size  = 0;

    for (const LocalPackage& pkg : packages) {
      if (pkg.explicitlyInstalled || required.contains(pkg.name))
        continue;

      if (std::ranges::any_of(pkg.provides, [&](const String& provided) { return required.contains(provided); }))
        continue;

      ++count;
      size += pkg.installedSize;
    }

    return { count, size };
  }

  auto ParseUpgradeList(const StringView output) -> Vec<String> {
    Vec<String> names;

    ForEachLine(output, [&](const StringView rawLine) {
      const StringView line = Trim(rawLine);

      if (line.empty() || line.ends_with("[ignored]"))
        return;

      // Names are single-quoted into the `pacman -Si` command line later.
      const StringView name = line.substr(0, line.find(' '));

      if (!name.empty() && name.find_first_of("'\"") == StringView::npos)
        names.emplace_back(name);
    });

    return names;
  }

  auto ParseSizeField(const StringView value) -> Option<u64> {
    using matchit::match, matchit::is, matchit::_;

    const StringView trimmed = Trim(value);
    const usize      space   = trimmed.find(' ');

    if (space == StringView::npos)
      return None;

    f64 amount = 0.0;

    const StringView number = trimmed.substr(0, space);
    const StringView unit   = Trim(trimmed.substr(space));

    const auto [ptr, errc] = std::from_chars(number.data(), number.data() + number.size(), amount);

    if (errc != std::errc {} || ptr != number.data() + number.size() || amount < 0.0)
      return None;

    const f64 multiplier = match(unit)(
      is | "B"   = 1.0,
      is | "KiB" = 1024.0,
      is | "MiB" = 1024.0 * 1024.0,
      is | "GiB" = 1024.0 * 1024.0 * 1024.0,
      is | "TiB" = 1024.0 * 1024.0 * 1024.0 * 1024.0,
      is | _     = 0.0
    );

    if (multiplier == 0.0)
      return None;

    return static_cast<u64>(std::llround(amount * multiplier));
  }

  auto ParseSyncPackageInfo(const StringView output) -> Vec<SyncPackage> {
    Vec<SyncPackage>           packages;
    std::unordered_set<String> seen;
    Option<SyncPackage>        current;

    const auto flush = [&] {
      if (current && !current->name.empty() && seen.insert(current->name).second)
        packages.push_back(std::move(*current));

      current.reset();
    };

    ForEachLine(output, [&](const StringView rawLine) {
      if (Trim(rawLine).empty()) {
        flush();
        return;
      }

      // Continuation lines of multi-value fields are indented.
      if (rawLine.starts_with(' '))
        return;

      const usize colon = rawLine.find(':');

      if (colon == StringView::npos)
        return;

      const StringView key   = Trim(rawLine.substr(0, colon));
      const StringView value = Trim(rawLine.substr(colon + 1));

      if (!current)
        current = SyncPackage {};

      if (key == "Name")
        current->name = String(value);
      else if (key == "Download Size")
        current->downloadSize = ParseSizeField(value).value_or(0);
      else if (key == "Installed Size")
        current->installedSize = ParseSizeField(value).value_or(0);
    });

    flush();
    return packages;
  }

  auto SumUpgradeSizes(const Span<const SyncPackage> upgrades, const Span<const LocalPackage> installed) -> UpgradeSizes {
    UnorderedMap<String, u64> localSizes;

    for (const LocalPackage& pkg : installed)
      localSizes.emplace(pkg.name, pkg.installedSize);

    u64 downloadTotal  = 0;
    u64 installedTotal = 0;
    i64 net            = 0;

    for (const SyncPackage& pkg : upgrades) {
      downloadTotal += pkg.downloadSize;
      installedTotal += pkg.installedSize;
      net += static_cast<i64>(pkg.installedSize);

      if (const auto iter = localSizes.find(pkg.name); iter != localSizes.end())
        net -= static_cast<i64>(iter->second);
    }

    f64 netMb = static_cast<f64>(net) / BYTES_PER_MIB;

    if (netMb > -0.01 && netMb < 0.01)
      netMb = 0.0;

    return {
      .downloadMb  = static_cast<f64>(downloadTotal) / BYTES_PER_MIB,
      .installedMb = static_cast<f64>(installedTotal) / BYTES_PER_MIB,
      .netMb       = netMb,
    };
  }

  auto CollectPacmanStats(const Span<const Declaration> requested, const StringView diskPath) -> PacmanStats {
    using std::chrono::steady_clock;

    PacmanStats stats;

    const auto timed = [](const StringView probe, auto&& body) {
      const steady_clock::time_point start = steady_clock::now();
      body();
      debug_log("{}: {}us", probe, std::chrono::duration_cast<std::chrono::microseconds>(steady_clock::now() - start).count());
    };

    if (Requests(requested, { StatId::Installed }))
      timed("installed count", [&] { Assign(CountInstalled(), stats.totalInstalled); });

    if (Requests(requested, { StatId::Upgradable, StatId::DownloadSize, StatId::InstalledSize, StatId::NetUpgradeSize }))
      timed("upgrades", [&] {
        Result<UpgradeProbe> upgrades = GetUpgrades(Requests(requested, { StatId::DownloadSize, StatId::InstalledSize, StatId::NetUpgradeSize }));

        if (!upgrades) {
          LogProbeFailure(upgrades.error());
          return;
        }

        stats.totalUpgradable = upgrades->count;

        if (upgrades->sizes) {
          stats.downloadSizeMb   = upgrades->sizes->downloadMb;
          stats.installedSizeMb  = upgrades->sizes->installedMb;
          stats.netUpgradeSizeMb = upgrades->sizes->netMb;
        }
      });

    if (Requests(requested, { StatId::OrphanedPackages }))
      timed("orphaned packages", [&] {
        Result<Pair<u32, u64>> orphans = GetOrphans();

        if (orphans) {
          stats.orphanedPackages = orphans->first;
          stats.orphanedSizeMb   = static_cast<f64>(orphans->second) / BYTES_PER_MIB;
        } else {
          debug_at(orphans.error());
        }
      });

    if (Requests(requested, { StatId::LastUpdate }))
      timed("last update", [&] {
        Result<String> log = ReadFile(PACMAN_LOG);

        if (log)
          Assign(ParseSecondsSinceUpgrade(*log, std::chrono::system_clock::now()), stats.secondsSinceLastUpdate);
        else
          debug_at(log.error());
      });

    if (Requests(requested, { StatId::CacheSize }))
      timed("cache size", [&] { Assign(GetCacheSizeMb(), stats.cacheSizeMb); });

    if (Requests(requested, { StatId::MirrorUrl, StatId::MirrorHealth }))
      timed("mirror url", [&] {
        Result<String> mirrorlist = ReadFile(PACMAN_MIRRORLIST);

        if (mirrorlist)
          stats.mirrorUrl = ParseMirrorUrl(*mirrorlist);
        else
          debug_at(mirrorlist.error());
      });

    if (Requests(requested, { StatId::Disk }))
      timed("disk usage", [&] {
        Result<Pair<u64, u64>> usage = GetDiskUsage(diskPath);

        if (usage) {
          stats.diskUsedBytes  = usage->first;
          stats.diskTotalBytes = usage->second;
        } else {
          debug_at(usage.error());
        }
      });

    timed("pacman version", [&] {
      Result<String> output = RunCommand("pacman --version 2>/dev/null");

      if (output)
        stats.pacmanVersion = ParsePacmanVersion(*output);
      else
        debug_at(output.error());
    });

    return stats;
  }
} // namespace pacfetch::services::stats
