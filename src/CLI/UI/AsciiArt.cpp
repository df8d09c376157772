#include "AsciiArt.hpp"

#include <algorithm>  // std::ranges::max
#include <filesystem> // std::filesystem::{path, exists}
#include <format>     // std::format
#include <fstream>    // std::ifstream
#include <system_error> // std::error_code
#include <matchit.hpp>

#include <Pacfetch/Render/Text.hpp>
#include <Pacfetch/Utils/Env.hpp>
#include <Pacfetch/Utils/Logging.hpp>

namespace fs = std::filesystem;

using namespace pacfetch::utils::types;
using enum pacfetch::utils::error::PfErrorCode;

namespace pacfetch::ui::ascii {
  auto SplitRows(const StringView block) -> Vec<String> {
    Vec<String> rows;
    usize       start = 0;

    while (start < block.size()) {
      usize end = block.find('\n', start);

      if (end == StringView::npos)
        end = block.size();

      StringView row = block.substr(start, end - start);

      if (row.ends_with('\r'))
        row.remove_suffix(1);

      rows.emplace_back(row);
      start = end + 1;
    }

    return rows;
  }

  auto NormalizeWidth(Vec<String> rows) -> Vec<String> {
    usize maxWidth = 0;

    for (const String& row : rows)
      maxWidth = std::max(maxWidth, render::GetVisualWidth(row));

    for (String& row : rows)
      row.append(maxWidth - render::GetVisualWidth(row), ' ');

    return rows;
  }

  auto LoadArtFile(const StringView path) -> Result<Vec<String>> {
    const fs::path expanded = TRY(utils::env::ExpandTilde(path));

    if (std::error_code errc; !fs::exists(expanded, errc))
      ERR_FMT(NotFound, "'{}' does not exist", expanded.string());

    std::ifstream file(expanded);

    if (!file)
      ERR_FMT(PermissionDenied, "failed to open '{}'", expanded.string());

    Vec<String> rows;

    for (String line; std::getline(file, line);) {
      if (line.ends_with('\r'))
        line.pop_back();

      rows.push_back(std::move(line));
    }

    if (file.bad())
      ERR_FMT(IoError, "failed to read '{}'", expanded.string());

    return rows;
  }

  auto GetAsciiArt(const StringView spec, render::WarningSink& sink) -> Vec<String> {
    using matchit::match, matchit::is, matchit::_;

    if (spec == "NONE")
      return {};

    if (spec.contains('\n'))
      return NormalizeWidth(SplitRows(spec));

    if (spec.starts_with('/') || spec.starts_with('~') || spec.starts_with('.')) {
      Result<Vec<String>> rows = LoadArtFile(spec);

      if (!rows) {
        sink.warn(std::format("failed to load ASCII art from '{}': {}; using PACMAN_DEFAULT", spec, rows.error().message));
        return SplitRows(logos::PACMAN_DEFAULT);
      }

      return NormalizeWidth(*std::move(rows));
    }

    return match(spec)(
      is | "PACMAN_SMALL" = [] { return SplitRows(logos::PACMAN_SMALL); },
      is | "PACMAN_DEFAULT" = [] { return SplitRows(logos::PACMAN_DEFAULT); },
      is | _ = [&] {
        debug_log("Unknown ASCII art '{}', using PACMAN_DEFAULT", spec);
        return SplitRows(logos::PACMAN_DEFAULT);
      }
    );
  }
} // namespace pacfetch::ui::ascii
