#include "Pacfetch/Render/Compositor.hpp"

#include <algorithm> // std::max
#include <format>    // std::format

#include "Pacfetch/Render/Text.hpp"

using namespace pacfetch::utils::types;
using pacfetch::utils::logging::LogColor;
using pacfetch::utils::logging::LogLevelConst;

namespace {
  constexpr StringView SWATCH = "   ";

  /// Unlike Colorize, keeps the row's own escape codes so multi-colored art survives a base color.
  auto TintArtRow(const String& row, const Option<pacfetch::render::Color>& color) -> String {
    if (!color)
      return row;

    return std::format("{}{}{}", pacfetch::render::ForegroundCode(*color), row, LogLevelConst::RESET_CODE);
  }

  auto PaletteRow(const u8 first) -> String {
    String row;

    for (u8 idx = first; idx < first + 8; ++idx) {
      row += pacfetch::render::BackgroundCode(static_cast<LogColor>(idx));
      row += SWATCH;
      row += LogLevelConst::RESET_CODE;
    }

    return row;
  }
} // namespace

namespace pacfetch::render {
  auto PaletteRows() -> Array<String, 2> {
    return { PaletteRow(0), PaletteRow(8) };
  }

  auto Compose(const Span<const String> statLines, const Span<const String> artRows, const Option<Color>& artColor) -> Vec<String> {
    Vec<String> output;
    output.emplace_back();

    if (artRows.empty()) {
      output.insert(output.end(), statLines.begin(), statLines.end());
      output.emplace_back();
      return output;
    }

    usize artWidth = 0;
    for (const String& row : artRows)
      artWidth = std::max(artWidth, GetVisualWidth(row));

    const String blankArt(artWidth, ' ');
    const usize  rowCount = std::max(artRows.size(), statLines.size());

    output.reserve(rowCount + 2);

    for (usize idx = 0; idx < rowCount; ++idx) {
      String row = " ";

      if (idx < artRows.size())
        row += PadRight(TintArtRow(artRows[idx], artColor), artWidth);
      else
        row += blankArt;

      row += GUTTER;

      if (idx < statLines.size())
        row += statLines[idx];

      output.push_back(std::move(row));
    }

    output.emplace_back();
    return output;
  }
} // namespace pacfetch::render
