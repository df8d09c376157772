#pragma once

#include "Pacfetch/Render/Color.hpp"
#include "Pacfetch/Utils/Types.hpp"

namespace pacfetch::render {
  namespace types = ::pacfetch::utils::types;

  /// Space between the art column and the stat column.
  inline constexpr types::StringView GUTTER = "   ";

  /**
   * @brief Two rows of eight three-space swatches: background colors 0-7, then 8-15.
   */
  auto PaletteRows() -> types::Array<types::String, 2>;

  /**
   * @brief Merges rendered stat lines with an ASCII-art block.
   *
   * Row i is " " + art row i (or blank padding once the art runs out) + the
   * gutter + stat line i (or nothing once the stats run out). Art rows are
   * padded to the widest row and painted with @p artColor. With no art the
   * stat lines are returned unindented. The block always starts and ends
   * with a blank line.
   */
  auto Compose(
    types::Span<const types::String> statLines,
    types::Span<const types::String> artRows,
    const types::Option<Color>&      artColor
  ) -> types::Vec<types::String>;
} // namespace pacfetch::render
