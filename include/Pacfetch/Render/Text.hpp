#pragma once

#include "Pacfetch/Utils/Types.hpp"

namespace pacfetch::render {
  namespace types = ::pacfetch::utils::types;

  /**
   * @brief Decodes one UTF-8 code point starting at @p pos and advances it.
   *
   * Invalid or truncated sequences decode as U+FFFD and consume one byte.
   */
  auto DecodeUTF8(types::StringView str, types::usize& pos) -> char32_t;

  /**
   * @brief Whether a code point occupies two terminal columns (CJK, fullwidth forms, most emoji).
   */
  auto IsWideCharacter(char32_t codepoint) -> bool;

  /**
   * @brief Columns a code point occupies: 0 for combining marks and zero-width characters, 2 for wide ones, 1 otherwise.
   */
  auto CodepointWidth(char32_t codepoint) -> types::usize;

  /**
   * @brief Visible column count of a string.
   *
   * Escape sequences (CSI, OSC and two-byte ESC sequences) contribute nothing.
   */
  auto GetVisualWidth(types::StringView str) -> types::usize;

  /// Removes every escape sequence, keeping the printable text.
  auto StripAnsi(types::StringView str) -> types::String;

  /**
   * @brief Repeats @p pattern end-to-end and cuts it to exactly @p width columns.
   *
   * Styling in the pattern is dropped. If a wide character would straddle the
   * cut, a space fills the last column instead. An empty pattern fills with spaces.
   */
  auto RepeatToWidth(types::StringView pattern, types::usize width) -> types::String;

  /// Appends spaces until @p str is @p width columns wide; wider strings are returned unchanged.
  auto PadRight(types::StringView str, types::usize width) -> types::String;
} // namespace pacfetch::render
