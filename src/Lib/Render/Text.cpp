#include "Pacfetch/Render/Text.hpp"

using namespace pacfetch::utils::types;

namespace {
  constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;
  constexpr char     ESC                   = '\033';
  constexpr char     BEL                   = '\a';

  constexpr auto IsContinuation(const u8 byte) -> bool {
    return (byte & 0xC0) == 0x80;
  }

  /**
   * @brief Length in bytes of the escape sequence starting at @p pos (which must be ESC).
   *
   * CSI (ESC '[') runs to its final byte in 0x40-0x7E, OSC (ESC ']') runs to
   * BEL or ESC '\'. Any other ESC consumes itself plus one byte.
   */
  auto EscapeSequenceLength(const StringView str, const usize pos) -> usize {
    const usize size = str.size();

    if (pos + 1 >= size)
      return size - pos;

    const char introducer = str[pos + 1];

    if (introducer == '[') {
      usize idx = pos + 2;
      while (idx < size) {
        const auto byte = static_cast<u8>(str[idx++]);
        if (byte >= 0x40 && byte <= 0x7E)
          break;
      }
      return idx - pos;
    }

    if (introducer == ']') {
      usize idx = pos + 2;
      while (idx < size) {
        if (str[idx] == BEL)
          return idx + 1 - pos;

        if (str[idx] == ESC && idx + 1 < size && str[idx + 1] == '\\')
          return idx + 2 - pos;

        ++idx;
      }
      return idx - pos;
    }

    return 2;
  }

  constexpr auto IsZeroWidth(const char32_t codepoint) -> bool {
    return (codepoint >= 0x0300 && codepoint <= 0x036F) || // Combining Diacritical Marks
      (codepoint >= 0x200B && codepoint <= 0x200F) ||      // zero-width space, joiners, direction marks
      (codepoint >= 0x20D0 && codepoint <= 0x20FF) ||      // Combining Marks for Symbols
      (codepoint >= 0xFE00 && codepoint <= 0xFE0F) ||      // Variation Selectors
      (codepoint >= 0xFE20 && codepoint <= 0xFE2F) ||      // Combining Half Marks
      codepoint == 0xFEFF ||                               // BOM
      codepoint < 0x20 || codepoint == 0x7F;               // C0 controls, DEL
  }
} // namespace

namespace pacfetch::render {
  auto DecodeUTF8(const StringView str, usize& pos) -> char32_t {
    if (pos >= str.size())
      return 0;

    const auto first = static_cast<u8>(str[pos]);

    if ((first & 0x80) == 0) {
      ++pos;
      return first;
    }

    usize    length    = 0;
    char32_t codepoint = 0;

    if ((first & 0xE0) == 0xC0) {
      length    = 2;
      codepoint = first & 0x1F;
    } else if ((first & 0xF0) == 0xE0) {
      length    = 3;
      codepoint = first & 0x0F;
    } else if ((first & 0xF8) == 0xF0) {
      length    = 4;
      codepoint = first & 0x07;
    } else {
      ++pos;
      return REPLACEMENT_CHARACTER;
    }

    if (pos + length > str.size()) {
      ++pos;
      return REPLACEMENT_CHARACTER;
    }

    for (usize idx = 1; idx < length; ++idx) {
      const auto byte = static_cast<u8>(str[pos + idx]);

      if (!IsContinuation(byte)) {
        ++pos;
        return REPLACEMENT_CHARACTER;
      }

      codepoint = (codepoint << 6) | (byte & 0x3F);
    }

    pos += length;
    return codepoint;
  }

  auto IsWideCharacter(const char32_t codepoint) -> bool {
    return (codepoint >= 0x1100 && codepoint <= 0x115F) || // Hangul Jamo
      (codepoint >= 0x2329 && codepoint <= 0x232A) ||      // Angle brackets
      (codepoint >= 0x2E80 && codepoint <= 0x303E) ||      // CJK Radicals .. CJK Symbols and Punctuation
      (codepoint >= 0x3041 && codepoint <= 0x33FF) ||      // Hiragana .. CJK Compatibility
      (codepoint >= 0x3400 && codepoint <= 0x4DBF) ||      // CJK Unified Ideographs Extension A
      (codepoint >= 0x4E00 && codepoint <= 0x9FFF) ||      // CJK Unified Ideographs
      (codepoint >= 0xA000 && codepoint <= 0xA4CF) ||      // Yi
      (codepoint >= 0xAC00 && codepoint <= 0xD7A3) ||      // Hangul Syllables
      (codepoint >= 0xF900 && codepoint <= 0xFAFF) ||      // CJK Compatibility Ideographs
      (codepoint >= 0xFE10 && codepoint <= 0xFE19) ||      // Vertical Forms
      (codepoint >= 0xFE30 && codepoint <= 0xFE6F) ||      // CJK Compatibility Forms
      (codepoint >= 0xFF00 && codepoint <= 0xFF60) ||      // Fullwidth Forms
      (codepoint >= 0xFFE0 && codepoint <= 0xFFE6) ||      // Fullwidth Signs
      (codepoint >= 0x1F300 && codepoint <= 0x1F64F) ||    // Misc Symbols and Pictographs, Emoticons
      (codepoint >= 0x1F900 && codepoint <= 0x1F9FF) ||    // Supplemental Symbols and Pictographs
      (codepoint >= 0x20000 && codepoint <= 0x2FFFD) ||    // CJK Unified Ideographs Extension B..E
      (codepoint >= 0x30000 && codepoint <= 0x3FFFD);      // CJK Unified Ideographs Extension F
  }

  auto CodepointWidth(const char32_t codepoint) -> usize {
    if (IsZeroWidth(codepoint))
      return 0;

    return IsWideCharacter(codepoint) ? 2 : 1;
  }

  auto GetVisualWidth(const StringView str) -> usize {
    usize width = 0;
    usize pos   = 0;

    while (pos < str.size()) {
      if (str[pos] == ESC) {
        pos += EscapeSequenceLength(str, pos);
        continue;
      }

      width += CodepointWidth(DecodeUTF8(str, pos));
    }

    return width;
  }

  auto StripAnsi(const StringView str) -> String {
    String result;
    result.reserve(str.size());

    usize pos = 0;
    while (pos < str.size()) {
      if (str[pos] == ESC) {
        pos += EscapeSequenceLength(str, pos);
        continue;
      }

      const usize next = str.find(ESC, pos);
      const usize end  = next == StringView::npos ? str.size() : next;

      result.append(str.substr(pos, end - pos));
      pos = end;
    }

    return result;
  }

  auto RepeatToWidth(const StringView pattern, const usize width) -> String {
    const String plain = StripAnsi(pattern);

    if (GetVisualWidth(plain) == 0)
      return String(width, ' ');

    String result;
    result.reserve(width * 3);

    usize filled = 0;
    usize pos    = 0;

    while (filled < width) {
      if (pos >= plain.size())
        pos = 0;

      const usize    start     = pos;
      const char32_t codepoint = DecodeUTF8(plain, pos);
      const usize    cols      = CodepointWidth(codepoint);

      if (filled + cols > width) {
        result.append(width - filled, ' ');
        break;
      }

      result.append(plain, start, pos - start);
      filled += cols;
    }

    return result;
  }

  auto PadRight(const StringView str, const usize width) -> String {
    String      result(str);
    const usize visible = GetVisualWidth(str);

    if (visible < width)
      result.append(width - visible, ' ');

    return result;
  }
} // namespace pacfetch::render
