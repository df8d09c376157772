#pragma once

#include <variant> // std::variant

#include "Pacfetch/Render/WarningSink.hpp"
#include "Pacfetch/Utils/Error.hpp"
#include "Pacfetch/Utils/Logging.hpp"
#include "Pacfetch/Utils/Types.hpp"

namespace pacfetch::render {
  namespace types = ::pacfetch::utils::types;

  using LogColor = ::pacfetch::utils::logging::LogColor;

  struct Rgb {
    types::u8 r;
    types::u8 g;
    types::u8 b;

    auto operator==(const Rgb&) const -> bool = default;
  };

  /**
   * @brief A concrete terminal color: one of the 16 palette entries or a 24-bit triple.
   */
  using Color = std::variant<LogColor, Rgb>;

  /**
   * @brief Strict lookup of a color token.
   *
   * The token is trimmed and lower-cased first. Returns an empty Option for
   * "none", the color for a known name or "#RRGGBB", and a ParseError otherwise.
   */
  auto LookupColor(types::StringView token) -> types::Result<types::Option<Color>>;

  /**
   * @brief Lenient color resolution: like LookupColor, but a bad token warns and yields no color.
   */
  auto ParseColor(types::StringView token, WarningSink& sink) -> types::Option<Color>;

  /// SGR sequence selecting @p color as the foreground.
  auto ForegroundCode(const Color& color) -> types::String;

  /// SGR sequence selecting @p color as the background.
  auto BackgroundCode(const Color& color) -> types::String;

  /**
   * @brief Applies a color to a text segment.
   *
   * With no color the segment is returned byte-for-byte. With a color, any
   * styling already in the segment is stripped, then the color (and bold, if
   * requested) is applied and reset at the end.
   */
  auto Colorize(types::StringView text, const types::Option<Color>& color, bool bold = false) -> types::String;
} // namespace pacfetch::render
