#include "Pacfetch/Render/Color.hpp"

#include <algorithm>   // std::ranges::transform
#include <cctype>      // std::tolower
#include <charconv>    // std::from_chars
#include <format>      // std::format
#include <matchit.hpp> // matchit::{match, is, or_, _}

#include "Pacfetch/Render/Text.hpp"

using namespace pacfetch::utils::types;
using enum pacfetch::utils::error::PfErrorCode;
using pacfetch::utils::logging::LogColor;
using pacfetch::utils::logging::LogLevelConst;

namespace {
  auto NormalizeToken(const StringView token) -> String {
    const usize first = token.find_first_not_of(" \t\r\n");

    if (first == StringView::npos)
      return {};

    const usize last = token.find_last_not_of(" \t\r\n");

    String lowered(token.substr(first, last - first + 1));
    std::ranges::transform(lowered, lowered.begin(), [](const u8 chr) { return static_cast<CStr>(std::tolower(chr)); });
    return lowered;
  }

  auto NamedColor(const StringView name) -> Option<LogColor> {
    using matchit::match, matchit::is, matchit::or_, matchit::_;

    // clang-format off
    return match(name)(
      is | "black"                                   = Some(LogColor::Black),
      is | or_("red", "dark_red")                    = Some(LogColor::Red),
      is | or_("green", "dark_green")                = Some(LogColor::Green),
      is | or_("yellow", "dark_yellow")              = Some(LogColor::Yellow),
      is | or_("blue", "dark_blue")                  = Some(LogColor::Blue),
      is | or_("magenta", "dark_magenta")            = Some(LogColor::Magenta),
      is | or_("cyan", "dark_cyan")                  = Some(LogColor::Cyan),
      is | or_("grey", "gray")                       = Some(LogColor::White),
      is | or_("dark_grey", "dark_gray", "bright_black") = Some(LogColor::Gray),
      is | "bright_red"                              = Some(LogColor::BrightRed),
      is | "bright_green"                            = Some(LogColor::BrightGreen),
      is | "bright_yellow"                           = Some(LogColor::BrightYellow),
      is | "bright_blue"                             = Some(LogColor::BrightBlue),
      is | "bright_magenta"                          = Some(LogColor::BrightMagenta),
      is | "bright_cyan"                             = Some(LogColor::BrightCyan),
      is | or_("white", "bright_white")              = Some(LogColor::BrightWhite),
      is | _                                         = Option<LogColor>(None)
    );
    // clang-format on
  }

  auto ParseHexByte(const StringView digits) -> Option<u8> {
    u8 value = 0;

    const auto [ptr, errc] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);

    if (errc != std::errc {} || ptr != digits.data() + digits.size())
      return None;

    return value;
  }

  auto SgrCode(const pacfetch::render::Color& color, const bool background) -> String {
    if (const auto* indexed = std::get_if<LogColor>(&color)) {
      const auto idx = static_cast<usize>(*indexed);
      return String(background ? LogLevelConst::BACKGROUND_CODE_LITERALS.at(idx) : LogLevelConst::COLOR_CODE_LITERALS.at(idx));
    }

    const auto& rgb = std::get<pacfetch::render::Rgb>(color);
    return std::format("\033[{};2;{};{};{}m", background ? 48 : 38, rgb.r, rgb.g, rgb.b);
  }
} // namespace

namespace pacfetch::render {
  auto LookupColor(const StringView token) -> Result<Option<Color>> {
    const String name = NormalizeToken(token);

    if (name == "none")
      return Option<Color>(None);

    if (name.starts_with('#')) {
      if (name.size() != 7)
        ERR_FMT(ParseError, "invalid hex color '{}': expected #RRGGBB", token);

      const Option<u8> red   = ParseHexByte(StringView(name).substr(1, 2));
      const Option<u8> green = ParseHexByte(StringView(name).substr(3, 2));
      const Option<u8> blue  = ParseHexByte(StringView(name).substr(5, 2));

      if (!red || !green || !blue)
        ERR_FMT(ParseError, "invalid hex color '{}': non-hex digits", token);

      return Option<Color>(Rgb { .r = *red, .g = *green, .b = *blue });
    }

    if (const Option<LogColor> named = NamedColor(name))
      return Option<Color>(*named);

    ERR_FMT(ParseError, "unknown color '{}'", token);
  }

  auto ParseColor(const StringView token, WarningSink& sink) -> Option<Color> {
    Result<Option<Color>> color = LookupColor(token);

    if (!color) {
      sink.warn(std::format("{}; using no color", color.error().message));
      return None;
    }

    return *color;
  }

  auto ForegroundCode(const Color& color) -> String {
    return SgrCode(color, false);
  }

  auto BackgroundCode(const Color& color) -> String {
    return SgrCode(color, true);
  }

  auto Colorize(const StringView text, const Option<Color>& color, const bool bold) -> String {
    if (!color)
      return String(text);

    String result;
    result.reserve(text.size() + 24);

    if (bold)
      result += LogLevelConst::BOLD_START;

    result += ForegroundCode(*color);
    result += StripAnsi(text);
    result += LogLevelConst::RESET_CODE;

    return result;
  }
} // namespace pacfetch::render
