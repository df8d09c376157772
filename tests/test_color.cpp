#include <boost/ut.hpp>

#include <Pacfetch/Render/Color.hpp>
#include <Pacfetch/Render/WarningSink.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace pacfetch::render;
  using namespace pacfetch::utils::types;
  using pacfetch::utils::error::PfErrorCode;

  "named colors"_test = [] -> void {
    expect(*LookupColor("red") == Option<Color>(LogColor::Red));
    expect(*LookupColor("bright_yellow") == Option<Color>(LogColor::BrightYellow));
    expect(*LookupColor("dark_blue") == Option<Color>(LogColor::Blue));
    expect(*LookupColor("grey") == Option<Color>(LogColor::White));
    expect(*LookupColor("dark_gray") == Option<Color>(LogColor::Gray));
    expect(*LookupColor("white") == Option<Color>(LogColor::BrightWhite));
  };

  "tokens are trimmed and case-insensitive"_test = [] -> void {
    expect(*LookupColor("  Yellow ") == Option<Color>(LogColor::Yellow));
    expect(*LookupColor("NONE") == Option<Color>(None));
  };

  "none resolves to no color"_test = [] -> void {
    Result<Option<Color>> color = LookupColor("none");

    expect(color.has_value());
    expect(!color->has_value());
  };

  "hex colors"_test = [] -> void {
    expect(*LookupColor("#ff8800") == Option<Color>(Rgb { .r = 0xff, .g = 0x88, .b = 0x00 }));
    expect(*LookupColor("#00AAff") == Option<Color>(Rgb { .r = 0x00, .g = 0xaa, .b = 0xff }));
  };

  "malformed tokens are errors"_test = [] -> void {
    for (const StringView token : { "#fff", "#gg0000", "#12345678", "purple", "" }) {
      Result<Option<Color>> color = LookupColor(token);

      expect(!color.has_value()) << token;
      if (!color)
        expect(color.error().code == PfErrorCode::ParseError);
    }
  };

  "ParseColor warns and falls back to no color"_test = [] -> void {
    MemoryWarningSink sink;

    expect(!ParseColor("purple", sink).has_value());
    expect(sink.count() == 1_ul);
    expect(sink.messages().front().contains("purple"));

    expect(ParseColor("cyan", sink) == Option<Color>(LogColor::Cyan));
    expect(sink.count() == 1_ul);
  };

  "SGR codes"_test = [] -> void {
    expect(ForegroundCode(LogColor::Yellow) == String("\033[38;5;3m"));
    expect(BackgroundCode(LogColor::BrightWhite) == String("\033[48;5;15m"));
    expect(ForegroundCode(Rgb { .r = 1, .g = 2, .b = 3 }) == String("\033[38;2;1;2;3m"));
    expect(BackgroundCode(Rgb { .r = 255, .g = 0, .b = 16 }) == String("\033[48;2;255;0;16m"));
  };

  "Colorize with no color passes text through"_test = [] -> void {
    const String styled = "\033[31mred\033[0m";

    expect(Colorize(styled, None) == styled);
    expect(Colorize("plain", None, true) == String("plain"));
  };

  "Colorize replaces existing styling"_test = [] -> void {
    const String styled = "\033[31mred\033[0m";

    expect(Colorize(styled, Option<Color>(LogColor::Yellow)) == String("\033[38;5;3mred\033[0m"));
    expect(Colorize("x", Option<Color>(LogColor::Red), true) == String("\033[1m\033[38;5;1mx\033[0m"));
  };

  return 0;
}
