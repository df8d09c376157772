#include <boost/ut.hpp>

#include <Pacfetch/Render/Text.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace pacfetch::render;
  using namespace pacfetch::utils::types;

  "ASCII width is byte count"_test = [] -> void {
    expect(GetVisualWidth("Installed: 1268") == 15_ul);
    expect(GetVisualWidth("") == 0_ul);
  };

  "escape sequences have no width"_test = [] -> void {
    expect(GetVisualWidth("\033[1m\033[38;5;11mInstalled\033[0m") == 9_ul);
    expect(GetVisualWidth("\033[38;2;255;136;0mx\033[0m") == 1_ul);
    expect(GetVisualWidth("\033]8;;https://archlinux.org\033\\link\033]8;;\033\\") == 4_ul);
  };

  "box drawing and braille are single width"_test = [] -> void {
    expect(GetVisualWidth("├─────┤") == 7_ul);
    expect(GetVisualWidth("⠀⣿⣷") == 3_ul);
  };

  "wide characters take two columns"_test = [] -> void {
    expect(GetVisualWidth("漢字") == 4_ul);
    expect(GetVisualWidth("ｐａｃ") == 6_ul);
    expect(GetVisualWidth("🍕") == 2_ul);
  };

  "combining marks take no columns"_test = [] -> void {
    expect(GetVisualWidth("é") == 1_ul);
  };

  "invalid UTF-8 decodes to the replacement character"_test = [] -> void {
    const String bad = "\xff";
    usize        pos = 0;

    expect(DecodeUTF8(bad, pos) == char32_t(0xFFFD));
    expect(pos == 1_ul);
    expect(GetVisualWidth("a\xe2\x94") == 3_ul);
  };

  "StripAnsi keeps printable text"_test = [] -> void {
    expect(StripAnsi("\033[1m\033[38;5;3mPacman\033[0m v7") == String("Pacman v7"));
    expect(StripAnsi("plain") == String("plain"));
  };

  "RepeatToWidth"_test = [] -> void {
    expect(RepeatToWidth("-", 5) == String("-----"));
    expect(RepeatToWidth("=-", 5) == String("=-=-="));
    expect(RepeatToWidth("─", 3) == String("───"));
    expect(RepeatToWidth("\033[31m-\033[0m", 2) == String("--"));
    expect(RepeatToWidth("", 3) == String("   "));
    expect(RepeatToWidth("-", 0).empty());
  };

  "RepeatToWidth never splits a wide character"_test = [] -> void {
    const String line = RepeatToWidth("漢", 3);

    expect(line == String("漢 "));
    expect(GetVisualWidth(line) == 3_ul);
  };

  "PadRight"_test = [] -> void {
    expect(PadRight("ab", 4) == String("ab  "));
    expect(PadRight("\033[1mab\033[0m", 3) == String("\033[1mab\033[0m "));
    expect(PadRight("abcdef", 3) == String("abcdef"));
  };

  return 0;
}
