#include <boost/ut.hpp>

#include <Pacfetch/Render/Layout.hpp>
#include <Pacfetch/Render/Text.hpp>

namespace {
  using namespace pacfetch::render;
  using namespace pacfetch::utils::types;

  auto Embedded(String line, String leftCap, String rightCap) -> TitleSpec {
    TitleSpec spec;
    spec.style    = TitleStyle::Embedded;
    spec.line     = std::move(line);
    spec.leftCap  = std::move(leftCap);
    spec.rightCap = std::move(rightCap);
    return spec;
  }
} // namespace

auto main() -> int {
  using namespace boost::ut;

  "stacked title renders text and an underline"_test = [] -> void {
    const Vec<String> lines = RenderTitle(TitleSpec {}, "Stats", 5, None, None);

    expect(lines.size() == 2_ul);
    expect(lines[0] == String("Stats"));
    expect(lines[1] == String("-----"));
  };

  "stacked title with empty text renders only the line"_test = [] -> void {
    const Vec<String> lines = RenderTitle(TitleSpec {}, "", 4, None, None);

    expect(lines.size() == 1_ul);
    expect(lines[0] == String("----"));
  };

  "stacked alignment"_test = [] -> void {
    TitleSpec spec;

    expect(RenderTitle(spec, "ab", 6, None, None)[0] == String("ab    "));

    spec.align = TitleAlign::Center;
    expect(RenderTitle(spec, "ab", 7, None, None)[0] == String("  ab   "));

    spec.align = TitleAlign::Right;
    expect(RenderTitle(spec, "ab", 6, None, None)[0] == String("    ab"));
  };

  "stacked text wider than the width is not truncated"_test = [] -> void {
    const Vec<String> lines = RenderTitle(TitleSpec {}, "Pacman v7.1.0", 4, None, None);

    expect(lines[0] == String("Pacman v7.1.0"));
    expect(lines[1] == String("----"));
  };

  "multi-character line patterns are cut to width"_test = [] -> void {
    TitleSpec spec;
    spec.line = "=-";

    expect(RenderTitle(spec, "", 5, None, None)[0] == String("=-=-="));
  };

  "embedded title with empty text is all fill"_test = [] -> void {
    const Vec<String> lines = RenderTitle(Embedded("─", "├", "┤"), "", 7, None, None);

    expect(lines.size() == 1_ul);
    expect(lines[0] == String("├─────┤"));
  };

  "embedded title centers by default"_test = [] -> void {
    const Vec<String> lines = RenderTitle(Embedded("─", "├", "┤"), "Stats", 14, None, None);

    expect(lines.size() == 1_ul);
    expect(lines[0] == String("├── Stats ───┤"));
    expect(GetVisualWidth(lines[0]) == 14_ul);
  };

  "embedded alignment keeps one fill column on the near side"_test = [] -> void {
    TitleSpec spec = Embedded("-", "[", "]");

    spec.align = TitleAlign::Left;
    expect(RenderTitle(spec, "ab", 10, None, None)[0] == String("[- ab ---]"));

    spec.align = TitleAlign::Right;
    expect(RenderTitle(spec, "ab", 10, None, None)[0] == String("[--- ab -]"));
  };

  "embedded title narrower than its text has no fill"_test = [] -> void {
    const Vec<String> lines = RenderTitle(Embedded("-", "<", ">"), "long title", 4, None, None);

    expect(lines[0] == String("< long title >"));
  };

  "none color leaves existing styling untouched"_test = [] -> void {
    const String styled = "\033[35mMy Box\033[0m";
    const Vec<String> lines = RenderTitle(TitleSpec {}, styled, 6, None, None);

    expect(lines[0] == styled);
  };

  "a concrete color replaces existing styling"_test = [] -> void {
    const String styled = "\033[35mMy Box\033[0m";
    const Vec<String> lines = RenderTitle(TitleSpec {}, styled, 6, Option<Color>(LogColor::Yellow), Option<Color>(LogColor::Blue));

    expect(lines[0] == String("\033[1m\033[38;5;3mMy Box\033[0m"));
    expect(lines[1] == String("\033[38;5;4m------\033[0m"));
  };

  "embedded segments are colored independently"_test = [] -> void {
    const Vec<String> lines = RenderTitle(Embedded("-", "[", "]"), "ab", 8, Option<Color>(LogColor::Red), Option<Color>(LogColor::Blue));

    expect(lines[0] == String("\033[38;5;4m[-\033[0m\033[1m\033[38;5;1m ab \033[0m\033[38;5;4m-]\033[0m"));
  };

  "stat lines"_test = [] -> void {
    const StatEntry installed { .id = StatId::Installed, .label = "Installed", .value = "1268" };
    const StatEntry missing { .id = StatId::Upgradable, .label = "Upgradable", .value = None };

    expect(RenderStat(installed, ": ", None) == String("Installed: 1268"));
    expect(RenderStat(missing, ": ", None) == String("Upgradable: -"));
    expect(RenderStat(installed, " => ", None) == String("Installed => 1268"));
    expect(RenderStat(installed, ": ", Option<Color>(LogColor::BrightYellow)) == String("\033[1m\033[38;5;11mInstalled\033[0m: 1268"));
  };

  return 0;
}
