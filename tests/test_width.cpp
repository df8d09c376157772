#include <boost/ut.hpp>

#include <Pacfetch/Render/Layout.hpp>

namespace {
  using namespace pacfetch::render;
  using namespace pacfetch::utils::types;

  auto Stat(const StatId id, String label, Option<String> value) -> RenderItem {
    return StatItem { .entry = StatEntry { .id = id, .label = std::move(label), .value = std::move(value) } };
  }

  auto Embedded(String leftCap, String rightCap) -> TitleSpec {
    TitleSpec spec;
    spec.style    = TitleStyle::Embedded;
    spec.leftCap  = std::move(leftCap);
    spec.rightCap = std::move(rightCap);
    return spec;
  }
} // namespace

auto main() -> int {
  using namespace boost::ut;

  "stat footprint counts label, glyph and value"_test = [] -> void {
    const StatEntry entry { .id = StatId::Installed, .label = "Installed", .value = "1268" };

    expect(StatFootprint(entry, ": ") == 15_ul);
    expect(StatFootprint(entry, " -> ") == 17_ul);
  };

  "missing values count as the placeholder"_test = [] -> void {
    const StatEntry entry { .id = StatId::Upgradable, .label = "Upgradable", .value = None };

    expect(StatFootprint(entry, ": ") == 13_ul);
  };

  "title footprints"_test = [] -> void {
    expect(TitleFootprint(TitleSpec {}, "Pacman v7.1.0") == 13_ul);
    expect(TitleFootprint(TitleSpec {}, "") == 0_ul);
    expect(TitleFootprint(Embedded("├", "┤"), "") == 3_ul);
    expect(TitleFootprint(Embedded("├", "┤"), "Stats") == 9_ul);
    expect(TitleFootprint(Embedded("", ""), "漢字") == 6_ul);
  };

  "content width is the widest item"_test = [] -> void {
    const Vec<RenderItem> items = {
      TitleItem { .spec = TitleSpec {}, .text = "Pacman v7.1.0 - libalpm v16.0.1" },
      Stat(StatId::Installed, "Installed", "1268"),
      Stat(StatId::MirrorUrl, "Mirror URL", "https://geo.mirror.pkgbuild.com/core/os/x86_64"),
      UnresolvedItem { .reference = "title.missing" },
    };

    expect(ComputeContentWidth(items, ": ") == 58_ul);
  };

  "styling does not count towards width"_test = [] -> void {
    const Vec<RenderItem> items = {
      Stat(StatId::MirrorHealth, "Mirror Health", "\033[32mOK\033[0m (last sync 1.5 hours)"),
    };

    expect(ComputeContentWidth(items, ": ") == 39_ul);
  };

  "content width floors at one"_test = [] -> void {
    expect(ComputeContentWidth({}, ": ") == 1_ul);

    const Vec<RenderItem> onlyUnresolved = { UnresolvedItem { .reference = "bogus" } };
    expect(ComputeContentWidth(onlyUnresolved, ": ") == 1_ul);

    const Vec<RenderItem> emptyTitle = { TitleItem { .spec = TitleSpec {}, .text = "" } };
    expect(ComputeContentWidth(emptyTitle, ": ") == 1_ul);
  };

  "resolved widths"_test = [] -> void {
    TitleSpec spec;

    expect(ResolveWidth(spec, "Header", 40) == 6_ul);
    expect(ResolveWidth(spec, "", 40) == 1_ul);

    spec.width = { .mode = WidthMode::Content, .fixed = 0 };
    expect(ResolveWidth(spec, "Header", 40) == 40_ul);

    spec.width = { .mode = WidthMode::Fixed, .fixed = 24 };
    expect(ResolveWidth(spec, "Header", 40) == 24_ul);

    spec.width = { .mode = WidthMode::Fixed, .fixed = 0 };
    expect(ResolveWidth(spec, "Header", 40) == 1_ul);
  };

  return 0;
}
