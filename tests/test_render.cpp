#include <boost/ut.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include <Pacfetch/Render/Layout.hpp>
#include <Pacfetch/Render/Text.hpp>
#include <Pacfetch/Utils/Logging.hpp>

namespace {
  using namespace pacfetch::render;
  using namespace pacfetch::utils::types;

  auto Snapshot() -> StatsSnapshot {
    StatsSnapshot snapshot;
    snapshot.pacmanVersion = "Pacman v7.1.0 - libalpm v16.0.1";
    snapshot.entries.emplace(StatId::Installed, StatEntry { .id = StatId::Installed, .label = "Installed", .value = "1268" });
    snapshot.entries.emplace(StatId::Upgradable, StatEntry { .id = StatId::Upgradable, .label = "Upgradable", .value = None });
    snapshot.entries.emplace(
      StatId::MirrorUrl,
      StatEntry { .id = StatId::MirrorUrl, .label = "Mirror URL", .value = "https://geo.mirror.pkgbuild.com" }
    );
    return snapshot;
  }

  auto Plain(TitleSpec spec) -> TitleSpec {
    spec.textColor = "none";
    spec.lineColor = "none";
    return spec;
  }

  auto PlainOptions() -> RenderOptions {
    return { .glyph = ": ", .labelColor = "none", .monochrome = false };
  }
} // namespace

auto main() -> int {
  using namespace boost::ut;

  "end to end with colors off"_test = [] -> void {
    MemoryWarningSink               sink;
    UnorderedMap<String, TitleSpec> titles;
    titles.emplace("header", Plain(TitleSpec {}));

    const Vec<Declaration> decls = { TitleRef { .name = "header" }, StatRef { .id = StatId::Installed } };
    const Vec<String>      lines = RenderLayout(decls, titles, TitleSpec {}, Snapshot(), PlainOptions(), sink);

    expect(lines.size() == 3_ul);
    expect(lines[0] == String("Pacman v7.1.0 - libalpm v16.0.1"));
    expect(lines[1] == String("-------------------------------"));
    expect(lines[2] == String("Installed: 1268"));
    expect(sink.count() == 0_ul);
  };

  "content width titles share the widest item"_test = [] -> void {
    MemoryWarningSink               sink;
    UnorderedMap<String, TitleSpec> titles;

    TitleSpec top = Plain(TitleSpec {});
    top.textKind  = TitleTextKind::PacmanVersion;
    top.width     = { .mode = WidthMode::Content, .fixed = 0 };

    TitleSpec divider = Plain(TitleSpec {});
    divider.textKind  = TitleTextKind::Empty;
    divider.style     = TitleStyle::Embedded;
    divider.line      = "─";
    divider.width     = { .mode = WidthMode::Content, .fixed = 0 };

    titles.emplace("top", top);
    titles.emplace("divider", divider);

    const Vec<Declaration> decls = {
      TitleRef { .name = "top" },
      StatRef { .id = StatId::Installed },
      TitleRef { .name = "divider" },
      StatRef { .id = StatId::MirrorUrl },
    };

    const Vec<String> lines = RenderLayout(decls, titles, TitleSpec {}, Snapshot(), PlainOptions(), sink);

    // "Mirror URL: https://geo.mirror.pkgbuild.com" is the widest item
    expect(lines.size() == 5_ul);
    expect(lines[0] == String("Pacman v7.1.0") + String(30, ' '));
    expect(GetVisualWidth(lines[1]) == 43_ul);
    expect(GetVisualWidth(lines[3]) == 43_ul);
    expect(lines[4] == String("Mirror URL: https://geo.mirror.pkgbuild.com"));
  };

  "undefined titles render nothing and warn once"_test = [] -> void {
    MemoryWarningSink               sink;
    UnorderedMap<String, TitleSpec> titles;

    const Vec<Declaration> decls = {
      StatRef { .id = StatId::Installed },
      TitleRef { .name = "ghost" },
      StatRef { .id = StatId::Upgradable },
    };

    const Vec<String> lines = RenderLayout(decls, titles, TitleSpec {}, Snapshot(), PlainOptions(), sink);

    expect(lines.size() == 2_ul);
    expect(lines[0] == String("Installed: 1268"));
    expect(lines[1] == String("Upgradable: -"));
    expect(sink.count() == 1_ul);
  };

  "unknown tokens render nothing and warn"_test = [] -> void {
    MemoryWarningSink               sink;
    UnorderedMap<String, TitleSpec> titles;

    const Vec<Declaration> decls = { ParseDeclaration("kernel"), StatRef { .id = StatId::Installed } };
    const Vec<String>      lines = RenderLayout(decls, titles, TitleSpec {}, Snapshot(), PlainOptions(), sink);

    expect(lines.size() == 1_ul);
    expect(sink.count() == 1_ul);
    expect(sink.messages().front().contains("kernel"));
  };

  "bad color tokens warn and render uncolored"_test = [] -> void {
    MemoryWarningSink               sink;
    UnorderedMap<String, TitleSpec> titles;

    TitleSpec spec = Plain(TitleSpec {});
    spec.textKind  = TitleTextKind::Literal;
    spec.literal   = "Box";
    spec.textColor = "#12";
    titles.emplace("box", spec);

    const Vec<Declaration> decls = { TitleRef { .name = "box" } };
    const Vec<String>      lines = RenderLayout(decls, titles, TitleSpec {}, Snapshot(), PlainOptions(), sink);

    expect(lines.size() == 2_ul);
    expect(lines[0] == String("Box"));
    expect(sink.count() == 1_ul);
  };

  "monochrome ignores every color"_test = [] -> void {
    MemoryWarningSink               sink;
    UnorderedMap<String, TitleSpec> titles;
    titles.emplace("header", TitleSpec {});

    const Vec<Declaration> decls = { TitleRef { .name = "header" }, StatRef { .id = StatId::Installed } };
    const Vec<String>      lines = RenderLayout(decls, titles, TitleSpec {}, Snapshot(), { .monochrome = true }, sink);

    for (const String& line : lines)
      expect(!line.contains('\033'));
  };

  "rendering is deterministic"_test = [] -> void {
    UnorderedMap<String, TitleSpec> titles;
    titles.emplace("header", TitleSpec {});

    const Vec<Declaration> decls = {
      TitleRef { .name = "header" },
      StatRef { .id = StatId::Installed },
      StatRef { .id = StatId::Upgradable },
      StatRef { .id = StatId::MirrorUrl },
    };

    MemoryWarningSink first;
    MemoryWarningSink second;

    const Vec<String> once  = RenderLayout(decls, titles, TitleSpec {}, Snapshot(), RenderOptions {}, first);
    const Vec<String> twice = RenderLayout(decls, titles, TitleSpec {}, Snapshot(), RenderOptions {}, second);

    expect(once == twice);
  };

  "file sink appends timestamped warnings"_test = [] -> void {
    const std::filesystem::path dir  = std::filesystem::temp_directory_path() / "pacfetch_sink_test";
    const std::filesystem::path path = dir / "nested" / "pacfetch.log";
    std::filesystem::remove_all(dir);

    {
      FileWarningSink sink(path);
      sink.warn("first");
      sink.warn("second");
    }

    std::ifstream      file(path);
    std::ostringstream contents;
    contents << file.rdbuf();

    const String text = contents.str();

    expect(text.starts_with("["));
    expect(text.contains("] WARN: first\n"));
    expect(text.ends_with("] WARN: second\n"));

    std::filesystem::remove_all(dir);
  };

  "rendering writes nothing to stderr, even at debug level"_test = [] -> void {
    using pacfetch::utils::logging::LogLevel;
    using pacfetch::utils::logging::SetRuntimeLogLevel;

    UnorderedMap<String, TitleSpec> titles;
    titles.emplace("header", Plain(TitleSpec {}));

    const Vec<Declaration> decls = {
      TitleRef { .name = "header" },
      StatRef { .id = StatId::Installed },
    };

    FILE* captured = std::tmpfile();
    expect(captured != nullptr);
    if (captured == nullptr)
      return;

    SetRuntimeLogLevel(LogLevel::Debug);
    std::fflush(stderr);
    const int savedStderr = dup(STDERR_FILENO);
    dup2(fileno(captured), STDERR_FILENO);

    MemoryWarningSink sink;
    const Vec<String> lines = RenderLayout(decls, titles, TitleSpec {}, Snapshot(), PlainOptions(), sink);

    std::fflush(stderr);
    dup2(savedStderr, STDERR_FILENO);
    close(savedStderr);
    SetRuntimeLogLevel(LogLevel::Warn);

    std::fseek(captured, 0, SEEK_END);
    const long written = std::ftell(captured);
    std::fclose(captured);

    expect(lines.size() == 3U);
    expect(sink.messages().empty());
    expect(written == 0);
  };

  return 0;
}
