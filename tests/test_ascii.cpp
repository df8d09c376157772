#include <boost/ut.hpp>

#include <filesystem>
#include <fstream>

#include <Pacfetch/Render/Text.hpp>
#include <Pacfetch/Render/WarningSink.hpp>

#include "UI/AsciiArt.hpp"

auto main() -> int {
  using namespace boost::ut;
  using namespace pacfetch::ui::ascii;
  using namespace pacfetch::utils::types;
  using pacfetch::render::GetVisualWidth;
  using pacfetch::render::MemoryWarningSink;

  "NONE gives no art"_test = [] -> void {
    MemoryWarningSink sink;

    expect(GetAsciiArt("NONE", sink).empty());
    expect(sink.count() == 0_ul);
  };

  "built-in art"_test = [] -> void {
    MemoryWarningSink sink;

    const Vec<String> full  = GetAsciiArt("PACMAN_DEFAULT", sink);
    const Vec<String> small = GetAsciiArt("PACMAN_SMALL", sink);

    expect(full.size() == 16_ul);
    expect(small.size() == 4_ul);
    expect(small[0] == String("  .--.                "));
    expect(sink.count() == 0_ul);
  };

  "unknown names fall back to the default art"_test = [] -> void {
    MemoryWarningSink sink;

    expect(GetAsciiArt("ARCH_LOGO", sink) == GetAsciiArt("PACMAN_DEFAULT", sink));
    expect(sink.count() == 0_ul);
  };

  "raw art is split and normalized"_test = [] -> void {
    MemoryWarningSink sink;

    const Vec<String> rows = GetAsciiArt(" ___\n<o o>\n \\_/", sink);

    expect(rows.size() == 3_ul);
    expect(rows[0] == String(" ___ "));
    expect(rows[1] == String("<o o>"));
    expect(rows[2] == String(" \\_/ "));
  };

  "normalization ignores styling"_test = [] -> void {
    const Vec<String> rows = NormalizeWidth({ "\033[31m###\033[0m", "#" });

    expect(GetVisualWidth(rows[0]) == 3_ul);
    expect(rows[1] == String("#  "));
  };

  "art files are loaded and normalized"_test = [] -> void {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "pacfetch_test_art.txt";

    {
      std::ofstream out(path);
      out << "/\\\r\n/  \\\n";
    }

    MemoryWarningSink sink;
    const Vec<String> rows = GetAsciiArt(path.string(), sink);

    expect(rows.size() == 2_ul);
    expect(rows[0] == String("/\\  "));
    expect(rows[1] == String("/  \\"));
    expect(sink.count() == 0_ul);

    std::filesystem::remove(path);
  };

  "unreadable files warn and fall back"_test = [] -> void {
    MemoryWarningSink sink;

    const Vec<String> rows = GetAsciiArt("/nonexistent/pacfetch/art.txt", sink);

    expect(rows.size() == 16_ul);
    expect(sink.count() == 1_ul);
    expect(sink.messages().front().contains("/nonexistent/pacfetch/art.txt"));
  };

  "missing files report NotFound"_test = [] -> void {
    Result<Vec<String>> rows = LoadArtFile("./definitely-not-here.txt");

    expect(!rows.has_value());
    if (!rows)
      expect(rows.error().code == pacfetch::utils::error::PfErrorCode::NotFound);
  };

  return 0;
}
