#include "UI.hpp"

#include <Pacfetch/Render/Color.hpp>
#include <Pacfetch/Render/Compositor.hpp>
#include <Pacfetch/Render/Layout.hpp>
#include <Pacfetch/Utils/Logging.hpp>

#include "AsciiArt.hpp"

using namespace pacfetch::utils::types;

namespace pacfetch::ui {
  using config::Config;
  using render::StatsSnapshot;
  using render::WarningSink;

  auto CreateUI(const Config& config, const StatsSnapshot& snapshot, WarningSink& sink, const bool plain) -> String {
    render::RenderOptions options = config.renderOptions();
    options.monochrome            = plain;

    Vec<String> statLines = render::RenderLayout(
      config.display.stats,
      config.display.titles,
      config.display.title,
      snapshot,
      options,
      sink
    );

    String out;

    if (plain) {
      for (const String& line : statLines) {
        out += line;
        out += '\n';
      }

      return out;
    }

    statLines.emplace_back();

    for (String& row : render::PaletteRows())
      statLines.push_back(std::move(row));

    const Vec<String>           artRows  = ascii::GetAsciiArt(config.display.ascii, sink);
    const Option<render::Color> artColor = render::ParseColor(config.display.asciiColor, sink);

    debug_log("composing {} stat rows beside {} art rows", statLines.size(), artRows.size());

    for (const String& line : render::Compose(statLines, artRows, artColor)) {
      out += line;
      out += '\n';
    }

    return out;
  }
} // namespace pacfetch::ui
