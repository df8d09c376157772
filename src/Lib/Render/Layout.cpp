#include "Pacfetch/Render/Layout.hpp"

#include <algorithm> // std::max
#include <format>    // std::format

#include "Pacfetch/Render/Text.hpp"

using namespace pacfetch::utils::types;

namespace {
  using pacfetch::render::Color;
  using pacfetch::render::TitleAlign;

  struct FillSplit {
    usize left;
    usize right;
  };

  /**
   * @brief Splits @p remaining fill columns around a centered segment.
   *
   * Left and Right keep a single column of fill on the near side (when there
   * is any) so the text never touches the cap; Center floors on the left.
   */
  auto SplitFill(const usize remaining, const TitleAlign align) -> FillSplit {
    switch (align) {
      case TitleAlign::Left: {
        const usize left = std::min<usize>(1, remaining);
        return { .left = left, .right = remaining - left };
      }
      case TitleAlign::Right: {
        const usize right = std::min<usize>(1, remaining);
        return { .left = remaining - right, .right = right };
      }
      case TitleAlign::Center:
        break;
    }

    return { .left = remaining / 2, .right = remaining - (remaining / 2) };
  }

  /// Pads @p text to @p width, placing it per @p align; text already at least that wide is returned as is.
  auto AlignText(const String& text, const usize visible, const usize width, const TitleAlign align) -> String {
    if (visible >= width)
      return text;

    const usize padding = width - visible;

    switch (align) {
      case TitleAlign::Left:
        return text + String(padding, ' ');
      case TitleAlign::Right:
        return String(padding, ' ') + text;
      case TitleAlign::Center:
        break;
    }

    return String(padding / 2, ' ') + text + String(padding - (padding / 2), ' ');
  }

  /// Colorize, but an empty segment stays empty instead of becoming a bare pair of escape codes.
  auto Paint(const StringView segment, const Option<Color>& color, const bool bold = false) -> String {
    if (segment.empty())
      return {};

    return pacfetch::render::Colorize(segment, color, bold);
  }

  auto ColorFor(const StringView token, const bool monochrome, pacfetch::render::WarningSink& sink) -> Option<Color> {
    if (monochrome)
      return None;

    return pacfetch::render::ParseColor(token, sink);
  }
} // namespace

namespace pacfetch::render {
  auto PacfetchBanner() -> String {
    return std::format("pacfetch {}", PACFETCH_VERSION);
  }

  auto ResolveTitleText(const TitleSpec& spec, const Option<String>& pacmanVersion) -> String {
    switch (spec.textKind) {
      case TitleTextKind::Empty:
        return {};
      case TitleTextKind::Default:
        return pacmanVersion ? *pacmanVersion : PacfetchBanner();
      case TitleTextKind::PacmanVersion: {
        if (!pacmanVersion)
          return "Pacman";

        const usize dash = pacmanVersion->find(" - ");
        if (dash == String::npos)
          return *pacmanVersion;

        String head = pacmanVersion->substr(0, dash);
        head.erase(head.find_last_not_of(' ') + 1);
        head.erase(0, head.find_first_not_of(' '));
        return head;
      }
      case TitleTextKind::PacfetchVersion:
        return PacfetchBanner();
      case TitleTextKind::Literal:
        return spec.literal;
    }

    return {};
  }

  auto BuildRenderItems(
    const Span<const Declaration>                 declarations,
    const UnorderedMap<String, TitleSpec>&        titles,
    const TitleSpec&                              legacyTitle,
    const StatsSnapshot&                          snapshot,
    WarningSink&                                  sink
  ) -> Vec<RenderItem> {
    Vec<RenderItem> items;
    items.reserve(declarations.size());

    for (const Declaration& declaration : declarations) {
      std::visit(
        [&](const auto& decl) {
          using D = std::decay_t<decltype(decl)>;

          if constexpr (std::is_same_v<D, StatRef>) {
            if (const auto iter = snapshot.entries.find(decl.id); iter != snapshot.entries.end())
              items.emplace_back(StatItem { .entry = iter->second });
            else
              items.emplace_back(StatItem { .entry = StatEntry { .id = decl.id, .label = String(StatLabel(decl.id)), .value = None } });
          } else if constexpr (std::is_same_v<D, TitleRef>) {
            if (const auto iter = titles.find(decl.name); iter != titles.end()) {
              items.emplace_back(TitleItem { .spec = iter->second, .text = ResolveTitleText(iter->second, snapshot.pacmanVersion) });
            } else {
              sink.warn(std::format("title '{}' is referenced in display.stats but [display.titles.{}] is not defined; skipping it", decl.name, decl.name));
              items.emplace_back(UnresolvedItem { .reference = std::format("title.{}", decl.name) });
            }
          } else if constexpr (std::is_same_v<D, LegacyTitleRef>) {
            sink.warn("the bare 'title' entry in display.stats is deprecated; define [display.titles.<name>] and reference it as 'title.<name>'");
            items.emplace_back(TitleItem { .spec = legacyTitle, .text = ResolveTitleText(legacyTitle, snapshot.pacmanVersion) });
          } else {
            sink.warn(std::format("unknown entry '{}' in display.stats; skipping it", decl.token));
            items.emplace_back(UnresolvedItem { .reference = decl.token });
          }
        },
        declaration
      );
    }

    return items;
  }

  auto StatFootprint(const StatEntry& entry, const StringView glyph) -> usize {
    const StringView value = entry.value ? StringView(*entry.value) : MISSING_VALUE_PLACEHOLDER;

    return GetVisualWidth(entry.label) + GetVisualWidth(glyph) + GetVisualWidth(value);
  }

  auto TitleFootprint(const TitleSpec& spec, const StringView text) -> usize {
    const usize textWidth = GetVisualWidth(text);

    if (spec.style == TitleStyle::Stacked)
      return textWidth;

    const usize caps = GetVisualWidth(spec.leftCap) + GetVisualWidth(spec.rightCap);

    return caps + (textWidth == 0 ? 1 : textWidth + 2);
  }

  auto ComputeContentWidth(const Span<const RenderItem> items, const StringView glyph) -> usize {
    usize width = 0;

    for (const RenderItem& item : items) {
      if (const auto* stat = std::get_if<StatItem>(&item))
        width = std::max(width, StatFootprint(stat->entry, glyph));
      else if (const auto* title = std::get_if<TitleItem>(&item))
        width = std::max(width, TitleFootprint(title->spec, title->text));
    }

    return std::max<usize>(width, 1);
  }

  auto ResolveWidth(const TitleSpec& spec, const StringView text, const usize contentWidth) -> usize {
    switch (spec.width.mode) {
      case WidthMode::Title:
        return std::max<usize>(TitleFootprint(spec, text), 1);
      case WidthMode::Content:
        return std::max<usize>(contentWidth, 1);
      case WidthMode::Fixed:
        return std::max<usize>(spec.width.fixed, 1);
    }

    return 1;
  }

  auto RenderTitle(
    const TitleSpec&    spec,
    const StringView    text,
    const usize         width,
    const Option<Color>& textColor,
    const Option<Color>& lineColor
  ) -> Vec<String> {
    const TitleAlign align       = spec.effectiveAlign();
    const usize      textVisible = GetVisualWidth(text);

    Vec<String> lines;

    if (spec.style == TitleStyle::Stacked) {
      if (textVisible > 0) {
        const String painted = Paint(text, textColor, true);
        lines.push_back(AlignText(painted, textVisible, width, align));
      }

      lines.push_back(Paint(RepeatToWidth(spec.line, width), lineColor));
      return lines;
    }

    const usize capsWidth = GetVisualWidth(spec.leftCap) + GetVisualWidth(spec.rightCap);
    const usize inner     = width > capsWidth ? width - capsWidth : 0;

    if (textVisible == 0) {
      lines.push_back(Paint(spec.leftCap + RepeatToWidth(spec.line, inner) + spec.rightCap, lineColor));
      return lines;
    }

    const String    spaced    = std::format(" {} ", text);
    const usize     used      = textVisible + 2;
    const usize     remaining = inner > used ? inner - used : 0;
    const FillSplit split     = SplitFill(remaining, align);

    lines.push_back(
      Paint(spec.leftCap + RepeatToWidth(spec.line, split.left), lineColor) +
      Paint(spaced, textColor, true) +
      Paint(RepeatToWidth(spec.line, split.right) + spec.rightCap, lineColor)
    );

    return lines;
  }

  auto RenderStat(const StatEntry& entry, const StringView glyph, const Option<Color>& labelColor) -> String {
    const StringView value = entry.value ? StringView(*entry.value) : MISSING_VALUE_PLACEHOLDER;

    return std::format("{}{}{}", Paint(entry.label, labelColor, true), glyph, value);
  }

  auto Render(const Span<const RenderItem> items, const RenderOptions& options, WarningSink& sink) -> Vec<String> {
    const usize contentWidth = ComputeContentWidth(items, options.glyph);
    const Option<Color> labelColor = ColorFor(options.labelColor, options.monochrome, sink);

    Vec<String> lines;
    lines.reserve(items.size() + 4);

    for (const RenderItem& item : items) {
      if (const auto* stat = std::get_if<StatItem>(&item)) {
        lines.push_back(RenderStat(stat->entry, options.glyph, labelColor));
      } else if (const auto* title = std::get_if<TitleItem>(&item)) {
        const usize         width     = ResolveWidth(title->spec, title->text, contentWidth);
        const Option<Color> textColor = ColorFor(title->spec.textColor, options.monochrome, sink);
        const Option<Color> lineColor = ColorFor(title->spec.lineColor, options.monochrome, sink);

        for (String& line : RenderTitle(title->spec, title->text, width, textColor, lineColor))
          lines.push_back(std::move(line));
      }
    }

    return lines;
  }

  auto RenderLayout(
    const Span<const Declaration>          declarations,
    const UnorderedMap<String, TitleSpec>& titles,
    const TitleSpec&                       legacyTitle,
    const StatsSnapshot&                   snapshot,
    const RenderOptions&                   options,
    WarningSink&                           sink
  ) -> Vec<String> {
    const Vec<RenderItem> items = BuildRenderItems(declarations, titles, legacyTitle, snapshot, sink);

    return Render(items, options, sink);
  }
} // namespace pacfetch::render
