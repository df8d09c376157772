/**
 * @file Layout.hpp
 * @brief The two-pass layout engine: title resolution, width calculation and line rendering.
 *
 * Pass 1 folds the ordered item list into one shared "content" width.
 * Pass 2 maps every item to its text lines with that width bound. Both
 * passes walk the same immutable list in the same order, and nothing here
 * performs I/O; bad configuration is reported through a WarningSink.
 */

#pragma once

#include "Pacfetch/Render/Color.hpp"
#include "Pacfetch/Render/Items.hpp"
#include "Pacfetch/Render/WarningSink.hpp"
#include "Pacfetch/Utils/Types.hpp"

namespace pacfetch::render {
  namespace types = ::pacfetch::utils::types;

  /// Shown in place of a stat value that could not be collected.
  inline constexpr types::StringView MISSING_VALUE_PLACEHOLDER = "-";

  struct RenderOptions {
    types::String glyph      = ": ";            ///< separator between label and value
    types::String labelColor = "bright_yellow"; ///< color token for stat labels
    bool          monochrome = false;           ///< treat every color token as "none"
  };

  /**
   * @brief "pacfetch <version>", the compiled-in program banner.
   */
  auto PacfetchBanner() -> types::String;

  /**
   * @brief Resolves a title's text template to display text.
   *
   * @param spec The title definition.
   * @param pacmanVersion The `pacman --version` banner line, if it was collected.
   * @return The text; never fails.
   */
  auto ResolveTitleText(const TitleSpec& spec, const types::Option<types::String>& pacmanVersion) -> types::String;

  /**
   * @brief Turns ordered declarations into ordered render items.
   *
   * Unknown titles and tokens become Unresolved items; the legacy bare title
   * is served from @p legacyTitle. Each problem is warned about exactly once.
   */
  auto BuildRenderItems(
    types::Span<const Declaration>                      declarations,
    const types::UnorderedMap<types::String, TitleSpec>& titles,
    const TitleSpec&                                     legacyTitle,
    const StatsSnapshot&                                 snapshot,
    WarningSink&                                         sink
  ) -> types::Vec<RenderItem>;

  /// Visible width of "label + glyph + value", using the placeholder for a missing value.
  auto StatFootprint(const StatEntry& entry, types::StringView glyph) -> types::usize;

  /// Minimum visible width a title needs with its own style and text.
  auto TitleFootprint(const TitleSpec& spec, types::StringView text) -> types::usize;

  /**
   * @brief Pass 1: the widest footprint over every item, at least 1.
   */
  auto ComputeContentWidth(types::Span<const RenderItem> items, types::StringView glyph) -> types::usize;

  /**
   * @brief The width a title renders at, given the pass-1 content width.
   */
  auto ResolveWidth(const TitleSpec& spec, types::StringView text, types::usize contentWidth) -> types::usize;

  /**
   * @brief Renders a title to one line (embedded, or stacked with empty text) or two (stacked).
   */
  auto RenderTitle(
    const TitleSpec&                  spec,
    types::StringView                 text,
    types::usize                      width,
    const types::Option<Color>&       textColor,
    const types::Option<Color>&       lineColor
  ) -> types::Vec<types::String>;

  /**
   * @brief Renders "label + glyph + value", with the label bold in @p labelColor when one is given.
   */
  auto RenderStat(const StatEntry& entry, types::StringView glyph, const types::Option<Color>& labelColor) -> types::String;

  /**
   * @brief Pass 1 then pass 2 over an already-built item list.
   */
  auto Render(types::Span<const RenderItem> items, const RenderOptions& options, WarningSink& sink) -> types::Vec<types::String>;

  /**
   * @brief BuildRenderItems followed by Render.
   */
  auto RenderLayout(
    types::Span<const Declaration>                      declarations,
    const types::UnorderedMap<types::String, TitleSpec>& titles,
    const TitleSpec&                                     legacyTitle,
    const StatsSnapshot&                                 snapshot,
    const RenderOptions&                                 options,
    WarningSink&                                         sink
  ) -> types::Vec<types::String>;
} // namespace pacfetch::render
