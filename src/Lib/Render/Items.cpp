#include "Pacfetch/Render/Items.hpp"

#include <magic_enum/magic_enum.hpp> // magic_enum::enum_values

using namespace pacfetch::utils::types;

namespace {
  constexpr StringView TITLE_KEYWORD = "title";
  constexpr StringView TITLE_PREFIX  = "title.";

  auto Trim(const StringView str) -> StringView {
    const usize first = str.find_first_not_of(" \t");

    if (first == StringView::npos)
      return {};

    return str.substr(first, str.find_last_not_of(" \t") - first + 1);
  }
} // namespace

namespace pacfetch::render {
  auto ParseStatId(const StringView key) -> Option<StatId> {
    for (const StatId id : magic_enum::enum_values<StatId>())
      if (StatConfigKey(id) == key)
        return id;

    return None;
  }

  auto ParseDeclaration(const StringView token) -> Declaration {
    const StringView trimmed = Trim(token);

    if (trimmed == TITLE_KEYWORD)
      return LegacyTitleRef {};

    if (trimmed.starts_with(TITLE_PREFIX)) {
      const StringView name = trimmed.substr(TITLE_PREFIX.size());

      if (!name.empty())
        return TitleRef { .name = String(name) };

      return UnknownRef { .token = String(token) };
    }

    if (const Option<StatId> id = ParseStatId(trimmed))
      return StatRef { .id = *id };

    return UnknownRef { .token = String(token) };
  }
} // namespace pacfetch::render
