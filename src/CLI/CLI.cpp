#include "CLI.hpp"

#include <glaze/glaze.hpp> // glz::{write, format_error}

#include <Pacfetch/Utils/Error.hpp>
#include <Pacfetch/Utils/Logging.hpp>

using namespace pacfetch::utils::types;
using namespace pacfetch::utils::logging;
using enum pacfetch::utils::error::PfErrorCode;

namespace pacfetch::cli {
  auto CollectSnapshot(const config::Config& config, const bool highlight) -> render::StatsSnapshot {
    using namespace services::stats;

    const PacmanStats stats = CollectPacmanStats(config.display.stats, config.disk.path);

    return BuildSnapshot(stats, config.disk.path, highlight);
  }

  auto FormatJson(const render::StatsSnapshot& snapshot) -> Result<String> {
    Map<String, String> output;

    for (const auto& [id, entry] : snapshot.entries)
      if (entry.value)
        output.emplace(render::StatConfigKey(id), *entry.value);

    String jsonStr;

    if (const glz::error_ctx errorContext = glz::write<glz::opts { .prettify = true }>(output, jsonStr))
      ERR_FMT(InternalError, "Failed to write JSON output: {}", glz::format_error(errorContext, jsonStr));

    return jsonStr;
  }

  auto PrintJsonOutput(const render::StatsSnapshot& snapshot) -> Unit {
    if (Result<String> json = FormatJson(snapshot))
      Println("{}", *json);
    else
      error_at(json.error());
  }
} // namespace pacfetch::cli
