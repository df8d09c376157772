#include <cstdlib> // EXIT_SUCCESS, EXIT_FAILURE
#include <format> // std::format

#include <Pacfetch/Render/Layout.hpp>
#include <Pacfetch/Render/WarningSink.hpp>
#include <Pacfetch/Utils/ArgumentParser.hpp>
#include <Pacfetch/Utils/Error.hpp>
#include <Pacfetch/Utils/Logging.hpp>
#include <Pacfetch/Utils/Types.hpp>

#include "CLI.hpp"
#include "Config/Config.hpp"
#include "UI/UI.hpp"

using namespace pacfetch::utils::types;
using namespace pacfetch::utils::logging;
using namespace pacfetch::config;
using namespace pacfetch::ui;
using namespace pacfetch::cli;

struct CliOptions {
  bool           debug      = false;
  bool           jsonOutput = false;
  Option<String> ascii;
  Option<String> asciiColor;
};

auto main(const i32 argc, CStr* argv[]) -> i32 try {
  CliOptions opts;

  {
    using pacfetch::utils::argparse::ArgumentParser;

    ArgumentParser parser(pacfetch::render::PacfetchBanner());

    parser
      .addArguments("-d", "--debug")
      .help("Print plain stat lines without art or color, and enable debug logging. Overrides --log-level.")
      .flag()
      .bindTo(opts.debug);

    parser
      .addArguments("-l", "--log-level")
      .help("Set the minimum log level.")
      .defaultValue(LogLevel::Warn);

    parser
      .addArguments("--ascii")
      .help("ASCII art to show: PACMAN_DEFAULT, PACMAN_SMALL, NONE or a file path. Overrides the config.")
      .bindTo(opts.ascii);

    parser
      .addArguments("--color")
      .help("Color of the ASCII art (a color name, \"#RRGGBB\" or \"none\"). Overrides the config.")
      .bindTo(opts.asciiColor);

    parser
      .addArguments("--json")
      .help("Output the stats as JSON.")
      .flag()
      .bindTo(opts.jsonOutput);

    if (Result<> result = parser.parseInto({ argv, static_cast<usize>(argc) }); !result) {
      error_at(result.error());
      return EXIT_FAILURE;
    }

    if (parser.isUsed("--help")) {
      parser.printHelp();
      return EXIT_SUCCESS;
    }

    if (parser.isUsed("--version")) {
      Println("{}", parser.getVersion());
      return EXIT_SUCCESS;
    }

    SetRuntimeLogLevel(opts.debug ? LogLevel::Debug : parser.getEnum<LogLevel>("--log-level"));
  }

  using pacfetch::render::FileWarningSink;
  using pacfetch::render::LogWarningSink;
  using pacfetch::render::WarningSink;

  // Warnings go to the log file when its location is known, otherwise to stderr.
  UniquePointer<WarningSink> sink;

  if (Result<std::filesystem::path> logPath = Config::getLogPath())
    sink = std::make_unique<FileWarningSink>(*logPath);
  else {
    debug_at(logPath.error());
    sink = std::make_unique<LogWarningSink>();
  }

  Config config = Config::getInstance(*sink);

  if (opts.ascii)
    config.display.ascii = *opts.ascii;

  if (opts.asciiColor)
    config.display.asciiColor = *opts.asciiColor;

  if (opts.jsonOutput) {
    PrintJsonOutput(CollectSnapshot(config, false));
    return EXIT_SUCCESS;
  }

  const bool plain = opts.debug;

  Print(CreateUI(config, CollectSnapshot(config, !plain), *sink, plain));

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
