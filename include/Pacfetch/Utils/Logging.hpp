#pragma once

#include <chrono>          // std::chrono::system_clock
#include <ctime>           // localtime_r, strftime, time_t, tm
#include <filesystem>      // std::filesystem::path
#include <format>          // std::format
#include <print>           // std::print
#include <source_location> // std::source_location
#include <utility>         // std::forward

#include "Error.hpp"
#include "Types.hpp"

namespace pacfetch::utils::logging {
  namespace types = ::pacfetch::utils::types;

  inline auto GetLogMutex() -> types::Mutex& {
    static types::Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  inline auto WriteToConsole(const types::StringView text, const bool useStderr = false) -> void {
    if (useStderr)
      std::print(stderr, "{}", text);
    else
      std::print("{}", text);
  }

  /**
   * @enum LogColor
   * @brief The 16 indexed terminal colors, in xterm palette order.
   */
  enum class LogColor : types::u8 {
    Black         = 0,
    Red           = 1,
    Green         = 2,
    Yellow        = 3,
    Blue          = 4,
    Magenta       = 5,
    Cyan          = 6,
    White         = 7,
    Gray          = 8,
    BrightRed     = 9,
    BrightGreen   = 10,
    BrightYellow  = 11,
    BrightBlue    = 12,
    BrightMagenta = 13,
    BrightCyan    = 14,
    BrightWhite   = 15,
  };

  struct LogLevelConst {
    // clang-format off
    static constexpr types::Array<types::StringView, 16> COLOR_CODE_LITERALS = {
      "\033[38;5;0m",  "\033[38;5;1m",  "\033[38;5;2m",  "\033[38;5;3m",
      "\033[38;5;4m",  "\033[38;5;5m",  "\033[38;5;6m",  "\033[38;5;7m",
      "\033[38;5;8m",  "\033[38;5;9m",  "\033[38;5;10m", "\033[38;5;11m",
      "\033[38;5;12m", "\033[38;5;13m", "\033[38;5;14m", "\033[38;5;15m",
    };

    static constexpr types::Array<types::StringView, 16> BACKGROUND_CODE_LITERALS = {
      "\033[48;5;0m",  "\033[48;5;1m",  "\033[48;5;2m",  "\033[48;5;3m",
      "\033[48;5;4m",  "\033[48;5;5m",  "\033[48;5;6m",  "\033[48;5;7m",
      "\033[48;5;8m",  "\033[48;5;9m",  "\033[48;5;10m", "\033[48;5;11m",
      "\033[48;5;12m", "\033[48;5;13m", "\033[48;5;14m", "\033[48;5;15m",
    };
    // clang-format on

    static constexpr types::PCStr RESET_CODE   = "\033[0m";
    static constexpr types::PCStr BOLD_START   = "\033[1m";
    static constexpr types::PCStr ITALIC_START = "\033[3m";
    static constexpr types::PCStr DIM_START    = "\033[2m";

    // TRACE=magenta, DEBUG=blue, INFO=green, WARN=yellow, ERROR=red
    static constexpr types::StringView TRACE_STYLED = "\033[1m\033[38;5;5mTRACE\033[0m";
    static constexpr types::StringView DEBUG_STYLED = "\033[1m\033[38;5;4mDEBUG\033[0m";
    static constexpr types::StringView INFO_STYLED  = "\033[1m\033[38;5;2mINFO \033[0m";
    static constexpr types::StringView WARN_STYLED  = "\033[1m\033[38;5;3mWARN \033[0m";
    static constexpr types::StringView ERROR_STYLED = "\033[1m\033[38;5;1mERROR\033[0m";

    static constexpr types::PCStr TIMESTAMP_FORMAT = "%Y-%m-%dT%H:%M:%S";
  };

  /**
   * @enum LogLevel
   * @brief Severity of a log event, least to most severe.
   */
  enum class LogLevel : types::u8 {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
  };

  inline auto GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel Level = LogLevel::Warn;
    return Level;
  }

  inline auto SetRuntimeLogLevel(const LogLevel level) -> void {
    GetRuntimeLogLevel() = level;
  }

  /**
   * @struct Style
   * @brief Options for text styling with ANSI codes.
   */
  struct Style {
    LogColor color  = LogColor::White;
    bool     bold   = false;
    bool     italic = false;
    bool     dim    = false;
  };

  /**
   * @brief Applies ANSI styling to text based on the provided style options.
   */
  inline auto Stylize(const types::StringView text, const Style& style) -> types::String {
    const bool hasStyle = style.bold || style.italic || style.dim || style.color != LogColor::White;

    if (!hasStyle)
      return types::String(text);

    types::String result;
    result.reserve(text.size() + 32);

    if (style.bold)
      result += LogLevelConst::BOLD_START;
    if (style.italic)
      result += LogLevelConst::ITALIC_START;
    if (style.dim)
      result += LogLevelConst::DIM_START;
    if (style.color != LogColor::White)
      result += LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<types::usize>(style.color));

    result += text;
    result += LogLevelConst::RESET_CODE;

    return result;
  }

  constexpr auto GetLevelInfo() -> const types::Array<types::StringView, 5>& {
    static constexpr types::Array<types::StringView, 5> LEVEL_INFO_INSTANCE = {
      LogLevelConst::TRACE_STYLED,
      LogLevelConst::DEBUG_STYLED,
      LogLevelConst::INFO_STYLED,
      LogLevelConst::WARN_STYLED,
      LogLevelConst::ERROR_STYLED,
    };
    return LEVEL_INFO_INSTANCE;
  }

  /**
   * @brief Log events never share stdout with the rendered output.
   */
  constexpr auto ShouldUseStderr(const LogLevel /*level*/) -> bool {
    return true;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Print Helpers
  // ─────────────────────────────────────────────────────────────────────────────

  inline auto Print(const LogLevel level, const types::StringView text) {
    WriteToConsole(text, ShouldUseStderr(level));
  }

  inline auto Println(const LogLevel level) {
    WriteToConsole("\n", ShouldUseStderr(level));
  }

  // User-facing print (stdout only)
  template <typename... Args>
  inline auto Print(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...));
  }

  inline auto Print(const types::StringView text) {
    WriteToConsole(text);
  }

  template <typename... Args>
  inline auto Println(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...) + '\n');
  }

  inline auto Println(const types::StringView text) {
    types::String textWithNewline(text);
    textWithNewline += '\n';
    WriteToConsole(textWithNewline);
  }

  inline auto Println() {
    WriteToConsole("\n");
  }

  /**
   * @brief Returns a local ISO8601-like timestamp (YYYY-MM-DDTHH:MM:SS), reformatting only when the second changes.
   */
  inline auto GetCachedTimestamp(const std::time_t timeT) -> types::StringView {
    thread_local auto                   LastTt   = static_cast<std::time_t>(-1);
    thread_local types::Array<char, 20> TsBuffer = { '\0' };

    if (timeT != LastTt) {
      std::tm localTm {};

      if (localtime_r(&timeT, &localTm) == nullptr ||
          std::strftime(TsBuffer.data(), TsBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
        std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());

      LastTt = timeT;
    }

    return { TsBuffer.data(), 19 };
  }

  /**
   * @brief Turns a function name into a module-like target.
   * @details "auto pacfetch::render::Render(...)" becomes "pacfetch::render".
   */
  inline auto ExtractTarget(const types::PCStr funcName) -> types::String {
    const types::StringView func(funcName);

    types::usize parenPos = func.rfind('(');
    if (parenPos == types::StringView::npos)
      parenPos = func.size();

    const types::usize lastColonPos = func.rfind("::", parenPos);
    if (lastColonPos == types::StringView::npos)
      return types::String(func.substr(0, parenPos));

    const types::usize spacePos = func.rfind(' ', lastColonPos);
    const types::usize startPos = (spacePos != types::StringView::npos) ? spacePos + 1 : 0;

    return types::String(func.substr(startPos, lastColonPos - startPos));
  }

  /**
   * @brief Writes one compact log line: timestamp LEVEL [file:line] target: message.
   */
  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    using std::chrono::system_clock;
    using std::filesystem::path;

    if (level < GetRuntimeLogLevel())
      return;

    const types::StringView timestamp = GetCachedTimestamp(system_clock::to_time_t(system_clock::now()));
    const types::String     message   = std::format(fmt, std::forward<Args>(args)...);

    const types::LockGuard lock(GetLogMutex());

    Print(level, Stylize(timestamp, { .color = LogColor::Gray, .dim = true }));
    Print(level, " ");
    Print(level, GetLevelInfo().at(static_cast<types::usize>(level)));
    Print(level, " ");
#ifndef NDEBUG
    Print(level, Stylize(std::format("{}:{}", path(loc.file_name()).filename().string(), loc.line()), { .color = LogColor::Gray, .italic = true }));
    Print(level, " ");
#else
    (void)loc;
#endif
    if (!target.empty()) {
      Print(level, Stylize(target, { .bold = true }));
      Print(level, ": ");
    }
    Print(level, message);
    Println(level);
  }

  /**
   * @brief Logs a PfError (or anything with a message) at the given level, using the error's own location.
   */
  template <typename ErrorType>
  auto LogError(const LogLevel level, const types::StringView target, const ErrorType& errorObj) {
    using DecayedErrorType = std::decay_t<ErrorType>;

    if constexpr (std::is_same_v<DecayedErrorType, error::PfError>)
      LogImpl(level, errorObj.location, target, "{}", errorObj.message);
    else if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
      LogImpl(level, std::source_location::current(), target, "{}", errorObj.what());
    else
      LogImpl(level, std::source_location::current(), target, "{}", errorObj.message);
  }
} // namespace pacfetch::utils::logging

#define PACFETCH_LOG_TARGET ::pacfetch::utils::logging::ExtractTarget(__FUNCTION__)

#define PACFETCH_LOG(lvl, fmt, ...)         \
  ::pacfetch::utils::logging::LogImpl(      \
    ::pacfetch::utils::logging::LogLevel::lvl, \
    std::source_location::current(),        \
    PACFETCH_LOG_TARGET,                    \
    fmt __VA_OPT__(, ) __VA_ARGS__          \
  )

#define trace_log(fmt, ...) PACFETCH_LOG(Trace, fmt __VA_OPT__(, ) __VA_ARGS__)
#define debug_log(fmt, ...) PACFETCH_LOG(Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log(fmt, ...)  PACFETCH_LOG(Info, fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log(fmt, ...)  PACFETCH_LOG(Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
#define error_log(fmt, ...) PACFETCH_LOG(Error, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_at(error_obj) ::pacfetch::utils::logging::LogError(::pacfetch::utils::logging::LogLevel::Debug, PACFETCH_LOG_TARGET, error_obj)
#define warn_at(error_obj)  ::pacfetch::utils::logging::LogError(::pacfetch::utils::logging::LogLevel::Warn, PACFETCH_LOG_TARGET, error_obj)
#define error_at(error_obj) ::pacfetch::utils::logging::LogError(::pacfetch::utils::logging::LogLevel::Error, PACFETCH_LOG_TARGET, error_obj)
