#pragma once

#include <format>          // std::format
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location

#include "Types.hpp"

namespace pacfetch::utils::error {
  /**
   * @enum PfErrorCode
   * @brief Broad categories for the failures pacfetch can report.
   */
  enum class PfErrorCode : types::u8 {
    ConfigurationError, ///< Configuration or environment issue.
    InternalError,      ///< A bug or broken invariant inside pacfetch.
    InvalidArgument,    ///< An invalid argument was passed on the command line or to a function.
    IoError,            ///< General I/O error (filesystem, pipes, etc.).
    NotFound,           ///< A required file, directory or program was not found.
    NotSupported,       ///< The operation is not available on this system.
    Other,              ///< Anything that does not fit the categories above.
    ParseError,         ///< Data was present but could not be parsed.
    PermissionDenied,   ///< Insufficient permissions to perform the operation.
  };

  /**
   * @struct PfError
   * @brief Structured error value carried by Result.
   */
  struct PfError {
    types::String        message;  ///< Human-readable description.
    std::source_location location; ///< Where the error was raised.
    PfErrorCode          code;     ///< Category of the error.

    PfError(const PfErrorCode errc, types::String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), code(errc) {}
  };

  /**
   * @brief Returns true for the error kinds that mean "this machine just doesn't have it".
   *
   * Used by collectors to decide whether a failure is worth more than a debug line.
   */
  inline auto IsExpectedAbsence(const PfErrorCode code) -> bool {
    using matchit::match, matchit::is, matchit::or_, matchit::_;

    return match(code)(
      is | or_(PfErrorCode::NotFound, PfErrorCode::NotSupported) = true,
      is | _                                                     = false
    );
  }
} // namespace pacfetch::utils::error

#define ERR(errc, msg)          return ::pacfetch::utils::types::Err(::pacfetch::utils::error::PfError(errc, msg))
#define ERR_FMT(errc, fmt, ...) return ::pacfetch::utils::types::Err(::pacfetch::utils::error::PfError(errc, std::format(fmt, __VA_ARGS__)))

/**
 * @brief Propagates the error of a Result<T>, otherwise yields its value.
 *
 * @code
 * auto loadArt(const String& path) -> Result<Vec<String>> {
 *   String contents = TRY(ReadFile(path));
 *   return SplitLines(contents);
 * }
 * @endcode
 *
 * @note Relies on GNU statement expressions (GCC/Clang).
 */
#define TRY(expr)                                                                             \
  _Pragma("clang diagnostic push")                                                            \
    _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
      auto&& _pf_try_result = (expr);                                                         \
      if (!_pf_try_result)                                                                    \
        return ::pacfetch::utils::types::Err(_pf_try_result.error());                         \
      std::move(*_pf_try_result);                                                             \
    })                                                                                        \
      _Pragma("clang diagnostic pop")

/**
 * @brief Propagates the error of a Result<void>; otherwise execution continues.
 */
#define TRY_VOID(expr)                                                \
  do {                                                                \
    auto&& _pf_try_result = (expr);                                   \
    if (!_pf_try_result)                                              \
      return ::pacfetch::utils::types::Err(_pf_try_result.error());   \
  } while (0)
