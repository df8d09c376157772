#pragma once

#include <cstdlib>    // std::getenv, setenv, unsetenv
#include <filesystem> // std::filesystem::path
#include <pwd.h>      // getpwnam_r, passwd
#include <unistd.h>   // sysconf

#include "Error.hpp"
#include "Types.hpp"

namespace pacfetch::utils::env {
  namespace types = ::pacfetch::utils::types;
  namespace error = ::pacfetch::utils::error;

  using enum error::PfErrorCode;

  /**
   * @brief Safely retrieves an environment variable.
   * @param name The name of the environment variable to retrieve.
   * @return The value, or NotFound when it is unset.
   */
  [[nodiscard]] inline auto GetEnv(const types::PCStr name) -> types::Result<types::String> {
    const types::PCStr value = std::getenv(name);

    if (!value)
      ERR_FMT(NotFound, "Environment variable '{}' not found", name);

    return types::String(value);
  }

  inline auto SetEnv(const types::PCStr name, const types::PCStr value) -> types::Unit {
    setenv(name, value, 1);
  }

  inline auto UnsetEnv(const types::PCStr name) -> types::Unit {
    unsetenv(name);
  }

  /**
   * @brief Home directory of the invoking user.
   *
   * When run through sudo, SUDO_USER's home wins over root's so that
   * config and log files keep landing in the real user's directories.
   */
  [[nodiscard]] inline auto GetHomeDir() -> types::Result<std::filesystem::path> {
    if (types::Result<types::String> sudoUser = GetEnv("SUDO_USER"); sudoUser && !sudoUser->empty()) {
      types::i64 bufSize = sysconf(_SC_GETPW_R_SIZE_MAX);
      if (bufSize <= 0)
        bufSize = 16384;

      types::Vec<char> buffer(static_cast<types::usize>(bufSize));
      passwd           pwd {};
      passwd*          result = nullptr;

      if (getpwnam_r(sudoUser->c_str(), &pwd, buffer.data(), buffer.size(), &result) == 0 && result && result->pw_dir)
        return std::filesystem::path(result->pw_dir);
    }

    if (types::Result<types::String> home = GetEnv("HOME"); home && !home->empty())
      return std::filesystem::path(*home);

    ERR(NotFound, "Could not determine the home directory (HOME is unset)");
  }

  /**
   * @brief Expands a leading "~" or "~/" to the home directory; other paths are returned unchanged.
   */
  [[nodiscard]] inline auto ExpandTilde(const types::StringView path) -> types::Result<std::filesystem::path> {
    if (path != "~" && !path.starts_with("~/"))
      return std::filesystem::path(path);

    std::filesystem::path home = TRY(GetHomeDir());

    if (path.size() <= 2)
      return home;

    return home / path.substr(2);
  }
} // namespace pacfetch::utils::env
