#pragma once

#include <filesystem> // std::filesystem::path

#include "Pacfetch/Utils/Types.hpp"

namespace pacfetch::render {
  namespace types = ::pacfetch::utils::types;

  /**
   * @brief Receives non-fatal configuration warnings.
   *
   * Rendering never fails on bad configuration; it degrades and reports here.
   */
  class WarningSink {
   public:
    WarningSink()                                      = default;
    WarningSink(const WarningSink&)                    = delete;
    WarningSink(WarningSink&&)                         = delete;
    auto operator=(const WarningSink&) -> WarningSink& = delete;
    auto operator=(WarningSink&&) -> WarningSink&      = delete;
    virtual ~WarningSink()                             = default;

    virtual auto warn(types::StringView message) -> types::Unit = 0;
  };

  /**
   * @brief Collects warnings in memory. Used by tests and by callers that want to inspect them.
   */
  class MemoryWarningSink final : public WarningSink {
   public:
    auto warn(types::StringView message) -> types::Unit override;

    [[nodiscard]] auto messages() const -> const types::Vec<types::String>&;
    [[nodiscard]] auto count() const -> types::usize;

   private:
    types::Vec<types::String> m_messages;
  };

  /**
   * @brief Forwards warnings to the process logger at warn level.
   */
  class LogWarningSink final : public WarningSink {
   public:
    auto warn(types::StringView message) -> types::Unit override;
  };

  /**
   * @brief Appends warnings to a log file as "[%Y-%m-%d %H:%M:%S] WARN: <message>".
   *
   * The file and its parent directory are created on first use. If the file
   * cannot be written the warning goes to the process logger instead.
   */
  class FileWarningSink final : public WarningSink {
   public:
    explicit FileWarningSink(std::filesystem::path path);

    auto warn(types::StringView message) -> types::Unit override;

    [[nodiscard]] auto path() const -> const std::filesystem::path&;

   private:
    std::filesystem::path m_path;
  };
} // namespace pacfetch::render
