#include "Pacfetch/Render/WarningSink.hpp"

#include <chrono>       // std::chrono::system_clock
#include <ctime>        // localtime_r, strftime
#include <fstream>      // std::ofstream
#include <system_error> // std::error_code

#include "Pacfetch/Utils/Logging.hpp"

namespace fs = std::filesystem;

using namespace pacfetch::utils::types;

namespace {
  auto FileTimestamp() -> String {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm           localTm {};
    Array<char, 32>   buffer {};

    if (localtime_r(&now, &localTm) == nullptr || std::strftime(buffer.data(), buffer.size(), "%Y-%m-%d %H:%M:%S", &localTm) == 0)
      return "????-??-?? ??:??:??";

    return { buffer.data() };
  }
} // namespace

namespace pacfetch::render {
  auto MemoryWarningSink::warn(const StringView message) -> Unit {
    m_messages.emplace_back(message);
  }

  auto MemoryWarningSink::messages() const -> const Vec<String>& {
    return m_messages;
  }

  auto MemoryWarningSink::count() const -> usize {
    return m_messages.size();
  }

  auto LogWarningSink::warn(const StringView message) -> Unit {
    warn_log("{}", message);
  }

  FileWarningSink::FileWarningSink(fs::path path) : m_path(std::move(path)) {}

  auto FileWarningSink::warn(const StringView message) -> Unit {
    if (std::error_code errc; m_path.has_parent_path() && !fs::create_directories(m_path.parent_path(), errc) && errc) {
      debug_log("Failed to create log directory '{}': {}", m_path.parent_path().string(), errc.message());
      warn_log("{}", message);
      return;
    }

    std::ofstream file(m_path, std::ios::app);

    if (!file) {
      debug_log("Failed to open log file '{}'", m_path.string());
      warn_log("{}", message);
      return;
    }

    file << '[' << FileTimestamp() << "] WARN: " << message << '\n';
  }

  auto FileWarningSink::path() const -> const fs::path& {
    return m_path;
  }
} // namespace pacfetch::render
