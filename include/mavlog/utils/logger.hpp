#pragma once

#include <filesystem>
#include <ostream>
#include <source_location>
#include <sstream>
#include <string_view>
#include <utility>

namespace mavlog::logger {

enum class Level : int {
  Debug = 10,
  Info  = 20,
  Warn  = 30,
  Error = 40
};

// Parses "debug" / "info" / "warn" / "error" (or a numeric level). Falls back to Info.
Level parse_level(std::string_view s) noexcept;

// Minimum level echoed to stderr. The log file always gets every level.
void set_print_level(Level level);

void set_logs_dir(const std::filesystem::path& dir_path);

// File output is off until enabled; console output is always on.
void set_file_logging_enabled(bool enabled);

/**
 * @brief One log line, built with operator<< and emitted when destroyed.
 *
 * Obtained from debug()/info()/warn()/error(); the call site's file and line
 * are captured through the default source_location argument.
 */
class LogStream {
public:
  LogStream(Level level, const std::source_location& loc);
  LogStream(LogStream&& other) noexcept;
  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;
  LogStream& operator=(LogStream&&) = delete;
  ~LogStream();

  template <typename T>
  LogStream& operator<<(T&& value) {
    stream_ << std::forward<T>(value);
    return *this;
  }

  using Manip = std::ostream& (*)(std::ostream&);
  LogStream& operator<<(Manip manip) {
    manip(stream_);
    return *this;
  }

  void commit();

private:
  Level level_;
  std::source_location loc_;
  std::ostringstream stream_;
  bool active_{true};
};

LogStream debug(const std::source_location& loc = std::source_location::current());
LogStream info(const std::source_location& loc = std::source_location::current());
LogStream warn(const std::source_location& loc = std::source_location::current());
LogStream error(const std::source_location& loc = std::source_location::current());

// Drain the queue and stop the writer thread (optional at shutdown).
void close_logger();

} // namespace mavlog::logger
