#include "mavlog/utils/logger.hpp"
#include "mavlog/utils/timestamp.hpp"

#include <atomic>
#include <cctype>
#include <charconv>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace mavlog::logger {
namespace {

constexpr const char* kColorReset = "\x1b[0m";

// Size at which the diagnostics file is moved aside to <stem>_N.log.
constexpr std::uintmax_t kMaxFileBytes = 1'000'000;
constexpr int kMaxRotatedFiles = 10000;

struct LevelStyle {
  const char* name;
  const char* color;
};

LevelStyle style_of(Level level) {
  switch (level) {
    case Level::Debug: return {"DEBUG", "\x1b[94m"};
    case Level::Info:  return {"INFO",  "\x1b[92m"};
    case Level::Warn:  return {"WARN",  "\x1b[93m"};
    case Level::Error: return {"ERROR", "\x1b[91m"};
  }
  return {"UNKNOWN", kColorReset};
}

// Call sites may end messages with "\n"; the line terminator is ours.
std::string_view trim_newlines(std::string_view s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.remove_suffix(1);
  return s;
}

struct FileLine {
  Level level;
  std::string text;
};

// Process-wide sink: coloured stderr plus an optional background file writer.
class Logger {
public:
  static Logger& instance() {
    static Logger inst;
    return inst;
  }

  void set_print_level(Level level) { print_level_.store(level); }

  bool set_logs_dir(const std::filesystem::path& dir) {
    const std::string s = dir.string();
    bool blank = true;
    for (char c : s) {
      if (!std::isspace(static_cast<unsigned char>(c))) blank = false;
    }
    if (blank) return false;

    std::scoped_lock lk(config_mtx_);
    dir_ = dir;
    file_.clear();
    return true;
  }

  void set_file_enabled(bool enabled) {
    file_enabled_.store(enabled);
    std::scoped_lock lk(config_mtx_);
    file_.clear();
  }

  void emit(Level level, std::string_view message, const std::source_location& loc) {
    std::ostringstream ctx;
    ctx << "(" << std::filesystem::path(loc.file_name()).filename().string() << ":"
        << loc.line() << ") " << trim_newlines(message);
    std::string text = ctx.str();

    if (level >= print_level_.load()) {
      const LevelStyle st = style_of(level);
      std::scoped_lock lk(print_mtx_);
      std::cerr << st.color << "[" << st.name << "] " << text << kColorReset << "\n";
    }

    if (!file_enabled_.load()) return;
    open_file();
    {
      std::scoped_lock lk(queue_mtx_);
      queue_.push_back({level, std::move(text)});
    }
    queue_cv_.notify_one();
  }

  void close() {
    {
      std::scoped_lock lk(queue_mtx_);
      stopping_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) worker_.join();

    std::scoped_lock lk(queue_mtx_, config_mtx_);
    stopping_ = false;
    file_.clear();
  }

private:
  Logger() = default;
  ~Logger() { close(); }

  // Picks the file name on first use after (re)configuration and starts the writer.
  void open_file() {
    std::scoped_lock lk(config_mtx_);
    if (!file_.empty()) return;

    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    file_ = dir_ / ("mavlog_" + utils::timestamp_string("%Y-%m-%d_%H-%M") + ".log");
    if (!worker_.joinable()) worker_ = std::thread(&Logger::drain, this);
  }

  std::filesystem::path file() {
    std::scoped_lock lk(config_mtx_);
    return file_;
  }

  static void move_aside_if_full(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec || size <= kMaxFileBytes) return;

    const std::string stem = path.stem().string();
    const std::string ext = path.extension().string();
    for (int i = 1; i < kMaxRotatedFiles; ++i) {
      const auto target = path.parent_path() / (stem + "_" + std::to_string(i) + ext);
      if (std::filesystem::exists(target, ec)) continue;
      std::filesystem::rename(path, target, ec);
      return;
    }
  }

  void drain() {
    std::unique_lock lk(queue_mtx_);
    while (true) {
      queue_cv_.wait(lk, [&] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) break;  // stopping with nothing left

      FileLine item = std::move(queue_.front());
      queue_.pop_front();
      lk.unlock();

      const std::filesystem::path path = file();
      move_aside_if_full(path);
      std::ofstream out(path, std::ios::app);
      if (out) {
        out << std::setw(6) << std::setfill('0') << ++line_no_
            << " [" << utils::timestamp_string("%H:%M:%S") << "] ["
            << style_of(item.level).name << "] " << item.text << "\n";
      }

      lk.lock();
    }
  }

  std::atomic<Level> print_level_{Level::Info};
  std::atomic<bool> file_enabled_{false};

  std::mutex config_mtx_;
  std::filesystem::path dir_{"logs"};
  std::filesystem::path file_;  // empty until the next line needs it

  std::mutex queue_mtx_;
  std::condition_variable queue_cv_;
  std::deque<FileLine> queue_;
  bool stopping_{false};
  std::thread worker_;
  std::uint64_t line_no_{0};

  std::mutex print_mtx_;
};

} // namespace

Level parse_level(std::string_view s) noexcept {
  if (s == "debug") return Level::Debug;
  if (s == "info")  return Level::Info;
  if (s == "warn")  return Level::Warn;
  if (s == "error") return Level::Error;

  int v = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return Level::Info;
  if (v <= static_cast<int>(Level::Debug)) return Level::Debug;
  if (v <= static_cast<int>(Level::Info))  return Level::Info;
  if (v <= static_cast<int>(Level::Warn))  return Level::Warn;
  return Level::Error;
}

LogStream::LogStream(Level level, const std::source_location& loc)
  : level_(level), loc_(loc) {}

LogStream::LogStream(LogStream&& other) noexcept
  : level_(other.level_),
    loc_(other.loc_),
    stream_(std::move(other.stream_)),
    active_(other.active_) {
  other.active_ = false;
}

LogStream::~LogStream() {
  if (!active_) return;
  try {
    commit();
  } catch (const std::exception& e) {
    std::cerr << "[logger] dropped message: " << e.what() << "\n";
  }
}

void LogStream::commit() {
  if (!active_) return;
  active_ = false;
  Logger::instance().emit(level_, stream_.str(), loc_);
}

void set_print_level(Level level) {
  Logger::instance().set_print_level(level);
}

void set_logs_dir(const std::filesystem::path& dir_path) {
  if (!Logger::instance().set_logs_dir(dir_path)) {
    warn() << "Invalid log directory path '" << dir_path.string() << "', keeping the previous one";
  }
}

void set_file_logging_enabled(bool enabled) {
  Logger::instance().set_file_enabled(enabled);
}

LogStream debug(const std::source_location& loc) { return LogStream(Level::Debug, loc); }
LogStream info(const std::source_location& loc) { return LogStream(Level::Info, loc); }
LogStream warn(const std::source_location& loc) { return LogStream(Level::Warn, loc); }
LogStream error(const std::source_location& loc) { return LogStream(Level::Error, loc); }

void close_logger() {
  Logger::instance().close();
}

} // namespace mavlog::logger
