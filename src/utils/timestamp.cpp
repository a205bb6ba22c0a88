#include "mavlog/utils/timestamp.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mavlog::utils {

static std::string format_time_t(std::time_t t, std::string_view fmt) {
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  std::ostringstream oss;
  const std::string fmt_str(fmt);
  oss << std::put_time(&tm_buf, fmt_str.c_str());
  return oss.str();
}

uint64_t epoch_now_us() noexcept {
  using namespace std::chrono;
  const auto us = duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
  return us > 0 ? static_cast<uint64_t>(us) : 0;
}

double monotonic_now() noexcept {
  using namespace std::chrono;
  static const steady_clock::time_point t0 = steady_clock::now();
  return duration_cast<std::chrono::duration<double>>(steady_clock::now() - t0).count();
}

std::string timestamp_string(std::string_view fmt) {
  const auto now = std::chrono::system_clock::now();
  return format_time_t(std::chrono::system_clock::to_time_t(now), fmt);
}

std::string format_epoch_us(uint64_t epoch_us, std::string_view fmt) {
  return format_time_t(static_cast<std::time_t>(epoch_us / 1'000'000u), fmt);
}

} // namespace mavlog::utils
