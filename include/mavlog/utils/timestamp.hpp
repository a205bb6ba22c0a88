#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace mavlog::utils {

/**
 * @brief Wall clock, microseconds since the Unix epoch.
 * Clamped to 0 if the system clock reads before 1970.
 */
[[nodiscard]] uint64_t epoch_now_us() noexcept;

/**
 * @brief Get monotonic timestamp in seconds since first call
 */
[[nodiscard]] double monotonic_now() noexcept;

[[nodiscard]] std::string timestamp_string(std::string_view fmt = "%Y-%m-%d_%H-%M-%S");

// Local time of an epoch-microsecond value, e.g. for dumps.
[[nodiscard]] std::string format_epoch_us(uint64_t epoch_us, std::string_view fmt = "%Y-%m-%d %H:%M:%S");

} // namespace mavlog::utils
