#pragma once
#include <cstdint>
#include <span>
#include <string_view>

namespace mavlog::utils {

/**
 * @brief Strict UTF-8 validation.
 * Rejects overlong encodings, surrogates (U+D800..U+DFFF) and code points above U+10FFFF.
 */
[[nodiscard]] bool is_valid_utf8(std::span<const uint8_t> bytes) noexcept;

[[nodiscard]] inline bool is_valid_utf8(std::string_view s) noexcept {
  return is_valid_utf8(std::span<const uint8_t>(
      reinterpret_cast<const uint8_t*>(s.data()), s.size()));
}

} // namespace mavlog::utils
