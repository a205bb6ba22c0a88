#include "mavlog/utils/utf8.hpp"

namespace mavlog::utils {

static bool is_cont(uint8_t b) noexcept { return (b & 0xC0) == 0x80; }

bool is_valid_utf8(std::span<const uint8_t> bytes) noexcept {
  const size_t n = bytes.size();
  size_t i = 0;
  while (i < n) {
    const uint8_t b0 = bytes[i];
    if (b0 < 0x80) { ++i; continue; }

    size_t len = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;
    if ((b0 & 0xE0) == 0xC0)      { len = 2; cp = b0 & 0x1F; min_cp = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; min_cp = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; min_cp = 0x10000; }
    else return false;

    if (i + len > n) return false;
    for (size_t k = 1; k < len; ++k) {
      const uint8_t b = bytes[i + k];
      if (!is_cont(b)) return false;
      cp = (cp << 6) | (b & 0x3F);
    }

    if (cp < min_cp) return false;                   // overlong
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;  // surrogate
    if (cp > 0x10FFFF) return false;
    i += len;
  }
  return true;
}

} // namespace mavlog::utils
