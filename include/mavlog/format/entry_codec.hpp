#pragma once
#include "mavlog/format/file_header.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace mavlog::format {

/**
 * @brief Record framing for the four flag combinations.
 *
 *   mavlink_only, !not_timestamped : [ts u64][frame]
 *   mavlink_only,  not_timestamped : [frame]
 *   mixed,        !not_timestamped : [tag u8][ts u64][len u16][payload]
 *   mixed,         not_timestamped : [tag u8][len u16][payload]
 *
 * All integers little-endian. For Mavlink-tagged mixed records the frame is the
 * payload and the length field is informational only.
 */

enum class EntryType : uint8_t {
  Raw     = 0,
  Mavlink = 1,
  Text    = 2,
};

inline constexpr size_t kTagSize       = 1;
inline constexpr size_t kTimestampSize = 8;
inline constexpr size_t kLengthSize    = 2;
inline constexpr size_t kMaxPayload    = 0xFFFF;

// Unknown tag bytes decode as Raw.
[[nodiscard]] constexpr EntryType entry_type_from_byte(uint8_t b) noexcept {
  switch (b) {
    case 1: return EntryType::Mavlink;
    case 2: return EntryType::Text;
    default: return EntryType::Raw;
  }
}

const char* entry_type_name(EntryType t) noexcept;

// Bytes in front of the payload for the given flags.
[[nodiscard]] constexpr size_t record_prefix_size(const FormatFlags& f) noexcept {
  size_t n = 0;
  if (!f.mavlink_only) n += kTagSize + kLengthSize;
  if (!f.not_timestamped) n += kTimestampSize;
  return n;
}

/**
 * @brief Appends one packed record to out.
 *
 * @return false (out untouched) when the record cannot be represented:
 *         a non-Mavlink entry in a mavlink_only file, or a payload above
 *         kMaxPayload in a mixed file.
 */
[[nodiscard]] bool pack_record(const FormatFlags& flags,
                               EntryType type,
                               uint64_t timestamp_us,
                               std::span<const uint8_t> payload,
                               std::vector<uint8_t>& out);

} // namespace mavlog::format
