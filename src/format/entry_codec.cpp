#include "mavlog/format/entry_codec.hpp"
#include "mavlog/format/wire.hpp"

namespace mavlog::format {

const char* entry_type_name(EntryType t) noexcept {
  switch (t) {
    case EntryType::Raw:     return "RAW";
    case EntryType::Mavlink: return "MAVLINK";
    case EntryType::Text:    return "TEXT";
  }
  return "UNKNOWN";
}

bool pack_record(const FormatFlags& flags,
                 EntryType type,
                 uint64_t timestamp_us,
                 std::span<const uint8_t> payload,
                 std::vector<uint8_t>& out) {
  if (flags.mavlink_only && type != EntryType::Mavlink) return false;
  if (!flags.mavlink_only && payload.size() > kMaxPayload) return false;

  out.reserve(out.size() + record_prefix_size(flags) + payload.size());
  if (!flags.mavlink_only) wire::put_u8(out, static_cast<uint8_t>(type));
  if (!flags.not_timestamped) wire::put_u64_le(out, timestamp_us);
  if (!flags.mavlink_only) wire::put_u16_le(out, static_cast<uint16_t>(payload.size()));
  wire::put_bytes(out, payload);
  return true;
}

} // namespace mavlog::format
