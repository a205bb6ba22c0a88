#include "mavlog/format/file_header.hpp"
#include "mavlog/format/errors.hpp"
#include "mavlog/format/wire.hpp"
#include "mavlog/io/byte_reader.hpp"
#include "mavlog/utils/utf8.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace mavlog::format {

namespace {

constexpr uint16_t kMavlinkOnlyBit    = 0x0001;
constexpr uint16_t kNotTimestampedBit = 0x0002;

// Field offsets inside the fixed header.
constexpr size_t kOffUuid       = 0;
constexpr size_t kOffTimestamp  = 16;
constexpr size_t kOffAppId      = 24;
constexpr size_t kOffVersion    = 56;
constexpr size_t kOffFlags      = 60;
constexpr size_t kOffDefinition = 62;

// Offsets inside the 46-byte definition block.
constexpr size_t kDefOffMajor   = 0;
constexpr size_t kDefOffMinor   = 4;
constexpr size_t kDefOffDialect = 8;
constexpr size_t kDefOffType    = 40;
constexpr size_t kDefOffSize    = 42;

static_assert(kOffDefinition + MessageDefinition::kFixedSize == FileHeader::kFixedSize);
static_assert(kDefOffSize + 4 == MessageDefinition::kFixedSize);

// Cap on a single allocation while reading a definition payload of unknown size.
constexpr size_t kPayloadChunk = 64 * 1024;

// NUL-truncated, UTF-8 checked. Invalid text decodes as "".
std::string unpack_string(const uint8_t* p, size_t width) {
  const auto* end = std::find(p, p + width, uint8_t{0});
  const std::span<const uint8_t> bytes(p, static_cast<size_t>(end - p));
  if (!utils::is_valid_utf8(bytes)) return {};
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

void check_string_field(std::string_view name, const std::string& value) {
  if (value.size() > kStringFieldSize) {
    throw std::invalid_argument(std::string(name) + " is " + std::to_string(value.size()) +
                                " bytes, limit is " + std::to_string(kStringFieldSize));
  }
}

} // namespace

// ---- FormatFlags ----
uint16_t FormatFlags::pack() const noexcept {
  uint16_t bits = 0;
  if (mavlink_only) bits |= kMavlinkOnlyBit;
  if (not_timestamped) bits |= kNotTimestampedBit;
  return bits;
}

FormatFlags FormatFlags::unpack(uint16_t bits) noexcept {
  return FormatFlags{
    .mavlink_only = (bits & kMavlinkOnlyBit) != 0,
    .not_timestamped = (bits & kNotTimestampedBit) != 0,
  };
}

const char* to_string(DefinitionPayloadType t) noexcept {
  switch (t) {
    case DefinitionPayloadType::None:    return "None";
    case DefinitionPayloadType::UrlList: return "UrlList";
    case DefinitionPayloadType::Xml:     return "Xml";
  }
  return "Unknown";
}

// ---- MessageDefinition ----
void MessageDefinition::pack(std::vector<uint8_t>& out) const {
  check_string_field("dialect", dialect);
  if (payload_type == DefinitionPayloadType::None) {
    if (size != 0 || !payload.empty()) {
      throw std::invalid_argument("definition payload given with payload type None");
    }
  } else if (payload.size() != size) {
    throw std::invalid_argument("definition payload is " + std::to_string(payload.size()) +
                                " bytes but size says " + std::to_string(size));
  }

  wire::put_u32_le(out, version_major);
  wire::put_u32_le(out, version_minor);
  wire::put_padded(out, dialect, kStringFieldSize);
  wire::put_u16_le(out, static_cast<uint16_t>(payload_type));
  wire::put_u32_le(out, size);
  if (payload_type != DefinitionPayloadType::None) wire::put_bytes(out, payload);
}

MessageDefinition MessageDefinition::unpack(std::span<const uint8_t, kFixedSize> in) {
  const uint8_t* p = in.data();

  const uint16_t type = wire::read_u16_le(p + kDefOffType);
  if (type > static_cast<uint16_t>(DefinitionPayloadType::Xml)) {
    throw FormatError("invalid message definition payload type " + std::to_string(type));
  }

  MessageDefinition d;
  d.version_major = wire::read_u32_le(p + kDefOffMajor);
  d.version_minor = wire::read_u32_le(p + kDefOffMinor);
  d.dialect = unpack_string(p + kDefOffDialect, kStringFieldSize);
  d.payload_type = static_cast<DefinitionPayloadType>(type);
  d.size = wire::read_u32_le(p + kDefOffSize);
  return d;
}

// ---- FileHeader ----
FileHeader FileHeader::create(FormatFlags flags,
                              MessageDefinition definition,
                              const core::Uuid& uuid,
                              uint64_t timestamp_us) {
  FileHeader h;
  h.uuid = uuid;
  h.timestamp_us = timestamp_us;
  h.format_flags = flags;
  h.message_definition = std::move(definition);
  return h;
}

std::vector<uint8_t> FileHeader::pack() const {
  check_string_field("src_application_id", src_application_id);

  std::vector<uint8_t> out;
  out.reserve(kFixedSize + message_definition.payload.size());
  wire::put_bytes(out, uuid);
  wire::put_u64_le(out, timestamp_us);
  wire::put_padded(out, src_application_id, kStringFieldSize);
  wire::put_u32_le(out, format_version);
  wire::put_u16_le(out, format_flags.pack());
  message_definition.pack(out);
  return out;
}

FileHeader FileHeader::unpack(std::span<const uint8_t, kFixedSize> in) {
  const uint8_t* p = in.data();

  FileHeader h;
  std::memcpy(h.uuid.data(), p + kOffUuid, h.uuid.size());
  h.timestamp_us = wire::read_u64_le(p + kOffTimestamp);
  h.src_application_id = unpack_string(p + kOffAppId, kStringFieldSize);
  h.format_version = wire::read_u32_le(p + kOffVersion);
  h.format_flags = FormatFlags::unpack(wire::read_u16_le(p + kOffFlags));
  h.message_definition = MessageDefinition::unpack(
      in.subspan<kOffDefinition, MessageDefinition::kFixedSize>());
  return h;
}

FileHeader FileHeader::read(io::ByteReader& in) {
  std::array<uint8_t, kFixedSize> fixed{};
  const size_t got = in.read(fixed.data(), fixed.size());
  if (got != fixed.size()) {
    throw FormatError("file header too short: got " + std::to_string(got) + " of " +
                      std::to_string(kFixedSize) + " bytes");
  }

  FileHeader h = unpack(fixed);

  // Always consume the declared payload so records start where the writer put them.
  auto& def = h.message_definition;
  size_t remaining = def.size;
  while (remaining > 0) {
    const size_t n = std::min(remaining, kPayloadChunk);
    const size_t old = def.payload.size();
    def.payload.resize(old + n);
    const size_t r = in.read(def.payload.data() + old, n);
    if (r != n) {
      throw FormatError("message definition payload too short: expected " +
                        std::to_string(def.size) + " bytes, got " +
                        std::to_string(old + r));
    }
    remaining -= n;
  }
  return h;
}

core::MavVersion check_supported(const FileHeader& h) {
  const auto& def = h.message_definition;
  if (def.payload_type != DefinitionPayloadType::None) {
    throw UnsupportedFileError(std::string("message definition payload type ") +
                               to_string(def.payload_type) + " is not supported");
  }
  if (h.format_version != FileHeader::kSupportedFormatVersion) {
    throw UnsupportedFileError("format version " + std::to_string(h.format_version) +
                               " is not supported (expected " +
                               std::to_string(FileHeader::kSupportedFormatVersion) + ")");
  }
  switch (def.version_major) {
    case 1: return core::MavVersion::V1;
    case 2: return core::MavVersion::V2;
    default:
      throw UnsupportedFileError("MAVLink major version " + std::to_string(def.version_major) +
                                 " is not supported");
  }
}

} // namespace mavlog::format
