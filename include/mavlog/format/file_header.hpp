#pragma once
#include "mavlog/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace mavlog::io { class ByteReader; }

namespace mavlog::format {

/**
 * @brief On-disk file header of a .mav log.
 *
 * Layout (little-endian, 108 fixed bytes):
 *   0   uuid[16]
 *   16  timestamp_us u64
 *   24  src_application_id[32] (NUL padded)
 *   56  format_version u32
 *   60  format_flags u16
 *   62  message definition (46 bytes, see MessageDefinition)
 *   108 definition payload[size]
 */

inline constexpr size_t kStringFieldSize = 32;

struct FormatFlags {
  bool mavlink_only{false};     // bit 0: no tag, no length, every record is a frame
  bool not_timestamped{false};  // bit 1: no per-record timestamp

  [[nodiscard]] uint16_t pack() const noexcept;
  [[nodiscard]] static FormatFlags unpack(uint16_t bits) noexcept;

  bool operator==(const FormatFlags&) const = default;
};

enum class DefinitionPayloadType : uint16_t {
  None    = 0,
  UrlList = 1,
  Xml     = 2,
};

const char* to_string(DefinitionPayloadType t) noexcept;

struct MessageDefinition {
  static constexpr size_t kFixedSize = 46;

  uint32_t version_major{2};
  uint32_t version_minor{0};
  std::string dialect{"common"};
  DefinitionPayloadType payload_type{DefinitionPayloadType::None};
  uint32_t size{0};
  std::vector<uint8_t> payload;

  // Appends the fixed block then the payload (when payload_type != None).
  // Throws std::invalid_argument on an oversized dialect or a size mismatch.
  void pack(std::vector<uint8_t>& out) const;

  // Decodes the fixed block only; payload is left empty.
  // Throws FormatError on an unknown payload type.
  static MessageDefinition unpack(std::span<const uint8_t, kFixedSize> in);

  bool operator==(const MessageDefinition&) const = default;
};

struct FileHeader {
  static constexpr size_t kFixedSize = 108;
  static constexpr uint32_t kSupportedFormatVersion = 1;

  core::Uuid uuid{};
  uint64_t timestamp_us{0};
  std::string src_application_id{"mavlog"};
  uint32_t format_version{kSupportedFormatVersion};
  FormatFlags format_flags{};
  MessageDefinition message_definition{};

  // New header for a file being created. Identity and time are injected.
  static FileHeader create(FormatFlags flags,
                           MessageDefinition definition,
                           const core::Uuid& uuid,
                           uint64_t timestamp_us);

  // Fixed part plus definition payload. Throws std::invalid_argument when a
  // string field does not fit or the payload size is inconsistent.
  [[nodiscard]] std::vector<uint8_t> pack() const;

  static FileHeader unpack(std::span<const uint8_t, kFixedSize> in);

  // Reads the fixed part and the definition payload. Throws FormatError on a
  // short read. Does not validate versions, see check_supported().
  static FileHeader read(io::ByteReader& in);

  bool operator==(const FileHeader&) const = default;
};

/**
 * @brief Validates that this build can decode a file with the given header.
 *
 * Checked in order: definition payload type, format version, MAVLink major
 * version. Throws UnsupportedFileError on the first failure.
 *
 * @return MAVLink wire version of every message record in the file.
 */
core::MavVersion check_supported(const FileHeader& h);

} // namespace mavlog::format
