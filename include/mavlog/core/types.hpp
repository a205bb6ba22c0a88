#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mavlog::core
{

  using Uuid = std::array<uint8_t, 16>;

  // MAVLink wire protocol generation used by every message record of a file.
  enum class MavVersion : uint8_t
  {
    V1 = 1,
    V2 = 2,
  };

  // Start-of-frame markers of the MAVLink wire formats.
  inline constexpr uint8_t kMavlinkV1Stx = 0xFE;
  inline constexpr uint8_t kMavlinkV2Stx = 0xFD;

  // Routing part of a MAVLink frame header.
  struct MavHeader
  {
    uint8_t system_id{255};
    uint8_t component_id{0};
    uint8_t sequence{0};

    bool operator==(const MavHeader &) const = default;
  };

  // One MAVLink message: id plus the payload bytes exactly as framed on the wire.
  struct MavMessage
  {
    uint32_t msg_id{0};
    std::vector<uint8_t> payload;

    bool operator==(const MavMessage &) const = default;
  };

  struct MavFrame
  {
    MavHeader header;
    MavMessage message;
    MavVersion version{MavVersion::V2};
  };

  // One decoded log record. A successfully decoded entry carries exactly one of
  // message, text or raw; header is present iff message is.
  struct LogEntry
  {
    std::optional<uint64_t> timestamp;
    std::optional<MavHeader> header;
    std::optional<MavMessage> message;
    std::optional<std::string> text;
    std::optional<std::vector<uint8_t>> raw;

    bool operator==(const LogEntry &) const = default;
  };

  [[nodiscard]] constexpr uint8_t start_marker(MavVersion v) noexcept
  {
    return v == MavVersion::V1 ? kMavlinkV1Stx : kMavlinkV2Stx;
  }

} // namespace mavlog::core
