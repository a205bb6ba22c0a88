#pragma once
#include "mavlog/mav/frame_codec.hpp"

#include <common/mavlink.h>

namespace mavlog::mav {

/**
 * @brief IFrameCodec backed by the MAVLink C library (common dialect).
 *
 * Reading:
 * - bytes are skipped until the start-of-frame marker of the requested version
 * - each candidate is parsed from peeked bytes; a candidate failing CRC (or
 *   signature) costs only its marker byte and scanning resumes right after it
 * - a frame whose id has no entry in the dialect is consumed and reported as
 *   Invalid
 *
 * Writing re-frames the message with the header's sequence number. MAVLink 2
 * payloads are trimmed of trailing zeros as the library does; message ids above
 * 255 cannot be written as MAVLink 1.
 */
class MavlinkCodec final : public IFrameCodec {
public:
  FrameStatus read_frame(io::ByteReader& in,
                         core::MavVersion version,
                         core::MavHeader& header,
                         core::MavMessage& message) override;

  [[nodiscard]] bool write_frame(const core::MavFrame& frame, std::vector<uint8_t>& out) override;

  uint64_t dropped_frames() const noexcept { return dropped_frames_; }

private:
  uint64_t dropped_frames_{0};
};

// Library message to our frame type. Version follows the frame's magic byte.
core::MavFrame to_frame(const mavlink_message_t& msg);

// Our frame to a finalized library message. False for unknown ids or a payload
// longer than the message definition.
[[nodiscard]] bool to_mavlink(const core::MavFrame& frame, mavlink_message_t& msg);

} // namespace mavlog::mav
