#pragma once
#include "mavlog/core/types.hpp"

#include <cstdint>
#include <vector>

namespace mavlog::io { class ByteReader; }

namespace mavlog::mav {

enum class FrameStatus {
  Ok,
  EndOfStream,  // bytes ran out before a complete valid frame
  Invalid,      // well-framed, checksum ok, but the message cannot be parsed
};

/**
 * @brief Embedded protocol codec used by the log readers and writers.
 *
 * read_frame() scans forward from the cursor to the next start-of-frame marker
 * of the requested version. A candidate whose checksum fails is not a frame:
 * only its marker byte is dropped and the scan goes on from the next byte, so
 * a real frame overlapping a bogus candidate is still found. Bytes in front of
 * the returned frame are consumed.
 */
class IFrameCodec {
public:
  virtual ~IFrameCodec() = default;

  virtual FrameStatus read_frame(io::ByteReader& in,
                                 core::MavVersion version,
                                 core::MavHeader& header,
                                 core::MavMessage& message) = 0;

  // Appends the serialized frame to out. False if it cannot be encoded.
  [[nodiscard]] virtual bool write_frame(const core::MavFrame& frame, std::vector<uint8_t>& out) = 0;

  virtual uint8_t start_marker(core::MavVersion version) const noexcept {
    return core::start_marker(version);
  }
};

} // namespace mavlog::mav
