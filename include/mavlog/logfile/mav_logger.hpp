#pragma once
#include "mavlog/core/types.hpp"

namespace mavlog::logfile {

enum class WriteStatus {
  Ok,
  RejectedEntryType,  // non-MAVLink entry in a mavlink_only file
  PayloadTooLarge,    // above 65535 bytes in a mixed file
  InvalidText,        // text entry is not valid UTF-8
  VersionMismatch,    // frame version differs from the file's MAVLink version
  EncodeFailed,       // frame codec could not serialize the frame
  IoError,            // sink refused the record
};

const char* to_string(WriteStatus s) noexcept;

// Anything that records MAVLink frames to disk.
class IMavLogger {
public:
  virtual ~IMavLogger() = default;

  [[nodiscard]] virtual WriteStatus write_mavlink(const core::MavFrame& frame) = 0;
  virtual void flush() = 0;
  virtual void close() noexcept = 0;
};

} // namespace mavlog::logfile
