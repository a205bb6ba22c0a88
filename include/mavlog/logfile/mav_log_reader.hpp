#pragma once
#include "mavlog/core/types.hpp"
#include "mavlog/format/file_header.hpp"
#include "mavlog/io/byte_reader.hpp"
#include "mavlog/logfile/entry_readers.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>

namespace mavlog::mav { class IFrameCodec; }

namespace mavlog::logfile {

/**
 * @brief Sequential decoder of a .mav log.
 *
 * The header is read and validated in the constructor; construction throws
 * (format::FormatError, format::UnsupportedFileError, std::runtime_error) and
 * never yields a half-open reader. Records are then pulled one at a time with
 * next() until it returns something other than ReadStatus::Ok.
 *
 * Usage:
 *   MavLogReader r(path, codec);
 *   core::LogEntry e;
 *   while (r.next(e) == ReadStatus::Ok) { ... }
 */
class MavLogReader {
public:
  MavLogReader(const std::filesystem::path& path,
               mav::IFrameCodec& codec,
               ResyncPolicy policy = ResyncPolicy::Lenient);

  // Stream must outlive the reader.
  MavLogReader(std::istream& in,
               mav::IFrameCodec& codec,
               ResyncPolicy policy = ResyncPolicy::Lenient);

  MavLogReader(const MavLogReader&) = delete;
  MavLogReader& operator=(const MavLogReader&) = delete;

  [[nodiscard]] ReadStatus next(core::LogEntry& out);

  const format::FileHeader& header() const noexcept { return header_; }
  core::MavVersion mavlink_version() const noexcept { return version_; }

  uint64_t entries_read() const noexcept { return entries_read_; }
  uint64_t bytes_consumed() const noexcept { return bytes_.position(); }

  // Timestamp resyncs so far (timestamped mavlink-only files only).
  uint64_t resyncs() const noexcept;

private:
  MavLogReader(std::unique_ptr<std::istream> owned,
               std::istream* in,
               mav::IFrameCodec& codec,
               ResyncPolicy policy);

  std::unique_ptr<std::istream> owned_;
  io::ByteReader bytes_;
  format::FileHeader header_;
  core::MavVersion version_;
  EntryReader entries_;
  uint64_t entries_read_{0};
};

} // namespace mavlog::logfile
