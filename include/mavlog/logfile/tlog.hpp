#pragma once
#include "mavlog/core/types.hpp"
#include "mavlog/io/byte_reader.hpp"
#include "mavlog/io/record_sink.hpp"
#include "mavlog/logfile/entry_readers.hpp"
#include "mavlog/logfile/mav_logger.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <vector>

namespace mavlog::mav { class IFrameCodec; }

namespace mavlog::logfile {

/**
 * @brief Ground-station style .tlog: no file header, every record is
 *   [epoch_us u64 LE][MAVLink frame]
 * Frames of either MAVLink version may be mixed; a reader only sees the
 * version it was opened for.
 */
class TlogWriter final : public IMavLogger {
public:
  using Clock = std::function<uint64_t()>;  // epoch microseconds

  TlogWriter(io::RecordSinkPtr sink, mav::IFrameCodec& codec, Clock clock = {});
  TlogWriter(const std::filesystem::path& base_path,
             uint64_t max_bytes,
             uint32_t backup_count,
             mav::IFrameCodec& codec);
  ~TlogWriter() override { close(); }

  TlogWriter(const TlogWriter&) = delete;
  TlogWriter& operator=(const TlogWriter&) = delete;

  [[nodiscard]] WriteStatus write_mavlink(const core::MavFrame& frame) override;
  void flush() override;
  void close() noexcept override;

  uint64_t records_written() const noexcept { return records_written_; }

private:
  io::RecordSinkPtr sink_;
  mav::IFrameCodec& codec_;
  Clock clock_;
  uint64_t records_written_{0};
  std::vector<uint8_t> record_;
};

class TlogReader {
public:
  TlogReader(const std::filesystem::path& path,
             mav::IFrameCodec& codec,
             core::MavVersion version = core::MavVersion::V2,
             ResyncPolicy policy = ResyncPolicy::Lenient);
  TlogReader(std::istream& in,
             mav::IFrameCodec& codec,
             core::MavVersion version = core::MavVersion::V2,
             ResyncPolicy policy = ResyncPolicy::Lenient);

  TlogReader(const TlogReader&) = delete;
  TlogReader& operator=(const TlogReader&) = delete;

  [[nodiscard]] ReadStatus next(core::LogEntry& out);

  uint64_t entries_read() const noexcept { return entries_read_; }
  uint64_t resyncs() const noexcept { return entries_.resyncs(); }

private:
  TlogReader(std::unique_ptr<std::istream> owned, std::istream* in,
             mav::IFrameCodec& codec, core::MavVersion version, ResyncPolicy policy);

  std::unique_ptr<std::istream> owned_;
  io::ByteReader bytes_;
  TimestampedMavlinkReader entries_;
  uint64_t entries_read_{0};
};

} // namespace mavlog::logfile
