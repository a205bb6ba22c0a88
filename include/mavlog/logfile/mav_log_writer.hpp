#pragma once
#include "mavlog/format/entry_codec.hpp"
#include "mavlog/format/file_header.hpp"
#include "mavlog/io/record_sink.hpp"
#include "mavlog/logfile/mav_logger.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string_view>
#include <vector>

namespace mavlog::mav { class IFrameCodec; }

namespace mavlog::logfile {

/**
 * @brief Encoder of .mav logs.
 *
 * The header is fixed at construction and written once, as the sink preamble,
 * so every rotated file starts with it. Record timestamps are microseconds
 * elapsed since the clock reading taken at construction; if the clock steps
 * backwards the reference moves to the new reading and that record gets 0.
 *
 * Rejected writes (any status other than Ok) leave the writer unchanged.
 * Single caller per writer.
 */
class MavLogWriter final : public IMavLogger {
public:
  using Clock = std::function<uint64_t()>;  // microseconds

  // Throws std::invalid_argument (null sink, unpackable header),
  // format::UnsupportedFileError (header this library could not read back) or
  // std::runtime_error (sink failed to open).
  MavLogWriter(format::FileHeader header,
               io::RecordSinkPtr sink,
               mav::IFrameCodec& codec,
               Clock clock = {});

  // Rotating file at base_path with a fresh uuid and the current time.
  MavLogWriter(const std::filesystem::path& base_path,
               uint64_t max_bytes,
               uint32_t backup_count,
               format::FormatFlags flags,
               format::MessageDefinition definition,
               mav::IFrameCodec& codec);

  ~MavLogWriter() override { close(); }

  MavLogWriter(const MavLogWriter&) = delete;
  MavLogWriter& operator=(const MavLogWriter&) = delete;

  [[nodiscard]] WriteStatus write(format::EntryType type, std::span<const uint8_t> data);

  [[nodiscard]] WriteStatus write_raw(std::span<const uint8_t> data) {
    return write(format::EntryType::Raw, data);
  }
  [[nodiscard]] WriteStatus write_text(std::string_view text);
  [[nodiscard]] WriteStatus write_mavlink(const core::MavFrame& frame) override;

  void flush() override;
  void close() noexcept override;

  const format::FileHeader& header() const noexcept { return header_; }
  core::MavVersion mavlink_version() const noexcept { return version_; }
  uint64_t records_written() const noexcept { return records_written_; }

private:
  uint64_t elapsed_us();

  format::FileHeader header_;
  core::MavVersion version_;
  io::RecordSinkPtr sink_;
  mav::IFrameCodec& codec_;
  Clock clock_;
  uint64_t reference_us_{0};
  uint64_t records_written_{0};

  std::vector<uint8_t> record_;  // reused encode buffers
  std::vector<uint8_t> frame_;
};

} // namespace mavlog::logfile
