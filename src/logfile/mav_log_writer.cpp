#include "mavlog/logfile/mav_log_writer.hpp"
#include "mavlog/io/rotating_file.hpp"
#include "mavlog/mav/frame_codec.hpp"
#include "mavlog/utils/logger.hpp"
#include "mavlog/utils/timestamp.hpp"
#include "mavlog/utils/utf8.hpp"
#include "mavlog/utils/uuid.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace mavlog::logfile {

const char* to_string(WriteStatus s) noexcept {
  switch (s) {
    case WriteStatus::Ok:                return "Ok";
    case WriteStatus::RejectedEntryType: return "RejectedEntryType";
    case WriteStatus::PayloadTooLarge:   return "PayloadTooLarge";
    case WriteStatus::InvalidText:       return "InvalidText";
    case WriteStatus::VersionMismatch:   return "VersionMismatch";
    case WriteStatus::EncodeFailed:      return "EncodeFailed";
    case WriteStatus::IoError:           return "IoError";
  }
  return "Unknown";
}

MavLogWriter::MavLogWriter(format::FileHeader header,
                           io::RecordSinkPtr sink,
                           mav::IFrameCodec& codec,
                           Clock clock)
  : header_(std::move(header)),
    version_(format::check_supported(header_)),
    sink_(std::move(sink)),
    codec_(codec),
    clock_(clock ? std::move(clock) : Clock(&utils::epoch_now_us)) {
  if (!sink_) throw std::invalid_argument("MavLogWriter: sink is null");

  const std::vector<uint8_t> preamble = header_.pack();
  if (!sink_->open(preamble)) {
    throw std::runtime_error("MavLogWriter: failed to open log sink");
  }
  reference_us_ = clock_();

  logger::debug() << "[LOG] Writer ready, uuid " << utils::uuid_to_string(header_.uuid)
                  << ", header " << preamble.size() << " bytes";
}

MavLogWriter::MavLogWriter(const std::filesystem::path& base_path,
                           uint64_t max_bytes,
                           uint32_t backup_count,
                           format::FormatFlags flags,
                           format::MessageDefinition definition,
                           mav::IFrameCodec& codec)
  : MavLogWriter(format::FileHeader::create(flags, std::move(definition),
                                            utils::generate_uuid(), utils::epoch_now_us()),
                 std::make_unique<io::RotatingFile>(base_path, max_bytes, backup_count),
                 codec) {}

uint64_t MavLogWriter::elapsed_us() {
  const uint64_t now = clock_();
  if (now < reference_us_) {
    logger::warn() << "[LOG] Clock went backwards by " << (reference_us_ - now)
                   << " us, resetting time reference";
    reference_us_ = now;
    return 0;
  }
  return now - reference_us_;
}

WriteStatus MavLogWriter::write(format::EntryType type, std::span<const uint8_t> data) {
  const auto& flags = header_.format_flags;
  if (flags.mavlink_only && type != format::EntryType::Mavlink) {
    return WriteStatus::RejectedEntryType;
  }
  if (!flags.mavlink_only && data.size() > format::kMaxPayload) {
    return WriteStatus::PayloadTooLarge;
  }
  if (type == format::EntryType::Text && !utils::is_valid_utf8(data)) {
    return WriteStatus::InvalidText;
  }

  const uint64_t ts = flags.not_timestamped ? 0 : elapsed_us();

  record_.clear();
  if (!format::pack_record(flags, type, ts, data, record_)) {
    return WriteStatus::RejectedEntryType;
  }

  if (!sink_->append(record_)) {
    logger::warn() << "[LOG] Failed to append " << format::entry_type_name(type)
                   << " record (" << record_.size() << " bytes)";
    return WriteStatus::IoError;
  }
  ++records_written_;
  return WriteStatus::Ok;
}

WriteStatus MavLogWriter::write_text(std::string_view text) {
  return write(format::EntryType::Text,
               std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

WriteStatus MavLogWriter::write_mavlink(const core::MavFrame& frame) {
  if (frame.version != version_) return WriteStatus::VersionMismatch;

  frame_.clear();
  if (!codec_.write_frame(frame, frame_)) return WriteStatus::EncodeFailed;
  return write(format::EntryType::Mavlink, frame_);
}

void MavLogWriter::flush() {
  sink_->flush();
}

void MavLogWriter::close() noexcept {
  if (sink_) sink_->close();
}

} // namespace mavlog::logfile
