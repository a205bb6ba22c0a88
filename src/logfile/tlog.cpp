#include "mavlog/logfile/tlog.hpp"
#include "mavlog/format/wire.hpp"
#include "mavlog/io/rotating_file.hpp"
#include "mavlog/mav/frame_codec.hpp"
#include "mavlog/utils/logger.hpp"
#include "mavlog/utils/timestamp.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace mavlog::logfile {

// ---- TlogWriter ----
TlogWriter::TlogWriter(io::RecordSinkPtr sink, mav::IFrameCodec& codec, Clock clock)
  : sink_(std::move(sink)),
    codec_(codec),
    clock_(clock ? std::move(clock) : Clock(&utils::epoch_now_us)) {
  if (!sink_) throw std::invalid_argument("TlogWriter: sink is null");
  if (!sink_->open({})) throw std::runtime_error("TlogWriter: failed to open log sink");
}

TlogWriter::TlogWriter(const std::filesystem::path& base_path,
                       uint64_t max_bytes,
                       uint32_t backup_count,
                       mav::IFrameCodec& codec)
  : TlogWriter(std::make_unique<io::RotatingFile>(base_path, max_bytes, backup_count), codec) {}

WriteStatus TlogWriter::write_mavlink(const core::MavFrame& frame) {
  record_.clear();
  format::wire::put_u64_le(record_, clock_());
  if (!codec_.write_frame(frame, record_)) return WriteStatus::EncodeFailed;

  if (!sink_->append(record_)) {
    logger::warn() << "[LOG] Failed to append tlog record (" << record_.size() << " bytes)";
    return WriteStatus::IoError;
  }
  ++records_written_;
  return WriteStatus::Ok;
}

void TlogWriter::flush() {
  sink_->flush();
}

void TlogWriter::close() noexcept {
  if (sink_) sink_->close();
}

// ---- TlogReader ----
static std::unique_ptr<std::istream> open_tlog(const std::filesystem::path& path) {
  auto f = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!f->is_open()) {
    logger::error() << "[READ] Failed to open " << path.string();
    throw std::runtime_error("cannot open tlog file: " + path.string());
  }
  return f;
}

TlogReader::TlogReader(const std::filesystem::path& path,
                       mav::IFrameCodec& codec,
                       core::MavVersion version,
                       ResyncPolicy policy)
  : TlogReader(open_tlog(path), nullptr, codec, version, policy) {}

TlogReader::TlogReader(std::istream& in,
                       mav::IFrameCodec& codec,
                       core::MavVersion version,
                       ResyncPolicy policy)
  : TlogReader(nullptr, &in, codec, version, policy) {}

TlogReader::TlogReader(std::unique_ptr<std::istream> owned, std::istream* in,
                       mav::IFrameCodec& codec, core::MavVersion version, ResyncPolicy policy)
  : owned_(std::move(owned)),
    bytes_(in ? *in : *owned_),
    entries_(bytes_, codec, version, policy) {}

ReadStatus TlogReader::next(core::LogEntry& out) {
  const ReadStatus st = entries_.next(out);
  if (st == ReadStatus::Ok) ++entries_read_;
  return st;
}

} // namespace mavlog::logfile
