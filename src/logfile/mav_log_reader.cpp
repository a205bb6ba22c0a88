#include "mavlog/logfile/mav_log_reader.hpp"
#include "mavlog/format/errors.hpp"
#include "mavlog/utils/logger.hpp"
#include "mavlog/utils/uuid.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>
#include <variant>

namespace mavlog::logfile {

namespace {

std::unique_ptr<std::istream> open_file(const std::filesystem::path& path) {
  auto f = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!f->is_open()) {
    logger::error() << "[READ] Failed to open " << path.string();
    throw std::runtime_error("cannot open log file: " + path.string());
  }
  return f;
}

format::FileHeader read_header(io::ByteReader& in) {
  try {
    return format::FileHeader::read(in);
  } catch (const format::FormatError& e) {
    logger::error() << "[READ] Bad file header: " << e.what();
    throw;
  }
}

core::MavVersion accept_header(const format::FileHeader& h) {
  try {
    const core::MavVersion v = format::check_supported(h);
    const auto& def = h.message_definition;
    logger::info() << "[READ] Log " << utils::uuid_to_string(h.uuid)
                   << " app=\"" << h.src_application_id << "\""
                   << " mavlink_only=" << h.format_flags.mavlink_only
                   << " timestamped=" << !h.format_flags.not_timestamped
                   << " mavlink=" << def.version_major << "." << def.version_minor
                   << " dialect=\"" << def.dialect << "\"";
    return v;
  } catch (const format::UnsupportedFileError& e) {
    logger::error() << "[READ] Unsupported log: " << e.what();
    throw;
  }
}

} // namespace

MavLogReader::MavLogReader(const std::filesystem::path& path,
                           mav::IFrameCodec& codec,
                           ResyncPolicy policy)
  : MavLogReader(open_file(path), nullptr, codec, policy) {}

MavLogReader::MavLogReader(std::istream& in,
                           mav::IFrameCodec& codec,
                           ResyncPolicy policy)
  : MavLogReader(nullptr, &in, codec, policy) {}

MavLogReader::MavLogReader(std::unique_ptr<std::istream> owned,
                           std::istream* in,
                           mav::IFrameCodec& codec,
                           ResyncPolicy policy)
  : owned_(std::move(owned)),
    bytes_(in ? *in : *owned_),
    header_(read_header(bytes_)),
    version_(accept_header(header_)),
    entries_(make_entry_reader(header_.format_flags, bytes_, codec, version_, policy)) {}

ReadStatus MavLogReader::next(core::LogEntry& out) {
  const ReadStatus st = std::visit([&](auto& r) { return r.next(out); }, entries_);
  if (st == ReadStatus::Ok) ++entries_read_;
  return st;
}

uint64_t MavLogReader::resyncs() const noexcept {
  if (const auto* r = std::get_if<TimestampedMavlinkReader>(&entries_)) return r->resyncs();
  return 0;
}

} // namespace mavlog::logfile
