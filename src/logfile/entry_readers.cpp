#include "mavlog/logfile/entry_readers.hpp"
#include "mavlog/format/entry_codec.hpp"
#include "mavlog/format/wire.hpp"
#include "mavlog/io/byte_reader.hpp"
#include "mavlog/mav/frame_codec.hpp"
#include "mavlog/utils/logger.hpp"
#include "mavlog/utils/utf8.hpp"

#include <array>
#include <string>
#include <utility>
#include <vector>

namespace mavlog::logfile {

const char* to_string(ReadStatus s) noexcept {
  switch (s) {
    case ReadStatus::Ok:             return "Ok";
    case ReadStatus::EndOfStream:    return "EndOfStream";
    case ReadStatus::Truncated:      return "Truncated";
    case ReadStatus::InvalidText:    return "InvalidText";
    case ReadStatus::InvalidMavlink: return "InvalidMavlink";
    case ReadStatus::Desynchronized: return "Desynchronized";
  }
  return "Unknown";
}

ReadStatus detail::ReaderBase::read_frame(core::LogEntry& out, uint64_t record_start) {
  core::MavHeader header{};
  core::MavMessage message{};
  switch (codec_.read_frame(in_, version_, header, message)) {
    case mav::FrameStatus::Ok:
      out.header = header;
      out.message = std::move(message);
      return ReadStatus::Ok;
    case mav::FrameStatus::Invalid:
      return ReadStatus::InvalidMavlink;
    case mav::FrameStatus::EndOfStream:
      break;
  }
  return in_.position() == record_start ? ReadStatus::EndOfStream : ReadStatus::Truncated;
}

// ---- Variant A ----
ReadStatus MavlinkOnlyReader::next(core::LogEntry& out) {
  out = core::LogEntry{};
  return read_frame(out, in_.position());
}

// ---- Variant B ----
ReadStatus TimestampedMavlinkReader::next(core::LogEntry& out) {
  out = core::LogEntry{};
  const uint64_t start = in_.position();

  constexpr size_t kLookahead = format::kTimestampSize + 1;
  std::array<uint8_t, kLookahead> ahead{};
  const size_t n = in_.peek(ahead.data(), ahead.size());
  if (n == 0) return ReadStatus::EndOfStream;

  if (n == kLookahead && ahead[format::kTimestampSize] == codec_.start_marker(version_)) {
    in_.skip(format::kTimestampSize);
    out.timestamp = format::wire::read_u64_le(ahead.data());
    return read_frame(out, start);
  }

  if (policy_ == ResyncPolicy::Strict) {
    return n < kLookahead ? ReadStatus::Truncated : ReadStatus::Desynchronized;
  }

  ++resyncs_;
  logger::debug() << "[READ] no frame marker after timestamp at offset " << start
                  << ", scanning for next frame";
  return read_frame(out, start);
}

// ---- Variants C and D ----
template <bool Timestamped>
ReadStatus TaggedReader<Timestamped>::next(core::LogEntry& out) {
  out = core::LogEntry{};
  const uint64_t start = in_.position();

  uint8_t tag = 0;
  if (!in_.read_u8(tag)) return ReadStatus::EndOfStream;

  if constexpr (Timestamped) {
    uint8_t ts[format::kTimestampSize];
    if (!in_.read_exact(ts, sizeof(ts))) return ReadStatus::Truncated;
    out.timestamp = format::wire::read_u64_le(ts);
  }

  uint8_t len_bytes[format::kLengthSize];
  if (!in_.read_exact(len_bytes, sizeof(len_bytes))) return ReadStatus::Truncated;
  const uint16_t len = format::wire::read_u16_le(len_bytes);

  switch (format::entry_type_from_byte(tag)) {
    case format::EntryType::Mavlink: {
      // The codec frames the message itself; len is not used.
      const ReadStatus st = read_frame(out, start);
      return st == ReadStatus::EndOfStream ? ReadStatus::Truncated : st;
    }
    case format::EntryType::Text: {
      std::vector<uint8_t> bytes(len);
      if (!in_.read_exact(bytes)) return ReadStatus::Truncated;
      if (!utils::is_valid_utf8(bytes)) return ReadStatus::InvalidText;
      out.text = std::string(bytes.begin(), bytes.end());
      return ReadStatus::Ok;
    }
    case format::EntryType::Raw: {
      std::vector<uint8_t> bytes(len);
      if (!in_.read_exact(bytes)) return ReadStatus::Truncated;
      out.raw = std::move(bytes);
      return ReadStatus::Ok;
    }
  }
  return ReadStatus::Ok;
}

template class TaggedReader<false>;
template class TaggedReader<true>;

EntryReader make_entry_reader(const format::FormatFlags& flags,
                              io::ByteReader& in,
                              mav::IFrameCodec& codec,
                              core::MavVersion version,
                              ResyncPolicy policy) {
  if (flags.mavlink_only) {
    if (flags.not_timestamped) {
      return EntryReader(std::in_place_type<MavlinkOnlyReader>, in, codec, version);
    }
    return EntryReader(std::in_place_type<TimestampedMavlinkReader>, in, codec, version, policy);
  }
  if (flags.not_timestamped) {
    return EntryReader(std::in_place_type<MixedReader>, in, codec, version);
  }
  return EntryReader(std::in_place_type<TimestampedMixedReader>, in, codec, version);
}

} // namespace mavlog::logfile
