#pragma once
#include "mavlog/core/types.hpp"
#include "mavlog/format/file_header.hpp"

#include <cstdint>
#include <variant>

namespace mavlog::io { class ByteReader; }
namespace mavlog::mav { class IFrameCodec; }

namespace mavlog::logfile {

enum class ReadStatus {
  Ok,
  EndOfStream,     // clean end at a record boundary
  Truncated,       // stream ended inside a record
  InvalidText,     // text record is not valid UTF-8 (record consumed)
  InvalidMavlink,  // frame found but the message cannot be parsed
  Desynchronized,  // strict mode: no frame marker where one must be
};

const char* to_string(ReadStatus s) noexcept;

/**
 * @brief What the timestamped mavlink-only reader does when the byte after the
 * 8-byte timestamp slot is not a start-of-frame marker.
 *
 * Lenient: read no timestamp and let the frame codec scan forward. On corrupt
 * data a coincidental marker can attach a wrong timestamp to a message.
 * Strict:  stop with ReadStatus::Desynchronized, nothing consumed.
 */
enum class ResyncPolicy {
  Lenient,
  Strict,
};

namespace detail {

class ReaderBase {
protected:
  ReaderBase(io::ByteReader& in, mav::IFrameCodec& codec, core::MavVersion version)
    : in_(in), codec_(codec), version_(version) {}

  // Decodes one frame into out. record_start is the cursor position where the
  // current record began, used to tell EndOfStream from Truncated.
  ReadStatus read_frame(core::LogEntry& out, uint64_t record_start);

  io::ByteReader& in_;
  mav::IFrameCodec& codec_;
  core::MavVersion version_;
};

} // namespace detail

// mavlink_only, not timestamped: every record is a bare frame.
class MavlinkOnlyReader : detail::ReaderBase {
public:
  MavlinkOnlyReader(io::ByteReader& in, mav::IFrameCodec& codec, core::MavVersion version)
    : ReaderBase(in, codec, version) {}

  ReadStatus next(core::LogEntry& out);
};

// mavlink_only, timestamped: [ts u64][frame], with marker-based resync.
class TimestampedMavlinkReader : detail::ReaderBase {
public:
  TimestampedMavlinkReader(io::ByteReader& in, mav::IFrameCodec& codec,
                           core::MavVersion version, ResyncPolicy policy)
    : ReaderBase(in, codec, version), policy_(policy) {}

  ReadStatus next(core::LogEntry& out);

  // Records decoded without a timestamp because the marker check failed.
  uint64_t resyncs() const noexcept { return resyncs_; }

private:
  ResyncPolicy policy_;
  uint64_t resyncs_{0};
};

// Mixed records: [tag u8]([ts u64])[len u16][payload].
template <bool Timestamped>
class TaggedReader : detail::ReaderBase {
public:
  TaggedReader(io::ByteReader& in, mav::IFrameCodec& codec, core::MavVersion version)
    : ReaderBase(in, codec, version) {}

  ReadStatus next(core::LogEntry& out);
};

extern template class TaggedReader<false>;
extern template class TaggedReader<true>;

using MixedReader = TaggedReader<false>;
using TimestampedMixedReader = TaggedReader<true>;

using EntryReader = std::variant<MavlinkOnlyReader,
                                 TimestampedMavlinkReader,
                                 MixedReader,
                                 TimestampedMixedReader>;

// Picks the reader for a file's flags. Fixed for the life of the file.
EntryReader make_entry_reader(const format::FormatFlags& flags,
                              io::ByteReader& in,
                              mav::IFrameCodec& codec,
                              core::MavVersion version,
                              ResyncPolicy policy = ResyncPolicy::Lenient);

} // namespace mavlog::logfile
