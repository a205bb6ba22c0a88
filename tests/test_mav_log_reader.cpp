#include "fake_frame_codec.hpp"
#include "memory_sink.hpp"

#include "mavlog/format/errors.hpp"
#include "mavlog/format/wire.hpp"
#include "mavlog/logfile/mav_log_reader.hpp"
#include "mavlog/logfile/mav_log_writer.hpp"
#include "mavlog/utils/logger.hpp"

#include <cassert>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mavlog;
using logfile::ReadStatus;
using logfile::WriteStatus;

namespace {

// Deterministic clock: each call advances by step microseconds.
struct StepClock {
  uint64_t now{1'000'000};
  uint64_t step{100};
  uint64_t operator()() {
    const uint64_t t = now;
    now += step;
    return t;
  }
};

core::Uuid fixed_uuid() {
  core::Uuid id{};
  id.fill(0x11);
  return id;
}

format::FileHeader make_header(format::FormatFlags flags, uint32_t mav_major = 2) {
  format::MessageDefinition def;
  def.version_major = mav_major;
  return format::FileHeader::create(flags, def, fixed_uuid(), 42);
}

struct Session {
  std::shared_ptr<tests::MemorySinkState> sink = std::make_shared<tests::MemorySinkState>();
  tests::FakeFrameCodec codec;
  std::unique_ptr<logfile::MavLogWriter> writer;

  explicit Session(format::FormatFlags flags, logfile::MavLogWriter::Clock clock = StepClock{}) {
    writer = std::make_unique<logfile::MavLogWriter>(
        make_header(flags), std::make_unique<tests::MemorySink>(sink), codec, std::move(clock));
  }

  std::vector<uint8_t>& bytes() { return sink->bytes; }
};

std::vector<core::LogEntry> read_all(const std::vector<uint8_t>& bytes,
                                     ReadStatus expect_end = ReadStatus::EndOfStream,
                                     logfile::ResyncPolicy policy = logfile::ResyncPolicy::Lenient) {
  tests::FakeFrameCodec codec;
  auto ss = tests::as_stream(bytes);
  logfile::MavLogReader reader(ss, codec, policy);

  std::vector<core::LogEntry> out;
  core::LogEntry e;
  ReadStatus st;
  while ((st = reader.next(e)) == ReadStatus::Ok) out.push_back(e);
  assert(st == expect_end);
  assert(reader.entries_read() == out.size());
  return out;
}

bool only_message(const core::LogEntry& e) { return e.message && e.header && !e.text && !e.raw; }
bool only_text(const core::LogEntry& e) { return e.text && !e.message && !e.header && !e.raw; }
bool only_raw(const core::LogEntry& e) { return e.raw && !e.message && !e.header && !e.text; }

} // namespace

static void test_round_trip_all_flag_combinations() {
  const std::vector<uint8_t> blob{1, 2, 3, 4};
  const auto frame = tests::make_frame(0, {9, 8, 7}, 5);

  for (uint16_t bits = 0; bits < 4; ++bits) {
    const auto flags = format::FormatFlags::unpack(bits);
    Session s(flags);

    if (flags.mavlink_only) {
      assert(s.writer->write_mavlink(frame) == WriteStatus::Ok);
      assert(s.writer->write_mavlink(frame) == WriteStatus::Ok);
    } else {
      assert(s.writer->write_raw(blob) == WriteStatus::Ok);
      assert(s.writer->write_text("hello") == WriteStatus::Ok);
      assert(s.writer->write_mavlink(frame) == WriteStatus::Ok);
    }

    const auto entries = read_all(s.bytes());
    assert(entries.size() == (flags.mavlink_only ? 2u : 3u));
    for (const auto& e : entries) assert(e.timestamp.has_value() == !flags.not_timestamped);

    if (flags.mavlink_only) {
      for (const auto& e : entries) {
        assert(only_message(e));
        assert(*e.message == frame.message);
        assert(*e.header == frame.header);
      }
    } else {
      assert(only_raw(entries[0]) && *entries[0].raw == blob);
      assert(only_text(entries[1]) && *entries[1].text == "hello");
      assert(only_message(entries[2]) && *entries[2].message == frame.message);
    }
  }
}

static void test_heartbeat_mavlink_only_timestamped() {
  Session s({.mavlink_only = true, .not_timestamped = false});
  const auto hb = tests::make_frame(0, {0, 0, 0, 0, 2, 3, 0x51, 4, 3});
  assert(s.writer->write_mavlink(hb) == WriteStatus::Ok);

  const auto entries = read_all(s.bytes());
  assert(entries.size() == 1);
  const auto& e = entries[0];
  assert(e.timestamp.has_value());
  assert(e.header && e.message);
  assert(!e.text && !e.raw);
  assert(e.message->msg_id == 0);
  assert(e.message->payload == hb.message.payload);
}

static void test_mixed_cycles_in_order() {
  Session s({.mavlink_only = false, .not_timestamped = false});
  const std::vector<uint8_t> raw10(10, 0xAB);

  for (int cycle = 0; cycle < 20; ++cycle) {
    assert(s.writer->write_raw(raw10) == WriteStatus::Ok);
    assert(s.writer->write_text("abcde") == WriteStatus::Ok);
    for (uint8_t k = 0; k < 3; ++k) {
      const auto f = tests::make_frame(30, {k, 1, 2, 3}, static_cast<uint8_t>(cycle * 3 + k));
      assert(s.writer->write_mavlink(f) == WriteStatus::Ok);
    }
  }
  assert(s.writer->records_written() == 100);

  const auto entries = read_all(s.bytes());
  assert(entries.size() == 100);

  uint64_t last_ts = 0;
  for (size_t i = 0; i < entries.size(); ++i) {
    const auto& e = entries[i];
    switch (i % 5) {
      case 0: assert(only_raw(e) && *e.raw == raw10); break;
      case 1: assert(only_text(e) && *e.text == "abcde"); break;
      default:
        assert(only_message(e));
        assert(e.message->payload[0] == (i % 5) - 2);
        break;
    }
    assert(e.timestamp && *e.timestamp >= last_ts);
    last_ts = *e.timestamp;
  }
}

static void test_end_of_stream_is_sticky() {
  Session s({.mavlink_only = false, .not_timestamped = true});
  for (int i = 0; i < 7; ++i) assert(s.writer->write_text("x") == WriteStatus::Ok);

  tests::FakeFrameCodec codec;
  auto ss = tests::as_stream(s.bytes());
  logfile::MavLogReader reader(ss, codec);
  core::LogEntry e;
  for (int i = 0; i < 7; ++i) assert(reader.next(e) == ReadStatus::Ok);
  assert(reader.next(e) == ReadStatus::EndOfStream);
  assert(reader.next(e) == ReadStatus::EndOfStream);
  assert(reader.bytes_consumed() == s.bytes().size());
}

static void test_empty_file_has_no_entries() {
  for (uint16_t bits = 0; bits < 4; ++bits) {
    Session s(format::FormatFlags::unpack(bits));
    assert(read_all(s.bytes()).empty());
  }
}

static void test_truncation() {
  Session s({.mavlink_only = false, .not_timestamped = false});
  assert(s.writer->write_raw(std::vector<uint8_t>{1, 2, 3}) == WriteStatus::Ok);
  const size_t one = s.bytes().size();
  assert(s.writer->write_raw(std::vector<uint8_t>{4, 5, 6}) == WriteStatus::Ok);
  const auto& full = s.bytes();

  // right after the tag byte
  std::vector<uint8_t> cut(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(one + 1));
  assert(read_all(cut, ReadStatus::Truncated).size() == 1);

  // inside the timestamp
  cut.assign(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(one + 5));
  assert(read_all(cut, ReadStatus::Truncated).size() == 1);

  // inside the payload
  cut.assign(full.begin(), full.end() - 1);
  assert(read_all(cut, ReadStatus::Truncated).size() == 1);

  // inside a mavlink frame
  Session m({.mavlink_only = true, .not_timestamped = true});
  assert(m.writer->write_mavlink(tests::make_frame(1, {1, 2, 3})) == WriteStatus::Ok);
  cut.assign(m.bytes().begin(), m.bytes().end() - 2);
  assert(read_all(cut, ReadStatus::Truncated).empty());
}

static void test_unsupported_version_rejected_at_open() {
  Session s({.mavlink_only = false, .not_timestamped = false});
  assert(s.writer->write_text("never read") == WriteStatus::Ok);

  auto bytes = s.bytes();
  format::wire::write_u32_le(&bytes[56], 2);

  tests::FakeFrameCodec codec;
  auto ss = tests::as_stream(bytes);
  bool threw = false;
  try {
    logfile::MavLogReader reader(ss, codec);
  } catch (const format::UnsupportedFileError&) {
    threw = true;
  }
  assert(threw);

  auto short_bytes = std::vector<uint8_t>(bytes.begin(), bytes.begin() + 50);
  auto ss2 = tests::as_stream(short_bytes);
  threw = false;
  try {
    logfile::MavLogReader reader(ss2, codec);
  } catch (const format::FormatError&) {
    threw = true;
  }
  assert(threw);
}

static void test_unknown_tag_reads_as_raw() {
  Session s({.mavlink_only = false, .not_timestamped = true});
  auto bytes = s.bytes();
  bytes.insert(bytes.end(), {0x07, 0x02, 0x00, 0xCA, 0xFE});

  const auto entries = read_all(bytes);
  assert(entries.size() == 1);
  assert(only_raw(entries[0]));
  assert((*entries[0].raw == std::vector<uint8_t>{0xCA, 0xFE}));
}

static void test_invalid_text_is_reported_and_skipped() {
  Session s({.mavlink_only = false, .not_timestamped = true});
  auto bytes = s.bytes();
  bytes.insert(bytes.end(), {0x02, 0x02, 0x00, 0xC3, 0x28});  // bad continuation byte
  bytes.insert(bytes.end(), {0x02, 0x02, 0x00, 'o', 'k'});

  tests::FakeFrameCodec codec;
  auto ss = tests::as_stream(bytes);
  logfile::MavLogReader reader(ss, codec);
  core::LogEntry e;
  assert(reader.next(e) == ReadStatus::InvalidText);
  assert(reader.next(e) == ReadStatus::Ok);
  assert(*e.text == "ok");
  assert(reader.next(e) == ReadStatus::EndOfStream);
}

static void test_invalid_mavlink() {
  Session s({.mavlink_only = true, .not_timestamped = true});
  assert(s.writer->write_mavlink(tests::make_frame(tests::FakeFrameCodec::kInvalidMsgId, {1})) ==
         WriteStatus::Ok);
  assert(read_all(s.bytes(), ReadStatus::InvalidMavlink).empty());
}

static void test_mixed_mavlink_length_is_frame_size() {
  Session s({.mavlink_only = false, .not_timestamped = true});
  assert(s.writer->write_mavlink(tests::make_frame(3, {1, 2, 3, 4, 5})) == WriteStatus::Ok);
  const auto& b = s.bytes();
  const size_t rec = format::FileHeader::kFixedSize;
  assert(b[rec] == 1);
  assert(format::wire::read_u16_le(&b[rec + 1]) == tests::FakeFrameCodec::frame_size(5));
  assert(b.size() == rec + 3 + tests::FakeFrameCodec::frame_size(5));
}

static void test_bare_frames_skip_garbage() {
  Session s({.mavlink_only = true, .not_timestamped = true});
  assert(s.writer->write_mavlink(tests::make_frame(1, {1})) == WriteStatus::Ok);
  s.bytes().insert(s.bytes().end(), {0x00, 0x13, 0x37});
  assert(s.writer->write_mavlink(tests::make_frame(2, {2})) == WriteStatus::Ok);

  const auto entries = read_all(s.bytes());
  assert(entries.size() == 2);
  assert(entries[0].message->msg_id == 1);
  assert(entries[1].message->msg_id == 2);
}

static void test_timestamp_resync_policies() {
  Session s({.mavlink_only = true, .not_timestamped = false});
  assert(s.writer->write_mavlink(tests::make_frame(1, {1})) == WriteStatus::Ok);
  const size_t first = s.bytes().size();
  s.bytes().insert(s.bytes().end(), {0x01, 0x02, 0x03});
  assert(s.writer->write_mavlink(tests::make_frame(2, {2})) == WriteStatus::Ok);
  assert(s.writer->write_mavlink(tests::make_frame(3, {3})) == WriteStatus::Ok);

  // lenient: the record after the garbage loses its timestamp, the rest are intact
  {
    tests::FakeFrameCodec codec;
    auto ss = tests::as_stream(s.bytes());
    logfile::MavLogReader reader(ss, codec, logfile::ResyncPolicy::Lenient);
    core::LogEntry e;
    assert(reader.next(e) == ReadStatus::Ok && e.timestamp && e.message->msg_id == 1);
    assert(reader.next(e) == ReadStatus::Ok && !e.timestamp && e.message->msg_id == 2);
    assert(reader.next(e) == ReadStatus::Ok && e.timestamp && e.message->msg_id == 3);
    assert(reader.next(e) == ReadStatus::EndOfStream);
    assert(reader.resyncs() == 1);
  }

  // strict: stop at the misalignment without consuming it
  {
    tests::FakeFrameCodec codec;
    auto ss = tests::as_stream(s.bytes());
    logfile::MavLogReader reader(ss, codec, logfile::ResyncPolicy::Strict);
    core::LogEntry e;
    assert(reader.next(e) == ReadStatus::Ok);
    assert(reader.next(e) == ReadStatus::Desynchronized);
    assert(reader.bytes_consumed() == first);
    assert(reader.next(e) == ReadStatus::Desynchronized);
    assert(reader.resyncs() == 0);
  }

  // a tail shorter than timestamp plus marker
  Session t({.mavlink_only = true, .not_timestamped = false});
  assert(t.writer->write_mavlink(tests::make_frame(1, {1})) == WriteStatus::Ok);
  const size_t good = t.bytes().size();
  t.bytes().insert(t.bytes().end(), {0x10, 0x20, 0x30, 0x40, 0x50});

  {
    tests::FakeFrameCodec codec;
    auto ss = tests::as_stream(t.bytes());
    logfile::MavLogReader reader(ss, codec, logfile::ResyncPolicy::Strict);
    core::LogEntry e;
    assert(reader.next(e) == ReadStatus::Ok);
    assert(reader.next(e) == ReadStatus::Truncated);
    assert(reader.bytes_consumed() == good);
  }

  {
    tests::FakeFrameCodec codec;
    auto ss = tests::as_stream(t.bytes());
    logfile::MavLogReader reader(ss, codec, logfile::ResyncPolicy::Lenient);
    core::LogEntry e;
    assert(reader.next(e) == ReadStatus::Ok);
    assert(reader.next(e) == ReadStatus::Truncated);
    assert(reader.bytes_consumed() == t.bytes().size());
    assert(reader.resyncs() == 1);
  }
}

static void test_marker_inside_skipped_timestamp() {
  // frame 2 is stamped 0xFD, the low byte of its timestamp equals the v2 marker
  std::vector<uint64_t> readings{1000, 1100, 1000 + 0xFD};
  size_t idx = 0;
  Session s({.mavlink_only = true, .not_timestamped = false}, [&] { return readings[idx++]; });
  assert(s.writer->write_mavlink(tests::make_frame(1, {1})) == WriteStatus::Ok);
  s.bytes().insert(s.bytes().end(), {0x01, 0x02, 0x03});
  assert(s.writer->write_mavlink(tests::make_frame(2, {2})) == WriteStatus::Ok);
  assert(idx == readings.size());

  tests::FakeFrameCodec codec;
  auto ss = tests::as_stream(s.bytes());
  logfile::MavLogReader reader(ss, codec, logfile::ResyncPolicy::Lenient);
  core::LogEntry e;
  assert(reader.next(e) == ReadStatus::Ok && *e.timestamp == 100 && e.message->msg_id == 1);
  assert(reader.next(e) == ReadStatus::Ok && !e.timestamp && e.message->msg_id == 2);
  assert(reader.next(e) == ReadStatus::EndOfStream);
  assert(reader.resyncs() == 1);
  assert(codec.dropped() == 1);
}

static void test_false_marker_before_bare_frame() {
  Session s({.mavlink_only = true, .not_timestamped = true});
  assert(s.writer->write_mavlink(tests::make_frame(1, {1})) == WriteStatus::Ok);
  // marker plus a length that spans the next frame
  s.bytes().insert(s.bytes().end(), {0xFD, 0x20});
  assert(s.writer->write_mavlink(tests::make_frame(2, std::vector<uint8_t>(40, 0))) == WriteStatus::Ok);

  tests::FakeFrameCodec codec;
  auto ss = tests::as_stream(s.bytes());
  logfile::MavLogReader reader(ss, codec);
  core::LogEntry e;
  assert(reader.next(e) == ReadStatus::Ok && e.message->msg_id == 1);
  assert(reader.next(e) == ReadStatus::Ok && e.message->msg_id == 2);
  assert(e.message->payload.size() == 40);
  assert(reader.next(e) == ReadStatus::EndOfStream);
  assert(codec.dropped() == 1);
}

static void test_clock_regression() {
  std::vector<uint64_t> readings{5000, 6000, 4000, 4500};
  size_t idx = 0;
  Session s({.mavlink_only = false, .not_timestamped = false},
            [&] { return readings[idx++]; });

  for (int i = 0; i < 3; ++i) assert(s.writer->write_text("t") == WriteStatus::Ok);
  assert(idx == readings.size());

  const auto entries = read_all(s.bytes());
  assert(entries.size() == 3);
  assert(*entries[0].timestamp == 1000);
  assert(*entries[1].timestamp == 0);
  assert(*entries[2].timestamp == 500);
}

static void test_writer_rejections() {
  Session only({.mavlink_only = true, .not_timestamped = false});
  const size_t header_size = only.bytes().size();
  assert(only.writer->write_raw(std::vector<uint8_t>{1}) == WriteStatus::RejectedEntryType);
  assert(only.writer->write_text("x") == WriteStatus::RejectedEntryType);
  assert(only.writer->records_written() == 0);
  assert(only.bytes().size() == header_size);

  Session mixed({.mavlink_only = false, .not_timestamped = false});
  assert(mixed.writer->write_raw(std::vector<uint8_t>(70000, 0)) == WriteStatus::PayloadTooLarge);
  assert(mixed.writer->write_text(std::string("\xFF\xFE", 2)) == WriteStatus::InvalidText);
  assert(mixed.writer->write_text(std::string("\xED\xA0\x80", 3)) == WriteStatus::InvalidText);
  assert(mixed.writer->write_mavlink(tests::make_frame(0, {}, 0, core::MavVersion::V1)) ==
         WriteStatus::VersionMismatch);
  assert(mixed.writer->write_mavlink(tests::make_frame(0, std::vector<uint8_t>(300, 1))) ==
         WriteStatus::EncodeFailed);
  assert(mixed.writer->records_written() == 0);

  mixed.sink->fail_append = true;
  assert(mixed.writer->write_text("lost") == WriteStatus::IoError);
  mixed.sink->fail_append = false;
  assert(mixed.writer->write_text("kept") == WriteStatus::Ok);
  assert(mixed.writer->records_written() == 1);

  const auto entries = read_all(mixed.bytes());
  assert(entries.size() == 1 && *entries[0].text == "kept");

  mixed.writer->close();
  assert(mixed.sink->closed);
  assert(mixed.writer->write_text("after close") == WriteStatus::IoError);
}

static void test_writer_construction_errors() {
  tests::FakeFrameCodec codec;

  auto failing = std::make_shared<tests::MemorySinkState>();
  failing->fail_open = true;
  bool threw = false;
  try {
    logfile::MavLogWriter w(make_header({}), std::make_unique<tests::MemorySink>(failing), codec);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto h = make_header({});
  h.src_application_id = std::string(40, 'x');
  threw = false;
  try {
    logfile::MavLogWriter w(h, std::make_unique<tests::MemorySink>(std::make_shared<tests::MemorySinkState>()), codec);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    logfile::MavLogWriter w(make_header({}, 7),
                            std::make_unique<tests::MemorySink>(std::make_shared<tests::MemorySinkState>()),
                            codec);
  } catch (const format::UnsupportedFileError&) {
    threw = true;
  }
  assert(threw);
}

static void test_mavlink_v1_file() {
  auto sink = std::make_shared<tests::MemorySinkState>();
  tests::FakeFrameCodec codec;
  logfile::MavLogWriter w(make_header({.mavlink_only = true, .not_timestamped = false}, 1),
                          std::make_unique<tests::MemorySink>(sink), codec, StepClock{});
  assert(w.mavlink_version() == core::MavVersion::V1);
  assert(w.write_mavlink(tests::make_frame(0, {1, 2}, 0, core::MavVersion::V1)) == WriteStatus::Ok);
  assert(sink->bytes[format::FileHeader::kFixedSize + 8] == core::kMavlinkV1Stx);

  auto ss = tests::as_stream(sink->bytes);
  logfile::MavLogReader reader(ss, codec);
  assert(reader.mavlink_version() == core::MavVersion::V1);
  core::LogEntry e;
  assert(reader.next(e) == ReadStatus::Ok && e.timestamp && e.message);
  assert(reader.next(e) == ReadStatus::EndOfStream);
}

int main() {
  logger::set_print_level(logger::Level::Error);

  test_round_trip_all_flag_combinations();
  test_heartbeat_mavlink_only_timestamped();
  test_mixed_cycles_in_order();
  test_end_of_stream_is_sticky();
  test_empty_file_has_no_entries();
  test_truncation();
  test_unsupported_version_rejected_at_open();
  test_unknown_tag_reads_as_raw();
  test_invalid_text_is_reported_and_skipped();
  test_invalid_mavlink();
  test_mixed_mavlink_length_is_frame_size();
  test_bare_frames_skip_garbage();
  test_timestamp_resync_policies();
  test_marker_inside_skipped_timestamp();
  test_false_marker_before_bare_frame();
  test_clock_regression();
  test_writer_rejections();
  test_writer_construction_errors();
  test_mavlink_v1_file();

  logger::close_logger();
  return 0;
}
