#include "mavlog/format/errors.hpp"
#include "mavlog/format/file_header.hpp"
#include "mavlog/format/wire.hpp"
#include "mavlog/io/byte_reader.hpp"

#include <cassert>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mavlog;

static core::Uuid test_uuid() {
  core::Uuid id{};
  for (size_t i = 0; i < id.size(); ++i) id[i] = static_cast<uint8_t>(0xA0 + i);
  return id;
}

static format::FileHeader sample_header() {
  format::MessageDefinition def;
  def.version_major = 2;
  def.version_minor = 3;
  def.dialect = "ardupilotmega";
  auto h = format::FileHeader::create({.mavlink_only = true, .not_timestamped = false},
                                      def, test_uuid(), 1'700'000'000'123'456ull);
  h.src_application_id = "unit-test";
  return h;
}

static format::FileHeader unpack_bytes(const std::vector<uint8_t>& bytes) {
  assert(bytes.size() >= format::FileHeader::kFixedSize);
  return format::FileHeader::unpack(
      std::span<const uint8_t, format::FileHeader::kFixedSize>(bytes.data(), format::FileHeader::kFixedSize));
}

static format::FileHeader read_bytes(const std::vector<uint8_t>& bytes) {
  std::istringstream ss(std::string(bytes.begin(), bytes.end()));
  io::ByteReader r(ss);
  return format::FileHeader::read(r);
}

template <typename E, typename F>
static bool throws(F&& f) {
  try {
    f();
  } catch (const E&) {
    return true;
  }
  return false;
}

static void test_layout() {
  const auto h = sample_header();
  const auto bytes = h.pack();
  assert(bytes.size() == 108);

  for (size_t i = 0; i < 16; ++i) assert(bytes[i] == 0xA0 + i);
  assert(format::wire::read_u64_le(&bytes[16]) == 1'700'000'000'123'456ull);
  assert(std::string(reinterpret_cast<const char*>(&bytes[24])) == "unit-test");
  assert(bytes[24 + 9] == 0 && bytes[55] == 0);
  assert(format::wire::read_u32_le(&bytes[56]) == 1);
  assert(format::wire::read_u16_le(&bytes[60]) == 0x0001);
  assert(format::wire::read_u32_le(&bytes[62]) == 2);
  assert(format::wire::read_u32_le(&bytes[66]) == 3);
  assert(std::string(reinterpret_cast<const char*>(&bytes[70])) == "ardupilotmega");
  assert(format::wire::read_u16_le(&bytes[102]) == 0);
  assert(format::wire::read_u32_le(&bytes[104]) == 0);
}

static void test_pack_unpack() {
  const auto h = sample_header();
  const auto back = unpack_bytes(h.pack());
  assert(back == h);
  assert(back.uuid == test_uuid());
  assert(format::check_supported(back) == core::MavVersion::V2);
}

static void test_defaults() {
  const auto h = format::FileHeader::create({}, {}, test_uuid(), 0);
  assert(h.src_application_id == "mavlog");
  assert(h.format_version == 1);
  assert(h.message_definition.version_major == 2);
  assert(h.message_definition.version_minor == 0);
  assert(h.message_definition.dialect == "common");
  assert(h.message_definition.payload_type == format::DefinitionPayloadType::None);
  assert(h.message_definition.size == 0);
}

static void test_flags() {
  for (uint16_t x = 0; x < 4; ++x) {
    assert(format::FormatFlags::unpack(x).pack() == x);
  }
  assert(format::FormatFlags::unpack(0xFFFC).pack() == 0);
  assert(format::FormatFlags::unpack(0xFFFF).pack() == 3);

  const auto f = format::FormatFlags::unpack(0x0002);
  assert(!f.mavlink_only && f.not_timestamped);
}

static void test_string_limits() {
  auto h = sample_header();
  h.src_application_id = std::string(32, 'a');
  h.message_definition.dialect = std::string(32, 'd');
  const auto back = unpack_bytes(h.pack());
  assert(back.src_application_id == std::string(32, 'a'));
  assert(back.message_definition.dialect == std::string(32, 'd'));

  h.src_application_id = std::string(33, 'a');
  assert(throws<std::invalid_argument>([&] { (void)h.pack(); }));

  h.src_application_id = "ok";
  h.message_definition.dialect = std::string(33, 'd');
  assert(throws<std::invalid_argument>([&] { (void)h.pack(); }));
}

static void test_nul_truncation_and_bad_utf8() {
  auto h = sample_header();
  h.src_application_id = std::string("abc\0def", 7);
  auto bytes = h.pack();
  assert(unpack_bytes(bytes).src_application_id == "abc");

  bytes[24] = 0xFF;  // not UTF-8
  bytes[25] = 0xFE;
  const auto back = unpack_bytes(bytes);
  assert(back.src_application_id.empty());
  assert(back.message_definition.dialect == "ardupilotmega");
}

static void test_definition_payload() {
  auto h = sample_header();
  h.message_definition.payload_type = format::DefinitionPayloadType::Xml;
  h.message_definition.payload = {'<', 'x', '/', '>', '\n'};
  h.message_definition.size = 5;

  auto bytes = h.pack();
  assert(bytes.size() == 108 + 5);
  bytes.push_back(0x42);  // first record byte

  std::istringstream ss(std::string(bytes.begin(), bytes.end()));
  io::ByteReader r(ss);
  const auto back = format::FileHeader::read(r);
  assert(back.message_definition.payload == h.message_definition.payload);
  assert(r.position() == 113);
  uint8_t next = 0;
  assert(r.read_u8(next) && next == 0x42);

  assert(throws<format::UnsupportedFileError>([&] { (void)format::check_supported(back); }));

  h.message_definition.size = 4;
  assert(throws<std::invalid_argument>([&] { (void)h.pack(); }));

  h.message_definition.payload_type = format::DefinitionPayloadType::None;
  assert(throws<std::invalid_argument>([&] { (void)h.pack(); }));
}

static void test_read_errors() {
  const auto bytes = sample_header().pack();

  std::vector<uint8_t> short_header(bytes.begin(), bytes.begin() + 107);
  assert(throws<format::FormatError>([&] { (void)read_bytes(short_header); }));
  assert(throws<format::FormatError>([&] { (void)read_bytes({}); }));

  auto bad_type = bytes;
  format::wire::write_u16_le(&bad_type[102], 3);
  assert(throws<format::FormatError>([&] { (void)read_bytes(bad_type); }));

  auto short_payload = bytes;
  format::wire::write_u16_le(&short_payload[102], 1);
  format::wire::write_u32_le(&short_payload[104], 10);
  short_payload.insert(short_payload.end(), {1, 2, 3});
  assert(throws<format::FormatError>([&] { (void)read_bytes(short_payload); }));
}

static void test_unsupported() {
  auto v2 = sample_header();
  v2.format_version = 2;
  assert(throws<format::UnsupportedFileError>([&] { (void)format::check_supported(v2); }));

  auto mav3 = sample_header();
  mav3.message_definition.version_major = 3;
  assert(throws<format::UnsupportedFileError>([&] { (void)format::check_supported(mav3); }));

  auto mav1 = sample_header();
  mav1.message_definition.version_major = 1;
  assert(format::check_supported(mav1) == core::MavVersion::V1);
}

int main() {
  test_layout();
  test_pack_unpack();
  test_defaults();
  test_flags();
  test_string_limits();
  test_nul_truncation_and_bad_utf8();
  test_definition_payload();
  test_read_errors();
  test_unsupported();
  return 0;
}
