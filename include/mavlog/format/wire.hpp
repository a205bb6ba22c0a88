#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace mavlog::format::wire {

/**
 * @brief Byte order helpers for the log file format.
 *
 * IMPORTANT:
 * - Every multi-byte field of a log file is LITTLE-ENDIAN.
 * - Fields are serialized one by one, never by dumping a struct, so files are
 *   readable by tools in other languages regardless of padding/alignment.
 */

inline void write_u16_le(uint8_t* out, uint16_t v) noexcept {
  out[0] = static_cast<uint8_t>(v & 0xFF);
  out[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}

inline void write_u32_le(uint8_t* out, uint32_t v) noexcept {
  out[0] = static_cast<uint8_t>(v & 0xFF);
  out[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  out[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
  out[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

inline void write_u64_le(uint8_t* out, uint64_t v) noexcept {
  write_u32_le(out, static_cast<uint32_t>(v & 0xFFFFFFFFu));
  write_u32_le(out + 4, static_cast<uint32_t>(v >> 32));
}

inline uint16_t read_u16_le(const uint8_t* in) noexcept {
  return static_cast<uint16_t>(static_cast<uint16_t>(in[0]) |
                               (static_cast<uint16_t>(in[1]) << 8));
}

inline uint32_t read_u32_le(const uint8_t* in) noexcept {
  return static_cast<uint32_t>(static_cast<uint32_t>(in[0]) |
                               (static_cast<uint32_t>(in[1]) << 8) |
                               (static_cast<uint32_t>(in[2]) << 16) |
                               (static_cast<uint32_t>(in[3]) << 24));
}

inline uint64_t read_u64_le(const uint8_t* in) noexcept {
  return static_cast<uint64_t>(read_u32_le(in)) |
         (static_cast<uint64_t>(read_u32_le(in + 4)) << 32);
}

// ---- Append variants for building records in a growing buffer ----
inline void put_u8(std::vector<uint8_t>& out, uint8_t v) {
  out.push_back(v);
}

inline void put_u16_le(std::vector<uint8_t>& out, uint16_t v) {
  const size_t o = out.size();
  out.resize(o + 2);
  write_u16_le(out.data() + o, v);
}

inline void put_u32_le(std::vector<uint8_t>& out, uint32_t v) {
  const size_t o = out.size();
  out.resize(o + 4);
  write_u32_le(out.data() + o, v);
}

inline void put_u64_le(std::vector<uint8_t>& out, uint64_t v) {
  const size_t o = out.size();
  out.resize(o + 8);
  write_u64_le(out.data() + o, v);
}

inline void put_bytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
  out.insert(out.end(), bytes.begin(), bytes.end());
}

// Fixed-width NUL padded string field. Caller guarantees s.size() <= width.
inline void put_padded(std::vector<uint8_t>& out, std::string_view s, size_t width) {
  const size_t o = out.size();
  out.resize(o + width, 0);
  for (size_t i = 0; i < s.size() && i < width; ++i) {
    out[o + i] = static_cast<uint8_t>(s[i]);
  }
}

} // namespace mavlog::format::wire
