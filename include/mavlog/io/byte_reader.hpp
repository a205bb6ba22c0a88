#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <vector>

namespace mavlog::io {

/**
 * @brief Sequential byte cursor over an input stream with bounded lookahead.
 *
 * - read()/read_exact() consume bytes.
 * - peek() looks ahead without moving the cursor.
 * - position() counts consumed bytes since construction.
 *
 * Not thread-safe: one reader per stream.
 */
class ByteReader {
public:
  explicit ByteReader(std::istream& in) : in_(in) {}

  ByteReader(const ByteReader&) = delete;
  ByteReader& operator=(const ByteReader&) = delete;

  // Returns number of bytes copied (short only at end of stream).
  size_t read(uint8_t* dst, size_t n);
  bool read_exact(uint8_t* dst, size_t n) { return read(dst, n) == n; }
  bool read_exact(std::span<uint8_t> dst) { return read(dst.data(), dst.size()) == dst.size(); }
  bool read_u8(uint8_t& out) { return read(&out, 1) == 1; }

  // Copies up to n upcoming bytes without consuming them.
  size_t peek(uint8_t* dst, size_t n);

  // Consumes up to n bytes, returns how many were skipped.
  size_t skip(size_t n);

  // True when no further byte can be read.
  [[nodiscard]] bool at_end();

  uint64_t position() const noexcept { return consumed_; }

private:
  static constexpr size_t kChunkSize = 4096;

  size_t available() const noexcept { return buf_.size() - head_; }
  size_t fill(size_t n);

  std::istream& in_;
  std::vector<uint8_t> buf_;
  size_t head_{0};
  uint64_t consumed_{0};
  bool eof_{false};
};

} // namespace mavlog::io
