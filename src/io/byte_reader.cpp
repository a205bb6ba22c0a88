#include "mavlog/io/byte_reader.hpp"

#include <algorithm>
#include <cstring>

namespace mavlog::io {

size_t ByteReader::fill(size_t n) {
  if (available() >= n || eof_) return available();

  // drop consumed prefix before growing
  if (head_ > 0) {
    buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(head_));
    head_ = 0;
  }

  while (buf_.size() < n && !eof_) {
    const size_t want = std::max(n - buf_.size(), kChunkSize);
    const size_t old = buf_.size();
    buf_.resize(old + want);
    in_.read(reinterpret_cast<char*>(buf_.data() + old), static_cast<std::streamsize>(want));
    const auto got = static_cast<size_t>(in_.gcount());
    buf_.resize(old + got);
    if (got == 0 || !in_) eof_ = true;
  }
  return available();
}

size_t ByteReader::read(uint8_t* dst, size_t n) {
  if (n == 0) return 0;
  const size_t m = std::min(n, fill(n));
  if (m > 0) std::memcpy(dst, buf_.data() + head_, m);
  head_ += m;
  consumed_ += m;
  return m;
}

size_t ByteReader::peek(uint8_t* dst, size_t n) {
  if (n == 0) return 0;
  const size_t m = std::min(n, fill(n));
  if (m > 0) std::memcpy(dst, buf_.data() + head_, m);
  return m;
}

size_t ByteReader::skip(size_t n) {
  const size_t m = std::min(n, fill(n));
  head_ += m;
  consumed_ += m;
  return m;
}

bool ByteReader::at_end() {
  return fill(1) == 0;
}

} // namespace mavlog::io
