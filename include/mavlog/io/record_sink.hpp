#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace mavlog::io {

/**
 * @brief Destination of packed log records.
 *
 * open() is called exactly once with the preamble every output file must start
 * with (the packed file header, or nothing for headerless formats). append()
 * is then called once per record. Implementations own the file handle and any
 * rotation policy; a fake can be injected for tests.
 */
class IRecordSink {
public:
  virtual ~IRecordSink() noexcept = default;

  virtual bool open(std::span<const uint8_t> preamble) = 0;
  virtual bool append(std::span<const uint8_t> bytes) = 0;
  virtual void flush() = 0;
  virtual void close() noexcept = 0;
  virtual bool is_open() const noexcept = 0;
};

using RecordSinkPtr = std::unique_ptr<IRecordSink>;

} // namespace mavlog::io
