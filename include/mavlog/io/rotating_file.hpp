#pragma once
#include "mavlog/io/record_sink.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <vector>

namespace mavlog::io {

/**
 * @brief Size-bounded rotating output file.
 *
 * Files:
 *   <base>      current file
 *   <base>.1    newest backup
 *   <base>.N    oldest backup (N = backup_count), older ones are deleted
 *
 * Rotation is active only when max_bytes > 0 and backup_count > 0. It happens
 * before an append that would push the current file past max_bytes, unless the
 * file holds nothing but the preamble (an oversized record still gets written).
 * Every file starts with the preamble given to open().
 *
 * At open, an existing non-empty <base> is rotated out when rotation is active,
 * otherwise it is truncated.
 */
class RotatingFile final : public IRecordSink {
public:
  RotatingFile(std::filesystem::path base_path, uint64_t max_bytes, uint32_t backup_count);
  ~RotatingFile() noexcept override { close(); }

  RotatingFile(const RotatingFile&) = delete;
  RotatingFile& operator=(const RotatingFile&) = delete;

  bool open(std::span<const uint8_t> preamble) override;
  bool append(std::span<const uint8_t> bytes) override;
  void flush() override;
  void close() noexcept override;
  bool is_open() const noexcept override { return out_.is_open(); }

  static std::filesystem::path backup_path(const std::filesystem::path& base, uint32_t index);

  const std::filesystem::path& path() const noexcept { return base_path_; }
  uint64_t bytes_written() const noexcept { return bytes_written_; }
  uint32_t rotations() const noexcept { return rotations_; }

private:
  bool rotation_enabled() const noexcept { return max_bytes_ > 0 && backup_count_ > 0; }
  bool rotate();
  void shift_backups();
  bool open_fresh();

  std::filesystem::path base_path_;
  uint64_t max_bytes_{0};
  uint32_t backup_count_{0};

  std::vector<uint8_t> preamble_;
  std::ofstream out_;
  uint64_t bytes_written_{0};
  uint32_t rotations_{0};
};

} // namespace mavlog::io
