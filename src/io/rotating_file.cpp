#include "mavlog/io/rotating_file.hpp"
#include "mavlog/utils/logger.hpp"

#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace mavlog::io {

RotatingFile::RotatingFile(std::filesystem::path base_path, uint64_t max_bytes, uint32_t backup_count)
  : base_path_(std::move(base_path)), max_bytes_(max_bytes), backup_count_(backup_count) {
  if (base_path_.empty() || !base_path_.has_filename()) {
    throw std::invalid_argument("RotatingFile: base path must name a file");
  }
}

std::filesystem::path RotatingFile::backup_path(const std::filesystem::path& base, uint32_t index) {
  std::filesystem::path p = base;
  p += "." + std::to_string(index);
  return p;
}

bool RotatingFile::open(std::span<const uint8_t> preamble) {
  close();
  preamble_.assign(preamble.begin(), preamble.end());

  std::error_code ec;
  if (base_path_.has_parent_path()) {
    std::filesystem::create_directories(base_path_.parent_path(), ec);
    if (ec) {
      logger::warn() << "[LOG] Failed to create directory " << base_path_.parent_path().string()
                     << ": " << ec.message();
      return false;
    }
  }

  // Keep an earlier session instead of overwriting it.
  if (rotation_enabled() && std::filesystem::exists(base_path_, ec) &&
      std::filesystem::file_size(base_path_, ec) > 0 && !ec) {
    shift_backups();
  }

  return open_fresh();
}

bool RotatingFile::open_fresh() {
  out_.open(base_path_, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!out_.is_open()) {
    logger::warn() << "[LOG] Failed to open log file: " << base_path_.string();
    return false;
  }

  bytes_written_ = 0;
  if (!preamble_.empty()) {
    out_.write(reinterpret_cast<const char*>(preamble_.data()),
               static_cast<std::streamsize>(preamble_.size()));
    if (!out_) {
      logger::warn() << "[LOG] Failed to write file header to " << base_path_.string();
      out_.close();
      return false;
    }
    bytes_written_ = preamble_.size();
  }

  logger::info() << "[LOG] Logging -> " << base_path_.string();
  return true;
}

void RotatingFile::shift_backups() {
  std::error_code ec;
  std::filesystem::remove(backup_path(base_path_, backup_count_), ec);
  for (uint32_t i = backup_count_; i > 1; --i) {
    const auto from = backup_path(base_path_, i - 1);
    if (std::filesystem::exists(from, ec)) {
      std::filesystem::rename(from, backup_path(base_path_, i), ec);
      if (ec) {
        logger::warn() << "[LOG] Failed to rename " << from.string() << ": " << ec.message();
      }
    }
  }
  std::filesystem::rename(base_path_, backup_path(base_path_, 1), ec);
  if (ec) {
    logger::warn() << "[LOG] Failed to rotate " << base_path_.string() << ": " << ec.message();
  }
}

bool RotatingFile::rotate() {
  out_.flush();
  out_.close();
  shift_backups();
  ++rotations_;
  logger::debug() << "[LOG] Rotated " << base_path_.string() << " (rotation " << rotations_ << ")";
  return open_fresh();
}

bool RotatingFile::append(std::span<const uint8_t> bytes) {
  if (!out_.is_open()) return false;

  if (rotation_enabled() &&
      bytes_written_ + bytes.size() > max_bytes_ &&
      bytes_written_ > preamble_.size()) {
    if (!rotate()) return false;
  }

  out_.write(reinterpret_cast<const char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
  if (!out_) return false;
  bytes_written_ += bytes.size();
  return true;
}

void RotatingFile::flush() {
  if (out_.is_open()) out_.flush();
}

void RotatingFile::close() noexcept {
  if (out_.is_open()) {
    out_.flush();
    out_.close();
  }
}

} // namespace mavlog::io
