#pragma once
#include "mavlog/format/file_header.hpp"
#include "mavlog/utils/logger.hpp"

#include <cstdint>
#include <string>

namespace mavlog::config {

struct RecorderConfig {
  // Output
  std::string out_path{"./logs/session.mav"};
  uint32_t rotate_mb{64};      // 0 disables rotation
  uint32_t rotate_keep{10};    // backups <out_path>.1 .. .N
  bool tlog{false};            // headerless .tlog records instead of .mav

  // File format
  format::FormatFlags flags{};
  uint32_t mavlink_major{2};
  std::string dialect{"common"};
  std::string app_id{"mavlog"};

  // Session
  uint64_t count{0};           // records per kind, 0 = until stopped
  double rate_hz{10.0};

  // Diagnostics
  std::string diag_dir{};      // empty keeps file logging off
  logger::Level print_level{logger::Level::Info};

  uint64_t rotate_bytes() const noexcept { return static_cast<uint64_t>(rotate_mb) * 1024u * 1024u; }
};

} // namespace mavlog::config
