#include "mavlog/config/recorder_config.hpp"
#include "mavlog/io/rotating_file.hpp"
#include "mavlog/logfile/mav_log_writer.hpp"
#include "mavlog/logfile/tlog.hpp"
#include "mavlog/mav/mavlink_codec.hpp"
#include "mavlog/utils/logger.hpp"
#include "mavlog/utils/signal_handler.hpp"
#include "mavlog/utils/stop_flag.hpp"
#include "mavlog/utils/timestamp.hpp"
#include "mavlog/utils/uuid.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

using namespace mavlog;

static void print_help(const char* argv0) {
  std::printf(
    "Usage: %s [options]\n"
    "  --out ./logs/session.mav\n"
    "  --rotate_mb 64          (0 disables rotation)\n"
    "  --rotate_keep 10\n"
    "  --tlog                  (headerless .tlog records)\n"
    "  --mavlink_only 1|0\n"
    "  --timestamped 1|0\n"
    "  --mav_version 1|2\n"
    "  --dialect common\n"
    "  --app_id mavlog\n"
    "  --count 0               (cycles to record, 0 = until SIGINT)\n"
    "  --hz 10\n"
    "  --diag_dir ./logs/diag\n"
    "  --log_level debug|info|warn|error\n",
    argv0
  );
}

namespace {

// Synthetic vehicle producing one heartbeat, one attitude sample, a status line
// and a raw blob per cycle.
class SyntheticSession {
public:
  SyntheticSession(const config::RecorderConfig& cfg, logfile::IMavLogger& log,
                   logfile::MavLogWriter* mav_writer)
    : version_(cfg.mavlink_major == 1 ? core::MavVersion::V1 : core::MavVersion::V2),
      log_(log),
      mav_writer_(mav_writer) {}

  bool step(uint64_t cycle) {
    mavlink_message_t msg;

    mavlink_msg_heartbeat_pack(kSystemId, kComponentId, &msg,
                               MAV_TYPE_QUADROTOR, MAV_AUTOPILOT_GENERIC,
                               MAV_MODE_FLAG_SAFETY_ARMED, 0, MAV_STATE_ACTIVE);
    if (!record(msg)) return false;

    const float t = static_cast<float>(utils::monotonic_now());
    mavlink_msg_attitude_pack(kSystemId, kComponentId, &msg,
                              static_cast<uint32_t>(t * 1000.0f),
                              0.1f * std::sin(t), 0.1f * std::cos(t), 0.01f * t,
                              0.1f * std::cos(t), -0.1f * std::sin(t), 0.01f);
    if (!record(msg)) return false;

    // Text and raw entries only exist in mixed .mav files.
    if (mav_writer_ && !mav_writer_->header().format_flags.mavlink_only) {
      const std::string text = "cycle " + std::to_string(cycle) + " nominal";
      if (!check(mav_writer_->write_text(text), "text")) return false;

      std::vector<uint8_t> blob(16);
      for (size_t i = 0; i < blob.size(); ++i) blob[i] = static_cast<uint8_t>(cycle + i);
      if (!check(mav_writer_->write_raw(blob), "raw")) return false;
    }
    return true;
  }

private:
  static constexpr uint8_t kSystemId = 1;
  static constexpr uint8_t kComponentId = MAV_COMP_ID_AUTOPILOT1;

  bool record(const mavlink_message_t& msg) {
    core::MavFrame f = mav::to_frame(msg);
    f.version = version_;
    f.header.sequence = seq_++;
    return check(log_.write_mavlink(f), "mavlink");
  }

  static bool check(logfile::WriteStatus st, std::string_view what) {
    if (st == logfile::WriteStatus::Ok) return true;
    logger::error() << "[REC] " << what << " write failed: " << logfile::to_string(st);
    return false;
  }

  core::MavVersion version_;
  logfile::IMavLogger& log_;
  logfile::MavLogWriter* mav_writer_;
  uint8_t seq_{0};
};

} // namespace

int main(int argc, char** argv) {
  config::RecorderConfig cfg;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    auto need = [&](std::string_view name) -> std::string_view {
      if (i + 1 >= argc) {
        logger::error() << "Missing value for " << name;
        std::exit(2);
      }
      return argv[++i];
    };

    try {
      if (a == "--out") cfg.out_path = std::string(need(a));
      else if (a == "--rotate_mb") cfg.rotate_mb = static_cast<uint32_t>(std::stoul(std::string(need(a))));
      else if (a == "--rotate_keep") cfg.rotate_keep = static_cast<uint32_t>(std::stoul(std::string(need(a))));
      else if (a == "--tlog") cfg.tlog = true;
      else if (a == "--mavlink_only") cfg.flags.mavlink_only = (std::stoi(std::string(need(a))) != 0);
      else if (a == "--timestamped") cfg.flags.not_timestamped = (std::stoi(std::string(need(a))) == 0);
      else if (a == "--mav_version") cfg.mavlink_major = static_cast<uint32_t>(std::stoul(std::string(need(a))));
      else if (a == "--dialect") cfg.dialect = std::string(need(a));
      else if (a == "--app_id") cfg.app_id = std::string(need(a));
      else if (a == "--count") cfg.count = std::stoull(std::string(need(a)));
      else if (a == "--hz") cfg.rate_hz = std::stod(std::string(need(a)));
      else if (a == "--diag_dir") cfg.diag_dir = std::string(need(a));
      else if (a == "--log_level") cfg.print_level = logger::parse_level(need(a));
      else if (a == "--help") { print_help(argv[0]); return 0; }
      else {
        logger::error() << "Unknown arg: " << a;
        print_help(argv[0]);
        return 2;
      }
    } catch (const std::exception& e) {
      logger::error() << "Invalid value for " << a << ": " << e.what();
      return 2;
    }
  }

  if (cfg.mavlink_major != 1 && cfg.mavlink_major != 2) {
    logger::error() << "--mav_version must be 1 or 2";
    return 2;
  }
  if (cfg.rate_hz <= 0.0) cfg.rate_hz = 10.0;

  logger::set_print_level(cfg.print_level);
  if (!cfg.diag_dir.empty()) {
    logger::set_logs_dir(cfg.diag_dir);
    logger::set_file_logging_enabled(true);
  }

  mav::MavlinkCodec codec;
  std::unique_ptr<logfile::IMavLogger> log;
  logfile::MavLogWriter* mav_writer = nullptr;

  try {
    if (cfg.tlog) {
      log = std::make_unique<logfile::TlogWriter>(cfg.out_path, cfg.rotate_bytes(), cfg.rotate_keep, codec);
    } else {
      format::MessageDefinition def;
      def.version_major = cfg.mavlink_major;
      def.dialect = cfg.dialect;
      auto header = format::FileHeader::create(cfg.flags, def, utils::generate_uuid(), utils::epoch_now_us());
      header.src_application_id = cfg.app_id;

      auto w = std::make_unique<logfile::MavLogWriter>(
          std::move(header),
          std::make_unique<io::RotatingFile>(cfg.out_path, cfg.rotate_bytes(), cfg.rotate_keep),
          codec);
      mav_writer = w.get();
      log = std::move(w);
    }
  } catch (const std::exception& e) {
    logger::error() << "[REC] Cannot start recording: " << e.what();
    logger::close_logger();
    return 1;
  }

  utils::StopFlag stop;
  utils::SignalHandler sig(stop);

  SyntheticSession session(cfg, *log, mav_writer);
  const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(1.0 / cfg.rate_hz));
  auto next = std::chrono::steady_clock::now();

  logger::info() << "[REC] Recording to " << cfg.out_path << " at " << cfg.rate_hz << " Hz";

  uint64_t cycle = 0;
  int rc = 0;
  while (!stop.stop_requested() && (cfg.count == 0 || cycle < cfg.count)) {
    if (!session.step(cycle)) {
      rc = 1;
      break;
    }
    ++cycle;
    next += period;
    std::this_thread::sleep_until(next);
  }

  log->close();
  if (stop.stop_requested()) {
    logger::info() << "[REC] Interrupted by signal " << stop.stop_signal() << ", log closed";
  }
  logger::info() << "[REC] Stopped after " << cycle << " cycles";
  logger::close_logger();
  return rc;
}
