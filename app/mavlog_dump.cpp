#include "mavlog/logfile/mav_log_reader.hpp"
#include "mavlog/logfile/tlog.hpp"
#include "mavlog/mav/mavlink_codec.hpp"
#include "mavlog/utils/logger.hpp"
#include "mavlog/utils/timestamp.hpp"
#include "mavlog/utils/uuid.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace mavlog;

struct DumpArgs {
  std::string in_path;
  std::string out_path;  // empty -> stdout
  bool strict{false};
  bool tlog{false};
  core::MavVersion tlog_version{core::MavVersion::V2};
  std::string diag_dir;
  logger::Level print_level{logger::Level::Warn};
};

void print_help(const char* argv0) {
  std::cout
    << "Usage:\n"
    << "  " << argv0 << " --in session.mav [--out session.csv] [options]\n"
    << "\n"
    << "Options:\n"
    << "  --out FILE            CSV output (default: stdout)\n"
    << "  --strict              stop at the first timestamp/frame misalignment\n"
    << "  --tlog                input is a headerless .tlog\n"
    << "  --mav_version 1|2     MAVLink version of a .tlog (default 2)\n"
    << "  --diag_dir DIR        also write diagnostics to DIR\n"
    << "  --log_level LEVEL     debug|info|warn|error (default warn)\n"
    << "\n"
    << "Columns:\n"
    << "  index,kind,timestamp_us,sysid,compid,seq,msgid,len,data\n"
    << "  data is hex for MAVLINK/RAW entries and quoted text for TEXT entries.\n";
}

bool parse_args(int argc, char** argv, DumpArgs& a) {
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto need = [&](std::string_view name) -> std::string_view {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << name << "\n";
        std::exit(2);
      }
      return argv[++i];
    };

    if (arg == "--in") a.in_path = std::string(need(arg));
    else if (arg == "--out") a.out_path = std::string(need(arg));
    else if (arg == "--strict") a.strict = true;
    else if (arg == "--tlog") a.tlog = true;
    else if (arg == "--mav_version") {
      const std::string_view v = need(arg);
      if (v == "1") a.tlog_version = core::MavVersion::V1;
      else if (v == "2") a.tlog_version = core::MavVersion::V2;
      else {
        std::cerr << "Invalid --mav_version: " << v << "\n";
        return false;
      }
    }
    else if (arg == "--diag_dir") a.diag_dir = std::string(need(arg));
    else if (arg == "--log_level") a.print_level = logger::parse_level(need(arg));
    else if (arg == "--help") { print_help(argv[0]); return false; }
    else {
      std::cerr << "Unknown arg: " << arg << "\n";
      print_help(argv[0]);
      return false;
    }
  }

  if (a.in_path.empty()) {
    std::cerr << "Missing --in\n";
    return false;
  }
  return true;
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t b : bytes) oss << std::setw(2) << static_cast<unsigned>(b);
  return oss.str();
}

std::string csv_quote(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

void write_row(std::ostream& csv, uint64_t index, const core::LogEntry& e) {
  csv << index << ",";
  if (e.message) csv << "MAVLINK,";
  else if (e.text) csv << "TEXT,";
  else csv << "RAW,";

  if (e.timestamp) csv << *e.timestamp;
  csv << ",";

  if (e.header) {
    csv << static_cast<unsigned>(e.header->system_id) << ","
        << static_cast<unsigned>(e.header->component_id) << ","
        << static_cast<unsigned>(e.header->sequence) << ",";
  } else {
    csv << ",,,";
  }

  if (e.message) {
    csv << e.message->msg_id << "," << e.message->payload.size() << "," << to_hex(e.message->payload);
  } else if (e.text) {
    csv << "," << e.text->size() << "," << csv_quote(*e.text);
  } else if (e.raw) {
    csv << "," << e.raw->size() << "," << to_hex(*e.raw);
  } else {
    csv << ",0,";
  }
  csv << "\n";
}

template <typename Reader>
logfile::ReadStatus dump_entries(Reader& reader, std::ostream& csv, uint64_t& n_entries) {
  csv << "index,kind,timestamp_us,sysid,compid,seq,msgid,len,data\n";
  core::LogEntry e;
  while (true) {
    const logfile::ReadStatus st = reader.next(e);
    if (st != logfile::ReadStatus::Ok) return st;
    write_row(csv, n_entries++, e);
  }
}

} // namespace

int main(int argc, char** argv) {
  DumpArgs args;
  if (!parse_args(argc, argv, args)) return 1;

  logger::set_print_level(args.print_level);
  if (!args.diag_dir.empty()) {
    logger::set_logs_dir(args.diag_dir);
    logger::set_file_logging_enabled(true);
  }

  std::ofstream out_file;
  if (!args.out_path.empty()) {
    out_file.open(args.out_path);
    if (!out_file.is_open()) {
      logger::error() << "Failed to open output: " << args.out_path;
      return 1;
    }
  }
  std::ostream& csv = args.out_path.empty() ? std::cout : out_file;

  const auto policy = args.strict ? logfile::ResyncPolicy::Strict : logfile::ResyncPolicy::Lenient;
  mav::MavlinkCodec codec;

  uint64_t n_entries = 0;
  logfile::ReadStatus st = logfile::ReadStatus::EndOfStream;
  uint64_t resyncs = 0;
  try {
    if (args.tlog) {
      logfile::TlogReader reader(args.in_path, codec, args.tlog_version, policy);
      st = dump_entries(reader, csv, n_entries);
      resyncs = reader.resyncs();
    } else {
      logfile::MavLogReader reader(args.in_path, codec, policy);
      logger::info() << "Input " << args.in_path << ": uuid "
                     << utils::uuid_to_string(reader.header().uuid) << ", created "
                     << utils::format_epoch_us(reader.header().timestamp_us);
      st = dump_entries(reader, csv, n_entries);
      resyncs = reader.resyncs();
    }
  } catch (const std::exception& e) {
    logger::error() << "Cannot decode " << args.in_path << ": " << e.what();
    logger::close_logger();
    return 1;
  }

  int rc = 0;
  if (st != logfile::ReadStatus::EndOfStream) {
    logger::warn() << "Stopped after " << n_entries << " entries: " << logfile::to_string(st);
    rc = 3;
  }
  logger::info() << "Decoded " << n_entries << " entries, " << resyncs << " resyncs, "
                 << codec.dropped_frames() << " frames dropped (bad checksum)";
  logger::close_logger();
  return rc;
}
