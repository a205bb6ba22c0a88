#include "mavlog/mav/mavlink_codec.hpp"
#include "mavlog/io/byte_reader.hpp"
#include "mavlog/utils/logger.hpp"

#include <cstring>

namespace mavlog::mav {

core::MavFrame to_frame(const mavlink_message_t& msg) {
  core::MavFrame f;
  f.header.system_id = msg.sysid;
  f.header.component_id = msg.compid;
  f.header.sequence = msg.seq;
  f.message.msg_id = msg.msgid;
  const auto* p = reinterpret_cast<const uint8_t*>(_MAV_PAYLOAD(&msg));
  f.message.payload.assign(p, p + msg.len);
  f.version = msg.magic == MAVLINK_STX_MAVLINK1 ? core::MavVersion::V1 : core::MavVersion::V2;
  return f;
}

bool to_mavlink(const core::MavFrame& frame, mavlink_message_t& msg) {
  const mavlink_msg_entry_t* entry = mavlink_get_msg_entry(frame.message.msg_id);
  if (entry == nullptr) return false;
  if (frame.message.payload.size() > entry->max_msg_len) return false;

  const bool v1 = frame.version == core::MavVersion::V1;
  if (v1 && frame.message.msg_id > 0xFF) return false;

  std::memset(&msg, 0, sizeof(msg));
  msg.msgid = frame.message.msg_id;
  std::memcpy(_MAV_PAYLOAD_NON_CONST(&msg), frame.message.payload.data(), frame.message.payload.size());

  mavlink_status_t status{};
  status.current_tx_seq = frame.header.sequence;
  if (v1) status.flags |= MAVLINK_STATUS_FLAG_OUT_MAVLINK1;

  mavlink_finalize_message_buffer(&msg,
                                  frame.header.system_id,
                                  frame.header.component_id,
                                  &status,
                                  entry->min_msg_len,
                                  entry->max_msg_len,
                                  entry->crc_extra);
  return true;
}

FrameStatus MavlinkCodec::read_frame(io::ByteReader& in,
                                     core::MavVersion version,
                                     core::MavHeader& header,
                                     core::MavMessage& message) {
  const uint8_t stx = start_marker(version);
  uint8_t window[MAVLINK_MAX_PACKET_LEN];

  while (true) {
    uint8_t c = 0;
    if (in.peek(&c, 1) == 0) return FrameStatus::EndOfStream;
    if (c != stx) {
      in.skip(1);
      continue;
    }

    // Parse the candidate from a peeked copy; only a valid frame is consumed.
    const size_t avail = in.peek(window, sizeof(window));
    mavlink_message_t rx{};
    mavlink_status_t rx_status{};
    mavlink_message_t msg{};
    mavlink_status_t status{};

    uint8_t res = MAVLINK_FRAMING_INCOMPLETE;
    size_t used = 0;
    while (used < avail && res == MAVLINK_FRAMING_INCOMPLETE) {
      res = mavlink_frame_char_buffer(&rx, &rx_status, window[used++], &msg, &status);
      // parser gave up on the candidate without reporting it
      if (res == MAVLINK_FRAMING_INCOMPLETE && rx_status.parse_state <= MAVLINK_PARSE_STATE_IDLE) break;
    }

    if (res != MAVLINK_FRAMING_OK) {
      // bad CRC/signature, or too few bytes left: this marker was not a frame
      if (res != MAVLINK_FRAMING_INCOMPLETE) {
        ++dropped_frames_;
        logger::debug() << "[MAV] Dropped candidate frame, msgid " << rx.msgid;
      }
      in.skip(1);
      continue;
    }

    in.skip(used);
    if (mavlink_get_msg_entry(msg.msgid) == nullptr) {
      logger::debug() << "[MAV] Unknown message id " << msg.msgid;
      return FrameStatus::Invalid;
    }

    const core::MavFrame f = to_frame(msg);
    header = f.header;
    message = f.message;
    return FrameStatus::Ok;
  }
}

bool MavlinkCodec::write_frame(const core::MavFrame& frame, std::vector<uint8_t>& out) {
  mavlink_message_t msg;
  if (!to_mavlink(frame, msg)) return false;

  uint8_t buf[MAVLINK_MAX_PACKET_LEN];
  const uint16_t n = mavlink_msg_to_send_buffer(buf, &msg);
  out.insert(out.end(), buf, buf + n);
  return true;
}

} // namespace mavlog::mav
