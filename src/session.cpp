#include "webd/session.hpp"

#include "webd/log.hpp"

#include <utility>

namespace webd {

using ws::FrameHeader;
using ws::OpCode;

namespace {

using MessageResult = Result<optional<Payload>>;

MessageResult no_message() { return MessageResult::success(optional<Payload>()); }

}  // namespace

Session::Session(Request request, BufferedStream stream, const SessionConfig& config)
    : request_(std::move(request)), stream_(std::move(stream)), config_(config) {
  if (stream_.max_capacity() < config_.max_message_size + FrameHeader::kMaxHeaderSize) {
    WEBD_LOG_DEBUG("receive buffer limit is below max_message_size; large frames will fail with buffer full");
  }
  WEBD_LOG_INFO("websocket open on " + request_.path);
}

uint16_t Session::close_code() const {
  if (close_payload_.size() < 2)
    return 0;
  return static_cast<uint16_t>((close_payload_[0] << 8) | close_payload_[1]);
}

// ============================================================================
// Receive path
// ============================================================================

MessageResult Session::receive() {
  if (state_ == SessionState::kClosed) {
    return no_message();
  }

  auto parsed = FrameHeader::parse(stream_.data(), stream_.size());
  if (!parsed) {
    return MessageResult::error(fail(parsed.get_error()));
  }
  if (!parsed.value()) {
    return no_message();  // header incomplete
  }
  const FrameHeader header = parsed.value().value();

  if (header.payload_len > config_.max_message_size) {
    return MessageResult::error(fail(make_error(
        ErrorCode::kFrameTooLarge, "frame payload of " + std::to_string(header.payload_len) + " bytes exceeds limit")));
  }
  if (stream_.size() < header.frame_len()) {
    return no_message();  // payload incomplete
  }

  std::vector<uint8_t> payload = header.unmask(stream_.data() + header.header_len, header.payload_len);
  stream_.consume(header.frame_len());
  return handle_frame(header, std::move(payload));
}

MessageResult Session::handle_frame(const FrameHeader& header, std::vector<uint8_t> payload) {
  if (config_.require_masked_frames && !header.masking_key) {
    return MessageResult::error(fail(make_error(ErrorCode::kFrameParseError, "unmasked client frame")));
  }
  if (ws::is_control(header.opcode) && (!header.fin || header.payload_len > FrameHeader::kMaxControlPayload)) {
    return MessageResult::error(fail(make_error(
        ErrorCode::kFrameParseError, std::string("malformed ") + ws::to_string(header.opcode) + " frame")));
  }

  switch (header.opcode) {
    case OpCode::kText:
    case OpCode::kBinary:
      if (fragmenting_) {
        return MessageResult::error(
            fail(make_error(ErrorCode::kFrameParseError, "data frame inside a fragmented message")));
      }
      if (header.fin) {
        return deliver(header.opcode, std::move(payload));
      }
      fragmenting_ = true;
      fragment_opcode_ = header.opcode;
      fragment_buffer_ = std::move(payload);
      return no_message();

    case OpCode::kContinuation: {
      if (!fragmenting_) {
        return MessageResult::error(
            fail(make_error(ErrorCode::kFrameParseError, "continuation frame without a message to continue")));
      }
      if (payload.size() > config_.max_message_size - fragment_buffer_.size()) {
        return MessageResult::error(fail(make_error(ErrorCode::kFrameTooLarge, "fragmented message exceeds limit")));
      }
      fragment_buffer_.insert(fragment_buffer_.end(), payload.begin(), payload.end());
      if (!header.fin) {
        return no_message();
      }
      fragmenting_ = false;
      std::vector<uint8_t> message = std::move(fragment_buffer_);
      fragment_buffer_.clear();
      return deliver(fragment_opcode_, std::move(message));
    }

    case OpCode::kClose: {
      close_payload_ = std::move(payload);
      // Echo the status code back to complete the closing handshake.
      auto sent = write_frame(OpCode::kClose, close_payload_.data(), close_payload_.size() >= 2 ? 2 : 0);
      transition_to_closed("close frame received");
      stream_.close();
      if (!sent) {
        return MessageResult::error(sent.get_error());
      }
      return no_message();
    }

    case OpCode::kPing: {
      auto sent = write_frame(OpCode::kPong, payload.data(), payload.size());
      if (!sent) {
        return MessageResult::error(sent.get_error());
      }
      return no_message();
    }

    case OpCode::kPong:
      return no_message();
  }
  return no_message();
}

MessageResult Session::deliver(OpCode opcode, std::vector<uint8_t> data) {
  switch (opcode) {
    case OpCode::kText:
      if (!ws::is_valid_utf8(data.data(), data.size())) {
        return MessageResult::error(fail(make_error(ErrorCode::kInvalidUtf8, "text message is not valid UTF-8")));
      }
      return MessageResult::success(optional<Payload>(Payload::text(std::string(data.begin(), data.end()))));
    case OpCode::kBinary:
      return MessageResult::success(optional<Payload>(Payload::binary(std::move(data))));
    case OpCode::kContinuation:
    case OpCode::kClose:
    case OpCode::kPing:
    case OpCode::kPong:
      break;
  }
  return MessageResult::error(fail(
      make_error(ErrorCode::kFrameParseError, std::string("cannot deliver ") + ws::to_string(opcode) + " frame")));
}

Result<size_t> Session::fill() {
  if (state_ == SessionState::kClosed) {
    return Result<size_t>::error(make_error(ErrorCode::kInvalidState, "session is closed"));
  }
  auto n = stream_.fill();
  if (!n) {
    return Result<size_t>::error(fail(n.get_error()));
  }
  if (n.value() == 0) {
    transition_to_closed("peer closed the stream");
  }
  return n;
}

MessageResult Session::next_message() {
  while (true) {
    size_t before = stream_.size();
    auto msg = receive();
    if (!msg || msg.value() || state_ == SessionState::kClosed) {
      return msg;
    }
    if (stream_.size() != before) {
      continue;  // a control frame was consumed; more may be buffered
    }

    auto n = fill();
    if (!n) {
      return MessageResult::error(n.get_error());
    }
    if (n.value() == 0) {
      return no_message();
    }
  }
}

// ============================================================================
// Send path
// ============================================================================

Result<size_t> Session::send(std::string_view text) {
  if (state_ == SessionState::kClosed) {
    return Result<size_t>::error(make_error(ErrorCode::kInvalidState, "cannot send: session is closed"));
  }
  return write_frame(OpCode::kText, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

Result<size_t> Session::send_binary(const uint8_t* data, size_t len) {
  if (state_ == SessionState::kClosed) {
    return Result<size_t>::error(make_error(ErrorCode::kInvalidState, "cannot send: session is closed"));
  }
  return write_frame(OpCode::kBinary, data, len);
}

Result<void> Session::close(uint16_t code) {
  if (state_ == SessionState::kClosed) {
    return Result<void>::error(make_error(ErrorCode::kInvalidState, "session already closed"));
  }

  uint8_t payload[2] = {static_cast<uint8_t>((code >> 8) & 0xFF), static_cast<uint8_t>(code & 0xFF)};
  auto sent = write_frame(OpCode::kClose, payload, sizeof(payload));
  transition_to_closed("closed locally");
  stream_.close();
  if (!sent) {
    return Result<void>::error(sent.get_error());
  }
  return Result<void>::success();
}

Result<size_t> Session::write_frame(OpCode opcode, const uint8_t* payload, size_t len) {
  FrameHeader header = FrameHeader::make(true, opcode, len);
  auto n = header.write(stream_);
  if (!n) {
    return Result<size_t>::error(fail(n.get_error()));
  }

  size_t total = n.value();
  if (len > 0) {
    auto m = stream_.write(payload, len);
    if (!m) {
      return Result<size_t>::error(fail(m.get_error()));
    }
    total += m.value();
  }
  return Result<size_t>::success(total);
}

// ============================================================================
// State transitions
// ============================================================================

Error Session::fail(Error err) {
  WEBD_LOG_WARN("websocket " + request_.path + " failed: " + err.describe());
  transition_to_closed("error");
  stream_.close();
  return err;
}

void Session::transition_to_closed(const char* reason) {
  if (state_ == SessionState::kClosed)
    return;
  state_ = SessionState::kClosed;
  fragmenting_ = false;
  fragment_buffer_.clear();
  WEBD_LOG_INFO("websocket " + request_.path + " closed (" + reason + ")");
}

}  // namespace webd
