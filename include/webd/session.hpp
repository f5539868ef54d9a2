#ifndef WEBD_SESSION_HPP_
#define WEBD_SESSION_HPP_

#include "frame.hpp"
#include "http.hpp"
#include "response.hpp"
#include "stream.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace webd {

// ============================================================================
// SessionConfig
// ============================================================================

struct SessionConfig {
  std::string server_name{kDefaultServerName};  // "Server:" header of the 101 response
  size_t max_message_size = 16U << 20;           // per frame and per reassembled message
  bool require_masked_frames = false;            // reject unmasked client frames
};

// ============================================================================
// Payload (one complete, unmasked application message)
// ============================================================================

class Payload {
 public:
  enum class Type : uint8_t { kText, kBinary };

  static Payload text(std::string data) {
    Payload p;
    p.type_ = Type::kText;
    p.text_ = std::move(data);
    return p;
  }

  static Payload binary(std::vector<uint8_t> data) {
    Payload p;
    p.type_ = Type::kBinary;
    p.binary_ = std::move(data);
    return p;
  }

  Type type() const { return type_; }
  bool is_text() const { return type_ == Type::kText; }
  bool is_binary() const { return type_ == Type::kBinary; }

  const std::string& text() const { return text_; }
  const std::vector<uint8_t>& binary() const { return binary_; }

 private:
  Type type_ = Type::kText;
  std::string text_;
  std::vector<uint8_t> binary_;
};

// ============================================================================
// Session (one upgraded WebSocket connection)
// ============================================================================

enum class SessionState : uint8_t {
  kOpen,   // WebSocket framing active
  kClosed  // Terminal
};

/**
 * @brief Per-connection WebSocket state machine.
 *
 * Owns the stream exclusively. receive() never blocks: it only looks at
 * bytes already buffered and reports "no message" when a frame is still
 * incomplete. fill() is the blocking half; next_message() loops both.
 *
 * Every I/O or protocol error closes the session. Once closed, receive()
 * yields no message and send() fails with kInvalidState without writing.
 */
class Session {
 public:
  static constexpr uint16_t kCloseNormal = 1000;

  Session(Request request, BufferedStream stream, const SessionConfig& config = SessionConfig{});

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Process at most one buffered frame.
  Result<optional<Payload>> receive();

  // Blocking read of more bytes into the buffer. 0 means the peer closed
  // the stream, which also closes the session.
  Result<size_t> fill();

  // Loop fill()/receive() until a message arrives; empty once closed.
  Result<optional<Payload>> next_message();

  // Final unmasked Text frame. Returns header + payload bytes written.
  Result<size_t> send(std::string_view text);
  Result<size_t> send_binary(const uint8_t* data, size_t len);

  // Send a Close frame with the given status code and close the stream.
  Result<void> close(uint16_t code = kCloseNormal);

  bool is_open() const { return state_ == SessionState::kOpen; }
  SessionState state() const { return state_; }
  const Request& request() const { return request_; }

  // Unmasked payload of the Close frame received from the peer, if any.
  const std::vector<uint8_t>& close_payload() const { return close_payload_; }
  // Status code from close_payload(), or 0 when it carried none.
  uint16_t close_code() const;

 private:
  Request request_;
  BufferedStream stream_;
  SessionConfig config_;
  SessionState state_ = SessionState::kOpen;

  // Fragmented message being reassembled
  bool fragmenting_ = false;
  ws::OpCode fragment_opcode_ = ws::OpCode::kText;
  std::vector<uint8_t> fragment_buffer_;

  std::vector<uint8_t> close_payload_;

  Result<size_t> write_frame(ws::OpCode opcode, const uint8_t* payload, size_t len);

  // Dispatch a complete frame whose bytes are already consumed.
  Result<optional<Payload>> handle_frame(const ws::FrameHeader& header, std::vector<uint8_t> payload);

  Result<optional<Payload>> deliver(ws::OpCode opcode, std::vector<uint8_t> data);

  // Record the failure, close the session and hand the error back.
  Error fail(Error err);

  void transition_to_closed(const char* reason);
};

}  // namespace webd

#endif  // WEBD_SESSION_HPP_
