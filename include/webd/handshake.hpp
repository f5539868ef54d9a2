#ifndef WEBD_HANDSHAKE_HPP_
#define WEBD_HANDSHAKE_HPP_

#include "http.hpp"
#include "session.hpp"
#include "stream.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace webd {

// RFC 6455 section 1.3
constexpr std::string_view kWebSocketMagic = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

// base64(SHA-1(key + kWebSocketMagic))
Result<std::string> compute_accept_key(std::string_view key);

// ============================================================================
// UpgradeResult
// ============================================================================

/**
 * @brief Outcome of upgrade().
 *
 * kUpgraded carries the new Session, kNotApplicable hands back the
 * request and stream untouched so the caller can answer in plain HTTP,
 * kError carries the failure.
 */
class UpgradeResult {
 public:
  enum class Outcome : uint8_t { kUpgraded, kNotApplicable, kError };

  static UpgradeResult upgraded(std::unique_ptr<Session> session);
  static UpgradeResult not_applicable(Request request, BufferedStream stream);
  static UpgradeResult failed(Error err);

  Outcome outcome() const { return outcome_; }
  bool is_upgraded() const { return outcome_ == Outcome::kUpgraded; }
  bool is_not_applicable() const { return outcome_ == Outcome::kNotApplicable; }
  bool is_error() const { return outcome_ == Outcome::kError; }

  // Ownership transfers out; each is meaningful for its own outcome only.
  std::unique_ptr<Session> take_session() { return std::move(session_); }
  Request take_request() { return std::move(request_); }
  BufferedStream take_stream() { return std::move(stream_); }

  const Error& error() const { return error_; }

 private:
  Outcome outcome_ = Outcome::kError;
  std::unique_ptr<Session> session_;
  Request request_;
  BufferedStream stream_;
  Error error_;
};

/**
 * @brief Switch an HTTP request to WebSocket framing.
 *
 * Requires "Connection" to list the "upgrade" token and "Upgrade" to be
 * "websocket" (both case-insensitive); otherwise the request is not a
 * WebSocket request. A missing or empty Sec-WebSocket-Key is an input
 * error. On success the 101 response is written before the Session is
 * returned.
 */
UpgradeResult upgrade(Request request, BufferedStream stream, const SessionConfig& config = SessionConfig{});

}  // namespace webd

#endif  // WEBD_HANDSHAKE_HPP_
