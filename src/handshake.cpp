#include "webd/handshake.hpp"

#include "webd/log.hpp"

#include <mbedtls/base64.h>
#include <mbedtls/sha1.h>

#include <cctype>

#include <utility>

namespace webd {

namespace {

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  }
  return true;
}

// "keep-alive, Upgrade" contains the token "upgrade".
bool has_token(std::string_view list, std::string_view token) {
  while (!list.empty()) {
    size_t comma = list.find(',');
    std::string_view item = trim(list.substr(0, comma));
    if (iequals(item, token))
      return true;
    if (comma == std::string_view::npos)
      break;
    list.remove_prefix(comma + 1);
  }
  return false;
}

}  // namespace

Result<std::string> compute_accept_key(std::string_view key) {
  std::string input;
  input.reserve(key.size() + kWebSocketMagic.size());
  input.append(key).append(kWebSocketMagic);

  unsigned char digest[20];
  int ret = mbedtls_sha1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);
  if (ret != 0) {
    return Result<std::string>::error(
        make_error(ErrorCode::kInternalError, "mbedtls_sha1 failed: " + std::to_string(ret)));
  }

  // 20 bytes encode to 28 characters plus the terminator
  unsigned char encoded[32];
  size_t olen = 0;
  ret = mbedtls_base64_encode(encoded, sizeof(encoded), &olen, digest, sizeof(digest));
  if (ret != 0) {
    return Result<std::string>::error(
        make_error(ErrorCode::kInternalError, "mbedtls_base64_encode failed: " + std::to_string(ret)));
  }
  return Result<std::string>::success(std::string(reinterpret_cast<const char*>(encoded), olen));
}

// ============================================================================
// UpgradeResult
// ============================================================================

UpgradeResult UpgradeResult::upgraded(std::unique_ptr<Session> session) {
  UpgradeResult r;
  r.outcome_ = Outcome::kUpgraded;
  r.session_ = std::move(session);
  return r;
}

UpgradeResult UpgradeResult::not_applicable(Request request, BufferedStream stream) {
  UpgradeResult r;
  r.outcome_ = Outcome::kNotApplicable;
  r.request_ = std::move(request);
  r.stream_ = std::move(stream);
  return r;
}

UpgradeResult UpgradeResult::failed(Error err) {
  UpgradeResult r;
  r.outcome_ = Outcome::kError;
  r.error_ = std::move(err);
  return r;
}

// ============================================================================
// upgrade
// ============================================================================

UpgradeResult upgrade(Request request, BufferedStream stream, const SessionConfig& config) {
  const std::string* connection = request.find_header("Connection");
  if (connection == nullptr || !has_token(*connection, "upgrade")) {
    return UpgradeResult::not_applicable(std::move(request), std::move(stream));
  }
  const std::string* upgrade_to = request.find_header("Upgrade");
  if (upgrade_to == nullptr || !iequals(trim(*upgrade_to), "websocket")) {
    return UpgradeResult::not_applicable(std::move(request), std::move(stream));
  }

  const std::string* key = request.find_header("Sec-WebSocket-Key");
  if (key == nullptr || key->empty()) {
    return UpgradeResult::failed(make_error(ErrorCode::kMissingHeader, "missing Sec-WebSocket-Key"));
  }

  auto accept = compute_accept_key(*key);
  if (!accept) {
    return UpgradeResult::failed(accept.get_error());
  }

  std::string response;
  response.reserve(160);
  response.append("HTTP/1.0 101 Switching Protocols\n");
  response.append("Server: ").append(config.server_name).append("\n");
  response.append("Connection: upgrade\n");
  response.append("Upgrade: websocket\n");
  response.append("Sec-WebSocket-Accept: ").append(accept.value()).append("\n");
  response.append("\n");

  auto sent = stream.write(response);
  if (!sent) {
    return UpgradeResult::failed(sent.get_error());
  }

  WEBD_LOG_INFO(" => 101 Switching Protocols");
  return UpgradeResult::upgraded(std::make_unique<Session>(std::move(request), std::move(stream), config));
}

}  // namespace webd
