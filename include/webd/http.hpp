#ifndef WEBD_HTTP_HPP_
#define WEBD_HTTP_HPP_

#include "stream.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>
#include <unordered_map>

namespace webd {

// ============================================================================
// Verb / Status (closed sets)
// ============================================================================

enum class Verb : uint8_t { kGet };

optional<Verb> parse_verb(std::string_view token);
const char* to_string(Verb verb);

enum class Status : uint8_t {
  kSwitchingProtocols,
  kOk,
  kBadRequest,
  kNotFound,
  kMethodNotAllowed,
};

// Status line without the protocol prefix, e.g. "404 Not Found".
const char* to_string(Status status);

// ============================================================================
// Request
// ============================================================================

using HeaderMap = std::unordered_map<std::string, std::string>;

struct Request {
  std::string version;
  Verb verb = Verb::kGet;
  std::string path;
  HeaderMap headers;  // case-sensitive names, later lines overwrite earlier

  // Returns nullptr when the header is absent.
  const std::string* find_header(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? nullptr : &it->second;
  }

  // Parse the request line and headers from the front of the stream.
  // Malformed request lines yield kind() == kInput, read failures kIo.
  static Result<Request> parse(BufferedStream& in);
};

// Strip leading/trailing ASCII whitespace.
std::string_view trim(std::string_view s);

}  // namespace webd

#endif  // WEBD_HTTP_HPP_
