#include "webd/http.hpp"

#include "webd/log.hpp"

#include <vector>

namespace webd {

optional<Verb> parse_verb(std::string_view token) {
  if (token == "GET") {
    return Verb::kGet;
  }
  return {};
}

const char* to_string(Verb verb) {
  switch (verb) {
    case Verb::kGet:
      return "GET";
  }
  return "";
}

const char* to_string(Status status) {
  switch (status) {
    case Status::kSwitchingProtocols:
      return "101 Switching Protocols";
    case Status::kOk:
      return "200 OK";
    case Status::kBadRequest:
      return "400 Bad Request";
    case Status::kNotFound:
      return "404 Not Found";
    case Status::kMethodNotAllowed:
      return "405 Method Not Allowed";
  }
  return "";
}

std::string_view trim(std::string_view s) {
  constexpr std::string_view kSpace = " \t\r\n\v\f";
  size_t first = s.find_first_not_of(kSpace);
  if (first == std::string_view::npos)
    return {};
  size_t last = s.find_last_not_of(kSpace);
  return s.substr(first, last - first + 1);
}

namespace {

// Split on every single space; consecutive spaces produce empty tokens.
std::vector<std::string_view> split_spaces(std::string_view line) {
  std::vector<std::string_view> tokens;
  size_t start = 0;
  while (true) {
    size_t pos = line.find(' ', start);
    if (pos == std::string_view::npos) {
      tokens.push_back(line.substr(start));
      break;
    }
    tokens.push_back(line.substr(start, pos - start));
    start = pos + 1;
  }
  return tokens;
}

}  // namespace

Result<Request> Request::parse(BufferedStream& in) {
  auto line = in.read_line();
  if (!line) {
    return Result<Request>::error(line.get_error());
  }

  std::string_view request_line = trim(line.value());
  std::vector<std::string_view> tokens;
  if (!request_line.empty()) {
    tokens = split_spaces(request_line);
  }

  if (tokens.empty()) {
    return Result<Request>::error(make_error(ErrorCode::kBadRequest, "no verb"));
  }
  auto verb = parse_verb(tokens[0]);
  if (!verb) {
    return Result<Request>::error(make_error(ErrorCode::kUnknownVerb, "unknown verb: " + std::string(tokens[0])));
  }
  if (tokens.size() < 2) {
    return Result<Request>::error(make_error(ErrorCode::kBadRequest, "no path"));
  }
  if (tokens.size() < 3) {
    return Result<Request>::error(make_error(ErrorCode::kBadRequest, "no version"));
  }
  for (size_t i = 3; i < tokens.size(); ++i) {
    WEBD_LOG_WARN("unexpected request line token: " + std::string(tokens[i]));
  }

  Request req;
  req.verb = verb.value();
  req.path = std::string(tokens[1]);
  req.version = std::string(tokens[2]);

  while (true) {
    auto header_line = in.read_line();
    if (!header_line) {
      return Result<Request>::error(header_line.get_error());
    }
    std::string_view hdr = trim(header_line.value());
    if (hdr.empty()) {
      break;
    }

    size_t colon = hdr.find(':');
    if (colon == std::string_view::npos) {
      WEBD_LOG_DEBUG("skipping header line without colon: " + std::string(hdr));
      continue;
    }
    std::string name(trim(hdr.substr(0, colon)));
    std::string value(trim(hdr.substr(colon + 1)));
    req.headers[std::move(name)] = std::move(value);
  }

  return Result<Request>::success(std::move(req));
}

}  // namespace webd
