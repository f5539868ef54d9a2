#include "webd/response.hpp"

#include "webd/log.hpp"

#include <cerrno>
#include <cstring>

#include <fstream>

namespace webd {

Result<size_t> send_headers(BufferedStream& out, Status status, std::string_view content_type, uint64_t length,
                            std::string_view server_name) {
  WEBD_LOG_INFO(std::string(" => ") + to_string(status));

  std::string head;
  head.reserve(128);
  head.append("HTTP/1.0 ").append(to_string(status)).append("\n");
  head.append("Server: ").append(server_name).append("\n");
  head.append("Content-Type: ").append(content_type).append("\n");
  head.append("Content-Length: ").append(std::to_string(length)).append("\n");
  head.append("\n");

  return out.write(head);
}

Result<size_t> send_str(BufferedStream& out, Status status, std::string_view content_type, std::string_view content,
                        std::string_view server_name) {
  auto head = send_headers(out, status, content_type, content.size(), server_name);
  if (!head) {
    return head;
  }
  auto body = out.write(content);
  if (!body) {
    return body;
  }
  return Result<size_t>::success(head.value() + body.value());
}

Result<size_t> send_file(BufferedStream& out, Status status, std::string_view content_type, const std::string& path,
                         std::string_view server_name) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return Result<size_t>::error(
        make_error(ErrorCode::kSocketError, "open " + path + ": " + std::string(std::strerror(errno))));
  }
  std::streamoff size = file.tellg();
  if (size < 0) {
    return Result<size_t>::error(make_error(ErrorCode::kSocketError, "stat " + path + " failed"));
  }
  file.seekg(0);

  auto head = send_headers(out, status, content_type, static_cast<uint64_t>(size), server_name);
  if (!head) {
    return head;
  }

  size_t total = head.value();
  char chunk[8192];
  while (file) {
    file.read(chunk, sizeof(chunk));
    std::streamsize got = file.gcount();
    if (got <= 0)
      break;
    auto n = out.write(reinterpret_cast<const uint8_t*>(chunk), static_cast<size_t>(got));
    if (!n) {
      return n;
    }
    total += n.value();
  }
  if (file.bad()) {
    return Result<size_t>::error(make_error(ErrorCode::kSocketError, "read " + path + " failed"));
  }
  return Result<size_t>::success(total);
}

}  // namespace webd
