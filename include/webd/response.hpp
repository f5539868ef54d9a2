#ifndef WEBD_RESPONSE_HPP_
#define WEBD_RESPONSE_HPP_

#include "http.hpp"
#include "stream.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>

namespace webd {

constexpr std::string_view kDefaultServerName = "webd 0.1";

// ============================================================================
// Plain HTTP/1.0 responses
// ============================================================================

// "HTTP/1.0 <status>", Server, Content-Type, Content-Length, blank line.
Result<size_t> send_headers(BufferedStream& out, Status status, std::string_view content_type, uint64_t length,
                            std::string_view server_name = kDefaultServerName);

Result<size_t> send_str(BufferedStream& out, Status status, std::string_view content_type, std::string_view content,
                        std::string_view server_name = kDefaultServerName);

// Streams the file in chunks. A file that cannot be opened is an I/O error
// and nothing is written.
Result<size_t> send_file(BufferedStream& out, Status status, std::string_view content_type, const std::string& path,
                         std::string_view server_name = kDefaultServerName);

}  // namespace webd

#endif  // WEBD_RESPONSE_HPP_
