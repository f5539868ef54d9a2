#include "webd/stream.hpp"

#include <cerrno>
#include <cstring>

#include <algorithm>
#include <chrono>
#include <utility>

namespace webd {

// ============================================================================
// SocketStream
// ============================================================================

SocketStream::SocketStream(sockpp::tcp_socket&& sock) : socket_(std::move(sock)) {}

SocketStream::~SocketStream() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

bool SocketStream::set_read_timeout_ms(int timeout_ms) {
  return socket_.read_timeout(std::chrono::milliseconds(timeout_ms));
}

Result<size_t> SocketStream::read(uint8_t* buf, size_t len) {
  if (!socket_.is_open()) {
    return Result<size_t>::error(make_error(ErrorCode::kConnectionClosed, "socket is closed"));
  }

  ssize_t n = socket_.read(buf, len);
  if (n >= 0) {
    return Result<size_t>::success(static_cast<size_t>(n));
  }

  int err = socket_.last_error();
  if (err == EAGAIN || err == EWOULDBLOCK) {
    return Result<size_t>::error(make_error(ErrorCode::kTimeout, "read timed out"));
  }
  return Result<size_t>::error(make_error(ErrorCode::kSocketError, "read: " + socket_.last_error_str()));
}

Result<size_t> SocketStream::write(const uint8_t* buf, size_t len) {
  if (!socket_.is_open()) {
    return Result<size_t>::error(make_error(ErrorCode::kConnectionClosed, "socket is closed"));
  }
  if (len == 0) {
    return Result<size_t>::success(0);
  }

  ssize_t n = socket_.write_n(buf, len);
  if (n < 0 || static_cast<size_t>(n) != len) {
    return Result<size_t>::error(make_error(ErrorCode::kSocketError, "write: " + socket_.last_error_str()));
  }
  return Result<size_t>::success(static_cast<size_t>(n));
}

void SocketStream::close() {
  if (socket_.is_open()) {
    socket_.shutdown();
    socket_.close();
  }
}

std::string SocketStream::peer() const {
  return socket_.peer_address().to_string();
}

// ============================================================================
// BufferedStream
// ============================================================================

BufferedStream::BufferedStream(std::unique_ptr<ByteStream> inner, size_t max_capacity)
    : inner_(std::move(inner)), max_capacity_(std::max(max_capacity, kReadChunk)) {
  buffer_.resize(std::min(kInitialCapacity, max_capacity_));
}

size_t BufferedStream::reserve_tail() {
  if (read_idx_ == write_idx_) {
    read_idx_ = 0;
    write_idx_ = 0;
  }
  if (buffer_.size() - write_idx_ >= kReadChunk) {
    return buffer_.size() - write_idx_;
  }

  if (read_idx_ > 0) {
    std::memmove(buffer_.data(), buffer_.data() + read_idx_, write_idx_ - read_idx_);
    write_idx_ -= read_idx_;
    read_idx_ = 0;
  }

  if (buffer_.size() - write_idx_ < kReadChunk && buffer_.size() < max_capacity_) {
    size_t grown = std::max({buffer_.size() * 2, write_idx_ + kReadChunk, kInitialCapacity});
    buffer_.resize(std::min(grown, max_capacity_));
  }
  return buffer_.size() - write_idx_;
}

Result<size_t> BufferedStream::fill() {
  if (!inner_) {
    return Result<size_t>::error(make_error(ErrorCode::kConnectionClosed, "stream is detached"));
  }

  size_t room = reserve_tail();
  if (room == 0) {
    return Result<size_t>::error(make_error(
        ErrorCode::kBufferFull, "receive buffer limit of " + std::to_string(max_capacity_) + " bytes reached"));
  }

  auto n = inner_->read(buffer_.data() + write_idx_, room);
  if (!n) {
    return n;
  }
  write_idx_ += n.value();
  return n;
}

Result<std::string> BufferedStream::read_line() {
  size_t scanned = 0;
  while (true) {
    const uint8_t* begin = data();
    const uint8_t* end = begin + size();
    const uint8_t* nl = std::find(begin + scanned, end, static_cast<uint8_t>('\n'));
    if (nl != end) {
      size_t len = static_cast<size_t>(nl - begin) + 1;
      std::string line(reinterpret_cast<const char*>(begin), len);
      consume(len);
      return Result<std::string>::success(std::move(line));
    }
    scanned = size();

    auto n = fill();
    if (!n) {
      return Result<std::string>::error(n.get_error());
    }
    if (n.value() == 0) {
      // End of stream: hand back whatever is left.
      std::string rest(reinterpret_cast<const char*>(data()), size());
      consume(size());
      return Result<std::string>::success(std::move(rest));
    }
  }
}

void BufferedStream::consume(size_t len) {
  len = std::min(len, size());
  read_idx_ += len;
  if (read_idx_ == write_idx_) {
    read_idx_ = 0;
    write_idx_ = 0;
  }
}

Result<size_t> BufferedStream::write(const uint8_t* buf, size_t len) {
  if (!inner_) {
    return Result<size_t>::error(make_error(ErrorCode::kConnectionClosed, "stream is detached"));
  }
  return inner_->write(buf, len);
}

void BufferedStream::close() {
  if (inner_) {
    inner_->close();
  }
}

}  // namespace webd
