#ifndef WEBD_STREAM_HPP_
#define WEBD_STREAM_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <sockpp/tcp_socket.h>
#include <string>
#include <string_view>
#include <vector>

namespace webd {

// ============================================================================
// ByteStream (duplex byte channel)
// ============================================================================

class ByteStream {
 public:
  virtual ~ByteStream() = default;

  // Read up to len bytes. Blocks until at least one byte is available.
  // Returns 0 at end of stream.
  virtual Result<size_t> read(uint8_t* buf, size_t len) = 0;

  // Write all len bytes. Returns len on success.
  virtual Result<size_t> write(const uint8_t* buf, size_t len) = 0;

  virtual void close() = 0;
};

// ============================================================================
// SocketStream (ByteStream over a connected TCP socket)
// ============================================================================

class SocketStream : public ByteStream {
 public:
  explicit SocketStream(sockpp::tcp_socket&& sock);
  ~SocketStream() override;

  // Bound blocking reads; 0 disables the timeout.
  bool set_read_timeout_ms(int timeout_ms);

  Result<size_t> read(uint8_t* buf, size_t len) override;
  Result<size_t> write(const uint8_t* buf, size_t len) override;
  void close() override;

  std::string peer() const;

 private:
  sockpp::tcp_socket socket_;
};

// ============================================================================
// BufferedStream (receive buffer + unbuffered writes)
// ============================================================================

/**
 * @brief Owns a ByteStream and a linear receive buffer.
 *
 * Move-only: ownership travels from the accept loop to the application,
 * the handshake and finally the WebSocket session.
 */
class BufferedStream {
 public:
  static constexpr size_t kInitialCapacity = 4096;
  static constexpr size_t kDefaultMaxCapacity = (16U << 20) + 14U;
  static constexpr size_t kReadChunk = 4096;

  BufferedStream() = default;
  explicit BufferedStream(std::unique_ptr<ByteStream> inner, size_t max_capacity = kDefaultMaxCapacity);

  BufferedStream(BufferedStream&&) noexcept = default;
  BufferedStream& operator=(BufferedStream&&) noexcept = default;
  BufferedStream(const BufferedStream&) = delete;
  BufferedStream& operator=(const BufferedStream&) = delete;

  // One blocking read from the inner stream, appended to the buffer.
  // Returns the number of bytes added; 0 means end of stream.
  Result<size_t> fill();

  // Read one line through '\n' (or end of stream); the terminator is kept.
  Result<std::string> read_line();

  // Buffered, not yet consumed bytes.
  const uint8_t* data() const { return buffer_.data() + read_idx_; }
  size_t size() const { return write_idx_ - read_idx_; }
  bool empty() const { return size() == 0; }

  // Drop len bytes from the front of the buffer.
  void consume(size_t len);

  Result<size_t> write(const uint8_t* buf, size_t len);
  Result<size_t> write(std::string_view text) {
    return write(reinterpret_cast<const uint8_t*>(text.data()), text.size());
  }

  void close();
  bool is_attached() const { return inner_ != nullptr; }
  size_t max_capacity() const { return max_capacity_; }

  ByteStream* inner() { return inner_.get(); }

 private:
  std::unique_ptr<ByteStream> inner_;
  std::vector<uint8_t> buffer_;
  size_t read_idx_ = 0;
  size_t write_idx_ = 0;
  size_t max_capacity_ = kDefaultMaxCapacity;

  // Make room for at least one read chunk (or whatever the limit allows).
  size_t reserve_tail();
};

}  // namespace webd

#endif  // WEBD_STREAM_HPP_
