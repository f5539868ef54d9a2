#ifndef WEBD_TESTS_MEMORY_STREAM_HPP_
#define WEBD_TESTS_MEMORY_STREAM_HPP_

#include "webd/frame.hpp"
#include "webd/stream.hpp"

#include <cstring>

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace webd {
namespace test {

// Shared between the test and the stream so output stays inspectable after
// the stream has been moved into a session.
struct MemoryPipe {
  std::vector<uint8_t> input;
  size_t read_pos = 0;
  size_t max_read = 0;  // 0 = no limit per read() call
  std::vector<uint8_t> output;
  bool closed = false;

  void feed(std::string_view text) { input.insert(input.end(), text.begin(), text.end()); }
  void feed(const std::vector<uint8_t>& bytes) { input.insert(input.end(), bytes.begin(), bytes.end()); }

  std::string output_str() const { return std::string(output.begin(), output.end()); }
};

class MemoryStream : public ByteStream {
 public:
  explicit MemoryStream(std::shared_ptr<MemoryPipe> pipe) : pipe_(std::move(pipe)) {}

  Result<size_t> read(uint8_t* buf, size_t len) override {
    if (pipe_->closed) {
      return Result<size_t>::error(make_error(ErrorCode::kConnectionClosed, "memory stream closed"));
    }
    size_t n = std::min(len, pipe_->input.size() - pipe_->read_pos);
    if (pipe_->max_read > 0) {
      n = std::min(n, pipe_->max_read);
    }
    if (n > 0) {
      std::memcpy(buf, pipe_->input.data() + pipe_->read_pos, n);
      pipe_->read_pos += n;
    }
    return Result<size_t>::success(n);
  }

  Result<size_t> write(const uint8_t* buf, size_t len) override {
    if (pipe_->closed) {
      return Result<size_t>::error(make_error(ErrorCode::kConnectionClosed, "memory stream closed"));
    }
    pipe_->output.insert(pipe_->output.end(), buf, buf + len);
    return Result<size_t>::success(len);
  }

  void close() override { pipe_->closed = true; }

 private:
  std::shared_ptr<MemoryPipe> pipe_;
};

inline BufferedStream make_stream(const std::shared_ptr<MemoryPipe>& pipe,
                                  size_t max_capacity = BufferedStream::kDefaultMaxCapacity) {
  return BufferedStream(std::make_unique<MemoryStream>(pipe), max_capacity);
}

// Client-side frame: header (masked when key is set) followed by the
// masked payload.
inline std::vector<uint8_t> client_frame(bool fin, ws::OpCode opcode, std::string_view payload,
                                         optional<ws::MaskingKey> key = ws::MaskingKey{0x12, 0x34, 0x56, 0x78}) {
  ws::FrameHeader header = ws::FrameHeader::make(fin, opcode, payload.size(), key);
  std::vector<uint8_t> out = header.serialize();
  size_t body = out.size();
  out.insert(out.end(), payload.begin(), payload.end());
  if (key) {
    ws::apply_mask(out.data() + body, payload.size(), key.value());
  }
  return out;
}

}  // namespace test
}  // namespace webd

#endif  // WEBD_TESTS_MEMORY_STREAM_HPP_
