#ifndef WEBD_FRAME_HPP_
#define WEBD_FRAME_HPP_

#include "stream.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <array>
#include <vector>

namespace webd {

namespace ws {

// Frame types
enum class OpCode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA
};

// Decode the low nibble of the first header byte. Reserved opcodes yield
// an empty optional.
optional<OpCode> opcode_from_nibble(uint8_t nibble);

bool is_control(OpCode opcode);
const char* to_string(OpCode opcode);

using MaskingKey = std::array<uint8_t, 4>;

// XOR data with key[(offset + i) % 4]. Self-inverse.
void apply_mask(uint8_t* data, size_t len, const MaskingKey& key, size_t offset = 0);

// Strict UTF-8: rejects overlong forms, surrogates and code points above
// U+10FFFF.
bool is_valid_utf8(const uint8_t* data, size_t len);

/**
 * @brief RFC 6455 base frame header.
 *
 * Wire layout:
 *   byte 0: FIN(1) RSV(3) OPCODE(4)
 *   byte 1: MASK(1) LEN(7)    LEN 126 -> 2 more bytes, 127 -> 8 more bytes
 *   [masking key, 4 bytes, when MASK is set]
 */
struct FrameHeader {
  static constexpr size_t kMaxHeaderSize = 14;
  static constexpr size_t kMaxControlPayload = 125;

  bool fin = true;
  OpCode opcode = OpCode::kText;
  size_t header_len = 2;
  size_t payload_len = 0;
  optional<MaskingKey> masking_key;

  size_t frame_len() const { return header_len + payload_len; }

  // Parse the header at the front of data.
  //   error        - malformed (reserved opcode, length beyond size_t)
  //   empty value  - not enough bytes for the header yet
  //   value        - header fits; the payload may still be incomplete,
  //                  check len >= frame_len() before touching it
  static Result<optional<FrameHeader>> parse(const uint8_t* data, size_t len);

  // Build a header with header_len matching the minimal length encoding.
  static FrameHeader make(bool fin, OpCode opcode, size_t payload_len, optional<MaskingKey> key = {});

  // Final, unmasked-by-default text frame (server to client send case).
  static FrameHeader final_text(size_t payload_len, optional<MaskingKey> key = {});

  // Copy of payload with the masking transform removed (plain copy when
  // the frame carries no key).
  std::vector<uint8_t> unmask(const uint8_t* payload, size_t len) const;

  // Encode into out (at least kMaxHeaderSize bytes). Returns bytes written.
  size_t serialize(uint8_t* out) const;
  std::vector<uint8_t> serialize() const;

  // Write the header bytes only; the payload follows as a separate write.
  Result<size_t> write(BufferedStream& out) const;
};

}  // namespace ws

}  // namespace webd

#endif  // WEBD_FRAME_HPP_
