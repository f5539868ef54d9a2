#include "webd/frame.hpp"

#include <cstring>

#include <limits>
#include <string>
#include <utility>

namespace webd {
namespace ws {

optional<OpCode> opcode_from_nibble(uint8_t nibble) {
  switch (nibble & 0x0F) {
    case 0x0:
      return OpCode::kContinuation;
    case 0x1:
      return OpCode::kText;
    case 0x2:
      return OpCode::kBinary;
    case 0x8:
      return OpCode::kClose;
    case 0x9:
      return OpCode::kPing;
    case 0xA:
      return OpCode::kPong;
    default:
      return {};
  }
}

bool is_control(OpCode opcode) {
  switch (opcode) {
    case OpCode::kContinuation:
    case OpCode::kText:
    case OpCode::kBinary:
      return false;
    case OpCode::kClose:
    case OpCode::kPing:
    case OpCode::kPong:
      return true;
  }
  return false;
}

const char* to_string(OpCode opcode) {
  switch (opcode) {
    case OpCode::kContinuation:
      return "continuation";
    case OpCode::kText:
      return "text";
    case OpCode::kBinary:
      return "binary";
    case OpCode::kClose:
      return "close";
    case OpCode::kPing:
      return "ping";
    case OpCode::kPong:
      return "pong";
  }
  return "?";
}

void apply_mask(uint8_t* data, size_t len, const MaskingKey& key, size_t offset) {
  for (size_t i = 0; i < len; ++i) {
    data[i] ^= key[(offset + i) % 4];
  }
}

bool is_valid_utf8(const uint8_t* data, size_t len) {
  size_t i = 0;
  while (i < len) {
    uint8_t c = data[i];
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t extra;
    uint32_t cp;
    uint32_t min_cp;
    if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
      min_cp = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
      min_cp = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
      min_cp = 0x10000;
    } else {
      return false;
    }

    if (len - i <= extra)
      return false;
    for (size_t k = 1; k <= extra; ++k) {
      uint8_t b = data[i + k];
      if ((b & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
      return false;
    i += extra + 1;
  }
  return true;
}

// ============================================================================
// FrameHeader
// ============================================================================

Result<optional<FrameHeader>> FrameHeader::parse(const uint8_t* data, size_t len) {
  using R = Result<optional<FrameHeader>>;
  if (len < 2) {
    return R::success(optional<FrameHeader>());
  }

  auto opcode = opcode_from_nibble(data[0] & 0x0F);
  if (!opcode) {
    return R::error(
        make_error(ErrorCode::kFrameParseError, "unknown opcode: " + std::to_string(data[0] & 0x0F)));
  }

  FrameHeader header;
  header.fin = (data[0] & 0x80) != 0;
  header.opcode = opcode.value();

  bool masked = (data[1] & 0x80) != 0;
  uint64_t payload_len = data[1] & 0x7F;
  size_t used = 2;

  if (payload_len == 126) {
    if (len < 4) {
      return R::success(optional<FrameHeader>());
    }
    payload_len = (static_cast<uint64_t>(data[2]) << 8) | data[3];
    used = 4;
  } else if (payload_len == 127) {
    if (len < 10) {
      return R::success(optional<FrameHeader>());
    }
    payload_len = 0;
    for (size_t i = 2; i < 10; ++i) {
      payload_len = (payload_len << 8) | data[i];
    }
    used = 10;
  }

  if (masked) {
    if (len < used + 4) {
      return R::success(optional<FrameHeader>());
    }
    MaskingKey key;
    std::memcpy(key.data(), data + used, 4);
    header.masking_key = key;
    used += 4;
  }

  if (payload_len > std::numeric_limits<size_t>::max() - used) {
    return R::error(make_error(ErrorCode::kFrameTooLarge,
                               "payload length " + std::to_string(payload_len) + " exceeds addressable size"));
  }

  header.header_len = used;
  header.payload_len = static_cast<size_t>(payload_len);
  return R::success(optional<FrameHeader>(header));
}

FrameHeader FrameHeader::make(bool fin, OpCode opcode, size_t payload_len, optional<MaskingKey> key) {
  FrameHeader header;
  header.fin = fin;
  header.opcode = opcode;
  header.payload_len = payload_len;

  size_t extra = 0;
  if (payload_len > 0xFFFF) {
    extra = 8;
  } else if (payload_len > 125) {
    extra = 2;
  }
  header.header_len = 2 + extra + (key ? 4 : 0);
  header.masking_key = std::move(key);
  return header;
}

FrameHeader FrameHeader::final_text(size_t payload_len, optional<MaskingKey> key) {
  return make(true, OpCode::kText, payload_len, std::move(key));
}

std::vector<uint8_t> FrameHeader::unmask(const uint8_t* payload, size_t len) const {
  std::vector<uint8_t> out(payload, payload + len);
  if (masking_key) {
    apply_mask(out.data(), out.size(), masking_key.value());
  }
  return out;
}

size_t FrameHeader::serialize(uint8_t* out) const {
  size_t pos = 0;
  out[pos++] = static_cast<uint8_t>((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode));

  uint8_t mask_bit = masking_key ? 0x80 : 0x00;
  if (payload_len <= 125) {
    out[pos++] = static_cast<uint8_t>(mask_bit | payload_len);
  } else if (payload_len <= 0xFFFF) {
    out[pos++] = mask_bit | 126;
    out[pos++] = static_cast<uint8_t>((payload_len >> 8) & 0xFF);
    out[pos++] = static_cast<uint8_t>(payload_len & 0xFF);
  } else {
    out[pos++] = mask_bit | 127;
    uint64_t len = payload_len;
    for (int shift = 56; shift >= 0; shift -= 8) {
      out[pos++] = static_cast<uint8_t>((len >> shift) & 0xFF);
    }
  }

  if (masking_key) {
    std::memcpy(out + pos, masking_key.value().data(), 4);
    pos += 4;
  }
  return pos;
}

std::vector<uint8_t> FrameHeader::serialize() const {
  uint8_t buf[kMaxHeaderSize];
  size_t n = serialize(buf);
  return std::vector<uint8_t>(buf, buf + n);
}

Result<size_t> FrameHeader::write(BufferedStream& out) const {
  uint8_t buf[kMaxHeaderSize];
  size_t n = serialize(buf);
  return out.write(buf, n);
}

}  // namespace ws
}  // namespace webd
