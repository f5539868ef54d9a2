#include "webd/frame.hpp"

#include <cstring>

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace webd;

namespace {

ws::FrameHeader parse_ok(const std::vector<uint8_t>& bytes) {
  auto parsed = ws::FrameHeader::parse(bytes.data(), bytes.size());
  REQUIRE(parsed.has_value());
  REQUIRE(parsed.value().has_value());
  return parsed.value().value();
}

bool is_incomplete(const uint8_t* data, size_t len) {
  auto parsed = ws::FrameHeader::parse(data, len);
  return parsed.has_value() && !parsed.value().has_value();
}

}  // namespace

// ============================================================================
// Frame Header Parsing
// ============================================================================

TEST_CASE("Frame parse - text frame unmasked", "[frame]") {
  // FIN=1, opcode=1 (text), no mask, payload=5
  std::vector<uint8_t> frame = {0x81, 0x05, 'H', 'e', 'l', 'l', 'o'};
  auto header = parse_ok(frame);
  REQUIRE(header.fin == true);
  REQUIRE(header.opcode == ws::OpCode::kText);
  REQUIRE(!header.masking_key.has_value());
  REQUIRE(header.header_len == 2);
  REQUIRE(header.payload_len == 5);
  REQUIRE(header.frame_len() == 7);
}

TEST_CASE("Frame parse - text frame masked", "[frame]") {
  // RFC 6455 section 5.7 example: masked "Hello"
  std::vector<uint8_t> frame = {0x81, 0x85, 0x37, 0xfa, 0x21, 0x3d, 0x7f, 0x9f, 0x4d, 0x51, 0x58};
  auto header = parse_ok(frame);
  REQUIRE(header.header_len == 6);  // 2 + 4 (mask key)
  REQUIRE(header.masking_key.has_value());
  REQUIRE(header.masking_key.value() == ws::MaskingKey{0x37, 0xfa, 0x21, 0x3d});
  REQUIRE(header.payload_len == 5);

  auto payload = header.unmask(frame.data() + header.header_len, header.payload_len);
  REQUIRE(std::string(payload.begin(), payload.end()) == "Hello");
}

TEST_CASE("Frame parse - control opcodes", "[frame]") {
  REQUIRE(parse_ok({0x88, 0x02, 0x03, 0xE8}).opcode == ws::OpCode::kClose);
  REQUIRE(parse_ok({0x89, 0x00}).opcode == ws::OpCode::kPing);
  REQUIRE(parse_ok({0x8A, 0x00}).opcode == ws::OpCode::kPong);
  REQUIRE(parse_ok({0x00, 0x00}).opcode == ws::OpCode::kContinuation);
  REQUIRE(parse_ok({0x00, 0x00}).fin == false);
}

TEST_CASE("Frame parse - 16-bit extended length", "[frame]") {
  std::vector<uint8_t> frame = {0x82, 0x7E, 0x01, 0x00};  // 256 bytes
  auto header = parse_ok(frame);
  REQUIRE(header.header_len == 4);
  REQUIRE(header.payload_len == 256);
}

TEST_CASE("Frame parse - 64-bit extended length", "[frame]") {
  std::vector<uint8_t> frame = {0x82, 0x7F, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00};  // 65536
  auto header = parse_ok(frame);
  REQUIRE(header.header_len == 10);
  REQUIRE(header.payload_len == 65536);
}

TEST_CASE("Frame parse - incomplete header", "[frame]") {
  uint8_t one[] = {0x81};
  REQUIRE(is_incomplete(one, 0));
  REQUIRE(is_incomplete(one, 1));

  uint8_t ext16[] = {0x81, 0x7E, 0x01};
  REQUIRE(is_incomplete(ext16, sizeof(ext16)));

  uint8_t ext64[] = {0x81, 0x7F, 0x00, 0x00, 0x00};
  REQUIRE(is_incomplete(ext64, sizeof(ext64)));

  uint8_t mask[] = {0x81, 0x85, 0x37, 0xfa};
  REQUIRE(is_incomplete(mask, sizeof(mask)));
}

TEST_CASE("Frame parse - header complete, payload pending", "[frame]") {
  uint8_t frame[] = {0x81, 0x05, 'H', 'e'};
  auto parsed = ws::FrameHeader::parse(frame, sizeof(frame));
  REQUIRE(parsed.has_value());
  REQUIRE(parsed.value().has_value());
  REQUIRE(parsed.value().value().frame_len() > sizeof(frame));
}

TEST_CASE("Frame parse - reserved opcode", "[frame]") {
  uint8_t frame[] = {0x83, 0x00};
  auto parsed = ws::FrameHeader::parse(frame, sizeof(frame));
  REQUIRE(!parsed.has_value());
  REQUIRE(parsed.get_error().code == ErrorCode::kFrameParseError);
  REQUIRE(parsed.get_error().message == "unknown opcode: 3");
}

// ============================================================================
// Frame Header Encoding
// ============================================================================

TEST_CASE("Frame encode - minimal length forms", "[frame]") {
  REQUIRE(ws::FrameHeader::make(true, ws::OpCode::kText, 125).serialize().size() == 2);
  REQUIRE(ws::FrameHeader::make(true, ws::OpCode::kText, 126).serialize().size() == 4);
  REQUIRE(ws::FrameHeader::make(true, ws::OpCode::kText, 65535).serialize().size() == 4);
  REQUIRE(ws::FrameHeader::make(true, ws::OpCode::kText, 65536).serialize().size() == 10);
  REQUIRE(ws::FrameHeader::make(true, ws::OpCode::kText, 0, ws::MaskingKey{1, 2, 3, 4}).serialize().size() == 6);
}

TEST_CASE("Frame encode - final text header bytes", "[frame]") {
  auto bytes = ws::FrameHeader::final_text(5).serialize();
  REQUIRE(bytes == std::vector<uint8_t>{0x81, 0x05});

  auto header = ws::FrameHeader::final_text(300);
  REQUIRE(header.header_len == 4);
  REQUIRE(header.serialize() == std::vector<uint8_t>{0x81, 0x7E, 0x01, 0x2C});
}

TEST_CASE("Frame encode - header_len matches serialized size", "[frame]") {
  for (size_t len : {size_t{0}, size_t{125}, size_t{126}, size_t{65536}}) {
    auto header = ws::FrameHeader::make(false, ws::OpCode::kBinary, len, ws::MaskingKey{9, 8, 7, 6});
    REQUIRE(header.serialize().size() == header.header_len);
  }
}

TEST_CASE("Frame round-trip - lengths, flags and masks", "[frame]") {
  const size_t lengths[] = {0, 1, 125, 126, 65535, 65536};
  const ws::OpCode opcodes[] = {ws::OpCode::kText, ws::OpCode::kBinary, ws::OpCode::kContinuation};

  for (size_t len : lengths) {
    for (ws::OpCode opcode : opcodes) {
      for (bool fin : {true, false}) {
        for (bool masked : {true, false}) {
          optional<ws::MaskingKey> key;
          if (masked) {
            key = ws::MaskingKey{0xDE, 0xAD, 0xBE, 0xEF};
          }
          auto sent = ws::FrameHeader::make(fin, opcode, len, key);
          auto got = parse_ok(sent.serialize());
          REQUIRE(got.fin == fin);
          REQUIRE(got.opcode == opcode);
          REQUIRE(got.payload_len == len);
          REQUIRE(got.header_len == sent.header_len);
          REQUIRE(got.masking_key.has_value() == masked);
          if (masked) {
            REQUIRE(got.masking_key.value() == key.value());
          }
        }
      }
    }
  }
}

// ============================================================================
// Masking
// ============================================================================

TEST_CASE("Masking - self-inverse", "[frame]") {
  ws::MaskingKey key = {0x12, 0x34, 0x56, 0x78};
  std::vector<uint8_t> original(257);
  for (size_t i = 0; i < original.size(); ++i) {
    original[i] = static_cast<uint8_t>(i * 31);
  }

  auto data = original;
  ws::apply_mask(data.data(), data.size(), key);
  REQUIRE(data != original);
  ws::apply_mask(data.data(), data.size(), key);
  REQUIRE(data == original);
}

TEST_CASE("Masking - offset continues the key cycle", "[frame]") {
  ws::MaskingKey key = {0x01, 0x02, 0x03, 0x04};
  std::vector<uint8_t> whole(10, 0);
  ws::apply_mask(whole.data(), whole.size(), key);

  std::vector<uint8_t> split(10, 0);
  ws::apply_mask(split.data(), 3, key, 0);
  ws::apply_mask(split.data() + 3, 7, key, 3);
  REQUIRE(split == whole);
}

TEST_CASE("Masking - unmask without key copies", "[frame]") {
  auto header = ws::FrameHeader::make(true, ws::OpCode::kBinary, 3);
  uint8_t payload[] = {1, 2, 3};
  REQUIRE(header.unmask(payload, 3) == std::vector<uint8_t>{1, 2, 3});
}

// ============================================================================
// UTF-8 Validation
// ============================================================================

namespace {

bool utf8(const std::string& s) {
  return ws::is_valid_utf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

}  // namespace

TEST_CASE("UTF-8 - accepts valid text", "[frame]") {
  REQUIRE(utf8(""));
  REQUIRE(utf8("hello"));
  REQUIRE(utf8("\xC3\xA9"));              // U+00E9
  REQUIRE(utf8("\xE2\x82\xAC"));          // U+20AC
  REQUIRE(utf8("\xF0\x9F\x98\x80"));      // U+1F600
  REQUIRE(utf8("\xF4\x8F\xBF\xBF"));      // U+10FFFF
}

TEST_CASE("UTF-8 - rejects malformed sequences", "[frame]") {
  REQUIRE(!utf8("\xFF"));
  REQUIRE(!utf8("\x80"));               // lone continuation
  REQUIRE(!utf8("\xC3"));               // truncated
  REQUIRE(!utf8("\xE2\x82"));           // truncated
  REQUIRE(!utf8("\xC0\xAF"));           // overlong '/'
  REQUIRE(!utf8("\xE0\x80\xAF"));       // overlong
  REQUIRE(!utf8("\xED\xA0\x80"));       // surrogate U+D800
  REQUIRE(!utf8("\xF4\x90\x80\x80"));   // above U+10FFFF
  REQUIRE(!utf8("\xC3\x28"));           // bad continuation
}

TEST_CASE("OpCode - control classification", "[frame]") {
  REQUIRE(ws::is_control(ws::OpCode::kClose));
  REQUIRE(ws::is_control(ws::OpCode::kPing));
  REQUIRE(ws::is_control(ws::OpCode::kPong));
  REQUIRE(!ws::is_control(ws::OpCode::kText));
  REQUIRE(!ws::is_control(ws::OpCode::kBinary));
  REQUIRE(!ws::is_control(ws::OpCode::kContinuation));
  REQUIRE(!ws::opcode_from_nibble(0xB).has_value());
}
