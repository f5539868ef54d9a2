#include "webd/vocabulary.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace webd;

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected - success with value", "[vocabulary]") {
  auto result = Result<int>::success(42);
  REQUIRE(result.has_value());
  REQUIRE(result.value() == 42);
}

TEST_CASE("expected - error", "[vocabulary]") {
  auto result = Result<int>::error(make_error(ErrorCode::kBufferFull, "full"));
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error().code == ErrorCode::kBufferFull);
  REQUIRE(result.get_error().message == "full");
}

TEST_CASE("expected - value_or", "[vocabulary]") {
  auto ok = Result<int>::success(10);
  auto err = Result<int>::error(make_error(ErrorCode::kTimeout, ""));
  REQUIRE(ok.value_or(99) == 10);
  REQUIRE(err.value_or(99) == 99);
}

TEST_CASE("expected - move keeps string payload", "[vocabulary]") {
  auto original = Result<std::string>::success(std::string("payload"));
  auto moved = static_cast<Result<std::string>&&>(original);
  REQUIRE(moved.has_value());
  REQUIRE(moved.value() == "payload");
}

TEST_CASE("expected<void> - success and error", "[vocabulary]") {
  auto ok = Result<void>::success();
  REQUIRE(ok.has_value());

  auto err = Result<void>::error(make_error(ErrorCode::kInvalidState, "closed"));
  REQUIRE(!err);
  REQUIRE(err.get_error().code == ErrorCode::kInvalidState);
}

TEST_CASE("expected - nested optional distinguishes empty from error", "[vocabulary]") {
  auto empty = Result<optional<int>>::success(optional<int>());
  REQUIRE(empty.has_value());
  REQUIRE(!empty.value().has_value());

  auto full = Result<optional<int>>::success(optional<int>(3));
  REQUIRE(full.value().value() == 3);
}

// ============================================================================
// Error kinds
// ============================================================================

TEST_CASE("Error - transport codes are io", "[vocabulary]") {
  REQUIRE(kind_of(ErrorCode::kSocketError) == ErrorKind::kIo);
  REQUIRE(kind_of(ErrorCode::kConnectionClosed) == ErrorKind::kIo);
  REQUIRE(kind_of(ErrorCode::kTimeout) == ErrorKind::kIo);
  REQUIRE(kind_of(ErrorCode::kInvalidState) == ErrorKind::kIo);
  REQUIRE(kind_of(ErrorCode::kInternalError) == ErrorKind::kIo);
}

TEST_CASE("Error - protocol codes are input", "[vocabulary]") {
  REQUIRE(kind_of(ErrorCode::kBadRequest) == ErrorKind::kInput);
  REQUIRE(kind_of(ErrorCode::kUnknownVerb) == ErrorKind::kInput);
  REQUIRE(kind_of(ErrorCode::kMissingHeader) == ErrorKind::kInput);
  REQUIRE(kind_of(ErrorCode::kFrameParseError) == ErrorKind::kInput);
  REQUIRE(kind_of(ErrorCode::kFrameTooLarge) == ErrorKind::kInput);
  REQUIRE(kind_of(ErrorCode::kInvalidUtf8) == ErrorKind::kInput);
  REQUIRE(kind_of(ErrorCode::kBufferFull) == ErrorKind::kInput);
}

TEST_CASE("Error - describe prefixes the kind", "[vocabulary]") {
  Error input = make_error(ErrorCode::kUnknownVerb, "unknown verb: POST");
  REQUIRE(input.is_input());
  REQUIRE(input.describe() == "input: unknown verb: POST");

  Error io = make_error(ErrorCode::kTimeout, "");
  REQUIRE(io.is_io());
  REQUIRE(io.describe() == "io: timeout");
}

// ============================================================================
// optional<T>
// ============================================================================

TEST_CASE("optional - empty", "[vocabulary]") {
  optional<int> opt;
  REQUIRE(!opt.has_value());
  REQUIRE(opt.value_or(99) == 99);
}

TEST_CASE("optional - with value", "[vocabulary]") {
  optional<int> opt(42);
  REQUIRE(opt.has_value());
  REQUIRE(opt.value() == 42);
}

TEST_CASE("optional - reset", "[vocabulary]") {
  optional<std::string> opt(std::string("x"));
  REQUIRE(opt.has_value());
  opt.reset();
  REQUIRE(!opt.has_value());
}

TEST_CASE("optional - copy and move", "[vocabulary]") {
  optional<std::string> a(std::string("seven"));
  optional<std::string> b = a;
  REQUIRE(b.value() == "seven");
  optional<std::string> c = static_cast<optional<std::string>&&>(a);
  REQUIRE(c.value() == "seven");
}
