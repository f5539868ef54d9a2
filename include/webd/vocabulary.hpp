/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file vocabulary.hpp
 * @brief Vocabulary types for webd: ErrorCode, Error, expected, optional.
 *
 * Every fallible operation in the library returns expected<V, Error>.
 * The error kind (I/O vs. malformed input) is derived from the code so the
 * HTTP layer can decide whether a 400 response is still possible.
 */

#ifndef WEBD_VOCABULARY_HPP_
#define WEBD_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

#ifndef WEBD_ASSERT
#define WEBD_ASSERT(cond) ((void)(cond))
#endif

namespace webd {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  // Transport
  kSocketError = 1,
  kConnectionClosed = 2,
  kTimeout = 3,
  kInvalidState = 4,
  // Malformed protocol data
  kBadRequest = 10,
  kUnknownVerb = 11,
  kMissingHeader = 12,
  kFrameParseError = 13,
  kFrameTooLarge = 14,
  kInvalidUtf8 = 15,
  kBufferFull = 16,
  kInternalError = 255
};

enum class ErrorKind : uint8_t { kIo, kInput };

inline ErrorKind kind_of(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk:
    case ErrorCode::kSocketError:
    case ErrorCode::kConnectionClosed:
    case ErrorCode::kTimeout:
    case ErrorCode::kInvalidState:
    case ErrorCode::kInternalError:
      return ErrorKind::kIo;
    case ErrorCode::kBadRequest:
    case ErrorCode::kUnknownVerb:
    case ErrorCode::kMissingHeader:
    case ErrorCode::kFrameParseError:
    case ErrorCode::kFrameTooLarge:
    case ErrorCode::kInvalidUtf8:
    case ErrorCode::kBufferFull:
      return ErrorKind::kInput;
  }
  return ErrorKind::kIo;
}

inline const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kSocketError:
      return "socket error";
    case ErrorCode::kConnectionClosed:
      return "connection closed";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kInvalidState:
      return "invalid state";
    case ErrorCode::kBadRequest:
      return "bad request";
    case ErrorCode::kUnknownVerb:
      return "unknown verb";
    case ErrorCode::kMissingHeader:
      return "missing header";
    case ErrorCode::kFrameParseError:
      return "frame parse error";
    case ErrorCode::kFrameTooLarge:
      return "frame too large";
    case ErrorCode::kInvalidUtf8:
      return "invalid utf-8";
    case ErrorCode::kBufferFull:
      return "buffer full";
    case ErrorCode::kInternalError:
      return "internal error";
  }
  return "unknown";
}

/**
 * @brief Error code plus a human readable message.
 */
struct Error {
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  ErrorKind kind() const noexcept { return kind_of(code); }
  bool is_input() const noexcept { return kind() == ErrorKind::kInput; }
  bool is_io() const noexcept { return kind() == ErrorKind::kIo; }

  // "input: unknown verb: POST" / "io: socket error: Broken pipe"
  std::string describe() const {
    std::string out = is_input() ? "input: " : "io: ";
    out += message.empty() ? to_string(code) : message;
    return out;
  }
};

inline Error make_error(ErrorCode code, std::string message) {
  return Error{code, std::move(message)};
}

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Use static factory methods success() and error() to construct.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(val);
    return e;
  }

  static expected success(V&& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = static_cast<E&&>(err);
    return e;
  }

  expected(const expected& other) : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(other.value());
      }
    }
    return *this;
  }

  expected(expected&& other) noexcept
      : storage_{}, err_(static_cast<E&&>(other.err_)), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.value()));
    }
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = static_cast<E&&>(other.err_);
      if (has_value_) {
        ::new (&storage_) V(static_cast<V&&>(other.value()));
      }
    }
    return *this;
  }

  ~expected() {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
    }
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    WEBD_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    WEBD_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  const E& get_error() const noexcept {
    WEBD_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& default_val) const { return has_value_ ? value() : default_val; }

 private:
  expected() noexcept : storage_{}, err_{}, has_value_(false) {}

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_{};
  E err_{};
  bool has_value_{false};
};

/**
 * @brief Void specialization - represents success or error with no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = static_cast<E&&>(err);
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const noexcept {
    WEBD_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  E err_{};
  bool has_value_{false};
};

template <typename V>
using Result = expected<V, Error>;

// ============================================================================
// optional<T> - Lightweight nullable value
// ============================================================================

/**
 * @brief Holds either a value of type T or nothing.
 */
template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& val) : has_value_(true) {  // NOLINT
    ::new (&storage_) T(val);
  }

  optional(T&& val) noexcept : has_value_(true) {  // NOLINT
    ::new (&storage_) T(static_cast<T&&>(val));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(other.value());
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) T(other.value());
      }
    }
    return *this;
  }

  optional(optional&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(static_cast<T&&>(other.value()));
    }
  }

  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) T(static_cast<T&&>(other.value()));
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    WEBD_ASSERT(has_value_);
    return *reinterpret_cast<T*>(&storage_);
  }

  const T& value() const noexcept {
    WEBD_ASSERT(has_value_);
    return *reinterpret_cast<const T*>(&storage_);
  }

  T value_or(const T& default_val) const { return has_value_ ? value() : default_val; }

  void reset() noexcept {
    if (has_value_) {
      reinterpret_cast<T*>(&storage_)->~T();
      has_value_ = false;
    }
  }

 private:
  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

}  // namespace webd

#endif  // WEBD_VOCABULARY_HPP_
