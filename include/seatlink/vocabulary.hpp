/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared across seatlink: error enums, expected<V, E>,
 *        optional<T> and the ByteBuffer alias.
 *
 * expected/optional are exception-free so every header stays usable with
 * -fno-exceptions. Accessing value() on an empty object is a programming
 * error and trips SEATLINK_ASSERT in debug builds.
 */

#ifndef SEATLINK_VOCABULARY_HPP_
#define SEATLINK_VOCABULARY_HPP_

#include "seatlink/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>
#include <vector>

namespace seatlink {

/// Raw bytes as they travel through the codec, frame and message layers.
using ByteBuffer = std::vector<uint8_t>;

// ============================================================================
// Error Enums
// ============================================================================

/// Byte-stuffing decode failures. The packet is discarded by the caller.
enum class CodecError : uint8_t {
  kEmptyInput,
  kMissingDelimiter,
  kUnexpectedDelimiter,
  kTruncatedBlock,
};

enum class FrameError : uint8_t {
  kEmpty,
  kTruncated,
  kUnknownKind,
  kInvalidField,
  kPayloadTooLarge,
};

/// Reported by the external transport implementation.
enum class TransportError : uint8_t {
  kNotConnected,
  kWriteFailed,
};

/// Errors surfaced to callers of the client facade. A missing response is
/// not an error; see AquaCleanClient.
enum class LinkError : uint8_t {
  kNotConnected,
  kWriteFailed,
  kEncodeFailed,
  kInvalidArgument,
  kAccessDenied,
};

enum class ConfigError : uint8_t {
  kFileNotFound,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

inline const char* ToString(CodecError e) noexcept {
  switch (e) {
    case CodecError::kEmptyInput:
      return "empty input";
    case CodecError::kMissingDelimiter:
      return "missing delimiter";
    case CodecError::kUnexpectedDelimiter:
      return "unexpected delimiter";
    case CodecError::kTruncatedBlock:
      return "truncated block";
    default:
      return "unknown";
  }
}

inline const char* ToString(FrameError e) noexcept {
  switch (e) {
    case FrameError::kEmpty:
      return "empty frame";
    case FrameError::kTruncated:
      return "truncated frame";
    case FrameError::kUnknownKind:
      return "unknown frame kind";
    case FrameError::kInvalidField:
      return "invalid header field";
    case FrameError::kPayloadTooLarge:
      return "payload too large";
    default:
      return "unknown";
  }
}

inline const char* ToString(LinkError e) noexcept {
  switch (e) {
    case LinkError::kNotConnected:
      return "not connected";
    case LinkError::kWriteFailed:
      return "write failed";
    case LinkError::kEncodeFailed:
      return "encode failed";
    case LinkError::kInvalidArgument:
      return "invalid argument";
    case LinkError::kAccessDenied:
      return "access denied";
    default:
      return "unknown";
  }
}

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional {
 public:
  optional() noexcept : has_(false) {}

  optional(const T& v) : has_(true) { new (&storage_) T(v); }  // NOLINT
  optional(T&& v) : has_(true) { new (&storage_) T(std::move(v)); }  // NOLINT

  optional(const optional& other) : has_(other.has_) {
    if (has_) new (&storage_) T(*other.ptr());
  }

  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : has_(other.has_) {
    if (has_) new (&storage_) T(std::move(*other.ptr()));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_) {
        new (&storage_) T(*other.ptr());
        has_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_) {
        new (&storage_) T(std::move(*other.ptr()));
        has_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_; }
  explicit operator bool() const noexcept { return has_; }

  T& value() noexcept {
    SEATLINK_ASSERT(has_);
    return *ptr();
  }
  const T& value() const noexcept {
    SEATLINK_ASSERT(has_);
    return *ptr();
  }

  T value_or(const T& default_val) const {
    return has_ ? *ptr() : default_val;
  }

  T* operator->() noexcept { return &value(); }
  const T* operator->() const noexcept { return &value(); }
  T& operator*() noexcept { return value(); }
  const T& operator*() const noexcept { return value(); }

  void reset() noexcept {
    if (has_) {
      ptr()->~T();
      has_ = false;
    }
  }

 private:
  T* ptr() noexcept { return reinterpret_cast<T*>(&storage_); }
  const T* ptr() const noexcept { return reinterpret_cast<const T*>(&storage_); }

  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_;
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result. E must be a trivially copyable error code.
 *
 * Construct through the named factories:
 * @code
 *   return expected<ByteBuffer, CodecError>::success(std::move(out));
 *   return expected<ByteBuffer, CodecError>::error(CodecError::kEmptyInput);
 * @endcode
 */
template <typename V, typename E>
class expected {
  static_assert(std::is_trivially_copyable<E>::value,
                "error type must be trivially copyable");

 public:
  static expected success(const V& v) { return expected(v); }
  static expected success(V&& v) { return expected(std::move(v)); }
  static expected error(E e) noexcept { return expected(ErrorTag{}, e); }

  expected(const expected& other) : has_(other.has_), err_(other.err_) {
    if (has_) new (&storage_) V(*other.ptr());
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_(other.has_), err_(other.err_) {
    if (has_) new (&storage_) V(std::move(*other.ptr()));
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_ = other.has_;
      err_ = other.err_;
      if (has_) new (&storage_) V(*other.ptr());
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_ = other.has_;
      err_ = other.err_;
      if (has_) new (&storage_) V(std::move(*other.ptr()));
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_; }
  explicit operator bool() const noexcept { return has_; }

  V& value() noexcept {
    SEATLINK_ASSERT(has_);
    return *ptr();
  }
  const V& value() const noexcept {
    SEATLINK_ASSERT(has_);
    return *ptr();
  }

  V value_or(const V& default_val) const { return has_ ? *ptr() : default_val; }

  E get_error() const noexcept {
    SEATLINK_ASSERT(!has_);
    return err_;
  }

 private:
  struct ErrorTag {};

  explicit expected(const V& v) : has_(true), err_{} { new (&storage_) V(v); }
  explicit expected(V&& v) : has_(true), err_{} { new (&storage_) V(std::move(v)); }
  expected(ErrorTag, E e) noexcept : has_(false), err_(e) {}

  void Destroy() noexcept {
    if (has_) {
      ptr()->~V();
      has_ = false;
    }
  }

  V* ptr() noexcept { return reinterpret_cast<V*>(&storage_); }
  const V* ptr() const noexcept { return reinterpret_cast<const V*>(&storage_); }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  bool has_;
  E err_;
};

/// expected<void, E>: success carries no value.
template <typename E>
class expected<void, E> {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_; }
  explicit operator bool() const noexcept { return has_; }

  E get_error() const noexcept {
    SEATLINK_ASSERT(!has_);
    return err_;
  }

 private:
  expected(bool has, E e) noexcept : has_(has), err_(e) {}

  bool has_;
  E err_;
};

}  // namespace seatlink

#endif  // SEATLINK_VOCABULARY_HPP_
