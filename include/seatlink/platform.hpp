/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, byte-order helpers and assertion
 *        macros shared by all seatlink headers.
 */

#ifndef SEATLINK_PLATFORM_HPP_
#define SEATLINK_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace seatlink {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define SEATLINK_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define SEATLINK_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define SEATLINK_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define SEATLINK_LIKELY(x) __builtin_expect(!!(x), 1)
#define SEATLINK_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define SEATLINK_UNUSED __attribute__((unused))
#else
#define SEATLINK_LIKELY(x) (x)
#define SEATLINK_UNLIKELY(x) (x)
#define SEATLINK_UNUSED
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "SEATLINK_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define SEATLINK_ASSERT(cond) ((void)0)
#else
#define SEATLINK_ASSERT(cond) \
  ((cond) ? ((void)0) : ::seatlink::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Little-endian helpers (all multi-byte wire fields are little-endian)
// ============================================================================

inline void WriteLE16(uint8_t* p, uint16_t v) noexcept {
  SEATLINK_ASSERT(p != nullptr);
  p[0] = static_cast<uint8_t>(v & 0xFFU);
  p[1] = static_cast<uint8_t>((v >> 8) & 0xFFU);
}

inline uint16_t ReadLE16(const uint8_t* p) noexcept {
  SEATLINK_ASSERT(p != nullptr);
  return static_cast<uint16_t>(static_cast<uint16_t>(p[0]) |
                               static_cast<uint16_t>(static_cast<uint16_t>(p[1]) << 8));
}

inline uint32_t ReadLE32(const uint8_t* p) noexcept {
  SEATLINK_ASSERT(p != nullptr);
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

}  // namespace seatlink

#endif  // SEATLINK_PLATFORM_HPP_
