/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
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
 * @file log.hpp
 * @brief Synchronous printf-style logger with runtime and compile-time level
 *        filtering.
 *
 * Output line format:
 *   [2026-10-18 12:00:00.123] [WARN] [Codec] message (cobs.hpp:42)
 *
 * Compile-time configuration:
 *   SEATLINK_LOG_MIN_LEVEL -- levels below this value are compiled out
 *                             (0=DEBUG .. 4=FATAL, default 0)
 *
 * Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef SEATLINK_LOG_HPP_
#define SEATLINK_LOG_HPP_

#include "seatlink/platform.hpp"
#include "seatlink/vocabulary.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <mutex>

#if defined(SEATLINK_PLATFORM_LINUX) || defined(SEATLINK_PLATFORM_MACOS)
#include <sys/time.h>
#include <time.h>
#endif

#ifndef SEATLINK_LOG_MIN_LEVEL
#define SEATLINK_LOG_MIN_LEVEL 0
#endif

namespace seatlink {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<uint8_t>& LevelStorage() noexcept {
#ifdef NDEBUG
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  return level;
}

inline std::atomic<bool>& InitFlag() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline std::mutex& WriteMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// Formats "YYYY-MM-DD HH:MM:SS.mmm" into buf.
inline void FormatWallClock(char* buf, size_t size) noexcept {
#if defined(SEATLINK_PLATFORM_LINUX) || defined(SEATLINK_PLATFORM_MACOS)
  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  ::localtime_r(&tv.tv_sec, &tm_buf);
  (void)std::snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                      tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                      static_cast<int>(tv.tv_usec / 1000));
#else
  (void)std::snprintf(buf, size, "-");
#endif
}

}  // namespace detail

// ============================================================================
// Level control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LevelStorage().store(static_cast<uint8_t>(level),
                               std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::LevelStorage().load(std::memory_order_relaxed));
}

/// Parses "debug", "info", "warn", "error", "fatal" or "off" (case-insensitive).
inline optional<Level> ParseLevel(const char* name) noexcept {
  if (name == nullptr) return {};
  static constexpr const char* kNames[] = {"debug", "info", "warn",
                                           "error", "fatal", "off"};
  for (uint8_t i = 0; i < 6U; ++i) {
    const char* a = name;
    const char* b = kNames[i];
    while (*a != '\0' && *b != '\0') {
      char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
      if (la != *b) break;
      ++a;
      ++b;
    }
    if (*a == '\0' && *b == '\0') return optional<Level>(static_cast<Level>(i));
  }
  return {};
}

// ============================================================================
// Lifecycle
// ============================================================================

/// Marks the logger as initialized. Logging works without Init(); the flag
/// only lets applications assert their startup order.
inline void Init(Level level = GetLevel()) noexcept {
  SetLevel(level);
  detail::InitFlag().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  std::lock_guard<std::mutex> lk(detail::WriteMutex());
  (void)std::fflush(stderr);
  detail::InitFlag().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitFlag().load(std::memory_order_acquire);
}

// ============================================================================
// LogWrite
// ============================================================================

/**
 * @brief Format and write one log line to stderr.
 *
 * Messages longer than the internal buffer are truncated. FATAL flushes and
 * aborts after writing.
 */
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char msg[512];
  va_list args;
  va_start(args, fmt);
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  va_end(args);

  char ts[32];
  detail::FormatWallClock(ts, sizeof(ts));

  {
    std::lock_guard<std::mutex> lk(detail::WriteMutex());
    (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                       detail::LevelTag(level),
                       (category != nullptr) ? category : "-", msg,
                       detail::Basename(file), line);
  }

  if (level == Level::kFatal) {
    (void)std::fflush(stderr);
    std::abort();
  }
}

}  // namespace log
}  // namespace seatlink

// ============================================================================
// Macros
// ============================================================================

#if SEATLINK_LOG_MIN_LEVEL <= 0
#define SEATLINK_LOG_DEBUG(cat, fmt, ...)                                      \
  ::seatlink::log::LogWrite(::seatlink::log::Level::kDebug, cat, __FILE__,     \
                            __LINE__, fmt, ##__VA_ARGS__)
#else
#define SEATLINK_LOG_DEBUG(cat, fmt, ...) ((void)0)
#endif

#if SEATLINK_LOG_MIN_LEVEL <= 1
#define SEATLINK_LOG_INFO(cat, fmt, ...)                                       \
  ::seatlink::log::LogWrite(::seatlink::log::Level::kInfo, cat, __FILE__,      \
                            __LINE__, fmt, ##__VA_ARGS__)
#else
#define SEATLINK_LOG_INFO(cat, fmt, ...) ((void)0)
#endif

#if SEATLINK_LOG_MIN_LEVEL <= 2
#define SEATLINK_LOG_WARN(cat, fmt, ...)                                       \
  ::seatlink::log::LogWrite(::seatlink::log::Level::kWarn, cat, __FILE__,      \
                            __LINE__, fmt, ##__VA_ARGS__)
#else
#define SEATLINK_LOG_WARN(cat, fmt, ...) ((void)0)
#endif

#if SEATLINK_LOG_MIN_LEVEL <= 3
#define SEATLINK_LOG_ERROR(cat, fmt, ...)                                      \
  ::seatlink::log::LogWrite(::seatlink::log::Level::kError, cat, __FILE__,     \
                            __LINE__, fmt, ##__VA_ARGS__)
#else
#define SEATLINK_LOG_ERROR(cat, fmt, ...) ((void)0)
#endif

#define SEATLINK_LOG_FATAL(cat, fmt, ...)                                      \
  ::seatlink::log::LogWrite(::seatlink::log::Level::kFatal, cat, __FILE__,     \
                            __LINE__, fmt, ##__VA_ARGS__)

#endif  // SEATLINK_LOG_HPP_
