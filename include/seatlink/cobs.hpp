/**
 * @file cobs.hpp
 * @brief Consistent Overhead Byte Stuffing (COBS) codec for the zero-delimited
 *        link framing.
 *
 * Encoded output never contains 0x00 except the single trailing delimiter.
 * Each block starts with a code byte equal to (run length + 1). A code of
 * 0xFF marks a full 254-byte run that is NOT followed by an implicit zero.
 *
 * @code
 *   ByteBuffer wire = seatlink::CobsEncode(frame_bytes);
 *   auto plain = seatlink::CobsDecode(wire);
 *   if (!plain.has_value()) { ... discard packet ... }
 * @endcode
 */

#ifndef SEATLINK_COBS_HPP_
#define SEATLINK_COBS_HPP_

#include "seatlink/platform.hpp"
#include "seatlink/vocabulary.hpp"

#include <cstdint>

namespace seatlink {

static constexpr uint8_t kCobsDelimiter = 0x00U;
static constexpr uint8_t kCobsMaxCode = 0xFFU;

// ============================================================================
// Encode
// ============================================================================

/**
 * @brief Stuff @p size bytes into a zero-free block sequence plus delimiter.
 *
 * Output size is at most size + size/254 + 2. Empty input yields {0x01, 0x00}.
 */
inline ByteBuffer CobsEncode(const uint8_t* data, uint32_t size) {
  SEATLINK_ASSERT(data != nullptr || size == 0U);
  ByteBuffer out;
  out.reserve(static_cast<size_t>(size) + size / 254U + 2U);

  size_t code_index = 0;
  uint8_t code = 1;
  out.push_back(0);  // placeholder for the first code byte

  for (uint32_t i = 0; i < size; ++i) {
    const uint8_t byte = data[i];
    if (byte == kCobsDelimiter) {
      out[code_index] = code;
      code_index = out.size();
      out.push_back(0);
      code = 1;
      continue;
    }
    out.push_back(byte);
    ++code;
    if (code == kCobsMaxCode) {
      out[code_index] = code;
      code_index = out.size();
      out.push_back(0);
      code = 1;
    }
  }

  out[code_index] = code;
  out.push_back(kCobsDelimiter);
  return out;
}

inline ByteBuffer CobsEncode(const ByteBuffer& data) {
  return CobsEncode(data.data(), static_cast<uint32_t>(data.size()));
}

// ============================================================================
// Decode
// ============================================================================

/**
 * @brief Reverse CobsEncode().
 *
 * The input must be exactly one encoded packet ending in the delimiter.
 * Failures:
 *   - kEmptyInput:          size == 0
 *   - kMissingDelimiter:    last byte is not 0x00
 *   - kUnexpectedDelimiter: a 0x00 appears before the last byte
 *   - kTruncatedBlock:      a code byte promises more bytes than remain
 */
inline expected<ByteBuffer, CodecError> CobsDecode(const uint8_t* data,
                                                   uint32_t size) {
  using Result = expected<ByteBuffer, CodecError>;
  if (size == 0U) {
    return Result::error(CodecError::kEmptyInput);
  }
  SEATLINK_ASSERT(data != nullptr);
  if (data[size - 1U] != kCobsDelimiter) {
    return Result::error(CodecError::kMissingDelimiter);
  }

  const uint32_t body = size - 1U;
  ByteBuffer out;
  out.reserve(body);

  uint32_t i = 0;
  while (i < body) {
    const uint8_t code = data[i++];
    if (code == kCobsDelimiter) {
      return Result::error(CodecError::kUnexpectedDelimiter);
    }
    const uint32_t run = static_cast<uint32_t>(code) - 1U;
    if (run > body - i) {
      return Result::error(CodecError::kTruncatedBlock);
    }
    for (uint32_t j = 0; j < run; ++j) {
      const uint8_t byte = data[i + j];
      if (byte == kCobsDelimiter) {
        return Result::error(CodecError::kUnexpectedDelimiter);
      }
      out.push_back(byte);
    }
    i += run;
    // The implicit zero closes every short block except the last one.
    if (code < kCobsMaxCode && i < body) {
      out.push_back(0);
    }
  }
  return Result::success(std::move(out));
}

inline expected<ByteBuffer, CodecError> CobsDecode(const ByteBuffer& data) {
  return CobsDecode(data.data(), static_cast<uint32_t>(data.size()));
}

}  // namespace seatlink

#endif  // SEATLINK_COBS_HPP_
