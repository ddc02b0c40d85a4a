/**
 * @file frame.hpp
 * @brief Link-level frame: one header byte plus payload, and outbound
 *        fragmentation into link-sized frames.
 *
 * Header byte (MSB first):
 *
 *   | 7 6 5 |  4  | 3 2 1 |  0   |
 *   | kind  | tag | trans | flag |
 *
 * Single and FlowControl frames carry the payload right after the header.
 * Consecutive frames insert an explicit length byte before the payload.
 */

#ifndef SEATLINK_FRAME_HPP_
#define SEATLINK_FRAME_HPP_

#include "seatlink/platform.hpp"
#include "seatlink/vocabulary.hpp"

#include <cstdint>
#include <vector>

namespace seatlink {

enum class FrameKind : uint8_t {
  kSingle = 0,
  kConsecutive = 2,
  kFlowControl = 3,
};

inline const char* ToString(FrameKind kind) noexcept {
  switch (kind) {
    case FrameKind::kSingle:
      return "Single";
    case FrameKind::kConsecutive:
      return "Consecutive";
    case FrameKind::kFlowControl:
      return "FlowControl";
    default:
      return "Unknown";
  }
}

static constexpr uint8_t kMaxTransaction = 7U;
static constexpr uint32_t kMaxConsecutivePayload = 255U;
/// One Consecutive fragment per transaction number.
static constexpr uint32_t kMaxFragments = kMaxTransaction + 1U;

// ============================================================================
// Frame
// ============================================================================

struct Frame {
  FrameKind kind = FrameKind::kSingle;
  bool has_tag = false;
  uint8_t transaction = 0;  ///< 0..7
  uint8_t flag = 0;         ///< 0 or 1
  ByteBuffer payload;

  /// Header byte. Fields are masked; use ToBytes() for validated output.
  uint8_t Header() const noexcept {
    return static_cast<uint8_t>(
        ((static_cast<uint8_t>(kind) & 0x07U) << 5) |
        ((has_tag ? 1U : 0U) << 4) | ((transaction & 0x07U) << 1) |
        (flag & 0x01U));
  }

  /**
   * @brief Serialize header (+ length byte for Consecutive) and payload.
   * @return kInvalidField if transaction > 7 or flag > 1,
   *         kPayloadTooLarge if a Consecutive payload exceeds 255 bytes.
   */
  expected<ByteBuffer, FrameError> ToBytes() const {
    using Result = expected<ByteBuffer, FrameError>;
    if (transaction > kMaxTransaction || flag > 1U) {
      return Result::error(FrameError::kInvalidField);
    }
    ByteBuffer out;
    out.reserve(payload.size() + 2U);
    out.push_back(Header());
    if (kind == FrameKind::kConsecutive) {
      if (payload.size() > kMaxConsecutivePayload) {
        return Result::error(FrameError::kPayloadTooLarge);
      }
      out.push_back(static_cast<uint8_t>(payload.size()));
    }
    out.insert(out.end(), payload.begin(), payload.end());
    return Result::success(std::move(out));
  }

  /**
   * @brief Parse one unstuffed frame.
   *
   * Bytes past a Consecutive frame's declared length are ignored. A declared
   * length larger than the remaining data fails with kTruncated.
   */
  static expected<Frame, FrameError> FromBytes(const uint8_t* data,
                                               uint32_t size) {
    using Result = expected<Frame, FrameError>;
    if (size == 0U) {
      return Result::error(FrameError::kEmpty);
    }
    SEATLINK_ASSERT(data != nullptr);

    const uint8_t header = data[0];
    const uint8_t raw_kind = static_cast<uint8_t>((header >> 5) & 0x07U);
    if (raw_kind != static_cast<uint8_t>(FrameKind::kSingle) &&
        raw_kind != static_cast<uint8_t>(FrameKind::kConsecutive) &&
        raw_kind != static_cast<uint8_t>(FrameKind::kFlowControl)) {
      return Result::error(FrameError::kUnknownKind);
    }

    Frame f;
    f.kind = static_cast<FrameKind>(raw_kind);
    f.has_tag = ((header >> 4) & 0x01U) != 0U;
    f.transaction = static_cast<uint8_t>((header >> 1) & 0x07U);
    f.flag = static_cast<uint8_t>(header & 0x01U);

    if (f.kind == FrameKind::kConsecutive) {
      if (size < 2U) {
        return Result::error(FrameError::kTruncated);
      }
      const uint32_t count = data[1];
      if (count > size - 2U) {
        return Result::error(FrameError::kTruncated);
      }
      f.payload.assign(data + 2, data + 2 + count);
    } else {
      f.payload.assign(data + 1, data + size);
    }
    return Result::success(std::move(f));
  }

  static expected<Frame, FrameError> FromBytes(const ByteBuffer& data) {
    return FromBytes(data.data(), static_cast<uint32_t>(data.size()));
  }
};

inline bool operator==(const Frame& a, const Frame& b) noexcept {
  return a.kind == b.kind && a.has_tag == b.has_tag &&
         a.transaction == b.transaction && a.flag == b.flag &&
         a.payload == b.payload;
}

inline bool operator!=(const Frame& a, const Frame& b) noexcept {
  return !(a == b);
}

// ============================================================================
// Fragment
// ============================================================================

/**
 * @brief Split an application message into frames that fit the link MTU.
 *
 * If header + payload fits in @p max_frame_size the result is one Single
 * frame. Otherwise the payload is cut into Consecutive frames carrying at
 * most (max_frame_size - 2) bytes each, numbered 0, 1, ... 7, with
 * flag = 1 on the last fragment only.
 *
 * @return kInvalidField if max_frame_size < 3 (no room for payload),
 *         kPayloadTooLarge if more than kMaxFragments would be needed.
 */
inline expected<std::vector<Frame>, FrameError> Fragment(
    const ByteBuffer& payload, uint32_t max_frame_size, bool has_tag) {
  using Result = expected<std::vector<Frame>, FrameError>;
  if (max_frame_size < 3U) {
    return Result::error(FrameError::kInvalidField);
  }

  std::vector<Frame> frames;
  if (payload.size() + 1U <= max_frame_size) {
    Frame f;
    f.kind = FrameKind::kSingle;
    f.has_tag = has_tag;
    f.payload = payload;
    frames.push_back(std::move(f));
    return Result::success(std::move(frames));
  }

  uint32_t chunk = max_frame_size - 2U;
  if (chunk > kMaxConsecutivePayload) chunk = kMaxConsecutivePayload;

  const size_t total = payload.size();
  if ((total + chunk - 1U) / chunk > kMaxFragments) {
    return Result::error(FrameError::kPayloadTooLarge);
  }

  size_t offset = 0;
  uint32_t seq = 0;
  while (offset < total) {
    size_t n = total - offset;
    if (n > chunk) n = chunk;
    Frame f;
    f.kind = FrameKind::kConsecutive;
    f.has_tag = has_tag;
    f.transaction = static_cast<uint8_t>(seq);
    f.flag = (offset + n == total) ? 1U : 0U;
    f.payload.assign(payload.begin() + static_cast<std::ptrdiff_t>(offset),
                     payload.begin() + static_cast<std::ptrdiff_t>(offset + n));
    frames.push_back(std::move(f));
    offset += n;
    ++seq;
  }
  return Result::success(std::move(frames));
}

}  // namespace seatlink

#endif  // SEATLINK_FRAME_HPP_
