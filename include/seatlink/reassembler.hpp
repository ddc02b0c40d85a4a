/**
 * @file reassembler.hpp
 * @brief Turns a stream of parsed link frames into complete application
 *        messages, delivered through a bounded FIFO.
 *
 * State per frame kind:
 *   - Single:       payload is a complete message, no state retained.
 *   - Consecutive:  idle <-> accumulating; assembly order is ascending
 *                   transaction number.
 *   - FlowControl:  link-level acknowledgment, counted and dropped.
 *
 * When a Consecutive fragment is assembled depends on ReassemblyPolicy:
 *   - kImmediate:  every Consecutive frame triggers assembly of whatever is
 *                  pending (there is no end-of-message check).
 *   - kFinalFlag:  fragments accumulate until one arrives with flag = 1.
 *                  A repeated transaction number abandons the pending list
 *                  (the previous message lost its final fragment).
 *
 * Not thread-safe; the owner serializes AddFrame()/GetCompleteMessage().
 */

#ifndef SEATLINK_REASSEMBLER_HPP_
#define SEATLINK_REASSEMBLER_HPP_

#include "seatlink/frame.hpp"
#include "seatlink/log.hpp"
#include "seatlink/platform.hpp"
#include "seatlink/vocabulary.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <vector>

namespace seatlink {

enum class ReassemblyPolicy : uint8_t {
  kImmediate = 0,
  kFinalFlag = 1,
};

static constexpr uint32_t kDefaultMaxCompletedMessages = 16U;

struct ReassemblerStats {
  uint64_t frames_received = 0;
  uint64_t single_frames = 0;
  uint64_t consecutive_frames = 0;
  uint64_t flow_control_frames = 0;
  uint64_t messages_completed = 0;
  uint64_t messages_dropped = 0;     ///< FIFO overflow, oldest evicted
  uint64_t messages_discarded = 0;   ///< pending list abandoned
  uint64_t fragments_discarded = 0;
};

class FrameReassembler {
 public:
  explicit FrameReassembler(
      ReassemblyPolicy policy = ReassemblyPolicy::kImmediate,
      uint32_t max_completed = kDefaultMaxCompletedMessages)
      : policy_(policy),
        max_completed_(max_completed == 0U ? 1U : max_completed) {}

  /**
   * @brief Feed one parsed frame.
   * @return true if a complete message was enqueued by this frame.
   */
  bool AddFrame(const Frame& frame) {
    ++stats_.frames_received;
    switch (frame.kind) {
      case FrameKind::kSingle:
        ++stats_.single_frames;
        Enqueue(ByteBuffer(frame.payload));
        return true;
      case FrameKind::kConsecutive:
        ++stats_.consecutive_frames;
        return AddConsecutive(frame);
      case FrameKind::kFlowControl:
        ++stats_.flow_control_frames;
        return false;
      default:
        return false;
    }
  }

  /// Pops the oldest completed message.
  optional<ByteBuffer> GetCompleteMessage() {
    if (completed_.empty()) return {};
    ByteBuffer msg = std::move(completed_.front());
    completed_.pop_front();
    return optional<ByteBuffer>(std::move(msg));
  }

  /// Drops pending fragments and completed messages. Stats are kept.
  void Reset() noexcept {
    pending_.clear();
    completed_.clear();
  }

  void ResetStats() noexcept { stats_ = ReassemblerStats{}; }

  uint32_t PendingFragments() const noexcept {
    return static_cast<uint32_t>(pending_.size());
  }
  uint32_t CompletedCount() const noexcept {
    return static_cast<uint32_t>(completed_.size());
  }
  ReassemblyPolicy Policy() const noexcept { return policy_; }
  const ReassemblerStats& Stats() const noexcept { return stats_; }

 private:
  bool AddConsecutive(const Frame& frame) {
    // A transaction number already pending means the previous message lost
    // its final fragment and this one starts a new message.
    if (policy_ == ReassemblyPolicy::kFinalFlag &&
        IsPending(frame.transaction)) {
      SEATLINK_LOG_WARN("Reassembler",
                        "transaction %u repeated, discarding %u stale fragments",
                        static_cast<unsigned>(frame.transaction),
                        static_cast<unsigned>(pending_.size()));
      DiscardPending();
    }
    pending_.push_back(frame);

    if (policy_ == ReassemblyPolicy::kFinalFlag && frame.flag == 0U) {
      return false;
    }
    Assemble();
    return true;
  }

  bool IsPending(uint8_t transaction) const noexcept {
    for (const Frame& f : pending_) {
      if (f.transaction == transaction) return true;
    }
    return false;
  }

  void DiscardPending() noexcept {
    stats_.fragments_discarded += pending_.size();
    ++stats_.messages_discarded;
    pending_.clear();
  }

  void Assemble() {
    std::stable_sort(pending_.begin(), pending_.end(),
                     [](const Frame& a, const Frame& b) {
                       return a.transaction < b.transaction;
                     });
    ByteBuffer msg;
    for (const Frame& f : pending_) {
      msg.insert(msg.end(), f.payload.begin(), f.payload.end());
    }
    SEATLINK_LOG_DEBUG("Reassembler", "assembled %u bytes from %u fragments",
                       static_cast<unsigned>(msg.size()),
                       static_cast<unsigned>(pending_.size()));
    pending_.clear();
    Enqueue(std::move(msg));
  }

  void Enqueue(ByteBuffer&& msg) {
    if (completed_.size() >= max_completed_) {
      completed_.pop_front();
      ++stats_.messages_dropped;
      SEATLINK_LOG_WARN("Reassembler",
                        "completed queue full (%u), dropped oldest message",
                        max_completed_);
    }
    completed_.push_back(std::move(msg));
    ++stats_.messages_completed;
  }

  ReassemblyPolicy policy_;
  uint32_t max_completed_;
  std::vector<Frame> pending_;  // Consecutive frames since last completion
  std::deque<ByteBuffer> completed_;
  ReassemblerStats stats_;
};

}  // namespace seatlink

#endif  // SEATLINK_REASSEMBLER_HPP_
