/**
 * @file correlator.hpp
 * @brief Single-outstanding-request correlation over the link, plus the
 *        abstract transport it writes through.
 *
 * Sequence of SendAndWait():
 *   1. clear the response slot and completion flag, mark a request in flight
 *   2. write every packet through LinkTransport (slot lock NOT held, so a
 *      synchronous transport may deliver the response from inside Write())
 *   3. wait until Deliver() signals or the timeout elapses
 *
 * A timeout is a normal outcome: SendAndWait() succeeds with an empty
 * optional. Only transport failures are errors. If several messages are
 * delivered before the waiter wakes, the last one wins.
 *
 * Concurrent SendAndWait() callers are serialized by an internal request
 * mutex, so each caller observes only responses delivered during its own
 * request.
 */

#ifndef SEATLINK_CORRELATOR_HPP_
#define SEATLINK_CORRELATOR_HPP_

#include "seatlink/log.hpp"
#include "seatlink/platform.hpp"
#include "seatlink/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <vector>

namespace seatlink {

// ============================================================================
// LinkTransport - downward boundary
// ============================================================================

/**
 * @brief Byte transport implemented outside this library (e.g. a GATT
 *        characteristic). Inbound data is pushed by the implementation into
 *        AquaCleanClient::OnNotification(), one call per notification.
 */
class LinkTransport {
 public:
  virtual ~LinkTransport() = default;

  /// Write one stuffed packet. Must not block for longer than the link needs.
  virtual expected<void, TransportError> Write(const uint8_t* data,
                                               uint32_t size) noexcept = 0;

  virtual bool IsConnected() const noexcept = 0;
};

inline LinkError ToLinkError(TransportError e) noexcept {
  return (e == TransportError::kNotConnected) ? LinkError::kNotConnected
                                              : LinkError::kWriteFailed;
}

// ============================================================================
// TransactionCorrelator
// ============================================================================

struct CorrelatorStats {
  uint64_t requests = 0;
  uint64_t responses = 0;
  uint64_t timeouts = 0;
  uint64_t write_failures = 0;
  uint64_t unsolicited = 0;  ///< delivered while no request was in flight
  uint64_t overwritten = 0;  ///< replaced in the slot before being consumed
};

class TransactionCorrelator final {
 public:
  using Result = expected<optional<ByteBuffer>, LinkError>;

  explicit TransactionCorrelator(LinkTransport& transport) noexcept
      : transport_(transport) {}

  TransactionCorrelator(const TransactionCorrelator&) = delete;
  TransactionCorrelator& operator=(const TransactionCorrelator&) = delete;
  TransactionCorrelator(TransactionCorrelator&&) = delete;
  TransactionCorrelator& operator=(TransactionCorrelator&&) = delete;

  /**
   * @brief Write all @p packets in order, then wait for one response.
   * @param timeout_ms Maximum wait after the last write.
   * @return Response bytes, an empty optional on timeout, or
   *         kNotConnected / kWriteFailed from the transport.
   */
  Result SendAndWait(const std::vector<ByteBuffer>& packets,
                     uint32_t timeout_ms) {
    std::lock_guard<std::mutex> request_lock(request_mtx_);

    {
      std::lock_guard<std::mutex> lk(mtx_);
      slot_.reset();
      signaled_ = false;
      in_flight_ = true;
      ++stats_.requests;
    }

    if (!transport_.IsConnected()) {
      Finish();
      return Result::error(LinkError::kNotConnected);
    }

    for (const ByteBuffer& pkt : packets) {
      auto w = transport_.Write(pkt.data(), static_cast<uint32_t>(pkt.size()));
      if (!w.has_value()) {
        {
          std::lock_guard<std::mutex> lk(mtx_);
          ++stats_.write_failures;
        }
        Finish();
        SEATLINK_LOG_ERROR("Correlator", "transport write of %u bytes failed",
                           static_cast<unsigned>(pkt.size()));
        return Result::error(ToLinkError(w.get_error()));
      }
    }

    std::unique_lock<std::mutex> lk(mtx_);
    const bool got = cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                                  [this] { return signaled_; });
    in_flight_ = false;
    if (!got) {
      ++stats_.timeouts;
      lk.unlock();
      SEATLINK_LOG_INFO("Correlator", "no response within %u ms",
                        static_cast<unsigned>(timeout_ms));
      return Result::success(optional<ByteBuffer>());
    }

    ++stats_.responses;
    optional<ByteBuffer> out(std::move(slot_.value()));
    slot_.reset();
    signaled_ = false;
    return Result::success(std::move(out));
  }

  Result SendAndWait(const ByteBuffer& packet, uint32_t timeout_ms) {
    return SendAndWait(std::vector<ByteBuffer>{packet}, timeout_ms);
  }

  /**
   * @brief Hand a completed inbound message to the waiting request.
   *
   * Called from the notification path. Messages arriving while no request
   * is in flight are dropped.
   */
  void Deliver(ByteBuffer message) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (!in_flight_) {
        ++stats_.unsolicited;
        SEATLINK_LOG_DEBUG("Correlator",
                           "dropping %u-byte message, no request in flight",
                           static_cast<unsigned>(message.size()));
        return;
      }
      if (slot_.has_value()) ++stats_.overwritten;
      slot_ = optional<ByteBuffer>(std::move(message));
      signaled_ = true;
    }
    cv_.notify_one();
  }

  bool InFlight() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return in_flight_;
  }

  CorrelatorStats Stats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return stats_;
  }

 private:
  void Finish() {
    std::lock_guard<std::mutex> lk(mtx_);
    in_flight_ = false;
    slot_.reset();
    signaled_ = false;
  }

  LinkTransport& transport_;
  std::mutex request_mtx_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  optional<ByteBuffer> slot_;
  bool signaled_ = false;
  bool in_flight_ = false;
  CorrelatorStats stats_;
};

}  // namespace seatlink

#endif  // SEATLINK_CORRELATOR_HPP_
