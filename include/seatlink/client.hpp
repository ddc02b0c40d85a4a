/**
 * @file client.hpp
 * @brief AquaCleanClient: the request/response facade over one link.
 *
 * Outbound: Serializer builds a Frame -> fragmented to the link MTU if
 * needed -> COBS -> LinkTransport::Write() -> TransactionCorrelator waits.
 *
 * Inbound: the transport calls OnNotification() once per notification ->
 * COBS decode -> Frame::FromBytes -> FrameReassembler -> every completed
 * message is delivered to the correlator.
 *
 * Every request returns expected<..., LinkError>. A missing response is a
 * successful call with an empty optional (or `false` for acknowledgments);
 * callers use it for command confirmation and for feature probing.
 *
 * Thread model: requests may be issued from any thread and are serialized.
 * OnNotification() may run on the transport's thread concurrently with a
 * waiting request.
 */

#ifndef SEATLINK_CLIENT_HPP_
#define SEATLINK_CLIENT_HPP_

#include "seatlink/catalogue.hpp"
#include "seatlink/cobs.hpp"
#include "seatlink/config.hpp"
#include "seatlink/correlator.hpp"
#include "seatlink/device_state.hpp"
#include "seatlink/frame.hpp"
#include "seatlink/log.hpp"
#include "seatlink/reassembler.hpp"
#include "seatlink/serializer.hpp"
#include "seatlink/vocabulary.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace seatlink {

static constexpr int32_t kMinWaterTemperature = 34;
static constexpr int32_t kMaxWaterTemperature = 40;
static constexpr int32_t kMinSprayLevel = 1;
static constexpr int32_t kMaxSprayLevel = 5;
static constexpr int32_t kMinBrightness = 0;
static constexpr int32_t kMaxBrightness = 100;

struct RxStats {
  uint64_t notifications = 0;
  uint64_t codec_errors = 0;
  uint64_t frame_errors = 0;
  uint64_t messages_delivered = 0;
};

class AquaCleanClient final {
 public:
  explicit AquaCleanClient(LinkTransport& transport,
                           const ClientConfig& cfg = ClientConfig{})
      : cfg_(cfg),
        layout_(FindStatusLayout(cfg.status_layout)),
        correlator_(transport),
        reassembler_(cfg.reassembly, cfg.max_completed_messages) {
    if (layout_ == nullptr) {
      SEATLINK_LOG_WARN("Client", "status layout %u unknown, using v1",
                        static_cast<unsigned>(cfg.status_layout));
      layout_ = &kStatusLayoutV1;
    }
  }

  AquaCleanClient(const AquaCleanClient&) = delete;
  AquaCleanClient& operator=(const AquaCleanClient&) = delete;

  // ==========================================================================
  // Requests
  // ==========================================================================

  expected<optional<DeviceIdentification>, LinkError>
  RequestDeviceIdentification() {
    using Result = expected<optional<DeviceIdentification>, LinkError>;
    auto r = Transact(BuildDeviceInfoRequest(), cfg_.response_timeout_ms);
    if (!r.has_value()) return Result::error(r.get_error());
    if (!r.value().has_value()) {
      SEATLINK_LOG_WARN("Client", "no response to device identification");
      return Result::success(optional<DeviceIdentification>());
    }
    DeviceIdentification id = ParseDeviceIdentification(r.value().value());
    SEATLINK_LOG_INFO("Client", "device: %s (S/N: %s, SAP: %s, %s)",
                      id.description.c_str(), id.serial_number.c_str(),
                      id.sap_number.c_str(), id.firmware_version.c_str());
    return Result::success(optional<DeviceIdentification>(std::move(id)));
  }

  /// On a response, replaces the confirmed state and drops tentative values.
  expected<optional<SystemParameters>, LinkError> RequestSystemParameters() {
    using Result = expected<optional<SystemParameters>, LinkError>;
    auto r = Transact(BuildSystemStatusRequest(), cfg_.response_timeout_ms);
    if (!r.has_value()) return Result::error(r.get_error());
    if (!r.value().has_value()) {
      SEATLINK_LOG_WARN("Client", "no response to system parameter request");
      return Result::success(optional<SystemParameters>());
    }
    SystemParameters params = ParseSystemParameters(r.value().value(), *layout_);
    {
      std::lock_guard<std::mutex> lk(state_mtx_);
      state_.ApplyConfirmed(params);
    }
    SEATLINK_LOG_DEBUG("Client",
                       "status: sitting=%d anal=%d lady=%d dryer=%d descale=%d",
                       params.user_is_sitting, params.anal_shower_running,
                       params.lady_shower_running, params.dryer_running,
                       params.descaling_needed);
    return Result::success(optional<SystemParameters>(params));
  }

  /**
   * @brief Send a high-level command.
   * @return true if any response arrived. Toggle commands then record a
   *         tentative state change.
   */
  expected<bool, LinkError> SendCommand(HighLevelCommand cmd) {
    auto ack = SendCommand(static_cast<uint16_t>(cmd));
    if (ack.has_value() && ack.value()) {
      std::lock_guard<std::mutex> lk(state_mtx_);
      (void)state_.RecordCommand(cmd);
    }
    return ack;
  }

  expected<bool, LinkError> SendCommand(uint16_t command_id) {
    auto r = Transact(BuildCommand(command_id), cfg_.response_timeout_ms);
    if (!r.has_value()) return expected<bool, LinkError>::error(r.get_error());
    const bool acked = r.value().has_value();
    if (!acked) {
      SEATLINK_LOG_WARN("Client", "command %u (%s) not acknowledged",
                        static_cast<unsigned>(command_id),
                        FindCommand(command_id) != nullptr
                            ? FindCommand(command_id)->name
                            : "uncatalogued");
    }
    return expected<bool, LinkError>::success(acked);
  }

  /// Raw value bytes of a data point, empty on timeout.
  expected<optional<ByteBuffer>, LinkError> ReadDataPoint(uint16_t dp_id) {
    return ReadDataPoint(dp_id, cfg_.response_timeout_ms);
  }

  expected<optional<ByteBuffer>, LinkError> ReadDataPoint(DataPointId id) {
    return ReadDataPoint(static_cast<uint16_t>(id));
  }

  /**
   * @brief Write raw value bytes to a data point.
   * @return kAccessDenied for catalogued read-only ids, kInvalidArgument for
   *         an empty value, otherwise whether the write was acknowledged.
   */
  expected<bool, LinkError> WriteDataPoint(uint16_t dp_id,
                                           const ByteBuffer& value) {
    using Result = expected<bool, LinkError>;
    if (value.empty()) return Result::error(LinkError::kInvalidArgument);
    const DataPointInfo* info = FindDataPoint(dp_id);
    if (info != nullptr && !info->IsWritable()) {
      SEATLINK_LOG_WARN("Client", "refusing write to read-only data point %s",
                        info->name);
      return Result::error(LinkError::kAccessDenied);
    }
    auto r = Transact(BuildDataPointWrite(dp_id, value),
                      cfg_.response_timeout_ms);
    if (!r.has_value()) return Result::error(r.get_error());
    return Result::success(r.value().has_value());
  }

  expected<bool, LinkError> WriteDataPoint(DataPointId id,
                                           const ByteBuffer& value) {
    return WriteDataPoint(static_cast<uint16_t>(id), value);
  }

  // ==========================================================================
  // Feature discovery
  // ==========================================================================

  /// true if the device answers a read of @p dp_id within @p timeout_ms.
  expected<bool, LinkError> ProbeDataPoint(uint16_t dp_id, uint32_t timeout_ms) {
    auto r = ReadDataPoint(dp_id, timeout_ms);
    if (!r.has_value()) return expected<bool, LinkError>::error(r.get_error());
    return expected<bool, LinkError>::success(r.value().has_value());
  }

  expected<bool, LinkError> ProbeDataPoint(uint16_t dp_id) {
    return ProbeDataPoint(dp_id, cfg_.response_timeout_ms);
  }

  /**
   * @brief Probe several data points, one request at a time.
   * @return Ids that answered, in probe order. Stops at the first transport
   *         error.
   */
  expected<std::vector<uint16_t>, LinkError> ProbeFeatures(
      const std::vector<uint16_t>& ids, uint32_t timeout_ms) {
    using Result = expected<std::vector<uint16_t>, LinkError>;
    std::vector<uint16_t> supported;
    for (uint16_t id : ids) {
      auto r = ProbeDataPoint(id, timeout_ms);
      if (!r.has_value()) return Result::error(r.get_error());
      if (r.value()) supported.push_back(id);
    }
    SEATLINK_LOG_INFO("Client", "%u of %u probed data points supported",
                      static_cast<unsigned>(supported.size()),
                      static_cast<unsigned>(ids.size()));
    return Result::success(std::move(supported));
  }

  // ==========================================================================
  // Range-checked setters
  // ==========================================================================

  expected<bool, LinkError> SetWaterTemperature(int32_t celsius) {
    return WriteRanged(DataPointId::kSetActiveShowerWaterTemperature, celsius,
                       kMinWaterTemperature, kMaxWaterTemperature);
  }

  expected<bool, LinkError> SetSprayIntensity(int32_t level) {
    return WriteRanged(DataPointId::kSetActiveAnalSprayIntensity, level,
                       kMinSprayLevel, kMaxSprayLevel);
  }

  expected<bool, LinkError> SetSprayArmPosition(int32_t position) {
    return WriteRanged(DataPointId::kSetActiveAnalSprayArmPosition, position,
                       kMinSprayLevel, kMaxSprayLevel);
  }

  expected<bool, LinkError> SetLightingBrightness(int32_t percent) {
    return WriteRanged(DataPointId::kLightingSetBrightness, percent,
                       kMinBrightness, kMaxBrightness);
  }

  // ==========================================================================
  // Inbound
  // ==========================================================================

  /**
   * @brief Entry point for one raw inbound notification.
   *
   * Malformed packets are logged and discarded without touching reassembly
   * state.
   */
  void OnNotification(const uint8_t* data, uint32_t size) {
    std::lock_guard<std::mutex> lk(rx_mtx_);
    ++rx_stats_.notifications;
    SEATLINK_LOG_DEBUG("Client", "notification of %u bytes",
                       static_cast<unsigned>(size));

    auto decoded = CobsDecode(data, size);
    if (!decoded.has_value()) {
      ++rx_stats_.codec_errors;
      SEATLINK_LOG_WARN("Client", "discarding packet: %s",
                        ToString(decoded.get_error()));
      return;
    }

    auto frame = Frame::FromBytes(decoded.value());
    if (!frame.has_value()) {
      ++rx_stats_.frame_errors;
      SEATLINK_LOG_WARN("Client", "discarding frame: %s",
                        ToString(frame.get_error()));
      return;
    }

    (void)reassembler_.AddFrame(frame.value());
    for (auto msg = reassembler_.GetCompleteMessage(); msg.has_value();
         msg = reassembler_.GetCompleteMessage()) {
      ++rx_stats_.messages_delivered;
      correlator_.Deliver(std::move(msg.value()));
    }
  }

  void OnNotification(const ByteBuffer& data) {
    OnNotification(data.data(), static_cast<uint32_t>(data.size()));
  }

  // ==========================================================================
  // State and diagnostics
  // ==========================================================================

  /// Confirmed state with tentative values overlaid.
  SystemParameters EffectiveState() const {
    std::lock_guard<std::mutex> lk(state_mtx_);
    return state_.Effective();
  }

  SystemParameters ConfirmedState() const {
    std::lock_guard<std::mutex> lk(state_mtx_);
    return state_.Confirmed();
  }

  bool HasTentativeState() const {
    std::lock_guard<std::mutex> lk(state_mtx_);
    return state_.HasTentative();
  }

  RxStats GetRxStats() const {
    std::lock_guard<std::mutex> lk(rx_mtx_);
    return rx_stats_;
  }

  ReassemblerStats GetReassemblerStats() const {
    std::lock_guard<std::mutex> lk(rx_mtx_);
    return reassembler_.Stats();
  }

  /// Consecutive fragments received but not yet assembled.
  uint32_t PendingFragments() const {
    std::lock_guard<std::mutex> lk(rx_mtx_);
    return reassembler_.PendingFragments();
  }

  CorrelatorStats GetCorrelatorStats() const { return correlator_.Stats(); }

  const ClientConfig& GetConfig() const noexcept { return cfg_; }

 private:
  expected<optional<ByteBuffer>, LinkError> ReadDataPoint(uint16_t dp_id,
                                                          uint32_t timeout_ms) {
    return Transact(BuildDataPointRead(dp_id), timeout_ms);
  }

  expected<bool, LinkError> WriteRanged(DataPointId id, int32_t value,
                                        int32_t lo, int32_t hi) {
    if (value < lo || value > hi) {
      SEATLINK_LOG_WARN("Client", "%s: %d outside %d..%d", ToString(id),
                        static_cast<int>(value), static_cast<int>(lo),
                        static_cast<int>(hi));
      return expected<bool, LinkError>::error(LinkError::kInvalidArgument);
    }
    ByteBuffer v{static_cast<uint8_t>(value)};
    auto ack = WriteDataPoint(id, v);
    if (ack.has_value() && ack.value()) {
      std::lock_guard<std::mutex> lk(state_mtx_);
      (void)state_.RecordWrite(id, value);
    }
    return ack;
  }

  /// Frame -> link packets. Oversized requests become Consecutive fragments.
  expected<std::vector<ByteBuffer>, LinkError> EncodeRequest(
      const Frame& frame) const {
    using Result = expected<std::vector<ByteBuffer>, LinkError>;
    auto raw = frame.ToBytes();
    if (!raw.has_value()) {
      SEATLINK_LOG_ERROR("Client", "cannot encode frame: %s",
                         ToString(raw.get_error()));
      return Result::error(LinkError::kEncodeFailed);
    }

    std::vector<ByteBuffer> packets;
    if (raw.value().size() <= cfg_.max_frame_size) {
      packets.push_back(CobsEncode(raw.value()));
      return Result::success(std::move(packets));
    }

    auto parts = Fragment(frame.payload, cfg_.max_frame_size, frame.has_tag);
    if (!parts.has_value()) {
      SEATLINK_LOG_ERROR("Client", "cannot fragment %u-byte request: %s",
                         static_cast<unsigned>(frame.payload.size()),
                         ToString(parts.get_error()));
      return Result::error(LinkError::kEncodeFailed);
    }
    for (const Frame& part : parts.value()) {
      auto bytes = part.ToBytes();
      if (!bytes.has_value()) return Result::error(LinkError::kEncodeFailed);
      packets.push_back(CobsEncode(bytes.value()));
    }
    SEATLINK_LOG_DEBUG("Client", "request split into %u fragments",
                       static_cast<unsigned>(packets.size()));
    return Result::success(std::move(packets));
  }

  expected<optional<ByteBuffer>, LinkError> Transact(const Frame& frame,
                                                     uint32_t timeout_ms) {
    auto packets = EncodeRequest(frame);
    if (!packets.has_value()) {
      return expected<optional<ByteBuffer>, LinkError>::error(
          packets.get_error());
    }
    return correlator_.SendAndWait(packets.value(), timeout_ms);
  }

  ClientConfig cfg_;
  const StatusLayout* layout_;
  TransactionCorrelator correlator_;

  mutable std::mutex rx_mtx_;
  FrameReassembler reassembler_;
  RxStats rx_stats_;

  mutable std::mutex state_mtx_;
  DeviceStateTracker state_;
};

}  // namespace seatlink

#endif  // SEATLINK_CLIENT_HPP_
