/**
 * @file serializer.hpp
 * @brief Stateless request builders and response parsers for the appliance
 *        protocol.
 *
 * Outbound (all integers little-endian, every request is a tagged Single
 * frame whose transaction number identifies the request type):
 *
 *   | request          | trans | payload                          |
 *   |------------------|-------|----------------------------------|
 *   | command          |   0   | cmd_id:u16                       |
 *   | data point read  |   1   | dp_id:u16, 0x00                  |
 *   | data point write |   2   | dp_id:u16, 0x01, value[]         |
 *   | device info      |   3   | 6 x dp_id:u16                    |
 *   | system status    |   4   | 6 x dp_id:u16                    |
 *
 * Inbound parsers never fail: short or garbled input leaves the affected
 * fields at their defaults.
 */

#ifndef SEATLINK_SERIALIZER_HPP_
#define SEATLINK_SERIALIZER_HPP_

#include "seatlink/catalogue.hpp"
#include "seatlink/cobs.hpp"
#include "seatlink/frame.hpp"
#include "seatlink/platform.hpp"
#include "seatlink/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

namespace seatlink {

static constexpr uint8_t kTransactionCommand = 0U;
static constexpr uint8_t kTransactionDataPointRead = 1U;
static constexpr uint8_t kTransactionDataPointWrite = 2U;
static constexpr uint8_t kTransactionDeviceInfo = 3U;
static constexpr uint8_t kTransactionSystemStatus = 4U;

static constexpr uint8_t kDataPointReadFlag = 0x00U;
static constexpr uint8_t kDataPointWriteFlag = 0x01U;

static constexpr DataPointId kDeviceInfoRequestIds[6] = {
    DataPointId::kDeviceSeries,    DataPointId::kDeviceVariant,
    DataPointId::kDeviceNumber,    DataPointId::kPcbSerialNumber,
    DataPointId::kFwRsVersion,     DataPointId::kBluetoothId,
};

static constexpr DataPointId kSystemStatusRequestIds[6] = {
    DataPointId::kAnalShowerStatus,  DataPointId::kLadyShowerStatus,
    DataPointId::kDryingStatus,      DataPointId::kFlushStatus,
    DataPointId::kDescalingStatus,   DataPointId::kMaintenanceStatus,
};

// ============================================================================
// Typed results
// ============================================================================

/// Empty string means "not reported".
struct DeviceIdentification {
  std::string sap_number;
  std::string serial_number;
  std::string production_date;
  std::string description;
  std::string firmware_version;
  std::string initial_operation_date;
};

/// Snapshot of the appliance state. Defaults are the values assumed before
/// the first successful read.
struct SystemParameters {
  // Basic status
  bool user_is_sitting = false;
  bool anal_shower_running = false;
  bool lady_shower_running = false;
  bool dryer_running = false;
  bool lid_position = false;
  int32_t orientation_light_state = 0;
  // Comfort
  int32_t water_temperature = 37;  ///< 34..40 degC
  bool seat_heating = false;
  bool night_light = false;
  // Spray
  int32_t spray_intensity = 3;  ///< 1..5
  int32_t spray_position = 3;   ///< 1..5
  bool oscillating_spray = false;
  // Maintenance
  bool descaling_needed = false;
  bool filter_replacement_needed = false;
  bool maintenance_due = false;
  float power_consumption = 0.0F;  ///< W
  float water_pressure = 0.0F;     ///< bar
  // Advanced
  bool auto_flush = true;
  bool barrier_free_mode = false;
  int32_t active_user_profile = 1;  ///< 1..4
};

// ============================================================================
// Status byte layout (versioned)
// ============================================================================

enum class StatusField : uint8_t {
  kNone = 0,
  kAnalShowerRunning,
  kLadyShowerRunning,
  kDryerRunning,
  kUserIsSitting,
  kDescalingNeeded,
  kMaintenanceDue,
};

static constexpr uint32_t kStatusByteCount = 6U;

/// Maps status response byte i to the field it drives (non-zero = true).
struct StatusLayout {
  uint8_t version;
  StatusField fields[kStatusByteCount];
};

/// Byte 3 answers the flush status request; "user is sitting" is inferred
/// from it and has not been confirmed on hardware.
static constexpr StatusLayout kStatusLayoutV1 = {
    1U,
    {StatusField::kAnalShowerRunning, StatusField::kLadyShowerRunning,
     StatusField::kDryerRunning, StatusField::kUserIsSitting,
     StatusField::kDescalingNeeded, StatusField::kMaintenanceDue}};

/// nullptr for unknown versions.
inline const StatusLayout* FindStatusLayout(uint8_t version) noexcept {
  return (version == kStatusLayoutV1.version) ? &kStatusLayoutV1 : nullptr;
}

// ============================================================================
// Builders
// ============================================================================

namespace detail {

inline Frame MakeRequestFrame(uint8_t transaction, ByteBuffer&& payload) {
  Frame f;
  f.kind = FrameKind::kSingle;
  f.has_tag = true;
  f.transaction = transaction;
  f.flag = 0;
  f.payload = std::move(payload);
  return f;
}

inline void AppendLE16(ByteBuffer& out, uint16_t v) {
  uint8_t b[2];
  WriteLE16(b, v);
  out.push_back(b[0]);
  out.push_back(b[1]);
}

inline Frame MakeMultiReadFrame(uint8_t transaction,
                                const DataPointId (&ids)[6]) {
  ByteBuffer payload;
  payload.reserve(12U);
  for (DataPointId id : ids) {
    AppendLE16(payload, static_cast<uint16_t>(id));
  }
  return MakeRequestFrame(transaction, std::move(payload));
}

}  // namespace detail

inline Frame BuildCommand(uint16_t command_id) {
  ByteBuffer payload;
  detail::AppendLE16(payload, command_id);
  return detail::MakeRequestFrame(kTransactionCommand, std::move(payload));
}

inline Frame BuildCommand(HighLevelCommand cmd) {
  return BuildCommand(static_cast<uint16_t>(cmd));
}

inline Frame BuildDataPointRead(uint16_t dp_id) {
  ByteBuffer payload;
  detail::AppendLE16(payload, dp_id);
  payload.push_back(kDataPointReadFlag);
  return detail::MakeRequestFrame(kTransactionDataPointRead,
                                  std::move(payload));
}

inline Frame BuildDataPointRead(DataPointId id) {
  return BuildDataPointRead(static_cast<uint16_t>(id));
}

inline Frame BuildDataPointWrite(uint16_t dp_id, const uint8_t* value,
                                 uint32_t size) {
  SEATLINK_ASSERT(value != nullptr || size == 0U);
  ByteBuffer payload;
  payload.reserve(3U + size);
  detail::AppendLE16(payload, dp_id);
  payload.push_back(kDataPointWriteFlag);
  payload.insert(payload.end(), value, value + size);
  return detail::MakeRequestFrame(kTransactionDataPointWrite,
                                  std::move(payload));
}

inline Frame BuildDataPointWrite(uint16_t dp_id, const ByteBuffer& value) {
  return BuildDataPointWrite(dp_id, value.data(),
                             static_cast<uint32_t>(value.size()));
}

inline Frame BuildDataPointWrite(DataPointId id, const ByteBuffer& value) {
  return BuildDataPointWrite(static_cast<uint16_t>(id), value);
}

inline Frame BuildDeviceInfoRequest() {
  return detail::MakeMultiReadFrame(kTransactionDeviceInfo,
                                    kDeviceInfoRequestIds);
}

inline Frame BuildSystemStatusRequest() {
  return detail::MakeMultiReadFrame(kTransactionSystemStatus,
                                    kSystemStatusRequestIds);
}

/// Frame -> header bytes -> COBS. Fails only on invalid frame fields.
inline expected<ByteBuffer, FrameError> EncodeForLink(const Frame& frame) {
  auto raw = frame.ToBytes();
  if (!raw.has_value()) {
    return expected<ByteBuffer, FrameError>::error(raw.get_error());
  }
  return expected<ByteBuffer, FrameError>::success(CobsEncode(raw.value()));
}

// ============================================================================
// Parsers
// ============================================================================

namespace detail {

/// Decodes UTF-8, dropping every byte that does not start a well-formed
/// sequence (overlong forms, surrogates and code points > U+10FFFF included).
inline std::string Utf8Lenient(const uint8_t* data, uint32_t size) {
  std::string out;
  out.reserve(size);
  uint32_t i = 0;
  while (i < size) {
    const uint8_t b0 = data[i];
    uint32_t len = 0;
    uint8_t lo = 0x80U;
    uint8_t hi = 0xBFU;
    if (b0 < 0x80U) {
      len = 1;
    } else if (b0 >= 0xC2U && b0 <= 0xDFU) {
      len = 2;
    } else if (b0 >= 0xE0U && b0 <= 0xEFU) {
      len = 3;
      if (b0 == 0xE0U) lo = 0xA0U;
      if (b0 == 0xEDU) hi = 0x9FU;
    } else if (b0 >= 0xF0U && b0 <= 0xF4U) {
      len = 4;
      if (b0 == 0xF0U) lo = 0x90U;
      if (b0 == 0xF4U) hi = 0x8FU;
    }

    bool ok = (len != 0U) && (len <= size - i);
    for (uint32_t k = 1; ok && k < len; ++k) {
      const uint8_t c = data[i + k];
      const uint8_t min = (k == 1U) ? lo : 0x80U;
      const uint8_t max = (k == 1U) ? hi : 0xBFU;
      if (c < min || c > max) ok = false;
    }

    if (ok) {
      out.append(reinterpret_cast<const char*>(data + i), len);
      i += len;
    } else {
      ++i;
    }
  }
  return out;
}

}  // namespace detail

/**
 * @brief Parse a device identification response.
 *
 * Layout: [0..1] SAP number (u16), [2..3] serial (u16), [4..7] firmware
 * version bytes, [8..] UTF-8 description (trailing NULs stripped).
 * Fields whose bytes are missing stay empty.
 */
inline DeviceIdentification ParseDeviceIdentification(const uint8_t* data,
                                                      uint32_t size) {
  DeviceIdentification id;
  if (data == nullptr) return id;
  char buf[32];

  if (size >= 2U) {
    (void)std::snprintf(buf, sizeof(buf), "SAP-%u",
                        static_cast<unsigned>(ReadLE16(data)));
    id.sap_number = buf;
  }
  if (size >= 4U) {
    (void)std::snprintf(buf, sizeof(buf), "SN-%08u",
                        static_cast<unsigned>(ReadLE16(data + 2)));
    id.serial_number = buf;
  }
  if (size >= 8U) {
    (void)std::snprintf(buf, sizeof(buf), "FW-%u.%u.%u.%u",
                        static_cast<unsigned>(data[4]),
                        static_cast<unsigned>(data[5]),
                        static_cast<unsigned>(data[6]),
                        static_cast<unsigned>(data[7]));
    id.firmware_version = buf;
  }
  if (size > 8U) {
    id.description = detail::Utf8Lenient(data + 8, size - 8U);
    while (!id.description.empty() && id.description.back() == '\0') {
      id.description.pop_back();
    }
  }
  return id;
}

inline DeviceIdentification ParseDeviceIdentification(const ByteBuffer& data) {
  return ParseDeviceIdentification(data.data(),
                                   static_cast<uint32_t>(data.size()));
}

/**
 * @brief Parse a system status response through a status layout.
 *
 * Only the first kStatusByteCount bytes are interpreted; a shorter response
 * fills the fields it covers. Bytes beyond that are ignored.
 */
inline SystemParameters ParseSystemParameters(
    const uint8_t* data, uint32_t size,
    const StatusLayout& layout = kStatusLayoutV1) {
  SystemParameters p;
  if (data == nullptr) return p;
  const uint32_t n = (size < kStatusByteCount) ? size : kStatusByteCount;
  for (uint32_t i = 0; i < n; ++i) {
    const bool on = data[i] != 0U;
    switch (layout.fields[i]) {
      case StatusField::kAnalShowerRunning:
        p.anal_shower_running = on;
        break;
      case StatusField::kLadyShowerRunning:
        p.lady_shower_running = on;
        break;
      case StatusField::kDryerRunning:
        p.dryer_running = on;
        break;
      case StatusField::kUserIsSitting:
        p.user_is_sitting = on;
        break;
      case StatusField::kDescalingNeeded:
        p.descaling_needed = on;
        break;
      case StatusField::kMaintenanceDue:
        p.maintenance_due = on;
        break;
      case StatusField::kNone:
      default:
        break;
    }
  }
  return p;
}

inline SystemParameters ParseSystemParameters(
    const ByteBuffer& data, const StatusLayout& layout = kStatusLayoutV1) {
  return ParseSystemParameters(data.data(), static_cast<uint32_t>(data.size()),
                               layout);
}

static constexpr uint32_t kStatusNotificationMinSize = 16U;

/**
 * @brief Parse an unsolicited status notification (16+ bytes).
 *
 * Bytes [4..5] (u16) low byte: bit0 sitting, bit1 anal shower, bit2 lady
 * shower, bit3 dryer. Bytes [6..7] (u16) high byte: bit0 descaling needed,
 * bit1 filter replacement needed. Shorter input returns defaults.
 */
inline SystemParameters ParseStatusNotification(const uint8_t* data,
                                                uint32_t size) {
  SystemParameters p;
  if (data == nullptr || size < kStatusNotificationMinSize) return p;

  const uint8_t main_status = static_cast<uint8_t>(ReadLE16(data + 4) & 0xFFU);
  const uint8_t ext_status =
      static_cast<uint8_t>((ReadLE16(data + 6) >> 8) & 0xFFU);

  p.user_is_sitting = (main_status & 0x01U) != 0U;
  p.anal_shower_running = (main_status & 0x02U) != 0U;
  p.lady_shower_running = (main_status & 0x04U) != 0U;
  p.dryer_running = (main_status & 0x08U) != 0U;
  p.descaling_needed = (ext_status & 0x01U) != 0U;
  p.filter_replacement_needed = (ext_status & 0x02U) != 0U;
  return p;
}

inline SystemParameters ParseStatusNotification(const ByteBuffer& data) {
  return ParseStatusNotification(data.data(),
                                 static_cast<uint32_t>(data.size()));
}

}  // namespace seatlink

#endif  // SEATLINK_SERIALIZER_HPP_
