/**
 * @file test_serializer.cpp
 * @brief Tests for serializer.hpp - request builders and response parsers.
 */

#include "seatlink/serializer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>

using seatlink::ByteBuffer;
using seatlink::DataPointId;
using seatlink::Frame;
using seatlink::FrameKind;
using seatlink::HighLevelCommand;

namespace {

ByteBuffer Raw(const Frame& f) {
  auto r = f.ToBytes();
  REQUIRE(r.has_value());
  return r.value();
}

}  // namespace

// ============================================================================
// Builders
// ============================================================================

TEST_CASE("serializer - command payload is little-endian id",
          "[serializer]") {
  Frame f = seatlink::BuildCommand(HighLevelCommand::kToggleLidPosition);
  REQUIRE(f.kind == FrameKind::kSingle);
  REQUIRE(f.has_tag);
  REQUIRE(f.transaction == seatlink::kTransactionCommand);
  REQUIRE(f.payload == ByteBuffer{0x0A, 0x00});
  REQUIRE(Raw(f) == ByteBuffer{0x10, 0x0A, 0x00});
}

TEST_CASE("serializer - data point read request", "[serializer]") {
  Frame f = seatlink::BuildDataPointRead(DataPointId::kAnalShowerStatus);
  REQUIRE(f.transaction == seatlink::kTransactionDataPointRead);
  REQUIRE(f.payload == ByteBuffer{0x34, 0x02, 0x00});
  REQUIRE(Raw(f) == ByteBuffer{0x12, 0x34, 0x02, 0x00});
}

// 340 = 0x0154, so the little-endian id is 54 01. Protocol notes that show
// this request as 34 01 01 4B have a typo in the first byte.
TEST_CASE("serializer - data point write 340 = 75", "[serializer]") {
  Frame f = seatlink::BuildDataPointWrite(uint16_t{340}, ByteBuffer{75});
  REQUIRE(f.transaction == seatlink::kTransactionDataPointWrite);
  REQUIRE(f.payload == ByteBuffer{0x54, 0x01, 0x01, 0x4B});
  REQUIRE(Raw(f) == ByteBuffer{0x14, 0x54, 0x01, 0x01, 0x4B});
}

TEST_CASE("serializer - write carries multi-byte values verbatim",
          "[serializer]") {
  Frame f = seatlink::BuildDataPointWrite(DataPointId::kRtcTime,
                                          ByteBuffer{0x01, 0x02, 0x03, 0x04});
  REQUIRE(f.payload == ByteBuffer{0x0F, 0x00, 0x01, 0x01, 0x02, 0x03, 0x04});
}

TEST_CASE("serializer - device info request packs six ids", "[serializer]") {
  Frame f = seatlink::BuildDeviceInfoRequest();
  REQUIRE(f.transaction == seatlink::kTransactionDeviceInfo);
  REQUIRE(f.payload == ByteBuffer{0x00, 0x00, 0x01, 0x00, 0x02, 0x00, 0x05,
                                  0x00, 0x08, 0x00, 0x0B, 0x00});
  REQUIRE(Raw(f)[0] == 0x16);
}

TEST_CASE("serializer - system status request packs six ids",
          "[serializer]") {
  Frame f = seatlink::BuildSystemStatusRequest();
  REQUIRE(f.transaction == seatlink::kTransactionSystemStatus);
  REQUIRE(f.payload == ByteBuffer{0x34, 0x02, 0x68, 0x03, 0x6B, 0x03, 0x8E,
                                  0x00, 0x49, 0x02, 0xDB, 0x01});
  REQUIRE(Raw(f)[0] == 0x18);
}

TEST_CASE("serializer - EncodeForLink stuffs the frame", "[serializer]") {
  auto wire = seatlink::EncodeForLink(
      seatlink::BuildCommand(HighLevelCommand::kToggleAnalShower));
  REQUIRE(wire.has_value());
  REQUIRE(wire.value() == ByteBuffer{0x02, 0x10, 0x01, 0x01, 0x00});

  auto plain = seatlink::CobsDecode(wire.value());
  REQUIRE(plain.has_value());
  REQUIRE(plain.value() == ByteBuffer{0x10, 0x00, 0x00});
}

TEST_CASE("serializer - EncodeForLink rejects invalid frames",
          "[serializer]") {
  Frame f = seatlink::BuildCommand(uint16_t{1});
  f.transaction = 9;
  auto wire = seatlink::EncodeForLink(f);
  REQUIRE(!wire.has_value());
  REQUIRE(wire.get_error() == seatlink::FrameError::kInvalidField);
}

// ============================================================================
// Device identification
// ============================================================================

TEST_CASE("serializer - full device identification", "[serializer]") {
  ByteBuffer data{0x39, 0x30, 0x2A, 0x00, 1, 2, 3, 4,
                  'A',  'q',  'u',  'a',  0, 0};
  auto id = seatlink::ParseDeviceIdentification(data);
  REQUIRE(id.sap_number == "SAP-12345");
  REQUIRE(id.serial_number == "SN-00000042");
  REQUIRE(id.firmware_version == "FW-1.2.3.4");
  REQUIRE(id.description == "Aqua");
  REQUIRE(id.production_date.empty());
  REQUIRE(id.initial_operation_date.empty());
}

TEST_CASE("serializer - short identification fills what it can",
          "[serializer]") {
  auto two = seatlink::ParseDeviceIdentification(ByteBuffer{0x01, 0x00});
  REQUIRE(two.sap_number == "SAP-1");
  REQUIRE(two.serial_number.empty());
  REQUIRE(two.firmware_version.empty());

  auto six = seatlink::ParseDeviceIdentification(
      ByteBuffer{0x01, 0x00, 0x02, 0x00, 0x09, 0x09});
  REQUIRE(six.serial_number == "SN-00000002");
  REQUIRE(six.firmware_version.empty());
  REQUIRE(six.description.empty());

  auto none = seatlink::ParseDeviceIdentification(ByteBuffer{});
  REQUIRE(none.sap_number.empty());
}

TEST_CASE("serializer - description drops undecodable bytes", "[serializer]") {
  ByteBuffer data{0, 0, 0, 0, 0, 0, 0, 0, 'O', 0xFF, 'K', 0xC3, 0xA9, 0xE2, 0x82};
  auto id = seatlink::ParseDeviceIdentification(data);
  REQUIRE(id.description == "OK\xC3\xA9");
}

TEST_CASE("serializer - description rejects overlong and surrogate forms",
          "[serializer]") {
  ByteBuffer data{0, 0, 0, 0, 0, 0, 0, 0, 0xC0, 0xAF, 'x', 0xED, 0xA0, 0x80, 'y'};
  auto id = seatlink::ParseDeviceIdentification(data);
  REQUIRE(id.description == "xy");
}

// ============================================================================
// System parameters
// ============================================================================

TEST_CASE("serializer - status bytes map through layout v1", "[serializer]") {
  auto p = seatlink::ParseSystemParameters(ByteBuffer{1, 0, 1, 0, 1, 0});
  REQUIRE(p.anal_shower_running);
  REQUIRE_FALSE(p.lady_shower_running);
  REQUIRE(p.dryer_running);
  REQUIRE_FALSE(p.user_is_sitting);
  REQUIRE(p.descaling_needed);
  REQUIRE_FALSE(p.maintenance_due);

  // untouched fields keep their defaults
  REQUIRE(p.water_temperature == 37);
  REQUIRE(p.spray_intensity == 3);
  REQUIRE(p.auto_flush);
  REQUIRE(p.active_user_profile == 1);
}

TEST_CASE("serializer - short status fills leading fields only",
          "[serializer]") {
  auto p = seatlink::ParseSystemParameters(ByteBuffer{0, 2});
  REQUIRE_FALSE(p.anal_shower_running);
  REQUIRE(p.lady_shower_running);
  REQUIRE_FALSE(p.dryer_running);

  auto empty = seatlink::ParseSystemParameters(ByteBuffer{});
  REQUIRE_FALSE(empty.anal_shower_running);
}

TEST_CASE("serializer - status bytes past six are ignored", "[serializer]") {
  auto p = seatlink::ParseSystemParameters(
      ByteBuffer{0, 0, 0, 1, 0, 1, 0xFF, 0xFF, 0xFF});
  REQUIRE(p.user_is_sitting);
  REQUIRE(p.maintenance_due);
  REQUIRE_FALSE(p.filter_replacement_needed);
  REQUIRE_FALSE(p.seat_heating);
}

TEST_CASE("serializer - custom status layout", "[serializer]") {
  using seatlink::StatusField;
  const seatlink::StatusLayout layout = {
      2U,
      {StatusField::kUserIsSitting, StatusField::kNone, StatusField::kNone,
       StatusField::kNone, StatusField::kNone, StatusField::kNone}};
  auto p = seatlink::ParseSystemParameters(ByteBuffer{1, 1, 1, 1, 1, 1}, layout);
  REQUIRE(p.user_is_sitting);
  REQUIRE_FALSE(p.anal_shower_running);
  REQUIRE_FALSE(p.descaling_needed);
}

TEST_CASE("serializer - FindStatusLayout", "[serializer]") {
  REQUIRE(seatlink::FindStatusLayout(1) == &seatlink::kStatusLayoutV1);
  REQUIRE(seatlink::FindStatusLayout(0) == nullptr);
  REQUIRE(seatlink::FindStatusLayout(2) == nullptr);
}

// ============================================================================
// Notifications
// ============================================================================

TEST_CASE("serializer - status notification flags", "[serializer]") {
  ByteBuffer n(16, 0);
  n[4] = 0x0B;  // sitting, anal shower, dryer
  n[7] = 0x02;  // filter replacement
  auto p = seatlink::ParseStatusNotification(n);
  REQUIRE(p.user_is_sitting);
  REQUIRE(p.anal_shower_running);
  REQUIRE_FALSE(p.lady_shower_running);
  REQUIRE(p.dryer_running);
  REQUIRE_FALSE(p.descaling_needed);
  REQUIRE(p.filter_replacement_needed);
}

TEST_CASE("serializer - captured idle notification", "[serializer]") {
  ByteBuffer n{0x30, 0x14, 0x0C, 0x03, 0x00, 0x03, 0x00, 0x00, 0x00,
               0x00, 0x31, 0x30, 0x00, 0x12, 0x00, 0xCF, 0x08};
  auto p = seatlink::ParseStatusNotification(n);
  REQUIRE_FALSE(p.user_is_sitting);
  REQUIRE_FALSE(p.anal_shower_running);
  REQUIRE_FALSE(p.descaling_needed);
}

TEST_CASE("serializer - short notification returns defaults",
          "[serializer]") {
  ByteBuffer n(15, 0xFF);
  auto p = seatlink::ParseStatusNotification(n);
  REQUIRE_FALSE(p.user_is_sitting);
  REQUIRE_FALSE(p.filter_replacement_needed);
}
