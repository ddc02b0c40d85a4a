/**
 * @file test_device_state.cpp
 * @brief Tests for device_state.hpp
 */

#include "seatlink/device_state.hpp"

#include <catch2/catch_test_macros.hpp>

using seatlink::DataPointId;
using seatlink::DeviceStateTracker;
using seatlink::HighLevelCommand;
using seatlink::SystemParameters;

TEST_CASE("device_state - starts with defaults and nothing pending",
          "[device_state]") {
  DeviceStateTracker s;
  REQUIRE_FALSE(s.HasConfirmed());
  REQUIRE_FALSE(s.HasTentative());
  REQUIRE(s.Effective().water_temperature == 37);
}

TEST_CASE("device_state - toggle flips the effective value",
          "[device_state]") {
  DeviceStateTracker s;
  REQUIRE(s.RecordCommand(HighLevelCommand::kToggleLidPosition));
  REQUIRE(s.HasTentative());
  REQUIRE(s.Effective().lid_position);
  REQUIRE_FALSE(s.Confirmed().lid_position);

  // a second toggle flips it back
  REQUIRE(s.RecordCommand(HighLevelCommand::kToggleLidPosition));
  REQUIRE_FALSE(s.Effective().lid_position);
}

TEST_CASE("device_state - toggle is relative to confirmed state",
          "[device_state]") {
  DeviceStateTracker s;
  SystemParameters p;
  p.anal_shower_running = true;
  s.ApplyConfirmed(p);

  s.RecordCommand(HighLevelCommand::kToggleAnalShower);
  REQUIRE_FALSE(s.Effective().anal_shower_running);
  REQUIRE(s.Confirmed().anal_shower_running);
}

TEST_CASE("device_state - orientation light drives night light",
          "[device_state]") {
  DeviceStateTracker s;
  REQUIRE(s.RecordCommand(HighLevelCommand::kToggleOrientationLight));
  REQUIRE(s.Effective().night_light);
}

TEST_CASE("device_state - untracked commands change nothing",
          "[device_state]") {
  DeviceStateTracker s;
  REQUIRE_FALSE(s.RecordCommand(HighLevelCommand::kTriggerFlushManually));
  REQUIRE_FALSE(s.HasTentative());
}

TEST_CASE("device_state - setter writes are tentative", "[device_state]") {
  DeviceStateTracker s;
  REQUIRE(s.RecordWrite(DataPointId::kSetActiveShowerWaterTemperature, 39));
  REQUIRE(s.RecordWrite(DataPointId::kSetActiveAnalSprayIntensity, 5));
  REQUIRE(s.RecordWrite(DataPointId::kSetActiveAnalSprayArmPosition, 1));
  REQUIRE_FALSE(s.RecordWrite(DataPointId::kLightingSetBrightness, 50));

  const SystemParameters e = s.Effective();
  REQUIRE(e.water_temperature == 39);
  REQUIRE(e.spray_intensity == 5);
  REQUIRE(e.spray_position == 1);
  REQUIRE(s.Confirmed().water_temperature == 37);
}

TEST_CASE("device_state - confirmed read discards tentative values",
          "[device_state]") {
  DeviceStateTracker s;
  s.RecordCommand(HighLevelCommand::kToggleDryer);
  s.RecordWrite(DataPointId::kSetActiveShowerWaterTemperature, 40);

  SystemParameters p;
  p.dryer_running = false;
  s.ApplyConfirmed(p);

  REQUIRE(s.HasConfirmed());
  REQUIRE_FALSE(s.HasTentative());
  REQUIRE_FALSE(s.Effective().dryer_running);
  REQUIRE(s.Effective().water_temperature == 37);
}

TEST_CASE("device_state - ClearTentative", "[device_state]") {
  DeviceStateTracker s;
  s.RecordCommand(HighLevelCommand::kToggleLadyShower);
  s.ClearTentative();
  REQUIRE_FALSE(s.HasTentative());
  REQUIRE_FALSE(s.Effective().lady_shower_running);
}
