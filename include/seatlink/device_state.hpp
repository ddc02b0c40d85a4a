/**
 * @file device_state.hpp
 * @brief Confirmed vs. tentative appliance state.
 *
 * Confirmed state is replaced wholesale by every successful status read.
 * Acknowledged commands (toggles, setter writes) only record tentative
 * values; Effective() overlays them on the confirmed snapshot until the next
 * confirmed read discards them.
 *
 * Not thread-safe; AquaCleanClient guards it with its state mutex.
 */

#ifndef SEATLINK_DEVICE_STATE_HPP_
#define SEATLINK_DEVICE_STATE_HPP_

#include "seatlink/catalogue.hpp"
#include "seatlink/serializer.hpp"
#include "seatlink/vocabulary.hpp"

#include <cstdint>

namespace seatlink {

struct TentativeState {
  optional<bool> lid_position;
  optional<bool> anal_shower_running;
  optional<bool> lady_shower_running;
  optional<bool> dryer_running;
  optional<bool> night_light;
  optional<int32_t> water_temperature;
  optional<int32_t> spray_intensity;
  optional<int32_t> spray_position;

  bool Empty() const noexcept {
    return !lid_position && !anal_shower_running && !lady_shower_running &&
           !dryer_running && !night_light && !water_temperature &&
           !spray_intensity && !spray_position;
  }
};

class DeviceStateTracker {
 public:
  /// Replace confirmed state and drop every tentative value.
  void ApplyConfirmed(const SystemParameters& params) {
    confirmed_ = params;
    has_confirmed_ = true;
    tentative_ = TentativeState{};
  }

  /**
   * @brief Record the expected effect of an acknowledged toggle command.
   * @return false if the command has no tracked state effect.
   */
  bool RecordCommand(HighLevelCommand cmd) {
    const SystemParameters now = Effective();
    switch (cmd) {
      case HighLevelCommand::kToggleLidPosition:
        tentative_.lid_position = !now.lid_position;
        return true;
      case HighLevelCommand::kToggleAnalShower:
        tentative_.anal_shower_running = !now.anal_shower_running;
        return true;
      case HighLevelCommand::kToggleLadyShower:
        tentative_.lady_shower_running = !now.lady_shower_running;
        return true;
      case HighLevelCommand::kToggleDryer:
        tentative_.dryer_running = !now.dryer_running;
        return true;
      case HighLevelCommand::kToggleOrientationLight:
        tentative_.night_light = !now.night_light;
        return true;
      default:
        return false;
    }
  }

  /// Record an acknowledged setter write. false if @p id is not tracked.
  bool RecordWrite(DataPointId id, int32_t value) {
    switch (id) {
      case DataPointId::kSetActiveShowerWaterTemperature:
        tentative_.water_temperature = value;
        return true;
      case DataPointId::kSetActiveAnalSprayIntensity:
        tentative_.spray_intensity = value;
        return true;
      case DataPointId::kSetActiveAnalSprayArmPosition:
        tentative_.spray_position = value;
        return true;
      default:
        return false;
    }
  }

  SystemParameters Effective() const {
    SystemParameters p = confirmed_;
    if (tentative_.lid_position) p.lid_position = *tentative_.lid_position;
    if (tentative_.anal_shower_running)
      p.anal_shower_running = *tentative_.anal_shower_running;
    if (tentative_.lady_shower_running)
      p.lady_shower_running = *tentative_.lady_shower_running;
    if (tentative_.dryer_running) p.dryer_running = *tentative_.dryer_running;
    if (tentative_.night_light) p.night_light = *tentative_.night_light;
    if (tentative_.water_temperature)
      p.water_temperature = *tentative_.water_temperature;
    if (tentative_.spray_intensity)
      p.spray_intensity = *tentative_.spray_intensity;
    if (tentative_.spray_position) p.spray_position = *tentative_.spray_position;
    return p;
  }

  const SystemParameters& Confirmed() const noexcept { return confirmed_; }
  const TentativeState& Tentative() const noexcept { return tentative_; }
  bool HasConfirmed() const noexcept { return has_confirmed_; }
  bool HasTentative() const noexcept { return !tentative_.Empty(); }

  void ClearTentative() { tentative_ = TentativeState{}; }

 private:
  SystemParameters confirmed_;
  TentativeState tentative_;
  bool has_confirmed_ = false;
};

}  // namespace seatlink

#endif  // SEATLINK_DEVICE_STATE_HPP_
