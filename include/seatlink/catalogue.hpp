/**
 * @file catalogue.hpp
 * @brief Closed catalogue of high-level commands and data points with their
 *        access mode and value encoding.
 *
 * kDataPointTable is the single source of truth for data point metadata.
 * Entries flagged `provisional` were mapped from limited device testing
 * (lighting / orientation light) and may differ between firmware variants.
 */

#ifndef SEATLINK_CATALOGUE_HPP_
#define SEATLINK_CATALOGUE_HPP_

#include "seatlink/platform.hpp"
#include "seatlink/vocabulary.hpp"

#include <cstdint>
#include <cstring>

namespace seatlink {

// ============================================================================
// High-level commands
// ============================================================================

enum class HighLevelCommand : uint16_t {
  kToggleAnalShower = 0,
  kToggleLadyShower = 1,
  kToggleDryer = 2,
  kStartCleaningDevice = 4,
  kExecuteNextCleaningStep = 5,
  kPrepareDescaling = 6,
  kConfirmDescaling = 7,
  kCancelDescaling = 8,
  kPostponeDescaling = 9,
  kToggleLidPosition = 10,
  kToggleOrientationLight = 20,
  kStartLidPositionCalibration = 33,
  kLidPositionOffsetSave = 34,
  kLidPositionOffsetIncrement = 35,
  kLidPositionOffsetDecrement = 36,
  kTriggerFlushManually = 37,
  kResetFilterCounter = 47,
};

struct CommandInfo {
  HighLevelCommand id;
  const char* name;
};

static constexpr CommandInfo kCommandTable[] = {
    {HighLevelCommand::kToggleAnalShower, "ToggleAnalShower"},
    {HighLevelCommand::kToggleLadyShower, "ToggleLadyShower"},
    {HighLevelCommand::kToggleDryer, "ToggleDryer"},
    {HighLevelCommand::kStartCleaningDevice, "StartCleaningDevice"},
    {HighLevelCommand::kExecuteNextCleaningStep, "ExecuteNextCleaningStep"},
    {HighLevelCommand::kPrepareDescaling, "PrepareDescaling"},
    {HighLevelCommand::kConfirmDescaling, "ConfirmDescaling"},
    {HighLevelCommand::kCancelDescaling, "CancelDescaling"},
    {HighLevelCommand::kPostponeDescaling, "PostponeDescaling"},
    {HighLevelCommand::kToggleLidPosition, "ToggleLidPosition"},
    {HighLevelCommand::kToggleOrientationLight, "ToggleOrientationLight"},
    {HighLevelCommand::kStartLidPositionCalibration,
     "StartLidPositionCalibration"},
    {HighLevelCommand::kLidPositionOffsetSave, "LidPositionOffsetSave"},
    {HighLevelCommand::kLidPositionOffsetIncrement,
     "LidPositionOffsetIncrement"},
    {HighLevelCommand::kLidPositionOffsetDecrement,
     "LidPositionOffsetDecrement"},
    {HighLevelCommand::kTriggerFlushManually, "TriggerFlushManually"},
    {HighLevelCommand::kResetFilterCounter, "ResetFilterCounter"},
};

// ============================================================================
// Data points
// ============================================================================

enum class DataPointId : uint16_t {
  // System information
  kDeviceSeries = 0,
  kDeviceVariant = 1,
  kDeviceNumber = 2,
  kPcbSerialNumber = 5,
  kFwRsVersion = 8,
  kFwTsVersion = 9,
  kHwRsVersion = 10,
  kBluetoothId = 11,
  kRtcTime = 15,
  kName = 16,
  kSupplyVoltage = 19,
  // Flush
  kBlockFlush = 112,
  kBlockFlushStatus = 113,
  kCleaningMode = 115,
  kCleaningModeStatus = 117,
  kPreFlush = 118,
  kPostFlush = 119,
  kManualFlush = 126,
  kAutomaticFlush = 127,
  kFlush = 141,
  kFlushStatus = 142,
  kFullFlushVolume = 291,
  kPartFlushVolume = 292,
  // Shower
  kStartStopAnalShower = 563,
  kAnalShowerStatus = 564,
  kAnalShowerProgress = 565,
  kStartStopLadyShower = 868,
  kSetActiveAnalSprayIntensity = 570,
  kActiveAnalSprayIntensityStatus = 571,
  kSetActiveAnalSprayArmPosition = 572,
  kActiveAnalSprayArmPositionStatus = 573,
  kSetActiveShowerWaterTemperature = 574,
  kActiveShowerWaterTemperatureStatus = 575,
  kSetActiveAnalSprayArmOscillation = 576,
  kActiveAnalSprayArmOscillationStatus = 577,
  kStoredAnalSprayIntensity = 580,
  kStoredAnalSprayArmPosition = 581,
  kStoredShowerWaterTemperature = 582,
  kStoredAnalSprayArmOscillation = 583,
  kSetActiveAnalShowerTime = 849,
  kActiveAnalShowerTime = 850,
  kStoredAnalShowerTime = 851,
  kSetActiveLadyShowerTime = 855,
  kSetActiveLadySprayIntensity = 858,
  kLadyShowerStatus = 872,
  kLadyShowerProgress = 873,
  // Dryer
  kStartStopDrying = 874,
  kDryingStatus = 875,
  kDryingProgress = 876,
  kDryerFanSetIntensity = 877,
  kDryerFanIntensity = 878,
  kDryerHeaterSetTemperature = 883,
  kDryerHeaterTemperature = 884,
  kSetActiveDryerFanIntensity = 893,
  kActiveDryerFanIntensityStatus = 894,
  kStoredDryerFanIntensity = 895,
  // Lighting
  kOrientationLightLed = 42,
  kOrientationLightSetLed = 43,
  kOrientationLightMode = 44,
  kOrientationLightIntensity = 48,
  kLightingBrightnessAdjust = 322,
  kLightingSetBrightness = 340,
  kLightingBrightnessStatus = 341,
  kLedColor = 382,
  // Odour extraction
  kOdourExtractionFan = 20,
  kOdourExtractionSetFan = 21,
  kOdourExtractionMode = 23,
  kOdourExtractionPower = 27,
  kOdourExtractionFollowUpTime = 29,
  // Descaling
  kStartStopDescaling = 584,
  kDescalingStatus = 585,
  kDescalingProgress = 586,
  kWaterHardness = 587,
  kDaysUntilNextDescaling = 589,
  kTimestampOfLastDescaling = 590,
  kDescalingResult = 798,
  // Maintenance
  kMaintenanceDone = 474,
  kMaintenanceStatus = 475,
  kMaintenanceCountdown = 515,
  kStartStopSprayArmCleaning = 566,
  kSprayArmCleaningStatus = 567,
  // Diagnostics
  kStartSelfTest = 151,
  kSelfTestStatus = 152,
  kCheckActuator = 184,
  kLedTest = 330,
  kDiagnoseDeviceState = 372,
  kCheckBuzzer = 453,
  kStartStopValveTest = 791,
  // Error status
  kOdourExtractionErrorStatus = 88,
  kPowerSupplyErrorStatus = 93,
  kGlobalError = 359,
  kGlobalWarning = 360,
  kTempSensErrorStatus = 478,
  kSeatHeaterErrorStatus = 819,
};

enum class DataPointAccess : uint8_t {
  kRead = 0,
  kWrite,
  kReadWrite,
};

enum class DataPointEncoding : uint8_t {
  kBinary = 0,
  kBoolean,
  kEnumerated,
  kPercent,
  kCounter,
  kText,
  kTimestampUtc,
  kSigned,
};

struct DataPointInfo {
  DataPointId id;
  const char* name;
  DataPointAccess access;
  DataPointEncoding encoding;
  bool provisional;

  bool IsReadable() const noexcept { return access != DataPointAccess::kWrite; }
  bool IsWritable() const noexcept { return access != DataPointAccess::kRead; }
};

namespace detail {
using A = DataPointAccess;
using E = DataPointEncoding;
using D = DataPointId;
}  // namespace detail

// clang-format off
static constexpr DataPointInfo kDataPointTable[] = {
    {detail::D::kDeviceSeries,                    "DeviceSeries",                    detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kDeviceVariant,                   "DeviceVariant",                   detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kDeviceNumber,                    "DeviceNumber",                    detail::A::kRead,      detail::E::kCounter,      false},
    {detail::D::kPcbSerialNumber,                 "PcbSerialNumber",                 detail::A::kRead,      detail::E::kText,         false},
    {detail::D::kFwRsVersion,                     "FwRsVersion",                     detail::A::kRead,      detail::E::kText,         false},
    {detail::D::kFwTsVersion,                     "FwTsVersion",                     detail::A::kRead,      detail::E::kText,         false},
    {detail::D::kHwRsVersion,                     "HwRsVersion",                     detail::A::kRead,      detail::E::kText,         false},
    {detail::D::kBluetoothId,                     "BluetoothId",                     detail::A::kRead,      detail::E::kText,         false},
    {detail::D::kRtcTime,                         "RtcTime",                         detail::A::kReadWrite, detail::E::kTimestampUtc, false},
    {detail::D::kName,                            "Name",                            detail::A::kReadWrite, detail::E::kText,         false},
    {detail::D::kSupplyVoltage,                   "SupplyVoltage",                   detail::A::kRead,      detail::E::kCounter,      false},

    {detail::D::kBlockFlush,                      "BlockFlush",                      detail::A::kWrite,     detail::E::kBoolean,      false},
    {detail::D::kBlockFlushStatus,                "BlockFlushStatus",                detail::A::kRead,      detail::E::kBoolean,      false},
    {detail::D::kCleaningMode,                    "CleaningMode",                    detail::A::kWrite,     detail::E::kEnumerated,   false},
    {detail::D::kCleaningModeStatus,              "CleaningModeStatus",              detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kPreFlush,                        "PreFlush",                        detail::A::kReadWrite, detail::E::kBoolean,      false},
    {detail::D::kPostFlush,                       "PostFlush",                       detail::A::kReadWrite, detail::E::kBoolean,      false},
    {detail::D::kManualFlush,                     "ManualFlush",                     detail::A::kWrite,     detail::E::kBoolean,      false},
    {detail::D::kAutomaticFlush,                  "AutomaticFlush",                  detail::A::kReadWrite, detail::E::kBoolean,      false},
    {detail::D::kFlush,                           "Flush",                           detail::A::kWrite,     detail::E::kBoolean,      false},
    {detail::D::kFlushStatus,                     "FlushStatus",                     detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kFullFlushVolume,                 "FullFlushVolume",                 detail::A::kReadWrite, detail::E::kCounter,      false},
    {detail::D::kPartFlushVolume,                 "PartFlushVolume",                 detail::A::kReadWrite, detail::E::kCounter,      false},

    {detail::D::kStartStopAnalShower,             "StartStopAnalShower",             detail::A::kWrite,     detail::E::kBoolean,      false},
    {detail::D::kAnalShowerStatus,                "AnalShowerStatus",                detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kAnalShowerProgress,              "AnalShowerProgress",              detail::A::kRead,      detail::E::kPercent,      false},
    {detail::D::kStartStopLadyShower,             "StartStopLadyShower",             detail::A::kWrite,     detail::E::kBoolean,      false},
    {detail::D::kSetActiveAnalSprayIntensity,     "SetActiveAnalSprayIntensity",     detail::A::kWrite,     detail::E::kEnumerated,   false},
    {detail::D::kActiveAnalSprayIntensityStatus,  "ActiveAnalSprayIntensityStatus",  detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kSetActiveAnalSprayArmPosition,   "SetActiveAnalSprayArmPosition",   detail::A::kWrite,     detail::E::kEnumerated,   false},
    {detail::D::kActiveAnalSprayArmPositionStatus, "ActiveAnalSprayArmPositionStatus", detail::A::kRead,    detail::E::kEnumerated,   false},
    {detail::D::kSetActiveShowerWaterTemperature, "SetActiveShowerWaterTemperature", detail::A::kWrite,     detail::E::kEnumerated,   false},
    {detail::D::kActiveShowerWaterTemperatureStatus, "ActiveShowerWaterTemperatureStatus", detail::A::kRead, detail::E::kEnumerated, false},
    {detail::D::kSetActiveAnalSprayArmOscillation, "SetActiveAnalSprayArmOscillation", detail::A::kWrite,   detail::E::kBoolean,      false},
    {detail::D::kActiveAnalSprayArmOscillationStatus, "ActiveAnalSprayArmOscillationStatus", detail::A::kRead, detail::E::kBoolean,   false},
    {detail::D::kStoredAnalSprayIntensity,        "StoredAnalSprayIntensity",        detail::A::kReadWrite, detail::E::kEnumerated,   false},
    {detail::D::kStoredAnalSprayArmPosition,      "StoredAnalSprayArmPosition",      detail::A::kReadWrite, detail::E::kEnumerated,   false},
    {detail::D::kStoredShowerWaterTemperature,    "StoredShowerWaterTemperature",    detail::A::kReadWrite, detail::E::kEnumerated,   false},
    {detail::D::kStoredAnalSprayArmOscillation,   "StoredAnalSprayArmOscillation",   detail::A::kReadWrite, detail::E::kBoolean,      false},
    {detail::D::kSetActiveAnalShowerTime,         "SetActiveAnalShowerTime",         detail::A::kWrite,     detail::E::kCounter,      false},
    {detail::D::kActiveAnalShowerTime,            "ActiveAnalShowerTime",            detail::A::kRead,      detail::E::kCounter,      false},
    {detail::D::kStoredAnalShowerTime,            "StoredAnalShowerTime",            detail::A::kReadWrite, detail::E::kCounter,      false},
    {detail::D::kSetActiveLadyShowerTime,         "SetActiveLadyShowerTime",         detail::A::kWrite,     detail::E::kCounter,      false},
    {detail::D::kSetActiveLadySprayIntensity,     "SetActiveLadySprayIntensity",     detail::A::kWrite,     detail::E::kEnumerated,   false},
    {detail::D::kLadyShowerStatus,                "LadyShowerStatus",                detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kLadyShowerProgress,              "LadyShowerProgress",              detail::A::kRead,      detail::E::kPercent,      false},

    {detail::D::kStartStopDrying,                 "StartStopDrying",                 detail::A::kWrite,     detail::E::kBoolean,      false},
    {detail::D::kDryingStatus,                    "DryingStatus",                    detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kDryingProgress,                  "DryingProgress",                  detail::A::kRead,      detail::E::kPercent,      false},
    {detail::D::kDryerFanSetIntensity,            "DryerFanSetIntensity",            detail::A::kWrite,     detail::E::kEnumerated,   false},
    {detail::D::kDryerFanIntensity,               "DryerFanIntensity",               detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kDryerHeaterSetTemperature,       "DryerHeaterSetTemperature",       detail::A::kWrite,     detail::E::kEnumerated,   false},
    {detail::D::kDryerHeaterTemperature,          "DryerHeaterTemperature",          detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kSetActiveDryerFanIntensity,      "SetActiveDryerFanIntensity",      detail::A::kWrite,     detail::E::kEnumerated,   false},
    {detail::D::kActiveDryerFanIntensityStatus,   "ActiveDryerFanIntensityStatus",   detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kStoredDryerFanIntensity,         "StoredDryerFanIntensity",         detail::A::kReadWrite, detail::E::kEnumerated,   false},

    {detail::D::kOrientationLightLed,             "OrientationLightLed",             detail::A::kRead,      detail::E::kBoolean,      true},
    {detail::D::kOrientationLightSetLed,          "OrientationLightSetLed",          detail::A::kWrite,     detail::E::kBoolean,      true},
    {detail::D::kOrientationLightMode,            "OrientationLightMode",            detail::A::kReadWrite, detail::E::kEnumerated,   true},
    {detail::D::kOrientationLightIntensity,       "OrientationLightIntensity",       detail::A::kReadWrite, detail::E::kPercent,      true},
    {detail::D::kLightingBrightnessAdjust,        "LightingBrightnessAdjust",        detail::A::kWrite,     detail::E::kSigned,       true},
    {detail::D::kLightingSetBrightness,           "LightingSetBrightness",           detail::A::kWrite,     detail::E::kPercent,      true},
    {detail::D::kLightingBrightnessStatus,        "LightingBrightnessStatus",        detail::A::kRead,      detail::E::kPercent,      true},
    {detail::D::kLedColor,                        "LedColor",                        detail::A::kReadWrite, detail::E::kBinary,       true},

    {detail::D::kOdourExtractionFan,              "OdourExtractionFan",              detail::A::kRead,      detail::E::kBoolean,      false},
    {detail::D::kOdourExtractionSetFan,           "OdourExtractionSetFan",           detail::A::kWrite,     detail::E::kBoolean,      false},
    {detail::D::kOdourExtractionMode,             "OdourExtractionMode",             detail::A::kReadWrite, detail::E::kEnumerated,   false},
    {detail::D::kOdourExtractionPower,            "OdourExtractionPower",            detail::A::kReadWrite, detail::E::kPercent,      false},
    {detail::D::kOdourExtractionFollowUpTime,     "OdourExtractionFollowUpTime",     detail::A::kReadWrite, detail::E::kCounter,      false},

    {detail::D::kStartStopDescaling,              "StartStopDescaling",              detail::A::kWrite,     detail::E::kBoolean,      false},
    {detail::D::kDescalingStatus,                 "DescalingStatus",                 detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kDescalingProgress,               "DescalingProgress",               detail::A::kRead,      detail::E::kPercent,      false},
    {detail::D::kWaterHardness,                   "WaterHardness",                   detail::A::kReadWrite, detail::E::kEnumerated,   false},
    {detail::D::kDaysUntilNextDescaling,          "DaysUntilNextDescaling",          detail::A::kRead,      detail::E::kCounter,      false},
    {detail::D::kTimestampOfLastDescaling,        "TimestampOfLastDescaling",        detail::A::kRead,      detail::E::kTimestampUtc, false},
    {detail::D::kDescalingResult,                 "DescalingResult",                 detail::A::kRead,      detail::E::kEnumerated,   false},

    {detail::D::kMaintenanceDone,                 "MaintenanceDone",                 detail::A::kWrite,     detail::E::kBinary,       false},
    {detail::D::kMaintenanceStatus,               "MaintenanceStatus",               detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kMaintenanceCountdown,            "MaintenanceCountdown",            detail::A::kRead,      detail::E::kCounter,      false},
    {detail::D::kStartStopSprayArmCleaning,       "StartStopSprayArmCleaning",       detail::A::kWrite,     detail::E::kBoolean,      false},
    {detail::D::kSprayArmCleaningStatus,          "SprayArmCleaningStatus",          detail::A::kRead,      detail::E::kEnumerated,   false},

    {detail::D::kStartSelfTest,                   "StartSelfTest",                   detail::A::kWrite,     detail::E::kBoolean,      false},
    {detail::D::kSelfTestStatus,                  "SelfTestStatus",                  detail::A::kRead,      detail::E::kEnumerated,   false},
    {detail::D::kCheckActuator,                   "CheckActuator",                   detail::A::kWrite,     detail::E::kBinary,       false},
    {detail::D::kLedTest,                         "LedTest",                         detail::A::kWrite,     detail::E::kBoolean,      false},
    {detail::D::kDiagnoseDeviceState,             "DiagnoseDeviceState",             detail::A::kRead,      detail::E::kBinary,       false},
    {detail::D::kCheckBuzzer,                     "CheckBuzzer",                     detail::A::kWrite,     detail::E::kBoolean,      false},
    {detail::D::kStartStopValveTest,              "StartStopValveTest",              detail::A::kWrite,     detail::E::kBoolean,      false},

    {detail::D::kOdourExtractionErrorStatus,      "OdourExtractionErrorStatus",      detail::A::kRead,      detail::E::kBinary,       false},
    {detail::D::kPowerSupplyErrorStatus,          "PowerSupplyErrorStatus",          detail::A::kRead,      detail::E::kBinary,       false},
    {detail::D::kGlobalError,                     "GlobalError",                     detail::A::kRead,      detail::E::kBinary,       false},
    {detail::D::kGlobalWarning,                   "GlobalWarning",                   detail::A::kRead,      detail::E::kBinary,       false},
    {detail::D::kTempSensErrorStatus,             "TempSensErrorStatus",             detail::A::kRead,      detail::E::kBinary,       false},
    {detail::D::kSeatHeaterErrorStatus,           "SeatHeaterErrorStatus",           detail::A::kRead,      detail::E::kBinary,       false},
};
// clang-format on

static constexpr uint32_t kDataPointCount =
    static_cast<uint32_t>(sizeof(kDataPointTable) / sizeof(kDataPointTable[0]));
static constexpr uint32_t kCommandCount =
    static_cast<uint32_t>(sizeof(kCommandTable) / sizeof(kCommandTable[0]));

// ============================================================================
// Lookup
// ============================================================================

/// nullptr if the id is not catalogued.
inline const DataPointInfo* FindDataPoint(uint16_t id) noexcept {
  for (uint32_t i = 0; i < kDataPointCount; ++i) {
    if (static_cast<uint16_t>(kDataPointTable[i].id) == id) {
      return &kDataPointTable[i];
    }
  }
  return nullptr;
}

inline const DataPointInfo* FindDataPoint(DataPointId id) noexcept {
  return FindDataPoint(static_cast<uint16_t>(id));
}

inline const DataPointInfo* FindDataPointByName(const char* name) noexcept {
  if (name == nullptr) return nullptr;
  for (uint32_t i = 0; i < kDataPointCount; ++i) {
    if (std::strcmp(kDataPointTable[i].name, name) == 0) {
      return &kDataPointTable[i];
    }
  }
  return nullptr;
}

inline const CommandInfo* FindCommand(uint16_t id) noexcept {
  for (uint32_t i = 0; i < kCommandCount; ++i) {
    if (static_cast<uint16_t>(kCommandTable[i].id) == id) {
      return &kCommandTable[i];
    }
  }
  return nullptr;
}

inline const CommandInfo* FindCommandByName(const char* name) noexcept {
  if (name == nullptr) return nullptr;
  for (uint32_t i = 0; i < kCommandCount; ++i) {
    if (std::strcmp(kCommandTable[i].name, name) == 0) {
      return &kCommandTable[i];
    }
  }
  return nullptr;
}

inline const char* ToString(HighLevelCommand cmd) noexcept {
  const CommandInfo* info = FindCommand(static_cast<uint16_t>(cmd));
  return (info != nullptr) ? info->name : "Unknown";
}

inline const char* ToString(DataPointId id) noexcept {
  const DataPointInfo* info = FindDataPoint(id);
  return (info != nullptr) ? info->name : "Unknown";
}

inline const char* ToString(DataPointEncoding enc) noexcept {
  switch (enc) {
    case DataPointEncoding::kBinary:
      return "Binary";
    case DataPointEncoding::kBoolean:
      return "OffOn";
    case DataPointEncoding::kEnumerated:
      return "Enum";
    case DataPointEncoding::kPercent:
      return "Percent";
    case DataPointEncoding::kCounter:
      return "Counter";
    case DataPointEncoding::kText:
      return "String";
    case DataPointEncoding::kTimestampUtc:
      return "TimeStampUtc";
    case DataPointEncoding::kSigned:
      return "Signed";
    default:
      return "Unknown";
  }
}

}  // namespace seatlink

#endif  // SEATLINK_CATALOGUE_HPP_
