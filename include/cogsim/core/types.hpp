// include/cogsim/core/types.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cogsim {

// -----------------------------
// Basic identifiers
// -----------------------------

using PatientId = std::string;  // usually a UUID
using DeviceId = std::string;   // e.g. "SPK-001"

// -----------------------------
// Time
// -----------------------------
// Session times are whole seconds since the Unix epoch, interpreted as UTC.
// Sub-second precision is never generated, so integers keep output stable.

struct EpochSeconds {
  std::int64_t s = 0;

  constexpr bool operator==(const EpochSeconds& other) const noexcept { return s == other.s; }
  constexpr bool operator!=(const EpochSeconds& other) const noexcept { return s != other.s; }
  constexpr bool operator<(const EpochSeconds& other) const noexcept { return s < other.s; }
  constexpr bool operator<=(const EpochSeconds& other) const noexcept { return s <= other.s; }
  constexpr bool operator>(const EpochSeconds& other) const noexcept { return s > other.s; }
  constexpr bool operator>=(const EpochSeconds& other) const noexcept { return s >= other.s; }
};

constexpr std::int64_t kSecondsPerDay = 86400;

// Run-log clock (nanoseconds). Not used for session times.
struct TimestampNs {
  std::int64_t ns = 0;
};

struct CivilDate {
  int year = 1970;
  int month = 1;  // 1..12
  int day = 1;    // 1..31

  constexpr bool operator==(const CivilDate& o) const noexcept {
    return year == o.year && month == o.month && day == o.day;
  }
};

// -----------------------------
// Devices
// -----------------------------

enum class DeviceRole {
  kWearable,
  kSpeech,
  kApp,
  kClinic,
};

// Key used under a profile's "device_ids" object.
inline const char* device_role_key(DeviceRole r) {
  switch (r) {
    case DeviceRole::kWearable: return "wearable";
    case DeviceRole::kSpeech: return "speech";
    case DeviceRole::kApp: return "app";
    case DeviceRole::kClinic: return "clinic";
  }
  return "unknown";
}

// Prefix for positionally synthesized device ids ("SPK-007").
inline const char* device_role_prefix(DeviceRole r) {
  switch (r) {
    case DeviceRole::kWearable: return "WEAR";
    case DeviceRole::kSpeech: return "SPK";
    case DeviceRole::kApp: return "APP";
    case DeviceRole::kClinic: return "CLIN";
  }
  return "DEV";
}

// -----------------------------
// Patient profiles (external input)
// -----------------------------

// Clinically typical values substituted when a profile omits a field.
constexpr int kDefaultMmse = 26;
constexpr int kDefaultMoca = 24;
constexpr int kDefaultDepressionScore = 6;

struct CognitiveBaseline {
  int mmse = kDefaultMmse;                        // 0..30
  int moca = kDefaultMoca;                        // 0..30
  int depression_score = kDefaultDepressionScore; // 0..27
};

struct PatientProfile {
  PatientId patient_id;  // may be empty if the source omitted it
  std::string name;
  std::string dob;       // YYYY-MM-DD
  std::string sex;
  int education_years = 0;
  std::vector<std::string> comorbidities;
  std::vector<std::string> medications;

  // role key ("wearable", "speech", "app", "clinic") -> device id
  std::map<std::string, DeviceId> device_ids;

  CognitiveBaseline cognitive_baseline;
  // True when any cognitive_baseline field was missing and defaulted.
  bool cognitive_baseline_defaulted = false;
};

// -----------------------------
// Simulators and schedules
// -----------------------------

enum class SimulatorKind {
  kComposite,
  kExecutiveFunction,
  kMemory,
  kLanguage,
  kMobility,
};

enum class ScheduleKind {
  kDaily,       // one session per calendar day
  kHistorical,  // sparse sessions, well spaced across a window
};

inline const char* simulator_name(SimulatorKind k) {
  switch (k) {
    case SimulatorKind::kComposite: return "composite";
    case SimulatorKind::kExecutiveFunction: return "executive_function";
    case SimulatorKind::kMemory: return "memory";
    case SimulatorKind::kLanguage: return "language";
    case SimulatorKind::kMobility: return "mobility";
  }
  return "unknown";
}

inline const char* schedule_name(ScheduleKind k) {
  return k == ScheduleKind::kDaily ? "daily" : "historical";
}

}  // namespace cogsim
