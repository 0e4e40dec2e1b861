// File: include/cogsim/core/io/session_record.hpp
#pragma once

#include <optional>
#include <variant>

#include "cogsim/core/types.hpp"

namespace cogsim {

// -----------------------------
// Composite session blocks
// -----------------------------

struct AttentionBlock {
  int digit_span_max = 0;
  int errors = 0;
  double latency_sec = 0.0;
};

struct ExecutiveBlock {
  int verbal_fluency_words = 0;
  double articulation_rate_wps = 0.0;
  int avg_pause_ms = 0;
};

struct MemoryBlock {
  int immediate_recall = 0;
  int delayed_recall = 0;
  int intrusion_errors = 0;
};

struct OrientationBlock {
  bool date_correct = false;
  bool city_correct = false;
  int orientation_correct = 0;  // 0, 4 or 8
};

struct ProcessingSpeedBlock {
  int avg_reaction_time_ms = 0;
  int missed_trials = 0;
};

struct MoodBlock {
  double sentiment_score = 0.0;
  double narrative_coherence = 0.0;
  int mood_score = 3;  // 1..5
};

struct CompositeMetrics {
  AttentionBlock attention;
  ExecutiveBlock executive_function;
  MemoryBlock memory;
  OrientationBlock orientation;
  ProcessingSpeedBlock processing_speed;
  MoodBlock mood_behavior;
};

// -----------------------------
// Single-domain metrics
// -----------------------------

struct ExecutiveFunctionMetrics {
  int tmt_b_completion_sec = 0;
  int errors = 0;
  int symbol_digit_correct = 0;
};

struct MemoryMetrics {
  int immediate_recall_correct = 0;
  int delayed_recall_correct = 0;
  int intrusion_errors = 0;
};

struct LanguageMetrics {
  int verbal_fluency_words = 0;
  int avg_pause_ms = 0;
  double articulation_rate_wps = 0.0;
  double sentiment_score = 0.0;
};

struct MobilityMetrics {
  double gait_speed_mps = 0.0;
  double stride_variability_pct = 0.0;
  int daily_steps = 0;
  bool fall_detected = false;
};

using SessionMetrics = std::variant<CompositeMetrics, ExecutiveFunctionMetrics, MemoryMetrics,
                                    LanguageMetrics, MobilityMetrics>;

// One synthetic assessment event. Created once by the engine, never mutated.
struct SessionRecord {
  PatientId patient_id;
  DeviceId device_id;

  EpochSeconds timestamp;
  bool utc_suffix = false;  // historical sessions are stamped with 'Z'

  int day_index = 0;  // days since the patient's first session

  SessionMetrics metrics;
  std::optional<double> signal_quality;
};

}  // namespace cogsim
