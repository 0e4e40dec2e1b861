// File: include/cogsim/core/model/domain_table.hpp
#pragma once

#include <limits>

namespace cogsim {

// -----------------------------
// Building blocks
// -----------------------------

struct Range {
  double lo = 0.0;
  double hi = 0.0;
};

enum class Rounding {
  kNearest,      // counts: nearest integer
  kTruncate,     // millisecond durations: toward zero
  kOneDecimal,
  kTwoDecimals,  // rates and scores
};

// Per-session output field: one Gaussian draw, then rounding, then clipping.
struct FieldSpec {
  const char* name;
  double noise_sd;
  double lo;
  double hi;
  Rounding rounding;
};

// Per-patient latent baseline:
//   N(intercept + cf_slope * factor + dep_slope * dep_penalty, sd), clipped to [lo, hi].
// Without a profile, `factor` is drawn from `prior_factor` for that domain alone.
struct BaselineSpec {
  double intercept;
  double cf_slope;
  double dep_slope;
  double sd;
  double lo;
  double hi;
};

enum class PracticeForm {
  kAdditive,    // practice value = gain * practiced days, added along the field's direction
  kMultiplier,  // practice value = min(1, floor + gain * practiced days), scales the baseline
};

// Phase layout shared by every field of a domain:
//   day <= practice_cutoff                      practice
//   practice_cutoff < day <= decline_threshold  plateau
//   day > decline_threshold                     decline (only when gated on)
// Decline is gated on cf < impairment_cutoff AND a per-patient Bernoulli(decline_probability).
struct TrendSpec {
  PracticeForm form;
  int practice_cutoff;
  int decline_threshold;
  double impairment_cutoff;
  double decline_probability;
  double multiplier_floor;  // kMultiplier only
};

// Per-field trend rates, sampled once per patient.
struct FieldTrendSpec {
  Range practice_gain;
  Range decline_rate;
};

struct IntradayWindow {
  int hour_lo;
  int hour_hi;
  int minute_lo;
  int minute_hi;
};

constexpr double kUnbounded = std::numeric_limits<double>::max();

// Depression penalty shared by every domain: min(cap, depression_score * per_point).
constexpr double kDepressionPenaltyPerPoint = 0.005;
constexpr double kDepressionPenaltyCap = 0.15;

namespace tables {

// Sparse (historical) sessions use one window for every domain.
constexpr IntradayWindow kHistoricalWindow{8, 18, 0, 59};

// ============================================================
// Composite (multi-domain) session
// ============================================================
namespace composite {

constexpr TrendSpec kTrend{PracticeForm::kMultiplier, /*practice_cutoff=*/4, /*decline_threshold=*/20,
                           /*impairment_cutoff=*/0.55, /*decline_probability=*/1.0,
                           /*multiplier_floor=*/0.75};
// Multiplier gain per practiced day; decline factor per day past the threshold.
constexpr FieldTrendSpec kFieldTrend{{0.07, 0.07}, {0.05, 0.05}};

constexpr IntradayWindow kWindow{8, 8, 0, 50};

constexpr BaselineSpec kAttentionSpan{4.0, 3.0, -1.5, 0.55, 2.0, 8.0};
constexpr BaselineSpec kAttentionLatency{1.65, -0.85, 0.4, 0.14, 0.6, 3.0};
constexpr BaselineSpec kExecFluency{12.0, 14.0, -6.0, 2.8, 3.0, 40.0};
constexpr BaselineSpec kExecPause{1420.0, -620.0, 220.0, 170.0, 300.0, 3000.0};
constexpr BaselineSpec kExecArticulation{1.38, 0.92, -0.25, 0.18, 0.6, 3.5};
constexpr BaselineSpec kMemoryImmediate{2.9, 2.0, -1.2, 0.48, 0.0, 5.0};
// Gap subtracted from the immediate baseline to get the delayed baseline.
constexpr BaselineSpec kMemoryDelayGap{0.9, -0.7, 0.3, 0.37, -kUnbounded, kUnbounded};
constexpr BaselineSpec kReactionTime{905.0, -355.0, 140.0, 58.0, 350.0, 1500.0};
constexpr BaselineSpec kSentiment{0.47, 0.25, -1.1, 0.09, 0.0, 1.0};
constexpr BaselineSpec kNarrative{0.5, 0.34, -0.8, 0.09, 0.0, 1.0};

constexpr FieldSpec kDigitSpan{"digit_span_max", 0.5, 2.0, 8.0, Rounding::kNearest};
constexpr FieldSpec kLatency{"latency_sec", 0.12, 0.6, 4.0, Rounding::kTwoDecimals};
constexpr FieldSpec kAttentionErrors{"errors", 0.0, 0.0, 10.0, Rounding::kTruncate};
constexpr FieldSpec kFluency{"verbal_fluency_words", 3.0, 3.0, 60.0, Rounding::kNearest};
constexpr FieldSpec kArticulation{"articulation_rate_wps", 0.15, 0.6, 4.0, Rounding::kTwoDecimals};
constexpr FieldSpec kPause{"avg_pause_ms", 160.0, 300.0, 4000.0, Rounding::kTruncate};
constexpr FieldSpec kImmediate{"immediate_recall", 0.6, 0.0, 5.0, Rounding::kNearest};
constexpr FieldSpec kDelayed{"delayed_recall", 0.7, 0.0, 5.0, Rounding::kNearest};
constexpr FieldSpec kReaction{"avg_reaction_time_ms", 50.0, 350.0, 2500.0, Rounding::kTruncate};
constexpr FieldSpec kMissedTrials{"missed_trials", 0.0, 0.0, 20.0, Rounding::kTruncate};
constexpr FieldSpec kSentimentScore{"sentiment_score", 0.07, 0.0, 1.0, Rounding::kTwoDecimals};
constexpr FieldSpec kNarrativeCoherence{"narrative_coherence", 0.08, 0.0, 1.0, Rounding::kTwoDecimals};

// Trend weights (how strongly the decline factor moves each field).
constexpr double kSpanDecline = 1.0;
constexpr double kLatencyDecline = 0.2;
constexpr double kFluencyDecline = 2.0;
constexpr double kArticulationDecline = 0.05;
constexpr double kPauseDecline = 120.0;
constexpr double kImmediateDecline = 0.2;
constexpr double kDelayedDecline = 0.35;
constexpr double kReactionDecline = 40.0;
constexpr double kSentimentPractice = 0.05;
constexpr double kSentimentDecline = 0.02;
constexpr double kNarrativePractice = 0.06;
constexpr double kNarrativeDecline = 0.03;

// Mood fields lose this much per unit of depression / 30.
constexpr double kSentimentDepression = 0.15;
constexpr double kNarrativeDepression = 0.12;

// Orientation: p = base + (cf - pivot) * cf_weight - decline * decline_weight.
constexpr double kDateBase = 0.85;
constexpr double kDateCfWeight = 0.25;
constexpr double kDateDecline = 0.05;
constexpr double kCityBase = 0.80;
constexpr double kCityCfWeight = 0.30;
constexpr double kCityDecline = 0.07;

constexpr int kMemoryMaxWords = 5;

}  // namespace composite

// ============================================================
// Executive function (Trail Making Test B + symbol digit)
// ============================================================
namespace executive {

constexpr TrendSpec kTrend{PracticeForm::kAdditive, 4, 10, 0.6, 1.0, 0.0};
constexpr IntradayWindow kWindow{9, 14, 0, 59};
constexpr Range kPriorFactor{0.55, 0.95};

constexpr BaselineSpec kTmt{170.0, -80.0, 60.0, 15.0, 65.0, 260.0};
constexpr BaselineSpec kSdmt{30.0, 30.0, -10.0, 4.0, 15.0, 70.0};

// Seconds faster / items gained per practiced day; worsening per decline day.
constexpr FieldTrendSpec kTmtTrend{{0.5, 1.5}, {0.05, 0.25}};
constexpr FieldTrendSpec kSdmtTrend{{0.6, 1.4}, {0.05, 0.20}};

constexpr FieldSpec kTmtField{"tmt_b_completion_sec", 6.0, 55.0, 300.0, Rounding::kNearest};
constexpr FieldSpec kSdmtField{"symbol_digit_correct", 2.5, 10.0, 80.0, Rounding::kNearest};
constexpr FieldSpec kErrorsField{"errors", 1.0, 0.0, 12.0, Rounding::kTruncate};

// errors ~ N((tmt - pivot) / scale, sd)
constexpr double kErrorsTmtPivot = 60.0;
constexpr double kErrorsTmtScale = 50.0;

constexpr FieldSpec kSignalQuality{"signal_quality", 0.02, 0.8, 1.0, Rounding::kTwoDecimals};
constexpr double kSignalQualityMean = 0.95;

}  // namespace executive

// ============================================================
// Memory (MoCA 5-word recall)
// ============================================================
namespace memory {

constexpr TrendSpec kTrend{PracticeForm::kAdditive, 2, 15, 0.6, 0.5, 0.0};
constexpr IntradayWindow kWindow{10, 12, 0, 59};
constexpr Range kPriorFactor{0.45, 0.95};

constexpr BaselineSpec kImmediate{3.2, 1.5, -1.2, 0.6, 0.5, 5.0};
constexpr BaselineSpec kDelayGap{0.8, -0.9, 0.3, 0.4, -kUnbounded, kUnbounded};

// Practice gain is fixed; the delayed-recall decline rate is sampled and
// immediate recall declines at a fixed share of it.
constexpr FieldTrendSpec kDelayedTrend{{0.20, 0.20}, {0.02, 0.08}};
constexpr double kImmediatePracticeGain = 0.25;
constexpr double kImmediateDeclineShare = 0.4;

constexpr FieldSpec kImmediateField{"immediate_recall_correct", 0.5, 0.0, 5.0, Rounding::kNearest};
constexpr FieldSpec kDelayedField{"delayed_recall_correct", 0.6, 0.0, 5.0, Rounding::kNearest};

constexpr int kMaxWords = 5;

constexpr Range kSignalQuality{0.9, 1.0};

}  // namespace memory

// ============================================================
// Language (verbal fluency)
// ============================================================
namespace language {

constexpr TrendSpec kTrend{PracticeForm::kAdditive, 3, 20, 0.6, 0.5, 0.0};
constexpr IntradayWindow kWindow{8, 11, 0, 59};
constexpr Range kPriorFactor{0.55, 0.95};

constexpr BaselineSpec kFluency{10.0, 10.0, -6.0, 5.0, 5.0, 40.0};
constexpr BaselineSpec kPause{1700.0, -625.0, 220.0, 300.0, 400.0, 3000.0};
constexpr BaselineSpec kArticulation{1.5, 0.875, -0.25, 0.4, 0.8, 3.5};
constexpr BaselineSpec kSentiment{0.35, 0.25, -1.1, 0.15, 0.1, 0.95};

constexpr FieldTrendSpec kFluencyTrend{{0.2, 0.6}, {0.02, 0.06}};
constexpr FieldTrendSpec kArticulationTrend{{0.01, 0.03}, {0.001, 0.004}};
constexpr FieldTrendSpec kSentimentTrend{{0.0, 0.01}, {0.001, 0.003}};

constexpr FieldSpec kFluencyField{"verbal_fluency_words", 3.0, 3.0, 45.0, Rounding::kNearest};
constexpr FieldSpec kArticulationField{"articulation_rate_wps", 0.15, 0.6, 3.8, Rounding::kTwoDecimals};
constexpr FieldSpec kPauseField{"avg_pause_ms", 250.0, 300.0, 4000.0, Rounding::kNearest};
constexpr FieldSpec kSentimentField{"sentiment_score", 0.07, 0.0, 1.0, Rounding::kTwoDecimals};

// Audio capture quality.
constexpr double kSignalFloor = 0.75;
constexpr double kLongPauseMs = 2500.0;
constexpr double kSlowArticulationWps = 1.0;
constexpr double kSignalPenalty = 0.05;
constexpr double kSignalJitter = 0.05;

}  // namespace language

// ============================================================
// Mobility (wearable)
// ============================================================
namespace mobility {

constexpr TrendSpec kTrend{PracticeForm::kAdditive, 0, 20, 0.55, 0.5, 0.0};
constexpr IntradayWindow kWindow{6, 22, 0, 59};
constexpr Range kPriorFactor{0.55, 0.95};

constexpr BaselineSpec kGaitSpeed{0.6, 0.4, 0.0, 0.12, 0.4, 1.5};
constexpr BaselineSpec kStrideVariability{24.0, -12.0, 0.0, 4.0, 5.0, 30.0};
constexpr BaselineSpec kDailySteps{1500.0, 3000.0, 0.0, 1200.0, 500.0, 15000.0};

constexpr FieldTrendSpec kGaitTrend{{0.0, 0.0}, {0.002, 0.006}};
constexpr FieldTrendSpec kStrideTrend{{0.0, 0.0}, {0.05, 0.15}};
constexpr FieldTrendSpec kStepsTrend{{0.0, 0.0}, {10.0, 40.0}};

constexpr FieldSpec kGaitField{"gait_speed_mps", 0.08, 0.4, 1.5, Rounding::kTwoDecimals};
constexpr FieldSpec kStrideField{"stride_variability_pct", 3.0, 5.0, 30.0, Rounding::kOneDecimal};
constexpr FieldSpec kStepsField{"daily_steps", 900.0, 500.0, 15000.0, Rounding::kTruncate};

// Fall probability rises as gait slows below the pivot.
constexpr double kFallBase = 0.02;
constexpr double kFallGaitPivot = 0.7;
constexpr double kFallGaitWeight = 0.1;

constexpr Range kSignalQuality{0.85, 1.0};

}  // namespace mobility

}  // namespace tables
}  // namespace cogsim
