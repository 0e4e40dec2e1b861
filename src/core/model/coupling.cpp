// File: src/core/model/coupling.cpp
#include "cogsim/core/model/coupling.hpp"

#include <algorithm>
#include <cmath>

#include "cogsim/core/model/domain_table.hpp"

namespace cogsim {
namespace coupling {

double intrusion_probability(const CouplingConfig& c, int immediate, int delayed, double cf,
                             int depression_score) {
  double p = c.intrusion_base;
  p += c.intrusion_gap_weight * std::max(0, immediate - delayed);
  p += c.intrusion_cf_weight * std::max(0.0, c.intrusion_cf_pivot - cf);
  if (c.intrusion_depression_scale > 0.0) {
    p += c.intrusion_depression_weight * (depression_score / c.intrusion_depression_scale);
  }
  return std::clamp(p, c.intrusion_min, c.intrusion_max);
}

int intrusion_errors(const CouplingConfig& c, int immediate, int delayed, double cf,
                     int depression_score, double u) {
  return u < intrusion_probability(c, immediate, delayed, cf, depression_score) ? 1 : 0;
}

double missed_trials_mean(const CouplingConfig& c, double reaction_time_ms) {
  return (reaction_time_ms - c.missed_trials_rt_threshold_ms) / c.missed_trials_rt_scale_ms;
}

double missed_trials(const CouplingConfig& c, int reaction_time_ms, double draw) {
  if (reaction_time_ms <= c.missed_trials_rt_threshold_ms) return 0.0;
  return std::max(0.0, std::trunc(draw));
}

double attention_errors_mean(const CouplingConfig& c, int digit_span) {
  return (c.attention_span_pivot - digit_span) * c.attention_error_weight;
}

double tmt_errors_mean(double tmt_sec) {
  return (tmt_sec - tables::executive::kErrorsTmtPivot) / tables::executive::kErrorsTmtScale;
}

double pause_from_fluency(double pause_base, double fluency_base, double fluency_mean) {
  return pause_base * (fluency_base / std::max(1.0, fluency_mean));
}

double orientation_probability(double base, double cf_pivot, double cf, double cf_weight,
                               double decline, double decline_weight) {
  return base + (cf - cf_pivot) * cf_weight - decline * decline_weight;
}

double fall_probability(double gait_speed_mps) {
  using namespace tables::mobility;
  return kFallBase + std::max(0.0, kFallGaitPivot - gait_speed_mps) * kFallGaitWeight;
}

int mood_score(double sentiment) {
  const double raw = std::round(3.0 + (sentiment - 0.5) * 4.0);
  return static_cast<int>(std::clamp(raw, 1.0, 5.0));
}

int orientation_correct(bool date_correct, bool city_correct) {
  return ((date_correct ? 1 : 0) + (city_correct ? 1 : 0)) * 4;
}

}  // namespace coupling
}  // namespace cogsim
