// File: src/core/model/trend.cpp
#include "cogsim/core/model/trend.hpp"

#include <algorithm>

namespace cogsim {

FieldTrend sample_field_trend(const FieldTrendSpec& spec, Rng& rng) {
  FieldTrend f;
  f.practice_gain = rng.uniform(spec.practice_gain.lo, spec.practice_gain.hi);
  f.decline_rate = rng.uniform(spec.decline_rate.lo, spec.decline_rate.hi);
  return f;
}

TrendModel::TrendModel(const TrendSpec& spec, bool decline_active)
    : spec_(spec), decline_active_(decline_active) {}

TrendModel TrendModel::for_patient(const TrendSpec& spec, double cf, Rng& rng) {
  const bool coin = rng.bernoulli(spec.decline_probability);
  return TrendModel(spec, cf < spec.impairment_cutoff && coin);
}

TrendPhase TrendModel::phase(int day) const {
  if (day <= spec_.practice_cutoff) return TrendPhase::kPractice;
  if (decline_active_ && day > spec_.decline_threshold) return TrendPhase::kDecline;
  return TrendPhase::kPlateau;
}

int TrendModel::practiced_days(int day) const {
  return std::clamp(day, 0, spec_.practice_cutoff);
}

int TrendModel::decline_days(int day) const {
  return phase(day) == TrendPhase::kDecline ? day - spec_.decline_threshold : 0;
}

double TrendModel::apply(double baseline, const FieldTrend& f, Direction dir, int day) const {
  const double better = f.practice_gain * practiced_days(day) - f.decline_rate * decline_days(day);
  return dir == Direction::kHigherIsBetter ? baseline + better : baseline - better;
}

double TrendModel::practice_multiplier(double gain, int day) const {
  return std::min(1.0, spec_.multiplier_floor + gain * practiced_days(day));
}

double TrendModel::decline_factor(double rate, int day) const {
  return rate * decline_days(day);
}

}  // namespace cogsim
