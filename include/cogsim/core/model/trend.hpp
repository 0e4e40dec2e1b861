// File: include/cogsim/core/model/trend.hpp
#pragma once

#include "cogsim/core/model/domain_table.hpp"
#include "cogsim/core/util/random.hpp"

namespace cogsim {

enum class TrendPhase {
  kPractice,
  kPlateau,
  kDecline,
};

enum class Direction {
  kHigherIsBetter,  // word counts, recall, symbol digit
  kLowerIsBetter,   // completion times, pauses, latencies
};

// Per-patient, per-field rates.
struct FieldTrend {
  double practice_gain = 0.0;
  double decline_rate = 0.0;
};

// Always draws both rates, whatever the patient's decline flag.
FieldTrend sample_field_trend(const FieldTrendSpec& spec, Rng& rng);

// Shared rise -> plateau -> optional decline model. One instance per patient
// and domain; immutable once built.
class TrendModel {
 public:
  TrendModel(const TrendSpec& spec, bool decline_active);

  // decline_active = cf < impairment_cutoff && Bernoulli(decline_probability).
  // The Bernoulli draw happens for every patient so streams do not depend on cf.
  static TrendModel for_patient(const TrendSpec& spec, double cf, Rng& rng);

  bool decline_active() const { return decline_active_; }
  const TrendSpec& spec() const { return spec_; }

  TrendPhase phase(int day) const;

  // min(day, practice_cutoff)
  int practiced_days(int day) const;

  // day - decline_threshold in the decline phase, else 0.
  int decline_days(int day) const;

  // Additive form: baseline moved by gain * practiced days toward "better" and by
  // rate * decline days toward "worse".
  double apply(double baseline, const FieldTrend& f, Direction dir, int day) const;

  // Multiplier form: min(1, floor + gain * practiced days).
  double practice_multiplier(double gain, int day) const;

  // Multiplier form: rate * decline days.
  double decline_factor(double rate, int day) const;

 private:
  TrendSpec spec_;
  bool decline_active_;
};

}  // namespace cogsim
