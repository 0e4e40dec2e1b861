// File: include/cogsim/core/model/coupling.hpp
#pragma once

#include "cogsim/core/config.hpp"

namespace cogsim {

// Cross-domain coupling. Every function here is pure: it only looks at values
// already computed for the same session (plus cf and depression). Callers
// draw the noise and pass it in where a quantity is stochastic.
namespace coupling {

// base + gap_weight * max(0, imm - del) + cf_weight * max(0, cf_pivot - cf)
//      + depression_weight * (depression / depression_scale),
// clipped to [intrusion_min, intrusion_max].
double intrusion_probability(const CouplingConfig& c, int immediate, int delayed, double cf,
                             int depression_score);

// Intrusion flag from a uniform draw in [0, 1).
int intrusion_errors(const CouplingConfig& c, int immediate, int delayed, double cf,
                     int depression_score, double u);

// (rt - threshold) / scale
double missed_trials_mean(const CouplingConfig& c, double reaction_time_ms);

// 0 unless rt > threshold; otherwise the drawn value truncated and floored at 0.
double missed_trials(const CouplingConfig& c, int reaction_time_ms, double draw);

// (span_pivot - span) * weight
double attention_errors_mean(const CouplingConfig& c, int digit_span);

// (tmt - 60) / 50
double tmt_errors_mean(double tmt_sec);

// Longer pauses when fluency falls below the patient's own baseline:
//   pause_base * fluency_base / max(1, fluency_mean)
double pause_from_fluency(double pause_base, double fluency_base, double fluency_mean);

// base + (cf - pivot) * cf_weight - decline * decline_weight
double orientation_probability(double base, double cf_pivot, double cf, double cf_weight,
                               double decline, double decline_weight);

// 0.02 + max(0, 0.7 - gait) * 0.1
double fall_probability(double gait_speed_mps);

// clamp(round(3 + (sentiment - 0.5) * 4), 1, 5)
int mood_score(double sentiment);

// (date + city) * 4, on the 0..8 scale the scoring endpoint expects.
int orientation_correct(bool date_correct, bool city_correct);

}  // namespace coupling
}  // namespace cogsim
