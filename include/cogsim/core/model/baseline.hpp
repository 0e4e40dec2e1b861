// File: include/cogsim/core/model/baseline.hpp
#pragma once

#include "cogsim/core/model/domain_table.hpp"
#include "cogsim/core/status.hpp"
#include "cogsim/core/types.hpp"
#include "cogsim/core/util/random.hpp"

namespace cogsim {

// Clinical inputs every domain baseline is conditioned on.
struct PatientFactors {
  double cf = 0.5;  // cognitive factor in [0.3, 1.0]
  int mmse = kDefaultMmse;
  int moca = kDefaultMoca;
  int depression_score = kDefaultDepressionScore;
  double dep_penalty = 0.0;

  // False when the scores were sampled from priors (no profile).
  bool from_profile = false;
};

// clamp((mmse + moca) / 60, 0.3, 1.0)
double cognitive_factor(int mmse, int moca);

// min(0.15, depression_score * 0.005)
double depression_penalty(int depression_score);

// Scores outside the clinical scales (mmse/moca 0..30, depression 0..27) are
// rejected with out_of_range; the caller skips that patient.
Result<PatientFactors> factors_from_profile(const PatientProfile& profile);

// Prior clinical scores for a patient without a profile:
// mmse U{22..29}, moca U{20..28}, depression U{0..14}.
PatientFactors sample_prior_factors(Rng& rng);

// Factor driving one domain block. With a profile this is cf; without one the
// domain draws its own factor from `prior` so domains stay uncorrelated.
// Always consumes one draw.
double domain_factor(const PatientFactors& f, const Range& prior, Rng& rng);

// N(intercept + cf_slope * factor + dep_slope * dep_penalty, sd) clipped to [lo, hi].
double draw_baseline(const BaselineSpec& spec, double factor, double dep_penalty, Rng& rng);

}  // namespace cogsim
