// File: src/core/model/baseline.cpp
#include "cogsim/core/model/baseline.hpp"

#include <algorithm>
#include <string>

namespace cogsim {
namespace {

Status check_scale(const char* field, int v, int hi) {
  if (v < 0 || v > hi) {
    return Status::out_of_range(std::string("cognitive_baseline.") + field + "=" + std::to_string(v) +
                                " outside [0, " + std::to_string(hi) + "]");
  }
  return Status::ok_status();
}

}  // namespace

double cognitive_factor(int mmse, int moca) {
  const double raw = static_cast<double>(mmse + moca) / 60.0;
  return std::clamp(raw, 0.3, 1.0);
}

double depression_penalty(int depression_score) {
  return std::min(kDepressionPenaltyCap, depression_score * kDepressionPenaltyPerPoint);
}

Result<PatientFactors> factors_from_profile(const PatientProfile& profile) {
  const CognitiveBaseline& cb = profile.cognitive_baseline;

  Status s = check_scale("mmse", cb.mmse, 30);
  if (s.ok()) s = check_scale("moca", cb.moca, 30);
  if (s.ok()) s = check_scale("depression_score", cb.depression_score, 27);
  if (!s.ok()) return Result<PatientFactors>::err(s);

  PatientFactors f;
  f.mmse = cb.mmse;
  f.moca = cb.moca;
  f.depression_score = cb.depression_score;
  f.cf = cognitive_factor(f.mmse, f.moca);
  f.dep_penalty = depression_penalty(f.depression_score);
  f.from_profile = true;
  return Result<PatientFactors>::ok(f);
}

PatientFactors sample_prior_factors(Rng& rng) {
  PatientFactors f;
  f.mmse = rng.uniform_int(22, 29);
  f.moca = rng.uniform_int(20, 28);
  f.depression_score = rng.uniform_int(0, 14);
  f.cf = cognitive_factor(f.mmse, f.moca);
  f.dep_penalty = depression_penalty(f.depression_score);
  f.from_profile = false;
  return f;
}

double domain_factor(const PatientFactors& f, const Range& prior, Rng& rng) {
  const double drawn = rng.uniform(prior.lo, prior.hi);
  return f.from_profile ? f.cf : drawn;
}

double draw_baseline(const BaselineSpec& spec, double factor, double dep_penalty, Rng& rng) {
  const double mean = spec.intercept + spec.cf_slope * factor + spec.dep_slope * dep_penalty;
  return std::clamp(rng.normal(mean, spec.sd), spec.lo, spec.hi);
}

}  // namespace cogsim
