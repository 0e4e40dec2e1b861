// File: include/cogsim/adapters/profile_synth/profile_synth.hpp
#pragma once

#include <string>
#include <vector>

#include "cogsim/core/types.hpp"
#include "cogsim/core/util/random.hpp"

namespace cogsim {

// Synthetic older-adult cohort used when no real profile collection exists.
//
// Per profile: ages 65..90 (triangular, mode 72) relative to `reference`,
// 0..5 comorbidities drawn by prevalence weight, one medication per
// comorbidity plus an occasional supplement, and a cognitive baseline shifted
// by education, mild cognitive impairment and depression. Device ids are
// positional: WEAR-001 / SPK-001 for the first profile.
struct ProfileSynthParams {
  int count{1000};
  CivilDate reference{2025, 9, 1};
};

std::vector<PatientProfile> synthesize_profiles(const ProfileSynthParams& params, Rng& rng);

// Exposed for tests.
std::vector<std::string> sample_comorbidities(Rng& rng);
std::vector<std::string> derive_medications(const std::vector<std::string>& comorbidities, Rng& rng);
CognitiveBaseline sample_cognitive_baseline(int education_years, bool has_mci, bool has_depression, Rng& rng);

}  // namespace cogsim
