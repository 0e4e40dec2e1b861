// File: include/cogsim/core/model/domain_baselines.hpp
#pragma once

#include "cogsim/core/model/baseline.hpp"
#include "cogsim/core/util/random.hpp"

namespace cogsim {

// Per-patient latent baselines, one struct per simulator. Derived once when
// the patient model is built and never changed afterwards. Every value is
// already clipped to its domain interval.

struct CompositeBaseline {
  double attention_span = 0.0;
  double attention_latency = 0.0;
  double exec_fluency = 0.0;
  double exec_pause = 0.0;
  double exec_articulation = 0.0;
  double memory_immediate = 0.0;
  double memory_delayed = 0.0;  // <= memory_immediate
  double reaction_time = 0.0;
  double sentiment = 0.0;
  double narrative = 0.0;
};

struct ExecutiveBaseline {
  double factor = 0.0;
  double tmt_sec = 0.0;
  double symbol_digit = 0.0;
};

struct MemoryBaseline {
  double factor = 0.0;
  double immediate = 0.0;
  double delayed = 0.0;  // <= immediate
};

struct LanguageBaseline {
  double factor = 0.0;
  double fluency = 0.0;
  double pause_ms = 0.0;
  double articulation = 0.0;
  double sentiment = 0.0;
};

struct MobilityBaseline {
  double factor = 0.0;
  double gait_speed = 0.0;
  double stride_variability = 0.0;
  double daily_steps = 0.0;
};

// The number of draws each function consumes does not depend on the factors,
// so two patients built from the same seed receive the same noise.
CompositeBaseline derive_composite_baseline(const PatientFactors& f, Rng& rng);
ExecutiveBaseline derive_executive_baseline(const PatientFactors& f, Rng& rng);
MemoryBaseline derive_memory_baseline(const PatientFactors& f, Rng& rng);
LanguageBaseline derive_language_baseline(const PatientFactors& f, Rng& rng);
MobilityBaseline derive_mobility_baseline(const PatientFactors& f, Rng& rng);

}  // namespace cogsim
