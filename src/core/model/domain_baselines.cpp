// File: src/core/model/domain_baselines.cpp
#include "cogsim/core/model/domain_baselines.hpp"

#include <algorithm>

#include "cogsim/core/model/domain_table.hpp"

namespace cogsim {

CompositeBaseline derive_composite_baseline(const PatientFactors& f, Rng& rng) {
  namespace t = tables::composite;
  const double cf = f.cf;
  const double dp = f.dep_penalty;

  CompositeBaseline b;
  b.attention_span = draw_baseline(t::kAttentionSpan, cf, dp, rng);
  b.attention_latency = draw_baseline(t::kAttentionLatency, cf, dp, rng);
  b.exec_fluency = draw_baseline(t::kExecFluency, cf, dp, rng);
  b.exec_pause = draw_baseline(t::kExecPause, cf, dp, rng);
  b.exec_articulation = draw_baseline(t::kExecArticulation, cf, dp, rng);
  b.memory_immediate = draw_baseline(t::kMemoryImmediate, cf, dp, rng);
  const double gap = draw_baseline(t::kMemoryDelayGap, cf, dp, rng);
  b.memory_delayed = std::clamp(b.memory_immediate - gap, 0.0, b.memory_immediate);
  b.sentiment = draw_baseline(t::kSentiment, cf, dp, rng);
  b.narrative = draw_baseline(t::kNarrative, cf, dp, rng);
  b.reaction_time = draw_baseline(t::kReactionTime, cf, dp, rng);
  return b;
}

ExecutiveBaseline derive_executive_baseline(const PatientFactors& f, Rng& rng) {
  namespace t = tables::executive;
  ExecutiveBaseline b;
  b.factor = domain_factor(f, t::kPriorFactor, rng);
  b.tmt_sec = draw_baseline(t::kTmt, b.factor, f.dep_penalty, rng);
  b.symbol_digit = draw_baseline(t::kSdmt, b.factor, f.dep_penalty, rng);
  return b;
}

MemoryBaseline derive_memory_baseline(const PatientFactors& f, Rng& rng) {
  namespace t = tables::memory;
  MemoryBaseline b;
  b.factor = domain_factor(f, t::kPriorFactor, rng);
  b.immediate = draw_baseline(t::kImmediate, b.factor, f.dep_penalty, rng);
  const double gap = draw_baseline(t::kDelayGap, b.factor, f.dep_penalty, rng);
  b.delayed = std::clamp(b.immediate - gap, 0.0, b.immediate);
  return b;
}

LanguageBaseline derive_language_baseline(const PatientFactors& f, Rng& rng) {
  namespace t = tables::language;
  LanguageBaseline b;
  b.factor = domain_factor(f, t::kPriorFactor, rng);
  b.fluency = draw_baseline(t::kFluency, b.factor, f.dep_penalty, rng);
  b.pause_ms = draw_baseline(t::kPause, b.factor, f.dep_penalty, rng);
  b.articulation = draw_baseline(t::kArticulation, b.factor, f.dep_penalty, rng);
  b.sentiment = draw_baseline(t::kSentiment, b.factor, f.dep_penalty, rng);
  return b;
}

MobilityBaseline derive_mobility_baseline(const PatientFactors& f, Rng& rng) {
  namespace t = tables::mobility;
  MobilityBaseline b;
  b.factor = domain_factor(f, t::kPriorFactor, rng);
  // Depression does not enter the gait model.
  b.gait_speed = draw_baseline(t::kGaitSpeed, b.factor, 0.0, rng);
  b.stride_variability = draw_baseline(t::kStrideVariability, b.factor, 0.0, rng);
  b.daily_steps = draw_baseline(t::kDailySteps, b.factor, 0.0, rng);
  return b;
}

}  // namespace cogsim
