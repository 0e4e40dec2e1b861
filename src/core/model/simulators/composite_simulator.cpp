// File: src/core/model/simulators/composite_simulator.cpp
#include <algorithm>
#include <memory>

#include "cogsim/core/model/coupling.hpp"
#include "cogsim/core/model/domain_baselines.hpp"
#include "cogsim/core/model/noise.hpp"
#include "cogsim/core/model/simulator.hpp"
#include "cogsim/core/model/trend.hpp"

namespace cogsim {
namespace {

namespace t = tables::composite;

// One record carries six domain blocks. All blocks share a single practice
// multiplier and decline factor, so the whole session drifts together.
class CompositePatient final : public PatientModel {
 public:
  CompositePatient(const CouplingConfig& coupling, const PatientFactors& factors, CompositeBaseline base,
                   TrendModel trend, FieldTrend rates)
      : coupling_(coupling), factors_(factors), base_(base), trend_(trend), rates_(rates) {}

  SessionSample session(int day, Rng& rng) const override {
    const double m = trend_.practice_multiplier(rates_.practice_gain, day);
    const double d = trend_.decline_factor(rates_.decline_rate, day);
    const double cf = factors_.cf;

    CompositeMetrics out;

    // attention
    AttentionBlock& a = out.attention;
    a.digit_span_max = observe_count(t::kDigitSpan, base_.attention_span * m - t::kSpanDecline * d, rng);
    const double err_draw =
        rng.normal(coupling::attention_errors_mean(coupling_, a.digit_span_max), coupling_.attention_error_sd);
    a.errors = finish_count(t::kAttentionErrors, err_draw);
    a.latency_sec = observe(t::kLatency, base_.attention_latency / m + t::kLatencyDecline * d, rng);

    // executive function (speech task)
    ExecutiveBlock& e = out.executive_function;
    e.verbal_fluency_words = observe_count(t::kFluency, base_.exec_fluency * m - t::kFluencyDecline * d, rng);
    e.articulation_rate_wps =
        observe(t::kArticulation, base_.exec_articulation * m - t::kArticulationDecline * d, rng);
    e.avg_pause_ms = observe_count(t::kPause, base_.exec_pause / m + t::kPauseDecline * d, rng);

    // memory
    MemoryBlock& mem = out.memory;
    mem.immediate_recall =
        observe_count(t::kImmediate, base_.memory_immediate * m - t::kImmediateDecline * d, rng);
    mem.delayed_recall = std::min(
        mem.immediate_recall,
        observe_count(t::kDelayed, base_.memory_delayed * m - t::kDelayedDecline * d, rng));
    mem.intrusion_errors = coupling::intrusion_errors(coupling_, mem.immediate_recall, mem.delayed_recall, cf,
                                                      factors_.depression_score, rng.unit());

    // orientation
    OrientationBlock& o = out.orientation;
    const double p_date = coupling::orientation_probability(t::kDateBase, coupling_.orientation_cf_pivot, cf,
                                                            t::kDateCfWeight, d, t::kDateDecline);
    const double p_city = coupling::orientation_probability(t::kCityBase, coupling_.orientation_cf_pivot, cf,
                                                            t::kCityCfWeight, d, t::kCityDecline);
    o.date_correct = rng.unit() < p_date;
    o.city_correct = rng.unit() < p_city;
    o.orientation_correct = coupling::orientation_correct(o.date_correct, o.city_correct);

    // processing speed
    ProcessingSpeedBlock& ps = out.processing_speed;
    ps.avg_reaction_time_ms = observe_count(t::kReaction, base_.reaction_time / m + t::kReactionDecline * d, rng);
    const double missed_draw = rng.normal(coupling::missed_trials_mean(coupling_, ps.avg_reaction_time_ms),
                                          coupling_.missed_trials_sd);
    ps.missed_trials =
        finish_count(t::kMissedTrials, coupling::missed_trials(coupling_, ps.avg_reaction_time_ms, missed_draw));

    // mood / behaviour
    MoodBlock& mood = out.mood_behavior;
    const double dep_adj = factors_.depression_score / 30.0;
    mood.sentiment_score = observe(t::kSentimentScore,
                                   base_.sentiment + (m - 1.0) * t::kSentimentPractice -
                                       t::kSentimentDecline * d - dep_adj * t::kSentimentDepression,
                                   rng);
    mood.narrative_coherence = observe(t::kNarrativeCoherence,
                                       base_.narrative + (m - 1.0) * t::kNarrativePractice -
                                           t::kNarrativeDecline * d - dep_adj * t::kNarrativeDepression,
                                       rng);
    mood.mood_score = coupling::mood_score(mood.sentiment_score);

    return SessionSample{out, std::nullopt};
  }

  bool decline_active() const override { return trend_.decline_active(); }

 private:
  CouplingConfig coupling_;
  PatientFactors factors_;
  CompositeBaseline base_;
  TrendModel trend_;
  FieldTrend rates_;
};

class CompositeSimulator final : public DomainSimulator {
 public:
  explicit CompositeSimulator(const CouplingConfig& coupling) : coupling_(coupling) {}

  SimulatorKind kind() const override { return SimulatorKind::kComposite; }
  DeviceRole device_role() const override { return DeviceRole::kSpeech; }
  IntradayWindow intraday_window() const override { return t::kWindow; }

  std::unique_ptr<PatientModel> make_patient(const PatientFactors& factors, Rng& rng) const override {
    const CompositeBaseline base = derive_composite_baseline(factors, rng);
    const TrendModel trend = TrendModel::for_patient(t::kTrend, factors.cf, rng);
    const FieldTrend rates = sample_field_trend(t::kFieldTrend, rng);
    return std::make_unique<CompositePatient>(coupling_, factors, base, trend, rates);
  }

 private:
  CouplingConfig coupling_;
};

}  // namespace

std::unique_ptr<DomainSimulator> make_composite_simulator(const CouplingConfig& coupling) {
  return std::make_unique<CompositeSimulator>(coupling);
}

}  // namespace cogsim
