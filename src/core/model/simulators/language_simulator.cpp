// File: src/core/model/simulators/language_simulator.cpp
#include <algorithm>
#include <memory>

#include "cogsim/core/model/coupling.hpp"
#include "cogsim/core/model/domain_baselines.hpp"
#include "cogsim/core/model/noise.hpp"
#include "cogsim/core/model/simulator.hpp"
#include "cogsim/core/model/trend.hpp"

namespace cogsim {
namespace {

namespace t = tables::language;

class LanguagePatient final : public PatientModel {
 public:
  LanguagePatient(LanguageBaseline base, TrendModel trend, FieldTrend fluency, FieldTrend articulation,
                  FieldTrend sentiment)
      : base_(base), trend_(trend), fluency_(fluency), articulation_(articulation), sentiment_(sentiment) {}

  SessionSample session(int day, Rng& rng) const override {
    LanguageMetrics out;

    const double fluency_mean = trend_.apply(base_.fluency, fluency_, Direction::kHigherIsBetter, day);
    const double artic_mean = trend_.apply(base_.articulation, articulation_, Direction::kHigherIsBetter, day);
    const double sentiment_mean = trend_.apply(base_.sentiment, sentiment_, Direction::kHigherIsBetter, day);
    const double pause_mean = coupling::pause_from_fluency(base_.pause_ms, base_.fluency, fluency_mean);

    out.verbal_fluency_words = observe_count(t::kFluencyField, fluency_mean, rng);
    out.articulation_rate_wps = observe(t::kArticulationField, artic_mean, rng);
    out.avg_pause_ms = observe_count(t::kPauseField, pause_mean, rng);
    out.sentiment_score = observe(t::kSentimentField, sentiment_mean, rng);

    // Audio capture degrades with very long pauses or slow speech.
    double penalty = 0.0;
    if (out.avg_pause_ms > t::kLongPauseMs) penalty += t::kSignalPenalty;
    if (out.articulation_rate_wps < t::kSlowArticulationWps) penalty += t::kSignalPenalty;
    const double jitter = rng.uniform(0.0, t::kSignalJitter);
    const double quality = round_value(std::max(t::kSignalFloor, 1.0 - penalty - jitter), Rounding::kTwoDecimals);

    return SessionSample{out, quality};
  }

  bool decline_active() const override { return trend_.decline_active(); }

 private:
  LanguageBaseline base_;
  TrendModel trend_;
  FieldTrend fluency_;
  FieldTrend articulation_;
  FieldTrend sentiment_;
};

class LanguageSimulator final : public DomainSimulator {
 public:
  SimulatorKind kind() const override { return SimulatorKind::kLanguage; }
  DeviceRole device_role() const override { return DeviceRole::kSpeech; }
  IntradayWindow intraday_window() const override { return t::kWindow; }

  std::unique_ptr<PatientModel> make_patient(const PatientFactors& factors, Rng& rng) const override {
    const LanguageBaseline base = derive_language_baseline(factors, rng);
    const TrendModel trend = TrendModel::for_patient(t::kTrend, base.factor, rng);
    const FieldTrend fluency = sample_field_trend(t::kFluencyTrend, rng);
    const FieldTrend articulation = sample_field_trend(t::kArticulationTrend, rng);
    const FieldTrend sentiment = sample_field_trend(t::kSentimentTrend, rng);
    return std::make_unique<LanguagePatient>(base, trend, fluency, articulation, sentiment);
  }
};

}  // namespace

std::unique_ptr<DomainSimulator> make_language_simulator() {
  return std::make_unique<LanguageSimulator>();
}

}  // namespace cogsim
