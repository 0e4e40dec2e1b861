// File: src/core/model/simulators/memory_simulator.cpp
#include <algorithm>
#include <memory>

#include "cogsim/core/model/coupling.hpp"
#include "cogsim/core/model/domain_baselines.hpp"
#include "cogsim/core/model/noise.hpp"
#include "cogsim/core/model/simulator.hpp"
#include "cogsim/core/model/trend.hpp"

namespace cogsim {
namespace {

namespace t = tables::memory;

// MoCA-style five word recall. Delayed recall never exceeds immediate recall.
class MemoryPatient final : public PatientModel {
 public:
  MemoryPatient(const CouplingConfig& coupling, int depression_score, MemoryBaseline base, TrendModel trend,
                FieldTrend immediate, FieldTrend delayed)
      : coupling_(coupling),
        depression_score_(depression_score),
        base_(base),
        trend_(trend),
        immediate_(immediate),
        delayed_(delayed) {}

  SessionSample session(int day, Rng& rng) const override {
    MemoryMetrics out;

    const double imm_mean = trend_.apply(base_.immediate, immediate_, Direction::kHigherIsBetter, day);
    const double del_mean = trend_.apply(base_.delayed, delayed_, Direction::kHigherIsBetter, day);

    out.immediate_recall_correct = observe_count(t::kImmediateField, imm_mean, rng);
    out.delayed_recall_correct =
        std::min(out.immediate_recall_correct, observe_count(t::kDelayedField, del_mean, rng));
    out.intrusion_errors = coupling::intrusion_errors(coupling_, out.immediate_recall_correct,
                                                      out.delayed_recall_correct, base_.factor,
                                                      depression_score_, rng.unit());

    const double quality =
        round_value(rng.uniform(t::kSignalQuality.lo, t::kSignalQuality.hi), Rounding::kTwoDecimals);
    return SessionSample{out, quality};
  }

  bool decline_active() const override { return trend_.decline_active(); }

 private:
  CouplingConfig coupling_;
  int depression_score_;
  MemoryBaseline base_;
  TrendModel trend_;
  FieldTrend immediate_;
  FieldTrend delayed_;
};

class MemorySimulator final : public DomainSimulator {
 public:
  explicit MemorySimulator(const CouplingConfig& coupling) : coupling_(coupling) {}

  SimulatorKind kind() const override { return SimulatorKind::kMemory; }
  DeviceRole device_role() const override { return DeviceRole::kClinic; }
  IntradayWindow intraday_window() const override { return t::kWindow; }

  std::unique_ptr<PatientModel> make_patient(const PatientFactors& factors, Rng& rng) const override {
    const MemoryBaseline base = derive_memory_baseline(factors, rng);
    const TrendModel trend = TrendModel::for_patient(t::kTrend, base.factor, rng);
    const FieldTrend delayed = sample_field_trend(t::kDelayedTrend, rng);

    FieldTrend immediate;
    immediate.practice_gain = t::kImmediatePracticeGain;
    immediate.decline_rate = delayed.decline_rate * t::kImmediateDeclineShare;

    return std::make_unique<MemoryPatient>(coupling_, factors.depression_score, base, trend, immediate, delayed);
  }

 private:
  CouplingConfig coupling_;
};

}  // namespace

std::unique_ptr<DomainSimulator> make_memory_simulator(const CouplingConfig& coupling) {
  return std::make_unique<MemorySimulator>(coupling);
}

}  // namespace cogsim
