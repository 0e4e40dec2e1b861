// File: src/core/model/simulators/executive_function_simulator.cpp
#include <memory>

#include "cogsim/core/model/coupling.hpp"
#include "cogsim/core/model/domain_baselines.hpp"
#include "cogsim/core/model/noise.hpp"
#include "cogsim/core/model/simulator.hpp"
#include "cogsim/core/model/trend.hpp"

namespace cogsim {
namespace {

namespace t = tables::executive;

// Trail Making Test B (seconds, lower is better) plus symbol digit (items,
// higher is better). Errors follow completion time.
class ExecutivePatient final : public PatientModel {
 public:
  ExecutivePatient(ExecutiveBaseline base, TrendModel trend, FieldTrend tmt, FieldTrend sdmt)
      : base_(base), trend_(trend), tmt_(tmt), sdmt_(sdmt) {}

  SessionSample session(int day, Rng& rng) const override {
    ExecutiveFunctionMetrics out;

    const double tmt_mean = trend_.apply(base_.tmt_sec, tmt_, Direction::kLowerIsBetter, day);
    const double sdmt_mean = trend_.apply(base_.symbol_digit, sdmt_, Direction::kHigherIsBetter, day);

    out.tmt_b_completion_sec = observe_count(t::kTmtField, tmt_mean, rng);
    out.symbol_digit_correct = observe_count(t::kSdmtField, sdmt_mean, rng);
    out.errors = observe_count(t::kErrorsField, coupling::tmt_errors_mean(out.tmt_b_completion_sec), rng);

    const double quality = observe(t::kSignalQuality, t::kSignalQualityMean, rng);
    return SessionSample{out, quality};
  }

  bool decline_active() const override { return trend_.decline_active(); }

 private:
  ExecutiveBaseline base_;
  TrendModel trend_;
  FieldTrend tmt_;
  FieldTrend sdmt_;
};

class ExecutiveFunctionSimulator final : public DomainSimulator {
 public:
  SimulatorKind kind() const override { return SimulatorKind::kExecutiveFunction; }
  DeviceRole device_role() const override { return DeviceRole::kApp; }
  IntradayWindow intraday_window() const override { return t::kWindow; }

  std::unique_ptr<PatientModel> make_patient(const PatientFactors& factors, Rng& rng) const override {
    const ExecutiveBaseline base = derive_executive_baseline(factors, rng);
    const TrendModel trend = TrendModel::for_patient(t::kTrend, base.factor, rng);
    const FieldTrend tmt = sample_field_trend(t::kTmtTrend, rng);
    const FieldTrend sdmt = sample_field_trend(t::kSdmtTrend, rng);
    return std::make_unique<ExecutivePatient>(base, trend, tmt, sdmt);
  }
};

}  // namespace

std::unique_ptr<DomainSimulator> make_executive_function_simulator() {
  return std::make_unique<ExecutiveFunctionSimulator>();
}

}  // namespace cogsim
