// File: src/core/model/simulators/mobility_simulator.cpp
#include <memory>

#include "cogsim/core/model/coupling.hpp"
#include "cogsim/core/model/domain_baselines.hpp"
#include "cogsim/core/model/noise.hpp"
#include "cogsim/core/model/simulator.hpp"
#include "cogsim/core/model/trend.hpp"

namespace cogsim {
namespace {

namespace t = tables::mobility;

// Daily wearable summary. No practice effect; gait slows and stride
// variability rises for declining patients.
class MobilityPatient final : public PatientModel {
 public:
  MobilityPatient(MobilityBaseline base, TrendModel trend, FieldTrend gait, FieldTrend stride, FieldTrend steps)
      : base_(base), trend_(trend), gait_(gait), stride_(stride), steps_(steps) {}

  SessionSample session(int day, Rng& rng) const override {
    MobilityMetrics out;

    out.gait_speed_mps =
        observe(t::kGaitField, trend_.apply(base_.gait_speed, gait_, Direction::kHigherIsBetter, day), rng);
    out.stride_variability_pct = observe(
        t::kStrideField, trend_.apply(base_.stride_variability, stride_, Direction::kLowerIsBetter, day), rng);
    out.daily_steps =
        observe_count(t::kStepsField, trend_.apply(base_.daily_steps, steps_, Direction::kHigherIsBetter, day), rng);
    out.fall_detected = rng.unit() < coupling::fall_probability(out.gait_speed_mps);

    const double quality =
        round_value(rng.uniform(t::kSignalQuality.lo, t::kSignalQuality.hi), Rounding::kTwoDecimals);
    return SessionSample{out, quality};
  }

  bool decline_active() const override { return trend_.decline_active(); }

 private:
  MobilityBaseline base_;
  TrendModel trend_;
  FieldTrend gait_;
  FieldTrend stride_;
  FieldTrend steps_;
};

class MobilitySimulator final : public DomainSimulator {
 public:
  SimulatorKind kind() const override { return SimulatorKind::kMobility; }
  DeviceRole device_role() const override { return DeviceRole::kWearable; }
  IntradayWindow intraday_window() const override { return t::kWindow; }

  std::unique_ptr<PatientModel> make_patient(const PatientFactors& factors, Rng& rng) const override {
    const MobilityBaseline base = derive_mobility_baseline(factors, rng);
    const TrendModel trend = TrendModel::for_patient(t::kTrend, base.factor, rng);
    const FieldTrend gait = sample_field_trend(t::kGaitTrend, rng);
    const FieldTrend stride = sample_field_trend(t::kStrideTrend, rng);
    const FieldTrend steps = sample_field_trend(t::kStepsTrend, rng);
    return std::make_unique<MobilityPatient>(base, trend, gait, stride, steps);
  }
};

}  // namespace

std::unique_ptr<DomainSimulator> make_mobility_simulator() {
  return std::make_unique<MobilitySimulator>();
}

}  // namespace cogsim
