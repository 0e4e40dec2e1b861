// File: src/core/config.cpp
#include "cogsim/core/config.hpp"

#include <cstdint>

#include "cogsim/core/util/civil_time.hpp"

namespace cogsim {

Result<SimulatorKind> parse_simulator_kind(const std::string& s) {
  if (s == "composite" || s == "multidomain") return Result<SimulatorKind>::ok(SimulatorKind::kComposite);
  if (s == "executive_function") return Result<SimulatorKind>::ok(SimulatorKind::kExecutiveFunction);
  if (s == "memory") return Result<SimulatorKind>::ok(SimulatorKind::kMemory);
  if (s == "language") return Result<SimulatorKind>::ok(SimulatorKind::kLanguage);
  if (s == "mobility") return Result<SimulatorKind>::ok(SimulatorKind::kMobility);
  return Result<SimulatorKind>::err(Status::invalid_argument(
      "generator.simulator must be one of composite, executive_function, memory, language, mobility (got '" +
      s + "')"));
}

Result<ScheduleKind> parse_schedule_kind(const std::string& s) {
  if (s == "daily") return Result<ScheduleKind>::ok(ScheduleKind::kDaily);
  if (s == "historical") return Result<ScheduleKind>::ok(ScheduleKind::kHistorical);
  return Result<ScheduleKind>::err(
      Status::invalid_argument("generator.schedule must be 'daily' or 'historical' (got '" + s + "')"));
}

Status validate_config(const Config& cfg) {
  const auto& g = cfg.generator;
  // use_all_profiles takes the count from the profile collection.
  if (g.patients <= 0 && !g.use_all_profiles) {
    return Status::invalid_argument("generator.patients must be > 0");
  }
  if (g.days <= 0) {
    return Status::invalid_argument("generator.days must be > 0");
  }
  const auto date = parse_iso_date(g.start_date);
  if (!date.ok()) return date.status().annotate("generator.start_date");

  const auto sim = parse_simulator_kind(g.simulator);
  if (!sim.ok()) return sim.status();
  const auto sched = parse_schedule_kind(g.schedule);
  if (!sched.ok()) return sched.status();

  if (g.workers < 1) {
    return Status::invalid_argument("generator.workers must be >= 1");
  }

  const auto& h = cfg.historical;
  if (h.records_per_patient < 1) {
    return Status::invalid_argument("historical.records_per_patient must be >= 1");
  }
  if (h.min_gap_days < 1) {
    return Status::invalid_argument("historical.min_gap_days must be >= 1");
  }
  const std::int64_t span = static_cast<std::int64_t>(h.records_per_patient - 1) * h.min_gap_days;
  if (h.window_days < span) {
    return Status::invalid_argument(
        "historical.window_days cannot fit records_per_patient sessions min_gap_days apart");
  }

  const auto& c = cfg.coupling;
  if (c.intrusion_min < 0.0 || c.intrusion_max > 1.0 || c.intrusion_min > c.intrusion_max) {
    return Status::invalid_argument("coupling.intrusion_min/max must satisfy 0 <= min <= max <= 1");
  }
  if (c.intrusion_depression_scale <= 0.0) {
    return Status::invalid_argument("coupling.intrusion_depression_scale must be > 0");
  }
  if (c.missed_trials_rt_scale_ms <= 0.0) {
    return Status::invalid_argument("coupling.missed_trials_rt_scale_ms must be > 0");
  }
  if (c.missed_trials_sd < 0.0 || c.attention_error_sd < 0.0) {
    return Status::invalid_argument("coupling noise sd values must be >= 0");
  }

  if (cfg.output.out_dir.empty()) {
    return Status::invalid_argument("output.out_dir must not be empty");
  }
  if (cfg.output.format != "json" && cfg.output.format != "jsonl" && cfg.output.format != "csv") {
    return Status::invalid_argument("output.format must be 'json', 'jsonl' or 'csv'");
  }
  if (cfg.output.keep_run_logs < 1) {
    return Status::invalid_argument("output.keep_run_logs must be >= 1");
  }
  if (cfg.profile_synth.count <= 0) {
    return Status::invalid_argument("profile_synth.count must be > 0");
  }
  return Status::ok_status();
}

}  // namespace cogsim
