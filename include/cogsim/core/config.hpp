// include/cogsim/core/config.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "cogsim/core/status.hpp"
#include "cogsim/core/types.hpp"

namespace cogsim {

// -----------------------------
// Generation parameters
// -----------------------------
struct GeneratorConfig {
  std::string simulator = "composite";  // composite | executive_function | memory | language | mobility
  std::string schedule = "daily";       // daily | historical

  int patients = 1000;
  int days = 30;
  std::string start_date = "2025-09-01";  // YYYY-MM-DD

  // Unset: seeded from std::random_device and reported in the run log.
  std::optional<std::uint64_t> seed;

  // Ignore `patients` and use every available profile.
  bool use_all_profiles = false;

  // Permit running without any profile source (fresh random ids).
  bool allow_synthetic = false;

  // Record count != patients * sessions becomes fatal instead of a warning.
  bool strict_count = false;

  // Patient-level fan-out. Output is identical for any value.
  int workers = 1;
};

// -----------------------------
// Profile source
// -----------------------------
struct ProfilesConfig {
  // Explicit JSON array of profiles. Relative paths resolve against the config file.
  std::string path;

  // Look for patient_profiles.json in out_dir and next to the config file.
  bool search = false;
};

// -----------------------------
// Historical (sparse) schedule
// -----------------------------
struct HistoricalConfig {
  int records_per_patient = 5;
  int window_days = 365;   // window starts at generator.start_date
  int min_gap_days = 30;
};

// -----------------------------
// Cross-domain coupling constants
// -----------------------------
// Empirical defaults with no cited derivation. Tunable, not authoritative.
struct CouplingConfig {
  // Intrusion error probability.
  double intrusion_base = 0.10;
  double intrusion_gap_weight = 0.05;
  double intrusion_cf_pivot = 0.55;
  double intrusion_cf_weight = 0.16;
  double intrusion_depression_weight = 0.12;
  double intrusion_depression_scale = 30.0;
  double intrusion_min = 0.01;
  double intrusion_max = 0.40;

  // Missed trials from slow reaction times.
  double missed_trials_rt_threshold_ms = 600.0;
  double missed_trials_rt_scale_ms = 160.0;
  double missed_trials_sd = 0.6;

  // Attention errors from short digit spans.
  double attention_span_pivot = 6.0;
  double attention_error_weight = 0.6;
  double attention_error_sd = 0.7;

  // Orientation sub-items shift around this cognitive factor.
  double orientation_cf_pivot = 0.6;
};

// -----------------------------
// Output (records + run log)
// -----------------------------
struct OutputConfig {
  std::string out_dir = "out";
  std::string format = "json";  // json | jsonl | csv

  // Run logs (run_<ns>.jsonl) kept in out_dir; older ones are pruned.
  int keep_run_logs = 50;
};

// -----------------------------
// Synthetic profile generator
// -----------------------------
struct ProfileSynthConfig {
  int count = 1000;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  GeneratorConfig generator;
  ProfilesConfig profiles;
  HistoricalConfig historical;
  CouplingConfig coupling;
  OutputConfig output;
  ProfileSynthConfig profile_synth;
};

Result<SimulatorKind> parse_simulator_kind(const std::string& s);
Result<ScheduleKind> parse_schedule_kind(const std::string& s);

// Strict validation; fails before any generation starts.
Status validate_config(const Config& cfg);

}  // namespace cogsim
