// File: include/cogsim/core/model/engine.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "cogsim/core/config.hpp"
#include "cogsim/core/io/session_record.hpp"
#include "cogsim/core/status.hpp"
#include "cogsim/core/types.hpp"

namespace cogsim {

// Everything the engine needs, already parsed and validated.
struct GenerationRequest {
  SimulatorKind simulator = SimulatorKind::kComposite;
  ScheduleKind schedule = ScheduleKind::kDaily;

  std::size_t patients = 0;
  int days = 0;
  CivilDate start_date;
  std::uint64_t seed = 0;

  bool use_all_profiles = false;
  int workers = 1;

  HistoricalConfig historical;
  CouplingConfig coupling;
};

// `seed` is the resolved seed (config value or a fresh entropy seed).
Result<GenerationRequest> make_request(const Config& cfg, std::uint64_t seed);

// Sessions per patient: `days` for the daily schedule, records_per_patient otherwise.
std::size_t sessions_per_patient(const GenerationRequest& req);

struct GenerationResult {
  std::vector<SessionRecord> records;  // patient order, then time order
  std::vector<std::string> warnings;
  std::vector<std::string> skipped;  // one reason per patient dropped during generation

  std::size_t patients_requested = 0;
  std::size_t patients_used = 0;     // after reconciling with the profiles
  std::size_t patients_skipped = 0;  // rejected during generation
  std::size_t expected_records = 0;  // patients_used * sessions_per_patient
};

// Runs the whole pipeline: identities, baselines, schedule, sessions.
// No I/O. `profiles` may be null (synthetic patients). Fatal errors (bad
// request, empty or inconsistent profiles) come back as a status; a patient
// whose profile cannot be used is skipped and reported in `skipped`.
// Output is identical for any worker count.
Result<GenerationResult> generate_sessions(const GenerationRequest& req,
                                           const std::vector<PatientProfile>* profiles);

}  // namespace cogsim
