// File: src/core/model/engine.cpp
#include "cogsim/core/model/engine.hpp"

#include <algorithm>
#include <iterator>
#include <memory>
#include <optional>
#include <thread>

#include "cogsim/core/model/baseline.hpp"
#include "cogsim/core/model/identity.hpp"
#include "cogsim/core/model/schedule.hpp"
#include "cogsim/core/model/simulator.hpp"
#include "cogsim/core/util/civil_time.hpp"
#include "cogsim/core/util/random.hpp"

namespace cogsim {
namespace {

struct PatientOutcome {
  std::vector<SessionRecord> records;
  std::optional<std::string> skipped;  // reason, when the patient was dropped
};

PatientOutcome run_patient(const GenerationRequest& req, const DomainSimulator& sim,
                           const PatientIdentity& id, const std::vector<PatientProfile>* profiles,
                           std::size_t index) {
  PatientOutcome out;
  Rng rng(Rng::derive_seed(req.seed, RngStream::kPatient, index));

  PatientFactors factors;
  if (id.profile_index && profiles) {
    auto f = factors_from_profile((*profiles)[*id.profile_index]);
    if (!f.ok()) {
      out.skipped = "patient " + id.patient_id + " skipped: " + f.status().message();
      return out;
    }
    factors = f.value();
  } else {
    factors = sample_prior_factors(rng);
  }

  const std::unique_ptr<PatientModel> model = sim.make_patient(factors, rng);

  const bool historical = req.schedule == ScheduleKind::kHistorical;
  const std::vector<SessionSlot> slots =
      historical ? historical_schedule(req.start_date, req.historical, rng)
                 : daily_schedule(req.start_date, req.days, sim.intraday_window(), rng);

  out.records.reserve(slots.size());
  for (const SessionSlot& slot : slots) {
    SessionSample sample = model->session(slot.day_index, rng);

    SessionRecord r;
    r.patient_id = id.patient_id;
    r.device_id = id.device_id;
    r.timestamp = slot.timestamp;
    r.utc_suffix = historical;
    r.day_index = slot.day_index;
    r.metrics = std::move(sample.metrics);
    r.signal_quality = sample.signal_quality;
    out.records.push_back(std::move(r));
  }
  return out;
}

}  // namespace

Result<GenerationRequest> make_request(const Config& cfg, std::uint64_t seed) {
  const Status valid = validate_config(cfg);
  if (!valid.ok()) return Result<GenerationRequest>::err(valid);

  auto sim = parse_simulator_kind(cfg.generator.simulator);
  if (!sim.ok()) return Result<GenerationRequest>::err(sim.status());
  auto sched = parse_schedule_kind(cfg.generator.schedule);
  if (!sched.ok()) return Result<GenerationRequest>::err(sched.status());
  auto date = parse_iso_date(cfg.generator.start_date);
  if (!date.ok()) return Result<GenerationRequest>::err(date.status().annotate("generator.start_date"));

  GenerationRequest req;
  req.simulator = sim.value();
  req.schedule = sched.value();
  req.patients = static_cast<std::size_t>(std::max(0, cfg.generator.patients));
  req.days = cfg.generator.days;
  req.start_date = date.value();
  req.seed = seed;
  req.use_all_profiles = cfg.generator.use_all_profiles;
  req.workers = cfg.generator.workers;
  req.historical = cfg.historical;
  req.coupling = cfg.coupling;
  return Result<GenerationRequest>::ok(req);
}

std::size_t sessions_per_patient(const GenerationRequest& req) {
  const int n = req.schedule == ScheduleKind::kDaily ? req.days : req.historical.records_per_patient;
  return static_cast<std::size_t>(std::max(0, n));
}

Result<GenerationResult> generate_sessions(const GenerationRequest& req,
                                           const std::vector<PatientProfile>* profiles) {
  if (req.patients == 0 && !(req.use_all_profiles && profiles)) {
    return Result<GenerationResult>::err(
        Status::invalid_argument("patients must be > 0 unless every supplied profile is used"));
  }
  if (req.days <= 0) {
    return Result<GenerationResult>::err(Status::invalid_argument("days must be > 0"));
  }
  if (req.workers < 1) {
    return Result<GenerationResult>::err(Status::invalid_argument("workers must be >= 1"));
  }

  const std::unique_ptr<DomainSimulator> sim = make_simulator(req.simulator, req.coupling);
  if (!sim) return Result<GenerationResult>::err(Status::internal("no simulator for requested kind"));

  Rng identity_rng(Rng::derive_seed(req.seed, RngStream::kIdentity, 0));
  auto cohort_r = resolve_identities(req.patients, profiles, sim->device_role(), req.use_all_profiles, identity_rng);
  if (!cohort_r.ok()) return Result<GenerationResult>::err(cohort_r.status());
  ResolvedCohort cohort = cohort_r.take_value();

  GenerationResult result;
  result.patients_requested = req.patients;
  result.patients_used = cohort.patients.size();
  result.expected_records = result.patients_used * sessions_per_patient(req);
  result.warnings = std::move(cohort.warnings);

  // Each patient owns its generator, so the split across workers cannot change output.
  const std::size_t n = cohort.patients.size();
  std::vector<PatientOutcome> outcomes(n);
  const std::size_t workers = std::min<std::size_t>(static_cast<std::size_t>(req.workers), std::max<std::size_t>(1, n));

  auto work = [&](std::size_t w) {
    for (std::size_t i = w; i < n; i += workers) {
      outcomes[i] = run_patient(req, *sim, cohort.patients[i], profiles, i);
    }
  };

  if (workers <= 1) {
    work(0);
  } else {
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) pool.emplace_back(work, w);
    for (auto& t : pool) t.join();
  }

  result.records.reserve(result.expected_records);
  for (PatientOutcome& o : outcomes) {
    if (o.skipped) {
      ++result.patients_skipped;
      result.skipped.push_back(*o.skipped);
      continue;
    }
    std::move(o.records.begin(), o.records.end(), std::back_inserter(result.records));
  }
  return Result<GenerationResult>::ok(std::move(result));
}

}  // namespace cogsim
