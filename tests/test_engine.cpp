// File: tests/test_engine.cpp
#include <catch2/catch.hpp>

#include <map>
#include <set>

#include "cogsim/core/io/record_codec.hpp"
#include "cogsim/core/model/engine.hpp"
#include "cogsim/core/util/repro_hash.hpp"
#include "test_support.hpp"

using namespace cogsim;
using cogsim::testing::make_profiles;
using cogsim::testing::make_test_request;

namespace {

GenerationResult run(const GenerationRequest& req, const std::vector<PatientProfile>* profiles) {
  auto r = generate_sessions(req, profiles);
  REQUIRE(r.ok());
  return r.take_value();
}

}  // namespace

TEST_CASE("same seed and inputs give identical output", "[engine][determinism]") {
  const auto profiles = make_profiles(12);
  for (SimulatorKind kind : {SimulatorKind::kComposite, SimulatorKind::kExecutiveFunction, SimulatorKind::kMemory,
                             SimulatorKind::kLanguage, SimulatorKind::kMobility}) {
    const GenerationRequest req = make_test_request(kind, 12, 10, 2024);
    const GenerationResult a = run(req, &profiles);
    const GenerationResult b = run(req, &profiles);
    REQUIRE(a.records.size() == b.records.size());
    CHECK(compute_records_digest(a.records, kind) == compute_records_digest(b.records, kind));
  }
}

TEST_CASE("different seeds give different output", "[engine][determinism]") {
  const auto profiles = make_profiles(5);
  const GenerationResult a = run(make_test_request(SimulatorKind::kComposite, 5, 10, 1), &profiles);
  const GenerationResult b = run(make_test_request(SimulatorKind::kComposite, 5, 10, 2), &profiles);
  CHECK(compute_records_digest(a.records, SimulatorKind::kComposite) !=
        compute_records_digest(b.records, SimulatorKind::kComposite));
}

TEST_CASE("worker count does not change output", "[engine][determinism]") {
  const auto profiles = make_profiles(23);
  GenerationRequest req = make_test_request(SimulatorKind::kLanguage, 23, 9, 77);
  const std::string serial = compute_records_digest(run(req, &profiles).records, SimulatorKind::kLanguage);
  for (int w : {2, 3, 8, 64}) {
    req.workers = w;
    CHECK(compute_records_digest(run(req, &profiles).records, SimulatorKind::kLanguage) == serial);
  }
}

TEST_CASE("record count is patients times days", "[engine][count]") {
  const GenerationResult res = run(make_test_request(SimulatorKind::kMobility, 7, 14), nullptr);
  CHECK(res.records.size() == 7 * 14);
  CHECK(res.expected_records == 7 * 14);
  CHECK(res.patients_used == 7);
  CHECK(res.warnings.empty());
}

TEST_CASE("profile ids are reused and each appears once per day", "[engine][identity]") {
  const auto profiles = make_profiles(6);
  const int days = 11;
  const GenerationResult res = run(make_test_request(SimulatorKind::kComposite, 6, days), &profiles);

  std::set<std::string> known;
  for (const auto& p : profiles) known.insert(p.patient_id);

  std::map<std::string, int> seen;
  for (const SessionRecord& r : res.records) {
    REQUIRE(known.count(r.patient_id) == 1);
    ++seen[r.patient_id];
  }
  CHECK(seen.size() == 6);
  for (const auto& [id, n] : seen) CHECK(n == days);

  // Patient order follows the profile order, days ascending.
  CHECK(res.records.front().patient_id == profiles.front().patient_id);
  CHECK(res.records.back().patient_id == profiles.back().patient_id);
  for (std::size_t i = 1; i < static_cast<std::size_t>(days); ++i) {
    CHECK(res.records[i].timestamp > res.records[i - 1].timestamp);
  }
}

TEST_CASE("shortage of profiles reduces patients with a warning", "[engine][shortage]") {
  const auto profiles = make_profiles(3);
  const GenerationResult res = run(make_test_request(SimulatorKind::kMemory, 10, 5), &profiles);
  CHECK(res.patients_requested == 10);
  CHECK(res.patients_used == 3);
  CHECK(res.records.size() == 3 * 5);
  CHECK(res.expected_records == res.records.size());
  bool warned = false;
  for (const std::string& w : res.warnings) warned = warned || w.find("only 3 profiles") != std::string::npos;
  CHECK(warned);
}

TEST_CASE("use_all_profiles takes the count from the profiles", "[engine][identity]") {
  const auto profiles = make_profiles(4);
  GenerationRequest req = make_test_request(SimulatorKind::kComposite, 0, 3);
  req.use_all_profiles = true;
  const GenerationResult res = run(req, &profiles);
  CHECK(res.patients_used == 4);
  CHECK(res.records.size() == 4 * 3);
  CHECK(res.expected_records == res.records.size());

  // Without profiles there is nothing to take the count from.
  CHECK(generate_sessions(req, nullptr).status().code() == Status::Code::kInvalidArgument);

  Config cfg;
  cfg.generator.patients = 0;
  cfg.generator.use_all_profiles = true;
  auto r = make_request(cfg, 9);
  REQUIRE(r.ok());
  CHECK(r.value().patients == 0u);
  CHECK(r.value().use_all_profiles);
}

TEST_CASE("a patient with an unusable profile is skipped", "[engine]") {
  auto profiles = make_profiles(4);
  profiles[2].cognitive_baseline.mmse = 45;
  const GenerationResult res = run(make_test_request(SimulatorKind::kExecutiveFunction, 4, 6), &profiles);
  CHECK(res.patients_skipped == 1);
  REQUIRE(res.skipped.size() == 1);
  CHECK(res.skipped.front().find(profiles[2].patient_id) != std::string::npos);
  CHECK(res.records.size() == 3 * 6);
  CHECK(res.expected_records == 4 * 6);
  for (const SessionRecord& r : res.records) CHECK(r.patient_id != profiles[2].patient_id);
}

TEST_CASE("historical schedule stamps UTC and spaces sessions", "[engine][historical]") {
  GenerationRequest req = make_test_request(SimulatorKind::kMemory, 4, 30);
  req.schedule = ScheduleKind::kHistorical;
  req.historical.records_per_patient = 5;
  req.historical.min_gap_days = 30;
  req.historical.window_days = 365;

  const GenerationResult res = run(req, nullptr);
  REQUIRE(res.records.size() == 4 * 5);
  CHECK(res.expected_records == 4 * 5);
  for (std::size_t i = 0; i < res.records.size(); ++i) {
    const SessionRecord& r = res.records[i];
    CHECK(r.utc_suffix);
    if (i % 5 != 0) CHECK(r.day_index - res.records[i - 1].day_index >= 30);
  }
  const std::string json = encode_record_json(res.records.front(), SimulatorKind::kMemory);
  CHECK(json.find("Z\"") != std::string::npos);
}

TEST_CASE("invalid requests fail before generation", "[engine]") {
  GenerationRequest req = make_test_request(SimulatorKind::kComposite, 0, 5);
  CHECK(generate_sessions(req, nullptr).status().code() == Status::Code::kInvalidArgument);

  req = make_test_request(SimulatorKind::kComposite, 3, 0);
  CHECK(generate_sessions(req, nullptr).status().code() == Status::Code::kInvalidArgument);

  const std::vector<PatientProfile> empty;
  req = make_test_request(SimulatorKind::kComposite, 3, 5);
  CHECK_FALSE(generate_sessions(req, &empty).ok());
}

TEST_CASE("make_request validates the configuration", "[engine][config]") {
  Config cfg;
  cfg.generator.patients = 3;
  cfg.generator.simulator = "multidomain";
  cfg.generator.start_date = "2025-03-10";
  auto r = make_request(cfg, 5);
  REQUIRE(r.ok());
  CHECK(r.value().simulator == SimulatorKind::kComposite);
  CHECK(r.value().start_date == CivilDate{2025, 3, 10});
  CHECK(r.value().seed == 5);

  cfg.generator.start_date = "2025-02-30";
  CHECK_FALSE(make_request(cfg, 5).ok());
}
