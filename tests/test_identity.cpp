// File: tests/test_identity.cpp
#include <catch2/catch.hpp>

#include <set>

#include "cogsim/core/model/identity.hpp"
#include "test_support.hpp"

using namespace cogsim;

TEST_CASE("positional device ids are one-based and zero padded", "[identity]") {
  CHECK(positional_device_id(DeviceRole::kSpeech, 0) == "SPK-001");
  CHECK(positional_device_id(DeviceRole::kWearable, 41) == "WEAR-042");
  CHECK(positional_device_id(DeviceRole::kApp, 999) == "APP-1000");
  CHECK(positional_device_id(DeviceRole::kClinic, 6) == "CLIN-007");
}

TEST_CASE("without profiles every patient gets a fresh id", "[identity]") {
  Rng rng(1);
  auto r = resolve_identities(4, nullptr, DeviceRole::kSpeech, false, rng);
  REQUIRE(r.ok());
  const ResolvedCohort& c = r.value();
  REQUIRE(c.patients.size() == 4);
  CHECK(c.warnings.empty());

  std::set<std::string> ids;
  for (std::size_t i = 0; i < c.patients.size(); ++i) {
    ids.insert(c.patients[i].patient_id);
    CHECK(c.patients[i].patient_id.size() == 36);
    CHECK(c.patients[i].device_id == positional_device_id(DeviceRole::kSpeech, i));
    CHECK_FALSE(c.patients[i].profile_index.has_value());
  }
  CHECK(ids.size() == 4);
}

TEST_CASE("shortage reduces the cohort with a warning", "[identity][shortage]") {
  const auto profiles = testing::make_profiles(3);
  Rng rng(1);
  auto r = resolve_identities(10, &profiles, DeviceRole::kSpeech, false, rng);
  REQUIRE(r.ok());
  CHECK(r.value().patients.size() == 3);
  CHECK(r.value().available == 3);
  REQUIRE(r.value().warnings.size() == 1);
  CHECK(r.value().warnings.front().find("only 3 profiles") != std::string::npos);
}

TEST_CASE("surplus profiles take the first n unless use_all", "[identity]") {
  const auto profiles = testing::make_profiles(8);
  Rng rng(1);

  auto first = resolve_identities(5, &profiles, DeviceRole::kWearable, false, rng);
  REQUIRE(first.ok());
  REQUIRE(first.value().patients.size() == 5);
  CHECK(first.value().patients[4].patient_id == profiles[4].patient_id);
  CHECK(first.value().patients[4].device_id == "WEAR-504");

  auto all = resolve_identities(2, &profiles, DeviceRole::kWearable, true, rng);
  REQUIRE(all.ok());
  CHECK(all.value().patients.size() == 8);
  CHECK(all.value().warnings.empty());
}

TEST_CASE("missing ids and devices are synthesized", "[identity]") {
  auto profiles = testing::make_profiles(3);
  profiles[1].patient_id.clear();
  profiles[2].device_ids.erase("speech");

  Rng rng(9);
  auto r = resolve_identities(3, &profiles, DeviceRole::kSpeech, false, rng);
  REQUIRE(r.ok());
  const ResolvedCohort& c = r.value();
  CHECK(c.patients[0].patient_id == "P-1000");
  CHECK(c.patients[1].patient_id.size() == 36);
  CHECK(c.patients[2].device_id == "SPK-003");
  CHECK(c.warnings.size() == 2);
}

TEST_CASE("role without any device id falls back to positions", "[identity]") {
  const auto profiles = testing::make_profiles(2);
  Rng rng(2);
  auto r = resolve_identities(2, &profiles, DeviceRole::kClinic, false, rng);
  REQUIRE(r.ok());
  CHECK(r.value().patients[0].device_id == "CLIN-001");
  CHECK(r.value().patients[1].device_id == "CLIN-002");
}

TEST_CASE("empty collections and duplicate ids are rejected", "[identity]") {
  Rng rng(3);
  const std::vector<PatientProfile> none;
  CHECK(resolve_identities(3, &none, DeviceRole::kSpeech, false, rng).status().code() ==
        Status::Code::kInvalidArgument);

  auto dup = testing::make_profiles(3);
  dup[2].patient_id = dup[0].patient_id;
  auto r = resolve_identities(3, &dup, DeviceRole::kSpeech, false, rng);
  REQUIRE_FALSE(r.ok());
  CHECK(r.status().message().find("duplicate") != std::string::npos);

  // The duplicate sits outside the selected slice.
  CHECK(resolve_identities(2, &dup, DeviceRole::kSpeech, false, rng).ok());
}
