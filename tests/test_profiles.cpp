// File: tests/test_profiles.cpp
#include <catch2/catch.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>

#include "cogsim/adapters/profile_json/profile_json.hpp"
#include "cogsim/adapters/profile_synth/profile_synth.hpp"
#include "cogsim/core/util/civil_time.hpp"
#include "cogsim/core/util/random.hpp"

using namespace cogsim;
namespace fs = std::filesystem;

namespace {

// Fresh scratch directory, removed on scope exit.
struct ScratchDir {
  fs::path path;
  explicit ScratchDir(const std::string& name) : path(fs::temp_directory_path() / name) {
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

const std::string kFixture = (fs::path(COGSIM_TEST_DATA_DIR) / "layered" / "patient_profiles.json").string();

}  // namespace

TEST_CASE("profile fixture loads with defaults for missing scores", "[profiles]") {
  auto r = load_profiles(kFixture);
  REQUIRE(r.ok());
  const auto profiles = r.value();
  REQUIRE(profiles.size() == 2);

  const PatientProfile& a = profiles[0];
  CHECK(a.name == "Linda Moore");
  CHECK(a.education_years == 14);
  CHECK((a.comorbidities == std::vector<std::string>{"hypertension", "hyperlipidemia"}));
  CHECK(a.device_ids.size() == 2);  // null clinic entry skipped
  CHECK(a.device_ids.at("speech") == "SPK-101");
  CHECK(a.cognitive_baseline.mmse == 28);
  CHECK_FALSE(a.cognitive_baseline_defaulted);

  const PatientProfile& b = profiles[1];
  CHECK(b.education_years == 10);
  CHECK(b.comorbidities.empty());
  CHECK(b.cognitive_baseline.mmse == 23);
  CHECK(b.cognitive_baseline.moca == kDefaultMoca);
  CHECK(b.cognitive_baseline.depression_score == kDefaultDepressionScore);
  CHECK(b.cognitive_baseline_defaulted);
}

TEST_CASE("profile shape errors", "[profiles]") {
  auto not_list = parse_profiles(R"({"patient_id": "x"})");
  REQUIRE_FALSE(not_list.ok());
  CHECK(not_list.status().code() == Status::Code::kInvalidArgument);

  auto not_object = parse_profiles(R"([{"patient_id": "x"}, 7])");
  REQUIRE_FALSE(not_object.ok());
  CHECK(not_object.status().code() == Status::Code::kInvalidArgument);
  CHECK(not_object.status().message().find("profile[1]") != std::string::npos);

  auto malformed = parse_profiles(R"([{"patient_id": )");
  REQUIRE_FALSE(malformed.ok());
  CHECK(malformed.status().code() == Status::Code::kParseError);

  auto bad_tags = parse_profiles(R"([{"comorbidities": "diabetes"}])");
  REQUIRE_FALSE(bad_tags.ok());
  CHECK(bad_tags.status().code() == Status::Code::kParseError);

  auto missing = load_profiles("/nonexistent/cogsim/patient_profiles.json");
  REQUIRE_FALSE(missing.ok());
  CHECK(missing.status().code() == Status::Code::kNotFound);
}

TEST_CASE("empty object is a fully defaulted profile", "[profiles]") {
  auto r = parse_profiles("[{}]");
  REQUIRE(r.ok());
  const PatientProfile& p = r.value().front();
  CHECK(p.patient_id.empty());
  CHECK(p.device_ids.empty());
  CHECK(p.cognitive_baseline.mmse == kDefaultMmse);
  CHECK(p.cognitive_baseline_defaulted);
}

TEST_CASE("written profiles read back with the same content", "[profiles]") {
  ScratchDir dir("cogsim_test_profiles_write");
  auto src = load_profiles(kFixture);
  REQUIRE(src.ok());

  const std::string path = (dir.path / "nested" / "patient_profiles.json").string();
  REQUIRE(write_profiles(src.value(), path).ok());

  auto back = load_profiles(path);
  REQUIRE(back.ok());
  REQUIRE(back.value().size() == 2);
  CHECK(back.value()[0].patient_id == src.value()[0].patient_id);
  CHECK(back.value()[0].medications == src.value()[0].medications);
  CHECK(back.value()[1].device_ids == src.value()[1].device_ids);
  // Defaults are written out explicitly.
  CHECK_FALSE(back.value()[1].cognitive_baseline_defaulted);
  CHECK(back.value()[1].cognitive_baseline.moca == kDefaultMoca);

  CHECK(encode_profiles({}) == "[]\n");
}

TEST_CASE("profile discovery order", "[profiles][discovery]") {
  ScratchDir out("cogsim_test_profiles_out");
  ScratchDir conf("cogsim_test_profiles_conf");

  ProfilesConfig pc;

  SECTION("explicit path must load") {
    pc.path = (out.path / "missing.json").string();
    auto r = discover_profiles(pc, true, out.path.string(), conf.path.string());
    REQUIRE_FALSE(r.ok());
    CHECK(r.status().code() == Status::Code::kNotFound);
  }

  SECTION("explicit path wins over search") {
    pc.path = kFixture;
    pc.search = true;
    auto r = discover_profiles(pc, false, out.path.string(), conf.path.string());
    REQUIRE(r.ok());
    CHECK(r.value().path == kFixture);
    CHECK(r.value().profiles.size() == 2);
  }

  SECTION("search prefers out_dir over the config directory") {
    auto fixture = load_profiles(kFixture).take_value();
    REQUIRE(write_profiles({fixture[0]}, (conf.path / "patient_profiles.json").string()).ok());
    REQUIRE(write_profiles(fixture, (out.path / "patient_profiles.json").string()).ok());

    pc.search = true;
    auto r = discover_profiles(pc, false, out.path.string(), conf.path.string());
    REQUIRE(r.ok());
    CHECK(r.value().profiles.size() == 2);
    CHECK(r.value().attempted.size() == 1);
  }

  SECTION("unreadable candidates are skipped") {
    {
      std::ofstream f(out.path / "patient_profiles.json");
      f << "not json [";
    }
    auto fixture = load_profiles(kFixture).take_value();
    REQUIRE(write_profiles(fixture, (conf.path / "patient_profiles.json").string()).ok());

    pc.search = true;
    auto r = discover_profiles(pc, false, out.path.string(), conf.path.string());
    REQUIRE(r.ok());
    CHECK(r.value().attempted.size() == 2);
    CHECK(r.value().profiles.size() == 2);
  }

  SECTION("nothing found with synthetic allowed") {
    pc.search = true;
    auto r = discover_profiles(pc, true, out.path.string(), conf.path.string());
    REQUIRE(r.ok());
    CHECK(r.value().path.empty());
    CHECK(r.value().profiles.empty());
    CHECK(r.value().attempted.size() == 2);
  }

  SECTION("synthetic allowed and search off looks nowhere") {
    auto r = discover_profiles(pc, true, out.path.string(), conf.path.string());
    REQUIRE(r.ok());
    CHECK(r.value().attempted.empty());
  }

  SECTION("empty explicit collection falls back to synthetic ids") {
    REQUIRE(write_profiles({}, (out.path / "empty.json").string()).ok());
    pc.path = (out.path / "empty.json").string();
    auto r = discover_profiles(pc, true, out.path.string(), conf.path.string());
    REQUIRE(r.ok());
    CHECK(r.value().path.empty());
    CHECK(r.value().profiles.empty());
    REQUIRE(r.value().warnings.size() == 1);
    CHECK(r.value().warnings[0].find("empty.json") != std::string::npos);
  }

  SECTION("empty explicit collection without synthetic is not found") {
    REQUIRE(write_profiles({}, (out.path / "empty.json").string()).ok());
    pc.path = (out.path / "empty.json").string();
    auto r = discover_profiles(pc, false, out.path.string(), conf.path.string());
    REQUIRE_FALSE(r.ok());
    CHECK(r.status().code() == Status::Code::kNotFound);
    CHECK(r.status().message().find("could not locate") != std::string::npos);
  }

  SECTION("empty search candidate is passed over") {
    REQUIRE(write_profiles({}, (out.path / "patient_profiles.json").string()).ok());
    auto fixture = load_profiles(kFixture).take_value();
    REQUIRE(write_profiles(fixture, (conf.path / "patient_profiles.json").string()).ok());

    pc.search = true;
    auto r = discover_profiles(pc, false, out.path.string(), conf.path.string());
    REQUIRE(r.ok());
    CHECK(r.value().profiles.size() == 2);
    CHECK(r.value().warnings.size() == 1);
  }

  SECTION("only empty candidates with synthetic allowed") {
    REQUIRE(write_profiles({}, (out.path / "patient_profiles.json").string()).ok());
    pc.search = true;
    auto r = discover_profiles(pc, true, out.path.string(), conf.path.string());
    REQUIRE(r.ok());
    CHECK(r.value().path.empty());
    CHECK(r.value().warnings.size() == 1);
  }

  SECTION("nothing found without synthetic lists every location") {
    auto r = discover_profiles(pc, false, out.path.string(), conf.path.string());
    REQUIRE_FALSE(r.ok());
    CHECK(r.status().code() == Status::Code::kNotFound);
    for (const std::string& p : profile_search_paths(out.path.string(), conf.path.string())) {
      CHECK(r.status().message().find(p) != std::string::npos);
    }
  }
}

TEST_CASE("search paths collapse when out_dir is the config directory", "[profiles][discovery]") {
  CHECK(profile_search_paths("configs", "configs").size() == 1);
  CHECK(profile_search_paths("out", "configs").size() == 2);
}

TEST_CASE("synthetic cohort shape", "[profiles][synth]") {
  ProfileSynthParams params;
  params.count = 200;
  params.reference = CivilDate{2025, 9, 1};
  Rng rng(99);
  const auto profiles = synthesize_profiles(params, rng);
  REQUIRE(profiles.size() == 200);

  CHECK(profiles[0].device_ids.at("wearable") == "WEAR-001");
  CHECK(profiles[0].device_ids.at("speech") == "SPK-001");
  CHECK(profiles[199].device_ids.at("speech") == "SPK-200");

  std::set<std::string> ids;
  for (const PatientProfile& p : profiles) {
    ids.insert(p.patient_id);
    CHECK(p.patient_id.size() == 36);
    CHECK(p.name.find(' ') != std::string::npos);
    CHECK((p.sex == "male" || p.sex == "female"));
    CHECK(p.education_years >= 4);
    CHECK(p.education_years <= 22);

    auto dob = parse_iso_date(p.dob);
    REQUIRE(dob.ok());
    CHECK(dob.value().year >= 2025 - 90);
    CHECK(dob.value().year <= 2025 - 65);

    CHECK(p.comorbidities.size() <= 5);
    CHECK(std::set<std::string>(p.comorbidities.begin(), p.comorbidities.end()).size() == p.comorbidities.size());
    CHECK(std::is_sorted(p.medications.begin(), p.medications.end()));

    CHECK(p.cognitive_baseline.mmse >= 10);
    CHECK(p.cognitive_baseline.mmse <= 30);
    CHECK(p.cognitive_baseline.moca >= 5);
    CHECK(p.cognitive_baseline.moca <= 30);
    CHECK(p.cognitive_baseline.depression_score >= 0);
    CHECK(p.cognitive_baseline.depression_score <= 27);
    CHECK_FALSE(p.cognitive_baseline_defaulted);
  }
  CHECK(ids.size() == profiles.size());
}

TEST_CASE("synthetic cohort is reproducible from the seed", "[profiles][synth]") {
  ProfileSynthParams params;
  params.count = 20;
  Rng a(5);
  Rng b(5);
  CHECK(encode_profiles(synthesize_profiles(params, a)) == encode_profiles(synthesize_profiles(params, b)));
}

TEST_CASE("impairment lowers the sampled baseline", "[profiles][synth]") {
  double healthy = 0.0;
  double mci = 0.0;
  Rng a(17);
  Rng b(17);
  for (int i = 0; i < 300; ++i) {
    healthy += sample_cognitive_baseline(12, false, false, a).moca;
    mci += sample_cognitive_baseline(12, true, true, b).moca;
  }
  CHECK(mci < healthy);
}

TEST_CASE("medications follow comorbidities", "[profiles][synth]") {
  Rng rng(3);
  for (int i = 0; i < 50; ++i) {
    const auto meds = derive_medications({"mild_cognitive_impairment"}, rng);
    CHECK(std::find(meds.begin(), meds.end(), "donepezil") != meds.end());
  }
  const auto none = derive_medications({"unknown_condition"}, rng);
  CHECK(none.size() <= 1);  // at most a supplement
}
