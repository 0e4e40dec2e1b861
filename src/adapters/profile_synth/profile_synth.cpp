// File: src/adapters/profile_synth/profile_synth.cpp
#include "cogsim/adapters/profile_synth/profile_synth.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string_view>
#include <utility>

#include "cogsim/core/model/identity.hpp"
#include "cogsim/core/util/civil_time.hpp"

namespace cogsim {
namespace {

struct Comorbidity {
  std::string_view tag;
  double weight;  // relative prevalence in older adults
  std::array<std::string_view, 3> medications;
  int n_medications;
};

constexpr std::array<Comorbidity, 10> kComorbidities{{
    {"hypertension", 0.55, {"lisinopril", "amlodipine", "losartan"}, 3},
    {"diabetes", 0.25, {"metformin", "glipizide", ""}, 2},
    {"hyperlipidemia", 0.40, {"atorvastatin", "rosuvastatin", ""}, 2},
    {"coronary_artery_disease", 0.18, {"aspirin", "clopidogrel", ""}, 2},
    {"atrial_fibrillation", 0.08, {"apixaban", "warfarin", ""}, 2},
    {"chronic_kidney_disease", 0.12, {"epoetin", "", ""}, 1},
    {"mild_cognitive_impairment", 0.22, {"donepezil", "", ""}, 1},
    {"parkinsonism", 0.04, {"carbidopa-levodopa", "", ""}, 1},
    {"depression", 0.20, {"sertraline", "citalopram", ""}, 2},
    {"sleep_apnea", 0.10, {"cpap", "", ""}, 1},
}};

constexpr std::array<std::string_view, 3> kSupplements{"vitamin_d", "multivitamin", "omega_3"};
constexpr double kSupplementProbability = 0.15;
constexpr int kComorbidityDraws = 10;  // oversample, keep first unique

constexpr std::array<std::string_view, 20> kFirstNames{
    "John",   "Mary",   "Robert", "Patricia", "Michael", "Linda",   "William",     "Barbara", "David",  "Elizabeth",
    "Richard", "Jennifer", "Joseph", "Maria", "Thomas",  "Susan",   "Charles", "Margaret", "Christopher", "Sarah"};
constexpr std::array<std::string_view, 20> kLastNames{
    "Smith",     "Johnson", "Williams", "Brown",  "Jones",    "Garcia", "Miller", "Davis",   "Rodriguez", "Martinez",
    "Hernandez", "Lopez",   "Gonzalez", "Wilson", "Anderson", "Thomas", "Taylor", "Moore",   "Jackson",   "Martin"};

constexpr int kMinAge = 65;
constexpr int kMaxAge = 90;
constexpr int kModeAge = 72;

template <std::size_t N>
std::string pick(const std::array<std::string_view, N>& options, Rng& rng) {
  return std::string(options[static_cast<std::size_t>(rng.uniform_int(0, static_cast<int>(N) - 1))]);
}

const Comorbidity* find_comorbidity(const std::string& tag) {
  for (const Comorbidity& c : kComorbidities) {
    if (c.tag == tag) return &c;
  }
  return nullptr;
}

std::string sample_dob(const CivilDate& reference, Rng& rng) {
  const int age = static_cast<int>(rng.triangular(kMinAge, kMaxAge, kModeAge));
  const int offset = rng.uniform_int(0, 364);
  const CivilDate jan1{reference.year - age, 1, 1};
  return format_iso_date(civil_from_days(days_from_civil(jan1) + offset));
}

}  // namespace

std::vector<std::string> sample_comorbidities(Rng& rng) {
  const int k = std::clamp(static_cast<int>(rng.normal(2.0, 1.2)), 0, 5);

  std::vector<double> weights;
  weights.reserve(kComorbidities.size());
  for (const Comorbidity& c : kComorbidities) weights.push_back(c.weight);

  // All draws happen even when k is reached early.
  std::vector<std::size_t> draws;
  draws.reserve(kComorbidityDraws);
  for (int i = 0; i < kComorbidityDraws; ++i) draws.push_back(rng.weighted_index(weights));

  std::vector<std::string> out;
  for (std::size_t idx : draws) {
    if (static_cast<int>(out.size()) >= k) break;
    const std::string tag(kComorbidities[idx].tag);
    if (std::find(out.begin(), out.end(), tag) == out.end()) out.push_back(tag);
  }
  return out;
}

std::vector<std::string> derive_medications(const std::vector<std::string>& comorbidities, Rng& rng) {
  std::vector<std::string> meds;
  for (const std::string& tag : comorbidities) {
    const Comorbidity* c = find_comorbidity(tag);
    if (!c || c->n_medications == 0) continue;
    meds.emplace_back(c->medications[static_cast<std::size_t>(rng.uniform_int(0, c->n_medications - 1))]);
  }
  if (rng.bernoulli(kSupplementProbability)) meds.push_back(pick(kSupplements, rng));

  std::sort(meds.begin(), meds.end());
  meds.erase(std::unique(meds.begin(), meds.end()), meds.end());
  return meds;
}

CognitiveBaseline sample_cognitive_baseline(int education_years, bool has_mci, bool has_depression, Rng& rng) {
  double mmse = rng.normal(27.5, 2.0);
  double moca = rng.normal(24.5, 2.5);
  double depression = rng.normal(5.0, 3.0);

  const double edu = (education_years - 12) * 0.15;
  mmse += edu;
  moca += edu * 1.1;

  if (has_mci) {
    mmse -= rng.uniform(1.0, 3.0);
    moca -= rng.uniform(2.0, 4.0);
  }
  if (has_depression) moca -= rng.uniform(0.5, 1.5);

  CognitiveBaseline b;
  b.mmse = static_cast<int>(std::lround(std::clamp(mmse, 10.0, 30.0)));
  b.moca = static_cast<int>(std::lround(std::clamp(moca, 5.0, 30.0)));
  b.depression_score = static_cast<int>(std::lround(std::clamp(depression, 0.0, 27.0)));
  return b;
}

std::vector<PatientProfile> synthesize_profiles(const ProfileSynthParams& params, Rng& rng) {
  std::vector<PatientProfile> out;
  if (params.count <= 0) return out;
  out.reserve(static_cast<std::size_t>(params.count));

  for (int i = 0; i < params.count; ++i) {
    PatientProfile p;
    p.patient_id = rng.uuid4();
    p.name = pick(kFirstNames, rng);
    p.name += " " + pick(kLastNames, rng);
    p.sex = rng.bernoulli(0.5) ? "male" : "female";
    p.education_years = static_cast<int>(std::clamp(rng.normal(13.0, 3.0), 4.0, 22.0));
    p.comorbidities = sample_comorbidities(rng);
    p.medications = derive_medications(p.comorbidities, rng);
    p.dob = sample_dob(params.reference, rng);

    const auto has = [&](const char* tag) {
      return std::find(p.comorbidities.begin(), p.comorbidities.end(), tag) != p.comorbidities.end();
    };
    p.cognitive_baseline =
        sample_cognitive_baseline(p.education_years, has("mild_cognitive_impairment"), has("depression"), rng);

    const auto pos = static_cast<std::size_t>(i);
    p.device_ids[device_role_key(DeviceRole::kWearable)] = positional_device_id(DeviceRole::kWearable, pos);
    p.device_ids[device_role_key(DeviceRole::kSpeech)] = positional_device_id(DeviceRole::kSpeech, pos);
    out.push_back(std::move(p));
  }
  return out;
}

}  // namespace cogsim
