// File: src/adapters/profile_json/profile_json.cpp
#include "cogsim/adapters/profile_json/profile_json.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "cogsim/core/util/json_text.hpp"

namespace cogsim {
namespace fs = std::filesystem;

namespace {

bool has_value(const YAML::Node& n) { return n && !n.IsNull(); }

std::string read_string(const YAML::Node& obj, const char* key) {
  const YAML::Node n = obj[key];
  if (!has_value(n)) return {};
  return n.as<std::string>();
}

// Integer fields may arrive as 27 or 27.0.
int read_int(const YAML::Node& n) {
  return static_cast<int>(std::llround(n.as<double>()));
}

std::vector<std::string> read_tags(const YAML::Node& obj, const char* key) {
  std::vector<std::string> out;
  const YAML::Node n = obj[key];
  if (!has_value(n)) return out;
  if (!n.IsSequence()) throw YAML::Exception(n.Mark(), std::string(key) + " must be an array");
  for (const auto& item : n) out.push_back(item.as<std::string>());
  return out;
}

PatientProfile profile_from_node(const YAML::Node& obj) {
  PatientProfile p;
  p.patient_id = read_string(obj, "patient_id");
  p.name = read_string(obj, "name");
  p.dob = read_string(obj, "dob");
  p.sex = read_string(obj, "sex");
  if (has_value(obj["education_years"])) p.education_years = read_int(obj["education_years"]);
  p.comorbidities = read_tags(obj, "comorbidities");
  p.medications = read_tags(obj, "medications");

  const YAML::Node dev = obj["device_ids"];
  if (has_value(dev)) {
    if (!dev.IsMap()) throw YAML::Exception(dev.Mark(), "device_ids must be an object");
    for (const auto& kv : dev) {
      if (!has_value(kv.second)) continue;
      p.device_ids[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
  }

  const YAML::Node cb = obj["cognitive_baseline"];
  bool defaulted = false;
  auto score = [&](const char* key, int fallback) {
    if (has_value(cb) && cb.IsMap() && has_value(cb[key])) return read_int(cb[key]);
    defaulted = true;
    return fallback;
  };
  p.cognitive_baseline.mmse = score("mmse", kDefaultMmse);
  p.cognitive_baseline.moca = score("moca", kDefaultMoca);
  p.cognitive_baseline.depression_score = score("depression_score", kDefaultDepressionScore);
  p.cognitive_baseline_defaulted = defaulted;
  return p;
}

Result<std::vector<PatientProfile>> profiles_from_root(const YAML::Node& root) {
  if (!root || !root.IsSequence()) {
    return Result<std::vector<PatientProfile>>::err(
        Status::invalid_argument("patient profiles must be a JSON array of objects"));
  }

  std::vector<PatientProfile> out;
  out.reserve(root.size());
  for (std::size_t i = 0; i < root.size(); ++i) {
    const YAML::Node item = root[i];
    const std::string where = "profile[" + std::to_string(i) + "]";
    if (!item.IsMap()) {
      return Result<std::vector<PatientProfile>>::err(Status::invalid_argument(where + " is not an object"));
    }
    try {
      out.push_back(profile_from_node(item));
    } catch (const YAML::Exception& e) {
      return Result<std::vector<PatientProfile>>::err(Status::parse_error(where + ": " + e.what()));
    }
  }
  return Result<std::vector<PatientProfile>>::ok(std::move(out));
}

void write_tags(std::ostringstream& ss, const std::vector<std::string>& tags) {
  if (tags.empty()) {
    ss << "[]";
    return;
  }
  ss << "[\n";
  for (std::size_t i = 0; i < tags.size(); ++i) {
    ss << "      " << json_quote(tags[i]) << (i + 1 < tags.size() ? ",\n" : "\n");
  }
  ss << "    ]";
}

}  // namespace

Result<std::vector<PatientProfile>> parse_profiles(const std::string& json_text) {
  YAML::Node root;
  try {
    root = YAML::Load(json_text);
  } catch (const YAML::Exception& e) {
    return Result<std::vector<PatientProfile>>::err(
        Status::parse_error(std::string("failed to parse patient profiles: ") + e.what()));
  }
  return profiles_from_root(root);
}

Result<std::vector<PatientProfile>> load_profiles(const std::string& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Result<std::vector<PatientProfile>>::err(Status::not_found("patient profiles not found: " + path));
  }
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::BadFile& e) {
    return Result<std::vector<PatientProfile>>::err(Status::io_error("failed to read " + path + ": " + e.what()));
  } catch (const YAML::Exception& e) {
    return Result<std::vector<PatientProfile>>::err(
        Status::parse_error("failed to parse patient profiles " + path + ": " + e.what()));
  }
  auto r = profiles_from_root(root);
  if (!r.ok()) return Result<std::vector<PatientProfile>>::err(r.status().annotate(path));
  return r;
}

std::string encode_profiles(const std::vector<PatientProfile>& profiles) {
  std::ostringstream ss;
  ss << "[";
  for (std::size_t i = 0; i < profiles.size(); ++i) {
    const PatientProfile& p = profiles[i];
    ss << (i ? ",\n" : "\n");
    ss << "  {\n";
    ss << "    \"patient_id\": " << json_quote(p.patient_id) << ",\n";
    ss << "    \"name\": " << json_quote(p.name) << ",\n";
    ss << "    \"dob\": " << json_quote(p.dob) << ",\n";
    ss << "    \"sex\": " << json_quote(p.sex) << ",\n";
    ss << "    \"education_years\": " << p.education_years << ",\n";
    ss << "    \"comorbidities\": ";
    write_tags(ss, p.comorbidities);
    ss << ",\n    \"medications\": ";
    write_tags(ss, p.medications);
    ss << ",\n    \"device_ids\": {";
    std::size_t k = 0;
    for (const auto& [role, id] : p.device_ids) {
      ss << (k++ ? ",\n" : "\n") << "      " << json_quote(role) << ": " << json_quote(id);
    }
    ss << (p.device_ids.empty() ? "}" : "\n    }") << ",\n";
    ss << "    \"cognitive_baseline\": {\n"
       << "      \"mmse\": " << p.cognitive_baseline.mmse << ",\n"
       << "      \"moca\": " << p.cognitive_baseline.moca << ",\n"
       << "      \"depression_score\": " << p.cognitive_baseline.depression_score << "\n"
       << "    }\n";
    ss << "  }";
  }
  ss << (profiles.empty() ? "]\n" : "\n]\n");
  return ss.str();
}

Status write_profiles(const std::vector<PatientProfile>& profiles, const std::string& path) {
  std::error_code ec;
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) return Status::io_error("failed creating '" + parent.string() + "': " + ec.message());
  }

  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f.is_open()) return Status::io_error("failed opening '" + path + "'");
  f << encode_profiles(profiles);
  f.flush();
  if (!f.good()) return Status::io_error("failed writing '" + path + "'");
  return Status::ok_status();
}

std::vector<std::string> profile_search_paths(const std::string& out_dir, const std::string& config_dir) {
  std::vector<std::string> out;
  out.push_back((fs::path(out_dir) / "patient_profiles.json").lexically_normal().string());
  const std::string next_to_config =
      (fs::path(config_dir.empty() ? "." : config_dir) / "patient_profiles.json").lexically_normal().string();
  if (next_to_config != out.front()) out.push_back(next_to_config);
  return out;
}

Result<ProfileSource> discover_profiles(const ProfilesConfig& cfg, bool allow_synthetic, const std::string& out_dir,
                                        const std::string& config_dir) {
  ProfileSource src;

  // An empty collection counts as no profiles at all.
  auto take = [&src](const std::string& path, std::vector<PatientProfile> profiles) {
    if (profiles.empty()) {
      src.warnings.push_back("patient profiles " + path + " are empty; ignoring");
      return false;
    }
    src.path = path;
    src.profiles = std::move(profiles);
    return true;
  };

  if (!cfg.path.empty()) {
    src.attempted.push_back(cfg.path);
    auto r = load_profiles(cfg.path);
    if (!r.ok()) return Result<ProfileSource>::err(r.status());
    if (take(cfg.path, r.take_value())) return Result<ProfileSource>::ok(std::move(src));
  } else if (cfg.search || !allow_synthetic) {
    for (const std::string& cand : profile_search_paths(out_dir, config_dir)) {
      src.attempted.push_back(cand);
      auto r = load_profiles(cand);
      if (!r.ok()) continue;
      if (take(cand, r.take_value())) return Result<ProfileSource>::ok(std::move(src));
    }
  }

  if (!allow_synthetic) {
    std::string msg = "could not locate patient_profiles.json in any of:";
    for (const std::string& p : src.attempted) msg += "\n  - " + p;
    msg += "\nset profiles.path or generator.allow_synthetic to bypass";
    return Result<ProfileSource>::err(Status::not_found(msg));
  }
  return Result<ProfileSource>::ok(std::move(src));
}

}  // namespace cogsim
