// src/core/util/config_loader.cpp
#include "cogsim/core/util/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <yaml-cpp/yaml.h>

namespace cogsim {
namespace fs = std::filesystem;

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth) {
  if (depth > 16) {
    return Result<YAML::Node>::err(Status::invalid_argument("includes nested too deeply at " + path.string()));
  }
  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["base.yaml", "coupling.yaml"]
  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, depth + 1);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  // Finally override with this file's contents (excluding includes itself).
  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static void read_seed(const YAML::Node& g, GeneratorConfig& out) {
  if (!g["seed"]) return;
  const YAML::Node s = g["seed"];
  if (s.IsNull()) {
    out.seed.reset();
    return;
  }
  out.seed = s.as<std::uint64_t>();
}

// Field mapping from a merged YAML tree. Conversion failures throw YAML exceptions,
// which the callers turn into parse errors.
static Config config_from_yaml(const YAML::Node& y) {
  Config cfg;  // defaults

  // --- generator
  if (is_map(y["generator"])) {
    const auto g = y["generator"];
    if (g["simulator"]) cfg.generator.simulator = to_lower(g["simulator"].as<std::string>());
    if (g["schedule"]) cfg.generator.schedule = to_lower(g["schedule"].as<std::string>());
    maybe_set(g, "patients", cfg.generator.patients);
    maybe_set(g, "days", cfg.generator.days);
    maybe_set(g, "start_date", cfg.generator.start_date);
    read_seed(g, cfg.generator);
    maybe_set(g, "use_all_profiles", cfg.generator.use_all_profiles);
    maybe_set(g, "allow_synthetic", cfg.generator.allow_synthetic);
    maybe_set(g, "strict_count", cfg.generator.strict_count);
    maybe_set(g, "workers", cfg.generator.workers);
  }

  // --- profiles
  if (is_map(y["profiles"])) {
    const auto p = y["profiles"];
    maybe_set(p, "path", cfg.profiles.path);
    maybe_set(p, "search", cfg.profiles.search);
  }

  // --- historical schedule
  if (is_map(y["historical"])) {
    const auto h = y["historical"];
    maybe_set(h, "records_per_patient", cfg.historical.records_per_patient);
    maybe_set(h, "window_days", cfg.historical.window_days);
    maybe_set(h, "min_gap_days", cfg.historical.min_gap_days);
  }

  // --- coupling constants
  if (is_map(y["coupling"])) {
    const auto c = y["coupling"];
    maybe_set(c, "intrusion_base", cfg.coupling.intrusion_base);
    maybe_set(c, "intrusion_gap_weight", cfg.coupling.intrusion_gap_weight);
    maybe_set(c, "intrusion_cf_pivot", cfg.coupling.intrusion_cf_pivot);
    maybe_set(c, "intrusion_cf_weight", cfg.coupling.intrusion_cf_weight);
    maybe_set(c, "intrusion_depression_weight", cfg.coupling.intrusion_depression_weight);
    maybe_set(c, "intrusion_depression_scale", cfg.coupling.intrusion_depression_scale);
    maybe_set(c, "intrusion_min", cfg.coupling.intrusion_min);
    maybe_set(c, "intrusion_max", cfg.coupling.intrusion_max);
    maybe_set(c, "missed_trials_rt_threshold_ms", cfg.coupling.missed_trials_rt_threshold_ms);
    maybe_set(c, "missed_trials_rt_scale_ms", cfg.coupling.missed_trials_rt_scale_ms);
    maybe_set(c, "missed_trials_sd", cfg.coupling.missed_trials_sd);
    maybe_set(c, "attention_span_pivot", cfg.coupling.attention_span_pivot);
    maybe_set(c, "attention_error_weight", cfg.coupling.attention_error_weight);
    maybe_set(c, "attention_error_sd", cfg.coupling.attention_error_sd);
    maybe_set(c, "orientation_cf_pivot", cfg.coupling.orientation_cf_pivot);
  }

  // --- output
  if (is_map(y["output"])) {
    const auto o = y["output"];
    maybe_set(o, "out_dir", cfg.output.out_dir);
    if (o["format"]) cfg.output.format = to_lower(o["format"].as<std::string>());
    maybe_set(o, "keep_run_logs", cfg.output.keep_run_logs);
  }

  // --- profile generator
  if (is_map(y["profile_synth"])) {
    maybe_set(y["profile_synth"], "count", cfg.profile_synth.count);
  }

  return cfg;
}

static Result<Config> finish(const YAML::Node& y) {
  Config cfg;
  try {
    cfg = config_from_yaml(y);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("bad config value: ") + e.what()));
  }

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  auto yaml_r = load_with_includes(path, 0);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());

  auto cfg_r = finish(yaml_r.take_value());
  if (!cfg_r.ok()) return cfg_r;

  Config cfg = cfg_r.take_value();
  if (!cfg.profiles.path.empty() && fs::path(cfg.profiles.path).is_relative()) {
    cfg.profiles.path = (path.parent_path() / cfg.profiles.path).lexically_normal().string();
  }
  return Result<Config>::ok(cfg);
}

Result<Config> parse_config(const std::string& yaml_text) {
  YAML::Node y;
  try {
    y = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("YAML parse error: ") + e.what()));
  }
  if (y && !y.IsNull() && !y.IsMap()) {
    return Result<Config>::err(Status::invalid_argument("config root must be a YAML map"));
  }
  return finish(y);
}

}  // namespace cogsim
