// File: src/apps/cogsim_profiles/main.cpp
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "cogsim/adapters/profile_json/profile_json.hpp"
#include "cogsim/adapters/profile_synth/profile_synth.hpp"
#include "cogsim/core/events/jsonl_event_sink.hpp"
#include "cogsim/core/model/generation_runner.hpp"
#include "cogsim/core/util/civil_time.hpp"
#include "cogsim/core/util/config_loader.hpp"
#include "cogsim/core/util/random.hpp"

namespace {

struct Args {
  std::string config_path;
  std::string out_path;  // default: <out_dir>/patient_profiles.json
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    if (s == "--out" && i + 1 < argc) {
      a.out_path = argv[++i];
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "cogsim_profiles\n"
            << "  --config <path>\n"
            << "  [--out <profiles.json>]\n";
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 1;
  }

  auto cfg_r = cogsim::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << "[ERROR] " << cfg_r.status().to_string() << "\n";
    return 1;
  }
  const cogsim::Config cfg = cfg_r.take_value();

  auto ref_r = cogsim::parse_iso_date(cfg.generator.start_date);
  if (!ref_r.ok()) {
    std::cerr << "[ERROR] " << ref_r.status().annotate("generator.start_date").to_string() << "\n";
    return 1;
  }

  cogsim::GenerationRunner runner(cfg, args.config_path, "cogsim_profiles");
  cogsim::JsonlEventSink events;
  const cogsim::Status st_start = runner.start(events);
  if (!st_start.ok()) {
    std::cerr << "[ERROR] " << st_start.to_string() << "\n";
    return 2;
  }

  struct Guard {
    cogsim::GenerationRunner& r;
    cogsim::JsonlEventSink& s;
    ~Guard() { r.stop(s); }
  } guard{runner, events};

  cogsim::ProfileSynthParams params;
  params.count = cfg.profile_synth.count;
  params.reference = ref_r.value();

  cogsim::Rng rng(cogsim::Rng::derive_seed(runner.seed(), cogsim::RngStream::kProfiles, 0));
  const std::vector<cogsim::PatientProfile> profiles = cogsim::synthesize_profiles(params, rng);

  const std::string path = args.out_path.empty()
                               ? (std::filesystem::path(cfg.output.out_dir) / "patient_profiles.json").string()
                               : args.out_path;

  const cogsim::Status st = cogsim::write_profiles(profiles, path);
  if (!st.ok()) {
    std::cerr << "[ERROR] " << st.to_string() << "\n";
    (void)runner.emit_event(events, "shutdown", st.to_string(), {{"exit_code", 2}});
    return 2;
  }

  (void)runner.emit_event(events, "generation_finished", path,
                          {{"profiles", static_cast<std::int64_t>(profiles.size())}});
  (void)runner.emit_event(events, "shutdown", "completed", {{"exit_code", 0}});

  std::cout << "[INFO] Seed: " << runner.seed() << (runner.seed_from_config() ? " (config)" : " (random)") << "\n";
  std::cout << "[OK] Wrote " << profiles.size() << " patient profiles to " << path << "\n";
  return 0;
}
