// File: src/apps/cogsim_gen/main.cpp
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "cogsim/adapters/file_export/file_record_sink.hpp"
#include "cogsim/adapters/profile_json/profile_json.hpp"
#include "cogsim/core/events/jsonl_event_sink.hpp"
#include "cogsim/core/io/delivery.hpp"
#include "cogsim/core/model/engine.hpp"
#include "cogsim/core/model/generation_runner.hpp"
#include "cogsim/core/util/config_loader.hpp"
#include "cogsim/core/util/repro_hash.hpp"

namespace {

constexpr int kExitConfig = 1;
constexpr int kExitRuntime = 2;
constexpr int kExitStrictCount = 3;

struct Args {
  std::string config_path;
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
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "cogsim_gen\n"
            << "  --config <path>\n";
}

std::string config_dir_of(const std::string& config_path) {
  const std::filesystem::path dir = std::filesystem::path(config_path).parent_path();
  return dir.empty() ? "." : dir.string();
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : kExitConfig;
  }

  auto cfg_r = cogsim::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << "[ERROR] " << cfg_r.status().to_string() << "\n";
    return kExitConfig;
  }
  const cogsim::Config cfg = cfg_r.take_value();

  cogsim::GenerationRunner runner(cfg, args.config_path, "cogsim_gen");

  auto req_r = cogsim::make_request(cfg, runner.seed());
  if (!req_r.ok()) {
    std::cerr << "[ERROR] " << req_r.status().to_string() << "\n";
    return kExitConfig;
  }
  const cogsim::GenerationRequest req = req_r.take_value();

  auto fmt_r = cogsim::parse_export_format(cfg.output.format);
  if (!fmt_r.ok()) {
    std::cerr << "[ERROR] " << fmt_r.status().to_string() << "\n";
    return kExitConfig;
  }

  cogsim::JsonlEventSink events;
  const cogsim::Status st_start = runner.start(events);
  if (!st_start.ok()) {
    std::cerr << "[ERROR] " << st_start.to_string() << "\n";
    return kExitRuntime;
  }

  // Always flush and close the run log, whatever path main() leaves by.
  struct Guard {
    cogsim::GenerationRunner& r;
    cogsim::JsonlEventSink& s;
    ~Guard() { r.stop(s); }
  } guard{runner, events};

  auto fail = [&](int code, const cogsim::Status& st) {
    std::cerr << "[ERROR] " << st.to_string() << "\n";
    (void)runner.emit_event(events, "shutdown", st.to_string(), {{"exit_code", code}});
    return code;
  };

  std::cout << "[INFO] Run log: " << events.path() << " (latest: " << events.latest_path() << ")\n";
  std::cout << "[INFO] Simulator: " << cogsim::simulator_name(req.simulator)
            << "  schedule=" << cogsim::schedule_name(req.schedule) << "  seed=" << runner.seed()
            << (runner.seed_from_config() ? " (config)" : " (random)") << "\n";

  // Profiles.
  auto src_r = cogsim::discover_profiles(cfg.profiles, cfg.generator.allow_synthetic, cfg.output.out_dir,
                                         config_dir_of(args.config_path));
  if (!src_r.ok()) return fail(kExitConfig, src_r.status());
  const cogsim::ProfileSource src = src_r.take_value();
  for (const std::string& w : src.warnings) std::cout << "[WARN] " << w << "\n";
  (void)runner.emit_warnings(events, src.warnings);

  const bool have_profiles = !src.path.empty();
  if (have_profiles) {
    std::cout << "[INFO] Loaded " << src.profiles.size() << " patient profiles from " << src.path << "\n";
  } else {
    std::cout << "[WARN] No patient profiles found; using synthetic identifiers\n";
  }
  (void)runner.emit_event(events, "profiles_loaded", have_profiles ? src.path : "synthetic",
                          {{"profiles", static_cast<std::int64_t>(src.profiles.size())},
                           {"attempted", static_cast<std::int64_t>(src.attempted.size())}},
                          {{"source", have_profiles ? "file" : "synthetic"}});

  // Generation.
  auto gen_r = cogsim::generate_sessions(req, have_profiles ? &src.profiles : nullptr);
  if (!gen_r.ok()) return fail(kExitConfig, gen_r.status());
  const cogsim::GenerationResult gen = gen_r.take_value();

  for (const std::string& w : gen.warnings) std::cout << "[WARN] " << w << "\n";
  (void)runner.emit_warnings(events, gen.warnings);
  for (const std::string& s : gen.skipped) {
    std::cout << "[WARN] " << s << "\n";
    (void)runner.emit_event(events, "patient_skipped", s);
  }

  const std::string digest = cogsim::compute_records_digest(gen.records, req.simulator);
  std::cout << "[INFO] Generated " << gen.records.size() << " records for " << gen.patients_used << " patients ("
            << gen.patients_skipped << " skipped)\n";
  (void)runner.emit_event(events, "generation_finished", "digest=" + digest,
                          {{"records", static_cast<std::int64_t>(gen.records.size())},
                           {"expected_records", static_cast<std::int64_t>(gen.expected_records)},
                           {"patients_requested", static_cast<std::int64_t>(gen.patients_requested)},
                           {"patients_used", static_cast<std::int64_t>(gen.patients_used)},
                           {"patients_skipped", static_cast<std::int64_t>(gen.patients_skipped)}},
                          {{"digest", digest}});

  if (gen.records.size() != gen.expected_records) {
    const std::string msg = "record count mismatch: expected " + std::to_string(gen.expected_records) + ", got " +
                            std::to_string(gen.records.size());
    if (cfg.generator.strict_count) return fail(kExitStrictCount, cogsim::Status::corrupt_data(msg));
    std::cout << "[WARN] " << msg << "\n";
    (void)runner.emit_event(events, "warning", msg);
  }

  // Delivery.
  cogsim::FileSinkConfig sc;
  sc.out_dir = cfg.output.out_dir;
  sc.format = fmt_r.value();
  sc.simulator = req.simulator;
  cogsim::FileRecordSink out(sc);

  auto report_r = cogsim::deliver_records(gen.records, out, [&](std::size_t index, const cogsim::Status& st) {
    std::cerr << "[WARN] record " << index << " not delivered: " << st.to_string() << "\n";
    (void)runner.emit_event(events, "warning", "record " + std::to_string(index) + " not delivered: " + st.message());
  });
  if (!report_r.ok()) return fail(kExitRuntime, report_r.status());
  const cogsim::DeliveryReport report = report_r.value();

  std::cout << "[INFO] Delivery: submitted=" << report.submitted << " succeeded=" << report.succeeded
            << " failed=" << report.failed << "\n";
  (void)runner.emit_event(events, "delivery_finished", out.path(),
                          {{"submitted", static_cast<std::int64_t>(report.submitted)},
                           {"succeeded", static_cast<std::int64_t>(report.succeeded)},
                           {"failed", static_cast<std::int64_t>(report.failed)}},
                          {{"sink", out.name()}, {"format", cfg.output.format}});

  (void)runner.emit_event(events, "shutdown", "completed", {{"exit_code", 0}});

  std::cout << "[INFO] Digest: " << digest << "\n";
  std::cout << "[OK] Wrote " << report.succeeded << " records to " << out.path() << "\n";
  return 0;
}
