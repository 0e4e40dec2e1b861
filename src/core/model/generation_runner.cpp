// File: src/core/model/generation_runner.cpp
#include "cogsim/core/model/generation_runner.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "cogsim/core/util/random.hpp"
#include "cogsim/core/util/repro_hash.hpp"

namespace cogsim {
namespace {

// "run_<digits>.jsonl" -> digits, else -1.
std::int64_t parse_run_log_epoch_ns(const std::string& name) {
  const std::string prefix = "run_";
  const std::string suffix = ".jsonl";

  if (name == "run_latest.jsonl") return -1;
  if (name.rfind(prefix, 0) != 0) return -1;
  if (name.size() <= prefix.size() + suffix.size()) return -1;
  if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return -1;

  const std::string mid = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  std::int64_t v = 0;
  const auto [ptr, ec] = std::from_chars(mid.data(), mid.data() + mid.size(), v);
  if (ec != std::errc() || ptr != mid.data() + mid.size() || v < 0) return -1;
  return v;
}

}  // namespace

GenerationRunner::GenerationRunner(Config cfg, std::string config_path, std::string tool)
    : cfg_(std::move(cfg)), config_path_(std::move(config_path)), tool_(std::move(tool)) {
  seed_from_config_ = cfg_.generator.seed.has_value();
  seed_ = seed_from_config_ ? *cfg_.generator.seed : Rng::entropy_seed();
}

TimestampNs GenerationRunner::wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

TimestampNs GenerationRunner::since_start_ns() const {
  if (!started_) return TimestampNs{0};
  const auto now = std::chrono::steady_clock::now();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now - t0_steady_).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

void GenerationRunner::prune_run_logs(const std::string& out_dir, std::size_t keep_last) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(out_dir, ec)) return;

  struct Entry {
    std::int64_t key_epoch_ns;
    fs::path path;
  };

  std::vector<Entry> files;
  for (const auto& it : fs::directory_iterator(out_dir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;

    const std::int64_t k = parse_run_log_epoch_ns(it.path().filename().string());
    if (k < 0) continue;
    files.push_back(Entry{k, it.path()});
  }

  if (files.size() <= keep_last) return;

  // Newest first, delete the tail.
  std::sort(files.begin(), files.end(),
            [](const Entry& a, const Entry& b) { return a.key_epoch_ns > b.key_epoch_ns; });

  for (std::size_t i = keep_last; i < files.size(); ++i) {
    fs::remove(files[i].path, ec);
    ec.clear();  // best-effort housekeeping
  }
}

Status GenerationRunner::start(EventSink& sink) {
  // The new run adds one more log, so keep one fewer of the old ones.
  const std::size_t keep = static_cast<std::size_t>(std::max(1, cfg_.output.keep_run_logs));
  prune_run_logs(cfg_.output.out_dir, keep - 1);

  t0_steady_ = std::chrono::steady_clock::now();
  t0_wall_ns_ = wall_now_epoch_ns();
  started_ = true;

  RunInfo run;
  run.tool = tool_;
  run.config_path = config_path_;
  run.out_dir = cfg_.output.out_dir;
  run.config_hash = compute_config_hash(cfg_);
  run.seed = seed_;
  run.seed_from_config = seed_from_config_;
  run.simulator = cfg_.generator.simulator;

  run.start_time_ns = TimestampNs{0};
  run.wall_start_time_ns = t0_wall_ns_;

  return sink.open(run);
}

Status GenerationRunner::emit_event(EventSink& sink, const std::string& type, const std::string& message,
                                    std::vector<std::pair<std::string, std::int64_t>> counts,
                                    std::vector<std::pair<std::string, std::string>> attrs) {
  Event e;
  e.type = type;
  e.t_ns = since_start_ns();
  e.t_wall_ns = wall_now_epoch_ns();
  e.message = message;
  e.counts = std::move(counts);
  e.attrs = std::move(attrs);
  return sink.emit(e);
}

Status GenerationRunner::emit_warnings(EventSink& sink, const std::vector<std::string>& warnings) {
  for (const std::string& w : warnings) {
    COGSIM_RETURN_IF_ERROR(emit_event(sink, "warning", w));
  }
  return Status::ok_status();
}

void GenerationRunner::stop(EventSink& sink) {
  if (!started_) return;
  (void)sink.flush();
  sink.close();
  started_ = false;
}

}  // namespace cogsim
