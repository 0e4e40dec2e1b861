// File: include/cogsim/core/model/generation_runner.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "cogsim/core/config.hpp"
#include "cogsim/core/events/event_sink.hpp"
#include "cogsim/core/status.hpp"
#include "cogsim/core/types.hpp"

namespace cogsim {

// GenerationRunner owns the run lifecycle and the run log.
// Time contract:
//  - t_ns      = relative since run start (starts at 0) using steady clock
//  - t_wall_ns = absolute epoch ns
class GenerationRunner {
 public:
  GenerationRunner(Config cfg, std::string config_path, std::string tool);

  // Seed the run will use: the configured one, else a fresh entropy seed.
  // Fixed at construction so it can be logged before generation.
  std::uint64_t seed() const { return seed_; }
  bool seed_from_config() const { return seed_from_config_; }

  // Prunes old run logs (output.keep_run_logs) and writes the run header.
  Status start(EventSink& sink);

  Status emit_event(EventSink& sink, const std::string& type, const std::string& message,
                    std::vector<std::pair<std::string, std::int64_t>> counts = {},
                    std::vector<std::pair<std::string, std::string>> attrs = {});

  // One "warning" event per entry.
  Status emit_warnings(EventSink& sink, const std::vector<std::string>& warnings);

  void stop(EventSink& sink);

  // Deletes run_<ns>.jsonl files beyond the newest `keep_last`. Never touches
  // run_latest.jsonl or record exports.
  static void prune_run_logs(const std::string& out_dir, std::size_t keep_last);

 private:
  static TimestampNs wall_now_epoch_ns();
  TimestampNs since_start_ns() const;

  Config cfg_;
  std::string config_path_;
  std::string tool_;

  std::uint64_t seed_{0};
  bool seed_from_config_{false};

  std::chrono::steady_clock::time_point t0_steady_{};
  TimestampNs t0_wall_ns_{0};
  bool started_{false};
};

}  // namespace cogsim
