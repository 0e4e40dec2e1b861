// File: include/cogsim/core/events/event_sink.hpp
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "cogsim/core/status.hpp"
#include "cogsim/core/types.hpp"

namespace cogsim {

// Run log model. Keep output stable; evolve by adding fields.

struct RunInfo {
  std::string tool;  // "cogsim_gen", "cogsim_profiles"
  std::string config_path;
  std::string out_dir;
  std::string config_hash;

  std::uint64_t seed = 0;
  bool seed_from_config = false;  // false: drawn from entropy for this run

  std::string simulator;

  TimestampNs start_time_ns;       // always 0
  TimestampNs wall_start_time_ns;  // epoch ns
};

struct Event {
  std::string type;  // "profiles_loaded", "warning", "patient_skipped", ...
  TimestampNs t_ns;       // since run start
  TimestampNs t_wall_ns;  // epoch

  std::string message;  // optional human-readable hint

  // Optional structured payload, written in insertion order.
  std::vector<std::pair<std::string, std::int64_t>> counts;
  std::vector<std::pair<std::string, std::string>> attrs;
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace cogsim
