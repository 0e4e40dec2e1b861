// File: include/cogsim/core/model/simulator.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "cogsim/core/config.hpp"
#include "cogsim/core/io/session_record.hpp"
#include "cogsim/core/model/baseline.hpp"
#include "cogsim/core/model/domain_table.hpp"
#include "cogsim/core/types.hpp"
#include "cogsim/core/util/random.hpp"

namespace cogsim {

struct SessionSample {
  SessionMetrics metrics;
  std::optional<double> signal_quality;
};

// Per-patient state for one domain: baselines, trend rates and the decline
// flag, fixed at construction.
class PatientModel {
 public:
  virtual ~PatientModel() = default;

  // Metrics for one session on `day` (days since the first session).
  virtual SessionSample session(int day, Rng& rng) const = 0;

  virtual bool decline_active() const = 0;
};

class DomainSimulator {
 public:
  virtual ~DomainSimulator() = default;

  virtual SimulatorKind kind() const = 0;
  virtual std::string name() const { return simulator_name(kind()); }

  // Device role whose id is attached to every record.
  virtual DeviceRole device_role() const = 0;

  // Intraday window for the daily schedule.
  virtual IntradayWindow intraday_window() const = 0;

  virtual std::unique_ptr<PatientModel> make_patient(const PatientFactors& factors, Rng& rng) const = 0;
};

std::unique_ptr<DomainSimulator> make_composite_simulator(const CouplingConfig& coupling);
std::unique_ptr<DomainSimulator> make_executive_function_simulator();
std::unique_ptr<DomainSimulator> make_memory_simulator(const CouplingConfig& coupling);
std::unique_ptr<DomainSimulator> make_language_simulator();
std::unique_ptr<DomainSimulator> make_mobility_simulator();

std::unique_ptr<DomainSimulator> make_simulator(SimulatorKind kind, const CouplingConfig& coupling);

// -----------------------------
// Record labels per simulator
// -----------------------------

// "language", "memory", ...; empty for the composite record.
const char* domain_tag(SimulatorKind kind);

// Task label key ("task_type" / "test_type") and value; key empty when none.
struct TaskLabel {
  const char* key;
  const char* value;
};
TaskLabel task_label(SimulatorKind kind);

}  // namespace cogsim
