// File: src/core/model/simulator.cpp
#include "cogsim/core/model/simulator.hpp"

namespace cogsim {

std::unique_ptr<DomainSimulator> make_simulator(SimulatorKind kind, const CouplingConfig& coupling) {
  switch (kind) {
    case SimulatorKind::kComposite: return make_composite_simulator(coupling);
    case SimulatorKind::kExecutiveFunction: return make_executive_function_simulator();
    case SimulatorKind::kMemory: return make_memory_simulator(coupling);
    case SimulatorKind::kLanguage: return make_language_simulator();
    case SimulatorKind::kMobility: return make_mobility_simulator();
  }
  return nullptr;
}

const char* domain_tag(SimulatorKind kind) {
  switch (kind) {
    case SimulatorKind::kComposite: return "";
    case SimulatorKind::kExecutiveFunction: return "executive_function";
    case SimulatorKind::kMemory: return "memory";
    case SimulatorKind::kLanguage: return "language";
    case SimulatorKind::kMobility: return "mobility";
  }
  return "";
}

TaskLabel task_label(SimulatorKind kind) {
  switch (kind) {
    case SimulatorKind::kExecutiveFunction: return TaskLabel{"task_type", "trail_making_test_b"};
    case SimulatorKind::kMemory: return TaskLabel{"test_type", "MoCA_recall"};
    case SimulatorKind::kLanguage: return TaskLabel{"task_type", "verbal_fluency_test"};
    case SimulatorKind::kMobility: return TaskLabel{"task_type", "daily_activity_monitoring"};
    case SimulatorKind::kComposite: break;
  }
  return TaskLabel{"", ""};
}

}  // namespace cogsim
