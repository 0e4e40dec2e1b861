// File: include/cogsim/core/model/identity.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "cogsim/core/status.hpp"
#include "cogsim/core/types.hpp"
#include "cogsim/core/util/random.hpp"

namespace cogsim {

struct PatientIdentity {
  PatientId patient_id;
  DeviceId device_id;

  // Position in the supplied profile collection; empty for synthetic patients.
  std::optional<std::size_t> profile_index;
};

struct ResolvedCohort {
  std::vector<PatientIdentity> patients;  // resolved profile order
  std::vector<std::string> warnings;      // non-fatal, for the caller to log

  std::size_t requested = 0;
  std::size_t available = 0;  // profiles supplied (0 without a profile source)
};

// Reconciles a requested patient count with an optional profile collection.
//  - profiles == nullptr: `requested` fresh UUIDs, device ids ROLE-001..ROLE-N.
//  - fewer profiles than requested: warning, count reduced to what is available.
//  - use_all: every profile, whatever `requested` says.
//  - profile ids are reused; a missing id gets a fresh UUID (with a warning).
//  - the role's device id is reused when present, else ROLE-{position:03d}.
// Errors: empty collection, duplicate patient ids among the selected profiles.
Result<ResolvedCohort> resolve_identities(std::size_t requested, const std::vector<PatientProfile>* profiles,
                                          DeviceRole role, bool use_all, Rng& rng);

// "SPK-007" for position 6 (zero-based).
DeviceId positional_device_id(DeviceRole role, std::size_t position);

}  // namespace cogsim
