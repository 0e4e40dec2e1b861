// File: src/core/model/identity.cpp
#include "cogsim/core/model/identity.hpp"

#include <cstdio>
#include <unordered_set>

namespace cogsim {

DeviceId positional_device_id(DeviceRole role, std::size_t position) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s-%03zu", device_role_prefix(role), position + 1);
  return DeviceId(buf);
}

Result<ResolvedCohort> resolve_identities(std::size_t requested, const std::vector<PatientProfile>* profiles,
                                          DeviceRole role, bool use_all, Rng& rng) {
  ResolvedCohort out;
  out.requested = requested;

  if (!profiles) {
    if (requested == 0) {
      return Result<ResolvedCohort>::err(Status::invalid_argument("patient count must be > 0"));
    }
    out.patients.reserve(requested);
    for (std::size_t i = 0; i < requested; ++i) {
      out.patients.push_back(PatientIdentity{rng.uuid4(), positional_device_id(role, i), std::nullopt});
    }
    return Result<ResolvedCohort>::ok(std::move(out));
  }

  if (profiles->empty()) {
    return Result<ResolvedCohort>::err(Status::invalid_argument("profile collection is empty"));
  }

  out.available = profiles->size();
  std::size_t n = requested;
  if (use_all) {
    n = out.available;
  } else if (requested > out.available) {
    out.warnings.push_back("requested " + std::to_string(requested) + " patients but only " +
                           std::to_string(out.available) + " profiles available; reducing");
    n = out.available;
  }

  const char* role_key = device_role_key(role);
  std::unordered_set<std::string> seen;
  std::size_t missing_devices = 0;
  out.patients.reserve(n);

  for (std::size_t i = 0; i < n; ++i) {
    const PatientProfile& p = (*profiles)[i];
    PatientIdentity id;
    id.profile_index = i;

    if (p.patient_id.empty()) {
      id.patient_id = rng.uuid4();
      out.warnings.push_back("profile[" + std::to_string(i) + "] has no patient_id; assigned " + id.patient_id);
    } else {
      if (!seen.insert(p.patient_id).second) {
        return Result<ResolvedCohort>::err(
            Status::invalid_argument("duplicate patient_id '" + p.patient_id + "' at profile[" +
                                     std::to_string(i) + "]"));
      }
      id.patient_id = p.patient_id;
    }

    const auto dev = p.device_ids.find(role_key);
    if (dev != p.device_ids.end() && !dev->second.empty()) {
      id.device_id = dev->second;
    } else {
      id.device_id = positional_device_id(role, i);
      ++missing_devices;
    }
    out.patients.push_back(std::move(id));
  }

  if (missing_devices > 0) {
    out.warnings.push_back(std::to_string(missing_devices) + " profile(s) without a '" + role_key +
                           "' device id; synthesized positional ids");
  }
  return Result<ResolvedCohort>::ok(std::move(out));
}

}  // namespace cogsim
