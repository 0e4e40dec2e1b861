// File: include/cogsim/adapters/profile_json/profile_json.hpp
#pragma once

#include <string>
#include <vector>

#include "cogsim/core/config.hpp"
#include "cogsim/core/status.hpp"
#include "cogsim/core/types.hpp"

namespace cogsim {

// Patient profile collections stored as a JSON array of objects.
//
// Parsing goes through yaml-cpp (JSON is a YAML subset). Rules:
//  - the root must be an array, every element an object (invalid_argument);
//  - every field is optional; a missing cognitive_baseline field takes the
//    documented default (26 / 24 / 6) and sets cognitive_baseline_defaulted;
//  - malformed text is parse_error, a missing file not_found.
Result<std::vector<PatientProfile>> parse_profiles(const std::string& json_text);
Result<std::vector<PatientProfile>> load_profiles(const std::string& path);

// JSON array, two-space indent, fields in schema order.
std::string encode_profiles(const std::vector<PatientProfile>& profiles);
Status write_profiles(const std::vector<PatientProfile>& profiles, const std::string& path);

struct ProfileSource {
  std::string path;  // empty: no profiles, run with synthetic identities
  std::vector<PatientProfile> profiles;
  std::vector<std::string> attempted;  // every location looked at, in order
  std::vector<std::string> warnings;   // empty collections that were passed over
};

// Candidate files probed by the search: <out_dir>/patient_profiles.json, then
// <config_dir>/patient_profiles.json.
std::vector<std::string> profile_search_paths(const std::string& out_dir, const std::string& config_dir);

// Explicit profiles.path first (must exist and parse). Otherwise, when
// profiles.search is set or synthetic ids are not allowed, the search paths
// in order; unreadable candidates are skipped. A collection holding no
// profiles is passed over with a warning. Without a hit and without
// allow_synthetic the result is not_found listing every attempted path.
Result<ProfileSource> discover_profiles(const ProfilesConfig& cfg, bool allow_synthetic, const std::string& out_dir,
                                        const std::string& config_dir);

}  // namespace cogsim
