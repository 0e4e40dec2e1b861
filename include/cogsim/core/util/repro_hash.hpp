// File: include/cogsim/core/util/repro_hash.hpp
#pragma once

#include <string>
#include <vector>

#include "cogsim/core/config.hpp"
#include "cogsim/core/io/session_record.hpp"

namespace cogsim {

// Fingerprint of every config field that can change the generated output
// (the seed only when it is fixed in the config).
std::string compute_config_hash(const Config& cfg);

// Fingerprint of the encoded record stream. Equal digests across runs mean
// byte-identical output.
std::string compute_records_digest(const std::vector<SessionRecord>& records, SimulatorKind kind);

}  // namespace cogsim
