// include/cogsim/core/util/config_loader.hpp
#pragma once

#include <string>

#include "cogsim/core/config.hpp"
#include "cogsim/core/status.hpp"

namespace cogsim {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
// - A relative profiles.path is resolved relative to the main config file.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

// Same parsing rules for an in-memory document (no includes, no path resolution).
Result<Config> parse_config(const std::string& yaml_text);

}  // namespace cogsim
