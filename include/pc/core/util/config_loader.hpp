// File: include/pc/core/util/config_loader.hpp
#pragma once

#include <string>

#include "pc/core/config.hpp"
#include "pc/core/status.hpp"

namespace pc {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

// Same, from an in-memory document (no includes).
Result<Config> load_config_from_string(const std::string& yaml);

}  // namespace pc
