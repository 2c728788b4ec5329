// include/blast/core/util/config_loader.hpp
#pragma once

#include <string>

#include "blast/core/config.hpp"
#include "blast/core/status.hpp"

namespace blast {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

// Same rules for an in-memory document. `includes:` is rejected here.
Result<Config> parse_config(const std::string& yaml_text);

}  // namespace blast
