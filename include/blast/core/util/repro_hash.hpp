// include/blast/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "blast/core/config.hpp"

namespace blast {

// Hash of the full effective config. Written into every run header so a run can be
// matched to the configuration that produced it.
std::string compute_config_hash(const Config& cfg);

}  // namespace blast
