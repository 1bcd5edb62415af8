// File: include/pc/core/util/repro_hash.hpp
#pragma once

#include <string>
#include <vector>

#include "pc/core/config.hpp"
#include "pc/core/types.hpp"

namespace pc {

// Hash the full runtime config. If the run settings change, this hash changes.
std::string compute_config_hash(const Config& cfg);

// Fingerprint of the clustered batch (order-sensitive). Two runs that report
// the same hash clustered exactly the same events.
std::string compute_events_hash(const std::vector<Event>& events);

// Stable 16-hex-digit key for arbitrary strings (cache file names).
std::string hash_string_hex(const std::string& s);

}  // namespace pc
