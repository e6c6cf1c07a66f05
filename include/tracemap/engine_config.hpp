#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "tracemap/geohash.hpp"

namespace tracemap {

struct EngineConfig {
    int write_precision = kWritePrecision;
    int floor_precision = 1;
    std::chrono::milliseconds settle_delay{300};
    int key_decimals = 3;
    size_t global_sample_limit = 50;
    double global_sample_min_span = 40.0;   // degrees
    std::string log_level = "info";

    // Throws std::invalid_argument on out-of-range values.
    void validate() const;
};

// Reads <path> (JSON). Keys that are absent keep their defaults.
EngineConfig load_engine_config(const std::string& path);

} // namespace tracemap
