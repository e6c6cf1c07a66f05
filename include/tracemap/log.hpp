#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace tracemap {

// Shared "tracemap" logger. Reuses a logger registered under that name, so
// host applications can install their own sinks before the engine starts.
std::shared_ptr<spdlog::logger> log();

// Accepts trace, debug, info, warn, error, critical or off.
void set_log_level(const std::string& level);

} // namespace tracemap
