#include "tracemap/log.hpp"

#include <mutex>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace tracemap {

namespace {
constexpr const char* kLoggerName = "tracemap";
std::mutex logger_mutex;
}

std::shared_ptr<spdlog::logger> log() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stdout_color_mt(kLoggerName);
    }
    return logger;
}

void set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    log()->set_level(parsed);
}

} // namespace tracemap
