#include "tracemap/engine_config.hpp"

#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>

// Minimal JSON parsing (no deps)
namespace {
bool is_space(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

// Position of the value for "key". A quoted key only counts when a ':' follows,
// so the same text inside a string value is skipped.
std::optional<size_t> find_value(const std::string& json, const std::string& key) {
    const std::string quoted = "\"" + key + "\"";
    for (auto pos = json.find(quoted); pos != std::string::npos; pos = json.find(quoted, pos + 1)) {
        auto after = pos + quoted.size();
        while (after < json.size() && is_space(json[after])) after++;
        if (after >= json.size() || json[after] != ':') continue;
        after++;
        while (after < json.size() && is_space(json[after])) after++;
        return after;
    }
    return std::nullopt;
}

// The number must run up to ',', '}' or whitespace.
void check_number_end(const std::string& json, size_t end, const std::string& key) {
    if (end < json.size() && json[end] != ',' && json[end] != '}' && !is_space(json[end])) {
        throw std::invalid_argument("Config key \"" + key + "\" has trailing characters");
    }
}

std::optional<std::string> extract_string(const std::string& json, const std::string& key) {
    auto pos = find_value(json, key);
    if (!pos || *pos >= json.size() || json[*pos] != '"') return std::nullopt;
    auto start = *pos + 1;
    auto end = json.find('"', start);
    if (end == std::string::npos) return std::nullopt;
    return json.substr(start, end - start);
}

std::optional<double> extract_number(const std::string& json, const std::string& key) {
    auto pos = find_value(json, key);
    if (!pos) return std::nullopt;
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(json.substr(*pos), &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Config key \"" + key + "\" is not a number");
    }
    check_number_end(json, *pos + used, key);
    return value;
}

std::optional<int> extract_int(const std::string& json, const std::string& key) {
    auto pos = find_value(json, key);
    if (!pos) return std::nullopt;
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(json.substr(*pos), &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Config key \"" + key + "\" is not an integer");
    }
    check_number_end(json, *pos + used, key);
    return value;
}
}

namespace tracemap {

void EngineConfig::validate() const {
    if (write_precision < geohash::kMinPrecision || write_precision > geohash::kMaxPrecision) {
        throw std::invalid_argument("write_precision out of range");
    }
    if (floor_precision < geohash::kMinPrecision || floor_precision > write_precision) {
        throw std::invalid_argument("floor_precision must lie in [1, write_precision]");
    }
    if (settle_delay.count() < 0) {
        throw std::invalid_argument("settle_delay_ms must not be negative");
    }
    if (key_decimals < 0 || key_decimals > 9) {
        throw std::invalid_argument("key_decimals must lie in [0, 9]");
    }
    if (global_sample_min_span <= 0.0) {
        throw std::invalid_argument("global_sample_min_span must be positive");
    }
}

EngineConfig load_engine_config(const std::string& path) {
    std::ifstream json_file(path);
    if (!json_file) throw std::runtime_error("Cannot open " + path);

    std::string json((std::istreambuf_iterator<char>(json_file)), std::istreambuf_iterator<char>());

    EngineConfig config;
    if (auto v = extract_int(json, "write_precision")) config.write_precision = *v;
    if (auto v = extract_int(json, "floor_precision")) config.floor_precision = *v;
    if (auto v = extract_int(json, "settle_delay_ms")) config.settle_delay = std::chrono::milliseconds(*v);
    if (auto v = extract_int(json, "key_decimals")) config.key_decimals = *v;
    if (auto v = extract_int(json, "global_sample_limit")) {
        if (*v < 0) throw std::invalid_argument("global_sample_limit must not be negative");
        config.global_sample_limit = static_cast<size_t>(*v);
    }
    if (auto v = extract_number(json, "global_sample_min_span")) config.global_sample_min_span = *v;
    if (auto v = extract_string(json, "log_level")) config.log_level = *v;

    config.validate();
    return config;
}

} // namespace tracemap
