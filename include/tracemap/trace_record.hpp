#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "tracemap/geohash.hpp"
#include "tracemap/viewport.hpp"

namespace tracemap {

using Timestamp = std::chrono::system_clock::time_point;

// A trace document has one audio slot and one image slot.
constexpr size_t kMaxMediaRefs = 2;

struct TraceRecord {
    std::string id;
    std::string name;
    Coordinate coordinate;
    std::string geohash;                    // written at kWritePrecision, never re-derived
    std::vector<std::string> media_refs;    // [audioPath, imagePath], at most kMaxMediaRefs
    Timestamp created_at;
};

// Untyped field value as the document store hands it out.
using FieldValue = std::variant<double, std::int64_t, std::string, Coordinate, Timestamp>;

struct Document {
    std::string id;
    std::unordered_map<std::string, FieldValue> fields;
};

// Document field names of the "traces" collection.
namespace fields {
constexpr const char* kName = "name";
constexpr const char* kLocation = "location";
constexpr const char* kGeohash = "geohash";
constexpr const char* kAudioPath = "audioPath";
constexpr const char* kImagePath = "imagePath";
constexpr const char* kTimestamp = "timestamp";
}

// Writer side: computes the index geohash once, at the given precision.
// Throws std::invalid_argument for more than kMaxMediaRefs media refs.
TraceRecord make_trace_record(std::string id, std::string name, const Coordinate& coordinate,
                              std::vector<std::string> media_refs, Timestamp created_at,
                              int write_precision = kWritePrecision);

// Empty when a required field is missing or has the wrong type.
std::optional<TraceRecord> decode_trace(const Document& doc);

// Throws std::invalid_argument when media_refs has no document slot left.
Document to_document(const TraceRecord& record);

} // namespace tracemap
