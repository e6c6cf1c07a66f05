#include "tracemap/trace_record.hpp"

#include <stdexcept>
#include <utility>

namespace tracemap {

namespace {
void check_media_refs(const std::vector<std::string>& media_refs) {
    if (media_refs.size() > kMaxMediaRefs) {
        throw std::invalid_argument("A trace holds at most " + std::to_string(kMaxMediaRefs) +
                                    " media refs, got " + std::to_string(media_refs.size()));
    }
}

template<typename T>
const T* field(const Document& doc, const char* key) {
    auto it = doc.fields.find(key);
    if (it == doc.fields.end()) return nullptr;
    return std::get_if<T>(&it->second);
}
}

TraceRecord make_trace_record(std::string id, std::string name, const Coordinate& coordinate,
                              std::vector<std::string> media_refs, Timestamp created_at,
                              int write_precision) {
    check_media_refs(media_refs);
    return TraceRecord{
        std::move(id),
        std::move(name),
        coordinate,
        geohash::encode(coordinate, write_precision),
        std::move(media_refs),
        created_at
    };
}

std::optional<TraceRecord> decode_trace(const Document& doc) {
    if (doc.id.empty()) return std::nullopt;

    const auto* name = field<std::string>(doc, fields::kName);
    const auto* location = field<Coordinate>(doc, fields::kLocation);
    const auto* hash = field<std::string>(doc, fields::kGeohash);
    const auto* timestamp = field<Timestamp>(doc, fields::kTimestamp);
    if (!name || !location || !hash || !timestamp) return std::nullopt;
    if (!location->is_valid() || !geohash::is_valid(*hash)) return std::nullopt;

    TraceRecord record{doc.id, *name, *location, *hash, {}, *timestamp};
    for (const char* key : {fields::kAudioPath, fields::kImagePath}) {
        if (const auto* ref = field<std::string>(doc, key)) {
            record.media_refs.push_back(*ref);
        }
    }
    return record;
}

Document to_document(const TraceRecord& record) {
    check_media_refs(record.media_refs);
    Document doc;
    doc.id = record.id;
    doc.fields[fields::kName] = record.name;
    doc.fields[fields::kLocation] = record.coordinate;
    doc.fields[fields::kGeohash] = record.geohash;
    doc.fields[fields::kTimestamp] = record.created_at;
    if (record.media_refs.size() > 0) doc.fields[fields::kAudioPath] = record.media_refs[0];
    if (record.media_refs.size() > 1) doc.fields[fields::kImagePath] = record.media_refs[1];
    return doc;
}

} // namespace tracemap
