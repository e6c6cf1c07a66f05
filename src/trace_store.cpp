#include "tracemap/trace_store.hpp"

#include <algorithm>
#include <utility>

namespace tracemap {

StoreError::StoreError(Code code, const std::string& what)
    : std::runtime_error(what)
    , code_(code) {}

const char* to_string(StoreError::Code code) {
    switch (code) {
        case StoreError::Code::Unavailable: return "unavailable";
        case StoreError::Code::Timeout: return "timeout";
        case StoreError::Code::PermissionDenied: return "permission denied";
    }
    return "unknown";
}

void InMemoryTraceStore::put(const TraceRecord& record) {
    put(to_document(record));
}

void InMemoryTraceStore::put(Document doc) {
    std::lock_guard<std::mutex> lock(mutex_);
    unindex(doc.id);

    auto it = doc.fields.find(fields::kGeohash);
    if (it != doc.fields.end()) {
        if (const auto* hash = std::get_if<std::string>(&it->second)) {
            by_geohash_.emplace(*hash, doc.id);
        }
    }
    std::string id = doc.id;
    by_id_[id] = std::move(doc);
}

bool InMemoryTraceStore::erase(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (by_id_.find(id) == by_id_.end()) return false;
    unindex(id);
    by_id_.erase(id);
    return true;
}

void InMemoryTraceStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    by_id_.clear();
    by_geohash_.clear();
}

size_t InMemoryTraceStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_id_.size();
}

void InMemoryTraceStore::unindex(const std::string& id) {
    auto existing = by_id_.find(id);
    if (existing == by_id_.end()) return;

    auto field = existing->second.fields.find(fields::kGeohash);
    if (field == existing->second.fields.end()) return;
    const auto* hash = std::get_if<std::string>(&field->second);
    if (!hash) return;

    auto [first, last] = by_geohash_.equal_range(*hash);
    for (auto it = first; it != last; ++it) {
        if (it->second == id) {
            by_geohash_.erase(it);
            return;
        }
    }
}

std::vector<Document> InMemoryTraceStore::query_range(const std::string& lower, const std::string& upper,
                                                      size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Document> result;
    auto end = by_geohash_.lower_bound(upper);
    for (auto it = by_geohash_.lower_bound(lower); it != end && result.size() < limit; ++it) {
        result.push_back(by_id_.at(it->second));
    }
    return result;
}

std::vector<Document> InMemoryTraceStore::recent(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<Timestamp, const Document*>> stamped;
    stamped.reserve(by_id_.size());
    for (const auto& [id, doc] : by_id_) {
        auto field = doc.fields.find(fields::kTimestamp);
        if (field == doc.fields.end()) continue;
        if (const auto* ts = std::get_if<Timestamp>(&field->second)) {
            stamped.emplace_back(*ts, &doc);
        }
    }

    auto newer = [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second->id < b.second->id;
    };
    size_t n = std::min(limit, stamped.size());
    std::partial_sort(stamped.begin(), stamped.begin() + n, stamped.end(), newer);

    std::vector<Document> result;
    result.reserve(n);
    for (size_t i = 0; i < n; i++) {
        result.push_back(*stamped[i].second);
    }
    return result;
}

size_t InMemoryTraceStore::count_in_box(const BoundingBox& box) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, doc] : by_id_) {
        auto field = doc.fields.find(fields::kLocation);
        if (field == doc.fields.end()) continue;
        const auto* location = std::get_if<Coordinate>(&field->second);
        if (location && box.contains(*location)) count++;
    }
    return count;
}

} // namespace tracemap
