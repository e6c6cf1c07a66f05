#include "tracemap/rendered_set_cache.hpp"

#include <utility>

namespace tracemap {

bool RenderedSetCache::update(const std::vector<TraceRecord>& records) {
    std::unordered_set<std::string> incoming;
    incoming.reserve(records.size());
    for (const auto& record : records) {
        incoming.insert(record.id);
    }

    if (incoming == ids_) {
        suppressed_++;
        return false;
    }

    ids_ = std::move(incoming);
    records_ = records;
    updates_++;
    return true;
}

void RenderedSetCache::clear() {
    ids_.clear();
    records_.clear();
}

} // namespace tracemap
