#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "tracemap/trace_record.hpp"

namespace tracemap {

// Identity set of the records currently handed to the renderer. A new result
// only replaces the list when its ids differ, so repeated fetches of the same
// region never trigger a redraw.
class RenderedSetCache {
public:
    RenderedSetCache() = default;

    // True when the id set changed and records replaced the rendered list.
    bool update(const std::vector<TraceRecord>& records);
    bool contains(const std::string& id) const { return ids_.count(id) > 0; }
    void clear();

    const std::vector<TraceRecord>& records() const { return records_; }
    const std::unordered_set<std::string>& ids() const { return ids_; }

    size_t size() const { return ids_.size(); }
    size_t updates() const { return updates_; }
    size_t suppressed() const { return suppressed_; }

private:
    std::unordered_set<std::string> ids_;
    std::vector<TraceRecord> records_;
    size_t updates_ = 0;
    size_t suppressed_ = 0;
};

} // namespace tracemap
