#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "tracemap/trace_record.hpp"

namespace tracemap {

class StoreError : public std::runtime_error {
public:
    enum class Code {
        Unavailable,
        Timeout,
        PermissionDenied,
    };

    StoreError(Code code, const std::string& what);

    Code code() const { return code_; }

private:
    Code code_;
};

const char* to_string(StoreError::Code code);

// Read side of the remote "traces" collection. Implementations must accept
// concurrent calls and report failures by throwing StoreError.
class TraceStore {
public:
    virtual ~TraceStore() = default;

    // Documents with lower <= geohash < upper, ascending by geohash, at most limit.
    virtual std::vector<Document> query_range(const std::string& lower, const std::string& upper,
                                              size_t limit) = 0;

    // Newest documents first, at most limit.
    virtual std::vector<Document> recent(size_t limit) = 0;

    // Aggregate count of documents located inside box.
    virtual size_t count_in_box(const BoundingBox& box) = 0;
};

class InMemoryTraceStore : public TraceStore {
public:
    InMemoryTraceStore() = default;

    void put(const TraceRecord& record);
    void put(Document doc);
    bool erase(const std::string& id);
    void clear();

    size_t size() const;

    std::vector<Document> query_range(const std::string& lower, const std::string& upper,
                                      size_t limit) override;
    std::vector<Document> recent(size_t limit) override;
    size_t count_in_box(const BoundingBox& box) override;

private:
    void unindex(const std::string& id);

    std::unordered_map<std::string, Document> by_id_;
    std::multimap<std::string, std::string> by_geohash_;
    mutable std::mutex mutex_;
};

} // namespace tracemap
