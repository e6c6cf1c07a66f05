#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "tracemap/geohash.hpp"
#include "tracemap/viewport.hpp"

namespace tracemap {

struct FetchCaps {
    size_t max_prefixes;
    size_t per_cell_limit;
};

struct CoverSet {
    std::set<std::string> prefixes;
    int precision;
    bool truncated;     // stopped at the cap before every cell was visited
};

struct CoveragePlan {
    std::vector<std::string> prefixes;
    int precision;
    FetchCaps caps;
    bool truncated;     // floor precision reached and the cover was cut at the cap
};

class CoveragePlanner {
public:
    explicit CoveragePlanner(int write_precision = kWritePrecision, int floor_precision = 1);

    int choose_precision(const Span& span) const;
    FetchCaps choose_fetch_caps(const Span& span) const;

    CoverSet cover_bounding_box(const Viewport& viewport, int precision, size_t cap) const;
    size_t estimate_cell_count(const Viewport& viewport, int precision) const;

    // Precision and prefixes to query for viewport, bounded by its fetch caps.
    CoveragePlan plan(const Viewport& viewport) const;

    // Center cell plus the cells one step away in each compass direction.
    std::vector<std::string> neighbor_prefixes(const Coordinate& center, int precision) const;

    int write_precision() const { return write_precision_; }
    int floor_precision() const { return floor_precision_; }

private:
    int clamp_precision(int precision) const;

    int write_precision_;
    int floor_precision_;
};

} // namespace tracemap
