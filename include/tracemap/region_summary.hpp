#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "tracemap/trace_store.hpp"
#include "tracemap/viewport.hpp"

namespace tracemap {

struct GeographicRegion {
    std::string name;
    BoundingBox bounds;
    Coordinate anchor;
};

struct RegionSummary {
    std::string name;
    size_t count;
    Coordinate anchor;
};

// Continent-scale boxes used for the coarse count view.
const std::vector<GeographicRegion>& builtin_regions();

// Trace counts for the regions intersecting viewport, populated regions only.
// Uses one aggregate count query per region instead of a cell fan-out.
std::vector<RegionSummary> summarize_regions(TraceStore& store, const Viewport& viewport,
                                             const std::vector<GeographicRegion>& regions = builtin_regions());

} // namespace tracemap
