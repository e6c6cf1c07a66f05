#include "tracemap/region_summary.hpp"

#include <exception>

#include "tracemap/log.hpp"

namespace tracemap {

const std::vector<GeographicRegion>& builtin_regions() {
    static const std::vector<GeographicRegion> regions = {
        {"North America", {15.0, 75.0, -170.0, -50.0}, {45.0, -100.0}},
        {"South America", {-55.0, 15.0, -85.0, -35.0}, {-15.0, -60.0}},
        {"Europe", {35.0, 70.0, -10.0, 40.0}, {50.0, 10.0}},
        {"Africa", {-35.0, 35.0, -20.0, 50.0}, {0.0, 20.0}},
        {"Asia", {10.0, 75.0, 40.0, 180.0}, {35.0, 100.0}},
        {"Australia", {-45.0, -10.0, 110.0, 180.0}, {-25.0, 135.0}},
        {"Antarctica", {-90.0, -60.0, -180.0, 180.0}, {-75.0, 0.0}},
    };
    return regions;
}

std::vector<RegionSummary> summarize_regions(TraceStore& store, const Viewport& viewport,
                                             const std::vector<GeographicRegion>& regions) {
    auto bbox = viewport.bounding_box();
    std::vector<RegionSummary> summaries;

    for (const auto& region : regions) {
        if (!region.bounds.intersects(bbox)) continue;

        size_t count = 0;
        try {
            count = store.count_in_box(region.bounds);
        } catch (const StoreError& e) {
            log()->warn("Count for {} failed ({}): {}", region.name, to_string(e.code()), e.what());
            continue;
        } catch (const std::exception& e) {
            log()->warn("Count for {} failed: {}", region.name, e.what());
            continue;
        }

        log()->debug("Count for {}: {}", region.name, count);
        if (count > 0) {
            summaries.push_back(RegionSummary{region.name, count, region.anchor});
        }
    }
    return summaries;
}

} // namespace tracemap
