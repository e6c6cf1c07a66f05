#include "tracemap/coverage_planner.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

#include "tracemap/log.hpp"

namespace tracemap {

namespace {
// Longitude cells are widened by 1/cos(lat), floored so polar viewports stay bounded.
constexpr double kMinCosine = 0.3;

struct PrecisionStep {
    double min_delta;
    int precision;
};

constexpr PrecisionStep kPrecisionSteps[] = {
    {40.0, 1},
    {10.0, 2},
    {1.5, 3},
    {0.2, 4},
    {0.05, 5},
    {0.006, 6},
    {0.0015, 7},
};

struct CapsBucket {
    double min_delta;
    FetchCaps caps;
};

// Zooming in trades prefixes for records per cell.
constexpr CapsBucket kCapsBuckets[] = {
    {40.0, {16, 10}},
    {15.0, {14, 25}},
    {5.0, {12, 50}},
    {1.0, {10, 100}},
    {0.0, {9, 200}},
};

long cell_index(double value, double origin, double step, long count) {
    auto index = static_cast<long>(std::floor((value - origin) / step));
    return std::clamp(index, 0L, count - 1);
}
}

CoveragePlanner::CoveragePlanner(int write_precision, int floor_precision)
    : write_precision_(write_precision)
    , floor_precision_(floor_precision) {
    if (write_precision < geohash::kMinPrecision || write_precision > geohash::kMaxPrecision) {
        throw std::invalid_argument("write_precision out of range");
    }
    if (floor_precision < geohash::kMinPrecision || floor_precision > write_precision) {
        throw std::invalid_argument("floor_precision must lie in [1, write_precision]");
    }
}

int CoveragePlanner::clamp_precision(int precision) const {
    return std::clamp(precision, floor_precision_, write_precision_);
}

int CoveragePlanner::choose_precision(const Span& span) const {
    double delta = std::max(span.lat_delta, span.lon_delta);
    for (const auto& step : kPrecisionSteps) {
        if (delta >= step.min_delta) return clamp_precision(step.precision);
    }
    return clamp_precision(write_precision_);
}

FetchCaps CoveragePlanner::choose_fetch_caps(const Span& span) const {
    double delta = std::max(span.lat_delta, span.lon_delta);
    for (const auto& bucket : kCapsBuckets) {
        if (delta >= bucket.min_delta) return bucket.caps;
    }
    return kCapsBuckets[std::size(kCapsBuckets) - 1].caps;
}

CoverSet CoveragePlanner::cover_bounding_box(const Viewport& viewport, int precision, size_t cap) const {
    auto cell = geohash::cell_size(precision);
    auto bbox = viewport.bounding_box();
    cap = std::max<size_t>(cap, 1);

    int total_bits = 5 * precision;
    long rows = 1L << (total_bits / 2);
    long cols = 1L << ((total_bits + 1) / 2);

    long row_lo = cell_index(bbox.min_lat, kMinLat, cell.lat_height, rows);
    long row_hi = cell_index(bbox.max_lat, kMinLat, cell.lat_height, rows);
    long col_lo = cell_index(bbox.min_lon, kMinLon, cell.lon_width, cols);
    long col_hi = cell_index(bbox.max_lon, kMinLon, cell.lon_width, cols);

    CoverSet cover{{}, precision, false};
    for (long row = row_lo; row <= row_hi && !cover.truncated; row++) {
        double lat = kMinLat + (row + 0.5) * cell.lat_height;
        for (long col = col_lo; col <= col_hi; col++) {
            if (cover.prefixes.size() == cap) {
                cover.truncated = true;
                break;
            }
            double lon = kMinLon + (col + 0.5) * cell.lon_width;
            cover.prefixes.insert(geohash::encode(Coordinate{lat, lon}, precision));
        }
    }
    return cover;
}

size_t CoveragePlanner::estimate_cell_count(const Viewport& viewport, int precision) const {
    auto cell = geohash::cell_size(precision);
    auto bbox = viewport.bounding_box();

    double cosine = std::max(std::cos(deg2rad(viewport.center().lat)), kMinCosine);
    double lon_width = cell.lon_width / cosine;

    double rows = std::max(1.0, std::ceil(bbox.lat_span() / cell.lat_height));
    double cols = std::max(1.0, std::ceil(bbox.lon_span() / lon_width));
    return static_cast<size_t>(rows * cols);
}

CoveragePlan CoveragePlanner::plan(const Viewport& viewport) const {
    auto caps = choose_fetch_caps(viewport.span());
    int precision = choose_precision(viewport.span());

    while (precision > floor_precision_ && estimate_cell_count(viewport, precision) > caps.max_prefixes) {
        precision--;
    }

    auto cover = cover_bounding_box(viewport, precision, caps.max_prefixes);
    while (cover.truncated && precision > floor_precision_) {
        precision--;
        cover = cover_bounding_box(viewport, precision, caps.max_prefixes);
    }

    if (cover.truncated) {
        log()->warn("Cover truncated to {} prefixes at floor precision {} (span {:.4f} x {:.4f})",
                    caps.max_prefixes, precision,
                    viewport.span().lat_delta, viewport.span().lon_delta);
    }

    log()->debug("Planned {} prefixes at precision {} (per-cell limit {})",
                 cover.prefixes.size(), precision, caps.per_cell_limit);

    return CoveragePlan{
        std::vector<std::string>(cover.prefixes.begin(), cover.prefixes.end()),
        precision,
        caps,
        cover.truncated
    };
}

std::vector<std::string> CoveragePlanner::neighbor_prefixes(const Coordinate& center, int precision) const {
    auto cell = geohash::cell_size(precision);
    auto origin = center.clamped();

    std::vector<std::string> prefixes;
    prefixes.reserve(9);
    prefixes.push_back(geohash::encode(origin, precision));

    for (int dlat = -1; dlat <= 1; dlat++) {
        for (int dlon = -1; dlon <= 1; dlon++) {
            if (dlat == 0 && dlon == 0) continue;
            Coordinate offset{origin.lat + dlat * cell.lat_height, origin.lon + dlon * cell.lon_width};
            auto hash = geohash::encode(offset.clamped(), precision);
            if (std::find(prefixes.begin(), prefixes.end(), hash) == prefixes.end()) {
                prefixes.push_back(std::move(hash));
            }
        }
    }
    return prefixes;
}

} // namespace tracemap
