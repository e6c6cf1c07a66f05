#pragma once

#include <cmath>
#include <algorithm>

namespace tracemap {

constexpr double kMinLat = -90.0;
constexpr double kMaxLat = 90.0;
constexpr double kMinLon = -180.0;
constexpr double kMaxLon = 180.0;

struct Coordinate {
    double lat;
    double lon;

    bool is_valid() const {
        return std::isfinite(lat) && std::isfinite(lon) &&
               lat >= kMinLat && lat <= kMaxLat &&
               lon >= kMinLon && lon <= kMaxLon;
    }

    Coordinate clamped() const {
        return {std::clamp(lat, kMinLat, kMaxLat), std::clamp(lon, kMinLon, kMaxLon)};
    }
};

struct Span {
    double lat_delta;
    double lon_delta;
};

struct BoundingBox {
    double min_lat;
    double max_lat;
    double min_lon;
    double max_lon;

    bool contains(const Coordinate& c) const {
        return c.lat >= min_lat && c.lat <= max_lat &&
               c.lon >= min_lon && c.lon <= max_lon;
    }

    bool intersects(const BoundingBox& other) const {
        return min_lat <= other.max_lat && other.min_lat <= max_lat &&
               min_lon <= other.max_lon && other.min_lon <= max_lon;
    }

    double lat_span() const { return max_lat - min_lat; }
    double lon_span() const { return max_lon - min_lon; }
};

// Visible map region. Always valid once constructed.
class Viewport {
public:
    Viewport(const Coordinate& center, const Span& span);

    // Builds a viewport from raw renderer values, clamping the center into range
    // and the deltas into (0, 180] / (0, 360].
    static Viewport clamped(const Coordinate& center, const Span& span);

    const Coordinate& center() const { return center_; }
    const Span& span() const { return span_; }
    double max_delta() const { return std::max(span_.lat_delta, span_.lon_delta); }

    BoundingBox bounding_box() const;

private:
    Coordinate center_;
    Span span_;
};

inline double deg2rad(double deg) { return deg * M_PI / 180.0; }

} // namespace tracemap
