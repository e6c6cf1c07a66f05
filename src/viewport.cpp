#include "tracemap/viewport.hpp"

#include <stdexcept>
#include <string>

namespace tracemap {

namespace {
constexpr double kMinDelta = 1e-9;
}

Viewport::Viewport(const Coordinate& center, const Span& span)
    : center_(center)
    , span_(span) {
    if (!center.is_valid()) {
        throw std::invalid_argument("Viewport center out of range: " +
                                    std::to_string(center.lat) + ", " + std::to_string(center.lon));
    }
    if (!std::isfinite(span.lat_delta) || !std::isfinite(span.lon_delta) ||
        span.lat_delta <= 0.0 || span.lon_delta <= 0.0) {
        throw std::invalid_argument("Viewport span must be positive");
    }
}

Viewport Viewport::clamped(const Coordinate& center, const Span& span) {
    Coordinate c = center;
    if (!std::isfinite(c.lat)) c.lat = 0.0;
    if (!std::isfinite(c.lon)) c.lon = 0.0;

    double lat_delta = std::isfinite(span.lat_delta) ? span.lat_delta : kMaxLat - kMinLat;
    double lon_delta = std::isfinite(span.lon_delta) ? span.lon_delta : kMaxLon - kMinLon;

    return Viewport(c.clamped(),
                    Span{std::clamp(lat_delta, kMinDelta, kMaxLat - kMinLat),
                         std::clamp(lon_delta, kMinDelta, kMaxLon - kMinLon)});
}

BoundingBox Viewport::bounding_box() const {
    double half_lat = span_.lat_delta / 2;
    double half_lon = span_.lon_delta / 2;
    return BoundingBox{
        std::clamp(center_.lat - half_lat, kMinLat, kMaxLat),
        std::clamp(center_.lat + half_lat, kMinLat, kMaxLat),
        std::clamp(center_.lon - half_lon, kMinLon, kMaxLon),
        std::clamp(center_.lon + half_lon, kMinLon, kMaxLon)
    };
}

} // namespace tracemap
