#pragma once

#include <string>
#include <string_view>

#include "tracemap/viewport.hpp"

namespace tracemap {

// Precision records are indexed at when they are written.
constexpr int kWritePrecision = 8;

namespace geohash {

constexpr int kMinPrecision = 1;
constexpr int kMaxPrecision = 12;

// Sorts after every symbol of the alphabet.
constexpr char kPrefixSentinel = '~';

extern const char* const kAlphabet;

struct CellSize {
    double lat_height;
    double lon_width;   // at the equator, in degrees
};

struct GeoCell {
    BoundingBox bounds;
    Coordinate center;
};

std::string encode(const Coordinate& coordinate, int precision);
GeoCell decode(std::string_view hash);
CellSize cell_size(int precision);

bool is_valid(std::string_view hash);

// Exclusive upper bound of the range holding every hash that starts with prefix.
std::string prefix_upper_bound(std::string_view prefix);

} // namespace geohash
} // namespace tracemap
