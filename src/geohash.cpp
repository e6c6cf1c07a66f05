#include "tracemap/geohash.hpp"

#include <array>
#include <cmath>
#include <stdexcept>

namespace tracemap {
namespace geohash {

const char* const kAlphabet = "0123456789bcdefghjkmnpqrstuvwxyz";

namespace {
constexpr int kBitsPerSymbol = 5;

// Reverse lookup over the ASCII range, -1 for symbols outside the alphabet.
constexpr std::array<int, 128> make_decode_table() {
    std::array<int, 128> table{};
    for (auto& v : table) v = -1;
    constexpr const char* symbols = "0123456789bcdefghjkmnpqrstuvwxyz";
    for (int i = 0; i < 32; i++) {
        table[static_cast<unsigned char>(symbols[i])] = i;
    }
    return table;
}

constexpr std::array<int, 128> kDecodeTable = make_decode_table();

int symbol_value(char c) {
    auto u = static_cast<unsigned char>(c);
    if (u >= kDecodeTable.size()) return -1;
    return kDecodeTable[u];
}

void check_precision(int precision) {
    if (precision < kMinPrecision || precision > kMaxPrecision) {
        throw std::invalid_argument("Geohash precision out of range: " + std::to_string(precision));
    }
}
}

std::string encode(const Coordinate& coordinate, int precision) {
    check_precision(precision);
    if (!coordinate.is_valid()) {
        throw std::out_of_range("Coordinate out of range: " +
                                std::to_string(coordinate.lat) + ", " + std::to_string(coordinate.lon));
    }

    double lat_min = kMinLat, lat_max = kMaxLat;
    double lon_min = kMinLon, lon_max = kMaxLon;
    bool is_lon = true;

    std::string hash;
    hash.reserve(precision);

    int bits = 0;
    int value = 0;
    while (static_cast<int>(hash.size()) < precision) {
        value <<= 1;
        if (is_lon) {
            double mid = (lon_min + lon_max) / 2;
            if (coordinate.lon >= mid) {
                value |= 1;
                lon_min = mid;
            } else {
                lon_max = mid;
            }
        } else {
            double mid = (lat_min + lat_max) / 2;
            if (coordinate.lat >= mid) {
                value |= 1;
                lat_min = mid;
            } else {
                lat_max = mid;
            }
        }
        is_lon = !is_lon;

        if (++bits == kBitsPerSymbol) {
            hash.push_back(kAlphabet[value]);
            bits = 0;
            value = 0;
        }
    }
    return hash;
}

GeoCell decode(std::string_view hash) {
    if (hash.empty() || static_cast<int>(hash.size()) > kMaxPrecision) {
        throw std::invalid_argument("Geohash length out of range: " + std::string(hash));
    }

    double lat_min = kMinLat, lat_max = kMaxLat;
    double lon_min = kMinLon, lon_max = kMaxLon;
    bool is_lon = true;

    for (char c : hash) {
        int value = symbol_value(c);
        if (value < 0) {
            throw std::invalid_argument("Invalid geohash symbol in: " + std::string(hash));
        }
        for (int bit = kBitsPerSymbol - 1; bit >= 0; bit--) {
            bool set = (value >> bit) & 1;
            if (is_lon) {
                double mid = (lon_min + lon_max) / 2;
                (set ? lon_min : lon_max) = mid;
            } else {
                double mid = (lat_min + lat_max) / 2;
                (set ? lat_min : lat_max) = mid;
            }
            is_lon = !is_lon;
        }
    }

    return GeoCell{
        BoundingBox{lat_min, lat_max, lon_min, lon_max},
        Coordinate{(lat_min + lat_max) / 2, (lon_min + lon_max) / 2}
    };
}

CellSize cell_size(int precision) {
    check_precision(precision);
    int total_bits = kBitsPerSymbol * precision;
    int lon_bits = (total_bits + 1) / 2;
    int lat_bits = total_bits / 2;
    return CellSize{
        (kMaxLat - kMinLat) / std::ldexp(1.0, lat_bits),
        (kMaxLon - kMinLon) / std::ldexp(1.0, lon_bits)
    };
}

bool is_valid(std::string_view hash) {
    if (hash.empty() || static_cast<int>(hash.size()) > kMaxPrecision) return false;
    for (char c : hash) {
        if (symbol_value(c) < 0) return false;
    }
    return true;
}

std::string prefix_upper_bound(std::string_view prefix) {
    std::string bound(prefix);
    bound.push_back(kPrefixSentinel);
    return bound;
}

} // namespace geohash
} // namespace tracemap
