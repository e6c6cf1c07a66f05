#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "tracemap/viewport.hpp"

namespace tracemap {

// Viewport quantized for change detection.
struct ViewportKey {
    std::int64_t lat;
    std::int64_t lon;
    std::int64_t lat_delta;
    std::int64_t lon_delta;

    bool operator==(const ViewportKey& other) const {
        return lat == other.lat && lon == other.lon &&
               lat_delta == other.lat_delta && lon_delta == other.lon_delta;
    }
    bool operator!=(const ViewportKey& other) const { return !(*this == other); }
};

ViewportKey make_viewport_key(const Viewport& viewport, int decimals);

struct FetchCycle {
    std::uint64_t sequence;
    Viewport viewport;
    ViewportKey key;
};

// Trailing debounce plus change gate in front of the fetch pipeline.
// Single-threaded: every call comes from the session's event thread.
class ViewportGate {
public:
    using Clock = std::chrono::steady_clock;

    explicit ViewportGate(std::chrono::milliseconds settle_delay = std::chrono::milliseconds(300),
                          int key_decimals = 3);

    // Replaces any pending viewport and restarts the settle timer.
    void submit(const Viewport& viewport, Clock::time_point now);

    // Issues a cycle once the burst has settled, unless the settled viewport
    // quantizes to the last completed cycle's key.
    std::optional<FetchCycle> poll(Clock::time_point now);

    // False when a newer cycle has been issued since; the caller drops its results.
    bool complete(const FetchCycle& cycle);

    bool is_latest(std::uint64_t sequence) const { return sequence == issued_; }
    bool has_pending() const { return pending_.has_value(); }
    bool in_flight() const { return issued_ != completed_; }
    std::optional<Clock::time_point> deadline() const;

    std::uint64_t issued() const { return issued_; }
    size_t skipped() const { return skipped_; }
    size_t dropped() const { return dropped_; }

private:
    std::chrono::milliseconds settle_delay_;
    int key_decimals_;

    std::optional<Viewport> pending_;
    Clock::time_point deadline_;

    std::uint64_t issued_ = 0;
    std::uint64_t completed_ = 0;
    std::optional<ViewportKey> last_key_;

    size_t skipped_ = 0;
    size_t dropped_ = 0;
};

} // namespace tracemap
