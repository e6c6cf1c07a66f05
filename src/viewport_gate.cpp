#include "tracemap/viewport_gate.hpp"

#include <cmath>
#include <stdexcept>

#include "tracemap/log.hpp"

namespace tracemap {

ViewportKey make_viewport_key(const Viewport& viewport, int decimals) {
    double scale = std::pow(10.0, decimals);
    auto q = [scale](double v) { return static_cast<std::int64_t>(std::llround(v * scale)); };
    return ViewportKey{
        q(viewport.center().lat),
        q(viewport.center().lon),
        q(viewport.span().lat_delta),
        q(viewport.span().lon_delta)
    };
}

ViewportGate::ViewportGate(std::chrono::milliseconds settle_delay, int key_decimals)
    : settle_delay_(settle_delay)
    , key_decimals_(key_decimals) {
    if (settle_delay.count() < 0) throw std::invalid_argument("settle delay must not be negative");
    if (key_decimals < 0) throw std::invalid_argument("key decimals must not be negative");
}

void ViewportGate::submit(const Viewport& viewport, Clock::time_point now) {
    pending_ = viewport;
    deadline_ = now + settle_delay_;
}

std::optional<ViewportGate::Clock::time_point> ViewportGate::deadline() const {
    if (!pending_) return std::nullopt;
    return deadline_;
}

std::optional<FetchCycle> ViewportGate::poll(Clock::time_point now) {
    if (!pending_ || now < deadline_) return std::nullopt;

    Viewport viewport = *pending_;
    pending_.reset();

    auto key = make_viewport_key(viewport, key_decimals_);
    if (last_key_ && *last_key_ == key && !in_flight()) {
        skipped_++;
        log()->debug("Viewport unchanged since last fetch, skipping");
        return std::nullopt;
    }

    return FetchCycle{++issued_, viewport, key};
}

bool ViewportGate::complete(const FetchCycle& cycle) {
    if (!is_latest(cycle.sequence)) {
        dropped_++;
        log()->debug("Dropping stale fetch cycle {} (latest {})", cycle.sequence, issued_);
        return false;
    }
    completed_ = cycle.sequence;
    last_key_ = cycle.key;
    return true;
}

} // namespace tracemap
