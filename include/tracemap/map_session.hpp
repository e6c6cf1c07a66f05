#pragma once

#include <functional>
#include <future>
#include <optional>
#include <vector>

#include "tracemap/engine_config.hpp"
#include "tracemap/fetch_orchestrator.hpp"
#include "tracemap/rendered_set_cache.hpp"
#include "tracemap/trace_store.hpp"
#include "tracemap/viewport_gate.hpp"

namespace tracemap {

// One map-viewing session: viewport events in, record lists out.
//
// on_viewport_changed, poll, complete and pump must be called from the same
// thread (the renderer's event thread). run and run_async only read the
// orchestrator and may execute anywhere.
class MapSession {
public:
    using Clock = ViewportGate::Clock;
    using RenderCallback = std::function<void(const std::vector<TraceRecord>&)>;

    MapSession(TraceStore& store, const EngineConfig& config, RenderCallback on_render);

    MapSession(const MapSession&) = delete;
    MapSession& operator=(const MapSession&) = delete;

    void on_viewport_changed(const Viewport& viewport);
    void on_viewport_changed(const Viewport& viewport, Clock::time_point now);

    std::optional<FetchCycle> poll(Clock::time_point now);

    FetchOutcome run(const FetchCycle& cycle) const;
    std::future<FetchOutcome> run_async(const FetchCycle& cycle) const;

    // Hands the outcome to the renderer if the cycle is still the latest and the
    // record set changed. Returns whether the renderer was called.
    bool complete(const FetchCycle& cycle, const FetchOutcome& outcome);

    // poll + run + complete on the calling thread.
    bool pump();
    bool pump(Clock::time_point now);

    const ViewportGate& gate() const { return gate_; }
    const RenderedSetCache& rendered() const { return rendered_; }
    const FetchOrchestrator& orchestrator() const { return orchestrator_; }

private:
    FetchOrchestrator orchestrator_;
    ViewportGate gate_;
    RenderedSetCache rendered_;
    RenderCallback on_render_;
};

} // namespace tracemap
