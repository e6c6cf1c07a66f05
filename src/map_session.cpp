#include "tracemap/map_session.hpp"

#include <utility>

#include "tracemap/log.hpp"

namespace tracemap {

namespace {
const EngineConfig& checked(const EngineConfig& config) {
    config.validate();
    return config;
}
}

MapSession::MapSession(TraceStore& store, const EngineConfig& config, RenderCallback on_render)
    : orchestrator_(store,
                    CoveragePlanner(checked(config).write_precision, config.floor_precision),
                    OrchestratorOptions{config.global_sample_limit, config.global_sample_min_span})
    , gate_(config.settle_delay, config.key_decimals)
    , on_render_(std::move(on_render)) {
    set_log_level(config.log_level);
}

void MapSession::on_viewport_changed(const Viewport& viewport) {
    on_viewport_changed(viewport, Clock::now());
}

void MapSession::on_viewport_changed(const Viewport& viewport, Clock::time_point now) {
    gate_.submit(viewport, now);
}

std::optional<FetchCycle> MapSession::poll(Clock::time_point now) {
    return gate_.poll(now);
}

FetchOutcome MapSession::run(const FetchCycle& cycle) const {
    return orchestrator_.fetch(cycle.viewport);
}

std::future<FetchOutcome> MapSession::run_async(const FetchCycle& cycle) const {
    return std::async(std::launch::async, [this, cycle] { return run(cycle); });
}

bool MapSession::complete(const FetchCycle& cycle, const FetchOutcome& outcome) {
    if (!gate_.complete(cycle)) return false;

    if (outcome.degraded()) {
        log()->warn("Fetch cycle {} degraded: all {} queries failed", cycle.sequence, outcome.cells_queried);
    }

    if (!rendered_.update(outcome.records)) return false;
    if (on_render_) on_render_(rendered_.records());
    return true;
}

bool MapSession::pump() {
    return pump(Clock::now());
}

bool MapSession::pump(Clock::time_point now) {
    auto cycle = poll(now);
    if (!cycle) return false;
    return complete(*cycle, run(*cycle));
}

} // namespace tracemap
