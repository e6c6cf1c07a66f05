#pragma once

#include "tracemap/coverage_planner.hpp"
#include "tracemap/engine_config.hpp"
#include "tracemap/fetch_orchestrator.hpp"
#include "tracemap/geohash.hpp"
#include "tracemap/log.hpp"
#include "tracemap/map_session.hpp"
#include "tracemap/region_summary.hpp"
#include "tracemap/rendered_set_cache.hpp"
#include "tracemap/trace_record.hpp"
#include "tracemap/trace_store.hpp"
#include "tracemap/viewport.hpp"
#include "tracemap/viewport_gate.hpp"

namespace tracemap {

constexpr const char* VERSION = "0.1.0";

} // namespace tracemap
