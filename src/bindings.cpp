#include <pybind11/pybind11.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include "tracemap/tracemap.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_tracemap_cpp, m) {
    m.doc() = "tracemap C++ backend for geohash viewport indexing";
    m.attr("__version__") = tracemap::VERSION;
    m.attr("WRITE_PRECISION") = tracemap::kWritePrecision;

    py::class_<tracemap::Coordinate>(m, "Coordinate")
        .def(py::init<double, double>(), py::arg("lat"), py::arg("lon"))
        .def_readonly("lat", &tracemap::Coordinate::lat)
        .def_readonly("lon", &tracemap::Coordinate::lon)
        .def("is_valid", &tracemap::Coordinate::is_valid);

    py::class_<tracemap::Span>(m, "Span")
        .def(py::init<double, double>(), py::arg("lat_delta"), py::arg("lon_delta"))
        .def_readonly("lat_delta", &tracemap::Span::lat_delta)
        .def_readonly("lon_delta", &tracemap::Span::lon_delta);

    py::class_<tracemap::BoundingBox>(m, "BoundingBox")
        .def_readonly("min_lat", &tracemap::BoundingBox::min_lat)
        .def_readonly("max_lat", &tracemap::BoundingBox::max_lat)
        .def_readonly("min_lon", &tracemap::BoundingBox::min_lon)
        .def_readonly("max_lon", &tracemap::BoundingBox::max_lon)
        .def("contains", &tracemap::BoundingBox::contains);

    py::class_<tracemap::Viewport>(m, "Viewport")
        .def(py::init<const tracemap::Coordinate&, const tracemap::Span&>(),
             py::arg("center"), py::arg("span"))
        .def_static("clamped", &tracemap::Viewport::clamped, py::arg("center"), py::arg("span"))
        .def_property_readonly("center", &tracemap::Viewport::center)
        .def_property_readonly("span", &tracemap::Viewport::span)
        .def("bounding_box", &tracemap::Viewport::bounding_box);

    auto gh = m.def_submodule("geohash", "Base-32 geohash codec");
    py::class_<tracemap::geohash::CellSize>(gh, "CellSize")
        .def_readonly("lat_height", &tracemap::geohash::CellSize::lat_height)
        .def_readonly("lon_width", &tracemap::geohash::CellSize::lon_width);
    py::class_<tracemap::geohash::GeoCell>(gh, "GeoCell")
        .def_readonly("bounds", &tracemap::geohash::GeoCell::bounds)
        .def_readonly("center", &tracemap::geohash::GeoCell::center);
    gh.def("encode", &tracemap::geohash::encode, py::arg("coordinate"), py::arg("precision"));
    gh.def("decode", [](const std::string& hash) { return tracemap::geohash::decode(hash); },
           py::arg("hash"));
    gh.def("cell_size", &tracemap::geohash::cell_size, py::arg("precision"));
    gh.def("is_valid", [](const std::string& hash) { return tracemap::geohash::is_valid(hash); },
           py::arg("hash"));
    gh.def("prefix_upper_bound", [](const std::string& prefix) {
        return tracemap::geohash::prefix_upper_bound(prefix);
    }, py::arg("prefix"));

    py::class_<tracemap::FetchCaps>(m, "FetchCaps")
        .def_readonly("max_prefixes", &tracemap::FetchCaps::max_prefixes)
        .def_readonly("per_cell_limit", &tracemap::FetchCaps::per_cell_limit);

    py::class_<tracemap::CoveragePlan>(m, "CoveragePlan")
        .def_readonly("prefixes", &tracemap::CoveragePlan::prefixes)
        .def_readonly("precision", &tracemap::CoveragePlan::precision)
        .def_readonly("caps", &tracemap::CoveragePlan::caps)
        .def_readonly("truncated", &tracemap::CoveragePlan::truncated);

    py::class_<tracemap::CoveragePlanner>(m, "CoveragePlanner")
        .def(py::init<int, int>(),
             py::arg("write_precision") = tracemap::kWritePrecision, py::arg("floor_precision") = 1)
        .def("choose_precision", &tracemap::CoveragePlanner::choose_precision)
        .def("choose_fetch_caps", &tracemap::CoveragePlanner::choose_fetch_caps)
        .def("estimate_cell_count", &tracemap::CoveragePlanner::estimate_cell_count)
        .def("cover_bounding_box", [](const tracemap::CoveragePlanner& p, const tracemap::Viewport& v,
                                      int precision, size_t cap) {
            auto cover = p.cover_bounding_box(v, precision, cap);
            return py::make_tuple(std::vector<std::string>(cover.prefixes.begin(), cover.prefixes.end()),
                                  cover.truncated);
        }, py::arg("viewport"), py::arg("precision"), py::arg("cap"))
        .def("plan", &tracemap::CoveragePlanner::plan)
        .def("neighbor_prefixes", &tracemap::CoveragePlanner::neighbor_prefixes);

    py::class_<tracemap::TraceRecord>(m, "TraceRecord")
        .def_readonly("id", &tracemap::TraceRecord::id)
        .def_readonly("name", &tracemap::TraceRecord::name)
        .def_readonly("coordinate", &tracemap::TraceRecord::coordinate)
        .def_readonly("geohash", &tracemap::TraceRecord::geohash)
        .def_readonly("media_refs", &tracemap::TraceRecord::media_refs)
        .def_readonly("created_at", &tracemap::TraceRecord::created_at);

    m.def("make_trace_record", &tracemap::make_trace_record,
          py::arg("id"), py::arg("name"), py::arg("coordinate"), py::arg("media_refs"),
          py::arg("created_at"), py::arg("write_precision") = tracemap::kWritePrecision);

    py::class_<tracemap::TraceStore>(m, "TraceStore");

    py::class_<tracemap::InMemoryTraceStore, tracemap::TraceStore>(m, "InMemoryTraceStore")
        .def(py::init<>())
        .def("put", py::overload_cast<const tracemap::TraceRecord&>(&tracemap::InMemoryTraceStore::put))
        .def("erase", &tracemap::InMemoryTraceStore::erase)
        .def("clear", &tracemap::InMemoryTraceStore::clear)
        .def("__len__", &tracemap::InMemoryTraceStore::size);

    py::enum_<tracemap::FetchStage>(m, "FetchStage")
        .value("PRIMARY", tracemap::FetchStage::Primary)
        .value("NEIGHBORS", tracemap::FetchStage::Neighbors)
        .value("GLOBAL_SAMPLE", tracemap::FetchStage::GlobalSample)
        .value("EMPTY", tracemap::FetchStage::Empty);

    py::class_<tracemap::FetchOutcome>(m, "FetchOutcome")
        .def_readonly("records", &tracemap::FetchOutcome::records)
        .def_readonly("stage", &tracemap::FetchOutcome::stage)
        .def_readonly("precision", &tracemap::FetchOutcome::precision)
        .def_readonly("cells_queried", &tracemap::FetchOutcome::cells_queried)
        .def_readonly("cells_failed", &tracemap::FetchOutcome::cells_failed)
        .def_readonly("decode_failures", &tracemap::FetchOutcome::decode_failures)
        .def_property_readonly("degraded", &tracemap::FetchOutcome::degraded);

    py::class_<tracemap::FetchOrchestrator>(m, "FetchOrchestrator")
        .def(py::init([](tracemap::TraceStore& store, const tracemap::CoveragePlanner& planner) {
            return tracemap::FetchOrchestrator(store, planner);
        }), py::arg("store"), py::arg("planner") = tracemap::CoveragePlanner(), py::keep_alive<1, 2>())
        .def("fetch", py::overload_cast<const tracemap::Viewport&>(&tracemap::FetchOrchestrator::fetch, py::const_),
             py::call_guard<py::gil_scoped_release>());

    py::class_<tracemap::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("write_precision", &tracemap::EngineConfig::write_precision)
        .def_readwrite("floor_precision", &tracemap::EngineConfig::floor_precision)
        .def_readwrite("settle_delay", &tracemap::EngineConfig::settle_delay)
        .def_readwrite("key_decimals", &tracemap::EngineConfig::key_decimals)
        .def_readwrite("global_sample_limit", &tracemap::EngineConfig::global_sample_limit)
        .def_readwrite("global_sample_min_span", &tracemap::EngineConfig::global_sample_min_span)
        .def_readwrite("log_level", &tracemap::EngineConfig::log_level)
        .def("validate", &tracemap::EngineConfig::validate);

    m.def("load_engine_config", &tracemap::load_engine_config, py::arg("path"));
    m.def("set_log_level", &tracemap::set_log_level, py::arg("level"));

    py::class_<tracemap::MapSession>(m, "MapSession")
        .def(py::init<tracemap::TraceStore&, const tracemap::EngineConfig&, tracemap::MapSession::RenderCallback>(),
             py::arg("store"), py::arg("config"), py::arg("on_render"), py::keep_alive<1, 2>())
        .def("on_viewport_changed", py::overload_cast<const tracemap::Viewport&>(
             &tracemap::MapSession::on_viewport_changed))
        .def("pump", py::overload_cast<>(&tracemap::MapSession::pump))
        .def_property_readonly("rendered", [](const tracemap::MapSession& s) {
            return s.rendered().records();
        });

    py::class_<tracemap::RegionSummary>(m, "RegionSummary")
        .def_readonly("name", &tracemap::RegionSummary::name)
        .def_readonly("count", &tracemap::RegionSummary::count)
        .def_readonly("anchor", &tracemap::RegionSummary::anchor);

    m.def("summarize_regions", [](tracemap::TraceStore& store, const tracemap::Viewport& viewport) {
        return tracemap::summarize_regions(store, viewport);
    }, py::arg("store"), py::arg("viewport"));
}
