#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "tracemap/coverage_planner.hpp"
#include "tracemap/trace_record.hpp"
#include "tracemap/trace_store.hpp"
#include "tracemap/viewport.hpp"

namespace tracemap {

// Per-cycle merge target shared by the concurrent cell queries.
class MergeAccumulator {
public:
    // Decodes docs and inserts them by id. Undecodable documents are counted and dropped.
    void merge(const std::vector<Document>& docs);
    void record_failure();
    // Failed cell query; the prefix is kept so a fallback can query it again.
    void record_failure(const std::string& prefix);

    // Records inside box, newest first (ties by id).
    std::vector<TraceRecord> collect_within(const BoundingBox& box) const;

    size_t size() const;
    size_t queries() const;
    size_t failures() const;
    size_t decode_failures() const;
    std::vector<std::string> failed_prefixes() const;

private:
    std::unordered_map<std::string, TraceRecord> records_;
    std::vector<std::string> failed_prefixes_;
    size_t queries_ = 0;
    size_t failures_ = 0;
    size_t decode_failures_ = 0;
    mutable std::mutex mutex_;
};

enum class FetchStage {
    Primary,
    Neighbors,
    GlobalSample,
    Empty,
};

const char* to_string(FetchStage stage);

struct FetchOutcome {
    std::vector<TraceRecord> records;
    FetchStage stage = FetchStage::Empty;
    int precision = 0;
    size_t cells_queried = 0;
    size_t cells_failed = 0;
    size_t decode_failures = 0;

    // Every query of the cycle failed; the empty result says nothing about the region.
    bool degraded() const { return cells_queried > 0 && cells_failed == cells_queried; }
};

struct OrchestratorOptions {
    size_t global_sample_limit = 50;
    double global_sample_min_span = 40.0;
};

class FetchOrchestrator {
public:
    FetchOrchestrator(TraceStore& store, CoveragePlanner planner, OrchestratorOptions options = {});

    FetchOutcome fetch(const Viewport& viewport) const;
    FetchOutcome fetch(const Viewport& viewport, const CoveragePlan& plan) const;

    const CoveragePlanner& planner() const { return planner_; }
    const OrchestratorOptions& options() const { return options_; }

private:
    void query_cell(const std::string& prefix, size_t limit, MergeAccumulator& acc) const;
    void fetch_cells(const std::vector<std::string>& prefixes, size_t limit, MergeAccumulator& acc) const;
    void fetch_global_sample(MergeAccumulator& acc) const;

    TraceStore& store_;
    CoveragePlanner planner_;
    OrchestratorOptions options_;
};

} // namespace tracemap
