#include "tracemap/fetch_orchestrator.hpp"

#include <algorithm>
#include <future>
#include <system_error>
#include <utility>

#include "tracemap/log.hpp"

namespace tracemap {

void MergeAccumulator::merge(const std::vector<Document>& docs) {
    std::vector<TraceRecord> decoded;
    decoded.reserve(docs.size());
    size_t rejected = 0;
    for (const auto& doc : docs) {
        if (auto record = decode_trace(doc)) {
            decoded.push_back(std::move(*record));
        } else {
            rejected++;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    queries_++;
    decode_failures_ += rejected;
    for (auto& record : decoded) {
        std::string id = record.id;
        records_.insert_or_assign(std::move(id), std::move(record));
    }
}

void MergeAccumulator::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    queries_++;
    failures_++;
}

void MergeAccumulator::record_failure(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    queries_++;
    failures_++;
    failed_prefixes_.push_back(prefix);
}

std::vector<TraceRecord> MergeAccumulator::collect_within(const BoundingBox& box) const {
    std::vector<TraceRecord> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, record] : records_) {
            if (box.contains(record.coordinate)) result.push_back(record);
        }
    }
    std::sort(result.begin(), result.end(), [](const TraceRecord& a, const TraceRecord& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id < b.id;
    });
    return result;
}

size_t MergeAccumulator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t MergeAccumulator::queries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queries_;
}

size_t MergeAccumulator::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

size_t MergeAccumulator::decode_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decode_failures_;
}

std::vector<std::string> MergeAccumulator::failed_prefixes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_prefixes_;
}

const char* to_string(FetchStage stage) {
    switch (stage) {
        case FetchStage::Primary: return "primary";
        case FetchStage::Neighbors: return "neighbors";
        case FetchStage::GlobalSample: return "global-sample";
        case FetchStage::Empty: return "empty";
    }
    return "unknown";
}

FetchOrchestrator::FetchOrchestrator(TraceStore& store, CoveragePlanner planner, OrchestratorOptions options)
    : store_(store)
    , planner_(std::move(planner))
    , options_(options) {}

void FetchOrchestrator::query_cell(const std::string& prefix, size_t limit, MergeAccumulator& acc) const {
    try {
        acc.merge(store_.query_range(prefix, geohash::prefix_upper_bound(prefix), limit));
    } catch (const StoreError& e) {
        log()->warn("Cell {} query failed ({}): {}", prefix, to_string(e.code()), e.what());
        acc.record_failure(prefix);
    } catch (const std::exception& e) {
        log()->warn("Cell {} query failed: {}", prefix, e.what());
        acc.record_failure(prefix);
    }
}

void FetchOrchestrator::fetch_cells(const std::vector<std::string>& prefixes, size_t limit,
                                    MergeAccumulator& acc) const {
    std::vector<std::future<void>> pending;
    pending.reserve(prefixes.size());

    for (const auto& prefix : prefixes) {
        try {
            pending.push_back(std::async(std::launch::async, [this, &prefix, limit, &acc] {
                query_cell(prefix, limit, acc);
            }));
        } catch (const std::system_error& e) {
            log()->warn("Cannot start query task for {} ({}), querying inline", prefix, e.what());
            query_cell(prefix, limit, acc);
        }
    }

    // Join all; query_cell never lets an exception escape.
    for (auto& f : pending) f.get();
}

void FetchOrchestrator::fetch_global_sample(MergeAccumulator& acc) const {
    try {
        acc.merge(store_.recent(options_.global_sample_limit));
    } catch (const StoreError& e) {
        log()->warn("Global sample query failed ({}): {}", to_string(e.code()), e.what());
        acc.record_failure();
    } catch (const std::exception& e) {
        log()->warn("Global sample query failed: {}", e.what());
        acc.record_failure();
    }
}

FetchOutcome FetchOrchestrator::fetch(const Viewport& viewport) const {
    return fetch(viewport, planner_.plan(viewport));
}

FetchOutcome FetchOrchestrator::fetch(const Viewport& viewport, const CoveragePlan& plan) const {
    auto bbox = viewport.bounding_box();
    MergeAccumulator acc;

    FetchOutcome outcome;
    outcome.precision = plan.precision;

    auto finish = [&](FetchStage stage, std::vector<TraceRecord> records) {
        outcome.records = std::move(records);
        outcome.stage = outcome.records.empty() ? FetchStage::Empty : stage;
        outcome.cells_queried = acc.queries();
        outcome.cells_failed = acc.failures();
        outcome.decode_failures = acc.decode_failures();
        log()->debug("Fetch cycle done: stage={} records={} queries={} failed={} undecodable={}",
                     to_string(outcome.stage), outcome.records.size(), outcome.cells_queried,
                     outcome.cells_failed, outcome.decode_failures);
        return outcome;
    };

    fetch_cells(plan.prefixes, plan.caps.per_cell_limit, acc);
    auto records = acc.collect_within(bbox);
    if (!records.empty()) return finish(FetchStage::Primary, std::move(records));

    // Self + 8 around the center, then any primary cell whose query failed.
    auto retry = planner_.neighbor_prefixes(viewport.center(), plan.precision);
    for (auto& prefix : acc.failed_prefixes()) {
        if (std::find(retry.begin(), retry.end(), prefix) == retry.end()) {
            retry.push_back(std::move(prefix));
        }
    }
    log()->info("Primary cover empty, retrying {} cells around the center", retry.size());
    fetch_cells(retry, plan.caps.per_cell_limit, acc);
    records = acc.collect_within(bbox);
    if (!records.empty()) return finish(FetchStage::Neighbors, std::move(records));

    if (viewport.max_delta() >= options_.global_sample_min_span) {
        log()->info("Neighbor probe empty, sampling {} recent traces", options_.global_sample_limit);
        fetch_global_sample(acc);
        records = acc.collect_within(bbox);
        if (!records.empty()) return finish(FetchStage::GlobalSample, std::move(records));
    }

    return finish(FetchStage::Empty, {});
}

} // namespace tracemap
