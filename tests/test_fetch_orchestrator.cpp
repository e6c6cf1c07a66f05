#include <gtest/gtest.h>
#include "tracemap/fetch_orchestrator.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <random>
#include <set>
#include <string>

namespace {

tracemap::Timestamp at(int seconds) {
    return tracemap::Timestamp(std::chrono::seconds(1700000000 + seconds));
}

std::vector<std::string> ids_of(const std::vector<tracemap::TraceRecord>& records) {
    std::vector<std::string> ids;
    for (const auto& r : records) ids.push_back(r.id);
    return ids;
}

// Fails every query, as during a store outage.
class OutageStore : public tracemap::TraceStore {
public:
    std::atomic<int> range_calls{0};
    std::atomic<int> recent_calls{0};

    std::vector<tracemap::Document> query_range(const std::string&, const std::string&, size_t) override {
        range_calls++;
        throw tracemap::StoreError(tracemap::StoreError::Code::Unavailable, "store offline");
    }
    std::vector<tracemap::Document> recent(size_t) override {
        recent_calls++;
        throw tracemap::StoreError(tracemap::StoreError::Code::Timeout, "deadline exceeded");
    }
    size_t count_in_box(const tracemap::BoundingBox&) override {
        throw tracemap::StoreError(tracemap::StoreError::Code::Unavailable, "store offline");
    }
};

// In-memory store that fails the range query for one prefix.
class FlakyStore : public tracemap::InMemoryTraceStore {
public:
    explicit FlakyStore(std::string failing_prefix) : failing_prefix_(std::move(failing_prefix)) {}

    std::vector<tracemap::Document> query_range(const std::string& lower, const std::string& upper,
                                                size_t limit) override {
        if (lower == failing_prefix_) {
            throw tracemap::StoreError(tracemap::StoreError::Code::PermissionDenied, "denied");
        }
        return InMemoryTraceStore::query_range(lower, upper, limit);
    }

private:
    std::string failing_prefix_;
};

// In-memory store whose first query for each prefix fails, like a dropped connection.
class TransientStore : public tracemap::InMemoryTraceStore {
public:
    std::atomic<int> range_calls{0};

    std::vector<tracemap::Document> query_range(const std::string& lower, const std::string& upper,
                                                size_t limit) override {
        range_calls++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (seen_.insert(lower).second) {
                throw tracemap::StoreError(tracemap::StoreError::Code::Timeout, "deadline exceeded");
            }
        }
        return InMemoryTraceStore::query_range(lower, upper, limit);
    }

private:
    std::set<std::string> seen_;
    std::mutex mutex_;
};

}

class FetchOrchestratorTest : public ::testing::Test {
protected:
    tracemap::Coordinate sf{37.7749, -122.4194};
    tracemap::InMemoryTraceStore store;

    void add(const std::string& id, const tracemap::Coordinate& c, int seconds) {
        store.put(tracemap::make_trace_record(id, "trace " + id, c, {"audio://" + id, "image://" + id}, at(seconds)));
    }

    void add_city_block_scenario() {
        add("near-a", {sf.lat + 0.010, sf.lon - 0.005}, 10);
        add("near-b", {sf.lat - 0.015, sf.lon + 0.012}, 30);
        add("near-c", {sf.lat + 0.002, sf.lon + 0.019}, 20);
        add("far", {sf.lat + 0.1, sf.lon}, 40);
    }
};

TEST_F(FetchOrchestratorTest, CityBlockScenarioFiltersToViewport) {
    add_city_block_scenario();
    tracemap::FetchOrchestrator orchestrator(store, tracemap::CoveragePlanner());
    tracemap::Viewport vp(sf, {0.05, 0.05});

    // A coarse cell holding all four records, so the exact filter has work to do
    auto coarse = tracemap::geohash::encode(sf, 3);
    ASSERT_EQ(tracemap::geohash::encode({sf.lat + 0.1, sf.lon}, 3), coarse);
    tracemap::CoveragePlan plan{{coarse}, 3, {9, 200}, false};

    auto outcome = orchestrator.fetch(vp, plan);

    EXPECT_EQ(outcome.stage, tracemap::FetchStage::Primary);
    EXPECT_EQ(ids_of(outcome.records), (std::vector<std::string>{"near-b", "near-c", "near-a"}));
    EXPECT_EQ(outcome.cells_queried, 1u);
    EXPECT_EQ(outcome.cells_failed, 0u);
}

TEST_F(FetchOrchestratorTest, PlannedFetchReturnsSameRecords) {
    add_city_block_scenario();
    tracemap::FetchOrchestrator orchestrator(store, tracemap::CoveragePlanner());

    auto outcome = orchestrator.fetch(tracemap::Viewport(sf, {0.05, 0.05}));

    EXPECT_EQ(ids_of(outcome.records), (std::vector<std::string>{"near-b", "near-c", "near-a"}));
    EXPECT_EQ(outcome.precision, 5);
}

TEST_F(FetchOrchestratorTest, ResultsAreInsideBoundingBox) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> jitter(-3.0, 3.0);
    for (int i = 0; i < 400; i++) {
        add("r" + std::to_string(i), {sf.lat + jitter(rng), sf.lon + jitter(rng)}, i);
    }
    tracemap::FetchOrchestrator orchestrator(store, tracemap::CoveragePlanner());

    for (double span : {0.05, 0.4, 1.5, 4.0}) {
        tracemap::Viewport vp({sf.lat + 0.3, sf.lon - 0.2}, {span, span * 1.5});
        auto bbox = vp.bounding_box();
        auto outcome = orchestrator.fetch(vp);
        for (const auto& r : outcome.records) {
            EXPECT_TRUE(bbox.contains(r.coordinate)) << r.id << " outside span " << span;
        }
    }
}

TEST_F(FetchOrchestratorTest, NewestFirst) {
    std::mt19937 rng(3);
    std::uniform_real_distribution<double> jitter(-0.3, 0.3);
    for (int i = 0; i < 50; i++) {
        add("r" + std::to_string(i), {sf.lat + jitter(rng), sf.lon + jitter(rng)}, (i * 37) % 50);
    }
    tracemap::FetchOrchestrator orchestrator(store, tracemap::CoveragePlanner());

    auto outcome = orchestrator.fetch(tracemap::Viewport(sf, {1.0, 1.0}));
    ASSERT_FALSE(outcome.records.empty());
    for (size_t i = 1; i < outcome.records.size(); i++) {
        EXPECT_GE(outcome.records[i - 1].created_at, outcome.records[i].created_at);
    }
}

TEST_F(FetchOrchestratorTest, RepeatedFetchIsIdentical) {
    std::mt19937 rng(11);
    std::uniform_real_distribution<double> jitter(-0.5, 0.5);
    for (int i = 0; i < 120; i++) {
        // Duplicate timestamps exercise the id tie-break
        add("r" + std::to_string(i), {sf.lat + jitter(rng), sf.lon + jitter(rng)}, i / 4);
    }
    tracemap::FetchOrchestrator orchestrator(store, tracemap::CoveragePlanner());
    tracemap::Viewport vp(sf, {0.8, 0.8});

    auto first = orchestrator.fetch(vp);
    auto second = orchestrator.fetch(vp);

    EXPECT_FALSE(first.records.empty());
    EXPECT_EQ(ids_of(first.records), ids_of(second.records));
}

TEST_F(FetchOrchestratorTest, OverlappingPrefixesMergeById) {
    add_city_block_scenario();
    tracemap::FetchOrchestrator orchestrator(store, tracemap::CoveragePlanner());
    tracemap::CoveragePlan plan{
        {tracemap::geohash::encode(sf, 3), tracemap::geohash::encode(sf, 4)}, 4, {9, 200}, false};

    auto outcome = orchestrator.fetch(tracemap::Viewport(sf, {0.05, 0.05}), plan);

    auto ids = ids_of(outcome.records);
    EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()).size(), ids.size());
    EXPECT_EQ(ids.size(), 3u);
}

TEST_F(FetchOrchestratorTest, PerCellLimitBoundsEachQuery) {
    for (int i = 0; i < 30; i++) {
        add("r" + std::to_string(i), {sf.lat + i * 0.0001, sf.lon}, i);
    }
    tracemap::FetchOrchestrator orchestrator(store, tracemap::CoveragePlanner());
    tracemap::CoveragePlan plan{{tracemap::geohash::encode(sf, 4)}, 4, {9, 5}, false};

    auto outcome = orchestrator.fetch(tracemap::Viewport(sf, {0.5, 0.5}), plan);
    EXPECT_EQ(outcome.records.size(), 5u);
}

TEST_F(FetchOrchestratorTest, OutageYieldsEmptyAndSamplesOnce) {
    OutageStore outage;
    tracemap::FetchOrchestrator orchestrator(outage, tracemap::CoveragePlanner());
    tracemap::Viewport world({0.0, 0.0}, {60.0, 60.0});

    tracemap::FetchOutcome outcome;
    EXPECT_NO_THROW(outcome = orchestrator.fetch(world));

    EXPECT_TRUE(outcome.records.empty());
    EXPECT_EQ(outcome.stage, tracemap::FetchStage::Empty);
    EXPECT_EQ(outage.recent_calls.load(), 1);
    EXPECT_GT(outage.range_calls.load(), 0);
    EXPECT_EQ(outcome.cells_failed, outcome.cells_queried);
    EXPECT_TRUE(outcome.degraded());
}

TEST_F(FetchOrchestratorTest, OutageAtCityZoomSkipsGlobalSample) {
    OutageStore outage;
    tracemap::FetchOrchestrator orchestrator(outage, tracemap::CoveragePlanner());

    auto outcome = orchestrator.fetch(tracemap::Viewport(sf, {0.05, 0.05}));

    EXPECT_TRUE(outcome.records.empty());
    EXPECT_EQ(outage.recent_calls.load(), 0);
}

TEST_F(FetchOrchestratorTest, FailedCellDegradesOnlyThatCell) {
    tracemap::Coordinate west{sf.lat, sf.lon - 0.3};
    tracemap::Coordinate east{sf.lat, sf.lon + 0.3};
    FlakyStore flaky(tracemap::geohash::encode(west, 4));
    flaky.put(tracemap::make_trace_record("west", "w", west, {}, at(1)));
    flaky.put(tracemap::make_trace_record("east", "e", east, {}, at(2)));

    tracemap::FetchOrchestrator orchestrator(flaky, tracemap::CoveragePlanner());
    tracemap::CoveragePlan plan{
        {tracemap::geohash::encode(west, 4), tracemap::geohash::encode(east, 4)}, 4, {9, 200}, false};

    auto outcome = orchestrator.fetch(tracemap::Viewport(sf, {1.0, 1.0}), plan);

    EXPECT_EQ(ids_of(outcome.records), std::vector<std::string>{"east"});
    EXPECT_EQ(outcome.cells_queried, 2u);
    EXPECT_EQ(outcome.cells_failed, 1u);
    EXPECT_FALSE(outcome.degraded());
}

TEST_F(FetchOrchestratorTest, FallsBackToNeighborCells) {
    add("near", {sf.lat + 0.001, sf.lon + 0.001}, 5);
    tracemap::FetchOrchestrator orchestrator(store, tracemap::CoveragePlanner());

    // Primary cover misses the populated cell entirely
    auto elsewhere = tracemap::geohash::encode({-10.0, 40.0}, 5);
    tracemap::CoveragePlan plan{{elsewhere}, 5, {9, 200}, false};

    auto outcome = orchestrator.fetch(tracemap::Viewport(sf, {0.05, 0.05}), plan);

    EXPECT_EQ(outcome.stage, tracemap::FetchStage::Neighbors);
    EXPECT_EQ(ids_of(outcome.records), std::vector<std::string>{"near"});
}

TEST_F(FetchOrchestratorTest, TransientFailureRecoveredByCenterRetry) {
    TransientStore transient;
    transient.put(tracemap::make_trace_record("near", "n", {sf.lat + 0.001, sf.lon + 0.001}, {}, at(5)));

    tracemap::CoveragePlanner planner;
    tracemap::FetchOrchestrator orchestrator(transient, planner);
    tracemap::Viewport vp(sf, {0.05, 0.05});
    auto plan = planner.plan(vp);
    ASSERT_FALSE(plan.truncated);

    auto outcome = orchestrator.fetch(vp, plan);

    EXPECT_EQ(outcome.stage, tracemap::FetchStage::Neighbors);
    EXPECT_EQ(ids_of(outcome.records), std::vector<std::string>{"near"});
    EXPECT_GE(outcome.cells_failed, plan.prefixes.size());
    EXPECT_FALSE(outcome.degraded());
}

TEST_F(FetchOrchestratorTest, FailedPrimaryCellIsQueriedAgain) {
    // Populated cell away from the center, outside the 3x3 ring at precision 5
    tracemap::Coordinate corner{sf.lat + 0.2, sf.lon + 0.2};
    auto corner_cell = tracemap::geohash::encode(corner, 5);
    auto ring = tracemap::CoveragePlanner().neighbor_prefixes(sf, 5);
    ASSERT_EQ(std::find(ring.begin(), ring.end(), corner_cell), ring.end());

    TransientStore transient;
    transient.put(tracemap::make_trace_record("corner", "c", corner, {}, at(5)));
    tracemap::FetchOrchestrator orchestrator(transient, tracemap::CoveragePlanner());
    tracemap::CoveragePlan plan{{corner_cell}, 5, {9, 200}, false};

    auto outcome = orchestrator.fetch(tracemap::Viewport(sf, {0.5, 0.5}), plan);

    EXPECT_EQ(outcome.stage, tracemap::FetchStage::Neighbors);
    EXPECT_EQ(ids_of(outcome.records), std::vector<std::string>{"corner"});
}

TEST_F(FetchOrchestratorTest, GlobalSampleOnlyAtWorldZoom) {
    // Indexed under a geohash that no prefix query of these viewports reaches
    auto record = tracemap::make_trace_record("misfiled", "m", {20.0, 10.0}, {}, at(1));
    record.geohash = "zzzzzzzz";
    store.put(record);
    tracemap::FetchOrchestrator orchestrator(store, tracemap::CoveragePlanner());

    auto world = orchestrator.fetch(tracemap::Viewport({0.0, 0.0}, {60.0, 60.0}));
    EXPECT_EQ(world.stage, tracemap::FetchStage::GlobalSample);
    EXPECT_EQ(ids_of(world.records), std::vector<std::string>{"misfiled"});

    auto region = orchestrator.fetch(tracemap::Viewport({20.0, 10.0}, {2.0, 2.0}));
    EXPECT_EQ(region.stage, tracemap::FetchStage::Empty);
    EXPECT_TRUE(region.records.empty());
}

TEST_F(FetchOrchestratorTest, UndecodableDocumentsAreSkipped) {
    add_city_block_scenario();
    tracemap::Document broken;
    broken.id = "broken";
    broken.fields[tracemap::fields::kGeohash] = tracemap::geohash::encode(sf, 8);
    broken.fields[tracemap::fields::kLocation] = sf;
    store.put(broken);

    tracemap::FetchOrchestrator orchestrator(store, tracemap::CoveragePlanner());
    auto outcome = orchestrator.fetch(tracemap::Viewport(sf, {0.05, 0.05}));

    EXPECT_EQ(outcome.records.size(), 3u);
    EXPECT_EQ(outcome.decode_failures, 1u);
}

TEST(MergeAccumulatorTest, CountsQueriesAndFailures) {
    tracemap::MergeAccumulator acc;
    auto record = tracemap::make_trace_record("a", "a", {1.0, 1.0}, {}, at(0));

    acc.merge({tracemap::to_document(record), tracemap::to_document(record)});
    acc.record_failure();
    acc.record_failure("9q8yy");

    EXPECT_EQ(acc.size(), 1u);
    EXPECT_EQ(acc.queries(), 3u);
    EXPECT_EQ(acc.failures(), 2u);
    EXPECT_EQ(acc.failed_prefixes(), std::vector<std::string>{"9q8yy"});
    EXPECT_EQ(acc.collect_within({0.0, 2.0, 0.0, 2.0}).size(), 1u);
    EXPECT_TRUE(acc.collect_within({5.0, 6.0, 5.0, 6.0}).empty());
}
