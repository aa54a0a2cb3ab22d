/**
 * @file test_event_store.cpp
 * @brief Unit tests for per-kind merging and the drain/export cycle.
 */

#include "analytics/event_store.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <limits>
#include <vector>

using namespace search_analytics;
using namespace std::chrono_literals;

namespace {

class RecordingSink : public IDeliverySink {
public:
    Result<void> push(Record record) override {
        records.push_back(std::move(record));
        if (fail_pushes) return Error{"push refused"};
        return {};
    }
    Result<void> flush() override { return {}; }

    std::vector<Record> records;
    bool fail_pushes{false};
};

const Timestamp kT0 = Timestamp{} + 1700000000s;

Envelope search_at(Timestamp when, SourceSet sources = {"client"}) {
    auto agg = SearchPostAggregator::from_query(SearchQuery{});
    agg.succeed(SearchResult{.processing_time_ms = 5});
    return make_envelope(std::move(agg), std::move(sources), when);
}

}  // namespace

TEST(EventStoreTest, FirstArrivalIsInserted) {
    EventStore store;
    EXPECT_EQ(store.record(search_at(kT0)), EventStore::RecordOutcome::Inserted);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_TRUE(store.contains(EventKind::SearchPost));
}

TEST(EventStoreTest, SameKindIsMergedNotAppended) {
    EventStore store;
    store.record(search_at(kT0));
    EXPECT_EQ(store.record(search_at(kT0 + 1s)), EventStore::RecordOutcome::Merged);
    EXPECT_EQ(store.record(search_at(kT0 + 2s)), EventStore::RecordOutcome::Merged);

    ASSERT_EQ(store.size(), 1u);
    const auto* env = store.find(EventKind::SearchPost);
    ASSERT_NE(env, nullptr);
    EXPECT_EQ(env->occurrences, 3u);
    EXPECT_EQ(std::get<SearchPostAggregator>(env->payload).total_received, 3u);
}

TEST(EventStoreTest, KindsAreKeptApart) {
    EventStore store;
    store.record(search_at(kT0));
    store.record(make_envelope(SimilarGetAggregator::from_query(SimilarQuery{}), {}, kT0));
    store.record(make_envelope(MultiSearchAggregator{}, {}, kT0));
    EXPECT_EQ(store.size(), 3u);
}

TEST(EventStoreTest, FirstSeenIsTheEarliest) {
    EventStore store;
    store.record(search_at(kT0));
    store.record(search_at(kT0 + 10s));
    EXPECT_EQ(store.find(EventKind::SearchPost)->first_seen, kT0);

    // A late-delivered older event pulls first_seen back.
    store.record(search_at(kT0 - 5s));
    EXPECT_EQ(store.find(EventKind::SearchPost)->first_seen, kT0 - 5s);
}

TEST(EventStoreTest, SourcesAreUnioned) {
    EventStore store;
    store.record(search_at(kT0, {"a", "b"}));
    store.record(search_at(kT0, {"b", "c"}));
    EXPECT_EQ(store.find(EventKind::SearchPost)->sources, (SourceSet{"a", "b", "c"}));
}

TEST(EventStoreTest, OccurrencesSaturate) {
    EventStore store;
    auto big = search_at(kT0);
    big.occurrences = std::numeric_limits<Count>::max() - 1;
    store.record(std::move(big));

    auto more = search_at(kT0);
    more.occurrences = 5;
    store.record(std::move(more));

    EXPECT_EQ(store.find(EventKind::SearchPost)->occurrences, std::numeric_limits<Count>::max());
}

TEST(EventStoreTest, ArrivalOrderDoesNotMatter) {
    std::vector<Envelope> forward;
    forward.push_back(search_at(kT0 + 3s, {"x"}));
    forward.push_back(search_at(kT0, {"y"}));
    forward.push_back(search_at(kT0 + 1s, {"z", "x"}));

    EventStore a;
    EventStore b;
    for (const auto& env : forward) a.record(env);
    for (auto it = forward.rbegin(); it != forward.rend(); ++it) b.record(*it);

    RecordingSink sink_a;
    RecordingSink sink_b;
    a.drain_and_export(sink_a, "uid");
    b.drain_and_export(sink_b, "uid");

    ASSERT_EQ(sink_a.records.size(), 1u);
    ASSERT_EQ(sink_b.records.size(), 1u);
    EXPECT_EQ(to_json(sink_a.records[0]), to_json(sink_b.records[0]));
}

TEST(EventStoreTest, DrainExportsAndEmpties) {
    EventStore store;
    store.record(search_at(kT0, {"client"}));
    store.record(search_at(kT0 + 10s, {"other"}));
    store.record(make_envelope(MultiSearchAggregator{}, {}, kT0));

    RecordingSink sink;
    EXPECT_EQ(store.drain_and_export(sink, "instance-1"), 2u);
    EXPECT_TRUE(store.empty());
    ASSERT_EQ(sink.records.size(), 2u);

    const Record* search = nullptr;
    for (const auto& record : sink.records) {
        EXPECT_EQ(record.type, RecordType::Track);
        EXPECT_EQ(record.user_id, "instance-1");
        if (record.event == "Documents Searched POST") search = &record;
    }
    ASSERT_NE(search, nullptr);
    ASSERT_TRUE(search->timestamp.has_value());
    EXPECT_EQ(*search->timestamp, kT0);
    EXPECT_EQ(search->properties["user-agent"], nlohmann::json::array({"client", "other"}));
    EXPECT_EQ(search->properties["requests"]["total_received"], 2);
}

TEST(EventStoreTest, DrainEmptiesEvenWhenSinkFails) {
    EventStore store;
    store.record(search_at(kT0));
    store.record(make_envelope(SimilarPostAggregator{}, {}, kT0));

    RecordingSink sink;
    sink.fail_pushes = true;
    EXPECT_EQ(store.drain_and_export(sink, "uid"), 2u);
    EXPECT_TRUE(store.empty());
    EXPECT_FALSE(store.contains(EventKind::SearchPost));
    EXPECT_FALSE(store.contains(EventKind::SimilarPost));
}

TEST(EventStoreTest, NextIntervalStartsFresh) {
    EventStore store;
    store.record(search_at(kT0));

    RecordingSink sink;
    store.drain_and_export(sink, "uid");

    store.record(search_at(kT0 + 1h));
    EXPECT_EQ(store.find(EventKind::SearchPost)->first_seen, kT0 + 1h);
    EXPECT_EQ(store.find(EventKind::SearchPost)->occurrences, 1u);
}

TEST(ExportEnvelopeTest, BackfillsMissingDefaults) {
    auto record = export_envelope(make_envelope(MultiSearchAggregator{}, {"sdk"}, kT0), "uid");
    EXPECT_EQ(record.event, "Documents Searched by Multi-Search POST");
    EXPECT_EQ(record.properties["user-agent"], nlohmann::json::array({"sdk"}));
    // The kind reports its own total_received; it is not overwritten.
    EXPECT_EQ(record.properties["requests"]["total_received"], 0);
}

TEST(ExportEnvelopeTest, OccurrencesFillAbsentTotal) {
    auto env = search_at(kT0);
    env.occurrences = 7;
    auto record = export_envelope(std::move(env), "uid");
    // Search tracks total_received itself.
    EXPECT_EQ(record.properties["requests"]["total_received"], 1);
}

TEST(ExportEnvelopeTest, WireShape) {
    auto record = export_envelope(search_at(kT0 + 250ms), "uid-1");
    auto wire = to_json(record);
    EXPECT_EQ(wire["type"], "track");
    EXPECT_EQ(wire["userId"], "uid-1");
    EXPECT_EQ(wire["event"], "Documents Searched POST");
    EXPECT_TRUE(wire["properties"].is_object());
    EXPECT_EQ(wire["timestamp"], "2023-11-14T22:13:20.250Z");
    EXPECT_FALSE(wire.contains("context"));
}
