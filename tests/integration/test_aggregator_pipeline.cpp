/**
 * @file test_aggregator_pipeline.cpp
 * @brief Integration tests exercising the full analytics pipeline.
 *
 * Producers → mailbox → aggregator thread → store → delivery sink, with a
 * recording sink and short flush intervals standing in for the hourly tick.
 */

#include "analytics/aggregator.hpp"
#include "analytics/analytics.hpp"
#include "analytics/delivery_sink.hpp"
#include "analytics/envelope.hpp"
#include "analytics/instance_uid.hpp"
#include "analytics/snapshot.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace search_analytics;
using namespace std::chrono_literals;

namespace {

struct SinkState {
    std::mutex mutex;
    std::vector<Record> records;
    std::vector<size_t> flush_marks;   ///< records.size() at each flush

    std::vector<Record> copy() {
        std::lock_guard lock(mutex);
        return records;
    }
};

class RecordingSink : public IDeliverySink {
public:
    explicit RecordingSink(std::shared_ptr<SinkState> state) : state_(std::move(state)) {}

    Result<void> push(Record record) override {
        std::lock_guard lock(state_->mutex);
        state_->records.push_back(std::move(record));
        return {};
    }

    Result<void> flush() override {
        std::lock_guard lock(state_->mutex);
        state_->flush_marks.push_back(state_->records.size());
        return {};
    }

private:
    std::shared_ptr<SinkState> state_;
};

class FakeStatsSource : public IStatsSource {
public:
    Result<InstanceStats> collect() override {
        return InstanceStats{.database_size = 1024, .documents_per_index = {3}};
    }
};

bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

std::vector<Record> records_named(const std::vector<Record>& records, std::string_view event) {
    std::vector<Record> out;
    for (const auto& r : records) {
        if (r.type == RecordType::Track && r.event == event) out.push_back(r);
    }
    return out;
}

Envelope search_envelope(bool succeeded, SourceSet sources = {"client"},
                         Timestamp when = std::chrono::system_clock::now()) {
    auto agg = SearchPostAggregator::from_query(SearchQuery{});
    if (succeeded) agg.succeed(SearchResult{.processing_time_ms = 10});
    return make_envelope(std::move(agg), std::move(sources), when);
}

class PipelineTest : public ::testing::Test {
protected:
    std::shared_ptr<SinkState> state_ = std::make_shared<SinkState>();
    FakeStatsSource stats_;
    Logger logger_{std::make_unique<NullSink>()};

    std::unique_ptr<Aggregator> make_aggregator(Aggregator::Options options,
                                                const InstanceUid& uid = "uid-1") {
        return std::make_unique<Aggregator>(
            uid, std::make_unique<RecordingSink>(state_),
            SnapshotProvider(ServerConfig{}, stats_, SystemInfo{}), logger_, options);
    }
};

}  // namespace

// ═══════════════════════════════════════════════
// Aggregator actor
// ═══════════════════════════════════════════════

TEST_F(PipelineTest, FirstRunPushesLaunchTwice) {
    auto aggregator = make_aggregator({.flush_interval = 1h, .first_time_run = true});

    auto records = state_->copy();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].event, "Launched");
    EXPECT_EQ(records[0].user_id, "total_launch");
    EXPECT_EQ(records[1].event, "Launched");
    EXPECT_EQ(records[1].user_id, "uid-1");

    std::lock_guard lock(state_->mutex);
    ASSERT_EQ(state_->flush_marks.size(), 1u);
    EXPECT_EQ(state_->flush_marks[0], 1u);
}

TEST_F(PipelineTest, KnownInstanceDoesNotLaunch) {
    auto aggregator = make_aggregator({.flush_interval = 1h, .first_time_run = false});
    EXPECT_TRUE(state_->copy().empty());
}

TEST_F(PipelineTest, NoFlushBeforeFirstInterval) {
    auto aggregator = make_aggregator({.flush_interval = 1h});
    aggregator->start();
    EXPECT_TRUE(aggregator->send(search_envelope(true)));
    std::this_thread::sleep_for(100ms);
    aggregator->stop();

    EXPECT_EQ(aggregator->flush_count(), 0u);
    EXPECT_TRUE(state_->copy().empty());
}

TEST_F(PipelineTest, ThreeSearchesRollUpIntoOneRecord) {
    auto aggregator = make_aggregator({.flush_interval = 200ms});
    aggregator->start();
    EXPECT_TRUE(aggregator->send(search_envelope(true, {"a"})));
    EXPECT_TRUE(aggregator->send(search_envelope(true, {"b"})));
    EXPECT_TRUE(aggregator->send(search_envelope(false, {"a"})));

    ASSERT_TRUE(wait_for([&] { return aggregator->flush_count() >= 1; }));
    aggregator->stop();

    auto records = state_->copy();
    ASSERT_GE(records.size(), 2u);
    EXPECT_EQ(records[0].type, RecordType::Identify);

    auto searches = records_named(records, "Documents Searched POST");
    ASSERT_EQ(searches.size(), 1u);
    const auto& props = searches[0].properties;
    EXPECT_EQ(props["requests"]["total_received"], 3);
    EXPECT_EQ(props["requests"]["total_succeeded"], 2);
    EXPECT_EQ(props["requests"]["total_failed"], 1);
    EXPECT_EQ(props["user-agent"], nlohmann::json::array({"a", "b"}));
}

TEST_F(PipelineTest, FullMailboxDropsTheOverflow) {
    auto aggregator = make_aggregator({.flush_interval = 200ms, .mailbox_capacity = 100});

    // Not started yet: nothing drains the mailbox.
    int accepted = 0;
    for (int i = 0; i < 100; ++i) {
        if (aggregator->send(search_envelope(true))) ++accepted;
    }
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(aggregator->send(search_envelope(true)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);

    EXPECT_EQ(accepted, 100);
    EXPECT_EQ(aggregator->dropped_events(), 1u);
    EXPECT_EQ(aggregator->pending(), 100u);

    aggregator->start();
    ASSERT_TRUE(wait_for([&] { return aggregator->flush_count() >= 1; }));
    aggregator->stop();

    auto searches = records_named(state_->copy(), "Documents Searched POST");
    ASSERT_EQ(searches.size(), 1u);
    EXPECT_EQ(searches[0].properties["requests"]["total_received"], 100);
}

TEST_F(PipelineTest, EachFlushStartsFresh) {
    const Timestamp t0 = Timestamp{} + 1700000000s;
    auto aggregator = make_aggregator({.flush_interval = 150ms});
    aggregator->start();

    EXPECT_TRUE(aggregator->send(search_envelope(true, {"a"}, t0)));
    EXPECT_TRUE(aggregator->send(search_envelope(true, {"a"}, t0 + 10s)));
    ASSERT_TRUE(wait_for([&] { return aggregator->flush_count() >= 1; }));

    EXPECT_TRUE(aggregator->send(search_envelope(true, {"b"}, t0 + 1h)));
    auto after_first = aggregator->flush_count();
    ASSERT_TRUE(wait_for([&] { return aggregator->flush_count() > after_first; }));
    aggregator->stop();

    auto searches = records_named(state_->copy(), "Documents Searched POST");
    ASSERT_EQ(searches.size(), 2u);
    EXPECT_EQ(searches[0].timestamp, t0);
    EXPECT_EQ(searches[0].properties["requests"]["total_received"], 2);
    EXPECT_EQ(searches[1].timestamp, t0 + 1h);
    EXPECT_EQ(searches[1].properties["requests"]["total_received"], 1);
    EXPECT_EQ(searches[1].properties["user-agent"], nlohmann::json::array({"b"}));
}

TEST_F(PipelineTest, SnapshotPrecedesEventsAndFlushFollows) {
    auto aggregator = make_aggregator({.flush_interval = 150ms});
    aggregator->start();
    EXPECT_TRUE(aggregator->send(search_envelope(true)));
    EXPECT_TRUE(aggregator->send(make_envelope(SimilarGetAggregator{}, {"x"})));
    ASSERT_TRUE(wait_for([&] { return aggregator->flush_count() >= 1; }));
    aggregator->stop();

    std::lock_guard lock(state_->mutex);
    ASSERT_GE(state_->records.size(), 3u);
    EXPECT_EQ(state_->records[0].type, RecordType::Identify);
    EXPECT_EQ(state_->records[0].properties["stats"]["documents_number"],
              nlohmann::json::array({3}));
    ASSERT_FALSE(state_->flush_marks.empty());
    EXPECT_EQ(state_->flush_marks[0], 3u);
}

TEST_F(PipelineTest, ConcurrentProducersLoseNothingAccepted) {
    constexpr int kProducers = 8;
    constexpr int kPerProducer = 50;
    auto aggregator = make_aggregator({.flush_interval = 100ms, .mailbox_capacity = 1000});
    aggregator->start();

    std::atomic<int> accepted{0};
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                if (aggregator->send(search_envelope(i % 2 == 0, {"producer-" + std::to_string(p)}))) {
                    ++accepted;
                }
            }
        });
    }
    for (auto& t : producers) t.join();

    ASSERT_TRUE(wait_for([&] { return aggregator->pending() == 0; }));
    auto settled = aggregator->flush_count();
    ASSERT_TRUE(wait_for([&] { return aggregator->flush_count() > settled; }));
    aggregator->stop();

    uint64_t received = 0;
    for (const auto& record : records_named(state_->copy(), "Documents Searched POST")) {
        received += record.properties["requests"]["total_received"].get<uint64_t>();
    }
    EXPECT_EQ(received, static_cast<uint64_t>(accepted.load()));
    EXPECT_EQ(received + aggregator->dropped_events(),
              static_cast<uint64_t>(kProducers * kPerProducer));
}

TEST_F(PipelineTest, FailingSinkDoesNotStopTheActor) {
    class RefusingSink : public IDeliverySink {
    public:
        explicit RefusingSink(std::atomic<int>& pushes) : pushes_(pushes) {}
        Result<void> push(Record) override {
            ++pushes_;
            return Error{"endpoint unreachable"};
        }
        Result<void> flush() override { return Error{"endpoint unreachable"}; }

    private:
        std::atomic<int>& pushes_;
    };

    std::atomic<int> pushes{0};
    Aggregator aggregator("uid-1", std::make_unique<RefusingSink>(pushes),
                          SnapshotProvider(ServerConfig{}, stats_, SystemInfo{}), logger_,
                          {.flush_interval = 100ms, .first_time_run = true});
    aggregator.start();
    EXPECT_TRUE(aggregator.send(search_envelope(true)));
    ASSERT_TRUE(wait_for([&] { return aggregator.flush_count() >= 2; }));
    EXPECT_TRUE(aggregator.is_running());
    aggregator.stop();

    // two launch records, then per tick one snapshot (+ one search on the first)
    EXPECT_GE(pushes.load(), 5);
}

TEST_F(PipelineTest, ZeroIntervalKeepsTickingAndStops) {
    auto aggregator = make_aggregator({.flush_interval = 0ms});
    aggregator->start();
    ASSERT_TRUE(wait_for([&] { return aggregator->flush_count() >= 3; }, 2s));

    auto begin = std::chrono::steady_clock::now();
    aggregator->stop();
    EXPECT_FALSE(aggregator->is_running());
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
}

TEST_F(PipelineTest, NegativeIntervalIsRaisedToTheMinimum) {
    auto aggregator = make_aggregator({.flush_interval = -5s});
    aggregator->start();
    ASSERT_TRUE(wait_for([&] { return aggregator->flush_count() >= 2; }, 2s));
    aggregator->stop();
}

// ═══════════════════════════════════════════════
// Analytics facade
// ═══════════════════════════════════════════════

class AnalyticsFacadeTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;
    Config config_;
    FakeStatsSource stats_;
    Logger logger_{std::make_unique<NullSink>()};

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "sa_test_facade";
        std::filesystem::remove_all(temp_dir_);
        config_.server.db_path = temp_dir_ / "data.ms";
        config_.analytics.config_dir = temp_dir_ / "config";
        config_.analytics.flush_interval_s = 1;
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(AnalyticsFacadeTest, DisabledByConfiguration) {
    config_.analytics.enabled = false;
    EXPECT_FALSE(Analytics::create(config_, stats_, logger_));
}

TEST_F(AnalyticsFacadeTest, ZeroFlushIntervalIsRejected) {
    config_.analytics.flush_interval_s = 0;
    auto state = std::make_shared<SinkState>();
    auto created = Analytics::create_with_sink(
        config_, std::make_unique<RecordingSink>(state), stats_, logger_);
    ASSERT_FALSE(created);
    EXPECT_NE(created.error().message.find("flush interval"), std::string::npos);
    EXPECT_TRUE(state->copy().empty());
}

TEST_F(AnalyticsFacadeTest, ZeroMailboxCapacityIsRejected) {
    config_.analytics.mailbox_capacity = 0;
    auto created = Analytics::create_with_sink(
        config_, std::make_unique<RecordingSink>(std::make_shared<SinkState>()), stats_, logger_);
    EXPECT_FALSE(created);
}

TEST_F(AnalyticsFacadeTest, SinkConstructionFailureDisables) {
    std::filesystem::create_directories(temp_dir_);
    std::ofstream(temp_dir_ / "blocker") << "x";
    config_.analytics.endpoint = (temp_dir_ / "blocker" / "out").string();

    auto created = Analytics::create(config_, stats_, logger_);
    ASSERT_FALSE(created);
    EXPECT_FALSE(created.error().message.empty());
}

TEST_F(AnalyticsFacadeTest, FirstRunThenKnownInstance) {
    InstanceUid first_uid;
    {
        auto state = std::make_shared<SinkState>();
        auto created = Analytics::create_with_sink(
            config_, std::make_unique<RecordingSink>(state), stats_, logger_);
        ASSERT_TRUE(created) << created.error().message;
        auto& analytics = **created;
        EXPECT_TRUE(analytics.first_time_run());
        EXPECT_TRUE(is_valid_uuid(analytics.instance_uid()));
        first_uid = analytics.instance_uid();

        auto records = state->copy();
        ASSERT_EQ(records.size(), 2u);
        EXPECT_EQ(records[0].user_id, kTotalLaunchUser);
        EXPECT_EQ(records[1].user_id, first_uid);
    }

    auto state = std::make_shared<SinkState>();
    auto created = Analytics::create_with_sink(
        config_, std::make_unique<RecordingSink>(state), stats_, logger_);
    ASSERT_TRUE(created);
    EXPECT_FALSE((*created)->first_time_run());
    EXPECT_EQ((*created)->instance_uid(), first_uid);
    EXPECT_TRUE(state->copy().empty());
}

TEST_F(AnalyticsFacadeTest, PublishReachesTheSink) {
    auto state = std::make_shared<SinkState>();
    auto created = Analytics::create_with_sink(
        config_, std::make_unique<RecordingSink>(state), stats_, logger_);
    ASSERT_TRUE(created);
    auto& analytics = **created;

    auto search = SearchGetAggregator::from_query(SearchQuery{.q = "tolkien"});
    search.succeed(SearchResult{.processing_time_ms = 4});
    EXPECT_TRUE(analytics.publish(std::move(search), "docs-site; search-js"));
    EXPECT_TRUE(analytics.publish(SimilarPostAggregator{}));

    ASSERT_TRUE(wait_for([&] { return analytics.aggregator().flush_count() >= 1; }, 5s));
    analytics.aggregator().stop();

    auto records = state->copy();
    auto searches = records_named(records, "Documents Searched GET");
    ASSERT_EQ(searches.size(), 1u);
    EXPECT_EQ(searches[0].user_id, analytics.instance_uid());
    EXPECT_EQ(searches[0].properties["user-agent"],
              nlohmann::json::array({"docs-site", "search-js"}));
    EXPECT_EQ(searches[0].properties["q"]["max_terms_number"], 1);

    auto similar = records_named(records, "Similar POST");
    ASSERT_EQ(similar.size(), 1u);
    EXPECT_EQ(similar[0].properties["user-agent"], nlohmann::json::array({"unknown"}));
}
