/**
 * @file aggregator.hpp
 * @brief Single-consumer actor that folds events and flushes them hourly.
 */

#pragma once

#include "analytics/delivery_sink.hpp"
#include "analytics/envelope.hpp"
#include "analytics/event_store.hpp"
#include "analytics/mailbox.hpp"
#include "analytics/snapshot.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <thread>

namespace search_analytics {

inline constexpr std::chrono::seconds kDefaultFlushInterval{60 * 60};
inline constexpr size_t kDefaultMailboxCapacity = 100;

/// Shorter intervals, zero and negative ones included, are raised to this.
inline constexpr std::chrono::milliseconds kMinFlushInterval{1};

/**
 * @brief The aggregation actor.
 *
 * A dedicated std::jthread owns the EventStore and reacts to exactly two
 * triggers:
 *   mailbox arrival: record() the envelope
 *   timer tick: push the snapshot, drain_and_export(), flush the sink
 *
 * The first tick fires one interval after start(), not immediately.
 * Destruction stops the thread without flushing; unflushed data is lost
 * just as it is on process exit.
 */
class Aggregator {
public:
    struct Options {
        std::chrono::milliseconds flush_interval{kDefaultFlushInterval};
        size_t mailbox_capacity{kDefaultMailboxCapacity};
        bool first_time_run{false};
    };

    /**
     * @brief Build the actor; on a first run, report the launch right away.
     *
     * The launch is pushed under kTotalLaunchUser and flushed, then pushed
     * again under @p user_id to leave with the first hourly batch. Both go
     * straight to the sink.
     */
    Aggregator(InstanceUid user_id,
               std::unique_ptr<IDeliverySink> sink,
               SnapshotProvider snapshot,
               Logger& logger,
               Options options);
    ~Aggregator();

    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

    /// Start the consumer thread and arm the timer.
    void start();

    /// Stop the consumer thread; pending messages and the store are discarded.
    void stop();

    /**
     * @brief Hand an envelope to the actor without waiting.
     *
     * @return false if the mailbox was full and the event was dropped.
     */
    bool send(Envelope envelope);

    [[nodiscard]] uint64_t dropped_events() const noexcept { return mailbox_.dropped(); }
    [[nodiscard]] uint64_t mismatched_events() const noexcept { return mismatched_.load(); }
    [[nodiscard]] uint64_t flush_count() const noexcept { return flushes_.load(); }
    [[nodiscard]] size_t pending() const { return mailbox_.size(); }
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

private:
    void run(std::stop_token stop);
    void handle(Envelope envelope);
    void tick();
    void push_launch(const InstanceUid& user);

    InstanceUid user_id_;
    std::unique_ptr<IDeliverySink> sink_;
    SnapshotProvider snapshot_;
    Logger& logger_;
    Options options_;

    BoundedMailbox<Envelope> mailbox_;
    EventStore store_;

    std::atomic<uint64_t> mismatched_{0};
    std::atomic<uint64_t> flushes_{0};
    std::atomic<bool> running_{false};

    std::jthread worker_;
};

}  // namespace search_analytics
