/**
 * @file aggregator.cpp
 * @brief Aggregator actor loop.
 */

#include "analytics/aggregator.hpp"

#include <algorithm>
#include <string>

namespace search_analytics {

Aggregator::Aggregator(InstanceUid user_id,
                       std::unique_ptr<IDeliverySink> sink,
                       SnapshotProvider snapshot,
                       Logger& logger,
                       Options options)
    : user_id_(std::move(user_id))
    , sink_(std::move(sink))
    , snapshot_(std::move(snapshot))
    , logger_(logger)
    , options_(options)
    , mailbox_(options.mailbox_capacity) {
    options_.flush_interval = std::max(options_.flush_interval, kMinFlushInterval);
    if (options_.first_time_run) {
        logger_.info("First launch of instance " + user_id_);
        push_launch(kTotalLaunchUser);
        if (auto flushed = sink_->flush(); !flushed) {
            logger_.debug("Launch flush failed: " + flushed.error().message);
        }
        push_launch(user_id_);
    }
}

Aggregator::~Aggregator() {
    stop();
}

void Aggregator::start() {
    if (running_.exchange(true)) return;
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void Aggregator::stop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    running_.store(false);
}

bool Aggregator::send(Envelope envelope) {
    return mailbox_.try_send(std::move(envelope));
}

void Aggregator::push_launch(const InstanceUid& user) {
    auto pushed = sink_->push(Record{
        .type = RecordType::Track,
        .user_id = user,
        .event = kLaunchedEvent,
    });
    if (!pushed) {
        logger_.debug("Launch push failed: " + pushed.error().message);
    }
}

void Aggregator::run(std::stop_token stop) {
    const auto interval = options_.flush_interval;
    auto next_tick = std::chrono::steady_clock::now() + interval;

    while (!stop.stop_requested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= next_tick) {
            tick();
            // Missed ticks are skipped, not replayed.
            while (next_tick <= std::chrono::steady_clock::now()) {
                next_tick += interval;
            }
            continue;
        }

        if (auto envelope = mailbox_.receive_until(next_tick, stop)) {
            handle(std::move(*envelope));
        }
    }
}

void Aggregator::handle(Envelope envelope) {
    auto kind = envelope.kind();
    if (store_.record(std::move(envelope)) == EventStore::RecordOutcome::Dropped) {
        mismatched_.fetch_add(1, std::memory_order_relaxed);
        logger_.debug("Dropped event of mismatched kind " + std::string{event_name(kind)});
    }
}

void Aggregator::tick() {
    if (auto identify = snapshot_.identify(user_id_)) {
        if (auto pushed = sink_->push(std::move(*identify)); !pushed) {
            logger_.debug("Snapshot push failed: " + pushed.error().message);
        }
    } else {
        logger_.debug("Instance statistics unavailable, snapshot skipped");
    }

    auto exported = store_.drain_and_export(*sink_, user_id_);

    if (auto flushed = sink_->flush(); !flushed) {
        logger_.debug("Analytics flush failed: " + flushed.error().message);
    }
    flushes_.fetch_add(1, std::memory_order_release);

    auto dropped = mailbox_.dropped();
    logger_.debug("Analytics flushed " + std::to_string(exported) + " events ("
                  + std::to_string(dropped) + " dropped on full mailbox so far)");
}

}  // namespace search_analytics
