/**
 * @file analytics.hpp
 * @brief Entry point used by request handlers to report usage.
 */

#pragma once

#include "analytics/aggregator.hpp"
#include "analytics/delivery_sink.hpp"
#include "analytics/envelope.hpp"
#include "analytics/snapshot.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace search_analytics {

/**
 * @brief Usage analytics of one search instance.
 *
 * create() fails when analytics are disabled or the delivery sink cannot be
 * built; the host then runs without instrumentation. Once created,
 * publish() never blocks and never reports an error to the caller.
 */
class Analytics {
public:
    /**
     * @brief Resolve the instance uid, build the configured sink, start the actor.
     */
    static Result<std::unique_ptr<Analytics>> create(const Config& config,
                                                     IStatsSource& stats,
                                                     Logger& logger);

    /**
     * @brief Same as create() with an explicit sink.
     */
    static Result<std::unique_ptr<Analytics>> create_with_sink(
        const Config& config,
        std::unique_ptr<IDeliverySink> sink,
        IStatsSource& stats,
        Logger& logger);

    /**
     * @brief Report one event.
     *
     * @param client_header value of the client header (or User-Agent), if any
     * @return false when the event was dropped because the mailbox is full
     */
    template <RegisteredAggregate T>
    bool publish(T event, std::optional<std::string_view> client_header = std::nullopt) {
        return aggregator_->send(
            make_envelope(std::move(event), extract_sources(client_header)));
    }

    [[nodiscard]] const InstanceUid& instance_uid() const noexcept { return instance_uid_; }
    [[nodiscard]] bool first_time_run() const noexcept { return first_time_run_; }
    [[nodiscard]] uint64_t dropped_events() const noexcept { return aggregator_->dropped_events(); }
    [[nodiscard]] Aggregator& aggregator() noexcept { return *aggregator_; }

private:
    Analytics(InstanceUid uid, bool first_time_run, std::unique_ptr<Aggregator> aggregator);

    InstanceUid instance_uid_;
    bool first_time_run_;
    std::unique_ptr<Aggregator> aggregator_;
};

}  // namespace search_analytics
