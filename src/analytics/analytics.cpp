/**
 * @file analytics.cpp
 * @brief Analytics construction.
 */

#include "analytics/analytics.hpp"
#include "analytics/instance_uid.hpp"

#include <chrono>

namespace search_analytics {

Analytics::Analytics(InstanceUid uid, bool first_time_run, std::unique_ptr<Aggregator> aggregator)
    : instance_uid_(std::move(uid))
    , first_time_run_(first_time_run)
    , aggregator_(std::move(aggregator)) {}

Result<std::unique_ptr<Analytics>> Analytics::create(const Config& config,
                                                     IStatsSource& stats,
                                                     Logger& logger) {
    if (!config.analytics.enabled) {
        return Error{"Analytics disabled by configuration"};
    }

    auto sink = make_delivery_sink(config.analytics, config.log);
    if (!sink) {
        return Error{"Analytics disabled: " + sink.error().message};
    }
    return create_with_sink(config, std::move(*sink), stats, logger);
}

Result<std::unique_ptr<Analytics>> Analytics::create_with_sink(
    const Config& config,
    std::unique_ptr<IDeliverySink> sink,
    IStatsSource& stats,
    Logger& logger) {
    if (!sink) {
        return Error{"Analytics disabled: no delivery sink"};
    }
    if (config.analytics.flush_interval_s == 0) {
        return Error{"Analytics disabled: flush interval must be greater than zero"};
    }
    if (config.analytics.mailbox_capacity == 0) {
        return Error{"Analytics disabled: mailbox capacity must be greater than zero"};
    }

    auto config_dir = config.analytics.config_dir.empty()
        ? default_analytics_config_dir()
        : config.analytics.config_dir;

    auto existing = find_instance_uid(config.server.db_path, config_dir);
    bool first_time_run = !existing.has_value();
    auto uid = existing.value_or(generate_instance_uid());
    write_instance_uid(config.server.db_path, config_dir, uid);

    SnapshotProvider snapshot(config.server, stats, collect_system_info(config.server.db_path));

    auto aggregator = std::make_unique<Aggregator>(
        uid, std::move(sink), std::move(snapshot), logger,
        Aggregator::Options{
            .flush_interval = std::chrono::seconds{config.analytics.flush_interval_s},
            .mailbox_capacity = config.analytics.mailbox_capacity,
            .first_time_run = first_time_run,
        });
    aggregator->start();

    logger.info("Analytics enabled for instance " + uid + ", flushing every "
                + std::to_string(config.analytics.flush_interval_s) + "s");

    return std::unique_ptr<Analytics>(
        new Analytics(std::move(uid), first_time_run, std::move(aggregator)));
}

}  // namespace search_analytics
