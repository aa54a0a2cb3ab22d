/**
 * @file delivery_sink.hpp
 * @brief Destination of exported records.
 *
 * Virtual dispatch, like ILogSink: the sink is chosen once at startup and
 * is only touched once per flush.
 */

#pragma once

#include "analytics/aggregate.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace search_analytics {

/**
 * @brief Best-effort record transport.
 *
 * Callers discard failures of both operations; nothing is retried.
 */
class IDeliverySink {
public:
    virtual ~IDeliverySink() = default;

    virtual Result<void> push(Record record) = 0;
    virtual Result<void> flush() = 0;
};

/**
 * @brief Buffers records and writes them as NDJSON lines to an ILogSink.
 *
 * The buffer is written out on flush() or as soon as it holds batch_size
 * records. Not thread-safe: owned by the aggregator thread.
 */
class BatchingDeliverySink : public IDeliverySink {
public:
    BatchingDeliverySink(std::unique_ptr<ILogSink> out, size_t batch_size = 100);
    ~BatchingDeliverySink() override;

    Result<void> push(Record record) override;
    Result<void> flush() override;

    [[nodiscard]] size_t pending() const noexcept { return batch_.size(); }

private:
    std::unique_ptr<ILogSink> out_;
    size_t batch_size_;
    std::vector<Record> batch_;
};

/**
 * @brief Build the sink named by the configuration.
 *
 * "stdout" writes to standard output; anything else is a directory that
 * receives rotating analytics.ndjson files. An error here disables
 * analytics for the process.
 */
Result<std::unique_ptr<IDeliverySink>> make_delivery_sink(const AnalyticsConfig& config,
                                                          const LogConfig& rotation);

}  // namespace search_analytics
