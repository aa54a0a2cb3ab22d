/**
 * @file delivery_sink.cpp
 * @brief Batching NDJSON delivery and sink construction.
 */

#include "analytics/delivery_sink.hpp"
#include "telemetry/json_sink.hpp"

#include <filesystem>
#include <system_error>

namespace search_analytics {

BatchingDeliverySink::BatchingDeliverySink(std::unique_ptr<ILogSink> out, size_t batch_size)
    : out_(std::move(out)), batch_size_(batch_size == 0 ? 1 : batch_size) {
    batch_.reserve(batch_size_);
}

BatchingDeliverySink::~BatchingDeliverySink() {
    auto flushed = flush();
    (void)flushed;
}

Result<void> BatchingDeliverySink::push(Record record) {
    batch_.push_back(std::move(record));
    if (batch_.size() >= batch_size_) {
        return flush();
    }
    return {};
}

Result<void> BatchingDeliverySink::flush() {
    if (batch_.empty()) return {};

    auto batch = std::move(batch_);
    batch_.clear();
    batch_.reserve(batch_size_);

    try {
        for (const auto& record : batch) {
            out_->write(to_json(record).dump(
                -1, ' ', false, nlohmann::json::error_handler_t::replace));
        }
        out_->flush();
    } catch (const std::exception& e) {
        return Error{std::string{"Failed to deliver batch: "} + e.what()};
    }
    return {};
}

Result<std::unique_ptr<IDeliverySink>> make_delivery_sink(const AnalyticsConfig& config,
                                                          const LogConfig& rotation) {
    if (config.endpoint.empty()) {
        return Error{"analytics endpoint is empty"};
    }

    if (config.endpoint == "stdout") {
        return std::unique_ptr<IDeliverySink>(
            std::make_unique<BatchingDeliverySink>(std::make_unique<StdoutSink>(),
                                                   config.batch_size));
    }

    try {
        auto file_sink = std::make_unique<JsonFileSink>(
            config.endpoint, "analytics", rotation.max_file_size_mb, rotation.rotate_count);
        if (!file_sink->is_open()) {
            return Error{"Cannot open analytics output in " + config.endpoint};
        }
        return std::unique_ptr<IDeliverySink>(
            std::make_unique<BatchingDeliverySink>(std::move(file_sink), config.batch_size));
    } catch (const std::filesystem::filesystem_error& e) {
        return Error{std::string{"Cannot create analytics output directory: "} + e.what()};
    }
}

}  // namespace search_analytics
