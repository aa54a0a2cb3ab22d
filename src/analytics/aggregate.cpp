/**
 * @file aggregate.cpp
 * @brief Record serialization.
 */

#include "analytics/aggregate.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace search_analytics {

namespace {

std::string format_rfc3339(Timestamp ts) {
    auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;
    if (ms.count() < 0) ms += std::chrono::milliseconds{1000};

    std::tm utc{};
    gmtime_r(&time_t_ts, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace

nlohmann::json to_json(const Record& record) {
    nlohmann::json out = {
        {"type", to_string(record.type)},
        {"userId", record.user_id},
    };
    if (record.type == RecordType::Track) {
        out["event"] = record.event;
        out["properties"] = record.properties;
    } else {
        out["traits"] = record.properties;
    }
    if (!record.context.empty()) {
        out["context"] = record.context;
    }
    if (record.timestamp) {
        out["timestamp"] = format_rfc3339(*record.timestamp);
    }
    return out;
}

}  // namespace search_analytics
