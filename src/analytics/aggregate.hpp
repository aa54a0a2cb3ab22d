/**
 * @file aggregate.hpp
 * @brief Exported record shape and the route-method tags of event kinds.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace search_analytics {

// ─────────────────────────────────────────────
// Record
// ─────────────────────────────────────────────

enum class RecordType : uint8_t {
    Track,      ///< A named event with properties
    Identify    ///< Instance traits (the snapshot)
};

[[nodiscard]] constexpr std::string_view to_string(RecordType type) noexcept {
    switch (type) {
        case RecordType::Track:    return "track";
        case RecordType::Identify: return "identify";
    }
    return "unknown";
}

/**
 * @brief One message handed to the delivery sink.
 *
 * For Track records `properties` holds the exported aggregate; for Identify
 * records it holds the instance traits and `context` carries the app
 * version. `timestamp` is when the underlying data was first observed.
 */
struct Record {
    RecordType type{RecordType::Track};
    InstanceUid user_id;
    std::string event;
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json context = nlohmann::json::object();
    std::optional<Timestamp> timestamp;
};

/// Wire shape of a record, one JSON object.
[[nodiscard]] nlohmann::json to_json(const Record& record);

// ─────────────────────────────────────────────
// Method tags
// ─────────────────────────────────────────────

struct SearchGET {
    static constexpr std::string_view event_name() noexcept { return "Documents Searched GET"; }
};

struct SearchPOST {
    static constexpr std::string_view event_name() noexcept { return "Documents Searched POST"; }
};

struct SimilarGET {
    static constexpr std::string_view event_name() noexcept { return "Similar GET"; }
};

struct SimilarPOST {
    static constexpr std::string_view event_name() noexcept { return "Similar POST"; }
};

static_assert(AggregateMethod<SearchGET>);
static_assert(AggregateMethod<SearchPOST>);
static_assert(AggregateMethod<SimilarGET>);
static_assert(AggregateMethod<SimilarPOST>);

}  // namespace search_analytics
