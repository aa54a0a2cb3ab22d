/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for SearchAnalytics interfaces.
 *
 * Every event kind is checked against these at compile time. The engine
 * itself only sees the closed tagged union built from the kinds, so no
 * virtual dispatch is involved in merging.
 */

#pragma once

#include <concepts>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace search_analytics {

// ─────────────────────────────────────────────
// AggregateMethod
// ─────────────────────────────────────────────

/**
 * @concept AggregateMethod
 * @brief Tag type naming the route variant an aggregate is collected for.
 *
 * The same payload shape (e.g. a search) is reported under a different
 * event name depending on the HTTP method, so the name lives in the tag.
 */
template <typename M>
concept AggregateMethod = requires {
    { M::event_name() } -> std::convertible_to<std::string_view>;
};

// ─────────────────────────────────────────────
// Aggregate
// ─────────────────────────────────────────────

/**
 * @concept Aggregate
 * @brief Capability every event kind implements.
 *
 *  - event_name(): stable name, a function of the kind only
 *  - merge(a, b):  associative and commutative per field
 *  - into_event(): single use, drains internal samples
 */
template <typename T>
concept Aggregate = std::movable<T> && std::default_initializable<T> && requires(T a, T b) {
    { T::event_name() } -> std::convertible_to<std::string_view>;
    { T::merge(std::move(a), std::move(b)) } -> std::same_as<T>;
    { std::move(a).into_event() } -> std::same_as<nlohmann::json>;
};

}  // namespace search_analytics
