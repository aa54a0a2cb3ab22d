/**
 * @file envelope.hpp
 * @brief Kind-independent wrapper the aggregation engine operates on.
 *
 * The set of event kinds is closed: AnyAggregate is a tagged union of the
 * concrete aggregators and EventKind is its explicit discriminant. The
 * engine merges and exports through the union without naming a concrete
 * type, and each alternative brings its own strongly-typed merge/export.
 */

#pragma once

#include "analytics/multi_search_aggregator.hpp"
#include "analytics/search_aggregator.hpp"
#include "analytics/similar_aggregator.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>
#include <variant>

#include <nlohmann/json.hpp>

namespace search_analytics {

// ─────────────────────────────────────────────
// Event kinds
// ─────────────────────────────────────────────

/// Alternatives are listed in EventKind order.
using AnyAggregate = std::variant<
    SearchGetAggregator,
    SearchPostAggregator,
    MultiSearchAggregator,
    SimilarGetAggregator,
    SimilarPostAggregator>;

enum class EventKind : uint8_t {
    SearchGet,
    SearchPost,
    MultiSearchPost,
    SimilarGet,
    SimilarPost
};

inline constexpr size_t kEventKindCount = std::variant_size_v<AnyAggregate>;

namespace detail {

template <typename T, typename Variant>
struct alternative_index;

template <typename T, typename... Ts>
struct alternative_index<T, std::variant<Ts...>> {
    static constexpr size_t value = [] {
        constexpr bool matches[] = {std::is_same_v<T, Ts>...};
        for (size_t i = 0; i < sizeof...(Ts); ++i) {
            if (matches[i]) return i;
        }
        return sizeof...(Ts);
    }();
};

}  // namespace detail

/**
 * @brief Concrete aggregators that belong to the closed set of kinds.
 */
template <typename T>
concept RegisteredAggregate =
    Aggregate<T> && detail::alternative_index<T, AnyAggregate>::value < kEventKindCount;

/// Compile-time discriminant of a concrete aggregator.
template <RegisteredAggregate T>
inline constexpr EventKind kind_of = static_cast<EventKind>(
    detail::alternative_index<T, AnyAggregate>::value);

static_assert(kind_of<SearchGetAggregator> == EventKind::SearchGet);
static_assert(kind_of<SearchPostAggregator> == EventKind::SearchPost);
static_assert(kind_of<MultiSearchAggregator> == EventKind::MultiSearchPost);
static_assert(kind_of<SimilarGetAggregator> == EventKind::SimilarGet);
static_assert(kind_of<SimilarPostAggregator> == EventKind::SimilarPost);

[[nodiscard]] EventKind kind_of_payload(const AnyAggregate& payload) noexcept;

/// Exported event name of a kind.
[[nodiscard]] std::string_view event_name(EventKind kind) noexcept;

// ─────────────────────────────────────────────
// Envelope
// ─────────────────────────────────────────────

/**
 * @brief One aggregate plus the bookkeeping the engine keeps for it.
 */
struct Envelope {
    AnyAggregate payload;
    Timestamp first_seen;      ///< first occurrence folded in, never moved forward
    SourceSet sources;         ///< union of the callers seen
    Count occurrences{1};      ///< events folded in, saturating

    [[nodiscard]] EventKind kind() const noexcept { return kind_of_payload(payload); }
};

/**
 * @brief Wrap a freshly built aggregate for the mailbox.
 */
template <RegisteredAggregate T>
[[nodiscard]] Envelope make_envelope(T event, SourceSet sources,
                                     Timestamp now = std::chrono::system_clock::now()) {
    return Envelope{
        .payload = AnyAggregate{std::in_place_type<T>, std::move(event)},
        .first_seen = now,
        .sources = std::move(sources),
        .occurrences = 1,
    };
}

/**
 * @brief Merge two payloads of the same kind.
 *
 * Returns nullopt when the kinds differ; the caller drops the incoming
 * event and keeps what it had.
 */
[[nodiscard]] std::optional<AnyAggregate> try_merge(AnyAggregate current, AnyAggregate incoming);

/**
 * @brief Export a payload; consumes its samples.
 */
[[nodiscard]] nlohmann::json export_payload(AnyAggregate&& payload);

/**
 * @brief The header value caller labels are read from.
 *
 * kAnalyticsHeader when the request carries it, else kUserAgentHeader.
 */
[[nodiscard]] std::optional<std::string_view> select_client_header(
    std::optional<std::string_view> analytics_header,
    std::optional<std::string_view> user_agent);

/**
 * @brief Caller labels from a client header value.
 *
 * "a; b;c" → {"a", "b", "c"}. Pieces are trimmed and kept even when empty,
 * so "a;;b" also yields "". An absent header counts as "unknown".
 */
[[nodiscard]] SourceSet extract_sources(std::optional<std::string_view> header_value);

}  // namespace search_analytics
