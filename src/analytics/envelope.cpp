/**
 * @file envelope.cpp
 * @brief Dispatch over the closed set of event kinds.
 */

#include "analytics/envelope.hpp"

#include <string>

namespace search_analytics {

EventKind kind_of_payload(const AnyAggregate& payload) noexcept {
    return static_cast<EventKind>(payload.index());
}

std::string_view event_name(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::SearchGet:       return SearchGetAggregator::event_name();
        case EventKind::SearchPost:      return SearchPostAggregator::event_name();
        case EventKind::MultiSearchPost: return MultiSearchAggregator::event_name();
        case EventKind::SimilarGet:      return SimilarGetAggregator::event_name();
        case EventKind::SimilarPost:     return SimilarPostAggregator::event_name();
    }
    return "unknown";
}

std::optional<AnyAggregate> try_merge(AnyAggregate current, AnyAggregate incoming) {
    if (current.index() != incoming.index()) return std::nullopt;

    return std::visit(
        [](auto& lhs, auto& rhs) -> std::optional<AnyAggregate> {
            using L = std::decay_t<decltype(lhs)>;
            using R = std::decay_t<decltype(rhs)>;
            if constexpr (std::is_same_v<L, R>) {
                return AnyAggregate{std::in_place_type<L>, L::merge(std::move(lhs), std::move(rhs))};
            } else {
                return std::nullopt;
            }
        },
        current, incoming);
}

nlohmann::json export_payload(AnyAggregate&& payload) {
    return std::visit(
        [](auto& aggregate) -> nlohmann::json { return std::move(aggregate).into_event(); },
        payload);
}

std::optional<std::string_view> select_client_header(
    std::optional<std::string_view> analytics_header,
    std::optional<std::string_view> user_agent) {
    return analytics_header ? analytics_header : user_agent;
}

SourceSet extract_sources(std::optional<std::string_view> header_value) {
    constexpr std::string_view kBlank = " \t\r\n\v\f";
    std::string_view value = header_value.value_or("unknown");

    SourceSet sources;
    while (true) {
        auto end = value.find(';');
        auto piece = value.substr(0, end);

        auto first = piece.find_first_not_of(kBlank);
        if (first == std::string_view::npos) {
            sources.emplace();
        } else {
            auto last = piece.find_last_not_of(kBlank);
            sources.emplace(piece.substr(first, last - first + 1));
        }

        if (end == std::string_view::npos) break;
        value.remove_prefix(end + 1);
    }
    return sources;
}

}  // namespace search_analytics
