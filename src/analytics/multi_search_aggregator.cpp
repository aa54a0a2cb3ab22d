/**
 * @file multi_search_aggregator.cpp
 * @brief MultiSearchAggregator implementation.
 */

#include "analytics/multi_search_aggregator.hpp"

#include <algorithm>
#include <set>
#include <string>

namespace search_analytics {

MultiSearchAggregator MultiSearchAggregator::from_federated_search(const FederatedSearch& search) {
    std::set<std::string> distinct_indexes;
    for (const auto& query : search.queries) {
        distinct_indexes.insert(query.index_uid);
    }

    MultiSearchAggregator ret;
    ret.total_received = 1;
    ret.total_succeeded = 0;
    ret.total_distinct_index_count = distinct_indexes.size();
    ret.total_single_index = distinct_indexes.size() == 1 ? 1 : 0;
    ret.total_search_count = search.queries.size();
    ret.show_ranking_score = std::any_of(
        search.queries.begin(), search.queries.end(),
        [](const SearchQueryWithIndex& q) { return q.show_ranking_score; });
    ret.show_ranking_score_details = std::any_of(
        search.queries.begin(), search.queries.end(),
        [](const SearchQueryWithIndex& q) { return q.show_ranking_score_details; });
    ret.use_federation = search.federation;
    return ret;
}

void MultiSearchAggregator::succeed() {
    total_succeeded = saturating_add(total_succeeded, 1);
}

MultiSearchAggregator MultiSearchAggregator::merge(MultiSearchAggregator lhs,
                                                   MultiSearchAggregator rhs) {
    return MultiSearchAggregator{
        .total_received = saturating_add(lhs.total_received, rhs.total_received),
        .total_succeeded = saturating_add(lhs.total_succeeded, rhs.total_succeeded),
        .total_distinct_index_count =
            saturating_add(lhs.total_distinct_index_count, rhs.total_distinct_index_count),
        .total_single_index = saturating_add(lhs.total_single_index, rhs.total_single_index),
        .total_search_count = saturating_add(lhs.total_search_count, rhs.total_search_count),
        .show_ranking_score = lhs.show_ranking_score || rhs.show_ranking_score,
        .show_ranking_score_details =
            lhs.show_ranking_score_details || rhs.show_ranking_score_details,
        .use_federation = lhs.use_federation || rhs.use_federation,
    };
}

nlohmann::json MultiSearchAggregator::into_event() && {
    auto received = static_cast<double>(total_received);
    return nlohmann::json{
        {"requests", {
            {"total_succeeded", total_succeeded},
            {"total_failed", saturating_sub(total_received, total_succeeded)},
            {"total_received", total_received},
        }},
        {"indexes", {
            {"total_single_index", total_single_index},
            {"total_distinct_index_count", total_distinct_index_count},
            {"avg_distinct_index_count", static_cast<double>(total_distinct_index_count) / received},
        }},
        {"searches", {
            {"total_search_count", total_search_count},
            {"avg_search_count", static_cast<double>(total_search_count) / received},
        }},
        {"scoring", {
            {"show_ranking_score", show_ranking_score},
            {"show_ranking_score_details", show_ranking_score_details},
        }},
        {"federation", {
            {"use_federation", use_federation},
        }},
    };
}

}  // namespace search_analytics
