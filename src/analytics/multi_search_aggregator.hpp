/**
 * @file multi_search_aggregator.hpp
 * @brief Rollup of multi-search (and federated search) requests.
 */

#pragma once

#include "analytics/aggregate.hpp"
#include "analytics/query.hpp"
#include "analytics/statistics.hpp"

#include <nlohmann/json.hpp>

namespace search_analytics {

/**
 * @brief Hourly summary of the multi-search route.
 */
struct MultiSearchAggregator {
    [[nodiscard]] static MultiSearchAggregator from_federated_search(const FederatedSearch& search);

    void succeed();

    static constexpr std::string_view event_name() noexcept {
        return "Documents Searched by Multi-Search POST";
    }

    [[nodiscard]] static MultiSearchAggregator merge(MultiSearchAggregator lhs,
                                                     MultiSearchAggregator rhs);

    [[nodiscard]] nlohmann::json into_event() &&;

    // requests
    Count total_received{0};
    Count total_succeeded{0};

    Count total_distinct_index_count{0};  ///< sum over requests of distinct indexes queried
    Count total_single_index{0};          ///< requests that hit exactly one index
    Count total_search_count{0};          ///< sum over requests of the number of queries

    // scoring
    bool show_ranking_score{false};
    bool show_ranking_score_details{false};

    bool use_federation{false};
};

static_assert(Aggregate<MultiSearchAggregator>);

}  // namespace search_analytics
