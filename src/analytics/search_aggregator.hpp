/**
 * @file search_aggregator.hpp
 * @brief Rollup of single-index search requests.
 */

#pragma once

#include "analytics/aggregate.hpp"
#include "analytics/query.hpp"
#include "analytics/statistics.hpp"

#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace search_analytics {

/**
 * @brief Hourly summary of the search route, one instance per HTTP method.
 *
 * Built with from_query() when a request arrives and completed with
 * succeed() once it was answered. Every field is folded by merge().
 */
template <AggregateMethod Method>
class SearchAggregator {
public:
    SearchAggregator() = default;

    [[nodiscard]] static SearchAggregator from_query(const SearchQuery& query);

    /// Account for a successful response.
    void succeed(const SearchResult& result);

    static constexpr std::string_view event_name() noexcept { return Method::event_name(); }

    [[nodiscard]] static SearchAggregator merge(SearchAggregator lhs, SearchAggregator rhs);

    [[nodiscard]] nlohmann::json into_event() &&;

    // requests
    Count total_received{0};
    Count total_succeeded{0};
    Count total_degraded{0};
    Count total_used_negative_operator{0};
    SampleSet time_spent;

    // sort
    bool sort_with_geo_point{false};
    Count sort_sum_of_criteria_terms{0};      ///< incremented by the terms of each sort
    Count sort_total_number_of_criteria{0};   ///< incremented by one per sorted request

    // distinct
    bool distinct{false};

    // filter
    bool filter_with_geo_radius{false};
    bool filter_with_geo_bounding_box{false};
    Count filter_sum_of_criteria_terms{0};    ///< incremented by the terms of each filter
    Count filter_total_number_of_criteria{0}; ///< incremented by one per filtered request
    FrequencyTable used_syntax;

    // attributes_to_search_on
    Count attributes_to_search_on_total_number_of_uses{0};

    // q
    Count max_terms_number{0};

    // vector
    Count max_vector_size{0};
    bool retrieve_vectors{false};

    // hybrid
    bool semantic_ratio{false};               ///< a non-default ratio was requested
    bool hybrid{false};

    FrequencyTable matching_strategy;
    std::set<std::string> locales;

    // pagination
    Count max_limit{0};
    Count max_offset{0};
    Count finite_pagination{0};

    // formatting
    Count max_attributes_to_retrieve{0};
    Count max_attributes_to_highlight{0};
    bool highlight_pre_tag{false};
    bool highlight_post_tag{false};
    Count max_attributes_to_crop{0};
    bool crop_marker{false};
    bool show_matches_position{false};
    bool crop_length{false};

    // facets
    Count facets_sum_of_terms{0};
    Count facets_total_number_of_facets{0};

    // scoring
    bool show_ranking_score{false};
    bool show_ranking_score_details{false};
    bool ranking_score_threshold{false};
};

extern template class SearchAggregator<SearchGET>;
extern template class SearchAggregator<SearchPOST>;

using SearchGetAggregator = SearchAggregator<SearchGET>;
using SearchPostAggregator = SearchAggregator<SearchPOST>;

static_assert(Aggregate<SearchGetAggregator>);
static_assert(Aggregate<SearchPostAggregator>);

}  // namespace search_analytics
