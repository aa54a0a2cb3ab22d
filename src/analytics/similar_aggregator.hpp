/**
 * @file similar_aggregator.hpp
 * @brief Rollup of similar-documents requests.
 */

#pragma once

#include "analytics/aggregate.hpp"
#include "analytics/query.hpp"
#include "analytics/statistics.hpp"

#include <nlohmann/json.hpp>

namespace search_analytics {

template <AggregateMethod Method>
class SimilarAggregator {
public:
    SimilarAggregator() = default;

    [[nodiscard]] static SimilarAggregator from_query(const SimilarQuery& query);

    void succeed(const SimilarResult& result);

    static constexpr std::string_view event_name() noexcept { return Method::event_name(); }

    [[nodiscard]] static SimilarAggregator merge(SimilarAggregator lhs, SimilarAggregator rhs);

    [[nodiscard]] nlohmann::json into_event() &&;

    // requests
    Count total_received{0};
    Count total_succeeded{0};
    SampleSet time_spent;

    // filter
    bool filter_with_geo_radius{false};
    bool filter_with_geo_bounding_box{false};
    Count filter_sum_of_criteria_terms{0};
    Count filter_total_number_of_criteria{0};
    FrequencyTable used_syntax;

    bool retrieve_vectors{false};

    // pagination
    Count max_limit{0};
    Count max_offset{0};

    // formatting
    Count max_attributes_to_retrieve{0};

    // scoring
    bool show_ranking_score{false};
    bool show_ranking_score_details{false};
    bool ranking_score_threshold{false};
};

extern template class SimilarAggregator<SimilarGET>;
extern template class SimilarAggregator<SimilarPOST>;

using SimilarGetAggregator = SimilarAggregator<SimilarGET>;
using SimilarPostAggregator = SimilarAggregator<SimilarPOST>;

static_assert(Aggregate<SimilarGetAggregator>);
static_assert(Aggregate<SimilarPostAggregator>);

}  // namespace search_analytics
