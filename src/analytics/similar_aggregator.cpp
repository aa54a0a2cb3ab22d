/**
 * @file similar_aggregator.cpp
 * @brief SimilarAggregator implementation.
 */

#include "analytics/similar_aggregator.hpp"

#include <algorithm>

namespace search_analytics {

template <AggregateMethod Method>
SimilarAggregator<Method> SimilarAggregator<Method>::from_query(const SimilarQuery& query) {
    SimilarAggregator ret;
    ret.total_received = 1;

    if (query.filter) {
        auto analysis = analyze_filter(*query.filter);
        ret.filter_total_number_of_criteria = 1;
        bump(ret.used_syntax, analysis.syntax);
        ret.filter_with_geo_radius = analysis.with_geo_radius;
        ret.filter_with_geo_bounding_box = analysis.with_geo_bounding_box;
        ret.filter_sum_of_criteria_terms = analysis.criteria_terms;
    }

    ret.max_limit = query.limit;
    ret.max_offset = query.offset;

    if (query.attributes_to_retrieve) {
        ret.max_attributes_to_retrieve = query.attributes_to_retrieve->size();
    }

    ret.show_ranking_score = query.show_ranking_score;
    ret.show_ranking_score_details = query.show_ranking_score_details;
    ret.ranking_score_threshold = query.ranking_score_threshold.has_value();

    ret.retrieve_vectors = query.retrieve_vectors;

    return ret;
}

template <AggregateMethod Method>
void SimilarAggregator<Method>::succeed(const SimilarResult& result) {
    total_succeeded = saturating_add(total_succeeded, 1);
    time_spent.push_back(result.processing_time_ms);
}

template <AggregateMethod Method>
SimilarAggregator<Method> SimilarAggregator<Method>::merge(SimilarAggregator lhs,
                                                           SimilarAggregator rhs) {
    // requests
    lhs.total_received = saturating_add(lhs.total_received, rhs.total_received);
    lhs.total_succeeded = saturating_add(lhs.total_succeeded, rhs.total_succeeded);
    append_samples(lhs.time_spent, std::move(rhs.time_spent));

    // filter
    lhs.filter_with_geo_radius |= rhs.filter_with_geo_radius;
    lhs.filter_with_geo_bounding_box |= rhs.filter_with_geo_bounding_box;
    lhs.filter_sum_of_criteria_terms =
        saturating_add(lhs.filter_sum_of_criteria_terms, rhs.filter_sum_of_criteria_terms);
    lhs.filter_total_number_of_criteria =
        saturating_add(lhs.filter_total_number_of_criteria, rhs.filter_total_number_of_criteria);
    merge_into(lhs.used_syntax, rhs.used_syntax);

    lhs.retrieve_vectors |= rhs.retrieve_vectors;

    // pagination
    lhs.max_limit = std::max(lhs.max_limit, rhs.max_limit);
    lhs.max_offset = std::max(lhs.max_offset, rhs.max_offset);

    // formatting
    lhs.max_attributes_to_retrieve =
        std::max(lhs.max_attributes_to_retrieve, rhs.max_attributes_to_retrieve);

    // scoring
    lhs.show_ranking_score |= rhs.show_ranking_score;
    lhs.show_ranking_score_details |= rhs.show_ranking_score_details;
    lhs.ranking_score_threshold |= rhs.ranking_score_threshold;

    return lhs;
}

template <AggregateMethod Method>
nlohmann::json SimilarAggregator<Method>::into_event() && {
    using nlohmann::json;

    auto p99 = percentile_nearest_rank(std::move(time_spent), 99);
    auto syntax = most_used(used_syntax);

    return json{
        {"requests", {
            {"99th_response_time", p99 ? json(std::to_string(*p99)) : json(nullptr)},
            {"total_succeeded", total_succeeded},
            {"total_failed", saturating_sub(total_received, total_succeeded)},
            {"total_received", total_received},
        }},
        {"filter", {
            {"with_geoRadius", filter_with_geo_radius},
            {"with_geoBoundingBox", filter_with_geo_bounding_box},
            {"avg_criteria_number",
             format_ratio(filter_sum_of_criteria_terms, filter_total_number_of_criteria)},
            {"most_used_syntax", syntax ? json(*syntax) : json(nullptr)},
        }},
        {"vector", {
            {"retrieve_vectors", retrieve_vectors},
        }},
        {"pagination", {
            {"max_limit", max_limit},
            {"max_offset", max_offset},
        }},
        {"formatting", {
            {"max_attributes_to_retrieve", max_attributes_to_retrieve},
        }},
        {"scoring", {
            {"show_ranking_score", show_ranking_score},
            {"show_ranking_score_details", show_ranking_score_details},
            {"ranking_score_threshold", ranking_score_threshold},
        }},
    };
}

template class SimilarAggregator<SimilarGET>;
template class SimilarAggregator<SimilarPOST>;

}  // namespace search_analytics
