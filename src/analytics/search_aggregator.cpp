/**
 * @file search_aggregator.cpp
 * @brief SearchAggregator construction, merge and export.
 */

#include "analytics/search_aggregator.hpp"

#include <algorithm>

namespace search_analytics {

template <AggregateMethod Method>
SearchAggregator<Method> SearchAggregator<Method>::from_query(const SearchQuery& query) {
    SearchAggregator ret;
    ret.total_received = 1;

    if (query.sort) {
        ret.sort_total_number_of_criteria = 1;
        ret.sort_with_geo_point = std::any_of(
            query.sort->begin(), query.sort->end(),
            [](const std::string& s) { return s.find("_geoPoint(") != std::string::npos; });
        ret.sort_sum_of_criteria_terms = query.sort->size();
    }

    ret.distinct = query.distinct.has_value();

    if (query.filter) {
        auto analysis = analyze_filter(*query.filter);
        ret.filter_total_number_of_criteria = 1;
        bump(ret.used_syntax, analysis.syntax);
        ret.filter_with_geo_radius = analysis.with_geo_radius;
        ret.filter_with_geo_bounding_box = analysis.with_geo_bounding_box;
        ret.filter_sum_of_criteria_terms = analysis.criteria_terms;
    }

    if (query.attributes_to_search_on) {
        ret.attributes_to_search_on_total_number_of_uses = 1;
    }

    if (query.q) {
        ret.max_terms_number = count_terms(*query.q);
    }

    if (query.vector) {
        ret.max_vector_size = query.vector->size();
    }
    ret.retrieve_vectors = query.retrieve_vectors;

    if (query.is_finite_pagination()) {
        Count limit = query.hits_per_page.value_or(kDefaultSearchLimit);
        ret.max_limit = limit;
        ret.max_offset = saturating_sub(query.page.value_or(1), 1) * limit;
        ret.finite_pagination = 1;
    } else {
        ret.max_limit = query.limit;
        ret.max_offset = query.offset;
        ret.finite_pagination = 0;
    }

    bump(ret.matching_strategy, std::string{to_string(query.matching_strategy)});

    if (query.locales) {
        ret.locales.insert(query.locales->begin(), query.locales->end());
    }

    if (query.attributes_to_retrieve) {
        ret.max_attributes_to_retrieve = query.attributes_to_retrieve->size();
    }
    if (query.attributes_to_highlight) {
        ret.max_attributes_to_highlight = query.attributes_to_highlight->size();
    }
    if (query.attributes_to_crop) {
        ret.max_attributes_to_crop = query.attributes_to_crop->size();
    }
    ret.highlight_pre_tag = query.highlight_pre_tag != kDefaultHighlightPreTag;
    ret.highlight_post_tag = query.highlight_post_tag != kDefaultHighlightPostTag;
    ret.crop_marker = query.crop_marker != kDefaultCropMarker;
    ret.crop_length = query.crop_length != kDefaultCropLength;
    ret.show_matches_position = query.show_matches_position;

    if (query.facets) {
        ret.facets_sum_of_terms = query.facets->size();
        ret.facets_total_number_of_facets = 1;
    }

    ret.show_ranking_score = query.show_ranking_score;
    ret.show_ranking_score_details = query.show_ranking_score_details;
    ret.ranking_score_threshold = query.ranking_score_threshold.has_value();

    if (query.hybrid) {
        ret.semantic_ratio = query.hybrid->semantic_ratio != kDefaultSemanticRatio;
        ret.hybrid = true;
    }

    return ret;
}

template <AggregateMethod Method>
void SearchAggregator<Method>::succeed(const SearchResult& result) {
    total_succeeded = saturating_add(total_succeeded, 1);
    if (result.degraded) {
        total_degraded = saturating_add(total_degraded, 1);
    }
    if (result.used_negative_operator) {
        total_used_negative_operator = saturating_add(total_used_negative_operator, 1);
    }
    time_spent.push_back(result.processing_time_ms);
}

template <AggregateMethod Method>
SearchAggregator<Method> SearchAggregator<Method>::merge(SearchAggregator lhs,
                                                         SearchAggregator rhs) {
    // requests
    lhs.total_received = saturating_add(lhs.total_received, rhs.total_received);
    lhs.total_succeeded = saturating_add(lhs.total_succeeded, rhs.total_succeeded);
    lhs.total_degraded = saturating_add(lhs.total_degraded, rhs.total_degraded);
    lhs.total_used_negative_operator =
        saturating_add(lhs.total_used_negative_operator, rhs.total_used_negative_operator);
    append_samples(lhs.time_spent, std::move(rhs.time_spent));

    // sort
    lhs.sort_with_geo_point |= rhs.sort_with_geo_point;
    lhs.sort_sum_of_criteria_terms =
        saturating_add(lhs.sort_sum_of_criteria_terms, rhs.sort_sum_of_criteria_terms);
    lhs.sort_total_number_of_criteria =
        saturating_add(lhs.sort_total_number_of_criteria, rhs.sort_total_number_of_criteria);

    // distinct
    lhs.distinct |= rhs.distinct;

    // filter
    lhs.filter_with_geo_radius |= rhs.filter_with_geo_radius;
    lhs.filter_with_geo_bounding_box |= rhs.filter_with_geo_bounding_box;
    lhs.filter_sum_of_criteria_terms =
        saturating_add(lhs.filter_sum_of_criteria_terms, rhs.filter_sum_of_criteria_terms);
    lhs.filter_total_number_of_criteria =
        saturating_add(lhs.filter_total_number_of_criteria, rhs.filter_total_number_of_criteria);
    merge_into(lhs.used_syntax, rhs.used_syntax);

    // attributes_to_search_on
    lhs.attributes_to_search_on_total_number_of_uses =
        saturating_add(lhs.attributes_to_search_on_total_number_of_uses,
                       rhs.attributes_to_search_on_total_number_of_uses);

    // q
    lhs.max_terms_number = std::max(lhs.max_terms_number, rhs.max_terms_number);

    // vector
    lhs.max_vector_size = std::max(lhs.max_vector_size, rhs.max_vector_size);
    lhs.retrieve_vectors |= rhs.retrieve_vectors;

    // hybrid
    lhs.semantic_ratio |= rhs.semantic_ratio;
    lhs.hybrid |= rhs.hybrid;

    merge_into(lhs.matching_strategy, rhs.matching_strategy);
    lhs.locales.merge(rhs.locales);

    // pagination
    lhs.max_limit = std::max(lhs.max_limit, rhs.max_limit);
    lhs.max_offset = std::max(lhs.max_offset, rhs.max_offset);
    lhs.finite_pagination = saturating_add(lhs.finite_pagination, rhs.finite_pagination);

    // formatting
    lhs.max_attributes_to_retrieve =
        std::max(lhs.max_attributes_to_retrieve, rhs.max_attributes_to_retrieve);
    lhs.max_attributes_to_highlight =
        std::max(lhs.max_attributes_to_highlight, rhs.max_attributes_to_highlight);
    lhs.highlight_pre_tag |= rhs.highlight_pre_tag;
    lhs.highlight_post_tag |= rhs.highlight_post_tag;
    lhs.max_attributes_to_crop = std::max(lhs.max_attributes_to_crop, rhs.max_attributes_to_crop);
    lhs.crop_marker |= rhs.crop_marker;
    lhs.show_matches_position |= rhs.show_matches_position;
    lhs.crop_length |= rhs.crop_length;

    // facets
    lhs.facets_sum_of_terms = saturating_add(lhs.facets_sum_of_terms, rhs.facets_sum_of_terms);
    lhs.facets_total_number_of_facets =
        saturating_add(lhs.facets_total_number_of_facets, rhs.facets_total_number_of_facets);

    // scoring
    lhs.show_ranking_score |= rhs.show_ranking_score;
    lhs.show_ranking_score_details |= rhs.show_ranking_score_details;
    lhs.ranking_score_threshold |= rhs.ranking_score_threshold;

    return lhs;
}

template <AggregateMethod Method>
nlohmann::json SearchAggregator<Method>::into_event() && {
    using nlohmann::json;

    auto p99 = percentile_nearest_rank(std::move(time_spent), 99);
    auto syntax = most_used(used_syntax);
    auto strategy = most_used(matching_strategy);

    return json{
        {"requests", {
            {"99th_response_time", p99 ? json(std::to_string(*p99)) : json(nullptr)},
            {"total_succeeded", total_succeeded},
            {"total_failed", saturating_sub(total_received, total_succeeded)},
            {"total_received", total_received},
            {"total_degraded", total_degraded},
            {"total_used_negative_operator", total_used_negative_operator},
        }},
        {"sort", {
            {"with_geoPoint", sort_with_geo_point},
            {"avg_criteria_number",
             format_ratio(sort_sum_of_criteria_terms, sort_total_number_of_criteria)},
        }},
        {"distinct", distinct},
        {"filter", {
            {"with_geoRadius", filter_with_geo_radius},
            {"with_geoBoundingBox", filter_with_geo_bounding_box},
            {"avg_criteria_number",
             format_ratio(filter_sum_of_criteria_terms, filter_total_number_of_criteria)},
            {"most_used_syntax", syntax ? json(*syntax) : json(nullptr)},
        }},
        {"attributes_to_search_on", {
            {"total_number_of_uses", attributes_to_search_on_total_number_of_uses},
        }},
        {"q", {
            {"max_terms_number", max_terms_number},
        }},
        {"vector", {
            {"max_vector_size", max_vector_size},
            {"retrieve_vectors", retrieve_vectors},
        }},
        {"hybrid", {
            {"enabled", hybrid},
            {"semantic_ratio", semantic_ratio},
        }},
        {"pagination", {
            {"max_limit", max_limit},
            {"max_offset", max_offset},
            {"most_used_navigation",
             finite_pagination > total_received / 2 ? "exhaustive" : "estimated"},
        }},
        {"formatting", {
            {"max_attributes_to_retrieve", max_attributes_to_retrieve},
            {"max_attributes_to_highlight", max_attributes_to_highlight},
            {"highlight_pre_tag", highlight_pre_tag},
            {"highlight_post_tag", highlight_post_tag},
            {"max_attributes_to_crop", max_attributes_to_crop},
            {"crop_marker", crop_marker},
            {"show_matches_position", show_matches_position},
            {"crop_length", crop_length},
        }},
        {"facets", {
            {"avg_facets_number", format_ratio(facets_sum_of_terms, facets_total_number_of_facets)},
        }},
        {"matching_strategy", {
            {"most_used_strategy", strategy ? json(*strategy) : json(nullptr)},
        }},
        {"locales", locales},
        {"scoring", {
            {"show_ranking_score", show_ranking_score},
            {"show_ranking_score_details", show_ranking_score_details},
            {"ranking_score_threshold", ranking_score_threshold},
        }},
    };
}

template class SearchAggregator<SearchGET>;
template class SearchAggregator<SearchPOST>;

}  // namespace search_analytics
