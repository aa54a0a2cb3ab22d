/**
 * @file query.hpp
 * @brief Request and response shapes the concrete aggregators are built from.
 *
 * The HTTP layer that decodes requests is outside this library; it fills
 * these structs and hands them to from_query()/succeed().
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace search_analytics {

// ─────────────────────────────────────────────
// Defaults of the search route
// ─────────────────────────────────────────────

inline constexpr uint64_t kDefaultSearchLimit = 20;
inline constexpr uint64_t kDefaultSearchOffset = 0;
inline constexpr uint64_t kDefaultCropLength = 10;
inline constexpr std::string_view kDefaultCropMarker = "…";
inline constexpr std::string_view kDefaultHighlightPreTag = "<em>";
inline constexpr std::string_view kDefaultHighlightPostTag = "</em>";
inline constexpr float kDefaultSemanticRatio = 0.5f;

enum class MatchingStrategy : uint8_t {
    Last,
    All,
    Frequency
};

[[nodiscard]] constexpr std::string_view to_string(MatchingStrategy strategy) noexcept {
    switch (strategy) {
        case MatchingStrategy::Last:      return "Last";
        case MatchingStrategy::All:       return "All";
        case MatchingStrategy::Frequency: return "Frequency";
    }
    return "unknown";
}

struct HybridQuery {
    float semantic_ratio{kDefaultSemanticRatio};
    std::string embedder;
};

// ─────────────────────────────────────────────
// Search
// ─────────────────────────────────────────────

struct SearchQuery {
    std::optional<std::string> q;
    std::optional<std::vector<float>> vector;
    uint64_t offset{kDefaultSearchOffset};
    uint64_t limit{kDefaultSearchLimit};
    std::optional<uint64_t> page;
    std::optional<uint64_t> hits_per_page;
    std::optional<std::vector<std::string>> attributes_to_retrieve;
    bool retrieve_vectors{false};
    std::optional<std::vector<std::string>> attributes_to_crop;
    uint64_t crop_length{kDefaultCropLength};
    std::optional<std::vector<std::string>> attributes_to_highlight;
    bool show_matches_position{false};
    bool show_ranking_score{false};
    bool show_ranking_score_details{false};
    std::optional<nlohmann::json> filter;
    std::optional<std::vector<std::string>> sort;
    std::optional<std::string> distinct;
    std::optional<std::vector<std::string>> facets;
    std::string highlight_pre_tag{kDefaultHighlightPreTag};
    std::string highlight_post_tag{kDefaultHighlightPostTag};
    std::string crop_marker{kDefaultCropMarker};
    MatchingStrategy matching_strategy{MatchingStrategy::Last};
    std::optional<std::vector<std::string>> attributes_to_search_on;
    std::optional<HybridQuery> hybrid;
    std::optional<double> ranking_score_threshold;
    std::optional<std::vector<std::string>> locales;

    /// page or hits_per_page switches the route to exhaustive pagination.
    [[nodiscard]] bool is_finite_pagination() const noexcept {
        return page.has_value() || hits_per_page.has_value();
    }
};

struct SearchResult {
    uint64_t processing_time_ms{0};
    bool degraded{false};
    bool used_negative_operator{false};
};

// ─────────────────────────────────────────────
// Multi-search
// ─────────────────────────────────────────────

struct SearchQueryWithIndex {
    std::string index_uid;
    bool show_ranking_score{false};
    bool show_ranking_score_details{false};
};

struct FederatedSearch {
    std::vector<SearchQueryWithIndex> queries;
    bool federation{false};
};

// ─────────────────────────────────────────────
// Similar documents
// ─────────────────────────────────────────────

struct SimilarQuery {
    std::string id;
    std::string embedder;
    uint64_t offset{kDefaultSearchOffset};
    uint64_t limit{kDefaultSearchLimit};
    std::optional<std::vector<std::string>> attributes_to_retrieve;
    bool retrieve_vectors{false};
    bool show_ranking_score{false};
    bool show_ranking_score_details{false};
    std::optional<nlohmann::json> filter;
    std::optional<double> ranking_score_threshold;
};

struct SimilarResult {
    uint64_t processing_time_ms{0};
};

// ─────────────────────────────────────────────
// Filter analysis
// ─────────────────────────────────────────────

/**
 * @brief What a filter expression tells us about the caller.
 *
 * syntax is "string" for a string filter, "mixed" for an array with at
 * least one element containing an AND/OR operator, "array" for any other
 * array and "none" for anything else.
 */
struct FilterAnalysis {
    std::string syntax;
    bool with_geo_radius{false};
    bool with_geo_bounding_box{false};
    Count criteria_terms{0};
};

[[nodiscard]] FilterAnalysis analyze_filter(const nlohmann::json& filter);

/// Number of whitespace-separated terms in a query string.
[[nodiscard]] Count count_terms(std::string_view q);

}  // namespace search_analytics
