/**
 * @file query.cpp
 * @brief Filter and query-string inspection.
 */

#include "analytics/query.hpp"

#include <iterator>
#include <regex>
#include <sstream>

namespace search_analytics {

namespace {

const std::regex& operator_pattern() {
    static const std::regex pattern{"AND | OR"};
    return pattern;
}

}  // namespace

FilterAnalysis analyze_filter(const nlohmann::json& filter) {
    FilterAnalysis analysis;

    if (filter.is_string()) {
        analysis.syntax = "string";
    } else if (filter.is_array()) {
        bool mixed = false;
        for (const auto& element : filter) {
            if (std::regex_search(element.dump(), operator_pattern())) {
                mixed = true;
                break;
            }
        }
        analysis.syntax = mixed ? "mixed" : "array";
    } else {
        analysis.syntax = "none";
    }

    auto stringified = filter.dump();
    analysis.with_geo_radius = stringified.find("_geoRadius(") != std::string::npos;
    analysis.with_geo_bounding_box = stringified.find("_geoBoundingBox(") != std::string::npos;

    // n operators split the expression into n + 1 criteria
    auto operators = std::distance(
        std::sregex_iterator(stringified.begin(), stringified.end(), operator_pattern()),
        std::sregex_iterator());
    analysis.criteria_terms = static_cast<Count>(operators) + 1;

    return analysis;
}

Count count_terms(std::string_view q) {
    std::istringstream iss{std::string{q}};
    Count terms = 0;
    std::string word;
    while (iss >> word) ++terms;
    return terms;
}

}  // namespace search_analytics
