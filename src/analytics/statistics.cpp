/**
 * @file statistics.cpp
 * @brief Frequency, percentile and ratio helpers.
 */

#include "analytics/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>

namespace search_analytics {

void bump(FrequencyTable& table, const std::string& key, Count n) {
    auto& slot = table[key];
    slot = saturating_add(slot, n);
}

void merge_into(FrequencyTable& dst, const FrequencyTable& src) {
    for (const auto& [key, count] : src) {
        bump(dst, key, count);
    }
}

std::optional<std::string> most_used(const FrequencyTable& table) {
    auto best = table.end();
    for (auto it = table.begin(); it != table.end(); ++it) {
        // strict > keeps the first (smallest) key among equal counts
        if (best == table.end() || it->second > best->second) {
            best = it;
        }
    }
    if (best == table.end()) return std::nullopt;
    return best->first;
}

void append_samples(SampleSet& dst, SampleSet&& src) {
    if (dst.empty()) {
        dst = std::move(src);
        return;
    }
    dst.reserve(dst.size() + src.size());
    std::move(src.begin(), src.end(), std::back_inserter(dst));
    src.clear();
}

std::optional<uint64_t> percentile_nearest_rank(SampleSet&& samples, unsigned pct) {
    SampleSet sorted = std::move(samples);
    samples.clear();
    if (sorted.empty()) return std::nullopt;

    std::sort(sorted.begin(), sorted.end());
    size_t rank = sorted.size() * pct / 100;
    if (rank >= sorted.size()) return std::nullopt;
    return sorted[rank];
}

std::string format_ratio(Count numerator, Count denominator) {
    double ratio = static_cast<double>(numerator) / static_cast<double>(denominator);
    if (std::isnan(ratio)) return "NaN";
    if (std::isinf(ratio)) return "inf";
    return std::format("{:.2f}", ratio);
}

}  // namespace search_analytics
