/**
 * @file statistics.hpp
 * @brief Summary statistics shared by the concrete aggregators.
 *
 * Counters saturate, frequency tables merge key-wise, and latency samples
 * are sorted on demand once per flush to pick a nearest-rank percentile.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace search_analytics {

// ─────────────────────────────────────────────
// Saturating arithmetic
// ─────────────────────────────────────────────

[[nodiscard]] constexpr Count saturating_add(Count a, Count b) noexcept {
    return (a > std::numeric_limits<Count>::max() - b)
        ? std::numeric_limits<Count>::max()
        : a + b;
}

[[nodiscard]] constexpr Count saturating_sub(Count a, Count b) noexcept {
    return a > b ? a - b : 0;
}

// ─────────────────────────────────────────────
// Frequency tables
// ─────────────────────────────────────────────

/// Observed variant name → number of occurrences.
using FrequencyTable = std::map<std::string, Count>;

/// Add @p n occurrences of @p key, saturating.
void bump(FrequencyTable& table, const std::string& key, Count n = 1);

/// Key-wise saturating addition of @p src into @p dst.
void merge_into(FrequencyTable& dst, const FrequencyTable& src);

/**
 * @brief The key with the highest count.
 *
 * Ties resolve to the smallest key so the answer does not depend on the
 * order in which tables were merged. Empty table → nullopt.
 */
[[nodiscard]] std::optional<std::string> most_used(const FrequencyTable& table);

// ─────────────────────────────────────────────
// Percentiles
// ─────────────────────────────────────────────

/// Unsorted latency samples in milliseconds.
using SampleSet = std::vector<uint64_t>;

/// Append every sample of @p src to @p dst.
void append_samples(SampleSet& dst, SampleSet&& src);

/**
 * @brief Nearest-rank percentile, not interpolated.
 *
 * Sorts the samples and returns the one at index floor(len * pct / 100).
 * The samples are consumed. Returns nullopt for an empty set or when the
 * index falls outside it (pct >= 100 on small sets).
 */
[[nodiscard]] std::optional<uint64_t> percentile_nearest_rank(SampleSet&& samples,
                                                              unsigned pct);

// ─────────────────────────────────────────────
// Ratios
// ─────────────────────────────────────────────

/**
 * @brief numerator / denominator with two decimals.
 *
 * A zero denominator yields "NaN"; the degenerate case is reported, not
 * guarded against.
 */
[[nodiscard]] std::string format_ratio(Count numerator, Count denominator);

}  // namespace search_analytics
