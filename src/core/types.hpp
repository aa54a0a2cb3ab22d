/**
 * @file types.hpp
 * @brief Vocabulary types shared by the analytics subsystem.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <set>
#include <string>

namespace search_analytics {

// ─────────────────────────────────────────────
// Identity and Time
// ─────────────────────────────────────────────

using InstanceUid = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Caller-identifying labels (client names, user agents) seen for an event.
using SourceSet = std::set<std::string>;

/// Counts are unsigned and saturate instead of wrapping.
using Count = uint64_t;

// ─────────────────────────────────────────────
// Fixed identities
// ─────────────────────────────────────────────

/// Shared user under which every first launch is counted.
inline constexpr const char* kTotalLaunchUser = "total_launch";

/// Event pushed when an instance starts for the first time.
inline constexpr const char* kLaunchedEvent = "Launched";

/// Request header carrying the client label, preferred over User-Agent.
inline constexpr const char* kAnalyticsHeader = "X-Search-Client";

/// Fallback request header for the client label.
inline constexpr const char* kUserAgentHeader = "User-Agent";

}  // namespace search_analytics
