/**
 * @file snapshot.hpp
 * @brief Per-flush instance snapshot: host facts, instance stats, options.
 */

#pragma once

#include "analytics/aggregate.hpp"
#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#ifndef SEARCH_ANALYTICS_VERSION
#define SEARCH_ANALYTICS_VERSION "0.0.0"
#endif

namespace search_analytics {

inline constexpr const char* kAppVersion = SEARCH_ANALYTICS_VERSION;

/// Environment variable naming the hosting provider.
inline constexpr const char* kServerProviderEnv = "SEARCH_SERVER_PROVIDER";

// ─────────────────────────────────────────────
// Host facts
// ─────────────────────────────────────────────

/**
 * @brief Hardware and OS facts; they do not change while the process runs.
 *
 * Data sources:
 *   /etc/os-release: distribution name
 *   uname(2): kernel release
 *   /proc/meminfo: total RAM
 *   statvfs(3): size of the largest disk among the data dir and /
 */
struct SystemInfo {
    std::optional<std::string> distribution;
    std::optional<std::string> kernel_version;
    uint32_t cores{0};
    uint64_t ram_size{0};                  ///< bytes
    std::optional<uint64_t> disk_size;     ///< bytes
    std::optional<std::string> server_provider;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Read the host facts once.
 */
[[nodiscard]] SystemInfo collect_system_info(const std::filesystem::path& data_dir);

// ─────────────────────────────────────────────
// Instance statistics
// ─────────────────────────────────────────────

/// Experimental features toggled at runtime.
struct RuntimeFeatures {
    bool vector_store{false};
    bool metrics{false};
    bool logs_route{false};
    bool edit_documents_by_function{false};
    bool contains_filter{false};
    bool gpu{false};                ///< embedders run on a GPU
};

struct InstanceStats {
    uint64_t database_size{0};
    std::vector<uint64_t> documents_per_index;
    RuntimeFeatures features;
};

/**
 * @brief Supplies fresh instance statistics; implemented by the host.
 */
class IStatsSource {
public:
    virtual ~IStatsSource() = default;

    virtual Result<InstanceStats> collect() = 0;
};

// ─────────────────────────────────────────────
// Options
// ─────────────────────────────────────────────

/**
 * @brief Host options as reported.
 *
 * Anything holding a path, an address or a key is reduced to a boolean.
 * Field names are part of the wire format.
 */
struct Infos {
    std::string env;
    bool experimental_contains_filter{false};
    bool experimental_vector_store{false};
    bool experimental_enable_metrics{false};
    bool experimental_edit_documents_by_function{false};
    uint64_t experimental_search_queue_size{0};
    uint64_t experimental_drop_search_after{0};
    uint64_t experimental_nb_searches_per_core{0};
    std::string experimental_logs_mode;
    bool experimental_replication_parameters{false};
    bool experimental_enable_logs_route{false};
    bool experimental_reduce_indexing_memory_usage{false};
    uint64_t experimental_max_number_of_batched_tasks{0};
    bool gpu_enabled{false};
    bool db_path{false};
    bool import_dump{false};
    bool dump_dir{false};
    bool ignore_missing_dump{false};
    bool ignore_dump_if_db_exists{false};
    bool import_snapshot{false};
    std::optional<uint64_t> schedule_snapshot;
    bool snapshot_dir{false};
    bool ignore_missing_snapshot{false};
    bool ignore_snapshot_if_db_exists{false};
    bool http_addr{false};
    uint64_t http_payload_size_limit{0};
    bool task_queue_webhook{false};
    bool task_webhook_authorization_header{false};
    std::string log_level;
    uint64_t max_indexing_memory{0};
    uint32_t max_indexing_threads{0};
    bool with_configuration_file{false};
    bool ssl_auth_path{false};
    bool ssl_cert_path{false};
    bool ssl_key_path{false};
    bool ssl_ocsp_path{false};
    bool ssl_require_auth{false};
    bool ssl_resumption{false};
    bool ssl_tickets{false};

    [[nodiscard]] static Infos from(const ServerConfig& server, const RuntimeFeatures& features);
    [[nodiscard]] nlohmann::json to_json() const;
};

// ─────────────────────────────────────────────
// SnapshotProvider
// ─────────────────────────────────────────────

/**
 * @brief Builds the Identify record pushed ahead of every flush.
 *
 * Host facts and the start time are captured at construction; instance
 * statistics are pulled from the stats source on every call.
 */
class SnapshotProvider {
public:
    SnapshotProvider(ServerConfig server, IStatsSource& stats, SystemInfo system,
                     SteadyTime started_at = std::chrono::steady_clock::now());

    /**
     * @brief Snapshot for @p user_id, or nullopt if statistics are unavailable.
     */
    [[nodiscard]] std::optional<Record> identify(const InstanceUid& user_id,
                                                 SteadyTime now = std::chrono::steady_clock::now());

    [[nodiscard]] const SystemInfo& system() const noexcept { return system_; }

private:
    ServerConfig server_;
    IStatsSource& stats_;
    SystemInfo system_;
    SteadyTime started_at_;
};

}  // namespace search_analytics
