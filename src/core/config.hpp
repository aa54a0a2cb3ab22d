/**
 * @file config.hpp
 * @brief Host and analytics configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace search_analytics {

/**
 * @brief Options of the host search server.
 *
 * Only reported in the snapshot record, and then reduced: paths, addresses
 * and keys become booleans saying whether they differ from the default.
 */
struct ServerConfig {
    std::string env = "development";
    std::filesystem::path db_path = "./data.ms";
    std::string http_addr = "localhost:7700";
    std::filesystem::path dump_dir = "dumps/";
    std::filesystem::path snapshot_dir = "snapshots/";
    std::string import_dump;
    std::string import_snapshot;
    bool ignore_missing_dump = false;
    bool ignore_dump_if_db_exists = false;
    bool ignore_missing_snapshot = false;
    bool ignore_snapshot_if_db_exists = false;
    uint64_t schedule_snapshot_s = 0;           ///< 0 = disabled
    uint64_t http_payload_size_limit = 104857600;
    uint64_t max_indexing_memory = 0;           ///< 0 = automatic
    uint32_t max_indexing_threads = 0;          ///< 0 = automatic
    std::string log_level = "info";
    std::string task_webhook_url;
    std::string task_webhook_authorization_header;
    std::string ssl_cert_path;
    std::string ssl_key_path;
    std::string ssl_auth_path;
    std::string ssl_ocsp_path;
    bool ssl_require_auth = false;
    bool ssl_resumption = false;
    bool ssl_tickets = false;
    bool experimental_contains_filter = false;
    bool experimental_enable_metrics = false;
    bool experimental_enable_logs_route = false;
    bool experimental_replication_parameters = false;
    bool experimental_reduce_indexing_memory_usage = false;
    std::string experimental_logs_mode = "human";
    uint64_t experimental_search_queue_size = 1000;
    uint64_t experimental_drop_search_after_s = 60;
    uint64_t experimental_nb_searches_per_core = 4;
    uint64_t experimental_max_number_of_batched_tasks = 0;  ///< 0 = unlimited
    std::filesystem::path config_file_path;     ///< set by the loader
};

struct AnalyticsConfig {
    bool enabled = true;
    std::string endpoint = "stdout";            ///< "stdout" or an output directory
    uint32_t flush_interval_s = 3600;
    uint32_t mailbox_capacity = 100;
    uint32_t batch_size = 100;
    std::filesystem::path config_dir;           ///< empty = $HOME/.config/SearchAnalytics
};

struct LogConfig {
    std::filesystem::path log_dir;              ///< empty = stdout
    std::string level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    ServerConfig server;
    AnalyticsConfig analytics;
    LogConfig log;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Secondary directory for the instance uid, honouring $HOME.
 */
std::filesystem::path default_analytics_config_dir();

}  // namespace search_analytics
