/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <cstdlib>
#include <limits>

#include <toml++/toml.hpp>

namespace search_analytics {

namespace {

template <typename Node>
uint64_t read_u64(Node node, uint64_t fallback) {
    auto value = node.template value<int64_t>();
    if (!value || *value < 0) return fallback;
    return static_cast<uint64_t>(*value);
}

template <typename Node>
uint32_t read_u32(Node node, uint32_t fallback) {
    auto value = read_u64(node, fallback);
    if (value > std::numeric_limits<uint32_t>::max()) return fallback;
    return static_cast<uint32_t>(value);
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;
        config.server.config_file_path = path;

        // [server]
        if (auto server = tbl["server"]; server.is_table()) {
            auto& s = config.server;
            s.env = server["env"].value_or(s.env);
            s.db_path = server["db_path"].value_or(s.db_path.string());
            s.http_addr = server["http_addr"].value_or(s.http_addr);
            s.dump_dir = server["dump_dir"].value_or(s.dump_dir.string());
            s.snapshot_dir = server["snapshot_dir"].value_or(s.snapshot_dir.string());
            s.import_dump = server["import_dump"].value_or(s.import_dump);
            s.import_snapshot = server["import_snapshot"].value_or(s.import_snapshot);
            s.ignore_missing_dump = server["ignore_missing_dump"].value_or(s.ignore_missing_dump);
            s.ignore_dump_if_db_exists =
                server["ignore_dump_if_db_exists"].value_or(s.ignore_dump_if_db_exists);
            s.ignore_missing_snapshot =
                server["ignore_missing_snapshot"].value_or(s.ignore_missing_snapshot);
            s.ignore_snapshot_if_db_exists =
                server["ignore_snapshot_if_db_exists"].value_or(s.ignore_snapshot_if_db_exists);
            s.schedule_snapshot_s = read_u64(server["schedule_snapshot"], s.schedule_snapshot_s);
            s.http_payload_size_limit =
                read_u64(server["http_payload_size_limit"], s.http_payload_size_limit);
            s.max_indexing_memory = read_u64(server["max_indexing_memory"], s.max_indexing_memory);
            s.max_indexing_threads =
                read_u32(server["max_indexing_threads"], s.max_indexing_threads);
            s.log_level = server["log_level"].value_or(s.log_level);
            s.task_webhook_url = server["task_webhook_url"].value_or(s.task_webhook_url);
            s.task_webhook_authorization_header =
                server["task_webhook_authorization_header"].value_or(
                    s.task_webhook_authorization_header);
            s.ssl_cert_path = server["ssl_cert_path"].value_or(s.ssl_cert_path);
            s.ssl_key_path = server["ssl_key_path"].value_or(s.ssl_key_path);
            s.ssl_auth_path = server["ssl_auth_path"].value_or(s.ssl_auth_path);
            s.ssl_ocsp_path = server["ssl_ocsp_path"].value_or(s.ssl_ocsp_path);
            s.ssl_require_auth = server["ssl_require_auth"].value_or(s.ssl_require_auth);
            s.ssl_resumption = server["ssl_resumption"].value_or(s.ssl_resumption);
            s.ssl_tickets = server["ssl_tickets"].value_or(s.ssl_tickets);
            s.experimental_contains_filter =
                server["experimental_contains_filter"].value_or(s.experimental_contains_filter);
            s.experimental_enable_metrics =
                server["experimental_enable_metrics"].value_or(s.experimental_enable_metrics);
            s.experimental_enable_logs_route =
                server["experimental_enable_logs_route"].value_or(s.experimental_enable_logs_route);
            s.experimental_replication_parameters =
                server["experimental_replication_parameters"].value_or(
                    s.experimental_replication_parameters);
            s.experimental_reduce_indexing_memory_usage =
                server["experimental_reduce_indexing_memory_usage"].value_or(
                    s.experimental_reduce_indexing_memory_usage);
            s.experimental_logs_mode =
                server["experimental_logs_mode"].value_or(s.experimental_logs_mode);
            s.experimental_search_queue_size = read_u64(
                server["experimental_search_queue_size"], s.experimental_search_queue_size);
            s.experimental_max_number_of_batched_tasks =
                read_u64(server["experimental_max_number_of_batched_tasks"],
                         s.experimental_max_number_of_batched_tasks);
            s.experimental_drop_search_after_s = read_u64(
                server["experimental_drop_search_after"], s.experimental_drop_search_after_s);
            s.experimental_nb_searches_per_core = read_u64(
                server["experimental_nb_searches_per_core"], s.experimental_nb_searches_per_core);
        }

        // [analytics]
        if (auto analytics = tbl["analytics"]; analytics.is_table()) {
            auto& a = config.analytics;
            a.enabled = analytics["enabled"].value_or(a.enabled);
            a.endpoint = analytics["endpoint"].value_or(a.endpoint);
            a.flush_interval_s = read_u32(analytics["flush_interval_s"], a.flush_interval_s);
            a.mailbox_capacity = read_u32(analytics["mailbox_capacity"], a.mailbox_capacity);
            a.batch_size = read_u32(analytics["batch_size"], a.batch_size);
            a.config_dir = analytics["config_dir"].value_or(a.config_dir.string());
        }

        // [log]
        if (auto log = tbl["log"]; log.is_table()) {
            config.log.log_dir = log["log_dir"].value_or(std::string{});
            config.log.level = log["level"].value_or(config.log.level);
            config.log.max_file_size_mb =
                read_u32(log["max_file_size_mb"], config.log.max_file_size_mb);
            config.log.rotate_count = read_u32(log["rotate_count"], config.log.rotate_count);
        }

        if (config.analytics.mailbox_capacity == 0) {
            return Error{"analytics.mailbox_capacity must be greater than zero"};
        }
        if (config.analytics.flush_interval_s == 0) {
            return Error{"analytics.flush_interval_s must be greater than zero"};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

std::filesystem::path default_analytics_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path{xdg} / "SearchAnalytics";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path{home} / ".config" / "SearchAnalytics";
    }
    return {};
}

}  // namespace search_analytics
