/**
 * @file snapshot.cpp
 * @brief Host fact collection and snapshot record assembly.
 */

#include "analytics/snapshot.hpp"

#include <sys/statvfs.h>
#include <sys/utsname.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

namespace search_analytics {

namespace {

std::vector<std::string> read_file_lines(const std::string& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

/**
 * @brief NAME from /etc/os-release, with surrounding quotes removed.
 */
std::optional<std::string> read_distribution() {
    for (const auto& line : read_file_lines("/etc/os-release")) {
        if (!line.starts_with("NAME=")) continue;
        auto value = line.substr(5);
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')) {
            value = value.substr(1, value.size() - 2);
        }
        if (value.empty()) return std::nullopt;
        return value;
    }
    return std::nullopt;
}

/**
 * @brief Kernel release up to the first '-', e.g. "6.1.0-13-amd64" → "6.1.0".
 */
std::optional<std::string> read_kernel_version() {
    struct utsname uts{};
    if (uname(&uts) != 0) return std::nullopt;
    std::string release = uts.release;
    auto dash = release.find('-');
    if (dash == std::string::npos) return std::nullopt;
    return release.substr(0, dash);
}

uint64_t read_total_memory() {
    for (const auto& line : read_file_lines("/proc/meminfo")) {
        if (line.starts_with("MemTotal:")) {
            uint64_t total_kb = 0;
            std::istringstream iss(line.substr(9));
            iss >> total_kb;
            return total_kb * 1024;
        }
    }
    return 0;
}

std::optional<uint64_t> disk_total(const std::filesystem::path& path) {
    struct statvfs vfs{};
    if (statvfs(path.c_str(), &vfs) != 0) return std::nullopt;
    return static_cast<uint64_t>(vfs.f_blocks) * static_cast<uint64_t>(vfs.f_frsize);
}

}  // namespace

// ── SystemInfo ───────────────────────────────

SystemInfo collect_system_info(const std::filesystem::path& data_dir) {
    SystemInfo info;
    info.distribution = read_distribution();
    info.kernel_version = read_kernel_version();
    info.cores = std::thread::hardware_concurrency();
    info.ram_size = read_total_memory();

    for (const auto& path : {data_dir, std::filesystem::path{"/"}}) {
        if (auto size = disk_total(path)) {
            info.disk_size = std::max(info.disk_size.value_or(0), *size);
        }
    }

    if (const char* provider = std::getenv(kServerProviderEnv)) {
        info.server_provider = provider;
    }
    return info;
}

nlohmann::json SystemInfo::to_json() const {
    auto opt = [](const auto& value) -> nlohmann::json {
        if (value) return *value;
        return nullptr;
    };
    return nlohmann::json{
        {"distribution", opt(distribution)},
        {"kernel_version", opt(kernel_version)},
        {"cores", cores},
        {"ram_size", ram_size},
        {"disk_size", opt(disk_size)},
        {"server_provider", opt(server_provider)},
    };
}

// ── Infos ────────────────────────────────────

Infos Infos::from(const ServerConfig& server, const RuntimeFeatures& features) {
    const ServerConfig defaults;

    Infos infos;
    infos.env = server.env;
    infos.experimental_contains_filter =
        server.experimental_contains_filter || features.contains_filter;
    infos.experimental_vector_store = features.vector_store;
    infos.experimental_enable_metrics = server.experimental_enable_metrics || features.metrics;
    infos.experimental_edit_documents_by_function = features.edit_documents_by_function;
    infos.experimental_search_queue_size = server.experimental_search_queue_size;
    infos.experimental_drop_search_after = server.experimental_drop_search_after_s;
    infos.experimental_nb_searches_per_core = server.experimental_nb_searches_per_core;
    infos.experimental_logs_mode = server.experimental_logs_mode;
    infos.experimental_replication_parameters = server.experimental_replication_parameters;
    infos.experimental_enable_logs_route =
        server.experimental_enable_logs_route || features.logs_route;
    infos.experimental_reduce_indexing_memory_usage =
        server.experimental_reduce_indexing_memory_usage;
    infos.experimental_max_number_of_batched_tasks =
        server.experimental_max_number_of_batched_tasks;
    infos.gpu_enabled = features.gpu;
    infos.db_path = server.db_path != defaults.db_path;
    infos.import_dump = !server.import_dump.empty();
    infos.dump_dir = server.dump_dir != defaults.dump_dir;
    infos.ignore_missing_dump = server.ignore_missing_dump;
    infos.ignore_dump_if_db_exists = server.ignore_dump_if_db_exists;
    infos.import_snapshot = !server.import_snapshot.empty();
    if (server.schedule_snapshot_s != 0) {
        infos.schedule_snapshot = server.schedule_snapshot_s;
    }
    infos.snapshot_dir = server.snapshot_dir != defaults.snapshot_dir;
    infos.ignore_missing_snapshot = server.ignore_missing_snapshot;
    infos.ignore_snapshot_if_db_exists = server.ignore_snapshot_if_db_exists;
    infos.http_addr = server.http_addr != defaults.http_addr;
    infos.http_payload_size_limit = server.http_payload_size_limit;
    infos.task_queue_webhook = !server.task_webhook_url.empty();
    infos.task_webhook_authorization_header = !server.task_webhook_authorization_header.empty();
    infos.log_level = server.log_level;
    infos.max_indexing_memory = server.max_indexing_memory;
    infos.max_indexing_threads = server.max_indexing_threads;
    infos.with_configuration_file = !server.config_file_path.empty();
    infos.ssl_auth_path = !server.ssl_auth_path.empty();
    infos.ssl_cert_path = !server.ssl_cert_path.empty();
    infos.ssl_key_path = !server.ssl_key_path.empty();
    infos.ssl_ocsp_path = !server.ssl_ocsp_path.empty();
    infos.ssl_require_auth = server.ssl_require_auth;
    infos.ssl_resumption = server.ssl_resumption;
    infos.ssl_tickets = server.ssl_tickets;
    return infos;
}

nlohmann::json Infos::to_json() const {
    return nlohmann::json{
        {"env", env},
        {"experimental_contains_filter", experimental_contains_filter},
        {"experimental_vector_store", experimental_vector_store},
        {"experimental_enable_metrics", experimental_enable_metrics},
        {"experimental_edit_documents_by_function", experimental_edit_documents_by_function},
        {"experimental_search_queue_size", experimental_search_queue_size},
        {"experimental_drop_search_after", experimental_drop_search_after},
        {"experimental_nb_searches_per_core", experimental_nb_searches_per_core},
        {"experimental_logs_mode", experimental_logs_mode},
        {"experimental_replication_parameters", experimental_replication_parameters},
        {"experimental_enable_logs_route", experimental_enable_logs_route},
        {"experimental_reduce_indexing_memory_usage", experimental_reduce_indexing_memory_usage},
        {"experimental_max_number_of_batched_tasks", experimental_max_number_of_batched_tasks},
        {"gpu_enabled", gpu_enabled},
        {"db_path", db_path},
        {"import_dump", import_dump},
        {"dump_dir", dump_dir},
        {"ignore_missing_dump", ignore_missing_dump},
        {"ignore_dump_if_db_exists", ignore_dump_if_db_exists},
        {"import_snapshot", import_snapshot},
        {"schedule_snapshot",
         schedule_snapshot ? nlohmann::json(*schedule_snapshot) : nlohmann::json(nullptr)},
        {"snapshot_dir", snapshot_dir},
        {"ignore_missing_snapshot", ignore_missing_snapshot},
        {"ignore_snapshot_if_db_exists", ignore_snapshot_if_db_exists},
        {"http_addr", http_addr},
        {"http_payload_size_limit", http_payload_size_limit},
        {"task_queue_webhook", task_queue_webhook},
        {"task_webhook_authorization_header", task_webhook_authorization_header},
        {"log_level", log_level},
        {"max_indexing_memory", max_indexing_memory},
        {"max_indexing_threads", max_indexing_threads},
        {"with_configuration_file", with_configuration_file},
        {"ssl_auth_path", ssl_auth_path},
        {"ssl_cert_path", ssl_cert_path},
        {"ssl_key_path", ssl_key_path},
        {"ssl_ocsp_path", ssl_ocsp_path},
        {"ssl_require_auth", ssl_require_auth},
        {"ssl_resumption", ssl_resumption},
        {"ssl_tickets", ssl_tickets},
    };
}

// ── SnapshotProvider ─────────────────────────

SnapshotProvider::SnapshotProvider(ServerConfig server, IStatsSource& stats, SystemInfo system,
                                   SteadyTime started_at)
    : server_(std::move(server))
    , stats_(stats)
    , system_(std::move(system))
    , started_at_(started_at) {}

std::optional<Record> SnapshotProvider::identify(const InstanceUid& user_id, SteadyTime now) {
    auto stats = stats_.collect();
    if (!stats) return std::nullopt;

    using Days = std::chrono::duration<int64_t, std::ratio<86400>>;
    auto start_since_days = std::chrono::duration_cast<Days>(now - started_at_).count();

    nlohmann::json traits = {
        {"start_since_days", start_since_days},
        {"system", system_.to_json()},
        {"stats", {
            {"database_size", stats->database_size},
            {"indexes_number", stats->documents_per_index.size()},
            {"documents_number", stats->documents_per_index},
        }},
        {"infos", Infos::from(server_, stats->features).to_json()},
    };

    return Record{
        .type = RecordType::Identify,
        .user_id = user_id,
        .event = {},
        .properties = std::move(traits),
        .context = {{"app", {{"version", kAppVersion}}}},
        .timestamp = std::nullopt,
    };
}

}  // namespace search_analytics
