/**
 * @file instance_uid.hpp
 * @brief Persistent identifier of this search instance.
 *
 * The uid lives in <db_path>/instance-uid and, as a fallback that survives
 * deleting the database, in <config_dir>/<db-path-key>-instance-uid. All I/O
 * is best effort: a uid that cannot be read is regenerated, one that cannot
 * be written is simply regenerated again on the next run.
 */

#pragma once

#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace search_analytics {

/// Canonical 8-4-4-4-12 hexadecimal form.
[[nodiscard]] bool is_valid_uuid(std::string_view text) noexcept;

/// Random version-4 UUID.
[[nodiscard]] InstanceUid generate_instance_uid();

/**
 * @brief Per-database file name inside the config directory.
 *
 * Distinct databases on the same host get distinct uids.
 */
[[nodiscard]] std::filesystem::path config_uid_path(const std::filesystem::path& db_path,
                                                    const std::filesystem::path& config_dir);

/**
 * @brief Read a previously persisted uid; nullopt on first run.
 */
[[nodiscard]] std::optional<InstanceUid> find_instance_uid(const std::filesystem::path& db_path,
                                                           const std::filesystem::path& config_dir);

/**
 * @brief Persist @p uid to both locations, ignoring every error.
 */
void write_instance_uid(const std::filesystem::path& db_path,
                        const std::filesystem::path& config_dir,
                        const InstanceUid& uid) noexcept;

}  // namespace search_analytics
