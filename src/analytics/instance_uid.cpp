/**
 * @file instance_uid.cpp
 * @brief Instance uid generation and persistence.
 */

#include "analytics/instance_uid.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace search_analytics {

namespace {

constexpr const char* kUidFileName = "instance-uid";

std::optional<InstanceUid> read_uid_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) return std::nullopt;

    std::string content;
    std::getline(ifs, content);
    auto first = content.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::nullopt;
    auto last = content.find_last_not_of(" \t\r\n");
    content = content.substr(first, last - first + 1);

    if (!is_valid_uuid(content)) return std::nullopt;
    return content;
}

void write_uid_file(const std::filesystem::path& path, const InstanceUid& uid) noexcept {
    try {
        std::ofstream ofs(path, std::ios::trunc);
        if (ofs.is_open()) ofs << uid;
    } catch (const std::exception&) {
        // best effort
    }
}

}  // namespace

bool is_valid_uuid(std::string_view text) noexcept {
    if (text.size() != 36) return false;
    for (size_t i = 0; i < text.size(); ++i) {
        bool dash_slot = i == 8 || i == 13 || i == 18 || i == 23;
        if (dash_slot) {
            if (text[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

InstanceUid generate_instance_uid() {
    std::random_device rd;
    std::mt19937_64 rng(
        (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd()));
    std::uniform_int_distribution<uint32_t> byte_dist(0, 255);

    std::array<uint8_t, 16> bytes{};
    for (auto& b : bytes) b = static_cast<uint8_t>(byte_dist(rng));
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

std::filesystem::path config_uid_path(const std::filesystem::path& db_path,
                                      const std::filesystem::path& config_dir) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(db_path, ec);
    const auto& key_source = ec ? db_path : canonical;

    std::ostringstream name;
    name << std::hex << std::setw(16) << std::setfill('0')
         << std::hash<std::string>{}(key_source.string()) << '-' << kUidFileName;
    return config_dir / name.str();
}

std::optional<InstanceUid> find_instance_uid(const std::filesystem::path& db_path,
                                             const std::filesystem::path& config_dir) {
    if (auto uid = read_uid_file(db_path / kUidFileName)) return uid;
    if (config_dir.empty()) return std::nullopt;
    return read_uid_file(config_uid_path(db_path, config_dir));
}

void write_instance_uid(const std::filesystem::path& db_path,
                        const std::filesystem::path& config_dir,
                        const InstanceUid& uid) noexcept {
    std::error_code ec;
    std::filesystem::create_directories(db_path, ec);
    write_uid_file(db_path / kUidFileName, uid);

    if (config_dir.empty()) return;
    ec.clear();
    std::filesystem::create_directories(config_dir, ec);
    if (ec) return;
    try {
        write_uid_file(config_uid_path(db_path, config_dir), uid);
    } catch (const std::exception&) {
        // best effort
    }
}

}  // namespace search_analytics
