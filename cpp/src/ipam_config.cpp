/**
 * @file ipam_config.cpp
 * @brief Implementation of service configuration loading and validation
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "segipam/ipam_config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

using json = nlohmann::json;

namespace segipam {
namespace config {

namespace {

std::filesystem::path data_directory_path() {
    // Check for environment variable SEGIPAM_DATA_DIR
    const std::string env_data_dir = utilities::get_env("SEGIPAM_DATA_DIR");
    if (!env_data_dir.empty()) {
        return std::filesystem::path(env_data_dir);
    }

    return std::filesystem::path("/opt/segipam/var");
}

std::filesystem::path ensure_directory(const std::filesystem::path& dir) {
    if (!std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }
    return dir;
}

} // namespace

// ============================================================================
// Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    return ensure_directory(data_directory_path());
}

std::filesystem::path get_database_directory() {
    return ensure_directory(get_data_directory() / "db");
}

std::filesystem::path get_log_directory() {
    return ensure_directory(get_data_directory() / "logs");
}

// ============================================================================
// Validation
// ============================================================================

bool validate_name(const std::string& name, size_t max_length) {
    if (name.empty() || name.length() > max_length) {
        return false;
    }

    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.' && c != ':') {
            return false;
        }
    }

    return true;
}

} // namespace config

// ============================================================================
// Preference Policy Names
// ============================================================================

std::string segment_preference_to_string(SegmentPreferencePolicy policy) {
    switch (policy) {
        case SegmentPreferencePolicy::DECLARATION_ORDER: return "declaration_order";
        case SegmentPreferencePolicy::MOST_AVAILABLE: return "most_available";
        default: return "unknown";
    }
}

std::optional<SegmentPreferencePolicy> string_to_segment_preference(const std::string& name) {
    const std::string lower = utilities::to_lowercase(utilities::trim_string(name));
    if (lower == "declaration_order") return SegmentPreferencePolicy::DECLARATION_ORDER;
    if (lower == "most_available") return SegmentPreferencePolicy::MOST_AVAILABLE;
    return std::nullopt;
}

// ============================================================================
// IpamConfig
// ============================================================================

namespace {

// "min:max" as used by ML2 type driver range options
SegmentationRange parse_range(const std::string& key, const std::string& text) {
    auto parts = utilities::split_string(text, ':');
    if (parts.size() != 2) {
        throw std::invalid_argument("Segmentation range '" + key + "' must be 'min:max'");
    }

    try {
        unsigned long min = std::stoul(utilities::trim_string(parts[0]));
        unsigned long max = std::stoul(utilities::trim_string(parts[1]));
        if (min > 0xFFFFFFFFul || max > 0xFFFFFFFFul) {
            throw std::out_of_range(key);
        }
        return SegmentationRange{static_cast<uint32_t>(min), static_cast<uint32_t>(max)};
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Segmentation range '" + key + "' is not numeric: " + text);
    }
}

std::chrono::milliseconds parse_millis(const json& value, const std::string& key) {
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        throw std::invalid_argument("'" + key + "' must be a non-negative integer");
    }
    return std::chrono::milliseconds(value.get<int64_t>());
}

size_t parse_count(const json& value, const std::string& key) {
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        throw std::invalid_argument("'" + key + "' must be a non-negative integer");
    }
    return static_cast<size_t>(value.get<int64_t>());
}

} // namespace

IpamConfig IpamConfig::defaults() {
    IpamConfig config;
    config.data_dir = config::data_directory_path();
    return config;
}

IpamConfig IpamConfig::from_json(const std::string& text) {
    if (text.size() > config::MAX_CONFIG_SIZE) {
        throw std::invalid_argument("Configuration exceeds maximum size");
    }

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("Malformed configuration JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }

    IpamConfig config = defaults();

    try {
        if (j.contains("data_dir")) {
            config.data_dir = j["data_dir"].get<std::string>();
        }
        if (j.contains("log_file")) {
            config.log_file = j["log_file"].get<std::string>();
        }
        if (j.contains("log_level")) {
            auto level = utilities::parse_log_level(j["log_level"].get<std::string>());
            if (!level) {
                throw std::invalid_argument("Unknown log_level: " + j["log_level"].get<std::string>());
            }
            config.log_level = *level;
        }
        if (j.contains("inventory_database")) {
            config.inventory_database = j["inventory_database"].get<std::string>();
        }

        if (j.contains("publish")) {
            const json& publish = j["publish"];
            if (!publish.is_object()) {
                throw std::invalid_argument("'publish' must be an object");
            }
            if (publish.contains("max_attempts")) {
                config.publish_max_attempts = parse_count(publish["max_attempts"], "publish.max_attempts");
            }
            if (publish.contains("initial_backoff_ms")) {
                config.publish_initial_backoff =
                    parse_millis(publish["initial_backoff_ms"], "publish.initial_backoff_ms");
            }
            if (publish.contains("max_backoff_ms")) {
                config.publish_max_backoff =
                    parse_millis(publish["max_backoff_ms"], "publish.max_backoff_ms");
            }
        }

        if (j.contains("shutdown_timeout_ms")) {
            config.shutdown_timeout = parse_millis(j["shutdown_timeout_ms"], "shutdown_timeout_ms");
        }

        if (j.contains("segment_preference")) {
            const std::string name = j["segment_preference"].get<std::string>();
            auto policy = string_to_segment_preference(name);
            if (!policy) {
                throw std::invalid_argument("Unknown segment_preference: " + name);
            }
            config.segment_preference = *policy;
        }

        if (j.contains("reserve_dhcp_address")) {
            config.reserve_dhcp_address = j["reserve_dhcp_address"].get<bool>();
        }
        if (j.contains("max_fixed_ips_per_port")) {
            config.max_fixed_ips_per_port =
                parse_count(j["max_fixed_ips_per_port"], "max_fixed_ips_per_port");
        }

        if (j.contains("segmentation_ranges")) {
            const json& ranges = j["segmentation_ranges"];
            if (!ranges.is_object()) {
                throw std::invalid_argument("'segmentation_ranges' must be an object");
            }
            if (ranges.contains("vlan")) {
                config.vlan_range = parse_range("vlan", ranges["vlan"].get<std::string>());
            }
            if (ranges.contains("vxlan")) {
                config.vxlan_range = parse_range("vxlan", ranges["vxlan"].get<std::string>());
            }
            if (ranges.contains("gre")) {
                config.gre_range = parse_range("gre", ranges["gre"].get<std::string>());
            }
        }

    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
}

IpamConfig IpamConfig::from_json_file(const std::filesystem::path& path) {
    auto content = utilities::read_file(path.string());
    if (!content) {
        throw std::invalid_argument("Unable to read configuration file: " + path.string());
    }
    return from_json(*content);
}

std::chrono::milliseconds IpamConfig::backoff_for_attempt(size_t attempt) const {
    if (attempt < 2) {
        return std::chrono::milliseconds(0);
    }

    auto delay = publish_initial_backoff;
    for (size_t i = 2; i < attempt && delay < publish_max_backoff; ++i) {
        delay *= 2;
    }

    return std::min(delay, publish_max_backoff);
}

std::filesystem::path IpamConfig::inventory_database_path() const {
    if (!inventory_database.empty()) {
        return std::filesystem::path(inventory_database);
    }
    return data_dir / "db" / "inventory.db";
}

void IpamConfig::validate() const {
    if (publish_max_attempts == 0) {
        throw std::invalid_argument("publish.max_attempts must be at least 1");
    }
    if (publish_max_backoff < publish_initial_backoff) {
        throw std::invalid_argument("publish.max_backoff_ms must not be below initial_backoff_ms");
    }
    if (max_fixed_ips_per_port == 0) {
        throw std::invalid_argument("max_fixed_ips_per_port must be at least 1");
    }

    auto check_range = [](const char* name, const SegmentationRange& range,
                          uint32_t floor, uint32_t ceiling) {
        if (range.min > range.max || range.min < floor || range.max > ceiling) {
            throw std::invalid_argument(std::string("Segmentation range '") + name + "' is invalid");
        }
    };

    check_range("vlan", vlan_range, config::MIN_VLAN_TAG, config::MAX_VLAN_TAG);
    check_range("vxlan", vxlan_range, config::MIN_VXLAN_VNI, config::MAX_VXLAN_VNI);
    check_range("gre", gre_range, config::MIN_GRE_KEY, config::MAX_GRE_KEY);
}

} // namespace segipam
