/**
 * @file ipam_config.hpp
 * @brief Service configuration and limits for segment-aware IPAM
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "segipam/utilities.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace segipam {
namespace config {

// ============================================================================
// Limits
// ============================================================================

/// Maximum identifier length (host, physical network, names)
constexpr size_t MAX_IDENTIFIER_LENGTH = 255;

/// Maximum configuration file size (1MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Default maximum fixed IPs per port
constexpr size_t MAX_FIXED_IPS_PER_PORT = 5;

// ============================================================================
// Segmentation ID ranges
// ============================================================================

/// Valid 802.1Q VLAN tags
constexpr uint32_t MIN_VLAN_TAG = 1;
constexpr uint32_t MAX_VLAN_TAG = 4094;

/// Valid VXLAN network identifiers (24 bits)
constexpr uint32_t MIN_VXLAN_VNI = 1;
constexpr uint32_t MAX_VXLAN_VNI = (1u << 24) - 1;

/// Valid GRE keys (32 bits)
constexpr uint32_t MIN_GRE_KEY = 1;
constexpr uint32_t MAX_GRE_KEY = 0xFFFFFFFFu;

// ============================================================================
// Inventory publication
// ============================================================================

/// Placement resource class for IPv4 addresses
constexpr const char* IPV4_RESOURCE_CLASS = "IPV4_ADDRESS";

/// Resource provider and aggregate name prefix (followed by segment id)
constexpr const char* SEGMENT_NAME_PREFIX = "segipam segment id ";

/// Default publish attempts before a segment is flagged degraded
constexpr size_t PUBLISH_MAX_ATTEMPTS = 5;

/// Default delay before the first publish retry
constexpr auto PUBLISH_INITIAL_BACKOFF = std::chrono::milliseconds(200);

/// Default upper bound on retry delay
constexpr auto PUBLISH_MAX_BACKOFF = std::chrono::milliseconds(5000);

/// Default time to drain the publish queue on shutdown
constexpr auto SHUTDOWN_TIMEOUT = std::chrono::milliseconds(2000);

// ============================================================================
// Directories
// ============================================================================

/**
 * @brief Get segipam data directory from SEGIPAM_DATA_DIR or use default
 * @return Filesystem path to data directory
 */
std::filesystem::path get_data_directory();

/**
 * @brief Get database directory (inventory mirror)
 */
std::filesystem::path get_database_directory();

/**
 * @brief Get log directory
 */
std::filesystem::path get_log_directory();

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Validate a host or physical network name
 *
 * Accepts alphanumerics plus '_', '-', '.' and ':' (hostnames, FQDNs and
 * physical network labels).
 *
 * @param name String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_name(const std::string& name, size_t max_length = MAX_IDENTIFIER_LENGTH);

} // namespace config

/**
 * @brief Tie-break policy for hosts reachable through several segments
 */
enum class SegmentPreferencePolicy {
    DECLARATION_ORDER,  ///< Lowest segment index first
    MOST_AVAILABLE      ///< Most free IPv4 addresses first
};

/**
 * @brief Inclusive segmentation ID range
 */
struct SegmentationRange {
    uint32_t min;
    uint32_t max;

    bool contains(uint32_t id) const { return id >= min && id <= max; }
};

/**
 * @brief IpamConfig - service-wide settings handed to each component
 *
 * Built once at startup (defaults, JSON file) and passed by const reference
 * to every component constructor.
 */
struct IpamConfig {
    /// Directory for database and logs
    std::filesystem::path data_dir;

    /// Log file path (empty for console only)
    std::string log_file;

    /// Minimum log level
    utilities::LogLevel log_level = utilities::LogLevel::INFO;

    /// SQLite inventory mirror path (empty for <data_dir>/db/inventory.db)
    std::string inventory_database;

    /// Publish attempts per inventory snapshot
    size_t publish_max_attempts = config::PUBLISH_MAX_ATTEMPTS;

    /// First retry delay; doubled per attempt
    std::chrono::milliseconds publish_initial_backoff = config::PUBLISH_INITIAL_BACKOFF;

    /// Retry delay cap
    std::chrono::milliseconds publish_max_backoff = config::PUBLISH_MAX_BACKOFF;

    /// Drain timeout used by stop()
    std::chrono::milliseconds shutdown_timeout = config::SHUTDOWN_TIMEOUT;

    /// Segment preference when a host reaches several segments
    SegmentPreferencePolicy segment_preference = SegmentPreferencePolicy::DECLARATION_ORDER;

    /// Hold one address per DHCP-enabled subnet for the DHCP port
    bool reserve_dhcp_address = true;

    /// Maximum fixed IP entries per port
    size_t max_fixed_ips_per_port = config::MAX_FIXED_IPS_PER_PORT;

    SegmentationRange vlan_range{config::MIN_VLAN_TAG, config::MAX_VLAN_TAG};
    SegmentationRange vxlan_range{config::MIN_VXLAN_VNI, config::MAX_VXLAN_VNI};
    SegmentationRange gre_range{config::MIN_GRE_KEY, config::MAX_GRE_KEY};

    /**
     * @brief Default configuration rooted at get_data_directory()
     */
    static IpamConfig defaults();

    /**
     * @brief Parse configuration JSON over the defaults
     * @param text JSON object text
     * @return Parsed configuration
     * @throws std::invalid_argument on malformed JSON or invalid values
     */
    static IpamConfig from_json(const std::string& text);

    /**
     * @brief Load configuration JSON file
     * @param path Configuration file
     * @return Parsed configuration
     * @throws std::invalid_argument if the file is unreadable or invalid
     */
    static IpamConfig from_json_file(const std::filesystem::path& path);

    /**
     * @brief Retry delay before the given publish attempt (2 = first retry)
     */
    std::chrono::milliseconds backoff_for_attempt(size_t attempt) const;

    /**
     * @brief Resolved inventory database path
     */
    std::filesystem::path inventory_database_path() const;

    /**
     * @brief Check value consistency
     * @throws std::invalid_argument describing the first invalid value
     */
    void validate() const;
};

/**
 * @brief Convert preference policy to its configuration name
 */
std::string segment_preference_to_string(SegmentPreferencePolicy policy);

/**
 * @brief Parse preference policy name ("declaration_order", "most_available")
 */
std::optional<SegmentPreferencePolicy> string_to_segment_preference(const std::string& name);

} // namespace segipam
