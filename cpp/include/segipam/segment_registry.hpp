/**
 * @file segment_registry.hpp
 * @brief Networks, segments and host/segment connectivity
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Owns the segment lifecycle:
 * - Physical network uniqueness within a network
 * - Segmentation ID validation per segment type
 * - Host/segment mappings (which hosts can reach which segments)
 * - Reference counts that block deletion of segments in use
 */

#pragma once

#include "segipam/ipam_config.hpp"
#include "segipam/lock_table.hpp"
#include "segipam/model.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace segipam {

/**
 * @brief SegmentRegistry - authoritative store of networks and segments
 *
 * Segment create/delete run inside the network-scoped critical section
 * returned by network_lock(); the subnet binder takes the same section
 * so segment deletion and subnet creation are serialized per network.
 *
 * Thread-safe for concurrent access
 */
class SegmentRegistry {
public:
    /**
     * @brief Construct registry
     * @param config Service configuration (segmentation ID ranges)
     */
    explicit SegmentRegistry(const IpamConfig& config);

    ~SegmentRegistry() = default;

    // Disable copy and move
    SegmentRegistry(const SegmentRegistry&) = delete;
    SegmentRegistry& operator=(const SegmentRegistry&) = delete;
    SegmentRegistry(SegmentRegistry&&) = delete;
    SegmentRegistry& operator=(SegmentRegistry&&) = delete;

    // ========================================================================
    // Networks
    // ========================================================================

    /**
     * @brief Create network, optionally with its first segment
     * @param name Network name
     * @param shared Shared across tenants
     * @param provider Provider attributes for an implicit first segment
     * @return Created network
     * @throws InvalidSegmentationId, InvalidSegmentDefinition for bad provider attributes
     */
    Network create_network(
        const std::string& name,
        bool shared = false,
        const std::optional<ProviderSpec>& provider = std::nullopt
    );

    /**
     * @brief Delete network together with its segments and host mappings
     * @param network_id Network to delete
     * @param precondition Runs inside the network section before anything is
     *        removed; throwing from it aborts the delete
     * @throws NetworkNotFound if network does not exist
     * @throws NetworkInUse if any segment is still referenced
     */
    void delete_network(const std::string& network_id,
                        const std::function<void()>& precondition = nullptr);

    std::optional<Network> get_network(const std::string& network_id) const;

    std::vector<Network> list_networks() const;

    bool has_network(const std::string& network_id) const;

    /**
     * @brief Network-scoped critical section
     *
     * Callers re-check the network after locking; a delete may complete
     * while they wait.
     *
     * @throws NetworkNotFound if network does not exist
     */
    std::shared_ptr<std::mutex> network_lock(const std::string& network_id);

    size_t network_lock_count() const;

    // ========================================================================
    // Segments
    // ========================================================================

    /**
     * @brief Create segment on an existing network
     * @param request Segment attributes
     * @return Created segment (segment_index = declaration order)
     * @throws NetworkNotFound if network does not exist
     * @throws DuplicatePhysicalNetwork if physical network already used on network
     * @throws InvalidSegmentationId if ID is missing, forbidden or out of range
     * @throws InvalidSegmentDefinition if physical network presence is wrong for type
     */
    Segment create_segment(const SegmentRequest& request);

    /**
     * @brief Delete segment and its host mappings
     * @throws SegmentNotFound if segment does not exist
     * @throws SegmentInUse if subnets or live port bindings reference it
     */
    void delete_segment(const std::string& segment_id);

    std::optional<Segment> get_segment(const std::string& segment_id) const;

    /**
     * @brief List network's segments in declaration order
     * @param network_id Network to list
     * @param marker Return segments after this segment id
     * @param limit Maximum number of segments (0 = unlimited)
     * @throws NetworkNotFound if network does not exist
     * @throws SegmentNotFound if marker is not a segment of network
     */
    std::vector<Segment> list_segments(
        const std::string& network_id,
        const std::optional<std::string>& marker = std::nullopt,
        size_t limit = 0
    ) const;

    /**
     * @brief Update mutable segment attributes
     * @throws SegmentNotFound if segment does not exist
     */
    Segment update_segment_name(
        const std::string& segment_id,
        const std::string& name,
        const std::string& description = ""
    );

    // ========================================================================
    // Host Mappings
    // ========================================================================

    /**
     * @brief Record that host can reach segment
     * @return true if mapping was added, false if it already existed
     * @throws SegmentNotFound if segment does not exist
     * @throws std::invalid_argument if host name is invalid
     */
    bool add_host_mapping(const std::string& host, const std::string& segment_id);

    /**
     * @brief Remove host/segment mapping
     * @return true if mapping was removed, false if it did not exist
     * @throws SegmentNotFound if segment does not exist
     * @throws SegmentInUse if ports bound on host depend on segment
     */
    bool remove_host_mapping(const std::string& host, const std::string& segment_id);

    /**
     * @brief Segments of network reachable from host, in declaration order
     */
    std::vector<Segment> segments_for_host(
        const std::string& host,
        const std::string& network_id
    ) const;

    /**
     * @brief Hosts mapped to segment (sorted)
     */
    std::vector<std::string> hosts_for_segment(const std::string& segment_id) const;

    bool host_reaches_segment(const std::string& host, const std::string& segment_id) const;

    // ========================================================================
    // References
    // ========================================================================

    /**
     * @brief Count a subnet bound to segment
     * @throws SegmentNotFound if segment does not exist
     */
    void retain_subnet_reference(const std::string& segment_id);

    void release_subnet_reference(const std::string& segment_id);

    /**
     * @brief Count a port bound on host whose addresses live on segment
     * @throws SegmentNotFound if segment does not exist
     */
    void retain_binding(const std::string& host, const std::string& segment_id);

    void release_binding(const std::string& host, const std::string& segment_id);

    size_t subnet_reference_count(const std::string& segment_id) const;

    size_t binding_count(const std::string& segment_id) const;

    /**
     * @brief Set callback fired (outside locks) when a segment's host set changes
     */
    void set_mapping_change_callback(SegmentChangeCallback callback);

private:
    struct SegmentEntry {
        Segment segment;
        size_t subnet_refs = 0;
        std::map<std::string, size_t> bindings;     ///< host -> bound ports
        std::set<std::string> hosts;
    };

    struct NetworkEntry {
        Network network;
        std::vector<std::string> segment_ids;       ///< Declaration order
        uint32_t next_segment_index = 0;
    };

    /// Service configuration
    const IpamConfig& config_;

    std::map<std::string, NetworkEntry> networks_;
    std::map<std::string, SegmentEntry> segments_;

    /// Network-scoped critical sections
    LockTable<std::string> network_locks_;

    /// Mutex for registry maps
    mutable std::mutex mutex_;

    SegmentChangeCallback mapping_change_callback_;
    mutable std::mutex callback_mutex_;

    void validate_segment_attributes(
        SegmentType type,
        const std::optional<std::string>& physical_network,
        const std::optional<uint32_t>& segmentation_id
    ) const;

    /// Caller holds mutex_
    Segment insert_segment_locked(NetworkEntry& network, const SegmentRequest& request);

    size_t live_bindings_locked(const SegmentEntry& entry) const;

    void notify_mapping_change(const std::string& segment_id);
};

} // namespace segipam
