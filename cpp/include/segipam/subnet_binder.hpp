/**
 * @file subnet_binder.hpp
 * @brief Subnet lifecycle and the subnet-to-segment binding
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Validates a new subnet against the rest of its network:
 * - Either every subnet of a network is bound to a segment, or none is
 * - A bound segment belongs to the subnet's network
 * - CIDRs of one network never overlap
 * and registers its allocation pools with the AddressAllocator.
 */

#pragma once

#include "segipam/address_allocator.hpp"
#include "segipam/ipam_config.hpp"
#include "segipam/model.hpp"
#include "segipam/segment_registry.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace segipam {

/**
 * @brief SubnetBinder - owns subnets and their segment edge
 *
 * Thread-safe for concurrent access
 */
class SubnetBinder {
public:
    /**
     * @brief Construct binder
     * @param config Service configuration (DHCP reservation)
     * @param registry Segment registry
     * @param allocator Address allocator receiving the subnet pools
     */
    SubnetBinder(
        const IpamConfig& config,
        SegmentRegistry& registry,
        AddressAllocator& allocator
    );

    ~SubnetBinder() = default;

    // Disable copy and move
    SubnetBinder(const SubnetBinder&) = delete;
    SubnetBinder& operator=(const SubnetBinder&) = delete;
    SubnetBinder(SubnetBinder&&) = delete;
    SubnetBinder& operator=(SubnetBinder&&) = delete;

    /**
     * @brief Create subnet
     *
     * The first subnet of a network fixes its mode (routed when bound to
     * a segment); later subnets must follow it.
     *
     * @param request Subnet attributes
     * @return Created subnet
     * @throws NetworkNotFound, SegmentNotFound
     * @throws SegmentBindingMismatch if segment presence disagrees with the network mode
     * @throws InvalidSegmentReference if segment belongs to another network
     * @throws InvalidCidr, InvalidGateway, InvalidAllocationPool
     */
    Subnet create_subnet(const SubnetRequest& request);

    /**
     * @brief Delete subnet and release its DHCP reservation
     * @throws SubnetNotFound if subnet does not exist
     * @throws SubnetInUse if ports still hold addresses from it
     */
    void delete_subnet(const std::string& subnet_id);

    /**
     * @brief Replace allocation pools
     * @throws SubnetNotFound if subnet does not exist
     * @throws InvalidAllocationPool if pools are invalid or orphan an allocated address
     */
    Subnet update_allocation_pools(
        const std::string& subnet_id,
        const std::vector<AllocationPoolSpec>& pools
    );

    std::optional<Subnet> get_subnet(const std::string& subnet_id) const;

    /**
     * @brief Network's subnets in creation order
     */
    std::vector<Subnet> list_subnets(const std::string& network_id) const;

    /**
     * @brief Subnets bound to segment in creation order
     */
    std::vector<Subnet> subnets_for_segment(const std::string& segment_id) const;

    /**
     * @brief Whether network has at least one segment-bound subnet
     */
    bool is_routed(const std::string& network_id) const;

    bool has_subnets(const std::string& network_id) const;

    /**
     * @brief Set callback fired (outside locks) with the segment of a changed subnet
     */
    void set_pool_change_callback(SegmentChangeCallback callback);

private:
    /// Service configuration
    const IpamConfig& config_;

    SegmentRegistry& registry_;
    AddressAllocator& allocator_;

    std::map<std::string, Subnet> subnets_;
    std::map<std::string, std::vector<std::string>> network_subnets_;   ///< Creation order

    /// Mutex for subnet maps
    mutable std::mutex mutex_;

    SegmentChangeCallback pool_change_callback_;
    mutable std::mutex callback_mutex_;

    static std::optional<IpAddress> resolve_gateway(const IpNetwork& cidr, const SubnetRequest& request);

    static std::vector<IpRange> default_pools(
        const IpNetwork& cidr,
        const std::optional<IpAddress>& gateway
    );

    static std::vector<IpRange> parse_pools(
        const IpNetwork& cidr,
        const std::optional<IpAddress>& gateway,
        const std::vector<AllocationPoolSpec>& pools
    );

    void notify_pool_change(const std::optional<std::string>& segment_id);
};

} // namespace segipam
