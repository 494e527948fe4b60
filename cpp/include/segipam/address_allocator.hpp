/**
 * @file address_allocator.hpp
 * @brief Thread-safe per-subnet IP address allocation
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Allocates addresses from a subnet's allocation pools.
 * - First-fit by ascending address (deterministic)
 * - Specific address requests
 * - Idempotent release
 * - One exclusive critical section per subnet
 */

#pragma once

#include "segipam/ip_address.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace segipam {

/**
 * @brief Capacity snapshot of one subnet's pools
 */
struct PoolUsage {
    uint128_t capacity = 0;     ///< Addresses in all pools
    uint128_t allocated = 0;    ///< Addresses currently in use

    uint128_t available() const { return capacity - allocated; }
};

/**
 * @brief AddressAllocator - sole writer of address-in-use state
 *
 * Each registered subnet has its own pool state and mutex, so allocations
 * on different subnets proceed in parallel while allocate/release on the
 * same subnet are mutually exclusive.
 */
class AddressAllocator {
public:
    AddressAllocator() = default;
    ~AddressAllocator() = default;

    // Disable copy and move
    AddressAllocator(const AddressAllocator&) = delete;
    AddressAllocator& operator=(const AddressAllocator&) = delete;
    AddressAllocator(AddressAllocator&&) = delete;
    AddressAllocator& operator=(AddressAllocator&&) = delete;

    /**
     * @brief Register pools for a new subnet
     * @param subnet_id Subnet identifier
     * @param cidr Subnet CIDR
     * @param pools Allocation pools (any order)
     * @throws InvalidAllocationPool if pools leave the CIDR or overlap
     * @throws std::invalid_argument if subnet is already registered
     */
    void register_subnet(
        const std::string& subnet_id,
        const IpNetwork& cidr,
        const std::vector<IpRange>& pools
    );

    /**
     * @brief Remove subnet pools
     * @param subnet_id Subnet identifier
     * @param releasable Allocated addresses that may be dropped with the subnet
     * @throws SubnetNotFound if subnet is not registered
     * @throws SubnetInUse if other addresses are still allocated
     */
    void unregister_subnet(
        const std::string& subnet_id,
        const std::set<IpAddress>& releasable = {}
    );

    /**
     * @brief Allocate an address
     * @param subnet_id Subnet to allocate from
     * @param requested Specific address, or std::nullopt for lowest free
     * @return Allocated address
     * @throws SubnetNotFound if subnet is not registered
     * @throws AddressNotAvailable if requested address is outside pools or in use
     * @throws PoolExhausted if no address remains
     */
    IpAddress allocate(
        const std::string& subnet_id,
        const std::optional<IpAddress>& requested = std::nullopt
    );

    /**
     * @brief Return address to its pool
     * @return true if address was released, false if it was not allocated
     */
    bool release(const std::string& subnet_id, const IpAddress& address);

    /**
     * @brief Replace subnet pools
     * @throws SubnetNotFound if subnet is not registered
     * @throws InvalidAllocationPool if pools are invalid or an allocated
     *         address would fall outside them
     */
    void update_pools(const std::string& subnet_id, const std::vector<IpRange>& pools);

    /**
     * @brief Capacity and usage of a subnet
     * @return Usage or std::nullopt if subnet is not registered
     */
    std::optional<PoolUsage> usage(const std::string& subnet_id) const;

    bool is_allocated(const std::string& subnet_id, const IpAddress& address) const;

    /**
     * @brief Addresses in use on subnet, ascending
     */
    std::vector<IpAddress> allocated_addresses(const std::string& subnet_id) const;

    /**
     * @brief Current pools of subnet, ascending
     */
    std::vector<IpRange> pools(const std::string& subnet_id) const;

    bool has_subnet(const std::string& subnet_id) const;

    size_t get_subnet_count() const;

    /**
     * @brief Sort pools and check them against a CIDR
     * @throws InvalidAllocationPool on a pool outside cidr or overlapping another
     */
    static std::vector<IpRange> normalize_pools(
        const IpNetwork& cidr,
        const std::vector<IpRange>& pools
    );

private:
    struct PoolState {
        IpNetwork cidr;
        std::vector<IpRange> pools;         ///< Ascending, non-overlapping
        std::set<IpAddress> allocated;
        bool removed = false;
        mutable std::mutex mutex;           ///< Per-subnet critical section
    };

    /// Registered subnets
    std::map<std::string, std::shared_ptr<PoolState>> subnets_;

    /// Mutex for the subnet map only
    mutable std::mutex mutex_;

    std::shared_ptr<PoolState> find_state(const std::string& subnet_id) const;

    static bool in_pools(const std::vector<IpRange>& pools, const IpAddress& address);
};

} // namespace segipam
