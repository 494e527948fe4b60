/**
 * @file port_binding_resolver.hpp
 * @brief Port address assignment with deferred host binding
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Ports on a routed network created without a host cannot know which
 * segment (and therefore which subnet) they live on. Such ports are parked
 * as ip_allocation=deferred until bind_host() supplies the host, which is
 * resolved to its reachable segments and then to an address.
 *
 * State machine (allocation perspective):
 *   UNBOUND -> HOST_BOUND -> ALLOCATED | ALLOCATION_FAILED
 */

#pragma once

#include "segipam/address_allocator.hpp"
#include "segipam/ipam_config.hpp"
#include "segipam/lock_table.hpp"
#include "segipam/model.hpp"
#include "segipam/segment_preference.hpp"
#include "segipam/segment_registry.hpp"
#include "segipam/subnet_binder.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace segipam {

/**
 * @brief PortBindingResolver - owns ports and their fixed IPs
 *
 * Operations on one port are serialized by a per-port lock; operations on
 * different ports run concurrently. Port creation runs inside the registry's
 * network section so it cannot race a network delete.
 */
class PortBindingResolver {
public:
    /**
     * @brief Construct resolver
     * @param config Service configuration (fixed IP limit)
     * @param registry Segment registry (host mappings, binding counts)
     * @param binder Subnet binder (subnets per network and segment)
     * @param allocator Address allocator
     * @param preference Segment tie-break policy
     */
    PortBindingResolver(
        const IpamConfig& config,
        SegmentRegistry& registry,
        SubnetBinder& binder,
        AddressAllocator& allocator,
        std::unique_ptr<SegmentPreference> preference
    );

    ~PortBindingResolver() = default;

    // Disable copy and move
    PortBindingResolver(const PortBindingResolver&) = delete;
    PortBindingResolver& operator=(const PortBindingResolver&) = delete;
    PortBindingResolver(PortBindingResolver&&) = delete;
    PortBindingResolver& operator=(PortBindingResolver&&) = delete;

    /**
     * @brief Create port
     *
     * - Explicit fixed IPs are allocated immediately (an empty list means
     *   no addresses)
     * - Non-routed network: lowest free address of the first subnet with
     *   space, IPv4 before IPv6
     * - Routed network with host: address from a segment reachable by host
     * - Routed network without host: deferred, parked as pending
     *
     * @param network_id Owning network
     * @param fixed_ips Requested fixed IPs, or std::nullopt for automatic
     * @param host Binding host if already known
     * @param name Port name
     * @return Created port
     * @throws NetworkNotFound, InvalidFixedIpRequest, HostNotCompatibleWithFixedIps
     * @throws AddressNotAvailable, PoolExhausted, NoReachableSegment, AllocationFailed
     */
    Port create_port(
        const std::string& network_id,
        const std::optional<std::vector<FixedIpRequest>>& fixed_ips = std::nullopt,
        const std::optional<std::string>& host = std::nullopt,
        const std::string& name = ""
    );

    /**
     * @brief Bind port to host, allocating deferred addresses
     *
     * Idempotent for a port already allocated on the same host.
     *
     * @return Updated port
     * @throws PortNotFound if port does not exist
     * @throws NoReachableSegment if host reaches no segment of the network
     * @throws AllocationFailed if every reachable segment is exhausted
     *         (port is left ALLOCATION_FAILED without host)
     * @throws HostNotCompatibleWithFixedIps if existing addresses do not
     *         work on the new host
     */
    Port bind_host(const std::string& port_id, const std::string& host);

    /**
     * @brief Remove host binding
     *
     * Addresses that were assigned because of the binding are released and
     * the port returns to UNBOUND (deferred).
     *
     * @return Updated port
     * @throws PortNotFound if port does not exist
     */
    Port unbind_host(const std::string& port_id);

    /**
     * @brief Delete port and release its addresses
     * @throws PortNotFound if port does not exist
     */
    void delete_port(const std::string& port_id);

    std::optional<Port> get_port(const std::string& port_id) const;

    std::vector<Port> list_ports(const std::string& network_id) const;

    /**
     * @brief Deferred ports waiting for a host, oldest first
     */
    std::vector<std::string> pending_ports() const;

    bool has_ports(const std::string& network_id) const;

    size_t get_port_count() const;

    size_t port_lock_count() const;

    /**
     * @brief Set callback fired (outside locks) for each segment whose
     *        allocations changed
     */
    void set_allocation_change_callback(SegmentChangeCallback callback);

private:
    /// Service configuration
    const IpamConfig& config_;

    SegmentRegistry& registry_;
    SubnetBinder& binder_;
    AddressAllocator& allocator_;

    /// Tie-break policy
    std::unique_ptr<SegmentPreference> preference_;

    std::map<std::string, Port> ports_;

    /// Pending work queue of deferred ports (FIFO)
    std::vector<std::string> pending_;

    /// Per-port critical sections
    LockTable<std::string> port_locks_;

    /// Mutex for port map and pending queue
    mutable std::mutex mutex_;

    SegmentChangeCallback allocation_change_callback_;
    mutable std::mutex callback_mutex_;

    std::vector<FixedIp> allocate_requested(
        const std::string& port_id,
        const std::string& network_id,
        const std::vector<FixedIpRequest>& requests,
        const std::optional<std::string>& host
    );

    std::vector<FixedIp> allocate_unrouted(const std::string& network_id);

    /**
     * @brief First free address on host's segments in preference order
     * @return Address or std::nullopt if every reachable segment is exhausted
     * @throws NoReachableSegment if host reaches no segment of network
     */
    std::optional<FixedIp> allocate_on_host_segments(
        const std::string& network_id,
        const std::string& host
    );

    /// Release addresses; returns their segments
    std::set<std::string> release_addresses(const std::vector<FixedIp>& fixed_ips);

    std::optional<std::string> segment_of(const FixedIp& fixed_ip) const;

    void retain_bindings(const std::string& host, const std::vector<FixedIp>& fixed_ips);
    void release_bindings(const std::string& host, const std::vector<FixedIp>& fixed_ips);

    bool host_compatible(const std::string& host, const std::vector<FixedIp>& fixed_ips) const;

    /// Per-port section; issued only while the port exists
    std::shared_ptr<std::mutex> port_lock(const std::string& port_id);

    void store_port(const Port& port);
    void enqueue_pending(const std::string& port_id);
    void dequeue_pending(const std::string& port_id);

    void notify_allocation_change(const std::set<std::string>& segment_ids);
};

} // namespace segipam
