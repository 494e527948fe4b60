/**
 * @file routed_network_service.hpp
 * @brief Segment-aware IPAM service orchestrator
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Wires the IPAM components from one configuration and routes every
 * allocation-affecting change to the inventory publisher.
 */

#pragma once

#include "segipam/address_allocator.hpp"
#include "segipam/inventory_publisher.hpp"
#include "segipam/inventory_store.hpp"
#include "segipam/ipam_config.hpp"
#include "segipam/model.hpp"
#include "segipam/port_binding_resolver.hpp"
#include "segipam/segment_registry.hpp"
#include "segipam/subnet_binder.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace segipam {

/**
 * @brief RoutedNetworkService statistics
 */
struct ServiceStats {
    size_t networks;                    ///< Networks known to the registry
    size_t subnets;                     ///< Subnets with registered pools
    size_t ports;                       ///< Ports of all networks
    size_t pending_ports;               ///< Deferred ports waiting for a host
    size_t degraded_segments;           ///< Segments whose inventory publication gave up
    PublisherStats publisher;           ///< Publication counters
};

/**
 * @brief RoutedNetworkService - facade over the IPAM components
 *
 * Components:
 * - SegmentRegistry (networks, segments, host mappings)
 * - AddressAllocator (per-subnet pools)
 * - SubnetBinder (subnet/segment edge)
 * - PortBindingResolver (immediate and deferred port addresses)
 * - InventoryPublisher (scheduler inventory per segment)
 */
class RoutedNetworkService {
public:
    /**
     * @brief Construct service
     * @param config Service configuration (copied)
     * @param store Inventory store; SQLite store at the configured path if null
     * @throws InventoryStoreError if the default store cannot be opened
     */
    explicit RoutedNetworkService(
        const IpamConfig& config,
        std::shared_ptr<InventoryStore> store = nullptr
    );

    /**
     * @brief Destructor - graceful shutdown
     */
    ~RoutedNetworkService();

    // Disable copy and move
    RoutedNetworkService(const RoutedNetworkService&) = delete;
    RoutedNetworkService& operator=(const RoutedNetworkService&) = delete;
    RoutedNetworkService(RoutedNetworkService&&) = delete;
    RoutedNetworkService& operator=(RoutedNetworkService&&) = delete;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    /**
     * @brief Start inventory publication
     * @return true if started, false if already running
     */
    bool start();

    /**
     * @brief Drain inventory publication and stop
     */
    void stop();

    bool is_running() const;

    // ========================================================================
    // Networks and Segments
    // ========================================================================

    Network create_network(
        const std::string& name,
        bool shared = false,
        const std::optional<ProviderSpec>& provider = std::nullopt
    );

    /**
     * @brief Delete network
     * @throws NetworkNotFound if network does not exist
     * @throws NetworkInUse while subnets or ports exist
     */
    void delete_network(const std::string& network_id);

    /**
     * @brief Network with its routed flag taken from the current subnets
     */
    std::optional<Network> get_network(const std::string& network_id) const;

    std::vector<Network> list_networks() const;

    Segment create_segment(const SegmentRequest& request);

    void delete_segment(const std::string& segment_id);

    bool add_host_mapping(const std::string& host, const std::string& segment_id);

    bool remove_host_mapping(const std::string& host, const std::string& segment_id);

    // ========================================================================
    // Subnets
    // ========================================================================

    Subnet create_subnet(const SubnetRequest& request);

    void delete_subnet(const std::string& subnet_id);

    Subnet update_allocation_pools(
        const std::string& subnet_id,
        const std::vector<AllocationPoolSpec>& pools
    );

    // ========================================================================
    // Ports
    // ========================================================================

    Port create_port(
        const std::string& network_id,
        const std::optional<std::vector<FixedIpRequest>>& fixed_ips = std::nullopt,
        const std::optional<std::string>& host = std::nullopt,
        const std::string& name = ""
    );

    Port bind_host(const std::string& port_id, const std::string& host);

    Port unbind_host(const std::string& port_id);

    void delete_port(const std::string& port_id);

    // ========================================================================
    // Components
    // ========================================================================

    const IpamConfig& config() const { return config_; }
    SegmentRegistry& registry() { return *registry_; }
    AddressAllocator& allocator() { return *allocator_; }
    SubnetBinder& binder() { return *binder_; }
    PortBindingResolver& resolver() { return *resolver_; }
    InventoryPublisher& publisher() { return *publisher_; }

    ServiceStats get_stats() const;

private:
    /// Service configuration (components hold references to it)
    const IpamConfig config_;

    std::shared_ptr<InventoryStore> store_;

    std::unique_ptr<SegmentRegistry> registry_;
    std::unique_ptr<AddressAllocator> allocator_;
    std::unique_ptr<SubnetBinder> binder_;
    std::unique_ptr<InventoryPublisher> publisher_;
    std::unique_ptr<PortBindingResolver> resolver_;
};

} // namespace segipam
