/**
 * @file routed_network_service.cpp
 * @brief Implementation of segment-aware IPAM service orchestrator
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "segipam/routed_network_service.hpp"
#include "segipam/exceptions.hpp"
#include "segipam/segment_preference.hpp"
#include "segipam/sqlite_inventory_store.hpp"

namespace segipam {

using namespace segipam::utilities;

// ============================================================================
// Constructor and Destructor
// ============================================================================

RoutedNetworkService::RoutedNetworkService(
    const IpamConfig& config,
    std::shared_ptr<InventoryStore> store
)
    : config_(config)
    , store_(std::move(store))
{
    config_.validate();

    if (!store_) {
        store_ = std::make_shared<SqliteInventoryStore>(config_.inventory_database_path().string());
    }

    registry_ = std::make_unique<SegmentRegistry>(config_);
    allocator_ = std::make_unique<AddressAllocator>();
    binder_ = std::make_unique<SubnetBinder>(config_, *registry_, *allocator_);
    publisher_ = std::make_unique<InventoryPublisher>(
        config_, *registry_, *binder_, *allocator_, store_);

    InventoryPublisher* publisher = publisher_.get();
    resolver_ = std::make_unique<PortBindingResolver>(
        config_, *registry_, *binder_, *allocator_,
        make_segment_preference(config_.segment_preference,
            [publisher](const std::string& segment_id) {
                return publisher->compute_inventory(segment_id).available();
            }));

    // Every allocation-affecting change ends in an inventory sync
    auto sync = [publisher](const std::string& segment_id) {
        publisher->sync_inventory(segment_id);
    };
    registry_->set_mapping_change_callback(sync);
    binder_->set_pool_change_callback(sync);
    resolver_->set_allocation_change_callback(sync);

    log_info("RoutedNetworkService: Initialized (segment preference " +
             segment_preference_to_string(config_.segment_preference) + ")");
}

RoutedNetworkService::~RoutedNetworkService() {
    if (publisher_ && publisher_->is_running()) {
        stop();
    }
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool RoutedNetworkService::start() {
    if (!publisher_->start()) {
        return false;
    }
    log_info("RoutedNetworkService: Started");
    return true;
}

void RoutedNetworkService::stop() {
    publisher_->stop();

    auto degraded = publisher_->degraded_segments();
    if (!degraded.empty()) {
        log_warn("RoutedNetworkService: Stopped with " + std::to_string(degraded.size()) +
                 " degraded segment inventories");
    }
    log_info("RoutedNetworkService: Stopped");
}

bool RoutedNetworkService::is_running() const {
    return publisher_->is_running();
}

// ============================================================================
// Networks and Segments
// ============================================================================

Network RoutedNetworkService::create_network(
    const std::string& name,
    bool shared,
    const std::optional<ProviderSpec>& provider
) {
    return registry_->create_network(name, shared, provider);
}

void RoutedNetworkService::delete_network(const std::string& network_id) {
    // Subnet and port creation take the same network section
    registry_->delete_network(network_id, [this, &network_id]() {
        if (binder_->has_subnets(network_id)) {
            throw NetworkInUse(network_id, "subnets still exist");
        }
        if (resolver_->has_ports(network_id)) {
            throw NetworkInUse(network_id, "ports still exist");
        }
    });
}

std::optional<Network> RoutedNetworkService::get_network(const std::string& network_id) const {
    std::optional<Network> network = registry_->get_network(network_id);
    if (network) {
        network->routed = binder_->is_routed(network_id);
    }
    return network;
}

std::vector<Network> RoutedNetworkService::list_networks() const {
    std::vector<Network> networks = registry_->list_networks();
    for (auto& network : networks) {
        network.routed = binder_->is_routed(network.id);
    }
    return networks;
}

Segment RoutedNetworkService::create_segment(const SegmentRequest& request) {
    return registry_->create_segment(request);
}

void RoutedNetworkService::delete_segment(const std::string& segment_id) {
    registry_->delete_segment(segment_id);
}

bool RoutedNetworkService::add_host_mapping(const std::string& host, const std::string& segment_id) {
    return registry_->add_host_mapping(host, segment_id);
}

bool RoutedNetworkService::remove_host_mapping(const std::string& host, const std::string& segment_id) {
    return registry_->remove_host_mapping(host, segment_id);
}

// ============================================================================
// Subnets
// ============================================================================

Subnet RoutedNetworkService::create_subnet(const SubnetRequest& request) {
    return binder_->create_subnet(request);
}

void RoutedNetworkService::delete_subnet(const std::string& subnet_id) {
    binder_->delete_subnet(subnet_id);
}

Subnet RoutedNetworkService::update_allocation_pools(
    const std::string& subnet_id,
    const std::vector<AllocationPoolSpec>& pools
) {
    return binder_->update_allocation_pools(subnet_id, pools);
}

// ============================================================================
// Ports
// ============================================================================

Port RoutedNetworkService::create_port(
    const std::string& network_id,
    const std::optional<std::vector<FixedIpRequest>>& fixed_ips,
    const std::optional<std::string>& host,
    const std::string& name
) {
    return resolver_->create_port(network_id, fixed_ips, host, name);
}

Port RoutedNetworkService::bind_host(const std::string& port_id, const std::string& host) {
    return resolver_->bind_host(port_id, host);
}

Port RoutedNetworkService::unbind_host(const std::string& port_id) {
    return resolver_->unbind_host(port_id);
}

void RoutedNetworkService::delete_port(const std::string& port_id) {
    resolver_->delete_port(port_id);
}

// ============================================================================
// Statistics
// ============================================================================

ServiceStats RoutedNetworkService::get_stats() const {
    ServiceStats stats;
    stats.networks = registry_->list_networks().size();
    stats.subnets = allocator_->get_subnet_count();
    stats.ports = resolver_->get_port_count();
    stats.pending_ports = resolver_->pending_ports().size();
    stats.degraded_segments = publisher_->degraded_segments().size();
    stats.publisher = publisher_->get_stats();
    return stats;
}

} // namespace segipam
