/**
 * @file subnet_binder.cpp
 * @brief Implementation of subnet creation, deletion and pool updates
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "segipam/subnet_binder.hpp"
#include "segipam/exceptions.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace segipam {

using namespace segipam::utilities;

// ============================================================================
// Constructor
// ============================================================================

SubnetBinder::SubnetBinder(
    const IpamConfig& config,
    SegmentRegistry& registry,
    AddressAllocator& allocator
)
    : config_(config)
    , registry_(registry)
    , allocator_(allocator)
{
}

// ============================================================================
// Subnet Lifecycle
// ============================================================================

Subnet SubnetBinder::create_subnet(const SubnetRequest& request) {
    if (!registry_.has_network(request.network_id)) {
        throw NetworkNotFound(request.network_id);
    }

    auto cidr = IpNetwork::parse(request.cidr);
    if (!cidr) {
        throw InvalidCidr("'" + request.cidr + "' is not a canonical CIDR");
    }

    if (request.ip_version && *request.ip_version != cidr->version()) {
        throw InvalidCidr("ip_version " + std::to_string(*request.ip_version) +
                          " does not match " + cidr->to_string());
    }

    Subnet subnet;
    subnet.id = generate_uuid();
    subnet.network_id = request.network_id;
    subnet.name = request.name;
    subnet.segment_id = request.segment_id;
    subnet.cidr = *cidr;
    subnet.ip_version = cidr->version();
    subnet.gateway_ip = resolve_gateway(*cidr, request);
    subnet.allocation_pools = request.allocation_pools.empty()
        ? default_pools(*cidr, subnet.gateway_ip)
        : parse_pools(*cidr, subnet.gateway_ip, request.allocation_pools);
    subnet.enable_dhcp = request.enable_dhcp;

    auto network_mutex = registry_.network_lock(request.network_id);
    {
        std::lock_guard<std::mutex> network_guard(*network_mutex);

        if (!registry_.has_network(request.network_id)) {
            throw NetworkNotFound(request.network_id);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto existing = network_subnets_.find(request.network_id);
            if (existing != network_subnets_.end() && !existing->second.empty()) {
                const Subnet& first = subnets_.at(existing->second.front());
                if (first.segment_id.has_value() != request.segment_id.has_value()) {
                    log_debug("SubnetBinder: Rejected subnet " + request.cidr +
                              " on network " + request.network_id + " (mixed segment binding)");
                    throw SegmentBindingMismatch(request.network_id);
                }

                for (const auto& subnet_id : existing->second) {
                    const Subnet& other = subnets_.at(subnet_id);
                    if (other.cidr.overlaps(*cidr)) {
                        throw InvalidCidr(cidr->to_string() + " overlaps subnet " + other.id +
                                          " (" + other.cidr.to_string() + ")");
                    }
                }
            }
        }

        if (request.segment_id) {
            auto segment = registry_.get_segment(*request.segment_id);
            if (!segment) {
                throw SegmentNotFound(*request.segment_id);
            }
            if (segment->network_id != request.network_id) {
                throw InvalidSegmentReference(request.network_id, *request.segment_id);
            }
        }

        allocator_.register_subnet(subnet.id, subnet.cidr, subnet.allocation_pools);

        if (subnet.segment_id) {
            registry_.retain_subnet_reference(*subnet.segment_id);
        }

        if (subnet.enable_dhcp && config_.reserve_dhcp_address) {
            try {
                subnet.dhcp_address = allocator_.allocate(subnet.id);
            } catch (const PoolExhausted&) {
                log_debug("SubnetBinder: No address left for DHCP on subnet " + subnet.id);
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        subnets_.emplace(subnet.id, subnet);
        network_subnets_[subnet.network_id].push_back(subnet.id);
    }

    log_info("SubnetBinder: Created subnet " + subnet.id + " (" + subnet.cidr.to_string() +
             ") on network " + subnet.network_id +
             (subnet.segment_id ? " segment " + *subnet.segment_id : std::string()));

    notify_pool_change(subnet.segment_id);
    return subnet;
}

void SubnetBinder::delete_subnet(const std::string& subnet_id) {
    std::optional<Subnet> subnet = get_subnet(subnet_id);
    if (!subnet) {
        throw SubnetNotFound(subnet_id);
    }

    std::shared_ptr<std::mutex> network_mutex;
    try {
        network_mutex = registry_.network_lock(subnet->network_id);
    } catch (const NetworkNotFound&) {
        throw SubnetNotFound(subnet_id);
    }
    {
        std::lock_guard<std::mutex> network_guard(*network_mutex);

        std::set<IpAddress> releasable;
        if (subnet->dhcp_address) {
            releasable.insert(*subnet->dhcp_address);
        }

        allocator_.unregister_subnet(subnet_id, releasable);

        if (subnet->segment_id) {
            registry_.release_subnet_reference(*subnet->segment_id);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        subnets_.erase(subnet_id);

        auto it = network_subnets_.find(subnet->network_id);
        if (it != network_subnets_.end()) {
            auto& ids = it->second;
            ids.erase(std::remove(ids.begin(), ids.end(), subnet_id), ids.end());
            if (ids.empty()) {
                network_subnets_.erase(it);
            }
        }
    }

    log_info("SubnetBinder: Deleted subnet " + subnet_id);
    notify_pool_change(subnet->segment_id);
}

Subnet SubnetBinder::update_allocation_pools(
    const std::string& subnet_id,
    const std::vector<AllocationPoolSpec>& pools
) {
    std::optional<Subnet> current = get_subnet(subnet_id);
    if (!current) {
        throw SubnetNotFound(subnet_id);
    }

    auto parsed = parse_pools(current->cidr, current->gateway_ip, pools);
    allocator_.update_pools(subnet_id, parsed);

    Subnet updated;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = subnets_.find(subnet_id);
        if (it == subnets_.end()) {
            throw SubnetNotFound(subnet_id);
        }
        it->second.allocation_pools = allocator_.pools(subnet_id);
        updated = it->second;
    }

    log_info("SubnetBinder: Updated allocation pools of subnet " + subnet_id);
    notify_pool_change(updated.segment_id);
    return updated;
}

// ============================================================================
// Query Functions
// ============================================================================

std::optional<Subnet> SubnetBinder::get_subnet(const std::string& subnet_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = subnets_.find(subnet_id);
    if (it == subnets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Subnet> SubnetBinder::list_subnets(const std::string& network_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Subnet> result;
    auto it = network_subnets_.find(network_id);
    if (it == network_subnets_.end()) {
        return result;
    }

    for (const auto& subnet_id : it->second) {
        result.push_back(subnets_.at(subnet_id));
    }
    return result;
}

std::vector<Subnet> SubnetBinder::subnets_for_segment(const std::string& segment_id) const {
    std::optional<Segment> segment = registry_.get_segment(segment_id);
    if (!segment) {
        return {};
    }

    std::vector<Subnet> result;
    for (const auto& subnet : list_subnets(segment->network_id)) {
        if (subnet.segment_id && *subnet.segment_id == segment_id) {
            result.push_back(subnet);
        }
    }
    return result;
}

bool SubnetBinder::is_routed(const std::string& network_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = network_subnets_.find(network_id);
    if (it == network_subnets_.end() || it->second.empty()) {
        return false;
    }
    return subnets_.at(it->second.front()).segment_id.has_value();
}

bool SubnetBinder::has_subnets(const std::string& network_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = network_subnets_.find(network_id);
    return it != network_subnets_.end() && !it->second.empty();
}

void SubnetBinder::set_pool_change_callback(SegmentChangeCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    pool_change_callback_ = std::move(callback);
}

// ============================================================================
// Private Helper Functions
// ============================================================================

std::optional<IpAddress> SubnetBinder::resolve_gateway(const IpNetwork& cidr, const SubnetRequest& request) {
    if (request.disable_gateway) {
        if (request.gateway_ip) {
            throw InvalidGateway("gateway_ip given for a subnet without gateway");
        }
        return std::nullopt;
    }

    const IpRange hosts = cidr.host_range();

    if (!request.gateway_ip) {
        return hosts.first;
    }

    auto gateway = IpAddress::parse(*request.gateway_ip);
    if (!gateway) {
        throw InvalidGateway("'" + *request.gateway_ip + "' is not an IP address");
    }
    if (!hosts.contains(*gateway)) {
        throw InvalidGateway(gateway->to_string() + " is not a host address of " + cidr.to_string());
    }
    return gateway;
}

std::vector<IpRange> SubnetBinder::default_pools(
    const IpNetwork& cidr,
    const std::optional<IpAddress>& gateway
) {
    const IpRange hosts = cidr.host_range();

    if (!gateway || !hosts.contains(*gateway)) {
        return {hosts};
    }

    std::vector<IpRange> pools;
    if (hosts.first < *gateway) {
        pools.emplace_back(hosts.first, gateway->prev());
    }
    if (*gateway < hosts.last) {
        pools.emplace_back(gateway->next(), hosts.last);
    }
    return pools;
}

std::vector<IpRange> SubnetBinder::parse_pools(
    const IpNetwork& cidr,
    const std::optional<IpAddress>& gateway,
    const std::vector<AllocationPoolSpec>& pools
) {
    std::vector<IpRange> ranges;
    ranges.reserve(pools.size());

    for (const auto& spec : pools) {
        try {
            ranges.push_back(IpRange::from_strings(spec.start, spec.end));
        } catch (const std::invalid_argument& e) {
            throw InvalidAllocationPool(spec.start + "-" + spec.end + ": " + e.what());
        }
    }

    ranges = AddressAllocator::normalize_pools(cidr, ranges);

    const IpRange hosts = cidr.host_range();
    for (const auto& range : ranges) {
        if (!hosts.contains(range.first) || !hosts.contains(range.last)) {
            throw InvalidAllocationPool(range.to_string() +
                                        " includes the network or broadcast address of " +
                                        cidr.to_string());
        }
        if (gateway && range.contains(*gateway)) {
            throw InvalidAllocationPool(range.to_string() + " contains the gateway " +
                                        gateway->to_string());
        }
    }

    return ranges;
}

void SubnetBinder::notify_pool_change(const std::optional<std::string>& segment_id) {
    if (!segment_id) {
        return;
    }

    SegmentChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = pool_change_callback_;
    }

    if (callback) {
        callback(*segment_id);
    }
}

} // namespace segipam
