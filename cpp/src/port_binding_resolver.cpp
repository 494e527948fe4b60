/**
 * @file port_binding_resolver.cpp
 * @brief Implementation of immediate and deferred port address assignment
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "segipam/port_binding_resolver.hpp"
#include "segipam/exceptions.hpp"

#include <algorithm>
#include <stdexcept>

namespace segipam {

using namespace segipam::utilities;

namespace {

// IPv4 subnets first, creation order otherwise
std::vector<Subnet> ipv4_first(std::vector<Subnet> subnets) {
    std::stable_partition(subnets.begin(), subnets.end(),
        [](const Subnet& subnet) { return subnet.ip_version == 4; });
    return subnets;
}

std::string describe(const std::vector<FixedIp>& fixed_ips) {
    std::string text;
    for (const auto& fixed_ip : fixed_ips) {
        if (!text.empty()) {
            text += ", ";
        }
        text += fixed_ip.ip_address.to_string();
    }
    return text.empty() ? "no addresses" : text;
}

} // namespace

// ============================================================================
// Constructor
// ============================================================================

PortBindingResolver::PortBindingResolver(
    const IpamConfig& config,
    SegmentRegistry& registry,
    SubnetBinder& binder,
    AddressAllocator& allocator,
    std::unique_ptr<SegmentPreference> preference
)
    : config_(config)
    , registry_(registry)
    , binder_(binder)
    , allocator_(allocator)
    , preference_(std::move(preference))
{
    if (!preference_) {
        throw std::invalid_argument("PortBindingResolver requires a segment preference");
    }
}

// ============================================================================
// Port Creation
// ============================================================================

Port PortBindingResolver::create_port(
    const std::string& network_id,
    const std::optional<std::vector<FixedIpRequest>>& fixed_ips,
    const std::optional<std::string>& host,
    const std::string& name
) {
    if (host && !config::validate_name(*host)) {
        throw std::invalid_argument("Invalid host name: " + *host);
    }

    if (fixed_ips && fixed_ips->size() > config_.max_fixed_ips_per_port) {
        throw InvalidFixedIpRequest(std::to_string(fixed_ips->size()) +
            " fixed IPs exceed the limit of " + std::to_string(config_.max_fixed_ips_per_port));
    }

    Port port;
    port.id = generate_uuid();
    port.network_id = network_id;
    port.name = name;
    port.host = host;

    // Network delete checks for ports in the same section
    auto network_mutex = registry_.network_lock(network_id);
    {
        std::lock_guard<std::mutex> network_guard(*network_mutex);

        if (!registry_.has_network(network_id)) {
            throw NetworkNotFound(network_id);
        }

        const bool routed = binder_.is_routed(network_id);

        if (fixed_ips) {
            port.fixed_ips = allocate_requested(port.id, network_id, *fixed_ips, host);
        } else if (!routed) {
            port.fixed_ips = allocate_unrouted(network_id);
        } else if (host) {
            std::optional<FixedIp> fixed_ip = allocate_on_host_segments(network_id, *host);
            if (!fixed_ip) {
                log_info("PortBindingResolver: No capacity for new port on host " + *host);
                throw AllocationFailed(port.id, *host);
            }
            port.fixed_ips.push_back(*fixed_ip);
            port.allocated_by_binding = true;
        } else {
            port.ip_allocation = IpAllocation::DEFERRED;
        }

        port.state = port.fixed_ips.empty() ? PortBindingState::UNBOUND : PortBindingState::ALLOCATED;

        if (port.host) {
            retain_bindings(*port.host, port.fixed_ips);
        }

        store_port(port);
        if (port.ip_allocation == IpAllocation::DEFERRED) {
            enqueue_pending(port.id);
        }
    }

    log_info("PortBindingResolver: Created port " + port.id + " on network " + network_id +
             " (" + ModelHelpers::ip_allocation_to_string(port.ip_allocation) + ", " +
             describe(port.fixed_ips) + ")");

    std::set<std::string> touched;
    for (const auto& fixed_ip : port.fixed_ips) {
        if (auto segment_id = segment_of(fixed_ip)) {
            touched.insert(*segment_id);
        }
    }
    notify_allocation_change(touched);

    return port;
}

// ============================================================================
// Host Binding
// ============================================================================

Port PortBindingResolver::bind_host(const std::string& port_id, const std::string& host) {
    if (!config::validate_name(host)) {
        throw std::invalid_argument("Invalid host name: " + host);
    }

    auto port_mutex = port_lock(port_id);
    std::lock_guard<std::mutex> port_guard(*port_mutex);

    std::optional<Port> current = get_port(port_id);
    if (!current) {
        throw PortNotFound(port_id);
    }
    Port port = *current;

    if (port.host && *port.host == host) {
        if (port.state == PortBindingState::ALLOCATED || port.ip_allocation == IpAllocation::IMMEDIATE) {
            return port;
        }
    }

    // Existing addresses must keep working on the new host
    if (!port.fixed_ips.empty() || port.ip_allocation == IpAllocation::IMMEDIATE) {
        if (!host_compatible(host, port.fixed_ips)) {
            throw HostNotCompatibleWithFixedIps(host, port_id);
        }

        if (port.host) {
            release_bindings(*port.host, port.fixed_ips);
        }
        retain_bindings(host, port.fixed_ips);

        port.host = host;
        store_port(port);

        log_info("PortBindingResolver: Port " + port_id + " bound to host " + host);
        return port;
    }

    // Deferred port: resolve host -> segment -> address
    const PortBindingState previous_state = port.state;
    port.host = host;
    port.state = PortBindingState::HOST_BOUND;
    store_port(port);

    std::optional<FixedIp> fixed_ip;
    try {
        fixed_ip = allocate_on_host_segments(port.network_id, host);
    } catch (const NoReachableSegment&) {
        port.host.reset();
        port.state = previous_state;
        store_port(port);
        log_info("PortBindingResolver: Host " + host + " reaches no segment of network " +
                 port.network_id + " for port " + port_id);
        throw;
    }

    if (!fixed_ip) {
        port.host.reset();
        port.state = PortBindingState::ALLOCATION_FAILED;
        store_port(port);
        log_warn("PortBindingResolver: Allocation failed for port " + port_id +
                 ", every segment reachable from host " + host + " is exhausted");
        throw AllocationFailed(port_id, host);
    }

    port.fixed_ips.push_back(*fixed_ip);
    port.allocated_by_binding = true;
    port.state = PortBindingState::ALLOCATED;

    retain_bindings(host, port.fixed_ips);
    store_port(port);
    dequeue_pending(port_id);

    log_info("PortBindingResolver: Port " + port_id + " bound to host " + host +
             " with " + describe(port.fixed_ips));

    std::set<std::string> touched;
    if (auto segment_id = segment_of(*fixed_ip)) {
        touched.insert(*segment_id);
    }
    notify_allocation_change(touched);

    return port;
}

Port PortBindingResolver::unbind_host(const std::string& port_id) {
    auto port_mutex = port_lock(port_id);
    std::lock_guard<std::mutex> port_guard(*port_mutex);

    std::optional<Port> current = get_port(port_id);
    if (!current) {
        throw PortNotFound(port_id);
    }
    Port port = *current;

    if (!port.host) {
        if (port.state == PortBindingState::ALLOCATION_FAILED) {
            port.state = PortBindingState::UNBOUND;
            store_port(port);
        }
        return port;
    }

    const std::string old_host = *port.host;
    release_bindings(old_host, port.fixed_ips);
    port.host.reset();

    std::set<std::string> touched;
    if (port.allocated_by_binding) {
        touched = release_addresses(port.fixed_ips);
        port.fixed_ips.clear();
        port.allocated_by_binding = false;
        port.ip_allocation = IpAllocation::DEFERRED;
        port.state = PortBindingState::UNBOUND;
    }

    store_port(port);
    if (port.ip_allocation == IpAllocation::DEFERRED && port.fixed_ips.empty()) {
        enqueue_pending(port_id);
    }

    log_info("PortBindingResolver: Port " + port_id + " unbound from host " + old_host);
    notify_allocation_change(touched);
    return port;
}

// ============================================================================
// Port Deletion
// ============================================================================

void PortBindingResolver::delete_port(const std::string& port_id) {
    auto port_mutex = port_lock(port_id);
    std::set<std::string> touched;
    {
        std::lock_guard<std::mutex> port_guard(*port_mutex);

        std::optional<Port> port = get_port(port_id);
        if (!port) {
            throw PortNotFound(port_id);
        }

        if (port->host) {
            release_bindings(*port->host, port->fixed_ips);
        }
        touched = release_addresses(port->fixed_ips);

        std::lock_guard<std::mutex> lock(mutex_);
        ports_.erase(port_id);
        pending_.erase(std::remove(pending_.begin(), pending_.end(), port_id), pending_.end());
        port_locks_.erase(port_id);
    }

    log_info("PortBindingResolver: Deleted port " + port_id);
    notify_allocation_change(touched);
}

// ============================================================================
// Query Functions
// ============================================================================

std::optional<Port> PortBindingResolver::get_port(const std::string& port_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = ports_.find(port_id);
    if (it == ports_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t PortBindingResolver::port_lock_count() const {
    return port_locks_.size();
}

std::vector<Port> PortBindingResolver::list_ports(const std::string& network_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Port> result;
    for (const auto& [id, port] : ports_) {
        if (port.network_id == network_id) {
            result.push_back(port);
        }
    }
    return result;
}

std::vector<std::string> PortBindingResolver::pending_ports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

bool PortBindingResolver::has_ports(const std::string& network_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    return std::any_of(ports_.begin(), ports_.end(),
        [&network_id](const auto& entry) { return entry.second.network_id == network_id; });
}

size_t PortBindingResolver::get_port_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ports_.size();
}

void PortBindingResolver::set_allocation_change_callback(SegmentChangeCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    allocation_change_callback_ = std::move(callback);
}

// ============================================================================
// Private Helper Functions
// ============================================================================

std::vector<FixedIp> PortBindingResolver::allocate_requested(
    const std::string& port_id,
    const std::string& network_id,
    const std::vector<FixedIpRequest>& requests,
    const std::optional<std::string>& host
) {
    struct Resolved {
        Subnet subnet;
        std::optional<IpAddress> address;
    };

    const std::vector<Subnet> subnets = binder_.list_subnets(network_id);
    std::vector<Resolved> resolved;

    // Validate every entry before allocating anything
    for (const auto& request : requests) {
        std::optional<IpAddress> address;
        if (request.ip_address) {
            address = IpAddress::parse(*request.ip_address);
            if (!address) {
                throw InvalidFixedIpRequest("'" + *request.ip_address + "' is not an IP address");
            }
        }

        const Subnet* match = nullptr;
        if (request.subnet_id) {
            auto it = std::find_if(subnets.begin(), subnets.end(),
                [&request](const Subnet& subnet) { return subnet.id == *request.subnet_id; });
            if (it == subnets.end()) {
                throw InvalidFixedIpRequest("subnet " + *request.subnet_id +
                                            " is not on network " + network_id);
            }
            match = &*it;
            if (address && !match->cidr.contains(*address)) {
                throw InvalidFixedIpRequest(address->to_string() + " is not in subnet " +
                                            match->id + " (" + match->cidr.to_string() + ")");
            }
        } else if (address) {
            auto it = std::find_if(subnets.begin(), subnets.end(),
                [&address](const Subnet& subnet) { return subnet.cidr.contains(*address); });
            if (it == subnets.end()) {
                throw InvalidFixedIpRequest(address->to_string() +
                                            " is not in any subnet of network " + network_id);
            }
            match = &*it;
        } else {
            throw InvalidFixedIpRequest("an entry needs a subnet_id or an ip_address");
        }

        if (host && match->segment_id && !registry_.host_reaches_segment(*host, *match->segment_id)) {
            throw HostNotCompatibleWithFixedIps(*host, port_id);
        }

        resolved.push_back(Resolved{*match, address});
    }

    std::vector<FixedIp> allocated;
    try {
        for (const auto& entry : resolved) {
            IpAddress address = allocator_.allocate(entry.subnet.id, entry.address);
            allocated.push_back(FixedIp{entry.subnet.id, address});
        }
    } catch (const IpamError&) {
        release_addresses(allocated);
        throw;
    }

    return allocated;
}

std::vector<FixedIp> PortBindingResolver::allocate_unrouted(const std::string& network_id) {
    const std::vector<Subnet> subnets = ipv4_first(binder_.list_subnets(network_id));
    if (subnets.empty()) {
        return {};
    }

    for (const auto& subnet : subnets) {
        try {
            IpAddress address = allocator_.allocate(subnet.id);
            return {FixedIp{subnet.id, address}};
        } catch (const PoolExhausted&) {
            continue;
        } catch (const SubnetNotFound&) {
            continue;
        }
    }

    throw PoolExhausted(subnets.front().id);
}

std::optional<FixedIp> PortBindingResolver::allocate_on_host_segments(
    const std::string& network_id,
    const std::string& host
) {
    std::vector<Segment> segments = registry_.segments_for_host(host, network_id);
    if (segments.empty()) {
        throw NoReachableSegment(host, network_id);
    }

    for (const auto& segment : preference_->order(std::move(segments))) {
        for (const auto& subnet : ipv4_first(binder_.subnets_for_segment(segment.id))) {
            try {
                IpAddress address = allocator_.allocate(subnet.id);
                return FixedIp{subnet.id, address};
            } catch (const PoolExhausted&) {
                continue;
            } catch (const SubnetNotFound&) {
                continue;
            }
        }
        log_debug("PortBindingResolver: Segment " + segment.id + " has no free address");
    }

    return std::nullopt;
}

std::set<std::string> PortBindingResolver::release_addresses(const std::vector<FixedIp>& fixed_ips) {
    std::set<std::string> segments;
    for (const auto& fixed_ip : fixed_ips) {
        allocator_.release(fixed_ip.subnet_id, fixed_ip.ip_address);
        if (auto segment_id = segment_of(fixed_ip)) {
            segments.insert(*segment_id);
        }
    }
    return segments;
}

std::optional<std::string> PortBindingResolver::segment_of(const FixedIp& fixed_ip) const {
    std::optional<Subnet> subnet = binder_.get_subnet(fixed_ip.subnet_id);
    if (!subnet) {
        return std::nullopt;
    }
    return subnet->segment_id;
}

void PortBindingResolver::retain_bindings(const std::string& host, const std::vector<FixedIp>& fixed_ips) {
    for (const auto& fixed_ip : fixed_ips) {
        if (auto segment_id = segment_of(fixed_ip)) {
            registry_.retain_binding(host, *segment_id);
        }
    }
}

void PortBindingResolver::release_bindings(const std::string& host, const std::vector<FixedIp>& fixed_ips) {
    for (const auto& fixed_ip : fixed_ips) {
        if (auto segment_id = segment_of(fixed_ip)) {
            registry_.release_binding(host, *segment_id);
        }
    }
}

bool PortBindingResolver::host_compatible(const std::string& host, const std::vector<FixedIp>& fixed_ips) const {
    for (const auto& fixed_ip : fixed_ips) {
        auto segment_id = segment_of(fixed_ip);
        if (segment_id && !registry_.host_reaches_segment(host, *segment_id)) {
            return false;
        }
    }
    return true;
}

std::shared_ptr<std::mutex> PortBindingResolver::port_lock(const std::string& port_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (ports_.find(port_id) == ports_.end()) {
        throw PortNotFound(port_id);
    }
    return port_locks_.get(port_id);
}

void PortBindingResolver::store_port(const Port& port) {
    std::lock_guard<std::mutex> lock(mutex_);
    ports_[port.id] = port;
}

void PortBindingResolver::enqueue_pending(const std::string& port_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(pending_.begin(), pending_.end(), port_id) == pending_.end()) {
        pending_.push_back(port_id);
    }
}

void PortBindingResolver::dequeue_pending(const std::string& port_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(std::remove(pending_.begin(), pending_.end(), port_id), pending_.end());
}

void PortBindingResolver::notify_allocation_change(const std::set<std::string>& segment_ids) {
    if (segment_ids.empty()) {
        return;
    }

    SegmentChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = allocation_change_callback_;
    }

    if (!callback) {
        return;
    }

    for (const auto& segment_id : segment_ids) {
        callback(segment_id);
    }
}

} // namespace segipam
