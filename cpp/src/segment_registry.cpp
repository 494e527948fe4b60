/**
 * @file segment_registry.cpp
 * @brief Implementation of network and segment registry
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "segipam/segment_registry.hpp"
#include "segipam/exceptions.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>

namespace segipam {

using namespace segipam::utilities;

// ============================================================================
// Constructor
// ============================================================================

SegmentRegistry::SegmentRegistry(const IpamConfig& config)
    : config_(config)
{
}

// ============================================================================
// Networks
// ============================================================================

Network SegmentRegistry::create_network(
    const std::string& name,
    bool shared,
    const std::optional<ProviderSpec>& provider
) {
    if (provider) {
        validate_segment_attributes(
            provider->network_type, provider->physical_network, provider->segmentation_id);
    }

    Network network;
    network.id = generate_uuid();
    network.name = name;
    network.shared = shared;

    std::optional<Segment> first_segment;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        NetworkEntry entry;
        entry.network = network;
        auto inserted = networks_.emplace(network.id, std::move(entry));

        if (provider) {
            SegmentRequest request;
            request.network_id = network.id;
            request.network_type = provider->network_type;
            request.physical_network = provider->physical_network;
            request.segmentation_id = provider->segmentation_id;
            try {
                first_segment = insert_segment_locked(inserted.first->second, request);
            } catch (const IpamError&) {
                networks_.erase(inserted.first);
                throw;
            }
        }
    }

    log_info("SegmentRegistry: Created network " + network.id +
             (first_segment ? " with segment " + first_segment->id : std::string()));
    return network;
}

void SegmentRegistry::delete_network(const std::string& network_id,
                                     const std::function<void()>& precondition) {
    auto network_mutex = network_lock(network_id);
    std::vector<std::string> removed_segments;

    {
        std::lock_guard<std::mutex> network_guard(*network_mutex);

        // A concurrent delete may have won the section
        if (!has_network(network_id)) {
            throw NetworkNotFound(network_id);
        }
        if (precondition) {
            precondition();
        }

        std::lock_guard<std::mutex> lock(mutex_);

        auto it = networks_.find(network_id);
        if (it == networks_.end()) {
            throw NetworkNotFound(network_id);
        }

        for (const auto& segment_id : it->second.segment_ids) {
            const SegmentEntry& entry = segments_.at(segment_id);
            if (entry.subnet_refs > 0) {
                throw NetworkInUse(network_id, "segment " + segment_id + " has subnets");
            }
            if (live_bindings_locked(entry) > 0) {
                throw NetworkInUse(network_id, "segment " + segment_id + " has bound ports");
            }
        }

        removed_segments = it->second.segment_ids;
        for (const auto& segment_id : removed_segments) {
            segments_.erase(segment_id);
        }
        networks_.erase(it);
        network_locks_.erase(network_id);
    }

    log_info("SegmentRegistry: Deleted network " + network_id);

    for (const auto& segment_id : removed_segments) {
        notify_mapping_change(segment_id);
    }
}

std::optional<Network> SegmentRegistry::get_network(const std::string& network_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = networks_.find(network_id);
    if (it == networks_.end()) {
        return std::nullopt;
    }
    return it->second.network;
}

std::vector<Network> SegmentRegistry::list_networks() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Network> result;
    result.reserve(networks_.size());
    for (const auto& [id, entry] : networks_) {
        result.push_back(entry.network);
    }
    return result;
}

bool SegmentRegistry::has_network(const std::string& network_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return networks_.find(network_id) != networks_.end();
}

std::shared_ptr<std::mutex> SegmentRegistry::network_lock(const std::string& network_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Entries live exactly as long as their network
    if (networks_.find(network_id) == networks_.end()) {
        throw NetworkNotFound(network_id);
    }
    return network_locks_.get(network_id);
}

size_t SegmentRegistry::network_lock_count() const {
    return network_locks_.size();
}

// ============================================================================
// Segments
// ============================================================================

Segment SegmentRegistry::create_segment(const SegmentRequest& request) {
    validate_segment_attributes(
        request.network_type, request.physical_network, request.segmentation_id);

    auto network_mutex = network_lock(request.network_id);
    std::lock_guard<std::mutex> network_guard(*network_mutex);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = networks_.find(request.network_id);
    if (it == networks_.end()) {
        throw NetworkNotFound(request.network_id);
    }

    Segment segment = insert_segment_locked(it->second, request);

    log_info("SegmentRegistry: Created segment " + segment.id + " (" +
             ModelHelpers::segment_type_to_string(segment.network_type) +
             ") on network " + segment.network_id);
    return segment;
}

void SegmentRegistry::delete_segment(const std::string& segment_id) {
    std::string network_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = segments_.find(segment_id);
        if (it == segments_.end()) {
            throw SegmentNotFound(segment_id);
        }
        network_id = it->second.segment.network_id;
    }

    std::shared_ptr<std::mutex> network_mutex;
    try {
        network_mutex = network_lock(network_id);
    } catch (const NetworkNotFound&) {
        throw SegmentNotFound(segment_id);
    }
    {
        std::lock_guard<std::mutex> network_guard(*network_mutex);
        std::lock_guard<std::mutex> lock(mutex_);

        // Re-check under the network section
        auto it = segments_.find(segment_id);
        if (it == segments_.end()) {
            throw SegmentNotFound(segment_id);
        }

        if (it->second.subnet_refs > 0) {
            throw SegmentInUse(segment_id,
                std::to_string(it->second.subnet_refs) + " subnet(s) reference it");
        }

        size_t live = live_bindings_locked(it->second);
        if (live > 0) {
            throw SegmentInUse(segment_id,
                std::to_string(live) + " port binding(s) depend on it");
        }

        auto network_it = networks_.find(network_id);
        if (network_it != networks_.end()) {
            auto& ids = network_it->second.segment_ids;
            ids.erase(std::remove(ids.begin(), ids.end(), segment_id), ids.end());
        }

        segments_.erase(it);
    }

    log_info("SegmentRegistry: Deleted segment " + segment_id);
    notify_mapping_change(segment_id);
}

std::optional<Segment> SegmentRegistry::get_segment(const std::string& segment_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = segments_.find(segment_id);
    if (it == segments_.end()) {
        return std::nullopt;
    }
    return it->second.segment;
}

std::vector<Segment> SegmentRegistry::list_segments(
    const std::string& network_id,
    const std::optional<std::string>& marker,
    size_t limit
) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = networks_.find(network_id);
    if (it == networks_.end()) {
        throw NetworkNotFound(network_id);
    }

    const auto& ids = it->second.segment_ids;
    auto start = ids.begin();
    if (marker) {
        start = std::find(ids.begin(), ids.end(), *marker);
        if (start == ids.end()) {
            throw SegmentNotFound(*marker);
        }
        ++start;
    }

    std::vector<Segment> result;
    for (auto id_it = start; id_it != ids.end(); ++id_it) {
        if (limit > 0 && result.size() >= limit) {
            break;
        }
        result.push_back(segments_.at(*id_it).segment);
    }
    return result;
}

Segment SegmentRegistry::update_segment_name(
    const std::string& segment_id,
    const std::string& name,
    const std::string& description
) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = segments_.find(segment_id);
    if (it == segments_.end()) {
        throw SegmentNotFound(segment_id);
    }

    it->second.segment.name = name;
    it->second.segment.description = description;
    return it->second.segment;
}

// ============================================================================
// Host Mappings
// ============================================================================

bool SegmentRegistry::add_host_mapping(const std::string& host, const std::string& segment_id) {
    if (!config::validate_name(host)) {
        throw std::invalid_argument("Invalid host name: " + host);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = segments_.find(segment_id);
        if (it == segments_.end()) {
            throw SegmentNotFound(segment_id);
        }

        if (!it->second.hosts.insert(host).second) {
            return false;
        }
    }

    log_debug("SegmentRegistry: Host " + host + " mapped to segment " + segment_id);
    notify_mapping_change(segment_id);
    return true;
}

bool SegmentRegistry::remove_host_mapping(const std::string& host, const std::string& segment_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = segments_.find(segment_id);
        if (it == segments_.end()) {
            throw SegmentNotFound(segment_id);
        }

        auto binding = it->second.bindings.find(host);
        if (binding != it->second.bindings.end() && binding->second > 0) {
            throw SegmentInUse(segment_id,
                "host " + host + " has " + std::to_string(binding->second) + " bound port(s)");
        }

        if (it->second.hosts.erase(host) == 0) {
            return false;
        }
    }

    log_debug("SegmentRegistry: Host " + host + " unmapped from segment " + segment_id);
    notify_mapping_change(segment_id);
    return true;
}

std::vector<Segment> SegmentRegistry::segments_for_host(
    const std::string& host,
    const std::string& network_id
) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Segment> result;

    auto it = networks_.find(network_id);
    if (it == networks_.end()) {
        return result;
    }

    for (const auto& segment_id : it->second.segment_ids) {
        const SegmentEntry& entry = segments_.at(segment_id);
        if (entry.hosts.count(host) > 0) {
            result.push_back(entry.segment);
        }
    }
    return result;
}

std::vector<std::string> SegmentRegistry::hosts_for_segment(const std::string& segment_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = segments_.find(segment_id);
    if (it == segments_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.hosts.begin(), it->second.hosts.end());
}

bool SegmentRegistry::host_reaches_segment(const std::string& host, const std::string& segment_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = segments_.find(segment_id);
    return it != segments_.end() && it->second.hosts.count(host) > 0;
}

// ============================================================================
// References
// ============================================================================

void SegmentRegistry::retain_subnet_reference(const std::string& segment_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = segments_.find(segment_id);
    if (it == segments_.end()) {
        throw SegmentNotFound(segment_id);
    }
    it->second.subnet_refs++;
}

void SegmentRegistry::release_subnet_reference(const std::string& segment_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = segments_.find(segment_id);
    if (it != segments_.end() && it->second.subnet_refs > 0) {
        it->second.subnet_refs--;
    }
}

void SegmentRegistry::retain_binding(const std::string& host, const std::string& segment_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = segments_.find(segment_id);
    if (it == segments_.end()) {
        throw SegmentNotFound(segment_id);
    }
    it->second.bindings[host]++;
}

void SegmentRegistry::release_binding(const std::string& host, const std::string& segment_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = segments_.find(segment_id);
    if (it == segments_.end()) {
        return;
    }

    auto binding = it->second.bindings.find(host);
    if (binding == it->second.bindings.end()) {
        return;
    }

    if (--binding->second == 0) {
        it->second.bindings.erase(binding);
    }
}

size_t SegmentRegistry::subnet_reference_count(const std::string& segment_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = segments_.find(segment_id);
    return it == segments_.end() ? 0 : it->second.subnet_refs;
}

size_t SegmentRegistry::binding_count(const std::string& segment_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = segments_.find(segment_id);
    return it == segments_.end() ? 0 : live_bindings_locked(it->second);
}

void SegmentRegistry::set_mapping_change_callback(SegmentChangeCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    mapping_change_callback_ = std::move(callback);
}

// ============================================================================
// Private Helper Functions
// ============================================================================

void SegmentRegistry::validate_segment_attributes(
    SegmentType type,
    const std::optional<std::string>& physical_network,
    const std::optional<uint32_t>& segmentation_id
) const {
    const std::string type_name = ModelHelpers::segment_type_to_string(type);

    if (ModelHelpers::requires_physical_network(type)) {
        if (!physical_network || physical_network->empty()) {
            throw InvalidSegmentDefinition(type_name + " segments require a physical network");
        }
        if (!config::validate_name(*physical_network)) {
            throw InvalidSegmentDefinition("invalid physical network name '" + *physical_network + "'");
        }
    } else if (physical_network && !physical_network->empty()) {
        throw InvalidSegmentDefinition(type_name + " segments cannot have a physical network");
    }

    if (!ModelHelpers::requires_segmentation_id(type)) {
        if (segmentation_id) {
            throw InvalidSegmentationId(type_name + " segments cannot have a segmentation ID");
        }
        return;
    }

    if (!segmentation_id) {
        throw InvalidSegmentationId(type_name + " segments require a segmentation ID");
    }

    const SegmentationRange* range = nullptr;
    switch (type) {
        case SegmentType::VLAN: range = &config_.vlan_range; break;
        case SegmentType::VXLAN: range = &config_.vxlan_range; break;
        case SegmentType::GRE: range = &config_.gre_range; break;
        default: break;
    }

    if (range && !range->contains(*segmentation_id)) {
        throw InvalidSegmentationId(std::to_string(*segmentation_id) + " is outside " +
            type_name + " range " + std::to_string(range->min) + "-" + std::to_string(range->max));
    }
}

Segment SegmentRegistry::insert_segment_locked(NetworkEntry& network, const SegmentRequest& request) {
    const bool has_physnet = request.physical_network && !request.physical_network->empty();

    for (const auto& [id, entry] : segments_) {
        const Segment& existing = entry.segment;
        const bool same_physnet = has_physnet
            ? existing.physical_network && *existing.physical_network == *request.physical_network
            : !existing.physical_network;

        if (has_physnet && same_physnet && existing.network_id == network.network.id) {
            throw DuplicatePhysicalNetwork(network.network.id, *request.physical_network);
        }

        // One segment per (type, physical network, segmentation ID)
        if (same_physnet && existing.network_type == request.network_type &&
            existing.segmentation_id && request.segmentation_id &&
            *existing.segmentation_id == *request.segmentation_id) {
            throw InvalidSegmentationId(std::to_string(*request.segmentation_id) +
                " is already in use" +
                (has_physnet ? " on physical network " + *request.physical_network : std::string()));
        }
    }

    Segment segment;
    segment.id = generate_uuid();
    segment.network_id = network.network.id;
    segment.name = request.name;
    segment.description = request.description;
    segment.network_type = request.network_type;
    segment.physical_network = has_physnet ? request.physical_network : std::nullopt;
    segment.segmentation_id = request.segmentation_id;
    segment.segment_index = network.next_segment_index++;

    SegmentEntry entry;
    entry.segment = segment;
    segments_.emplace(segment.id, std::move(entry));
    network.segment_ids.push_back(segment.id);

    return segment;
}

size_t SegmentRegistry::live_bindings_locked(const SegmentEntry& entry) const {
    size_t total = 0;
    for (const auto& [host, count] : entry.bindings) {
        total += count;
    }
    return total;
}

void SegmentRegistry::notify_mapping_change(const std::string& segment_id) {
    SegmentChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = mapping_change_callback_;
    }

    if (callback) {
        callback(segment_id);
    }
}

} // namespace segipam
