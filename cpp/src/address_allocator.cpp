/**
 * @file address_allocator.cpp
 * @brief Implementation of per-subnet address allocation
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * First-fit allocation by ascending address
 */

#include "segipam/address_allocator.hpp"
#include "segipam/exceptions.hpp"
#include "segipam/utilities.hpp"

#include <algorithm>
#include <stdexcept>

namespace segipam {

using namespace segipam::utilities;

// ============================================================================
// Subnet Registration
// ============================================================================

void AddressAllocator::register_subnet(
    const std::string& subnet_id,
    const IpNetwork& cidr,
    const std::vector<IpRange>& pools
) {
    auto state = std::make_shared<PoolState>();
    state->cidr = cidr;
    state->pools = normalize_pools(cidr, pools);

    std::lock_guard<std::mutex> lock(mutex_);

    if (subnets_.find(subnet_id) != subnets_.end()) {
        throw std::invalid_argument("Subnet already registered: " + subnet_id);
    }

    subnets_.emplace(subnet_id, std::move(state));
    log_debug("AddressAllocator: Registered subnet " + subnet_id + " (" + cidr.to_string() + ")");
}

void AddressAllocator::unregister_subnet(
    const std::string& subnet_id,
    const std::set<IpAddress>& releasable
) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = subnets_.find(subnet_id);
    if (it == subnets_.end()) {
        throw SubnetNotFound(subnet_id);
    }

    {
        std::lock_guard<std::mutex> pool_lock(it->second->mutex);

        for (const auto& address : it->second->allocated) {
            if (releasable.count(address) == 0) {
                throw SubnetInUse(subnet_id);
            }
        }

        it->second->allocated.clear();
        it->second->removed = true;
    }

    subnets_.erase(it);
    log_debug("AddressAllocator: Unregistered subnet " + subnet_id);
}

// ============================================================================
// Address Allocation
// ============================================================================

IpAddress AddressAllocator::allocate(
    const std::string& subnet_id,
    const std::optional<IpAddress>& requested
) {
    auto state = find_state(subnet_id);
    if (!state) {
        throw SubnetNotFound(subnet_id);
    }

    std::lock_guard<std::mutex> lock(state->mutex);

    if (state->removed) {
        throw SubnetNotFound(subnet_id);
    }

    if (requested) {
        if (requested->version() != state->cidr.version() ||
            !in_pools(state->pools, *requested) ||
            state->allocated.count(*requested) > 0) {
            throw AddressNotAvailable(subnet_id, requested->to_string());
        }

        state->allocated.insert(*requested);
        return *requested;
    }

    for (const auto& pool : state->pools) {
        IpAddress candidate = pool.first;
        auto it = state->allocated.lower_bound(candidate);
        bool exhausted = false;

        // Skip the run of allocated addresses starting at candidate
        while (it != state->allocated.end() && *it == candidate) {
            if (candidate == pool.last) {
                exhausted = true;
                break;
            }
            candidate = candidate.next();
            ++it;
        }

        if (!exhausted) {
            state->allocated.insert(candidate);
            return candidate;
        }
    }

    log_debug("AddressAllocator: Subnet " + subnet_id + " exhausted");
    throw PoolExhausted(subnet_id);
}

// ============================================================================
// Address Release
// ============================================================================

bool AddressAllocator::release(const std::string& subnet_id, const IpAddress& address) {
    auto state = find_state(subnet_id);
    if (!state) {
        return false;
    }

    std::lock_guard<std::mutex> lock(state->mutex);

    auto it = state->allocated.find(address);
    if (it == state->allocated.end()) {
        return false;
    }

    state->allocated.erase(it);
    return true;
}

// ============================================================================
// Pool Management
// ============================================================================

void AddressAllocator::update_pools(const std::string& subnet_id, const std::vector<IpRange>& pools) {
    auto state = find_state(subnet_id);
    if (!state) {
        throw SubnetNotFound(subnet_id);
    }

    std::lock_guard<std::mutex> lock(state->mutex);

    if (state->removed) {
        throw SubnetNotFound(subnet_id);
    }

    auto normalized = normalize_pools(state->cidr, pools);

    for (const auto& address : state->allocated) {
        if (!in_pools(normalized, address)) {
            throw InvalidAllocationPool("allocated address " + address.to_string() +
                                        " would fall outside the new pools");
        }
    }

    state->pools = std::move(normalized);
}

std::vector<IpRange> AddressAllocator::normalize_pools(
    const IpNetwork& cidr,
    const std::vector<IpRange>& pools
) {
    std::vector<IpRange> sorted = pools;
    std::sort(sorted.begin(), sorted.end());

    for (size_t i = 0; i < sorted.size(); ++i) {
        const IpRange& pool = sorted[i];

        if (pool.first.version() != cidr.version()) {
            throw InvalidAllocationPool(pool.to_string() + " is not an IPv" +
                                        std::to_string(cidr.version()) + " range");
        }
        if (!cidr.contains(pool.first) || !cidr.contains(pool.last)) {
            throw InvalidAllocationPool(pool.to_string() + " is outside " + cidr.to_string());
        }
        if (i > 0 && sorted[i - 1].overlaps(pool)) {
            throw InvalidAllocationPool(sorted[i - 1].to_string() + " overlaps " + pool.to_string());
        }
    }

    return sorted;
}

// ============================================================================
// Query Functions
// ============================================================================

std::optional<PoolUsage> AddressAllocator::usage(const std::string& subnet_id) const {
    auto state = find_state(subnet_id);
    if (!state) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(state->mutex);

    PoolUsage result;
    for (const auto& pool : state->pools) {
        result.capacity += pool.size();
    }
    result.allocated = state->allocated.size();
    return result;
}

bool AddressAllocator::is_allocated(const std::string& subnet_id, const IpAddress& address) const {
    auto state = find_state(subnet_id);
    if (!state) {
        return false;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    return state->allocated.count(address) > 0;
}

std::vector<IpAddress> AddressAllocator::allocated_addresses(const std::string& subnet_id) const {
    auto state = find_state(subnet_id);
    if (!state) {
        return {};
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    return std::vector<IpAddress>(state->allocated.begin(), state->allocated.end());
}

std::vector<IpRange> AddressAllocator::pools(const std::string& subnet_id) const {
    auto state = find_state(subnet_id);
    if (!state) {
        return {};
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    return state->pools;
}

bool AddressAllocator::has_subnet(const std::string& subnet_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subnets_.find(subnet_id) != subnets_.end();
}

size_t AddressAllocator::get_subnet_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subnets_.size();
}

// ============================================================================
// Private Helper Functions
// ============================================================================

std::shared_ptr<AddressAllocator::PoolState> AddressAllocator::find_state(const std::string& subnet_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = subnets_.find(subnet_id);
    if (it == subnets_.end()) {
        return nullptr;
    }
    return it->second;
}

bool AddressAllocator::in_pools(const std::vector<IpRange>& pools, const IpAddress& address) {
    for (const auto& pool : pools) {
        if (pool.contains(address)) {
            return true;
        }
    }
    return false;
}

} // namespace segipam
