/**
 * @file exceptions.hpp
 * @brief Error taxonomy for segment-aware IPAM operations
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every rejected operation throws a subclass of IpamError before any state
 * is mutated. The category tells callers whether retrying with different
 * parameters (or a different host) can succeed.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace segipam {

/**
 * @brief Broad classification of IPAM errors
 */
enum class ErrorCategory {
    VALIDATION,     ///< Request violates an invariant; nothing was changed
    NOT_FOUND,      ///< Referenced entity does not exist
    CONFLICT,       ///< Entity is still referenced by live state
    RESOURCE,       ///< No capacity; retry with other parameters or host
    INTEGRATION     ///< External inventory store failure
};

/**
 * @brief Convert category to lowercase name
 */
const char* error_category_name(ErrorCategory category);

/**
 * @brief Base class of all IPAM errors
 */
class IpamError : public std::runtime_error {
public:
    IpamError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message)
        , category_(category)
    {}

    ErrorCategory category() const { return category_; }

private:
    ErrorCategory category_;
};

// ============================================================================
// Not found
// ============================================================================

class NetworkNotFound : public IpamError {
public:
    explicit NetworkNotFound(const std::string& network_id)
        : IpamError(ErrorCategory::NOT_FOUND, "Network " + network_id + " could not be found")
    {}
};

class SegmentNotFound : public IpamError {
public:
    explicit SegmentNotFound(const std::string& segment_id)
        : IpamError(ErrorCategory::NOT_FOUND, "Segment " + segment_id + " could not be found")
    {}
};

class SubnetNotFound : public IpamError {
public:
    explicit SubnetNotFound(const std::string& subnet_id)
        : IpamError(ErrorCategory::NOT_FOUND, "Subnet " + subnet_id + " could not be found")
    {}
};

class PortNotFound : public IpamError {
public:
    explicit PortNotFound(const std::string& port_id)
        : IpamError(ErrorCategory::NOT_FOUND, "Port " + port_id + " could not be found")
    {}
};

// ============================================================================
// Validation
// ============================================================================

class DuplicatePhysicalNetwork : public IpamError {
public:
    DuplicatePhysicalNetwork(const std::string& network_id, const std::string& physical_network)
        : IpamError(ErrorCategory::VALIDATION,
            "Network " + network_id + " already has a segment on physical network '" +
            physical_network + "'")
    {}
};

class InvalidSegmentationId : public IpamError {
public:
    explicit InvalidSegmentationId(const std::string& reason)
        : IpamError(ErrorCategory::VALIDATION, "Invalid segmentation ID: " + reason)
    {}
};

class InvalidSegmentDefinition : public IpamError {
public:
    explicit InvalidSegmentDefinition(const std::string& reason)
        : IpamError(ErrorCategory::VALIDATION, "Invalid segment: " + reason)
    {}
};

class InvalidSegmentReference : public IpamError {
public:
    InvalidSegmentReference(const std::string& network_id, const std::string& segment_id)
        : IpamError(ErrorCategory::VALIDATION,
            "The subnet's network id, '" + network_id +
            "', doesn't match the network_id of segment '" + segment_id + "'")
    {}
};

class SegmentBindingMismatch : public IpamError {
public:
    explicit SegmentBindingMismatch(const std::string& network_id)
        : IpamError(ErrorCategory::VALIDATION,
            "All of the subnets on network '" + network_id +
            "' must either all be associated with segments or all not associated with any segment")
    {}
};

class InvalidCidr : public IpamError {
public:
    explicit InvalidCidr(const std::string& reason)
        : IpamError(ErrorCategory::VALIDATION, "Invalid CIDR: " + reason)
    {}
};

class InvalidGateway : public IpamError {
public:
    explicit InvalidGateway(const std::string& reason)
        : IpamError(ErrorCategory::VALIDATION, "Invalid gateway: " + reason)
    {}
};

class InvalidAllocationPool : public IpamError {
public:
    explicit InvalidAllocationPool(const std::string& reason)
        : IpamError(ErrorCategory::VALIDATION, "Invalid allocation pool: " + reason)
    {}
};

class InvalidFixedIpRequest : public IpamError {
public:
    explicit InvalidFixedIpRequest(const std::string& reason)
        : IpamError(ErrorCategory::VALIDATION, "Invalid fixed IP request: " + reason)
    {}
};

class HostNotCompatibleWithFixedIps : public IpamError {
public:
    HostNotCompatibleWithFixedIps(const std::string& host, const std::string& port_id)
        : IpamError(ErrorCategory::VALIDATION,
            "Host " + host + " is not connected to a segment where the existing fixed_ips on port " +
            port_id + " will function given the routed network topology")
    {}
};

// ============================================================================
// Conflict
// ============================================================================

class SegmentInUse : public IpamError {
public:
    SegmentInUse(const std::string& segment_id, const std::string& reason)
        : IpamError(ErrorCategory::CONFLICT, "Segment " + segment_id + " is in use: " + reason)
    {}
};

class SubnetInUse : public IpamError {
public:
    explicit SubnetInUse(const std::string& subnet_id)
        : IpamError(ErrorCategory::CONFLICT,
            "Subnet " + subnet_id + " still has addresses allocated to ports")
    {}
};

class NetworkInUse : public IpamError {
public:
    NetworkInUse(const std::string& network_id, const std::string& reason)
        : IpamError(ErrorCategory::CONFLICT, "Network " + network_id + " is in use: " + reason)
    {}
};

// ============================================================================
// Resource
// ============================================================================

class AddressNotAvailable : public IpamError {
public:
    AddressNotAvailable(const std::string& subnet_id, const std::string& address)
        : IpamError(ErrorCategory::RESOURCE,
            "Address " + address + " is not available on subnet " + subnet_id)
    {}
};

class PoolExhausted : public IpamError {
public:
    explicit PoolExhausted(const std::string& subnet_id)
        : IpamError(ErrorCategory::RESOURCE,
            "No more IP addresses available on subnet " + subnet_id)
    {}
};

class NoReachableSegment : public IpamError {
public:
    NoReachableSegment(const std::string& host, const std::string& network_id)
        : IpamError(ErrorCategory::RESOURCE,
            "Host " + host + " is not connected to any segments on routed provider network '" +
            network_id + "'.  It should be connected to one.")
    {}
};

class AllocationFailed : public IpamError {
public:
    AllocationFailed(const std::string& port_id, const std::string& host)
        : IpamError(ErrorCategory::RESOURCE,
            "No address available for port " + port_id + " on any segment reachable from host " + host)
    {}
};

// ============================================================================
// Integration
// ============================================================================

class InventoryStoreError : public IpamError {
public:
    explicit InventoryStoreError(const std::string& reason)
        : IpamError(ErrorCategory::INTEGRATION, "Inventory store error: " + reason)
    {}
};

} // namespace segipam
