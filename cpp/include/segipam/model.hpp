/**
 * @file model.hpp
 * @brief Data model for routed provider networks
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Plain value types shared by all components:
 * - Networks and their layer-2 segments
 * - Subnets and allocation pools
 * - Ports, fixed IPs and the deferred allocation state machine
 */

#pragma once

#include "segipam/ip_address.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace segipam {

/**
 * @brief Segmentation (network) type of a layer-2 segment
 */
enum class SegmentType {
    FLAT,       ///< Untagged, requires a physical network
    VLAN,       ///< 802.1Q tagged, requires a physical network
    VXLAN,      ///< Overlay, no physical network
    GRE,        ///< Overlay, no physical network
    LOCAL       ///< Host-local, no physical network
};

/**
 * @brief Provider attributes used to create the first segment with a network
 */
struct ProviderSpec {
    SegmentType network_type = SegmentType::FLAT;
    std::optional<std::string> physical_network;
    std::optional<uint32_t> segmentation_id;
};

/**
 * @brief Logical network
 */
struct Network {
    std::string id;                 ///< Network UUID
    std::string name;               ///< Human-readable name
    bool shared = false;            ///< Shared across tenants
    bool routed = false;            ///< Has segment-bound subnets (derived, filled by the service)
};

/**
 * @brief Single layer-2 broadcast domain of a network
 */
struct Segment {
    std::string id;                                 ///< Segment UUID
    std::string network_id;                         ///< Owning network
    std::string name;                               ///< Optional name
    std::string description;                        ///< Optional description
    SegmentType network_type = SegmentType::FLAT;   ///< Segmentation type
    std::optional<std::string> physical_network;    ///< Physical network name
    std::optional<uint32_t> segmentation_id;        ///< VLAN/VNI/key
    uint32_t segment_index = 0;                     ///< Declaration order within network
};

/**
 * @brief Segment creation request
 */
struct SegmentRequest {
    std::string network_id;
    SegmentType network_type = SegmentType::FLAT;
    std::optional<std::string> physical_network;
    std::optional<uint32_t> segmentation_id;
    std::string name;
    std::string description;
};

/**
 * @brief Allocation pool boundaries as text
 */
struct AllocationPoolSpec {
    std::string start;
    std::string end;
};

/**
 * @brief Subnet creation request
 */
struct SubnetRequest {
    std::string network_id;
    std::optional<std::string> segment_id;          ///< Null for non-routed networks
    std::string cidr;
    std::string name;
    std::optional<int> ip_version;                  ///< Must match the CIDR when given
    std::optional<std::string> gateway_ip;          ///< Defaults to first host address
    bool disable_gateway = false;                   ///< Create without gateway
    std::vector<AllocationPoolSpec> allocation_pools;   ///< Empty for default pools
    bool enable_dhcp = true;
};

/**
 * @brief Subnet bound (optionally) to a segment
 */
struct Subnet {
    std::string id;
    std::string network_id;
    std::string name;
    std::optional<std::string> segment_id;          ///< Immutable after creation
    IpNetwork cidr;
    int ip_version = 4;
    std::optional<IpAddress> gateway_ip;
    std::vector<IpRange> allocation_pools;          ///< Ascending, non-overlapping
    bool enable_dhcp = true;
    std::optional<IpAddress> dhcp_address;          ///< Address held for the DHCP port
};

/**
 * @brief How a port's addresses are assigned
 */
enum class IpAllocation {
    IMMEDIATE,      ///< Addresses assigned at creation
    DEFERRED        ///< Addresses assigned once the binding host is known
};

/**
 * @brief Port state from the IP allocation perspective
 */
enum class PortBindingState {
    UNBOUND,            ///< No host, no address
    HOST_BOUND,         ///< Host known, segment resolution in progress
    ALLOCATED,          ///< Address assigned
    ALLOCATION_FAILED   ///< No capacity on any segment reachable from the host
};

/**
 * @brief One fixed address of a port
 */
struct FixedIp {
    std::string subnet_id;
    IpAddress ip_address;
};

/**
 * @brief Requested fixed address (either field may be left empty)
 */
struct FixedIpRequest {
    std::optional<std::string> subnet_id;
    std::optional<std::string> ip_address;
};

/**
 * @brief Network port
 */
struct Port {
    std::string id;
    std::string network_id;
    std::string name;
    std::optional<std::string> host;                ///< Binding host
    IpAllocation ip_allocation = IpAllocation::IMMEDIATE;
    PortBindingState state = PortBindingState::UNBOUND;
    std::vector<FixedIp> fixed_ips;
    bool allocated_by_binding = false;              ///< fixed_ips came from a host binding
};

/**
 * @brief Notification that a segment's allocation state or mappings changed
 */
using SegmentChangeCallback = std::function<void(const std::string& segment_id)>;

/**
 * @brief Conversion helpers for model enums
 */
class ModelHelpers {
public:
    static std::string segment_type_to_string(SegmentType type);
    static std::optional<SegmentType> string_to_segment_type(const std::string& str);

    static std::string ip_allocation_to_string(IpAllocation allocation);

    static std::string port_state_to_string(PortBindingState state);
    static std::optional<PortBindingState> string_to_port_state(const std::string& str);

    /**
     * @brief Whether segments of this type are bound to a physical network
     */
    static bool requires_physical_network(SegmentType type);

    /**
     * @brief Whether segments of this type carry a segmentation ID
     */
    static bool requires_segmentation_id(SegmentType type);
};

} // namespace segipam
