/**
 * @file descriptors.hpp
 * @brief JSON boundary descriptors for segments, subnets, ports and inventory
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Field names follow the networking API attribute names so an API layer
 * can pass descriptors through unchanged.
 */

#pragma once

#include "segipam/inventory_store.hpp"
#include "segipam/model.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace segipam {

/**
 * @brief Segment descriptor
 */
struct SegmentDescriptor {
    std::string id;
    std::string network_id;
    std::optional<std::string> physical_network;
    std::string network_type;
    std::optional<uint32_t> segmentation_id;
    std::string name;

    static SegmentDescriptor from_segment(const Segment& segment);

    std::string to_json() const;
    static std::optional<SegmentDescriptor> from_json(const std::string& json);

    /**
     * @brief Creation request carried by this descriptor
     * @return Request or std::nullopt if network_type is unknown
     */
    std::optional<SegmentRequest> to_request() const;
};

/**
 * @brief Subnet descriptor (conventional subnet fields plus segment_id)
 */
struct SubnetDescriptor {
    std::string id;
    std::string network_id;
    std::optional<std::string> segment_id;
    std::string name;
    std::string cidr;
    int ip_version = 4;
    std::optional<std::string> gateway_ip;
    bool gateway_disabled = false;      ///< gateway_ip given as null
    std::vector<AllocationPoolSpec> allocation_pools;
    bool enable_dhcp = true;

    static SubnetDescriptor from_subnet(const Subnet& subnet);

    std::string to_json() const;
    static std::optional<SubnetDescriptor> from_json(const std::string& json);

    /**
     * @brief Creation request carried by this descriptor
     *
     * A null gateway_ip means "no gateway"; an omitted one means the
     * default gateway.
     */
    SubnetRequest to_request() const;
};

/**
 * @brief Port descriptor
 *
 * A deferred port reports ip_allocation "deferred" and an empty fixed_ips
 * list until its binding host resolves an address.
 */
struct PortDescriptor {
    std::string id;
    std::string network_id;
    std::string name;
    std::optional<std::string> host;
    std::string ip_allocation;
    std::string binding_state;
    std::vector<std::pair<std::string, std::string>> fixed_ips;    ///< (subnet_id, ip_address)

    static PortDescriptor from_port(const Port& port);

    std::string to_json() const;
};

/**
 * @brief Serialize inventory record as published per segment
 */
std::string inventory_record_to_json(const InventoryRecord& record);

/**
 * @brief Parse inventory record
 * @return Record or std::nullopt on malformed input
 */
std::optional<InventoryRecord> inventory_record_from_json(const std::string& json);

} // namespace segipam
