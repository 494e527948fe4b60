/**
 * @file descriptors.cpp
 * @brief Implementation of descriptor serialization
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "segipam/descriptors.hpp"

#include <nlohmann/json.hpp>

#include <limits>

using json = nlohmann::json;

namespace segipam {

namespace {

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> read_optional_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

} // namespace

// ============================================================================
// SegmentDescriptor
// ============================================================================

SegmentDescriptor SegmentDescriptor::from_segment(const Segment& segment) {
    SegmentDescriptor descriptor;
    descriptor.id = segment.id;
    descriptor.network_id = segment.network_id;
    descriptor.physical_network = segment.physical_network;
    descriptor.network_type = ModelHelpers::segment_type_to_string(segment.network_type);
    descriptor.segmentation_id = segment.segmentation_id;
    descriptor.name = segment.name;
    return descriptor;
}

std::string SegmentDescriptor::to_json() const {
    json j;
    j["id"] = id;
    j["network_id"] = network_id;
    j["physical_network"] = optional_string(physical_network);
    j["network_type"] = network_type;
    j["segmentation_id"] = segmentation_id ? json(*segmentation_id) : json(nullptr);
    j["name"] = name;
    return j.dump();
}

std::optional<SegmentDescriptor> SegmentDescriptor::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        SegmentDescriptor descriptor;
        descriptor.id = j.value("id", "");
        descriptor.network_id = j.at("network_id").get<std::string>();
        descriptor.physical_network = read_optional_string(j, "physical_network");
        descriptor.network_type = j.at("network_type").get<std::string>();
        if (j.contains("segmentation_id") && !j["segmentation_id"].is_null()) {
            const json& value = j["segmentation_id"];
            if (!value.is_number_unsigned() ||
                value.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
                return std::nullopt;
            }
            descriptor.segmentation_id = static_cast<uint32_t>(value.get<uint64_t>());
        }
        descriptor.name = j.value("name", "");

        if (!ModelHelpers::string_to_segment_type(descriptor.network_type)) {
            return std::nullopt;
        }

        return descriptor;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::optional<SegmentRequest> SegmentDescriptor::to_request() const {
    auto type = ModelHelpers::string_to_segment_type(network_type);
    if (!type) {
        return std::nullopt;
    }

    SegmentRequest request;
    request.network_id = network_id;
    request.network_type = *type;
    request.physical_network = physical_network;
    request.segmentation_id = segmentation_id;
    request.name = name;
    return request;
}

// ============================================================================
// SubnetDescriptor
// ============================================================================

SubnetDescriptor SubnetDescriptor::from_subnet(const Subnet& subnet) {
    SubnetDescriptor descriptor;
    descriptor.id = subnet.id;
    descriptor.network_id = subnet.network_id;
    descriptor.segment_id = subnet.segment_id;
    descriptor.name = subnet.name;
    descriptor.cidr = subnet.cidr.to_string();
    descriptor.ip_version = subnet.ip_version;
    if (subnet.gateway_ip) {
        descriptor.gateway_ip = subnet.gateway_ip->to_string();
    } else {
        descriptor.gateway_disabled = true;
    }
    for (const auto& pool : subnet.allocation_pools) {
        descriptor.allocation_pools.push_back(
            AllocationPoolSpec{pool.first.to_string(), pool.last.to_string()});
    }
    descriptor.enable_dhcp = subnet.enable_dhcp;
    return descriptor;
}

std::string SubnetDescriptor::to_json() const {
    json pools = json::array();
    for (const auto& pool : allocation_pools) {
        pools.push_back({{"start", pool.start}, {"end", pool.end}});
    }

    json j;
    j["id"] = id;
    j["network_id"] = network_id;
    j["segment_id"] = optional_string(segment_id);
    j["name"] = name;
    j["cidr"] = cidr;
    j["ip_version"] = ip_version;
    j["gateway_ip"] = optional_string(gateway_ip);
    j["allocation_pools"] = pools;
    j["enable_dhcp"] = enable_dhcp;
    return j.dump();
}

std::optional<SubnetDescriptor> SubnetDescriptor::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        SubnetDescriptor descriptor;
        descriptor.id = j.value("id", "");
        descriptor.network_id = j.at("network_id").get<std::string>();
        descriptor.segment_id = read_optional_string(j, "segment_id");
        descriptor.name = j.value("name", "");
        descriptor.cidr = j.at("cidr").get<std::string>();
        descriptor.ip_version = j.value("ip_version", 4);
        descriptor.gateway_ip = read_optional_string(j, "gateway_ip");
        descriptor.gateway_disabled = j.contains("gateway_ip") && j["gateway_ip"].is_null();
        descriptor.enable_dhcp = j.value("enable_dhcp", true);

        if (descriptor.ip_version != 4 && descriptor.ip_version != 6) {
            return std::nullopt;
        }

        if (j.contains("allocation_pools")) {
            for (const auto& pool : j["allocation_pools"]) {
                descriptor.allocation_pools.push_back(AllocationPoolSpec{
                    pool.at("start").get<std::string>(),
                    pool.at("end").get<std::string>()});
            }
        }

        return descriptor;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

SubnetRequest SubnetDescriptor::to_request() const {
    SubnetRequest request;
    request.network_id = network_id;
    request.segment_id = segment_id;
    request.cidr = cidr;
    request.name = name;
    request.ip_version = ip_version;
    request.gateway_ip = gateway_ip;
    request.disable_gateway = gateway_disabled && !gateway_ip;
    request.allocation_pools = allocation_pools;
    request.enable_dhcp = enable_dhcp;
    return request;
}

// ============================================================================
// PortDescriptor
// ============================================================================

PortDescriptor PortDescriptor::from_port(const Port& port) {
    PortDescriptor descriptor;
    descriptor.id = port.id;
    descriptor.network_id = port.network_id;
    descriptor.name = port.name;
    descriptor.host = port.host;
    descriptor.ip_allocation = ModelHelpers::ip_allocation_to_string(port.ip_allocation);
    descriptor.binding_state = ModelHelpers::port_state_to_string(port.state);
    for (const auto& fixed_ip : port.fixed_ips) {
        descriptor.fixed_ips.emplace_back(fixed_ip.subnet_id, fixed_ip.ip_address.to_string());
    }
    return descriptor;
}

std::string PortDescriptor::to_json() const {
    json fixed = json::array();
    for (const auto& [subnet_id, ip_address] : fixed_ips) {
        fixed.push_back({{"subnet_id", subnet_id}, {"ip_address", ip_address}});
    }

    json j;
    j["id"] = id;
    j["network_id"] = network_id;
    j["name"] = name;
    j["binding:host_id"] = host ? *host : std::string();
    j["ip_allocation"] = ip_allocation;
    j["binding_state"] = binding_state;
    j["fixed_ips"] = fixed;
    return j.dump();
}

// ============================================================================
// Inventory Record
// ============================================================================

std::string inventory_record_to_json(const InventoryRecord& record) {
    json j;
    j["resource_provider_generation"] = record.resource_provider_generation;
    j["total"] = record.total;
    j["reserved"] = record.reserved;
    j["step_size"] = record.step_size;
    j["min_unit"] = record.min_unit;
    j["max_unit"] = record.max_unit;
    j["allocation_ratio"] = record.allocation_ratio;
    return j.dump();
}

std::optional<InventoryRecord> inventory_record_from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        InventoryRecord record;
        record.resource_provider_generation = j.at("resource_provider_generation").get<uint64_t>();
        record.total = j.at("total").get<uint64_t>();
        record.reserved = j.value("reserved", uint64_t(0));
        record.step_size = j.value("step_size", uint64_t(1));
        record.min_unit = j.value("min_unit", uint64_t(1));
        record.max_unit = j.value("max_unit", uint64_t(1));
        record.allocation_ratio = j.value("allocation_ratio", 1.0);

        if (record.reserved > record.total) {
            return std::nullopt;
        }

        return record;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

} // namespace segipam
