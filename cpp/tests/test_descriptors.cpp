/**
 * @file test_descriptors.cpp
 * @brief Unit tests for model helpers and JSON descriptors
 *
 * Tests descriptor serialization including:
 * - Model enum conversion
 * - Segment, subnet and port descriptor fields
 * - Malformed and unknown input handling
 * - Inventory record validation
 */

#include <gtest/gtest.h>
#include "segipam/descriptors.hpp"
#include <nlohmann/json.hpp>

using namespace segipam;
using json = nlohmann::json;

// ============================================================================
// Model Helper Tests
// ============================================================================

TEST(ModelHelpersTest, SegmentTypeConversion) {
    EXPECT_EQ(ModelHelpers::segment_type_to_string(SegmentType::VLAN), "vlan");
    EXPECT_EQ(ModelHelpers::segment_type_to_string(SegmentType::VXLAN), "vxlan");

    auto type = ModelHelpers::string_to_segment_type("flat");
    ASSERT_TRUE(type.has_value());
    EXPECT_EQ(*type, SegmentType::FLAT);
    EXPECT_FALSE(ModelHelpers::string_to_segment_type("VLAN").has_value());
    EXPECT_FALSE(ModelHelpers::string_to_segment_type("geneve").has_value());
}

TEST(ModelHelpersTest, SegmentTypeAttributes) {
    EXPECT_TRUE(ModelHelpers::requires_physical_network(SegmentType::FLAT));
    EXPECT_TRUE(ModelHelpers::requires_physical_network(SegmentType::VLAN));
    EXPECT_FALSE(ModelHelpers::requires_physical_network(SegmentType::GRE));

    EXPECT_TRUE(ModelHelpers::requires_segmentation_id(SegmentType::VXLAN));
    EXPECT_FALSE(ModelHelpers::requires_segmentation_id(SegmentType::FLAT));
    EXPECT_FALSE(ModelHelpers::requires_segmentation_id(SegmentType::LOCAL));
}

TEST(ModelHelpersTest, PortStateConversion) {
    EXPECT_EQ(ModelHelpers::port_state_to_string(PortBindingState::ALLOCATION_FAILED), "ALLOCATION_FAILED");
    EXPECT_EQ(ModelHelpers::ip_allocation_to_string(IpAllocation::DEFERRED), "deferred");

    auto state = ModelHelpers::string_to_port_state("HOST_BOUND");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(*state, PortBindingState::HOST_BOUND);
    EXPECT_FALSE(ModelHelpers::string_to_port_state("BOUND").has_value());
}

// ============================================================================
// Segment Descriptor Tests
// ============================================================================

TEST(SegmentDescriptorTest, FromSegmentToJson) {
    Segment segment;
    segment.id = "seg-2";
    segment.network_id = "net-1";
    segment.name = "segment2";
    segment.network_type = SegmentType::VLAN;
    segment.physical_network = "provider2";
    segment.segmentation_id = 2016;

    json j = json::parse(SegmentDescriptor::from_segment(segment).to_json());
    EXPECT_EQ(j["id"], "seg-2");
    EXPECT_EQ(j["network_id"], "net-1");
    EXPECT_EQ(j["network_type"], "vlan");
    EXPECT_EQ(j["physical_network"], "provider2");
    EXPECT_EQ(j["segmentation_id"], 2016);
    EXPECT_EQ(j["name"], "segment2");
}

TEST(SegmentDescriptorTest, OverlaySegmentHasNullPhysnet) {
    Segment segment;
    segment.id = "seg-3";
    segment.network_id = "net-1";
    segment.network_type = SegmentType::VXLAN;
    segment.segmentation_id = 5000;

    json j = json::parse(SegmentDescriptor::from_segment(segment).to_json());
    EXPECT_TRUE(j["physical_network"].is_null());
    EXPECT_EQ(j["segmentation_id"], 5000);
}

TEST(SegmentDescriptorTest, FromJsonToRequest) {
    auto descriptor = SegmentDescriptor::from_json(
        R"({"network_id": "net-1", "network_type": "vlan", "physical_network": "provider2", "segmentation_id": 2016})");
    ASSERT_TRUE(descriptor.has_value());

    auto request = descriptor->to_request();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->network_id, "net-1");
    EXPECT_EQ(request->network_type, SegmentType::VLAN);
    EXPECT_EQ(request->physical_network, std::optional<std::string>("provider2"));
    EXPECT_EQ(request->segmentation_id, std::optional<uint32_t>(2016));
}

TEST(SegmentDescriptorTest, FromJsonRejectsBadInput) {
    EXPECT_FALSE(SegmentDescriptor::from_json(R"({"network_id": "net-1", "network_type": "geneve"})").has_value());
    EXPECT_FALSE(SegmentDescriptor::from_json(R"({"network_type": "vlan"})").has_value());
    EXPECT_FALSE(SegmentDescriptor::from_json("not json").has_value());
    EXPECT_FALSE(SegmentDescriptor::from_json(
        R"({"network_id": "net-1", "network_type": "vlan", "segmentation_id": "tag"})").has_value());

    // Out-of-range IDs must not wrap into valid ones
    EXPECT_FALSE(SegmentDescriptor::from_json(
        R"({"network_id": "net-1", "network_type": "vlan", "physical_network": "provider1", "segmentation_id": 4294969312})").has_value());
    EXPECT_FALSE(SegmentDescriptor::from_json(
        R"({"network_id": "net-1", "network_type": "gre", "segmentation_id": -1})").has_value());
    EXPECT_FALSE(SegmentDescriptor::from_json(
        R"({"network_id": "net-1", "network_type": "vxlan", "segmentation_id": 5000.5})").has_value());

    auto largest = SegmentDescriptor::from_json(
        R"({"network_id": "net-1", "network_type": "gre", "segmentation_id": 4294967295})");
    ASSERT_TRUE(largest.has_value());
    EXPECT_EQ(largest->segmentation_id, std::optional<uint32_t>(4294967295u));
}

TEST(SegmentDescriptorTest, UnknownTypeHasNoRequest) {
    SegmentDescriptor descriptor;
    descriptor.network_id = "net-1";
    descriptor.network_type = "geneve";
    EXPECT_FALSE(descriptor.to_request().has_value());
}

// ============================================================================
// Subnet Descriptor Tests
// ============================================================================

TEST(SubnetDescriptorTest, FromSubnetToJson) {
    Subnet subnet;
    subnet.id = "sub-1";
    subnet.network_id = "net-1";
    subnet.segment_id = "seg-1";
    subnet.cidr = IpNetwork::from_string("203.0.113.0/24");
    subnet.gateway_ip = IpAddress::from_string("203.0.113.1");
    subnet.allocation_pools.push_back(IpRange::from_strings("203.0.113.2", "203.0.113.254"));

    json j = json::parse(SubnetDescriptor::from_subnet(subnet).to_json());
    EXPECT_EQ(j["segment_id"], "seg-1");
    EXPECT_EQ(j["cidr"], "203.0.113.0/24");
    EXPECT_EQ(j["ip_version"], 4);
    EXPECT_EQ(j["gateway_ip"], "203.0.113.1");
    ASSERT_EQ(j["allocation_pools"].size(), 1u);
    EXPECT_EQ(j["allocation_pools"][0]["start"], "203.0.113.2");
    EXPECT_EQ(j["allocation_pools"][0]["end"], "203.0.113.254");
    EXPECT_EQ(j["enable_dhcp"], true);
}

TEST(SubnetDescriptorTest, NonRoutedSubnetHasNullSegment) {
    Subnet subnet;
    subnet.id = "sub-1";
    subnet.network_id = "net-1";
    subnet.cidr = IpNetwork::from_string("192.0.2.0/24");

    json j = json::parse(SubnetDescriptor::from_subnet(subnet).to_json());
    EXPECT_TRUE(j["segment_id"].is_null());
    EXPECT_TRUE(j["gateway_ip"].is_null());
}

TEST(SubnetDescriptorTest, FromJsonToRequest) {
    auto descriptor = SubnetDescriptor::from_json(R"({
        "network_id": "net-1",
        "segment_id": "seg-2",
        "cidr": "198.51.100.0/24",
        "ip_version": 4,
        "gateway_ip": "198.51.100.1",
        "allocation_pools": [{"start": "198.51.100.10", "end": "198.51.100.99"}],
        "enable_dhcp": false
    })");
    ASSERT_TRUE(descriptor.has_value());

    SubnetRequest request = descriptor->to_request();
    EXPECT_EQ(request.segment_id, std::optional<std::string>("seg-2"));
    EXPECT_EQ(request.gateway_ip, std::optional<std::string>("198.51.100.1"));
    EXPECT_FALSE(request.disable_gateway);
    ASSERT_EQ(request.allocation_pools.size(), 1u);
    EXPECT_EQ(request.allocation_pools[0].start, "198.51.100.10");
    EXPECT_FALSE(request.enable_dhcp);
}

TEST(SubnetDescriptorTest, NullGatewayDisablesGateway) {
    auto descriptor = SubnetDescriptor::from_json(
        R"({"network_id": "net-1", "cidr": "192.0.2.0/24", "gateway_ip": null})");
    ASSERT_TRUE(descriptor.has_value());

    SubnetRequest request = descriptor->to_request();
    EXPECT_TRUE(request.disable_gateway);
    EXPECT_FALSE(request.segment_id.has_value());
}

TEST(SubnetDescriptorTest, OmittedGatewayUsesDefault) {
    auto descriptor = SubnetDescriptor::from_json(R"({"network_id": "net-1", "cidr": "192.0.2.0/24"})");
    ASSERT_TRUE(descriptor.has_value());
    EXPECT_FALSE(descriptor->gateway_disabled);

    SubnetRequest request = descriptor->to_request();
    EXPECT_FALSE(request.disable_gateway);
    EXPECT_FALSE(request.gateway_ip.has_value());
}

TEST(SubnetDescriptorTest, SubnetWithoutGatewayKeepsItDisabled) {
    Subnet subnet;
    subnet.id = "sub-1";
    subnet.network_id = "net-1";
    subnet.cidr = IpNetwork::from_string("192.0.2.0/24");

    SubnetDescriptor descriptor = SubnetDescriptor::from_subnet(subnet);
    EXPECT_TRUE(descriptor.to_request().disable_gateway);

    auto parsed = SubnetDescriptor::from_json(descriptor.to_json());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->to_request().disable_gateway);
}

TEST(SubnetDescriptorTest, FromJsonRejectsBadInput) {
    EXPECT_FALSE(SubnetDescriptor::from_json(
        R"({"network_id": "net-1", "cidr": "192.0.2.0/24", "ip_version": 5})").has_value());
    EXPECT_FALSE(SubnetDescriptor::from_json(R"({"network_id": "net-1"})").has_value());
    EXPECT_FALSE(SubnetDescriptor::from_json(
        R"({"network_id": "net-1", "cidr": "192.0.2.0/24", "allocation_pools": [{"start": "192.0.2.5"}]})").has_value());
    EXPECT_FALSE(SubnetDescriptor::from_json("[").has_value());
}

// ============================================================================
// Port Descriptor Tests
// ============================================================================

TEST(PortDescriptorTest, DeferredPortReportsEmptyFixedIps) {
    Port port;
    port.id = "port-1";
    port.network_id = "net-1";
    port.ip_allocation = IpAllocation::DEFERRED;

    json j = json::parse(PortDescriptor::from_port(port).to_json());
    EXPECT_EQ(j["ip_allocation"], "deferred");
    EXPECT_EQ(j["binding_state"], "UNBOUND");
    EXPECT_EQ(j["binding:host_id"], "");
    EXPECT_TRUE(j["fixed_ips"].is_array());
    EXPECT_TRUE(j["fixed_ips"].empty());
}

TEST(PortDescriptorTest, BoundPortReportsAddress) {
    Port port;
    port.id = "port-1";
    port.network_id = "net-1";
    port.host = "compute0002";
    port.ip_allocation = IpAllocation::DEFERRED;
    port.state = PortBindingState::ALLOCATED;
    port.fixed_ips.push_back(FixedIp{"sub-2", IpAddress::from_string("198.51.100.3")});

    json j = json::parse(PortDescriptor::from_port(port).to_json());
    EXPECT_EQ(j["binding:host_id"], "compute0002");
    EXPECT_EQ(j["binding_state"], "ALLOCATED");
    ASSERT_EQ(j["fixed_ips"].size(), 1u);
    EXPECT_EQ(j["fixed_ips"][0]["subnet_id"], "sub-2");
    EXPECT_EQ(j["fixed_ips"][0]["ip_address"], "198.51.100.3");
}

// ============================================================================
// Inventory Record Tests
// ============================================================================

TEST(InventoryRecordTest, SerializeFields) {
    InventoryRecord record;
    record.resource_provider_generation = 7;
    record.total = 254;
    record.reserved = 3;

    json j = json::parse(inventory_record_to_json(record));
    EXPECT_EQ(j["resource_provider_generation"], 7);
    EXPECT_EQ(j["total"], 254);
    EXPECT_EQ(j["reserved"], 3);
    EXPECT_EQ(j["step_size"], 1);
    EXPECT_EQ(j["min_unit"], 1);
    EXPECT_EQ(j["max_unit"], 1);
    EXPECT_DOUBLE_EQ(j["allocation_ratio"].get<double>(), 1.0);
}

TEST(InventoryRecordTest, ParseDefaults) {
    auto record = inventory_record_from_json(R"({"resource_provider_generation": 2, "total": 30})");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->total, 30u);
    EXPECT_EQ(record->reserved, 0u);
    EXPECT_EQ(record->step_size, 1u);
}

TEST(InventoryRecordTest, ParseRejectsInvalid) {
    EXPECT_FALSE(inventory_record_from_json(
        R"({"resource_provider_generation": 2, "total": 5, "reserved": 6})").has_value());
    EXPECT_FALSE(inventory_record_from_json(R"({"total": 5})").has_value());
    EXPECT_FALSE(inventory_record_from_json("{").has_value());
}
