/**
 * @file test_subnet_binder.cpp
 * @brief Unit tests for SubnetBinder
 *
 * Tests the subnet/segment edge including:
 * - Gateway and default pool derivation
 * - Routed and non-routed networks never mixed
 * - Segment reference bookkeeping
 * - Pool updates and deletion protection
 */

#include <gtest/gtest.h>
#include "segipam/exceptions.hpp"
#include "segipam/subnet_binder.hpp"
#include <string>
#include <vector>

using namespace segipam;

// Test fixture for subnet binder tests
class SubnetBinderTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = IpamConfig::defaults();
        registry_ = std::make_unique<SegmentRegistry>(config_);
        allocator_ = std::make_unique<AddressAllocator>();
        binder_ = std::make_unique<SubnetBinder>(config_, *registry_, *allocator_);
        binder_->set_pool_change_callback([this](const std::string& segment_id) {
            notified_.push_back(segment_id);
        });

        ProviderSpec provider;
        provider.network_type = SegmentType::VLAN;
        provider.physical_network = "provider1";
        provider.segmentation_id = 2016;
        network_ = registry_->create_network("multisegment1", true, provider);
        segment1_ = registry_->list_segments(network_.id).front();

        SegmentRequest request;
        request.network_id = network_.id;
        request.network_type = SegmentType::VLAN;
        request.physical_network = "provider2";
        request.segmentation_id = 2016;
        segment2_ = registry_->create_segment(request);
    }

    void TearDown() override {
        binder_.reset();
        allocator_.reset();
        registry_.reset();
    }

    SubnetRequest routed(const std::string& cidr, const std::string& segment_id) {
        SubnetRequest request;
        request.network_id = network_.id;
        request.segment_id = segment_id;
        request.cidr = cidr;
        return request;
    }

    static IpAddress ip(const std::string& text) {
        return IpAddress::from_string(text);
    }

    IpamConfig config_;
    std::unique_ptr<SegmentRegistry> registry_;
    std::unique_ptr<AddressAllocator> allocator_;
    std::unique_ptr<SubnetBinder> binder_;
    Network network_;
    Segment segment1_;
    Segment segment2_;
    std::vector<std::string> notified_;
};

// ============================================================================
// Creation Tests
// ============================================================================

TEST_F(SubnetBinderTest, CreateRoutedSubnetDefaults) {
    Subnet subnet = binder_->create_subnet(routed("203.0.113.0/24", segment1_.id));

    EXPECT_EQ(subnet.segment_id, std::optional<std::string>(segment1_.id));
    EXPECT_EQ(subnet.ip_version, 4);
    ASSERT_TRUE(subnet.gateway_ip.has_value());
    EXPECT_EQ(*subnet.gateway_ip, ip("203.0.113.1"));
    ASSERT_EQ(subnet.allocation_pools.size(), 1u);
    EXPECT_EQ(subnet.allocation_pools[0], IpRange::from_strings("203.0.113.2", "203.0.113.254"));

    // Lowest free address held for DHCP
    ASSERT_TRUE(subnet.dhcp_address.has_value());
    EXPECT_EQ(*subnet.dhcp_address, ip("203.0.113.2"));
    EXPECT_TRUE(allocator_->is_allocated(subnet.id, ip("203.0.113.2")));

    EXPECT_EQ(registry_->subnet_reference_count(segment1_.id), 1u);
    ASSERT_EQ(notified_.size(), 1u);
    EXPECT_EQ(notified_[0], segment1_.id);
    EXPECT_TRUE(binder_->is_routed(network_.id));
}

TEST_F(SubnetBinderTest, GatewayInsideRangeSplitsDefaultPools) {
    SubnetRequest request = routed("198.51.100.0/24", segment2_.id);
    request.gateway_ip = "198.51.100.100";
    request.enable_dhcp = false;

    Subnet subnet = binder_->create_subnet(request);
    ASSERT_EQ(subnet.allocation_pools.size(), 2u);
    EXPECT_EQ(subnet.allocation_pools[0], IpRange::from_strings("198.51.100.1", "198.51.100.99"));
    EXPECT_EQ(subnet.allocation_pools[1], IpRange::from_strings("198.51.100.101", "198.51.100.254"));
    EXPECT_FALSE(subnet.dhcp_address.has_value());
}

TEST_F(SubnetBinderTest, NoGatewayUsesWholeHostRange) {
    SubnetRequest request = routed("198.51.100.0/24", segment2_.id);
    request.disable_gateway = true;

    Subnet subnet = binder_->create_subnet(request);
    EXPECT_FALSE(subnet.gateway_ip.has_value());
    ASSERT_EQ(subnet.allocation_pools.size(), 1u);
    EXPECT_EQ(subnet.allocation_pools[0], IpRange::from_strings("198.51.100.1", "198.51.100.254"));
}

TEST_F(SubnetBinderTest, ExplicitPools) {
    SubnetRequest request = routed("203.0.113.0/24", segment1_.id);
    request.allocation_pools = {{"203.0.113.100", "203.0.113.150"}, {"203.0.113.10", "203.0.113.20"}};

    Subnet subnet = binder_->create_subnet(request);
    ASSERT_EQ(subnet.allocation_pools.size(), 2u);
    EXPECT_EQ(subnet.allocation_pools[0].first, ip("203.0.113.10"));
    EXPECT_EQ(*subnet.dhcp_address, ip("203.0.113.10"));
}

TEST_F(SubnetBinderTest, DhcpReservationCanBeDisabled) {
    config_.reserve_dhcp_address = false;
    Subnet subnet = binder_->create_subnet(routed("203.0.113.0/24", segment1_.id));
    EXPECT_FALSE(subnet.dhcp_address.has_value());
    EXPECT_EQ(saturate_to_u64(allocator_->usage(subnet.id)->allocated), 0u);
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(SubnetBinderTest, RejectInvalidCidr) {
    EXPECT_THROW(binder_->create_subnet(routed("203.0.113.5/24", segment1_.id)), InvalidCidr);
    EXPECT_THROW(binder_->create_subnet(routed("not-a-cidr", segment1_.id)), InvalidCidr);

    SubnetRequest request = routed("203.0.113.0/24", segment1_.id);
    request.ip_version = 6;
    EXPECT_THROW(binder_->create_subnet(request), InvalidCidr);
}

TEST_F(SubnetBinderTest, RejectInvalidGateway) {
    SubnetRequest request = routed("203.0.113.0/24", segment1_.id);

    request.gateway_ip = "198.51.100.1";
    EXPECT_THROW(binder_->create_subnet(request), InvalidGateway);

    request.gateway_ip = "203.0.113.255";
    EXPECT_THROW(binder_->create_subnet(request), InvalidGateway);

    request.gateway_ip = "203.0.113.1";
    request.disable_gateway = true;
    EXPECT_THROW(binder_->create_subnet(request), InvalidGateway);
}

TEST_F(SubnetBinderTest, RejectInvalidPools) {
    SubnetRequest request = routed("203.0.113.0/24", segment1_.id);

    request.allocation_pools = {{"203.0.113.1", "203.0.113.50"}};
    EXPECT_THROW(binder_->create_subnet(request), InvalidAllocationPool);

    request.allocation_pools = {{"203.0.113.0", "203.0.113.50"}};
    request.gateway_ip = "203.0.113.254";
    EXPECT_THROW(binder_->create_subnet(request), InvalidAllocationPool);

    request.allocation_pools = {{"203.0.113.50", "203.0.113.10"}};
    EXPECT_THROW(binder_->create_subnet(request), InvalidAllocationPool);

    request.allocation_pools = {{"203.0.113.10", "bogus"}};
    EXPECT_THROW(binder_->create_subnet(request), InvalidAllocationPool);

    EXPECT_FALSE(binder_->has_subnets(network_.id));
    EXPECT_EQ(registry_->subnet_reference_count(segment1_.id), 0u);
}

TEST_F(SubnetBinderTest, RejectUnknownReferences) {
    SubnetRequest request = routed("203.0.113.0/24", "missing");
    EXPECT_THROW(binder_->create_subnet(request), SegmentNotFound);

    request.network_id = "missing";
    EXPECT_THROW(binder_->create_subnet(request), NetworkNotFound);
}

TEST_F(SubnetBinderTest, RejectSegmentOfOtherNetwork) {
    ProviderSpec provider;
    provider.network_type = SegmentType::VLAN;
    provider.physical_network = "provider3";
    provider.segmentation_id = 3000;
    Network other = registry_->create_network("other", false, provider);
    Segment foreign = registry_->list_segments(other.id).front();

    EXPECT_THROW(binder_->create_subnet(routed("203.0.113.0/24", foreign.id)), InvalidSegmentReference);
}

TEST_F(SubnetBinderTest, RejectOverlappingCidr) {
    binder_->create_subnet(routed("203.0.113.0/24", segment1_.id));
    EXPECT_THROW(binder_->create_subnet(routed("203.0.113.128/25", segment2_.id)), InvalidCidr);
}

// ============================================================================
// Segment Binding Consistency Tests
// ============================================================================

TEST_F(SubnetBinderTest, RoutedThenUnroutedRejected) {
    binder_->create_subnet(routed("203.0.113.0/24", segment1_.id));

    SubnetRequest request;
    request.network_id = network_.id;
    request.cidr = "198.51.100.0/24";
    EXPECT_THROW(binder_->create_subnet(request), SegmentBindingMismatch);
}

TEST_F(SubnetBinderTest, UnroutedThenRoutedRejected) {
    SubnetRequest request;
    request.network_id = network_.id;
    request.cidr = "198.51.100.0/24";
    binder_->create_subnet(request);
    EXPECT_FALSE(binder_->is_routed(network_.id));
    EXPECT_TRUE(notified_.empty());

    EXPECT_THROW(binder_->create_subnet(routed("203.0.113.0/24", segment1_.id)), SegmentBindingMismatch);
}

TEST_F(SubnetBinderTest, MultipleSubnetsPerSegment) {
    binder_->create_subnet(routed("203.0.113.0/24", segment1_.id));
    binder_->create_subnet(routed("192.0.2.0/24", segment1_.id));
    binder_->create_subnet(routed("198.51.100.0/24", segment2_.id));

    EXPECT_EQ(binder_->subnets_for_segment(segment1_.id).size(), 2u);
    EXPECT_EQ(binder_->subnets_for_segment(segment2_.id).size(), 1u);
    EXPECT_EQ(binder_->list_subnets(network_.id).size(), 3u);
    EXPECT_EQ(registry_->subnet_reference_count(segment1_.id), 2u);
}

// ============================================================================
// Deletion Tests
// ============================================================================

TEST_F(SubnetBinderTest, DeleteSubnetReleasesSegment) {
    Subnet subnet = binder_->create_subnet(routed("203.0.113.0/24", segment1_.id));
    EXPECT_THROW(registry_->delete_segment(segment1_.id), SegmentInUse);

    notified_.clear();
    binder_->delete_subnet(subnet.id);

    EXPECT_FALSE(binder_->get_subnet(subnet.id).has_value());
    EXPECT_FALSE(allocator_->has_subnet(subnet.id));
    EXPECT_EQ(registry_->subnet_reference_count(segment1_.id), 0u);
    EXPECT_EQ(notified_.size(), 1u);
    EXPECT_NO_THROW(registry_->delete_segment(segment1_.id));
}

TEST_F(SubnetBinderTest, DeleteSubnetWithAllocations) {
    Subnet subnet = binder_->create_subnet(routed("203.0.113.0/24", segment1_.id));
    allocator_->allocate(subnet.id);

    EXPECT_THROW(binder_->delete_subnet(subnet.id), SubnetInUse);
    EXPECT_TRUE(binder_->get_subnet(subnet.id).has_value());
    EXPECT_THROW(binder_->delete_subnet("missing"), SubnetNotFound);
}

TEST_F(SubnetBinderTest, DeleteLastSubnetAllowsOtherMode) {
    Subnet subnet = binder_->create_subnet(routed("203.0.113.0/24", segment1_.id));
    binder_->delete_subnet(subnet.id);

    SubnetRequest request;
    request.network_id = network_.id;
    request.cidr = "198.51.100.0/24";
    EXPECT_NO_THROW(binder_->create_subnet(request));
}

// ============================================================================
// Pool Update Tests
// ============================================================================

TEST_F(SubnetBinderTest, UpdateAllocationPools) {
    Subnet subnet = binder_->create_subnet(routed("203.0.113.0/24", segment1_.id));
    notified_.clear();

    Subnet updated = binder_->update_allocation_pools(subnet.id, {{"203.0.113.2", "203.0.113.50"}});
    ASSERT_EQ(updated.allocation_pools.size(), 1u);
    EXPECT_EQ(updated.allocation_pools[0].last, ip("203.0.113.50"));
    EXPECT_EQ(notified_.size(), 1u);

    // DHCP address .2 must stay inside the pools
    EXPECT_THROW(binder_->update_allocation_pools(subnet.id, {{"203.0.113.10", "203.0.113.50"}}),
                 InvalidAllocationPool);
    EXPECT_THROW(binder_->update_allocation_pools(subnet.id, {{"203.0.113.1", "203.0.113.50"}}),
                 InvalidAllocationPool);
    EXPECT_THROW(binder_->update_allocation_pools("missing", {}), SubnetNotFound);
}
