/**
 * @file test_segment_registry.cpp
 * @brief Unit tests for SegmentRegistry
 *
 * Tests segment bookkeeping including:
 * - Network creation with a provider segment
 * - Segment validation and uniqueness
 * - Host mappings
 * - In-use protection for deletion
 * - Change notification
 */

#include <gtest/gtest.h>
#include "segipam/exceptions.hpp"
#include "segipam/segment_registry.hpp"
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace segipam;

// Test fixture for segment registry tests
class SegmentRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = IpamConfig::defaults();
        registry_ = std::make_unique<SegmentRegistry>(config_);
        registry_->set_mapping_change_callback([this](const std::string& segment_id) {
            notified_.push_back(segment_id);
        });

        ProviderSpec provider;
        provider.network_type = SegmentType::VLAN;
        provider.physical_network = "provider1";
        provider.segmentation_id = 2016;
        network_ = registry_->create_network("multisegment1", true, provider);
        segment1_ = registry_->list_segments(network_.id).front();
    }

    void TearDown() override {
        registry_.reset();
    }

    Segment add_vlan(const std::string& physnet, uint32_t tag, const std::string& network_id = "") {
        SegmentRequest request;
        request.network_id = network_id.empty() ? network_.id : network_id;
        request.network_type = SegmentType::VLAN;
        request.physical_network = physnet;
        request.segmentation_id = tag;
        return registry_->create_segment(request);
    }

    IpamConfig config_;
    std::unique_ptr<SegmentRegistry> registry_;
    Network network_;
    Segment segment1_;
    std::vector<std::string> notified_;
};

// ============================================================================
// Network Tests
// ============================================================================

TEST_F(SegmentRegistryTest, CreateNetworkWithProviderSegment) {
    EXPECT_TRUE(registry_->has_network(network_.id));
    EXPECT_EQ(segment1_.network_type, SegmentType::VLAN);
    EXPECT_EQ(segment1_.physical_network, std::optional<std::string>("provider1"));
    EXPECT_EQ(segment1_.segmentation_id, std::optional<uint32_t>(2016));
    EXPECT_EQ(segment1_.segment_index, 0u);
}

TEST_F(SegmentRegistryTest, CreateNetworkWithoutProvider) {
    Network plain = registry_->create_network("plain");
    EXPECT_TRUE(registry_->list_segments(plain.id).empty());
}

TEST_F(SegmentRegistryTest, CreateNetworkRejectsInvalidProvider) {
    ProviderSpec provider;
    provider.network_type = SegmentType::VLAN;
    provider.physical_network = "provider9";

    size_t before = registry_->list_networks().size();
    EXPECT_THROW(registry_->create_network("broken", false, provider), InvalidSegmentationId);
    EXPECT_EQ(registry_->list_networks().size(), before);
}

TEST_F(SegmentRegistryTest, DeleteNetworkRemovesSegments) {
    Segment segment2 = add_vlan("provider2", 2016);
    notified_.clear();

    registry_->delete_network(network_.id);

    EXPECT_FALSE(registry_->has_network(network_.id));
    EXPECT_FALSE(registry_->get_segment(segment1_.id).has_value());
    EXPECT_FALSE(registry_->get_segment(segment2.id).has_value());
    EXPECT_EQ(notified_.size(), 2u);
    EXPECT_THROW(registry_->delete_network(network_.id), NetworkNotFound);
}

TEST_F(SegmentRegistryTest, DeleteNetworkDropsItsLock) {
    Network plain = registry_->create_network("plain");
    registry_->network_lock(plain.id);
    size_t locks = registry_->network_lock_count();

    registry_->delete_network(plain.id);
    EXPECT_EQ(registry_->network_lock_count(), locks - 1);
}

TEST_F(SegmentRegistryTest, DeleteNetworkPreconditionAborts) {
    bool ran = false;
    EXPECT_THROW(registry_->delete_network(network_.id, [&]() {
        ran = true;
        throw NetworkInUse(network_.id, "ports still exist");
    }), NetworkInUse);

    EXPECT_TRUE(ran);
    EXPECT_TRUE(registry_->has_network(network_.id));
    EXPECT_TRUE(registry_->get_segment(segment1_.id).has_value());

    EXPECT_NO_THROW(registry_->delete_network(network_.id, [&]() {}));
    EXPECT_FALSE(registry_->has_network(network_.id));
}

TEST_F(SegmentRegistryTest, DeleteNetworkInUse) {
    registry_->retain_subnet_reference(segment1_.id);
    EXPECT_THROW(registry_->delete_network(network_.id), NetworkInUse);

    registry_->release_subnet_reference(segment1_.id);
    EXPECT_NO_THROW(registry_->delete_network(network_.id));
}

// ============================================================================
// Segment Validation Tests
// ============================================================================

TEST_F(SegmentRegistryTest, CreateSegmentKeepsDeclarationOrder) {
    Segment segment2 = add_vlan("provider2", 2016);
    Segment segment3 = add_vlan("provider3", 2016);

    auto segments = registry_->list_segments(network_.id);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0].id, segment1_.id);
    EXPECT_EQ(segments[1].id, segment2.id);
    EXPECT_EQ(segments[2].id, segment3.id);
    EXPECT_LT(segment2.segment_index, segment3.segment_index);
}

TEST_F(SegmentRegistryTest, DuplicatePhysicalNetworkRejected) {
    EXPECT_THROW(add_vlan("provider1", 100), DuplicatePhysicalNetwork);
}

TEST_F(SegmentRegistryTest, SameTagOnSamePhysnetRejectedAcrossNetworks) {
    Network other = registry_->create_network("other");
    EXPECT_THROW(add_vlan("provider1", 2016, other.id), InvalidSegmentationId);
    EXPECT_NO_THROW(add_vlan("provider1", 2017, other.id));
}

TEST_F(SegmentRegistryTest, SameVniRejectedAcrossNetworks) {
    SegmentRequest request;
    request.network_id = network_.id;
    request.network_type = SegmentType::VXLAN;
    request.segmentation_id = 5000;
    registry_->create_segment(request);

    Network other = registry_->create_network("other");
    request.network_id = other.id;
    EXPECT_THROW(registry_->create_segment(request), InvalidSegmentationId);
}

TEST_F(SegmentRegistryTest, SegmentAttributeValidation) {
    SegmentRequest request;
    request.network_id = network_.id;

    // flat requires a physical network, forbids a segmentation ID
    request.network_type = SegmentType::FLAT;
    EXPECT_THROW(registry_->create_segment(request), InvalidSegmentDefinition);
    request.physical_network = "flatnet";
    request.segmentation_id = 10;
    EXPECT_THROW(registry_->create_segment(request), InvalidSegmentationId);

    // vxlan forbids a physical network
    request.network_type = SegmentType::VXLAN;
    request.physical_network = "provider5";
    EXPECT_THROW(registry_->create_segment(request), InvalidSegmentDefinition);

    // vlan tags are bounded
    request.network_type = SegmentType::VLAN;
    request.segmentation_id = 4095;
    EXPECT_THROW(registry_->create_segment(request), InvalidSegmentationId);
    request.segmentation_id.reset();
    EXPECT_THROW(registry_->create_segment(request), InvalidSegmentationId);

    // local takes nothing
    request.network_type = SegmentType::LOCAL;
    request.physical_network.reset();
    EXPECT_NO_THROW(registry_->create_segment(request));
}

TEST_F(SegmentRegistryTest, ConfiguredVlanRangeApplies) {
    config_.vlan_range = SegmentationRange{100, 200};
    SegmentRegistry registry(config_);
    Network network = registry.create_network("ranged");

    SegmentRequest request;
    request.network_id = network.id;
    request.network_type = SegmentType::VLAN;
    request.physical_network = "provider1";
    request.segmentation_id = 2016;
    EXPECT_THROW(registry.create_segment(request), InvalidSegmentationId);

    request.segmentation_id = 150;
    EXPECT_NO_THROW(registry.create_segment(request));
}

TEST_F(SegmentRegistryTest, CreateSegmentUnknownNetwork) {
    size_t locks = registry_->network_lock_count();

    EXPECT_THROW(add_vlan("provider2", 10, "missing"), NetworkNotFound);
    EXPECT_THROW(registry_->network_lock("missing"), NetworkNotFound);
    EXPECT_THROW(registry_->delete_network("missing"), NetworkNotFound);

    // Unknown ids must not leave lock entries behind
    EXPECT_EQ(registry_->network_lock_count(), locks);
}

TEST_F(SegmentRegistryTest, ListSegmentsPagination) {
    add_vlan("provider2", 2016);
    Segment segment3 = add_vlan("provider3", 2016);

    auto page = registry_->list_segments(network_.id, std::nullopt, 2);
    ASSERT_EQ(page.size(), 2u);

    auto rest = registry_->list_segments(network_.id, page.back().id, 2);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].id, segment3.id);

    EXPECT_THROW(registry_->list_segments(network_.id, std::string("missing")), SegmentNotFound);
}

TEST_F(SegmentRegistryTest, UpdateSegmentName) {
    Segment updated = registry_->update_segment_name(segment1_.id, "segment1", "rack 1");
    EXPECT_EQ(updated.name, "segment1");
    EXPECT_EQ(registry_->get_segment(segment1_.id)->description, "rack 1");
    EXPECT_THROW(registry_->update_segment_name("missing", "x"), SegmentNotFound);
}

// ============================================================================
// Host Mapping Tests
// ============================================================================

TEST_F(SegmentRegistryTest, HostMappings) {
    Segment segment2 = add_vlan("provider2", 2016);
    notified_.clear();

    EXPECT_TRUE(registry_->add_host_mapping("compute0001", segment1_.id));
    EXPECT_TRUE(registry_->add_host_mapping("compute0002", segment2.id));
    EXPECT_FALSE(registry_->add_host_mapping("compute0001", segment1_.id));
    EXPECT_EQ(notified_.size(), 2u);

    EXPECT_TRUE(registry_->host_reaches_segment("compute0001", segment1_.id));
    EXPECT_FALSE(registry_->host_reaches_segment("compute0001", segment2.id));

    auto reachable = registry_->segments_for_host("compute0002", network_.id);
    ASSERT_EQ(reachable.size(), 1u);
    EXPECT_EQ(reachable[0].id, segment2.id);

    EXPECT_TRUE(registry_->remove_host_mapping("compute0001", segment1_.id));
    EXPECT_FALSE(registry_->remove_host_mapping("compute0001", segment1_.id));
    EXPECT_TRUE(registry_->hosts_for_segment(segment1_.id).empty());
}

TEST_F(SegmentRegistryTest, HostsForSegmentSorted) {
    registry_->add_host_mapping("compute0003", segment1_.id);
    registry_->add_host_mapping("compute0001", segment1_.id);

    auto hosts = registry_->hosts_for_segment(segment1_.id);
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0], "compute0001");
    EXPECT_EQ(hosts[1], "compute0003");
}

TEST_F(SegmentRegistryTest, HostMappingValidation) {
    EXPECT_THROW(registry_->add_host_mapping("bad host", segment1_.id), std::invalid_argument);
    EXPECT_THROW(registry_->add_host_mapping("compute0001", "missing"), SegmentNotFound);
}

TEST_F(SegmentRegistryTest, RemoveMappingWithBoundPorts) {
    registry_->add_host_mapping("compute0001", segment1_.id);
    registry_->retain_binding("compute0001", segment1_.id);

    EXPECT_THROW(registry_->remove_host_mapping("compute0001", segment1_.id), SegmentInUse);

    registry_->release_binding("compute0001", segment1_.id);
    EXPECT_TRUE(registry_->remove_host_mapping("compute0001", segment1_.id));
}

// ============================================================================
// Deletion Tests
// ============================================================================

TEST_F(SegmentRegistryTest, DeleteSegmentInUse) {
    Segment segment2 = add_vlan("provider2", 2016);

    registry_->retain_subnet_reference(segment2.id);
    EXPECT_EQ(registry_->subnet_reference_count(segment2.id), 1u);
    EXPECT_THROW(registry_->delete_segment(segment2.id), SegmentInUse);

    registry_->release_subnet_reference(segment2.id);
    registry_->add_host_mapping("compute0002", segment2.id);
    registry_->retain_binding("compute0002", segment2.id);
    EXPECT_EQ(registry_->binding_count(segment2.id), 1u);
    EXPECT_THROW(registry_->delete_segment(segment2.id), SegmentInUse);

    registry_->release_binding("compute0002", segment2.id);
    EXPECT_NO_THROW(registry_->delete_segment(segment2.id));
    EXPECT_FALSE(registry_->get_segment(segment2.id).has_value());
    EXPECT_THROW(registry_->delete_segment(segment2.id), SegmentNotFound);
}

TEST_F(SegmentRegistryTest, PhysnetReusableAfterDelete) {
    Segment segment2 = add_vlan("provider2", 2016);
    registry_->delete_segment(segment2.id);
    EXPECT_NO_THROW(add_vlan("provider2", 2016));
}
