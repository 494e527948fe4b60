/**
 * @file routed_network_demo.cpp
 * @brief Routed provider network walkthrough
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates:
 * - Two VLAN segments on different physical networks
 * - One subnet per segment
 * - A deferred port resolved through its binding host
 * - Inventory published per segment
 */

#include "segipam/descriptors.hpp"
#include "segipam/routed_network_service.hpp"
#include "segipam/sqlite_inventory_store.hpp"

#include <chrono>
#include <iostream>
#include <memory>

using namespace segipam;
using namespace std::chrono_literals;

namespace {

void print_inventory(InventoryStore& store, const std::string& segment_id) {
    auto record = store.get_inventory(segment_id, config::IPV4_RESOURCE_CLASS);
    if (!record) {
        std::cout << "  " << segment_id << ": (no inventory)\n";
        return;
    }
    std::cout << "  " << segment_id << ": " << inventory_record_to_json(*record) << "\n";

    auto hosts = store.aggregate_hosts(InventoryPublisher::segment_resource_name(segment_id));
    std::cout << "    hosts:";
    for (const auto& host : hosts) {
        std::cout << " " << host;
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string database = argc >= 2 ? argv[1] : ":memory:";

    try {
        std::cout << "\n=== segipam Routed Network Demo ===\n\n";

        IpamConfig config = IpamConfig::defaults();
        config.publish_initial_backoff = 50ms;
        utilities::initialize_logging(config.log_file, utilities::LogLevel::WARN);

        auto store = std::make_shared<SqliteInventoryStore>(database);
        RoutedNetworkService service(config, store);
        service.start();

        // Network with a first VLAN segment on provider1
        ProviderSpec provider;
        provider.network_type = SegmentType::VLAN;
        provider.physical_network = "provider1";
        provider.segmentation_id = 2016;
        Network network = service.create_network("multisegment1", true, provider);

        Segment segment1 = service.registry().list_segments(network.id).front();

        SegmentRequest request;
        request.network_id = network.id;
        request.network_type = SegmentType::VLAN;
        request.physical_network = "provider2";
        request.segmentation_id = 2016;
        request.name = "segment2";
        Segment segment2 = service.create_segment(request);

        std::cout << "Segments:\n";
        for (const auto& segment : service.registry().list_segments(network.id)) {
            std::cout << "  " << SegmentDescriptor::from_segment(segment).to_json() << "\n";
        }

        // One subnet per segment
        SubnetRequest subnet1;
        subnet1.network_id = network.id;
        subnet1.segment_id = segment1.id;
        subnet1.cidr = "203.0.113.0/24";
        subnet1.name = "multisegment1-segment1";
        service.create_subnet(subnet1);

        SubnetRequest subnet2;
        subnet2.network_id = network.id;
        subnet2.segment_id = segment2.id;
        subnet2.cidr = "198.51.100.0/24";
        subnet2.name = "multisegment1-segment2";
        service.create_subnet(subnet2);

        std::cout << "\nSubnets:\n";
        for (const auto& subnet : service.binder().list_subnets(network.id)) {
            std::cout << "  " << SubnetDescriptor::from_subnet(subnet).to_json() << "\n";
        }

        // compute0002 is wired to provider2 only
        const std::string host = "compute0002";
        service.add_host_mapping(host, segment2.id);

        Port port = service.create_port(network.id, std::nullopt, std::nullopt, "port1");
        std::cout << "\nPort before binding:\n  " << PortDescriptor::from_port(port).to_json() << "\n";

        port = service.bind_host(port.id, host);
        std::cout << "Port after binding to " << host << ":\n  "
                  << PortDescriptor::from_port(port).to_json() << "\n";

        if (!service.publisher().wait_idle(2s)) {
            std::cout << "\n(inventory publication still in progress)\n";
        }

        std::cout << "\nInventory:\n";
        print_inventory(*store, segment1.id);
        print_inventory(*store, segment2.id);

        auto stats = service.get_stats();
        std::cout << "\nStatistics:\n";
        std::cout << "  Networks:          " << stats.networks << "\n";
        std::cout << "  Subnets:           " << stats.subnets << "\n";
        std::cout << "  Ports:             " << stats.ports << "\n";
        std::cout << "  Pending ports:     " << stats.pending_ports << "\n";
        std::cout << "  Published:         " << stats.publisher.published << "\n";
        std::cout << "  Degraded segments: " << stats.degraded_segments << "\n";

        service.stop();
        std::cout << "\nDemo completed.\n\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
