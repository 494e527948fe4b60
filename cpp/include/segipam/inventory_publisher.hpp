/**
 * @file inventory_publisher.hpp
 * @brief Per-segment IPv4 inventory publication to the scheduler
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Recomputes a segment's address inventory after every subnet, pool,
 * allocation or host-mapping change and pushes it to the InventoryStore
 * from a background ASIO worker:
 * - Snapshots taken synchronously, published out-of-band
 * - Pending snapshots of one segment coalesce to the newest
 * - Store failures retried with exponential backoff
 * - Persistent failure flags the segment degraded instead of failing callers
 */

#pragma once

#include "segipam/address_allocator.hpp"
#include "segipam/inventory_store.hpp"
#include "segipam/ipam_config.hpp"
#include "segipam/segment_registry.hpp"
#include "segipam/subnet_binder.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace segipam {

/**
 * @brief Derived IPv4 inventory of one segment
 */
struct SegmentInventory {
    std::string segment_id;
    uint64_t total = 0;                 ///< Pool addresses plus one per gateway
    uint64_t reserved = 0;              ///< Gateways plus allocated addresses
    std::vector<std::string> hosts;     ///< Hosts mapped to the segment

    uint64_t available() const { return total - reserved; }

    /**
     * @brief Scheduler inventory record for this snapshot
     */
    InventoryRecord to_record(uint64_t generation) const;
};

/**
 * @brief Publisher counters
 */
struct PublisherStats {
    uint64_t published = 0;             ///< Snapshots written to the store
    uint64_t unchanged = 0;             ///< Snapshots matching the stored inventory
    uint64_t removed = 0;               ///< Providers removed for zero capacity
    uint64_t failed_attempts = 0;       ///< Store failures (each retry counted)
    uint64_t coalesced = 0;             ///< Snapshots replaced before publication
};

/**
 * @brief InventoryPublisher - reconciles segment inventory with the store
 *
 * Reads allocator state only; owns no allocation state.
 */
class InventoryPublisher {
public:
    /**
     * @brief Construct publisher
     * @param config Service configuration (retry and shutdown settings)
     * @param registry Segment registry (host mappings)
     * @param binder Subnet binder (subnets per segment)
     * @param allocator Address allocator (pool usage)
     * @param store External inventory store
     */
    InventoryPublisher(
        const IpamConfig& config,
        SegmentRegistry& registry,
        SubnetBinder& binder,
        AddressAllocator& allocator,
        std::shared_ptr<InventoryStore> store
    );

    /**
     * @brief Destructor - stops worker if running
     */
    ~InventoryPublisher();

    // Disable copy and move
    InventoryPublisher(const InventoryPublisher&) = delete;
    InventoryPublisher& operator=(const InventoryPublisher&) = delete;
    InventoryPublisher(InventoryPublisher&&) = delete;
    InventoryPublisher& operator=(InventoryPublisher&&) = delete;

    /**
     * @brief Start background worker
     * @return true if started, false if already running
     */
    bool start();

    /**
     * @brief Drain queue (up to shutdown timeout) and stop worker
     */
    void stop();

    bool is_running() const { return running_; }

    /**
     * @brief Compute current inventory of a segment
     *
     * IPv6 subnets are not counted. A deleted or subnet-less segment yields
     * zero capacity.
     */
    SegmentInventory compute_inventory(const std::string& segment_id) const;

    /**
     * @brief Snapshot segment inventory and queue it for publication
     *
     * Never throws for store problems; never blocks on the store.
     */
    void sync_inventory(const std::string& segment_id);

    /**
     * @brief Wait until no snapshot is pending or in flight
     * @return true if idle, false on timeout
     */
    bool wait_idle(std::chrono::milliseconds timeout);

    /**
     * @brief Segments whose last snapshot exhausted all publish attempts
     */
    std::vector<std::string> degraded_segments() const;

    bool is_degraded(const std::string& segment_id) const;

    /**
     * @brief Last snapshot successfully reconciled for segment
     */
    std::optional<SegmentInventory> last_published(const std::string& segment_id) const;

    PublisherStats get_stats() const;

    /**
     * @brief Deterministic provider/aggregate name of a segment
     */
    static std::string segment_resource_name(const std::string& segment_id);

private:
    /// Service configuration
    const IpamConfig& config_;

    SegmentRegistry& registry_;
    SubnetBinder& binder_;
    AddressAllocator& allocator_;

    /// External inventory store
    std::shared_ptr<InventoryStore> store_;

    /// Running flag
    std::atomic<bool> running_;

    /// ASIO context for publication and retry timers
    asio::io_context io_context_;

    /// Work guard to keep io_context running
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;

    /// Publication worker
    std::thread worker_thread_;

    /// Newest unpublished snapshot per segment
    std::map<std::string, SegmentInventory> pending_;

    /// Segments with a publication chain scheduled
    std::set<std::string> in_flight_;

    /// Segments whose publication gave up
    std::set<std::string> degraded_;

    std::map<std::string, SegmentInventory> last_published_;

    PublisherStats stats_;

    /// Mutex for queue, degraded set and stats
    mutable std::mutex queue_mutex_;

    /// Signalled when a publication chain ends
    std::condition_variable idle_cv_;

    /**
     * @brief Publish newest snapshot of segment (worker thread)
     * @param segment_id Segment to publish
     * @param attempt Attempt number of this chain (1-based)
     * @param carried Snapshot of the failed previous attempt
     */
    void run_publish(
        const std::string& segment_id,
        size_t attempt,
        const std::optional<SegmentInventory>& carried
    );

    /**
     * @brief Reconcile store with snapshot
     * @return true if the store was written
     * @throws InventoryStoreError on store failure
     */
    bool publish(const SegmentInventory& snapshot);

    /// End of a chain: continue with a newer snapshot or go idle
    void finish_chain(const std::string& segment_id);
};

} // namespace segipam
