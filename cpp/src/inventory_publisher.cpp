/**
 * @file inventory_publisher.cpp
 * @brief Implementation of segment inventory publication
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "segipam/inventory_publisher.hpp"
#include "segipam/exceptions.hpp"

#include <stdexcept>

namespace segipam {

using namespace segipam::utilities;

InventoryRecord SegmentInventory::to_record(uint64_t generation) const {
    InventoryRecord record;
    record.resource_provider_generation = generation;
    record.total = total;
    record.reserved = reserved;
    record.step_size = 1;
    record.min_unit = 1;
    record.max_unit = 1;
    record.allocation_ratio = 1.0;
    return record;
}

// ============================================================================
// Constructor and Destructor
// ============================================================================

InventoryPublisher::InventoryPublisher(
    const IpamConfig& config,
    SegmentRegistry& registry,
    SubnetBinder& binder,
    AddressAllocator& allocator,
    std::shared_ptr<InventoryStore> store
)
    : config_(config)
    , registry_(registry)
    , binder_(binder)
    , allocator_(allocator)
    , store_(std::move(store))
    , running_(false)
{
    if (!store_) {
        throw std::invalid_argument("InventoryPublisher requires an inventory store");
    }
}

InventoryPublisher::~InventoryPublisher() {
    if (running_) {
        stop();
    }
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool InventoryPublisher::start() {
    if (running_) {
        log_warn("InventoryPublisher: Already running");
        return false;
    }

    io_context_.restart();

    // Create work guard to keep io_context running
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        io_context_.get_executor()
    );

    worker_thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (const std::exception& e) {
            log_error("InventoryPublisher: Worker thread exception: " + std::string(e.what()));
        }
    });

    running_ = true;
    log_info("InventoryPublisher: Started");
    return true;
}

void InventoryPublisher::stop() {
    if (!running_) {
        return;
    }

    log_info("InventoryPublisher: Stopping...");

    if (!wait_idle(config_.shutdown_timeout)) {
        log_warn("InventoryPublisher: Shutdown timeout reached with publications outstanding");
    }

    running_ = false;

    // Stop ASIO work
    work_guard_.reset();
    io_context_.stop();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        dropped = pending_.size() + in_flight_.size();
        pending_.clear();
        in_flight_.clear();
    }
    idle_cv_.notify_all();

    if (dropped > 0) {
        log_warn("InventoryPublisher: Dropped " + std::to_string(dropped) +
                 " unpublished segment inventories");
    }

    log_info("InventoryPublisher: Stopped");
}

// ============================================================================
// Inventory Computation
// ============================================================================

SegmentInventory InventoryPublisher::compute_inventory(const std::string& segment_id) const {
    SegmentInventory inventory;
    inventory.segment_id = segment_id;

    for (const auto& subnet : binder_.subnets_for_segment(segment_id)) {
        if (subnet.ip_version != 4) {
            continue;
        }

        auto usage = allocator_.usage(subnet.id);
        if (!usage || usage->capacity == 0) {
            continue;
        }

        inventory.total += saturate_to_u64(usage->capacity);
        inventory.reserved += saturate_to_u64(usage->allocated);

        // Gateway is part of the subnet but never allocatable
        if (subnet.gateway_ip) {
            inventory.total += 1;
            inventory.reserved += 1;
        }
    }

    inventory.hosts = registry_.hosts_for_segment(segment_id);
    return inventory;
}

std::string InventoryPublisher::segment_resource_name(const std::string& segment_id) {
    return std::string(config::SEGMENT_NAME_PREFIX) + segment_id;
}

// ============================================================================
// Publication Queue
// ============================================================================

void InventoryPublisher::sync_inventory(const std::string& segment_id) {
    SegmentInventory snapshot = compute_inventory(segment_id);

    bool schedule = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        auto it = pending_.find(segment_id);
        if (it != pending_.end()) {
            it->second = snapshot;
            stats_.coalesced++;
        } else {
            pending_.emplace(segment_id, snapshot);
        }

        if (in_flight_.insert(segment_id).second) {
            schedule = true;
        }
    }

    log_debug("InventoryPublisher: Queued segment " + segment_id + " (total " +
              std::to_string(snapshot.total) + ", reserved " + std::to_string(snapshot.reserved) + ")");

    if (schedule) {
        asio::post(io_context_, [this, segment_id]() {
            run_publish(segment_id, 1, std::nullopt);
        });
    }
}

bool InventoryPublisher::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() {
        return pending_.empty() && in_flight_.empty();
    });
}

void InventoryPublisher::run_publish(
    const std::string& segment_id,
    size_t attempt,
    const std::optional<SegmentInventory>& carried
) {
    SegmentInventory snapshot;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        auto it = pending_.find(segment_id);
        if (it != pending_.end()) {
            // A newer snapshot supersedes the one being retried
            snapshot = it->second;
            pending_.erase(it);
        } else if (carried) {
            snapshot = *carried;
        } else {
            in_flight_.erase(segment_id);
            idle_cv_.notify_all();
            return;
        }
    }

    try {
        bool written = publish(snapshot);

        bool recovered = false;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            recovered = degraded_.erase(segment_id) > 0;
            last_published_[segment_id] = snapshot;
            if (snapshot.total == 0) {
                stats_.removed++;
            } else if (written) {
                stats_.published++;
            } else {
                stats_.unchanged++;
            }
        }

        if (recovered) {
            log_info("InventoryPublisher: Segment " + segment_id + " inventory recovered");
        }

        finish_chain(segment_id);

    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stats_.failed_attempts++;
        }

        log_warn("InventoryPublisher: Attempt " + std::to_string(attempt) + "/" +
                 std::to_string(config_.publish_max_attempts) + " for segment " +
                 segment_id + " failed: " + e.what());

        if (attempt >= config_.publish_max_attempts) {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                degraded_.insert(segment_id);
            }
            log_warn("InventoryPublisher: Segment " + segment_id +
                     " inventory is degraded; scheduler placement may be stale");
            finish_chain(segment_id);
            return;
        }

        auto delay = config_.backoff_for_attempt(attempt + 1);
        auto timer = std::make_shared<asio::steady_timer>(io_context_, delay);
        timer->async_wait([this, timer, segment_id, attempt, snapshot](const asio::error_code& ec) {
            if (ec) {
                return;
            }
            run_publish(segment_id, attempt + 1, snapshot);
        });
    }
}

bool InventoryPublisher::publish(const SegmentInventory& snapshot) {
    const std::string name = segment_resource_name(snapshot.segment_id);

    if (snapshot.total == 0) {
        bool removed_aggregate = store_->delete_aggregate(name);
        bool removed_provider = store_->delete_resource_provider(snapshot.segment_id);
        if (removed_aggregate || removed_provider) {
            log_info("InventoryPublisher: Removed resource provider of segment " + snapshot.segment_id);
        }
        return removed_provider;
    }

    ResourceProvider provider = store_->ensure_resource_provider(snapshot.segment_id, name);

    bool written = false;
    auto current = store_->get_inventory(snapshot.segment_id, config::IPV4_RESOURCE_CLASS);
    InventoryRecord record = snapshot.to_record(provider.generation);

    if (!current || !current->same_capacity(record)) {
        if (current) {
            record.resource_provider_generation = current->resource_provider_generation;
        }
        uint64_t generation = store_->put_inventory(
            snapshot.segment_id, config::IPV4_RESOURCE_CLASS, record);
        written = true;

        log_info("InventoryPublisher: Published segment " + snapshot.segment_id +
                 " inventory total=" + std::to_string(record.total) +
                 " reserved=" + std::to_string(record.reserved) +
                 " generation=" + std::to_string(generation));
    }

    store_->ensure_aggregate(name, snapshot.segment_id);
    store_->set_aggregate_hosts(name, snapshot.hosts);

    return written;
}

void InventoryPublisher::finish_chain(const std::string& segment_id) {
    bool more = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (pending_.count(segment_id) > 0) {
            more = true;
        } else {
            in_flight_.erase(segment_id);
        }
    }

    if (more) {
        asio::post(io_context_, [this, segment_id]() {
            run_publish(segment_id, 1, std::nullopt);
        });
    } else {
        idle_cv_.notify_all();
    }
}

// ============================================================================
// Query Functions
// ============================================================================

std::vector<std::string> InventoryPublisher::degraded_segments() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return std::vector<std::string>(degraded_.begin(), degraded_.end());
}

bool InventoryPublisher::is_degraded(const std::string& segment_id) const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return degraded_.count(segment_id) > 0;
}

std::optional<SegmentInventory> InventoryPublisher::last_published(const std::string& segment_id) const {
    std::lock_guard<std::mutex> lock(queue_mutex_);

    auto it = last_published_.find(segment_id);
    if (it == last_published_.end()) {
        return std::nullopt;
    }
    return it->second;
}

PublisherStats InventoryPublisher::get_stats() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return stats_;
}

} // namespace segipam
