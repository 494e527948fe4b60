/**
 * @file fake_inventory_store.hpp
 * @brief In-memory InventoryStore with injectable failures for tests
 */

#pragma once

#include "segipam/exceptions.hpp"
#include "segipam/inventory_store.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace segipam {
namespace test_support {

class FakeInventoryStore : public InventoryStore {
public:
    /// Fail the next @p count store calls
    void fail_next(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_remaining_ = count;
    }

    /// Fail every store call until cleared
    void fail_always(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_always_ = enabled;
    }

    int call_count() const { return calls_.load(); }

    int put_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return puts_;
    }

    bool has_provider(const std::string& uuid) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return providers_.count(uuid) > 0;
    }

    bool has_aggregate(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return aggregates_.count(name) > 0;
    }

    ResourceProvider ensure_resource_provider(const std::string& uuid, const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_fail("ensure_resource_provider");

        auto it = providers_.find(uuid);
        if (it != providers_.end()) {
            return it->second;
        }
        ResourceProvider provider{uuid, name, 0};
        providers_.emplace(uuid, provider);
        return provider;
    }

    std::optional<ResourceProvider> get_resource_provider(const std::string& uuid) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_fail("get_resource_provider");

        auto it = providers_.find(uuid);
        if (it == providers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool delete_resource_provider(const std::string& uuid) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_fail("delete_resource_provider");

        inventories_.erase(uuid);
        return providers_.erase(uuid) > 0;
    }

    std::optional<InventoryRecord> get_inventory(
        const std::string& provider_uuid,
        const std::string& resource_class
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_fail("get_inventory");

        auto provider = providers_.find(provider_uuid);
        auto it = inventories_.find(provider_uuid);
        if (provider == providers_.end() || it == inventories_.end()) {
            return std::nullopt;
        }
        auto record = it->second.find(resource_class);
        if (record == it->second.end()) {
            return std::nullopt;
        }
        InventoryRecord result = record->second;
        result.resource_provider_generation = provider->second.generation;
        return result;
    }

    uint64_t put_inventory(
        const std::string& provider_uuid,
        const std::string& resource_class,
        const InventoryRecord& record
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_fail("put_inventory");

        auto provider = providers_.find(provider_uuid);
        if (provider == providers_.end()) {
            throw InventoryStoreError("resource provider " + provider_uuid + " does not exist");
        }
        if (provider->second.generation != record.resource_provider_generation) {
            throw InventoryStoreError("generation conflict on " + provider_uuid);
        }
        if (record.reserved > record.total) {
            throw InventoryStoreError("reserved exceeds total");
        }

        inventories_[provider_uuid][resource_class] = record;
        puts_++;
        return ++provider->second.generation;
    }

    void ensure_aggregate(const std::string& name, const std::string& provider_uuid) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_fail("ensure_aggregate");

        aggregates_.emplace(name, provider_uuid);
    }

    bool delete_aggregate(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_fail("delete_aggregate");

        aggregate_hosts_.erase(name);
        return aggregates_.erase(name) > 0;
    }

    void set_aggregate_hosts(const std::string& name, const std::vector<std::string>& hosts) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_fail("set_aggregate_hosts");

        if (aggregates_.count(name) == 0) {
            throw InventoryStoreError("aggregate '" + name + "' does not exist");
        }
        aggregate_hosts_[name] = std::set<std::string>(hosts.begin(), hosts.end());
    }

    std::vector<std::string> aggregate_hosts(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = aggregate_hosts_.find(name);
        if (it == aggregate_hosts_.end()) {
            return {};
        }
        return std::vector<std::string>(it->second.begin(), it->second.end());
    }

private:
    std::map<std::string, ResourceProvider> providers_;
    std::map<std::string, std::map<std::string, InventoryRecord>> inventories_;
    std::map<std::string, std::string> aggregates_;
    std::map<std::string, std::set<std::string>> aggregate_hosts_;

    int failures_remaining_ = 0;
    bool fail_always_ = false;
    int puts_ = 0;
    std::atomic<int> calls_{0};
    mutable std::mutex mutex_;

    void maybe_fail(const std::string& operation) {
        calls_++;
        if (fail_always_) {
            throw InventoryStoreError(operation + " unavailable");
        }
        if (failures_remaining_ > 0) {
            failures_remaining_--;
            throw InventoryStoreError(operation + " unavailable");
        }
    }
};

} // namespace test_support
} // namespace segipam
