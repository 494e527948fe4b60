/**
 * @file lock_table.hpp
 * @brief Keyed mutex table for network- and port-scoped critical sections
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>

namespace segipam {

/**
 * @brief LockTable - one mutex per key, created on first use
 *
 * Returned mutexes are shared so a caller holding one keeps it alive after
 * erase() drops the table entry.
 */
template <typename Key>
class LockTable {
public:
    LockTable() = default;
    ~LockTable() = default;

    // Disable copy and move
    LockTable(const LockTable&) = delete;
    LockTable& operator=(const LockTable&) = delete;
    LockTable(LockTable&&) = delete;
    LockTable& operator=(LockTable&&) = delete;

    /**
     * @brief Get (or create) the mutex for a key
     */
    std::shared_ptr<std::mutex> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = locks_.find(key);
        if (it != locks_.end()) {
            return it->second;
        }

        auto entry = std::make_shared<std::mutex>();
        locks_.emplace(key, entry);
        return entry;
    }

    /**
     * @brief Forget a key once its entity is gone
     */
    void erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        locks_.erase(key);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return locks_.size();
    }

private:
    std::map<Key, std::shared_ptr<std::mutex>> locks_;
    mutable std::mutex mutex_;
};

} // namespace segipam
