/**
 * @file sqlite_inventory_store.hpp
 * @brief SQLite-backed resource-inventory store
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Durable local mirror of what is published to the scheduler:
 * - Resource providers with generation counters
 * - Inventories per provider and resource class
 * - Aggregates and their hosts
 * - Thread-safe operations
 */

#pragma once

#include "segipam/inventory_store.hpp"

#include <mutex>
#include <string>

namespace segipam {

/**
 * @brief SqliteInventoryStore - InventoryStore persisted in SQLite
 */
class SqliteInventoryStore : public InventoryStore {
public:
    /**
     * @brief Open (and create) inventory database
     * @param database_path Path to SQLite database file (":memory:" for in-memory)
     * @throws InventoryStoreError if database cannot be opened or initialized
     */
    explicit SqliteInventoryStore(const std::string& database_path);

    /**
     * @brief Destructor - closes database
     */
    ~SqliteInventoryStore() override;

    // Disable copy and move
    SqliteInventoryStore(const SqliteInventoryStore&) = delete;
    SqliteInventoryStore& operator=(const SqliteInventoryStore&) = delete;
    SqliteInventoryStore(SqliteInventoryStore&&) = delete;
    SqliteInventoryStore& operator=(SqliteInventoryStore&&) = delete;

    ResourceProvider ensure_resource_provider(
        const std::string& uuid,
        const std::string& name
    ) override;

    std::optional<ResourceProvider> get_resource_provider(const std::string& uuid) override;

    bool delete_resource_provider(const std::string& uuid) override;

    std::optional<InventoryRecord> get_inventory(
        const std::string& provider_uuid,
        const std::string& resource_class
    ) override;

    uint64_t put_inventory(
        const std::string& provider_uuid,
        const std::string& resource_class,
        const InventoryRecord& record
    ) override;

    void ensure_aggregate(const std::string& name, const std::string& provider_uuid) override;

    bool delete_aggregate(const std::string& name) override;

    void set_aggregate_hosts(
        const std::string& name,
        const std::vector<std::string>& hosts
    ) override;

    std::vector<std::string> aggregate_hosts(const std::string& name) override;

    /**
     * @brief Number of resource providers stored
     */
    size_t get_provider_count();

private:
    /// Path to SQLite database
    std::string database_path_;

    /// SQLite database connection (opaque pointer)
    void* db_connection_;

    /// Mutex for thread-safe database access
    std::mutex db_mutex_;

    /**
     * @brief Initialize database schema
     * @return true if successful, false otherwise
     */
    bool initialize_database();

    /// Caller holds db_mutex_
    std::optional<ResourceProvider> find_provider_locked(const std::string& uuid);

    /// Caller holds db_mutex_
    void execute_locked(const char* sql, const std::string& context);
};

} // namespace segipam
