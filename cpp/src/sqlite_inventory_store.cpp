/**
 * @file sqlite_inventory_store.cpp
 * @brief Implementation of SQLite-backed resource-inventory store
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "segipam/sqlite_inventory_store.hpp"
#include "segipam/exceptions.hpp"
#include "segipam/utilities.hpp"

#include <sqlite3.h>

#include <filesystem>

namespace segipam {

using namespace segipam::utilities;

namespace {

/**
 * @brief Prepared statement finalized on scope exit
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql, const std::string& context)
        : db_(db)
        , stmt_(nullptr)
        , context_(context)
    {
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            throw InventoryStoreError(context_ + ": " + sqlite3_errmsg(db_));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bind_int64(int index, uint64_t value) {
        sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    }

    void bind_double(int index, double value) {
        sqlite3_bind_double(stmt_, index, value);
    }

    /// @return true if a row is available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw InventoryStoreError(context_ + ": " + sqlite3_errmsg(db_));
    }

    std::string column_text(int column) const {
        const unsigned char* text = sqlite3_column_text(stmt_, column);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    uint64_t column_uint64(int column) const {
        return static_cast<uint64_t>(sqlite3_column_int64(stmt_, column));
    }

    double column_double(int column) const {
        return sqlite3_column_double(stmt_, column);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
    std::string context_;
};

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

SqliteInventoryStore::SqliteInventoryStore(const std::string& database_path)
    : database_path_(database_path)
    , db_connection_(nullptr)
{
    if (database_path_ != ":memory:") {
        std::filesystem::path parent = std::filesystem::path(database_path_).parent_path();
        std::error_code ec;
        if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw InventoryStoreError("cannot create directory " + parent.string() +
                                          ": " + ec.message());
            }
        }
    }

    // Open SQLite database
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw InventoryStoreError("failed to open inventory database: " + database_path_);
    }

    db_connection_ = static_cast<void*>(db);

    // Initialize database schema
    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw InventoryStoreError("failed to initialize inventory schema");
    }

    log_info("SqliteInventoryStore: Opened " + database_path_);
}

SqliteInventoryStore::~SqliteInventoryStore() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool SqliteInventoryStore::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    const char* schema = R"(
        PRAGMA foreign_keys = ON;
        CREATE TABLE IF NOT EXISTS resource_providers (
            uuid TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            generation INTEGER NOT NULL DEFAULT 0
        );
        CREATE TABLE IF NOT EXISTS inventories (
            provider_uuid TEXT NOT NULL REFERENCES resource_providers(uuid) ON DELETE CASCADE,
            resource_class TEXT NOT NULL,
            total INTEGER NOT NULL,
            reserved INTEGER NOT NULL,
            min_unit INTEGER NOT NULL,
            max_unit INTEGER NOT NULL,
            step_size INTEGER NOT NULL,
            allocation_ratio REAL NOT NULL,
            PRIMARY KEY (provider_uuid, resource_class),
            CONSTRAINT valid_reserved CHECK (reserved <= total)
        );
        CREATE TABLE IF NOT EXISTS aggregates (
            name TEXT PRIMARY KEY,
            provider_uuid TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS aggregate_hosts (
            aggregate_name TEXT NOT NULL REFERENCES aggregates(name) ON DELETE CASCADE,
            host TEXT NOT NULL,
            PRIMARY KEY (aggregate_name, host)
        );
    )";

    int rc = sqlite3_exec(db, schema, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            log_error("SqliteInventoryStore: Schema error: " + std::string(error_msg));
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Resource Providers
// ============================================================================

ResourceProvider SqliteInventoryStore::ensure_resource_provider(
    const std::string& uuid,
    const std::string& name
) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    auto existing = find_provider_locked(uuid);
    if (existing) {
        return *existing;
    }

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    Statement insert(db,
        "INSERT INTO resource_providers (uuid, name, generation) VALUES (?, ?, 0)",
        "create resource provider " + uuid);
    insert.bind_text(1, uuid);
    insert.bind_text(2, name);
    insert.step();

    return ResourceProvider{uuid, name, 0};
}

std::optional<ResourceProvider> SqliteInventoryStore::get_resource_provider(const std::string& uuid) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return find_provider_locked(uuid);
}

bool SqliteInventoryStore::delete_resource_provider(const std::string& uuid) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    Statement remove(db, "DELETE FROM resource_providers WHERE uuid = ?",
                     "delete resource provider " + uuid);
    remove.bind_text(1, uuid);
    remove.step();

    return sqlite3_changes(db) > 0;
}

size_t SqliteInventoryStore::get_provider_count() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    Statement count(db, "SELECT COUNT(*) FROM resource_providers", "count resource providers");
    if (!count.step()) {
        return 0;
    }
    return static_cast<size_t>(count.column_uint64(0));
}

// ============================================================================
// Inventories
// ============================================================================

std::optional<InventoryRecord> SqliteInventoryStore::get_inventory(
    const std::string& provider_uuid,
    const std::string& resource_class
) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT p.generation, i.total, i.reserved, i.step_size, i.min_unit, i.max_unit,
               i.allocation_ratio
        FROM inventories i
        JOIN resource_providers p ON p.uuid = i.provider_uuid
        WHERE i.provider_uuid = ? AND i.resource_class = ?
    )";

    Statement select(db, sql, "read inventory of " + provider_uuid);
    select.bind_text(1, provider_uuid);
    select.bind_text(2, resource_class);

    if (!select.step()) {
        return std::nullopt;
    }

    InventoryRecord record;
    record.resource_provider_generation = select.column_uint64(0);
    record.total = select.column_uint64(1);
    record.reserved = select.column_uint64(2);
    record.step_size = select.column_uint64(3);
    record.min_unit = select.column_uint64(4);
    record.max_unit = select.column_uint64(5);
    record.allocation_ratio = select.column_double(6);
    return record;
}

uint64_t SqliteInventoryStore::put_inventory(
    const std::string& provider_uuid,
    const std::string& resource_class,
    const InventoryRecord& record
) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    if (record.reserved > record.total) {
        throw InventoryStoreError("reserved " + std::to_string(record.reserved) +
                                  " exceeds total " + std::to_string(record.total));
    }

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    execute_locked("BEGIN IMMEDIATE", "begin inventory update");

    try {
        auto provider = find_provider_locked(provider_uuid);
        if (!provider) {
            throw InventoryStoreError("resource provider " + provider_uuid + " does not exist");
        }
        if (provider->generation != record.resource_provider_generation) {
            throw InventoryStoreError("generation conflict on resource provider " + provider_uuid +
                                      " (have " + std::to_string(provider->generation) +
                                      ", got " + std::to_string(record.resource_provider_generation) + ")");
        }

        const char* upsert_sql = R"(
            INSERT OR REPLACE INTO inventories
            (provider_uuid, resource_class, total, reserved, min_unit, max_unit, step_size, allocation_ratio)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        )";

        Statement upsert(db, upsert_sql, "write inventory of " + provider_uuid);
        upsert.bind_text(1, provider_uuid);
        upsert.bind_text(2, resource_class);
        upsert.bind_int64(3, record.total);
        upsert.bind_int64(4, record.reserved);
        upsert.bind_int64(5, record.min_unit);
        upsert.bind_int64(6, record.max_unit);
        upsert.bind_int64(7, record.step_size);
        upsert.bind_double(8, record.allocation_ratio);
        upsert.step();

        Statement bump(db, "UPDATE resource_providers SET generation = generation + 1 WHERE uuid = ?",
                       "bump generation of " + provider_uuid);
        bump.bind_text(1, provider_uuid);
        bump.step();

        execute_locked("COMMIT", "commit inventory update");
        return provider->generation + 1;

    } catch (const InventoryStoreError&) {
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
}

// ============================================================================
// Aggregates
// ============================================================================

void SqliteInventoryStore::ensure_aggregate(const std::string& name, const std::string& provider_uuid) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    Statement insert(db,
        "INSERT OR IGNORE INTO aggregates (name, provider_uuid) VALUES (?, ?)",
        "create aggregate " + name);
    insert.bind_text(1, name);
    insert.bind_text(2, provider_uuid);
    insert.step();
}

bool SqliteInventoryStore::delete_aggregate(const std::string& name) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    Statement remove(db, "DELETE FROM aggregates WHERE name = ?", "delete aggregate " + name);
    remove.bind_text(1, name);
    remove.step();

    return sqlite3_changes(db) > 0;
}

void SqliteInventoryStore::set_aggregate_hosts(
    const std::string& name,
    const std::vector<std::string>& hosts
) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    execute_locked("BEGIN IMMEDIATE", "begin aggregate update");

    try {
        Statement exists(db, "SELECT 1 FROM aggregates WHERE name = ?", "read aggregate " + name);
        exists.bind_text(1, name);
        if (!exists.step()) {
            throw InventoryStoreError("aggregate '" + name + "' does not exist");
        }

        Statement clear(db, "DELETE FROM aggregate_hosts WHERE aggregate_name = ?",
                        "clear aggregate " + name);
        clear.bind_text(1, name);
        clear.step();

        for (const auto& host : hosts) {
            Statement insert(db,
                "INSERT OR IGNORE INTO aggregate_hosts (aggregate_name, host) VALUES (?, ?)",
                "add host to aggregate " + name);
            insert.bind_text(1, name);
            insert.bind_text(2, host);
            insert.step();
        }

        execute_locked("COMMIT", "commit aggregate update");

    } catch (const InventoryStoreError&) {
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
}

std::vector<std::string> SqliteInventoryStore::aggregate_hosts(const std::string& name) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    Statement select(db,
        "SELECT host FROM aggregate_hosts WHERE aggregate_name = ? ORDER BY host",
        "read aggregate hosts of " + name);
    select.bind_text(1, name);

    std::vector<std::string> hosts;
    while (select.step()) {
        hosts.push_back(select.column_text(0));
    }
    return hosts;
}

// ============================================================================
// Private Helper Functions
// ============================================================================

std::optional<ResourceProvider> SqliteInventoryStore::find_provider_locked(const std::string& uuid) {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    Statement select(db,
        "SELECT uuid, name, generation FROM resource_providers WHERE uuid = ?",
        "read resource provider " + uuid);
    select.bind_text(1, uuid);

    if (!select.step()) {
        return std::nullopt;
    }

    return ResourceProvider{select.column_text(0), select.column_text(1), select.column_uint64(2)};
}

void SqliteInventoryStore::execute_locked(const char* sql, const std::string& context) {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string message = error_msg ? error_msg : sqlite3_errmsg(db);
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        throw InventoryStoreError(context + ": " + message);
    }
}

} // namespace segipam
