/**
 * @file inventory_store.hpp
 * @brief Contract of the external resource-inventory store
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The scheduler side of routed networks keeps, per segment:
 * - A resource provider whose uuid is the segment id
 * - An IPV4_ADDRESS inventory on that provider
 * - An aggregate named after the segment holding the mapped hosts
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace segipam {

/**
 * @brief Inventory of one resource class on one provider
 */
struct InventoryRecord {
    uint64_t resource_provider_generation = 0;  ///< Provider generation the record was read at / written against
    uint64_t total = 0;
    uint64_t reserved = 0;
    uint64_t step_size = 1;
    uint64_t min_unit = 1;
    uint64_t max_unit = 1;
    double allocation_ratio = 1.0;

    /**
     * @brief Compare everything but the generation
     */
    bool same_capacity(const InventoryRecord& other) const {
        return total == other.total &&
               reserved == other.reserved &&
               step_size == other.step_size &&
               min_unit == other.min_unit &&
               max_unit == other.max_unit &&
               allocation_ratio == other.allocation_ratio;
    }
};

/**
 * @brief Resource provider as seen by the store
 */
struct ResourceProvider {
    std::string uuid;
    std::string name;
    uint64_t generation = 0;
};

/**
 * @brief InventoryStore - external resource-inventory store
 *
 * Every method throws InventoryStoreError when the store cannot be reached
 * or rejects the request. Implementations must be thread-safe.
 */
class InventoryStore {
public:
    virtual ~InventoryStore() = default;

    /**
     * @brief Create provider if missing
     * @return Provider with its current generation
     */
    virtual ResourceProvider ensure_resource_provider(
        const std::string& uuid,
        const std::string& name
    ) = 0;

    virtual std::optional<ResourceProvider> get_resource_provider(const std::string& uuid) = 0;

    /**
     * @brief Delete provider and its inventories
     * @return true if provider existed
     */
    virtual bool delete_resource_provider(const std::string& uuid) = 0;

    virtual std::optional<InventoryRecord> get_inventory(
        const std::string& provider_uuid,
        const std::string& resource_class
    ) = 0;

    /**
     * @brief Create or replace inventory
     *
     * record.resource_provider_generation must equal the provider's current
     * generation; the write bumps it.
     *
     * @return New provider generation
     * @throws InventoryStoreError on generation conflict or missing provider
     */
    virtual uint64_t put_inventory(
        const std::string& provider_uuid,
        const std::string& resource_class,
        const InventoryRecord& record
    ) = 0;

    /**
     * @brief Create aggregate associated with provider if missing
     */
    virtual void ensure_aggregate(const std::string& name, const std::string& provider_uuid) = 0;

    /**
     * @brief Delete aggregate and its host list
     * @return true if aggregate existed
     */
    virtual bool delete_aggregate(const std::string& name) = 0;

    /**
     * @brief Replace aggregate membership
     */
    virtual void set_aggregate_hosts(
        const std::string& name,
        const std::vector<std::string>& hosts
    ) = 0;

    /**
     * @brief Aggregate members (sorted)
     */
    virtual std::vector<std::string> aggregate_hosts(const std::string& name) = 0;
};

} // namespace segipam
