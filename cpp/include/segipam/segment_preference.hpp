/**
 * @file segment_preference.hpp
 * @brief Tie-break order for hosts reaching several segments
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "segipam/ipam_config.hpp"
#include "segipam/model.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace segipam {

/**
 * @brief Free IPv4 addresses of a segment
 */
using FreeAddressCounter = std::function<uint64_t(const std::string& segment_id)>;

/**
 * @brief SegmentPreference - orders candidate segments for allocation
 */
class SegmentPreference {
public:
    virtual ~SegmentPreference() = default;

    /**
     * @brief Order candidates, most preferred first
     */
    virtual std::vector<Segment> order(std::vector<Segment> candidates) const = 0;

    virtual SegmentPreferencePolicy policy() const = 0;
};

/**
 * @brief Lowest segment index first
 */
class DeclarationOrderPreference : public SegmentPreference {
public:
    std::vector<Segment> order(std::vector<Segment> candidates) const override;
    SegmentPreferencePolicy policy() const override { return SegmentPreferencePolicy::DECLARATION_ORDER; }
};

/**
 * @brief Most free IPv4 addresses first, then lowest segment index
 */
class MostAvailablePreference : public SegmentPreference {
public:
    explicit MostAvailablePreference(FreeAddressCounter counter);

    std::vector<Segment> order(std::vector<Segment> candidates) const override;
    SegmentPreferencePolicy policy() const override { return SegmentPreferencePolicy::MOST_AVAILABLE; }

private:
    FreeAddressCounter counter_;
};

/**
 * @brief Build the preference selected by configuration
 * @param policy Configured policy
 * @param counter Free address source (used by MOST_AVAILABLE)
 */
std::unique_ptr<SegmentPreference> make_segment_preference(
    SegmentPreferencePolicy policy,
    FreeAddressCounter counter
);

} // namespace segipam
