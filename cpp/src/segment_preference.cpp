/**
 * @file segment_preference.cpp
 * @brief Segment preference policies
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "segipam/segment_preference.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

namespace segipam {

std::vector<Segment> DeclarationOrderPreference::order(std::vector<Segment> candidates) const {
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const Segment& a, const Segment& b) {
            return a.segment_index < b.segment_index;
        });
    return candidates;
}

MostAvailablePreference::MostAvailablePreference(FreeAddressCounter counter)
    : counter_(std::move(counter))
{
    if (!counter_) {
        throw std::invalid_argument("MostAvailablePreference requires a free address counter");
    }
}

std::vector<Segment> MostAvailablePreference::order(std::vector<Segment> candidates) const {
    // Count once per segment; counts may move while sorting
    std::map<std::string, uint64_t> free;
    for (const auto& segment : candidates) {
        free[segment.id] = counter_(segment.id);
    }

    std::stable_sort(candidates.begin(), candidates.end(),
        [&free](const Segment& a, const Segment& b) {
            uint64_t free_a = free.at(a.id);
            uint64_t free_b = free.at(b.id);
            if (free_a != free_b) {
                return free_a > free_b;
            }
            return a.segment_index < b.segment_index;
        });
    return candidates;
}

std::unique_ptr<SegmentPreference> make_segment_preference(
    SegmentPreferencePolicy policy,
    FreeAddressCounter counter
) {
    switch (policy) {
        case SegmentPreferencePolicy::DECLARATION_ORDER:
            return std::make_unique<DeclarationOrderPreference>();
        case SegmentPreferencePolicy::MOST_AVAILABLE:
            return std::make_unique<MostAvailablePreference>(std::move(counter));
    }
    throw std::invalid_argument("Unknown segment preference policy");
}

} // namespace segipam
