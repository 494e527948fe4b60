/**
 * @file model.cpp
 * @brief String conversions for model enums
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "segipam/model.hpp"
#include "segipam/exceptions.hpp"
#include "segipam/utilities.hpp"

namespace segipam {

const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::VALIDATION: return "validation";
        case ErrorCategory::NOT_FOUND: return "not_found";
        case ErrorCategory::CONFLICT: return "conflict";
        case ErrorCategory::RESOURCE: return "resource";
        case ErrorCategory::INTEGRATION: return "integration";
        default: return "unknown";
    }
}

// ============================================================================
// Segment Types
// ============================================================================

std::string ModelHelpers::segment_type_to_string(SegmentType type) {
    switch (type) {
        case SegmentType::FLAT: return "flat";
        case SegmentType::VLAN: return "vlan";
        case SegmentType::VXLAN: return "vxlan";
        case SegmentType::GRE: return "gre";
        case SegmentType::LOCAL: return "local";
        default: return "unknown";
    }
}

std::optional<SegmentType> ModelHelpers::string_to_segment_type(const std::string& str) {
    const std::string lower = utilities::to_lowercase(str);
    if (lower == "flat") return SegmentType::FLAT;
    if (lower == "vlan") return SegmentType::VLAN;
    if (lower == "vxlan") return SegmentType::VXLAN;
    if (lower == "gre") return SegmentType::GRE;
    if (lower == "local") return SegmentType::LOCAL;
    return std::nullopt;
}

bool ModelHelpers::requires_physical_network(SegmentType type) {
    return type == SegmentType::FLAT || type == SegmentType::VLAN;
}

bool ModelHelpers::requires_segmentation_id(SegmentType type) {
    return type == SegmentType::VLAN || type == SegmentType::VXLAN || type == SegmentType::GRE;
}

// ============================================================================
// Port State
// ============================================================================

std::string ModelHelpers::ip_allocation_to_string(IpAllocation allocation) {
    switch (allocation) {
        case IpAllocation::IMMEDIATE: return "immediate";
        case IpAllocation::DEFERRED: return "deferred";
        default: return "unknown";
    }
}

std::string ModelHelpers::port_state_to_string(PortBindingState state) {
    switch (state) {
        case PortBindingState::UNBOUND: return "UNBOUND";
        case PortBindingState::HOST_BOUND: return "HOST_BOUND";
        case PortBindingState::ALLOCATED: return "ALLOCATED";
        case PortBindingState::ALLOCATION_FAILED: return "ALLOCATION_FAILED";
        default: return "UNKNOWN";
    }
}

std::optional<PortBindingState> ModelHelpers::string_to_port_state(const std::string& str) {
    if (str == "UNBOUND") return PortBindingState::UNBOUND;
    if (str == "HOST_BOUND") return PortBindingState::HOST_BOUND;
    if (str == "ALLOCATED") return PortBindingState::ALLOCATED;
    if (str == "ALLOCATION_FAILED") return PortBindingState::ALLOCATION_FAILED;
    return std::nullopt;
}

} // namespace segipam
