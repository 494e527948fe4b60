/**
 * @file ip_address.cpp
 * @brief Implementation of address, range and CIDR value types
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "segipam/ip_address.hpp"

#include <asio.hpp>

#include <limits>
#include <stdexcept>

namespace segipam {

namespace {

uint128_t all_ones(int bits) {
    if (bits >= 128) {
        return ~static_cast<uint128_t>(0);
    }
    return (static_cast<uint128_t>(1) << bits) - 1;
}

// Mask covering the host part of a prefix
uint128_t host_mask(int bit_length, int prefix_length) {
    return all_ones(bit_length - prefix_length);
}

} // namespace

uint64_t saturate_to_u64(uint128_t value) {
    if (value > static_cast<uint128_t>(std::numeric_limits<uint64_t>::max())) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(value);
}

// ============================================================================
// IpAddress
// ============================================================================

IpAddress::IpAddress()
    : version_(4)
    , value_(0)
{
}

IpAddress::IpAddress(int version, uint128_t value)
    : version_(version)
    , value_(value)
{
    if (version_ != 4 && version_ != 6) {
        throw std::invalid_argument("IP version must be 4 or 6");
    }
    if (version_ == 4 && value_ > all_ones(32)) {
        throw std::invalid_argument("IPv4 address value out of range");
    }
}

std::optional<IpAddress> IpAddress::parse(const std::string& text) {
    asio::error_code ec;
    asio::ip::address address = asio::ip::make_address(text, ec);
    if (ec) {
        return std::nullopt;
    }

    if (address.is_v4()) {
        return IpAddress(4, address.to_v4().to_uint());
    }

    // Scoped link-local text is not a pool address
    if (address.to_v6().scope_id() != 0) {
        return std::nullopt;
    }

    uint128_t value = 0;
    for (auto byte : address.to_v6().to_bytes()) {
        value = (value << 8) | byte;
    }
    return IpAddress(6, value);
}

IpAddress IpAddress::from_string(const std::string& text) {
    auto address = parse(text);
    if (!address) {
        throw std::invalid_argument("Invalid IP address: '" + text + "'");
    }
    return *address;
}

IpAddress IpAddress::max_address() const {
    return IpAddress(version_, all_ones(bit_length()));
}

IpAddress IpAddress::next() const {
    return IpAddress(version_, value_ + 1);
}

IpAddress IpAddress::prev() const {
    return IpAddress(version_, value_ - 1);
}

std::string IpAddress::to_string() const {
    if (version_ == 4) {
        return asio::ip::address_v4(static_cast<asio::ip::address_v4::uint_type>(value_)).to_string();
    }

    asio::ip::address_v6::bytes_type bytes;
    uint128_t remaining = value_;
    for (size_t i = bytes.size(); i > 0; --i) {
        bytes[i - 1] = static_cast<unsigned char>(remaining & 0xff);
        remaining >>= 8;
    }
    return asio::ip::address_v6(bytes).to_string();
}

bool IpAddress::operator==(const IpAddress& other) const {
    return version_ == other.version_ && value_ == other.value_;
}

bool IpAddress::operator!=(const IpAddress& other) const {
    return !(*this == other);
}

bool IpAddress::operator<(const IpAddress& other) const {
    if (version_ != other.version_) {
        return version_ < other.version_;
    }
    return value_ < other.value_;
}

bool IpAddress::operator<=(const IpAddress& other) const {
    return !(other < *this);
}

bool IpAddress::operator>(const IpAddress& other) const {
    return other < *this;
}

bool IpAddress::operator>=(const IpAddress& other) const {
    return !(*this < other);
}

// ============================================================================
// IpRange
// ============================================================================

IpRange::IpRange(const IpAddress& first_address, const IpAddress& last_address)
    : first(first_address)
    , last(last_address)
{
    if (first.version() != last.version()) {
        throw std::invalid_argument("Range endpoints must share an IP version");
    }
    if (last < first) {
        throw std::invalid_argument(
            "Range start " + first.to_string() + " is after end " + last.to_string());
    }
}

IpRange IpRange::from_strings(const std::string& start, const std::string& end) {
    return IpRange(IpAddress::from_string(start), IpAddress::from_string(end));
}

uint128_t IpRange::size() const {
    // A full IPv6 range does not fit; clamp to the largest value
    uint128_t span = last.value() - first.value();
    if (span == ~static_cast<uint128_t>(0)) {
        return span;
    }
    return span + 1;
}

bool IpRange::contains(const IpAddress& address) const {
    return address.version() == first.version() && first <= address && address <= last;
}

bool IpRange::overlaps(const IpRange& other) const {
    if (first.version() != other.first.version()) {
        return false;
    }
    return first <= other.last && other.first <= last;
}

std::string IpRange::to_string() const {
    return first.to_string() + "-" + last.to_string();
}

bool IpRange::operator==(const IpRange& other) const {
    return first == other.first && last == other.last;
}

bool IpRange::operator!=(const IpRange& other) const {
    return !(*this == other);
}

bool IpRange::operator<(const IpRange& other) const {
    if (first != other.first) {
        return first < other.first;
    }
    return last < other.last;
}

// ============================================================================
// IpNetwork
// ============================================================================

IpNetwork::IpNetwork()
    : network_address_()
    , prefix_length_(0)
{
}

IpNetwork::IpNetwork(const IpAddress& network_address, int prefix_length)
    : network_address_(network_address)
    , prefix_length_(prefix_length)
{
    if (prefix_length_ < 0 || prefix_length_ > network_address_.bit_length()) {
        throw std::invalid_argument("Invalid prefix length: " + std::to_string(prefix_length_));
    }
    if ((network_address_.value() & host_mask(network_address_.bit_length(), prefix_length_)) != 0) {
        throw std::invalid_argument(
            "Host bits set in CIDR " + network_address_.to_string() + "/" + std::to_string(prefix_length_));
    }
}

std::optional<IpNetwork> IpNetwork::parse(const std::string& text) {
    auto slash = text.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= text.size()) {
        return std::nullopt;
    }

    auto address = IpAddress::parse(text.substr(0, slash));
    if (!address) {
        return std::nullopt;
    }

    const std::string prefix_text = text.substr(slash + 1);
    if (prefix_text.size() > 3) {
        return std::nullopt;
    }
    for (char c : prefix_text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }

    int prefix = std::stoi(prefix_text);
    if (prefix > address->bit_length()) {
        return std::nullopt;
    }
    if ((address->value() & host_mask(address->bit_length(), prefix)) != 0) {
        return std::nullopt;
    }

    return IpNetwork(*address, prefix);
}

IpNetwork IpNetwork::from_string(const std::string& text) {
    auto network = parse(text);
    if (!network) {
        throw std::invalid_argument("Invalid CIDR: '" + text + "'");
    }
    return *network;
}

IpAddress IpNetwork::last_address() const {
    return IpAddress(
        network_address_.version(),
        network_address_.value() | host_mask(network_address_.bit_length(), prefix_length_));
}

uint128_t IpNetwork::size() const {
    return as_range().size();
}

bool IpNetwork::contains(const IpAddress& address) const {
    return as_range().contains(address);
}

bool IpNetwork::overlaps(const IpNetwork& other) const {
    return as_range().overlaps(other.as_range());
}

IpRange IpNetwork::as_range() const {
    return IpRange(network_address_, last_address());
}

IpRange IpNetwork::host_range() const {
    const int host_bits = network_address_.bit_length() - prefix_length_;

    if (version() == 4) {
        if (host_bits <= 1) {
            return as_range();
        }
        return IpRange(network_address_.next(), last_address().prev());
    }

    if (host_bits == 0) {
        return as_range();
    }
    return IpRange(network_address_.next(), last_address());
}

std::string IpNetwork::to_string() const {
    return network_address_.to_string() + "/" + std::to_string(prefix_length_);
}

bool IpNetwork::operator==(const IpNetwork& other) const {
    return network_address_ == other.network_address_ && prefix_length_ == other.prefix_length_;
}

bool IpNetwork::operator!=(const IpNetwork& other) const {
    return !(*this == other);
}

} // namespace segipam
