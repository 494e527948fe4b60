/**
 * @file ip_address.hpp
 * @brief IPv4/IPv6 address, CIDR and address range value types
 *
 * segipam - Segment-aware IPAM for routed provider networks
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Addresses are stored as 128-bit unsigned integers tagged with their IP
 * version so that pools can be walked and counted with plain arithmetic.
 * Textual parsing and formatting go through ASIO's address types.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace segipam {

/// Unsigned 128-bit integer wide enough for any IPv6 address
__extension__ typedef unsigned __int128 uint128_t;

/**
 * @brief Clamp a 128-bit count to 64 bits
 * @param value Count to clamp
 * @return value, or UINT64_MAX if it does not fit
 */
uint64_t saturate_to_u64(uint128_t value);

/**
 * @brief IpAddress - single IPv4 or IPv6 address
 */
class IpAddress {
public:
    /**
     * @brief Construct IPv4 0.0.0.0
     */
    IpAddress();

    /**
     * @brief Construct from version and integer value
     * @param version 4 or 6
     * @param value Address as host-order integer
     */
    IpAddress(int version, uint128_t value);

    /**
     * @brief Parse dotted-quad or IPv6 text
     * @param text Address text
     * @return Address or std::nullopt if text is not an address
     */
    static std::optional<IpAddress> parse(const std::string& text);

    /**
     * @brief Parse address text, throwing on malformed input
     * @param text Address text
     * @return Parsed address
     * @throws std::invalid_argument if text is not an address
     */
    static IpAddress from_string(const std::string& text);

    int version() const { return version_; }
    uint128_t value() const { return value_; }

    /// Number of bits in an address of this version (32 or 128)
    int bit_length() const { return version_ == 4 ? 32 : 128; }

    /// Largest representable address of this version
    IpAddress max_address() const;

    /// Address + 1 (caller must not step past max_address())
    IpAddress next() const;

    /// Address - 1 (caller must not step below zero)
    IpAddress prev() const;

    std::string to_string() const;

    bool operator==(const IpAddress& other) const;
    bool operator!=(const IpAddress& other) const;
    bool operator<(const IpAddress& other) const;
    bool operator<=(const IpAddress& other) const;
    bool operator>(const IpAddress& other) const;
    bool operator>=(const IpAddress& other) const;

private:
    int version_;
    uint128_t value_;
};

/**
 * @brief IpRange - inclusive range of addresses of one IP version
 */
struct IpRange {
    IpAddress first;    ///< Lowest address in range
    IpAddress last;     ///< Highest address in range

    IpRange() = default;
    IpRange(const IpAddress& first_address, const IpAddress& last_address);

    /**
     * @brief Parse a start/end pair
     * @throws std::invalid_argument on malformed text, mixed versions or start > end
     */
    static IpRange from_strings(const std::string& start, const std::string& end);

    /// Number of addresses in range
    uint128_t size() const;

    bool contains(const IpAddress& address) const;
    bool overlaps(const IpRange& other) const;

    /// "start-end"
    std::string to_string() const;

    bool operator==(const IpRange& other) const;
    bool operator!=(const IpRange& other) const;
    bool operator<(const IpRange& other) const;
};

/**
 * @brief IpNetwork - canonical CIDR block
 */
class IpNetwork {
public:
    /**
     * @brief Construct 0.0.0.0/0
     */
    IpNetwork();

    /**
     * @brief Construct from network address and prefix length
     * @throws std::invalid_argument if prefix is out of range or host bits are set
     */
    IpNetwork(const IpAddress& network_address, int prefix_length);

    /**
     * @brief Parse "address/prefix" text
     * @return Network or std::nullopt if text is not a canonical CIDR
     */
    static std::optional<IpNetwork> parse(const std::string& text);

    /**
     * @brief Parse "address/prefix" text
     * @throws std::invalid_argument if text is not a canonical CIDR
     */
    static IpNetwork from_string(const std::string& text);

    int version() const { return network_address_.version(); }
    int prefix_length() const { return prefix_length_; }

    /// First address of the block
    const IpAddress& network_address() const { return network_address_; }

    /// Last address of the block (the broadcast address for IPv4)
    IpAddress last_address() const;

    /// Total number of addresses in the block
    uint128_t size() const;

    bool contains(const IpAddress& address) const;
    bool overlaps(const IpNetwork& other) const;

    /// Whole block as a range
    IpRange as_range() const;

    /**
     * @brief Addresses that may be handed out from this block
     *
     * IPv4 excludes the network and broadcast addresses (except for /31 and
     * /32 point-to-point blocks). IPv6 excludes the subnet-router anycast
     * address (the network address) unless the block is a /128.
     */
    IpRange host_range() const;

    std::string to_string() const;

    bool operator==(const IpNetwork& other) const;
    bool operator!=(const IpNetwork& other) const;

private:
    IpAddress network_address_;
    int prefix_length_;
};

} // namespace segipam
