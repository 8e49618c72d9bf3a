//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/NetTypes.hpp
// Purpose: Fixed-size routing primitives: IP addresses, prefixes, ASNs and
//          standard communities.
// Key invariants: Prefix length never exceeds the address width (32 or 128).
// Ownership/Lifetime: Trivially copyable value types.
// Links: runtime/Value.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sieve::runtime
{

/// @brief IPv4 or IPv6 address. IPv4 occupies the first four bytes.
struct IpAddr
{
    bool v6 = false;
    std::array<uint8_t, 16> bytes{};

    static IpAddr v4(uint8_t a, uint8_t b, uint8_t c, uint8_t d);
    static IpAddr v4(uint32_t hostOrder);
    static IpAddr fromV6(const std::array<uint8_t, 16> &octets);

    /// @brief Parse dotted IPv4 ("192.0.2.1") or full/compressed IPv6.
    static std::optional<IpAddr> parse(std::string_view text);

    unsigned width() const
    {
        return v6 ? 128u : 32u;
    }

    /// @brief Value of bit @p index counted from the most significant bit.
    bool bit(unsigned index) const
    {
        return (bytes[index / 8] >> (7 - index % 8)) & 1u;
    }

    std::string toString() const;

    auto operator<=>(const IpAddr &) const = default;
};

/// @brief Address prefix such as 10.0.0.0/8.
struct Prefix
{
    IpAddr addr;
    uint8_t len = 0;

    /// @brief Build a prefix; fails when @p length exceeds the address width.
    static std::optional<Prefix> make(const IpAddr &addr, unsigned length);

    /// @brief Parse "a.b.c.d/len" or "v6addr/len".
    static std::optional<Prefix> parse(std::string_view text);

    /// @brief Whether @p ip lies inside this prefix.
    bool contains(const IpAddr &ip) const;

    /// @brief Whether @p other is equal to or more specific than this prefix.
    bool covers(const Prefix &other) const;

    std::string toString() const;

    auto operator<=>(const Prefix &) const = default;
};

/// @brief Autonomous system number.
struct Asn
{
    uint32_t value = 0;

    std::string toString() const
    {
        return "AS" + std::to_string(value);
    }

    auto operator<=>(const Asn &) const = default;
};

/// @brief RFC 1997 standard community (16-bit ASN : 16-bit value).
struct Community
{
    uint32_t raw = 0;

    static Community make(uint16_t asn, uint16_t value)
    {
        return Community{(static_cast<uint32_t>(asn) << 16) | value};
    }

    uint16_t asn() const
    {
        return static_cast<uint16_t>(raw >> 16);
    }

    uint16_t value() const
    {
        return static_cast<uint16_t>(raw & 0xFFFFu);
    }

    std::string toString() const
    {
        return std::to_string(asn()) + ":" + std::to_string(value());
    }

    auto operator<=>(const Community &) const = default;
};

} // namespace sieve::runtime
