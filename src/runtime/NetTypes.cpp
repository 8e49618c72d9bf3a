//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/NetTypes.cpp
// Purpose: Parsing, formatting and containment tests for routing primitives.
// Key invariants: Parsers reject out-of-range octets and prefix lengths.
// Ownership/Lifetime: Stateless helpers.
// Links: runtime/NetTypes.hpp
//
//===----------------------------------------------------------------------===//

#include "runtime/NetTypes.hpp"

#include <charconv>
#include <vector>

namespace sieve::runtime
{

namespace
{
std::optional<IpAddr> parseV4(std::string_view text)
{
    IpAddr ip;
    size_t pos = 0;
    for (int i = 0; i < 4; ++i)
    {
        if (i)
        {
            if (pos >= text.size() || text[pos] != '.')
                return std::nullopt;
            ++pos;
        }
        unsigned octet = 0;
        auto [end, ec] = std::from_chars(text.data() + pos, text.data() + text.size(), octet);
        size_t digits = static_cast<size_t>(end - (text.data() + pos));
        if (ec != std::errc() || digits == 0 || digits > 3 || octet > 255)
            return std::nullopt;
        ip.bytes[i] = static_cast<uint8_t>(octet);
        pos += digits;
    }
    if (pos != text.size())
        return std::nullopt;
    return ip;
}

std::optional<uint16_t> parseHexGroup(std::string_view group)
{
    if (group.empty() || group.size() > 4)
        return std::nullopt;
    unsigned value = 0;
    auto [end, ec] = std::from_chars(group.data(), group.data() + group.size(), value, 16);
    if (ec != std::errc() || end != group.data() + group.size())
        return std::nullopt;
    return static_cast<uint16_t>(value);
}

std::optional<std::vector<uint16_t>> parseGroups(std::string_view text)
{
    std::vector<uint16_t> groups;
    if (text.empty())
        return groups;
    size_t start = 0;
    while (true)
    {
        size_t colon = text.find(':', start);
        auto group = parseHexGroup(text.substr(start, colon == std::string_view::npos
                                                          ? std::string_view::npos
                                                          : colon - start));
        if (!group)
            return std::nullopt;
        groups.push_back(*group);
        if (colon == std::string_view::npos)
            break;
        start = colon + 1;
    }
    return groups;
}

std::optional<IpAddr> parseV6(std::string_view text)
{
    std::vector<uint16_t> head;
    std::vector<uint16_t> tail;
    size_t gap = text.find("::");
    if (gap == std::string_view::npos)
    {
        auto groups = parseGroups(text);
        if (!groups || groups->size() != 8)
            return std::nullopt;
        head = *groups;
    }
    else
    {
        auto h = parseGroups(text.substr(0, gap));
        auto t = parseGroups(text.substr(gap + 2));
        if (!h || !t || h->size() + t->size() > 7)
            return std::nullopt;
        head = *h;
        tail = *t;
    }
    std::array<uint8_t, 16> octets{};
    for (size_t i = 0; i < head.size(); ++i)
    {
        octets[2 * i] = static_cast<uint8_t>(head[i] >> 8);
        octets[2 * i + 1] = static_cast<uint8_t>(head[i] & 0xFF);
    }
    size_t offset = 8 - tail.size();
    for (size_t i = 0; i < tail.size(); ++i)
    {
        octets[2 * (offset + i)] = static_cast<uint8_t>(tail[i] >> 8);
        octets[2 * (offset + i) + 1] = static_cast<uint8_t>(tail[i] & 0xFF);
    }
    return IpAddr::fromV6(octets);
}
} // namespace

IpAddr IpAddr::v4(uint8_t a, uint8_t b, uint8_t c, uint8_t d)
{
    IpAddr ip;
    ip.bytes[0] = a;
    ip.bytes[1] = b;
    ip.bytes[2] = c;
    ip.bytes[3] = d;
    return ip;
}

IpAddr IpAddr::v4(uint32_t hostOrder)
{
    return v4(static_cast<uint8_t>(hostOrder >> 24), static_cast<uint8_t>(hostOrder >> 16),
              static_cast<uint8_t>(hostOrder >> 8), static_cast<uint8_t>(hostOrder));
}

IpAddr IpAddr::fromV6(const std::array<uint8_t, 16> &octets)
{
    IpAddr ip;
    ip.v6 = true;
    ip.bytes = octets;
    return ip;
}

std::optional<IpAddr> IpAddr::parse(std::string_view text)
{
    if (text.find(':') != std::string_view::npos)
        return parseV6(text);
    return parseV4(text);
}

std::string IpAddr::toString() const
{
    std::string out;
    if (!v6)
    {
        for (int i = 0; i < 4; ++i)
        {
            if (i)
                out += '.';
            out += std::to_string(bytes[i]);
        }
        return out;
    }
    static const char *kHex = "0123456789abcdef";
    for (int g = 0; g < 8; ++g)
    {
        if (g)
            out += ':';
        unsigned value = (static_cast<unsigned>(bytes[2 * g]) << 8) | bytes[2 * g + 1];
        bool leading = true;
        for (int shift = 12; shift >= 0; shift -= 4)
        {
            unsigned nibble = (value >> shift) & 0xF;
            if (leading && nibble == 0 && shift != 0)
                continue;
            leading = false;
            out += kHex[nibble];
        }
    }
    return out;
}

std::optional<Prefix> Prefix::make(const IpAddr &addr, unsigned length)
{
    if (length > addr.width())
        return std::nullopt;
    Prefix p;
    p.addr = addr;
    p.len = static_cast<uint8_t>(length);
    return p;
}

std::optional<Prefix> Prefix::parse(std::string_view text)
{
    size_t slash = text.find('/');
    if (slash == std::string_view::npos)
        return std::nullopt;
    auto addr = IpAddr::parse(text.substr(0, slash));
    if (!addr)
        return std::nullopt;
    std::string_view lenText = text.substr(slash + 1);
    unsigned length = 0;
    auto [end, ec] = std::from_chars(lenText.data(), lenText.data() + lenText.size(), length);
    if (ec != std::errc() || end != lenText.data() + lenText.size() || lenText.empty())
        return std::nullopt;
    return make(*addr, length);
}

bool Prefix::contains(const IpAddr &ip) const
{
    if (ip.v6 != addr.v6)
        return false;
    for (unsigned i = 0; i < len; ++i)
    {
        if (ip.bit(i) != addr.bit(i))
            return false;
    }
    return true;
}

bool Prefix::covers(const Prefix &other) const
{
    return other.addr.v6 == addr.v6 && other.len >= len && contains(other.addr);
}

std::string Prefix::toString() const
{
    return addr.toString() + "/" + std::to_string(len);
}

} // namespace sieve::runtime
