//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/Builtins.cpp
// Purpose: Built-in method table and implementations.
// Key invariants: Table order matches BuiltinId.
// Ownership/Lifetime: Static data only.
// Links: runtime/Builtins.hpp
//
//===----------------------------------------------------------------------===//

#include "runtime/Builtins.hpp"

#include <algorithm>
#include <array>

namespace sieve::runtime
{

using types::TypeKind;
using types::TypeRef;

namespace
{

struct BuiltinInfo
{
    BuiltinId id;
    TypeKind receiver;
    const char *name;
    unsigned arity;
};

constexpr std::array<BuiltinInfo, kBuiltinCount> kBuiltins = {{
    {BuiltinId::PrefixLen, TypeKind::Prefix, "len", 1},
    {BuiltinId::PrefixAddr, TypeKind::Prefix, "addr", 1},
    {BuiltinId::PrefixIsV4, TypeKind::Prefix, "is_v4", 1},
    {BuiltinId::PrefixContains, TypeKind::Prefix, "contains", 2},
    {BuiltinId::IpIsV4, TypeKind::IpAddr, "is_v4", 1},
    {BuiltinId::IpIsV6, TypeKind::IpAddr, "is_v6", 1},
    {BuiltinId::ListLen, TypeKind::List, "len", 1},
    {BuiltinId::ListIsEmpty, TypeKind::List, "is_empty", 1},
    {BuiltinId::ListContains, TypeKind::List, "contains", 2},
    {BuiltinId::StringLen, TypeKind::String, "len", 1},
    {BuiltinId::StringStartsWith, TypeKind::String, "starts_with", 2},
    {BuiltinId::StringContains, TypeKind::String, "contains", 2},
    {BuiltinId::BytesLen, TypeKind::Bytes, "len", 1},
    {BuiltinId::CommunityAsn, TypeKind::Community, "asn", 1},
    {BuiltinId::CommunityValue, TypeKind::Community, "value", 1},
    {BuiltinId::AsnToInt, TypeKind::Asn, "to_int", 1},
    {BuiltinId::AsPathLen, TypeKind::AsPath, "len", 1},
    {BuiltinId::AsPathContains, TypeKind::AsPath, "contains", 2},
    {BuiltinId::AsPathOrigin, TypeKind::AsPath, "origin", 1},
    {BuiltinId::AsPathIsEmpty, TypeKind::AsPath, "is_empty", 1},
}};

/// Parameter and result types once the receiver is known.
BuiltinSignature signatureFor(BuiltinId id, const TypeRef &receiver)
{
    namespace t = types::make;
    switch (id)
    {
        case BuiltinId::PrefixLen:
        case BuiltinId::ListLen:
        case BuiltinId::StringLen:
        case BuiltinId::BytesLen:
        case BuiltinId::CommunityAsn:
        case BuiltinId::CommunityValue:
        case BuiltinId::AsnToInt:
        case BuiltinId::AsPathLen:
            return {id, {}, t::integer()};
        case BuiltinId::PrefixAddr:
            return {id, {}, t::ipAddr()};
        case BuiltinId::PrefixIsV4:
        case BuiltinId::IpIsV4:
        case BuiltinId::IpIsV6:
        case BuiltinId::ListIsEmpty:
        case BuiltinId::AsPathIsEmpty:
            return {id, {}, t::boolean()};
        case BuiltinId::PrefixContains:
            return {id, {t::ipAddr()}, t::boolean()};
        case BuiltinId::ListContains:
            return {id, {receiver->element}, t::boolean()};
        case BuiltinId::StringStartsWith:
        case BuiltinId::StringContains:
            return {id, {t::string()}, t::boolean()};
        case BuiltinId::AsPathContains:
            return {id, {t::asn()}, t::boolean()};
        case BuiltinId::AsPathOrigin:
            return {id, {}, t::asn()};
    }
    return {id, {}, t::error()};
}

} // namespace

std::optional<BuiltinSignature> lookupBuiltin(const TypeRef &receiver, std::string_view name)
{
    if (!receiver)
        return std::nullopt;
    for (const auto &info : kBuiltins)
    {
        if (info.receiver == receiver->kind && name == info.name)
            return signatureFor(info.id, receiver);
    }
    return std::nullopt;
}

const char *builtinName(BuiltinId id)
{
    auto index = static_cast<size_t>(id);
    return index < kBuiltins.size() ? kBuiltins[index].name : "?";
}

unsigned builtinArity(BuiltinId id)
{
    auto index = static_cast<size_t>(id);
    return index < kBuiltins.size() ? kBuiltins[index].arity : 0;
}

bool invokeBuiltin(BuiltinId id, const Value *args, Value &out)
{
    const Value &self = args[0];
    auto requireKind = [&](const Value &v, ValueKind kind) { return v.kind() == kind; };

    switch (id)
    {
        case BuiltinId::PrefixLen:
            if (!requireKind(self, ValueKind::Prefix))
                return false;
            out = Value::integer(self.asPrefix().len);
            return true;
        case BuiltinId::PrefixAddr:
            if (!requireKind(self, ValueKind::Prefix))
                return false;
            out = Value::ipAddr(self.asPrefix().addr);
            return true;
        case BuiltinId::PrefixIsV4:
            if (!requireKind(self, ValueKind::Prefix))
                return false;
            out = Value::boolean(!self.asPrefix().addr.v6);
            return true;
        case BuiltinId::PrefixContains:
            if (!requireKind(self, ValueKind::Prefix) || !requireKind(args[1], ValueKind::IpAddr))
                return false;
            out = Value::boolean(self.asPrefix().contains(args[1].asIpAddr()));
            return true;
        case BuiltinId::IpIsV4:
        case BuiltinId::IpIsV6:
            if (!requireKind(self, ValueKind::IpAddr))
                return false;
            out = Value::boolean(self.asIpAddr().v6 == (id == BuiltinId::IpIsV6));
            return true;
        case BuiltinId::ListLen:
            if (!requireKind(self, ValueKind::List))
                return false;
            out = Value::integer(static_cast<int64_t>(self.asList().size()));
            return true;
        case BuiltinId::ListIsEmpty:
            if (!requireKind(self, ValueKind::List))
                return false;
            out = Value::boolean(self.asList().empty());
            return true;
        case BuiltinId::ListContains:
        {
            if (!requireKind(self, ValueKind::List))
                return false;
            const auto &items = self.asList();
            out = Value::boolean(std::find(items.begin(), items.end(), args[1]) != items.end());
            return true;
        }
        case BuiltinId::StringLen:
            if (!requireKind(self, ValueKind::String))
                return false;
            out = Value::integer(static_cast<int64_t>(self.asString().size()));
            return true;
        case BuiltinId::StringStartsWith:
        case BuiltinId::StringContains:
        {
            if (!requireKind(self, ValueKind::String) || !requireKind(args[1], ValueKind::String))
                return false;
            const std::string &s = self.asString();
            const std::string &needle = args[1].asString();
            bool hit = id == BuiltinId::StringStartsWith ? s.starts_with(needle)
                                                         : s.find(needle) != std::string::npos;
            out = Value::boolean(hit);
            return true;
        }
        case BuiltinId::BytesLen:
            if (!requireKind(self, ValueKind::Bytes))
                return false;
            out = Value::integer(static_cast<int64_t>(self.asBytes().size()));
            return true;
        case BuiltinId::CommunityAsn:
            if (!requireKind(self, ValueKind::Community))
                return false;
            out = Value::integer(self.asCommunity().asn());
            return true;
        case BuiltinId::CommunityValue:
            if (!requireKind(self, ValueKind::Community))
                return false;
            out = Value::integer(self.asCommunity().value());
            return true;
        case BuiltinId::AsnToInt:
            if (!requireKind(self, ValueKind::Asn))
                return false;
            out = Value::integer(self.asAsn().value);
            return true;
        case BuiltinId::AsPathLen:
            if (!requireKind(self, ValueKind::AsPath))
                return false;
            out = Value::integer(static_cast<int64_t>(self.asAsPath().size()));
            return true;
        case BuiltinId::AsPathContains:
        {
            if (!requireKind(self, ValueKind::AsPath) || !requireKind(args[1], ValueKind::Asn))
                return false;
            const auto &path = self.asAsPath();
            out = Value::boolean(std::find(path.begin(), path.end(), args[1].asAsn()) != path.end());
            return true;
        }
        case BuiltinId::AsPathOrigin:
        {
            if (!requireKind(self, ValueKind::AsPath))
                return false;
            // An empty path (locally originated route) reports AS0.
            const auto &path = self.asAsPath();
            out = Value::asn(path.empty() ? Asn{0} : path.back());
            return true;
        }
        case BuiltinId::AsPathIsEmpty:
            if (!requireKind(self, ValueKind::AsPath))
                return false;
            out = Value::boolean(self.asAsPath().empty());
            return true;
    }
    return false;
}

} // namespace sieve::runtime
