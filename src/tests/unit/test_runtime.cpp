//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_runtime.cpp
// Purpose: Network value types, runtime values and built-in methods.
// Key invariants: None.
// Ownership/Lifetime: Values are immutable and shared.
// Links: runtime/NetTypes.hpp, runtime/Value.hpp, runtime/Builtins.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "runtime/Builtins.hpp"
#include "runtime/NetTypes.hpp"
#include "runtime/Value.hpp"

using namespace sieve::runtime;
namespace ty = sieve::types::make;

namespace
{

Prefix pfx(const char *text)
{
    auto p = Prefix::parse(text);
    EXPECT_TRUE(p.has_value()) << text;
    return p.value_or(Prefix{});
}

Value call(BuiltinId id, std::vector<Value> args)
{
    Value out;
    EXPECT_TRUE(invokeBuiltin(id, args.data(), out)) << builtinName(id);
    return out;
}

} // namespace

TEST(NetTypes, ParsesIpv4)
{
    auto ip = IpAddr::parse("192.0.2.1");
    ASSERT_TRUE(ip.has_value());
    EXPECT_FALSE(ip->v6);
    EXPECT_EQ(ip->toString(), "192.0.2.1");
    EXPECT_TRUE(*ip == IpAddr::v4(0xC0000201u));

    EXPECT_FALSE(IpAddr::parse("192.0.2").has_value());
    EXPECT_FALSE(IpAddr::parse("192.0.2.256").has_value());
    EXPECT_FALSE(IpAddr::parse("192.0.2.1.").has_value());
    EXPECT_FALSE(IpAddr::parse("").has_value());
}

TEST(NetTypes, ParsesIpv6)
{
    auto ip = IpAddr::parse("2001:db8::1");
    ASSERT_TRUE(ip.has_value());
    EXPECT_TRUE(ip->v6);
    EXPECT_EQ(ip->toString(), "2001:db8:0:0:0:0:0:1");
    EXPECT_TRUE(IpAddr::parse("::").has_value());
    EXPECT_FALSE(IpAddr::parse("1:2:3:4:5:6:7").has_value());
    EXPECT_FALSE(IpAddr::parse("1::2::3").has_value());
    EXPECT_FALSE(IpAddr::parse("12345::").has_value());
}

TEST(NetTypes, PrefixLengthIsBoundedByFamily)
{
    EXPECT_TRUE(Prefix::parse("10.0.0.0/32").has_value());
    EXPECT_FALSE(Prefix::parse("10.0.0.0/33").has_value());
    EXPECT_TRUE(Prefix::parse("2001:db8::/128").has_value());
    EXPECT_FALSE(Prefix::parse("10.0.0.0").has_value());
    EXPECT_FALSE(Prefix::parse("10.0.0.0/").has_value());
    EXPECT_EQ(pfx("10.1.0.0/16").toString(), "10.1.0.0/16");
}

TEST(NetTypes, ContainmentAndCoverage)
{
    Prefix ten = pfx("10.0.0.0/8");
    EXPECT_TRUE(ten.contains(*IpAddr::parse("10.200.1.1")));
    EXPECT_FALSE(ten.contains(*IpAddr::parse("11.0.0.1")));
    EXPECT_FALSE(ten.contains(*IpAddr::parse("::a00:1")));

    EXPECT_TRUE(ten.covers(pfx("10.1.0.0/16")));
    EXPECT_TRUE(ten.covers(ten));
    EXPECT_FALSE(pfx("10.1.0.0/16").covers(ten));
    EXPECT_FALSE(ten.covers(pfx("11.0.0.0/16")));
    EXPECT_TRUE(pfx("0.0.0.0/0").covers(pfx("203.0.113.0/24")));
}

TEST(NetTypes, CommunitiesSplitIntoHalves)
{
    Community c = Community::make(65000, 666);
    EXPECT_EQ(c.asn(), 65000);
    EXPECT_EQ(c.value(), 666);
    EXPECT_EQ(c.toString(), "65000:666");
    EXPECT_EQ(Asn{64512}.toString(), "AS64512");
}

TEST(Value, DeepEquality)
{
    Value one = Value::integer(1);
    EXPECT_TRUE(Value::list({one, Value::string("x")}) == Value::list({one, Value::string("x")}));
    EXPECT_FALSE(Value::list({one}) == Value::list({one, one}));
    EXPECT_TRUE(Value::record({one, Value::boolean(true)}) ==
                Value::record({one, Value::boolean(true)}));
    EXPECT_TRUE(Value::variant(1, &one) == Value::variant(1, &one));
    EXPECT_FALSE(Value::variant(1, &one) == Value::variant(1));
    EXPECT_FALSE(Value::variant(0) == Value::variant(1));
    EXPECT_FALSE(Value::integer(1) == Value::asn(Asn{1}));
    EXPECT_TRUE(Value::unit() == Value());
}

TEST(Value, DebugSpelling)
{
    Value one = Value::integer(1);
    EXPECT_EQ(Value::unit().toString(), "()");
    EXPECT_EQ(Value::string("a").toString(), "\"a\"");
    EXPECT_EQ(Value::prefix(pfx("10.0.0.0/8")).toString(), "10.0.0.0/8");
    EXPECT_EQ(Value::asPath({Asn{1}, Asn{2}}).toString(), "aspath(1 2)");
    EXPECT_EQ(Value::list({one, Value::boolean(false)}).toString(), "[1, false]");
    EXPECT_EQ(Value::record({one}).toString(), "{1}");
    EXPECT_EQ(Value::variant(2, &one).toString(), "#2(1)");
    EXPECT_EQ(Value::bytes({1, 2, 3}).toString(), "bytes[3]");
}

TEST(Builtins, LookupIsByReceiverKind)
{
    auto len = lookupBuiltin(ty::prefix(), "len");
    ASSERT_TRUE(len.has_value());
    EXPECT_EQ(len->id, BuiltinId::PrefixLen);
    EXPECT_EQ(static_cast<int>(BuiltinId::PrefixLen), 0);

    auto contains = lookupBuiltin(ty::list(ty::community()), "contains");
    ASSERT_TRUE(contains.has_value());
    ASSERT_EQ(contains->params.size(), 1u);
    EXPECT_TRUE(sieve::types::sameType(contains->params[0], ty::community()));

    EXPECT_FALSE(lookupBuiltin(ty::integer(), "len").has_value());
    EXPECT_FALSE(lookupBuiltin(ty::prefix(), "length").has_value());
    EXPECT_EQ(builtinArity(BuiltinId::AsPathContains), 2u);
    EXPECT_STREQ(builtinName(BuiltinId::AsPathOrigin), "origin");
}

TEST(Builtins, NetworkMethods)
{
    Value p = Value::prefix(pfx("192.0.2.0/24"));
    EXPECT_EQ(call(BuiltinId::PrefixLen, {p}).asInt(), 24);
    EXPECT_EQ(call(BuiltinId::PrefixAddr, {p}).toString(), "192.0.2.0");
    EXPECT_TRUE(call(BuiltinId::PrefixIsV4, {p}).asBool());
    EXPECT_TRUE(
        call(BuiltinId::PrefixContains, {p, Value::ipAddr(*IpAddr::parse("192.0.2.9"))}).asBool());

    Value c = Value::community(Community::make(65000, 1));
    EXPECT_EQ(call(BuiltinId::CommunityAsn, {c}).asInt(), 65000);
    EXPECT_EQ(call(BuiltinId::CommunityValue, {c}).asInt(), 1);
    EXPECT_EQ(call(BuiltinId::AsnToInt, {Value::asn(Asn{4200000000u})}).asInt(), 4200000000);
}

TEST(Builtins, PathMethods)
{
    Value path = Value::asPath({Asn{64500}, Asn{64501}, Asn{64502}});
    EXPECT_EQ(call(BuiltinId::AsPathLen, {path}).asInt(), 3);
    EXPECT_EQ(call(BuiltinId::AsPathOrigin, {path}).asAsn().value, 64502u);
    EXPECT_TRUE(call(BuiltinId::AsPathContains, {path, Value::asn(Asn{64501})}).asBool());
    EXPECT_FALSE(call(BuiltinId::AsPathContains, {path, Value::asn(Asn{1})}).asBool());

    EXPECT_FALSE(call(BuiltinId::AsPathIsEmpty, {path}).asBool());

    // A locally originated route has an empty path.
    EXPECT_EQ(call(BuiltinId::AsPathOrigin, {Value::asPath({})}).asAsn().value, 0u);
    EXPECT_TRUE(call(BuiltinId::AsPathIsEmpty, {Value::asPath({})}).asBool());

    auto isEmpty = lookupBuiltin(ty::asPath(), "is_empty");
    ASSERT_TRUE(isEmpty.has_value());
    EXPECT_EQ(isEmpty->id, BuiltinId::AsPathIsEmpty);
    EXPECT_TRUE(sieve::types::sameType(isEmpty->result, ty::boolean()));
}

TEST(Builtins, CollectionAndStringMethods)
{
    Value items = Value::list({Value::integer(3), Value::integer(5)});
    EXPECT_EQ(call(BuiltinId::ListLen, {items}).asInt(), 2);
    EXPECT_FALSE(call(BuiltinId::ListIsEmpty, {items}).asBool());
    EXPECT_TRUE(call(BuiltinId::ListIsEmpty, {Value::list({})}).asBool());
    EXPECT_TRUE(call(BuiltinId::ListContains, {items, Value::integer(5)}).asBool());

    Value s = Value::string("peer-AS65003");
    EXPECT_EQ(call(BuiltinId::StringLen, {s}).asInt(), 12);
    EXPECT_TRUE(call(BuiltinId::StringStartsWith, {s, Value::string("peer-")}).asBool());
    EXPECT_FALSE(call(BuiltinId::StringContains, {s, Value::string("AS1")}).asBool());
}

TEST(Builtins, RejectsMismatchedOperands)
{
    Value out;
    Value wrong = Value::integer(1);
    EXPECT_FALSE(invokeBuiltin(BuiltinId::PrefixLen, &wrong, out));
    Value args[2] = {Value::string("a"), Value::integer(1)};
    EXPECT_FALSE(invokeBuiltin(BuiltinId::StringContains, args, out));
}
