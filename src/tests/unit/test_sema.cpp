//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_sema.cpp
// Purpose: Type checking, scoping, flow and declaration diagnostics.
// Key invariants: Checking continues after an error; one mistake reports once.
// Ownership/Lifetime: Each test owns its CompilerResult.
// Links: frontends/sieve/Sema.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tests/TestSupport.hpp"

#include <string>

using namespace sieve;
using support::DiagKind;
using test::compileSource;
using test::countKind;
using test::renderAll;

namespace
{

bool hasMessage(const frontend::CompilerResult &r, const std::string &text)
{
    for (const auto &d : r.diagnostics.diagnostics())
    {
        if (d.message.find(text) != std::string::npos)
            return true;
    }
    return false;
}

} // namespace

TEST(Sema, AcceptsWellTypedPolicy)
{
    auto r = compileSource(R"(
record Peer { asn: Asn, name: String }
enum Action { Keep, Tag(Community) }

function classify(route: Route) -> Action {
    if route.has_community(65000:1) { return Action::Keep; }
    Action::Tag(65000:2)
}

filter f(route: Route) {
    let p = Peer { asn: AS65000, name: "edge" };
    let nets: List[Prefix] = [10.0.0.0/8, 192.168.0.0/16];
    if route.prefix in nets && p.asn <= AS65535 && 10.1.2.3 in 10.0.0.0/8 {
        accept;
    }
    match classify(route) {
        Keep => accept,
        Tag(c) => { if c.asn() == 65000 { reject; } else { accept; } }
    }
}
)");
    EXPECT_TRUE(r.succeeded()) << renderAll(r);
    EXPECT_EQ(r.diagnostics.warningCount(), 0u) << renderAll(r);
}

TEST(Sema, ArithmeticNeedsInts)
{
    auto r = compileSource("function f(s: String) -> Int { s + 1 }");
    EXPECT_FALSE(r.succeeded());
    EXPECT_EQ(r.diagnostics.errorCount(), 1u) << renderAll(r);
    EXPECT_TRUE(hasMessage(r, "expected operand of '+' of type 'Int', found 'String'"));
}

TEST(Sema, EqualityNeedsMatchingTypes)
{
    auto r = compileSource("function f(a: Int, b: Asn) -> Bool { a == b }");
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::TypeMismatch), 1u) << renderAll(r);
    EXPECT_TRUE(hasMessage(r, "cannot compare 'Int' with 'Asn'"));
}

TEST(Sema, ExternalValuesAreNotEquatable)
{
    auto r = compileSource("function f(a: Route, b: Route) -> Bool { a == b }");
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::TypeMismatch), 1u) << renderAll(r);
}

TEST(Sema, MembershipForms)
{
    auto ok = compileSource(R"(
function f(ip: IpAddr, p: Prefix, xs: List[Int]) -> Bool {
    ip in p && p in 10.0.0.0/8 && 3 not in xs
}
)");
    EXPECT_TRUE(ok.succeeded()) << renderAll(ok);

    auto bad = compileSource("function f(a: Int, p: Prefix) -> Bool { a in p }");
    EXPECT_EQ(countKind(bad.diagnostics, DiagKind::TypeMismatch), 1u) << renderAll(bad);
}

TEST(Sema, EmptyListTakesContextType)
{
    auto ok = compileSource("function f() -> Int { let xs: List[Int] = []; xs.len() }");
    EXPECT_TRUE(ok.succeeded()) << renderAll(ok);

    auto bad = compileSource("function f() -> Int { let xs = []; 0 }");
    EXPECT_EQ(countKind(bad.diagnostics, DiagKind::TypeMismatch), 1u) << renderAll(bad);
}

TEST(Sema, ScopesAllowShadowingButNotRedeclaration)
{
    auto shadow = compileSource("function f() -> Int { let x = 1; { let x = 2; x; } x }");
    EXPECT_TRUE(shadow.succeeded()) << renderAll(shadow);
    EXPECT_EQ(shadow.diagnostics.warningCount(), 0u) << renderAll(shadow);

    auto dup = compileSource("function f() -> Int { let x = 1; let x = 2; x }");
    EXPECT_EQ(countKind(dup.diagnostics, DiagKind::DuplicateDeclaration), 1u) << renderAll(dup);
}

TEST(Sema, OnlyLetLocalsAreAssignable)
{
    auto ok = compileSource("function f() -> Int { let x = 1; x = x + 1; x }");
    EXPECT_TRUE(ok.succeeded()) << renderAll(ok);

    auto bad = compileSource("function f(a: Int) -> Int { a = 2; a }");
    EXPECT_EQ(countKind(bad.diagnostics, DiagKind::InvalidAssignment), 1u) << renderAll(bad);
    EXPECT_TRUE(hasMessage(bad, "cannot assign to parameter 'a'"));

    auto loop = compileSource("function f(xs: List[Int]) { for x in xs { x = 1; } }");
    EXPECT_EQ(countKind(loop.diagnostics, DiagKind::InvalidAssignment), 1u) << renderAll(loop);
}

TEST(Sema, RecordLiteralFields)
{
    auto r = compileSource(R"(
record Peer { asn: Asn, name: String }
function f() -> Peer { Peer { asn: AS1, nam: "x" } }
)");
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::UnknownField), 1u) << renderAll(r);
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::MissingField), 1u) << renderAll(r);
    EXPECT_TRUE(hasMessage(r, "missing field(s) 'name'"));
}

TEST(Sema, AnonymousRecordConvertsToNamedRecord)
{
    auto r = compileSource(R"(
record Pair { a: Int, b: Int }
function f() -> Int { let p: Pair = { b: 2, a: 1 }; p.a }
)");
    EXPECT_TRUE(r.succeeded()) << renderAll(r);
}

TEST(Sema, UnknownMembers)
{
    auto r = compileSource(R"(
function f(route: Route) -> Int {
    let a = route.nexthop;
    let b = route.prefix.size();
    0
}
)");
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::UnknownField), 1u) << renderAll(r);
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::UnknownMethod), 1u) << renderAll(r);
}

TEST(Sema, ArityOfCalls)
{
    auto r = compileSource(R"(
function add(a: Int, b: Int) -> Int { a + b }
function f() -> Int { add(1) }
)");
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::ArityMismatch), 1u) << renderAll(r);
    EXPECT_TRUE(hasMessage(r, "'add' expects 2 arguments, found 1"));
}

TEST(Sema, TerminalActionsDependOnDeclarationKind)
{
    auto acceptValue = compileSource("filter f(route: Route) { accept 1; }");
    EXPECT_EQ(countKind(acceptValue.diagnostics, DiagKind::InvalidAction), 1u)
        << renderAll(acceptValue);

    auto returnInFilter = compileSource("filter f(route: Route) { return; }");
    EXPECT_EQ(countKind(returnInFilter.diagnostics, DiagKind::InvalidAction), 1u)
        << renderAll(returnInFilter);

    auto acceptInFunction = compileSource("function f() { accept; }");
    EXPECT_EQ(countKind(acceptInFunction.diagnostics, DiagKind::InvalidAction), 1u)
        << renderAll(acceptInFunction);

    auto filterResult = compileSource("filter f(route: Route) -> Int { accept; }");
    EXPECT_EQ(countKind(filterResult.diagnostics, DiagKind::InvalidAction), 1u)
        << renderAll(filterResult);

    auto mapValue = compileSource("filter-map m(route: Route) -> Int { accept \"x\"; }");
    EXPECT_EQ(countKind(mapValue.diagnostics, DiagKind::TypeMismatch), 1u) << renderAll(mapValue);
    EXPECT_TRUE(hasMessage(mapValue, "expected accept value of type 'Int', found 'String'"));
}

TEST(Sema, FiltersAreNotCallable)
{
    auto r = compileSource(R"(
filter inner(route: Route) { accept; }
filter outer(route: Route) { inner(route); accept; }
)");
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::InvalidAction), 1u) << renderAll(r);
}

TEST(Sema, FallingOffTheEnd)
{
    auto fn = compileSource("function f(a: Bool) -> Int { if a { return 1; } }");
    EXPECT_EQ(countKind(fn.diagnostics, DiagKind::MissingReturn), 1u) << renderAll(fn);

    auto filter = compileSource(
        "filter f(route: Route) { if route.prefix.len() > 8 { reject; } }");
    EXPECT_EQ(countKind(filter.diagnostics, DiagKind::MissingTerminalAction), 1u)
        << renderAll(filter);

    auto both = compileSource(
        "filter f(route: Route) { if route.prefix.len() > 8 { reject; } else { accept; } }");
    EXPECT_TRUE(both.succeeded()) << renderAll(both);

    auto loop = compileSource("filter f(route: Route) { for c in route.communities { reject; } }");
    EXPECT_EQ(countKind(loop.diagnostics, DiagKind::MissingTerminalAction), 1u)
        << renderAll(loop);
}

TEST(Sema, AbortNeedsStringAndTerminates)
{
    auto ok = compileSource("function f() -> Int { abort \"unsupported\"; }");
    EXPECT_TRUE(ok.succeeded()) << renderAll(ok);

    auto bad = compileSource("filter f(route: Route) { abort 1; }");
    EXPECT_EQ(countKind(bad.diagnostics, DiagKind::TypeMismatch), 1u) << renderAll(bad);
}

TEST(Sema, UnreachableStatementWarning)
{
    auto r = compileSource("filter f(route: Route) { reject; accept; }");
    EXPECT_TRUE(r.succeeded()) << renderAll(r);
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::UnreachableCode), 1u) << renderAll(r);
}

TEST(Sema, RecursionIsRejected)
{
    auto direct = compileSource("function f(n: Int) -> Int { f(n - 1) }");
    EXPECT_EQ(countKind(direct.diagnostics, DiagKind::RecursiveCall), 1u) << renderAll(direct);
    EXPECT_TRUE(hasMessage(direct, "recursive call cycle: f -> f"));

    auto mutual = compileSource(R"(
function a() -> Int { b() }
function b() -> Int { a() }
)");
    EXPECT_EQ(countKind(mutual.diagnostics, DiagKind::RecursiveCall), 1u) << renderAll(mutual);
    EXPECT_TRUE(hasMessage(mutual, "recursive call cycle: a -> b -> a"));
}

TEST(Sema, UnusedDeclarationWarnings)
{
    auto r = compileSource(R"(
record Unused { a: Int }
enum Color { Red, Green(Int) }
filter f(route: Route) {
    let x = 1;
    let _quiet = 2;
    for c in route.communities { }
    let color = Color::Green(1);
    match color {
        Green(v) => accept,
        _ => accept,
    }
}
)");
    EXPECT_TRUE(r.succeeded()) << renderAll(r);
    // 'x', the loop variable 'c', the match binding 'v' and the record 'Unused'.
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::UnusedDeclaration), 4u) << renderAll(r);
    EXPECT_TRUE(hasMessage(r, "unused local 'x'"));
    EXPECT_TRUE(hasMessage(r, "unused loop variable 'c'"));
    EXPECT_TRUE(hasMessage(r, "unused match binding 'v'"));
    EXPECT_TRUE(hasMessage(r, "unused record 'Unused'"));
}

TEST(Sema, DuplicateTypeAndFunctionNames)
{
    auto r = compileSource(R"(
record Route { a: Int }
record R { a: Int }
enum R { X }
function lookup_peer() -> Int { 1 }
function g() -> Int { 1 }
function g() -> Int { 2 }
)");
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::DuplicateDeclaration), 4u) << renderAll(r);
}

TEST(Sema, SelfContainingRecordIsRejected)
{
    auto r = compileSource(R"(
record Node { next: Node }
function f(n: Node) -> Int { 0 }
)");
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::UndefinedType), 1u) << renderAll(r);
    EXPECT_TRUE(hasMessage(r, "contains itself"));
}

TEST(Sema, MatchPatterns)
{
    auto r = compileSource(R"(
enum Shape { Dot, Line(Int) }
function f(s: Shape) -> Int {
    match s {
        Dot(x) => return 0,
        Line(n) => return n,
        Line(m) => return m,
        Square => return 1,
    }
}
)");
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::ArityMismatch), 1u) << renderAll(r);
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::UnknownVariant), 1u) << renderAll(r);
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::UnreachableCode), 1u) << renderAll(r);
}

TEST(Sema, GuardedArmsDoNotCover)
{
    auto r = compileSource(R"(
enum Shape { Dot, Line(Int) }
function f(s: Shape) -> Int {
    match s {
        Dot => return 0,
        Line(n) if n > 0 => return n,
    }
    0
}
)");
    EXPECT_EQ(countKind(r.diagnostics, DiagKind::NonExhaustiveMatch), 1u) << renderAll(r);
    EXPECT_TRUE(hasMessage(r, "variant 'Line'"));
}

TEST(Sema, ExternalFunctionCall)
{
    auto r = compileSource(R"(
function peer(route: Route) -> String { lookup_peer(route.as_path.origin()) }
)");
    EXPECT_TRUE(r.succeeded()) << renderAll(r);

    auto bad = compileSource("function peer() -> String { lookup_peer(1) }");
    EXPECT_EQ(countKind(bad.diagnostics, DiagKind::TypeMismatch), 1u) << renderAll(bad);
}
