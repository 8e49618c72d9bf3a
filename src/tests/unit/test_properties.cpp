//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_properties.cpp
// Purpose: Whole-pipeline properties checked over a small corpus of policies
//          and representative inputs.
// Key invariants: Accepted programs compile deterministically, never reach an
//                 InvalidState fault and halt within the default budget.
// Ownership/Lifetime: Corpus entries are static strings.
// Links: frontends/sieve/Compiler.hpp, bytecode/ProgramWriter.hpp,
//        vm/BytecodeVM.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "bytecode/ProgramWriter.hpp"
#include "bytecode/StackVerifier.hpp"
#include "frontends/sieve/Lexer.hpp"
#include "tests/TestSupport.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

using namespace sieve;
using runtime::Community;

namespace
{

const char *const kCorpus[] = {
    R"(
filter bogons(route: Route) {
    let martians: List[Prefix] = [10.0.0.0/8, 172.16.0.0/12, 192.168.0.0/16];
    for m in martians {
        if route.prefix in m { reject; }
    }
    if route.as_path.contains(AS0) || route.as_path.len() > 50 { reject; }
    accept;
}
)",
    R"(
enum Class { Customer(Int), Peer, Transit }

function classify(route: Route) -> Class {
    for c in route.communities {
        if c.asn() == 65000 && c.value() < 100 { return Class::Customer(c.value()); }
        if c == 65000:200 { return Class::Peer; }
    }
    Class::Transit
}

filter-map local_pref(route: Route) -> Int {
    match classify(route) {
        Customer(n) if n > 50 => accept 250,
        Customer(n) => accept 200 + n,
        Peer => accept 100,
        Transit => {
            if route.as_path.is_empty() { reject; }
            accept 50;
        }
    }
}
)",
    R"(
record Summary { origin: Asn, hops: Int, tagged: Bool }

function summarize(route: Route) -> Summary {
    Summary {
        tagged: !route.communities.is_empty(),
        hops: route.as_path.len(),
        origin: route.as_path.origin(),
    }
}

filter-map describe(route: Route) -> String {
    let s = summarize(route);
    if s.origin == AS0 { abort "locally originated"; }
    if s.tagged { accept lookup_peer(s.origin); }
    reject;
}
)",
};

std::vector<runtime::Value> representativeRoutes()
{
    return {
        test::makeRoute("10.1.0.0/16", {65001}),
        test::makeRoute("203.0.113.0/24", {65001, 65002, 65003}, {Community::make(65000, 20)}),
        test::makeRoute("198.51.100.0/24", {64512}, {Community::make(65000, 80)}),
        test::makeRoute("198.51.100.0/25", {64512, 0}, {Community::make(65000, 200)}),
        test::makeRoute("192.0.2.0/24", {}, {Community::make(65001, 1)}),
        test::makeRoute("0.0.0.0/0"),
    };
}

std::vector<std::string> entryPoints(const bytecode::Program &program)
{
    std::vector<std::string> names;
    for (const auto &fn : program.functions)
    {
        if (fn.kind != ir::FunctionKind::Function)
            names.push_back(fn.name);
    }
    return names;
}

} // namespace

TEST(Properties, LexerSpansCoverTheSource)
{
    for (const char *source : kCorpus)
    {
        std::string text(source);
        support::DiagnosticEngine diag;
        frontend::Lexer lexer(text, 1, diag);
        std::vector<frontend::Token> tokens = lexer.tokenizeAll();
        EXPECT_FALSE(diag.hasErrors());

        // Concatenated token spellings equal the source with trivia removed.
        std::string rebuilt;
        uint32_t last = 0;
        for (const auto &tok : tokens)
        {
            ASSERT_GE(tok.span.begin, last);
            rebuilt.append(text, tok.span.begin, tok.span.length());
            last = tok.span.end;
        }
        std::string expected;
        for (char ch : text)
        {
            if (!std::isspace(static_cast<unsigned char>(ch)))
                expected.push_back(ch);
        }
        std::string squeezed;
        for (char ch : rebuilt)
        {
            if (!std::isspace(static_cast<unsigned char>(ch)))
                squeezed.push_back(ch);
        }
        EXPECT_EQ(squeezed, expected);
    }
}

TEST(Properties, CompilationIsDeterministic)
{
    for (const char *source : kCorpus)
    {
        auto first = test::compileSource(source);
        auto second = test::compileSource(source, test::routeTable());
        ASSERT_TRUE(first.succeeded()) << test::renderAll(first);
        ASSERT_TRUE(second.succeeded()) << test::renderAll(second);
        EXPECT_EQ(bytecode::writeProgram(*first.program), bytecode::writeProgram(*second.program));
    }
}

TEST(Properties, AcceptedProgramsNeverReachInvalidState)
{
    for (const char *source : kCorpus)
    {
        test::Harness h(source);
        for (const auto &entry : entryPoints(*h.attachment->program()))
        {
            for (const auto &route : representativeRoutes())
            {
                auto out = h.runRoute(entry, route);
                if (out.ok())
                    continue;
                EXPECT_NE(out.fault->kind, vm::FaultKind::InvalidState) << out.fault->toString();
                EXPECT_NE(out.fault->kind, vm::FaultKind::ResourceExhausted)
                    << out.fault->toString();
            }
        }
    }
}

TEST(Properties, ExpectedOutcomesOverCorpus)
{
    test::Harness bogons(kCorpus[0]);
    auto routes = representativeRoutes();
    EXPECT_EQ(bogons.runRoute("bogons", routes[0]).result->termination, vm::Termination::Reject);
    EXPECT_EQ(bogons.runRoute("bogons", routes[1]).result->termination, vm::Termination::Accept);
    EXPECT_EQ(bogons.runRoute("bogons", routes[3]).result->termination, vm::Termination::Reject);

    test::Harness pref(kCorpus[1]);
    EXPECT_EQ(pref.runRoute("local_pref", routes[1]).result->value.asInt(), 220);
    EXPECT_EQ(pref.runRoute("local_pref", routes[2]).result->value.asInt(), 250);
    EXPECT_EQ(pref.runRoute("local_pref", routes[3]).result->value.asInt(), 100);
    EXPECT_EQ(pref.runRoute("local_pref", routes[0]).result->value.asInt(), 50);
    EXPECT_EQ(pref.runRoute("local_pref", routes[5]).result->termination, vm::Termination::Reject);

    test::Harness describe(kCorpus[2]);
    auto aborted = describe.runRoute("describe", routes[4]);
    ASSERT_FALSE(aborted.ok());
    EXPECT_EQ(aborted.fault->kind, vm::FaultKind::UserTermination);
    auto named = describe.runRoute("describe", routes[1]);
    ASSERT_TRUE(named.ok());
    EXPECT_EQ(named.result->value.asString(), "peer-AS65003");
}

TEST(Properties, VerifiedMaximumIsReachedOnSomePath)
{
    test::Harness h(R"(
record Triple { x: Int, y: Int, z: Int }
function pick(a: Int, b: Int) -> Int {
    if a > 0 {
        let t = Triple { x: a, y: b, z: a + b };
        return t.z;
    }
    b
}
)");
    const bytecode::BytecodeFunction *fn = h.attachment->program()->findFunction("pick");
    ASSERT_NE(fn, nullptr);
    auto verified = bytecode::verifyFunction(*fn, *h.attachment->program());
    ASSERT_TRUE(verified.isOk()) << verified.error();
    EXPECT_EQ(verified.value(), 3u);

    uint32_t observed = 0;
    for (int64_t a : {-1, 1})
    {
        vm::RuntimeContext ctx;
        ctx.set("a", runtime::Value::integer(a));
        ctx.set("b", runtime::Value::integer(2));
        vm::BytecodeVM machine;
        auto out = machine.run(*h.attachment, "pick", ctx);
        ASSERT_TRUE(out.ok());
        EXPECT_LE(machine.peakStackDepth(), verified.value());
        if (a < 0)
        {
            EXPECT_LT(machine.peakStackDepth(), verified.value());
        }
        observed = std::max(observed, machine.peakStackDepth());
    }
    EXPECT_EQ(observed, verified.value());
}
