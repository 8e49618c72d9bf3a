//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_lowering.cpp
// Purpose: Block layout, hidden slots and terminators produced by lowering.
// Key invariants: Every lowered block ends in exactly one terminator.
// Ownership/Lifetime: Each test owns its AST and IR module.
// Links: frontends/sieve/Lowerer.hpp, ir/IR.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontends/sieve/Lexer.hpp"
#include "frontends/sieve/Lowerer.hpp"
#include "frontends/sieve/Parser.hpp"
#include "frontends/sieve/Sema.hpp"
#include "tests/TestSupport.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

using namespace sieve;
using ir::Opcode;
using ir::TermKind;

namespace
{

ir::Module lowerSource(const std::string &source)
{
    support::DiagnosticEngine diag;
    frontend::Lexer lexer(source, 1, diag);
    frontend::Parser parser(lexer, diag);
    frontend::Module module = parser.parseModule();
    frontend::Sema sema(diag, test::routeTable());
    sema.analyze(module);
    if (diag.hasErrors())
        throw std::runtime_error("source does not check");
    frontend::Lowerer lowerer;
    return lowerer.lower(module);
}

size_t countOps(const ir::Function &fn, Opcode op)
{
    size_t n = 0;
    for (const auto &bb : fn.blocks)
    {
        for (const auto &in : bb.instructions)
            n += in.op == op ? 1 : 0;
    }
    return n;
}

size_t countTerms(const ir::Function &fn, TermKind kind)
{
    size_t n = 0;
    for (const auto &bb : fn.blocks)
        n += bb.term.kind == kind ? 1 : 0;
    return n;
}

} // namespace

TEST(Lowering, StraightLineFunction)
{
    ir::Module m = lowerSource("function add(a: Int, b: Int) -> Int { a + b }");
    ASSERT_EQ(m.functions.size(), 1u);
    const ir::Function &fn = m.functions[0];
    EXPECT_EQ(fn.kind, ir::FunctionKind::Function);
    EXPECT_EQ(fn.namedSlots, 2u);
    ASSERT_EQ(fn.blocks.size(), 1u);

    const ir::BasicBlock &entry = fn.blocks[0];
    EXPECT_EQ(entry.label, "entry");
    ASSERT_EQ(entry.instructions.size(), 1u);
    EXPECT_EQ(entry.instructions[0].op, Opcode::Add);
    EXPECT_EQ(ir::toString(entry.instructions[0].operands[0]), "$0");
    EXPECT_EQ(ir::toString(entry.instructions[0].operands[1]), "$1");
    EXPECT_EQ(entry.term.kind, TermKind::Ret);
    EXPECT_EQ(entry.term.retKind, ir::RetKind::Return);
    EXPECT_EQ(ir::toString(entry.term.operands[0]), "%0");
}

TEST(Lowering, IfWithoutElseJoinsAtEnd)
{
    ir::Module m = lowerSource(R"(
filter f(route: Route) {
    if route.prefix.len() > 24 { reject; }
    accept;
}
)");
    const ir::Function &fn = m.functions[0];
    EXPECT_EQ(fn.kind, ir::FunctionKind::Filter);
    ASSERT_EQ(fn.blocks.size(), 3u);
    EXPECT_EQ(fn.blocks[0].term.kind, TermKind::CBr);
    EXPECT_EQ(fn.blocks[1].label, "if.then.0");
    EXPECT_EQ(fn.blocks[1].term.retKind, ir::RetKind::Reject);
    EXPECT_EQ(fn.blocks[2].label, "if.end.1");
    EXPECT_EQ(fn.blocks[2].term.retKind, ir::RetKind::Accept);
    EXPECT_EQ(countOps(fn, Opcode::CallExtern), 1u);
    EXPECT_EQ(countOps(fn, Opcode::CallBuiltin), 1u);
}

TEST(Lowering, ExitingBranchesLeaveNoJoinBlock)
{
    ir::Module m = lowerSource(R"(
filter f(route: Route) {
    if route.prefix.len() > 24 { reject; } else { accept; }
}
)");
    const ir::Function &fn = m.functions[0];
    ASSERT_EQ(fn.blocks.size(), 3u);
    for (const auto &bb : fn.blocks)
        EXPECT_NE(bb.label.rfind("if.end", 0), 0u) << bb.label;
    EXPECT_EQ(countTerms(fn, TermKind::Ret), 2u);
}

TEST(Lowering, ShortCircuitUsesHiddenJoinSlot)
{
    ir::Module m = lowerSource("function f(a: Bool, b: Bool) -> Bool { a && b }");
    const ir::Function &fn = m.functions[0];
    EXPECT_EQ(fn.namedSlots, 2u);
    EXPECT_EQ(fn.slotCount, 3u);
    ASSERT_EQ(fn.blocks.size(), 3u);
    EXPECT_EQ(fn.blocks[1].label, "and.rhs.0");
    EXPECT_EQ(fn.blocks[2].label, "and.end.1");

    const ir::Terminator &cbr = fn.blocks[0].term;
    ASSERT_EQ(cbr.kind, TermKind::CBr);
    EXPECT_EQ(cbr.labels[0], "and.rhs.0");
    EXPECT_EQ(cbr.labels[1], "and.end.1");
    EXPECT_EQ(ir::toString(fn.blocks[2].term.operands[0]), "$2");
}

TEST(Lowering, OrBranchesTheOtherWay)
{
    ir::Module m = lowerSource("function f(a: Bool, b: Bool) -> Bool { a || b }");
    const ir::Terminator &cbr = m.functions[0].blocks[0].term;
    ASSERT_EQ(cbr.kind, TermKind::CBr);
    EXPECT_EQ(cbr.labels[0], "or.end.1");
    EXPECT_EQ(cbr.labels[1], "or.rhs.0");
}

TEST(Lowering, StatementsAfterATerminatorAreDropped)
{
    ir::Module m = lowerSource("filter f(route: Route) { reject; accept; }");
    const ir::Function &fn = m.functions[0];
    ASSERT_EQ(fn.blocks.size(), 1u);
    EXPECT_EQ(fn.blocks[0].term.retKind, ir::RetKind::Reject);
}

TEST(Lowering, ExhaustiveMatchTestsAllButTheLastArm)
{
    ir::Module m = lowerSource(R"(
enum Shape { Dot, Line(Int), Box(Int) }
function f(s: Shape) -> Int {
    match s {
        Dot => return 0,
        Line(n) => return n,
        Box(w) => return w * w,
    }
}
)");
    const ir::Function &fn = m.functions[0];
    EXPECT_EQ(countOps(fn, Opcode::VariantTag), 1u);
    EXPECT_EQ(countOps(fn, Opcode::Eq), 2u);
    EXPECT_EQ(countOps(fn, Opcode::VariantPayload), 2u);
    EXPECT_EQ(countTerms(fn, TermKind::Abort), 0u);
    EXPECT_EQ(countTerms(fn, TermKind::Ret), 3u);
}

TEST(Lowering, GuardedMatchFallsThroughToWildcard)
{
    ir::Module m = lowerSource(R"(
enum Shape { Dot, Line(Int) }
function f(s: Shape) -> Int {
    match s {
        Line(n) if n > 0 => return n,
        _ => return 0,
    }
}
)");
    const ir::Function &fn = m.functions[0];
    EXPECT_EQ(countTerms(fn, TermKind::Abort), 0u);
    // Tag test and guard each branch to the wildcard arm.
    EXPECT_EQ(countTerms(fn, TermKind::CBr), 2u);
}

TEST(Lowering, NonExitingMatchJoins)
{
    ir::Module m = lowerSource(R"(
enum Shape { Dot, Line(Int) }
function f(s: Shape) -> Int {
    let r = 0;
    match s {
        Dot => r = 1,
        Line(n) => r = n,
    }
    r
}
)");
    const ir::Function &fn = m.functions[0];
    bool sawEnd = false;
    for (const auto &bb : fn.blocks)
        sawEnd = sawEnd || bb.label.rfind("match.end", 0) == 0;
    EXPECT_TRUE(sawEnd);
    EXPECT_EQ(countTerms(fn, TermKind::Ret), 1u);
}

TEST(Lowering, ForLoopUsesIterNextHeader)
{
    ir::Module m = lowerSource(R"(
function sum(xs: List[Int]) -> Int {
    let total = 0;
    for x in xs { total = total + x; }
    total
}
)");
    const ir::Function &fn = m.functions[0];
    EXPECT_EQ(fn.namedSlots, 3u);
    EXPECT_EQ(fn.slotCount, 5u);
    ASSERT_EQ(countTerms(fn, TermKind::IterNext), 1u);

    for (const auto &bb : fn.blocks)
    {
        if (bb.term.kind != TermKind::IterNext)
            continue;
        EXPECT_EQ(bb.label, "for.head.0");
        EXPECT_EQ(bb.term.iter.listSlot, 3u);
        EXPECT_EQ(bb.term.iter.elemSlot, 2u);
        EXPECT_EQ(bb.term.labels[0], "for.body.1");
        EXPECT_EQ(bb.term.labels[1], "for.exit.2");
    }
}

TEST(Lowering, UnitFunctionGetsImplicitReturn)
{
    ir::Module m = lowerSource("function noop(a: Int) { let b = a; }");
    const ir::Function &fn = m.functions[0];
    ASSERT_EQ(fn.blocks.size(), 1u);
    EXPECT_EQ(fn.blocks[0].term.kind, TermKind::Ret);
    EXPECT_EQ(ir::toString(fn.blocks[0].term.operands[0]), "()");
}

TEST(Lowering, TextListing)
{
    ir::Module m = lowerSource(R"(
filter-map tag(route: Route) -> String {
    for c in route.communities {
        if c.asn() == 65000 { accept lookup_peer(route.as_path.origin()); }
    }
    reject;
}
)");
    std::ostringstream os;
    ir::print(m, os);
    std::string text = os.str();
    EXPECT_NE(text.find("func @tag(route: Route) -> String [filter-map]"), std::string::npos)
        << text;
    EXPECT_NE(text.find("iter.next"), std::string::npos) << text;
    EXPECT_NE(text.find("call.extern lookup_peer"), std::string::npos) << text;
    EXPECT_NE(text.find("call.builtin origin"), std::string::npos) << text;
    EXPECT_NE(text.find("ret accept"), std::string::npos) << text;
    EXPECT_NE(text.find("ret reject"), std::string::npos) << text;
}
