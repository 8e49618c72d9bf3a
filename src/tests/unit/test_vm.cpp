//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_vm.cpp
// Purpose: Execution semantics, faults, limits and tracing of the VM.
// Key invariants: Every run ends in exactly one of a result or a fault.
// Ownership/Lifetime: Each test owns its harness and VM.
// Links: vm/BytecodeVM.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tests/TestSupport.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace sieve;
using runtime::Value;
using test::Harness;
using vm::FaultKind;
using vm::RunOutcome;
using vm::Termination;

namespace
{

RunOutcome runInts(const Harness &h, std::string_view entry, int64_t a, int64_t b)
{
    vm::RuntimeContext ctx;
    ctx.set("a", Value::integer(a));
    ctx.set("b", Value::integer(b));
    return h.run(entry, ctx);
}

int64_t intResult(const RunOutcome &out)
{
    EXPECT_TRUE(out.ok()) << (out.fault ? out.fault->toString() : std::string());
    return out.ok() ? out.result->value.asInt() : 0;
}

Value intList(int64_t count)
{
    std::vector<Value> items;
    for (int64_t i = 0; i < count; ++i)
        items.push_back(Value::integer(i));
    return Value::list(std::move(items));
}

} // namespace

TEST(VM, IntegerArithmeticWraps)
{
    Harness h(R"(
function add(a: Int, b: Int) -> Int { a + b }
function sub(a: Int, b: Int) -> Int { a - b }
function mul(a: Int, b: Int) -> Int { a * b }
function neg(a: Int, b: Int) -> Int { -a + b }
)");
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();

    EXPECT_EQ(intResult(runInts(h, "add", 40, 2)), 42);
    EXPECT_EQ(intResult(runInts(h, "add", kMax, 1)), kMin);
    EXPECT_EQ(intResult(runInts(h, "sub", kMin, 1)), kMax);
    EXPECT_EQ(intResult(runInts(h, "mul", kMax, 2)), -2);
    EXPECT_EQ(intResult(runInts(h, "neg", kMin, 0)), kMin);
}

TEST(VM, DivisionAndRemainderNeverFault)
{
    Harness h(R"(
function div(a: Int, b: Int) -> Int { a / b }
function rem(a: Int, b: Int) -> Int { a % b }
)");
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();

    EXPECT_EQ(intResult(runInts(h, "div", 7, 2)), 3);
    EXPECT_EQ(intResult(runInts(h, "div", -7, 2)), -3);
    EXPECT_EQ(intResult(runInts(h, "div", 7, 0)), 0);
    EXPECT_EQ(intResult(runInts(h, "div", kMin, -1)), kMin);
    EXPECT_EQ(intResult(runInts(h, "rem", -7, 3)), -1);
    EXPECT_EQ(intResult(runInts(h, "rem", 7, 0)), 0);
    EXPECT_EQ(intResult(runInts(h, "rem", kMin, -1)), 0);
}

TEST(VM, FilterTerminations)
{
    Harness h(R"(
filter f(route: Route) {
    if route.prefix.len() > 24 { reject; }
    accept;
}
)");
    auto rejected = h.runRoute("f", test::makeRoute("10.1.2.0/26"));
    ASSERT_TRUE(rejected.ok());
    EXPECT_EQ(rejected.result->termination, Termination::Reject);
    EXPECT_EQ(rejected.result->value.kind(), runtime::ValueKind::Unit);

    auto accepted = h.runRoute("f", test::makeRoute("10.0.0.0/8"));
    ASSERT_TRUE(accepted.ok());
    EXPECT_EQ(accepted.result->termination, Termination::Accept);
    EXPECT_STREQ(vm::terminationName(accepted.result->termination), "accept");
}

TEST(VM, FilterMapAcceptsWithValue)
{
    Harness h(R"(
filter-map peer(route: Route) -> String {
    accept lookup_peer(route.as_path.origin());
}
)");
    auto out = h.runRoute("peer", test::makeRoute("192.0.2.0/24", {65001, 65002}));
    ASSERT_TRUE(out.ok()) << out.fault->toString();
    EXPECT_EQ(out.result->termination, Termination::Accept);
    EXPECT_EQ(out.result->value.asString(), "peer-AS65002");

    auto fault = h.runRoute("peer", test::makeRoute("192.0.2.0/24"));
    ASSERT_FALSE(fault.ok());
    EXPECT_EQ(fault.fault->kind, FaultKind::ExternalCallError);
    EXPECT_EQ(fault.fault->message, "external 'lookup_peer' failed: no peer for AS0");
    EXPECT_EQ(fault.fault->function, "peer");
}

TEST(VM, ShortCircuitSkipsHostCalls)
{
    Harness h(R"(
filter f(route: Route) {
    if route.prefix.len() > 24 && route.has_community(65000:666) { reject; }
    accept;
}
)");
    auto shortRoute = h.runRoute("f", test::makeRoute("10.0.0.0/16"));
    ASSERT_TRUE(shortRoute.ok());
    EXPECT_EQ(h.log->count("Route.has_community"), 0);

    auto longRoute =
        h.runRoute("f", test::makeRoute("10.0.0.0/28", {}, {runtime::Community::make(65000, 666)}));
    ASSERT_TRUE(longRoute.ok());
    EXPECT_EQ(longRoute.result->termination, Termination::Reject);
    EXPECT_EQ(h.log->count("Route.has_community"), 1);
}

TEST(VM, OrShortCircuits)
{
    Harness h(R"(
function either(a: Int, b: Int) -> Bool { a == 0 || 10 / a > b }
)");
    auto out = runInts(h, "either", 0, 5);
    ASSERT_TRUE(out.ok());
    EXPECT_TRUE(out.result->value.asBool());

    auto other = runInts(h, "either", 2, 5);
    ASSERT_TRUE(other.ok());
    EXPECT_FALSE(other.result->value.asBool());
}

TEST(VM, RecordsEnumsAndMatch)
{
    Harness h(R"(
record Score { base: Int, bonus: Int }
enum Grade { Low, High(Score) }

function grade(a: Int, b: Int) -> Grade {
    if a < 10 { return Grade::Low; }
    Grade::High(Score { bonus: b, base: a })
}

function total(a: Int, b: Int) -> Int {
    match grade(a, b) {
        Low => return 0,
        High(s) if s.bonus == 0 => return s.base,
        High(s) => return s.base + s.bonus,
    }
}
)");
    EXPECT_EQ(intResult(runInts(h, "total", 3, 4)), 0);
    EXPECT_EQ(intResult(runInts(h, "total", 20, 0)), 20);
    EXPECT_EQ(intResult(runInts(h, "total", 20, 5)), 25);

    auto variant = runInts(h, "grade", 20, 5);
    ASSERT_TRUE(variant.ok());
    EXPECT_EQ(variant.result->value.variantTag(), 1u);
    ASSERT_NE(variant.result->value.variantPayload(), nullptr);
    // Record fields are stored in sorted name order.
    const auto &fields = variant.result->value.variantPayload()->recordFields();
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[0].asInt(), 20);
    EXPECT_EQ(fields[1].asInt(), 5);
}

TEST(VM, MembershipFlavours)
{
    Harness h(R"(
function covers(p: Prefix) -> Bool { 10.1.2.3 in p }
function within(p: Prefix) -> Bool { p in 10.0.0.0/8 }
function tagged(route: Route) -> Bool { 65000:1 in route.communities }
function clean(route: Route) -> Bool { 65000:1 not in route.communities }
)");
    auto runPrefix = [&](std::string_view entry, std::string_view text) {
        vm::RuntimeContext ctx;
        ctx.set("p", Value::prefix(test::prefix(text)));
        auto out = h.run(entry, ctx);
        EXPECT_TRUE(out.ok());
        return out.ok() && out.result->value.asBool();
    };
    EXPECT_TRUE(runPrefix("covers", "10.0.0.0/8"));
    EXPECT_FALSE(runPrefix("covers", "10.2.0.0/16"));
    EXPECT_TRUE(runPrefix("within", "10.20.0.0/16"));
    EXPECT_TRUE(runPrefix("within", "10.0.0.0/8"));
    EXPECT_FALSE(runPrefix("within", "0.0.0.0/0"));

    auto route = test::makeRoute("10.0.0.0/8", {}, {runtime::Community::make(65000, 1)});
    auto tagged = h.runRoute("tagged", route);
    ASSERT_TRUE(tagged.ok());
    EXPECT_TRUE(tagged.result->value.asBool());
    auto clean = h.runRoute("clean", route);
    ASSERT_TRUE(clean.ok());
    EXPECT_FALSE(clean.result->value.asBool());
}

TEST(VM, LoopsAccumulate)
{
    Harness h(R"(
function sum(xs: List[Int]) -> Int {
    let total = 0;
    for x in xs { total = total + x; }
    total
}
filter f(route: Route) {
    for c in route.communities {
        if c.value() == 666 { reject; }
    }
    accept;
}
)");
    vm::RuntimeContext ctx;
    ctx.set("xs", intList(101));
    EXPECT_EQ(intResult(h.run("sum", ctx)), 5050);

    vm::RuntimeContext empty;
    empty.set("xs", intList(0));
    EXPECT_EQ(intResult(h.run("sum", empty)), 0);

    auto blackholed = h.runRoute(
        "f", test::makeRoute("10.0.0.0/8", {},
                             {runtime::Community::make(65000, 1), runtime::Community::make(65000, 666)}));
    ASSERT_TRUE(blackholed.ok());
    EXPECT_EQ(blackholed.result->termination, Termination::Reject);
}

TEST(VM, AbortIsUserTermination)
{
    Harness h(R"(
filter f(route: Route) {
    if route.prefix.len() == 0 { abort "default route"; }
    accept;
}
)");
    auto out = h.runRoute("f", test::makeRoute("0.0.0.0/0"));
    ASSERT_FALSE(out.ok());
    EXPECT_EQ(out.fault->kind, FaultKind::UserTermination);
    EXPECT_EQ(out.fault->message, "default route");
    EXPECT_EQ(out.fault->function, "f");
    EXPECT_EQ(out.fault->toString().rfind("UserTermination in 'f' at ", 0), 0u)
        << out.fault->toString();
}

TEST(VM, InstructionBudget)
{
    Harness h(R"(
function square(xs: List[Int]) -> Int {
    let n = 0;
    for x in xs { for y in xs { n = n + x * y; } }
    n
}
)");
    vm::RuntimeContext ctx;
    ctx.set("xs", intList(100));

    vm::RunConfig tight;
    tight.maxSteps = 1000;
    auto limited = h.run("square", ctx, tight);
    ASSERT_FALSE(limited.ok());
    EXPECT_EQ(limited.fault->kind, FaultKind::ResourceExhausted);
    EXPECT_EQ(limited.fault->message, "instruction budget of 1000 steps exhausted");

    EXPECT_EQ(intResult(h.run("square", ctx)), 4950 * 4950);
}

TEST(VM, CallDepthLimit)
{
    Harness h(R"(
function c(a: Int, b: Int) -> Int { a + b }
function b2(a: Int, b: Int) -> Int { c(a, b) + 1 }
function a1(a: Int, b: Int) -> Int { b2(a, b) + 1 }
)");
    vm::RuntimeContext ctx;
    ctx.set("a", Value::integer(1));
    ctx.set("b", Value::integer(2));

    EXPECT_EQ(intResult(h.run("a1", ctx)), 5);

    vm::RunConfig shallow;
    shallow.maxCallDepth = 2;
    auto out = h.run("a1", ctx, shallow);
    ASSERT_FALSE(out.ok());
    EXPECT_EQ(out.fault->kind, FaultKind::ResourceExhausted);
    EXPECT_EQ(out.fault->message, "call depth limit of 2 exceeded");
    EXPECT_EQ(out.fault->function, "b2");
}

TEST(VM, InvalidInvocations)
{
    Harness h("filter f(route: Route) { accept; }");

    auto unknown = h.runRoute("nope", test::makeRoute("10.0.0.0/8"));
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.fault->kind, FaultKind::InvalidState);
    EXPECT_EQ(unknown.fault->message, "unknown entry point 'nope'");

    auto missing = h.run("f", vm::RuntimeContext{});
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.fault->message, "missing input 'route'");
    EXPECT_EQ(missing.fault->function, "f");

    auto wrongType = h.runRoute("f", Value::integer(1));
    ASSERT_FALSE(wrongType.ok());
    EXPECT_EQ(wrongType.fault->kind, FaultKind::InvalidState);
    EXPECT_EQ(wrongType.fault->message, "input 'route' is not a value of type 'Route'");
}

TEST(VM, HostFailuresBecomeFaults)
{
    const char *source = "filter f(route: Route) { if route.prefix.len() > 8 { reject; } accept; }";
    auto table = test::routeTable();
    auto compiled = test::compileSource(source, table);
    ASSERT_TRUE(compiled.succeeded()) << test::renderAll(compiled);
    auto route = test::makeRoute("10.0.0.0/16");

    auto runWith = [&](vm::ExternalFn prefixFn) {
        auto bindings = test::routeBindings(table, std::make_shared<test::CallLog>());
        EXPECT_TRUE(bindings.bind("Route.prefix", std::move(prefixFn)));
        auto attached = vm::attach(compiled.program, bindings);
        EXPECT_TRUE(attached.isOk());
        vm::RuntimeContext ctx;
        ctx.set("route", route);
        vm::BytecodeVM machine;
        return machine.run(*attached.value(), "f", ctx);
    };

    auto threw = runWith([](const std::vector<Value> &) -> support::Result<Value> {
        throw std::runtime_error("table unavailable");
    });
    ASSERT_FALSE(threw.ok());
    EXPECT_EQ(threw.fault->kind, FaultKind::ExternalCallError);
    EXPECT_EQ(threw.fault->message, "external 'Route.prefix' threw: table unavailable");

    auto wrong = runWith(
        [](const std::vector<Value> &) -> support::Result<Value> { return Value::integer(8); });
    ASSERT_FALSE(wrong.ok());
    EXPECT_EQ(wrong.fault->message, "external 'Route.prefix' returned a value that is not 'Prefix'");
}

TEST(VM, PeakStackStaysWithinRecordedMaximum)
{
    Harness h(R"(
record Pair { left: Int, right: Int }
function build(a: Int, b: Int) -> List[Pair] {
    [Pair { left: a, right: b }, Pair { left: b, right: a * b + (a - b) * 3 }]
}
)");
    vm::RuntimeContext ctx;
    ctx.set("a", Value::integer(3));
    ctx.set("b", Value::integer(4));
    vm::BytecodeVM machine;
    auto out = machine.run(*h.attachment, "build", ctx);
    ASSERT_TRUE(out.ok());
    EXPECT_EQ(out.result->value.asList().size(), 2u);

    uint32_t recorded = 0;
    for (const auto &fn : h.attachment->program()->functions)
        recorded = std::max(recorded, fn.maxStack);
    EXPECT_GT(machine.peakStackDepth(), 0u);
    EXPECT_LE(machine.peakStackDepth(), recorded);
    EXPECT_GT(machine.instrCount(), 0u);
}

TEST(VM, MachineIsReusableAcrossRuns)
{
    Harness h("function add(a: Int, b: Int) -> Int { a + b }");
    vm::BytecodeVM machine;
    for (int64_t i = 0; i < 3; ++i)
    {
        vm::RuntimeContext ctx;
        ctx.set("a", Value::integer(i));
        ctx.set("b", Value::integer(10));
        auto out = machine.run(*h.attachment, "add", ctx);
        ASSERT_TRUE(out.ok());
        EXPECT_EQ(out.result->value.asInt(), i + 10);
    }
}

TEST(VM, TraceWritesCallsAndSteps)
{
    Harness h(R"(
function inner(a: Int, b: Int) -> Int { a * b }
function outer(a: Int, b: Int) -> Int { inner(a, b) + 1 }
)");
    vm::RuntimeContext ctx;
    ctx.set("a", Value::integer(6));
    ctx.set("b", Value::integer(7));

    std::ostringstream calls;
    vm::RunConfig callConfig;
    callConfig.trace.mode = vm::TraceConfig::Calls;
    callConfig.trace.out = &calls;
    EXPECT_EQ(intResult(h.run("outer", ctx, callConfig)), 43);
    EXPECT_NE(calls.str().find("[trace] enter outer depth=1"), std::string::npos) << calls.str();
    EXPECT_NE(calls.str().find("[trace] enter inner depth=2"), std::string::npos) << calls.str();
    EXPECT_EQ(calls.str().find("MUL"), std::string::npos);

    std::ostringstream steps;
    vm::RunConfig stepConfig;
    stepConfig.trace.mode = vm::TraceConfig::Bytecode;
    stepConfig.trace.out = &steps;
    EXPECT_EQ(intResult(h.run("outer", ctx, stepConfig)), 43);
    EXPECT_NE(steps.str().find("[trace] inner@0002 MUL sp=2"), std::string::npos) << steps.str();
    EXPECT_NE(steps.str().find("RETURN return"), std::string::npos) << steps.str();
}
