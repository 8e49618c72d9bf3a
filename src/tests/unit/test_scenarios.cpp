//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_scenarios.cpp
// Purpose: End-to-end acceptance scenarios through compile, attach and run.
// Key invariants: A compilation with errors never yields a program.
// Ownership/Lifetime: Each scenario owns its compile result.
// Links: frontends/sieve/Compiler.hpp, vm/BytecodeVM.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tests/TestSupport.hpp"

#include <string>

using namespace sieve;
using support::DiagKind;

TEST(Scenario, LongPrefixesAreRejected)
{
    test::Harness h(R"(
filter reject_long(route: Route) {
    if route.prefix.len() > 24 {
        reject;
    } else {
        accept;
    }
}
)");
    auto longer = h.runRoute("reject_long", test::makeRoute("203.0.113.0/26"));
    ASSERT_TRUE(longer.ok()) << longer.fault->toString();
    EXPECT_STREQ(vm::terminationName(longer.result->termination), "reject");

    auto shorter = h.runRoute("reject_long", test::makeRoute("198.16.0.0/20"));
    ASSERT_TRUE(shorter.ok()) << shorter.fault->toString();
    EXPECT_STREQ(vm::terminationName(shorter.result->termination), "accept");
}

TEST(Scenario, UndeclaredIdentifier)
{
    const std::string source = "filter f(route: Route) {\n"
                               "    if prefx.len() > 24 { reject; }\n"
                               "    accept;\n"
                               "}\n";
    auto result = test::compileSource(source);
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.program, nullptr);
    ASSERT_EQ(result.diagnostics.errorCount(), 1u) << test::renderAll(result);
    ASSERT_EQ(test::countKind(result.diagnostics, DiagKind::UndefinedSymbol), 1u);

    const support::Diagnostic &d = result.diagnostics.diagnostics().front();
    support::SourceSpan span = d.span();
    EXPECT_EQ(span.begin, source.find("prefx"));
    EXPECT_EQ(span.length(), 5u);
    EXPECT_EQ(support::formatDiagnostic(d, &result.sources),
              "test.sieve:2:8: error[UndefinedSymbol]: undefined identifier 'prefx'");
}

TEST(Scenario, ReturnTypeMismatch)
{
    auto result = test::compileSource("function f() -> Bool { 1 }");
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.program, nullptr);
    ASSERT_EQ(result.diagnostics.errorCount(), 1u) << test::renderAll(result);
    ASSERT_EQ(test::countKind(result.diagnostics, DiagKind::TypeMismatch), 1u);

    const std::string &message = result.diagnostics.diagnostics().front().message;
    EXPECT_NE(message.find("'Bool'"), std::string::npos) << message;
    EXPECT_NE(message.find("'Int'"), std::string::npos) << message;
}

TEST(Scenario, NonExhaustiveMatch)
{
    auto result = test::compileSource(R"(
enum Origin { Igp, Egp, Incomplete }
function rank(o: Origin) -> Int {
    match o {
        Igp => return 0,
        Egp => return 1,
    }
    2
}
)");
    EXPECT_FALSE(result.succeeded());
    ASSERT_EQ(test::countKind(result.diagnostics, DiagKind::NonExhaustiveMatch), 1u)
        << test::renderAll(result);
    for (const auto &d : result.diagnostics.diagnostics())
    {
        if (d.kind != DiagKind::NonExhaustiveMatch)
            continue;
        EXPECT_EQ(d.severity, support::Severity::Error);
        EXPECT_NE(d.message.find("'Incomplete'"), std::string::npos) << d.message;
        EXPECT_EQ(d.message.find("'Igp'"), std::string::npos) << d.message;
    }
}

TEST(Scenario, ParseAndTypeErrorsReportedTogether)
{
    auto result = test::compileSource(R"(
function f() -> Int { let x = ; 1 }
function g() -> Bool { 2 }
)");
    EXPECT_FALSE(result.succeeded());
    EXPECT_GE(test::countKind(result.diagnostics, DiagKind::ParseError), 1u)
        << test::renderAll(result);
    EXPECT_EQ(test::countKind(result.diagnostics, DiagKind::TypeMismatch), 1u)
        << test::renderAll(result);
}

TEST(Compiler, DebugDumpsAreBracketed)
{
    frontend::CompilerInput input;
    input.source = "filter f(route: Route) { accept; }";
    input.unitName = "test.sieve";
    input.types = test::routeTable();

    frontend::CompilerOptions options;
    options.dumpTokens = true;
    options.dumpAst = true;
    options.dumpIr = true;
    options.dumpBytecode = true;

    testing::internal::CaptureStderr();
    auto result = frontend::compile(input, options);
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_TRUE(result.succeeded()) << test::renderAll(result);
    for (const char *banner : {"=== Sieve Token Stream ===", "=== End Token Stream ===",
                               "=== AST after semantic analysis ===", "=== End AST ===",
                               "=== IR after lowering ===", "=== End IR ===", "=== Bytecode ===",
                               "=== End Bytecode ==="})
        EXPECT_NE(err.find(banner), std::string::npos) << banner;
    EXPECT_NE(err.find("RETURN accept"), std::string::npos) << err;
}
