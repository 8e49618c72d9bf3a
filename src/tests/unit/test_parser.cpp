//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_parser.cpp
// Purpose: Parser structure, precedence and error recovery, checked through
//          the AST dump.
// Key invariants: A partial AST is returned even when errors are reported.
// Ownership/Lifetime: Each test owns its lexer, parser and module.
// Links: frontends/sieve/Parser.hpp, frontends/sieve/AstPrinter.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontends/sieve/AST.hpp"
#include "frontends/sieve/Lexer.hpp"
#include "frontends/sieve/Parser.hpp"
#include "support/diagnostics.hpp"

#include <sstream>
#include <string>

using namespace sieve;
using namespace sieve::frontend;

namespace
{

struct Parsed
{
    support::DiagnosticEngine diag;
    Module module;
    std::string dump;
};

void parse(const std::string &source, Parsed &out)
{
    Lexer lexer(source, 1, out.diag);
    Parser parser(lexer, out.diag);
    out.module = parser.parseModule();
    std::ostringstream os;
    printAst(out.module, os);
    out.dump = os.str();
}

} // namespace

TEST(Parser, ArithmeticPrecedence)
{
    Parsed p;
    parse("function f() -> Int { 1 + 2 * 3 - 4 }", p);
    EXPECT_EQ(p.diag.errorCount(), 0u);
    EXPECT_EQ(p.dump, "function f() -> Int\n"
                      "  tail (- (+ 1 (* 2 3)) 4)\n");
}

TEST(Parser, LogicalOperatorsBindLooserThanComparison)
{
    Parsed p;
    parse("function f(a: Int, b: Int) -> Bool { a < 1 || b == 2 && !false }", p);
    EXPECT_EQ(p.diag.errorCount(), 0u);
    EXPECT_EQ(p.dump, "function f(a: Int, b: Int) -> Bool\n"
                      "  tail (|| (< a 1) (&& (== b 2) (! false)))\n");
}

TEST(Parser, NotInAndPostfixChains)
{
    Parsed p;
    parse("function f(route: Route, l: List[Prefix]) -> Bool {\n"
          "    -route.prefix.len() < 0 || route.prefix not in l\n"
          "}",
          p);
    EXPECT_EQ(p.diag.errorCount(), 0u);
    EXPECT_EQ(p.dump, "function f(route: Route, l: List[Prefix]) -> Bool\n"
                      "  tail (|| (< (- (call (. route prefix).len)) 0) "
                      "(not in (. route prefix) l))\n");
}

TEST(Parser, AggregateLiterals)
{
    Parsed p;
    parse("function f() {\n"
          "    let r = R { a: 1, b: [1, 2] };\n"
          "    let anon = { x: 10.0.0.0/8 };\n"
          "    let e: Color = Color::Red(3);\n"
          "    let g = Color::Green;\n"
          "}",
          p);
    EXPECT_EQ(p.diag.errorCount(), 0u);
    EXPECT_EQ(p.dump, "function f()\n"
                      "  let r = (record R a:1 b:(list 1 2))\n"
                      "  let anon = (record x:10.0.0.0/8)\n"
                      "  let e: Color = (Color::Red 3)\n"
                      "  let g = (Color::Green)\n");
}

TEST(Parser, RecordLiteralsAreNotParsedInConditions)
{
    Parsed p;
    parse("filter f(route: Route) {\n"
          "    if ok { reject; }\n"
          "    for x in xs { reject; }\n"
          "    accept;\n"
          "}",
          p);
    EXPECT_EQ(p.diag.errorCount(), 0u);
    EXPECT_EQ(p.dump, "filter f(route: Route)\n"
                      "  if ok\n"
                      "    reject\n"
                      "  for x in xs\n"
                      "    reject\n"
                      "  accept\n");
}

TEST(Parser, ElseIfChain)
{
    Parsed p;
    parse("filter f(route: Route) { if a { reject; } else if b { reject; } else { accept; } }", p);
    EXPECT_EQ(p.diag.errorCount(), 0u);
    EXPECT_EQ(p.dump, "filter f(route: Route)\n"
                      "  if a\n"
                      "    reject\n"
                      "  else\n"
                      "    if b\n"
                      "      reject\n"
                      "    else\n"
                      "      accept\n");
}

TEST(Parser, MatchArms)
{
    Parsed p;
    parse("filter f(route: Route) {\n"
          "    match v {\n"
          "        A(x) if x > 1 => reject,\n"
          "        B => { accept; }\n"
          "        _ => accept,\n"
          "    }\n"
          "}",
          p);
    EXPECT_EQ(p.diag.errorCount(), 0u);
    EXPECT_EQ(p.dump, "filter f(route: Route)\n"
                      "  match v\n"
                      "    arm A(x) if (> x 1)\n"
                      "      reject\n"
                      "    arm B\n"
                      "      accept\n"
                      "    arm _\n"
                      "      accept\n");
}

TEST(Parser, DeclarationKinds)
{
    Parsed p;
    parse("record Peer { asn: Asn, tags: List[String] }\n"
          "enum Verdict { Drop, Tag(Community) }\n"
          "function one() -> Int { return 1; }\n"
          "filter f(route: Route) { accept; }\n"
          "filter-map m(route: Route) -> Int { accept 1; }\n",
          p);
    EXPECT_EQ(p.diag.errorCount(), 0u);
    ASSERT_EQ(p.module.decls.size(), 5u);
    EXPECT_TRUE(std::holds_alternative<RecordDecl>(p.module.decls[0]->node));
    EXPECT_TRUE(std::holds_alternative<EnumDecl>(p.module.decls[1]->node));
    EXPECT_EQ(std::get<FunctionDecl>(p.module.decls[2]->node).kind, FunctionKind::Function);
    EXPECT_EQ(std::get<FunctionDecl>(p.module.decls[3]->node).kind, FunctionKind::Filter);
    EXPECT_EQ(std::get<FunctionDecl>(p.module.decls[4]->node).kind, FunctionKind::FilterMap);
}

TEST(Parser, ReportsIndependentErrorsInOneCall)
{
    Parsed p;
    parse("filter f(route: Route) {\n"
          "    let x = ;\n"
          "    let y = 1 +;\n"
          "    accept;\n"
          "}",
          p);
    ASSERT_EQ(p.diag.errorCount(), 2u);
    for (const auto &d : p.diag.diagnostics())
    {
        EXPECT_EQ(d.kind, support::DiagKind::ParseError);
        EXPECT_NE(d.message.find("expected expression, found ';'"), std::string::npos)
            << d.message;
    }
    // The partial AST keeps the statements after each error.
    ASSERT_EQ(p.module.decls.size(), 1u);
    EXPECT_EQ(std::get<FunctionDecl>(p.module.decls[0]->node).body.stmts.size(), 3u);
}

TEST(Parser, RecoversAtNextDeclaration)
{
    Parsed p;
    parse("filter f(route: Route) { accept; }\n"
          "garbage here\n"
          "record R { a: Int }\n",
          p);
    ASSERT_EQ(p.diag.errorCount(), 1u);
    EXPECT_EQ(p.diag.diagnostics()[0].kind, support::DiagKind::ParseError);
    ASSERT_EQ(p.module.decls.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<RecordDecl>(p.module.decls[1]->node));
}

TEST(Parser, ChainedComparisonIsRejected)
{
    Parsed p;
    parse("function f() -> Bool { 1 < 2 < 3 }", p);
    ASSERT_EQ(p.diag.errorCount(), 1u);
    EXPECT_NE(p.diag.diagnostics()[0].message.find("cannot be chained"), std::string::npos);
}

TEST(Parser, MissingSemicolonNamesExpectedTokens)
{
    Parsed p;
    parse("filter f(route: Route) { let x = 1 accept; }", p);
    ASSERT_GE(p.diag.errorCount(), 1u);
    const auto &d = p.diag.diagnostics()[0];
    EXPECT_EQ(d.kind, support::DiagKind::ParseError);
    EXPECT_EQ(d.message, "expected ';' or '}', found 'accept'");
}

TEST(Parser, OneErrorPerTokenAtEndOfInput)
{
    auto parseErrors = [](const Parsed &p) {
        size_t n = 0;
        for (const auto &d : p.diag.diagnostics())
            n += d.kind == support::DiagKind::ParseError ? 1 : 0;
        return n;
    };

    Parsed missingBrace;
    parse("function f() -> Int { 1 + 2", missingBrace);
    ASSERT_EQ(parseErrors(missingBrace), 1u);
    EXPECT_EQ(missingBrace.diag.diagnostics()[0].message,
              "expected ';' or '}', found end of input");

    // The lexer reports the unterminated string; the parser adds one error at the end.
    Parsed openString;
    parse("function f() -> String { \"abc }", openString);
    EXPECT_EQ(parseErrors(openString), 1u);
    EXPECT_EQ(openString.module.decls.size(), 1u);
}
