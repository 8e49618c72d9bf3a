//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Parser.hpp
// Purpose: Recursive-descent parser building the Sieve AST.
// Key invariants: After an error the parser stays in panic mode, reporting
//                 nothing further, until it resynchronizes at a statement or
//                 declaration boundary. At most one error is reported per
//                 token, even when recovery makes no progress. A Module is
//                 always returned.
// Ownership/Lifetime: The parser borrows the lexer and diagnostic engine; the
//                     returned Module is owned by the caller.
// Links: frontends/sieve/AST.hpp, frontends/sieve/Lexer.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/sieve/AST.hpp"
#include "frontends/sieve/Lexer.hpp"
#include "support/diagnostics.hpp"

#include <initializer_list>
#include <optional>
#include <vector>

namespace sieve::frontend
{

/// @brief Parses one compilation unit.
class Parser
{
  public:
    Parser(Lexer &lexer, support::DiagnosticEngine &diag);

    /// @brief Parse the whole unit; always returns a (possibly partial) module.
    Module parseModule();

    /// @brief Parse a single expression (used by tests and tooling).
    ExprPtr parseExpression();

    /// @brief True when any parse error was reported.
    bool hasError() const
    {
        return hasError_;
    }

  private:
    //=========================================================================
    // Token stream
    //=========================================================================

    const Token &peek(size_t offset = 0);
    Token advance();
    bool check(TokenKind kind, size_t offset = 0);
    bool match(TokenKind kind, Token *out = nullptr);
    bool expect(TokenKind kind, Token *out = nullptr);

    /// @brief Span from @p start to the end of the last consumed token.
    SourceSpan spanFrom(const SourceSpan &start) const;

    //=========================================================================
    // Errors and recovery
    //=========================================================================

    /// @brief Report "expected <set>, found <token>" at the current token.
    void errorExpected(std::initializer_list<TokenKind> expected);
    void errorExpected(const char *what);
    void errorAt(SourceSpan span, const std::string &message);

    void syncToStatement();
    void syncToDeclaration();
    bool atStatementKeyword();
    bool atDeclarationKeyword();

    /// Disables `Name { ... }` record literals in if/match/for headers.
    class NoRecordLiterals
    {
      public:
        NoRecordLiterals(Parser &parser, bool disable) : parser_(parser), saved_(parser.noRecordLiterals_)
        {
            parser_.noRecordLiterals_ = disable;
        }

        ~NoRecordLiterals()
        {
            parser_.noRecordLiterals_ = saved_;
        }

        NoRecordLiterals(const NoRecordLiterals &) = delete;
        NoRecordLiterals &operator=(const NoRecordLiterals &) = delete;

      private:
        Parser &parser_;
        bool saved_;
    };

    //=========================================================================
    // Expressions
    //=========================================================================

    ExprPtr parseLogicalOr();
    ExprPtr parseLogicalAnd();
    ExprPtr parseComparison();
    ExprPtr parseAdditive();
    ExprPtr parseMultiplicative();
    ExprPtr parseUnary();
    ExprPtr parsePostfix();
    ExprPtr parsePrimary();
    ExprPtr parseIdentifierExpr();
    ExprPtr parseRecordLiteral(std::string typeName, SourceSpan typeSpan);
    ExprPtr parseListLiteral();
    std::vector<ExprPtr> parseCallArgs();

    //=========================================================================
    // Statements
    //=========================================================================

    Block parseBlock();
    StmtPtr parseStatement();
    StmtPtr parseLetStmt();
    StmtPtr parseAssignStmt();
    StmtPtr parseIfStmt();
    StmtPtr parseMatchStmt();
    bool parseMatchArm(MatchArm &arm);
    StmtPtr parseForStmt();
    StmtPtr parseActionStmt();
    StmtPtr parseExprStmt();

    /// @brief Accept `;`, or nothing before `}` (and before `,` in match arms).
    /// @return True when a `;` was consumed.
    bool parseStatementEnd();

    //=========================================================================
    // Types and declarations
    //=========================================================================

    std::optional<TypeNode> parseType();
    DeclPtr parseDeclaration();
    DeclPtr parseFunctionDecl(FunctionKind kind);
    DeclPtr parseRecordDecl();
    DeclPtr parseEnumDecl();
    std::vector<Param> parseParams();

    Lexer &lexer_;
    support::DiagnosticEngine &diag_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    uint32_t prevEnd_ = 0;
    uint32_t unit_ = 0;
    bool hasError_ = false;
    bool panic_ = false;
    std::optional<size_t> lastErrorPos_; ///< Token index of the last reported error.
    bool noRecordLiterals_ = false;
    int matchArmDepth_ = 0;
};

} // namespace sieve::frontend
