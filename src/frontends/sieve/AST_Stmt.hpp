//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/AST_Stmt.hpp
// Purpose: Statement nodes as a closed tagged variant.
// Key invariants: Local ids on declaring statements are assigned by the
//                 checker in declaration order.
// Ownership/Lifetime: Blocks own their statements.
// Links: frontends/sieve/Sema_Stmt.cpp, frontends/sieve/Lowerer_Stmt.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/sieve/AST_Expr.hpp"

#include <optional>

namespace sieve::frontend
{

/// @brief Brace-delimited statement list; opens a scope.
struct Block
{
    SourceSpan span;
    std::vector<StmtPtr> stmts;
};

/// @brief `let name [: Type] = init;`
struct LetStmt
{
    std::string name;
    SourceSpan nameSpan;
    std::optional<TypeNode> annotation;
    ExprPtr init;
    LocalId local = kNoLocal;
};

/// @brief `name = value;`
struct AssignStmt
{
    std::string name;
    SourceSpan nameSpan;
    ExprPtr value;
    LocalId local = kNoLocal;
};

/// @brief Expression evaluated for its value or effects.
struct ExprStmt
{
    ExprPtr expr;

    /// False when the expression ends a block without `;`.
    bool hasSemicolon = true;

    /// Set by the checker when the expression is the function's result.
    bool implicitReturn = false;
};

/// @brief `if cond { } else { }`; `else if` nests an IfStmt in elseBlock.
struct IfStmt
{
    ExprPtr cond;
    Block thenBlock;
    std::optional<Block> elseBlock;
};

/// @brief One `Variant(binding) if guard => body` arm.
struct MatchArm
{
    /// Variant name, or "_" for the wildcard arm.
    std::string variant;
    SourceSpan patternSpan;
    std::optional<std::string> binding;
    SourceSpan bindingSpan;
    ExprPtr guard;
    Block body;

    uint32_t variantIndex = 0;
    LocalId bindingLocal = kNoLocal;

    bool isWildcard() const
    {
        return variant == "_";
    }
};

/// @brief `match scrutinee { arms }` over an enum value.
struct MatchStmt
{
    ExprPtr scrutinee;
    std::vector<MatchArm> arms;
};

/// @brief `for var in iterable { body }` over a list.
struct ForStmt
{
    std::string var;
    SourceSpan varSpan;
    ExprPtr iterable;
    Block body;
    LocalId local = kNoLocal;
};

/// @brief Statements that end evaluation of the current function.
enum class ActionKind
{
    Accept,
    Reject,
    Return,
    Abort,
};

/// @brief `accept [e];`, `reject;`, `return [e];` or `abort e;`.
struct ActionStmt
{
    ActionKind kind;
    ExprPtr value;
};

/// @brief Nested `{ ... }` block.
struct BlockStmt
{
    Block block;
};

using StmtNode =
    std::variant<LetStmt, AssignStmt, ExprStmt, IfStmt, MatchStmt, ForStmt, ActionStmt, BlockStmt>;

/// @brief Statement node.
struct Stmt
{
    SourceSpan span;
    StmtNode node;

    Stmt(SourceSpan s, StmtNode n) : span(s), node(std::move(n)) {}
};

template <typename T> StmtPtr makeStmt(SourceSpan span, T node)
{
    return std::make_unique<Stmt>(span, StmtNode(std::move(node)));
}

} // namespace sieve::frontend
