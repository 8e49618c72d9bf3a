//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/AST_Expr.hpp
// Purpose: Expression nodes as a closed tagged variant.
// Key invariants: After checking, Expr::type is non-null for every reachable
//                 expression; failed expressions carry the Error type.
// Ownership/Lifetime: Children are owned through ExprPtr.
// Links: frontends/sieve/Sema_Expr.cpp, frontends/sieve/Lowerer_Expr.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/sieve/AST_Fwd.hpp"
#include "runtime/Value.hpp"
#include "types/Types.hpp"

#include <variant>

namespace sieve::frontend
{

/// @brief Unary operators.
enum class UnaryOp
{
    Neg, ///< `-a`
    Not, ///< `!a` or `not a`
};

/// @brief Binary operators, loosest binding last.
enum class BinaryOp
{
    Mul,
    Div,
    Rem,
    Add,
    Sub,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    In,
    NotIn,
    And,
    Or,
};

/// @brief Source spelling of @p op.
const char *binaryOpSpelling(BinaryOp op);

/// @brief How a resolved call or member access is carried out.
enum class CallKind
{
    Unresolved,
    Function, ///< User function, index into the module's function list.
    External, ///< Host symbol, see CallTarget::symbol.
    Builtin,  ///< Built-in method, index is a runtime::BuiltinId.
    Field,    ///< Record field, index is the field position.
};

/// @brief Resolution annotation filled in by the checker.
struct CallTarget
{
    CallKind kind = CallKind::Unresolved;
    uint32_t index = 0;
    std::string symbol;
};

/// @brief Membership test flavour chosen by the checker for `in`.
enum class InKind
{
    Unresolved,
    List,          ///< element in List[T]
    AddrInPrefix,  ///< IpAddr in Prefix
    PrefixInPrefix ///< Prefix in Prefix
};

/// @brief Literal of any primitive kind: `42`, `"x"`, `10.0.0.0/8`, `AS65000`.
struct LiteralExpr
{
    runtime::Value value;
};

/// @brief Reference to a local, parameter or loop variable.
struct NameExpr
{
    std::string name;
    LocalId local = kNoLocal;
};

struct UnaryExpr
{
    UnaryOp op;
    ExprPtr operand;
};

/// @brief Binary operation. `&&` and `||` short-circuit.
struct BinaryExpr
{
    BinaryOp op;
    ExprPtr lhs;
    ExprPtr rhs;
    InKind inKind = InKind::Unresolved;
};

/// @brief `base.field` on a record or an external type.
struct FieldExpr
{
    ExprPtr base;
    std::string field;
    SourceSpan fieldSpan;
    CallTarget target; ///< Field (record) or External (host getter).
};

/// @brief `receiver.method(args)` on a built-in or external receiver.
struct MethodCallExpr
{
    ExprPtr receiver;
    std::string method;
    SourceSpan methodSpan;
    std::vector<ExprPtr> args;
    CallTarget target;
};

/// @brief `name(args)` calling a user or external function.
struct CallExpr
{
    std::string callee;
    SourceSpan calleeSpan;
    std::vector<ExprPtr> args;
    CallTarget target;
};

/// @brief One `name: value` entry of a record literal.
struct FieldInit
{
    std::string name;
    SourceSpan nameSpan;
    ExprPtr value;
};

/// @brief `Name { a: 1 }` (typed) or `{ a: 1 }` (anonymous).
struct RecordExpr
{
    std::string typeName; ///< Empty for anonymous records.
    SourceSpan typeSpan;
    std::vector<FieldInit> fields;
};

/// @brief `Enum::Variant` or `Enum::Variant(payload)`.
struct EnumExpr
{
    std::string enumName;
    std::string variant;
    SourceSpan variantSpan;
    ExprPtr payload;
    uint32_t variantIndex = 0;
};

/// @brief `[a, b, c]`.
struct ListExpr
{
    std::vector<ExprPtr> elements;
};

/// @brief Placeholder produced by parser recovery.
struct ErrorExpr
{
};

using ExprNode = std::variant<LiteralExpr,
                              NameExpr,
                              UnaryExpr,
                              BinaryExpr,
                              FieldExpr,
                              MethodCallExpr,
                              CallExpr,
                              RecordExpr,
                              EnumExpr,
                              ListExpr,
                              ErrorExpr>;

/// @brief Expression node.
struct Expr
{
    SourceSpan span;
    ExprNode node;

    /// Resolved type, set by the checker.
    types::TypeRef type;

    Expr(SourceSpan s, ExprNode n) : span(s), node(std::move(n)) {}
};

/// @brief Allocate an expression node.
template <typename T> ExprPtr makeExpr(SourceSpan span, T node)
{
    return std::make_unique<Expr>(span, ExprNode(std::move(node)));
}

} // namespace sieve::frontend
