//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/AST_Fwd.hpp
// Purpose: Forward declarations, owning pointer aliases and the visitor
//          overload helper shared by all AST headers.
// Key invariants: Every AST node is exclusively owned by its parent.
// Ownership/Lifetime: unique_ptr ownership from the Module down.
// Links: frontends/sieve/AST.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sieve::frontend
{

struct Expr;
struct Stmt;
struct Decl;

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using DeclPtr = std::unique_ptr<Decl>;

using SourceSpan = support::SourceSpan;

/// @brief Local slot identifier assigned by the checker.
using LocalId = uint32_t;

/// @brief Marker for a name the checker could not resolve to a local.
inline constexpr LocalId kNoLocal = UINT32_MAX;

/// @brief Builds a visitor from a set of lambdas for std::visit.
template <typename... Ts> struct Overload : Ts...
{
    using Ts::operator()...;
};

template <typename... Ts> Overload(Ts...) -> Overload<Ts...>;

/// @brief Syntactic type annotation, e.g. `Int` or `List[Prefix]`.
/// @details Resolved to a semantic type by the checker.
struct TypeNode
{
    std::string name;
    SourceSpan span;
    std::vector<TypeNode> args;

    /// @brief Source-like spelling for messages.
    std::string toString() const
    {
        std::string out = name;
        if (!args.empty())
        {
            out += '[';
            for (size_t i = 0; i < args.size(); ++i)
                out += (i ? ", " : "") + args[i].toString();
            out += ']';
        }
        return out;
    }
};

} // namespace sieve::frontend
