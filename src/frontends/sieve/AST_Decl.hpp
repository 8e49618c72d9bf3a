//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/AST_Decl.hpp
// Purpose: Top-level declarations and the module root.
// Key invariants: Function indices follow declaration order of FunctionDecls.
// Ownership/Lifetime: Module owns every declaration.
// Links: frontends/sieve/Sema_Decl.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/sieve/AST_Stmt.hpp"

namespace sieve::frontend
{

/// @brief Flavour of a callable declaration.
enum class FunctionKind
{
    Function,  ///< `function`: returns with `return`
    Filter,    ///< `filter`: ends with accept or reject
    FilterMap, ///< `filter-map`: accept may carry a value
};

struct Param
{
    std::string name;
    SourceSpan span;
    TypeNode type;
};

/// @brief `function`, `filter` or `filter-map` declaration.
struct FunctionDecl
{
    FunctionKind kind = FunctionKind::Function;
    std::string name;
    SourceSpan nameSpan;
    std::vector<Param> params;
    std::optional<TypeNode> returnType;
    Block body;

    /// Set by the checker.
    types::TypeRef signature;
    uint32_t localCount = 0;
};

struct FieldDecl
{
    std::string name;
    SourceSpan span;
    TypeNode type;
};

/// @brief `record Name { field: Type, ... }`
struct RecordDecl
{
    std::string name;
    SourceSpan nameSpan;
    std::vector<FieldDecl> fields;
};

struct VariantDecl
{
    std::string name;
    SourceSpan span;
    std::optional<TypeNode> payload;
};

/// @brief `enum Name { A, B(Type), ... }`
struct EnumDecl
{
    std::string name;
    SourceSpan nameSpan;
    std::vector<VariantDecl> variants;
};

using DeclNode = std::variant<FunctionDecl, RecordDecl, EnumDecl>;

struct Decl
{
    SourceSpan span;
    DeclNode node;

    Decl(SourceSpan s, DeclNode n) : span(s), node(std::move(n)) {}
};

/// @brief Root of one compilation unit.
struct Module
{
    uint32_t unit = 0;
    std::vector<DeclPtr> decls;
};

} // namespace sieve::frontend
