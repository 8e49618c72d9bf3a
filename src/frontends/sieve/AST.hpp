//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/AST.hpp
// Purpose: Umbrella header for the Sieve AST.
// Key invariants: None.
// Ownership/Lifetime: See individual headers.
// Links: frontends/sieve/AST_Expr.hpp, AST_Stmt.hpp, AST_Decl.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/sieve/AST_Decl.hpp"
#include "frontends/sieve/AST_Expr.hpp"
#include "frontends/sieve/AST_Fwd.hpp"
#include "frontends/sieve/AST_Stmt.hpp"

#include <ostream>

namespace sieve::frontend
{

/// @brief Write an indented tree dump of @p module, used by --dump-ast style
///        debugging and parser tests.
void printAst(const Module &module, std::ostream &os);

} // namespace sieve::frontend
