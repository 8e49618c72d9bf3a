//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Options.hpp
// Purpose: Options controlling one compilation.
// Key invariants: Options never change the produced Program, only the debug
//                 output written while producing it.
// Ownership/Lifetime: Plain value type.
// Links: frontends/sieve/Compiler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

namespace sieve::frontend
{

struct CompilerOptions
{
    /// @brief Dump the token stream before parsing.
    bool dumpTokens{false};

    /// @brief Dump the AST after semantic analysis.
    bool dumpAst{false};

    /// @brief Dump IR after lowering.
    bool dumpIr{false};

    /// @brief Dump the disassembled program after verification.
    bool dumpBytecode{false};
};

} // namespace sieve::frontend
