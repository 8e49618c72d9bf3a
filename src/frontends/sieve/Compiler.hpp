//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Compiler.hpp
// Purpose: Sieve compiler driver; runs the pipeline from source text to a
//          verified Program.
// Key invariants: CompilerResult::program is set iff no error was reported.
//                 Every diagnostic of every phase is kept, in report order.
// Ownership/Lifetime: The result owns its diagnostics and source manager and
//                     shares the Program; nothing outlives the call otherwise.
// Links: frontends/sieve/Lexer.hpp, frontends/sieve/Parser.hpp,
//        frontends/sieve/Sema.hpp, frontends/sieve/Lowerer.hpp,
//        bytecode/BytecodeCompiler.hpp, bytecode/StackVerifier.hpp
//
//===----------------------------------------------------------------------===//
//
// Compilation phases:
//   1. Lexing      text -> tokens (Lexer)
//   2. Parsing     tokens -> AST, with recovery (Parser)
//   3. Sema        AST -> typed AST; also runs on a partial AST so parse
//                  and type errors are reported together
//   4. Lowering    typed AST -> IR (Lowerer), only without errors
//   5. Codegen     IR -> Program (BytecodeCompiler)
//   6. Verify      stack-effect verification (verifyProgram)
//
// Usage:
//   CompilerInput input;
//   input.source = text;
//   input.types = table;
//   CompilerResult result = compile(input, {});
//   if (result.succeeded())
//       use(result.program);

#pragma once

#include "bytecode/BytecodeModule.hpp"
#include "frontends/sieve/Options.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include "types/TypeTable.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace sieve::frontend
{

/// @brief Source and environment of one compilation.
struct CompilerInput
{
    /// @brief Policy source text.
    std::string_view source;

    /// @brief Unit name used when formatting diagnostics.
    std::string_view unitName{"<input>"};

    /// @brief Unit identifier stamped into every span; must be non-zero.
    uint32_t unitId{1};

    /// @brief Host-registered types and functions; may be null.
    std::shared_ptr<const types::ExternalTypeTable> types;
};

/// @brief Diagnostics and program produced by compile().
struct CompilerResult
{
    support::DiagnosticEngine diagnostics{};

    /// @brief The compiled unit, for formatting diagnostics.
    support::SourceManager sources{};

    /// @brief Verified program; null when any error was reported.
    std::shared_ptr<const bytecode::Program> program;

    [[nodiscard]] bool succeeded() const;
};

/// @brief Compile @p input into a verified Program.
/// @details Never throws for malformed input; every problem is a diagnostic.
CompilerResult compile(const CompilerInput &input, const CompilerOptions &options);

} // namespace sieve::frontend
