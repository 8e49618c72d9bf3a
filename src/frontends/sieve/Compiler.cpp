//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Compiler.cpp
// Purpose: Implementation of the Sieve compiler driver.
// Key invariants: Later phases only run on input earlier phases accepted;
//                 Sema is the exception and also checks a partial AST.
// Ownership/Lifetime: See Compiler.hpp.
// Links: frontends/sieve/Compiler.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/Compiler.hpp"
#include "bytecode/BytecodeCompiler.hpp"
#include "bytecode/Disassembler.hpp"
#include "bytecode/StackVerifier.hpp"
#include "frontends/sieve/AST.hpp"
#include "frontends/sieve/Lexer.hpp"
#include "frontends/sieve/Lowerer.hpp"
#include "frontends/sieve/Parser.hpp"
#include "frontends/sieve/Sema.hpp"
#include "ir/IR.hpp"

#include <cstdlib>
#include <iostream>

namespace sieve::frontend
{

namespace
{
/// @brief Print every token of @p source to stderr.
/// @details Uses its own lexer and diagnostic engine so lexical errors are
///          reported once, by the lexer that feeds the parser.
void dumpTokenStream(const std::string &source, uint32_t unitId,
                     const support::SourceManager &sm)
{
    support::DiagnosticEngine scratch;
    Lexer lexer(source, unitId, scratch);
    std::cerr << "=== Sieve Token Stream ===\n";
    for (;;)
    {
        Token tok = lexer.next();
        support::SourceLoc loc = sm.locate(tok.span);
        std::cerr << loc.line << ':' << loc.column << '\t' << tokenKindToString(tok.kind);
        if (!tok.text.empty())
            std::cerr << "\t\"" << tok.text << '"';
        if (tok.literal.kind() != runtime::ValueKind::Unit)
            std::cerr << "\tvalue=" << tok.literal.toString();
        std::cerr << '\n';
        if (tok.kind == TokenKind::Eof)
            break;
    }
    std::cerr << "=== End Token Stream ===\n";
}
} // namespace

bool CompilerResult::succeeded() const
{
    return diagnostics.errorCount() == 0 && program != nullptr;
}

CompilerResult compile(const CompilerInput &input, const CompilerOptions &options)
{
    CompilerResult result{};
    std::string source(input.source);
    result.sources.addUnit(input.unitId, std::string(input.unitName), source);

    auto debugPhase = [](const char *phase)
    {
        if (std::getenv("SIEVE_DEBUG_COMPILE"))
            std::cerr << "[sieve] " << phase << std::endl;
    };

    if (options.dumpTokens)
        dumpTokenStream(source, input.unitId, result.sources);

    debugPhase("Phase 1: Lexing");
    Lexer lexer(source, input.unitId, result.diagnostics);

    debugPhase("Phase 2: Parsing");
    Parser parser(lexer, result.diagnostics);
    Module module = parser.parseModule();

    // Sema runs even after parse errors so one call reports both kinds.
    debugPhase("Phase 3: Semantic Analysis");
    Sema sema(result.diagnostics, input.types);
    sema.analyze(module);

    if (options.dumpAst)
    {
        std::cerr << "=== AST after semantic analysis ===\n";
        printAst(module, std::cerr);
        std::cerr << "=== End AST ===\n";
    }

    if (result.diagnostics.hasErrors())
        return result;

    debugPhase("Phase 4: IR Lowering");
    Lowerer lowerer;
    ir::Module irModule = lowerer.lower(module);

    if (options.dumpIr)
    {
        std::cerr << "=== IR after lowering ===\n";
        ir::print(irModule, std::cerr);
        std::cerr << "=== End IR ===\n";
    }

    debugPhase("Phase 5: Bytecode Generation");
    bytecode::BytecodeCompiler codegen(result.diagnostics, input.types.get());
    std::optional<bytecode::BytecodeModule> program = codegen.compile(irModule);
    if (!program)
        return result;

    debugPhase("Phase 6: Verification");
    if (!bytecode::verifyProgram(*program, result.diagnostics))
        return result;

    if (options.dumpBytecode)
    {
        std::cerr << "=== Bytecode ===\n";
        bytecode::disassemble(*program, std::cerr);
        std::cerr << "=== End Bytecode ===\n";
    }

    debugPhase("Phase 7: Done");
    result.program = std::make_shared<const bytecode::Program>(std::move(*program));
    return result;
}

} // namespace sieve::frontend
