//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bytecode/StackVerifier.hpp
// Purpose: Static stack-effect verification of compiled functions.
// Key invariants: A program is only handed out after every function passes.
// Ownership/Lifetime: Stateless functions over borrowed modules.
// Links: bytecode/Bytecode.hpp, bytecode/BytecodeCompiler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/BytecodeModule.hpp"
#include "support/diagnostics.hpp"
#include "support/result.hpp"

#include <cstdint>
#include <optional>

namespace sieve::bytecode
{

/// @brief Values an instruction pops and pushes.
struct StackEffect
{
    uint32_t pops = 0;
    uint32_t pushes = 0;
};

/// @brief Stack effect of instruction @p word.
/// @details Calls take their pop count from the callee's parameter count,
///          aggregates from their operand.
/// @return nullopt for an unknown opcode or an out-of-range callee.
std::optional<StackEffect> stackEffect(uint32_t word, const BytecodeModule &module);

/// @brief Verify one function.
/// @details Simulates the operand stack along every reachable path and checks
///          that:
///          - depth never drops below zero
///          - depth agrees wherever paths merge
///          - depth is zero at every jump and jump target
///          - exactly one value is on the stack at RETURN and ABORT
///          - jumps land on instruction boundaries inside the function, and
///            LOOP lands on ITER_NEXT
///          - local, constant, callee and table operands are in range
///          - the verified maximum equals the recorded maxStack
/// @return The verified maximum depth, or a message naming the first problem.
support::Result<uint32_t> verifyFunction(const BytecodeFunction &fn, const BytecodeModule &module);

/// @brief Verify every function, reporting failures as InternalError.
/// @return True when all functions verify.
bool verifyProgram(const BytecodeModule &module, support::DiagnosticEngine &diag);

} // namespace sieve::bytecode
