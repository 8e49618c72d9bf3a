//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bytecode/Disassembler.hpp
// Purpose: Human-readable listings of compiled programs for debug dumps.
// Key invariants: Output is deterministic for a given program.
// Ownership/Lifetime: Borrows the module.
// Links: bytecode/Bytecode.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/BytecodeModule.hpp"

#include <ostream>
#include <string>

namespace sieve::bytecode
{

/// @brief Render one instruction, e.g. "JUMP_IF_FALSE +4 -> 0012".
/// @param pc Offset of the instruction within @p fn.
std::string disassembleInstr(const BytecodeFunction &fn, uint32_t pc, const BytecodeModule &module);

/// @brief Listing of @p fn with one instruction per line.
std::string disassemble(const BytecodeFunction &fn, const BytecodeModule &module);

/// @brief Listing of every function followed by the constant pool and the
///        external-call table.
void disassemble(const BytecodeModule &module, std::ostream &os);

} // namespace sieve::bytecode
