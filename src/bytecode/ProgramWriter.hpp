//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bytecode/ProgramWriter.hpp
// Purpose: Serializes a Program into a flat byte image.
// Key invariants: Equal programs produce identical images; the image starts
//                 with kBytecodeModuleMagic and kBytecodeVersion.
// Ownership/Lifetime: Returns an owned byte vector.
// Links: bytecode/BytecodeModule.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/BytecodeModule.hpp"

#include <cstdint>
#include <vector>

namespace sieve::bytecode
{

/// @brief Serialize @p program.
/// @details Layout, all integers little-endian u32 and strings length-prefixed:
///          magic, version, constants (kind byte plus spelling), functions
///          (name, kind, parameter names and types, result, locals, maxStack,
///          code words) and external-call entries (symbol, signature).
std::vector<uint8_t> writeProgram(const BytecodeModule &program);

} // namespace sieve::bytecode
