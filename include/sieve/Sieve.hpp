//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/sieve/Sieve.hpp
// Purpose: Stable public entry point for embedding Sieve in a route daemon:
//          type registration, compile, attach, run and hot reload.
// Key invariants: Re-exports only the host-facing surface; compiler internals
//                 (AST, IR, bytecode encoding) stay under src/.
// Ownership/Lifetime: Types keep the semantics of their defining headers.
// Links: frontends/sieve/Compiler.hpp, vm/BytecodeVM.hpp, vm/ProgramSlot.hpp
#pragma once

#include "frontends/sieve/Compiler.hpp"
#include "runtime/NetTypes.hpp"
#include "runtime/Value.hpp"
#include "support/diagnostics.hpp"
#include "support/result.hpp"
#include "types/TypeTable.hpp"
#include "vm/BytecodeVM.hpp"
#include "vm/HostBindings.hpp"
#include "vm/ProgramSlot.hpp"

/// @file include/sieve/Sieve.hpp
/// @brief Host workflow:
///        1. Register external types and functions with types::TypeTableBuilder.
///        2. frontend::compile() a policy against the built table.
///        3. Bind host callables in vm::HostBindings and vm::attach() the program.
///        4. Publish the attachment in a vm::ProgramSlot and run snapshots of it
///           with vm::BytecodeVM.
