//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Trace.cpp
// Purpose: Trace line formatting for the bytecode VM.
// Key invariants: One line per event, prefixed with "[trace]".
// Ownership/Lifetime: See Trace.hpp.
// Links: vm/Trace.hpp, bytecode/Disassembler.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/Trace.hpp"
#include "bytecode/Disassembler.hpp"

#include <iomanip>
#include <iostream>

namespace sieve::vm
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

std::ostream &TraceSink::stream() const
{
    return cfg.out ? *cfg.out : std::cerr;
}

void TraceSink::onCall(const bytecode::BytecodeFunction &fn, size_t depth)
{
    if (!cfg.enabled())
        return;
    stream() << "[trace] enter " << fn.name << " depth=" << depth << "\n";
}

void TraceSink::onStep(const bytecode::BytecodeModule &module,
                       const bytecode::BytecodeFunction &fn, uint32_t pc, uint32_t stackDepth)
{
    if (cfg.mode != TraceConfig::Bytecode)
        return;
    std::ostream &os = stream();
    os << "[trace] " << fn.name << "@" << std::setw(4) << std::setfill('0') << pc
       << std::setfill(' ') << " " << bytecode::disassembleInstr(fn, pc, module)
       << " sp=" << stackDepth << "\n";
}

} // namespace sieve::vm
