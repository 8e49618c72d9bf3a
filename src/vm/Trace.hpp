//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Trace.hpp
// Purpose: Declare tracing configuration and sink for VM instruction steps.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value and borrows the output
//                     stream, which defaults to std::cerr.
// Links: vm/BytecodeVM.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/BytecodeModule.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>

namespace sieve::vm
{

/// @brief Configuration for interpreter tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,     ///< Tracing disabled
        Calls,   ///< Trace function entry only
        Bytecode ///< Trace every instruction
    } mode{Off};

    /// @brief Destination stream; null selects std::cerr.
    std::ostream *out = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record entry into @p fn at call depth @p depth.
    void onCall(const bytecode::BytecodeFunction &fn, size_t depth);

    /// @brief Record execution of the instruction at @p pc of @p fn.
    void onStep(const bytecode::BytecodeModule &module, const bytecode::BytecodeFunction &fn,
                uint32_t pc, uint32_t stackDepth);

  private:
    std::ostream &stream() const;

    TraceConfig cfg; ///< Active configuration
};

} // namespace sieve::vm
