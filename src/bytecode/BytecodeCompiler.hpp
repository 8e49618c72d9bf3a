//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bytecode/BytecodeCompiler.hpp
// Purpose: Compiles IR functions into stack bytecode.
// Key invariants: Operand stack depth is zero between IR instructions.
//                 The recorded maxStack is the largest depth any emitted
//                 sequence reaches.
// Ownership/Lifetime: The compiler borrows the IR module, the external type
//                     table and the diagnostic engine for one compile() call.
// Links: ir/IR.hpp, bytecode/BytecodeModule.hpp, bytecode/StackVerifier.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Bytecode.hpp"
#include "bytecode/BytecodeModule.hpp"
#include "ir/IR.hpp"
#include "support/diagnostics.hpp"
#include "types/TypeTable.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sieve::bytecode
{

/// @brief Compiler that transforms an IR module into a Program.
/// @details Each IR value lives in a frame local: named and hidden slots keep
///          their IR index and temporary t maps to slot `slotCount + t`. An
///          instruction loads its operands, applies the opcode and stores the
///          result, so the operand stack never carries values across
///          instructions or blocks.
///
///          Blocks are emitted in IR layout order. Branches to the next block
///          become fall-through, other forward branches are JUMP variants
///          patched after the function is laid out, and the branch from a loop
///          body back to its iter.next header becomes LOOP.
class BytecodeCompiler
{
  public:
    BytecodeCompiler(support::DiagnosticEngine &diag, const types::ExternalTypeTable *externals);

    /// @brief Compile every function of @p module.
    /// @return The program, or nullopt after reporting an InternalError.
    std::optional<BytecodeModule> compile(const ir::Module &module);

  private:
    /// @brief A jump awaiting its target offset.
    struct BranchFixup
    {
        uint32_t codeOffset; ///< pc of the jump or ITER_NEXT instruction.
        std::string targetLabel;
        bool iterExit = false; ///< Patch the trailing ITER_NEXT word.
    };

    bool compileFunction(const ir::Function &fn);
    void compileBlock(size_t index);
    void compileInstr(const ir::Instr &in);
    void compileTerminator(const ir::Terminator &term, size_t index);
    void resolveBranches();

    /// @name Emission
    /// @{
    uint32_t pc() const
    {
        return static_cast<uint32_t>(currentFunc_->code.size());
    }
    void emit(uint32_t word);
    void pushValue(const ir::Operand &op);
    void storeResult(uint32_t temp);
    void emitLoadLocal(uint32_t slot);
    void emitStoreLocal(uint32_t slot);
    void emitBranch(BCOpcode op, const std::string &label);
    /// @brief Emit control transfer to @p label unless it is the next block.
    void emitGoto(const std::string &label, size_t fromIndex);
    uint32_t tempSlot(uint32_t temp) const;
    /// @}

    /// @name Stack tracking
    /// @{
    void pushStack(int32_t count = 1);
    void popStack(int32_t count = 1);
    /// @}

    void fail(const std::string &message);

    support::DiagnosticEngine &diag_;
    const types::ExternalTypeTable *externals_;

    BytecodeModule module_;
    const ir::Function *irFunc_ = nullptr;
    BytecodeFunction *currentFunc_ = nullptr;

    /// Block label to bytecode offset, filled as blocks are emitted.
    std::unordered_map<std::string, uint32_t> blockOffsets_;
    std::vector<BranchFixup> pendingBranches_;

    int32_t currentStackDepth_ = 0;
    int32_t maxStackDepth_ = 0;
    bool failed_ = false;
};

} // namespace sieve::bytecode
