//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bytecode/BytecodeCompiler.cpp
// Purpose: IR to bytecode translation with branch fixups and stack tracking.
// Key invariants: Every forward branch is patched with a positive offset that
//                 fits 16 bits; anything else fails the compile.
// Ownership/Lifetime: See BytecodeCompiler.hpp.
// Links: bytecode/BytecodeCompiler.hpp
//
//===----------------------------------------------------------------------===//

#include "bytecode/BytecodeCompiler.hpp"

#include <limits>

namespace sieve::bytecode
{

using ir::Opcode;
using ir::Operand;

namespace
{

BCOpcode toBytecode(Opcode op)
{
    switch (op)
    {
        case Opcode::Neg:
            return BCOpcode::NEG;
        case Opcode::Not:
            return BCOpcode::NOT;
        case Opcode::Add:
            return BCOpcode::ADD;
        case Opcode::Sub:
            return BCOpcode::SUB;
        case Opcode::Mul:
            return BCOpcode::MUL;
        case Opcode::Div:
            return BCOpcode::DIV;
        case Opcode::Rem:
            return BCOpcode::REM;
        case Opcode::Eq:
            return BCOpcode::EQ;
        case Opcode::Ne:
            return BCOpcode::NE;
        case Opcode::Lt:
            return BCOpcode::LT;
        case Opcode::Le:
            return BCOpcode::LE;
        case Opcode::Gt:
            return BCOpcode::GT;
        case Opcode::Ge:
            return BCOpcode::GE;
        case Opcode::VariantTag:
            return BCOpcode::VARIANT_TAG;
        case Opcode::VariantPayload:
            return BCOpcode::VARIANT_PAYLOAD;
        default:
            break;
    }
    return BCOpcode::NOP;
}

ReturnKind toReturnKind(ir::RetKind kind)
{
    switch (kind)
    {
        case ir::RetKind::Accept:
            return ReturnKind::Accept;
        case ir::RetKind::Reject:
            return ReturnKind::Reject;
        case ir::RetKind::Return:
            break;
    }
    return ReturnKind::Return;
}

} // namespace

BytecodeCompiler::BytecodeCompiler(support::DiagnosticEngine &diag,
                                   const types::ExternalTypeTable *externals)
    : diag_(diag), externals_(externals)
{
}

std::optional<BytecodeModule> BytecodeCompiler::compile(const ir::Module &module)
{
    module_ = BytecodeModule{};
    failed_ = false;

    for (const auto &fn : module.functions)
    {
        if (!compileFunction(fn))
            return std::nullopt;
    }
    return std::move(module_);
}

bool BytecodeCompiler::compileFunction(const ir::Function &fn)
{
    BytecodeFunction out;
    out.name = fn.name;
    out.kind = fn.kind;
    out.numParams = static_cast<uint32_t>(fn.params.size());
    out.params = fn.params;
    out.result = fn.result;

    uint64_t locals = uint64_t{fn.slotCount} + fn.tempCount;
    if (locals > uint64_t{kMaxOperand16} + 1)
    {
        irFunc_ = &fn;
        fail("function too large: " + std::to_string(locals) + " frame slots");
        return false;
    }
    out.numLocals = static_cast<uint32_t>(locals);

    irFunc_ = &fn;
    currentFunc_ = &out;
    blockOffsets_.clear();
    pendingBranches_.clear();
    currentStackDepth_ = 0;
    maxStackDepth_ = 0;

    for (size_t i = 0; i < fn.blocks.size() && !failed_; ++i)
        compileBlock(i);
    if (!failed_)
        resolveBranches();

    out.maxStack = static_cast<uint32_t>(maxStackDepth_);
    currentFunc_ = nullptr;
    if (failed_)
        return false;
    module_.addFunction(std::move(out));
    irFunc_ = nullptr;
    return true;
}

void BytecodeCompiler::compileBlock(size_t index)
{
    const ir::BasicBlock &bb = irFunc_->blocks[index];
    blockOffsets_[bb.label] = pc();
    for (const auto &in : bb.instructions)
    {
        if (failed_)
            return;
        compileInstr(in);
    }
    compileTerminator(bb.term, index);
}

void BytecodeCompiler::compileInstr(const ir::Instr &in)
{
    if (in.op == Opcode::Store)
    {
        pushValue(in.operands[0]);
        emitStoreLocal(in.imm);
        return;
    }

    for (const auto &op : in.operands)
        pushValue(op);

    auto count = static_cast<uint32_t>(in.operands.size());
    if (count > kMaxOperand16)
    {
        fail("too many operands for '" + std::string(ir::opcodeName(in.op)) + "'");
        return;
    }

    switch (in.op)
    {
        case Opcode::In:
            emit(encodeOp8(BCOpcode::IN, static_cast<uint8_t>(in.imm)));
            break;
        case Opcode::MakeRecord:
            emit(encodeOp16(BCOpcode::MAKE_RECORD, static_cast<uint16_t>(count)));
            break;
        case Opcode::GetField:
            emit(encodeOp16(BCOpcode::GET_FIELD, static_cast<uint16_t>(in.imm)));
            break;
        case Opcode::MakeVariant:
            emit(encodeOp8_16(BCOpcode::MAKE_VARIANT, count ? 1 : 0,
                              static_cast<uint16_t>(in.imm)));
            break;
        case Opcode::MakeList:
            emit(encodeOp16(BCOpcode::MAKE_LIST, static_cast<uint16_t>(count)));
            break;
        case Opcode::Call:
            emit(encodeOp16(BCOpcode::CALL, static_cast<uint16_t>(in.imm)));
            break;
        case Opcode::CallBuiltin:
            emit(encodeOp16(BCOpcode::CALL_BUILTIN, static_cast<uint16_t>(in.imm)));
            break;
        case Opcode::CallExtern:
        {
            const types::ExternalSignature *sig =
                externals_ ? externals_->findSymbol(in.symbol) : nullptr;
            if (!sig)
            {
                fail("external symbol '" + in.symbol + "' is not registered");
                return;
            }
            uint32_t idx = module_.addExtern(in.symbol, *sig);
            emit(encodeOp16(BCOpcode::CALL_EXTERN, static_cast<uint16_t>(idx)));
            break;
        }
        default:
            emit(encodeOp(toBytecode(in.op)));
            break;
    }

    popStack(static_cast<int32_t>(count));
    pushStack();
    storeResult(*in.result);
}

void BytecodeCompiler::compileTerminator(const ir::Terminator &term, size_t index)
{
    switch (term.kind)
    {
        case ir::TermKind::Br:
            emitGoto(term.labels[0], index);
            break;

        case ir::TermKind::CBr:
        {
            pushValue(term.operands[0]);
            size_t next = index + 1;
            bool trueIsNext = irFunc_->findBlock(term.labels[0]) == next;
            bool falseIsNext = irFunc_->findBlock(term.labels[1]) == next;
            if (trueIsNext)
            {
                emitBranch(BCOpcode::JUMP_IF_FALSE, term.labels[1]);
            }
            else if (falseIsNext)
            {
                emitBranch(BCOpcode::JUMP_IF_TRUE, term.labels[0]);
            }
            else
            {
                emitBranch(BCOpcode::JUMP_IF_FALSE, term.labels[1]);
                emitGoto(term.labels[0], index);
            }
            break;
        }

        case ir::TermKind::Ret:
            pushValue(term.operands[0]);
            emit(encodeOp8(BCOpcode::RETURN, static_cast<uint8_t>(toReturnKind(term.retKind))));
            popStack();
            break;

        case ir::TermKind::Abort:
            pushValue(term.operands[0]);
            emit(encodeOp(BCOpcode::ABORT));
            popStack();
            break;

        case ir::TermKind::IterNext:
        {
            if (term.iter.listSlot + 1 > kMaxOperand16 || term.iter.elemSlot > kMaxOperand16)
            {
                fail("loop slots out of range");
                return;
            }
            pendingBranches_.push_back({pc(), term.labels[1], true});
            emit(encodeOp16(BCOpcode::ITER_NEXT, static_cast<uint16_t>(term.iter.listSlot)));
            emit(encodeIterWord(static_cast<uint16_t>(term.iter.elemSlot), 0));
            emitGoto(term.labels[0], index);
            break;
        }

        case ir::TermKind::None:
            fail("block '" + irFunc_->blocks[index].label + "' has no terminator");
            break;
    }
}

void BytecodeCompiler::emitGoto(const std::string &label, size_t fromIndex)
{
    size_t target = irFunc_->findBlock(label);
    if (target == fromIndex + 1)
        return;
    if (target > fromIndex && target < irFunc_->blocks.size())
    {
        emitBranch(BCOpcode::JUMP, label);
        return;
    }

    // Backward transfers are only legal to a loop header, which is already laid
    // out and holds nothing but ITER_NEXT.
    auto it = blockOffsets_.find(label);
    const ir::BasicBlock *header = target < irFunc_->blocks.size() ? &irFunc_->blocks[target]
                                                                   : nullptr;
    if (it == blockOffsets_.end() || !header || header->term.kind != ir::TermKind::IterNext ||
        !header->instructions.empty())
    {
        fail("backward branch to '" + label + "' does not target a loop header");
        return;
    }
    uint32_t distance = pc() - it->second;
    if (distance > kMaxOperand16)
    {
        fail("function too large: loop body exceeds the jump range");
        return;
    }
    emit(encodeOp16(BCOpcode::LOOP, static_cast<uint16_t>(distance)));
}

void BytecodeCompiler::resolveBranches()
{
    for (const auto &fixup : pendingBranches_)
    {
        auto it = blockOffsets_.find(fixup.targetLabel);
        if (it == blockOffsets_.end())
        {
            fail("branch to unknown block '" + fixup.targetLabel + "'");
            return;
        }
        if (it->second <= fixup.codeOffset)
        {
            fail("conditional branch to '" + fixup.targetLabel + "' is not forward");
            return;
        }
        uint32_t offset = it->second - fixup.codeOffset;
        if (offset > kMaxOperand16)
        {
            fail("function too large: branch to '" + fixup.targetLabel +
                 "' exceeds the jump range");
            return;
        }

        if (fixup.iterExit)
        {
            uint32_t &word = currentFunc_->code[fixup.codeOffset + 1];
            word = encodeIterWord(decodeIterElemSlot(word), static_cast<uint16_t>(offset));
        }
        else
        {
            uint32_t &word = currentFunc_->code[fixup.codeOffset];
            word = encodeOp16(decodeOpcode(word), static_cast<uint16_t>(offset));
        }
    }
}

void BytecodeCompiler::emit(uint32_t word)
{
    currentFunc_->code.push_back(word);
}

void BytecodeCompiler::pushValue(const Operand &op)
{
    switch (op.kind)
    {
        case Operand::Kind::Temp:
            emitLoadLocal(tempSlot(op.id));
            return;
        case Operand::Kind::Slot:
            emitLoadLocal(op.id);
            return;
        case Operand::Kind::Const:
            break;
    }

    const runtime::Value &v = op.value;
    switch (v.kind())
    {
        case runtime::ValueKind::Unit:
            emit(encodeOp(BCOpcode::LOAD_UNIT));
            break;
        case runtime::ValueKind::Bool:
            emit(encodeOp(v.asBool() ? BCOpcode::LOAD_TRUE : BCOpcode::LOAD_FALSE));
            break;
        case runtime::ValueKind::Int:
            if (v.asInt() >= std::numeric_limits<int16_t>::min() &&
                v.asInt() <= std::numeric_limits<int16_t>::max())
            {
                emit(encodeOpI16(BCOpcode::LOAD_I16, static_cast<int16_t>(v.asInt())));
                break;
            }
            [[fallthrough]];
        default:
        {
            uint32_t idx = module_.addConstant(v);
            if (idx > kMaxOperand16)
            {
                fail("constant pool overflow");
                return;
            }
            emit(encodeOp16(BCOpcode::LOAD_CONST, static_cast<uint16_t>(idx)));
            break;
        }
    }
    pushStack();
}

void BytecodeCompiler::storeResult(uint32_t temp)
{
    emitStoreLocal(tempSlot(temp));
}

void BytecodeCompiler::emitLoadLocal(uint32_t slot)
{
    emit(encodeOp16(BCOpcode::LOAD_LOCAL, static_cast<uint16_t>(slot)));
    pushStack();
}

void BytecodeCompiler::emitStoreLocal(uint32_t slot)
{
    emit(encodeOp16(BCOpcode::STORE_LOCAL, static_cast<uint16_t>(slot)));
    popStack();
}

void BytecodeCompiler::emitBranch(BCOpcode op, const std::string &label)
{
    pendingBranches_.push_back({pc(), label, false});
    emit(encodeOp16(op, 0));
    if (op != BCOpcode::JUMP)
        popStack();
}

uint32_t BytecodeCompiler::tempSlot(uint32_t temp) const
{
    return irFunc_->slotCount + temp;
}

void BytecodeCompiler::pushStack(int32_t count)
{
    currentStackDepth_ += count;
    if (currentStackDepth_ > maxStackDepth_)
    {
        maxStackDepth_ = currentStackDepth_;
    }
}

void BytecodeCompiler::popStack(int32_t count)
{
    currentStackDepth_ -= count;
}

void BytecodeCompiler::fail(const std::string &message)
{
    if (failed_)
        return;
    failed_ = true;
    std::string where = irFunc_ ? " in '" + irFunc_->name + "'" : std::string();
    diag_.report(support::makeError(support::DiagKind::InternalError,
                                    "bytecode generation failed" + where + ": " + message,
                                    support::SourceSpan{}));
}

} // namespace sieve::bytecode
