//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Lowerer.cpp
// Purpose: Function setup, block bookkeeping and instruction emission for the
//          IR lowerer.
// Key invariants: current_ names an open, unterminated block or is -1.
// Ownership/Lifetime: fn_ points into the module being built by lower().
// Links: frontends/sieve/Lowerer.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/Lowerer.hpp"

namespace sieve::frontend
{

using ir::Operand;

namespace
{

ir::FunctionKind toIrKind(FunctionKind kind)
{
    switch (kind)
    {
        case FunctionKind::Filter:
            return ir::FunctionKind::Filter;
        case FunctionKind::FilterMap:
            return ir::FunctionKind::FilterMap;
        case FunctionKind::Function:
            break;
    }
    return ir::FunctionKind::Function;
}

} // namespace

ir::Module Lowerer::lower(const Module &module)
{
    ir::Module out;
    for (const auto &decl : module.decls)
    {
        const auto *fn = std::get_if<FunctionDecl>(&decl->node);
        if (!fn)
            continue;
        out.functions.emplace_back();
        fn_ = &out.functions.back();
        lowerFunction(*fn);
    }
    fn_ = nullptr;
    return out;
}

void Lowerer::lowerFunction(const FunctionDecl &decl)
{
    decl_ = &decl;
    current_ = -1;
    labelCounter_ = 0;
    referenced_.clear();

    fn_->name = decl.name;
    fn_->kind = toIrKind(decl.kind);
    for (size_t i = 0; i < decl.params.size(); ++i)
        fn_->params.push_back(ir::Param{decl.params[i].name, decl.signature->params[i]});
    fn_->result = decl.signature->result;
    fn_->namedSlots = decl.localCount;
    fn_->slotCount = decl.localCount;

    referenced_.insert("entry");
    startBlock("entry");
    lowerBlock(decl.body);

    // Only Unit functions can reach the end of their body after checking.
    if (live())
        emitRet(ir::RetKind::Return, Operand::constant(runtime::Value::unit()));
    decl_ = nullptr;
}

std::string Lowerer::newLabel(const std::string &hint)
{
    return hint + "." + std::to_string(labelCounter_++);
}

bool Lowerer::startBlock(const std::string &label)
{
    if (live())
        emitBr(label);
    if (!referenced_.count(label))
    {
        current_ = -1;
        return false;
    }
    ir::BasicBlock bb;
    bb.label = label;
    fn_->blocks.push_back(std::move(bb));
    current_ = static_cast<int>(fn_->blocks.size()) - 1;
    return true;
}

ir::BasicBlock &Lowerer::cur()
{
    return fn_->blocks[static_cast<size_t>(current_)];
}

uint32_t Lowerer::newTemp()
{
    return fn_->tempCount++;
}

uint32_t Lowerer::newHiddenSlot()
{
    return fn_->slotCount++;
}

Operand Lowerer::emit(ir::Opcode op, std::vector<Operand> operands, uint32_t imm,
                      std::string symbol)
{
    ir::Instr in;
    in.op = op;
    in.result = newTemp();
    in.operands = std::move(operands);
    in.imm = imm;
    in.symbol = std::move(symbol);
    uint32_t id = *in.result;
    cur().instructions.push_back(std::move(in));
    return Operand::temp(id);
}

void Lowerer::emitStore(uint32_t slot, Operand value)
{
    ir::Instr in;
    in.op = ir::Opcode::Store;
    in.imm = slot;
    in.operands.push_back(std::move(value));
    cur().instructions.push_back(std::move(in));
}

void Lowerer::terminate(ir::Terminator term)
{
    for (const auto &label : term.labels)
        referenced_.insert(label);
    cur().term = std::move(term);
    current_ = -1;
}

void Lowerer::emitBr(const std::string &target)
{
    ir::Terminator t;
    t.kind = ir::TermKind::Br;
    t.labels = {target};
    terminate(std::move(t));
}

void Lowerer::emitCBr(Operand cond, const std::string &onTrue, const std::string &onFalse)
{
    ir::Terminator t;
    t.kind = ir::TermKind::CBr;
    t.operands = {std::move(cond)};
    t.labels = {onTrue, onFalse};
    terminate(std::move(t));
}

void Lowerer::emitRet(ir::RetKind kind, Operand value)
{
    ir::Terminator t;
    t.kind = ir::TermKind::Ret;
    t.retKind = kind;
    t.operands = {std::move(value)};
    terminate(std::move(t));
}

void Lowerer::emitAbort(Operand message)
{
    ir::Terminator t;
    t.kind = ir::TermKind::Abort;
    t.operands = {std::move(message)};
    terminate(std::move(t));
}

void Lowerer::emitIterNext(uint32_t listSlot, uint32_t elemSlot, const std::string &body,
                           const std::string &exit)
{
    ir::Terminator t;
    t.kind = ir::TermKind::IterNext;
    t.iter.listSlot = listSlot;
    t.iter.elemSlot = elemSlot;
    t.labels = {body, exit};
    terminate(std::move(t));
}

} // namespace sieve::frontend
