//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Lowerer_Stmt.cpp
// Purpose: Statement lowering: locals, conditionals, match dispatch, loops and
//          terminal actions.
// Key invariants: A loop header block holds nothing but its iter.next
//                 terminator, so the loop back edge always lands on it.
// Ownership/Lifetime: See Lowerer.hpp.
// Links: frontends/sieve/Lowerer.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/Lowerer.hpp"

namespace sieve::frontend
{

using ir::Opcode;
using ir::Operand;

void Lowerer::lowerBlock(const Block &block)
{
    for (const auto &stmt : block.stmts)
    {
        if (!live())
            break;
        lowerStmt(*stmt);
    }
}

void Lowerer::lowerStmt(const Stmt &stmt)
{
    std::visit(Overload{
                   [&](const LetStmt &s) { emitStore(s.local, lowerExpr(*s.init)); },
                   [&](const AssignStmt &s) { emitStore(s.local, lowerExpr(*s.value)); },
                   [&](const ExprStmt &s) {
                       Operand value = lowerExpr(*s.expr);
                       if (s.implicitReturn)
                           emitRet(ir::RetKind::Return, std::move(value));
                   },
                   [&](const IfStmt &s) { lowerIf(s); },
                   [&](const MatchStmt &s) { lowerMatch(s); },
                   [&](const ForStmt &s) { lowerFor(s); },
                   [&](const ActionStmt &s) { lowerAction(s); },
                   [&](const BlockStmt &s) { lowerBlock(s.block); },
               },
               stmt.node);
}

void Lowerer::lowerIf(const IfStmt &stmt)
{
    Operand cond = lowerExpr(*stmt.cond);
    std::string thenLabel = newLabel("if.then");
    std::string endLabel = newLabel("if.end");
    std::string elseLabel = stmt.elseBlock ? newLabel("if.else") : endLabel;

    emitCBr(std::move(cond), thenLabel, elseLabel);

    startBlock(thenLabel);
    lowerBlock(stmt.thenBlock);
    if (live())
        emitBr(endLabel);

    if (stmt.elseBlock)
    {
        startBlock(elseLabel);
        lowerBlock(*stmt.elseBlock);
        if (live())
            emitBr(endLabel);
    }

    startBlock(endLabel);
}

/// Arms are tried in source order. Each arm compares the variant tag, binds
/// the payload and evaluates its guard; a failed test falls to the next arm.
/// An unguarded wildcard, or an unguarded final arm of a checked (and so
/// exhaustive) match, needs no tag test. Whatever still reaches the end of the
/// chain aborts.
void Lowerer::lowerMatch(const MatchStmt &stmt)
{
    Operand scrutinee = lowerExpr(*stmt.scrutinee);
    Operand tag = emit(Opcode::VariantTag, {scrutinee});
    std::string endLabel = newLabel("match.end");

    for (size_t i = 0; i < stmt.arms.size(); ++i)
    {
        if (!live())
            break;
        const MatchArm &arm = stmt.arms[i];
        bool last = i + 1 == stmt.arms.size();
        std::string nextLabel = newLabel("match.next");

        if (!arm.isWildcard() && !(last && !arm.guard))
        {
            Operand hit = emit(Opcode::Eq,
                               {tag, Operand::constant(runtime::Value::integer(arm.variantIndex))});
            std::string armLabel = newLabel("match.arm");
            emitCBr(std::move(hit), armLabel, nextLabel);
            startBlock(armLabel);
        }

        if (arm.bindingLocal != kNoLocal)
            emitStore(arm.bindingLocal, emit(Opcode::VariantPayload, {scrutinee}));

        if (arm.guard)
        {
            Operand pass = lowerExpr(*arm.guard);
            std::string bodyLabel = newLabel("match.body");
            emitCBr(std::move(pass), bodyLabel, nextLabel);
            startBlock(bodyLabel);
        }

        lowerBlock(arm.body);
        if (live())
            emitBr(endLabel);

        if (arm.isWildcard() && !arm.guard)
            break;
        startBlock(nextLabel);
    }

    if (live())
        emitAbort(Operand::constant(runtime::Value::string("no match arm applied")));

    startBlock(endLabel);
}

void Lowerer::lowerFor(const ForStmt &stmt)
{
    Operand list = lowerExpr(*stmt.iterable);
    uint32_t listSlot = newHiddenSlot();
    uint32_t cursorSlot = newHiddenSlot();
    emitStore(listSlot, std::move(list));
    emitStore(cursorSlot, Operand::constant(runtime::Value::integer(0)));

    std::string headLabel = newLabel("for.head");
    std::string bodyLabel = newLabel("for.body");
    std::string exitLabel = newLabel("for.exit");

    emitBr(headLabel);
    startBlock(headLabel);
    emitIterNext(listSlot, stmt.local, bodyLabel, exitLabel);

    startBlock(bodyLabel);
    lowerBlock(stmt.body);
    if (live())
        emitBr(headLabel);

    startBlock(exitLabel);
}

void Lowerer::lowerAction(const ActionStmt &stmt)
{
    Operand unit = Operand::constant(runtime::Value::unit());
    switch (stmt.kind)
    {
        case ActionKind::Accept:
            emitRet(ir::RetKind::Accept, stmt.value ? lowerExpr(*stmt.value) : unit);
            break;
        case ActionKind::Reject:
            emitRet(ir::RetKind::Reject, unit);
            break;
        case ActionKind::Return:
            emitRet(ir::RetKind::Return, stmt.value ? lowerExpr(*stmt.value) : unit);
            break;
        case ActionKind::Abort:
            emitAbort(stmt.value ? lowerExpr(*stmt.value)
                                 : Operand::constant(runtime::Value::string("abort")));
            break;
    }
}

} // namespace sieve::frontend
