//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Lowerer_Expr.cpp
// Purpose: Expression lowering into temporaries.
// Key invariants: Operands are evaluated left to right; record literal fields
//                 are evaluated in source order and passed in field order.
// Ownership/Lifetime: See Lowerer.hpp.
// Links: frontends/sieve/Lowerer.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/Lowerer.hpp"

namespace sieve::frontend
{

using ir::Opcode;
using ir::Operand;

namespace
{

Opcode binaryOpcode(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Mul:
            return Opcode::Mul;
        case BinaryOp::Div:
            return Opcode::Div;
        case BinaryOp::Rem:
            return Opcode::Rem;
        case BinaryOp::Add:
            return Opcode::Add;
        case BinaryOp::Sub:
            return Opcode::Sub;
        case BinaryOp::Eq:
            return Opcode::Eq;
        case BinaryOp::Ne:
            return Opcode::Ne;
        case BinaryOp::Lt:
            return Opcode::Lt;
        case BinaryOp::Le:
            return Opcode::Le;
        case BinaryOp::Gt:
            return Opcode::Gt;
        case BinaryOp::Ge:
            return Opcode::Ge;
        default:
            break;
    }
    return Opcode::In;
}

ir::InFlavour inFlavour(InKind kind)
{
    switch (kind)
    {
        case InKind::AddrInPrefix:
            return ir::InFlavour::AddrInPrefix;
        case InKind::PrefixInPrefix:
            return ir::InFlavour::PrefixInPrefix;
        default:
            break;
    }
    return ir::InFlavour::List;
}

} // namespace

Operand Lowerer::lowerExpr(const Expr &expr)
{
    return std::visit(
        Overload{
            [&](const LiteralExpr &e) { return Operand::constant(e.value); },
            [&](const NameExpr &e) { return Operand::slot(e.local); },
            [&](const UnaryExpr &e) {
                Operand value = lowerExpr(*e.operand);
                return emit(e.op == UnaryOp::Neg ? Opcode::Neg : Opcode::Not, {value});
            },
            [&](const BinaryExpr &e) { return lowerBinary(e); },
            [&](const FieldExpr &e) {
                Operand base = lowerExpr(*e.base);
                if (e.target.kind == CallKind::External)
                    return emit(Opcode::CallExtern, {base}, 0, e.target.symbol);
                return emit(Opcode::GetField, {base}, e.target.index);
            },
            [&](const MethodCallExpr &e) {
                std::vector<Operand> args = lowerArgs(e.args, e.receiver.get());
                if (e.target.kind == CallKind::External)
                    return emit(Opcode::CallExtern, std::move(args), 0, e.target.symbol);
                return emit(Opcode::CallBuiltin, std::move(args), e.target.index);
            },
            [&](const CallExpr &e) {
                std::vector<Operand> args = lowerArgs(e.args);
                if (e.target.kind == CallKind::External)
                    return emit(Opcode::CallExtern, std::move(args), 0, e.target.symbol);
                return emit(Opcode::Call, std::move(args), e.target.index);
            },
            [&](const RecordExpr &e) { return lowerRecord(e, expr.type); },
            [&](const EnumExpr &e) {
                std::vector<Operand> payload;
                if (e.payload)
                    payload.push_back(lowerExpr(*e.payload));
                return emit(Opcode::MakeVariant, std::move(payload), e.variantIndex);
            },
            [&](const ListExpr &e) { return emit(Opcode::MakeList, lowerArgs(e.elements)); },
            [&](const ErrorExpr &) { return Operand::constant(runtime::Value::unit()); },
        },
        expr.node);
}

Operand Lowerer::lowerBinary(const BinaryExpr &expr)
{
    if (expr.op == BinaryOp::And || expr.op == BinaryOp::Or)
        return lowerShortCircuit(expr);

    Operand lhs = lowerExpr(*expr.lhs);
    Operand rhs = lowerExpr(*expr.rhs);
    if (expr.op == BinaryOp::In || expr.op == BinaryOp::NotIn)
    {
        Operand test = emit(Opcode::In, {lhs, rhs}, static_cast<uint32_t>(inFlavour(expr.inKind)));
        return expr.op == BinaryOp::In ? test : emit(Opcode::Not, {test});
    }
    return emit(binaryOpcode(expr.op), {lhs, rhs});
}

/// `a && b` stores a into the join slot and only evaluates b when a is true;
/// `a || b` only when a is false. The join slot is the expression's value.
Operand Lowerer::lowerShortCircuit(const BinaryExpr &expr)
{
    bool isAnd = expr.op == BinaryOp::And;
    uint32_t join = newHiddenSlot();
    Operand lhs = lowerExpr(*expr.lhs);
    emitStore(join, lhs);

    std::string rhsLabel = newLabel(isAnd ? "and.rhs" : "or.rhs");
    std::string endLabel = newLabel(isAnd ? "and.end" : "or.end");
    if (isAnd)
        emitCBr(lhs, rhsLabel, endLabel);
    else
        emitCBr(lhs, endLabel, rhsLabel);

    startBlock(rhsLabel);
    emitStore(join, lowerExpr(*expr.rhs));
    emitBr(endLabel);

    startBlock(endLabel);
    return Operand::slot(join);
}

Operand Lowerer::lowerRecord(const RecordExpr &expr, const types::TypeRef &type)
{
    std::vector<Operand> bySource;
    bySource.reserve(expr.fields.size());
    for (const auto &init : expr.fields)
        bySource.push_back(lowerExpr(*init.value));

    std::vector<Operand> byField;
    byField.reserve(type->fields.size());
    for (const auto &field : type->fields)
    {
        for (size_t i = 0; i < expr.fields.size(); ++i)
        {
            if (expr.fields[i].name == field.name)
            {
                byField.push_back(bySource[i]);
                break;
            }
        }
    }
    return emit(Opcode::MakeRecord, std::move(byField));
}

std::vector<Operand> Lowerer::lowerArgs(const std::vector<ExprPtr> &args, const Expr *receiver)
{
    std::vector<Operand> out;
    out.reserve(args.size() + (receiver ? 1 : 0));
    if (receiver)
        out.push_back(lowerExpr(*receiver));
    for (const auto &arg : args)
        out.push_back(lowerExpr(*arg));
    return out;
}

} // namespace sieve::frontend
