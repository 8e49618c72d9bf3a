//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/IR.cpp
// Purpose: Operand factories, opcode names and the textual IR printer used by
//          --dump-ir.
// Key invariants: The printed form is stable; tests match against it.
// Ownership/Lifetime: Printing borrows the module.
// Links: ir/IR.hpp
//
//===----------------------------------------------------------------------===//

#include "ir/IR.hpp"
#include "runtime/Builtins.hpp"

#include <sstream>

namespace sieve::ir
{

Operand Operand::temp(uint32_t t)
{
    Operand op;
    op.kind = Kind::Temp;
    op.id = t;
    return op;
}

Operand Operand::slot(uint32_t s)
{
    Operand op;
    op.kind = Kind::Slot;
    op.id = s;
    return op;
}

Operand Operand::constant(runtime::Value v)
{
    Operand op;
    op.kind = Kind::Const;
    op.value = std::move(v);
    return op;
}

std::string toString(const Operand &op)
{
    switch (op.kind)
    {
        case Operand::Kind::Temp:
            return "%" + std::to_string(op.id);
        case Operand::Kind::Slot:
            return "$" + std::to_string(op.id);
        case Operand::Kind::Const:
            if (op.value.kind() == runtime::ValueKind::String)
                return "\"" + op.value.asString() + "\"";
            return op.value.toString();
    }
    return "?";
}

const char *opcodeName(Opcode op)
{
    switch (op)
    {
        case Opcode::Store:
            return "store";
        case Opcode::Neg:
            return "neg";
        case Opcode::Not:
            return "not";
        case Opcode::Add:
            return "add";
        case Opcode::Sub:
            return "sub";
        case Opcode::Mul:
            return "mul";
        case Opcode::Div:
            return "div";
        case Opcode::Rem:
            return "rem";
        case Opcode::Eq:
            return "eq";
        case Opcode::Ne:
            return "ne";
        case Opcode::Lt:
            return "lt";
        case Opcode::Le:
            return "le";
        case Opcode::Gt:
            return "gt";
        case Opcode::Ge:
            return "ge";
        case Opcode::In:
            return "in";
        case Opcode::MakeRecord:
            return "record";
        case Opcode::GetField:
            return "field";
        case Opcode::MakeVariant:
            return "variant";
        case Opcode::VariantTag:
            return "tag";
        case Opcode::VariantPayload:
            return "payload";
        case Opcode::MakeList:
            return "list";
        case Opcode::Call:
            return "call";
        case Opcode::CallExtern:
            return "call.extern";
        case Opcode::CallBuiltin:
            return "call.builtin";
    }
    return "<unknown>";
}

size_t Function::findBlock(const std::string &label) const
{
    for (size_t i = 0; i < blocks.size(); ++i)
    {
        if (blocks[i].label == label)
            return i;
    }
    return blocks.size();
}

namespace
{

const char *kindSuffix(FunctionKind kind)
{
    switch (kind)
    {
        case FunctionKind::Filter:
            return " [filter]";
        case FunctionKind::FilterMap:
            return " [filter-map]";
        case FunctionKind::Function:
            break;
    }
    return "";
}

const char *retKindName(RetKind kind)
{
    switch (kind)
    {
        case RetKind::Accept:
            return "accept";
        case RetKind::Reject:
            return "reject";
        case RetKind::Return:
            break;
    }
    return "return";
}

void printInstr(const Instr &in, std::ostream &os)
{
    os << "  ";
    if (in.result)
        os << "%" << *in.result << " = ";
    os << opcodeName(in.op);
    switch (in.op)
    {
        case Opcode::Store:
            os << " $" << in.imm << ",";
            break;
        case Opcode::GetField:
        case Opcode::MakeVariant:
        case Opcode::In:
            os << " #" << in.imm;
            if (!in.operands.empty())
                os << ",";
            break;
        case Opcode::Call:
            os << " @" << in.imm;
            break;
        case Opcode::CallExtern:
            os << " " << in.symbol;
            break;
        case Opcode::CallBuiltin:
            os << " " << runtime::builtinName(static_cast<runtime::BuiltinId>(in.imm));
            break;
        default:
            break;
    }
    for (size_t i = 0; i < in.operands.size(); ++i)
    {
        bool needsComma = i > 0;
        os << (needsComma ? ", " : " ") << toString(in.operands[i]);
    }
    os << "\n";
}

void printTerminator(const Terminator &t, std::ostream &os)
{
    os << "  ";
    switch (t.kind)
    {
        case TermKind::Br:
            os << "br " << t.labels[0];
            break;
        case TermKind::CBr:
            os << "cbr " << toString(t.operands[0]) << ", " << t.labels[0] << ", " << t.labels[1];
            break;
        case TermKind::Ret:
            os << "ret " << retKindName(t.retKind) << " " << toString(t.operands[0]);
            break;
        case TermKind::Abort:
            os << "abort " << toString(t.operands[0]);
            break;
        case TermKind::IterNext:
            os << "iter.next $" << t.iter.listSlot << " -> $" << t.iter.elemSlot << ", "
               << t.labels[0] << ", " << t.labels[1];
            break;
        case TermKind::None:
            os << "<unterminated>";
            break;
    }
    os << "\n";
}

void printFunction(const Function &fn, std::ostream &os)
{
    os << "func @" << fn.name << "(";
    for (size_t i = 0; i < fn.params.size(); ++i)
        os << (i ? ", " : "") << fn.params[i].name << ": " << types::typeName(fn.params[i].type);
    os << ") -> " << types::typeName(fn.result) << kindSuffix(fn.kind) << "\n";
    for (const auto &bb : fn.blocks)
    {
        os << bb.label << ":\n";
        for (const auto &in : bb.instructions)
            printInstr(in, os);
        printTerminator(bb.term, os);
    }
}

} // namespace

void print(const Module &module, std::ostream &os)
{
    for (size_t i = 0; i < module.functions.size(); ++i)
    {
        if (i)
            os << "\n";
        printFunction(module.functions[i], os);
    }
}

std::string toString(const Function &fn)
{
    std::ostringstream os;
    printFunction(fn, os);
    return os.str();
}

} // namespace sieve::ir
