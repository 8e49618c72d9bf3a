//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bytecode/Disassembler.cpp
// Purpose: Bytecode listings for --dump-bytecode and the VM trace.
// Key invariants: None beyond determinism.
// Ownership/Lifetime: Borrows the module.
// Links: bytecode/Disassembler.hpp
//
//===----------------------------------------------------------------------===//

#include "bytecode/Disassembler.hpp"
#include "runtime/Builtins.hpp"

#include <iomanip>
#include <sstream>

namespace sieve::bytecode
{

namespace
{

std::string pcLabel(uint32_t pc)
{
    std::ostringstream os;
    os << std::setw(4) << std::setfill('0') << pc;
    return os.str();
}

const char *returnKindName(uint8_t kind)
{
    switch (static_cast<ReturnKind>(kind))
    {
        case ReturnKind::Accept:
            return "accept";
        case ReturnKind::Reject:
            return "reject";
        case ReturnKind::Return:
            return "return";
    }
    return "?";
}

const char *inFlavourName(uint8_t flavour)
{
    switch (flavour)
    {
        case 0:
            return "list";
        case 1:
            return "addr-in-prefix";
        case 2:
            return "prefix-in-prefix";
        default:
            return "?";
    }
}

const char *functionKindName(ir::FunctionKind kind)
{
    switch (kind)
    {
        case ir::FunctionKind::Filter:
            return "filter";
        case ir::FunctionKind::FilterMap:
            return "filter-map";
        case ir::FunctionKind::Function:
            break;
    }
    return "function";
}

} // namespace

std::string disassembleInstr(const BytecodeFunction &fn, uint32_t pc, const BytecodeModule &module)
{
    uint32_t word = fn.code[pc];
    BCOpcode op = decodeOpcode(word);
    std::ostringstream os;
    os << opcodeName(op);

    switch (op)
    {
        case BCOpcode::LOAD_LOCAL:
        case BCOpcode::STORE_LOCAL:
        case BCOpcode::MAKE_RECORD:
        case BCOpcode::GET_FIELD:
        case BCOpcode::MAKE_LIST:
            os << " " << decodeArg16(word);
            break;
        case BCOpcode::LOAD_I16:
            os << " " << decodeArgI16(word);
            break;
        case BCOpcode::LOAD_CONST:
        {
            uint16_t idx = decodeArg16(word);
            os << " #" << idx;
            if (idx < module.constants.size())
                os << " ; " << module.constants[idx].toString();
            break;
        }
        case BCOpcode::IN:
            os << " " << inFlavourName(decodeArg8_0(word));
            break;
        case BCOpcode::MAKE_VARIANT:
            os << " " << decodeArg16_1(word) << (decodeArg8_0(word) ? " +payload" : "");
            break;
        case BCOpcode::CALL:
        {
            uint16_t idx = decodeArg16(word);
            os << " " << idx;
            if (idx < module.functions.size())
                os << " ; " << module.functions[idx].name;
            break;
        }
        case BCOpcode::CALL_EXTERN:
        {
            uint16_t idx = decodeArg16(word);
            os << " " << idx;
            if (idx < module.externs.size())
                os << " ; " << module.externs[idx].symbol;
            break;
        }
        case BCOpcode::CALL_BUILTIN:
            os << " " << decodeArg16(word) << " ; "
               << runtime::builtinName(static_cast<runtime::BuiltinId>(decodeArg16(word)));
            break;
        case BCOpcode::JUMP:
        case BCOpcode::JUMP_IF_FALSE:
        case BCOpcode::JUMP_IF_TRUE:
            os << " +" << decodeArg16(word) << " -> " << pcLabel(pc + decodeArg16(word));
            break;
        case BCOpcode::LOOP:
            os << " -" << decodeArg16(word) << " -> " << pcLabel(pc - decodeArg16(word));
            break;
        case BCOpcode::ITER_NEXT:
            if (pc + 1 < fn.code.size())
            {
                uint32_t extra = fn.code[pc + 1];
                os << " " << decodeArg16(word) << " -> " << decodeIterElemSlot(extra)
                   << ", exit " << pcLabel(pc + decodeIterExitOffset(extra));
            }
            break;
        case BCOpcode::RETURN:
            os << " " << returnKindName(decodeArg8_0(word));
            break;
        default:
            break;
    }
    return os.str();
}

std::string disassemble(const BytecodeFunction &fn, const BytecodeModule &module)
{
    std::ostringstream os;
    os << functionKindName(fn.kind) << " " << fn.name << " (params=" << fn.numParams
       << ", locals=" << fn.numLocals << ", maxStack=" << fn.maxStack << ")\n";
    for (uint32_t pc = 0; pc < fn.code.size();)
    {
        os << "  " << pcLabel(pc) << "  " << disassembleInstr(fn, pc, module) << "\n";
        pc += instrWords(decodeOpcode(fn.code[pc]));
    }
    return os.str();
}

void disassemble(const BytecodeModule &module, std::ostream &os)
{
    for (const auto &fn : module.functions)
        os << disassemble(fn, module);
    if (!module.constants.empty())
    {
        os << "constants:\n";
        for (size_t i = 0; i < module.constants.size(); ++i)
            os << "  #" << i << " " << module.constants[i].toString() << "\n";
    }
    if (!module.externs.empty())
    {
        os << "externs:\n";
        for (size_t i = 0; i < module.externs.size(); ++i)
            os << "  " << i << " " << module.externs[i].symbol << " "
               << module.externs[i].signature.toString() << "\n";
    }
}

} // namespace sieve::bytecode
