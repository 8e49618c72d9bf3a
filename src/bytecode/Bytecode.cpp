//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "bytecode/Bytecode.hpp"

namespace sieve::bytecode
{

const char *opcodeName(BCOpcode op)
{
    switch (op)
    {
        // Stack Operations
        case BCOpcode::NOP:
            return "NOP";
        case BCOpcode::POP:
            return "POP";

        // Local Variable Operations
        case BCOpcode::LOAD_LOCAL:
            return "LOAD_LOCAL";
        case BCOpcode::STORE_LOCAL:
            return "STORE_LOCAL";

        // Constant Loading
        case BCOpcode::LOAD_CONST:
            return "LOAD_CONST";
        case BCOpcode::LOAD_I16:
            return "LOAD_I16";
        case BCOpcode::LOAD_TRUE:
            return "LOAD_TRUE";
        case BCOpcode::LOAD_FALSE:
            return "LOAD_FALSE";
        case BCOpcode::LOAD_UNIT:
            return "LOAD_UNIT";

        // Integer Arithmetic and Logic
        case BCOpcode::ADD:
            return "ADD";
        case BCOpcode::SUB:
            return "SUB";
        case BCOpcode::MUL:
            return "MUL";
        case BCOpcode::DIV:
            return "DIV";
        case BCOpcode::REM:
            return "REM";
        case BCOpcode::NEG:
            return "NEG";
        case BCOpcode::NOT:
            return "NOT";

        // Comparisons and Membership
        case BCOpcode::EQ:
            return "EQ";
        case BCOpcode::NE:
            return "NE";
        case BCOpcode::LT:
            return "LT";
        case BCOpcode::LE:
            return "LE";
        case BCOpcode::GT:
            return "GT";
        case BCOpcode::GE:
            return "GE";
        case BCOpcode::IN:
            return "IN";

        // Aggregates
        case BCOpcode::MAKE_RECORD:
            return "MAKE_RECORD";
        case BCOpcode::GET_FIELD:
            return "GET_FIELD";
        case BCOpcode::MAKE_VARIANT:
            return "MAKE_VARIANT";
        case BCOpcode::VARIANT_TAG:
            return "VARIANT_TAG";
        case BCOpcode::VARIANT_PAYLOAD:
            return "VARIANT_PAYLOAD";
        case BCOpcode::MAKE_LIST:
            return "MAKE_LIST";

        // Calls
        case BCOpcode::CALL:
            return "CALL";
        case BCOpcode::CALL_EXTERN:
            return "CALL_EXTERN";
        case BCOpcode::CALL_BUILTIN:
            return "CALL_BUILTIN";

        // Control Flow
        case BCOpcode::JUMP:
            return "JUMP";
        case BCOpcode::JUMP_IF_FALSE:
            return "JUMP_IF_FALSE";
        case BCOpcode::JUMP_IF_TRUE:
            return "JUMP_IF_TRUE";
        case BCOpcode::ITER_NEXT:
            return "ITER_NEXT";
        case BCOpcode::LOOP:
            return "LOOP";
        case BCOpcode::RETURN:
            return "RETURN";
        case BCOpcode::ABORT:
            return "ABORT";
    }
    return "UNKNOWN";
}

} // namespace sieve::bytecode
