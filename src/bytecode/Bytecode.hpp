//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bytecode/Bytecode.hpp
// Purpose: Bytecode instruction format and opcode definitions.
// Key invariants: Instructions are 32-bit words; only ITER_NEXT occupies a
//                 second word. Forward jumps carry unsigned offsets measured
//                 from the jump's own pc; LOOP is the only backward transfer.
// Ownership/Lifetime: Header-only helpers; opcodeName() is defined in
//                     Bytecode.cpp.
// Links: bytecode/BytecodeCompiler.hpp, bytecode/StackVerifier.hpp,
//        vm/BytecodeVM.hpp
//
//===----------------------------------------------------------------------===//
//
// Instruction Encoding:
// - [opcode:8][arg0:8][arg1:8][arg2:8]
// - 16-bit operands occupy bits 8-23
// - MAKE_VARIANT packs [hasPayload:8][tag:16]
// - ITER_NEXT is followed by a raw word [exitOffset:16][elemSlot:16]
//
// Stack Model:
// - Every IR value lives in a frame local; the operand stack only holds the
//   inputs of the instruction being evaluated
// - Parameters occupy the first locals
// - Stack depth is zero at every block boundary

#pragma once

#include <cstdint>

namespace sieve::bytecode
{

/// @brief Magic number of serialized programs: "SIEV".
constexpr uint32_t kBytecodeModuleMagic = 0x56454953;

/// @brief Current bytecode format version.
constexpr uint32_t kBytecodeVersion = 1;

/// @brief Largest local index, pool index or jump distance an operand holds.
constexpr uint32_t kMaxOperand16 = 0xFFFF;

/// @brief Bytecode opcodes.
/// @details Encoding categories:
///          - 0x00-0x0F  Stack operations
///          - 0x10-0x1F  Local variable operations
///          - 0x20-0x2F  Constant loading
///          - 0x30-0x3F  Integer arithmetic and logic
///          - 0x40-0x4F  Comparisons and membership
///          - 0x50-0x5F  Aggregates
///          - 0x60-0x6F  Calls
///          - 0x70-0x7F  Control flow
enum class BCOpcode : uint8_t
{
    // Stack Operations (0x00-0x0F)
    NOP = 0x00, ///< No operation.
    POP = 0x01, ///< Discard TOS.

    // Local Variable Operations (0x10-0x1F)
    LOAD_LOCAL = 0x10,  ///< Push locals[arg16].
    STORE_LOCAL = 0x11, ///< Pop TOS into locals[arg16].

    // Constant Loading (0x20-0x2F)
    LOAD_CONST = 0x20, ///< Push constant pool entry [arg16].
    LOAD_I16 = 0x21,   ///< Push a signed 16-bit Int immediate.
    LOAD_TRUE = 0x22,  ///< Push Bool true.
    LOAD_FALSE = 0x23, ///< Push Bool false.
    LOAD_UNIT = 0x24,  ///< Push Unit.

    // Integer Arithmetic and Logic (0x30-0x3F)
    ADD = 0x30, ///< Wrapping a + b.
    SUB = 0x31, ///< Wrapping a - b.
    MUL = 0x32, ///< Wrapping a * b.
    DIV = 0x33, ///< a / b; zero when b is zero.
    REM = 0x34, ///< a % b; zero when b is zero.
    NEG = 0x35, ///< Wrapping -a.
    NOT = 0x36, ///< Boolean negation.

    // Comparisons and Membership (0x40-0x4F)
    EQ = 0x40, ///< Structural equality.
    NE = 0x41, ///< Structural inequality.
    LT = 0x42, ///< Ordered a < b (Int, Asn).
    LE = 0x43, ///< Ordered a <= b.
    GT = 0x44, ///< Ordered a > b.
    GE = 0x45, ///< Ordered a >= b.
    IN = 0x46, ///< Membership; arg8 selects list, address or prefix flavour.

    // Aggregates (0x50-0x5F)
    MAKE_RECORD = 0x50,     ///< Pop arg16 field values, push a record.
    GET_FIELD = 0x51,       ///< Replace a record with its field [arg16].
    MAKE_VARIANT = 0x52,    ///< Push variant [tag16], popping a payload when arg8 is set.
    VARIANT_TAG = 0x53,     ///< Replace a variant with its Int tag.
    VARIANT_PAYLOAD = 0x54, ///< Replace a variant with its payload.
    MAKE_LIST = 0x55,       ///< Pop arg16 elements, push a list.

    // Calls (0x60-0x6F)
    CALL = 0x60,         ///< Call function [arg16] with its parameters on the stack.
    CALL_EXTERN = 0x61,  ///< Call external-call table entry [arg16].
    CALL_BUILTIN = 0x62, ///< Call built-in method [arg16], receiver first.

    // Control Flow (0x70-0x7F)
    JUMP = 0x70,          ///< pc += arg16.
    JUMP_IF_FALSE = 0x71, ///< Pop Bool; pc += arg16 when false.
    JUMP_IF_TRUE = 0x72,  ///< Pop Bool; pc += arg16 when true.
    ITER_NEXT = 0x73,     ///< Advance the list in locals[arg16]; see file header.
    LOOP = 0x74,          ///< pc -= arg16; lands on an ITER_NEXT.
    RETURN = 0x75,        ///< Pop the result; arg8 is the termination kind.
    ABORT = 0x76,         ///< Pop a String message and terminate with a fault.
};

/// @brief Termination kinds carried by RETURN.
enum class ReturnKind : uint8_t
{
    Return = 0,
    Accept = 1,
    Reject = 2,
};

/// @brief Get the mnemonic name of an opcode.
/// @param op The opcode.
/// @return A static string such as "LOAD_LOCAL", or "UNKNOWN".
const char *opcodeName(BCOpcode op);

/// @brief Number of 32-bit words an instruction with opcode @p op occupies.
inline constexpr uint32_t instrWords(BCOpcode op)
{
    return op == BCOpcode::ITER_NEXT ? 2 : 1;
}

/// @brief Check whether an opcode ends a basic block.
inline constexpr bool isTerminator(BCOpcode op)
{
    return op == BCOpcode::JUMP || op == BCOpcode::JUMP_IF_FALSE ||
           op == BCOpcode::JUMP_IF_TRUE || op == BCOpcode::ITER_NEXT || op == BCOpcode::LOOP ||
           op == BCOpcode::RETURN || op == BCOpcode::ABORT;
}

/// @brief Check whether control can continue with the next instruction.
inline constexpr bool fallsThrough(BCOpcode op)
{
    return op != BCOpcode::JUMP && op != BCOpcode::LOOP && op != BCOpcode::RETURN &&
           op != BCOpcode::ABORT;
}

//==============================================================================
// Instruction Encoding Helpers
//==============================================================================

/// @brief Encode an instruction with no arguments: [opcode:8][0:24].
inline constexpr uint32_t encodeOp(BCOpcode op)
{
    return static_cast<uint32_t>(op);
}

/// @brief Encode an instruction with one unsigned 8-bit argument.
inline constexpr uint32_t encodeOp8(BCOpcode op, uint8_t arg0)
{
    return static_cast<uint32_t>(op) | (static_cast<uint32_t>(arg0) << 8);
}

/// @brief Encode an instruction with one unsigned 16-bit argument in bits 8-23.
inline constexpr uint32_t encodeOp16(BCOpcode op, uint16_t arg0)
{
    return static_cast<uint32_t>(op) | (static_cast<uint32_t>(arg0) << 8);
}

/// @brief Encode an instruction with one signed 16-bit argument in bits 8-23.
inline constexpr uint32_t encodeOpI16(BCOpcode op, int16_t arg0)
{
    return static_cast<uint32_t>(op) | (static_cast<uint32_t>(static_cast<uint16_t>(arg0)) << 8);
}

/// @brief Encode [opcode:8][arg0:8][arg1:16].
inline constexpr uint32_t encodeOp8_16(BCOpcode op, uint8_t arg0, uint16_t arg1)
{
    return static_cast<uint32_t>(op) | (static_cast<uint32_t>(arg0) << 8) |
           (static_cast<uint32_t>(arg1) << 16);
}

/// @brief Encode the trailing word of ITER_NEXT.
inline constexpr uint32_t encodeIterWord(uint16_t elemSlot, uint16_t exitOffset)
{
    return static_cast<uint32_t>(elemSlot) | (static_cast<uint32_t>(exitOffset) << 16);
}

//==============================================================================
// Instruction Decoding Helpers
//==============================================================================

inline constexpr BCOpcode decodeOpcode(uint32_t instr)
{
    return static_cast<BCOpcode>(instr & 0xFF);
}

inline constexpr uint8_t decodeArg8_0(uint32_t instr)
{
    return static_cast<uint8_t>((instr >> 8) & 0xFF);
}

inline constexpr uint16_t decodeArg16(uint32_t instr)
{
    return static_cast<uint16_t>((instr >> 8) & 0xFFFF);
}

inline constexpr int16_t decodeArgI16(uint32_t instr)
{
    return static_cast<int16_t>((instr >> 8) & 0xFFFF);
}

/// @brief Second 16-bit argument in bits 16-31.
inline constexpr uint16_t decodeArg16_1(uint32_t instr)
{
    return static_cast<uint16_t>((instr >> 16) & 0xFFFF);
}

inline constexpr uint16_t decodeIterElemSlot(uint32_t word)
{
    return static_cast<uint16_t>(word & 0xFFFF);
}

inline constexpr uint16_t decodeIterExitOffset(uint32_t word)
{
    return static_cast<uint16_t>((word >> 16) & 0xFFFF);
}

} // namespace sieve::bytecode
