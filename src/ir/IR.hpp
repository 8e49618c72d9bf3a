//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/IR.hpp
// Purpose: Block-structured intermediate form produced by lowering and
//          consumed by the bytecode compiler.
// Key invariants: Every block in Function::blocks ends in exactly one
//                 terminator. Blocks appear in layout order: every branch
//                 targets a later block except the back edge from a loop body
//                 to its iter.next header.
// Ownership/Lifetime: Module owns functions, functions own blocks, blocks own
//                     instructions, all by value.
// Links: frontends/sieve/Lowerer.hpp, bytecode/BytecodeCompiler.hpp
//
//===----------------------------------------------------------------------===//
//
// Operands name one of three storage classes:
// - Temp: single-assignment temporary produced by an instruction
// - Slot: frame local (named locals first, hidden slots after)
// - Const: immediate runtime value
//
// Temporaries are numbered per function from zero. The bytecode compiler maps
// them to frame slots placed after every named and hidden slot.

#pragma once

#include "runtime/Value.hpp"
#include "types/Types.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace sieve::ir
{

/// @brief Instruction operand.
struct Operand
{
    enum class Kind
    {
        Temp,
        Slot,
        Const,
    };

    Kind kind = Kind::Const;
    uint32_t id = 0;
    runtime::Value value;

    static Operand temp(uint32_t t);
    static Operand slot(uint32_t s);
    static Operand constant(runtime::Value v);
};

/// @brief Render @p op as "%3", "$1" or a literal.
std::string toString(const Operand &op);

/// @brief Non-terminator instruction opcodes.
enum class Opcode
{
    Store, ///< slot[imm] = operands[0]
    Neg,
    Not,
    Add,
    Sub,
    Mul,
    Div,
    Rem,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    In,             ///< imm selects the membership flavour, see InFlavour.
    MakeRecord,     ///< operands are field values in sorted field order
    GetField,       ///< imm is the field index
    MakeVariant,    ///< imm is the variant index; optional payload operand
    VariantTag,     ///< Int tag of a variant
    VariantPayload, ///< payload of a variant
    MakeList,
    Call,        ///< imm is the callee function index
    CallExtern,  ///< symbol names the external entry
    CallBuiltin, ///< imm is a runtime::BuiltinId
};

/// @brief Encoding of `In` flavours, shared with bytecode.
enum class InFlavour : uint32_t
{
    List = 0,
    AddrInPrefix = 1,
    PrefixInPrefix = 2,
};

/// @brief Mnemonic of @p op, e.g. "add".
const char *opcodeName(Opcode op);

/// @brief One non-terminator instruction.
struct Instr
{
    Opcode op;

    /// Destination temporary; absent for Store.
    std::optional<uint32_t> result;

    std::vector<Operand> operands;

    /// Opcode-specific immediate (slot, field, variant, callee or builtin).
    uint32_t imm = 0;

    /// External symbol for CallExtern.
    std::string symbol;
};

/// @brief Result classification carried by `ret`.
enum class RetKind
{
    Return,
    Accept,
    Reject,
};

/// @brief Block terminators.
enum class TermKind
{
    None,
    Br,       ///< labels[0]
    CBr,      ///< operands[0] ? labels[0] : labels[1]
    Ret,      ///< return operands[0] with retKind
    Abort,    ///< user termination with message operands[0]
    IterNext, ///< loop header, see Terminator::iter
};

/// @brief Slots used by an `iter.next` header.
/// @details The list lives in listSlot and the cursor in listSlot + 1. When an
///          element remains it is stored into elemSlot and control continues
///          at labels[0]; otherwise control leaves through labels[1].
struct IterSlots
{
    uint32_t listSlot = 0;
    uint32_t elemSlot = 0;
};

struct Terminator
{
    TermKind kind = TermKind::None;
    std::vector<Operand> operands;
    std::vector<std::string> labels;
    RetKind retKind = RetKind::Return;
    IterSlots iter;
};

struct BasicBlock
{
    std::string label;
    std::vector<Instr> instructions;
    Terminator term;

    bool terminated() const
    {
        return term.kind != TermKind::None;
    }
};

/// @brief Kind of callable; mirrors the source declaration keyword.
enum class FunctionKind
{
    Function,
    Filter,
    FilterMap,
};

struct Param
{
    std::string name;
    types::TypeRef type;
};

struct Function
{
    std::string name;
    FunctionKind kind = FunctionKind::Function;
    std::vector<Param> params;
    types::TypeRef result;

    /// Named locals, parameters included.
    uint32_t namedSlots = 0;

    /// Named plus hidden slots.
    uint32_t slotCount = 0;

    uint32_t tempCount = 0;

    std::vector<BasicBlock> blocks;

    /// @brief Index of block @p label, or blocks.size() when absent.
    size_t findBlock(const std::string &label) const;
};

struct Module
{
    /// Functions in declaration order; indices match Call immediates.
    std::vector<Function> functions;
};

/// @brief Write a textual listing of @p module.
void print(const Module &module, std::ostream &os);

/// @brief Textual listing of a single function.
std::string toString(const Function &fn);

} // namespace sieve::ir
