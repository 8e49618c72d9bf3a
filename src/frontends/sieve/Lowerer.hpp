//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Lowerer.hpp
// Purpose: Lowers a checked Sieve AST into the block-structured IR.
// Key invariants: Only called on modules that checked without errors.
//                 Blocks are laid out in creation-of-use order so every branch
//                 is forward except the loop back edge.
// Ownership/Lifetime: The Lowerer borrows the AST for the duration of lower()
//                     and returns an IR module by value.
// Links: ir/IR.hpp, frontends/sieve/Sema.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/sieve/AST.hpp"
#include "ir/IR.hpp"

#include <set>
#include <string>
#include <unordered_map>

namespace sieve::frontend
{

/// @brief Translates checked function declarations into IR functions.
/// @details Frame layout per function:
///          - slots [0, localCount): named locals numbered by the checker,
///            parameters first
///          - slots [localCount, slotCount): hidden slots for short-circuit
///            joins, match scrutinees and loop state
///          Temporaries are numbered separately and placed after every slot by
///          the bytecode compiler.
///
///          A block is only appended to the layout once something branches to
///          it or control falls into it. Statements that follow a terminator
///          in the same block are never lowered.
class Lowerer
{
  public:
    /// @brief Lower every callable of @p module in declaration order.
    ir::Module lower(const Module &module);

  private:
    /// @name Function state
    /// @{
    void lowerFunction(const FunctionDecl &decl);
    std::string newLabel(const std::string &hint);
    /// @brief Append block @p label when reachable and make it current.
    /// @return False when nothing reaches the block.
    bool startBlock(const std::string &label);
    bool live() const
    {
        return current_ >= 0;
    }
    ir::BasicBlock &cur();
    uint32_t newTemp();
    uint32_t newHiddenSlot();
    /// @}

    /// @name Emission
    /// @{
    ir::Operand emit(ir::Opcode op, std::vector<ir::Operand> operands, uint32_t imm = 0,
                     std::string symbol = {});
    void emitStore(uint32_t slot, ir::Operand value);
    void emitBr(const std::string &target);
    void emitCBr(ir::Operand cond, const std::string &onTrue, const std::string &onFalse);
    void emitRet(ir::RetKind kind, ir::Operand value);
    void emitAbort(ir::Operand message);
    void emitIterNext(uint32_t listSlot, uint32_t elemSlot, const std::string &body,
                      const std::string &exit);
    void terminate(ir::Terminator term);
    /// @}

    /// @name Statements
    /// @{
    void lowerBlock(const Block &block);
    void lowerStmt(const Stmt &stmt);
    void lowerIf(const IfStmt &stmt);
    void lowerMatch(const MatchStmt &stmt);
    void lowerFor(const ForStmt &stmt);
    void lowerAction(const ActionStmt &stmt);
    /// @}

    /// @name Expressions
    /// @{
    ir::Operand lowerExpr(const Expr &expr);
    ir::Operand lowerBinary(const BinaryExpr &expr);
    ir::Operand lowerShortCircuit(const BinaryExpr &expr);
    ir::Operand lowerRecord(const RecordExpr &expr, const types::TypeRef &type);
    std::vector<ir::Operand> lowerArgs(const std::vector<ExprPtr> &args,
                                       const Expr *receiver = nullptr);
    /// @}

    ir::Function *fn_ = nullptr;
    const FunctionDecl *decl_ = nullptr;
    int current_ = -1;
    uint32_t labelCounter_ = 0;

    /// Labels that a terminator has already referenced.
    std::set<std::string> referenced_;
};

} // namespace sieve::frontend
