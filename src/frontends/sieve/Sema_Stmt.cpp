//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Sema_Stmt.cpp
// Purpose: Statement checking, terminal-action rules, match exhaustiveness
//          and the "always exits" flow analysis.
// Key invariants: Each check returns true only when every path through the
//                 statement ends in accept, reject, return or abort.
// Ownership/Lifetime: See Sema.hpp.
// Links: frontends/sieve/Sema.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/Sema.hpp"

#include <algorithm>

namespace sieve::frontend
{

using support::DiagKind;
using types::TypeKind;
namespace ty = types::make;

bool Sema::checkBlock(Block &block, bool functionBody)
{
    pushScope();
    bool exits = false;
    bool warned = false;
    for (size_t i = 0; i < block.stmts.size(); ++i)
    {
        Stmt &stmt = *block.stmts[i];
        if (exits && !warned)
        {
            warning(DiagKind::UnreachableCode, stmt.span, "unreachable statement");
            warned = true;
        }
        bool tail = functionBody && i + 1 == block.stmts.size();
        if (checkStmt(stmt, tail))
            exits = true;
    }
    popScope();
    return exits;
}

bool Sema::checkStmt(Stmt &stmt, bool tailOfBody)
{
    return std::visit(Overload{
                          [&](LetStmt &s) { return checkLet(s); },
                          [&](AssignStmt &s) { return checkAssign(s); },
                          [&](ExprStmt &s) { return checkExprStmt(s, tailOfBody); },
                          [&](IfStmt &s) { return checkIf(s); },
                          [&](MatchStmt &s) { return checkMatch(s, stmt.span); },
                          [&](ForStmt &s) { return checkFor(s); },
                          [&](ActionStmt &s) { return checkAction(s, stmt.span); },
                          [&](BlockStmt &s) { return checkBlock(s.block); },
                      },
                      stmt.node);
}

bool Sema::checkLet(LetStmt &stmt)
{
    TypeRef declared = stmt.annotation ? resolveTypeNode(*stmt.annotation) : nullptr;
    TypeRef type;
    if (!stmt.init)
    {
        type = declared ? declared : ty::error();
    }
    else if (declared)
    {
        expectType(*stmt.init, declared, "type");
        type = declared;
    }
    else
    {
        type = checkExpr(*stmt.init);
    }

    LocalSymbol sym;
    sym.name = stmt.name;
    sym.type = type;
    sym.declSpan = stmt.nameSpan;
    sym.isMutable = true;
    sym.what = "local";
    stmt.local = declareLocal(std::move(sym))->local;
    return false;
}

bool Sema::checkAssign(AssignStmt &stmt)
{
    LocalSymbol *sym = lookupLocal(stmt.name);
    if (!sym)
    {
        if (stmt.value)
            checkExpr(*stmt.value);
        error(DiagKind::UndefinedSymbol, stmt.nameSpan, "undefined identifier '" + stmt.name + "'");
        return false;
    }

    stmt.local = sym->local;
    TypeRef target = sym->type;
    if (!sym->isMutable)
        error(DiagKind::InvalidAssignment, stmt.nameSpan,
              std::string("cannot assign to ") + sym->what + " '" + stmt.name + "'");
    if (stmt.value)
        expectType(*stmt.value, target, "type");
    return false;
}

bool Sema::checkExprStmt(ExprStmt &stmt, bool tailOfBody)
{
    const TypeRef &result = currentFn_->signature->result;
    if (tailOfBody && !stmt.hasSemicolon && currentFn_->decl->kind == FunctionKind::Function &&
        result->kind != TypeKind::Unit)
    {
        stmt.implicitReturn = true;
        expectType(*stmt.expr, result, "return type");
        return true;
    }
    checkExpr(*stmt.expr);
    return false;
}

bool Sema::checkIf(IfStmt &stmt)
{
    expectType(*stmt.cond, ty::boolean(), "condition of type");
    bool thenExits = checkBlock(stmt.thenBlock);
    bool elseExits = stmt.elseBlock ? checkBlock(*stmt.elseBlock) : false;
    return thenExits && elseExits;
}

bool Sema::checkMatch(MatchStmt &stmt, SourceSpan span)
{
    TypeRef scrutinee = checkExpr(*stmt.scrutinee);
    bool isEnum = scrutinee->kind == TypeKind::Enum;
    if (!isEnum && !scrutinee->isError())
        error(DiagKind::TypeMismatch, stmt.scrutinee->span,
              "match requires an enum value, found '" + scrutinee->toString() + "'");

    std::vector<bool> covered(isEnum ? scrutinee->variants.size() : 0, false);
    bool wildcard = false;
    bool allExit = true;

    for (auto &arm : stmt.arms)
    {
        TypeRef payload;
        bool known = false;
        if (arm.isWildcard())
        {
            if (wildcard)
                warning(DiagKind::UnreachableCode, arm.patternSpan,
                        "unreachable match arm: '_' already matched");
            else if (isEnum && std::find(covered.begin(), covered.end(), false) == covered.end())
                warning(DiagKind::UnreachableCode, arm.patternSpan,
                        "unreachable match arm: every variant is already covered");
            if (arm.binding)
                error(DiagKind::ArityMismatch, arm.bindingSpan,
                      "the wildcard pattern cannot bind a value");
        }
        else if (isEnum)
        {
            auto index = scrutinee->variantIndex(arm.variant);
            if (!index)
            {
                error(DiagKind::UnknownVariant, arm.patternSpan,
                      "enum '" + scrutinee->toString() + "' has no variant '" + arm.variant + "'");
            }
            else
            {
                known = true;
                arm.variantIndex = static_cast<uint32_t>(*index);
                payload = scrutinee->variants[*index].payload;
                if (wildcard || covered[*index])
                    warning(DiagKind::UnreachableCode, arm.patternSpan,
                            "unreachable match arm: '" + arm.variant + "' is already covered");
                if (arm.binding && !payload)
                    error(DiagKind::ArityMismatch, arm.bindingSpan,
                          "variant '" + arm.variant + "' has no payload to bind");
            }
        }

        pushScope();
        if (arm.binding)
        {
            LocalSymbol sym;
            sym.name = *arm.binding;
            sym.type = payload ? payload : ty::error();
            sym.declSpan = arm.bindingSpan;
            sym.what = "match binding";
            arm.bindingLocal = declareLocal(std::move(sym))->local;
        }
        if (arm.guard)
            expectType(*arm.guard, ty::boolean(), "guard of type");
        if (!checkBlock(arm.body))
            allExit = false;
        popScope();

        if (!arm.guard)
        {
            if (arm.isWildcard())
                wildcard = true;
            else if (known)
                covered[arm.variantIndex] = true;
        }
    }

    if (!isEnum)
        return false;

    std::vector<std::string> missing;
    if (!wildcard)
    {
        for (size_t i = 0; i < covered.size(); ++i)
        {
            if (!covered[i])
                missing.push_back(scrutinee->variants[i].name);
        }
    }
    if (!missing.empty())
    {
        std::string list;
        for (size_t i = 0; i < missing.size(); ++i)
            list += (i ? ", '" : "'") + missing[i] + "'";
        error(DiagKind::NonExhaustiveMatch, span,
              std::string("non-exhaustive match: variant") + (missing.size() == 1 ? " " : "s ") +
                  list + " of '" + scrutinee->toString() + "' not covered");
        return false;
    }
    return allExit && !stmt.arms.empty();
}

bool Sema::checkFor(ForStmt &stmt)
{
    TypeRef iterable = checkExpr(*stmt.iterable);
    TypeRef element = ty::error();
    if (iterable->kind == TypeKind::List)
        element = iterable->element;
    else if (!iterable->isError())
        error(DiagKind::TypeMismatch, stmt.iterable->span,
              "'for' expects a list, found '" + iterable->toString() + "'");

    pushScope();
    LocalSymbol sym;
    sym.name = stmt.var;
    sym.type = element;
    sym.declSpan = stmt.varSpan;
    sym.what = "loop variable";
    stmt.local = declareLocal(std::move(sym))->local;
    checkBlock(stmt.body);
    popScope();
    // The list may be empty, so the body never guarantees an exit.
    return false;
}

bool Sema::checkAction(ActionStmt &stmt, SourceSpan span)
{
    const FunctionDecl &fn = *currentFn_->decl;
    const TypeRef &result = currentFn_->signature->result;
    bool isFilter = fn.kind != FunctionKind::Function;

    switch (stmt.kind)
    {
        case ActionKind::Accept:
            if (!isFilter)
            {
                if (stmt.value)
                    checkExpr(*stmt.value);
                error(DiagKind::InvalidAction, span,
                      "'accept' is only valid in a filter or filter-map");
            }
            else if (fn.kind == FunctionKind::Filter)
            {
                if (stmt.value)
                {
                    checkExpr(*stmt.value);
                    error(DiagKind::InvalidAction, stmt.value->span,
                          "'accept' in a filter takes no value; use a filter-map to produce one");
                }
            }
            else if (result->kind == TypeKind::Unit)
            {
                if (stmt.value)
                {
                    checkExpr(*stmt.value);
                    error(DiagKind::InvalidAction, stmt.value->span,
                          "filter-map '" + fn.name + "' declares no result type");
                }
            }
            else if (!stmt.value)
            {
                error(DiagKind::InvalidAction, span,
                      "'accept' in filter-map '" + fn.name + "' must carry a value of type '" +
                          result->toString() + "'");
            }
            else
            {
                expectType(*stmt.value, result, "accept value of type");
            }
            break;

        case ActionKind::Reject:
            if (!isFilter)
                error(DiagKind::InvalidAction, span,
                      "'reject' is only valid in a filter or filter-map");
            break;

        case ActionKind::Return:
            if (isFilter)
            {
                if (stmt.value)
                    checkExpr(*stmt.value);
                error(DiagKind::InvalidAction, span,
                      "'return' is not valid in a filter; use 'accept' or 'reject'");
            }
            else if (stmt.value)
            {
                expectType(*stmt.value, result, "return type");
            }
            else if (result->kind != TypeKind::Unit && !result->isError())
            {
                mismatch(span, "return type", result, ty::unit());
            }
            break;

        case ActionKind::Abort:
            if (stmt.value)
                expectType(*stmt.value, ty::string(), "abort message of type");
            break;
    }
    return true;
}

} // namespace sieve::frontend
