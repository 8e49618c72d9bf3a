//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Sema.cpp
// Purpose: Checker entry point, pass sequencing, scope arena and diagnostic
//          helpers.
// Key invariants: The scope arena only holds scopes of the function being
//                 checked; it is empty between functions.
// Ownership/Lifetime: Sema borrows the DiagnosticEngine and shares the
//                     external type table.
// Links: frontends/sieve/Sema.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/Sema.hpp"

namespace sieve::frontend
{

using support::DiagKind;

Sema::Sema(support::DiagnosticEngine &diag,
           std::shared_ptr<const types::ExternalTypeTable> externals)
    : diag_(diag), externals_(std::move(externals))
{
}

bool Sema::analyze(Module &module)
{
    collectTypes(module);
    resolveTypes();
    collectSignatures(module);
    for (auto &fn : functions_)
        checkFunctionBody(fn);
    checkRecursion();
    reportUnusedTypes();
    return !hasError_;
}

TypeRef Sema::lookupDeclaredType(const std::string &name) const
{
    auto it = declaredTypes_.find(name);
    return it == declaredTypes_.end() ? nullptr : it->second.type;
}

//===----------------------------------------------------------------------===//
// Scopes
//===----------------------------------------------------------------------===//

void Sema::pushScope()
{
    scopes_.push_back(ScopeRecord{currentScope_, {}});
    currentScope_ = static_cast<int>(scopes_.size()) - 1;
}

void Sema::popScope()
{
    ScopeRecord &scope = scopes_[static_cast<size_t>(currentScope_)];
    for (const auto &sym : scope.symbols)
    {
        if (sym.used || !sym.warnUnused || sym.name.empty() || sym.name[0] == '_')
            continue;
        warning(DiagKind::UnusedDeclaration, sym.declSpan,
                std::string("unused ") + sym.what + " '" + sym.name + "'");
    }
    currentScope_ = scope.parent;
}

LocalSymbol *Sema::declareLocal(LocalSymbol symbol)
{
    ScopeRecord &scope = scopes_[static_cast<size_t>(currentScope_)];
    for (const auto &existing : scope.symbols)
    {
        if (existing.name != symbol.name)
            continue;
        support::Diagnostic d =
            support::makeError(DiagKind::DuplicateDeclaration,
                               "'" + symbol.name + "' is already declared in this scope",
                               symbol.declSpan);
        d.labels.push_back({existing.declSpan, "previous declaration"});
        diag_.report(std::move(d));
        hasError_ = true;
        break;
    }
    symbol.local = nextLocal_++;
    scope.symbols.push_back(std::move(symbol));
    return &scope.symbols.back();
}

LocalSymbol *Sema::lookupLocal(const std::string &name)
{
    for (int id = currentScope_; id >= 0; id = scopes_[static_cast<size_t>(id)].parent)
    {
        auto &symbols = scopes_[static_cast<size_t>(id)].symbols;
        // Latest declaration wins inside one scope after a duplicate.
        for (auto it = symbols.rbegin(); it != symbols.rend(); ++it)
        {
            if (it->name == name)
                return &*it;
        }
    }
    return nullptr;
}

//===----------------------------------------------------------------------===//
// Diagnostics
//===----------------------------------------------------------------------===//

void Sema::error(DiagKind kind, SourceSpan span, const std::string &message)
{
    hasError_ = true;
    diag_.report(support::makeError(kind, message, span));
}

void Sema::warning(DiagKind kind, SourceSpan span, const std::string &message)
{
    diag_.report(support::makeWarning(kind, message, span));
}

void Sema::mismatch(SourceSpan span, const std::string &what, const TypeRef &expected,
                    const TypeRef &found)
{
    std::string prefix = what.empty() ? "expected '" : "expected " + what + " '";
    error(DiagKind::TypeMismatch, span,
          prefix + types::typeName(expected) + "', found '" + types::typeName(found) + "'");
}

void Sema::expectType(Expr &expr, const TypeRef &target, const std::string &what)
{
    TypeRef found = checkExpr(expr, target);
    if (!types::isAssignable(target, found))
        mismatch(expr.span, what, target, found);
}

} // namespace sieve::frontend
