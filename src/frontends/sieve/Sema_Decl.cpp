//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Sema_Decl.cpp
// Purpose: Declaration passes: type collection and resolution, function
//          signatures, body driver, recursion detection and unused types.
// Key invariants: Function indices follow declaration order, duplicates
//                 included, so they match the order the lowerer emits.
// Ownership/Lifetime: See Sema.hpp.
// Links: frontends/sieve/Sema.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/Sema.hpp"

#include <algorithm>
#include <functional>

namespace sieve::frontend
{

using support::DiagKind;
namespace ty = types::make;

namespace
{

const char *declNoun(const Decl &decl)
{
    return std::holds_alternative<RecordDecl>(decl.node) ? "record" : "enum";
}

const char *functionNoun(FunctionKind kind)
{
    switch (kind)
    {
        case FunctionKind::Filter:
            return "filter";
        case FunctionKind::FilterMap:
            return "filter-map";
        default:
            return "function";
    }
}

} // namespace

//===----------------------------------------------------------------------===//
// Pass 1 and 2: types
//===----------------------------------------------------------------------===//

void Sema::collectTypes(Module &module)
{
    for (const auto &decl : module.decls)
    {
        const std::string *name = nullptr;
        SourceSpan nameSpan;
        if (const auto *record = std::get_if<RecordDecl>(&decl->node))
        {
            name = &record->name;
            nameSpan = record->nameSpan;
        }
        else if (const auto *enumDecl = std::get_if<EnumDecl>(&decl->node))
        {
            name = &enumDecl->name;
            nameSpan = enumDecl->nameSpan;
        }
        if (!name)
            continue;

        if (ty::primitiveByName(*name) || *name == "List")
        {
            error(DiagKind::DuplicateDeclaration, nameSpan,
                  "'" + *name + "' is a built-in type and cannot be redeclared");
            continue;
        }
        if (externals_ && externals_->findType(*name))
        {
            error(DiagKind::DuplicateDeclaration, nameSpan,
                  "'" + *name + "' is already registered as an external type");
            continue;
        }
        auto [it, inserted] = declaredTypes_.try_emplace(*name);
        if (!inserted)
        {
            support::Diagnostic d = support::makeError(
                DiagKind::DuplicateDeclaration, "type '" + *name + "' is declared more than once",
                nameSpan);
            d.labels.push_back({it->second.nameSpan, "previous declaration"});
            diag_.report(std::move(d));
            hasError_ = true;
            continue;
        }
        it->second.decl = decl.get();
        it->second.nameSpan = nameSpan;
        declaredOrder_.push_back(*name);
    }
}

void Sema::resolveTypes()
{
    for (const auto &name : declaredOrder_)
        resolveDeclaredType(name, declaredTypes_[name].nameSpan);

    for (const auto &name : declaredOrder_)
    {
        const TypeDeclInfo &info = declaredTypes_[name];
        const auto *enumDecl = std::get_if<EnumDecl>(&info.decl->node);
        if (enumDecl && enumDecl->variants.empty())
            error(DiagKind::UnknownVariant, info.nameSpan,
                  "enum '" + name + "' declares no variants");
    }
}

TypeRef Sema::resolveDeclaredType(const std::string &name, SourceSpan useSpan)
{
    TypeDeclInfo &info = declaredTypes_[name];
    if (info.state == TypeDeclInfo::State::Done)
        return info.type;
    if (info.state == TypeDeclInfo::State::Visiting)
    {
        if (!info.cyclic)
        {
            info.cyclic = true;
            error(DiagKind::UndefinedType, useSpan,
                  std::string(declNoun(*info.decl)) + " '" + name +
                      "' contains itself and cannot be constructed");
        }
        return ty::error();
    }

    info.state = TypeDeclInfo::State::Visiting;
    TypeRef result;
    if (const auto *record = std::get_if<RecordDecl>(&info.decl->node))
    {
        std::vector<types::FieldType> fields;
        for (const auto &field : record->fields)
        {
            bool duplicate = false;
            for (const auto &seen : fields)
                duplicate = duplicate || seen.name == field.name;
            if (duplicate)
            {
                error(DiagKind::DuplicateDeclaration, field.span,
                      "field '" + field.name + "' is declared more than once in '" + name + "'");
                continue;
            }
            fields.push_back(types::FieldType{field.name, resolveTypeNode(field.type)});
        }
        result = ty::record(name, std::move(fields));
    }
    else
    {
        const auto &enumDecl = std::get<EnumDecl>(info.decl->node);
        std::vector<types::VariantType> variants;
        for (const auto &variant : enumDecl.variants)
        {
            bool duplicate = false;
            for (const auto &seen : variants)
                duplicate = duplicate || seen.name == variant.name;
            if (duplicate)
            {
                error(DiagKind::DuplicateDeclaration, variant.span,
                      "variant '" + variant.name + "' is declared more than once in '" + name +
                          "'");
                continue;
            }
            TypeRef payload = variant.payload ? resolveTypeNode(*variant.payload) : nullptr;
            variants.push_back(types::VariantType{variant.name, payload});
        }
        result = ty::enumeration(name, std::move(variants));
    }

    info.type = result;
    info.state = TypeDeclInfo::State::Done;
    return result;
}

TypeRef Sema::resolveTypeNode(const TypeNode &node)
{
    if (!node.args.empty())
    {
        if (node.name != "List" || node.args.size() != 1)
        {
            error(DiagKind::UndefinedType, node.span,
                  "unknown generic type '" + node.toString() + "'");
            return ty::error();
        }
        TypeRef element = resolveTypeNode(node.args.front());
        return element->isError() ? ty::error() : ty::list(element);
    }

    if (node.name == "List")
    {
        error(DiagKind::UndefinedType, node.span, "'List' needs an element type, e.g. 'List[Int]'");
        return ty::error();
    }
    if (TypeRef prim = ty::primitiveByName(node.name))
        return prim;

    auto it = declaredTypes_.find(node.name);
    if (it != declaredTypes_.end())
    {
        it->second.used = true;
        return resolveDeclaredType(node.name, node.span);
    }

    if (externals_)
    {
        if (const auto *info = externals_->findType(node.name))
            return info->type;
    }

    error(DiagKind::UndefinedType, node.span, "unknown type '" + node.name + "'");
    return ty::error();
}

//===----------------------------------------------------------------------===//
// Pass 3: signatures
//===----------------------------------------------------------------------===//

void Sema::collectSignatures(Module &module)
{
    for (auto &decl : module.decls)
    {
        auto *fn = std::get_if<FunctionDecl>(&decl->node);
        if (!fn)
            continue;

        FunctionInfo info;
        info.name = fn->name;
        info.decl = fn;
        info.index = static_cast<uint32_t>(functions_.size());

        auto existing = functionIndex_.find(fn->name);
        if (existing != functionIndex_.end())
        {
            support::Diagnostic d = support::makeError(
                DiagKind::DuplicateDeclaration,
                "'" + fn->name + "' is declared more than once", fn->nameSpan);
            d.labels.push_back(
                {functions_[existing->second].decl->nameSpan, "previous declaration"});
            diag_.report(std::move(d));
            hasError_ = true;
        }
        else if (externals_ && externals_->findFunction(fn->name))
        {
            error(DiagKind::DuplicateDeclaration, fn->nameSpan,
                  "'" + fn->name + "' is already registered as an external function");
        }
        else
        {
            functionIndex_[fn->name] = info.index;
        }

        std::vector<TypeRef> params;
        params.reserve(fn->params.size());
        for (const auto &param : fn->params)
            params.push_back(resolveTypeNode(param.type));

        TypeRef result = ty::unit();
        if (fn->returnType)
        {
            TypeRef declared = resolveTypeNode(*fn->returnType);
            if (fn->kind == FunctionKind::Filter)
                error(DiagKind::InvalidAction, fn->returnType->span,
                      "filter '" + fn->name +
                          "' cannot declare a result type; use 'filter-map' instead");
            else
                result = declared;
        }

        info.signature = ty::function(std::move(params), result);
        fn->signature = info.signature;
        functions_.push_back(std::move(info));
    }
}

//===----------------------------------------------------------------------===//
// Pass 4: bodies
//===----------------------------------------------------------------------===//

void Sema::checkFunctionBody(FunctionInfo &fn)
{
    FunctionDecl &decl = *fn.decl;
    scopes_.clear();
    currentScope_ = -1;
    nextLocal_ = 0;
    currentFn_ = &fn;

    pushScope();
    for (size_t i = 0; i < decl.params.size(); ++i)
    {
        LocalSymbol param;
        param.name = decl.params[i].name;
        param.type = fn.signature->params[i];
        param.declSpan = decl.params[i].span;
        param.what = "parameter";
        param.warnUnused = false;
        declareLocal(std::move(param));
    }

    bool exits = checkBlock(decl.body, true);
    popScope();

    if (!exits)
    {
        const TypeRef &result = fn.signature->result;
        if (decl.kind == FunctionKind::Function)
        {
            if (result->kind != types::TypeKind::Unit && !result->isError())
                error(DiagKind::MissingReturn, decl.nameSpan,
                      "function '" + decl.name +
                          "' may finish without returning a value of type '" +
                          result->toString() + "'");
        }
        else
        {
            error(DiagKind::MissingTerminalAction, decl.nameSpan,
                  std::string(functionNoun(decl.kind)) + " '" + decl.name +
                      "' may finish without 'accept' or 'reject'");
        }
    }

    decl.localCount = nextLocal_;
    scopes_.clear();
    currentScope_ = -1;
    currentFn_ = nullptr;
}

//===----------------------------------------------------------------------===//
// Pass 5: recursion
//===----------------------------------------------------------------------===//

namespace
{

/// Depth-first search that reports each back edge of the call graph once.
class CycleFinder
{
  public:
    using Graph = std::map<uint32_t, std::map<uint32_t, SourceSpan>>;
    using Report = std::function<void(SourceSpan, const std::vector<uint32_t> &)>;

    CycleFinder(const Graph &graph, size_t count, Report report)
        : graph_(graph), state_(count, 0), report_(std::move(report))
    {
    }

    void run()
    {
        for (uint32_t i = 0; i < state_.size(); ++i)
        {
            if (state_[i] == 0)
                visit(i);
        }
    }

  private:
    void visit(uint32_t node)
    {
        state_[node] = 1;
        stack_.push_back(node);
        auto edges = graph_.find(node);
        if (edges != graph_.end())
        {
            for (const auto &[callee, site] : edges->second)
            {
                if (state_[callee] == 0)
                {
                    visit(callee);
                }
                else if (state_[callee] == 1)
                {
                    auto start = std::find(stack_.begin(), stack_.end(), callee);
                    std::vector<uint32_t> cycle(start, stack_.end());
                    cycle.push_back(callee);
                    report_(site, cycle);
                }
            }
        }
        stack_.pop_back();
        state_[node] = 2;
    }

    const Graph &graph_;
    std::vector<int> state_;
    std::vector<uint32_t> stack_;
    Report report_;
};

} // namespace

void Sema::checkRecursion()
{
    CycleFinder finder(callGraph_, functions_.size(),
                       [this](SourceSpan site, const std::vector<uint32_t> &cycle) {
                           std::string path;
                           for (size_t i = 0; i < cycle.size(); ++i)
                               path += (i ? " -> " : "") + functions_[cycle[i]].name;
                           error(DiagKind::RecursiveCall, site,
                                 "recursive call cycle: " + path);
                       });
    finder.run();
}

void Sema::reportUnusedTypes()
{
    for (const auto &name : declaredOrder_)
    {
        const TypeDeclInfo &info = declaredTypes_[name];
        if (info.used || name[0] == '_')
            continue;
        warning(DiagKind::UnusedDeclaration, info.nameSpan,
                std::string("unused ") + declNoun(*info.decl) + " '" + name + "'");
    }
}

} // namespace sieve::frontend
