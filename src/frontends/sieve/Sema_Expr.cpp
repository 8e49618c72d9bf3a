//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/sieve/Sema_Expr.cpp
// Purpose: Expression typing and call/member resolution.
// Key invariants: checkExpr() always stores a non-null type on the node.
//                 Operands with the Error type never produce a second
//                 diagnostic.
// Ownership/Lifetime: See Sema.hpp.
// Links: frontends/sieve/Sema.hpp, runtime/Builtins.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/sieve/Sema.hpp"

#include "runtime/Builtins.hpp"

namespace sieve::frontend
{

using support::DiagKind;
using types::TypeKind;
namespace ty = types::make;

namespace
{

TypeRef literalType(const runtime::Value &value)
{
    switch (value.kind())
    {
        case runtime::ValueKind::Unit:
            return ty::unit();
        case runtime::ValueKind::Bool:
            return ty::boolean();
        case runtime::ValueKind::Int:
            return ty::integer();
        case runtime::ValueKind::String:
            return ty::string();
        case runtime::ValueKind::Bytes:
            return ty::bytes();
        case runtime::ValueKind::Prefix:
            return ty::prefix();
        case runtime::ValueKind::IpAddr:
            return ty::ipAddr();
        case runtime::ValueKind::Asn:
            return ty::asn();
        case runtime::ValueKind::Community:
            return ty::community();
        default:
            return ty::error();
    }
}

bool isKind(const TypeRef &type, TypeKind kind)
{
    return type && type->kind == kind;
}

bool isErr(const TypeRef &type)
{
    return !type || type->isError();
}

std::string quoted(const TypeRef &type)
{
    return "'" + types::typeName(type) + "'";
}

} // namespace

TypeRef Sema::checkExpr(Expr &expr, const TypeRef &expected)
{
    TypeRef type = std::visit(
        Overload{
            [&](LiteralExpr &e) { return literalType(e.value); },
            [&](NameExpr &e) { return checkName(expr, e); },
            [&](UnaryExpr &e) { return checkUnary(e); },
            [&](BinaryExpr &e) { return checkBinary(expr, e); },
            [&](FieldExpr &e) { return checkField(e); },
            [&](MethodCallExpr &e) { return checkMethodCall(expr, e); },
            [&](CallExpr &e) { return checkCall(expr, e); },
            [&](RecordExpr &e) { return checkRecord(expr, e); },
            [&](EnumExpr &e) { return checkEnum(expr, e); },
            [&](ListExpr &e) { return checkList(expr, e, expected); },
            [&](ErrorExpr &) { return ty::error(); },
        },
        expr.node);
    if (!type)
        type = ty::error();
    expr.type = type;
    return type;
}

TypeRef Sema::checkName(Expr &expr, NameExpr &e)
{
    if (LocalSymbol *sym = lookupLocal(e.name))
    {
        sym->used = true;
        e.local = sym->local;
        return sym->type;
    }
    if (functionIndex_.count(e.name) || (externals_ && externals_->findFunction(e.name)))
    {
        error(DiagKind::TypeMismatch, expr.span,
              "'" + e.name + "' is a function; call it as '" + e.name + "(...)'");
        return ty::error();
    }
    error(DiagKind::UndefinedSymbol, expr.span, "undefined identifier '" + e.name + "'");
    return ty::error();
}

TypeRef Sema::checkUnary(UnaryExpr &e)
{
    TypeRef operand = checkExpr(*e.operand);
    TypeRef want = e.op == UnaryOp::Neg ? ty::integer() : ty::boolean();
    if (!types::isAssignable(want, operand))
        error(DiagKind::TypeMismatch, e.operand->span,
              std::string("operator '") + (e.op == UnaryOp::Neg ? "-" : "!") + "' expects " +
                  quoted(want) + ", found " + quoted(operand));
    return want;
}

TypeRef Sema::checkBinary(Expr &expr, BinaryExpr &e)
{
    const std::string op = binaryOpSpelling(e.op);
    TypeRef lhs = checkExpr(*e.lhs);

    switch (e.op)
    {
        case BinaryOp::And:
        case BinaryOp::Or:
        {
            TypeRef rhs = checkExpr(*e.rhs);
            if (!types::isAssignable(ty::boolean(), lhs))
                mismatch(e.lhs->span, "operand of '" + op + "' of type", ty::boolean(), lhs);
            if (!types::isAssignable(ty::boolean(), rhs))
                mismatch(e.rhs->span, "operand of '" + op + "' of type", ty::boolean(), rhs);
            return ty::boolean();
        }
        case BinaryOp::Mul:
        case BinaryOp::Div:
        case BinaryOp::Rem:
        case BinaryOp::Add:
        case BinaryOp::Sub:
        {
            TypeRef rhs = checkExpr(*e.rhs);
            if (!types::isAssignable(ty::integer(), lhs))
                mismatch(e.lhs->span, "operand of '" + op + "' of type", ty::integer(), lhs);
            if (!types::isAssignable(ty::integer(), rhs))
                mismatch(e.rhs->span, "operand of '" + op + "' of type", ty::integer(), rhs);
            return ty::integer();
        }
        case BinaryOp::Eq:
        case BinaryOp::Ne:
        {
            TypeRef rhs = checkExpr(*e.rhs, lhs);
            if (isErr(lhs) || isErr(rhs))
                return ty::boolean();
            if (!types::sameType(lhs, rhs))
                error(DiagKind::TypeMismatch, expr.span,
                      "cannot compare " + quoted(lhs) + " with " + quoted(rhs));
            else if (!types::isEquatable(lhs))
                error(DiagKind::TypeMismatch, expr.span,
                      "values of type " + quoted(lhs) + " cannot be compared with '" + op + "'");
            return ty::boolean();
        }
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:
        {
            TypeRef rhs = checkExpr(*e.rhs);
            if (isErr(lhs) || isErr(rhs))
                return ty::boolean();
            if (!types::isOrdered(lhs))
                error(DiagKind::TypeMismatch, e.lhs->span,
                      "operator '" + op + "' expects 'Int' or 'Asn', found " + quoted(lhs));
            else if (!types::sameType(lhs, rhs))
                mismatch(e.rhs->span, "right operand of '" + op + "' of type", lhs, rhs);
            return ty::boolean();
        }
        case BinaryOp::In:
        case BinaryOp::NotIn:
        {
            TypeRef rhs = checkExpr(*e.rhs, isErr(lhs) ? nullptr : ty::list(lhs));
            if (isErr(lhs) || isErr(rhs))
                return ty::boolean();
            if (isKind(rhs, TypeKind::List))
            {
                e.inKind = InKind::List;
                if (!types::isAssignable(rhs->element, lhs))
                    mismatch(e.lhs->span, "element type", rhs->element, lhs);
            }
            else if (isKind(rhs, TypeKind::Prefix) && isKind(lhs, TypeKind::IpAddr))
            {
                e.inKind = InKind::AddrInPrefix;
            }
            else if (isKind(rhs, TypeKind::Prefix) && isKind(lhs, TypeKind::Prefix))
            {
                e.inKind = InKind::PrefixInPrefix;
            }
            else
            {
                error(DiagKind::TypeMismatch, expr.span,
                      "operator '" + op + "' cannot test " + quoted(lhs) + " against " +
                          quoted(rhs));
            }
            return ty::boolean();
        }
    }
    return ty::error();
}

TypeRef Sema::checkField(FieldExpr &e)
{
    TypeRef base = checkExpr(*e.base);
    if (isErr(base))
        return ty::error();

    if (isKind(base, TypeKind::Record))
    {
        if (auto index = base->fieldIndex(e.field))
        {
            e.target.kind = CallKind::Field;
            e.target.index = static_cast<uint32_t>(*index);
            return base->fields[*index].type;
        }
        error(DiagKind::UnknownField, e.fieldSpan,
              "record " + quoted(base) + " has no field '" + e.field + "'");
        return ty::error();
    }

    if (isKind(base, TypeKind::External) && externals_)
    {
        const auto *info = externals_->findType(base->name);
        if (const auto *field = info ? info->findField(e.field) : nullptr)
        {
            e.target.kind = CallKind::External;
            e.target.symbol = field->symbol;
            return field->type;
        }
        if (info && info->findMethod(e.field))
        {
            error(DiagKind::UnknownField, e.fieldSpan,
                  "'" + e.field + "' is a method of " + quoted(base) + "; call it as '" + e.field +
                      "()'");
            return ty::error();
        }
    }
    else if (runtime::lookupBuiltin(base, e.field))
    {
        error(DiagKind::UnknownField, e.fieldSpan,
              "'" + e.field + "' is a method of " + quoted(base) + "; call it as '" + e.field +
                  "()'");
        return ty::error();
    }

    error(DiagKind::UnknownField, e.fieldSpan,
          "type " + quoted(base) + " has no field '" + e.field + "'");
    return ty::error();
}

TypeRef Sema::checkMethodCall(Expr &expr, MethodCallExpr &e)
{
    TypeRef receiver = checkExpr(*e.receiver);
    if (isErr(receiver))
    {
        for (auto &arg : e.args)
            checkExpr(*arg);
        return ty::error();
    }

    const std::string display = types::typeName(receiver) + "." + e.method;

    if (isKind(receiver, TypeKind::External) && externals_)
    {
        const auto *info = externals_->findType(receiver->name);
        if (const auto *method = info ? info->findMethod(e.method) : nullptr)
        {
            e.target.kind = CallKind::External;
            e.target.symbol = method->symbol;
            checkArgs(display, expr.span, e.args, method->params);
            return method->result;
        }
    }
    else if (auto builtin = runtime::lookupBuiltin(receiver, e.method))
    {
        e.target.kind = CallKind::Builtin;
        e.target.index = static_cast<uint32_t>(builtin->id);
        checkArgs(display, expr.span, e.args, builtin->params);
        return builtin->result;
    }

    for (auto &arg : e.args)
        checkExpr(*arg);
    error(DiagKind::UnknownMethod, e.methodSpan,
          "type " + quoted(receiver) + " has no method '" + e.method + "'");
    return ty::error();
}

TypeRef Sema::checkCall(Expr &expr, CallExpr &e)
{
    auto user = functionIndex_.find(e.callee);
    if (user != functionIndex_.end())
    {
        const FunctionInfo &callee = functions_[user->second];
        if (callee.decl->kind != FunctionKind::Function)
        {
            for (auto &arg : e.args)
                checkExpr(*arg);
            error(DiagKind::InvalidAction, e.calleeSpan,
                  "'" + e.callee + "' is a filter entry point and cannot be called");
            return ty::error();
        }
        e.target.kind = CallKind::Function;
        e.target.index = callee.index;
        checkArgs(e.callee, expr.span, e.args, callee.signature->params);
        if (currentFn_)
            callGraph_[currentFn_->index].try_emplace(callee.index, e.calleeSpan);
        return callee.signature->result;
    }

    if (externals_)
    {
        if (const auto *ext = externals_->findFunction(e.callee))
        {
            e.target.kind = CallKind::External;
            e.target.symbol = ext->name;
            checkArgs(e.callee, expr.span, e.args, ext->params);
            return ext->result;
        }
    }

    for (auto &arg : e.args)
        checkExpr(*arg);
    if (lookupLocal(e.callee))
        error(DiagKind::TypeMismatch, e.calleeSpan, "'" + e.callee + "' is not a function");
    else
        error(DiagKind::UndefinedSymbol, e.calleeSpan, "undefined function '" + e.callee + "'");
    return ty::error();
}

void Sema::checkArgs(const std::string &callee, SourceSpan span, std::vector<ExprPtr> &args,
                     const std::vector<TypeRef> &params)
{
    if (args.size() != params.size())
    {
        error(DiagKind::ArityMismatch, span,
              "'" + callee + "' expects " + std::to_string(params.size()) + " argument" +
                  (params.size() == 1 ? "" : "s") + ", found " + std::to_string(args.size()));
        for (auto &arg : args)
            checkExpr(*arg);
        return;
    }
    for (size_t i = 0; i < args.size(); ++i)
        expectType(*args[i], params[i],
                   "argument " + std::to_string(i + 1) + " of '" + callee + "' of type");
}

TypeRef Sema::checkRecord(Expr &expr, RecordExpr &e)
{
    // Anonymous records take their structure from the fields given.
    if (e.typeName.empty())
    {
        std::vector<types::FieldType> fields;
        for (auto &init : e.fields)
        {
            TypeRef value = checkExpr(*init.value);
            bool duplicate = false;
            for (const auto &f : fields)
                duplicate = duplicate || f.name == init.name;
            if (duplicate)
            {
                error(DiagKind::DuplicateDeclaration, init.nameSpan,
                      "field '" + init.name + "' is given more than once");
                continue;
            }
            fields.push_back(types::FieldType{init.name, value});
        }
        return ty::record(std::string(), std::move(fields));
    }

    TypeRef type;
    auto declared = declaredTypes_.find(e.typeName);
    if (declared != declaredTypes_.end())
    {
        declared->second.used = true;
        type = declared->second.type;
    }

    if (!isKind(type, TypeKind::Record))
    {
        for (auto &init : e.fields)
            checkExpr(*init.value);
        if (type && !type->isError())
            error(DiagKind::TypeMismatch, e.typeSpan, "'" + e.typeName + "' is not a record type");
        else if (!type)
            error(DiagKind::UndefinedType, e.typeSpan, "unknown record type '" + e.typeName + "'");
        return ty::error();
    }

    std::vector<bool> seen(type->fields.size(), false);
    for (auto &init : e.fields)
    {
        auto index = type->fieldIndex(init.name);
        if (!index)
        {
            checkExpr(*init.value);
            error(DiagKind::UnknownField, init.nameSpan,
                  "record '" + e.typeName + "' has no field '" + init.name + "'");
            continue;
        }
        if (seen[*index])
        {
            checkExpr(*init.value);
            error(DiagKind::DuplicateDeclaration, init.nameSpan,
                  "field '" + init.name + "' is given more than once");
            continue;
        }
        seen[*index] = true;
        expectType(*init.value, type->fields[*index].type, "field '" + init.name + "' of type");
    }

    std::string missing;
    for (size_t i = 0; i < seen.size(); ++i)
    {
        if (!seen[i])
            missing += (missing.empty() ? "'" : ", '") + type->fields[i].name + "'";
    }
    if (!missing.empty())
        error(DiagKind::MissingField, expr.span,
              "record '" + e.typeName + "' literal is missing field(s) " + missing);
    return type;
}

TypeRef Sema::checkEnum(Expr &expr, EnumExpr &e)
{
    TypeRef type;
    auto declared = declaredTypes_.find(e.enumName);
    if (declared != declaredTypes_.end())
    {
        declared->second.used = true;
        type = declared->second.type;
    }

    if (!isKind(type, TypeKind::Enum))
    {
        if (e.payload)
            checkExpr(*e.payload);
        if (type && !type->isError())
            error(DiagKind::TypeMismatch, expr.span, "'" + e.enumName + "' is not an enum type");
        else if (!type)
            error(DiagKind::UndefinedType, expr.span, "unknown enum type '" + e.enumName + "'");
        return ty::error();
    }

    auto index = type->variantIndex(e.variant);
    if (!index)
    {
        if (e.payload)
            checkExpr(*e.payload);
        error(DiagKind::UnknownVariant, e.variantSpan,
              "enum '" + e.enumName + "' has no variant '" + e.variant + "'");
        return type;
    }
    e.variantIndex = static_cast<uint32_t>(*index);

    const TypeRef &payload = type->variants[*index].payload;
    const std::string display = e.enumName + "::" + e.variant;
    if (payload && !e.payload)
        error(DiagKind::ArityMismatch, expr.span,
              "variant '" + display + "' expects a payload of type " + quoted(payload));
    else if (!payload && e.payload)
    {
        checkExpr(*e.payload);
        error(DiagKind::ArityMismatch, e.payload->span,
              "variant '" + display + "' takes no payload");
    }
    else if (payload)
        expectType(*e.payload, payload, "payload of '" + display + "' of type");
    return type;
}

TypeRef Sema::checkList(Expr &expr, ListExpr &e, const TypeRef &expected)
{
    TypeRef element = isKind(expected, TypeKind::List) ? expected->element : nullptr;

    if (e.elements.empty())
    {
        if (element)
            return expected;
        error(DiagKind::TypeMismatch, expr.span,
              "cannot infer the element type of an empty list; add a type annotation");
        return ty::error();
    }

    for (auto &item : e.elements)
    {
        TypeRef type = checkExpr(*item, element);
        if (isErr(type))
            continue;
        if (!element)
            element = type;
        else if (!types::isAssignable(element, type))
            mismatch(item->span, "list element of type", element, type);
    }
    return element ? ty::list(element) : ty::error();
}

} // namespace sieve::frontend
