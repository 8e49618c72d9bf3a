//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: types/Types.cpp
// Purpose: Type factories, structural comparison and type spelling.
// Key invariants: Primitive factories return the same instance every call.
// Ownership/Lifetime: Singletons live for the program duration.
// Links: types/Types.hpp
//
//===----------------------------------------------------------------------===//

#include "types/Types.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace sieve::types
{

bool SieveType::isPrimitive() const
{
    switch (kind)
    {
        case TypeKind::Unit:
        case TypeKind::Bool:
        case TypeKind::Int:
        case TypeKind::String:
        case TypeKind::Bytes:
        case TypeKind::Prefix:
        case TypeKind::IpAddr:
        case TypeKind::Asn:
        case TypeKind::Community:
        case TypeKind::AsPath:
            return true;
        default:
            return false;
    }
}

std::optional<size_t> SieveType::fieldIndex(std::string_view fieldName) const
{
    for (size_t i = 0; i < fields.size(); ++i)
    {
        if (fields[i].name == fieldName)
            return i;
    }
    return std::nullopt;
}

std::optional<size_t> SieveType::variantIndex(std::string_view variantName) const
{
    for (size_t i = 0; i < variants.size(); ++i)
    {
        if (variants[i].name == variantName)
            return i;
    }
    return std::nullopt;
}

std::string SieveType::toString() const
{
    switch (kind)
    {
        case TypeKind::Unit:
            return "Unit";
        case TypeKind::Bool:
            return "Bool";
        case TypeKind::Int:
            return "Int";
        case TypeKind::String:
            return "String";
        case TypeKind::Bytes:
            return "Bytes";
        case TypeKind::Prefix:
            return "Prefix";
        case TypeKind::IpAddr:
            return "IpAddr";
        case TypeKind::Asn:
            return "Asn";
        case TypeKind::Community:
            return "Community";
        case TypeKind::AsPath:
            return "AsPath";
        case TypeKind::List:
            return "List[" + typeName(element) + "]";
        case TypeKind::Record:
        {
            if (!name.empty())
                return name;
            std::string out = "{";
            for (size_t i = 0; i < fields.size(); ++i)
            {
                if (i)
                    out += ", ";
                out += fields[i].name + ": " + typeName(fields[i].type);
            }
            return out + "}";
        }
        case TypeKind::Enum:
        case TypeKind::External:
            return name;
        case TypeKind::Function:
        {
            std::string out = "function(";
            for (size_t i = 0; i < params.size(); ++i)
            {
                if (i)
                    out += ", ";
                out += typeName(params[i]);
            }
            return out + ") -> " + typeName(result);
        }
        case TypeKind::Error:
            return "<error>";
    }
    return "<error>";
}

std::string typeName(const TypeRef &type)
{
    return type ? type->toString() : std::string("<unknown>");
}

bool sameType(const TypeRef &a, const TypeRef &b)
{
    if (a == b)
        return true;
    if (!a || !b || a->kind != b->kind)
        return false;
    switch (a->kind)
    {
        case TypeKind::List:
            return sameType(a->element, b->element);
        case TypeKind::Record:
            if (a->fields.size() != b->fields.size())
                return false;
            for (size_t i = 0; i < a->fields.size(); ++i)
            {
                if (a->fields[i].name != b->fields[i].name ||
                    !sameType(a->fields[i].type, b->fields[i].type))
                    return false;
            }
            return true;
        case TypeKind::Enum:
            if (a->variants.size() != b->variants.size())
                return false;
            for (size_t i = 0; i < a->variants.size(); ++i)
            {
                const auto &va = a->variants[i];
                const auto &vb = b->variants[i];
                if (va.name != vb.name || static_cast<bool>(va.payload) != static_cast<bool>(vb.payload))
                    return false;
                if (va.payload && !sameType(va.payload, vb.payload))
                    return false;
            }
            return true;
        case TypeKind::Function:
            if (a->params.size() != b->params.size() || !sameType(a->result, b->result))
                return false;
            for (size_t i = 0; i < a->params.size(); ++i)
            {
                if (!sameType(a->params[i], b->params[i]))
                    return false;
            }
            return true;
        case TypeKind::External:
            return a->name == b->name;
        default:
            return true;
    }
}

bool isAssignable(const TypeRef &target, const TypeRef &source)
{
    if (!target || !source)
        return true;
    if (target->isError() || source->isError())
        return true;
    return sameType(target, source);
}

bool isEquatable(const TypeRef &type)
{
    if (!type)
        return false;
    switch (type->kind)
    {
        case TypeKind::External:
        case TypeKind::Function:
            return false;
        case TypeKind::List:
            return isEquatable(type->element);
        case TypeKind::Record:
            return std::all_of(type->fields.begin(), type->fields.end(),
                               [](const FieldType &f) { return isEquatable(f.type); });
        case TypeKind::Enum:
            return std::all_of(type->variants.begin(), type->variants.end(),
                               [](const VariantType &v) { return !v.payload || isEquatable(v.payload); });
        default:
            return true;
    }
}

bool isOrdered(const TypeRef &type)
{
    return type && (type->kind == TypeKind::Int || type->kind == TypeKind::Asn ||
                    type->kind == TypeKind::Error);
}

namespace make
{

namespace
{
TypeRef makePrimitive(TypeKind kind)
{
    return std::make_shared<const SieveType>(kind);
}
} // namespace

TypeRef unit()
{
    static const TypeRef t = makePrimitive(TypeKind::Unit);
    return t;
}

TypeRef boolean()
{
    static const TypeRef t = makePrimitive(TypeKind::Bool);
    return t;
}

TypeRef integer()
{
    static const TypeRef t = makePrimitive(TypeKind::Int);
    return t;
}

TypeRef string()
{
    static const TypeRef t = makePrimitive(TypeKind::String);
    return t;
}

TypeRef bytes()
{
    static const TypeRef t = makePrimitive(TypeKind::Bytes);
    return t;
}

TypeRef prefix()
{
    static const TypeRef t = makePrimitive(TypeKind::Prefix);
    return t;
}

TypeRef ipAddr()
{
    static const TypeRef t = makePrimitive(TypeKind::IpAddr);
    return t;
}

TypeRef asn()
{
    static const TypeRef t = makePrimitive(TypeKind::Asn);
    return t;
}

TypeRef community()
{
    static const TypeRef t = makePrimitive(TypeKind::Community);
    return t;
}

TypeRef asPath()
{
    static const TypeRef t = makePrimitive(TypeKind::AsPath);
    return t;
}

TypeRef error()
{
    static const TypeRef t = makePrimitive(TypeKind::Error);
    return t;
}

TypeRef list(TypeRef element)
{
    auto t = std::make_shared<SieveType>(TypeKind::List);
    t->element = std::move(element);
    return t;
}

TypeRef record(std::string name, std::vector<FieldType> fields)
{
    std::sort(fields.begin(), fields.end(),
              [](const FieldType &a, const FieldType &b) { return a.name < b.name; });
    auto t = std::make_shared<SieveType>(TypeKind::Record, std::move(name));
    t->fields = std::move(fields);
    return t;
}

TypeRef enumeration(std::string name, std::vector<VariantType> variants)
{
    auto t = std::make_shared<SieveType>(TypeKind::Enum, std::move(name));
    t->variants = std::move(variants);
    return t;
}

TypeRef function(std::vector<TypeRef> params, TypeRef result)
{
    auto t = std::make_shared<SieveType>(TypeKind::Function);
    t->params = std::move(params);
    t->result = std::move(result);
    return t;
}

TypeRef external(std::string name)
{
    return std::make_shared<const SieveType>(TypeKind::External, std::move(name));
}

TypeRef primitiveByName(std::string_view name)
{
    static const std::array<std::pair<std::string_view, TypeRef (*)()>, 10> kPrimitives = {{
        {"AsPath", &asPath},
        {"Asn", &asn},
        {"Bool", &boolean},
        {"Bytes", &bytes},
        {"Community", &community},
        {"Int", &integer},
        {"IpAddr", &ipAddr},
        {"Prefix", &prefix},
        {"String", &string},
        {"Unit", &unit},
    }};
    for (const auto &[spelling, factory] : kPrimitives)
    {
        if (spelling == name)
            return factory();
    }
    return nullptr;
}

} // namespace make

} // namespace sieve::types
