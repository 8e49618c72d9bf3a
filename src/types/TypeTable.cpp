//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: types/TypeTable.cpp
// Purpose: External type registration and lookup.
// Key invariants: build() hands out the table at most once.
// Ownership/Lifetime: The builder owns the table until build() succeeds.
// Links: types/TypeTable.hpp
//
//===----------------------------------------------------------------------===//

#include "types/TypeTable.hpp"

namespace sieve::types
{

std::string ExternalSignature::toString() const
{
    std::string out = "(";
    for (size_t i = 0; i < params.size(); ++i)
    {
        if (i)
            out += ", ";
        out += typeName(params[i]);
    }
    return out + ") -> " + typeName(result);
}

bool ExternalSignature::operator==(const ExternalSignature &other) const
{
    if (params.size() != other.params.size() || !sameType(result, other.result))
        return false;
    for (size_t i = 0; i < params.size(); ++i)
    {
        if (!sameType(params[i], other.params[i]))
            return false;
    }
    return true;
}

const ExternalField *ExternalTypeInfo::findField(std::string_view fieldName) const
{
    for (const auto &f : fields)
    {
        if (f.name == fieldName)
            return &f;
    }
    return nullptr;
}

const ExternalMethod *ExternalTypeInfo::findMethod(std::string_view methodName) const
{
    for (const auto &m : methods)
    {
        if (m.name == methodName)
            return &m;
    }
    return nullptr;
}

const ExternalTypeInfo *ExternalTypeTable::findType(std::string_view name) const
{
    auto it = types_.find(name);
    return it == types_.end() ? nullptr : &it->second;
}

const ExternalFunction *ExternalTypeTable::findFunction(std::string_view name) const
{
    auto it = functions_.find(name);
    return it == functions_.end() ? nullptr : &it->second;
}

const ExternalSignature *ExternalTypeTable::findSymbol(std::string_view symbol) const
{
    auto it = symbols_.find(symbol);
    return it == symbols_.end() ? nullptr : &it->second;
}

//===----------------------------------------------------------------------===//
// Builder
//===----------------------------------------------------------------------===//

TypeRef TypeTableBuilder::addType(const std::string &name)
{
    if (make::primitiveByName(name))
    {
        problems_.push_back("external type '" + name + "' shadows a built-in type");
        return make::external(name);
    }
    auto [it, inserted] = table_->types_.try_emplace(name);
    if (!inserted)
    {
        problems_.push_back("external type '" + name + "' registered twice");
        return it->second.type;
    }
    it->second.name = name;
    it->second.type = make::external(name);
    return it->second.type;
}

TypeRef TypeTableBuilder::external(const std::string &name)
{
    auto it = table_->types_.find(name);
    if (it != table_->types_.end())
        return it->second.type;
    return make::external(name);
}

TypeTableBuilder &TypeTableBuilder::addField(const std::string &typeName,
                                             const std::string &fieldName, TypeRef type)
{
    auto it = table_->types_.find(typeName);
    if (it == table_->types_.end())
    {
        problems_.push_back("field '" + fieldName + "' added to unregistered type '" + typeName + "'");
        return *this;
    }
    auto &info = it->second;
    std::string symbol = typeName + "." + fieldName;
    if (info.findField(fieldName) || info.findMethod(fieldName))
    {
        problems_.push_back("member '" + symbol + "' registered twice");
        return *this;
    }
    checkSignatureTypes(symbol, {}, type);
    table_->symbols_[symbol] = ExternalSignature{{info.type}, type};
    info.fields.push_back(ExternalField{fieldName, std::move(type), symbol});
    return *this;
}

TypeTableBuilder &TypeTableBuilder::addMethod(const std::string &typeName,
                                              const std::string &methodName,
                                              std::vector<TypeRef> params, TypeRef result)
{
    auto it = table_->types_.find(typeName);
    if (it == table_->types_.end())
    {
        problems_.push_back("method '" + methodName + "' added to unregistered type '" + typeName +
                            "'");
        return *this;
    }
    auto &info = it->second;
    std::string symbol = typeName + "." + methodName;
    if (info.findField(methodName) || info.findMethod(methodName))
    {
        problems_.push_back("member '" + symbol + "' registered twice");
        return *this;
    }
    checkSignatureTypes(symbol, params, result);
    ExternalSignature sig;
    sig.params.push_back(info.type);
    sig.params.insert(sig.params.end(), params.begin(), params.end());
    sig.result = result;
    table_->symbols_[symbol] = std::move(sig);
    info.methods.push_back(ExternalMethod{methodName, std::move(params), std::move(result), symbol});
    return *this;
}

TypeTableBuilder &TypeTableBuilder::addFunction(const std::string &name,
                                                std::vector<TypeRef> params, TypeRef result)
{
    if (table_->functions_.count(name) || table_->symbols_.count(name))
    {
        problems_.push_back("external function '" + name + "' registered twice");
        return *this;
    }
    checkSignatureTypes(name, params, result);
    table_->symbols_[name] = ExternalSignature{params, result};
    table_->functions_[name] = ExternalFunction{name, std::move(params), std::move(result)};
    return *this;
}

void TypeTableBuilder::checkSignatureTypes(const std::string &owner,
                                           const std::vector<TypeRef> &params,
                                           const TypeRef &result)
{
    for (const auto &p : params)
        checkType(owner, p);
    checkType(owner, result);
}

void TypeTableBuilder::checkType(const std::string &owner, const TypeRef &type)
{
    if (!type)
    {
        problems_.push_back("'" + owner + "' uses a null type");
        return;
    }
    switch (type->kind)
    {
        case TypeKind::External:
            // Externals may be registered after the signature naming them.
            pendingChecks_.emplace_back(owner, type);
            break;
        case TypeKind::List:
            checkType(owner, type->element);
            break;
        case TypeKind::Record:
            for (const auto &f : type->fields)
                checkType(owner, f.type);
            break;
        case TypeKind::Enum:
            for (const auto &v : type->variants)
            {
                if (v.payload)
                    checkType(owner, v.payload);
            }
            break;
        case TypeKind::Function:
        case TypeKind::Error:
            problems_.push_back("'" + owner + "' uses unsupported type '" + type->toString() + "'");
            break;
        default:
            break;
    }
}

support::Result<std::shared_ptr<const ExternalTypeTable>> TypeTableBuilder::build()
{
    if (!table_)
        return support::Result<std::shared_ptr<const ExternalTypeTable>>::error(
            "type table already built");
    for (const auto &[owner, type] : pendingChecks_)
    {
        if (!table_->types_.count(type->name))
            problems_.push_back("'" + owner + "' names unregistered external type '" + type->name +
                                "'");
    }
    pendingChecks_.clear();
    if (!problems_.empty())
    {
        std::string message;
        for (const auto &p : problems_)
        {
            if (!message.empty())
                message += '\n';
            message += p;
        }
        return support::Result<std::shared_ptr<const ExternalTypeTable>>::error(message);
    }
    std::shared_ptr<const ExternalTypeTable> table = std::move(table_);
    return table;
}

} // namespace sieve::types
