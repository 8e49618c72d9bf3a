//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: types/TypeTable.hpp
// Purpose: Host registration of opaque external types, their fields and
//          methods, and free external functions.
// Key invariants: An ExternalTypeTable is immutable once built; every external
//                 type named by a signature is registered in the same table;
//                 symbol names are unique.
// Ownership/Lifetime: Built tables are shared through
//                     std::shared_ptr<const ExternalTypeTable> and may be used
//                     by any number of concurrent compilations.
// Links: types/Types.hpp, vm/HostBindings.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/result.hpp"
#include "types/Types.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sieve::types
{

/// @brief Calling signature of an external symbol.
/// @details For fields and methods the receiver is the first parameter.
struct ExternalSignature
{
    std::vector<TypeRef> params;
    TypeRef result;

    /// @brief Spelling such as "(Route, Community) -> Bool".
    std::string toString() const;

    bool operator==(const ExternalSignature &other) const;
};

/// @brief Read-only field exposed by an external type.
struct ExternalField
{
    std::string name;
    TypeRef type;
    std::string symbol; ///< "<Type>.<field>"
};

/// @brief Method exposed by an external type (receiver excluded from params).
struct ExternalMethod
{
    std::string name;
    std::vector<TypeRef> params;
    TypeRef result;
    std::string symbol; ///< "<Type>.<method>"
};

/// @brief One registered opaque type.
struct ExternalTypeInfo
{
    std::string name;
    TypeRef type;
    std::vector<ExternalField> fields;
    std::vector<ExternalMethod> methods;

    const ExternalField *findField(std::string_view fieldName) const;
    const ExternalMethod *findMethod(std::string_view methodName) const;
};

/// @brief Free function provided by the host.
struct ExternalFunction
{
    std::string name;
    std::vector<TypeRef> params;
    TypeRef result;
};

/// @brief Closed, immutable table consulted by the checker and code generator.
class ExternalTypeTable
{
  public:
    const ExternalTypeInfo *findType(std::string_view name) const;

    const ExternalFunction *findFunction(std::string_view name) const;

    /// @brief Signature of symbol @p symbol ("Route.prefix", "lookup_peer").
    const ExternalSignature *findSymbol(std::string_view symbol) const;

    /// @brief Registered types in name order.
    const std::map<std::string, ExternalTypeInfo, std::less<>> &typesByName() const
    {
        return types_;
    }

    /// @brief Every symbol with its signature in name order.
    const std::map<std::string, ExternalSignature, std::less<>> &symbols() const
    {
        return symbols_;
    }

  private:
    friend class TypeTableBuilder;

    std::map<std::string, ExternalTypeInfo, std::less<>> types_;
    std::map<std::string, ExternalFunction, std::less<>> functions_;
    std::map<std::string, ExternalSignature, std::less<>> symbols_;
};

/// @brief Incremental registration API producing an ExternalTypeTable.
/// @details Registration mistakes (duplicate names, members on unknown types,
///          signatures naming unregistered externals) are collected and
///          reported together by build().
class TypeTableBuilder
{
  public:
    /// @brief Register opaque type @p name and return its handle.
    TypeRef addType(const std::string &name);

    /// @brief Handle for external type @p name for use in signatures.
    /// @details The type must be registered before build() is called.
    TypeRef external(const std::string &name);

    TypeTableBuilder &addField(const std::string &typeName, const std::string &fieldName,
                               TypeRef type);

    TypeTableBuilder &addMethod(const std::string &typeName, const std::string &methodName,
                                std::vector<TypeRef> params, TypeRef result);

    TypeTableBuilder &addFunction(const std::string &name, std::vector<TypeRef> params,
                                  TypeRef result);

    /// @brief Finalize the table. The builder is spent afterwards.
    /// @return The table, or every registration problem joined by newlines.
    support::Result<std::shared_ptr<const ExternalTypeTable>> build();

  private:
    void checkSignatureTypes(const std::string &owner, const std::vector<TypeRef> &params,
                             const TypeRef &result);
    void checkType(const std::string &owner, const TypeRef &type);

    std::shared_ptr<ExternalTypeTable> table_ = std::make_shared<ExternalTypeTable>();
    std::vector<std::string> problems_;
    std::vector<std::pair<std::string, TypeRef>> pendingChecks_;
};

} // namespace sieve::types
