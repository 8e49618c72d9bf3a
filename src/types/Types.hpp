//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: types/Types.hpp
// Purpose: Semantic type model shared by the checker, code generator and host
//          registration API.
// Key invariants: Types are immutable once shared; record fields are sorted by
//                 name; primitive types are singletons.
// Ownership/Lifetime: Types are reference counted through TypeRef.
// Links: types/TypeTable.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sieve::types
{

struct SieveType;

/// @brief Shared handle to an immutable semantic type.
using TypeRef = std::shared_ptr<const SieveType>;

/// @brief Discriminator for SieveType.
enum class TypeKind
{
    Unit,
    Bool,
    Int,
    String,
    Bytes,
    Prefix,
    IpAddr,
    Asn,
    Community,
    AsPath,
    List,
    Record,
    Enum,
    Function,
    External,

    /// Recovery type assigned to expressions that failed to check. It is
    /// compatible with every other type so one mistake reports once.
    Error,
};

/// @brief Named record field.
struct FieldType
{
    std::string name;
    TypeRef type;
};

/// @brief Enum variant with an optional payload (null when absent).
struct VariantType
{
    std::string name;
    TypeRef payload;
};

/// @brief A semantic type.
/// @details Records and enums compare structurally; the name is kept for
///          messages only. External types compare by name.
struct SieveType
{
    TypeKind kind = TypeKind::Error;

    /// Declared name for records, enums and externals; empty for anonymous
    /// records and for constructed types.
    std::string name;

    /// Element type of a List.
    TypeRef element;

    /// Record fields sorted by name.
    std::vector<FieldType> fields;

    /// Enum variants in declaration order.
    std::vector<VariantType> variants;

    /// Function parameter types.
    std::vector<TypeRef> params;

    /// Function result type.
    TypeRef result;

    SieveType() = default;

    explicit SieveType(TypeKind k) : kind(k) {}

    SieveType(TypeKind k, std::string n) : kind(k), name(std::move(n)) {}

    bool isError() const
    {
        return kind == TypeKind::Error;
    }

    /// @brief True for the scalar built-in kinds (Unit through AsPath).
    bool isPrimitive() const;

    /// @brief Index of field @p fieldName in a record, if present.
    std::optional<size_t> fieldIndex(std::string_view fieldName) const;

    /// @brief Index of variant @p variantName in an enum, if present.
    std::optional<size_t> variantIndex(std::string_view variantName) const;

    /// @brief Human-readable spelling used in diagnostics, e.g. "List[Int]".
    std::string toString() const;
};

/// @brief Render an optional type handle; null prints as "<unknown>".
std::string typeName(const TypeRef &type);

/// @brief Structural equality (nominal for External).
bool sameType(const TypeRef &a, const TypeRef &b);

/// @brief Whether a value of type @p source may be stored where @p target is
///        expected. No implicit widening exists; Error is compatible both ways.
bool isAssignable(const TypeRef &target, const TypeRef &source);

/// @brief Whether `==` and `!=` apply to values of @p type.
bool isEquatable(const TypeRef &type);

/// @brief Whether `<`, `<=`, `>`, `>=` apply to values of @p type.
bool isOrdered(const TypeRef &type);

namespace make
{

/// @name Primitive singletons
/// @{
TypeRef unit();
TypeRef boolean();
TypeRef integer();
TypeRef string();
TypeRef bytes();
TypeRef prefix();
TypeRef ipAddr();
TypeRef asn();
TypeRef community();
TypeRef asPath();
TypeRef error();
/// @}

/// @brief List with element type @p element.
TypeRef list(TypeRef element);

/// @brief Record type; @p fields are sorted by name on construction.
/// @param name Declared name, empty for anonymous records.
TypeRef record(std::string name, std::vector<FieldType> fields);

/// @brief Enum type with variants in declaration order.
TypeRef enumeration(std::string name, std::vector<VariantType> variants);

/// @brief Function type.
TypeRef function(std::vector<TypeRef> params, TypeRef result);

/// @brief Opaque host type named @p name.
TypeRef external(std::string name);

/// @brief Primitive type spelled @p name in source ("Int", "Prefix", ...).
TypeRef primitiveByName(std::string_view name);

} // namespace make

} // namespace sieve::types
