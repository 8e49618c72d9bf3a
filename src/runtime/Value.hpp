//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/Value.hpp
// Purpose: Tagged runtime value manipulated by the VM and passed across the
//          host boundary.
// Key invariants: kind() always matches the engaged storage alternative;
//                 variable-size payloads are immutable once shared.
// Ownership/Lifetime: Scalars are stored inline; strings, byte strings, AS
//                     paths, lists, records, variants and external objects are
//                     reference counted, so copying a Value never deep-copies.
// Links: runtime/NetTypes.hpp, vm/BytecodeVM.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/NetTypes.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sieve::runtime
{

/// @brief Discriminator of Value. Order matches the storage alternatives.
enum class ValueKind : uint8_t
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
    Variant,
    External,
};

/// @brief Stable spelling of @p kind.
const char *valueKindName(ValueKind kind);

/// @brief Base class for host objects handed to policies as external values.
/// @details Hosts derive from this class for each registered external type.
///          The VM never looks inside; it only forwards the handle to host
///          callables.
class ExternalObject
{
  public:
    virtual ~ExternalObject() = default;

    /// @brief Registered external type name of this object, e.g. "Route".
    virtual std::string_view typeName() const = 0;
};

struct ListData;
struct RecordData;
struct VariantData;

/// @brief A runtime value.
class Value
{
  public:
    /// @brief Constructs the Unit value.
    Value() = default;

    static Value unit()
    {
        return Value();
    }

    static Value boolean(bool b);
    static Value integer(int64_t i);
    static Value string(std::string s);
    static Value bytes(std::vector<uint8_t> b);
    static Value prefix(const Prefix &p);
    static Value ipAddr(const IpAddr &ip);
    static Value asn(Asn a);
    static Value community(Community c);
    static Value asPath(std::vector<Asn> path);
    static Value list(std::vector<Value> items);

    /// @brief Record whose @p fields are ordered like the record type's fields.
    static Value record(std::vector<Value> fields);

    /// @brief Enum variant @p tag, optionally carrying @p payload.
    static Value variant(uint32_t tag, const Value *payload = nullptr);

    static Value external(std::shared_ptr<const ExternalObject> object);

    ValueKind kind() const
    {
        return static_cast<ValueKind>(storage_.index());
    }

    /// @name Accessors
    /// @pre kind() matches the accessor.
    /// @{
    bool asBool() const
    {
        return std::get<bool>(storage_);
    }

    int64_t asInt() const
    {
        return std::get<int64_t>(storage_);
    }

    const std::string &asString() const
    {
        return *std::get<std::shared_ptr<const std::string>>(storage_);
    }

    const std::vector<uint8_t> &asBytes() const
    {
        return *std::get<std::shared_ptr<const std::vector<uint8_t>>>(storage_);
    }

    const Prefix &asPrefix() const
    {
        return std::get<Prefix>(storage_);
    }

    const IpAddr &asIpAddr() const
    {
        return std::get<IpAddr>(storage_);
    }

    Asn asAsn() const
    {
        return std::get<Asn>(storage_);
    }

    Community asCommunity() const
    {
        return std::get<Community>(storage_);
    }

    const std::vector<Asn> &asAsPath() const
    {
        return *std::get<std::shared_ptr<const std::vector<Asn>>>(storage_);
    }

    const std::vector<Value> &asList() const;
    const std::vector<Value> &recordFields() const;
    uint32_t variantTag() const;

    /// @brief Payload of a variant, or nullptr when the variant has none.
    const Value *variantPayload() const;

    const std::shared_ptr<const ExternalObject> &asExternal() const
    {
        return std::get<std::shared_ptr<const ExternalObject>>(storage_);
    }
    /// @}

    /// @brief Typed access to an external object.
    /// @return nullptr when this is not an external of dynamic type @p T.
    template <typename T> const T *externalAs() const
    {
        if (kind() != ValueKind::External)
            return nullptr;
        return dynamic_cast<const T *>(asExternal().get());
    }

    /// @brief Deep equality; externals compare by identity.
    bool operator==(const Value &other) const;

    /// @brief Debug spelling, e.g. "10.0.0.0/8", "[1, 2]", "{1, true}".
    std::string toString() const;

  private:
    using Storage = std::variant<std::monostate,
                                 bool,
                                 int64_t,
                                 std::shared_ptr<const std::string>,
                                 std::shared_ptr<const std::vector<uint8_t>>,
                                 Prefix,
                                 IpAddr,
                                 Asn,
                                 Community,
                                 std::shared_ptr<const std::vector<Asn>>,
                                 std::shared_ptr<const ListData>,
                                 std::shared_ptr<const RecordData>,
                                 std::shared_ptr<const VariantData>,
                                 std::shared_ptr<const ExternalObject>>;

    struct PayloadTag
    {
    };

    template <typename T> Value(PayloadTag, T &&payload) : storage_(std::forward<T>(payload)) {}

    Storage storage_;
};

struct ListData
{
    std::vector<Value> items;
};

struct RecordData
{
    std::vector<Value> fields;
};

struct VariantData
{
    uint32_t tag = 0;
    bool hasPayload = false;
    Value payload;
};

} // namespace sieve::runtime
