//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/Value.cpp
// Purpose: Value construction, deep equality and debug formatting.
// Key invariants: Equality is structural except for external handles.
// Ownership/Lifetime: Payloads are shared immutable allocations.
// Links: runtime/Value.hpp
//
//===----------------------------------------------------------------------===//

#include "runtime/Value.hpp"

#include <sstream>

namespace sieve::runtime
{

const char *valueKindName(ValueKind kind)
{
    switch (kind)
    {
        case ValueKind::Unit:
            return "Unit";
        case ValueKind::Bool:
            return "Bool";
        case ValueKind::Int:
            return "Int";
        case ValueKind::String:
            return "String";
        case ValueKind::Bytes:
            return "Bytes";
        case ValueKind::Prefix:
            return "Prefix";
        case ValueKind::IpAddr:
            return "IpAddr";
        case ValueKind::Asn:
            return "Asn";
        case ValueKind::Community:
            return "Community";
        case ValueKind::AsPath:
            return "AsPath";
        case ValueKind::List:
            return "List";
        case ValueKind::Record:
            return "Record";
        case ValueKind::Variant:
            return "Variant";
        case ValueKind::External:
            return "External";
    }
    return "?";
}

Value Value::boolean(bool b)
{
    return Value(PayloadTag{}, b);
}

Value Value::integer(int64_t i)
{
    return Value(PayloadTag{}, i);
}

Value Value::string(std::string s)
{
    return Value(PayloadTag{}, std::make_shared<const std::string>(std::move(s)));
}

Value Value::bytes(std::vector<uint8_t> b)
{
    return Value(PayloadTag{}, std::make_shared<const std::vector<uint8_t>>(std::move(b)));
}

Value Value::prefix(const Prefix &p)
{
    return Value(PayloadTag{}, p);
}

Value Value::ipAddr(const IpAddr &ip)
{
    return Value(PayloadTag{}, ip);
}

Value Value::asn(Asn a)
{
    return Value(PayloadTag{}, a);
}

Value Value::community(Community c)
{
    return Value(PayloadTag{}, c);
}

Value Value::asPath(std::vector<Asn> path)
{
    return Value(PayloadTag{}, std::make_shared<const std::vector<Asn>>(std::move(path)));
}

Value Value::list(std::vector<Value> items)
{
    return Value(PayloadTag{}, std::make_shared<const ListData>(ListData{std::move(items)}));
}

Value Value::record(std::vector<Value> fields)
{
    return Value(PayloadTag{}, std::make_shared<const RecordData>(RecordData{std::move(fields)}));
}

Value Value::variant(uint32_t tag, const Value *payload)
{
    VariantData data;
    data.tag = tag;
    if (payload)
    {
        data.hasPayload = true;
        data.payload = *payload;
    }
    return Value(PayloadTag{}, std::make_shared<const VariantData>(std::move(data)));
}

Value Value::external(std::shared_ptr<const ExternalObject> object)
{
    return Value(PayloadTag{}, std::move(object));
}

const std::vector<Value> &Value::asList() const
{
    return std::get<std::shared_ptr<const ListData>>(storage_)->items;
}

const std::vector<Value> &Value::recordFields() const
{
    return std::get<std::shared_ptr<const RecordData>>(storage_)->fields;
}

uint32_t Value::variantTag() const
{
    return std::get<std::shared_ptr<const VariantData>>(storage_)->tag;
}

const Value *Value::variantPayload() const
{
    const auto &data = std::get<std::shared_ptr<const VariantData>>(storage_);
    return data->hasPayload ? &data->payload : nullptr;
}

bool Value::operator==(const Value &other) const
{
    if (kind() != other.kind())
        return false;
    switch (kind())
    {
        case ValueKind::Unit:
            return true;
        case ValueKind::Bool:
            return asBool() == other.asBool();
        case ValueKind::Int:
            return asInt() == other.asInt();
        case ValueKind::String:
            return asString() == other.asString();
        case ValueKind::Bytes:
            return asBytes() == other.asBytes();
        case ValueKind::Prefix:
            return asPrefix() == other.asPrefix();
        case ValueKind::IpAddr:
            return asIpAddr() == other.asIpAddr();
        case ValueKind::Asn:
            return asAsn() == other.asAsn();
        case ValueKind::Community:
            return asCommunity() == other.asCommunity();
        case ValueKind::AsPath:
            return asAsPath() == other.asAsPath();
        case ValueKind::List:
            return asList() == other.asList();
        case ValueKind::Record:
            return recordFields() == other.recordFields();
        case ValueKind::Variant:
        {
            if (variantTag() != other.variantTag())
                return false;
            const Value *a = variantPayload();
            const Value *b = other.variantPayload();
            if (!a || !b)
                return a == b;
            return *a == *b;
        }
        case ValueKind::External:
            return asExternal() == other.asExternal();
    }
    return false;
}

std::string Value::toString() const
{
    std::ostringstream os;
    switch (kind())
    {
        case ValueKind::Unit:
            os << "()";
            break;
        case ValueKind::Bool:
            os << (asBool() ? "true" : "false");
            break;
        case ValueKind::Int:
            os << asInt();
            break;
        case ValueKind::String:
            os << '"' << asString() << '"';
            break;
        case ValueKind::Bytes:
            os << "bytes[" << asBytes().size() << ']';
            break;
        case ValueKind::Prefix:
            os << asPrefix().toString();
            break;
        case ValueKind::IpAddr:
            os << asIpAddr().toString();
            break;
        case ValueKind::Asn:
            os << asAsn().toString();
            break;
        case ValueKind::Community:
            os << asCommunity().toString();
            break;
        case ValueKind::AsPath:
        {
            os << "aspath(";
            const auto &path = asAsPath();
            for (size_t i = 0; i < path.size(); ++i)
                os << (i ? " " : "") << path[i].value;
            os << ')';
            break;
        }
        case ValueKind::List:
        case ValueKind::Record:
        {
            const auto &items = kind() == ValueKind::List ? asList() : recordFields();
            os << (kind() == ValueKind::List ? '[' : '{');
            for (size_t i = 0; i < items.size(); ++i)
                os << (i ? ", " : "") << items[i].toString();
            os << (kind() == ValueKind::List ? ']' : '}');
            break;
        }
        case ValueKind::Variant:
            os << '#' << variantTag();
            if (const Value *payload = variantPayload())
                os << '(' << payload->toString() << ')';
            break;
        case ValueKind::External:
            os << '<' << asExternal()->typeName() << '>';
            break;
    }
    return os.str();
}

} // namespace sieve::runtime
