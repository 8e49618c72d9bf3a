//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/Builtins.hpp
// Purpose: Built-in methods on primitive and list receivers: their typed
//          signatures (for the checker) and their implementations (for the VM).
// Key invariants: Builtin ids are stable bytecode operands; every builtin is
//                 total over well-typed arguments.
// Ownership/Lifetime: Static tables.
// Links: frontends/sieve/Sema_Expr.cpp, vm/BytecodeVM.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/Value.hpp"
#include "types/Types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace sieve::runtime
{

/// @brief Identifier of a built-in method, encoded in CALL_BUILTIN.
enum class BuiltinId : uint16_t
{
    PrefixLen,
    PrefixAddr,
    PrefixIsV4,
    PrefixContains,
    IpIsV4,
    IpIsV6,
    ListLen,
    ListIsEmpty,
    ListContains,
    StringLen,
    StringStartsWith,
    StringContains,
    BytesLen,
    CommunityAsn,
    CommunityValue,
    AsnToInt,
    AsPathLen,
    AsPathContains,
    AsPathOrigin,
    AsPathIsEmpty,
};

/// @brief Number of builtin ids.
inline constexpr uint16_t kBuiltinCount = static_cast<uint16_t>(BuiltinId::AsPathIsEmpty) + 1;

/// @brief Resolved builtin for a concrete receiver type.
struct BuiltinSignature
{
    BuiltinId id;
    std::vector<types::TypeRef> params; ///< Excluding the receiver.
    types::TypeRef result;
};

/// @brief Look up method @p name on a receiver of type @p receiver.
std::optional<BuiltinSignature> lookupBuiltin(const types::TypeRef &receiver,
                                              std::string_view name);

/// @brief Method name of @p id, e.g. "len".
const char *builtinName(BuiltinId id);

/// @brief Operand count of @p id including the receiver.
unsigned builtinArity(BuiltinId id);

/// @brief Evaluate builtin @p id over @p args (receiver first).
/// @return False when the argument kinds do not fit the builtin.
bool invokeBuiltin(BuiltinId id, const Value *args, Value &out);

} // namespace sieve::runtime
