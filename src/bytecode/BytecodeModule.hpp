//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bytecode/BytecodeModule.hpp
// Purpose: Compiled program container: functions, constant pool and the
//          external-call table.
// Key invariants: Constant pool entries are deduplicated (equal value, same
//                 index). Function indices match the IR and the checker.
// Ownership/Lifetime: Built by BytecodeCompiler, then frozen and shared as
//                     std::shared_ptr<const Program>.
// Links: bytecode/Bytecode.hpp, bytecode/BytecodeCompiler.hpp,
//        vm/BytecodeVM.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Bytecode.hpp"
#include "ir/IR.hpp"
#include "runtime/Value.hpp"
#include "types/TypeTable.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sieve::bytecode
{

namespace detail
{

/// @brief Find or add a value to a pool with deduplication.
/// @details Linear scan for an existing match; appends when none is found.
template <typename T, typename Eq>
inline uint32_t findOrAddToPool(std::vector<T> &pool, const T &value, Eq eq)
{
    for (size_t i = 0; i < pool.size(); ++i)
    {
        if (eq(pool[i], value))
        {
            return static_cast<uint32_t>(i);
        }
    }
    uint32_t idx = static_cast<uint32_t>(pool.size());
    pool.push_back(value);
    return idx;
}

} // namespace detail

/// @brief A compiled function.
struct BytecodeFunction
{
    std::string name;
    ir::FunctionKind kind = ir::FunctionKind::Function;
    uint32_t numParams = 0;           ///< Parameters occupy locals [0, numParams).
    std::vector<ir::Param> params;    ///< Input names and types.
    types::TypeRef result;            ///< Declared result type.
    uint32_t numLocals = 0;           ///< Named, hidden and temporary slots.
    uint32_t maxStack = 0;            ///< Maximum operand stack depth.
    std::vector<uint32_t> code;       ///< Instruction stream (32-bit words).
};

/// @brief One entry of the external-call table.
/// @details The entry is symbolic; attach() binds it to a host callable.
struct ExternRef
{
    std::string symbol; ///< "Route.prefix", "Route.has_community", "lookup_peer".
    types::ExternalSignature signature;
};

/// @brief A compiled program ready for attachment.
struct BytecodeModule
{
    uint32_t magic = kBytecodeModuleMagic;
    uint32_t version = kBytecodeVersion;

    std::vector<runtime::Value> constants;
    std::vector<BytecodeFunction> functions;
    std::unordered_map<std::string, uint32_t> functionIndex;
    std::vector<ExternRef> externs;
    std::unordered_map<std::string, uint32_t> externIndex;

    const BytecodeFunction *findFunction(std::string_view name) const
    {
        auto it = functionIndex.find(std::string(name));
        if (it != functionIndex.end())
        {
            return &functions[it->second];
        }
        return nullptr;
    }

    uint32_t addFunction(BytecodeFunction fn)
    {
        uint32_t idx = static_cast<uint32_t>(functions.size());
        functionIndex.emplace(fn.name, idx);
        functions.push_back(std::move(fn));
        return idx;
    }

    /// @brief Add a constant, deduplicating by structural equality.
    uint32_t addConstant(const runtime::Value &value)
    {
        return detail::findOrAddToPool(
            constants, value, [](const runtime::Value &a, const runtime::Value &b)
            { return a.kind() == b.kind() && a == b; });
    }

    /// @brief Add an external-call entry, deduplicating by symbol.
    uint32_t addExtern(const std::string &symbol, const types::ExternalSignature &signature)
    {
        auto it = externIndex.find(symbol);
        if (it != externIndex.end())
        {
            return it->second;
        }
        uint32_t idx = static_cast<uint32_t>(externs.size());
        externIndex[symbol] = idx;
        externs.push_back({symbol, signature});
        return idx;
    }
};

/// @brief The compiled artifact handed to hosts.
using Program = BytecodeModule;

} // namespace sieve::bytecode
