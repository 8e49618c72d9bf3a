//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/HostBindings.hpp
// Purpose: Host callables for external symbols, and attachment of a compiled
//          program to them.
// Key invariants: An Attachment has a callable for every entry of its
//                 program's external-call table, with a matching signature.
// Ownership/Lifetime: Attachments share the program and copy the callables;
//                     they are immutable once created.
// Links: types/TypeTable.hpp, bytecode/BytecodeModule.hpp, vm/BytecodeVM.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/BytecodeModule.hpp"
#include "runtime/Value.hpp"
#include "support/result.hpp"
#include "types/TypeTable.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sieve::vm
{

/// @brief Host implementation of an external field, method or function.
/// @details Methods and fields receive the external object first. Returning
///          an error, or throwing a std::exception, faults the running policy
///          with ExternalCallError.
using ExternalFn =
    std::function<support::Result<runtime::Value>(const std::vector<runtime::Value> &)>;

/// @brief Callables registered by symbol against one external type table.
class HostBindings
{
  public:
    explicit HostBindings(std::shared_ptr<const types::ExternalTypeTable> table);

    /// @brief Bind @p symbol ("Route.prefix", "lookup_peer") to @p fn.
    /// @return False when the table declares no such symbol.
    bool bind(const std::string &symbol, ExternalFn fn);

    /// @brief Callable bound to @p symbol, or nullptr.
    const ExternalFn *find(std::string_view symbol) const;

    const std::shared_ptr<const types::ExternalTypeTable> &table() const
    {
        return table_;
    }

  private:
    std::shared_ptr<const types::ExternalTypeTable> table_;
    std::map<std::string, ExternalFn, std::less<>> fns_;
};

/// @brief A program whose external-call table is bound to host callables.
class Attachment
{
  public:
    const std::shared_ptr<const bytecode::Program> &program() const
    {
        return program_;
    }

    /// @brief Callable for external-call table entry @p index.
    const ExternalFn &binding(uint32_t index) const
    {
        return bindings_[index];
    }

  private:
    friend support::Result<std::shared_ptr<const Attachment>>
    attach(std::shared_ptr<const bytecode::Program> program, const HostBindings &bindings);

    std::shared_ptr<const bytecode::Program> program_;
    std::vector<ExternalFn> bindings_;
};

/// @brief Resolve every external-call entry of @p program against @p bindings.
/// @return The attachment, or every unresolved entry joined by newlines.
support::Result<std::shared_ptr<const Attachment>>
attach(std::shared_ptr<const bytecode::Program> program, const HostBindings &bindings);

} // namespace sieve::vm
