//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/HostBindings.cpp
// Purpose: Symbol binding and attach-time resolution of external calls.
// Key invariants: attach() reports every problem, not only the first.
// Ownership/Lifetime: See HostBindings.hpp.
// Links: vm/HostBindings.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/HostBindings.hpp"

namespace sieve::vm
{

HostBindings::HostBindings(std::shared_ptr<const types::ExternalTypeTable> table)
    : table_(std::move(table))
{
}

bool HostBindings::bind(const std::string &symbol, ExternalFn fn)
{
    if (!table_ || !table_->findSymbol(symbol) || !fn)
        return false;
    fns_[symbol] = std::move(fn);
    return true;
}

const ExternalFn *HostBindings::find(std::string_view symbol) const
{
    auto it = fns_.find(symbol);
    return it == fns_.end() ? nullptr : &it->second;
}

support::Result<std::shared_ptr<const Attachment>>
attach(std::shared_ptr<const bytecode::Program> program, const HostBindings &bindings)
{
    using R = support::Result<std::shared_ptr<const Attachment>>;
    if (!program)
        return R::error("no program to attach");

    std::vector<std::string> problems;
    std::vector<ExternalFn> resolved;
    resolved.reserve(program->externs.size());

    for (const auto &ext : program->externs)
    {
        const types::ExternalSignature *sig =
            bindings.table() ? bindings.table()->findSymbol(ext.symbol) : nullptr;
        if (!sig)
        {
            problems.push_back("external '" + ext.symbol +
                               "' is not registered in the host type table");
            resolved.emplace_back();
            continue;
        }
        if (!(*sig == ext.signature))
        {
            problems.push_back("external '" + ext.symbol + "' was compiled as " +
                               ext.signature.toString() + " but the host declares " +
                               sig->toString());
        }
        const ExternalFn *fn = bindings.find(ext.symbol);
        if (!fn)
        {
            problems.push_back("no host callable bound for external '" + ext.symbol + "'");
            resolved.emplace_back();
            continue;
        }
        resolved.push_back(*fn);
    }

    if (!problems.empty())
    {
        std::string message;
        for (size_t i = 0; i < problems.size(); ++i)
            message += (i ? "\n" : "") + problems[i];
        return R::error(std::move(message));
    }

    auto attachment = std::shared_ptr<Attachment>(new Attachment());
    attachment->program_ = std::move(program);
    attachment->bindings_ = std::move(resolved);
    return std::shared_ptr<const Attachment>(std::move(attachment));
}

} // namespace sieve::vm
