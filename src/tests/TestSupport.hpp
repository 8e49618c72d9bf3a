//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/TestSupport.hpp
// Purpose: Shared fixtures for unit tests: a host "Route" type, its type
//          table and bindings, and compile/run helpers.
// Key invariants: Helpers never hide diagnostics; callers inspect them.
// Ownership/Lifetime: Helpers return owning values; bindings capture a shared
//                     call log that outlives every attachment built from it.
// Links: include/sieve/Sieve.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/sieve/Compiler.hpp"
#include "runtime/NetTypes.hpp"
#include "runtime/Value.hpp"
#include "support/diagnostics.hpp"
#include "types/TypeTable.hpp"
#include "vm/BytecodeVM.hpp"
#include "vm/HostBindings.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sieve::test
{

/// @brief Host route handed to policies as the external type "Route".
class RouteObject : public runtime::ExternalObject
{
  public:
    runtime::Prefix prefix;
    std::vector<runtime::Asn> asPath;
    std::vector<runtime::Community> communities;

    std::string_view typeName() const override
    {
        return "Route";
    }
};

inline runtime::Prefix prefix(std::string_view text)
{
    auto p = runtime::Prefix::parse(text);
    if (!p)
        throw std::invalid_argument("bad prefix in test: " + std::string(text));
    return *p;
}

inline runtime::Value makeRoute(std::string_view prefixText,
                                std::vector<uint32_t> path = {},
                                std::vector<runtime::Community> communities = {})
{
    auto route = std::make_shared<RouteObject>();
    route->prefix = prefix(prefixText);
    for (uint32_t asn : path)
        route->asPath.push_back(runtime::Asn{asn});
    route->communities = std::move(communities);
    return runtime::Value::external(std::move(route));
}

/// @brief Type table with Route { prefix, as_path, communities,
///        has_community(Community) } and lookup_peer(Asn) -> String.
inline std::shared_ptr<const types::ExternalTypeTable> routeTable()
{
    namespace ty = types::make;
    types::TypeTableBuilder builder;
    builder.addType("Route");
    builder.addField("Route", "prefix", ty::prefix())
        .addField("Route", "as_path", ty::asPath())
        .addField("Route", "communities", ty::list(ty::community()))
        .addMethod("Route", "has_community", {ty::community()}, ty::boolean())
        .addFunction("lookup_peer", {ty::asn()}, ty::string());
    auto table = builder.build();
    if (!table.isOk())
        throw std::logic_error(table.error());
    return table.value();
}

/// @brief Number of host calls per symbol, shared with the bindings.
struct CallLog
{
    std::map<std::string, int> calls;

    int count(const std::string &symbol) const
    {
        auto it = calls.find(symbol);
        return it == calls.end() ? 0 : it->second;
    }
};

inline const RouteObject *asRoute(const runtime::Value &v)
{
    return v.externalAs<RouteObject>();
}

/// @brief Bindings for every symbol of routeTable(); lookup_peer fails for AS0.
inline vm::HostBindings routeBindings(std::shared_ptr<const types::ExternalTypeTable> table,
                                      std::shared_ptr<CallLog> log)
{
    using runtime::Value;
    using R = support::Result<Value>;
    vm::HostBindings bindings(std::move(table));

    bindings.bind("Route.prefix", [log](const std::vector<Value> &args) -> R {
        ++log->calls["Route.prefix"];
        return Value::prefix(asRoute(args[0])->prefix);
    });
    bindings.bind("Route.as_path", [log](const std::vector<Value> &args) -> R {
        ++log->calls["Route.as_path"];
        return Value::asPath(asRoute(args[0])->asPath);
    });
    bindings.bind("Route.communities", [log](const std::vector<Value> &args) -> R {
        ++log->calls["Route.communities"];
        std::vector<Value> items;
        for (const auto &c : asRoute(args[0])->communities)
            items.push_back(Value::community(c));
        return Value::list(std::move(items));
    });
    bindings.bind("Route.has_community", [log](const std::vector<Value> &args) -> R {
        ++log->calls["Route.has_community"];
        const auto &cs = asRoute(args[0])->communities;
        bool found = std::find(cs.begin(), cs.end(), args[1].asCommunity()) != cs.end();
        return Value::boolean(found);
    });
    bindings.bind("lookup_peer", [log](const std::vector<Value> &args) -> R {
        ++log->calls["lookup_peer"];
        if (args[0].asAsn().value == 0)
            return R::error("no peer for AS0");
        return Value::string("peer-" + args[0].asAsn().toString());
    });
    return bindings;
}

inline frontend::CompilerResult compileSource(
    std::string_view source,
    std::shared_ptr<const types::ExternalTypeTable> table = routeTable())
{
    frontend::CompilerInput input;
    input.source = source;
    input.unitName = "test.sieve";
    input.types = std::move(table);
    return frontend::compile(input, {});
}

/// @brief Count diagnostics of @p kind.
inline size_t countKind(const support::DiagnosticEngine &diag, support::DiagKind kind)
{
    return static_cast<size_t>(std::count_if(diag.diagnostics().begin(), diag.diagnostics().end(),
                                             [kind](const support::Diagnostic &d) {
                                                 return d.kind == kind;
                                             }));
}

/// @brief All diagnostics rendered one per line, for failure messages.
inline std::string renderAll(const frontend::CompilerResult &result)
{
    std::string out;
    for (const auto &d : result.diagnostics.diagnostics())
        out += support::formatDiagnostic(d, &result.sources) + "\n";
    return out;
}

/// @brief A compiled and attached policy plus the host call log.
struct Harness
{
    frontend::CompilerResult compiled;
    std::shared_ptr<CallLog> log = std::make_shared<CallLog>();
    std::shared_ptr<const vm::Attachment> attachment;

    explicit Harness(std::string_view source)
    {
        auto table = routeTable();
        compiled = compileSource(source, table);
        if (!compiled.succeeded())
            throw std::runtime_error("compilation failed:\n" + renderAll(compiled));
        auto attached = vm::attach(compiled.program, routeBindings(table, log));
        if (!attached.isOk())
            throw std::runtime_error("attach failed: " + attached.error());
        attachment = attached.value();
    }

    vm::RunOutcome run(std::string_view entry, const vm::RuntimeContext &context,
                       vm::RunConfig config = {}) const
    {
        vm::BytecodeVM machine(config);
        return machine.run(*attachment, entry, context);
    }

    /// @brief Run @p entry with the single input `route`.
    vm::RunOutcome runRoute(std::string_view entry, runtime::Value route) const
    {
        vm::RuntimeContext context;
        context.set("route", std::move(route));
        return run(entry, context);
    }
};

} // namespace sieve::test
