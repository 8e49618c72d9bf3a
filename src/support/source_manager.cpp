//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.cpp
// Purpose: Unit registration and offset to line/column translation.
// Key invariants: Line start tables are computed once per registration.
// Ownership/Lifetime: SourceManager owns all registered text.
// Links: support/source_manager.hpp
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include <algorithm>

namespace sieve::support
{

namespace
{
std::vector<uint32_t> computeLineStarts(std::string_view text)
{
    std::vector<uint32_t> starts{0};
    for (uint32_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\n')
            starts.push_back(i + 1);
    }
    return starts;
}
} // namespace

void SourceManager::addUnit(uint32_t unit, std::string name, std::string text)
{
    for (auto &u : units_)
    {
        if (u.id == unit)
        {
            u.name = std::move(name);
            u.text = std::move(text);
            u.lineStarts = computeLineStarts(u.text);
            return;
        }
    }
    Unit u;
    u.id = unit;
    u.name = std::move(name);
    u.text = std::move(text);
    u.lineStarts = computeLineStarts(u.text);
    units_.push_back(std::move(u));
    if (unit >= nextId_)
        nextId_ = unit + 1;
}

uint32_t SourceManager::addUnit(std::string name, std::string text)
{
    uint32_t id = nextId_;
    addUnit(id, std::move(name), std::move(text));
    return id;
}

const SourceManager::Unit *SourceManager::find(uint32_t unit) const
{
    for (const auto &u : units_)
    {
        if (u.id == unit)
            return &u;
    }
    return nullptr;
}

std::string_view SourceManager::name(uint32_t unit) const
{
    const Unit *u = find(unit);
    return u ? std::string_view(u->name) : std::string_view("<unknown>");
}

std::string_view SourceManager::text(uint32_t unit) const
{
    const Unit *u = find(unit);
    return u ? std::string_view(u->text) : std::string_view();
}

SourceLoc SourceManager::locate(const SourceSpan &span) const
{
    const Unit *u = find(span.unit);
    if (!u)
        return {};
    auto it = std::upper_bound(u->lineStarts.begin(), u->lineStarts.end(), span.begin);
    auto line = static_cast<uint32_t>(it - u->lineStarts.begin());
    uint32_t column = span.begin - u->lineStarts[line - 1] + 1;
    return SourceLoc{span.unit, line, column};
}

} // namespace sieve::support
