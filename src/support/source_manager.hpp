//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Registry of compilation units (name + text) keyed by unit id.
// Key invariants: Unit id 0 is invalid; ids are never reused.
// Ownership/Lifetime: Owns copies of unit names and text.
// Links: support/source_location.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace sieve::support
{

/// Maintains the mapping between unit identifiers and their text so spans can
/// be converted to line/column positions for display.
class SourceManager
{
  public:
    /// @brief Register a unit under the explicit identifier @p unit.
    /// @details Re-registering an identifier replaces its text.
    void addUnit(uint32_t unit, std::string name, std::string text);

    /// @brief Register a unit and return a fresh identifier (> 0).
    uint32_t addUnit(std::string name, std::string text);

    /// @brief Name registered for @p unit, or "<unknown>".
    std::string_view name(uint32_t unit) const;

    /// @brief Source text registered for @p unit, or empty.
    std::string_view text(uint32_t unit) const;

    /// @brief Convert the start of @p span to a line/column position.
    SourceLoc locate(const SourceSpan &span) const;

  private:
    struct Unit
    {
        uint32_t id = 0;
        std::string name;
        std::string text;
        std::vector<uint32_t> lineStarts;
    };

    const Unit *find(uint32_t unit) const;

    std::deque<Unit> units_;
    uint32_t nextId_ = 1;
};

} // namespace sieve::support
