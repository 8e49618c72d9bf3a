//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Byte-offset spans and line/column positions for source units.
// Key invariants: Spans are half-open; unit id 0 denotes an unknown unit.
// Ownership/Lifetime: Plain value types.
// Links: support/source_manager.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace sieve::support
{

/// @brief Half-open byte range [begin, end) within one compilation unit.
/// @invariant begin <= end when valid; unit == 0 marks an unknown span.
/// @ownership Value type with no owned resources.
struct SourceSpan
{
    /// @brief Offset of the first byte covered by the span.
    uint32_t begin = 0;

    /// @brief Offset one past the last byte covered by the span.
    uint32_t end = 0;

    /// @brief Compilation unit identifier assigned by the caller of compile().
    uint32_t unit = 0;

    /// @brief Check whether the span references a known unit.
    [[nodiscard]] bool isValid() const
    {
        return unit != 0 && begin <= end;
    }

    /// @brief Number of bytes covered.
    [[nodiscard]] uint32_t length() const
    {
        return end - begin;
    }

    /// @brief Smallest span covering both @p a and @p b.
    /// @details When one side is invalid the other is returned unchanged.
    [[nodiscard]] static SourceSpan join(const SourceSpan &a, const SourceSpan &b)
    {
        if (!a.isValid())
            return b;
        if (!b.isValid())
            return a;
        return SourceSpan{a.begin < b.begin ? a.begin : b.begin, a.end > b.end ? a.end : b.end,
                          a.unit};
    }

    bool operator==(const SourceSpan &) const = default;
};

/// @brief Resolved one-based line/column position, used only for formatting.
struct SourceLoc
{
    uint32_t unit = 0;
    uint32_t line = 0;
    uint32_t column = 0;

    [[nodiscard]] bool isValid() const
    {
        return unit != 0 && line != 0;
    }
};

} // namespace sieve::support
