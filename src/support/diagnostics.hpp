//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic engine shared by every compilation stage.
// Key invariants: Diagnostics keep report order; counts reflect reported items.
// Ownership/Lifetime: Engine owns collected diagnostics; one engine per
//                     compilation call.
// Links: support/source_location.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

/// @brief Records diagnostics from lexing through code generation.
/// @invariant Counts reflect reported diagnostics.
/// @ownership Owns stored diagnostic messages.
namespace sieve::support
{

class SourceManager;

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Warning,
    Error
};

/// @brief Classification tag carried by every diagnostic.
enum class DiagKind
{
    LexError,
    ParseError,
    UndefinedSymbol,
    UndefinedType,
    TypeMismatch,
    ArityMismatch,
    DuplicateDeclaration,
    UnknownField,
    MissingField,
    UnknownVariant,
    UnknownMethod,
    NonExhaustiveMatch,
    UnreachableCode,
    MissingReturn,
    MissingTerminalAction,
    InvalidAction,
    InvalidAssignment,
    RecursiveCall,
    UnusedDeclaration,
    InternalError,
};

/// @brief Stable spelling of @p kind, e.g. "TypeMismatch".
const char *diagKindName(DiagKind kind);

/// @brief A span with a short explanation attached to a diagnostic.
struct DiagLabel
{
    SourceSpan span;
    std::string message;
};

/// @brief Single diagnostic with one or more labelled spans.
/// @invariant labels is non-empty; labels.front() is the primary location.
struct Diagnostic
{
    Severity severity = Severity::Error; ///< Message severity
    DiagKind kind = DiagKind::InternalError;
    std::string message;           ///< Human-readable text
    std::vector<DiagLabel> labels; ///< Primary label first

    /// @brief Span of the primary label, or an invalid span.
    [[nodiscard]] SourceSpan span() const
    {
        return labels.empty() ? SourceSpan{} : labels.front().span;
    }
};

/// @brief Build an error diagnostic with a single primary label.
Diagnostic makeError(DiagKind kind, std::string message, SourceSpan span,
                     std::string label = {});

/// @brief Build a warning diagnostic with a single primary label.
Diagnostic makeWarning(DiagKind kind, std::string message, SourceSpan span,
                       std::string label = {});

/// @brief Render @p d as "unit:line:col: error[Kind]: message".
/// @param sm Optional source manager used to resolve unit names and lines.
std::string formatDiagnostic(const Diagnostic &d, const SourceManager *sm = nullptr);

/// @brief Collects diagnostics in report order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os, one per line.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

    bool hasErrors() const
    {
        return errors_ != 0;
    }

    /// @brief All diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Move the collected diagnostics out, leaving the engine empty.
    std::vector<Diagnostic> take();

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};
} // namespace sieve::support
