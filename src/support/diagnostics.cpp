//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.cpp
// Purpose: Implements the diagnostic engine and the plain-text formatter.
// Key invariants: Error and warning counters match the stored diagnostics.
// Ownership/Lifetime: Engine owns its diagnostics until take() is called.
// Links: support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <sstream>
#include <utility>

namespace sieve::support
{

const char *diagKindName(DiagKind kind)
{
    switch (kind)
    {
        case DiagKind::LexError:
            return "LexError";
        case DiagKind::ParseError:
            return "ParseError";
        case DiagKind::UndefinedSymbol:
            return "UndefinedSymbol";
        case DiagKind::UndefinedType:
            return "UndefinedType";
        case DiagKind::TypeMismatch:
            return "TypeMismatch";
        case DiagKind::ArityMismatch:
            return "ArityMismatch";
        case DiagKind::DuplicateDeclaration:
            return "DuplicateDeclaration";
        case DiagKind::UnknownField:
            return "UnknownField";
        case DiagKind::MissingField:
            return "MissingField";
        case DiagKind::UnknownVariant:
            return "UnknownVariant";
        case DiagKind::UnknownMethod:
            return "UnknownMethod";
        case DiagKind::NonExhaustiveMatch:
            return "NonExhaustiveMatch";
        case DiagKind::UnreachableCode:
            return "UnreachableCode";
        case DiagKind::MissingReturn:
            return "MissingReturn";
        case DiagKind::MissingTerminalAction:
            return "MissingTerminalAction";
        case DiagKind::InvalidAction:
            return "InvalidAction";
        case DiagKind::InvalidAssignment:
            return "InvalidAssignment";
        case DiagKind::RecursiveCall:
            return "RecursiveCall";
        case DiagKind::UnusedDeclaration:
            return "UnusedDeclaration";
        case DiagKind::InternalError:
            return "InternalError";
    }
    return "Unknown";
}

Diagnostic makeError(DiagKind kind, std::string message, SourceSpan span, std::string label)
{
    Diagnostic d;
    d.severity = Severity::Error;
    d.kind = kind;
    d.message = std::move(message);
    d.labels.push_back(DiagLabel{span, std::move(label)});
    return d;
}

Diagnostic makeWarning(DiagKind kind, std::string message, SourceSpan span, std::string label)
{
    Diagnostic d = makeError(kind, std::move(message), span, std::move(label));
    d.severity = Severity::Warning;
    return d;
}

std::string formatDiagnostic(const Diagnostic &d, const SourceManager *sm)
{
    std::ostringstream os;
    SourceSpan span = d.span();
    if (sm && span.isValid())
    {
        SourceLoc loc = sm->locate(span);
        os << sm->name(span.unit) << ':' << loc.line << ':' << loc.column << ": ";
    }
    else if (span.isValid())
    {
        os << '@' << span.begin << ".." << span.end << ": ";
    }
    os << (d.severity == Severity::Error ? "error" : "warning") << '[' << diagKindName(d.kind)
       << "]: " << d.message;
    return os.str();
}

/// @brief Adds a diagnostic to the engine and updates severity counters.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else
        ++warnings_;
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
        os << formatDiagnostic(d, sm) << '\n';
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

std::vector<Diagnostic> DiagnosticEngine::take()
{
    errors_ = 0;
    warnings_ = 0;
    return std::exchange(diags_, {});
}

} // namespace sieve::support
