//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file diagnostics.cpp
/// @brief Implements the diagnostic engine responsible for collecting messages.
///
/// @details The engine aggregates lexer and parser diagnostics for tools that
///          want to report more than one failure (the REPL keeps one engine
///          per session) and keeps track of severity counts.
///
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace nikl::support
{

/// @brief Adds a diagnostic to the engine and updates severity counters.
///
/// Notes leave both counters unchanged.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/// @brief Writes all stored diagnostics to @p os via printDiag.
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace nikl::support
