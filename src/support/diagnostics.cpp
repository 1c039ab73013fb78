//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @details
 *     The engine aggregates warnings and errors produced while one Java file
 *     is parsed, correlated and emitted, and keeps track of severity counts.
 *     Diagnostics are stored until the driver prints or inspects them.
 */

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace jnigen::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so engine output and one-off
 * diagnostics look identical.
 *
 * @param os Output stream that receives the formatted diagnostics.
 * @param sm Optional source manager used to translate file identifiers.
 */
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

const std::vector<Diagnostic> &DiagnosticEngine::diagnostics() const
{
    return diags_;
}
} // namespace jnigen::support
