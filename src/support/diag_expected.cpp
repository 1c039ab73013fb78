//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library: the Expected<void> specialisation, severity-to-string mapping and
// the single printer every tool uses so that parse, correlation and driver
// errors share one format.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.

#include "support/diag_expected.hpp"

namespace jnigen::support
{

Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

/// @brief Report whether the Expected<void> represents a successful outcome.
/// @return True if the instance holds no diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
/// @details Callers must check @ref hasValue() first.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
/// @brief Map a diagnostic severity to the lowercase word used when printing.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

Diag makeWarning(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Warning, std::move(msg), loc};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a SourceManager is supplied and the location names a file,
///          the message is prefixed with "<path>:<line>:" (and the column when
///          known) in the usual compiler style. When the manager also holds
///          the file's text, the offending line follows the message, with a
///          caret under the column when one is known.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param sm Optional source manager for mapping file identifiers to paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.isValid())
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.hasLine())
            {
                os << ':' << diag.loc.line;
                if (diag.loc.column != 0)
                {
                    os << ':' << diag.loc.column;
                }
            }
            os << ": ";
        }
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';

    if (!sm || !diag.loc.isValid())
        return;
    const std::string_view line = sm->lineText(diag.loc.file_id, diag.loc.line);
    if (line.empty())
        return;
    os << "    " << line << '\n';
    if (diag.loc.column != 0)
        os << "    " << std::string(diag.loc.column - 1, ' ') << "^\n";
}
} // namespace jnigen::support
