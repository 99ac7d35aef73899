//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements error construction and compiler-style printing of diagnostics
// (`path:line:col: severity: message`).
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace roadman::support
{

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

/// @brief Build an error diagnostic with the provided location and message.
///
/// @param loc Source location that triggered the diagnostic, or unknown.
/// @param msg Human-readable description of the problem.
/// @param code Optional stage code.
/// @return Diagnostic populated with error severity and provided context.
Diag makeError(SourceLoc loc, std::string msg, std::string code)
{
    return Diag{Severity::Error, std::move(msg), loc, std::move(code)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a valid location and a SourceManager are available the
///          message is prefixed with `<path>:<line>:<column>: ` in the common
///          compiler diagnostic style. Always emits a trailing newline so
///          multiple diagnostics appear as a contiguous block.
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
            if (diag.loc.line != 0)
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
}

} // namespace roadman::support
