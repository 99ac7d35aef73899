//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file diagnostics.cpp
/// @brief Implements the diagnostic engine responsible for collecting messages.
///
/// @details Every stage of the pipeline reports into one engine per execution
/// unit. Diagnostics are stored until callers explicitly print or inspect them,
/// which lets the command-line driver decide whether a unit may proceed to the
/// next stage.
///
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace roadman::support
{

/// @brief Adds a diagnostic to the engine and updates severity counters.
///
/// @param d Diagnostic to record; moved into the engine's storage.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/// @brief Writes all stored diagnostics to the provided output stream.
///
/// @param os Output stream that receives the formatted diagnostics.
/// @param sm Optional source manager used to translate file identifiers.
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

void DiagnosticEngine::clear()
{
    diags_.clear();
    errors_ = 0;
    warnings_ = 0;
}

} // namespace roadman::support
