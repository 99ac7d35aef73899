//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic engine shared by the lexer, parser and interpreter.
// Key invariants: Error and warning counters always match the stored diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: src/support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace roadman::support
{

class SourceManager;

enum class Severity
{
    Note,
    Warning,
    Error
};

/// Diagnostic codes per pipeline stage.
inline constexpr const char *kLexErrorCode = "R1000";
inline constexpr const char *kParseErrorCode = "R2000";
inline constexpr const char *kRuntimeErrorCode = "R3000";

struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional source location
    std::string code{};  ///< Stage code such as "R2000"; empty when unclassified
};

/// @brief Collects diagnostics for one execution unit and prints them on demand.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param os Output stream.
    /// @param sm Optional source manager for location info.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    /// @brief Recorded diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

    /// @brief Drop every stored diagnostic and reset the counters.
    void clear();

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

} // namespace roadman::support
