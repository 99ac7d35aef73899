//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/roadman/cli.hpp
// Purpose: Command-line option model and parser for the roadman tool.
// Key invariants: Parsing never exits the process; the caller acts on the result.
// Ownership/Lifetime: CliOptions owns its strings.
// Links: src/tools/roadman/main.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/Trace.hpp"
#include <cstddef>
#include <ostream>
#include <string>

namespace roadman::tools
{

/// @brief Options accepted by the roadman tool.
struct CliOptions
{
    /// @brief Program to run; empty selects the interactive session.
    std::string sourcePath{};

    /// @brief Destination of transpiled text; empty writes to stdout.
    std::string outputPath{};

    /// @brief Print JavaScript instead of executing.
    bool transpile = false;

    /// @brief Print the token stream instead of executing.
    bool dumpTokens = false;

    /// @brief Print the AST instead of executing.
    bool dumpAst = false;

    /// @brief Keep parsing after a syntax error to report all of them.
    bool allErrors = false;

    /// @brief Trace settings requested via --trace flags.
    roadman::interp::TraceConfig::Mode trace = roadman::interp::TraceConfig::Off;

    /// @brief Maximum nesting of user function calls.
    size_t maxDepth = 1000;
};

/// @brief Outcome of command-line parsing.
enum class CliParseResult
{
    Run,     ///< Options parsed; proceed.
    Help,    ///< -h/--help requested.
    Version, ///< --version requested.
    Error    ///< Malformed command line; a message was written.
};

/// @brief Parse @p argv (including the program name at index 0) into @p opts.
/// @param err Stream receiving `error: ...` lines for malformed input.
CliParseResult parseCli(int argc, char **argv, CliOptions &opts, std::ostream &err);

} // namespace roadman::tools
