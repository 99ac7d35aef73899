//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/roadman/session.hpp
// Purpose: Drives source units through lexer, parser and one back end.
// Key invariants: A unit with lex or parse errors is never executed or
//                 transpiled. One Interpreter lives for the whole session so
//                 interactive inputs share global state.
// Ownership/Lifetime: Borrows the output and error streams for its lifetime.
// Links: src/tools/roadman/main.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/Interpreter.hpp"
#include "support/source_manager.hpp"
#include "tools/roadman/cli.hpp"

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

namespace roadman::tools
{

class Session
{
  public:
    /// @param opts Parsed command-line options.
    /// @param out Program output, transpiled text and dumps.
    /// @param err Diagnostics and trace lines.
    Session(const CliOptions &opts, std::ostream &out, std::ostream &err);

    /// @brief Batch mode: load and process the file named in the options.
    /// @return Process exit status; 0 on success, 1 on any error.
    int runFile();

    /// @brief Interactive mode: read one unit per line from @p in until
    ///        `exit()` or end of input.
    /// @return Process exit status; always 0.
    int runRepl(std::istream &in);

    /// @brief Process one unit of source text registered under @p fileId.
    /// @param sink Stream receiving transpiled text and dumps.
    /// @return True when the unit produced no error diagnostics.
    bool processUnit(const std::string &source, uint32_t fileId, std::ostream &sink);

    /// @brief Source manager owning the file names of every processed unit.
    roadman::support::SourceManager &sourceManager()
    {
        return sm_;
    }

  private:
    bool dumpTokens(const std::string &source, uint32_t fileId, std::ostream &sink);

    CliOptions opts_;
    std::ostream &out_;
    std::ostream &err_;
    roadman::support::SourceManager sm_;
    roadman::interp::Interpreter interp_;
};

} // namespace roadman::tools
