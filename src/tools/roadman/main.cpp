//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the roadman command-line tool.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `roadman` CLI tool.
/// @details Parses the command line, then runs a file or the interactive
///          session through a Session bound to the standard streams.

#include "tools/roadman/cli.hpp"
#include "tools/roadman/session.hpp"
#include "tools/roadman/usage.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    using namespace roadman::tools;

    CliOptions opts;
    switch (parseCli(argc, argv, opts, std::cerr))
    {
        case CliParseResult::Run:
            break;
        case CliParseResult::Help:
            printUsage(std::cerr);
            return 0;
        case CliParseResult::Version:
            printVersion(std::cout);
            return 0;
        case CliParseResult::Error:
            std::cerr << "\n";
            printUsage(std::cerr);
            return 1;
    }

    Session session(opts, std::cout, std::cerr);
    if (opts.sourcePath.empty())
        return session.runRepl(std::cin);
    return session.runFile();
}
