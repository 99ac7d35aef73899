//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements usage and version output for the `roadman` CLI tool.

#include "tools/roadman/usage.hpp"
#include "roadman/version.hpp"

namespace roadman::tools
{

void printVersion(std::ostream &os)
{
    os << "roadman v" << ROADMAN_VERSION_STR << "\n";
    os << "Roadman language interpreter and JavaScript transpiler\n";
}

void printUsage(std::ostream &os)
{
    os << "roadman v" << ROADMAN_VERSION_STR << " - Roadman interpreter\n"
       << "\n"
       << "Usage: roadman [options] [file.rm]\n"
       << "\n"
       << "Usage Modes:\n"
       << "  roadman                          Start the interactive session\n"
       << "  roadman script.rm                Run program\n"
       << "  roadman script.rm --transpile    Print JavaScript to stdout\n"
       << "  roadman script.rm -o script.js   Write JavaScript to file\n"
       << "\n"
       << "Options:\n"
       << "  -o, --output FILE              Output file for JavaScript (implies --transpile)\n"
       << "  --transpile                    Emit JavaScript instead of running\n"
       << "  --dump-tokens                  Print the token stream\n"
       << "  --dump-ast                     Print the syntax tree\n"
       << "  --all-errors                   Report every syntax error, not just the first\n"
       << "  --trace[=stmt|call]            Enable execution tracing on stderr\n"
       << "  --max-depth N                  Limit function call nesting (default 1000)\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n"
       << "\n"
       << "Roadman Language Notes:\n"
       << "  - 'gimme' declares a variable, 'conste' a constant, 'fam' a function\n"
       << "  - 'innit'/'elseway' branch, 'loopz' loops, 'stopit' breaks, 'returnz' returns\n"
       << "  - say(value) prints a value\n";
}

} // namespace roadman::tools
