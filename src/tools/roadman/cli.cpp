//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements argument parsing for the roadman tool.

#include "tools/roadman/cli.hpp"

#include <charconv>
#include <string_view>

namespace roadman::tools
{

namespace
{

/// @brief Parse a positive decimal count; rejects trailing garbage.
bool parseCount(std::string_view text, size_t &out)
{
    const char *begin = text.data();
    const char *end = begin + text.size();
    size_t parsed = 0;
    auto fc = std::from_chars(begin, end, parsed);
    if (fc.ec != std::errc() || fc.ptr != end || parsed == 0)
        return false;
    out = parsed;
    return true;
}

} // namespace

CliParseResult parseCli(int argc, char **argv, CliOptions &opts, std::ostream &err)
{
    using roadman::interp::TraceConfig;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help")
            return CliParseResult::Help;
        if (arg == "--version")
            return CliParseResult::Version;

        if (arg == "--transpile")
        {
            opts.transpile = true;
        }
        else if (arg == "-o" || arg == "--output")
        {
            if (i + 1 >= argc)
            {
                err << "error: " << arg << " requires an output path\n";
                return CliParseResult::Error;
            }
            opts.outputPath = argv[++i];
            opts.transpile = true; // -o implies --transpile
        }
        else if (arg == "--dump-tokens")
        {
            opts.dumpTokens = true;
        }
        else if (arg == "--dump-ast")
        {
            opts.dumpAst = true;
        }
        else if (arg == "--all-errors")
        {
            opts.allErrors = true;
        }
        else if (arg == "--trace" || arg == "--trace=stmt")
        {
            opts.trace = TraceConfig::Stmt;
        }
        else if (arg == "--trace=call")
        {
            opts.trace = TraceConfig::Call;
        }
        else if (arg == "--max-depth")
        {
            if (i + 1 >= argc || !parseCount(argv[i + 1], opts.maxDepth))
            {
                err << "error: --max-depth requires a positive integer\n";
                return CliParseResult::Error;
            }
            ++i;
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            err << "error: unknown option: " << arg << "\n";
            return CliParseResult::Error;
        }
        else
        {
            if (!opts.sourcePath.empty())
            {
                err << "error: multiple source files not supported\n";
                return CliParseResult::Error;
            }
            opts.sourcePath = std::string(arg);
        }
    }

    if (!opts.outputPath.empty() && opts.sourcePath.empty())
    {
        err << "error: --output requires a source file\n";
        return CliParseResult::Error;
    }

    if (static_cast<int>(opts.transpile) + static_cast<int>(opts.dumpTokens) +
            static_cast<int>(opts.dumpAst) >
        1)
    {
        err << "error: --transpile, --dump-tokens and --dump-ast are mutually exclusive\n";
        return CliParseResult::Error;
    }
    return CliParseResult::Run;
}

} // namespace roadman::tools
