//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements batch and interactive processing for the roadman tool.

#include "tools/roadman/session.hpp"

#include "frontend/AstPrinter.hpp"
#include "frontend/Lexer.hpp"
#include "frontend/Parser.hpp"
#include "roadman/version.hpp"
#include "support/diag_expected.hpp"
#include "tools/common/source_loader.hpp"
#include "transpile/Transpiler.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>

namespace roadman::tools
{

namespace
{

roadman::interp::InterpreterOptions makeInterpreterOptions(const CliOptions &opts,
                                                           std::ostream &out,
                                                           std::ostream &err,
                                                           const roadman::support::SourceManager &sm)
{
    roadman::interp::InterpreterOptions io;
    io.out = &out;
    io.trace.mode = opts.trace;
    io.trace.sm = &sm;
    io.traceOut = &err;
    io.maxCallDepth = opts.maxDepth;
    return io;
}

/// @brief Strip leading and trailing whitespace.
std::string trim(const std::string &s)
{
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(s.begin(), s.end(), isSpace);
    auto end = std::find_if_not(s.rbegin(), s.rend(), isSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool isExitCommand(const std::string &line)
{
    std::string lowered = trim(line);
    std::transform(lowered.begin(),
                   lowered.end(),
                   lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "exit()";
}

} // namespace

Session::Session(const CliOptions &opts, std::ostream &out, std::ostream &err)
    : opts_(opts), out_(out), err_(err), sm_(),
      interp_(makeInterpreterOptions(opts, out, err, sm_))
{
}

bool Session::dumpTokens(const std::string &source, uint32_t fileId, std::ostream &sink)
{
    roadman::support::DiagnosticEngine diag;
    for (const auto &tok : roadman::frontend::tokenize(source, fileId, diag))
    {
        sink << tok.loc.line << ':' << tok.loc.column << ' '
             << roadman::frontend::tokenKindToString(tok.kind);
        if (!tok.text.empty())
            sink << ' ' << tok.text;
        sink << '\n';
    }
    diag.printAll(err_, &sm_);
    return diag.errorCount() == 0;
}

bool Session::processUnit(const std::string &source, uint32_t fileId, std::ostream &sink)
{
    roadman::support::DiagnosticEngine diag;

    if (opts_.dumpTokens)
        return dumpTokens(source, fileId, sink);

    auto tokens = roadman::frontend::tokenize(source, fileId, diag);
    if (diag.errorCount() > 0)
    {
        diag.printAll(err_, &sm_);
        return false;
    }

    roadman::frontend::ParserOptions popts;
    popts.recover = opts_.allErrors;
    std::shared_ptr<const roadman::frontend::Program> program =
        roadman::frontend::parse(std::move(tokens), diag, popts);
    if (!program)
    {
        diag.printAll(err_, &sm_);
        return false;
    }

    if (opts_.dumpAst)
    {
        roadman::frontend::AstPrinter printer;
        sink << printer.dump(*program);
        return true;
    }

    if (opts_.transpile)
    {
        std::string text = roadman::transpile::transpile(*program);
        sink << text;
        if (!text.empty())
            sink << '\n';
        return true;
    }

    bool ok = interp_.interpret(std::move(program), diag);
    out_.flush();
    diag.printAll(err_, &sm_);
    return ok;
}

int Session::runFile()
{
    auto loaded = roadman::tools::common::loadSourceBuffer(opts_.sourcePath, sm_);
    if (!loaded)
    {
        roadman::support::printDiag(loaded.error(), err_, &sm_);
        return 1;
    }

    std::ofstream file;
    std::ostream *sink = &out_;
    if (!opts_.outputPath.empty())
    {
        file.open(opts_.outputPath, std::ios::binary);
        if (!file)
        {
            err_ << "error: failed to open output file: " << opts_.outputPath << "\n";
            return 1;
        }
        sink = &file;
    }

    const auto &src = loaded.value();
    return processUnit(src.buffer, src.fileId, *sink) ? 0 : 1;
}

int Session::runRepl(std::istream &in)
{
    const uint32_t fileId = sm_.addFile("<repl>");

    out_ << "Roadman REPL v" << ROADMAN_VERSION_STR << "\n";
    out_ << "Type 'exit()' to quit.\n";

    std::string line;
    while (true)
    {
        out_ << "> " << std::flush;
        if (!std::getline(in, line))
        {
            out_ << "\n";
            break;
        }
        if (isExitCommand(line))
            break;
        if (trim(line).empty())
            continue;
        processUnit(line, fileId, out_);
    }
    return 0;
}

} // namespace roadman::tools
