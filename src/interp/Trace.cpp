//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Trace.cpp
// Purpose: Implement deterministic execution tracing for the interpreter.
// Key invariants: Each traced event produces exactly one flushed line prefixed
//                 with "[trace] "; emission honours TraceConfig::mode.
// Ownership/Lifetime: Trace sinks borrow an externally owned stream.
//
//===----------------------------------------------------------------------===//

#include "interp/Trace.hpp"

#include "frontend/AST.hpp"
#include "support/source_manager.hpp"
#include <iostream>

namespace roadman::interp
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig cfg, std::ostream *os) : cfg(cfg), os(os ? os : &std::cerr) {}

void TraceSink::onStmt(const frontend::Stmt &stmt)
{
    if (cfg.mode != TraceConfig::Stmt)
        return;

    *os << "[trace] ";
    if (cfg.sm)
    {
        auto path = cfg.sm->getPath(stmt.loc.file_id);
        if (!path.empty())
            *os << path << ':';
    }
    *os << stmt.loc.line << ':' << stmt.loc.column << ' ' << frontend::stmtKindName(stmt.kind)
        << std::endl;
}

void TraceSink::onCall(const std::string &name, size_t depth)
{
    if (cfg.mode != TraceConfig::Call)
        return;
    *os << "[trace] call " << name << " depth=" << depth << std::endl;
}

void TraceSink::onReturn(const std::string &name)
{
    if (cfg.mode != TraceConfig::Call)
        return;
    *os << "[trace] return " << name << std::endl;
}

} // namespace roadman::interp
