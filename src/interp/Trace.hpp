//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Trace.hpp
// Purpose: Declare tracing configuration and sink for interpreter execution.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value and borrows its stream.
// Links: src/interp/Interpreter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>

namespace roadman::support
{
class SourceManager;
} // namespace roadman::support

namespace roadman::frontend
{
struct Stmt;
} // namespace roadman::frontend

namespace roadman::interp
{

/// @brief Configuration for interpreter tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,  ///< Tracing disabled
        Stmt, ///< One line per executed statement
        Call  ///< One line per function entry and exit
    } mode{Off};

    /// @brief Optional source manager for resolving file paths.
    const roadman::support::SourceManager *sm = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg writing to @p os.
    /// @param os Destination stream; null selects std::cerr.
    explicit TraceSink(TraceConfig cfg = {}, std::ostream *os = nullptr);

    /// @brief Record execution of statement @p stmt (Stmt mode).
    void onStmt(const frontend::Stmt &stmt);

    /// @brief Record entry into function @p name at call depth @p depth (Call mode).
    void onCall(const std::string &name, size_t depth);

    /// @brief Record exit from function @p name (Call mode).
    void onReturn(const std::string &name);

  private:
    TraceConfig cfg;
    std::ostream *os;
};

} // namespace roadman::interp
