//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Load Roadman source files for the command-line tool.
// Key invariants: LoadedSource accurately captures file contents and SourceManager registration.
// Ownership/Lifetime: The caller owns the returned LoadedSource.
// Links: src/support/source_manager.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>

namespace roadman::tools::common
{

/// @brief Result of loading a source file into memory.
struct LoadedSource
{
    std::string buffer; ///< Full contents of the source file.
    uint32_t fileId{0}; ///< Identifier assigned by SourceManager (0 indicates failure).
};

/// @brief Load a source file into memory and register it with the source manager.
///
/// @param path Filesystem path to the source file.
/// @param sm Source manager tracking file identifiers for diagnostics.
/// @return Loaded source buffer on success; otherwise a diagnostic describing
///         the I/O failure or SourceManager overflow.
roadman::support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                          roadman::support::SourceManager &sm);

} // namespace roadman::tools::common
