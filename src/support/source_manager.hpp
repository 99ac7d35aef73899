//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares manager for source unit identifiers.
// Key invariants: File ID 0 is invalid.
// Ownership/Lifetime: Manager owns file path strings.
// Links: src/support/source_location.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace roadman::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// @brief Maps source unit names (file paths, `<stdin>`, `<repl>`) to small ids.
/// @invariant Registering the same normalized path twice yields the same id.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @param path File system path or pseudo-name of an in-memory unit.
    /// @return New file identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @param file_id Identifier returned by addFile().
    /// @return File path string view, empty for unknown identifiers.
    std::string_view getPath(uint32_t file_id) const;

  private:
    /// Stored paths; index + 1 is the file identifier. std::deque keeps
    /// references stable as new files are added.
    std::deque<std::string> files_;

    /// Next identifier to assign; stored as 64-bit to detect overflow safely.
    uint64_t next_file_id_ = 1;

    /// Fast lookup from normalized path to previously assigned identifier.
    std::unordered_map<std::string, uint32_t> path_to_id_;
};

} // namespace roadman::support
