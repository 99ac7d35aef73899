//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager utility that tracks source units referenced by
// tokens, AST nodes and diagnostics. The manager assigns stable numeric
// identifiers to paths and resolves them back when printing diagnostics.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"
#include "support/diag_expected.hpp"
#include <filesystem>
#include <iostream>
#include <limits>

namespace roadman::support
{

namespace
{

/// @brief Normalize real paths; pseudo-names such as `<repl>` pass through.
std::string normalizePath(std::string path)
{
    if (!path.empty() && path.front() == '<')
        return path;
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}

} // namespace

/// @brief Register a path and assign it a stable identifier.
///
/// @details Identifiers start at one, leaving zero to represent an unknown
///          location. Ownership of the normalized string remains with the
///          manager so callers may hold `std::string_view` references for the
///          manager's lifetime.
///
/// @param path Filesystem path or pseudo-name to store.
/// @return Identifier (>0) representing the stored path, 0 on exhaustion.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));
    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        auto diag = makeError({}, std::string{kSourceManagerFileIdOverflowMessage});
        printDiag(diag, std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

/// @brief Retrieve the canonical path associated with a file identifier.
///
/// @param file_id 1-based identifier previously returned by addFile().
/// @return Stored path, or an empty view if @p file_id is invalid.
std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

} // namespace roadman::support
