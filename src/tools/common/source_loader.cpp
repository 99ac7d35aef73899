//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Reads Roadman source files and registers them for diagnostics.

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace roadman::tools::common
{

using roadman::support::Diagnostic;
using roadman::support::Expected;
using roadman::support::Severity;

Expected<LoadedSource> loadSourceBuffer(const std::string &path, roadman::support::SourceManager &sm)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Expected<LoadedSource>(Diagnostic{Severity::Error, "unable to open " + path, {}, {}});

    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kMaxSourceSize = static_cast<std::streamoff>(64ULL * 1024 * 1024);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
    {
        return Expected<LoadedSource>(Diagnostic{
            Severity::Error, "source file too large: " + path + " (limit: 64 MB)", {}, {}});
    }

    std::string contents;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        contents = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return Expected<LoadedSource>(
            Diagnostic{Severity::Error, "out of memory reading " + path, {}, {}});
    }

    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
    {
        return Expected<LoadedSource>(roadman::support::makeError(
            {}, std::string{roadman::support::kSourceManagerFileIdOverflowMessage}));
    }

    LoadedSource source{};
    source.buffer = std::move(contents);
    source.fileId = fileId;
    return Expected<LoadedSource>(std::move(source));
}

} // namespace roadman::tools::common
