//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity query for SourceLoc. A location is valid when it refers
// to a file registered with the SourceManager; line and column components are
// optional and surfaced through hasLine() and hasColumn().
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace roadman::support
{

/// @brief Determine whether the location carries a real source attachment.
///
/// @details SourceManager dispenses monotonically increasing identifiers for
///          every unit it registers. The default-constructed location uses zero
///          to mark "unknown", which lets diagnostics elide the path prefix.
///
/// @return True when the location originated from a tracked source unit.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

} // namespace roadman::support
