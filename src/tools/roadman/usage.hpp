//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>

namespace roadman::tools
{

/// @brief Print usage information for the `roadman` command.
void printUsage(std::ostream &os);

/// @brief Print tool version information.
void printVersion(std::ostream &os);

} // namespace roadman::tools
