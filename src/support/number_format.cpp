//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements shortest round-trip number rendering on top of std::to_chars.
//
//===----------------------------------------------------------------------===//

#include "support/number_format.hpp"

#include <charconv>
#include <cmath>

namespace roadman::support
{

std::string formatNumber(double value)
{
    if (std::isnan(value))
        return "nan";
    if (std::isinf(value))
        return value < 0 ? "-inf" : "inf";

    char buf[64];
    double mag = std::fabs(value);
    bool fixed = mag == 0.0 || (mag >= 1e-4 && mag < 1e16);
    auto res = std::to_chars(buf,
                             buf + sizeof(buf),
                             value,
                             fixed ? std::chars_format::fixed : std::chars_format::scientific);
    std::string out(buf, res.ptr);
    if (fixed && out.find('.') == std::string::npos)
        out += ".0";
    return out;
}

} // namespace roadman::support
