//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides diagnostic helpers and a lightweight Expected container.
// Key invariants: An Expected holds either a value or exactly one diagnostic.
// Ownership/Lifetime: Expected owns its value or diagnostic payload.
// Links: src/support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace roadman::support
{

using Diag = Diagnostic;

/// @brief Result of a fallible operation: a value of @p T or a diagnostic.
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Enabled only when the value does not decay to Diag so the two
    ///          constructors never collide.
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding diagnostic @p diag.
    Expected(Diag diag) : error_(std::move(diag)) {}

    /// @brief Check whether a value is present.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the diagnostic describing the failure; requires !hasValue().
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

namespace detail
{
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Build an error diagnostic located at @p loc.
Diag makeError(SourceLoc loc, std::string msg, std::string code = {});

/// @brief Print @p diag as `path:line:col: severity: message`.
/// @param sm Optional source manager used to resolve the path prefix.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);

} // namespace roadman::support
