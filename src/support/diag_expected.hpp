//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Expected results for pipeline steps, plus diagnostic constructors
//          and the single-diagnostic printer.
// Key invariants: An Expected holds exactly one of a value or an error Diag.
// Ownership/Lifetime: Expected owns its value or diagnostic.
// Links: support/diagnostics.hpp, support/source_manager.hpp
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

namespace jnigen::support
{
using Diag = Diagnostic;

/// @brief Result of one pipeline step: the produced value or the diagnostic
///        that stopped the step.
/// @details Segment lists, signature lists and loaded file texts travel
///          through the generator in this wrapper; the first failing step's
///          diagnostic is handed to the caller unchanged.
template <class T> class Expected
{
  public:
    /// @brief Wrap a produced value.
    /// @details Disabled for Diag so that returning a diagnostic always selects
    ///          the error constructor.
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Wrap the diagnostic that ended the step.
    Expected(Diag diag) : error_(std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @pre hasValue()
    T &value() &
    {
        return *value_;
    }

    /// @pre hasValue()
    const T &value() const &
    {
        return *value_;
    }

    /// @brief Move the produced value out of a temporary result.
    /// @pre hasValue()
    T &&value() &&
    {
        return std::move(*value_);
    }

    /// @pre !hasValue()
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

/// @brief Result of a step that produces nothing but may fail, such as
///        writing a translation unit or copying JNI headers.
template <> class Expected<void>
{
  public:
    /// @brief Success.
    Expected() = default;

    Expected(Diag diag);

    [[nodiscard]] bool hasValue() const;

    explicit operator bool() const;

    /// @pre !hasValue()
    const Diag &error() const &;

  private:
    std::optional<Diag> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg);

Diag makeWarning(SourceLoc loc, std::string msg);

/// @brief Write @p diag as "path:line[:col]: severity: message".
/// @param sm Resolves file ids to paths and, when registered, to the
///           offending source line; may be null.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);
} // namespace jnigen::support
