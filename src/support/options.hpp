//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the global settings shared by the pipeline and the tool.
// Key invariants: Flags are independent booleans.
// Ownership/Lifetime: Value type.
// Links: support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

namespace jnigen::support
{

/// @brief Holds global command-line settings that influence generation.
/// @invariant Flags are independent booleans.
/// @ownership Value type.
struct Options
{
    /// @brief Enable verbose tracing of generation phases on stderr.
    bool trace = false;

    /// @brief Suppress per-file progress lines on stdout.
    bool quiet = false;
};
} // namespace jnigen::support
