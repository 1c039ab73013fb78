//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/trace.hpp
// Purpose: Phase tracing for the generator, written to stderr.
// Key invariants: Nothing is written unless tracing was requested through
//                 Options::trace or the JNIGEN_TRACE environment variable.
// Ownership/Lifetime: Stateless helpers; the stream is borrowed.
// Links: support/options.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/options.hpp"

#include <ostream>
#include <string_view>

namespace jnigen::support
{

/// @brief Name of the environment variable that forces tracing on.
inline constexpr const char *kTraceEnvVar = "JNIGEN_TRACE";

/// @brief Determine whether trace output is enabled for @p opts.
/// @return True when opts.trace is set or JNIGEN_TRACE is non-empty.
[[nodiscard]] bool isTraceEnabled(const Options &opts);

/// @brief Write "[jnigen] <message>" to @p os when tracing is enabled.
void trace(const Options &opts, std::string_view message, std::ostream &os);

/// @brief Write "[jnigen] <message>" to std::cerr when tracing is enabled.
void trace(const Options &opts, std::string_view message);

} // namespace jnigen::support
