//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/trace.cpp
// Purpose: Implements stderr phase tracing gated by options or environment.
//
//===----------------------------------------------------------------------===//

#include "support/trace.hpp"

#include <cstdlib>
#include <iostream>

namespace jnigen::support
{

bool isTraceEnabled(const Options &opts)
{
    if (opts.trace)
        return true;
    const char *env = std::getenv(kTraceEnvVar);
    return env != nullptr && *env != '\0';
}

void trace(const Options &opts, std::string_view message, std::ostream &os)
{
    if (!isTraceEnabled(opts))
        return;
    os << "[jnigen] " << message << '\n';
}

void trace(const Options &opts, std::string_view message)
{
    trace(opts, message, std::cerr);
}

} // namespace jnigen::support
