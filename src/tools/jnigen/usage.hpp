//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/jnigen/usage.hpp
// Purpose: Usage and version text for the jnigen tool.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace jnigen::tools
{

void printUsage();
void printVersion();

} // namespace jnigen::tools
