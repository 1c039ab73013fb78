//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/jnigen/version.hpp
// Purpose: Version string reported by the jnigen tool.
// Key invariants: The build system may define JNIGEN_VERSION_STR from the
//                 project version; this header supplies the fallback.
//
//===----------------------------------------------------------------------===//

#pragma once

#ifndef JNIGEN_VERSION_STR
#define JNIGEN_VERSION_STR "1.0.0"
#endif
