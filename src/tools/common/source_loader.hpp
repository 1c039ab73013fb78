//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Read Java sources and JNI headers into memory and write units out.
// Key invariants: A loaded buffer holds the complete file contents.
// Ownership/Lifetime: The caller owns the returned strings.
// Links: tools/jnigen/cmd_generate.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>

namespace jnigen::tools::common
{

/// @brief Largest file the tool agrees to read.
inline constexpr std::size_t kMaxSourceSize = 256ULL * 1024 * 1024;

/// @brief Read the file at @p path into a string.
/// @return File contents on success; otherwise a diagnostic describing the
///         I/O failure or an oversized file.
support::Expected<std::string> loadSourceFile(const std::string &path);

/// @brief Replace the file at @p path with @p contents.
/// @details The text is written in binary mode so line endings are kept. It
///          goes to `<path>.tmp` first and is renamed over @p path only once
///          fully written, so a failed write leaves any previous file intact.
support::Expected<void> writeTextFile(const std::string &path, std::string_view contents);

} // namespace jnigen::tools::common
