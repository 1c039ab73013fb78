//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/path_match.hpp
// Purpose: Ant-style path patterns for selecting Java sources.
//
// Pattern syntax:
//   ?    one character other than '/'
//   *    any run of characters within one path segment
//   **   any number of whole segments, including none
// A pattern ending in '/' behaves as if followed by "**". Paths and patterns
// use '/' separators; backslashes are treated as '/'.
//
// Key invariants: Matching is case-sensitive and never touches the file system.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace jnigen::tools::common
{

/// @brief Test @p path (relative to the source root) against @p pattern.
[[nodiscard]] bool matchAntPattern(std::string_view pattern, std::string_view path);

/// @brief True when @p path matches any pattern of @p patterns.
[[nodiscard]] bool matchesAny(const std::vector<std::string> &patterns, std::string_view path);

/// @brief Decide whether a relative source path is selected.
/// @details Selected when @p includes is empty or one include matches, and no
///          exclude matches.
[[nodiscard]] bool isSelected(const std::vector<std::string> &includes,
                              const std::vector<std::string> &excludes,
                              std::string_view path);

} // namespace jnigen::tools::common
