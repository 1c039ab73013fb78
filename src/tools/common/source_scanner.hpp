//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_scanner.hpp
// Purpose: Find the Java files under the source root that declare native
//          methods.
// Key invariants: Results are sorted by relative path; relative paths use '/'.
// Ownership/Lifetime: Caller owns the returned list.
// Links: tools/common/path_match.hpp, tools/common/project_loader.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/options.hpp"
#include "tools/common/project_loader.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jnigen::tools::common
{

/// @brief One Java file selected for generation.
struct JavaSource
{
    std::string path;         ///< Path as found under the source root.
    std::string relativePath; ///< Path relative to the source root, '/'-separated.
    std::string className;    ///< Fully qualified class name, e.g. "com.example.Foo".
};

/// @brief Fully qualified class name for a source-root relative path.
/// @details "com/example/Foo.java" becomes "com.example.Foo".
[[nodiscard]] std::string classNameFromRelative(std::string_view relativePath);

/// @brief True when @p text contains `native` as a whole word.
[[nodiscard]] bool mentionsNative(std::string_view text);

/// @brief Walk config.sourceDir for selected .java files mentioning `native`.
/// @details Skips .svn and .git directories and directories matched by an
///          exclude pattern.
/// @return The files, or an error when the source root does not exist.
support::Expected<std::vector<JavaSource>> findNativeSources(const GeneratorConfig &config,
                                                             const support::Options &options);

} // namespace jnigen::tools::common
