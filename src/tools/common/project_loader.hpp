//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/project_loader.hpp
// Purpose: Generator configuration and the jnigen.project manifest parser.
//
// Manifest format: one "directive value" per line; '#' starts a comment line.
//
//   sources      src            (Java source root)
//   classpath    bin            (compiled classes for the header tool)
//   jni          jni            (output directory)
//   include      **/*.java      (repeatable)
//   exclude      **/test/**     (repeatable)
//   header-tool  javah|javac|none
//   jdk-include  /usr/lib/jvm/java/include
//   trace        on|off
//
// Key invariants: Relative directory values resolve against the manifest's
//                 directory. Single-valued directives appear at most once.
// Ownership/Lifetime: Caller owns the returned GeneratorConfig.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jnigen::tools::common
{

/// @brief Name of the manifest looked up in the working directory.
inline constexpr std::string_view kManifestName = "jnigen.project";

/// @brief How JNI headers are obtained for each class.
enum class HeaderTool
{
    Javah, ///< javah -classpath <cp> -o <jni>/<fqcn>.h <fqcn>
    Javac, ///< javac -h <jni> -cp <cp> -d <cp> <file>
    None,  ///< Headers already exist in the output directory.
};

/// @brief Resolved settings for one generator run.
struct GeneratorConfig
{
    std::string sourceDir{"src"};
    std::string classpath{"bin"};
    std::string jniDir{"jni"};
    std::vector<std::string> includes;
    std::vector<std::string> excludes;
    HeaderTool headerTool{HeaderTool::Javah};

    /// @brief JDK include directory to copy JNI headers from; empty skips the copy.
    std::string jdkInclude;

    bool trace{false};
};

/// @brief Parse a header-tool name ("javah", "javac", "none").
/// @return The tool, or an error naming the accepted values.
support::Expected<HeaderTool> parseHeaderTool(std::string_view name);

/// @brief Name of @p tool as written on the command line.
[[nodiscard]] std::string_view headerToolName(HeaderTool tool) noexcept;

/// @brief Parse manifest text already in memory.
/// @param text Manifest contents.
/// @param manifestPath Path used as the prefix of error messages.
/// @param baseDir Directory relative values resolve against.
/// @return Configuration on success; "<manifestPath>:<line>: <message>" on error.
support::Expected<GeneratorConfig> parseManifestText(std::string_view text,
                                                     const std::string &manifestPath,
                                                     const std::string &baseDir);

/// @brief Read and parse the manifest at @p manifestPath.
support::Expected<GeneratorConfig> parseManifest(const std::string &manifestPath);

} // namespace jnigen::tools::common
