//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/header_tool.hpp
// Purpose: Produce the JNI header for one Java class with javah or javac -h,
//          and copy the JDK's own JNI headers next to the generated code.
// Key invariants: A non-zero exit of the header tool is an error whose
//                 message carries the tool's output.
// Links: tools/common/RunProcess.hpp, tools/common/source_scanner.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/options.hpp"
#include "tools/common/project_loader.hpp"
#include "tools/common/source_scanner.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace jnigen::tools::common
{

/// @brief Directory under the output directory receiving the JDK headers.
inline constexpr const char *kJniHeadersDir = "jni-headers";

/// @brief Path of the JNI header the chosen tool writes for @p source.
/// @details javah and "none" use "<jni>/<fqcn>.h"; javac -h names the header
///          after the class with '.' replaced by '_'.
[[nodiscard]] std::string headerPathFor(const GeneratorConfig &config, const JavaSource &source);

/// @brief Path of the generated unit, "<jni>/<fqcn>.cpp".
[[nodiscard]] std::string unitPathFor(const GeneratorConfig &config, const JavaSource &source);

/// @brief Command line that produces the header; empty for HeaderTool::None.
[[nodiscard]] std::vector<std::string> headerToolCommand(const GeneratorConfig &config,
                                                         const JavaSource &source);

/// @brief Run the header tool for @p source.
/// @return Path of the header, which exists on success.
support::Expected<std::string> produceHeader(const GeneratorConfig &config,
                                             const JavaSource &source,
                                             const support::Options &options);

/// @brief Copy jni.h and friends from @p jdkInclude into <jniDir>/jni-headers.
/// @details Files missing from the JDK are skipped; platform headers land in
///          linux/, mac/ (from darwin/) and win32/.
/// @return Number of files copied.
support::Expected<std::size_t> copyJniHeaders(const std::string &jdkInclude,
                                              const std::string &jniDir,
                                              const support::Options &options);

} // namespace jnigen::tools::common
