//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/RunProcess.hpp
// Purpose: Launch the JDK header tools and capture what they print.
// Key invariants: RunResult captures the exit code and merged stdout/stderr.
// Ownership/Lifetime: Callers own argument buffers; the helper copies them.
// Links: tools/common/header_tool.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace jnigen::tools::common
{

/// @brief Result of launching a subprocess.
struct RunResult
{
    int exit_code;   ///< Normalised process exit code (or -1 on launch failure).
    std::string out; ///< Captured standard output and standard error text.
};

/// @brief Render @p argv as one shell command line with every argument quoted.
[[nodiscard]] std::string formatCommandLine(const std::vector<std::string> &argv);

/// @brief Spawn a subprocess using the provided argument vector.
/// @param argv Command-line arguments including the executable at index zero.
/// @param cwd Optional working directory for the child.
/// @return Captured process result including exit code and output.
RunResult run_process(const std::vector<std::string> &argv,
                      const std::optional<std::string> &cwd = std::nullopt);

} // namespace jnigen::tools::common
