//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/jnigen/cli.hpp
// Purpose: Command-line options of the jnigen tool and its subcommands.
// Key invariants: Unset options leave manifest or default values in place.
// Ownership/Lifetime: Option structs are value types.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tools/common/project_loader.hpp"

#include <optional>
#include <string>
#include <vector>

namespace jnigen::tools
{

/// @brief Options given on the command line; each overrides the manifest.
struct CliOptions
{
    std::optional<std::string> sourceDir;
    std::optional<std::string> classpath;
    std::optional<std::string> jniDir;
    std::optional<std::string> jdkInclude;
    std::optional<common::HeaderTool> headerTool;

    /// @brief Explicit manifest; otherwise ./jnigen.project when present.
    std::optional<std::string> projectFile;

    std::vector<std::string> includes;
    std::vector<std::string> excludes;

    /// @brief Output path for unit mode; stdout when unset.
    std::optional<std::string> output;

    /// @brief Positional arguments in order.
    std::vector<std::string> positional;

    bool trace = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

/// @brief Result of attempting to parse one CLI option.
enum class OptionParseResult
{
    NotMatched, ///< Argument does not correspond to a known option.
    Parsed,     ///< Option recognised and applied.
    Error,      ///< Option recognised but malformed (missing or bad value).
};

/// @brief Parse the option at argv[index], advancing @p index past its value.
/// @param error Receives a message when Error is returned.
OptionParseResult parseOption(int &index, int argc, char **argv, CliOptions &opts, std::string &error);

/// @brief Parse a whole argument vector (without the program name).
/// @return False with @p error set on the first malformed option.
bool parseArgs(int argc, char **argv, CliOptions &opts, std::string &error);

/// @brief Overlay options set on the command line onto @p base.
/// @details Include and exclude patterns are appended; trace is enabled when
///          either side asks for it.
common::GeneratorConfig applyOverrides(common::GeneratorConfig base, const CliOptions &opts);

/// @brief Generate units for every native class of the configured project.
/// @return Process exit status; non-zero when any file failed.
int cmdGenerate(const CliOptions &opts);

/// @brief Run the pipeline on one Java file and one JNI header.
int cmdUnit(const CliOptions &opts);

} // namespace jnigen::tools
