//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the jnigen command-line tool.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `jnigen` CLI tool.
/// @details Parses the command line once and dispatches to project-wide
///          generation or to the single-unit subcommand.

#include "cli.hpp"
#include "usage.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv)
{
    using namespace jnigen::tools;

    CliOptions opts;
    std::string error;
    if (!parseArgs(argc - 1, argv + 1, opts, error))
    {
        std::cerr << "jnigen: " << error << "\n";
        printUsage();
        return 1;
    }
    if (opts.help)
    {
        printUsage();
        return 0;
    }
    if (opts.version)
    {
        printVersion();
        return 0;
    }

    if (!opts.positional.empty() && opts.positional.front() == "unit")
        return cmdUnit(opts);
    if (!opts.positional.empty())
    {
        std::cerr << "jnigen: unexpected argument '" << opts.positional.front() << "'\n";
        printUsage();
        return 1;
    }
    return cmdGenerate(opts);
}
