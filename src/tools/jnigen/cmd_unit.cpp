//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/jnigen/cmd_unit.cpp
// Purpose: `jnigen unit <File.java> <File.h> [-o out.cpp]`: run the pipeline
//          on one source/header pair without invoking any JDK tool.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "jnigen/Generator.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"
#include "usage.hpp"

#include <iostream>

namespace jnigen::tools
{

int cmdUnit(const CliOptions &opts)
{
    // positional[0] is the subcommand name.
    if (opts.positional.size() != 3)
    {
        std::cerr << "unit: expected <File.java> <File.h>\n";
        printUsage();
        return 1;
    }
    const std::string &javaPath = opts.positional[1];
    const std::string &headerPath = opts.positional[2];

    auto javaText = common::loadSourceFile(javaPath);
    if (!javaText)
    {
        support::printDiag(javaText.error(), std::cerr);
        return 1;
    }
    auto headerText = common::loadSourceFile(headerPath);
    if (!headerText)
    {
        support::printDiag(headerText.error(), std::cerr);
        return 1;
    }

    support::Options options;
    options.trace = opts.trace;
    options.quiet = opts.quiet;

    support::SourceManager sm;
    UnitInput input;
    input.javaSource = javaText.value();
    input.javaPath = javaPath;
    input.headerSource = headerText.value();
    input.headerPath = headerPath;
    UnitResult result = generateUnit(input, options, sm);
    result.diagnostics.printAll(std::cerr, &sm);
    if (!result.succeeded())
        return 1;

    if (!opts.output)
    {
        std::cout << result.output;
        return 0;
    }
    if (auto ok = common::writeTextFile(*opts.output, result.output); !ok)
    {
        support::printDiag(ok.error(), std::cerr);
        return 1;
    }
    return 0;
}

} // namespace jnigen::tools
