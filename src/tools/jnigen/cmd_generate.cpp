//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/jnigen/cmd_generate.cpp
// Purpose: Project-wide generation: discover native classes, produce their
//          JNI headers and write one C++ unit per class.
// Key invariants: A unit is written only when its pipeline succeeded; one
//                 failing file does not stop the others.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "jnigen/Generator.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"
#include "support/trace.hpp"
#include "tools/common/header_tool.hpp"
#include "tools/common/source_loader.hpp"
#include "tools/common/source_scanner.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace jnigen::tools
{
namespace
{

/// @brief Load the manifest named on the command line or found in the cwd.
support::Expected<common::GeneratorConfig> loadBaseConfig(const CliOptions &opts)
{
    if (opts.projectFile)
        return common::parseManifest(*opts.projectFile);
    std::error_code ec;
    if (fs::is_regular_file(std::string(common::kManifestName), ec))
        return common::parseManifest(std::string(common::kManifestName));
    return common::GeneratorConfig{};
}

/// @brief Header, pipeline and write for one source.
/// @return True when the unit was written.
bool generateOne(const common::GeneratorConfig &config,
                 const common::JavaSource &source,
                 const support::Options &options)
{
    auto header = common::produceHeader(config, source, options);
    if (!header)
    {
        support::printDiag(header.error(), std::cerr);
        return false;
    }

    auto javaText = common::loadSourceFile(source.path);
    if (!javaText)
    {
        support::printDiag(javaText.error(), std::cerr);
        return false;
    }
    auto headerText = common::loadSourceFile(header.value());
    if (!headerText)
    {
        support::printDiag(headerText.error(), std::cerr);
        return false;
    }

    UnitInput input;
    input.javaSource = javaText.value();
    input.javaPath = source.path;
    input.headerSource = headerText.value();
    input.headerPath = header.value();
    support::SourceManager sm;
    UnitResult result = generateUnit(input, options, sm);
    result.diagnostics.printAll(std::cerr, &sm);
    if (!result.succeeded())
        return false;

    const std::string unitPath = common::unitPathFor(config, source);
    if (auto ok = common::writeTextFile(unitPath, result.output); !ok)
    {
        support::printDiag(ok.error(), std::cerr);
        return false;
    }
    support::trace(options, "wrote " + unitPath);
    return true;
}

} // namespace

int cmdGenerate(const CliOptions &opts)
{
    auto base = loadBaseConfig(opts);
    if (!base)
    {
        support::printDiag(base.error(), std::cerr);
        return 1;
    }
    const common::GeneratorConfig config = applyOverrides(std::move(base).value(), opts);

    support::Options options;
    options.trace = config.trace;
    options.quiet = opts.quiet;
    support::trace(options, "source " + config.sourceDir + ", classpath " + config.classpath +
                                ", jni " + config.jniDir + ", header tool " +
                                std::string(common::headerToolName(config.headerTool)));

    std::error_code ec;
    fs::create_directories(config.jniDir, ec);
    if (ec)
    {
        support::printDiag(
            support::makeError({}, "cannot create output directory " + config.jniDir + ": " +
                                       ec.message()),
            std::cerr);
        return 1;
    }

    if (!config.jdkInclude.empty())
    {
        auto copied = common::copyJniHeaders(config.jdkInclude, config.jniDir, options);
        if (!copied)
        {
            support::printDiag(copied.error(), std::cerr);
            return 1;
        }
    }

    auto sources = common::findNativeSources(config, options);
    if (!sources)
    {
        support::printDiag(sources.error(), std::cerr);
        return 1;
    }

    std::size_t failures = 0;
    for (const auto &source : sources.value())
    {
        if (!options.quiet)
            std::cout << "Generating C/C++ for '" << source.relativePath << "'..." << std::flush;
        const bool ok = generateOne(config, source, options);
        if (!ok)
            ++failures;
        if (!options.quiet)
            std::cout << (ok ? " done" : " failed") << std::endl;
    }

    if (failures != 0)
    {
        std::cerr << failures << " of " << sources.value().size() << " file(s) failed\n";
        return 1;
    }
    return 0;
}

} // namespace jnigen::tools
