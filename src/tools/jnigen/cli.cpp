//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements command-line parsing for the jnigen tool. Options are decoded
// into CliOptions and only later merged with the manifest, so the command
// line always wins regardless of argument order.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include <string_view>

namespace jnigen::tools
{

/// @brief Parse a jnigen option and update @p opts.
///
/// @details Options taking a value consume the following argument and advance
///          @p index. A value-taking option at the end of argv is an error.
///          Arguments that do not start with '-' are not matched so the caller
///          can collect them as positionals.
OptionParseResult parseOption(int &index, int argc, char **argv, CliOptions &opts, std::string &error)
{
    const std::string_view arg = argv[index];

    auto value = [&](std::optional<std::string> &slot) -> OptionParseResult
    {
        if (index + 1 >= argc)
        {
            error = "missing value for " + std::string(arg);
            return OptionParseResult::Error;
        }
        slot = argv[++index];
        return OptionParseResult::Parsed;
    };

    if (arg == "--source")
        return value(opts.sourceDir);
    if (arg == "--classpath")
        return value(opts.classpath);
    if (arg == "--jni")
        return value(opts.jniDir);
    if (arg == "--jdk-include")
        return value(opts.jdkInclude);
    if (arg == "--project")
        return value(opts.projectFile);
    if (arg == "-o" || arg == "--output")
        return value(opts.output);
    if (arg == "--include" || arg == "--exclude")
    {
        std::optional<std::string> pattern;
        if (value(pattern) == OptionParseResult::Error)
            return OptionParseResult::Error;
        (arg == "--include" ? opts.includes : opts.excludes).push_back(*pattern);
        return OptionParseResult::Parsed;
    }
    if (arg == "--header-tool")
    {
        std::optional<std::string> name;
        if (value(name) == OptionParseResult::Error)
            return OptionParseResult::Error;
        auto tool = common::parseHeaderTool(*name);
        if (!tool)
        {
            error = tool.error().message;
            return OptionParseResult::Error;
        }
        opts.headerTool = tool.value();
        return OptionParseResult::Parsed;
    }
    if (arg == "--trace")
    {
        opts.trace = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--quiet")
    {
        opts.quiet = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "-h" || arg == "--help")
    {
        opts.help = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--version")
    {
        opts.version = true;
        return OptionParseResult::Parsed;
    }
    return OptionParseResult::NotMatched;
}

bool parseArgs(int argc, char **argv, CliOptions &opts, std::string &error)
{
    for (int i = 0; i < argc; ++i)
    {
        switch (parseOption(i, argc, argv, opts, error))
        {
            case OptionParseResult::Parsed:
                continue;
            case OptionParseResult::Error:
                return false;
            case OptionParseResult::NotMatched:
                break;
        }
        const std::string_view arg = argv[i];
        if (arg.size() > 1 && arg[0] == '-')
        {
            error = "unknown option '" + std::string(arg) + "'";
            return false;
        }
        opts.positional.emplace_back(arg);
    }
    return true;
}

common::GeneratorConfig applyOverrides(common::GeneratorConfig base, const CliOptions &opts)
{
    if (opts.sourceDir)
        base.sourceDir = *opts.sourceDir;
    if (opts.classpath)
        base.classpath = *opts.classpath;
    if (opts.jniDir)
        base.jniDir = *opts.jniDir;
    if (opts.jdkInclude)
        base.jdkInclude = *opts.jdkInclude;
    if (opts.headerTool)
        base.headerTool = *opts.headerTool;
    base.includes.insert(base.includes.end(), opts.includes.begin(), opts.includes.end());
    base.excludes.insert(base.excludes.end(), opts.excludes.begin(), opts.excludes.end());
    base.trace = base.trace || opts.trace;
    return base;
}

} // namespace jnigen::tools
