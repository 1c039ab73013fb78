//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/project_loader.cpp
// Purpose: jnigen.project manifest parsing.
//
//===----------------------------------------------------------------------===//

#include "tools/common/project_loader.hpp"

#include "tools/common/source_loader.hpp"

#include <filesystem>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace jnigen::tools::common
{

namespace
{

/// @brief Make a diagnostic error with file:line context.
support::Diag makeManifestErr(const std::string &path, int line, const std::string &msg)
{
    return support::makeError({}, path + ":" + std::to_string(line) + ": " + msg);
}

/// @brief Parse an on/off boolean value.
support::Expected<bool> parseBool(const std::string &val,
                                  const std::string &manifestPath,
                                  int line,
                                  const std::string &directive)
{
    if (val == "on" || val == "true" || val == "yes")
        return true;
    if (val == "off" || val == "false" || val == "no")
        return false;
    return makeManifestErr(manifestPath, line,
                           "invalid value '" + val + "' for " + directive + "; expected on or off");
}

std::string resolveAgainst(const std::string &baseDir, const std::string &value)
{
    fs::path p(value);
    if (p.is_absolute() || baseDir.empty())
        return p.lexically_normal().string();
    return (fs::path(baseDir) / p).lexically_normal().string();
}

} // namespace

support::Expected<HeaderTool> parseHeaderTool(std::string_view name)
{
    if (name == "javah")
        return HeaderTool::Javah;
    if (name == "javac")
        return HeaderTool::Javac;
    if (name == "none")
        return HeaderTool::None;
    return support::makeError(
        {}, "invalid header tool '" + std::string(name) + "'; expected javah, javac or none");
}

std::string_view headerToolName(HeaderTool tool) noexcept
{
    switch (tool)
    {
        case HeaderTool::Javah:
            return "javah";
        case HeaderTool::Javac:
            return "javac";
        case HeaderTool::None:
            return "none";
    }
    return "";
}

support::Expected<GeneratorConfig> parseManifestText(std::string_view text,
                                                     const std::string &manifestPath,
                                                     const std::string &baseDir)
{
    GeneratorConfig config;
    bool hasSources = false;
    bool hasClasspath = false;
    bool hasJni = false;
    bool hasHeaderTool = false;
    bool hasJdkInclude = false;
    bool hasTrace = false;

    std::istringstream in{std::string(text)};
    std::string line;
    int lineNum = 0;
    while (std::getline(in, line))
    {
        ++lineNum;

        // Strip leading/trailing whitespace
        auto start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos)
            continue; // blank line
        line = line.substr(start);
        auto end = line.find_last_not_of(" \t\r\n");
        if (end != std::string::npos)
            line = line.substr(0, end + 1);

        if (line[0] == '#')
            continue;

        auto spacePos = line.find_first_of(" \t");
        if (spacePos == std::string::npos)
            return makeManifestErr(manifestPath, lineNum, "directive missing value: '" + line + "'");

        std::string directive = line.substr(0, spacePos);
        std::string value = line.substr(line.find_first_not_of(" \t", spacePos));

        auto once = [&](bool &seen) -> support::Expected<void>
        {
            if (seen)
                return makeManifestErr(manifestPath, lineNum,
                                       "duplicate directive '" + directive + "'");
            seen = true;
            return {};
        };

        if (directive == "sources")
        {
            if (auto ok = once(hasSources); !ok)
                return ok.error();
            config.sourceDir = resolveAgainst(baseDir, value);
        }
        else if (directive == "classpath")
        {
            if (auto ok = once(hasClasspath); !ok)
                return ok.error();
            config.classpath = resolveAgainst(baseDir, value);
        }
        else if (directive == "jni")
        {
            if (auto ok = once(hasJni); !ok)
                return ok.error();
            config.jniDir = resolveAgainst(baseDir, value);
        }
        else if (directive == "include")
        {
            config.includes.push_back(value);
        }
        else if (directive == "exclude")
        {
            config.excludes.push_back(value);
        }
        else if (directive == "header-tool")
        {
            if (auto ok = once(hasHeaderTool); !ok)
                return ok.error();
            auto tool = parseHeaderTool(value);
            if (!tool)
                return makeManifestErr(manifestPath, lineNum, tool.error().message);
            config.headerTool = tool.value();
        }
        else if (directive == "jdk-include")
        {
            if (auto ok = once(hasJdkInclude); !ok)
                return ok.error();
            config.jdkInclude = resolveAgainst(baseDir, value);
        }
        else if (directive == "trace")
        {
            if (auto ok = once(hasTrace); !ok)
                return ok.error();
            auto b = parseBool(value, manifestPath, lineNum, "trace");
            if (!b)
                return b.error();
            config.trace = b.value();
        }
        else
        {
            return makeManifestErr(manifestPath, lineNum, "unknown directive '" + directive + "'");
        }
    }

    // Defaults are relative to the manifest as well.
    if (!hasSources)
        config.sourceDir = resolveAgainst(baseDir, config.sourceDir);
    if (!hasClasspath)
        config.classpath = resolveAgainst(baseDir, config.classpath);
    if (!hasJni)
        config.jniDir = resolveAgainst(baseDir, config.jniDir);
    return config;
}

support::Expected<GeneratorConfig> parseManifest(const std::string &manifestPath)
{
    auto text = loadSourceFile(manifestPath);
    if (!text)
        return support::makeError({}, "cannot open manifest: " + manifestPath);
    return parseManifestText(text.value(), manifestPath, fs::path(manifestPath).parent_path().string());
}

} // namespace jnigen::tools::common
