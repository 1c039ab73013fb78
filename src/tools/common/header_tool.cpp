//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/header_tool.cpp
// Purpose: JDK header tool invocation and JNI header copying.
//
//===----------------------------------------------------------------------===//

#include "tools/common/header_tool.hpp"

#include "support/trace.hpp"
#include "tools/common/RunProcess.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace jnigen::tools::common
{

std::string headerPathFor(const GeneratorConfig &config, const JavaSource &source)
{
    std::string name = source.className;
    if (config.headerTool == HeaderTool::Javac)
        std::replace(name.begin(), name.end(), '.', '_');
    return (fs::path(config.jniDir) / (name + ".h")).string();
}

std::string unitPathFor(const GeneratorConfig &config, const JavaSource &source)
{
    return (fs::path(config.jniDir) / (source.className + ".cpp")).string();
}

std::vector<std::string> headerToolCommand(const GeneratorConfig &config, const JavaSource &source)
{
    switch (config.headerTool)
    {
        case HeaderTool::Javah:
            return {"javah", "-classpath", config.classpath, "-o", headerPathFor(config, source),
                    source.className};
        case HeaderTool::Javac:
            return {"javac", "-h", config.jniDir, "-cp", config.classpath, "-d", config.classpath,
                    source.path};
        case HeaderTool::None:
            break;
    }
    return {};
}

support::Expected<std::string> produceHeader(const GeneratorConfig &config,
                                             const JavaSource &source,
                                             const support::Options &options)
{
    std::string header = headerPathFor(config, source);
    const auto argv = headerToolCommand(config, source);
    if (!argv.empty())
    {
        support::trace(options, "running " + formatCommandLine(argv));
        const RunResult rr = run_process(argv);
        if (rr.exit_code != 0)
        {
            std::string msg = std::string(headerToolName(config.headerTool)) + " failed for " +
                              source.className + " (exit code " + std::to_string(rr.exit_code) +
                              ")";
            if (!rr.out.empty())
                msg += ":\n" + rr.out;
            return support::makeError({}, std::move(msg));
        }
    }

    std::error_code ec;
    if (!fs::is_regular_file(header, ec))
        return support::makeError({}, "JNI header not found: " + header);
    return header;
}

support::Expected<std::size_t> copyJniHeaders(const std::string &jdkInclude,
                                              const std::string &jniDir,
                                              const support::Options &options)
{
    static constexpr std::array<const char *, 4> kCommon{
        "classfile_constants.h", "jawt.h", "jdwpTransport.h", "jni.h"};
    static constexpr std::array<const char *, 2> kPlatform{"jni_md.h", "jawt_md.h"};
    static constexpr std::array<std::pair<const char *, const char *>, 3> kPlatformDirs{{
        {"linux", "linux"},
        {"darwin", "mac"},
        {"win32", "win32"},
    }};

    const fs::path from(jdkInclude);
    const fs::path to = fs::path(jniDir) / kJniHeadersDir;
    std::error_code ec;
    if (!fs::is_directory(from, ec))
        return support::makeError({}, "JDK include directory not found: " + jdkInclude);

    std::size_t copied = 0;
    auto copyOne = [&](const fs::path &src, const fs::path &dstDir) -> support::Expected<void>
    {
        std::error_code err;
        if (!fs::is_regular_file(src, err))
            return {};
        fs::create_directories(dstDir, err);
        if (err)
            return support::makeError({}, "cannot create " + dstDir.string() + ": " + err.message());
        fs::copy_file(src, dstDir / src.filename(), fs::copy_options::overwrite_existing, err);
        if (err)
            return support::makeError({}, "cannot copy " + src.string() + ": " + err.message());
        ++copied;
        return {};
    };

    for (const char *name : kCommon)
    {
        if (auto ok = copyOne(from / name, to); !ok)
            return ok.error();
    }
    for (const auto &[jdkDir, outDir] : kPlatformDirs)
    {
        for (const char *name : kPlatform)
        {
            if (auto ok = copyOne(from / jdkDir / name, to / outDir); !ok)
                return ok.error();
        }
    }
    support::trace(options, "copied " + std::to_string(copied) + " JNI header(s) to " + to.string());
    return copied;
}

} // namespace jnigen::tools::common
