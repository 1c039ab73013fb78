//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the helper used to launch javah/javac. The routine builds a
// shell command line from argv fragments, invokes the platform's `popen`
// facility, and collects the merged output for diagnostics.
//
//===----------------------------------------------------------------------===//

#include "tools/common/RunProcess.hpp"

#include <cstdio>

#ifndef _WIN32
#    include <sys/wait.h>
#endif

#ifdef _WIN32
#    define POPEN _popen
#    define PCLOSE _pclose
#else
#    define POPEN popen
#    define PCLOSE pclose
#endif

namespace jnigen::tools::common
{
namespace
{
#if defined(_WIN32)
std::string quote_argument(const std::string &arg)
{
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('"');

    std::size_t backslashCount = 0;
    for (const char ch : arg)
    {
        if (ch == '\\')
        {
            ++backslashCount;
            continue;
        }

        if (ch == '"')
        {
            quoted.append(backslashCount * 2 + 1, '\\');
            quoted.push_back('"');
            backslashCount = 0;
            continue;
        }

        if (backslashCount != 0)
        {
            quoted.append(backslashCount, '\\');
            backslashCount = 0;
        }

        quoted.push_back(ch);
    }

    if (backslashCount != 0)
        quoted.append(backslashCount * 2, '\\');

    quoted.push_back('"');
    return quoted;
}
#else
std::string quote_argument(const std::string &arg)
{
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('"');
    for (const char ch : arg)
    {
        if (ch == '\\' || ch == '"' || ch == '$' || ch == '`')
            quoted.push_back('\\');
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}
#endif
} // namespace

std::string formatCommandLine(const std::vector<std::string> &argv)
{
    std::string cmd;
    for (std::size_t i = 0; i < argv.size(); ++i)
    {
        if (i != 0)
            cmd += ' ';
        cmd += quote_argument(argv[i]);
    }
    return cmd;
}

/// @brief Launch a subprocess using the host shell and capture its output.
/// @details stderr is redirected into stdout so compiler messages from the
///          header tool reach the caller in order. A working directory is
///          applied with a `cd` prefix inside the child shell, leaving the
///          tool's own working directory untouched.
RunResult run_process(const std::vector<std::string> &argv, const std::optional<std::string> &cwd)
{
    std::string cmd;
    if (cwd)
    {
#ifdef _WIN32
        cmd = "cd /d " + quote_argument(*cwd) + " && ";
#else
        cmd = "cd " + quote_argument(*cwd) + " && ";
#endif
    }
    cmd += formatCommandLine(argv);
    cmd += " 2>&1";

    RunResult rr{0, ""};
    FILE *pipe = POPEN(cmd.c_str(), "r");
    if (!pipe)
    {
        rr.exit_code = -1;
        rr.out = "failed to popen";
        return rr;
    }

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe))
        rr.out += buffer;

    const int status = PCLOSE(pipe);
#ifdef _WIN32
    rr.exit_code = status;
#else
    if (WIFEXITED(status))
        rr.exit_code = WEXITSTATUS(status);
    else
        rr.exit_code = status;
#endif
    return rr;
}

} // namespace jnigen::tools::common

#undef POPEN
#undef PCLOSE
