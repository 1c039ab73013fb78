//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Standardise how the tool reads inputs and writes generated units.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: Returned strings are owned by the caller.
// Links: src/tools/common/source_loader.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <filesystem>
#include <fstream>
#include <new>
#include <sstream>
#include <system_error>

namespace jnigen::tools::common
{

support::Expected<std::string> loadSourceFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return support::makeError({}, "unable to open " + path);

    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    const auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    if (fileSize < 0 || static_cast<std::size_t>(fileSize) > kMaxSourceSize)
        return support::makeError({}, "source file too large: " + path + " (limit: 256 MB)");

    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return support::makeError({}, "out of memory reading " + path);
    }
}

support::Expected<void> writeTextFile(const std::string &path, std::string_view contents)
{
    const std::string tmpPath = path + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out)
            return support::makeError({}, "unable to write " + path);
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out)
        {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(tmpPath, ignored);
            return support::makeError({}, "error while writing " + path);
        }
    }

    // The destination only ever holds a complete unit.
    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec)
    {
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        return support::makeError({}, "unable to replace " + path + ": " + ec.message());
    }
    return {};
}

} // namespace jnigen::tools::common
