//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_scanner.cpp
// Purpose: Recursive discovery of native-bearing Java sources.
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_scanner.hpp"

#include "frontends/common/CharUtils.hpp"
#include "support/trace.hpp"
#include "tools/common/path_match.hpp"
#include "tools/common/source_loader.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace jnigen::tools::common
{

std::string classNameFromRelative(std::string_view relativePath)
{
    constexpr std::string_view kExt = ".java";
    if (relativePath.size() >= kExt.size() &&
        relativePath.substr(relativePath.size() - kExt.size()) == kExt)
    {
        relativePath.remove_suffix(kExt.size());
    }
    std::string name(relativePath);
    std::replace(name.begin(), name.end(), '/', '.');
    std::replace(name.begin(), name.end(), '\\', '.');
    return name;
}

bool mentionsNative(std::string_view text)
{
    using frontends::common::char_utils::isJavaIdentifierPart;
    constexpr std::string_view kWord = "native";
    std::size_t pos = text.find(kWord);
    while (pos != std::string_view::npos)
    {
        const bool startOk = pos == 0 || !isJavaIdentifierPart(text[pos - 1]);
        const std::size_t after = pos + kWord.size();
        const bool endOk = after >= text.size() || !isJavaIdentifierPart(text[after]);
        if (startOk && endOk)
            return true;
        pos = text.find(kWord, pos + 1);
    }
    return false;
}

support::Expected<std::vector<JavaSource>> findNativeSources(const GeneratorConfig &config,
                                                             const support::Options &options)
{
    const fs::path root(config.sourceDir);
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        return support::makeError({}, "source directory not found: " + config.sourceDir);

    std::vector<JavaSource> result;
    auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
    if (ec)
        return support::makeError({}, "cannot read source directory " + config.sourceDir + ": " +
                                          ec.message());

    for (; it != fs::recursive_directory_iterator(); it.increment(ec))
    {
        if (ec)
            return support::makeError({}, "error while scanning " + config.sourceDir + ": " +
                                              ec.message());

        const std::string rel = it->path().lexically_relative(root).generic_string();
        if (it->is_directory(ec))
        {
            const std::string name = it->path().filename().string();
            if (name == ".svn" || name == ".git" || matchesAny(config.excludes, rel))
            {
                support::trace(options, "skipping directory " + rel);
                it.disable_recursion_pending();
            }
            continue;
        }

        if (!it->is_regular_file(ec) || it->path().extension() != ".java")
            continue;
        if (!isSelected(config.includes, config.excludes, rel))
        {
            support::trace(options, "not selected " + rel);
            continue;
        }

        auto text = loadSourceFile(it->path().string());
        if (!text)
            return text.error();
        if (!mentionsNative(text.value()))
            continue;

        JavaSource source;
        source.path = it->path().string();
        source.relativePath = rel;
        source.className = classNameFromRelative(rel);
        result.push_back(std::move(source));
    }

    std::sort(result.begin(), result.end(), [](const JavaSource &a, const JavaSource &b)
              { return a.relativePath < b.relativePath; });
    support::trace(options, "found " + std::to_string(result.size()) + " file(s) with native methods");
    return result;
}

} // namespace jnigen::tools::common
