//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/path_match.cpp
// Purpose: Implements Ant-style pattern matching over '/'-separated paths.
//
//===----------------------------------------------------------------------===//

#include "tools/common/path_match.hpp"

namespace jnigen::tools::common
{
namespace
{

std::vector<std::string> splitSegments(std::string_view text)
{
    std::vector<std::string> segments;
    std::string current;
    for (char c : text)
    {
        if (c == '/' || c == '\\')
        {
            if (!current.empty())
                segments.push_back(std::move(current));
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty())
        segments.push_back(std::move(current));
    return segments;
}

/// @brief Glob match of one segment with '*' and '?'.
bool matchSegment(std::string_view pattern, std::string_view text)
{
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t starP = std::string_view::npos;
    std::size_t starT = 0;
    while (t < text.size())
    {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t]))
        {
            ++p;
            ++t;
        }
        else if (p < pattern.size() && pattern[p] == '*')
        {
            starP = p++;
            starT = t;
        }
        else if (starP != std::string_view::npos)
        {
            p = starP + 1;
            t = ++starT;
        }
        else
        {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*')
        ++p;
    return p == pattern.size();
}

bool matchSegments(const std::vector<std::string> &pat,
                   std::size_t pi,
                   const std::vector<std::string> &path,
                   std::size_t si)
{
    while (pi < pat.size())
    {
        if (pat[pi] == "**")
        {
            // Collapse runs of "**".
            while (pi + 1 < pat.size() && pat[pi + 1] == "**")
                ++pi;
            if (pi + 1 == pat.size())
                return true;
            for (std::size_t k = si; k <= path.size(); ++k)
            {
                if (matchSegments(pat, pi + 1, path, k))
                    return true;
            }
            return false;
        }
        if (si == path.size() || !matchSegment(pat[pi], path[si]))
            return false;
        ++pi;
        ++si;
    }
    return si == path.size();
}

} // namespace

bool matchAntPattern(std::string_view pattern, std::string_view path)
{
    std::vector<std::string> pat = splitSegments(pattern);
    if (!pattern.empty() && (pattern.back() == '/' || pattern.back() == '\\'))
        pat.emplace_back("**");
    return matchSegments(pat, 0, splitSegments(path), 0);
}

bool matchesAny(const std::vector<std::string> &patterns, std::string_view path)
{
    for (const auto &pattern : patterns)
    {
        if (matchAntPattern(pattern, path))
            return true;
    }
    return false;
}

bool isSelected(const std::vector<std::string> &includes,
                const std::vector<std::string> &excludes,
                std::string_view path)
{
    if (!includes.empty() && !matchesAny(includes, path))
        return false;
    return !matchesAny(excludes, path);
}

} // namespace jnigen::tools::common
