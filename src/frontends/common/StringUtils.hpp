//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/StringUtils.hpp
// Purpose: Shared string utility functions for the frontends and the tool.
// Key invariants: All functions are stateless.
// Ownership/Lifetime: Header-only; returned views alias the input.
// Links: frontends/common/CharUtils.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/common/CharUtils.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jnigen::frontends::common::string_utils
{

/// @brief Strip leading and trailing ASCII whitespace.
[[nodiscard]] inline std::string_view trim(std::string_view text) noexcept
{
    std::size_t begin = 0;
    while (begin < text.size() && char_utils::isWhitespace(text[begin]))
        ++begin;
    std::size_t end = text.size();
    while (end > begin && char_utils::isWhitespace(text[end - 1]))
        --end;
    return text.substr(begin, end - begin);
}

/// @brief Remove every occurrence of @p ch from @p text.
[[nodiscard]] inline std::string removeChar(std::string_view text, char ch)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        if (c != ch)
            out.push_back(c);
    }
    return out;
}

/// @brief Split @p text on @p sep, trimming each piece.
/// @details Empty input yields an empty vector; empty pieces are kept.
[[nodiscard]] inline std::vector<std::string> splitTrimmed(std::string_view text, char sep)
{
    std::vector<std::string> pieces;
    if (trim(text).empty())
        return pieces;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t pos = text.find(sep, start);
        const std::string_view piece =
            text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
        pieces.emplace_back(trim(piece));
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return pieces;
}

} // namespace jnigen::frontends::common::string_utils
