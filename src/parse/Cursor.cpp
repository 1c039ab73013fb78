//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/parse/Cursor.cpp
// Purpose: Provide out-of-line helpers for the parse::Cursor utility.
// Key invariants: Line numbers advance exactly once per consumed '\n'.
// Ownership/Lifetime: Operates on caller-owned string_view buffers.
// Links: include/jnigen/parse/Cursor.h
//
//===----------------------------------------------------------------------===//

#include "jnigen/parse/Cursor.h"

#include "frontends/common/CharUtils.hpp"

namespace jnigen::parse
{

using namespace jnigen::frontends::common::char_utils;

Cursor::Cursor(std::string_view text, unsigned line) noexcept : text_(text), line_(line) {}

/// @brief Inspect a character without advancing.
/// @details Returns '\0' past the end so callers can treat it as a terminator.
char Cursor::peek(std::size_t ahead) const noexcept
{
    const std::size_t idx = index_ + ahead;
    return idx < text_.size() ? text_[idx] : '\0';
}

/// @brief Consume the current character and update the line counter.
void Cursor::advance() noexcept
{
    if (atEnd())
        return;
    const char ch = text_[index_++];
    if (ch == '\n')
    {
        ++line_;
        atLineStart_ = true;
    }
    else if (!isWhitespace(ch))
    {
        atLineStart_ = false;
    }
}

bool Cursor::skipComment() noexcept
{
    if (peek() != '/')
        return false;
    if (peek(1) == '/')
    {
        while (!atEnd() && peek() != '\n')
            advance();
        return true;
    }
    if (peek(1) != '*')
        return false;
    advance();
    advance();
    while (!atEnd() && !(peek() == '*' && peek(1) == '/'))
        advance();
    advance();
    advance();
    return true;
}

/// @brief Step over whitespace, C comments and whole preprocessor lines.
/// @details A '#' only starts a directive when it is the first non-blank
///          character of its line. Directives continued with a backslash are
///          skipped to their last line.
void Cursor::skipTrivia() noexcept
{
    while (!atEnd())
    {
        const char c = peek();
        if (isWhitespace(c))
        {
            advance();
            continue;
        }
        if (skipComment())
            continue;
        if (c == '#' && atLineStart_)
        {
            while (!atEnd() && peek() != '\n')
            {
                if (peek() == '\\' && peek(1) == '\n')
                    advance();
                else if (peek() == '\\' && peek(1) == '\r' && peek(2) == '\n')
                {
                    advance();
                    advance();
                }
                advance();
            }
            continue;
        }
        return;
    }
}

bool Cursor::consumeIf(char c) noexcept
{
    if (peek() == c && !atEnd())
    {
        advance();
        return true;
    }
    return false;
}

/// @brief Consume a C identifier token.
/// @details Skips trivia, then reads a letter or '_' followed by letters,
///          digits or '_'. On success @p out references the identifier.
bool Cursor::consumeIdent(std::string_view &out) noexcept
{
    skipTrivia();
    const char first = peek();
    if (atEnd() || !(isLetter(first) || first == '_'))
        return false;
    out = consumeWhile([](char ch) { return isCIdentifierPart(ch); });
    return true;
}

bool Cursor::consumeWord(std::string_view word) noexcept
{
    skipTrivia();
    if (text_.substr(index_, word.size()) != word)
        return false;
    if (isCIdentifierPart(peek(word.size())))
        return false;
    for (std::size_t k = 0; k < word.size(); ++k)
        advance();
    return true;
}

} // namespace jnigen::parse
