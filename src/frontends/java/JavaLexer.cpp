//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/java/JavaLexer.cpp
// Purpose: Implements the Java token scanner used by the segment parser.
//
//===----------------------------------------------------------------------===//

#include "frontends/java/JavaLexer.hpp"

#include "frontends/common/CharUtils.hpp"

namespace jnigen::frontends::java
{

using namespace common::char_utils;
using common::lexer_base::skipAllWhitespace;
using common::lexer_base::skipToEndOfLine;

JavaLexer::JavaLexer(std::string_view src, uint32_t fileId) : LexerCursor(fileId), src_(src) {}

support::Diag JavaLexer::errorAt(const Token &tok, std::string message) const
{
    return support::makeError({fileId(), tok.line, tok.column}, "parse error: " + std::move(message));
}

support::Expected<Token> JavaLexer::next()
{
    while (true)
    {
        skipAllWhitespace(*this);
        if (peek() == '/' && peek(1) == '/')
        {
            skipToEndOfLine(*this);
            continue;
        }
        break;
    }

    if (eof())
    {
        Token tok;
        tok.kind = TokenKind::Eof;
        tok.line = line();
        tok.column = column();
        tok.endLine = line();
        return tok;
    }

    const char c = peek();
    if (c == '/' && peek(1) == '*')
        return lexBlockComment();
    if (c == '"' && peek(1) == '"' && peek(2) == '"')
        return lexTextBlock();
    if (c == '"' || c == '\'')
        return lexQuoted(c);
    if (isJavaIdentifierStart(c))
        return lexIdentifier();
    if (isDigit(c))
        return lexNumber();

    Token tok;
    tok.kind = TokenKind::Punct;
    tok.line = line();
    tok.column = column();
    if (c == '.' && peek(1) == '.' && peek(2) == '.')
    {
        get();
        get();
        get();
        tok.text = "...";
    }
    else
    {
        tok.text.assign(1, get());
    }
    tok.endLine = tok.line;
    return tok;
}

support::Expected<Token> JavaLexer::lexBlockComment()
{
    Token tok;
    tok.kind = TokenKind::BlockComment;
    tok.line = line();
    tok.column = column();
    get();
    get();

    const std::size_t begin = position();
    while (!eof())
    {
        if (peek() == '*' && peek(1) == '/')
        {
            tok.text.assign(src_.substr(begin, position() - begin));
            tok.endLine = line();
            get();
            get();
            return tok;
        }
        get();
    }
    return errorAt(tok, "unterminated block comment");
}

support::Expected<Token> JavaLexer::lexQuoted(char quote)
{
    Token tok;
    tok.kind = TokenKind::Literal;
    tok.line = line();
    tok.column = column();
    const std::size_t begin = position();
    get();

    while (!eof())
    {
        const char c = peek();
        if (c == '\n')
            break;
        get();
        if (c == '\\')
        {
            if (peek() != '\n')
                get();
            continue;
        }
        if (c == quote)
        {
            tok.text.assign(src_.substr(begin, position() - begin));
            tok.endLine = line();
            return tok;
        }
    }
    return errorAt(tok,
                   quote == '"' ? "unterminated string literal" : "unterminated character literal");
}

support::Expected<Token> JavaLexer::lexTextBlock()
{
    Token tok;
    tok.kind = TokenKind::Literal;
    tok.line = line();
    tok.column = column();
    const std::size_t begin = position();
    get();
    get();
    get();

    while (!eof())
    {
        if (peek() == '\\')
        {
            get();
            get();
            continue;
        }
        if (peek() == '"' && peek(1) == '"' && peek(2) == '"')
        {
            get();
            get();
            get();
            tok.text.assign(src_.substr(begin, position() - begin));
            tok.endLine = line();
            return tok;
        }
        get();
    }
    return errorAt(tok, "unterminated text block");
}

Token JavaLexer::lexIdentifier()
{
    Token tok;
    tok.kind = TokenKind::Identifier;
    tok.line = line();
    tok.column = column();
    const std::size_t begin = position();
    while (!eof() && isJavaIdentifierPart(peek()))
        get();
    tok.text.assign(src_.substr(begin, position() - begin));
    tok.endLine = tok.line;
    return tok;
}

Token JavaLexer::lexNumber()
{
    Token tok;
    tok.kind = TokenKind::Literal;
    tok.line = line();
    tok.column = column();
    const std::size_t begin = position();
    while (!eof() && (isAlphanumeric(peek()) || peek() == '_' || peek() == '.'))
        get();
    tok.text.assign(src_.substr(begin, position() - begin));
    tok.endLine = tok.line;
    return tok;
}

} // namespace jnigen::frontends::java
