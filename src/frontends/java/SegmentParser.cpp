//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/java/SegmentParser.cpp
// Purpose: Implements the single-pass segment parser over Java tokens.
//
// The parser understands just enough Java to find member boundaries: a member
// header runs until `;`, `{` or `}` at parenthesis depth zero. Headers that
// name `class`, `interface`, `enum` or `record` open a nested class body;
// other `{` blocks are bodies or initializers and are skipped by brace
// matching; `=` at depth zero starts a field initializer that is skipped up
// to its `;`. Only headers containing the `native` modifier are parsed in
// detail.
//
//===----------------------------------------------------------------------===//

#include "frontends/java/SegmentParser.hpp"

#include <utility>

namespace jnigen::frontends::java
{
namespace
{

using TokenRange = std::vector<const Token *>;

bool isJniSection(const Token &tok)
{
    return tok.kind == TokenKind::BlockComment &&
           std::string_view(tok.text).substr(0, kJniSectionTag.size()) == kJniSectionTag;
}

bool containsIdent(const TokenRange &range, std::string_view ident)
{
    for (const Token *tok : range)
    {
        if (tok->isIdent(ident))
            return true;
    }
    return false;
}

/// @brief Drop annotations (`@Name`, `@a.b.Name(...)`) and `final` modifiers.
TokenRange stripAnnotations(const TokenRange &range)
{
    TokenRange out;
    out.reserve(range.size());
    std::size_t k = 0;
    while (k < range.size())
    {
        const Token *tok = range[k];
        if (tok->isPunct('@') && k + 1 < range.size() &&
            range[k + 1]->kind == TokenKind::Identifier && !range[k + 1]->isIdent("interface"))
        {
            k += 2;
            while (k + 1 < range.size() && range[k]->isPunct('.') &&
                   range[k + 1]->kind == TokenKind::Identifier)
            {
                k += 2;
            }
            if (k < range.size() && range[k]->isPunct('('))
            {
                int depth = 0;
                for (; k < range.size(); ++k)
                {
                    if (range[k]->isPunct('('))
                        ++depth;
                    else if (range[k]->isPunct(')') && --depth == 0)
                    {
                        ++k;
                        break;
                    }
                }
            }
            continue;
        }
        if (tok->isIdent("final"))
        {
            ++k;
            continue;
        }
        out.push_back(tok);
        ++k;
    }
    return out;
}

/// @brief Concatenate type tokens, separating adjacent words with a space.
std::string joinTypeTokens(const TokenRange &range, std::size_t count)
{
    std::string text;
    for (std::size_t k = 0; k < count; ++k)
    {
        if (k > 0 && range[k]->kind == TokenKind::Identifier &&
            range[k - 1]->kind == TokenKind::Identifier)
        {
            text.push_back(' ');
        }
        text += range[k]->text;
    }
    return text;
}

} // namespace

support::Expected<SegmentList> parseSegments(std::string_view source,
                                             uint32_t fileId,
                                             support::DiagnosticEngine &diags)
{
    SegmentParser parser(source, fileId, diags);
    return parser.parse();
}

SegmentParser::SegmentParser(std::string_view source,
                             uint32_t fileId,
                             support::DiagnosticEngine &diags)
    : source_(source), fileId_(fileId), diags_(diags)
{
}

support::Diag SegmentParser::errorAt(uint32_t line, std::string message) const
{
    return support::makeError({fileId_, line, 0}, "parse error: " + std::move(message));
}

support::Diag SegmentParser::errorAt(const Token &tok, std::string message) const
{
    return support::makeError({fileId_, tok.line, tok.column}, "parse error: " + std::move(message));
}

support::Expected<SegmentList> SegmentParser::parse()
{
    if (auto ok = tokenize(); !ok)
        return ok.error();
    if (auto ok = parseMembers(true); !ok)
        return ok.error();
    return std::move(segments_);
}

support::Expected<void> SegmentParser::tokenize()
{
    JavaLexer lexer(source_, fileId_);
    while (true)
    {
        auto tok = lexer.next();
        if (!tok)
            return tok.error();
        tokens_.push_back(std::move(tok.value()));
        if (tokens_.back().kind == TokenKind::Eof)
            return {};
    }
}

const Token &SegmentParser::peek() const
{
    return tokens_[index_];
}

const Token &SegmentParser::advance()
{
    const Token &tok = tokens_[index_];
    if (tok.kind != TokenKind::Eof)
        ++index_;
    recordComment(tok);
    return tok;
}

void SegmentParser::skipComments()
{
    while (peek().kind == TokenKind::BlockComment)
        advance();
}

void SegmentParser::recordComment(const Token &tok)
{
    if (!isJniSection(tok))
        return;
    RawBlock block;
    block.nativeCode = tok.text.substr(kJniSectionTag.size());
    block.startLine = tok.line;
    segments_.emplace_back(std::move(block));
}

std::string SegmentParser::currentClassName() const
{
    std::string name;
    for (const auto &part : classStack_)
    {
        if (!name.empty())
            name.push_back('$');
        name += part;
    }
    return name;
}

support::Expected<void> SegmentParser::parseMembers(bool topLevel)
{
    while (true)
    {
        skipComments();
        const Token &tok = peek();
        if (tok.kind == TokenKind::Eof)
        {
            if (!topLevel)
                return errorAt(tok,
                               "unexpected end of file in body of class '" + currentClassName() + "'");
            return {};
        }
        if (tok.isPunct('}'))
        {
            advance();
            if (!topLevel)
                return {};
            continue;
        }
        if (tok.isPunct(';'))
        {
            advance();
            continue;
        }
        if (auto ok = parseMember(); !ok)
            return ok;
    }
}

support::Expected<void> SegmentParser::parseMember()
{
    TokenRange header;
    int parenDepth = 0;
    while (true)
    {
        skipComments();
        const Token &tok = peek();
        if (tok.kind == TokenKind::Eof)
            break;
        if (tok.kind == TokenKind::Punct)
        {
            if (tok.isPunct('('))
                ++parenDepth;
            else if (tok.isPunct(')'))
                --parenDepth;
            else if (tok.isPunct(';'))
                break;
            else if (parenDepth <= 0 && (tok.isPunct('{') || tok.isPunct('}')))
                break;
            else if (parenDepth <= 0 && tok.isPunct('='))
            {
                advance();
                return skipInitializer();
            }
        }
        header.push_back(&advance());
    }

    const Token &terminator = peek();

    for (std::size_t k = 0; k + 1 < header.size(); ++k)
    {
        const Token &word = *header[k];
        if (word.kind != TokenKind::Identifier)
            continue;
        bool classLike = word.text == "class" || word.text == "interface" || word.text == "enum";
        if (word.text == "record" && k + 2 < header.size())
            classLike = header[k + 2]->isPunct('(') || header[k + 2]->isPunct('<');
        if (!classLike || header[k + 1]->kind != TokenKind::Identifier)
            continue;
        if (k > 0 && header[k - 1]->isPunct('.'))
            continue;

        if (!terminator.isPunct('{'))
        {
            if (terminator.kind == TokenKind::Eof)
                return errorAt(word,
                               "unexpected end of file in declaration of '" + header[k + 1]->text + "'");
            return {};
        }
        advance();
        return parseClassBody(header[k + 1]->text, word.text == "enum");
    }

    if (terminator.isPunct('{'))
        return skipBalanced('{', '}');

    const bool isNative = containsIdent(header, "native");
    if (terminator.isPunct(';'))
    {
        if (isNative)
            return parseNativeMethod(header);
        advance();
        return {};
    }

    if (isNative)
        return errorAt(*header.front(), "unterminated native method declaration");
    return {};
}

support::Expected<void> SegmentParser::parseClassBody(const std::string &name, bool isEnum)
{
    classStack_.push_back(name);
    if (isEnum)
    {
        auto more = skipEnumConstants();
        if (!more)
        {
            classStack_.pop_back();
            return more.error();
        }
        if (!more.value())
        {
            classStack_.pop_back();
            return {};
        }
    }
    auto ok = parseMembers(false);
    classStack_.pop_back();
    return ok;
}

support::Expected<bool> SegmentParser::skipEnumConstants()
{
    int depth = 0;
    while (true)
    {
        const Token &tok = peek();
        if (tok.kind == TokenKind::Eof)
            return errorAt(tok,
                           "unexpected end of file in body of enum '" + currentClassName() + "'");
        if (depth == 0 && tok.isPunct(';'))
        {
            advance();
            return true;
        }
        if (depth == 0 && tok.isPunct('}'))
        {
            advance();
            return false;
        }
        if (tok.isPunct('(') || tok.isPunct('{'))
            ++depth;
        else if (tok.isPunct(')') || tok.isPunct('}'))
            --depth;
        advance();
    }
}

support::Expected<void> SegmentParser::skipBalanced(char open, char close)
{
    const uint32_t openLine = peek().line;
    int depth = 0;
    while (true)
    {
        const Token &tok = advance();
        if (tok.kind == TokenKind::Eof)
            return errorAt(openLine, std::string("missing '") + close + "' for '" + open +
                                         "' opened on this line");
        if (tok.isPunct(open))
            ++depth;
        else if (tok.isPunct(close) && --depth == 0)
            return {};
    }
}

support::Expected<void> SegmentParser::skipInitializer()
{
    const uint32_t startLine = peek().line;
    int depth = 0;
    while (true)
    {
        const Token &tok = peek();
        if (tok.kind == TokenKind::Eof)
            return errorAt(startLine, "unterminated field initializer");
        if (depth <= 0 && tok.isPunct(';'))
        {
            advance();
            return {};
        }
        if (depth <= 0 && tok.isPunct('}'))
            return {};
        if (tok.isPunct('(') || tok.isPunct('{') || tok.isPunct('['))
            ++depth;
        else if (tok.isPunct(')') || tok.isPunct('}') || tok.isPunct(']'))
            --depth;
        advance();
    }
}

support::Expected<void> SegmentParser::parseNativeMethod(const TokenRange &header)
{
    const TokenRange sig = stripAnnotations(header);

    std::size_t open = 0;
    while (open < sig.size() && !sig[open]->isPunct('('))
        ++open;
    if (open == sig.size())
        return errorAt(*header.front(), "expected parameter list in native method declaration");
    if (open == 0 || sig[open - 1]->kind != TokenKind::Identifier)
        return errorAt(*sig[open], "missing method name in native method declaration");

    const std::string &methodName = sig[open - 1]->text;

    std::size_t close = open;
    int depth = 0;
    for (; close < sig.size(); ++close)
    {
        if (sig[close]->isPunct('('))
            ++depth;
        else if (sig[close]->isPunct(')') && --depth == 0)
            break;
    }
    if (close == sig.size())
        return errorAt(*sig[open],
                       "unbalanced parentheses in declaration of native method '" + methodName + "'");

    Declaration decl;
    decl.className = currentClassName();
    decl.methodName = methodName;
    for (std::size_t k = 0; k + 1 < open; ++k)
    {
        if (sig[k]->isIdent("static"))
            decl.isStatic = true;
    }

    // Split the parameter list on commas outside generic brackets.
    if (close > open + 1)
    {
        TokenRange param;
        int nesting = 0;
        for (std::size_t k = open + 1; k <= close; ++k)
        {
            const Token *tok = sig[k];
            if (k == close || (nesting == 0 && tok->isPunct(',')))
            {
                auto arg = parseParameter(param, methodName, tok->line);
                if (!arg)
                    return arg.error();
                decl.arguments.push_back(std::move(arg.value()));
                param.clear();
                continue;
            }
            if (tok->isPunct('<') || tok->isPunct('('))
                ++nesting;
            else if (tok->isPunct('>') || tok->isPunct(')'))
                --nesting;
            param.push_back(tok);
        }
    }

    const Token &semi = advance();

    const Token &body = peek();
    if (body.kind == TokenKind::BlockComment && !isJniSection(body) && body.line == semi.line)
    {
        advance();
        decl.embeddedCode = body.text;
        decl.startLine = body.line;
        decl.endLine = body.endLine;
        segments_.emplace_back(std::move(decl));
        return {};
    }

    diags_.report(support::makeWarning({fileId_, semi.line, 0},
                                       "native method '" + decl.className + "#" + methodName +
                                           "' has no embedded code; skipped"));
    return {};
}

support::Expected<Argument> SegmentParser::parseParameter(const TokenRange &tokens,
                                                          const std::string &methodName,
                                                          uint32_t line)
{
    TokenRange param = stripAnnotations(tokens);
    if (param.empty())
        return errorAt(line, "missing parameter in declaration of native method '" + methodName + "'");

    int dims = 0;
    while (param.size() >= 2 && param.back()->isPunct(']') && param[param.size() - 2]->isPunct('['))
    {
        param.pop_back();
        param.pop_back();
        ++dims;
    }

    if (param.empty() || param.back()->kind != TokenKind::Identifier)
        return errorAt(param.empty() ? line : param.back()->line,
                       "missing parameter name in declaration of native method '" + methodName + "'");

    Argument arg;
    arg.name = param.back()->text;
    if (param.size() < 2)
        return errorAt(*param.back(), "missing type for parameter '" + arg.name +
                                               "' of native method '" + methodName + "'");

    std::string typeText = joinTypeTokens(param, param.size() - 1);
    for (int d = 0; d < dims; ++d)
        typeText += "[]";
    arg.type = classify(typeText);
    return arg;
}

} // namespace jnigen::frontends::java
