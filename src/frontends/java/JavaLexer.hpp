//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/java/JavaLexer.hpp
// Purpose: Token scanner for the subset of Java structure the segment parser
//          needs: identifiers, punctuation and block comments.
//
// Key invariants:
//   - Literals are consumed whole so braces, parentheses and the word
//     `native` inside strings or chars never surface as structure.
//   - Line comments are dropped; block comments are returned as tokens whose
//     text is the comment interior, verbatim.
//   - Token lines are the 1-based lines of the source text.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/common/LexerBase.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace jnigen::frontends::java
{

enum class TokenKind
{
    Eof,
    Identifier,   ///< Java identifier or keyword.
    Punct,        ///< Single punctuation character, or "..." for varargs.
    Literal,      ///< Number, string, char or text block literal.
    BlockComment, ///< `/* ... */`; text holds the interior.
};

struct Token
{
    TokenKind kind{TokenKind::Eof};
    std::string text;
    uint32_t line{0};
    /// @brief 1-based column of the first character.
    uint32_t column{0};
    uint32_t endLine{0};

    [[nodiscard]] bool is(TokenKind k, std::string_view t) const
    {
        return kind == k && text == t;
    }

    [[nodiscard]] bool isPunct(char c) const
    {
        return kind == TokenKind::Punct && text.size() == 1 && text[0] == c;
    }

    [[nodiscard]] bool isIdent(std::string_view t) const
    {
        return is(TokenKind::Identifier, t);
    }
};

class JavaLexer : public common::lexer_base::LexerCursor<JavaLexer>
{
  public:
    JavaLexer(std::string_view src, uint32_t fileId);

    /// @brief Scan the next token.
    /// @return The token, or a parse error for unterminated comments and literals.
    support::Expected<Token> next();

    std::string_view source() const
    {
        return src_;
    }

  private:
    support::Expected<Token> lexBlockComment();
    support::Expected<Token> lexQuoted(char quote);
    support::Expected<Token> lexTextBlock();
    Token lexIdentifier();
    Token lexNumber();

    support::Diag errorAt(const Token &tok, std::string message) const;

    std::string_view src_;
};

} // namespace jnigen::frontends::java
