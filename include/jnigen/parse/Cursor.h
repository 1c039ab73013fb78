//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/jnigen/parse/Cursor.h
// Purpose: Declare a lightweight text cursor for scanning C headers.
// Key invariants: Operates on a string_view without allocating or owning storage.
// Ownership/Lifetime: Views textual buffers owned by the caller.
// Links: frontends/jni/JniHeaderParser.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Defines a reusable cursor helper for C header text.
/// @details The cursor provides zero-allocation scanning primitives for the
///          JNI header parser. It tracks a line number and knows how to step
///          over C comments and preprocessor lines, which is all the header
///          parser needs to find exported function prototypes.

#pragma once

#include <concepts>
#include <cstddef>
#include <string_view>

namespace jnigen::parse
{

template <class Predicate>
concept CursorPredicate = requires(Predicate pred, char ch) {
    { pred(ch) } -> std::convertible_to<bool>;
};

/// @brief Cursor over C header text.
class Cursor
{
  public:
    /// @brief Construct a cursor over @p text starting on line @p line.
    explicit Cursor(std::string_view text, unsigned line = 1) noexcept;

    [[nodiscard]] std::string_view view() const noexcept
    {
        return text_;
    }

    /// @brief Query whether the cursor has reached the end of the buffer.
    [[nodiscard]] bool atEnd() const noexcept
    {
        return index_ >= text_.size();
    }

    /// @brief Inspect the character @p ahead positions past the cursor.
    /// @return The character, or '\0' beyond the end.
    [[nodiscard]] char peek(std::size_t ahead = 0) const noexcept;

    /// @brief Current 1-based line number.
    [[nodiscard]] unsigned line() const noexcept
    {
        return line_;
    }

    /// @brief Absolute byte offset within the buffer.
    [[nodiscard]] std::size_t offset() const noexcept
    {
        return index_;
    }

    /// @brief Skip whitespace, comments and preprocessor lines.
    void skipTrivia() noexcept;

    /// @brief Consume @p c if present at the cursor.
    bool consumeIf(char c) noexcept;

    /// @brief Consume characters while @p pred returns true.
    template <CursorPredicate Predicate> std::string_view consumeWhile(Predicate pred) noexcept
    {
        const std::size_t begin = index_;
        while (!atEnd() && pred(peek()))
            advance();
        return text_.substr(begin, index_ - begin);
    }

    /// @brief Consume a C identifier after skipping trivia.
    bool consumeIdent(std::string_view &out) noexcept;

    /// @brief Consume @p word when it appears as a whole identifier.
    /// @details Leaves the cursor untouched when the next identifier differs.
    bool consumeWord(std::string_view word) noexcept;

    /// @brief Advance by a single character if not already at end.
    void advance() noexcept;

  private:
    /// @return True when a comment was skipped.
    bool skipComment() noexcept;

    std::string_view text_;
    std::size_t index_ = 0;
    unsigned line_ = 1;
    bool atLineStart_ = true;
};

} // namespace jnigen::parse
