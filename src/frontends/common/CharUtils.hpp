//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/CharUtils.hpp
// Purpose: Character classification utilities for the Java scanner and the
//          JNI header parser.
//
// Java identifiers may contain '$' and any non-ASCII letter. The scanner works
// on UTF-8 bytes, so every byte >= 0x80 is accepted as identifier material and
// names are carried through as raw text without further validation.
//
//===----------------------------------------------------------------------===//
#pragma once

namespace jnigen::frontends::common::char_utils
{

/// @brief Check if character is an ASCII letter (A-Z, a-z).
[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character is alphanumeric (letter or digit).
[[nodiscard]] constexpr bool isAlphanumeric(char c) noexcept
{
    return isLetter(c) || isDigit(c);
}

/// @brief Check if the byte belongs to a multi-byte UTF-8 sequence.
[[nodiscard]] constexpr bool isNonAscii(char c) noexcept
{
    return static_cast<unsigned char>(c) >= 0x80;
}

/// @brief Check if character can start a Java identifier.
[[nodiscard]] constexpr bool isJavaIdentifierStart(char c) noexcept
{
    return isLetter(c) || c == '_' || c == '$' || isNonAscii(c);
}

/// @brief Check if character can continue a Java identifier.
[[nodiscard]] constexpr bool isJavaIdentifierPart(char c) noexcept
{
    return isJavaIdentifierStart(c) || isDigit(c);
}

/// @brief Check if character can continue a C identifier.
[[nodiscard]] constexpr bool isCIdentifierPart(char c) noexcept
{
    return isAlphanumeric(c) || c == '_';
}

/// @brief Check if character is ASCII whitespace.
[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
}

} // namespace jnigen::frontends::common::char_utils
