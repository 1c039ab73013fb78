//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/frontends/jni/JniMangle.cpp
// Purpose: Implement JNI short-name escaping.
// Key invariants:
//   - Letters and digits pass through unchanged.
//   - Every escape starts with '_' followed by a digit, so escapes never
//     collide with the '_' joining class and method.
// Ownership/Lifetime: Stateless helpers returning std::string by value.
// Links: src/frontends/jni/JniMangle.hpp
//
//===----------------------------------------------------------------------===//

#include "frontends/jni/JniMangle.hpp"

#include "frontends/common/CharUtils.hpp"

#include <cstdint>

namespace jnigen::frontends::jni
{
namespace
{

void appendUnit(std::string &out, uint32_t unit)
{
    static constexpr char kHex[] = "0123456789abcdef";
    out += "_0";
    for (int shift = 12; shift >= 0; shift -= 4)
        out.push_back(kHex[(unit >> shift) & 0xF]);
}

/// @brief Decode one UTF-8 sequence starting at @p pos.
/// @details Malformed sequences decode a single byte as its own value.
uint32_t decodeUtf8(std::string_view text, std::size_t &pos)
{
    const auto lead = static_cast<unsigned char>(text[pos]);
    int extra = 0;
    uint32_t cp = lead;
    if ((lead & 0xE0) == 0xC0)
    {
        extra = 1;
        cp = lead & 0x1F;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        extra = 2;
        cp = lead & 0x0F;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        extra = 3;
        cp = lead & 0x07;
    }

    if (pos + extra >= text.size())
    {
        ++pos;
        return lead;
    }
    for (int k = 1; k <= extra; ++k)
    {
        const auto cont = static_cast<unsigned char>(text[pos + k]);
        if ((cont & 0xC0) != 0x80)
        {
            ++pos;
            return lead;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    pos += extra + 1;
    return cp;
}

} // namespace

std::string mangleJniName(std::string_view name)
{
    using common::char_utils::isAlphanumeric;

    std::string out;
    out.reserve(name.size());
    std::size_t pos = 0;
    while (pos < name.size())
    {
        const char ch = name[pos];
        if (isAlphanumeric(ch))
        {
            out.push_back(ch);
            ++pos;
            continue;
        }
        if (ch == '_')
        {
            out += "_1";
            ++pos;
            continue;
        }

        const uint32_t cp = decodeUtf8(name, pos);
        if (cp >= 0x10000)
        {
            const uint32_t v = cp - 0x10000;
            appendUnit(out, 0xD800 + (v >> 10));
            appendUnit(out, 0xDC00 + (v & 0x3FF));
        }
        else
        {
            appendUnit(out, cp);
        }
    }
    return out;
}

std::string correlationToken(std::string_view className, std::string_view methodName)
{
    return mangleJniName(className) + "_" + mangleJniName(methodName);
}

} // namespace jnigen::frontends::jni
