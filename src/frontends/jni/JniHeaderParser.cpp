//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/frontends/jni/JniHeaderParser.cpp
// Purpose: Implements the JNI header prototype scanner on top of parse::Cursor.
//
//===----------------------------------------------------------------------===//

#include "frontends/jni/JniHeaderParser.hpp"

#include "frontends/common/CharUtils.hpp"
#include "frontends/common/StringUtils.hpp"
#include "jnigen/parse/Cursor.h"

namespace jnigen::frontends::jni
{
namespace
{

using common::char_utils::isCIdentifierPart;
using common::char_utils::isLetter;

constexpr std::string_view kExport = "JNIEXPORT";
constexpr std::string_view kCall = "JNICALL";

support::Diag headerError(uint32_t fileId, unsigned line, std::string message)
{
    return support::makeError({fileId, line, 0}, "parse error: " + std::move(message));
}

std::string removeLineBreaks(std::string_view text)
{
    using common::string_utils::removeChar;
    return removeChar(removeChar(text, '\n'), '\r');
}

/// @brief Parse one prototype; the cursor sits just past JNIEXPORT.
support::Expected<LowLevelSignature> parsePrototype(parse::Cursor &cur,
                                                    std::size_t headStart,
                                                    unsigned headLine,
                                                    uint32_t fileId)
{
    LowLevelSignature sig;
    sig.line = headLine;

    std::string_view ret;
    if (!cur.consumeIdent(ret))
        return headerError(fileId, headLine, "expected return type after JNIEXPORT");
    sig.returnCType = std::string(ret);

    if (!cur.consumeWord(kCall))
        return headerError(fileId, headLine, "expected JNICALL in exported prototype");

    std::string_view name;
    if (!cur.consumeIdent(name))
        return headerError(fileId, headLine, "expected function name after JNICALL");
    sig.functionName = std::string(name);
    sig.headerLine = removeLineBreaks(cur.view().substr(headStart, cur.offset() - headStart));

    cur.skipTrivia();
    if (!cur.consumeIf('('))
        return headerError(fileId, headLine,
                           "missing parameter list for '" + sig.functionName + "'");

    const std::string_view params = cur.consumeWhile([](char ch) { return ch != ')'; });
    if (!cur.consumeIf(')'))
        return headerError(fileId, headLine,
                           "unterminated parameter list for '" + sig.functionName + "'");
    cur.skipTrivia();
    if (!cur.consumeIf(';'))
        return headerError(fileId, headLine,
                           "expected ';' after prototype of '" + sig.functionName + "'");

    sig.argumentCTypes = common::string_utils::splitTrimmed(removeLineBreaks(params), ',');
    return sig;
}

} // namespace

support::Expected<std::vector<LowLevelSignature>> parseJniHeader(std::string_view text,
                                                                uint32_t fileId)
{
    std::vector<LowLevelSignature> signatures;
    parse::Cursor cur(text);
    while (true)
    {
        cur.skipTrivia();
        if (cur.atEnd())
            break;

        const std::size_t start = cur.offset();
        const unsigned line = cur.line();
        if (cur.consumeWord(kExport))
        {
            auto sig = parsePrototype(cur, start, line, fileId);
            if (!sig)
                return sig.error();
            signatures.push_back(std::move(sig.value()));
            continue;
        }

        // Step over one identifier or one other character.
        if (isLetter(cur.peek()) || cur.peek() == '_')
            cur.consumeWhile([](char ch) { return isCIdentifierPart(ch); });
        else
            cur.advance();
    }
    return signatures;
}

} // namespace jnigen::frontends::jni
