//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/jni/SignatureCorrelator.cpp
// Purpose: Implements count-based matching of declarations to prototypes.
//
//===----------------------------------------------------------------------===//

#include "codegen/jni/SignatureCorrelator.hpp"

#include "frontends/jni/JniMangle.hpp"

#include <string>

namespace jnigen::codegen::jni
{

using frontends::java::Declaration;
using frontends::java::RawBlock;
using frontends::jni::LowLevelSignature;

namespace
{

/// @brief Check that @p token names the class and method of @p functionName.
/// @details The token must follow a '_' separator and end the name or be
///          followed directly by the "__" overload suffix, so `get` does not
///          match `Java_Foo_getAll`.
bool namesMethod(const std::string &functionName, const std::string &token)
{
    for (auto pos = functionName.find(token); pos != std::string::npos;
         pos = functionName.find(token, pos + 1))
    {
        if (pos == 0 || functionName[pos - 1] != '_')
            continue;
        const std::size_t end = pos + token.size();
        if (end == functionName.size() || functionName.compare(end, 2, "__") == 0)
            return true;
    }
    return false;
}

} // namespace

const LowLevelSignature *findSignature(const Declaration &decl,
                                       const std::vector<LowLevelSignature> &signatures)
{
    const std::string token = frontends::jni::correlationToken(decl.className, decl.methodName);
    for (const auto &sig : signatures)
    {
        if (!namesMethod(sig.functionName, token))
            continue;
        if (sig.argumentCTypes.size() == decl.arguments.size() + 2)
            return &sig;
    }
    return nullptr;
}

support::Expected<MatchedSegmentList> correlate(const frontends::java::SegmentList &segments,
                                                const std::vector<LowLevelSignature> &signatures,
                                                uint32_t fileId)
{
    MatchedSegmentList out;
    out.reserve(segments.size());
    for (const auto &segment : segments)
    {
        if (const auto *raw = std::get_if<RawBlock>(&segment))
        {
            out.emplace_back(*raw);
            continue;
        }

        const auto &decl = std::get<Declaration>(segment);
        const LowLevelSignature *sig = findSignature(decl, signatures);
        if (!sig)
        {
            return support::makeError({fileId, decl.startLine, 0},
                                      "no matching signature for '" + decl.className + "#" +
                                          decl.methodName + "' with " +
                                          std::to_string(decl.arguments.size()) + " argument(s)");
        }
        out.emplace_back(MatchedDeclaration{decl, *sig});
    }
    return out;
}

} // namespace jnigen::codegen::jni
