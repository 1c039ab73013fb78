//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/jni/Generator.cpp
// Purpose: Implements the one-file generation pipeline.
// Key invariants: A failing stage stops the pipeline; no output is produced.
// Links: include/jnigen/Generator.hpp
//
//===----------------------------------------------------------------------===//

#include "jnigen/Generator.hpp"

#include "codegen/jni/CodeEmitter.hpp"
#include "codegen/jni/SignatureCorrelator.hpp"
#include "frontends/java/SegmentParser.hpp"
#include "frontends/jni/JniHeaderParser.hpp"
#include "support/trace.hpp"

#include <string>

namespace jnigen
{

bool UnitResult::succeeded() const
{
    return diagnostics.errorCount() == 0;
}

std::string_view baseName(std::string_view path) noexcept
{
    const std::size_t slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

UnitResult generateUnit(const UnitInput &input,
                        const support::Options &options,
                        support::SourceManager &sm)
{
    UnitResult result;
    result.javaFileId = sm.addFile(std::string(input.javaPath));
    result.headerFileId = sm.addFile(std::string(input.headerPath));
    sm.setSource(result.javaFileId, input.javaSource);
    sm.setSource(result.headerFileId, input.headerSource);

    auto phase = [&](const std::string &message) { support::trace(options, message); };

    auto segments =
        frontends::java::parseSegments(input.javaSource, result.javaFileId, result.diagnostics);
    if (!segments)
    {
        result.diagnostics.report(segments.error());
        return result;
    }
    for (const auto &segment : segments.value())
    {
        if (std::holds_alternative<frontends::java::RawBlock>(segment))
            ++result.rawBlockCount;
        else
            ++result.declarationCount;
    }
    phase("segments " + std::string(input.javaPath) + ": " +
          std::to_string(result.rawBlockCount) + " raw, " +
          std::to_string(result.declarationCount) + " native");

    auto signatures = frontends::jni::parseJniHeader(input.headerSource, result.headerFileId);
    if (!signatures)
    {
        result.diagnostics.report(signatures.error());
        return result;
    }
    phase("header " + std::string(input.headerPath) + ": " +
          std::to_string(signatures.value().size()) + " prototype(s)");

    auto matched = codegen::jni::correlate(segments.value(), signatures.value(), result.javaFileId);
    if (!matched)
    {
        result.diagnostics.report(matched.error());
        return result;
    }
    if (support::isTraceEnabled(options))
    {
        for (const auto &segment : matched.value())
        {
            if (const auto *m = std::get_if<codegen::jni::MatchedDeclaration>(&segment))
                phase("matched " + m->declaration.className + "#" + m->declaration.methodName +
                      " -> " + m->signature.functionName);
        }
    }

    codegen::jni::CodeEmitter emitter;
    result.output = emitter.emit(matched.value(), baseName(input.headerPath));
    phase("emitted " + std::to_string(result.output.size()) + " bytes");
    return result;
}

} // namespace jnigen
