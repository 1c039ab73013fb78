//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/codegen/jni/CodeEmitter.cpp
// Purpose: Implements JNI glue emission: function heads, argument
//          marshalling and the inner/outer decomposition.
//
//===----------------------------------------------------------------------===//

#include "codegen/jni/CodeEmitter.hpp"

#include "frontends/common/StringUtils.hpp"

#include <sstream>

namespace jnigen::codegen::jni
{

using frontends::java::ArgumentKind;
using frontends::java::Declaration;
using frontends::java::RawBlock;

namespace
{

/// @brief Name used for @p arg in the JNI parameter list.
std::string handleName(const frontends::java::Argument &arg)
{
    if (arg.type.needsMarshalling())
        return std::string(kArgPrefix) + arg.name;
    return arg.name;
}

std::string_view classSlot(const Declaration &decl)
{
    return decl.isStatic ? "clazz" : "object";
}

} // namespace

bool needsDecomposition(const Declaration &decl)
{
    return decl.hasMarshalledArgument() && decl.embeddedCode.find("return") != std::string::npos;
}

std::string CodeEmitter::emit(const MatchedSegmentList &segments, std::string_view headerName) const
{
    std::ostringstream os;
    emitUnit(os, segments, headerName);
    return os.str();
}

void CodeEmitter::emitUnit(std::ostream &os,
                           const MatchedSegmentList &segments,
                           std::string_view headerName) const
{
    os << "#include <" << headerName << ">\n";
    for (const auto &segment : segments)
    {
        if (const auto *raw = std::get_if<RawBlock>(&segment))
            emitRawBlock(os, *raw);
        else
            emitMethod(os, std::get<MatchedDeclaration>(segment));
    }
}

void CodeEmitter::emitLineMarker(std::ostream &os, uint32_t line) const
{
    os << "\n//@line:" << line << "\n";
}

void CodeEmitter::emitRawBlock(std::ostream &os, const RawBlock &block) const
{
    emitLineMarker(os, block.startLine);
    os << frontends::common::string_utils::removeChar(block.nativeCode, '\r');
}

/// @brief Build acquisition and release code for the marshalled arguments.
/// @details Acquisition runs in three passes (buffers, strings, arrays)
///          because GetPrimitiveArrayCritical forbids further JNI calls until
///          the matching release. Release runs arrays first, then strings.
CodeEmitter::Marshalling CodeEmitter::planMarshalling(const MatchedDeclaration &matched) const
{
    const Declaration &decl = matched.declaration;
    Marshalling plan;

    plan.callArgs.emplace_back("env");
    plan.callArgs.emplace_back(classSlot(decl));
    for (const auto &arg : decl.arguments)
        plan.callArgs.push_back(handleName(arg));

    auto acquire = [&](ArgumentKind kind, std::string_view call, std::string_view extra)
    {
        for (const auto &arg : decl.arguments)
        {
            if (arg.type.kind != kind)
                continue;
            const std::string type(frontends::java::pointerCType(arg.type));
            plan.setup += "\t" + type + " " + arg.name + " = (" + type + ")env->" +
                          std::string(call) + "(" + std::string(kArgPrefix) + arg.name +
                          std::string(extra) + ");\n";
            plan.innerParams.push_back(type + " " + arg.name);
            plan.callArgs.push_back(arg.name);
        }
    };
    acquire(ArgumentKind::Buffer, "GetDirectBufferAddress", "");
    acquire(ArgumentKind::String, "GetStringUTFChars", ", 0");
    acquire(ArgumentKind::Array, "GetPrimitiveArrayCritical", ", 0");
    plan.setup += "\n";

    for (const auto &arg : decl.arguments)
    {
        if (arg.type.isArray())
            plan.cleanup += "\tenv->ReleasePrimitiveArrayCritical(" + std::string(kArgPrefix) +
                            arg.name + ", " + arg.name + ", 0);\n";
    }
    for (const auto &arg : decl.arguments)
    {
        if (arg.type.isString())
            plan.cleanup += "\tenv->ReleaseStringUTFChars(" + std::string(kArgPrefix) + arg.name +
                            ", " + arg.name + ");\n";
    }
    plan.cleanup += "\n";
    return plan;
}

void CodeEmitter::emitSignature(std::ostream &os,
                                const MatchedDeclaration &matched,
                                const std::vector<std::string> *innerParams) const
{
    const Declaration &decl = matched.declaration;
    const auto &sig = matched.signature;

    if (innerParams)
        os << "static inline " << sig.returnCType << " " << kWrapperPrefix << sig.functionName
           << "\n";
    else
        os << sig.headerLine;

    os << "(JNIEnv* env, " << (decl.isStatic ? "jclass clazz" : "jobject object");
    for (std::size_t i = 0; i < decl.arguments.size(); ++i)
        os << ", " << sig.argumentCTypes[i + 2] << " " << handleName(decl.arguments[i]);
    if (innerParams)
    {
        for (const auto &param : *innerParams)
            os << ", " << param;
    }
    os << ") {\n";
}

void CodeEmitter::emitBody(std::ostream &os, const Declaration &decl) const
{
    emitLineMarker(os, decl.startLine);
    os << decl.embeddedCode << "\n";
}

void CodeEmitter::emitMethod(std::ostream &os, const MatchedDeclaration &matched) const
{
    const Declaration &decl = matched.declaration;
    const Marshalling plan = planMarshalling(matched);

    if (!needsDecomposition(decl))
    {
        emitSignature(os, matched, nullptr);
        os << plan.setup;
        emitBody(os, decl);
        os << plan.cleanup;
        os << "}\n\n";
        return;
    }

    // Inner function: the embedded code alone, free to return anywhere.
    emitSignature(os, matched, &plan.innerParams);
    emitBody(os, decl);
    os << "}\n\n";

    // Exported wrapper: acquire, call through, release, return.
    emitSignature(os, matched, nullptr);
    os << plan.setup;
    const bool isVoid = matched.signature.returnCType == "void";
    os << "\t";
    if (!isVoid)
        os << matched.signature.returnCType << " " << kReturnValue << " = ";
    os << kWrapperPrefix << matched.signature.functionName << "(";
    for (std::size_t i = 0; i < plan.callArgs.size(); ++i)
        os << (i ? ", " : "") << plan.callArgs[i];
    os << ");\n\n";
    os << plan.cleanup;
    if (!isVoid)
        os << "\treturn " << kReturnValue << ";\n";
    os << "}\n\n";
}

} // namespace jnigen::codegen::jni
