//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/java/TypeClassifier.cpp
// Purpose: Implements the Java-to-native marshalling category table.
//
// | Java          | C/C++            |
// |---------------|------------------|
// | String        | char* (UTF-8)    |
// | boolean[]     | bool*            |
// | byte[]        | char*            |
// | char[]        | unsigned short*  |
// | short[]       | short*           |
// | int[]         | int*             |
// | long[]        | long long*       |
// | float[]       | float*           |
// | double[]      | double*          |
// | Buffer        | unsigned char*   |
// | ByteBuffer    | char*            |
// | CharBuffer    | unsigned short*  |
// | ShortBuffer   | short*           |
// | IntBuffer     | int*             |
// | LongBuffer    | long long*       |
// | FloatBuffer   | float*           |
// | DoubleBuffer  | double*          |
// | anything else | jobject          |
//
//===----------------------------------------------------------------------===//

#include "frontends/java/TypeClassifier.hpp"

#include "frontends/common/CharUtils.hpp"

#include <array>
#include <utility>

namespace jnigen::frontends::java
{
namespace
{

using ElementEntry = std::pair<std::string_view, ElementKind>;

constexpr std::array<ElementEntry, 8> kPrimitives{{
    {"boolean", ElementKind::Boolean},
    {"byte", ElementKind::Byte},
    {"char", ElementKind::Char},
    {"short", ElementKind::Short},
    {"int", ElementKind::Int},
    {"long", ElementKind::Long},
    {"float", ElementKind::Float},
    {"double", ElementKind::Double},
}};

constexpr std::array<ElementEntry, 8> kBuffers{{
    {"Buffer", ElementKind::Untyped},
    {"ByteBuffer", ElementKind::Byte},
    {"CharBuffer", ElementKind::Char},
    {"ShortBuffer", ElementKind::Short},
    {"IntBuffer", ElementKind::Int},
    {"LongBuffer", ElementKind::Long},
    {"FloatBuffer", ElementKind::Float},
    {"DoubleBuffer", ElementKind::Double},
}};

constexpr std::string_view kLangPackage = "java.lang.";
constexpr std::string_view kNioPackage = "java.nio.";

ElementKind lookup(const std::array<ElementEntry, 8> &table, std::string_view name)
{
    for (const auto &[key, kind] : table)
    {
        if (key == name)
            return kind;
    }
    return ElementKind::None;
}

std::string normalize(std::string_view declared)
{
    std::string out;
    out.reserve(declared.size());
    for (char c : declared)
    {
        if (!common::char_utils::isWhitespace(c))
            out.push_back(c);
    }
    constexpr std::string_view kVarargs = "...";
    if (out.size() > kVarargs.size() && out.compare(out.size() - kVarargs.size(), kVarargs.size(), kVarargs) == 0)
    {
        out.resize(out.size() - kVarargs.size());
        out += "[]";
    }
    return out;
}

std::string_view stripPackage(std::string_view name, std::string_view package)
{
    if (name.substr(0, package.size()) == package)
        return name.substr(package.size());
    return name;
}

} // namespace

ArgumentType classify(std::string_view declaredType)
{
    ArgumentType type;
    type.declared = normalize(declaredType);
    std::string_view name = type.declared;

    if (const ElementKind prim = lookup(kPrimitives, name); prim != ElementKind::None)
    {
        type.kind = ArgumentKind::PlainOldData;
        type.element = prim;
        return type;
    }

    constexpr std::string_view kDims = "[]";
    if (name.size() > kDims.size() && name.substr(name.size() - kDims.size()) == kDims)
    {
        // Only one-dimensional primitive arrays are pinned; int[][] is an
        // array of handles and stays opaque.
        const ElementKind elem = lookup(kPrimitives, name.substr(0, name.size() - kDims.size()));
        if (elem != ElementKind::None)
        {
            type.kind = ArgumentKind::Array;
            type.element = elem;
        }
        return type;
    }

    if (stripPackage(name, kLangPackage) == "String")
    {
        type.kind = ArgumentKind::String;
        return type;
    }

    if (const ElementKind buf = lookup(kBuffers, stripPackage(name, kNioPackage)); buf != ElementKind::None)
    {
        type.kind = ArgumentKind::Buffer;
        type.element = buf;
        return type;
    }

    return type;
}

std::string_view pointerCType(const ArgumentType &type) noexcept
{
    switch (type.kind)
    {
        case ArgumentKind::PlainOldData:
        case ArgumentKind::ObjectReference:
            return {};
        case ArgumentKind::String:
            return "char*";
        case ArgumentKind::Array:
        case ArgumentKind::Buffer:
            break;
    }

    switch (type.element)
    {
        case ElementKind::Boolean:
            return "bool*";
        case ElementKind::Byte:
            return "char*";
        case ElementKind::Char:
            return "unsigned short*";
        case ElementKind::Short:
            return "short*";
        case ElementKind::Int:
            return "int*";
        case ElementKind::Long:
            return "long long*";
        case ElementKind::Float:
            return "float*";
        case ElementKind::Double:
            return "double*";
        case ElementKind::Untyped:
            return "unsigned char*";
        case ElementKind::None:
            break;
    }
    return {};
}

std::string_view kindName(ArgumentKind kind) noexcept
{
    switch (kind)
    {
        case ArgumentKind::PlainOldData:
            return "pod";
        case ArgumentKind::ObjectReference:
            return "object";
        case ArgumentKind::String:
            return "string";
        case ArgumentKind::Array:
            return "array";
        case ArgumentKind::Buffer:
            return "buffer";
    }
    return "";
}

} // namespace jnigen::frontends::java
