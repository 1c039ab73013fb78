//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/java/TypeClassifier.hpp
// Purpose: Classify declared Java parameter types into marshalling categories.
// Key invariants: classify() is total; unknown types become ObjectReference.
//                 The element pointer table is fixed and must not drift.
// Ownership/Lifetime: ArgumentType is a value type.
// Links: codegen/jni/CodeEmitter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

namespace jnigen::frontends::java
{

/// @brief Marshalling category of a native method argument.
enum class ArgumentKind
{
    PlainOldData,    ///< boolean, byte, char, short, int, long, float, double.
    ObjectReference, ///< Any other type; passed through as an opaque handle.
    String,          ///< java.lang.String; read as modified UTF-8.
    Array,           ///< One-dimensional primitive array; pinned while in use.
    Buffer,          ///< java.nio direct buffer; only its address is taken.
};

/// @brief Primitive element type carried by arrays and buffers.
enum class ElementKind
{
    None,
    Boolean,
    Byte,
    Char,
    Short,
    Int,
    Long,
    Float,
    Double,
    Untyped, ///< Plain java.nio.Buffer.
};

/// @brief Result of classifying one declared parameter type.
struct ArgumentType
{
    ArgumentKind kind{ArgumentKind::ObjectReference};
    ElementKind element{ElementKind::None};

    /// @brief Declared type as written in the source, whitespace removed.
    std::string declared;

    [[nodiscard]] bool isPlainOldData() const noexcept
    {
        return kind == ArgumentKind::PlainOldData;
    }

    [[nodiscard]] bool isObject() const noexcept
    {
        return kind == ArgumentKind::ObjectReference;
    }

    [[nodiscard]] bool isString() const noexcept
    {
        return kind == ArgumentKind::String;
    }

    [[nodiscard]] bool isArray() const noexcept
    {
        return kind == ArgumentKind::Array;
    }

    [[nodiscard]] bool isBuffer() const noexcept
    {
        return kind == ArgumentKind::Buffer;
    }

    /// @brief True when the emitter must produce acquisition code for the argument.
    [[nodiscard]] bool needsMarshalling() const noexcept
    {
        return !isPlainOldData() && !isObject();
    }
};

/// @brief Classify the declared Java type @p declaredType.
/// @details Accepts simple and fully qualified names (java.lang.String,
///          java.nio.FloatBuffer), whitespace inside the type, and varargs
///          (`int...` is classified like `int[]`).
[[nodiscard]] ArgumentType classify(std::string_view declaredType);

/// @brief Native pointer type used to view the argument's data.
/// @return For example "float*" for float[]; empty for POD and object handles.
[[nodiscard]] std::string_view pointerCType(const ArgumentType &type) noexcept;

/// @brief Human-readable category name, used in trace output and tests.
[[nodiscard]] std::string_view kindName(ArgumentKind kind) noexcept;

} // namespace jnigen::frontends::java
