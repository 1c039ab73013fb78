//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/jni/JniMangle.hpp
// Purpose: JNI short-name escaping of Java class and method names.
// Key invariants: Output is ASCII [A-Za-z0-9_]; plain identifiers without
//                 '_' or '$' map to themselves.
// Ownership/Lifetime: Stateless helpers returning std::string by value.
// Links: codegen/jni/SignatureCorrelator.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

namespace jnigen::frontends::jni
{

/// @brief Escape @p name the way JNI short function names are escaped.
/// @details '_' becomes "_1", '$' becomes "_00024", any other character
///          outside [A-Za-z0-9] becomes "_0xxxx" with the lowercase hex of its
///          UTF-16 code unit. UTF-8 input is decoded first; characters beyond
///          the BMP produce two escapes, one per surrogate.
/// @param name Simple or '$'-joined nested class name, or a method name.
std::string mangleJniName(std::string_view name);

/// @brief Token searched for in a JNI header line to find a method.
/// @return mangleJniName(className) + "_" + mangleJniName(methodName).
std::string correlationToken(std::string_view className, std::string_view methodName);

} // namespace jnigen::frontends::jni
