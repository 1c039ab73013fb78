//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/jni/JniHeaderParser.hpp
// Purpose: Extract exported function prototypes from a javah/javac -h header.
//
// A prototype has the shape
//
//   JNIEXPORT <ret> JNICALL <name>
//     (<type>, <type>, ...);
//
// Comments and preprocessor lines between prototypes are ignored.
//
// Key invariants: Signatures are returned in header order; argumentCTypes[0]
//                 and [1] are the JNIEnv and class/instance slots.
// Ownership/Lifetime: LowLevelSignature is a value type.
// Links: codegen/jni/SignatureCorrelator.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace jnigen::frontends::jni
{

/// @brief One exported function prototype of a JNI header.
struct LowLevelSignature
{
    /// @brief "JNIEXPORT <ret> JNICALL <name>" with line breaks removed.
    std::string headerLine;

    std::string functionName;
    std::string returnCType;

    /// @brief Parameter types as written, e.g. "JNIEnv *", "jclass", "jint".
    std::vector<std::string> argumentCTypes;

    /// @brief Source line of the JNIEXPORT keyword.
    uint32_t line = 0;
};

/// @brief Parse every exported prototype in @p text.
/// @param text Full header text.
/// @param fileId SourceManager id used for diagnostic locations.
/// @return Signatures in header order, or a parse error naming the line of a
///         prototype head without a parameter list.
support::Expected<std::vector<LowLevelSignature>> parseJniHeader(std::string_view text,
                                                                uint32_t fileId = 0);

} // namespace jnigen::frontends::jni
