//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/java/Segment.hpp
// Purpose: Data model produced by the segment parser: raw native blocks and
//          native method declarations with their embedded code.
// Key invariants: A SegmentList mirrors the textual order of the source file.
//                 Line numbers are 1-based positions in the source text.
// Ownership/Lifetime: Plain value types; not mutated after parsing.
// Links: frontends/java/SegmentParser.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/TypeClassifier.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace jnigen::frontends::java
{

/// @brief One parameter of a native method.
/// @details The name is kept exactly as written; Java allows characters such
///          as '$' that are never re-lexed or validated for C.
struct Argument
{
    std::string name;
    ArgumentType type;
};

/// @brief A native method together with the code comment that implements it.
struct Declaration
{
    /// @brief Enclosing class, nested classes joined with '$' (Outer$Inner).
    std::string className;
    std::string methodName;
    bool isStatic = false;
    std::vector<Argument> arguments;

    /// @brief Interior of the code comment, verbatim.
    std::string embeddedCode;

    /// @brief Line of the comment's opening delimiter.
    uint32_t startLine = 0;

    /// @brief Line of the comment's closing delimiter.
    uint32_t endLine = 0;

    /// @brief True when at least one argument needs acquire/release code.
    [[nodiscard]] bool hasMarshalledArgument() const
    {
        for (const auto &arg : arguments)
        {
            if (arg.type.needsMarshalling())
                return true;
        }
        return false;
    }
};

/// @brief Free-standing native code not attached to a method.
struct RawBlock
{
    std::string nativeCode;
    uint32_t startLine = 0;
};

/// @brief One element of a parsed file in source order.
using Segment = std::variant<RawBlock, Declaration>;

using SegmentList = std::vector<Segment>;

} // namespace jnigen::frontends::java
