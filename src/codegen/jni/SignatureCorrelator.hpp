//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/jni/SignatureCorrelator.hpp
// Purpose: Pair each native method declaration with its JNI header prototype.
//
// Matching: a prototype matches when its header line contains the mangled
// "Class_method" token and it carries exactly two more parameter types than
// the declaration has arguments. The first match in header order wins.
// Overloads with equal arity are not told apart by parameter type.
//
// Key invariants: For every MatchedDeclaration,
//                 signature.argumentCTypes.size() - 2 == declaration.arguments.size().
// Ownership/Lifetime: Results copy the declaration and signature.
// Links: frontends/java/Segment.hpp, frontends/jni/JniHeaderParser.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/Segment.hpp"
#include "frontends/jni/JniHeaderParser.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <variant>
#include <vector>

namespace jnigen::codegen::jni
{

/// @brief A declaration together with the prototype it implements.
struct MatchedDeclaration
{
    frontends::java::Declaration declaration;
    frontends::jni::LowLevelSignature signature;
};

using MatchedSegment = std::variant<frontends::java::RawBlock, MatchedDeclaration>;
using MatchedSegmentList = std::vector<MatchedSegment>;

/// @brief Find the prototype implementing @p decl.
/// @return Pointer into @p signatures, or nullptr when none matches.
const frontends::jni::LowLevelSignature *findSignature(
    const frontends::java::Declaration &decl,
    const std::vector<frontends::jni::LowLevelSignature> &signatures);

/// @brief Correlate every declaration of @p segments; raw blocks pass through.
/// @param fileId SourceManager id of the Java file, for diagnostics.
/// @return Matched segments in the same order, or a "no matching signature"
///         error at the declaration's line for the first unmatched one.
support::Expected<MatchedSegmentList> correlate(
    const frontends::java::SegmentList &segments,
    const std::vector<frontends::jni::LowLevelSignature> &signatures,
    uint32_t fileId = 0);

} // namespace jnigen::codegen::jni
