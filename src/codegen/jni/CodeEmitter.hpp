//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/jni/CodeEmitter.hpp
// Purpose: Emit the C++ translation unit for one Java file from its matched
//          segments.
//
// Output layout:
//   #include <Header.h>
//   for each raw block:   //@line:N marker, then the block text
//   for each declaration: the JNI function with argument marshalling, or an
//                         inner wrapped_ function plus the exported wrapper
//                         when acquired arguments meet an early `return`.
//
// Key invariants:
//   - Acquisition order is buffers, strings, arrays; release order is arrays,
//     strings. Buffers are never released.
//   - Segments are emitted in list order.
//   - The exported function head is the header's text, byte for byte.
// Ownership/Lifetime: The emitter is stateless; streams are borrowed.
// Links: codegen/jni/SignatureCorrelator.hpp, frontends/java/TypeClassifier.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/jni/SignatureCorrelator.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace jnigen::codegen::jni
{

/// @brief Prefix of a raw JNI handle whose converted pointer takes the plain name.
inline constexpr std::string_view kArgPrefix = "obj_";

/// @brief Prefix of the inner function produced by decomposition.
inline constexpr std::string_view kWrapperPrefix = "wrapped_";

/// @brief Local holding the inner function's result in the exported wrapper.
inline constexpr std::string_view kReturnValue = "JNI_returnValue";

/// @brief True when @p decl must be split into inner and outer functions.
/// @details Requires an argument needing acquire/release and the text
///          "return" anywhere in the embedded code.
[[nodiscard]] bool needsDecomposition(const frontends::java::Declaration &decl);

/// @brief Writes JNI glue code for matched segments.
class CodeEmitter
{
  public:
    /// @brief Emit the whole unit to @p os.
    /// @param headerName Base name of the JNI header, e.g. "com.example.Foo.h".
    void emitUnit(std::ostream &os,
                  const MatchedSegmentList &segments,
                  std::string_view headerName) const;

    /// @brief Emit the whole unit and return it as a string.
    [[nodiscard]] std::string emit(const MatchedSegmentList &segments,
                                   std::string_view headerName) const;

    /// @brief Emit a `//@line:N` marker preceded by a blank line.
    void emitLineMarker(std::ostream &os, uint32_t line) const;

    void emitRawBlock(std::ostream &os, const frontends::java::RawBlock &block) const;

    /// @brief Emit one or two functions for @p matched.
    void emitMethod(std::ostream &os, const MatchedDeclaration &matched) const;

  private:
    /// @brief Acquire/release code and the extra names for decomposition.
    struct Marshalling
    {
        std::string setup;
        std::string cleanup;
        /// @brief "<type> <name>" for every acquired pointer, acquisition order.
        std::vector<std::string> innerParams;
        /// @brief Arguments the wrapper passes to the inner function.
        std::vector<std::string> callArgs;
    };

    Marshalling planMarshalling(const MatchedDeclaration &matched) const;

    /// @brief Emit the function head and parameter list up to the opening brace.
    /// @param innerParams Extra trailing parameters; non-null selects the inner
    ///                    wrapped_ head.
    void emitSignature(std::ostream &os,
                       const MatchedDeclaration &matched,
                       const std::vector<std::string> *innerParams) const;

    void emitBody(std::ostream &os, const frontends::java::Declaration &decl) const;
};

} // namespace jnigen::codegen::jni
