//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Generator.hpp
/// @brief One-file pipeline: Java source plus JNI header in, C++ unit out.
///
/// @details The pipeline runs three stages strictly in order:
///
/// 1. **Segmenting** - split the Java text into raw blocks and native method
///    declarations (frontends/java/SegmentParser)
/// 2. **Correlation** - parse the JNI header and pair each declaration with
///    its exported prototype (codegen/jni/SignatureCorrelator)
/// 3. **Emission** - write the translation unit (codegen/jni/CodeEmitter)
///
/// ## Usage
///
/// ```cpp
/// SourceManager sm;
/// UnitInput input{.javaSource = java, .javaPath = "src/Foo.java",
///                 .headerSource = header, .headerPath = "jni/Foo.h"};
/// UnitResult result = generateUnit(input, Options{}, sm);
/// if (result.succeeded())
///     write(result.output);
/// else
///     result.diagnostics.printAll(std::cerr, &sm);
/// ```
///
/// @invariant output is empty unless succeeded() returns true.
/// @invariant The generator keeps no state between calls.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/options.hpp"
#include "support/source_manager.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace jnigen
{

/// @brief Source texts and names for one generation unit.
struct UnitInput
{
    /// @brief Annotated Java source text.
    std::string_view javaSource;

    /// @brief Path of the Java file, used for diagnostics.
    std::string_view javaPath{"<java>"};

    /// @brief JNI header text produced by javah or javac -h.
    std::string_view headerSource;

    /// @brief Path of the header; its base name becomes the #include.
    std::string_view headerPath{"<header>.h"};
};

/// @brief Outcome of generating one unit.
struct UnitResult
{
    /// @brief Errors and warnings from every stage.
    support::DiagnosticEngine diagnostics{};

    /// @brief SourceManager ids of the Java file and the header.
    uint32_t javaFileId{0};
    uint32_t headerFileId{0};

    /// @brief Generated C++ text.
    std::string output;

    std::size_t rawBlockCount{0};
    std::size_t declarationCount{0};

    [[nodiscard]] bool succeeded() const;
};

/// @brief Base name of @p path with '/' or '\\' separators.
[[nodiscard]] std::string_view baseName(std::string_view path) noexcept;

/// @brief Run the parse, correlate and emit stages on @p input.
/// @param options Trace settings; progress output is left to the caller.
/// @param sm Registers both paths and texts for diagnostic printing.
UnitResult generateUnit(const UnitInput &input,
                        const support::Options &options,
                        support::SourceManager &sm);

} // namespace jnigen
