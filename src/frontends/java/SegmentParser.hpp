//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/java/SegmentParser.hpp
// Purpose: Split an annotated Java source file into raw native blocks and
//          native method declarations with their embedded code.
//
// Recognised constructs:
//   - `/*JNI ... */` anywhere outside a declaration: a RawBlock holding the
//     text after the JNI tag.
//   - `native` method declaration whose terminating `;` is followed, on the
//     same line, by a block comment: a Declaration whose embedded code is the
//     comment interior.
// Everything else (package, imports, fields, ordinary methods) is discarded.
//
// Key invariants: Segments appear in source order. A malformed native
//                 signature fails the whole file; no partial list is returned.
// Ownership/Lifetime: The parser borrows the source text for the duration of
//                     parse(); the returned segments own their strings.
// Links: frontends/java/Segment.hpp, frontends/java/JavaLexer.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/JavaLexer.hpp"
#include "frontends/java/Segment.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace jnigen::frontends::java
{

/// @brief Marker that tags a free-standing native code comment.
inline constexpr std::string_view kJniSectionTag = "JNI";

/// @brief Parse @p source into an ordered list of segments.
/// @param source Full text of one Java file.
/// @param fileId SourceManager id used for diagnostic locations.
/// @param diags Receives warnings (native methods without embedded code).
/// @return Segments in source order, or the first parse error.
support::Expected<SegmentList> parseSegments(std::string_view source,
                                             uint32_t fileId,
                                             support::DiagnosticEngine &diags);

/// @brief Recursive-descent scanner over the token stream of one file.
/// @details Tracks only class nesting and member boundaries; method and
///          initializer bodies are skipped by brace matching.
class SegmentParser
{
  public:
    SegmentParser(std::string_view source, uint32_t fileId, support::DiagnosticEngine &diags);

    support::Expected<SegmentList> parse();

  private:
    using TokenRange = std::vector<const Token *>;

    support::Expected<void> tokenize();
    support::Expected<void> parseMembers(bool topLevel);
    support::Expected<void> parseMember();
    support::Expected<void> parseClassBody(const std::string &name, bool isEnum);
    /// @return True when member declarations follow the constants, false
    ///         when the enum body closed.
    support::Expected<bool> skipEnumConstants();
    support::Expected<void> skipBalanced(char open, char close);
    support::Expected<void> skipInitializer();
    support::Expected<void> parseNativeMethod(const TokenRange &header);
    support::Expected<Argument> parseParameter(const TokenRange &tokens,
                                               const std::string &methodName,
                                               uint32_t line);

    /// @brief Current token; comments are returned as-is.
    const Token &peek() const;

    /// @brief Consume the current token, recording JNI sections.
    const Token &advance();

    /// @brief Skip comment tokens at the cursor, recording JNI sections.
    void skipComments();

    void recordComment(const Token &tok);
    std::string currentClassName() const;

    support::Diag errorAt(uint32_t line, std::string message) const;
    support::Diag errorAt(const Token &tok, std::string message) const;

    std::string_view source_;
    uint32_t fileId_;
    support::DiagnosticEngine &diags_;
    std::vector<Token> tokens_;
    std::size_t index_ = 0;
    std::vector<std::string> classStack_;
    SegmentList segments_;
};

} // namespace jnigen::frontends::java
