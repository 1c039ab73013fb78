//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares lightweight source location POD for diagnostics and segment positions.
// Key invariants: file_id == 0 denotes an unknown file; line is 1-based when valid.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace jnigen::support
{

/// @brief Represents an absolute position within a source file.
/// @invariant file_id == 0 indicates an unknown file.
/// @ownership Value type with no owned resources.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 denotes invalid location.
    uint32_t file_id = 0;

    /// @brief One-based line number within the file; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a valid file entry.
    [[nodiscard]] bool isValid() const;

    /// @brief Determine whether a 1-based line number is available.
    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }
};

} // namespace jnigen::support
