//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Maps file identifiers to paths and, optionally, to the text of the
//          Java source or JNI header registered under them.
// Key invariants: File ID 0 is invalid. Equal normalized paths share an id.
// Ownership/Lifetime: Manager owns path strings and registered texts.
// Links: support/diag_expected.hpp (printDiag)
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace jnigen::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// Diagnostics carry only a file identifier; the manager resolves it to the
/// path and, when the text was registered, to the offending line.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @return New or existing file identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @return File path string view, empty for unknown identifiers.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Keep a copy of the text of @p file_id for diagnostic excerpts.
    void setSource(uint32_t file_id, std::string_view text);

    /// @brief Text of 1-based @p line without its line terminator.
    /// @return Empty when the file has no registered text or the line is out of range.
    std::string_view lineText(uint32_t file_id, uint32_t line) const;

    /// @brief Number of registered files.
    [[nodiscard]] std::size_t fileCount() const
    {
        return files_.size();
    }

  private:
    /// Stored file paths; index i holds identifier i + 1.
    std::deque<std::string> files_;

    /// Next identifier to assign; stored as 64-bit to detect overflow safely.
    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;

    /// Registered texts keyed by identifier.
    std::unordered_map<uint32_t, std::string> sources_;
};
} // namespace jnigen::support
