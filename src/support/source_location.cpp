//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the helper predicates attached to SourceLoc.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Validity checks for source locations.

#include "support/source_location.hpp"

namespace jnigen::support
{

/// @brief Report whether the location was produced for a registered file.
///
/// @details Locations emitted by the Java scanner always carry the file id
///          handed out by the SourceManager; a zero id marks diagnostics that
///          are not tied to any file (for example command-line errors).
///
/// @return True when @ref file_id is non-zero.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

} // namespace jnigen::support
