//===----------------------------------------------------------------------===//
//
// Part of the jnigen project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager that hands out file identifiers to the Java
// scanner and the header parser and resolves them back to paths and source
// lines when diagnostics are printed.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"
#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace jnigen::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));
    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        printDiag(makeError({}, std::string{kSourceManagerFileIdOverflowMessage}), std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

void SourceManager::setSource(uint32_t file_id, std::string_view text)
{
    if (file_id == 0)
        return;
    sources_[file_id] = std::string(text);
}

/// @details Linear scan of the registered text; a trailing '\r' of a CRLF
///          line ending is dropped.
std::string_view SourceManager::lineText(uint32_t file_id, uint32_t line) const
{
    if (line == 0)
        return {};
    auto it = sources_.find(file_id);
    if (it == sources_.end())
        return {};

    std::string_view src = it->second;
    std::size_t start = 0;
    for (uint32_t l = 1; l < line; ++l)
    {
        const std::size_t pos = src.find('\n', start);
        if (pos == std::string_view::npos)
            return {};
        start = pos + 1;
    }
    std::size_t end = src.find('\n', start);
    if (end == std::string_view::npos)
        end = src.size();
    std::string_view text = src.substr(start, end - start);
    if (!text.empty() && text.back() == '\r')
        text.remove_suffix(1);
    return text;
}

} // namespace jnigen::support
