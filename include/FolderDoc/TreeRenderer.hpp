// =================================================================
// include/FolderDoc/TreeRenderer.hpp
// =================================================================
// Header for the ASCII directory tree.

#pragma once

#include "FolderDoc/FileSystem.hpp"
#include "FolderDoc/InclusionFilter.hpp"
#include <ostream>
#include <string>
#include <unordered_set>

namespace FolderDoc {

/**
 * @brief Renders included entries the way the `tree` command does
 *
 * Siblings are sorted by path with directories and files interleaved.
 * Excluded directories are pruned and never enumerated.
 */
class TreeRenderer {
public:
    TreeRenderer(const FileSystemReader& file_system, const InclusionFilter& filter);

    /**
     * @brief Render the tree below a root directory
     * @param root Root directory entry
     * @param root_label Label printed on the first line (a trailing `/` is added)
     * @param out Output sink
     */
    void render(const FileSystemEntry& root, const std::string& root_label, std::ostream& out) const;

    /**
     * @brief Well-known entry-point file names annotated in the tree
     */
    static const std::unordered_set<std::string>& entryPointNames();

private:
    const FileSystemReader& m_file_system;
    const InclusionFilter& m_filter;

    void renderChildren(const FileSystemEntry& directory, const std::string& indent, std::ostream& out) const;
};

} // namespace FolderDoc
