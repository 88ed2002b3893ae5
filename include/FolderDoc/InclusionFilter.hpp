// =================================================================
// include/FolderDoc/InclusionFilter.hpp
// =================================================================
// Header for deciding which files and directories enter the document.

#pragma once

#include "FolderDoc/FileSystem.hpp"
#include "FolderDoc/GlobPattern.hpp"
#include <string>
#include <vector>
#include <unordered_set>

namespace FolderDoc {

/**
 * @brief Fixed exclusion tables shared by every run
 */
struct ExclusionSets {
    /**
     * @brief Lower-cased file extensions that are never documented
     */
    static const std::unordered_set<std::string>& excludedExtensions();

    /**
     * @brief Directory names that are never entered
     */
    static const std::unordered_set<std::string>& excludedFolders();
};

/**
 * @brief Decides whether an entry belongs in the tree and the content dump
 *
 * The fixed exclusion sets are applied first. With no include patterns
 * every remaining entry is included. Directories are kept when a pattern
 * could still match something below them, so that the traversal only
 * prunes subtrees that can contribute nothing.
 */
class InclusionFilter {
public:
    /**
     * @brief Construct a filter from raw include patterns
     * @param patterns Glob patterns; empty means include everything
     */
    explicit InclusionFilter(const std::vector<std::string>& patterns = {});

    /**
     * @brief Decide whether an entry is included
     * @param entry File or directory entry
     * @return true if entry should be rendered and traversed
     */
    bool isIncluded(const FileSystemEntry& entry) const;

    /**
     * @brief Check the fixed exclusion sets only
     * @param entry File or directory entry
     * @return true if the entry is globally excluded
     */
    static bool isGloballyExcluded(const FileSystemEntry& entry);

    bool hasPatterns() const { return !m_patterns.empty(); }

private:
    std::vector<GlobPattern> m_patterns;

    bool matchesAnyPattern(const FileSystemEntry& entry) const;

    bool mayContainMatches(const FileSystemEntry& directory) const;
};

} // namespace FolderDoc
