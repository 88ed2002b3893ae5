// =================================================================
// include/FolderDoc/ProjectMetadata.hpp
// =================================================================
// Header for .csproj discovery and property extraction.

#pragma once

#include "FolderDoc/FileSystem.hpp"
#include "FolderDoc/InclusionFilter.hpp"
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace FolderDoc {

/**
 * @brief A NuGet package reference
 */
struct PackageReference {
    std::string name;
    std::string version;
};

/**
 * @brief Properties extracted from one project file
 */
struct ProjectInfo {
    std::string relative_path;
    std::vector<std::pair<std::string, std::string>> properties;
    std::vector<PackageReference> packages;
};

/**
 * @brief Collects .csproj metadata for the document header
 *
 * Uses the same pruning as the rest of the traversal, so only project
 * files that would also appear in the content dump are reported.
 */
class ProjectMetadata {
public:
    ProjectMetadata(const FileSystemReader& file_system, const InclusionFilter& filter);

    /**
     * @brief Find and parse every included project file
     * @param root Root directory
     * @return Parsed projects sorted by path
     */
    std::vector<ProjectInfo> collect(const FileSystemEntry& root) const;

    /**
     * @brief Extract properties and package references from project XML
     * @param relative_path Path recorded in the result
     * @param xml Project file content
     * @return Parsed project
     */
    static ProjectInfo parse(const std::string& relative_path, const std::string& xml);

    /**
     * @brief Write a markdown section describing the projects
     * @param projects Parsed projects; nothing is written when empty
     * @param out Output sink
     */
    static void render(const std::vector<ProjectInfo>& projects, std::ostream& out);

private:
    const FileSystemReader& m_file_system;
    const InclusionFilter& m_filter;

    void collectInto(const FileSystemEntry& directory, std::vector<ProjectInfo>& projects) const;
};

} // namespace FolderDoc
