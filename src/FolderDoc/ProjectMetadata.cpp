// =================================================================
// src/FolderDoc/ProjectMetadata.cpp
// =================================================================
// Implementation for .csproj discovery and property extraction.

#include "FolderDoc/ProjectMetadata.hpp"
#include "FolderDoc/Logger.hpp"
#include <regex>
#include <stdexcept>

namespace FolderDoc {

ProjectMetadata::ProjectMetadata(const FileSystemReader& file_system, const InclusionFilter& filter)
    : m_file_system(file_system), m_filter(filter)
{
}

std::vector<ProjectInfo> ProjectMetadata::collect(const FileSystemEntry& root) const {
    std::vector<ProjectInfo> projects;
    collectInto(root, projects);
    return projects;
}

void ProjectMetadata::collectInto(const FileSystemEntry& directory, std::vector<ProjectInfo>& projects) const {
    std::vector<FileSystemEntry> children;
    try {
        children = m_file_system.listDirectory(directory);
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::getInstance().debug("ProjectMetadata", "Skipping unreadable directory", e.what());
        return;
    }
    sortEntries(children);

    for (const auto& child : children) {
        if (!m_filter.isIncluded(child)) {
            continue;
        }

        if (child.isDirectory()) {
            collectInto(child, projects);
            continue;
        }

        if (child.extension() != ".csproj") {
            continue;
        }

        try {
            projects.push_back(parse(child.relative_path, m_file_system.readText(child)));
        } catch (const std::exception& e) {
            Logger::getInstance().warning("ProjectMetadata", "Cannot read project " + child.relative_path, e.what());
        }
    }
}

ProjectInfo ProjectMetadata::parse(const std::string& relative_path, const std::string& xml) {
    static const std::vector<std::string> property_names = {
        "TargetFramework", "TargetFrameworks", "OutputType", "AssemblyName", "RootNamespace", "Nullable"
    };
    static const std::regex package_regex(
        R"re(<PackageReference\s{1,32}Include\s{0,32}=\s{0,32}"([^"]{1,256})"(?:\s{1,32}Version\s{0,32}=\s{0,32}"([^"]{0,64})")?)re",
        std::regex_constants::ECMAScript | std::regex_constants::icase);

    ProjectInfo info;
    info.relative_path = relative_path;

    // Every quantifier is bounded: std::regex recursion grows with the matched length

    for (const auto& name : property_names) {
        std::regex property_regex("<" + name + R"re(>\s{0,64}([^<]{0,512}?)\s{0,64}</)re" + name + ">");
        std::smatch match;
        if (std::regex_search(xml, match, property_regex)) {
            info.properties.emplace_back(name, match.str(1));
        }
    }

    auto end = std::sregex_iterator();
    for (auto it = std::sregex_iterator(xml.begin(), xml.end(), package_regex); it != end; ++it) {
        PackageReference package;
        package.name = (*it).str(1);
        package.version = (*it)[2].matched ? (*it).str(2) : "";
        info.packages.push_back(package);
    }

    return info;
}

void ProjectMetadata::render(const std::vector<ProjectInfo>& projects, std::ostream& out) {
    if (projects.empty()) {
        return;
    }

    out << "## Project Metadata\n\n";
    for (const auto& project : projects) {
        out << "### " << project.relative_path << "\n\n";

        for (const auto& property : project.properties) {
            out << "- **" << property.first << "**: " << property.second << "\n";
        }

        if (!project.packages.empty()) {
            out << "- **Packages**:\n";
            for (const auto& package : project.packages) {
                out << "  - " << package.name;
                if (!package.version.empty()) {
                    out << " (" << package.version << ")";
                }
                out << "\n";
            }
        }
        out << "\n";
    }
}

} // namespace FolderDoc
