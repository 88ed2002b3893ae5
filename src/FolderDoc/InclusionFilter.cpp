// =================================================================
// src/FolderDoc/InclusionFilter.cpp
// =================================================================
// Implementation for file and directory inclusion decisions.

#include "FolderDoc/InclusionFilter.hpp"
#include "FolderDoc/StringUtils.hpp"

namespace FolderDoc {

const std::unordered_set<std::string>& ExclusionSets::excludedExtensions() {
    static const std::unordered_set<std::string> extensions = {
        // Executables, libraries and debug symbols
        ".exe", ".dll", ".pdb", ".bin", ".obj", ".o", ".so", ".dylib", ".a", ".lib",
        // IDE and build caches
        ".cache", ".user", ".suo",
        // Binary media and archives
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".ico", ".pdf",
        ".zip", ".rar", ".7z", ".tar", ".gz"
    };
    return extensions;
}

const std::unordered_set<std::string>& ExclusionSets::excludedFolders() {
    static const std::unordered_set<std::string> folders = {
        "bin", "obj", ".vs", ".git", ".svn", ".hg", "node_modules", "packages",
        "Debug", "Release", ".idea", ".vscode", "dist", "build", "__pycache__",
        "Properties", ".folderdoc"
    };
    return folders;
}

InclusionFilter::InclusionFilter(const std::vector<std::string>& patterns)
    : m_patterns(compilePatterns(patterns))
{
}

bool InclusionFilter::isIncluded(const FileSystemEntry& entry) const {
    if (entry.relative_path.empty() || entry.relative_path == ".") {
        return true;
    }

    if (isGloballyExcluded(entry)) {
        return false;
    }

    if (m_patterns.empty()) {
        return true;
    }

    if (matchesAnyPattern(entry)) {
        return true;
    }

    return entry.isDirectory() && mayContainMatches(entry);
}

bool InclusionFilter::isGloballyExcluded(const FileSystemEntry& entry) {
    if (entry.isDirectory()) {
        const auto& folders = ExclusionSets::excludedFolders();
        return folders.find(entry.name()) != folders.end();
    }

    const auto& extensions = ExclusionSets::excludedExtensions();
    return extensions.find(entry.extension()) != extensions.end();
}

bool InclusionFilter::matchesAnyPattern(const FileSystemEntry& entry) const {
    std::string name = entry.name();
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(entry.relative_path) || pattern.matches(name)) {
            return true;
        }
    }
    return false;
}

bool InclusionFilter::mayContainMatches(const FileSystemEntry& directory) const {
    std::string relative = toLower(directory.relative_path);
    std::string name = toLower(directory.name());

    for (const auto& pattern : m_patterns) {
        const std::string& raw = pattern.getLoweredPattern();

        // Pattern names a path below this directory
        if (startsWith(raw, relative + "/")) {
            return true;
        }
        // Deliberately loose: any segment with this name keeps the directory
        if (startsWith(raw, name + "/") || raw.find("/" + name + "/") != std::string::npos) {
            return true;
        }
        // Universal-descendant forms can match at any depth
        if (startsWith(raw, "**")) {
            return true;
        }
    }

    return false;
}

} // namespace FolderDoc
