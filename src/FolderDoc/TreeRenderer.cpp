// =================================================================
// src/FolderDoc/TreeRenderer.cpp
// =================================================================
// Implementation for the ASCII directory tree.

#include "FolderDoc/TreeRenderer.hpp"
#include "FolderDoc/Logger.hpp"
#include <system_error>
#include <vector>

namespace FolderDoc {

TreeRenderer::TreeRenderer(const FileSystemReader& file_system, const InclusionFilter& filter)
    : m_file_system(file_system), m_filter(filter)
{
}

void TreeRenderer::render(const FileSystemEntry& root, const std::string& root_label, std::ostream& out) const {
    out << root_label << "/\n";
    renderChildren(root, "", out);
}

const std::unordered_set<std::string>& TreeRenderer::entryPointNames() {
    static const std::unordered_set<std::string> names = {
        "Program.cs", "Startup.cs", "App.xaml.cs",
        "main.cpp", "main.c", "main.py", "main.go", "main.rs",
        "index.js", "index.ts"
    };
    return names;
}

void TreeRenderer::renderChildren(const FileSystemEntry& directory, const std::string& indent, std::ostream& out) const {
    std::vector<FileSystemEntry> children;
    try {
        children = m_file_system.listDirectory(directory);
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::getInstance().warning("TreeRenderer", "Cannot enumerate directory", e.what());
        bool denied = e.code() == std::errc::permission_denied;
        out << indent << "└── " << (denied ? "[Access Denied]" : "[Unreadable]") << "\n";
        return;
    }

    std::vector<FileSystemEntry> included;
    for (auto& child : children) {
        if (m_filter.isIncluded(child)) {
            included.push_back(std::move(child));
        }
    }
    sortEntries(included);

    for (size_t i = 0; i < included.size(); ++i) {
        const FileSystemEntry& entry = included[i];
        bool is_last = (i == included.size() - 1);

        out << indent << (is_last ? "└── " : "├── ") << entry.name();
        if (entry.isDirectory()) {
            out << "/";
        } else if (entryPointNames().count(entry.name()) > 0) {
            out << " [Entry Point]";
        }
        out << "\n";

        if (entry.isDirectory()) {
            renderChildren(entry, indent + (is_last ? "    " : "│   "), out);
        }
    }
}

} // namespace FolderDoc
