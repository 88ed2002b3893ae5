// =================================================================
// src/FolderDoc/FileSystem.cpp
// =================================================================
// Implementation for directory enumeration and whole-file reads.

#include "FolderDoc/FileSystem.hpp"
#include "FolderDoc/Logger.hpp"
#include "FolderDoc/StringUtils.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace FolderDoc {

std::string FileSystemEntry::name() const {
    return absolute_path.filename().string();
}

std::string FileSystemEntry::extension() const {
    return toLower(absolute_path.extension().string());
}

FileSystemEntry FileSystemEntry::root(const std::filesystem::path& root) {
    std::filesystem::path absolute = std::filesystem::absolute(root).lexically_normal();
    // "project/" normalizes to "project/." style paths with an empty filename
    if (absolute.filename().empty() && absolute.has_parent_path()) {
        absolute = absolute.parent_path();
    }
    return FileSystemEntry(EntryKind::Directory, absolute, "");
}

std::vector<FileSystemEntry> DiskFileSystem::listDirectory(const FileSystemEntry& directory) const {
    std::vector<FileSystemEntry> children;

    // The throwing iterator constructor surfaces permission errors to the caller
    for (const auto& entry : std::filesystem::directory_iterator(directory.absolute_path)) {
        std::error_code ec;
        bool is_link = entry.is_symlink(ec);
        bool is_dir = !ec && entry.is_directory(ec);
        if (ec) {
            continue;
        }
        if (!is_dir && !entry.is_regular_file(ec)) {
            continue;
        }

        std::string name = entry.path().filename().string();
        // A linked directory may point back at one of its ancestors
        if (is_dir && is_link) {
            Logger::getInstance().debug("FileSystem", "Skipping directory link",
                                        joinRelative(directory.relative_path, name));
            continue;
        }
        children.emplace_back(is_dir ? EntryKind::Directory : EntryKind::File,
                              entry.path(),
                              joinRelative(directory.relative_path, name));
    }

    return children;
}

std::string DiskFileSystem::readText(const FileSystemEntry& file) const {
    std::ifstream stream(file.absolute_path, std::ios::binary);
    if (!stream.is_open()) {
        throw std::runtime_error("Could not open file: " + file.relative_path);
    }

    std::ostringstream content;
    content << stream.rdbuf();
    if (stream.bad()) {
        throw std::runtime_error("I/O error while reading: " + file.relative_path);
    }

    std::string text = content.str();
    // Drop a UTF-8 byte order mark
    if (startsWith(text, "\xEF\xBB\xBF")) {
        text.erase(0, 3);
    }
    return text;
}

std::string joinRelative(const std::string& parent, const std::string& name) {
    if (parent.empty() || parent == ".") {
        return name;
    }
    return parent + "/" + name;
}

void sortEntries(std::vector<FileSystemEntry>& entries) {
    std::sort(entries.begin(), entries.end(),
              [](const FileSystemEntry& a, const FileSystemEntry& b) {
                  return a.relative_path < b.relative_path;
              });
}

} // namespace FolderDoc
