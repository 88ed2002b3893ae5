// =================================================================
// include/FolderDoc/FileSystem.hpp
// =================================================================
// Directory entries and the file-system reader used by the traversal.

#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace FolderDoc {

enum class EntryKind {
    File,
    Directory
};

/**
 * @brief A file or directory discovered under the scan root
 *
 * The relative path always uses `/` separators. The root itself has
 * an empty relative path.
 */
struct FileSystemEntry {
    EntryKind kind;
    std::filesystem::path absolute_path;
    std::string relative_path;

    FileSystemEntry(EntryKind k, const std::filesystem::path& abs, const std::string& rel)
        : kind(k), absolute_path(abs), relative_path(rel) {}

    bool isDirectory() const { return kind == EntryKind::Directory; }
    bool isFile() const { return kind == EntryKind::File; }

    /**
     * @brief Last component of the path
     * @return File or directory name
     */
    std::string name() const;

    /**
     * @brief Lower-cased extension including the dot
     * @return Extension such as ".json", or empty
     */
    std::string extension() const;

    /**
     * @brief Build the entry for a scan root
     * @param root Root directory
     * @return Directory entry with empty relative path
     */
    static FileSystemEntry root(const std::filesystem::path& root);
};

/**
 * @brief Read-only access to the tree being documented
 */
class FileSystemReader {
public:
    virtual ~FileSystemReader() = default;

    /**
     * @brief Enumerate the direct children of a directory
     * @param directory Directory entry
     * @return Children in enumeration order (unsorted); symbolic links to
     *         directories are left out
     * @throws std::filesystem::filesystem_error if the directory cannot be read
     */
    virtual std::vector<FileSystemEntry> listDirectory(const FileSystemEntry& directory) const = 0;

    /**
     * @brief Read the whole file as text
     * @param file File entry
     * @return File content
     * @throws std::runtime_error if the file cannot be opened or read
     */
    virtual std::string readText(const FileSystemEntry& file) const = 0;
};

/**
 * @brief FileSystemReader backed by std::filesystem
 */
class DiskFileSystem : public FileSystemReader {
public:
    std::vector<FileSystemEntry> listDirectory(const FileSystemEntry& directory) const override;
    std::string readText(const FileSystemEntry& file) const override;
};

/**
 * @brief Join a parent relative path and a child name with `/`
 * @param parent Parent relative path (may be empty)
 * @param name Child name
 * @return Child relative path
 */
std::string joinRelative(const std::string& parent, const std::string& name);

/**
 * @brief Sort entries by relative path, ordinal comparison
 * @param entries Entries to sort in place
 */
void sortEntries(std::vector<FileSystemEntry>& entries);

} // namespace FolderDoc
