// =================================================================
// include/FolderDoc/DocumentAssembler.hpp
// =================================================================
// Header for assembling the complete review document.

#pragma once

#include "FolderDoc/ContentAggregator.hpp"
#include "FolderDoc/FileSystem.hpp"
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace FolderDoc {

/**
 * @brief Builds the markdown document for an LLM reviewer
 *
 * The document holds a header, reviewer instructions, optional project
 * metadata, the directory tree, every included file with line numbers,
 * and a summary with total file and line counts.
 */
class DocumentAssembler {
public:
    /**
     * @brief Construct an assembler
     * @param file_system Reader used for all traversals; a DiskFileSystem when null
     */
    explicit DocumentAssembler(std::shared_ptr<const FileSystemReader> file_system = nullptr);

    /**
     * @brief Write the document for a root directory
     * @param root_path Directory to document
     * @param patterns Include patterns; empty documents everything
     * @param strip_comments Strip comments from supported source kinds
     * @param out Output sink
     * @return Totals for the content dump
     * @throws std::invalid_argument if root_path is not an existing directory
     */
    TraversalStats generate(const std::filesystem::path& root_path,
                            const std::vector<std::string>& patterns,
                            bool strip_comments,
                            std::ostream& out) const;

    /**
     * @brief Generate the document and save it to disk
     * @param root_path Directory to document
     * @param output_path Requested output file; resolved when empty
     * @param patterns Include patterns
     * @param strip_comments Strip comments from supported source kinds
     * @return Path the document was written to
     * @throws std::invalid_argument if root_path is not an existing directory
     * @throws std::runtime_error if the output file cannot be written
     */
    std::filesystem::path generateToFile(const std::filesystem::path& root_path,
                                         const std::filesystem::path& output_path,
                                         const std::vector<std::string>& patterns,
                                         bool strip_comments) const;

    /**
     * @brief Get statistics from the last generate() call
     */
    TraversalStats getLastStats() const { return m_last_stats; }

    /**
     * @brief Resolve where the document is saved
     *
     * Without a requested path the document goes to
     * `<base>/Md/<project>/<project>.md`, where `<base>` is the parent of
     * the root, or its grandparent when the parent carries the project
     * name (nested checkout layout).
     *
     * @param root_path Root directory
     * @param requested Requested output path, may be empty
     * @return Output file path
     */
    static std::filesystem::path resolveOutputPath(const std::filesystem::path& root_path,
                                                   const std::filesystem::path& requested);

    /**
     * @brief Project name derived from the root directory
     * @param root_path Root directory
     * @return Last path component
     */
    static std::string projectName(const std::filesystem::path& root_path);

    /**
     * @brief Fixed instructions for the reviewing model
     * @return Markdown section text
     */
    static std::string buildReviewerInstructions();

private:
    std::shared_ptr<const FileSystemReader> m_file_system;
    mutable TraversalStats m_last_stats;

    void writeHeader(const std::string& project, const std::filesystem::path& root_path,
                     const std::vector<std::string>& patterns, bool strip_comments,
                     std::ostream& out) const;

    static std::string currentTimestamp();
};

} // namespace FolderDoc
