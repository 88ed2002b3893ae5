// =================================================================
// include/FolderDoc/ContentAggregator.hpp
// =================================================================
// Header for streaming numbered file contents into the document.

#pragma once

#include "FolderDoc/FileSystem.hpp"
#include "FolderDoc/InclusionFilter.hpp"
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace FolderDoc {

/**
 * @brief Totals for a traversal, merged by addition
 */
struct TraversalStats {
    size_t file_count = 0;
    size_t line_count = 0;

    TraversalStats& operator+=(const TraversalStats& other) {
        file_count += other.file_count;
        line_count += other.line_count;
        return *this;
    }
};

inline TraversalStats operator+(TraversalStats lhs, const TraversalStats& rhs) {
    lhs += rhs;
    return lhs;
}

/**
 * @brief Writes every included file as a numbered, fenced block
 *
 * Within a directory the files are written first, sorted by path, and
 * the subdirectories follow in sorted order. Each recursive call returns
 * its own totals which the caller adds to its running sum.
 */
class ContentAggregator {
public:
    /**
     * @brief Construct an aggregator
     * @param file_system Reader used for enumeration and file content
     * @param filter Inclusion decisions
     * @param strip_comments Strip comments from supported source kinds
     */
    ContentAggregator(const FileSystemReader& file_system, const InclusionFilter& filter,
                      bool strip_comments = false);

    /**
     * @brief Write the contents of a directory subtree
     * @param directory Directory to process
     * @param out Output sink
     * @return Files and lines written for this subtree
     */
    TraversalStats aggregate(const FileSystemEntry& directory, std::ostream& out) const;

    /**
     * @brief Read, sanitize and write a single file section
     * @param file File entry
     * @param out Output sink
     * @return {1, lines} on success, {0, 0} if the file could not be read
     */
    TraversalStats emitFile(const FileSystemEntry& file, std::ostream& out) const;

    /**
     * @brief Apply redaction and optional comment stripping for a file
     * @param file_name File name used for classification
     * @param content Raw content
     * @return Sanitized content with unchanged line count
     */
    std::string sanitize(const std::string& file_name, const std::string& content) const;

    /**
     * @brief Split text into lines, ReadAllLines style
     * @param text Content
     * @return Lines without terminators; no trailing empty line for a final terminator
     */
    static std::vector<std::string> splitLines(const std::string& text);

    /**
     * @brief Pick a fence that cannot be closed by the content
     * @param content File content
     * @return "```" or "````" when the content holds a triple backtick
     */
    static std::string fenceFor(const std::string& content);

    /**
     * @brief Markdown info string for a file extension
     * @param file_name File name
     * @return Language tag such as "csharp", or "text"
     */
    static std::string languageTag(const std::string& file_name);

private:
    const FileSystemReader& m_file_system;
    const InclusionFilter& m_filter;
    bool m_strip_comments;
};

} // namespace FolderDoc
