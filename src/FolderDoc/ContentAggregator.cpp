// =================================================================
// src/FolderDoc/ContentAggregator.cpp
// =================================================================
// Implementation for streaming numbered file contents.

#include "FolderDoc/ContentAggregator.hpp"
#include "FolderDoc/ContentSanitizer.hpp"
#include "FolderDoc/Logger.hpp"
#include "FolderDoc/StringUtils.hpp"
#include <filesystem>
#include <stdexcept>
#include <unordered_map>

namespace FolderDoc {

ContentAggregator::ContentAggregator(const FileSystemReader& file_system, const InclusionFilter& filter,
                                     bool strip_comments)
    : m_file_system(file_system), m_filter(filter), m_strip_comments(strip_comments)
{
}

TraversalStats ContentAggregator::aggregate(const FileSystemEntry& directory, std::ostream& out) const {
    TraversalStats stats;

    std::vector<FileSystemEntry> children;
    try {
        children = m_file_system.listDirectory(directory);
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::getInstance().warning("ContentAggregator", "Skipping unreadable directory", e.what());
        out << "> [Access Denied] " << directory.relative_path << "/\n\n";
        return stats;
    }

    std::vector<FileSystemEntry> files;
    std::vector<FileSystemEntry> directories;
    for (auto& child : children) {
        if (!m_filter.isIncluded(child)) {
            continue;
        }
        if (child.isDirectory()) {
            directories.push_back(std::move(child));
        } else {
            files.push_back(std::move(child));
        }
    }
    sortEntries(files);
    sortEntries(directories);

    for (const auto& file : files) {
        stats += emitFile(file, out);
    }

    for (const auto& subdirectory : directories) {
        stats += aggregate(subdirectory, out);
    }

    return stats;
}

TraversalStats ContentAggregator::emitFile(const FileSystemEntry& file, std::ostream& out) const {
    Logger::getInstance().debug("ContentAggregator", "Writing " + file.relative_path);

    out << "### File: " << file.relative_path << "\n\n";

    std::string content;
    try {
        content = m_file_system.readText(file);
    } catch (const std::exception& e) {
        Logger::getInstance().warning("ContentAggregator", "Cannot read file " + file.relative_path, e.what());
        out << "> [Error] Unable to read file: " << e.what() << "\n\n";
        return TraversalStats();
    }

    std::string sanitized = sanitize(file.name(), content);
    std::vector<std::string> lines = splitLines(sanitized);
    std::string fence = fenceFor(sanitized);

    out << fence << languageTag(file.name()) << "\n";
    for (size_t i = 0; i < lines.size(); ++i) {
        out << (i + 1) << "|" << trimRight(lines[i]) << "\n";
    }
    out << fence << "\n\n";

    TraversalStats stats;
    stats.file_count = 1;
    stats.line_count = lines.size();
    return stats;
}

std::string ContentAggregator::sanitize(const std::string& file_name, const std::string& content) const {
    std::string result = content;

    if (ContentSanitizer::isConfigFile(file_name)) {
        result = ContentSanitizer::redactSecrets(result);
    }

    if (m_strip_comments) {
        SourceKind kind = ContentSanitizer::classifySource(file_name);
        if (kind != SourceKind::None) {
            result = ContentSanitizer::stripComments(result, kind);
        }
    }

    return result;
}

std::vector<std::string> ContentAggregator::splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            lines.push_back(current);
            current.clear();
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        lines.push_back(current);
    }

    return lines;
}

std::string ContentAggregator::fenceFor(const std::string& content) {
    return content.find("```") != std::string::npos ? "````" : "```";
}

std::string ContentAggregator::languageTag(const std::string& file_name) {
    static const std::unordered_map<std::string, std::string> tags = {
        {".cs", "csharp"}, {".js", "javascript"}, {".ts", "typescript"},
        {".json", "json"},
        {".xml", "xml"}, {".csproj", "xml"}, {".config", "xml"}, {".props", "xml"}, {".targets", "xml"},
        {".cpp", "cpp"}, {".hpp", "cpp"}, {".h", "cpp"}, {".cc", "cpp"}, {".c", "c"},
        {".py", "python"}, {".md", "markdown"}, {".yml", "yaml"}, {".yaml", "yaml"},
        {".sh", "bash"}, {".sql", "sql"}, {".html", "html"}, {".css", "css"}
    };

    std::string extension = toLower(std::filesystem::path(file_name).extension().string());
    auto it = tags.find(extension);
    return it != tags.end() ? it->second : "text";
}

} // namespace FolderDoc
