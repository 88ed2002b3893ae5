// =================================================================
// src/FolderDoc/DocumentAssembler.cpp
// =================================================================
// Implementation for assembling the complete review document.

#include "FolderDoc/DocumentAssembler.hpp"
#include "FolderDoc/InclusionFilter.hpp"
#include "FolderDoc/Logger.hpp"
#include "FolderDoc/ProjectMetadata.hpp"
#include "FolderDoc/StringUtils.hpp"
#include "FolderDoc/TreeRenderer.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace FolderDoc {

namespace {

void requireDirectory(const std::filesystem::path& root_path) {
    std::error_code ec;
    if (root_path.empty() || !std::filesystem::is_directory(root_path, ec)) {
        throw std::invalid_argument("Directory does not exist: " + root_path.string());
    }
}

} // namespace

DocumentAssembler::DocumentAssembler(std::shared_ptr<const FileSystemReader> file_system)
    : m_file_system(std::move(file_system))
{
    if (!m_file_system) {
        m_file_system = std::make_shared<DiskFileSystem>();
    }
}

TraversalStats DocumentAssembler::generate(const std::filesystem::path& root_path,
                                           const std::vector<std::string>& patterns,
                                           bool strip_comments,
                                           std::ostream& out) const {
    requireDirectory(root_path);

    m_last_stats = TraversalStats();

    FileSystemEntry root = FileSystemEntry::root(root_path);
    std::string project = projectName(root_path);
    InclusionFilter filter(patterns);

    writeHeader(project, root.absolute_path, patterns, strip_comments, out);

    out << buildReviewerInstructions();

    ProjectMetadata metadata(*m_file_system, filter);
    ProjectMetadata::render(metadata.collect(root), out);

    Logger::getInstance().info("DocumentAssembler", "Building directory tree");
    out << "## 1. Directory Structure\n\n";
    out << "```text\n";
    TreeRenderer tree(*m_file_system, filter);
    tree.render(root, project, out);
    out << "```\n\n---\n\n";

    Logger::getInstance().info("DocumentAssembler", "Writing file contents");
    out << "## 2. File Contents\n\n";
    ContentAggregator aggregator(*m_file_system, filter, strip_comments);
    TraversalStats stats = aggregator.aggregate(root, out);

    out << "---\n\n";
    out << "## 3. Summary\n\n";
    out << "- **Total files**: " << stats.file_count << "\n";
    out << "- **Total lines**: " << stats.line_count << "\n";

    m_last_stats = stats;
    return stats;
}

std::filesystem::path DocumentAssembler::generateToFile(const std::filesystem::path& root_path,
                                                        const std::filesystem::path& output_path,
                                                        const std::vector<std::string>& patterns,
                                                        bool strip_comments) const {
    requireDirectory(root_path);

    // Buffer the whole document so an output file inside the root is never read half-written
    std::ostringstream document;
    TraversalStats stats = generate(root_path, patterns, strip_comments, document);

    std::filesystem::path target = resolveOutputPath(root_path, output_path);
    try {
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw std::runtime_error("Cannot create output directory: " + std::string(e.what()));
    }

    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + target.string());
    }
    file << document.str();
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + target.string());
    }

    Logger::getInstance().logDocumentSummary(stats.file_count, stats.line_count, target.string());
    return target;
}

std::filesystem::path DocumentAssembler::resolveOutputPath(const std::filesystem::path& root_path,
                                                           const std::filesystem::path& requested) {
    if (!requested.empty()) {
        return requested;
    }

    std::filesystem::path root = FileSystemEntry::root(root_path).absolute_path;
    std::string project = projectName(root_path);

    std::filesystem::path parent = root.parent_path();
    if (!parent.empty() && parent != root && equalsIgnoreCase(parent.filename().string(), project)) {
        parent = parent.parent_path();
    }

    std::filesystem::path base = (parent.empty() || parent == root) ? root : parent;
    return base / "Md" / project / (project + ".md");
}

std::string DocumentAssembler::projectName(const std::filesystem::path& root_path) {
    std::string name = FileSystemEntry::root(root_path).absolute_path.filename().string();
    return name.empty() ? "project" : name;
}

std::string DocumentAssembler::buildReviewerInstructions() {
    return R"(## 0. Instructions for AI Reviewer

This document is a snapshot of a source tree prepared for code review.

1. Section 1 shows the directory structure. Only files listed there are included.
2. Section 2 contains every included file. Each file starts with a `### File:` header
   followed by a fenced block in which every line is written as `N|text`.
   `N` is the 1-based line number in the file on disk.
3. Line numbers are stable. Redaction and comment removal never add or remove lines,
   so a blank numbered line may stand where a comment used to be.
4. Secrets in configuration files are masked. `***` replaces credential values,
   `***REDACTED_HEX***` replaces long hexadecimal tokens and `user@example.com`
   replaces email addresses. Do not report these placeholders as defects.
5. When referring to code, cite it as `path:line` or `path:start-end` using the
   numbers shown in the left column.
6. A `> [Error]` or `> [Access Denied]` marker means the content could not be read.

---

)";
}

void DocumentAssembler::writeHeader(const std::string& project, const std::filesystem::path& root_path,
                                    const std::vector<std::string>& patterns, bool strip_comments,
                                    std::ostream& out) const {
    out << "# " << project << " Project Document\n\n";
    out << "**Generated**: " << currentTimestamp() << "\n";
    out << "**Project path**: " << root_path.string() << "\n";

    out << "**Include patterns**: ";
    if (patterns.empty()) {
        out << "all files";
    } else {
        for (size_t i = 0; i < patterns.size(); ++i) {
            if (i > 0) out << ", ";
            out << "`" << patterns[i] << "`";
        }
    }
    out << "\n";

    out << "**Comments**: " << (strip_comments ? "stripped" : "kept") << "\n\n";
}

std::string DocumentAssembler::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace FolderDoc
