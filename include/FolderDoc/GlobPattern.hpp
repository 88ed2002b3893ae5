// =================================================================
// include/FolderDoc/GlobPattern.hpp
// =================================================================
// Header for include-pattern compilation and matching.

#pragma once

#include <string>
#include <vector>
#include <regex>

namespace FolderDoc {

/**
 * @brief A compiled include pattern
 *
 * Supported syntax:
 * - `**` followed by `/`: zero or more leading path segments
 * - `**`: any sequence of characters, `/` included
 * - `*`: any sequence of characters except `/`
 * - `?`: exactly one character except `/`
 *
 * Every other character is literal. Matching is case-insensitive and
 * always covers the whole relative path.
 */
class GlobPattern {
public:
    /**
     * @brief Compile a pattern
     * @param pattern Raw pattern, `/` or `\` as separator
     */
    explicit GlobPattern(const std::string& pattern);

    /**
     * @brief Check whether a normalized relative path matches
     * @param path Relative path using `/` separators
     * @return true if the whole path matches
     */
    bool matches(const std::string& path) const;

    /**
     * @brief Get the normalized pattern text
     * @return Pattern with separators converted to `/`
     */
    const std::string& getPattern() const { return m_pattern; }

    /**
     * @brief Get the lower-cased normalized pattern text
     * @return Pattern used for the directory-prefix heuristics
     */
    const std::string& getLoweredPattern() const { return m_lowered_pattern; }

    /**
     * @brief Check if compilation fell back to literal matching
     *
     * Every glob character is escaped, so this only happens when the regex
     * library rejects the pattern or the pattern is longer than any real
     * path (4096 characters).
     *
     * @return true if the regex could not be built
     */
    bool isLiteralFallback() const { return m_literal_fallback; }

    /**
     * @brief Check if pattern is empty after normalization
     * @return true if pattern carries nothing to match
     */
    bool isEmpty() const { return m_pattern.empty(); }

    /**
     * @brief Convert a glob pattern to an ECMAScript regex body
     * @param glob_pattern Normalized glob pattern
     * @return Regex source without anchors
     */
    static std::string globToRegex(const std::string& glob_pattern);

    /**
     * @brief Normalize separators to `/`, trim surrounding whitespace and drop a leading `./`
     * @param pattern Raw pattern text
     * @return Normalized pattern
     */
    static std::string normalize(const std::string& pattern);

private:
    std::string m_pattern;
    std::string m_lowered_pattern;
    bool m_literal_fallback;
    std::regex m_regex;
};

/**
 * @brief Compile a list of raw patterns, dropping empty ones
 * @param patterns Raw pattern strings
 * @return Compiled patterns in input order
 */
std::vector<GlobPattern> compilePatterns(const std::vector<std::string>& patterns);

} // namespace FolderDoc
