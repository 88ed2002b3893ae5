// =================================================================
// src/FolderDoc/GlobPattern.cpp
// =================================================================
// Implementation for include-pattern compilation and matching.

#include "FolderDoc/GlobPattern.hpp"
#include "FolderDoc/Logger.hpp"
#include "FolderDoc/StringUtils.hpp"
#include <algorithm>

namespace FolderDoc {

namespace {

// Longer than any path the file system hands back
const size_t kMaxCompiledLength = 4096;

} // namespace

GlobPattern::GlobPattern(const std::string& pattern)
    : m_pattern(normalize(pattern)),
      m_lowered_pattern(toLower(m_pattern)),
      m_literal_fallback(false)
{
    if (m_pattern.empty()) {
        return;
    }

    try {
        // The regex compiler recurses once per pattern element
        if (m_pattern.size() > kMaxCompiledLength) {
            throw std::regex_error(std::regex_constants::error_complexity);
        }
        m_regex = std::regex(globToRegex(m_pattern),
                             std::regex_constants::ECMAScript | std::regex_constants::icase);
    } catch (const std::regex_error& e) {
        Logger::getInstance().warning("GlobPattern",
            "Failed to compile pattern '" + m_pattern.substr(0, 80) + "', using literal match", e.what());
        m_literal_fallback = true;
    }
}

bool GlobPattern::matches(const std::string& path) const {
    if (m_pattern.empty()) {
        return false;
    }

    if (m_literal_fallback) {
        return toLower(path).find(m_lowered_pattern) != std::string::npos;
    }

    try {
        return std::regex_match(path, m_regex);
    } catch (const std::regex_error& e) {
        Logger::getInstance().warning("GlobPattern",
            "Regex error in pattern '" + m_pattern + "'", e.what());
        return false;
    }
}

std::string GlobPattern::globToRegex(const std::string& glob_pattern) {
    std::string regex_pattern;
    regex_pattern.reserve(glob_pattern.size() * 2);

    for (size_t i = 0; i < glob_pattern.length(); ++i) {
        char c = glob_pattern[i];

        switch (c) {
            case '*':
                if (i + 1 < glob_pattern.length() && glob_pattern[i + 1] == '*') {
                    if (i + 2 < glob_pattern.length() && glob_pattern[i + 2] == '/') {
                        // **/ matches zero or more leading directories
                        regex_pattern += "(?:.*/)?";
                        i += 2;
                    } else {
                        regex_pattern += ".*";
                        i += 1;
                    }
                } else {
                    regex_pattern += "[^/]*";
                }
                break;

            case '?':
                regex_pattern += "[^/]";
                break;

            case '.': case '^': case '$': case '+': case '(': case ')':
            case '[': case ']': case '{': case '}': case '|': case '\\':
                regex_pattern += '\\';
                regex_pattern += c;
                break;

            default:
                regex_pattern += c;
                break;
        }
    }

    return regex_pattern;
}

std::string GlobPattern::normalize(const std::string& pattern) {
    std::string normalized = trim(pattern);
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    // Relative paths never carry a "./" prefix
    while (startsWith(normalized, "./")) {
        normalized.erase(0, 2);
    }
    return normalized;
}

std::vector<GlobPattern> compilePatterns(const std::vector<std::string>& patterns) {
    std::vector<GlobPattern> compiled;
    compiled.reserve(patterns.size());

    for (const auto& pattern : patterns) {
        GlobPattern glob(pattern);
        if (!glob.isEmpty()) {
            compiled.push_back(std::move(glob));
        }
    }

    return compiled;
}

} // namespace FolderDoc
