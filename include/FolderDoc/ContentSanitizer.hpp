// =================================================================
// include/FolderDoc/ContentSanitizer.hpp
// =================================================================
// Header for secret redaction and comment stripping.

#pragma once

#include <string>
#include <vector>
#include <regex>
#include <functional>
#include <utility>

namespace FolderDoc {

/**
 * @brief Byte range of a secret inside whole-file text
 */
struct SecretSpan {
    size_t begin = 0;
    size_t end = 0;
};

/**
 * @brief An ordered redaction rule
 *
 * The opener regex matches only a short, bounded prefix. The locator then
 * scans forward from the opener by hand and reports the secret span, or
 * rejects the opener as a false start. The span is replaced by the
 * placeholder followed by the line breaks the span held, so text after the
 * span stays on its original line.
 */
struct SanitizationRule {
    using Locator = std::function<bool(const std::string& text, const std::smatch& opener, SecretSpan& span)>;

    std::string name;
    std::regex opener;
    Locator locate;
    std::string placeholder;

    SanitizationRule(const std::string& rule_name, const std::string& pattern, Locator locator,
                     const std::string& replacement)
        : name(rule_name),
          opener(pattern, std::regex_constants::ECMAScript | std::regex_constants::icase),
          locate(std::move(locator)),
          placeholder(replacement) {}
};

/**
 * @brief Source kinds eligible for comment stripping
 */
enum class SourceKind {
    None,
    CSharp,
    JavaScript,
    TypeScript,
    Json
};

/**
 * @brief Line-count preserving text rewriting
 *
 * Both operations keep every line break of the input in place, so line
 * numbers computed after sanitization refer to the same lines as in the
 * file on disk. Rule tables are built once and shared.
 */
class ContentSanitizer {
public:
    /**
     * @brief Redact connection strings, credentials, hex tokens and emails
     * @param text Whole-file content
     * @return Redacted content with identical line breaks
     */
    static std::string redactSecrets(const std::string& text);

    /**
     * @brief Remove comments while keeping string literals verbatim
     * @param text Whole-file content
     * @param kind Source kind of the file
     * @return Content with comments reduced to their line breaks
     */
    static std::string stripComments(const std::string& text, SourceKind kind);

    /**
     * @brief Apply a single rule to whole-file text
     * @param text Input text
     * @param rule Rule to apply
     * @return Rewritten text; line breaks inside a secret stay in place
     */
    static std::string applyRule(const std::string& text, const SanitizationRule& rule);

    /**
     * @brief Check whether a file holds configuration
     * @param filename File name or path
     * @return true for JSON, XML and .config files, or names mentioning settings, constants or config
     */
    static bool isConfigFile(const std::string& filename);

    /**
     * @brief Classify a file for comment stripping
     * @param filename File name or path
     * @return Source kind, SourceKind::None if not strippable
     */
    static SourceKind classifySource(const std::string& filename);

    /**
     * @brief Secret redaction rules in application order
     */
    static const std::vector<SanitizationRule>& secretRules();

    /**
     * @brief Extract only the line breaks of a span
     * @param span Matched text
     * @return Concatenation of every "\r\n", "\n" and lone "\r" in order
     */
    static std::string lineBreaksOf(const std::string& span);

    static size_t countNewlines(const std::string& text);
};

} // namespace FolderDoc
