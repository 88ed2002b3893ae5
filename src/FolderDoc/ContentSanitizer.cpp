// =================================================================
// src/FolderDoc/ContentSanitizer.cpp
// =================================================================
// Implementation for secret redaction and comment stripping.

#include "FolderDoc/ContentSanitizer.hpp"
#include "FolderDoc/StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace FolderDoc {

namespace {

const size_t npos = std::string::npos;

// Whitespace allowed between tokens of an opener
const std::string kGap = R"re(\s{0,32})re";

// Credential-like key names; a prefix such as "Db" or "Client" is allowed
const std::string kCredentialNames =
    R"re([\w.-]{0,64}?(?:password|passwd|pwd|secret|secretkey|token|appkey|apikey|api_key|accesskey|access_key|privatekey|private_key|credential))re";

size_t offsetOf(const std::string& text, std::string::const_iterator it) {
    return static_cast<size_t>(it - text.begin());
}

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Value running from the end of the opener up to the next `terminator`
SanitizationRule::Locator valueUntil(char terminator) {
    return [terminator](const std::string& text, const std::smatch& opener, SecretSpan& span) {
        size_t from = offsetOf(text, opener[0].second);
        size_t close = text.find(terminator, from);
        if (close == npos) {
            return false;
        }
        span.begin = from;
        span.end = close;
        return true;
    };
}

// Non-empty value closed by the quote captured as group 1; any character in
// `terminators` ends the value early and rejects the match
SanitizationRule::Locator quotedValue(const char* terminators) {
    return [terminators](const std::string& text, const std::smatch& opener, SecretSpan& span) {
        char quote = *opener[1].first;
        size_t from = offsetOf(text, opener[0].second);
        size_t close = text.find_first_of(terminators, from);
        if (close == npos || close == from || text[close] != quote) {
            return false;
        }
        span.begin = from;
        span.end = close;
        return true;
    };
}

// Quoted value that looks like `Key=...;...`
bool locateConnectionValue(const std::string& text, const std::smatch& opener, SecretSpan& span) {
    char quote = *opener[1].first;
    size_t from = offsetOf(text, opener[0].second);
    size_t close = text.find_first_of("\"'\r\n", from);
    if (close == npos || text[close] != quote) {
        return false;
    }

    size_t equals = text.find('=', from);
    size_t separator = text.find(';', equals);
    if (equals >= close || separator >= close) {
        return false;
    }
    span.begin = from;
    span.end = close;
    return true;
}

// Everything after the quoted key, so the property is rewritten as "Key":"***"
bool locateJsonCredential(const std::string& text, const std::smatch& opener, SecretSpan& span) {
    size_t close = text.find('"', offsetOf(text, opener[0].second));
    if (close == npos) {
        return false;
    }
    span.begin = offsetOf(text, opener[1].second);
    span.end = close + 1;
    return true;
}

// Element body, accepted only when the matching closing tag follows
bool locateXmlCredential(const std::string& text, const std::smatch& opener, SecretSpan& span) {
    size_t from = offsetOf(text, opener[0].second);
    size_t close = text.find('<', from);
    if (close == npos) {
        return false;
    }

    std::string closing_tag = "</" + opener.str(1) + ">";
    if (!equalsIgnoreCase(text.substr(close, closing_tag.size()), closing_tag)) {
        return false;
    }
    span.begin = from;
    span.end = close;
    return true;
}

// Whole run of hex digits, which must end at a word boundary
bool locateHexRun(const std::string& text, const std::smatch& opener, SecretSpan& span) {
    size_t begin = offsetOf(text, opener[0].first);
    size_t end = begin;
    while (end < text.size() && std::isxdigit(static_cast<unsigned char>(text[end]))) {
        ++end;
    }
    if (end < text.size() && isWordChar(text[end])) {
        return false;
    }
    span.begin = begin;
    span.end = end;
    return true;
}

bool locateWholeOpener(const std::string& text, const std::smatch& opener, SecretSpan& span) {
    span.begin = offsetOf(text, opener[0].first);
    span.end = offsetOf(text, opener[0].second);
    return true;
}

// End of a verbatim string whose body starts at `from`, or npos
size_t verbatimStringEnd(const std::string& text, size_t from) {
    size_t last_doubled = npos;
    size_t position = from;
    while (true) {
        size_t quote = text.find('"', position);
        if (quote == npos) {
            // Unterminated: the last doubled quote is the closing one
            return last_doubled;
        }
        if (quote + 1 < text.size() && text[quote + 1] == '"') {
            last_doubled = quote + 1;
            position = quote + 2;
            continue;
        }
        return quote + 1;
    }
}

// End of a single-line escaped literal whose body starts at `from`, or npos
size_t quotedLiteralEnd(const std::string& text, size_t from, char quote) {
    for (size_t i = from; i < text.size(); ++i) {
        char c = text[i];
        if (c == quote) {
            return i + 1;
        }
        if (c == '\r' || c == '\n') {
            return npos;
        }
        if (c == '\\') {
            if (i + 1 >= text.size() || text[i + 1] == '\r' || text[i + 1] == '\n') {
                return npos;
            }
            ++i;
        }
    }
    return npos;
}

} // namespace

const std::vector<SanitizationRule>& ContentSanitizer::secretRules() {
    static const std::vector<SanitizationRule> rules = {
        // Connection strings
        SanitizationRule("connection-strings-block",
                         R"re("ConnectionStrings")re" + kGap + ":" + kGap + R"re(\{)re",
                         valueUntil('}'), R"re("***")re"),
        SanitizationRule("connection-string-assignment",
                         "ConnectionString" + kGap + "=" + kGap + R"re((["']))re",
                         quotedValue("\"'"), "***"),
        SanitizationRule("connection-string-value",
                         R"re((["'])(?=(?:Server|Data Source|Host|Address|Addr)\s{0,32}=))re",
                         locateConnectionValue, "***"),

        // Named credentials
        SanitizationRule("credential-assignment",
                         R"re(\b)re" + kCredentialNames + kGap + "=" + kGap + R"re((["']))re",
                         quotedValue("\"'\r\n"), "***"),
        SanitizationRule("credential-json",
                         "(\"" + kCredentialNames + "\")" + kGap + ":" + kGap + "\"",
                         locateJsonCredential, R"re(:"***")re"),
        SanitizationRule("credential-xml-element",
                         "<(" + kCredentialNames + ")>",
                         locateXmlCredential, "***"),
        SanitizationRule("credential-app-setting",
                         R"re(<add\s{1,32}key)re" + kGap + "=" + kGap +
                         R"re("[^"]{0,128}(?:password|pwd|secret|token|key)[^"]{0,128}"\s{1,32}value)re" +
                         kGap + "=" + kGap + "\"",
                         valueUntil('"'), "***"),

        // Generic high-entropy tokens
        SanitizationRule("hex-token", R"re(\b(?=[0-9a-f]{32}))re", locateHexRun, "***REDACTED_HEX***"),

        // Email addresses, bounded by the RFC 5321 part lengths
        SanitizationRule("email",
                         R"re(\b[\w.%+-]{1,64}@[\w-]{1,63}(?:\.[\w-]{1,63}){0,8}\.[a-z]{2,24}\b)re",
                         locateWholeOpener, "user@example.com")
    };
    return rules;
}

std::string ContentSanitizer::redactSecrets(const std::string& text) {
    std::string result = text;
    for (const auto& rule : secretRules()) {
        result = applyRule(result, rule);
    }
    return result;
}

std::string ContentSanitizer::stripComments(const std::string& text, SourceKind kind) {
    if (kind == SourceKind::None) {
        return text;
    }

    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char current = text[i];
        char next = i + 1 < text.size() ? text[i + 1] : '\0';

        // Literals win over comments: verbatim, double-quoted, single-quoted
        size_t literal_end = npos;
        if (current == '@' && next == '"') {
            literal_end = verbatimStringEnd(text, i + 2);
        } else if (current == '"' || current == '\'') {
            literal_end = quotedLiteralEnd(text, i + 1, current);
        }
        if (literal_end != npos) {
            result.append(text, i, literal_end - i);
            i = literal_end;
            continue;
        }

        if (current == '/' && next == '/') {
            i = text.find_first_of("\r\n", i);
            if (i == npos) {
                i = text.size();
            }
            continue;
        }

        if (current == '/' && next == '*') {
            size_t close = text.find("*/", i + 2);
            if (close != npos) {
                result += lineBreaksOf(text.substr(i, close + 2 - i));
                i = close + 2;
                continue;
            }
        }

        result += current;
        ++i;
    }

    return result;
}

std::string ContentSanitizer::applyRule(const std::string& text, const SanitizationRule& rule) {
    std::string result;
    result.reserve(text.size());

    size_t last = 0;
    size_t search_from = 0;
    std::smatch opener;
    while (search_from <= text.size()) {
        auto flags = search_from > 0 ? std::regex_constants::match_prev_avail
                                     : std::regex_constants::match_default;
        if (!std::regex_search(text.cbegin() + search_from, text.cend(), opener, rule.opener, flags)) {
            break;
        }

        size_t opener_begin = offsetOf(text, opener[0].first);
        SecretSpan span;
        if (!rule.locate(text, opener, span)) {
            search_from = opener_begin + 1;
            continue;
        }

        result.append(text, last, span.begin - last);
        result += rule.placeholder;
        result += lineBreaksOf(text.substr(span.begin, span.end - span.begin));

        last = span.end;
        search_from = std::max(span.end, opener_begin + 1);
    }
    result.append(text, last, npos);

    return result;
}

bool ContentSanitizer::isConfigFile(const std::string& filename) {
    std::filesystem::path path(filename);
    std::string extension = toLower(path.extension().string());
    if (extension == ".json" || extension == ".xml" || extension == ".config") {
        return true;
    }

    std::string name = toLower(path.filename().string());
    return name.find("setting") != std::string::npos ||
           name.find("constant") != std::string::npos ||
           name.find("config") != std::string::npos;
}

SourceKind ContentSanitizer::classifySource(const std::string& filename) {
    std::string extension = toLower(std::filesystem::path(filename).extension().string());
    if (extension == ".cs") return SourceKind::CSharp;
    if (extension == ".js") return SourceKind::JavaScript;
    if (extension == ".ts") return SourceKind::TypeScript;
    if (extension == ".json") return SourceKind::Json;
    return SourceKind::None;
}

std::string ContentSanitizer::lineBreaksOf(const std::string& span) {
    std::string breaks;
    for (char c : span) {
        if (c == '\r' || c == '\n') {
            breaks += c;
        }
    }
    return breaks;
}

size_t ContentSanitizer::countNewlines(const std::string& text) {
    return static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
}

} // namespace FolderDoc
