// =================================================================
// src/FolderDoc/StringUtils.cpp
// =================================================================

#include "FolderDoc/StringUtils.hpp"
#include <algorithm>
#include <cctype>

namespace FolderDoc {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, (last - first + 1));
}

std::string trimRight(const std::string& s) {
    size_t last = s.find_last_not_of(" \t\n\r\f\v");
    if (std::string::npos == last) {
        return "";
    }
    return s.substr(0, last + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() && toLower(a) == toLower(b);
}

} // namespace FolderDoc
