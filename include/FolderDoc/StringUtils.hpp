// =================================================================
// include/FolderDoc/StringUtils.hpp
// =================================================================
// Small string helpers shared across components.

#pragma once

#include <string>

namespace FolderDoc {

// Trims spaces, tabs, carriage returns and newlines from both ends.
std::string trim(const std::string& s);

// Trims whitespace from the right end only.
std::string trimRight(const std::string& s);

std::string toLower(std::string s);

bool startsWith(const std::string& s, const std::string& prefix);

bool equalsIgnoreCase(const std::string& a, const std::string& b);

} // namespace FolderDoc
