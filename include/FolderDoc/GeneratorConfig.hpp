// =================================================================
// include/FolderDoc/GeneratorConfig.hpp
// =================================================================
// Configuration structure for document generation settings.

#pragma once

#include "FolderDoc/Logger.hpp"
#include <string>
#include <vector>

namespace FolderDoc {

struct Commands;

/**
 * @brief Configuration settings for a document run
 */
struct GeneratorConfig {
    // Selection and content
    std::vector<std::string> include_patterns;
    bool strip_comments = false;
    std::string output_path;

    // Logging
    std::string log_level = "info";
    bool console_logging = true;
    std::string log_dir;
    size_t max_log_size = 10 * 1024 * 1024; // 10MB
    size_t max_log_files = 5;

    /**
     * @brief Load settings from a YAML file
     * @param config_path Path to the YAML file
     * @return false if the file is missing or cannot be parsed
     */
    bool loadFromFile(const std::string& config_path);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Validate configuration settings
     * @return True if configuration is valid
     */
    bool validate() const;

    /**
     * @brief Configure the logger from the logging settings
     */
    void applyToLogger() const;

    /**
     * @brief Default config file location for a root directory
     * @param root_path Directory being documented
     * @return `<root>/.folderdoc/config.yml`
     */
    static std::string defaultConfigPath(const std::string& root_path);
};

} // namespace FolderDoc
