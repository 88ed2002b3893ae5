// =================================================================
// src/FolderDoc/GeneratorConfig.cpp
// =================================================================
// Implementation for configuration loading and overrides.

#include "FolderDoc/GeneratorConfig.hpp"
#include "FolderDoc/CliParser.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace FolderDoc {

bool GeneratorConfig::loadFromFile(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);

        YAML::Node patterns = root["include_patterns"];
        if (patterns.IsScalar()) {
            // A single pattern written without list syntax
            include_patterns = {patterns.as<std::string>()};
        } else if (patterns.IsSequence()) {
            include_patterns.clear();
            for (const auto& pattern : patterns) {
                include_patterns.push_back(pattern.as<std::string>());
            }
        } else if (patterns.IsNull()) {
            include_patterns.clear();
        } else if (patterns.IsDefined()) {
            Logger::getInstance().warning("GeneratorConfig",
                "include_patterns must be a list of patterns, ignoring it", config_path);
        }
        if (root["strip_comments"]) {
            strip_comments = root["strip_comments"].as<bool>();
        }
        if (root["output_path"]) {
            output_path = root["output_path"].as<std::string>();
        }

        if (root["logging"]) {
            YAML::Node logging = root["logging"];
            if (logging["level"]) {
                log_level = logging["level"].as<std::string>();
            }
            if (logging["console"]) {
                console_logging = logging["console"].as<bool>();
            }
            if (logging["log_dir"]) {
                log_dir = logging["log_dir"].as<std::string>();
            }
            if (logging["max_log_size"]) {
                max_log_size = logging["max_log_size"].as<size_t>();
            }
            if (logging["max_log_files"]) {
                max_log_files = logging["max_log_files"].as<size_t>();
            }
        }

    } catch (const YAML::Exception& e) {
        Logger::getInstance().warning("GeneratorConfig",
            "Failed to parse configuration file, using defaults", config_path + ": " + e.what());
        return false;
    }

    Logger::getInstance().debug("GeneratorConfig", "Loaded configuration", config_path);
    return true;
}

void GeneratorConfig::applyCommandOverrides(const Commands& commands) {
    if (!commands.include_patterns.empty()) {
        include_patterns = commands.include_patterns;
    }

    if (commands.strip_comments) {
        strip_comments = true;
    }

    if (!commands.output_path.empty()) {
        output_path = commands.output_path;
    }

    if (commands.verbose) {
        log_level = "debug";
    }

    if (commands.quiet) {
        console_logging = false;
    }
}

bool GeneratorConfig::validate() const {
    bool valid = true;

    LogLevel level = LogLevel::INFO;
    if (!Logger::parseLevel(log_level, level)) {
        Logger::getInstance().error("GeneratorConfig", "Unknown log level: " + log_level);
        valid = false;
    }

    if (max_log_size == 0) {
        Logger::getInstance().error("GeneratorConfig", "logging.max_log_size must be greater than 0");
        valid = false;
    }

    if (max_log_files == 0) {
        Logger::getInstance().error("GeneratorConfig", "logging.max_log_files must be greater than 0");
        valid = false;
    }

    return valid;
}

void GeneratorConfig::applyToLogger() const {
    Logger& logger = Logger::getInstance();

    LogLevel level = LogLevel::INFO;
    if (!Logger::parseLevel(log_level, level)) {
        level = LogLevel::INFO;
    }

    logger.setConsoleLogLevel(level);
    logger.setConsoleLogging(console_logging);
    logger.initialize(log_dir, max_log_size, max_log_files);
}

std::string GeneratorConfig::defaultConfigPath(const std::string& root_path) {
    return (std::filesystem::path(root_path) / ".folderdoc" / "config.yml").string();
}

} // namespace FolderDoc
