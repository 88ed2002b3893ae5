// =================================================================
// src/FolderDoc/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "FolderDoc/Core.hpp"
#include "FolderDoc/DocumentAssembler.hpp"
#include "FolderDoc/Logger.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace FolderDoc {

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_assembler(std::make_unique<DocumentAssembler>())
{
}

Core::~Core() = default;

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();
    Logger& logger = Logger::getInstance();

    if (!loadConfiguration()) {
        return 2;
    }

    logger.logSessionStart(m_commands.root_path, m_config.include_patterns);

    int exit_code = 0;
    try {
        std::filesystem::path output = m_assembler->generateToFile(
            m_commands.root_path, m_config.output_path, m_config.include_patterns, m_config.strip_comments);
        logger.info("Core", "Document saved", output.string());
    } catch (const std::invalid_argument& e) {
        logger.critical("Core", e.what());
        exit_code = 1;
    } catch (const std::runtime_error& e) {
        logger.error("Core", "Failed to write document", e.what());
        exit_code = 1;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    logger.logSessionEnd(exit_code, static_cast<long>(duration.count()));
    logger.flush();

    return exit_code;
}

bool Core::loadConfiguration() {
    std::string config_path = m_commands.config_path.empty()
        ? GeneratorConfig::defaultConfigPath(m_commands.root_path)
        : m_commands.config_path;

    bool loaded = m_config.loadFromFile(config_path);
    if (!loaded && !m_commands.config_path.empty()) {
        Logger::getInstance().warning("Core", "Configuration file not loaded, using defaults", config_path);
    }

    m_config.applyCommandOverrides(m_commands);

    if (!m_config.validate()) {
        Logger::getInstance().critical("Core", "Invalid configuration");
        return false;
    }

    m_config.applyToLogger();
    return true;
}

} // namespace FolderDoc
