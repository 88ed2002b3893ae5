// =================================================================
// include/FolderDoc/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "FolderDoc/CliParser.hpp"
#include "FolderDoc/GeneratorConfig.hpp"
#include <memory>
#include <string>

namespace FolderDoc {

class DocumentAssembler;

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Loads configuration and writes the document.
     * @return 0 on success, 1 on a fatal error, 2 on invalid configuration.
     */
    int run();

private:
    const Commands& m_commands;
    GeneratorConfig m_config;
    std::unique_ptr<DocumentAssembler> m_assembler;

    bool loadConfiguration();
};

} // namespace FolderDoc
