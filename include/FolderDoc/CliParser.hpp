// =================================================================
// include/FolderDoc/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace FolderDoc {

// A simple struct to hold parsed command information.
struct Commands {
    std::string root_path;
    std::string output_path;
    std::vector<std::string> include_patterns;
    std::string config_path;
    bool strip_comments = false;
    bool verbose = false;
    bool quiet = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace FolderDoc
