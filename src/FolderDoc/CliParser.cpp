// =================================================================
// src/FolderDoc/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "FolderDoc/CliParser.hpp"

namespace FolderDoc {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "FolderDoc: documents a source tree as a single line-numbered markdown file for AI review.");

    m_app->add_option("root", m_commands.root_path, "The project directory to document.")->required();
    m_app->add_option("-o,--output", m_commands.output_path,
                      "Output file (default: <parent>/Md/<project>/<project>.md)");
    m_app->add_option("-i,--include", m_commands.include_patterns,
                      "Include only paths matching this glob (repeatable, e.g. 'src/**' or '*.sln')");
    m_app->add_flag("--strip-comments", m_commands.strip_comments,
                    "Remove comments from C#, JavaScript, TypeScript and JSON files");
    m_app->add_option("-c,--config", m_commands.config_path,
                      "Configuration file (default: <root>/.folderdoc/config.yml)");

    auto* verbose = m_app->add_flag("-v,--verbose", m_commands.verbose, "Log every file as it is written");
    auto* quiet = m_app->add_flag("-q,--quiet", m_commands.quiet, "Disable console logging");
    verbose->excludes(quiet);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

} // namespace FolderDoc
