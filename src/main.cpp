#include "FolderDoc/CliParser.hpp"
#include "FolderDoc/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    FolderDoc::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    FolderDoc::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
