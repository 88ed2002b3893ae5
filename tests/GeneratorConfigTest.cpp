// =================================================================
// tests/GeneratorConfigTest.cpp
// =================================================================
// Unit tests for GeneratorConfig and CliParser components.

#include "FolderDoc/GeneratorConfig.hpp"
#include "FolderDoc/CliParser.hpp"
#include "TestSupport.hpp"
#include <iostream>
#include <cassert>
#include <vector>

using FolderDoc::Commands;
using FolderDoc::GeneratorConfig;

class GeneratorConfigTest {
public:
    void testDefaults() {
        std::cout << "Testing default configuration..." << std::endl;

        GeneratorConfig config;

        assert(config.include_patterns.empty());
        assert(!config.strip_comments);
        assert(config.output_path.empty());
        assert(config.log_level == "info");
        assert(config.console_logging);
        assert(config.validate() && "Defaults must be valid");

        std::cout << "✓ Default configuration test passed" << std::endl;
    }

    void testLoadFromYaml() {
        std::cout << "Testing YAML loading..." << std::endl;

        TempDirectory temp("folderdoc_config");
        temp.writeFile("config.yml",
            "include_patterns:\n"
            "  - \"src/**\"\n"
            "  - \"*.sln\"\n"
            "strip_comments: true\n"
            "output_path: docs/review.md\n"
            "logging:\n"
            "  level: debug\n"
            "  console: false\n"
            "  max_log_files: 3\n");

        GeneratorConfig config;
        bool loaded = config.loadFromFile((temp.path() / "config.yml").string());

        assert(loaded && "Config file should load");
        assert(config.include_patterns.size() == 2);
        assert(config.include_patterns[0] == "src/**");
        assert(config.include_patterns[1] == "*.sln");
        assert(config.strip_comments);
        assert(config.output_path == "docs/review.md");
        assert(config.log_level == "debug");
        assert(!config.console_logging);
        assert(config.max_log_files == 3);
        assert(config.max_log_size == 10 * 1024 * 1024 && "Unset keys keep defaults");

        std::cout << "✓ YAML loading test passed" << std::endl;
    }

    void testSinglePatternWithoutList() {
        std::cout << "Testing scalar include pattern..." << std::endl;

        TempDirectory temp("folderdoc_config");
        temp.writeFile("scalar.yml", "include_patterns: \"src/**\"\n");
        temp.writeFile("mapping.yml", "include_patterns:\n  src: yes\n");

        GeneratorConfig config;
        assert(config.loadFromFile((temp.path() / "scalar.yml").string()));
        assert(config.include_patterns.size() == 1 && config.include_patterns[0] == "src/**" &&
               "A scalar is a one-element list");

        assert(config.loadFromFile((temp.path() / "mapping.yml").string()));
        assert(config.include_patterns.size() == 1 && config.include_patterns[0] == "src/**" &&
               "A mapping is ignored, not treated as an empty list");

        temp.writeFile("empty.yml", "include_patterns:\n");
        assert(config.loadFromFile((temp.path() / "empty.yml").string()));
        assert(config.include_patterns.empty() && "An empty value clears the list");

        std::cout << "✓ Scalar include pattern test passed" << std::endl;
    }

    void testMissingAndMalformedFiles() {
        std::cout << "Testing missing and malformed files..." << std::endl;

        TempDirectory temp("folderdoc_config");
        GeneratorConfig config;

        assert(!config.loadFromFile((temp.path() / "absent.yml").string()));

        temp.writeFile("broken.yml", "include_patterns: [unclosed\n");
        assert(!config.loadFromFile((temp.path() / "broken.yml").string()) && "Parse errors are reported");
        assert(config.include_patterns.empty() && "Failed load keeps defaults");

        std::cout << "✓ Missing and malformed file test passed" << std::endl;
    }

    void testCommandOverrides() {
        std::cout << "Testing command-line overrides..." << std::endl;

        GeneratorConfig config;
        config.include_patterns = {"from/config/**"};
        config.output_path = "config.md";

        Commands commands;
        commands.include_patterns = {"src/**"};
        commands.strip_comments = true;
        commands.verbose = true;
        config.applyCommandOverrides(commands);

        assert(config.include_patterns.size() == 1 && config.include_patterns[0] == "src/**");
        assert(config.strip_comments);
        assert(config.output_path == "config.md" && "Empty override keeps config value");
        assert(config.log_level == "debug");

        Commands quiet;
        quiet.quiet = true;
        config.applyCommandOverrides(quiet);
        assert(!config.console_logging);

        std::cout << "✓ Command override test passed" << std::endl;
    }

    void testValidation() {
        std::cout << "Testing validation..." << std::endl;

        GeneratorConfig bad_level;
        bad_level.log_level = "loud";
        assert(!bad_level.validate());

        GeneratorConfig warn_level;
        warn_level.log_level = "WARNING";
        assert(warn_level.validate() && "Level names ignore case");

        GeneratorConfig zero_size;
        zero_size.max_log_size = 0;
        assert(!zero_size.validate());

        GeneratorConfig zero_files;
        zero_files.max_log_files = 0;
        assert(!zero_files.validate());

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void testDefaultConfigPath() {
        std::cout << "Testing default config path..." << std::endl;

        fs::path expected = fs::path("/work/Proj") / ".folderdoc" / "config.yml";
        assert(GeneratorConfig::defaultConfigPath("/work/Proj") == expected.string());

        std::cout << "✓ Default config path test passed" << std::endl;
    }

    void testCliParsing() {
        std::cout << "Testing command-line parsing..." << std::endl;

        FolderDoc::CliParser parser;
        auto app = parser.setupCli();

        std::vector<const char*> argv = {
            "folderdoc", "proj", "-i", "src/**", "-i", "*.sln",
            "--strip-comments", "-o", "out.md", "-v"
        };
        app->parse(static_cast<int>(argv.size()), argv.data());

        const Commands& commands = parser.getCommands();
        assert(commands.root_path == "proj");
        assert(commands.include_patterns.size() == 2);
        assert(commands.include_patterns[1] == "*.sln");
        assert(commands.strip_comments);
        assert(commands.output_path == "out.md");
        assert(commands.verbose);
        assert(!commands.quiet);

        std::cout << "✓ Command-line parsing test passed" << std::endl;
    }

    void testCliRejectsInvalidArguments() {
        std::cout << "Testing command-line errors..." << std::endl;

        {
            FolderDoc::CliParser parser;
            auto app = parser.setupCli();
            std::vector<const char*> argv = {"folderdoc", "-v"};
            bool thrown = false;
            try {
                app->parse(static_cast<int>(argv.size()), argv.data());
            } catch (const CLI::ParseError&) {
                thrown = true;
            }
            assert(thrown && "Root directory is required");
        }

        {
            FolderDoc::CliParser parser;
            auto app = parser.setupCli();
            std::vector<const char*> argv = {"folderdoc", "proj", "-v", "-q"};
            bool thrown = false;
            try {
                app->parse(static_cast<int>(argv.size()), argv.data());
            } catch (const CLI::ParseError&) {
                thrown = true;
            }
            assert(thrown && "--verbose and --quiet exclude each other");
        }

        std::cout << "✓ Command-line error test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running GeneratorConfig unit tests..." << std::endl;

        testDefaults();
        testLoadFromYaml();
        testSinglePatternWithoutList();
        testMissingAndMalformedFiles();
        testCommandOverrides();
        testValidation();
        testDefaultConfigPath();
        testCliParsing();
        testCliRejectsInvalidArguments();

        std::cout << "All GeneratorConfig tests passed!" << std::endl;
    }
};

int main() {
    try {
        GeneratorConfigTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All GeneratorConfig component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
