// =================================================================
// tests/DocumentAssemblerTest.cpp
// =================================================================
// Unit tests for DocumentAssembler and ProjectMetadata components.

#include "FolderDoc/DocumentAssembler.hpp"
#include "FolderDoc/ProjectMetadata.hpp"
#include "TestSupport.hpp"
#include <iostream>
#include <cassert>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

using FolderDoc::DocumentAssembler;
using FolderDoc::TraversalStats;

namespace {

std::string readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

const char* const kProjectXml =
    "<Project Sdk=\"Microsoft.NET.Sdk\">\n"
    "  <PropertyGroup>\n"
    "    <OutputType>Exe</OutputType>\n"
    "    <TargetFramework>net8.0</TargetFramework>\n"
    "  </PropertyGroup>\n"
    "  <ItemGroup>\n"
    "    <PackageReference Include=\"Newtonsoft.Json\" Version=\"13.0.3\" />\n"
    "    <PackageReference Include=\"Serilog\" />\n"
    "  </ItemGroup>\n"
    "</Project>\n";

} // namespace

class DocumentAssemblerTest {
public:
    void testBasicDocument() {
        std::cout << "Testing basic document generation..." << std::endl;

        TempDirectory temp("folderdoc_assembler");
        fs::path root = temp.path() / "Demo";
        fs::create_directories(root);
        std::ofstream(root / "a.txt") << "hello\nworld\n";
        fs::create_directories(root / "bin");
        std::ofstream(root / "bin" / "skip.txt") << "skip me";

        DocumentAssembler assembler;
        std::ostringstream out;
        TraversalStats stats = assembler.generate(root, {}, false, out);
        std::string document = out.str();

        assert(document.find("# Demo Project Document") != std::string::npos);
        assert(document.find("## 0. Instructions for AI Reviewer") != std::string::npos);
        assert(document.find("Demo/\n└── a.txt\n") != std::string::npos && "Tree should list only a.txt");
        assert(document.find("### File: a.txt\n\n```text\n1|hello\n2|world\n```") != std::string::npos);
        assert(document.find("skip") == std::string::npos && "bin/ must be omitted everywhere");
        assert(document.find("- **Total files**: 1") != std::string::npos);
        assert(document.find("- **Total lines**: 2") != std::string::npos);
        assert(stats.file_count == 1 && stats.line_count == 2);
        assert(assembler.getLastStats().line_count == 2);
        assert(document.find("## Project Metadata") == std::string::npos && "No project files, no metadata");

        std::cout << "✓ Basic document test passed" << std::endl;
    }

    void testSectionOrder() {
        std::cout << "Testing section order..." << std::endl;

        TempDirectory temp("folderdoc_assembler");
        temp.writeFile("App/App.csproj", kProjectXml);
        temp.writeFile("App/Program.cs", "class P {}\n");

        DocumentAssembler assembler;
        std::ostringstream out;
        assembler.generate(temp.path(), {}, false, out);
        std::string document = out.str();

        size_t header = document.find(" Project Document");
        size_t instructions = document.find("## 0. Instructions for AI Reviewer");
        size_t metadata = document.find("## Project Metadata");
        size_t tree = document.find("## 1. Directory Structure");
        size_t contents = document.find("## 2. File Contents");
        size_t summary = document.find("## 3. Summary");

        assert(header < instructions);
        assert(instructions < metadata);
        assert(metadata < tree);
        assert(tree < contents);
        assert(contents < summary);
        assert(summary != std::string::npos);
        assert(document.find("Program.cs [Entry Point]") != std::string::npos);

        std::cout << "✓ Section order test passed" << std::endl;
    }

    void testSecretRedactionInDocument() {
        std::cout << "Testing redaction in document..." << std::endl;

        TempDirectory temp("folderdoc_assembler");
        temp.writeFile("app.json", "{\n  \"Password\": \"abc123\"\n}\n");

        DocumentAssembler assembler;
        std::ostringstream out;
        assembler.generate(temp.path(), {}, false, out);
        std::string document = out.str();

        assert(document.find("\"Password\":\"***\"") != std::string::npos);
        assert(document.find("abc123") == std::string::npos);
        assert(document.find("- **Total lines**: 3") != std::string::npos);

        std::cout << "✓ Redaction in document test passed" << std::endl;
    }

    void testIncludePatterns() {
        std::cout << "Testing include patterns..." << std::endl;

        TempDirectory temp("folderdoc_assembler");
        temp.writeFile("src/x.cs", "int x;\n");
        temp.writeFile("docs/readme.md", "# readme\n");

        DocumentAssembler assembler;
        std::ostringstream out;
        TraversalStats stats = assembler.generate(temp.path(), {"src/**"}, false, out);
        std::string document = out.str();

        assert(document.find("### File: src/x.cs") != std::string::npos);
        assert(document.find("readme.md") == std::string::npos);
        assert(document.find("docs/") == std::string::npos);
        assert(document.find("**Include patterns**: `src/**`") != std::string::npos);
        assert(stats.file_count == 1);

        std::cout << "✓ Include pattern test passed" << std::endl;
    }

    void testDirectoryLinksAreNotFollowed() {
        std::cout << "Testing directory links..." << std::endl;

        TempDirectory temp("folderdoc_assembler");
        temp.writeFile("src/x.cs", "int x;\nint y;\n");
        fs::create_directory_symlink(".", temp.path() / "src" / "loop");

        DocumentAssembler assembler;
        std::ostringstream out;
        TraversalStats stats = assembler.generate(temp.path(), {"src/**"}, false, out);
        std::string document = out.str();

        assert(stats.file_count == 1 && stats.line_count == 2 && "A link back to src must not be walked");
        assert(document.find("loop") == std::string::npos);
        assert(document.find("### File: src/x.cs") != std::string::npos);

        std::cout << "✓ Directory link test passed" << std::endl;
    }

    void testCommentStripping() {
        std::cout << "Testing comment stripping in document..." << std::endl;

        TempDirectory temp("folderdoc_assembler");
        temp.writeFile("src/x.cs", "// comment\ncode();");

        DocumentAssembler assembler;
        std::ostringstream out;
        assembler.generate(temp.path(), {}, true, out);
        std::string document = out.str();

        assert(document.find("1|\n2|code();\n") != std::string::npos);
        assert(document.find("// comment") == std::string::npos);
        assert(document.find("**Comments**: stripped") != std::string::npos);

        std::cout << "✓ Comment stripping test passed" << std::endl;
    }

    void testMissingRootFailsBeforeOutput() {
        std::cout << "Testing missing root directory..." << std::endl;

        DocumentAssembler assembler;
        std::ostringstream out;
        bool thrown = false;
        try {
            assembler.generate(fs::temp_directory_path() / "folderdoc_missing_root_dir", {}, false, out);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }

        assert(thrown && "Missing root should throw invalid_argument");
        assert(out.str().empty() && "Nothing may be written before validation");

        std::cout << "✓ Missing root test passed" << std::endl;
    }

    void testInjectedReader() {
        std::cout << "Testing injected file system..." << std::endl;

        TempDirectory temp("folderdoc_assembler");
        auto memory = std::make_shared<InMemoryFileSystem>();
        memory->addFile("keep.txt", "kept");
        memory->denyDirectory("private");

        DocumentAssembler assembler(memory);
        std::ostringstream out;
        TraversalStats stats = assembler.generate(temp.path(), {}, false, out);
        std::string document = out.str();

        assert(document.find("├── keep.txt\n└── private/\n    └── [Access Denied]\n") != std::string::npos);
        assert(document.find("> [Access Denied] private/") != std::string::npos);
        assert(document.find("1|kept") != std::string::npos);
        assert(stats.file_count == 1);

        std::cout << "✓ Injected file system test passed" << std::endl;
    }

    void testGenerateToFile() {
        std::cout << "Testing document saving..." << std::endl;

        TempDirectory temp("folderdoc_assembler");
        fs::path root = temp.path() / "Shop";
        fs::create_directories(root);
        std::ofstream(root / "Program.cs") << "class Program {}\n";

        DocumentAssembler assembler;

        fs::path explicit_path = temp.path() / "out" / "doc.md";
        fs::path written = assembler.generateToFile(root, explicit_path, {}, false);
        assert(written == explicit_path);
        assert(fs::exists(explicit_path));
        assert(readFile(explicit_path).find("## 3. Summary") != std::string::npos);

        fs::path default_path = assembler.generateToFile(root, "", {}, false);
        assert(default_path == temp.path() / "Md" / "Shop" / "Shop.md");
        assert(fs::exists(default_path));

        std::cout << "✓ Document saving test passed" << std::endl;
    }

    void testOutputPathResolution() {
        std::cout << "Testing output path resolution..." << std::endl;

        assert(DocumentAssembler::resolveOutputPath("/work/Proj", "custom/out.md") == fs::path("custom/out.md"));
        assert(DocumentAssembler::resolveOutputPath("/work/Proj", "") == fs::path("/work/Md/Proj/Proj.md"));
        assert(DocumentAssembler::resolveOutputPath("/work/Proj/", "") == fs::path("/work/Md/Proj/Proj.md"));
        assert(DocumentAssembler::resolveOutputPath("/work/Proj/Proj", "") == fs::path("/work/Md/Proj/Proj.md") &&
               "Nested layout should move up one level");
        assert(DocumentAssembler::resolveOutputPath("/work/proj/Proj", "") == fs::path("/work/Md/Proj/Proj.md") &&
               "Nested check should ignore case");

        assert(DocumentAssembler::projectName("/a/b/") == "b");
        assert(DocumentAssembler::projectName("/a/b") == "b");

        std::cout << "✓ Output path resolution test passed" << std::endl;
    }

    void testProjectMetadataParsing() {
        std::cout << "Testing project metadata parsing..." << std::endl;

        FolderDoc::ProjectInfo info = FolderDoc::ProjectMetadata::parse("App/App.csproj", kProjectXml);

        assert(info.relative_path == "App/App.csproj");
        assert(info.properties.size() == 2);
        assert(info.properties[0].first == "TargetFramework" && info.properties[0].second == "net8.0");
        assert(info.properties[1].first == "OutputType" && info.properties[1].second == "Exe");
        assert(info.packages.size() == 2);
        assert(info.packages[0].name == "Newtonsoft.Json" && info.packages[0].version == "13.0.3");
        assert(info.packages[1].name == "Serilog" && info.packages[1].version.empty());

        std::ostringstream out;
        FolderDoc::ProjectMetadata::render({info}, out);
        std::string section = out.str();

        assert(section.find("## Project Metadata\n\n### App/App.csproj\n") != std::string::npos);
        assert(section.find("- **TargetFramework**: net8.0\n") != std::string::npos);
        assert(section.find("  - Newtonsoft.Json (13.0.3)\n") != std::string::npos);
        assert(section.find("  - Serilog\n") != std::string::npos);

        std::string bulky = "<Project>\n  <Description>" + std::string(200000, 'd') +
                            "</Description>\n  <OutputType>Library</OutputType>\n</Project>\n";
        FolderDoc::ProjectInfo large = FolderDoc::ProjectMetadata::parse("Big.csproj", bulky);
        assert(large.properties.size() == 1 && large.properties[0].second == "Library");

        std::ostringstream empty;
        FolderDoc::ProjectMetadata::render({}, empty);
        assert(empty.str().empty());

        std::cout << "✓ Project metadata parsing test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running DocumentAssembler unit tests..." << std::endl;

        testBasicDocument();
        testSectionOrder();
        testSecretRedactionInDocument();
        testIncludePatterns();
        testDirectoryLinksAreNotFollowed();
        testCommentStripping();
        testMissingRootFailsBeforeOutput();
        testInjectedReader();
        testGenerateToFile();
        testOutputPathResolution();
        testProjectMetadataParsing();

        std::cout << "All DocumentAssembler tests passed!" << std::endl;
    }
};

int main() {
    try {
        DocumentAssemblerTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All DocumentAssembler component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
