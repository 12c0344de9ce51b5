// =================================================================
// tests/ProjectCatalogTest.cpp
// =================================================================
// Unit tests for ProjectCatalog component.

#include "Jetpilot/ProjectCatalog.hpp"
#include "Jetpilot/Errors.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <vector>

namespace fs = std::filesystem;

class ProjectCatalogTest {
private:
    fs::path test_dir;

    void setupTestFiles() {
        cleanupTestFiles();

        // Create test directory structure
        fs::create_directories(test_dir / "ansible" / "roles" / "bastion-install" / "tasks");
        fs::create_directories(test_dir / "ansible" / "roles" / "create-ai-cluster");
        fs::create_directories(test_dir / "ansible" / "vars");
        fs::create_directories(test_dir / "docs" / "img");
        fs::create_directories(test_dir / "docs" / "guides" / "img");
        fs::create_directories(test_dir / "docs" / "guides" / "images");

        // Create test files
        std::ofstream(test_dir / "ansible" / "sno-deploy.yml") << "---\n";
        std::ofstream(test_dir / "ansible" / "create-inventory.yml") << "---\n";
        std::ofstream(test_dir / "ansible" / "mno-deploy.yaml") << "---\n";
        std::ofstream(test_dir / "ansible" / "README.md") << "# Ansible\n";
        std::ofstream(test_dir / "ansible" / "roles" / "bastion-install" / "tasks" / "main.yml") << "---\n";
        std::ofstream(test_dir / "ansible" / "roles" / "notes.txt") << "not a role\n";
        std::ofstream(test_dir / "ansible" / "vars" / "all.sample.yml") << "lab:\n";
        std::ofstream(test_dir / "docs" / "deploy-sno.md") << "# SNO\n";
        std::ofstream(test_dir / "docs" / "guides" / "tips.md") << "# Tips\n";
        std::ofstream(test_dir / "docs" / "guides" / "images" / "kept.md") << "# Kept\n";
        std::ofstream(test_dir / "docs" / "img" / "diagram.md") << "# Skipped\n";
        std::ofstream(test_dir / "docs" / "guides" / "img" / "nested.md") << "# Skipped\n";
        std::ofstream(test_dir / "docs" / "logo.png") << "png";
        std::ofstream(test_dir / "docs" / "utf8.md") << "Caf\xC3\xA9 \xE2\x9C\x93\n";
        std::ofstream(test_dir / "binary.bin", std::ios::binary) << std::string("\xFF\xFE\x00\x01", 4);
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    template <typename Error, typename Fn>
    static bool throwsError(Fn fn) {
        try {
            fn();
        } catch (const Error&) {
            return true;
        }
        return false;
    }

public:
    ProjectCatalogTest() : test_dir(fs::temp_directory_path() / "jetpilot_project_catalog_test") {}

    void testListPlaybooks() {
        std::cout << "Testing playbook listing..." << std::endl;

        setupTestFiles();
        Jetpilot::ProjectLayout layout(test_dir);
        Jetpilot::ProjectCatalog catalog(layout);

        auto playbooks = catalog.listPlaybooks();
        assert(playbooks.size() == 3);
        assert(playbooks[0].name == "create-inventory.yml");
        assert(playbooks[1].name == "mno-deploy.yaml");
        assert(playbooks[2].name == "sno-deploy.yml");
        assert(fs::path(playbooks[2].path) == layout.ansibleDir() / "sno-deploy.yml");

        cleanupTestFiles();
        std::cout << "✓ Playbook listing test passed" << std::endl;
    }

    void testListRoles() {
        std::cout << "Testing role listing..." << std::endl;

        setupTestFiles();
        Jetpilot::ProjectLayout layout(test_dir);
        Jetpilot::ProjectCatalog catalog(layout);

        const std::vector<std::string> expected = {"bastion-install", "create-ai-cluster"};
        assert(catalog.listRoles() == expected);

        cleanupTestFiles();
        std::cout << "✓ Role listing test passed" << std::endl;
    }

    void testListDocs() {
        std::cout << "Testing doc listing..." << std::endl;

        setupTestFiles();
        Jetpilot::ProjectLayout layout(test_dir);
        Jetpilot::ProjectCatalog catalog(layout);

        auto docs = catalog.listDocs();
        const std::vector<std::string> expected = {
            (layout.docsDir() / "deploy-sno.md").string(),
            (layout.docsDir() / "guides" / "images" / "kept.md").string(),
            (layout.docsDir() / "guides" / "tips.md").string(),
            (layout.docsDir() / "utf8.md").string(),
        };
        assert(docs == expected);

        cleanupTestFiles();
        std::cout << "✓ Doc listing test passed" << std::endl;
    }

    void testMissingDirectories() {
        std::cout << "Testing missing directories..." << std::endl;

        cleanupTestFiles();
        fs::create_directories(test_dir);
        Jetpilot::ProjectLayout layout(test_dir);
        Jetpilot::ProjectCatalog catalog(layout);

        assert(catalog.listPlaybooks().empty());
        assert(catalog.listRoles().empty());
        assert(catalog.listDocs().empty());

        cleanupTestFiles();
        std::cout << "✓ Missing directories test passed" << std::endl;
    }

    void testReadTextFile() {
        std::cout << "Testing text file reading..." << std::endl;

        setupTestFiles();
        Jetpilot::ProjectLayout layout(test_dir);
        Jetpilot::ProjectCatalog catalog(layout);

        assert(catalog.readTextFile("ansible/vars/all.sample.yml") == "lab:\n");
        assert(catalog.readTextFile("docs/utf8.md") == "Caf\xC3\xA9 \xE2\x9C\x93\n");

        assert(throwsError<Jetpilot::PathEscapeError>([&] { catalog.readTextFile("../etc/passwd"); }));
        assert(throwsError<Jetpilot::PathEscapeError>([&] { catalog.readTextFile("/etc/hostname"); }));
        assert(throwsError<Jetpilot::NotFoundError>([&] { catalog.readTextFile("docs/missing.md"); }));
        assert(throwsError<Jetpilot::NotFoundError>([&] { catalog.readTextFile("docs"); }));
        assert(throwsError<Jetpilot::EncodingError>([&] { catalog.readTextFile("binary.bin"); }));

        cleanupTestFiles();
        std::cout << "✓ Text file reading test passed" << std::endl;
    }

    void testUtf8Validation() {
        std::cout << "Testing UTF-8 validation..." << std::endl;

        using Jetpilot::ProjectCatalog;
        assert(ProjectCatalog::isValidUtf8(""));
        assert(ProjectCatalog::isValidUtf8("plain ascii"));
        assert(ProjectCatalog::isValidUtf8("\xF0\x9F\x9A\x80"));       // 4-byte sequence
        assert(!ProjectCatalog::isValidUtf8("\xC3"));                  // truncated
        assert(!ProjectCatalog::isValidUtf8("\xC0\xAF"));              // overlong
        assert(!ProjectCatalog::isValidUtf8("\xED\xA0\x80"));          // surrogate
        assert(!ProjectCatalog::isValidUtf8("\xF4\x90\x80\x80"));      // above U+10FFFF
        assert(!ProjectCatalog::isValidUtf8("\x80"));                  // stray continuation

        std::cout << "✓ UTF-8 validation test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ProjectCatalog unit tests..." << std::endl;

        testListPlaybooks();
        testListRoles();
        testListDocs();
        testMissingDirectories();
        testReadTextFile();
        testUtf8Validation();

        std::cout << "All ProjectCatalog tests passed!" << std::endl;
    }
};

int main() {
    try {
        ProjectCatalogTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
