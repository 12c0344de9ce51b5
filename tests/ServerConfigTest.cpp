// =================================================================
// tests/ServerConfigTest.cpp
// =================================================================
// Unit tests for YAML configuration loading.

#include "Jetpilot/ServerConfig.hpp"
#include "Jetpilot/SysInteraction.hpp"
#include "Jetpilot/CliParser.hpp"
#include "Jetpilot/Errors.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>

namespace fs = std::filesystem;

class ServerConfigTest {
private:
    fs::path test_dir;

    void setupTestFiles() {
        cleanupTestFiles();
        fs::create_directories(test_dir);
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
    ServerConfigTest() : test_dir(fs::temp_directory_path() / "jetpilot_server_config_test") {}

    void testDefaults() {
        std::cout << "Testing default configuration..." << std::endl;

        Jetpilot::ServerConfig config;
        assert(config.project_root == "jetlag");
        assert(config.default_timeout_seconds == 7200);
        assert(config.log_dir == ".jetpilot/logs");
        assert(config.log_level == "info");
        assert(config.file_log_level == "debug");
        assert(config.console_logging);
        config.validate();

        std::cout << "✓ Default configuration test passed" << std::endl;
    }

    void testLoadFromFile() {
        std::cout << "Testing configuration file loading..." << std::endl;

        setupTestFiles();
        fs::path file = test_dir / "config.yml";
        std::ofstream(file) <<
            "# Jetpilot configuration\n"
            "project_root: /srv/jetlag\n"
            "default_timeout_seconds: 600\n"
            "log_level: debug\n"
            "file_log_level: warning\n"
            "console_logging: false\n";

        Jetpilot::ServerConfig config;
        config.loadFromFile(file.string());
        assert(config.project_root == "/srv/jetlag");
        assert(config.default_timeout_seconds == 600);
        assert(config.log_level == "debug");
        assert(config.file_log_level == "warning");
        assert(!config.console_logging);
        // Absent keys keep their defaults
        assert(config.log_dir == ".jetpilot/logs");

        std::ofstream(file) << "log_dir:\n";
        Jetpilot::ServerConfig console_only;
        console_only.loadFromFile(file.string());
        assert(console_only.log_dir.empty());

        cleanupTestFiles();
        std::cout << "✓ Configuration file loading test passed" << std::endl;
    }

    void testLoadErrors() {
        std::cout << "Testing configuration errors..." << std::endl;

        setupTestFiles();
        fs::path file = test_dir / "config.yml";

        assert(throwsError<Jetpilot::NotFoundError>([&] {
            Jetpilot::ServerConfig config;
            config.loadFromFile((test_dir / "missing.yml").string());
        }));

        std::ofstream(file) << "project_root: [unclosed\n";
        assert(throwsError<Jetpilot::ValidationError>([&] {
            Jetpilot::ServerConfig config;
            config.loadFromFile(file.string());
        }));

        std::ofstream(file) << "default_timeout_seconds: soon\n";
        assert(throwsError<Jetpilot::ValidationError>([&] {
            Jetpilot::ServerConfig config;
            config.loadFromFile(file.string());
        }));

        std::ofstream(file) << "- just\n- a list\n";
        assert(throwsError<Jetpilot::ValidationError>([&] {
            Jetpilot::ServerConfig config;
            config.loadFromFile(file.string());
        }));

        cleanupTestFiles();
        std::cout << "✓ Configuration errors test passed" << std::endl;
    }

    void testCommandOverrides() {
        std::cout << "Testing command-line overrides..." << std::endl;

        Jetpilot::Commands commands;
        commands.project_root = "../jetlag";
        commands.log_dir = "/tmp/jetpilot-logs";
        commands.verbose = true;
        commands.quiet = true;

        Jetpilot::ServerConfig config;
        config.applyCommandOverrides(commands);
        assert(config.project_root == "../jetlag");
        assert(config.log_dir == "/tmp/jetpilot-logs");
        assert(config.log_level == "debug");
        assert(!config.console_logging);

        Jetpilot::Commands untouched;
        Jetpilot::ServerConfig defaults;
        defaults.applyCommandOverrides(untouched);
        assert(defaults.project_root == "jetlag");
        assert(defaults.log_level == "info");

        std::cout << "✓ Command-line overrides test passed" << std::endl;
    }

    void testValidation() {
        std::cout << "Testing validation..." << std::endl;

        Jetpilot::ServerConfig config;
        config.log_level = "chatty";
        assert(throwsError<Jetpilot::ValidationError>([&] { config.validate(); }));

        config.log_level = "warning";
        config.default_timeout_seconds = 0;
        assert(throwsError<Jetpilot::ValidationError>([&] { config.validate(); }));

        config.default_timeout_seconds = static_cast<int>(Jetpilot::SysInteraction::MAX_TIMEOUT.count()) + 1;
        assert(throwsError<Jetpilot::ValidationError>([&] { config.validate(); }));

        config.default_timeout_seconds = static_cast<int>(Jetpilot::SysInteraction::MAX_TIMEOUT.count());
        config.validate();

        config.file_log_level = "loud";
        assert(throwsError<Jetpilot::ValidationError>([&] { config.validate(); }));

        config.file_log_level = "error";
        config.default_timeout_seconds = 10;
        config.project_root.clear();
        assert(throwsError<Jetpilot::ValidationError>([&] { config.validate(); }));

        assert(Jetpilot::ServerConfig::parseLogLevel("error") == Jetpilot::LogLevel::ERROR);
        assert(Jetpilot::ServerConfig::parseLogLevel("warn") == Jetpilot::LogLevel::WARNING);

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ServerConfig unit tests..." << std::endl;

        testDefaults();
        testLoadFromFile();
        testLoadErrors();
        testCommandOverrides();
        testValidation();

        std::cout << "All ServerConfig tests passed!" << std::endl;
    }
};

int main() {
    try {
        ServerConfigTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
