// =================================================================
// src/Jetpilot/ServerConfig.cpp
// =================================================================
// Implementation for YAML-backed configuration.

#include "Jetpilot/ServerConfig.hpp"
#include "Jetpilot/CliParser.hpp"
#include "Jetpilot/Errors.hpp"
#include "Jetpilot/SysInteraction.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace Jetpilot {

void ServerConfig::loadFromFile(const std::string& config_path) {
    if (!std::filesystem::is_regular_file(config_path)) {
        throw NotFoundError("Configuration file not found: " + config_path);
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);
        if (!root || root.IsNull()) {
            return;
        }
        if (!root.IsMap()) {
            throw ValidationError("Configuration file must be a mapping: " + config_path);
        }

        if (root["project_root"]) {
            project_root = root["project_root"].as<std::string>();
        }
        if (root["default_timeout_seconds"]) {
            default_timeout_seconds = root["default_timeout_seconds"].as<int>();
        }
        if (root["log_dir"]) {
            log_dir = root["log_dir"].IsNull() ? "" : root["log_dir"].as<std::string>();
        }
        if (root["log_level"]) {
            log_level = root["log_level"].as<std::string>();
        }
        if (root["file_log_level"]) {
            file_log_level = root["file_log_level"].as<std::string>();
        }
        if (root["console_logging"]) {
            console_logging = root["console_logging"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ValidationError("Invalid configuration file " + config_path + ": " + e.what());
    }
}

void ServerConfig::applyCommandOverrides(const Commands& commands) {
    if (!commands.project_root.empty()) {
        project_root = commands.project_root;
    }
    if (!commands.log_dir.empty()) {
        log_dir = commands.log_dir;
    }
    if (!commands.log_level.empty()) {
        log_level = commands.log_level;
    }
    if (commands.verbose) {
        log_level = "debug";
    }
    if (commands.quiet) {
        console_logging = false;
    }
}

void ServerConfig::validate() const {
    if (project_root.empty()) {
        throw ValidationError("project_root cannot be empty");
    }
    if (default_timeout_seconds <= 0) {
        throw ValidationError("default_timeout_seconds must be greater than 0");
    }
    if (default_timeout_seconds > SysInteraction::MAX_TIMEOUT.count()) {
        throw ValidationError("default_timeout_seconds must not exceed " +
                              std::to_string(SysInteraction::MAX_TIMEOUT.count()));
    }
    parseLogLevel(log_level);
    parseLogLevel(file_log_level);
}

LogLevel ServerConfig::parseLogLevel(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    throw ValidationError("Unknown log level '" + name +
                          "', expected one of debug, info, warning, error, critical");
}

} // namespace Jetpilot
