// =================================================================
// include/Jetpilot/ServerConfig.hpp
// =================================================================
// Runtime configuration loaded from .jetpilot/config.yml.

#pragma once

#include "Jetpilot/Logger.hpp"
#include <string>

namespace Jetpilot {

struct Commands;

/**
 * @brief Settings shared by every command
 */
struct ServerConfig {
    // Jetlag checkout the operations act on
    std::string project_root = "jetlag";

    // Subprocess settings
    int default_timeout_seconds = 7200;

    // Logging settings
    std::string log_dir = ".jetpilot/logs";
    std::string log_level = "info";
    std::string file_log_level = "debug";
    bool console_logging = true;

    /**
     * @brief Load values from a YAML configuration file
     * @param config_path Path to the YAML file
     *
     * Keys missing from the file keep their defaults. Throws NotFoundError
     * if the file does not exist and ValidationError if it does not parse.
     */
    void loadFromFile(const std::string& config_path);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Validate configuration settings, throws ValidationError
     */
    void validate() const;

    /**
     * @brief Parse a log level name (debug, info, warning, error, critical)
     */
    static LogLevel parseLogLevel(const std::string& name);

    static constexpr const char* DEFAULT_CONFIG_PATH = ".jetpilot/config.yml";
};

} // namespace Jetpilot
