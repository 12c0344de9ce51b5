// =================================================================
// include/Jetpilot/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Jetpilot {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string config_path;
    std::string project_root;
    std::string log_dir;
    std::string log_level;
    bool verbose = false;
    bool quiet = false;

    // Options for 'read'
    std::string relative_path;

    // Options for 'run'
    std::string playbook_name;
    std::string inventory_relpath;
    std::string limit;
    std::string tags;
    std::string extra_vars_json;
    bool check = false;
    int timeout_seconds = 0;    // 0 means the configured default

    // Options for 'create-vars'
    std::string lab;
    std::string lab_cloud;
    std::string cluster_type;
    std::string ocp_build;
    std::string ocp_version;
    bool public_vlan = false;
    bool sno_use_lab_dhcp = false;
    std::string ssh_private_key_file;
    std::string ssh_public_key_file;
    std::string sno_install_disk;
    std::string control_plane_install_disk;
    std::string worker_install_disk;
    std::string pull_secret_lookup = "../pull_secret.txt";
    std::string override_vars_json;
    long long worker_node_count = -1;   // negative means not given
    bool show_diff = false;
    bool dry_run = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupGlobalOptions(CLI::App& app);
    void setupListCommands(CLI::App& app);
    void setupReadCommand(CLI::App& app);
    void setupRunCommand(CLI::App& app);
    void setupCreateVarsCommand(CLI::App& app);
    void setupServeCommand(CLI::App& app);
    void setupToolsCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Jetpilot
