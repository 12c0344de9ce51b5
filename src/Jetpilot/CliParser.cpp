// =================================================================
// src/Jetpilot/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Jetpilot/CliParser.hpp"

namespace Jetpilot {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Jetpilot: drives a Jetlag checkout (playbooks, docs, cluster vars).");
    m_app->require_subcommand(1);

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    // Define all commands
    setupGlobalOptions(*m_app);
    setupListCommands(*m_app);
    setupReadCommand(*m_app);
    setupRunCommand(*m_app);
    setupCreateVarsCommand(*m_app);
    setupServeCommand(*m_app);
    setupToolsCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupGlobalOptions(CLI::App& app) {
    app.add_option("-c,--config", m_commands.config_path, "YAML configuration file (default: .jetpilot/config.yml)");
    app.add_option("-p,--project-root", m_commands.project_root, "Path to the Jetlag checkout");
    app.add_option("--log-dir", m_commands.log_dir, "Directory for log files");
    app.add_option("--log-level", m_commands.log_level, "Log level")
        ->check(CLI::IsMember({"debug", "info", "warning", "error", "critical"}));
    auto* verbose = app.add_flag("-v,--verbose", m_commands.verbose, "Log debug messages");
    app.add_flag("-q,--quiet", m_commands.quiet, "Disable console logging")->excludes(verbose);
}

void CliParser::setupListCommands(CLI::App& app) {
    app.add_subcommand("list-playbooks", "Lists the top-level playbooks under ansible/.");
    app.add_subcommand("list-roles", "Lists the role names under ansible/roles.");
    app.add_subcommand("list-docs", "Lists the Markdown docs under docs/.");
}

void CliParser::setupReadCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("read", "Prints a UTF-8 text file from inside the project.");
    sub->add_option("relative_path", m_commands.relative_path, "Path relative to the project root.")->required();
}

void CliParser::setupRunCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("run", "Runs a top-level playbook with ansible-playbook.");
    sub->add_option("playbook", m_commands.playbook_name, "Playbook file name (e.g. 'sno-deploy.yml').")->required();
    sub->add_option("-i,--inventory", m_commands.inventory_relpath, "Inventory path relative to the project root.");
    sub->add_option("--limit", m_commands.limit, "Host pattern passed to --limit.");
    sub->add_option("--tags", m_commands.tags, "Tags passed to --tags.");
    sub->add_option("-e,--extra-vars", m_commands.extra_vars_json, "JSON object passed with -e.");
    sub->add_flag("--check", m_commands.check, "Run in check mode.");
    sub->add_option("--timeout", m_commands.timeout_seconds, "Timeout in seconds (default from configuration).")
        ->check(CLI::PositiveNumber);
}

void CliParser::setupCreateVarsCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("create-vars", "Writes ansible/vars/all.yml from all.sample.yml.");
    sub->add_option("lab", m_commands.lab, "Lab name (e.g. 'scalelab').")->required();
    sub->add_option("lab_cloud", m_commands.lab_cloud, "Cloud allocation (e.g. 'cloud99').")->required();
    sub->add_option("cluster_type", m_commands.cluster_type, "Cluster type.")
        ->required()
        ->check(CLI::IsMember({"mno", "sno", "vmno"}));
    sub->add_option("ocp_build", m_commands.ocp_build, "OCP build (ga, dev or ci).")->required();
    sub->add_option("ocp_version", m_commands.ocp_version, "OCP version (e.g. 'latest-4.17').")->required();
    sub->add_flag("--public-vlan", m_commands.public_vlan, "Use the public VLAN.");
    sub->add_flag("--sno-use-lab-dhcp", m_commands.sno_use_lab_dhcp, "Use lab DHCP for SNO.");
    sub->add_option("--ssh-private-key", m_commands.ssh_private_key_file, "SSH private key (default ~/.ssh/id_rsa).");
    sub->add_option("--ssh-public-key", m_commands.ssh_public_key_file, "SSH public key (default ~/.ssh/id_rsa.pub).");
    sub->add_option("--sno-install-disk", m_commands.sno_install_disk, "Install disk for sno.");
    sub->add_option("--control-plane-install-disk", m_commands.control_plane_install_disk, "Control plane install disk.");
    sub->add_option("--worker-install-disk", m_commands.worker_install_disk, "Worker install disk.");
    sub->add_option("--pull-secret", m_commands.pull_secret_lookup, "Pull secret path used in the file lookup.");
    sub->add_option("--worker-node-count", m_commands.worker_node_count, "Number of worker nodes.")
        ->check(CLI::NonNegativeNumber);
    sub->add_option("-e,--extra-vars", m_commands.override_vars_json, "Flat JSON object appended as overrides.");
    sub->add_flag("--diff", m_commands.show_diff, "Show the changes against the current file.");
    sub->add_flag("--dry-run", m_commands.dry_run, "Render without writing.");
}

void CliParser::setupServeCommand(CLI::App& app) {
    app.add_subcommand("serve", "Serves the tools as JSON-RPC over stdin/stdout.");
}

void CliParser::setupToolsCommand(CLI::App& app) {
    app.add_subcommand("tools", "Prints the tool descriptions and input schemas.");
}

} // namespace Jetpilot
