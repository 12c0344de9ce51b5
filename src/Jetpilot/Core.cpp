// =================================================================
// src/Jetpilot/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Jetpilot/Core.hpp"
#include "Jetpilot/ClusterVarsWriter.hpp"
#include "Jetpilot/DiffGenerator.hpp"
#include "Jetpilot/Errors.hpp"
#include "Jetpilot/Logger.hpp"
#include "Jetpilot/ProjectLayout.hpp"
#include "Jetpilot/StdioServer.hpp"
#include "Jetpilot/ToolDispatcher.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace Jetpilot {

Core::Core(const Commands& commands)
    : m_commands(commands)
{
}

Core::~Core() = default;

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();
    int exit_code = 1;

    try {
        loadConfiguration();
        Logger::getInstance().logSessionStart(m_commands.active_command, m_layout->root().string());
        exit_code = dispatch();
    } catch (const JetpilotError& e) {
        LOG_ERROR("Core", e.what());
        std::cerr << "Error: " << errorKindName(e.kind()) << ": " << e.what() << std::endl;
        exit_code = 1;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, duration.count());
    Logger::getInstance().flush();
    return exit_code;
}

void Core::loadConfiguration() {
    if (!m_commands.config_path.empty()) {
        m_config.loadFromFile(m_commands.config_path);
    } else if (std::filesystem::is_regular_file(ServerConfig::DEFAULT_CONFIG_PATH)) {
        m_config.loadFromFile(ServerConfig::DEFAULT_CONFIG_PATH);
    }
    m_config.applyCommandOverrides(m_commands);
    m_config.validate();

    Logger& logger = Logger::getInstance();
    logger.initialize(m_config.log_dir);
    logger.setConsoleLogging(m_config.console_logging);
    logger.setConsoleLogLevel(ServerConfig::parseLogLevel(m_config.log_level));
    logger.setFileLogLevel(ServerConfig::parseLogLevel(m_config.file_log_level));

    m_layout = std::make_unique<ProjectLayout>(m_config.project_root);
    m_dispatcher = std::make_unique<ToolDispatcher>(
        *m_layout, std::chrono::seconds(m_config.default_timeout_seconds));

    LOG_DEBUG("Core", "Project root: " + m_layout->root().string());
}

int Core::dispatch() {
    if (m_commands.active_command == "list-playbooks") {
        return handleListPlaybooks();
    } else if (m_commands.active_command == "list-roles") {
        return handleListRoles();
    } else if (m_commands.active_command == "list-docs") {
        return handleListDocs();
    } else if (m_commands.active_command == "read") {
        return handleRead();
    } else if (m_commands.active_command == "run") {
        return handleRun();
    } else if (m_commands.active_command == "create-vars") {
        return handleCreateVars();
    } else if (m_commands.active_command == "serve") {
        return handleServe();
    } else if (m_commands.active_command == "tools") {
        return handleTools();
    } else if (m_commands.active_command.empty()) {
        return 0;
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return 1;
}

int Core::printResult(const OperationResult& result) {
    if (!result.ok) {
        std::cerr << "Error: " << result.errorText() << std::endl;
        return 1;
    }
    if (result.value.is_string()) {
        std::cout << result.value.get<std::string>();
    } else {
        std::cout << dumpJson(result.value, 2) << std::endl;
    }
    return 0;
}

int Core::handleListPlaybooks() {
    return printResult(m_dispatcher->call("list_playbooks", Json::object()));
}

int Core::handleListRoles() {
    return printResult(m_dispatcher->call("list_roles", Json::object()));
}

int Core::handleListDocs() {
    return printResult(m_dispatcher->call("list_docs", Json::object()));
}

int Core::handleRead() {
    return printResult(m_dispatcher->call("read_text_file", {{"relative_path", m_commands.relative_path}}));
}

int Core::handleRun() {
    Json arguments = {{"playbook_name", m_commands.playbook_name}, {"check", m_commands.check}};
    if (!m_commands.inventory_relpath.empty()) arguments["inventory_relpath"] = m_commands.inventory_relpath;
    if (!m_commands.limit.empty()) arguments["limit"] = m_commands.limit;
    if (!m_commands.tags.empty()) arguments["tags"] = m_commands.tags;
    if (!m_commands.extra_vars_json.empty()) arguments["extra_vars_json"] = m_commands.extra_vars_json;
    if (m_commands.timeout_seconds > 0) arguments["timeout_seconds"] = m_commands.timeout_seconds;

    OperationResult result = m_dispatcher->call("run_playbook", arguments);
    if (printResult(result) != 0) {
        return 1;
    }

    // Mirror the playbook's exit status, shell style for signals
    int returncode = result.value["returncode"].get<int>();
    return returncode < 0 ? 128 - returncode : returncode;
}

int Core::handleCreateVars() {
    ClusterVarsRequest request;
    request.lab = m_commands.lab;
    request.lab_cloud = m_commands.lab_cloud;
    request.cluster_type = m_commands.cluster_type;
    request.ocp_build = m_commands.ocp_build;
    request.ocp_version = m_commands.ocp_version;
    request.public_vlan = m_commands.public_vlan;
    request.sno_use_lab_dhcp = m_commands.sno_use_lab_dhcp;
    request.ssh_private_key_file = m_commands.ssh_private_key_file;
    request.ssh_public_key_file = m_commands.ssh_public_key_file;
    request.sno_install_disk = m_commands.sno_install_disk;
    request.control_plane_install_disk = m_commands.control_plane_install_disk;
    request.worker_install_disk = m_commands.worker_install_disk;
    request.pull_secret_lookup = m_commands.pull_secret_lookup;
    request.extra_vars_json = m_commands.override_vars_json;
    if (m_commands.worker_node_count >= 0) {
        request.worker_node_count = m_commands.worker_node_count;
    }

    ClusterVarsWriter writer(*m_layout);
    ClusterVarsResult result = writer.write(request, m_commands.dry_run);

    if (m_commands.show_diff) {
        DiffGenerator diff(result.previous_text, result.rendered_text);
        if (diff.hasChanges()) {
            DiffStats counts = diff.stats();
            diff.printColoredDiff(std::cout);
            LOG_INFO("Core", "Vars file diff: +" + std::to_string(counts.added) +
                             " -" + std::to_string(counts.removed) + " lines");
        } else {
            std::cout << "No changes." << std::endl;
        }
    }

    if (m_commands.dry_run) {
        LOG_INFO("Core", "Dry run: " + result.written_path + " left untouched");
    }
    std::cout << dumpJson(ToolDispatcher::toJson(result), 2) << std::endl;
    return 0;
}

int Core::handleServe() {
    // stdout carries protocol frames only; logs stay on stderr
    StdioServer server(*m_dispatcher, std::cin, std::cout);
    server.run();
    return 0;
}

int Core::handleTools() {
    Json tools = Json::array();
    for (const auto& tool : ToolDispatcher::describeTools()) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.inputSchema()},
        });
    }
    std::cout << dumpJson(tools, 2) << std::endl;
    return 0;
}

} // namespace Jetpilot
