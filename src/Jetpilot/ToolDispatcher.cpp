// =================================================================
// src/Jetpilot/ToolDispatcher.cpp
// =================================================================
// Implementation for tool dispatch.

#include "Jetpilot/ToolDispatcher.hpp"
#include "Jetpilot/Logger.hpp"
#include <filesystem>

namespace Jetpilot {

namespace {

std::string getString(const Json& arguments, const std::string& name, const std::string& fallback = "") {
    if (!arguments.contains(name) || arguments[name].is_null()) {
        return fallback;
    }
    return arguments[name].get<std::string>();
}

bool getBool(const Json& arguments, const std::string& name, bool fallback = false) {
    if (!arguments.contains(name) || arguments[name].is_null()) {
        return fallback;
    }
    return arguments[name].get<bool>();
}

bool hasValue(const Json& arguments, const std::string& name) {
    return arguments.contains(name) && !arguments[name].is_null();
}

bool matchesType(const Json& value, const std::string& type) {
    if (value.is_null()) return true;
    if (type == "string") return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "integer") return value.is_number_integer();
    return false;
}

} // namespace

std::string dumpJson(const Json& value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

OperationResult OperationResult::success(Json value) {
    OperationResult result;
    result.ok = true;
    result.value = std::move(value);
    return result;
}

OperationResult OperationResult::failure(ErrorKind kind, const std::string& message) {
    OperationResult result;
    result.ok = false;
    result.error_kind = kind;
    result.error_message = message;
    return result;
}

std::string OperationResult::errorText() const {
    return errorKindName(error_kind) + ": " + error_message;
}

Json ToolDescription::inputSchema() const {
    Json properties = Json::object();
    Json required = Json::array();
    for (const auto& param : parameters) {
        properties[param.name] = {{"type", param.type}, {"description", param.description}};
        if (param.required) {
            required.push_back(param.name);
        }
    }

    Json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

ToolDispatcher::ToolDispatcher(const ProjectLayout& layout, std::chrono::seconds default_timeout)
    : m_layout(layout),
      m_default_timeout(default_timeout),
      m_catalog(layout),
      m_builder(layout),
      m_vars_writer(layout)
{
    registerHandlers();
}

const std::vector<ToolDescription>& ToolDispatcher::describeTools() {
    static const std::vector<ToolDescription> tools = {
        {"list_playbooks",
         "List top-level Ansible playbooks under jetlag/ansible (excludes role internals).",
         {}},
        {"list_roles",
         "List Ansible role names available under jetlag/ansible/roles.",
         {}},
        {"list_docs",
         "List Markdown docs under jetlag/docs (excluding images).",
         {}},
        {"read_text_file",
         "Read a text file from within the jetlag project by relative path. "
         "Only files within the jetlag directory are allowed. Use forward slashes.",
         {{"relative_path", "string", true, "Path relative to the jetlag directory"}}},
        {"run_playbook",
         "Run an Ansible playbook by name (top-level file under jetlag/ansible).",
         {{"playbook_name", "string", true, "Playbook file name, e.g. sno-deploy.yml"},
          {"inventory_relpath", "string", false, "Inventory path relative to jetlag, e.g. ansible/inventory/cloud99.local"},
          {"limit", "string", false, "Ansible --limit host pattern"},
          {"tags", "string", false, "Ansible --tags filter"},
          {"extra_vars_json", "string", false, "JSON string of variables passed with -e"},
          {"check", "boolean", false, "Run with --check"},
          {"timeout_seconds", "integer", false, "Process timeout in seconds"}}},
        {"create_all_yml_vars_file",
         "Create or overwrite ansible/vars/all.yml from ansible/vars/all.sample.yml. "
         "Replaces the given keys in place, preserving comments and spacing, and "
         "appends extra vars under the 'Append override vars below' section.",
         {{"lab", "string", true, "Lab name, e.g. scalelab"},
          {"lab_cloud", "string", true, "Lab cloud allocation, e.g. cloud99"},
          {"cluster_type", "string", true, "One of mno, sno, vmno"},
          {"ocp_build", "string", true, "ga, dev or ci"},
          {"ocp_version", "string", true, "OpenShift version, e.g. latest-4.17"},
          {"public_vlan", "boolean", false, "Use the public VLAN"},
          {"sno_use_lab_dhcp", "boolean", false, "Use lab DHCP for SNO"},
          {"ssh_private_key_file", "string", false, "Defaults to ~/.ssh/id_rsa"},
          {"ssh_public_key_file", "string", false, "Defaults to ~/.ssh/id_rsa.pub"},
          {"sno_install_disk", "string", false, "Install disk for sno clusters"},
          {"control_plane_install_disk", "string", false, "Control plane install disk for mno/vmno"},
          {"worker_install_disk", "string", false, "Worker install disk for mno/vmno"},
          {"pull_secret_lookup", "string", false, "Pull secret path for the file lookup, defaults to ../pull_secret.txt"},
          {"extra_vars_json", "string", false, "Flat JSON object of override vars to append"},
          {"worker_node_count", "integer", false, "Number of worker nodes"}}},
    };
    return tools;
}

const ToolDescription* ToolDispatcher::findTool(const std::string& name) {
    for (const auto& tool : describeTools()) {
        if (tool.name == name) {
            return &tool;
        }
    }
    return nullptr;
}

void ToolDispatcher::validateArguments(const ToolDescription& tool, const Json& arguments) {
    if (!arguments.is_object()) {
        throw ValidationError("Arguments for " + tool.name + " must be a JSON object");
    }

    for (const auto& item : arguments.items()) {
        const ToolParameter* param = nullptr;
        for (const auto& candidate : tool.parameters) {
            if (candidate.name == item.key()) {
                param = &candidate;
                break;
            }
        }
        if (param == nullptr) {
            throw ValidationError("Unknown argument '" + item.key() + "' for " + tool.name);
        }
        if (!matchesType(item.value(), param->type)) {
            throw ValidationError("Argument '" + item.key() + "' of " + tool.name + " must be " +
                                  param->type + ", got " + item.value().type_name());
        }
    }

    for (const auto& param : tool.parameters) {
        if (param.required && !hasValue(arguments, param.name)) {
            throw ValidationError("Missing required argument '" + param.name + "' for " + tool.name);
        }
    }
}

void ToolDispatcher::registerHandlers() {
    m_handlers["list_playbooks"] = [this](const Json&) {
        return toJson(m_catalog.listPlaybooks());
    };
    m_handlers["list_roles"] = [this](const Json&) {
        return Json(m_catalog.listRoles());
    };
    m_handlers["list_docs"] = [this](const Json&) {
        return Json(m_catalog.listDocs());
    };
    m_handlers["read_text_file"] = [this](const Json& arguments) {
        return Json(m_catalog.readTextFile(getString(arguments, "relative_path")));
    };
    m_handlers["run_playbook"] = [this](const Json& arguments) {
        return handleRunPlaybook(arguments);
    };
    m_handlers["create_all_yml_vars_file"] = [this](const Json& arguments) {
        return toJson(m_vars_writer.write(clusterVarsRequestFromJson(arguments)));
    };
}

OperationResult ToolDispatcher::call(const std::string& tool, const Json& arguments) {
    auto start_time = std::chrono::steady_clock::now();
    auto elapsed = [&start_time]() {
        return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count());
    };

    OperationResult result;
    try {
        const ToolDescription* description = findTool(tool);
        auto handler = m_handlers.find(tool);
        if (description == nullptr || handler == m_handlers.end()) {
            throw ValidationError("Unknown tool: " + tool);
        }

        Json args = arguments.is_null() ? Json::object() : arguments;
        validateArguments(*description, args);
        result = OperationResult::success(handler->second(args));
    } catch (const JetpilotError& e) {
        result = OperationResult::failure(e.kind(), e.what());
    } catch (const nlohmann::json::exception& e) {
        result = OperationResult::failure(ErrorKind::VALIDATION, e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        result = OperationResult::failure(ErrorKind::IO, e.what());
    }

    Logger::getInstance().logToolCall(tool, result.ok, elapsed(), result.ok ? "" : result.errorText());
    return result;
}

Json ToolDispatcher::handleRunPlaybook(const Json& arguments) {
    PlaybookRunOptions options;
    options.playbook_name = getString(arguments, "playbook_name");
    options.flags.inventory_relpath = getString(arguments, "inventory_relpath");
    options.flags.limit = getString(arguments, "limit");
    options.flags.tags = getString(arguments, "tags");
    options.flags.extra_vars_json = getString(arguments, "extra_vars_json");
    options.flags.check = getBool(arguments, "check");
    options.timeout = m_default_timeout;

    if (hasValue(arguments, "timeout_seconds")) {
        long long seconds = arguments["timeout_seconds"].get<long long>();
        if (seconds <= 0) {
            throw ValidationError("timeout_seconds must be greater than 0");
        }
        if (seconds > SysInteraction::MAX_TIMEOUT.count()) {
            throw ValidationError("timeout_seconds must not exceed " +
                                  std::to_string(SysInteraction::MAX_TIMEOUT.count()));
        }
        options.timeout = std::chrono::seconds(seconds);
    }

    CommandSpec spec = m_builder.buildPlaybookRun(options);
    return toJson(m_sys.execute(spec));
}

ClusterVarsRequest ToolDispatcher::clusterVarsRequestFromJson(const Json& arguments) {
    ClusterVarsRequest request;
    request.lab = getString(arguments, "lab");
    request.lab_cloud = getString(arguments, "lab_cloud");
    request.cluster_type = getString(arguments, "cluster_type");
    request.ocp_build = getString(arguments, "ocp_build");
    request.ocp_version = getString(arguments, "ocp_version");
    request.public_vlan = getBool(arguments, "public_vlan");
    request.sno_use_lab_dhcp = getBool(arguments, "sno_use_lab_dhcp");
    request.ssh_private_key_file = getString(arguments, "ssh_private_key_file");
    request.ssh_public_key_file = getString(arguments, "ssh_public_key_file");
    request.sno_install_disk = getString(arguments, "sno_install_disk");
    request.control_plane_install_disk = getString(arguments, "control_plane_install_disk");
    request.worker_install_disk = getString(arguments, "worker_install_disk");
    request.pull_secret_lookup = getString(arguments, "pull_secret_lookup", request.pull_secret_lookup);
    request.extra_vars_json = getString(arguments, "extra_vars_json");
    if (hasValue(arguments, "worker_node_count")) {
        request.worker_node_count = arguments["worker_node_count"].get<long long>();
    }
    return request;
}

Json ToolDispatcher::toJson(const std::vector<PlaybookInfo>& playbooks) {
    Json list = Json::array();
    for (const auto& playbook : playbooks) {
        list.push_back({{"name", playbook.name}, {"path", playbook.path}});
    }
    return list;
}

Json ToolDispatcher::toJson(const ExecutionResult& result) {
    return {
        {"returncode", result.exit_code},
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"command", result.command_line},
        {"cwd", result.working_directory.empty() ? Json(nullptr) : Json(result.working_directory)},
    };
}

Json ToolDispatcher::toJson(const ClusterVarsResult& result) {
    return {
        {"written", result.written_path},
        {"updated", result.report.describe()},
        {"skipped", result.report.skipped_keys},
    };
}

} // namespace Jetpilot
