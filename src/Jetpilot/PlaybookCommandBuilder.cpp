// =================================================================
// src/Jetpilot/PlaybookCommandBuilder.cpp
// =================================================================
// Implementation for ansible-playbook command construction.

#include "Jetpilot/PlaybookCommandBuilder.hpp"
#include "Jetpilot/Errors.hpp"
#include "Jetpilot/Logger.hpp"
#include "nlohmann/json.hpp"

namespace Jetpilot {

PlaybookCommandBuilder::PlaybookCommandBuilder(const ProjectLayout& layout)
    : m_layout(layout),
      m_project_sandbox(layout.root()),
      m_ansible_sandbox(layout.ansibleDir())
{
}

CommandSpec PlaybookCommandBuilder::build(const std::string& tool_path,
                                          const std::vector<std::string>& positional_args,
                                          const CommandFlags& flags) const {
    CommandSpec spec;
    spec.executable = tool_path;
    spec.arguments = positional_args;
    spec.working_directory = m_layout.root();

    if (!flags.inventory_relpath.empty()) {
        auto inventory = m_project_sandbox.resolve(flags.inventory_relpath);
        if (!std::filesystem::exists(inventory)) {
            throw NotFoundError("Inventory not found: " + inventory.string());
        }
        spec.arguments.push_back("-i");
        spec.arguments.push_back(inventory.string());
    }

    if (!flags.limit.empty()) {
        spec.arguments.push_back("--limit");
        spec.arguments.push_back(flags.limit);
    }
    if (!flags.tags.empty()) {
        spec.arguments.push_back("--tags");
        spec.arguments.push_back(flags.tags);
    }

    if (!flags.extra_vars_json.empty()) {
        validateExtraVars(flags.extra_vars_json);
        spec.arguments.push_back("-e");
        spec.arguments.push_back(flags.extra_vars_json);
    }

    if (flags.check) {
        spec.arguments.push_back("--check");
    }

    std::error_code ec;
    if (std::filesystem::is_regular_file(m_layout.ansibleConfigFile(), ec)) {
        spec.environment["ANSIBLE_CONFIG"] = m_layout.ansibleConfigFile().string();
    }

    return spec;
}

CommandSpec PlaybookCommandBuilder::buildPlaybookRun(const PlaybookRunOptions& options) const {
    if (options.playbook_name.empty()) {
        throw ValidationError("playbook_name cannot be empty");
    }

    auto playbook = m_ansible_sandbox.resolve(options.playbook_name);
    if (!std::filesystem::exists(playbook)) {
        throw NotFoundError("Playbook not found: " + playbook.string());
    }

    CommandSpec spec = build(resolveExecutable(), {playbook.string()}, options.flags);
    spec.timeout = options.timeout;

    LOG_DEBUG("PlaybookCommandBuilder", "Built command: " + spec.commandLine());
    return spec;
}

std::string PlaybookCommandBuilder::resolveExecutable() const {
    auto bundled = m_layout.bundledPlaybookExecutable();
    std::error_code ec;
    if (std::filesystem::exists(bundled, ec)) {
        return bundled.string();
    }
    return PLAYBOOK_EXECUTABLE;
}

void PlaybookCommandBuilder::validateExtraVars(const std::string& json_text) {
    try {
        (void)nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(std::string("extra_vars_json is not valid JSON: ") + e.what());
    }
}

} // namespace Jetpilot
