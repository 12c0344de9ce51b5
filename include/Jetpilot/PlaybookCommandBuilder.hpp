// =================================================================
// include/Jetpilot/PlaybookCommandBuilder.hpp
// =================================================================
// Assembles validated ansible-playbook invocations.

#pragma once

#include "Jetpilot/PathSandbox.hpp"
#include "Jetpilot/ProjectLayout.hpp"
#include "Jetpilot/SysInteraction.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace Jetpilot {

/**
 * @brief Optional ansible-playbook flags; empty strings mean "not given"
 */
struct CommandFlags {
    std::string inventory_relpath;   ///< -i, relative to the project root
    std::string limit;               ///< --limit host pattern
    std::string tags;                ///< --tags filter
    std::string extra_vars_json;     ///< -e, passed through verbatim once it parses
    bool check = false;              ///< --check (dry run)
};

/**
 * @brief Arguments of the run_playbook operation
 */
struct PlaybookRunOptions {
    std::string playbook_name;       ///< Top-level file under ansible/, e.g. "sno-deploy.yml"
    CommandFlags flags;
    std::chrono::seconds timeout{7200};
};

/**
 * @brief Builds CommandSpecs for the project's automation tool
 *
 * All paths are resolved through a PathSandbox rooted at the project, the
 * command runs from the project root, and ANSIBLE_CONFIG points at the
 * project's ansible.cfg when one exists.
 */
class PlaybookCommandBuilder {
public:
    explicit PlaybookCommandBuilder(const ProjectLayout& layout);

    /**
     * @brief Build a command from its parts
     * @param tool_path Executable path or name
     * @param positional_args Arguments placed right after the executable
     * @param flags Optional flags
     * @return Command ready for SysInteraction::execute
     *
     * Throws PathEscapeError or NotFoundError for a bad inventory and
     * ValidationError if extra_vars_json is not well-formed JSON.
     */
    CommandSpec build(const std::string& tool_path,
                      const std::vector<std::string>& positional_args,
                      const CommandFlags& flags) const;

    /**
     * @brief Build the ansible-playbook command for a top-level playbook
     *
     * Throws PathEscapeError if the playbook name leaves ansible/ and
     * NotFoundError if the playbook does not exist.
     */
    CommandSpec buildPlaybookRun(const PlaybookRunOptions& options) const;

    /**
     * @brief The project-bundled ansible-playbook if present, else the bare name for PATH lookup
     */
    std::string resolveExecutable() const;

    /**
     * @brief Throws ValidationError unless the text is well-formed JSON
     */
    static void validateExtraVars(const std::string& json_text);

    static constexpr const char* PLAYBOOK_EXECUTABLE = "ansible-playbook";

private:
    ProjectLayout m_layout;
    PathSandbox m_project_sandbox;
    PathSandbox m_ansible_sandbox;
};

} // namespace Jetpilot
