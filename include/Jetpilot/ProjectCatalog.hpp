// =================================================================
// include/Jetpilot/ProjectCatalog.hpp
// =================================================================
// Header for enumerating and reading files of the Jetlag project.

#pragma once

#include "Jetpilot/PathSandbox.hpp"
#include "Jetpilot/ProjectLayout.hpp"
#include "Jetpilot/SysInteraction.hpp"
#include <string>
#include <vector>

namespace Jetpilot {

/**
 * @brief A top-level playbook under ansible/
 */
struct PlaybookInfo {
    std::string name;   ///< File name, e.g. "sno-deploy.yml"
    std::string path;   ///< Absolute path
};

/**
 * @brief Lists playbooks, roles and docs, and reads project files as text
 *
 * Missing directories produce empty listings. Reads are confined to the
 * project root through a PathSandbox.
 */
class ProjectCatalog {
public:
    explicit ProjectCatalog(const ProjectLayout& layout);

    /**
     * @brief Playbooks directly under ansible/ (*.yml, *.yaml), sorted by name
     */
    std::vector<PlaybookInfo> listPlaybooks();

    /**
     * @brief Role directory names under ansible/roles, sorted
     */
    std::vector<std::string> listRoles();

    /**
     * @brief Markdown files anywhere under docs/, skipping img/ directories, sorted
     * @return Absolute paths
     */
    std::vector<std::string> listDocs();

    /**
     * @brief Read a UTF-8 text file inside the project
     * @param relative_path Path relative to the project root
     * @return File content
     *
     * Throws PathEscapeError if the path leaves the project, NotFoundError
     * if it is not an existing regular file, and EncodingError if the
     * content is not valid UTF-8.
     */
    std::string readTextFile(const std::string& relative_path);

    /**
     * @brief Check that a byte sequence is well-formed UTF-8
     */
    static bool isValidUtf8(const std::string& text);

private:
    ProjectLayout m_layout;
    PathSandbox m_sandbox;
    SysInteraction m_sys;
};

} // namespace Jetpilot
