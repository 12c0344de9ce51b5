// =================================================================
// include/Jetpilot/ProjectLayout.hpp
// =================================================================
// Well-known locations inside a Jetlag checkout.

#pragma once

#include <filesystem>
#include <string>

namespace Jetpilot {

/**
 * @brief Directory layout of the Jetlag project being driven
 *
 * Every component receives its layout at construction so it can be
 * pointed at an arbitrary root (tests build throwaway trees).
 */
class ProjectLayout {
public:
    /**
     * @brief Construct a layout rooted at the given directory
     * @param project_root Path to the Jetlag checkout, made absolute and normalized
     */
    explicit ProjectLayout(const std::filesystem::path& project_root);

    const std::filesystem::path& root() const { return m_root; }

    std::filesystem::path ansibleDir() const;
    std::filesystem::path rolesDir() const;
    std::filesystem::path docsDir() const;
    std::filesystem::path inventoryDir() const;
    std::filesystem::path varsDir() const;

    /**
     * @brief The sample vars file the cluster configuration is rendered from
     */
    std::filesystem::path sampleVarsFile() const;

    /**
     * @brief The rendered cluster vars file (ansible/vars/all.yml)
     */
    std::filesystem::path targetVarsFile() const;

    /**
     * @brief ansible-playbook bundled in the project's virtualenv
     */
    std::filesystem::path bundledPlaybookExecutable() const;

    /**
     * @brief Project-specific ansible.cfg
     */
    std::filesystem::path ansibleConfigFile() const;

private:
    std::filesystem::path m_root;
};

} // namespace Jetpilot
