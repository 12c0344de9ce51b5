// =================================================================
// src/Jetpilot/ProjectLayout.cpp
// =================================================================

#include "Jetpilot/ProjectLayout.hpp"

namespace Jetpilot {

ProjectLayout::ProjectLayout(const std::filesystem::path& project_root)
    : m_root(std::filesystem::weakly_canonical(std::filesystem::absolute(project_root)))
{
}

std::filesystem::path ProjectLayout::ansibleDir() const {
    return m_root / "ansible";
}

std::filesystem::path ProjectLayout::rolesDir() const {
    return ansibleDir() / "roles";
}

std::filesystem::path ProjectLayout::docsDir() const {
    return m_root / "docs";
}

std::filesystem::path ProjectLayout::inventoryDir() const {
    return ansibleDir() / "inventory";
}

std::filesystem::path ProjectLayout::varsDir() const {
    return ansibleDir() / "vars";
}

std::filesystem::path ProjectLayout::sampleVarsFile() const {
    return varsDir() / "all.sample.yml";
}

std::filesystem::path ProjectLayout::targetVarsFile() const {
    return varsDir() / "all.yml";
}

std::filesystem::path ProjectLayout::bundledPlaybookExecutable() const {
    return m_root / ".ansible" / "bin" / "ansible-playbook";
}

std::filesystem::path ProjectLayout::ansibleConfigFile() const {
    return m_root / "ansible.cfg";
}

} // namespace Jetpilot
