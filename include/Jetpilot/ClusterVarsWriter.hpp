// =================================================================
// include/Jetpilot/ClusterVarsWriter.hpp
// =================================================================
// Generates ansible/vars/all.yml from the sample vars file.

#pragma once

#include "Jetpilot/ConfigTemplateEngine.hpp"
#include "Jetpilot/PathSandbox.hpp"
#include "Jetpilot/ProjectLayout.hpp"
#include "Jetpilot/SysInteraction.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Jetpilot {

/**
 * @brief Parameters of a cluster vars file
 *
 * Empty optional strings mean "not given".
 */
struct ClusterVarsRequest {
    // Required
    std::string lab;
    std::string lab_cloud;
    std::string cluster_type;        ///< sno, mno or vmno
    std::string ocp_build;
    std::string ocp_version;

    bool public_vlan = false;
    bool sno_use_lab_dhcp = false;
    std::string ssh_private_key_file;          ///< Defaults to ~/.ssh/id_rsa
    std::string ssh_public_key_file;           ///< Defaults to ~/.ssh/id_rsa.pub
    std::string sno_install_disk;              ///< Used for sno only
    std::string control_plane_install_disk;    ///< Used for mno/vmno only
    std::string worker_install_disk;           ///< Used for mno/vmno only
    std::string pull_secret_lookup = "../pull_secret.txt";
    std::string extra_vars_json;               ///< Flat JSON object appended as overrides
    std::optional<long long> worker_node_count;
};

struct ClusterVarsResult {
    std::string written_path;    ///< Target file (written unless dry run)
    bool written = false;
    RenderReport report;
    std::string rendered_text;
    std::string previous_text;   ///< Prior target content, or the sample if no target existed
};

/**
 * @brief Renders and writes the cluster vars file
 *
 * The sample is read fresh on every call, base keys are rewritten in
 * place, overrides go below the "# Append override vars below" anchor,
 * and the result replaces all.yml in a single write.
 */
class ClusterVarsWriter {
public:
    explicit ClusterVarsWriter(const ProjectLayout& layout);

    /**
     * @brief Build the ordered base replacement rules for a request
     *
     * Throws ValidationError for an unknown cluster type.
     */
    std::vector<KeyReplacementRule> buildRules(const ClusterVarsRequest& request) const;

    /**
     * @brief Render and (unless dry_run) write the vars file
     *
     * Every validation happens before the write: nothing is written when
     * an error is thrown.
     */
    ClusterVarsResult write(const ClusterVarsRequest& request, bool dry_run = false);

    /**
     * @brief Accepted cluster types, sorted
     */
    static const std::set<std::string>& allowedClusterTypes();

    /**
     * @brief Formatting policy for the vars file (ocp_build and ocp_version always quoted)
     */
    static ValueFormatter makeFormatter();

private:
    ProjectLayout m_layout;
    PathSandbox m_sandbox;
    SysInteraction m_sys;
    ConfigTemplateEngine m_engine;
};

} // namespace Jetpilot
