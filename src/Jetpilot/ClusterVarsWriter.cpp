// =================================================================
// src/Jetpilot/ClusterVarsWriter.cpp
// =================================================================
// Implementation for cluster vars file generation.

#include "Jetpilot/ClusterVarsWriter.hpp"
#include "Jetpilot/Errors.hpp"
#include "Jetpilot/Logger.hpp"

namespace Jetpilot {

static const char* DEFAULT_SSH_PRIVATE_KEY = "~/.ssh/id_rsa";
static const char* DEFAULT_SSH_PUBLIC_KEY = "~/.ssh/id_rsa.pub";
static const char* DEFAULT_PULL_SECRET_LOOKUP = "../pull_secret.txt";

ClusterVarsWriter::ClusterVarsWriter(const ProjectLayout& layout)
    : m_layout(layout),
      m_sandbox(layout.root()),
      m_engine(makeFormatter())
{
}

const std::set<std::string>& ClusterVarsWriter::allowedClusterTypes() {
    static const std::set<std::string> types = {"mno", "sno", "vmno"};
    return types;
}

ValueFormatter ClusterVarsWriter::makeFormatter() {
    return ValueFormatter({"ocp_build", "ocp_version"});
}

std::vector<KeyReplacementRule> ClusterVarsWriter::buildRules(const ClusterVarsRequest& request) const {
    if (allowedClusterTypes().count(request.cluster_type) == 0) {
        std::string choices;
        for (const auto& type : allowedClusterTypes()) {
            choices += choices.empty() ? type : ", " + type;
        }
        throw ValidationError("cluster_type must be one of [" + choices + "], got '" +
                              request.cluster_type + "'");
    }

    std::string lookup = request.pull_secret_lookup.empty()
        ? std::string(DEFAULT_PULL_SECRET_LOOKUP) : request.pull_secret_lookup;

    std::vector<KeyReplacementRule> rules = {
        {"lab", request.lab},
        {"lab_cloud", request.lab_cloud},
        {"cluster_type", request.cluster_type},
        {"public_vlan", request.public_vlan},
        {"sno_use_lab_dhcp", request.sno_use_lab_dhcp},
        {"ocp_build", request.ocp_build},
        {"ocp_version", request.ocp_version},
        {"ssh_private_key_file", request.ssh_private_key_file.empty()
            ? std::string(DEFAULT_SSH_PRIVATE_KEY) : request.ssh_private_key_file},
        {"ssh_public_key_file", request.ssh_public_key_file.empty()
            ? std::string(DEFAULT_SSH_PUBLIC_KEY) : request.ssh_public_key_file},
        {"pull_secret", "{{ lookup('file', '" + lookup + "') }}"},
    };

    if (request.worker_node_count) {
        rules.push_back({"worker_node_count", *request.worker_node_count});
    }

    if (request.cluster_type == "sno") {
        if (!request.sno_install_disk.empty()) {
            rules.push_back({"sno_install_disk", request.sno_install_disk});
        }
    } else {
        if (!request.control_plane_install_disk.empty()) {
            rules.push_back({"control_plane_install_disk", request.control_plane_install_disk});
        }
        if (!request.worker_install_disk.empty()) {
            rules.push_back({"worker_install_disk", request.worker_install_disk});
        }
    }

    return rules;
}

ClusterVarsResult ClusterVarsWriter::write(const ClusterVarsRequest& request, bool dry_run) {
    auto rules = buildRules(request);
    auto overrides = ConfigTemplateEngine::parseOverrides(request.extra_vars_json);

    auto vars_dir = m_sandbox.resolve(m_layout.varsDir());
    auto sample_file = vars_dir / m_layout.sampleVarsFile().filename();
    auto target_file = vars_dir / m_layout.targetVarsFile().filename();

    if (!m_sys.fileExists(sample_file)) {
        throw NotFoundError("Sample vars file not found: " + sample_file.string());
    }

    std::string sample_text = m_sys.readFile(sample_file);
    RenderResult rendered = m_engine.render(sample_text, rules, overrides);

    ClusterVarsResult result;
    result.written_path = target_file.string();
    result.report = rendered.report;
    result.rendered_text = rendered.text;
    result.previous_text = m_sys.fileExists(target_file) ? m_sys.readFile(target_file) : sample_text;

    if (dry_run) {
        LOG_INFO("ClusterVarsWriter", "Dry run, not writing " + target_file.string());
        return result;
    }

    m_sys.createDirectories(vars_dir);
    m_sys.writeFile(target_file, rendered.text);
    result.written = true;

    Logger::getInstance().logRender(target_file.string(), rendered.report.replacedCount(),
                                    rendered.report.appendedCount(), rendered.report.skipped_keys);
    return result;
}

} // namespace Jetpilot
