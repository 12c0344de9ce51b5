// =================================================================
// include/Jetpilot/ToolDispatcher.hpp
// =================================================================
// Maps operation names and JSON arguments onto the components.

#pragma once

#include "Jetpilot/ClusterVarsWriter.hpp"
#include "Jetpilot/Errors.hpp"
#include "Jetpilot/PlaybookCommandBuilder.hpp"
#include "Jetpilot/ProjectCatalog.hpp"
#include "Jetpilot/ProjectLayout.hpp"
#include "Jetpilot/SysInteraction.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace Jetpilot {

using Json = nlohmann::ordered_json;

/**
 * @brief Serialize a value for output
 *
 * Invalid UTF-8 in strings (subprocess output, file names) is replaced
 * with U+FFFD instead of throwing.
 */
std::string dumpJson(const Json& value, int indent = -1);

/**
 * @brief Explicit outcome of one operation: a value or a typed error
 */
struct OperationResult {
    bool ok = false;
    Json value;
    ErrorKind error_kind = ErrorKind::VALIDATION;
    std::string error_message;

    static OperationResult success(Json value);
    static OperationResult failure(ErrorKind kind, const std::string& message);

    /**
     * @brief "<ErrorKind>: <message>" for failed results
     */
    std::string errorText() const;
};

/**
 * @brief Declared parameter of a tool
 */
struct ToolParameter {
    std::string name;
    std::string type;          ///< JSON schema type: string, boolean or integer
    bool required = false;
    std::string description;
};

struct ToolDescription {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;

    /**
     * @brief JSON schema of the tool's arguments object
     */
    Json inputSchema() const;
};

/**
 * @brief Dispatches named operations to the project components
 *
 * Arguments are checked against each tool's declared parameters (unknown
 * names, missing required values and wrong JSON types are rejected with
 * ValidationError). Exceptions never escape call(): every failure comes
 * back as an OperationResult carrying its ErrorKind.
 */
class ToolDispatcher {
public:
    /**
     * @brief Construct a dispatcher
     * @param layout Project the tools operate on
     * @param default_timeout Timeout for run_playbook when none is given
     */
    ToolDispatcher(const ProjectLayout& layout, std::chrono::seconds default_timeout);

    /**
     * @brief Run a tool
     * @param tool Tool name, e.g. "list_playbooks"
     * @param arguments JSON object of arguments (null is treated as empty)
     */
    OperationResult call(const std::string& tool, const Json& arguments);

    /**
     * @brief Every tool with its description and parameters
     */
    static const std::vector<ToolDescription>& describeTools();

    // JSON shapes shared with the command-line front end
    static Json toJson(const std::vector<PlaybookInfo>& playbooks);
    static Json toJson(const ExecutionResult& result);
    static Json toJson(const ClusterVarsResult& result);

    /**
     * @brief Build a ClusterVarsRequest from validated tool arguments
     */
    static ClusterVarsRequest clusterVarsRequestFromJson(const Json& arguments);

private:
    using Handler = std::function<Json(const Json&)>;

    ProjectLayout m_layout;
    std::chrono::seconds m_default_timeout;
    ProjectCatalog m_catalog;
    PlaybookCommandBuilder m_builder;
    ClusterVarsWriter m_vars_writer;
    SysInteraction m_sys;
    std::map<std::string, Handler> m_handlers;

    void registerHandlers();
    static const ToolDescription* findTool(const std::string& name);
    static void validateArguments(const ToolDescription& tool, const Json& arguments);

    Json handleRunPlaybook(const Json& arguments);
};

} // namespace Jetpilot
