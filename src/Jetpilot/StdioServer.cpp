// =================================================================
// src/Jetpilot/StdioServer.cpp
// =================================================================
// Implementation for the stdio JSON-RPC server.

#include "Jetpilot/StdioServer.hpp"
#include "Jetpilot/Logger.hpp"

#ifndef JETPILOT_VERSION
#define JETPILOT_VERSION "0.0.0"
#endif

namespace Jetpilot {

namespace {

// Thrown inside the dispatch path to produce an INVALID_PARAMS reply.
class InvalidParams : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace

StdioServer::StdioServer(ToolDispatcher& dispatcher, std::istream& in, std::ostream& out)
    : m_dispatcher(dispatcher), m_in(in), m_out(out)
{
}

size_t StdioServer::run() {
    LOG_INFO("StdioServer", "Serving tools on stdio");

    size_t answered = 0;
    std::string line;
    while (std::getline(m_in, line)) {
        std::optional<Json> response = handleMessage(line);
        if (!response) {
            continue;
        }
        m_out << dumpJson(*response) << '\n';
        m_out.flush();
        answered++;
    }

    LOG_INFO("StdioServer", "Input closed after " + std::to_string(answered) + " responses");
    return answered;
}

std::optional<Json> StdioServer::handleMessage(const std::string& raw_line) {
    std::string line = raw_line;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) {
        return std::nullopt;
    }

    Json request;
    try {
        request = Json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARNING("StdioServer", std::string("Unparseable message: ") + e.what());
        return makeError(nullptr, PARSE_ERROR, std::string("Parse error: ") + e.what());
    }

    if (!request.is_object() || !request.contains("method") || !request["method"].is_string()) {
        Json id = request.is_object() && request.contains("id") ? request["id"] : Json(nullptr);
        return makeError(id, INVALID_REQUEST, "Invalid request");
    }

    const std::string method = request["method"].get<std::string>();
    const bool is_notification = !request.contains("id");
    const Json id = is_notification ? Json(nullptr) : request["id"];
    const Json params = request.contains("params") && !request["params"].is_null()
        ? request["params"] : Json::object();

    LOG_DEBUG("StdioServer", "Request: " + method);

    if (is_notification) {
        // notifications/initialized and friends need no reply
        return std::nullopt;
    }

    try {
        if (!params.is_object()) {
            throw InvalidParams("params must be an object");
        }
        if (method == "initialize") {
            return makeResult(id, handleInitialize(params));
        }
        if (method == "ping") {
            return makeResult(id, Json::object());
        }
        if (method == "tools/list") {
            return makeResult(id, handleToolsList());
        }
        if (method == "tools/call") {
            return makeResult(id, handleToolsCall(params));
        }
        return makeError(id, METHOD_NOT_FOUND, "Method not found: " + method);
    } catch (const InvalidParams& e) {
        return makeError(id, INVALID_PARAMS, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("StdioServer", "Internal error in " + method + ": " + e.what());
        return makeError(id, INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }
}

Json StdioServer::handleInitialize(const Json& params) const {
    std::string protocol_version = DEFAULT_PROTOCOL_VERSION;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        protocol_version = params["protocolVersion"].get<std::string>();
    }

    return {
        {"protocolVersion", protocol_version},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", SERVER_NAME}, {"version", JETPILOT_VERSION}}},
    };
}

Json StdioServer::handleToolsList() const {
    Json tools = Json::array();
    for (const auto& tool : ToolDispatcher::describeTools()) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.inputSchema()},
        });
    }
    return {{"tools", tools}};
}

Json StdioServer::handleToolsCall(const Json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw InvalidParams("tools/call requires a string 'name'");
    }
    Json arguments = params.contains("arguments") ? params["arguments"] : Json::object();
    if (!arguments.is_null() && !arguments.is_object()) {
        throw InvalidParams("tools/call 'arguments' must be an object");
    }

    OperationResult result = m_dispatcher.call(params["name"].get<std::string>(), arguments);

    std::string text;
    if (!result.ok) {
        text = result.errorText();
    } else if (result.value.is_string()) {
        text = result.value.get<std::string>();
    } else {
        text = dumpJson(result.value, 2);
    }

    Json content = Json::array();
    content.push_back({{"type", "text"}, {"text", text}});
    return {{"content", content}, {"isError", !result.ok}};
}

Json StdioServer::makeResult(const Json& id, Json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

Json StdioServer::makeError(const Json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

} // namespace Jetpilot
