// =================================================================
// include/Jetpilot/StdioServer.hpp
// =================================================================
// Line-delimited JSON-RPC front end exposing the tools over stdio.

#pragma once

#include "Jetpilot/ToolDispatcher.hpp"
#include <iostream>
#include <optional>
#include <string>

namespace Jetpilot {

/**
 * @brief JSON-RPC 2.0 server speaking the tool protocol over a stream pair
 *
 * One request per input line, one response per output line. Supported
 * methods: initialize, notifications/initialized, ping, tools/list and
 * tools/call. Messages without an id are notifications and get no reply.
 */
class StdioServer {
public:
    StdioServer(ToolDispatcher& dispatcher, std::istream& in, std::ostream& out);

    /**
     * @brief Serve until the input stream reaches EOF
     * @return Number of requests answered
     */
    size_t run();

    /**
     * @brief Handle one raw input line
     * @return The response frame, or nothing for notifications and blank lines
     */
    std::optional<Json> handleMessage(const std::string& line);

    static constexpr const char* DEFAULT_PROTOCOL_VERSION = "2024-11-05";
    static constexpr const char* SERVER_NAME = "jetpilot";

    // JSON-RPC error codes
    static constexpr int PARSE_ERROR = -32700;
    static constexpr int INVALID_REQUEST = -32600;
    static constexpr int METHOD_NOT_FOUND = -32601;
    static constexpr int INVALID_PARAMS = -32602;
    static constexpr int INTERNAL_ERROR = -32603;

private:
    ToolDispatcher& m_dispatcher;
    std::istream& m_in;
    std::ostream& m_out;

    Json handleInitialize(const Json& params) const;
    Json handleToolsList() const;
    Json handleToolsCall(const Json& params);

    static Json makeResult(const Json& id, Json result);
    static Json makeError(const Json& id, int code, const std::string& message);
};

} // namespace Jetpilot
