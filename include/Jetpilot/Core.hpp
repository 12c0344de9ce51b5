// =================================================================
// include/Jetpilot/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Jetpilot/CliParser.hpp"
#include "Jetpilot/ServerConfig.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Jetpilot {
    class ProjectLayout;
    class ToolDispatcher;
    struct OperationResult;
}

namespace Jetpilot {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    void loadConfiguration();
    int dispatch();

    // Command Handlers
    int handleListPlaybooks();
    int handleListRoles();
    int handleListDocs();
    int handleRead();
    int handleRun();
    int handleCreateVars();
    int handleServe();
    int handleTools();

    int printResult(const OperationResult& result);

    const Commands& m_commands;
    ServerConfig m_config;
    std::unique_ptr<ProjectLayout> m_layout;
    std::unique_ptr<ToolDispatcher> m_dispatcher;
};

} // namespace Jetpilot
