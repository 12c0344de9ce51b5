// =================================================================
// include/Jetpilot/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations like file I/O
// and running external processes.

#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace Jetpilot {

/**
 * @brief Everything needed to launch one external process
 */
struct CommandSpec {
    std::string executable;                          ///< Path, or a name looked up in PATH
    std::vector<std::string> arguments;              ///< Arguments after the executable
    std::filesystem::path working_directory;         ///< Empty to inherit the caller's
    std::map<std::string, std::string> environment;  ///< Variables set on top of the inherited environment
    std::chrono::milliseconds timeout{std::chrono::hours(2)};

    /**
     * @brief Executable followed by the arguments
     */
    std::vector<std::string> argv() const;

    /**
     * @brief Shell-quoted command line, for diagnostics only
     */
    std::string commandLine() const;
};

/**
 * @brief Outcome of a process that ran to completion
 */
struct ExecutionResult {
    int exit_code = 0;              ///< Exit status, or -signal if the process was killed
    std::string stdout_text;
    std::string stderr_text;
    std::string command_line;       ///< Effective command line
    std::string working_directory;  ///< Directory the process ran in, empty if inherited
};

class SysInteraction {
public:
    // Longest timeout a command may be given (one week)
    static constexpr std::chrono::seconds MAX_TIMEOUT{7 * 24 * 3600};

    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The raw bytes of the file.
     *
     * Throws NotFoundError if the file does not exist and IoError if it
     * cannot be read.
     */
    std::string readFile(const std::filesystem::path& file_path);

    /**
     * @brief Writes content to a file, overwriting it. Throws IoError on failure.
     */
    void writeFile(const std::filesystem::path& file_path, const std::string& content);

    bool fileExists(const std::filesystem::path& file_path);
    bool directoryExists(const std::filesystem::path& dir_path);

    /**
     * @brief Creates a directory and its parents. Throws IoError on failure.
     */
    void createDirectories(const std::filesystem::path& dir_path);

    /**
     * @brief Runs a process to completion and captures its output.
     * @param spec Command to run; spec.timeout bounds the run
     * @return Exit code, stdout and stderr of the process
     *
     * No shell is involved. A non-zero exit code is returned, not thrown.
     * Throws LaunchError if the process cannot be started and TimeoutError
     * if it outlives the timeout (its process group is killed first).
     */
    ExecutionResult execute(const CommandSpec& spec);

    /**
     * @brief Same as execute(spec) with an explicit timeout
     */
    ExecutionResult execute(const CommandSpec& spec, std::chrono::milliseconds timeout);

    /**
     * @brief Quote an argument for display in a POSIX shell
     */
    static std::string shellQuote(const std::string& argument);
};

} // namespace Jetpilot
