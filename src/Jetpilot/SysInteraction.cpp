// =================================================================
// src/Jetpilot/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "Jetpilot/SysInteraction.hpp"
#include "Jetpilot/Errors.hpp"
#include "Jetpilot/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace Jetpilot {

namespace {

constexpr std::chrono::milliseconds TERMINATE_GRACE{2000};
constexpr std::chrono::milliseconds POLL_INTERVAL{100};

// Owns a file descriptor for the lifetime of one execution.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : m_fd(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return m_fd; }
    bool valid() const { return m_fd >= 0; }

    void reset(int fd = -1) {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
        m_fd = fd;
    }

private:
    int m_fd = -1;
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

void openPipe(Pipe& pipe) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw LaunchError(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    pipe.read_end.reset(fds[0]);
    pipe.write_end.reset(fds[1]);
}

// Reads whatever is available; closes the descriptor on EOF.
void drain(FileDescriptor& fd, std::string& sink) {
    char buffer[4096];
    ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
    if (n > 0) {
        sink.append(buffer, static_cast<size_t>(n));
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        fd.reset();
    }
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overlay) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string variable(*entry);
        std::string name = variable.substr(0, variable.find('='));
        if (overlay.count(name) == 0) {
            env.push_back(variable);
        }
    }
    for (const auto& [name, value] : overlay) {
        env.push_back(name + "=" + value);
    }
    return env;
}

std::vector<char*> toCStrings(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

void terminateProcessGroup(pid_t pid) {
    ::killpg(pid, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + TERMINATE_GRACE;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    ::killpg(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

std::vector<std::string> CommandSpec::argv() const {
    std::vector<std::string> result;
    result.reserve(arguments.size() + 1);
    result.push_back(executable);
    result.insert(result.end(), arguments.begin(), arguments.end());
    return result;
}

std::string CommandSpec::commandLine() const {
    std::string line;
    for (const auto& part : argv()) {
        if (!line.empty()) {
            line += ' ';
        }
        line += SysInteraction::shellQuote(part);
    }
    return line;
}

std::string SysInteraction::readFile(const std::filesystem::path& file_path) {
    if (!fileExists(file_path)) {
        throw NotFoundError("File not found: " + file_path.string());
    }
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw IoError("Failed to open file: " + file_path.string());
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    if (file_stream.bad()) {
        throw IoError("Failed to read file: " + file_path.string());
    }
    return buffer.str();
}

void SysInteraction::writeFile(const std::filesystem::path& file_path, const std::string& content) {
    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        throw IoError("Failed to open file for writing: " + file_path.string());
    }
    file_stream << content;
    file_stream.flush();
    if (!file_stream.good()) {
        throw IoError("Failed to write file: " + file_path.string());
    }
}

bool SysInteraction::fileExists(const std::filesystem::path& file_path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(file_path, ec);
}

bool SysInteraction::directoryExists(const std::filesystem::path& dir_path) {
    std::error_code ec;
    return std::filesystem::is_directory(dir_path, ec);
}

void SysInteraction::createDirectories(const std::filesystem::path& dir_path) {
    std::error_code ec;
    std::filesystem::create_directories(dir_path, ec);
    if (ec) {
        throw IoError("Failed to create directory " + dir_path.string() + ": " + ec.message());
    }
}

ExecutionResult SysInteraction::execute(const CommandSpec& spec) {
    return execute(spec, spec.timeout);
}

ExecutionResult SysInteraction::execute(const CommandSpec& spec, std::chrono::milliseconds timeout) {
    ExecutionResult result;
    result.command_line = spec.commandLine();
    result.working_directory = spec.working_directory.string();

    if (spec.executable.empty()) {
        throw LaunchError("No executable given");
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> argv_strings = spec.argv();
    std::vector<char*> argv = toCStrings(argv_strings);
    std::vector<std::string> env_strings = buildEnvironment(spec.environment);
    std::vector<char*> envp = toCStrings(env_strings);
    std::string cwd = spec.working_directory.string();

    Pipe out_pipe, err_pipe, exec_pipe;
    openPipe(out_pipe);
    openPipe(err_pipe);
    openPipe(exec_pipe);

    auto start_time = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        throw LaunchError(std::string("Failed to fork: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: own process group so a timeout can kill the whole tree
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe.write_end.get(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end.get(), STDERR_FILENO);

        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            int error = errno;
            ssize_t ignored = ::write(exec_pipe.write_end.get(), &error, sizeof(error));
            (void)ignored;
            ::_exit(127);
        }

        ::execvpe(argv[0], argv.data(), envp.data());

        // Only reached when exec failed
        int error = errno;
        ssize_t ignored = ::write(exec_pipe.write_end.get(), &error, sizeof(error));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    exec_pipe.write_end.reset();

    // The exec pipe is close-on-exec: EOF means exec succeeded
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe.read_end.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        if (!cwd.empty() && !directoryExists(cwd)) {
            throw LaunchError("Working directory not usable: " + cwd + " (" + std::strerror(child_errno) + ")");
        }
        throw LaunchError("Failed to launch " + spec.executable + ": " + std::strerror(child_errno));
    }

    // Saturate rather than overflow for timeouts beyond the clock's range
    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::time_point::max() - start_time);
    auto deadline = timeout >= headroom
        ? std::chrono::steady_clock::time_point::max()
        : start_time + timeout;
    bool reaped = false;
    int status = 0;

    while (out_pipe.read_end.valid() || err_pipe.read_end.valid() || !reaped) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            terminateProcessGroup(pid);
            LOG_WARNING("SysInteraction", "Command timed out: " + result.command_line);
            throw TimeoutError("Command timed out after " + std::to_string(timeout.count()) +
                               "ms: " + result.command_line);
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int wait_ms = static_cast<int>(std::min(remaining, POLL_INTERVAL).count());

        if (out_pipe.read_end.valid() || err_pipe.read_end.valid()) {
            pollfd fds[2];
            nfds_t count = 0;
            FileDescriptor* owners[2];
            std::string* sinks[2];
            if (out_pipe.read_end.valid()) {
                fds[count] = {out_pipe.read_end.get(), POLLIN, 0};
                owners[count] = &out_pipe.read_end;
                sinks[count] = &result.stdout_text;
                count++;
            }
            if (err_pipe.read_end.valid()) {
                fds[count] = {err_pipe.read_end.get(), POLLIN, 0};
                owners[count] = &err_pipe.read_end;
                sinks[count] = &result.stderr_text;
                count++;
            }

            int ready = ::poll(fds, count, wait_ms);
            if (ready < 0 && errno != EINTR) {
                terminateProcessGroup(pid);
                throw IoError(std::string("poll failed: ") + std::strerror(errno));
            }
            for (nfds_t i = 0; ready > 0 && i < count; i++) {
                if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                    drain(*owners[i], *sinks[i]);
                }
            }
        } else {
            std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(10)));
        }

        if (!reaped) {
            pid_t waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                reaped = true;
            } else if (waited < 0 && errno != EINTR) {
                throw IoError(std::string("waitpid failed: ") + std::strerror(errno));
            }
        }
    }

    result.exit_code = decodeWaitStatus(status);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logCommandExecution(result.command_line, result.exit_code, duration.count());

    return result;
}

std::string SysInteraction::shellQuote(const std::string& argument) {
    if (argument.empty()) {
        return "''";
    }

    bool safe = true;
    for (char c : argument) {
        bool is_safe = std::isalnum(static_cast<unsigned char>(c)) ||
                       (c != '\0' && std::strchr("@%+=:,./-_", c) != nullptr);
        if (!is_safe) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return argument;
    }

    std::string quoted = "'";
    for (char c : argument) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace Jetpilot
