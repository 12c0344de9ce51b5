// =================================================================
// include/Jetpilot/Errors.hpp
// =================================================================
// Error taxonomy shared by every Jetpilot operation.

#pragma once

#include <stdexcept>
#include <string>

namespace Jetpilot {

/**
 * @brief Classification of operation failures
 */
enum class ErrorKind {
    PATH_ESCAPE,    ///< Resolved path is outside the sandbox base
    NOT_FOUND,      ///< Referenced file, playbook, inventory or sample is missing
    VALIDATION,     ///< Malformed structured input or invalid choice
    ENCODING,       ///< File content is not valid UTF-8 text
    TIMEOUT,        ///< Subprocess exceeded its allotted time
    LAUNCH,         ///< Subprocess could not be started
    IO              ///< Filesystem write or other I/O failure
};

/**
 * @brief Get the display name of an error kind (e.g. "PathEscapeError")
 */
std::string errorKindName(ErrorKind kind);

/**
 * @brief Base class for all typed Jetpilot failures
 */
class JetpilotError : public std::runtime_error {
public:
    JetpilotError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

class PathEscapeError : public JetpilotError {
public:
    explicit PathEscapeError(const std::string& message)
        : JetpilotError(ErrorKind::PATH_ESCAPE, message) {}
};

class NotFoundError : public JetpilotError {
public:
    explicit NotFoundError(const std::string& message)
        : JetpilotError(ErrorKind::NOT_FOUND, message) {}
};

class ValidationError : public JetpilotError {
public:
    explicit ValidationError(const std::string& message)
        : JetpilotError(ErrorKind::VALIDATION, message) {}
};

class EncodingError : public JetpilotError {
public:
    explicit EncodingError(const std::string& message)
        : JetpilotError(ErrorKind::ENCODING, message) {}
};

class TimeoutError : public JetpilotError {
public:
    explicit TimeoutError(const std::string& message)
        : JetpilotError(ErrorKind::TIMEOUT, message) {}
};

class LaunchError : public JetpilotError {
public:
    explicit LaunchError(const std::string& message)
        : JetpilotError(ErrorKind::LAUNCH, message) {}
};

class IoError : public JetpilotError {
public:
    explicit IoError(const std::string& message)
        : JetpilotError(ErrorKind::IO, message) {}
};

} // namespace Jetpilot
