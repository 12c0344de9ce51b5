// =================================================================
// src/Jetpilot/Errors.cpp
// =================================================================

#include "Jetpilot/Errors.hpp"

namespace Jetpilot {

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PATH_ESCAPE: return "PathEscapeError";
        case ErrorKind::NOT_FOUND: return "NotFoundError";
        case ErrorKind::VALIDATION: return "ValidationError";
        case ErrorKind::ENCODING: return "EncodingError";
        case ErrorKind::TIMEOUT: return "TimeoutError";
        case ErrorKind::LAUNCH: return "LaunchError";
        case ErrorKind::IO: return "IoError";
        default: return "UnknownError";
    }
}

} // namespace Jetpilot
