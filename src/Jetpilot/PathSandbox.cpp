// =================================================================
// src/Jetpilot/PathSandbox.cpp
// =================================================================
// Implementation for sandboxed path resolution.

#include "Jetpilot/PathSandbox.hpp"
#include "Jetpilot/Errors.hpp"
#include <algorithm>

namespace fs = std::filesystem;

namespace Jetpilot {

// weakly_canonical keeps a trailing separator ("/proj/" -> "/proj/"), which
// shows up as an empty last element and would break component comparison.
static fs::path stripTrailingSeparator(fs::path path) {
    while (path.has_relative_path() && path.filename().empty()) {
        path = path.parent_path();
    }
    return path;
}

static fs::path weaklyCanonical(const fs::path& path) {
    std::error_code ec;
    fs::path result = fs::weakly_canonical(path, ec);
    if (ec) {
        throw IoError("Cannot resolve path " + path.string() + ": " + ec.message());
    }
    return stripTrailingSeparator(result.lexically_normal());
}

PathSandbox::PathSandbox(const fs::path& base)
    : m_base(weaklyCanonical(fs::absolute(base)))
{
}

fs::path PathSandbox::resolve(const fs::path& candidate) const {
    fs::path canonical = canonicalize(candidate);
    if (!isWithinBase(canonical)) {
        throw PathEscapeError("Path escapes allowed base: " + canonical.string() +
                              " not within " + m_base.string());
    }
    return canonical;
}

bool PathSandbox::contains(const fs::path& candidate) const {
    try {
        return isWithinBase(canonicalize(candidate));
    } catch (const JetpilotError&) {
        return false;
    }
}

fs::path PathSandbox::resolve(const fs::path& base, const fs::path& candidate) {
    return PathSandbox(base).resolve(candidate);
}

fs::path PathSandbox::canonicalize(const fs::path& candidate) const {
    fs::path joined = candidate.is_absolute() ? candidate : m_base / candidate;
    return weaklyCanonical(joined);
}

bool PathSandbox::isWithinBase(const fs::path& canonical) const {
    auto base_begin = m_base.begin();
    auto base_end = m_base.end();
    auto result = std::mismatch(base_begin, base_end, canonical.begin(), canonical.end());
    return result.first == base_end;
}

} // namespace Jetpilot
