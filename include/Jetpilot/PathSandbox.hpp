// =================================================================
// include/Jetpilot/PathSandbox.hpp
// =================================================================
// Confines path lookups to a base directory tree.

#pragma once

#include <filesystem>

namespace Jetpilot {

/**
 * @brief Resolves candidate paths and rejects those escaping the base
 *
 * Both the base and the candidate are canonicalized (symlinks in the
 * existing part of the path are followed, ".." and "." are folded) before
 * comparison. A candidate is accepted iff it is the base itself or lies
 * below it, compared component by component.
 */
class PathSandbox {
public:
    /**
     * @brief Construct a sandbox rooted at base
     * @param base Permitted base directory
     */
    explicit PathSandbox(const std::filesystem::path& base);

    /**
     * @brief Resolve a candidate against this sandbox
     * @param candidate Absolute path, or path relative to the base
     * @return Canonical absolute path inside the base
     *
     * Throws PathEscapeError if the canonical path is outside the base.
     */
    std::filesystem::path resolve(const std::filesystem::path& candidate) const;

    /**
     * @brief Check containment without throwing
     */
    bool contains(const std::filesystem::path& candidate) const;

    const std::filesystem::path& base() const { return m_base; }

    /**
     * @brief One-shot form of resolve()
     */
    static std::filesystem::path resolve(const std::filesystem::path& base,
                                         const std::filesystem::path& candidate);

private:
    std::filesystem::path m_base;

    std::filesystem::path canonicalize(const std::filesystem::path& candidate) const;
    bool isWithinBase(const std::filesystem::path& canonical) const;
};

} // namespace Jetpilot
