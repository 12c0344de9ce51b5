// =================================================================
// src/Jetpilot/ProjectCatalog.cpp
// =================================================================
// Implementation for project file discovery and reading.

#include "Jetpilot/ProjectCatalog.hpp"
#include "Jetpilot/Errors.hpp"
#include "Jetpilot/Logger.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace Jetpilot {

ProjectCatalog::ProjectCatalog(const ProjectLayout& layout)
    : m_layout(layout),
      m_sandbox(layout.root())
{
}

std::vector<PlaybookInfo> ProjectCatalog::listPlaybooks() {
    std::vector<PlaybookInfo> playbooks;
    if (!m_sys.directoryExists(m_layout.ansibleDir())) {
        LOG_DEBUG("ProjectCatalog", "No ansible directory: " + m_layout.ansibleDir().string());
        return playbooks;
    }

    try {
        for (const auto& entry : fs::directory_iterator(m_layout.ansibleDir())) {
            if (!entry.is_regular_file()) {
                continue;
            }
            std::string extension = entry.path().extension().string();
            if (extension != ".yml" && extension != ".yaml") {
                continue;
            }
            playbooks.push_back({entry.path().filename().string(), entry.path().string()});
        }
    } catch (const fs::filesystem_error& e) {
        throw IoError(std::string("Failed to list playbooks: ") + e.what());
    }

    std::sort(playbooks.begin(), playbooks.end(),
              [](const PlaybookInfo& a, const PlaybookInfo& b) { return a.name < b.name; });
    return playbooks;
}

std::vector<std::string> ProjectCatalog::listRoles() {
    std::vector<std::string> roles;
    if (!m_sys.directoryExists(m_layout.rolesDir())) {
        return roles;
    }

    try {
        for (const auto& entry : fs::directory_iterator(m_layout.rolesDir())) {
            if (entry.is_directory()) {
                roles.push_back(entry.path().filename().string());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw IoError(std::string("Failed to list roles: ") + e.what());
    }

    std::sort(roles.begin(), roles.end());
    return roles;
}

std::vector<std::string> ProjectCatalog::listDocs() {
    std::vector<fs::path> docs;
    if (!m_sys.directoryExists(m_layout.docsDir())) {
        return {};
    }

    try {
        for (const auto& entry : fs::recursive_directory_iterator(m_layout.docsDir())) {
            if (!entry.is_regular_file() || entry.path().extension() != ".md") {
                continue;
            }

            // Skip image directories
            fs::path relative = entry.path().lexically_relative(m_layout.docsDir());
            bool in_img = false;
            for (const auto& part : relative.parent_path()) {
                if (part == "img") {
                    in_img = true;
                    break;
                }
            }
            if (!in_img) {
                docs.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw IoError(std::string("Failed to list docs: ") + e.what());
    }

    std::sort(docs.begin(), docs.end());

    std::vector<std::string> paths;
    paths.reserve(docs.size());
    for (const auto& doc : docs) {
        paths.push_back(doc.string());
    }
    return paths;
}

std::string ProjectCatalog::readTextFile(const std::string& relative_path) {
    fs::path safe_path = m_sandbox.resolve(relative_path);
    if (!m_sys.fileExists(safe_path)) {
        throw NotFoundError("File not found: " + safe_path.string());
    }

    std::string content = m_sys.readFile(safe_path);
    if (!isValidUtf8(content)) {
        throw EncodingError("File is not UTF-8 text; refusing to read as text: " + safe_path.string());
    }

    LOG_DEBUG("ProjectCatalog", "Read " + std::to_string(content.size()) + " bytes from " + safe_path.string());
    return content;
}

bool ProjectCatalog::isValidUtf8(const std::string& text) {
    size_t i = 0;
    const size_t size = text.size();

    while (i < size) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t continuation = 0;
        unsigned int code_point = 0;

        if (lead < 0x80) {
            i++;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            continuation = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            continuation = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            continuation = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + continuation >= size) {
            return false;
        }
        for (size_t k = 1; k <= continuation; k++) {
            unsigned char byte = static_cast<unsigned char>(text[i + k]);
            if ((byte & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (byte & 0x3F);
        }

        // Overlong encodings, surrogates and out-of-range code points
        static const unsigned int minimum[] = {0, 0x80, 0x800, 0x10000};
        if (code_point < minimum[continuation] || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }

        i += continuation + 1;
    }
    return true;
}

} // namespace Jetpilot
