// =================================================================
// src/Jetpilot/DiffGenerator.cpp
// =================================================================
// Line diff preview for rendered vars files, built on dtl.

#include "Jetpilot/DiffGenerator.hpp"
#include "dtl/dtl.hpp"
#include <algorithm>
#include <sstream>

namespace Jetpilot {

DiffGenerator::DiffGenerator(const std::string& original, const std::string& modified)
: m_original(original), m_modified(modified) {
}

std::vector<std::string> DiffGenerator::splitIntoLines(const std::string& text) const {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }
    
    return lines;
}

std::vector<DiffLine> DiffGenerator::getDiff() const {
    using elem = std::string;
    using sequence = std::vector<elem>;

    sequence original_lines = splitIntoLines(m_original);
    sequence modified_lines = splitIntoLines(m_modified);

    dtl::Diff<elem, sequence> differ(original_lines, modified_lines);
    differ.compose();

    std::vector<DiffLine> diff;
    for (const auto& ses_item : differ.getSes().getSequence()) {
        const auto& info = ses_item.second;
        switch (info.type) {
            case dtl::SES_ADD:
                diff.push_back({ses_item.first, DiffLineType::ADDED, 0,
                                static_cast<size_t>(info.afterIdx)});
                break;
            case dtl::SES_DELETE:
                diff.push_back({ses_item.first, DiffLineType::REMOVED,
                                static_cast<size_t>(info.beforeIdx), 0});
                break;
            default:
                diff.push_back({ses_item.first, DiffLineType::UNCHANGED,
                                static_cast<size_t>(info.beforeIdx),
                                static_cast<size_t>(info.afterIdx)});
                break;
        }
    }
    
    return diff;
}

bool DiffGenerator::hasChanges() const {
    DiffStats counts = stats();
    return counts.added > 0 || counts.removed > 0;
}

DiffStats DiffGenerator::stats() const {
    DiffStats counts;
    for (const auto& line : getDiff()) {
        if (line.type == DiffLineType::ADDED) {
            counts.added++;
        } else if (line.type == DiffLineType::REMOVED) {
            counts.removed++;
        }
    }
    return counts;
}

void DiffGenerator::printColoredDiff(std::ostream& out, size_t context_lines) const {
    const std::string RESET = "\033[0m";
    const std::string RED = "\033[31m";
    const std::string GREEN = "\033[32m";
    const std::string GRAY = "\033[90m";
    
    auto diff_lines = getDiff();

    // Mark unchanged lines close enough to a change to be shown
    std::vector<bool> visible(diff_lines.size(), false);
    for (size_t i = 0; i < diff_lines.size(); i++) {
        if (diff_lines[i].type == DiffLineType::UNCHANGED) {
            continue;
        }
        size_t first = i >= context_lines ? i - context_lines : 0;
        size_t last = std::min(diff_lines.size() - 1, i + context_lines);
        for (size_t k = first; k <= last; k++) {
            visible[k] = true;
        }
    }
    
    out << GRAY << "=== Diff View ===" << RESET << "\n";
    
    bool skipped = false;
    for (size_t i = 0; i < diff_lines.size(); i++) {
        if (!visible[i]) {
            skipped = true;
            continue;
        }
        if (skipped) {
            out << GRAY << "  ..." << RESET << "\n";
            skipped = false;
        }

        const auto& line = diff_lines[i];
        switch (line.type) {
            case DiffLineType::ADDED:
                out << GREEN << "+ " << line.text << RESET << "\n";
                break;
            case DiffLineType::REMOVED:
                out << RED << "- " << line.text << RESET << "\n";
                break;
            case DiffLineType::UNCHANGED:
                out << "  " << line.text << "\n";
                break;
        }
    }
    
    out << GRAY << "================" << RESET << "\n";
}

} // namespace Jetpilot
