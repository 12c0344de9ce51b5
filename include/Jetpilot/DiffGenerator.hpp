#ifndef JETPILOT_DIFFGENERATOR_HPP
#define JETPILOT_DIFFGENERATOR_HPP

#include <ostream>
#include <string>
#include <vector>

namespace Jetpilot {

enum class DiffLineType {
    UNCHANGED,
    ADDED,
    REMOVED
};

struct DiffLine {
    std::string text;
    DiffLineType type;
    size_t original_line_num;   ///< 1-based, 0 for added lines
    size_t new_line_num;        ///< 1-based, 0 for removed lines
};

struct DiffStats {
    size_t added = 0;
    size_t removed = 0;
};

/**
 * @brief Line diff between the current vars file and a freshly rendered one
 */
class DiffGenerator {
public:
    DiffGenerator(const std::string& original, const std::string& modified);
    
    std::vector<DiffLine> getDiff() const;

    bool hasChanges() const;

    DiffStats stats() const;
    
    /**
     * @brief Print added and removed lines with a few lines of context
     */
    void printColoredDiff(std::ostream& out, size_t context_lines = 2) const;
    
private:
    std::vector<std::string> splitIntoLines(const std::string& text) const;
    
    std::string m_original;
    std::string m_modified;
};

} // namespace Jetpilot

#endif // JETPILOT_DIFFGENERATOR_HPP
