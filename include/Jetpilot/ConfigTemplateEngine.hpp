// =================================================================
// include/Jetpilot/ConfigTemplateEngine.hpp
// =================================================================
// Comment- and format-preserving key replacement for YAML vars files.

#pragma once

#include "nlohmann/json.hpp"
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace Jetpilot {

/**
 * @brief A scalar value written into a template (null, bool, number or string)
 */
using TemplateValue = nlohmann::ordered_json;

/**
 * @brief Fixed value-formatting policy for `key: value` lines
 *
 * - booleans render as lowercase true/false
 * - null renders as nothing after the colon
 * - keys on the always-quote list are wrapped in double quotes
 * - strings containing both "{{" and "}}" are wrapped in double quotes
 * - everything else renders in its plain textual form
 */
class ValueFormatter {
public:
    explicit ValueFormatter(std::unordered_set<std::string> always_quote_keys = {});

    /**
     * @brief Format a value for the given key
     * @param key Key the value is assigned to
     * @param value Value to format
     * @return Text placed after "key: "
     */
    std::string format(const std::string& key, const TemplateValue& value) const;

    /**
     * @brief Check whether a string holds a Jinja templating expression
     */
    static bool isTemplateExpression(const std::string& text);

private:
    std::unordered_set<std::string> m_always_quote_keys;
};

/**
 * @brief Replace the first `key:` line of a document with a new value
 */
struct KeyReplacementRule {
    std::string key;
    TemplateValue value;
};

enum class KeyAction {
    REPLACED,   ///< Existing line rewritten in place
    APPENDED    ///< Override line inserted at the anchor
};

struct ReportEntry {
    std::string key;
    KeyAction action;

    /**
     * @brief Human-readable form, e.g. "lab (replaced)"
     */
    std::string describe() const;
};

/**
 * @brief Per-key outcome of a render
 */
struct RenderReport {
    std::vector<ReportEntry> entries;         ///< Replaced keys in rule order, then appended keys
    std::vector<std::string> skipped_keys;    ///< Rule keys absent from the document

    size_t replacedCount() const;
    size_t appendedCount() const;
    std::vector<std::string> describe() const;
};

struct RenderResult {
    std::string text;
    RenderReport report;
};

/**
 * @brief Renders a configuration document from a sample text
 *
 * Works line by line: a rule rewrites only the first line declaring its
 * key, overrides are inserted as new lines after the anchor comment (or at
 * the end of the document), and every other line is kept byte for byte,
 * line terminators included. The document's structure is never parsed.
 */
class ConfigTemplateEngine {
public:
    static constexpr const char* DEFAULT_ANCHOR_PATTERN = R"(^# Append override vars below\s*$)";

    /**
     * @brief Construct an engine
     * @param formatter Value formatting policy shared by rules and overrides
     * @param anchor_pattern Regex matched against each line (without terminator)
     */
    explicit ConfigTemplateEngine(ValueFormatter formatter,
                                  const std::string& anchor_pattern = DEFAULT_ANCHOR_PATTERN);

    /**
     * @brief Render a document
     * @param sample_text Sample document text
     * @param rules Replacement rules, applied in order
     * @param overrides Flat JSON object inserted at the anchor, in key order
     * @return Rendered text and per-key report
     *
     * Throws ValidationError if overrides is not a flat object.
     */
    RenderResult render(const std::string& sample_text,
                        const std::vector<KeyReplacementRule>& rules,
                        const TemplateValue& overrides = TemplateValue::object()) const;

    /**
     * @brief Parse an override set from JSON text
     * @param json_text JSON object text; empty text yields an empty set
     * @return Parsed override set, key order preserved
     *
     * Throws ValidationError for malformed JSON or a non-flat object.
     */
    static TemplateValue parseOverrides(const std::string& json_text);

    /**
     * @brief Ensure an override set is an object of scalar values
     */
    static void validateOverrides(const TemplateValue& overrides);

private:
    ValueFormatter m_formatter;
    std::regex m_anchor;
};

} // namespace Jetpilot
