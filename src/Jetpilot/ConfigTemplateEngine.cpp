// =================================================================
// src/Jetpilot/ConfigTemplateEngine.cpp
// =================================================================
// Implementation for line-level template rendering.

#include "Jetpilot/ConfigTemplateEngine.hpp"
#include "Jetpilot/Errors.hpp"
#include <utility>

namespace Jetpilot {

namespace {

// A document line split from its terminator ("\n", "\r\n" or "" for an
// unterminated last line) so that rewriting content never touches it.
struct Line {
    std::string content;
    std::string terminator;
};

std::vector<Line> splitLines(const std::string& text) {
    std::vector<Line> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t newline = text.find('\n', start);
        if (newline == std::string::npos) {
            lines.push_back({text.substr(start), ""});
            break;
        }
        size_t content_end = newline;
        if (content_end > start && text[content_end - 1] == '\r') {
            content_end--;
        }
        lines.push_back({text.substr(start, content_end - start),
                         text.substr(content_end, newline + 1 - content_end)});
        start = newline + 1;
    }
    return lines;
}

std::string joinLines(const std::vector<Line>& lines) {
    std::string text;
    for (const auto& line : lines) {
        text += line.content;
        text += line.terminator;
    }
    return text;
}

// Line ending used for inserted lines: CRLF only if the document uses it.
std::string detectLineEnding(const std::vector<Line>& lines) {
    for (const auto& line : lines) {
        if (!line.terminator.empty()) {
            return line.terminator;
        }
    }
    return "\n";
}

// Length of the indentation if the line declares `key:`, npos otherwise.
// Only the prefix is inspected; the value may be arbitrarily long.
size_t keyDeclarationIndent(const std::string& line, const std::string& key) {
    size_t pos = line.find_first_not_of(" \t");
    if (pos == std::string::npos || line.compare(pos, key.size(), key) != 0) {
        return std::string::npos;
    }
    size_t indent = pos;
    pos = line.find_first_not_of(" \t", pos + key.size());
    if (pos == std::string::npos || line[pos] != ':') {
        return std::string::npos;
    }
    return indent;
}

} // namespace

ValueFormatter::ValueFormatter(std::unordered_set<std::string> always_quote_keys)
    : m_always_quote_keys(std::move(always_quote_keys))
{
}

std::string ValueFormatter::format(const std::string& key, const TemplateValue& value) const {
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_null()) {
        return "";
    }

    std::string text = value.is_string() ? value.get<std::string>() : value.dump();

    if (m_always_quote_keys.count(key) > 0) {
        return "\"" + text + "\"";
    }
    if (value.is_string() && isTemplateExpression(text)) {
        return "\"" + text + "\"";
    }
    return text;
}

bool ValueFormatter::isTemplateExpression(const std::string& text) {
    return text.find("{{") != std::string::npos && text.find("}}") != std::string::npos;
}

std::string ReportEntry::describe() const {
    switch (action) {
        case KeyAction::REPLACED: return key + " (replaced)";
        case KeyAction::APPENDED: return key + " (appended override)";
    }
    return key;
}

size_t RenderReport::replacedCount() const {
    size_t count = 0;
    for (const auto& entry : entries) {
        if (entry.action == KeyAction::REPLACED) count++;
    }
    return count;
}

size_t RenderReport::appendedCount() const {
    return entries.size() - replacedCount();
}

std::vector<std::string> RenderReport::describe() const {
    std::vector<std::string> descriptions;
    descriptions.reserve(entries.size());
    for (const auto& entry : entries) {
        descriptions.push_back(entry.describe());
    }
    return descriptions;
}

ConfigTemplateEngine::ConfigTemplateEngine(ValueFormatter formatter, const std::string& anchor_pattern)
    : m_formatter(std::move(formatter))
{
    try {
        m_anchor = std::regex(anchor_pattern);
    } catch (const std::regex_error& e) {
        throw ValidationError("Invalid anchor pattern '" + anchor_pattern + "': " + e.what());
    }
}

RenderResult ConfigTemplateEngine::render(const std::string& sample_text,
                                          const std::vector<KeyReplacementRule>& rules,
                                          const TemplateValue& overrides) const {
    validateOverrides(overrides);

    RenderResult result;
    std::vector<Line> lines = splitLines(sample_text);

    // Step 1: in-place replacement of the first declaration of each key
    for (const auto& rule : rules) {
        bool replaced = false;

        for (auto& line : lines) {
            size_t indent = keyDeclarationIndent(line.content, rule.key);
            if (indent != std::string::npos) {
                line.content = line.content.substr(0, indent) + rule.key + ": " +
                               m_formatter.format(rule.key, rule.value);
                replaced = true;
                break;
            }
        }

        if (replaced) {
            result.report.entries.push_back({rule.key, KeyAction::REPLACED});
        } else {
            result.report.skipped_keys.push_back(rule.key);
        }
    }

    // Step 2: overrides after the anchor, or at the end of the document
    if (!overrides.empty()) {
        size_t insert_at = lines.size();
        for (size_t i = 0; i < lines.size(); i++) {
            if (std::regex_search(lines[i].content, m_anchor)) {
                insert_at = i + 1;
                break;
            }
        }

        const std::string line_ending = detectLineEnding(lines);
        if (insert_at > 0 && lines[insert_at - 1].terminator.empty()) {
            lines[insert_at - 1].terminator = line_ending;
        }

        std::vector<Line> inserted;
        for (const auto& item : overrides.items()) {
            inserted.push_back({item.key() + ": " + m_formatter.format(item.key(), item.value()), line_ending});
            result.report.entries.push_back({item.key(), KeyAction::APPENDED});
        }
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(insert_at), inserted.begin(), inserted.end());
    }

    result.text = joinLines(lines);
    return result;
}

TemplateValue ConfigTemplateEngine::parseOverrides(const std::string& json_text) {
    if (json_text.empty()) {
        return TemplateValue::object();
    }

    TemplateValue parsed;
    try {
        parsed = TemplateValue::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(std::string("extra_vars_json is not valid JSON: ") + e.what());
    }

    validateOverrides(parsed);
    return parsed;
}

void ConfigTemplateEngine::validateOverrides(const TemplateValue& overrides) {
    if (!overrides.is_object()) {
        throw ValidationError("extra_vars_json must be a JSON object");
    }
    for (const auto& item : overrides.items()) {
        if (item.value().is_structured()) {
            throw ValidationError("extra_vars_json must be a flat mapping, '" + item.key() +
                                  "' holds a nested " + item.value().type_name());
        }
    }
}

} // namespace Jetpilot
