// =================================================================
// tests/ConfigTemplateEngineTest.cpp
// =================================================================
// Unit tests for ValueFormatter and ConfigTemplateEngine.

#include "Jetpilot/ConfigTemplateEngine.hpp"
#include "Jetpilot/Errors.hpp"
#include <algorithm>
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

using Jetpilot::ConfigTemplateEngine;
using Jetpilot::KeyAction;
using Jetpilot::KeyReplacementRule;
using Jetpilot::TemplateValue;
using Jetpilot::ValueFormatter;

namespace {

const std::string SAMPLE =
    "---\n"
    "# Sample vars file\n"
    "lab:\n"
    "\n"
    "# Which cloud in the lab\n"
    "lab_cloud:\n"
    "\n"
    "cluster_type:\n"
    "\n"
    "ocp_build: \"ga\"\n"
    "ocp_version: \"latest-4.17\"\n"
    "\n"
    "# lab: commented-out example\n"
    "\n"
    "# Append override vars below\n"
    "\n"
    "bastion_cluster_config_dir: /root/{{ cluster_type }}\n";

template <typename Fn>
bool throwsValidation(Fn fn) {
    try {
        fn();
    } catch (const Jetpilot::ValidationError&) {
        return true;
    }
    return false;
}

} // namespace

class ValueFormatterTest {
public:
    void testScalars() {
        std::cout << "Testing scalar formatting..." << std::endl;

        ValueFormatter formatter;
        assert(formatter.format("public_vlan", true) == "true");
        assert(formatter.format("public_vlan", false) == "false");
        assert(formatter.format("worker_node_count", 3) == "3");
        assert(formatter.format("ratio", 1.5) == "1.5");
        assert(formatter.format("lab", "scalelab") == "scalelab");
        assert(formatter.format("empty", nullptr) == "");

        std::cout << "✓ Scalar formatting test passed" << std::endl;
    }

    void testQuoting() {
        std::cout << "Testing quoting rules..." << std::endl;

        ValueFormatter formatter({"ocp_build", "ocp_version"});
        assert(formatter.format("ocp_build", "ga") == "\"ga\"");
        assert(formatter.format("ocp_version", "latest-4.17") == "\"latest-4.17\"");

        // Templating expressions are quoted for any key
        assert(formatter.format("pull_secret", "{{ lookup('file', '../pull_secret.txt') }}") ==
               "\"{{ lookup('file', '../pull_secret.txt') }}\"");

        // A lone brace pair is not an expression
        assert(formatter.format("lab", "{{ half") == "{{ half");
        assert(ValueFormatter::isTemplateExpression("{{ x }}"));
        assert(!ValueFormatter::isTemplateExpression("plain"));

        // Booleans win over the always-quote list
        assert(formatter.format("ocp_build", true) == "true");

        std::cout << "✓ Quoting rules test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ValueFormatter unit tests..." << std::endl;

        testScalars();
        testQuoting();

        std::cout << "All ValueFormatter tests passed!" << std::endl;
    }
};

class ConfigTemplateEngineTest {
private:
    ConfigTemplateEngine engine{ValueFormatter({"ocp_build", "ocp_version"})};

public:
    void testInPlaceReplacement() {
        std::cout << "Testing in-place replacement..." << std::endl;

        std::vector<KeyReplacementRule> rules = {
            {"lab", "scalelab"},
            {"lab_cloud", "cloud99"},
            {"ocp_version", "latest-4.18"},
        };
        auto result = engine.render(SAMPLE, rules);

        assert(result.text.find("\nlab: scalelab\n") != std::string::npos);
        assert(result.text.find("\nlab_cloud: cloud99\n") != std::string::npos);
        assert(result.text.find("\nocp_version: \"latest-4.18\"\n") != std::string::npos);

        // Comments, blank lines and untouched keys survive byte for byte
        assert(result.text.find("# Sample vars file\n") != std::string::npos);
        assert(result.text.find("# Which cloud in the lab\n") != std::string::npos);
        assert(result.text.find("# lab: commented-out example\n") != std::string::npos);
        assert(result.text.find("\nocp_build: \"ga\"\n") != std::string::npos);
        assert(result.text.find("bastion_cluster_config_dir: /root/{{ cluster_type }}\n") != std::string::npos);

        // Same number of lines as the sample
        auto count = [](const std::string& s) { return std::count(s.begin(), s.end(), '\n'); };
        assert(count(result.text) == count(SAMPLE));

        assert(result.report.replacedCount() == 3);
        assert(result.report.appendedCount() == 0);
        assert(result.report.skipped_keys.empty());

        std::cout << "✓ In-place replacement test passed" << std::endl;
    }

    void testIndentationAndFirstOccurrence() {
        std::cout << "Testing indentation and first occurrence..." << std::endl;

        const std::string text =
            "cluster:\n"
            "  lab :   old  # trailing comment\n"
            "lab: second\n";
        auto result = engine.render(text, {{"lab", "scalelab"}});

        assert(result.text ==
               "cluster:\n"
               "  lab: scalelab\n"
               "lab: second\n");

        std::cout << "✓ Indentation and first occurrence test passed" << std::endl;
    }

    void testKeyPrefixesDoNotMatch() {
        std::cout << "Testing key prefix isolation..." << std::endl;

        const std::string text = "lab_cloud: cloud01\nlab: old\n";
        auto result = engine.render(text, {{"lab", "scalelab"}});
        assert(result.text == "lab_cloud: cloud01\nlab: scalelab\n");

        // Regex metacharacters in keys are literal
        const std::string dotted = "aXb: 1\na.b: 2\n";
        auto escaped = engine.render(dotted, {{"a.b", 9}});
        assert(escaped.text == "aXb: 1\na.b: 9\n");

        std::cout << "✓ Key prefix isolation test passed" << std::endl;
    }

    void testSkippedKeys() {
        std::cout << "Testing skipped keys..." << std::endl;

        auto result = engine.render(SAMPLE, {{"lab", "scalelab"}, {"worker_node_count", 4}});

        assert(result.text.find("worker_node_count") == std::string::npos);
        assert(result.report.skipped_keys.size() == 1);
        assert(result.report.skipped_keys[0] == "worker_node_count");

        auto described = result.report.describe();
        assert(described.size() == 1);
        assert(described[0] == "lab (replaced)");

        std::cout << "✓ Skipped keys test passed" << std::endl;
    }

    void testOverridesAfterAnchor() {
        std::cout << "Testing override insertion at the anchor..." << std::endl;

        TemplateValue overrides = TemplateValue::parse(R"({"zeta": "z", "alpha": 1, "flag": false})");
        auto result = engine.render(SAMPLE, {{"lab", "scalelab"}}, overrides);

        const std::string expected_block =
            "# Append override vars below\n"
            "zeta: z\n"
            "alpha: 1\n"
            "flag: false\n"
            "\n"
            "bastion_cluster_config_dir: /root/{{ cluster_type }}\n";
        assert(result.text.size() >= expected_block.size());
        assert(result.text.compare(result.text.size() - expected_block.size(),
                                   expected_block.size(), expected_block) == 0);

        auto described = result.report.describe();
        assert(described.size() == 4);
        assert(described[0] == "lab (replaced)");
        assert(described[1] == "zeta (appended override)");
        assert(described[2] == "alpha (appended override)");
        assert(described[3] == "flag (appended override)");
        assert(result.report.entries[1].action == KeyAction::APPENDED);

        std::cout << "✓ Override insertion test passed" << std::endl;
    }

    void testOverridesWithoutAnchor() {
        std::cout << "Testing override insertion without an anchor..." << std::endl;

        TemplateValue overrides = TemplateValue::parse(R"({"extra": "value"})");

        auto terminated = engine.render("lab: x\n", {}, overrides);
        assert(terminated.text == "lab: x\nextra: value\n");

        // An unterminated last line gets a line break before the override
        auto unterminated = engine.render("lab: x", {}, overrides);
        assert(unterminated.text == "lab: x\nextra: value\n");

        auto empty = engine.render("", {}, overrides);
        assert(empty.text == "extra: value\n");

        std::cout << "✓ Override insertion without anchor test passed" << std::endl;
    }

    void testCrlfPreserved() {
        std::cout << "Testing CRLF line endings..." << std::endl;

        const std::string text = "lab: old\r\n# Append override vars below\r\nother: 1\r\n";
        TemplateValue overrides = TemplateValue::parse(R"({"x": 1})");
        auto result = engine.render(text, {{"lab", "new"}}, overrides);

        assert(result.text == "lab: new\r\n# Append override vars below\r\nx: 1\r\nother: 1\r\n");

        std::cout << "✓ CRLF line endings test passed" << std::endl;
    }

    void testIdempotentRender() {
        std::cout << "Testing repeatable rendering..." << std::endl;

        std::vector<KeyReplacementRule> rules = {{"lab", "scalelab"}, {"cluster_type", "sno"}};
        TemplateValue overrides = TemplateValue::parse(R"({"a": 1})");

        auto first = engine.render(SAMPLE, rules, overrides);
        auto second = engine.render(SAMPLE, rules, overrides);
        assert(first.text == second.text);

        // Replacing with the value already present is a no-op on the text
        auto again = engine.render(first.text, rules);
        assert(again.text == first.text);

        std::cout << "✓ Repeatable rendering test passed" << std::endl;
    }

    void testNullAndBooleanValues() {
        std::cout << "Testing null and boolean values..." << std::endl;

        const std::string text = "public_vlan: true\nsno_install_disk: /dev/sda\n";
        auto result = engine.render(text, {{"public_vlan", false}, {"sno_install_disk", nullptr}});
        assert(result.text == "public_vlan: false\nsno_install_disk: \n");

        std::cout << "✓ Null and boolean values test passed" << std::endl;
    }

    void testOverrideValidation() {
        std::cout << "Testing override validation..." << std::endl;

        assert(ConfigTemplateEngine::parseOverrides("").empty());
        assert(ConfigTemplateEngine::parseOverrides("{}").empty());

        auto parsed = ConfigTemplateEngine::parseOverrides(R"({"b": 2, "a": 1})");
        assert(parsed.begin().key() == "b");

        assert(throwsValidation([] { ConfigTemplateEngine::parseOverrides("{not json"); }));
        assert(throwsValidation([] { ConfigTemplateEngine::parseOverrides("[1, 2]"); }));
        assert(throwsValidation([] { ConfigTemplateEngine::parseOverrides(R"({"a": {"b": 1}})"); }));
        assert(throwsValidation([] { ConfigTemplateEngine::parseOverrides(R"({"a": [1]})"); }));

        // render() refuses nested overrides without touching anything
        assert(throwsValidation([this] {
            engine.render(SAMPLE, {}, TemplateValue::parse(R"({"a": {"b": 1}})"));
        }));

        std::cout << "✓ Override validation test passed" << std::endl;
    }

    void testCustomAnchor() {
        std::cout << "Testing custom anchor patterns..." << std::endl;

        ConfigTemplateEngine custom(ValueFormatter(), R"(^## extras$)");
        TemplateValue overrides = TemplateValue::parse(R"({"k": "v"})");
        auto result = custom.render("a: 1\n## extras\nb: 2\n", {}, overrides);
        assert(result.text == "a: 1\n## extras\nk: v\nb: 2\n");

        assert(throwsValidation([] { ConfigTemplateEngine bad(ValueFormatter(), "(unclosed"); }));

        std::cout << "✓ Custom anchor test passed" << std::endl;
    }

    void testTemplatedOverrideQuoted() {
        std::cout << "Testing templated override values..." << std::endl;

        TemplateValue overrides = TemplateValue::parse(R"({"foo": 1, "bar": "{{ y }}"})");
        auto result = engine.render(SAMPLE, {}, overrides);

        const std::string expected =
            "# Append override vars below\n"
            "foo: 1\n"
            "bar: \"{{ y }}\"\n"
            "\n";
        assert(result.text.find(expected) != std::string::npos);

        std::cout << "✓ Templated override values test passed" << std::endl;
    }

    void testKeyInRulesAndOverrides() {
        std::cout << "Testing a key given both as rule and override..." << std::endl;

        TemplateValue overrides = TemplateValue::parse(R"({"lab": "other"})");
        auto result = engine.render(SAMPLE, {{"lab", "scalelab"}}, overrides);

        assert(result.text.find("---\n# Sample vars file\nlab: scalelab\n") == 0);
        assert(result.text.find("# Append override vars below\nlab: other\n") != std::string::npos);

        auto described = result.report.describe();
        assert(described.size() == 2);
        assert(described[0] == "lab (replaced)");
        assert(described[1] == "lab (appended override)");

        std::cout << "✓ Rule and override for one key test passed" << std::endl;
    }

    void testLongValueLine() {
        std::cout << "Testing a declaration with a very long value..." << std::endl;

        const std::string blob(200 * 1024, 'a');
        const std::string text =
            "pull_secret: '" + blob + "'\n"
            "# Append override vars below\n";
        TemplateValue overrides = TemplateValue::parse(R"({"x": 1})");
        auto result = engine.render(text, {{"pull_secret", "short"}}, overrides);

        assert(result.text == "pull_secret: short\n# Append override vars below\nx: 1\n");

        // Untouched long lines pass through unchanged
        auto untouched = engine.render(text, {{"lab", "scalelab"}});
        assert(untouched.text == text);
        assert(untouched.report.skipped_keys.size() == 1);

        std::cout << "✓ Long value line test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ConfigTemplateEngine unit tests..." << std::endl;

        testInPlaceReplacement();
        testIndentationAndFirstOccurrence();
        testKeyPrefixesDoNotMatch();
        testSkippedKeys();
        testOverridesAfterAnchor();
        testOverridesWithoutAnchor();
        testCrlfPreserved();
        testIdempotentRender();
        testNullAndBooleanValues();
        testOverrideValidation();
        testCustomAnchor();
        testTemplatedOverrideQuoted();
        testKeyInRulesAndOverrides();
        testLongValueLine();

        std::cout << "All ConfigTemplateEngine tests passed!" << std::endl;
    }
};

int main() {
    try {
        ValueFormatterTest formatter_tests;
        formatter_tests.runAllTests();

        std::cout << std::endl;

        ConfigTemplateEngineTest engine_tests;
        engine_tests.runAllTests();

        std::cout << "\n🎉 All ConfigTemplateEngine component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
