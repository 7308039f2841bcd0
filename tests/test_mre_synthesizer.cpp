#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "mre/mre_synthesizer.hpp"

#include <string>

using namespace sanitizer;

namespace {

const std::string kOrderCode =
    "import os\n"
    "import json\n"
    "from mycompany.internal import secrets_helper\n"
    "\n"
    "class CustomerOrderProcessor:\n"
    "    def process_customer_order(self, customer_id):\n"
    "        raise ValueError(\"bad order\")";

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string python_block(size_t body_lines) {
    std::string code = "def f():";
    for (size_t i = 0; i < body_lines; ++i) {
        code += "\n    a = 1";
    }
    return code;
}

} // namespace

TEST_CASE("MRESynthesizer Python snippet", "[mre]") {

    MRESynthesizer synthesizer;
    const auto result = synthesizer.synthesize(kOrderCode, std::string("ValueError: bad order"));

    SECTION("Language and imports") {
        REQUIRE(result.language == Language::PYTHON);
        REQUIRE(result.imports_kept.size() == 3);
        REQUIRE(result.imports_kept[0] == "import os");
        REQUIRE(result.imports_kept[1] == "import json");
        REQUIRE(result.imports_kept[2] == "# import mycompany  # internal module removed");
    }

    SECTION("Domain names are abstracted") {
        REQUIRE_FALSE(contains(result.synthesized_mre, "CustomerOrderProcessor"));
        REQUIRE_FALSE(contains(result.synthesized_mre, "customer_id"));
        REQUIRE_FALSE(contains(result.synthesized_mre, "mycompany.internal"));
        REQUIRE(contains(result.synthesized_mre, "class ServiceA:"));
        REQUIRE(contains(result.synthesized_mre, "def process_item(self, item):"));
        REQUIRE(result.names_replaced.front()
                == std::pair<std::string, std::string>{"CustomerOrderProcessor", "ServiceA"});
    }

    SECTION("Error line is marked") {
        REQUIRE(result.error_marker_added);
        REQUIRE(contains(result.synthesized_mre, "raise ValueError(\"bad data\")  # <-- ERROR OCCURS HERE"));
    }

    SECTION("Output stays valid Python") {
        REQUIRE(result.syntax_valid);
        REQUIRE(result.warnings.empty());
    }

    SECTION("Original is preserved and quality is scored") {
        REQUIRE(result.original_code == kOrderCode);
        REQUIRE(result.line_count == 8);
        REQUIRE(result.names_replaced.size() == 4);
        // lines < 10: 0.2, 4 names: 0.24, valid: 0.2, mentions error: 0.2
        REQUIRE(result.quality_score == Catch::Approx(0.84));
    }
}

TEST_CASE("MRESynthesizer error marker", "[mre]") {

    MRESynthesizer synthesizer;

    SECTION("Fallback summary line when no line looks like the error site") {
        const auto result = synthesizer.synthesize("def f(x):\n    return x * 2",
                                                   std::string("TypeError: unsupported operand"));
        REQUIRE(result.error_marker_added);
        REQUIRE(result.synthesized_mre ==
            "def f(x):\n    return x * 2\n\n# Error: TypeError: unsupported operand...");
        REQUIRE(result.syntax_valid);
    }

    SECTION("Summary is cut and flattened") {
        MRESynthesizer short_summary(MRESynthesizer::Config{.max_lines = 50, .error_summary_chars = 10});
        const auto result = short_summary.synthesize("def f(x):\n    return x",
                                                     std::string("line one\nline two"));
        REQUIRE(contains(result.synthesized_mre, "# Error: line one l..."));
    }

    SECTION("No error message and no indicator") {
        const auto result = synthesizer.synthesize("def f(x):\n    return x");
        REQUIRE_FALSE(result.error_marker_added);
        REQUIRE(result.synthesized_mre == "def f(x):\n    return x");
    }

    SECTION("Indicator lines are marked even without an error message") {
        const auto result = synthesizer.synthesize("def f(x):\n    assert x > 0");
        REQUIRE(result.error_marker_added);
        REQUIRE(contains(result.synthesized_mre, "assert x > 0  # <-- ERROR OCCURS HERE"));
    }

    SECTION("Non-Python snippets use their own comment prefix") {
        const auto result = synthesizer.synthesize(
            "const total = items.reduce((a, b) => a + b, 0);", std::string("boom"));
        REQUIRE(result.language == Language::JAVASCRIPT);
        REQUIRE(contains(result.synthesized_mre, "// Error: boom..."));
    }
}

TEST_CASE("MRESynthesizer truncation", "[mre]") {

    SECTION("Long snippets keep max_lines lines plus a marker") {
        MRESynthesizer synthesizer;
        const auto result = synthesizer.synthesize(python_block(59));
        REQUIRE(result.line_count == 51);
        REQUIRE(result.synthesized_mre.ends_with("\n# ... (truncated)"));
        REQUIRE(result.syntax_valid);
    }

    SECTION("Configured limit") {
        MRESynthesizer synthesizer(MRESynthesizer::Config{.max_lines = 5, .error_summary_chars = 100});
        const auto result = synthesizer.synthesize(python_block(9));
        REQUIRE(result.line_count == 6);
        REQUIRE(result.synthesized_mre.ends_with("# ... (truncated)"));
    }

    SECTION("Snippets at the limit are untouched") {
        MRESynthesizer synthesizer(MRESynthesizer::Config{.max_lines = 10, .error_summary_chars = 100});
        const auto result = synthesizer.synthesize(python_block(9));
        REQUIRE(result.line_count == 10);
        REQUIRE_FALSE(contains(result.synthesized_mre, "truncated"));
    }
}

TEST_CASE("MRESynthesizer warnings", "[mre]") {

    MRESynthesizer synthesizer;

    SECTION("Empty code") {
        const auto result = synthesizer.synthesize("   \n\t");
        REQUIRE(result.warnings == std::vector<std::string>{"Empty code provided"});
        REQUIRE(result.quality_score == 0.0);
        REQUIRE(result.syntax_valid);
        REQUIRE(result.synthesized_mre.empty());
    }

    SECTION("Syntax error") {
        const auto result = synthesizer.synthesize("def f(x):\n    return g((x)");
        REQUIRE_FALSE(result.syntax_valid);
        REQUIRE(result.warnings.size() == 1);
        REQUIRE(result.warnings[0] == "Syntax validation failed: '(' was never closed (line 2)");
    }

    SECTION("Statement-level errors lower the quality score") {
        const auto valid = synthesizer.synthesize("def f(x):\n    y = x + 1");
        const auto invalid = synthesizer.synthesize("def f(x):\n    y = = x + 1");
        REQUIRE(valid.syntax_valid);
        REQUIRE_FALSE(invalid.syntax_valid);
        REQUIRE(invalid.quality_score == Catch::Approx(valid.quality_score - 0.1));
    }

    SECTION("Unknown language") {
        const auto result = synthesizer.synthesize("SELECT * FROM t");
        REQUIRE(result.language == Language::UNKNOWN);
        REQUIRE(result.warnings == std::vector<std::string>{
            "Language not detected, limited processing applied"});
    }

    SECTION("Heuristic-only language") {
        const auto result = synthesizer.synthesize("package main\n\nfunc main() {\n}");
        REQUIRE(result.language == Language::GO);
        REQUIRE(result.warnings == std::vector<std::string>{
            "Limited processing for go: no import filtering or syntax validation"});
        REQUIRE(result.syntax_valid);
    }
}

TEST_CASE("MRESynthesizer quality_score", "[mre]") {

    SECTION("Best case") {
        MREResult r;
        r.line_count = 20;
        r.names_replaced.assign(5, {"a", "b"});
        r.syntax_valid = true;
        r.synthesized_mre = "raise Error";
        REQUIRE(MRESynthesizer::quality_score(r) == Catch::Approx(1.0));
    }

    SECTION("Worst case") {
        MREResult r;
        r.line_count = 60;
        r.syntax_valid = false;
        r.synthesized_mre = "x = 1";
        REQUIRE(MRESynthesizer::quality_score(r) == Catch::Approx(0.4));
    }

    SECTION("Name term saturates at five names") {
        MREResult r;
        r.line_count = 20;
        r.names_replaced.assign(12, {"a", "b"});
        r.syntax_valid = true;
        r.synthesized_mre = "x = 1";
        REQUIRE(MRESynthesizer::quality_score(r) == Catch::Approx(0.9));
    }

    SECTION("Error keyword matches in any case") {
        MREResult r;
        r.line_count = 20;
        r.syntax_valid = true;
        for (const std::string text : {"raise ERROR", "# an eRRor here", "error"}) {
            r.synthesized_mre = text;
            INFO(text);
            REQUIRE(MRESynthesizer::quality_score(r) == Catch::Approx(0.8));
        }
        r.synthesized_mre = "raise Err";
        REQUIRE(MRESynthesizer::quality_score(r) == Catch::Approx(0.7));
    }
}
