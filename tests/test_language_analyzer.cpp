#include <catch2/catch_test_macros.hpp>
#include "mre/language_analyzer.hpp"
#include "mre/python_analyzer.hpp"

#include <string>

using namespace sanitizer;

TEST_CASE("detect_language", "[language_analyzer]") {

    SECTION("Python indicators") {
        REQUIRE(detect_language("def foo():\n    pass") == Language::PYTHON);
        REQUIRE(detect_language("import numpy as np\nx = np.zeros(3)") == Language::PYTHON);
        REQUIRE(detect_language("from pathlib import Path") == Language::PYTHON);
        REQUIRE(detect_language("try:\n    x()\nexcept ValueError:\n    pass") == Language::PYTHON);
    }

    SECTION("Go needs both func and package") {
        REQUIRE(detect_language("package main\n\nfunc main() {\n}") == Language::GO);
        REQUIRE(detect_language("func main() {\n}") != Language::GO);
    }

    SECTION("Rust") {
        REQUIRE(detect_language("fn main() {\n    let x = 5;\n}") == Language::RUST);
    }

    SECTION("JavaScript") {
        REQUIRE(detect_language("import React from 'react';\nconst App = () => null;")
                == Language::JAVASCRIPT);
        REQUIRE(detect_language("function add(a, b) { return a + b; }") == Language::JAVASCRIPT);
    }

    SECTION("Python is checked before JavaScript") {
        REQUIRE(detect_language("async def handler():\n    pass") == Language::PYTHON);
    }

    SECTION("Rust is checked before JavaScript") {
        REQUIRE(detect_language("fn add(a: i32) -> i32 {\n    let mut b = a;\n    b\n}")
                == Language::RUST);
    }

    SECTION("Brace classes are not Python") {
        REQUIRE(detect_language("class Foo {\n}") == Language::UNKNOWN);
    }

    SECTION("No indicators") {
        REQUIRE(detect_language("SELECT * FROM t") == Language::UNKNOWN);
        REQUIRE(detect_language("") == Language::UNKNOWN);
    }
}

TEST_CASE("analyzer_for", "[language_analyzer]") {

    SECTION("Comment prefixes") {
        REQUIRE(analyzer_for(Language::PYTHON).comment_prefix() == "#");
        REQUIRE(analyzer_for(Language::JAVASCRIPT).comment_prefix() == "//");
        REQUIRE(analyzer_for(Language::GO).comment_prefix() == "//");
        REQUIRE(analyzer_for(Language::RUST).comment_prefix() == "//");
        REQUIRE(analyzer_for(Language::UNKNOWN).comment_prefix() == "#");
    }

    SECTION("Only Python has a parser") {
        REQUIRE(analyzer_for(Language::PYTHON).has_parser());
        REQUIRE_FALSE(analyzer_for(Language::GO).has_parser());
        REQUIRE(analyzer_for(Language::RUST).language() == Language::RUST);
    }

    SECTION("Instances are shared") {
        REQUIRE(&analyzer_for(Language::PYTHON) == &analyzer_for(Language::PYTHON));
    }
}

TEST_CASE("PythonAnalyzer imports", "[language_analyzer]") {

    PythonAnalyzer analyzer;

    SECTION("module_of") {
        REQUIRE(PythonAnalyzer::module_of("import os") == "os");
        REQUIRE(PythonAnalyzer::module_of("import os.path") == "os");
        REQUIRE(PythonAnalyzer::module_of("from  collections import deque") == "collections");
        REQUIRE(PythonAnalyzer::module_of("from .models import User") == ".models");
        REQUIRE(PythonAnalyzer::module_of("x = 1").empty());
        REQUIRE(PythonAnalyzer::module_of("important = 1").empty());
    }

    SECTION("Allow list") {
        REQUIRE(PythonAnalyzer::is_allowed_module("json"));
        REQUIRE(PythonAnalyzer::is_allowed_module("requests"));
        REQUIRE(PythonAnalyzer::is_allowed_module("pydantic"));
        REQUIRE_FALSE(PythonAnalyzer::is_allowed_module("acme_billing"));
        REQUIRE_FALSE(PythonAnalyzer::is_allowed_module(".models"));
    }

    SECTION("Allowed imports pass through") {
        REQUIRE(analyzer.filter_import("import requests") == "import requests");
        REQUIRE(analyzer.filter_import("from typing import Optional") == "from typing import Optional");
    }

    SECTION("Internal imports become a placeholder comment") {
        REQUIRE(analyzer.filter_import("from acme_billing.core import Ledger")
                == "# import acme_billing  # internal module removed");
        REQUIRE(analyzer.filter_import("import acme_secrets")
                == "# import acme_secrets  # internal module removed");
    }

    SECTION("Only top-level imports are split out") {
        const auto analysis = analyzer.analyze(
            "import os\n\ndef f():\n    import json\n    return 1");
        REQUIRE(analysis.imports == std::vector<std::string>{"import os"});
        REQUIRE(analysis.body == "\ndef f():\n    import json\n    return 1");
    }

    SECTION("Validation delegates to the syntax checker") {
        REQUIRE_FALSE(analyzer.validate("x = 1\n").has_value());
        REQUIRE(analyzer.validate("x = (1\n").value() == "'(' was never closed (line 1)");
    }
}

TEST_CASE("HeuristicAnalyzer", "[language_analyzer]") {

    HeuristicAnalyzer go(Language::GO);

    SECTION("Whole snippet is body") {
        const std::string code = "package main\nimport \"fmt\"\nfunc main() {}";
        const auto analysis = go.analyze(code);
        REQUIRE(analysis.imports.empty());
        REQUIRE(analysis.body == code);
    }

    SECTION("No filtering or validation") {
        REQUIRE(go.filter_import("import \"internal/acme\"") == "import \"internal/acme\"");
        REQUIRE_FALSE(go.validate("func {{{").has_value());
    }

    SECTION("Unknown analyzer accepts anything") {
        REQUIRE(HeuristicAnalyzer(Language::UNKNOWN).detect("anything"));
    }
}
