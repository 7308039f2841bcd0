#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "mre/python_syntax_checker.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace sanitizer;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;

namespace {

std::string error_of(std::string_view code) {
    return PythonSyntaxChecker::check(code).value_or("");
}

} // namespace

TEST_CASE("PythonSyntaxChecker accepts valid code", "[python_syntax]") {

    SECTION("Function with body") {
        REQUIRE_FALSE(PythonSyntaxChecker::check("def f(x):\n    return x + 1\n").has_value());
    }

    SECTION("Empty input") {
        REQUIRE_FALSE(PythonSyntaxChecker::check("").has_value());
    }

    SECTION("Brackets spanning lines") {
        REQUIRE_FALSE(PythonSyntaxChecker::check("foo(1,\n    2)\nbar()\n").has_value());
    }

    SECTION("if / else chain") {
        REQUIRE_FALSE(PythonSyntaxChecker::check(
            "if x:\n    a = 1\nelif y:\n    a = 2\nelse:\n    a = 3\n").has_value());
    }

    SECTION("Lambda and walrus") {
        REQUIRE_FALSE(PythonSyntaxChecker::check(
            "f = lambda x: x\nif (n := 10) > 5:\n    print(n)\n").has_value());
    }

    SECTION("Prefixed, escaped and triple-quoted strings") {
        REQUIRE_FALSE(PythonSyntaxChecker::check(
            "a = f'{b}'\nc = 'it\\'s'\nd = \"\"\"multi\nline\"\"\"\n").has_value());
    }

    SECTION("No trailing newline") {
        REQUIRE_FALSE(PythonSyntaxChecker::check("x = 1 + \\\n    2").has_value());
    }

    SECTION("Top-level return is a compiler error, not a parse error") {
        REQUIRE_FALSE(PythonSyntaxChecker::check("return result\n").has_value());
    }
}

TEST_CASE("PythonSyntaxChecker statement errors", "[python_syntax]") {

    SECTION("Errors a line scanner cannot see") {
        for (const std::string code : {"x = = 1\n", "print(1 2)\n", "return = 5\n",
                                       "for in range(3):\n    pass\n", "x = 1 +\n"}) {
            INFO(code);
            REQUIRE_THAT(error_of(code), EndsWith("(line 1)"));
        }
    }

    SECTION("Compound statement without colon") {
        REQUIRE_THAT(error_of("if x\n    pass\n"), ContainsSubstring("expected ':'"));
        REQUIRE_THAT(error_of("def broken(a, b)\n    return a\n"), EndsWith("(line 1)"));
    }

    SECTION("Stray character after backslash") {
        REQUIRE_THAT(error_of("x = 1 \\ y\n"),
                     ContainsSubstring("unexpected character after line continuation character"));
    }

    SECTION("Error on a later line") {
        REQUIRE_THAT(error_of("a = 1\nb = 2\nc = = 3\n"), EndsWith("(line 3)"));
    }
}

TEST_CASE("PythonSyntaxChecker bracket errors", "[python_syntax]") {

    SECTION("Unclosed bracket reports the line it opened on") {
        REQUIRE(error_of("x = [\n    1,\n") == "'[' was never closed (line 1)");
        REQUIRE(error_of("print((1, 2)\n") == "'(' was never closed (line 1)");
    }

    SECTION("Unmatched closer") {
        REQUIRE(error_of("x = 1\ny = 2)\n") == "unmatched ')' (line 2)");
    }

    SECTION("Mismatched closer") {
        REQUIRE(error_of("x = [1, 2)\n")
                == "closing parenthesis ')' does not match opening parenthesis '[' (line 1)");
    }
}

TEST_CASE("PythonSyntaxChecker string and indentation errors", "[python_syntax]") {

    SECTION("Unterminated string") {
        const auto error = error_of("s = 'abc\nt = 1\n");
        REQUIRE_THAT(error, ContainsSubstring("unterminated string literal"));
        REQUIRE_THAT(error, EndsWith("(line 1)"));
    }

    SECTION("Unterminated triple-quoted string") {
        const auto error = error_of("x = 1\ndoc = \"\"\"start\nmore\n");
        REQUIRE_THAT(error, ContainsSubstring("unterminated triple-quoted string literal"));
        REQUIRE_THAT(error, EndsWith("(line 2)"));
    }

    SECTION("Unexpected indent") {
        REQUIRE(error_of("x = 1\n    y = 2\n") == "unexpected indent (line 2)");
    }

    SECTION("Inconsistent dedent") {
        REQUIRE(error_of("if x:\n        a = 1\n    b = 2\n")
                == "unindent does not match any outer indentation level (line 3)");
    }

    SECTION("Missing block body") {
        const auto error = error_of("def f():\nreturn 1\n");
        REQUIRE_THAT(error, ContainsSubstring("expected an indented block"));
        REQUIRE_THAT(error, EndsWith("(line 2)"));
    }
}

TEST_CASE("PythonSyntaxChecker input handling", "[python_syntax]") {

    SECTION("Embedded null byte") {
        REQUIRE(error_of(std::string_view("x = 1\0", 6)) == "source code cannot contain null bytes");
    }

    SECTION("Concurrent callers") {
        std::vector<std::string> errors(8);
        std::vector<std::thread> threads;
        for (size_t i = 0; i < errors.size(); ++i) {
            threads.emplace_back([&errors, i] {
                errors[i] = error_of(i % 2 == 0 ? "x = (1\n" : "x = 1\n");
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        for (size_t i = 0; i < errors.size(); ++i) {
            REQUIRE(errors[i] == (i % 2 == 0 ? "'(' was never closed (line 1)" : ""));
        }
    }
}
