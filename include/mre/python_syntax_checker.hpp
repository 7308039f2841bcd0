#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sanitizer {

/**
 * @brief Python syntax check backed by CPython's own parser.
 *
 * The snippet is parsed to an AST only (PyCF_ONLY_AST), the same check as
 * ast.parse: nothing is compiled to bytecode or executed, and
 * compiler-level errors such as a top-level `return` are not reported.
 *
 * The embedded interpreter is started once, isolated from the environment
 * (no site import, no signal handlers), and shared by all callers under the
 * GIL. Start-up failure throws SanitizerError(INTERNAL_ERROR).
 */
class PythonSyntaxChecker {
public:
    /**
     * @brief First syntax error as "<message> (line N)", or nullopt when the
     * snippet parses.
     */
    [[nodiscard]] static std::optional<std::string> check(std::string_view code);
};

} // namespace sanitizer
