#pragma once

#include "mre/language_analyzer.hpp"

#include <string>
#include <string_view>

namespace sanitizer {

/**
 * @brief Full structural support: import split, allow-list filtering and
 * syntax validation through PythonSyntaxChecker.
 */
class PythonAnalyzer : public ILanguageAnalyzer {
public:
    [[nodiscard]] Language language() const override { return Language::PYTHON; }
    [[nodiscard]] bool detect(std::string_view code) const override;
    [[nodiscard]] CodeAnalysis analyze(const std::string& code) const override;
    [[nodiscard]] std::string filter_import(const std::string& line) const override;
    [[nodiscard]] std::optional<std::string> validate(const std::string& code) const override;
    [[nodiscard]] bool has_parser() const override { return true; }
    [[nodiscard]] std::string_view comment_prefix() const override { return "#"; }

    /**
     * @brief Standard-library or common third-party top-level module.
     */
    [[nodiscard]] static bool is_allowed_module(std::string_view module);

    /**
     * @brief Top-level module of an "import x" / "from x import y" line,
     * empty when the line is neither.
     */
    [[nodiscard]] static std::string module_of(std::string_view import_line);
};

} // namespace sanitizer
