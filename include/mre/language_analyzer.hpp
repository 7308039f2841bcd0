#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sanitizer {

/**
 * @brief Structural split of a snippet: import lines and the remaining body.
 */
struct CodeAnalysis {
    std::vector<std::string> imports;
    std::string body;
};

/**
 * @brief Per-language capability used by the MRE synthesizer.
 *
 * Implementations are stateless. Languages without structural support
 * return the whole snippet as body and never report syntax errors.
 */
class ILanguageAnalyzer {
public:
    virtual ~ILanguageAnalyzer() = default;

    [[nodiscard]] virtual Language language() const = 0;

    /**
     * @brief True when the snippet shows this language's strong indicators.
     */
    [[nodiscard]] virtual bool detect(std::string_view code) const = 0;

    [[nodiscard]] virtual CodeAnalysis analyze(const std::string& code) const = 0;

    /**
     * @brief Keep an allow-listed import as-is, or return a commented-out
     * placeholder naming the removed module.
     */
    [[nodiscard]] virtual std::string filter_import(const std::string& line) const = 0;

    /**
     * @brief Syntax error text ("message (line N)"), or nullopt when the code
     * parses or no parser exists.
     */
    [[nodiscard]] virtual std::optional<std::string> validate(const std::string& code) const = 0;

    [[nodiscard]] virtual bool has_parser() const = 0;

    [[nodiscard]] virtual std::string_view comment_prefix() const = 0;
};

/**
 * @brief Heuristic-only analyzer for JavaScript, Go, Rust and unknown input.
 */
class HeuristicAnalyzer : public ILanguageAnalyzer {
public:
    explicit HeuristicAnalyzer(Language language) : language_(language) {}

    [[nodiscard]] Language language() const override { return language_; }
    [[nodiscard]] bool detect(std::string_view code) const override;
    [[nodiscard]] CodeAnalysis analyze(const std::string& code) const override;
    [[nodiscard]] std::string filter_import(const std::string& line) const override;
    [[nodiscard]] std::optional<std::string> validate(const std::string& code) const override;
    [[nodiscard]] bool has_parser() const override { return false; }
    [[nodiscard]] std::string_view comment_prefix() const override;

private:
    Language language_;
};

/**
 * @brief First language whose strong indicators fire, checked in the order
 * Python, Go, Rust, JavaScript; UNKNOWN otherwise.
 */
[[nodiscard]] Language detect_language(std::string_view code);

/**
 * @brief Analyzer for a language (immutable, process-lifetime instances).
 */
[[nodiscard]] const ILanguageAnalyzer& analyzer_for(Language language);

} // namespace sanitizer
