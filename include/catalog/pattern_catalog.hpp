#pragma once

#include "core/types.hpp"

#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sanitizer {

/**
 * @brief Which part of a regex match gets replaced.
 *
 * WHOLE_MATCH:  the entire match is redacted (capture group only names the secret)
 * CAPTURE_ONLY: only the capture group span is redacted (e.g. keep "SSN: ")
 */
enum class SpanMode : uint8_t { WHOLE_MATCH, CAPTURE_ONLY };

/**
 * @brief How a rule finds its spans.
 *
 * REGEX:     std::regex search over the text
 * PEM_BLOCK: literal BEGIN/END marker search; `pattern` holds the PEM label
 *            ("RSA PRIVATE KEY"). Bodies of any length are matched without
 *            running the regex engine over them.
 */
enum class MatchKind : uint8_t { REGEX, PEM_BLOCK };

// Post-match validation (Luhn, IPv6 sanity); false drops the match
using RuleValidator = bool (*)(std::string_view match);

/**
 * @brief Static rule definition (compile-time table row)
 */
struct RuleDefinition {
    std::string_view name;
    RuleCategory category;
    std::string_view pattern;
    bool case_insensitive = false;
    int capture_group = 0;
    SpanMode span = SpanMode::WHOLE_MATCH;
    RuleValidator validator = nullptr;
    MatchKind kind = MatchKind::REGEX;
};

struct RuleMatch {
    size_t start = 0;
    size_t end = 0;
    std::string matched_text;
};

/**
 * @brief Compiled, immutable rule
 */
struct PatternRule {
    std::string name;
    RuleCategory category;
    std::regex matcher;
    int capture_group = 0;
    SpanMode span = SpanMode::WHOLE_MATCH;
    RuleValidator validator = nullptr;
    MatchKind kind = MatchKind::REGEX;
    std::string pem_label;

    [[nodiscard]] bool is_secret() const {
        return std::holds_alternative<SecretCategory>(category);
    }

    /**
     * @brief All non-overlapping matches of this rule, left to right.
     */
    [[nodiscard]] std::vector<RuleMatch> find_all(const std::string& text) const;
};

/**
 * @brief Versioned secret + PII pattern tables.
 *
 * The tables are compile-time data; compilation into std::regex happens once,
 * on first use of instance(). A rule that fails to compile throws
 * SanitizerError(CATALOG_ERROR).
 *
 * Every repetition in a regex rule has an upper bound: the libstdc++ matcher
 * recurses once per consumed character, so an unbounded run over a long
 * token would exhaust the stack.
 */
class PatternCatalog {
public:
    PatternCatalog(std::span<const RuleDefinition> secret_definitions,
                   std::span<const RuleDefinition> pii_definitions);

    [[nodiscard]] static const PatternCatalog& instance();

    [[nodiscard]] static std::span<const RuleDefinition> default_secret_definitions();
    [[nodiscard]] static std::span<const RuleDefinition> default_pii_definitions();

    [[nodiscard]] const std::vector<PatternRule>& secret_rules() const { return secret_rules_; }
    [[nodiscard]] const std::vector<PatternRule>& pii_rules() const { return pii_rules_; }

    [[nodiscard]] const PatternRule* find(std::string_view name) const;

    [[nodiscard]] static std::string_view version();

    /**
     * @brief Secret replacement token: <{RULE_NAME_UPPERCASE}_REDACTED>
     */
    [[nodiscard]] static std::string secret_placeholder(std::string_view rule_name);

    /**
     * @brief Indexed placeholder prefix for a PII category ("EMAIL", "IP", ...).
     * Empty for categories replaced by a fixed generic value (home paths).
     */
    [[nodiscard]] static std::string_view pii_prefix(PiiCategory category);

private:
    static std::vector<PatternRule> compile(std::span<const RuleDefinition> definitions);

    std::vector<PatternRule> secret_rules_;
    std::vector<PatternRule> pii_rules_;
};

} // namespace sanitizer
