#pragma once

#include "catalog/pattern_catalog.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sanitizer {

/**
 * @brief Shannon entropy in bits per character: -sum(p(c) * log2 p(c)).
 * Empty input has entropy 0.
 */
[[nodiscard]] double calculate_entropy(std::string_view text);

/**
 * @brief Maximal runs of [A-Za-z0-9+/=_-] of at least min_length characters
 * whose entropy is >= threshold, as "high_entropy_string" findings with
 * confidence min((entropy - 3) / 2, 1).
 */
[[nodiscard]] std::vector<Finding> detect_high_entropy_strings(
    std::string_view text, size_t min_length = 20, double threshold = 4.0);

/**
 * @brief Layer-1 credential scanner.
 *
 * Pattern rules from the catalog plus an entropy fallback. Every detection is
 * redacted to <{RULE_NAME}_REDACTED>; the detector never refuses input.
 * Stateless per call and safe to share between threads.
 */
class SecretDetector {
public:
    struct Config {
        double entropy_threshold = 4.0;
        size_t entropy_min_length = 20;
    };

    static constexpr double kPatternConfidence = 0.95;

    SecretDetector() : SecretDetector(Config{}) {}
    explicit SecretDetector(const Config& config,
                            const PatternCatalog& catalog = PatternCatalog::instance());

    [[nodiscard]] SecretScanResult detect(const std::string& text) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    void collect_pattern_findings(const std::string& text, std::vector<Finding>& out) const;

    Config config_;
    const PatternCatalog& catalog_;
};

/**
 * @brief True when any redacted finding was a PEM private-key block.
 */
[[nodiscard]] bool has_private_key_material(const SecretScanResult& result);

} // namespace sanitizer
