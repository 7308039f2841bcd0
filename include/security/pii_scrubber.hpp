#pragma once

#include "catalog/pattern_catalog.hpp"
#include "core/types.hpp"

#include <map>
#include <string>
#include <string_view>

namespace sanitizer {

/**
 * @brief Layer-1 PII scrubber with indexed placeholders.
 *
 * Each distinct value of a category gets <PREFIX_n>, numbered from 1 in
 * order of first appearance within one scrub() call. Emails are matched
 * case-insensitively for indexing. Home-directory prefixes are replaced by a
 * fixed generic path instead of an index. The index table lives on the stack
 * of scrub(), so concurrent calls never share numbering.
 */
class PiiScrubber {
public:
    static constexpr double kPiiConfidence = 0.9;
    static constexpr double kMaxRemainingRisk = 0.5;

    PiiScrubber() : PiiScrubber(PatternCatalog::instance()) {}
    explicit PiiScrubber(const PatternCatalog& catalog) : catalog_(catalog) {}

    [[nodiscard]] PiiScanResult scrub(const std::string& text) const;

    /**
     * @brief Rule names whose presence raises remaining_risk by 0.1 each.
     */
    [[nodiscard]] static bool is_sensitive_type(std::string_view rule_name);

private:
    const PatternCatalog& catalog_;
};

/**
 * @brief Finding count per rule name.
 */
[[nodiscard]] std::map<std::string, size_t> pii_summary(const PiiScanResult& result);

} // namespace sanitizer
