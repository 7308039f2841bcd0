#include "security/pii_scrubber.hpp"
#include "security/redaction.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <unordered_map>

namespace sanitizer {

namespace {

constexpr std::array<std::string_view, 4> kSensitiveTypes = {
    "email", "credit_card", "ssn", "phone_us"
};

constexpr std::string_view kGenericUnixPath = "/path/to/project";
constexpr std::string_view kGenericWindowsPath = "C:\\path\\to\\project";

/**
 * @brief Per-call (prefix, normalized value) -> index mapping.
 */
class IndexTable {
public:
    std::string placeholder(std::string_view prefix, const std::string& normalized) {
        auto key = std::format("{}\x1f{}", prefix, normalized);
        auto it = seen_.find(key);
        if (it == seen_.end()) {
            const int index = ++counters_[std::string(prefix)];
            it = seen_.emplace(std::move(key), index).first;
        }
        return std::format("<{}_{}>", prefix, it->second);
    }

private:
    std::unordered_map<std::string, int> seen_;
    std::unordered_map<std::string, int> counters_;
};

} // anonymous namespace

bool PiiScrubber::is_sensitive_type(std::string_view rule_name) {
    return std::ranges::find(kSensitiveTypes, rule_name) != kSensitiveTypes.end();
}

PiiScanResult PiiScrubber::scrub(const std::string& text) const {
    PiiScanResult result;
    if (text.empty()) {
        return result;
    }

    std::vector<Finding> merged;
    for (const auto& rule : catalog_.pii_rules()) {
        for (auto& m : rule.find_all(text)) {
            // Record the full matched span, not only the captured username
            std::string matched = text.substr(m.start, m.end - m.start);
            merged.push_back(Finding{
                .rule_name = rule.name,
                .category = rule.category,
                .matched_text = std::move(matched),
                .start = m.start,
                .end = m.end,
                .confidence = kPiiConfidence,
            });
        }
    }

    result.findings = resolve_overlaps(std::move(merged));

    IndexTable index;
    result.sanitized_text = apply_redactions(text, result.findings, [&index](const Finding& f) {
        const auto category = std::get<PiiCategory>(f.category);
        if (category == PiiCategory::HOME_PATH) {
            return std::string(f.rule_name == "windows_user_path"
                ? kGenericWindowsPath : kGenericUnixPath);
        }
        const auto normalized = category == PiiCategory::EMAIL
            ? utils::to_lower(f.matched_text) : f.matched_text;
        return index.placeholder(PatternCatalog::pii_prefix(category), normalized);
    });

    for (const auto& f : result.findings) {
        result.types_found.insert(f.rule_name);
    }

    const auto sensitive = std::ranges::count_if(result.types_found, [](const std::string& t) {
        return is_sensitive_type(t);
    });
    double risk = 0.0;
    if (sensitive > 0) {
        risk = 0.1 * static_cast<double>(sensitive);
    } else if (!result.findings.empty()) {
        risk = 0.05;
    }
    result.remaining_risk = std::min(risk, kMaxRemainingRisk);
    result.scan_confidence = std::max(0.85,
        1.0 - 0.02 * static_cast<double>(result.findings.size()));

    if (!result.findings.empty()) {
        utils::log::debug(std::format("PII scan: {} finding(s) across {} type(s)",
            result.findings.size(), result.types_found.size()));
    }
    return result;
}

std::map<std::string, size_t> pii_summary(const PiiScanResult& result) {
    std::map<std::string, size_t> summary;
    for (const auto& f : result.findings) {
        ++summary[f.rule_name];
    }
    return summary;
}

} // namespace sanitizer
