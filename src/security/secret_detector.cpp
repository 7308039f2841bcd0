#include "security/secret_detector.hpp"
#include "security/redaction.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>

namespace sanitizer {

// ============================================================================
// Entropy candidate alphabet: [A-Za-z0-9+/=_-]
// ============================================================================
namespace {

struct CandidateTable {
    bool allowed[256];

    constexpr CandidateTable() : allowed{} {
        for (int i = '0'; i <= '9'; ++i) allowed[i] = true;
        for (int i = 'a'; i <= 'z'; ++i) allowed[i] = true;
        for (int i = 'A'; i <= 'Z'; ++i) allowed[i] = true;
        allowed['+'] = true;
        allowed['/'] = true;
        allowed['='] = true;
        allowed['_'] = true;
        allowed['-'] = true;
    }
};

static constexpr CandidateTable CANDIDATE{};

inline bool is_candidate_char(char c) {
    return CANDIDATE.allowed[static_cast<unsigned char>(c)];
}

constexpr std::string_view kHighEntropyRule = "high_entropy_string";

} // anonymous namespace

double calculate_entropy(std::string_view text) {
    if (text.empty()) {
        return 0.0;
    }

    std::array<size_t, 256> freq{};
    for (const char c : text) {
        ++freq[static_cast<unsigned char>(c)];
    }

    const auto n = static_cast<double>(text.size());
    double entropy = 0.0;
    for (const size_t count : freq) {
        if (count == 0) continue;
        const double p = static_cast<double>(count) / n;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

std::vector<Finding> detect_high_entropy_strings(std::string_view text,
                                                 size_t min_length, double threshold) {
    std::vector<Finding> findings;
    const size_t len = text.size();
    size_t i = 0;

    while (i < len) {
        if (!is_candidate_char(text[i])) {
            ++i;
            continue;
        }
        const size_t start = i;
        while (i < len && is_candidate_char(text[i])) {
            ++i;
        }
        if (i - start < min_length) {
            continue;
        }

        const auto candidate = text.substr(start, i - start);
        const double entropy = calculate_entropy(candidate);
        if (entropy >= threshold) {
            findings.push_back(Finding{
                .rule_name = std::string(kHighEntropyRule),
                .category = SecretCategory::HIGH_ENTROPY,
                .matched_text = std::string(candidate),
                .start = start,
                .end = i,
                .confidence = std::min((entropy - 3.0) / 2.0, 1.0),
            });
        }
    }
    return findings;
}

// ============================================================================
// SecretDetector
// ============================================================================

SecretDetector::SecretDetector(const Config& config, const PatternCatalog& catalog)
    : config_(config), catalog_(catalog) {}

void SecretDetector::collect_pattern_findings(const std::string& text,
                                              std::vector<Finding>& out) const {
    for (const auto& rule : catalog_.secret_rules()) {
        for (auto& m : rule.find_all(text)) {
            out.push_back(Finding{
                .rule_name = rule.name,
                .category = rule.category,
                .matched_text = std::move(m.matched_text),
                .start = m.start,
                .end = m.end,
                .confidence = kPatternConfidence,
            });
        }
    }
}

SecretScanResult SecretDetector::detect(const std::string& text) const {
    SecretScanResult result;
    if (text.empty()) {
        return result;
    }

    // Pattern findings go first so an exact tie with an entropy run keeps the rule name
    std::vector<Finding> merged;
    collect_pattern_findings(text, merged);
    for (auto& f : detect_high_entropy_strings(text, config_.entropy_min_length,
                                               config_.entropy_threshold)) {
        merged.emplace_back(std::move(f));
    }

    result.findings = resolve_overlaps(std::move(merged));
    result.sanitized_text = apply_redactions(text, result.findings, [](const Finding& f) {
        return PatternCatalog::secret_placeholder(f.rule_name);
    });

    const size_t count = result.findings.size();
    if (count == 0) {
        result.remaining_risk = 0.0;
    } else if (count <= 5) {
        result.remaining_risk = 0.1;
    } else {
        result.remaining_risk = 0.3;
    }
    result.scan_confidence = count == 0 ? 0.98 : 0.95;

    if (count > 0) {
        utils::log::debug(std::format("Secret scan: {} finding(s) redacted", count));
    }
    return result;
}

bool has_private_key_material(const SecretScanResult& result) {
    return std::ranges::any_of(result.findings, [](const Finding& f) {
        const auto* cat = std::get_if<SecretCategory>(&f.category);
        return cat != nullptr && *cat == SecretCategory::PRIVATE_KEY;
    });
}

} // namespace sanitizer
