#include "security/redaction.hpp"

#include <algorithm>

namespace sanitizer {

std::vector<Finding> resolve_overlaps(std::vector<Finding> findings) {
    std::ranges::stable_sort(findings, [](const Finding& a, const Finding& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.length() > b.length();
    });

    std::vector<Finding> kept;
    kept.reserve(findings.size());
    size_t last_end = 0;
    for (auto& f : findings) {
        if (!kept.empty() && f.start < last_end) {
            continue;
        }
        last_end = f.end;
        kept.emplace_back(std::move(f));
    }
    return kept;
}

std::string apply_redactions(const std::string& text,
                             const std::vector<Finding>& findings,
                             const ReplacementFn& replacement) {
    std::vector<std::string> tokens;
    tokens.reserve(findings.size());
    for (const auto& f : findings) {
        tokens.emplace_back(replacement(f));
    }

    std::string result = text;
    for (size_t i = findings.size(); i-- > 0;) {
        const auto& f = findings[i];
        result.replace(f.start, f.length(), tokens[i]);
    }
    return result;
}

} // namespace sanitizer
