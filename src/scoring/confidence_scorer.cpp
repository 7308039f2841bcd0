#include "scoring/confidence_scorer.hpp"

#include <algorithm>

namespace sanitizer {

double ConfidenceScorer::score(const SecretScanResult& secret_result,
                               const PiiScanResult& pii_result,
                               const std::optional<MREResult>& mre_result,
                               bool refinement_used) {
    const double secret_term = kSecretWeight * secret_result.scan_confidence
        * (1.0 - 0.5 * secret_result.remaining_risk);
    const double pii_term = kPiiWeight * pii_result.scan_confidence
        * (1.0 - 0.5 * pii_result.remaining_risk);

    double mre_term = kNoMreScore;
    double syntax_term = 0.1;
    if (mre_result) {
        mre_term = kMreWeight * mre_result->quality_score;
        syntax_term = mre_result->syntax_valid ? 0.1 : 0.05;
    }

    const double refinement_term = refinement_used ? 0.1 : 0.05;

    return std::clamp(secret_term + pii_term + mre_term + syntax_term + refinement_term, 0.0, 1.0);
}

void ConfidenceScorer::merge_into(ScanResult& merged, const ScanResult& lane) {
    merged.findings.insert(merged.findings.end(), lane.findings.begin(), lane.findings.end());
    merged.remaining_risk = std::max(merged.remaining_risk, lane.remaining_risk);
    merged.scan_confidence = std::min(merged.scan_confidence, lane.scan_confidence);
}

} // namespace sanitizer
