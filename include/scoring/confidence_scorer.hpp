#pragma once

#include "core/types.hpp"

#include <optional>

namespace sanitizer {

/**
 * @brief Combines scan confidences, residual risks, MRE quality and whether
 * refinement changed the output into one trust score in [0, 1].
 *
 *   0.35 * secret.scan_confidence * (1 - 0.5 * secret.remaining_risk)
 * + 0.25 * pii.scan_confidence    * (1 - 0.5 * pii.remaining_risk)
 * + mre term        (0.2 * quality, or 0.15 without an MRE)
 * + syntax term     (0.1 without an MRE, else 0.1 valid / 0.05 invalid)
 * + refinement term (0.1 if refinement changed the output, else 0.05)
 */
class ConfidenceScorer {
public:
    static constexpr double kSecretWeight = 0.35;
    static constexpr double kPiiWeight = 0.25;
    static constexpr double kMreWeight = 0.2;
    static constexpr double kNoMreScore = 0.15;

    [[nodiscard]] static double score(const SecretScanResult& secret_result,
                                      const PiiScanResult& pii_result,
                                      const std::optional<MREResult>& mre_result,
                                      bool refinement_used);

    /**
     * @brief Merge per-lane scans for scoring: findings concatenated,
     * remaining_risk is the max, scan_confidence the min.
     */
    static void merge_into(ScanResult& merged, const ScanResult& lane);
};

} // namespace sanitizer
