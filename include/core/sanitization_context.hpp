#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"

#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace sanitizer {

/**
 * @brief Layer-1 output of one input field.
 */
struct LaneResult {
    SecretScanResult secret_scan;
    PiiScanResult pii_scan;
    std::string text;   // secrets redacted, then PII scrubbed
};

/**
 * @brief Sanitization context - carries state through one sanitize() call
 *
 * Owned by the call; nothing in it outlives the returned result.
 */
struct SanitizationContext {
    // Input
    const SanitizationRequest* request = nullptr;
    std::stop_token stop;

    // Layer 1
    LaneResult error_lane;
    std::optional<LaneResult> context_lane;
    std::optional<LaneResult> code_lane;
    std::optional<MREResult> mre_result;

    // Current output per field (Layer 1, replaced by accepted refinements)
    std::string sanitized_error;
    std::string sanitized_context;
    std::string sanitized_code;

    // Layer 2
    bool refinement_used = false;

    std::vector<std::string> warnings;

    utils::Timer timer;
};

} // namespace sanitizer
