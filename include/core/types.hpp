#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sanitizer {

// ============================================================================
// Rule Categories
// ============================================================================

enum class SecretCategory : uint8_t {
    CLOUD_PROVIDER_KEY,
    AI_PROVIDER_KEY,
    VCS_TOKEN,
    CHAT_TOKEN,
    DATABASE_URL,
    AUTH_TOKEN,
    PRIVATE_KEY,
    PAYMENT_KEY,
    MESSAGING_API_KEY,
    PACKAGE_REGISTRY_TOKEN,
    GENERIC,
    HIGH_ENTROPY
};

enum class PiiCategory : uint8_t {
    EMAIL,
    HOME_PATH,
    IP_ADDRESS,
    INTERNAL_URL,
    PHONE,
    CREDIT_CARD,
    SSN
};

using RuleCategory = std::variant<SecretCategory, PiiCategory>;

[[nodiscard]] inline const char* secret_category_to_string(SecretCategory c) {
    switch (c) {
        case SecretCategory::CLOUD_PROVIDER_KEY:     return "cloud_provider_key";
        case SecretCategory::AI_PROVIDER_KEY:        return "ai_provider_key";
        case SecretCategory::VCS_TOKEN:              return "vcs_token";
        case SecretCategory::CHAT_TOKEN:             return "chat_token";
        case SecretCategory::DATABASE_URL:           return "database_url";
        case SecretCategory::AUTH_TOKEN:             return "auth_token";
        case SecretCategory::PRIVATE_KEY:            return "private_key";
        case SecretCategory::PAYMENT_KEY:            return "payment_key";
        case SecretCategory::MESSAGING_API_KEY:      return "messaging_api_key";
        case SecretCategory::PACKAGE_REGISTRY_TOKEN: return "package_registry_token";
        case SecretCategory::GENERIC:                return "generic";
        case SecretCategory::HIGH_ENTROPY:           return "high_entropy";
        default:                                     return "unknown";
    }
}

[[nodiscard]] inline const char* pii_category_to_string(PiiCategory c) {
    switch (c) {
        case PiiCategory::EMAIL:        return "email";
        case PiiCategory::HOME_PATH:    return "home_path";
        case PiiCategory::IP_ADDRESS:   return "ip_address";
        case PiiCategory::INTERNAL_URL: return "internal_url";
        case PiiCategory::PHONE:        return "phone";
        case PiiCategory::CREDIT_CARD:  return "credit_card";
        case PiiCategory::SSN:          return "ssn";
        default:                        return "unknown";
    }
}

// ============================================================================
// Scan Results
// ============================================================================

/**
 * @brief One detected secret or PII span in the scanned text.
 *
 * [start, end) are byte offsets into the text handed to the scan call.
 */
struct Finding {
    std::string rule_name;
    RuleCategory category = SecretCategory::GENERIC;
    std::string matched_text;
    size_t start = 0;
    size_t end = 0;
    double confidence = 0.0;

    [[nodiscard]] size_t length() const { return end - start; }
};

/**
 * @brief Result of one scan call.
 *
 * From a single detect()/scrub() call, findings are non-overlapping and
 * sorted by start. The lane-merged copies in SanitizationResult concatenate
 * the error, context and code scans in that order; their offsets point into
 * different texts and carry neither property.
 */
struct ScanResult {
    std::vector<Finding> findings;
    std::string sanitized_text;
    double remaining_risk = 0.0;
    double scan_confidence = 1.0;
};

using SecretScanResult = ScanResult;

struct PiiScanResult : ScanResult {
    std::set<std::string> types_found;
};

// ============================================================================
// MRE Synthesis
// ============================================================================

enum class Language : uint8_t {
    PYTHON,
    JAVASCRIPT,
    GO,
    RUST,
    UNKNOWN
};

[[nodiscard]] inline const char* language_to_string(Language lang) {
    switch (lang) {
        case Language::PYTHON:     return "python";
        case Language::JAVASCRIPT: return "javascript";
        case Language::GO:         return "go";
        case Language::RUST:       return "rust";
        case Language::UNKNOWN:    return "unknown";
        default:                   return "unknown";
    }
}

struct MREResult {
    std::string original_code;
    std::string synthesized_mre;
    Language language = Language::UNKNOWN;
    std::vector<std::string> imports_kept;
    std::vector<std::pair<std::string, std::string>> names_replaced;  // insertion order
    size_t line_count = 0;
    double quality_score = 0.0;
    bool syntax_valid = true;
    bool error_marker_added = false;
    std::vector<std::string> warnings;
};

// ============================================================================
// Pipeline Request / Result
// ============================================================================

enum class RefinementField : uint8_t {
    ERROR_MESSAGE,
    CONTEXT,
    CODE
};

[[nodiscard]] inline const char* refinement_field_to_string(RefinementField f) {
    switch (f) {
        case RefinementField::ERROR_MESSAGE: return "error";
        case RefinementField::CONTEXT:       return "context";
        case RefinementField::CODE:          return "code";
        default:                             return "unknown";
    }
}

struct SanitizationRequest {
    std::string error_message;
    std::optional<std::string> error_context;
    std::optional<std::string> code_snippet;
    bool use_refinement = false;
};

struct SanitizationResult {
    bool success = false;
    std::string sanitized_error;
    std::string sanitized_context;
    std::string sanitized_mre;
    double confidence_score = 0.0;
    std::vector<std::string> warnings;
    bool refinement_used = false;

    // Diagnostics: lane-merged Layer-1 scans (error, context, code findings
    // concatenated, offsets relative to each lane's own text) and the MRE
    // (if code was given)
    SecretScanResult secret_scan;
    PiiScanResult pii_scan;
    std::optional<MREResult> mre_result;
};

} // namespace sanitizer
