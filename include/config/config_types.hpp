#pragma once

#include "core/llm_client.hpp"
#include "core/utils.hpp"
#include "mre/mre_synthesizer.hpp"
#include "security/secret_detector.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sanitizer {

// ============================================================================
// Refinement Config
// ============================================================================

enum class RefinementMode : uint8_t {
    PER_FIELD,  // one remote call per non-empty field
    BATCH       // one remote call returning a JSON object for all fields
};

[[nodiscard]] inline const char* refinement_mode_to_string(RefinementMode mode) {
    switch (mode) {
        case RefinementMode::PER_FIELD: return "per_field";
        case RefinementMode::BATCH:     return "batch";
        default:                        return "unknown";
    }
}

[[nodiscard]] inline std::optional<RefinementMode> parse_refinement_mode(std::string_view str) {
    const std::string lower = utils::to_lower(str);
    if (lower == "per_field") return RefinementMode::PER_FIELD;
    if (lower == "batch") return RefinementMode::BATCH;
    return std::nullopt;
}

struct RefinementConfig {
    bool enabled = false;
    RefinementMode mode = RefinementMode::PER_FIELD;
    bool parallel = false;       // per_field only: dispatch fields via std::async
    bool verify_output = true;   // re-scan refined text with Layer 1
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    utils::log::Level level = utils::log::Level::INFO;
};

// ============================================================================
// Top-level Config (mirrors TOML hierarchy)
// ============================================================================

struct SanitizerConfig {
    LoggingConfig logging;
    SecretDetector::Config secrets;
    MRESynthesizer::Config mre;
    RefinementConfig refinement;
    LlmClient::Config llm;
};

} // namespace sanitizer
