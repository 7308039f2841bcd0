#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sanitizer {

// nlohmann::json ADL hooks for the CLI wire format

void to_json(nlohmann::json& j, const Finding& finding);
void to_json(nlohmann::json& j, const MREResult& mre);
void to_json(nlohmann::json& j, const SanitizationResult& result);

/**
 * @brief {"error_message": str, "error_context"?: str|null, "code_snippet"?: str|null,
 *         "use_refinement"?: bool}
 * @throws std::invalid_argument on a missing or mistyped field
 */
void from_json(const nlohmann::json& j, SanitizationRequest& request);

/**
 * @brief Pretty-printed output document. Invalid UTF-8 in a string (raw
 * --quick input, a span cut inside a multi-byte sequence) is written as
 * U+FFFD instead of failing the dump.
 */
[[nodiscard]] std::string to_output_string(const nlohmann::json& j);

} // namespace sanitizer
