#include "core/result_json.hpp"

#include <format>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace sanitizer {

namespace {

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw std::invalid_argument(std::format("'{}' must be a string or null", key));
    }
    return it->get<std::string>();
}

} // anonymous namespace

void to_json(nlohmann::json& j, const Finding& finding) {
    // matched_text is the sensitive value itself and is never serialized
    j = nlohmann::json{
        {"rule_name", finding.rule_name},
        {"category", std::visit([](auto c) -> std::string {
            if constexpr (std::is_same_v<decltype(c), SecretCategory>) {
                return secret_category_to_string(c);
            } else {
                return pii_category_to_string(c);
            }
        }, finding.category)},
        {"start", finding.start},
        {"end", finding.end},
        {"confidence", finding.confidence}
    };
}

void to_json(nlohmann::json& j, const MREResult& mre) {
    auto names = nlohmann::json::array();
    for (const auto& [original, generic] : mre.names_replaced) {
        names.push_back(nlohmann::json{{"original", original}, {"generic", generic}});
    }
    j = nlohmann::json{
        {"language", language_to_string(mre.language)},
        {"imports_kept", mre.imports_kept},
        {"names_replaced", std::move(names)},
        {"line_count", mre.line_count},
        {"quality_score", mre.quality_score},
        {"syntax_valid", mre.syntax_valid},
        {"error_marker_added", mre.error_marker_added},
        {"warnings", mre.warnings}
    };
}

void to_json(nlohmann::json& j, const SanitizationResult& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"sanitized_error", result.sanitized_error},
        {"sanitized_context", result.sanitized_context},
        {"sanitized_mre", result.sanitized_mre},
        {"confidence_score", result.confidence_score},
        {"warnings", result.warnings},
        {"refinement_used", result.refinement_used},
        {"secret_findings", result.secret_scan.findings},
        {"pii_findings", result.pii_scan.findings},
        {"pii_types_found", result.pii_scan.types_found}
    };
    if (result.mre_result) {
        j["mre"] = *result.mre_result;
    } else {
        j["mre"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, SanitizationRequest& request) {
    if (!j.is_object()) {
        throw std::invalid_argument("request must be a JSON object");
    }
    const auto error = j.find("error_message");
    if (error == j.end() || !error->is_string()) {
        throw std::invalid_argument("'error_message' is required and must be a string");
    }
    request.error_message = error->get<std::string>();
    request.error_context = optional_string(j, "error_context");
    request.code_snippet = optional_string(j, "code_snippet");

    const auto refine = j.find("use_refinement");
    if (refine != j.end() && !refine->is_null()) {
        if (!refine->is_boolean()) {
            throw std::invalid_argument("'use_refinement' must be a boolean");
        }
        request.use_refinement = refine->get<bool>();
    }
}

std::string to_output_string(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace sanitizer
