#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "mre/mre_synthesizer.hpp"
#include "scoring/confidence_scorer.hpp"
#include "security/pii_scrubber.hpp"
#include "security/secret_detector.hpp"

#include <format>
#include <future>

namespace sanitizer {

namespace {

std::string& field_text(SanitizationContext& ctx, RefinementField field) {
    switch (field) {
        case RefinementField::CONTEXT: return ctx.sanitized_context;
        case RefinementField::CODE:    return ctx.sanitized_code;
        case RefinementField::ERROR_MESSAGE:
        default:                       return ctx.sanitized_error;
    }
}

void add_lane_warnings(SanitizationContext& ctx, const LaneResult& lane, std::string_view lane_name) {
    if (!lane.secret_scan.findings.empty()) {
        ctx.warnings.push_back(std::format("Layer 1: Removed {} potential secrets from {}",
                                           lane.secret_scan.findings.size(), lane_name));
    }
    if (has_private_key_material(lane.secret_scan)) {
        ctx.warnings.push_back(std::format("Layer 1: private key material redacted from {}", lane_name));
    }
    if (!lane.pii_scan.findings.empty()) {
        ctx.warnings.push_back(std::format("Layer 1: Replaced {} PII items in {}",
                                           lane.pii_scan.findings.size(), lane_name));
    }
}

void merge_lane(SecretScanResult& secret, PiiScanResult& pii, const LaneResult& lane) {
    ConfidenceScorer::merge_into(secret, lane.secret_scan);
    ConfidenceScorer::merge_into(pii, lane.pii_scan);
    pii.types_found.insert(lane.pii_scan.types_found.begin(), lane.pii_scan.types_found.end());
}

} // anonymous namespace

SanitizationPipeline::SanitizationPipeline(PipelineComponents components)
    : c_(std::move(components)) {
    if (!c_.secret_detector || !c_.pii_scrubber || !c_.mre_synthesizer) {
        throw SanitizerError(ErrorCategory::CONFIG_ERROR,
                             "SanitizationPipeline: Layer-1 components are required");
    }
}

// ============================================================================
// Entry points
// ============================================================================

SanitizationResult SanitizationPipeline::sanitize(const SanitizationRequest& request,
                                                  std::stop_token stop) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    SanitizationContext ctx;
    ctx.request = &request;
    ctx.stop = std::move(stop);

    // Layer 1: Secrets + PII, per field
    sanitize_fields(ctx);

    // Layer 1.5: MRE synthesis of the scrubbed code
    synthesize_mre(ctx);

    // Layer 2: Refinement
    if (request.use_refinement) {
        if (refinement_available()) {
            refine(ctx);
        } else {
            ctx.warnings.emplace_back("Layer 2: refinement unavailable, using Layer 1 only");
        }
    }

    // Layer 3: Score + assemble
    return build_result(ctx);
}

Result<SanitizationResult> SanitizationPipeline::try_sanitize(const SanitizationRequest& request,
                                                              std::stop_token stop) {
    try {
        return Result<SanitizationResult>::ok(sanitize(request, std::move(stop)));
    } catch (const SanitizerError& e) {
        utils::log::error(std::format("Sanitization failed ({}): {}",
                                      error_category_to_string(e.category()), e.what()));
        return Result<SanitizationResult>::error(e.category(), e.what());
    } catch (const std::exception& e) {
        utils::log::error(std::format("Sanitization failed: {}", e.what()));
        return Result<SanitizationResult>::error(ErrorCategory::INTERNAL_ERROR, e.what());
    }
}

std::pair<std::string, std::vector<std::string>> SanitizationPipeline::quick_sanitize(
    const std::string& text) const {
    auto lane = run_lane(text);

    std::vector<std::string> warnings;
    if (!lane.secret_scan.findings.empty()) {
        warnings.push_back(std::format("Removed {} potential secrets", lane.secret_scan.findings.size()));
    }
    if (!lane.pii_scan.findings.empty()) {
        warnings.push_back(std::format("Replaced {} PII items", lane.pii_scan.findings.size()));
    }
    return {std::move(lane.text), std::move(warnings)};
}

// ============================================================================
// Layer 1
// ============================================================================

LaneResult SanitizationPipeline::run_lane(const std::string& text) const {
    LaneResult lane;
    lane.secret_scan = c_.secret_detector->detect(text);
    lane.pii_scan = c_.pii_scrubber->scrub(lane.secret_scan.sanitized_text);
    lane.text = lane.pii_scan.sanitized_text;
    return lane;
}

void SanitizationPipeline::sanitize_fields(SanitizationContext& ctx) const {
    const auto& request = *ctx.request;

    ctx.error_lane = run_lane(request.error_message);
    ctx.sanitized_error = ctx.error_lane.text;
    add_lane_warnings(ctx, ctx.error_lane, "error");

    if (request.error_context && !request.error_context->empty()) {
        ctx.context_lane = run_lane(*request.error_context);
        ctx.sanitized_context = ctx.context_lane->text;
        add_lane_warnings(ctx, *ctx.context_lane, "context");
    }

    if (request.code_snippet && !request.code_snippet->empty()) {
        ctx.code_lane = run_lane(*request.code_snippet);
        ctx.sanitized_code = ctx.code_lane->text;
        add_lane_warnings(ctx, *ctx.code_lane, "code");
    }
}

void SanitizationPipeline::synthesize_mre(SanitizationContext& ctx) const {
    if (!ctx.code_lane) return;

    auto mre = c_.mre_synthesizer->synthesize(ctx.code_lane->text, ctx.error_lane.text);
    ctx.sanitized_code = mre.synthesized_mre;

    for (const auto& w : mre.warnings) {
        ctx.warnings.push_back(std::format("Layer 1: {}", w));
    }
    if (!mre.names_replaced.empty()) {
        ctx.warnings.push_back(std::format("Layer 1: Abstracted {} domain-specific names",
                                           mre.names_replaced.size()));
    }
    ctx.mre_result = std::move(mre);
}

// ============================================================================
// Layer 2
// ============================================================================

void SanitizationPipeline::refine(SanitizationContext& ctx) {
    if (ctx.stop.stop_requested()) {
        cancellations_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn("Refinement cancelled before dispatch, keeping Layer-1 output");
        ctx.warnings.emplace_back("Layer 2: refinement cancelled, using Layer 1 only");
        return;
    }

    std::vector<RefinementItem> items;
    if (!ctx.sanitized_error.empty()) {
        items.push_back({RefinementField::ERROR_MESSAGE, ctx.sanitized_error});
    }
    if (!ctx.sanitized_context.empty()) {
        items.push_back({RefinementField::CONTEXT, ctx.sanitized_context});
    }
    if (!ctx.sanitized_code.empty()) {
        items.push_back({RefinementField::CODE, ctx.sanitized_code});
    }
    if (items.empty()) return;

    if (c_.refinement.mode == RefinementMode::BATCH) {
        refine_batch(ctx, items);
    } else if (c_.refinement.parallel) {
        refine_parallel(ctx, items);
    } else {
        refine_per_field(ctx, items);
    }
}

void SanitizationPipeline::refine_per_field(SanitizationContext& ctx,
                                            const std::vector<RefinementItem>& items) {
    for (const auto& item : items) {
        const auto* name = refinement_field_to_string(item.field);
        if (ctx.stop.stop_requested()) {
            record_refinement_failure(ctx, name, "cancelled");
            continue;
        }
        refinement_calls_.fetch_add(1, std::memory_order_relaxed);
        try {
            apply_refinement(ctx, item.field,
                             c_.refiner->refine(item.field, item.text, ctx.error_lane.text, ctx.stop));
        } catch (const std::exception& e) {
            record_refinement_failure(ctx, name, e.what());
        }
    }
}

void SanitizationPipeline::refine_parallel(SanitizationContext& ctx,
                                           const std::vector<RefinementItem>& items) {
    std::vector<std::future<std::string>> pending;
    pending.reserve(items.size());
    for (const auto& item : items) {
        refinement_calls_.fetch_add(1, std::memory_order_relaxed);
        pending.push_back(std::async(std::launch::async,
            [refiner = c_.refiner, item, error_context = ctx.error_lane.text, stop = ctx.stop] {
                return refiner->refine(item.field, item.text, error_context, stop);
            }));
    }

    // Applied in field order regardless of completion order
    for (size_t i = 0; i < items.size(); ++i) {
        const auto* name = refinement_field_to_string(items[i].field);
        try {
            apply_refinement(ctx, items[i].field, pending[i].get());
        } catch (const std::exception& e) {
            record_refinement_failure(ctx, name, e.what());
        }
    }
}

void SanitizationPipeline::refine_batch(SanitizationContext& ctx,
                                        const std::vector<RefinementItem>& items) {
    refinement_calls_.fetch_add(1, std::memory_order_relaxed);

    std::map<RefinementField, std::string> refined;
    try {
        refined = c_.refiner->refine_batch(items, ctx.stop);
    } catch (const std::exception& e) {
        record_refinement_failure(ctx, "batch", e.what());
        return;
    }

    for (const auto& item : items) {
        const auto it = refined.find(item.field);
        if (it == refined.end()) {
            record_refinement_failure(ctx, refinement_field_to_string(item.field),
                                      "missing from batch completion");
            continue;
        }
        apply_refinement(ctx, item.field, std::move(it->second));
    }
}

void SanitizationPipeline::apply_refinement(SanitizationContext& ctx,
                                            RefinementField field,
                                            std::string refined) {
    const auto* name = refinement_field_to_string(field);

    // A result that arrives after a stop request is never used
    if (ctx.stop.stop_requested()) {
        record_refinement_failure(ctx, name, "cancelled");
        return;
    }

    if (c_.refinement.verify_output) {
        const auto recheck = run_lane(refined);
        const size_t leaked = recheck.secret_scan.findings.size() + recheck.pii_scan.findings.size();
        if (leaked > 0) {
            refinements_discarded_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Discarded {} refinement: {} sensitive items in output",
                                         name, leaked));
            ctx.warnings.push_back(std::format(
                "Layer 2: {} refinement discarded, output contained {} sensitive items", name, leaked));
            return;
        }
    }

    auto& current = field_text(ctx, field);
    if (refined == current) return;

    current = std::move(refined);
    ctx.refinement_used = true;
    ctx.warnings.push_back(std::format("Layer 2: Refined {}", name));
}

void SanitizationPipeline::record_refinement_failure(SanitizationContext& ctx,
                                                     std::string_view what,
                                                     const std::string& reason) {
    if (ctx.stop.stop_requested()) {
        cancellations_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Refinement of {} cancelled, keeping Layer-1 output", what));
        ctx.warnings.push_back(std::format("Layer 2: {} refinement cancelled, using Layer 1 output", what));
        return;
    }

    refinement_failures_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format("Refinement of {} failed: {}", what, reason));
    ctx.warnings.push_back(std::format("Layer 2: {} refinement failed: {}, using Layer 1 output",
                                       what, reason));
}

// ============================================================================
// Layer 3
// ============================================================================

SanitizationResult SanitizationPipeline::build_result(SanitizationContext& ctx) const {
    SanitizationResult result;

    result.secret_scan = ctx.error_lane.secret_scan;
    result.pii_scan = ctx.error_lane.pii_scan;
    if (ctx.context_lane) merge_lane(result.secret_scan, result.pii_scan, *ctx.context_lane);
    if (ctx.code_lane) merge_lane(result.secret_scan, result.pii_scan, *ctx.code_lane);

    result.confidence_score = ConfidenceScorer::score(
        result.secret_scan, result.pii_scan, ctx.mre_result, ctx.refinement_used);

    result.success = true;
    result.sanitized_error = std::move(ctx.sanitized_error);
    result.sanitized_context = std::move(ctx.sanitized_context);
    result.sanitized_mre = std::move(ctx.sanitized_code);
    result.refinement_used = ctx.refinement_used;
    result.mre_result = std::move(ctx.mre_result);
    result.warnings = std::move(ctx.warnings);

    utils::log::debug(std::format(
        "Sanitized request: {} secrets, {} PII items, mre={}, refined={}, confidence={:.2f} in {}us",
        result.secret_scan.findings.size(), result.pii_scan.findings.size(),
        result.mre_result.has_value(), result.refinement_used,
        result.confidence_score, ctx.timer.elapsed_us().count()));

    return result;
}

} // namespace sanitizer
