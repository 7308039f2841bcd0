#pragma once

#include "core/error.hpp"
#include "core/pipeline_builder.hpp"
#include "core/sanitization_context.hpp"
#include "core/types.hpp"
#include "refine/text_refiner.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sanitizer {

/**
 * @brief Pipeline coordinator - sequences the sanitization layers
 *
 * Layers:
 * 1. Secret detection then PII scrubbing, per field (error, context, code)
 * 1.5. MRE synthesis of the scrubbed code
 * 2. Optional refinement of the Layer-1 output (per field or batched)
 * 3. Confidence scoring over the lane-merged scans
 *
 * Content never makes sanitize() fail: refinement errors and cancellation
 * fall back to the Layer-1 text of the affected field and become warnings.
 * Only a broken setup (catalog, configuration) surfaces as SanitizerError.
 */
class SanitizationPipeline {
public:
    explicit SanitizationPipeline(PipelineComponents components);

    /**
     * @brief Sanitize one submission.
     * @param stop Cancels refinement; Layer-1 output is always completed
     */
    [[nodiscard]] SanitizationResult sanitize(const SanitizationRequest& request,
                                              std::stop_token stop = {});

    /**
     * @brief sanitize() with fatal errors returned as an error value.
     */
    [[nodiscard]] Result<SanitizationResult> try_sanitize(const SanitizationRequest& request,
                                                          std::stop_token stop = {});

    /**
     * @brief Layer 1 only, no MRE: (sanitized text, warnings).
     */
    [[nodiscard]] std::pair<std::string, std::vector<std::string>> quick_sanitize(
        const std::string& text) const;

    [[nodiscard]] bool refinement_available() const {
        return c_.refinement.enabled && c_.refiner != nullptr;
    }

    [[nodiscard]] const RefinementConfig& refinement_config() const { return c_.refinement; }

    struct Stats {
        uint64_t total_requests;
        uint64_t refinement_calls;
        uint64_t refinement_failures;
        uint64_t refinements_discarded;
        uint64_t cancellations;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            total_requests_.load(std::memory_order_relaxed),
            refinement_calls_.load(std::memory_order_relaxed),
            refinement_failures_.load(std::memory_order_relaxed),
            refinements_discarded_.load(std::memory_order_relaxed),
            cancellations_.load(std::memory_order_relaxed)
        };
    }

private:
    [[nodiscard]] LaneResult run_lane(const std::string& text) const;

    void sanitize_fields(SanitizationContext& ctx) const;
    void synthesize_mre(SanitizationContext& ctx) const;
    void refine(SanitizationContext& ctx);
    void refine_per_field(SanitizationContext& ctx, const std::vector<RefinementItem>& items);
    void refine_parallel(SanitizationContext& ctx, const std::vector<RefinementItem>& items);
    void refine_batch(SanitizationContext& ctx, const std::vector<RefinementItem>& items);
    void apply_refinement(SanitizationContext& ctx, RefinementField field, std::string refined);
    void record_refinement_failure(SanitizationContext& ctx, std::string_view what,
                                   const std::string& reason);
    [[nodiscard]] SanitizationResult build_result(SanitizationContext& ctx) const;

    PipelineComponents c_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> refinement_calls_{0};
    std::atomic<uint64_t> refinement_failures_{0};
    std::atomic<uint64_t> refinements_discarded_{0};
    std::atomic<uint64_t> cancellations_{0};
};

} // namespace sanitizer
