#pragma once

#include "config/config_types.hpp"

#include <memory>

namespace sanitizer {

// Forward declarations
class SecretDetector;
class PiiScrubber;
class MRESynthesizer;
class ITextRefiner;
class SanitizationPipeline;

/**
 * @brief All components that SanitizationPipeline needs, grouped in a single struct.
 */
struct PipelineComponents {
    // Layer 1 (nullptr = default-configured instance)
    std::shared_ptr<SecretDetector> secret_detector;
    std::shared_ptr<PiiScrubber> pii_scrubber;
    std::shared_ptr<MRESynthesizer> mre_synthesizer;

    // Layer 2 (nullptr = refinement unavailable)
    std::shared_ptr<ITextRefiner> refiner;
    RefinementConfig refinement;
};

/**
 * @brief Builder pattern for SanitizationPipeline construction.
 *
 * Usage:
 *   auto pipeline = PipelineBuilder()
 *       .with_secret_detector(detector)
 *       .with_refiner(refiner)              // optional
 *       .with_refinement_config(config)     // optional
 *       .build();
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_secret_detector(std::shared_ptr<SecretDetector> p)   { c_.secret_detector = std::move(p); return *this; }
    PipelineBuilder& with_pii_scrubber(std::shared_ptr<PiiScrubber> p)         { c_.pii_scrubber = std::move(p); return *this; }
    PipelineBuilder& with_mre_synthesizer(std::shared_ptr<MRESynthesizer> p)   { c_.mre_synthesizer = std::move(p); return *this; }
    PipelineBuilder& with_refiner(std::shared_ptr<ITextRefiner> p)             { c_.refiner = std::move(p); return *this; }
    PipelineBuilder& with_refinement_config(const RefinementConfig& config)    { c_.refinement = config; return *this; }

    /**
     * @brief Build from a loaded config; refiner is still supplied separately.
     */
    PipelineBuilder& with_config(const SanitizerConfig& config);

    /**
     * @brief Build the pipeline, default-constructing missing Layer-1 components.
     * @throws SanitizerError (CONFIG_ERROR) if refinement is enabled without a refiner,
     *         (CATALOG_ERROR) if the pattern catalog fails to compile.
     */
    [[nodiscard]] std::shared_ptr<SanitizationPipeline> build();

private:
    PipelineComponents c_;
};

} // namespace sanitizer
