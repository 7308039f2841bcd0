#include "core/pipeline_builder.hpp"
#include "core/error.hpp"
#include "core/pipeline.hpp"
#include "mre/mre_synthesizer.hpp"
#include "refine/text_refiner.hpp"
#include "security/pii_scrubber.hpp"
#include "security/secret_detector.hpp"

namespace sanitizer {

PipelineBuilder& PipelineBuilder::with_config(const SanitizerConfig& config) {
    c_.secret_detector = std::make_shared<SecretDetector>(config.secrets);
    c_.mre_synthesizer = std::make_shared<MRESynthesizer>(config.mre);
    c_.refinement = config.refinement;
    return *this;
}

std::shared_ptr<SanitizationPipeline> PipelineBuilder::build() {
    if (c_.refinement.enabled && !c_.refiner) {
        throw SanitizerError(ErrorCategory::CONFIG_ERROR,
                             "PipelineBuilder: refinement is enabled but no refiner was supplied");
    }

    if (!c_.secret_detector) c_.secret_detector = std::make_shared<SecretDetector>();
    if (!c_.pii_scrubber) c_.pii_scrubber = std::make_shared<PiiScrubber>();
    if (!c_.mre_synthesizer) c_.mre_synthesizer = std::make_shared<MRESynthesizer>();

    return std::make_shared<SanitizationPipeline>(std::move(c_));
}

} // namespace sanitizer
