#pragma once

#include "core/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace sanitizer {

/**
 * @brief Reduce a merged finding set to a non-overlapping one.
 *
 * Findings are ordered by start, longest first on equal start; a finding is
 * kept only when it starts at or after the end of the last kept one. The sort
 * is stable, so on an exact tie the finding that came first in the input wins.
 */
[[nodiscard]] std::vector<Finding> resolve_overlaps(std::vector<Finding> findings);

using ReplacementFn = std::function<std::string(const Finding&)>;

/**
 * @brief Replace every finding span in text.
 *
 * Findings must be non-overlapping and sorted by start. Replacement tokens
 * are produced in ascending order (so indexed placeholders number left to
 * right) and spliced from the highest offset downward.
 */
[[nodiscard]] std::string apply_redactions(const std::string& text,
                                           const std::vector<Finding>& findings,
                                           const ReplacementFn& replacement);

} // namespace sanitizer
