#pragma once

#include "core/types.hpp"

#include <map>
#include <stop_token>
#include <string>
#include <vector>

namespace sanitizer {

/**
 * @brief Remote text-completion capability (LLM endpoint).
 *
 * complete() throws RefinementError on timeout, remote error, rate limiting
 * or cancellation. A stop request should abort an in-flight call.
 */
class ITextCompleter {
public:
    virtual ~ITextCompleter() = default;

    [[nodiscard]] virtual std::string complete(const std::string& prompt, std::stop_token stop) = 0;

    [[nodiscard]] std::string complete(const std::string& prompt) {
        return complete(prompt, std::stop_token{});
    }
};

struct RefinementItem {
    RefinementField field = RefinementField::ERROR_MESSAGE;
    std::string text;
};

/**
 * @brief Optional Layer-2 rewrite of already-redacted text.
 *
 * Every failure (remote error, malformed or empty completion, cancellation)
 * surfaces as RefinementError; callers keep the Layer-1 text.
 */
class ITextRefiner {
public:
    virtual ~ITextRefiner() = default;

    /**
     * @brief Refine one field.
     * @param error_context Already-redacted error message, used when refining code
     */
    [[nodiscard]] virtual std::string refine(RefinementField field,
                                             const std::string& text,
                                             const std::string& error_context,
                                             std::stop_token stop) = 0;

    /**
     * @brief Refine several fields in one remote call.
     * @return Refined text per requested field; every requested field is present
     */
    [[nodiscard]] virtual std::map<RefinementField, std::string> refine_batch(
        const std::vector<RefinementItem>& items,
        std::stop_token stop) = 0;
};

} // namespace sanitizer
