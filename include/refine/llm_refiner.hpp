#pragma once

#include "refine/text_refiner.hpp"

#include <string>
#include <string_view>

namespace sanitizer {

/**
 * @brief ITextRefiner over a text completer, using XML-delimited prompts.
 *
 * User-controlled text only ever appears inside its <user_*> element, with
 * '&', '<' and '>' escaped, so it cannot close the element or open a new
 * instruction region.
 */
class LlmRefiner : public ITextRefiner {
public:
    explicit LlmRefiner(ITextCompleter& completer) : completer_(completer) {}

    [[nodiscard]] std::string refine(RefinementField field,
                                     const std::string& text,
                                     const std::string& error_context,
                                     std::stop_token stop) override;

    [[nodiscard]] std::map<RefinementField, std::string> refine_batch(
        const std::vector<RefinementItem>& items,
        std::stop_token stop) override;

    [[nodiscard]] static std::string build_prompt(RefinementField field,
                                                  const std::string& text,
                                                  const std::string& error_context);

    [[nodiscard]] static std::string build_batch_prompt(const std::vector<RefinementItem>& items);

    [[nodiscard]] static std::string escape_xml(std::string_view text);
    [[nodiscard]] static std::string unescape_xml(std::string_view text);

    /**
     * @brief Trim and drop a surrounding ```lang ... ``` fence, if any.
     */
    [[nodiscard]] static std::string strip_code_fences(const std::string& text);

private:
    ITextCompleter& completer_;
};

} // namespace sanitizer
