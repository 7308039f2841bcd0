#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sanitizer {

/**
 * @brief Maps domain identifiers to generic names for one synthesis call.
 *
 * collect() may be called on several fragments (body, imports); each distinct
 * identifier gets one replacement from its pool (class, function, variable),
 * falling back to Class{n} / func_{n} / var_{n} once a pool is exhausted.
 * apply() substitutes whole words, longest identifier first.
 */
class NameAbstractor {
public:
    enum class Kind : uint8_t { CLASS, FUNCTION, VARIABLE };

    void collect(const std::string& code);

    [[nodiscard]] std::string apply(const std::string& code) const;

    // original -> generic, in order of first discovery
    [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& replacements() const {
        return replacements_;
    }

    [[nodiscard]] bool empty() const { return replacements_.empty(); }

private:
    void assign(const std::string& original, Kind kind);
    std::string next_generic(Kind kind);

    std::vector<std::pair<std::string, std::string>> replacements_;
    std::unordered_map<std::string, std::string> lookup_;
    size_t class_counter_ = 0;
    size_t function_counter_ = 0;
    size_t variable_counter_ = 0;
};

} // namespace sanitizer
