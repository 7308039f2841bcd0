#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace sanitizer {

class ILanguageAnalyzer;

/**
 * @brief Rewrites an already-redacted snippet into a minimal reproducible example.
 *
 * Steps: language detection, import filtering (Python), domain-name
 * abstraction, error-site marker, truncation, syntax validation (Python),
 * quality scoring. All per-call state (name pools, counters) lives inside
 * synthesize(), so one instance can serve concurrent callers.
 */
class MRESynthesizer {
public:
    struct Config {
        size_t max_lines = 50;
        size_t error_summary_chars = 100;
    };

    MRESynthesizer() : MRESynthesizer(Config{}) {}
    explicit MRESynthesizer(const Config& config) : config_(config) {}

    [[nodiscard]] MREResult synthesize(const std::string& code,
                                       const std::optional<std::string>& error_message = std::nullopt) const;

    /**
     * @brief Score from line band, abstraction density, syntax and error marker.
     */
    [[nodiscard]] static double quality_score(const MREResult& result);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    std::string add_error_marker(const std::string& body,
                                 const std::optional<std::string>& error_message,
                                 std::string_view comment_prefix,
                                 bool& marked) const;

    std::string truncate(const std::string& code, std::string_view comment_prefix) const;

    Config config_;
};

} // namespace sanitizer
