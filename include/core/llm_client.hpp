#pragma once

#include "refine/text_refiner.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>

namespace sanitizer {

struct LlmRequest {
    std::string prompt;
    std::string model;          // empty = Config::default_model
    double temperature = 0.0;
    int max_tokens = 2048;
};

struct LlmResponse {
    bool success = false;
    std::string content;
    std::string error;
    std::string model_used;
    bool from_cache = false;
    std::chrono::milliseconds latency{0};
};

/**
 * @brief LLM client backing the refinement layer.
 *
 * OpenAI- or Anthropic-compatible chat API via httplib::Client.
 * Features:
 * - Response cache keyed by SHA-256 of model + prompt
 * - Per-minute rate limit on API calls
 * - Retry with backoff on HTTP 429 and connection errors
 * - Cancellation: a stop request aborts the in-flight HTTP call
 *
 * Only already-redacted text is ever sent.
 */
class LlmClient : public ITextCompleter {
public:
    struct Config {
        bool enabled = false;
        std::string provider = "openai";    // "openai" | "anthropic"
        std::string endpoint = "https://api.openai.com";
        std::string api_key;
        std::string default_model = "gpt-4o-mini";
        uint32_t timeout_ms = 30000;
        uint32_t max_retries = 2;
        uint32_t max_requests_per_minute = 60;
        bool cache_enabled = true;
        size_t cache_max_entries = 1000;
        uint32_t cache_ttl_seconds = 3600;
    };

    LlmClient();
    explicit LlmClient(Config config);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    // Core API
    [[nodiscard]] LlmResponse complete(const LlmRequest& request, std::stop_token stop = {});

    // ITextCompleter: throws RefinementError when the response is not a success
    using ITextCompleter::complete;
    [[nodiscard]] std::string complete(const std::string& prompt, std::stop_token stop) override;

    [[nodiscard]] static std::string system_prompt();

    // Cache key generation (for testing)
    [[nodiscard]] static std::string cache_key(const std::string& model, const std::string& prompt);

    // Provider response body -> completion text; nullopt on a malformed body
    [[nodiscard]] static std::optional<std::string> extract_content(const std::string& body,
                                                                    const std::string& provider);

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t cache_hits = 0;
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
        uint64_t rate_limited = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] LlmResponse call_api(const std::string& user_prompt,
                                       const std::string& model,
                                       double temperature,
                                       int max_tokens,
                                       std::stop_token stop);

    [[nodiscard]] bool check_rate_limit();

    Config config_;

    // Response cache
    struct CacheEntry {
        LlmResponse response;
        std::chrono::steady_clock::time_point expires_at;
    };
    std::unordered_map<std::string, CacheEntry> cache_;
    mutable std::shared_mutex cache_mutex_;

    // Rate limiting
    std::atomic<uint32_t> requests_this_minute_{0};
    std::chrono::steady_clock::time_point minute_start_ =
        std::chrono::steady_clock::now();
    std::mutex rate_mutex_;

    // Stats
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
    std::atomic<uint64_t> rate_limited_{0};
};

} // namespace sanitizer
