#include "core/llm_client.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <format>
#include <thread>

namespace sanitizer {

namespace {

// Backoff sleep that wakes early on a stop request
bool sleep_unless_stopped(std::chrono::milliseconds duration, const std::stop_token& stop) {
    constexpr auto kSlice = std::chrono::milliseconds(50);
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        if (stop.stop_requested()) return false;
        std::this_thread::sleep_for(kSlice);
    }
    return !stop.stop_requested();
}

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

LlmClient::LlmClient() = default;

LlmClient::LlmClient(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// System Prompt
// ============================================================================

std::string LlmClient::system_prompt() {
    return "You are a privacy sanitization assistant for a public knowledge base of "
           "software errors. You rewrite error messages, descriptions and code so they "
           "contain no secrets, credentials, personal information or proprietary names, "
           "while keeping the technical content needed to understand the problem. "
           "Follow the output format requested in the user message exactly.";
}

// ============================================================================
// Cache Key Generation
// ============================================================================

std::string LlmClient::cache_key(const std::string& model, const std::string& prompt) {
    const std::string combined = model + '\0' + prompt;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    EVP_Digest(
        combined.data(), combined.size(),
        hash, &hash_len,
        EVP_sha256(), nullptr);

    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += std::format("{:02x}", hash[i]);
    }
    return hex;
}

// ============================================================================
// Rate Limiting
// ============================================================================

bool LlmClient::check_rate_limit() {
    std::lock_guard lock(rate_mutex_);
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        now - minute_start_);

    if (elapsed.count() >= 60) {
        minute_start_ = now;
        requests_this_minute_.store(0, std::memory_order_relaxed);
    }

    const uint32_t current = requests_this_minute_.load(std::memory_order_relaxed);
    if (current >= config_.max_requests_per_minute) {
        return false;
    }

    requests_this_minute_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

// ============================================================================
// Core API
// ============================================================================

LlmResponse LlmClient::complete(const LlmRequest& request, std::stop_token stop) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (!config_.enabled) {
        return {.success = false, .error = "LLM client is disabled"};
    }

    const auto model = request.model.empty() ? config_.default_model : request.model;
    const auto key = cache_key(model, request.prompt);

    // Check cache (read path, shared lock)
    if (config_.cache_enabled) {
        std::shared_lock lock(cache_mutex_);
        const auto it = cache_.find(key);
        if (it != cache_.end() && std::chrono::steady_clock::now() < it->second.expires_at) {
            cache_hits_.fetch_add(1, std::memory_order_relaxed);
            auto response = it->second.response;
            response.from_cache = true;
            return response;
        }
    }

    if (!check_rate_limit()) {
        rate_limited_.fetch_add(1, std::memory_order_relaxed);
        return {.success = false, .error = "Rate limited: too many LLM API requests"};
    }

    auto response = call_api(request.prompt, model, request.temperature, request.max_tokens, stop);

    if (response.success && config_.cache_enabled && config_.cache_max_entries > 0) {
        const auto expires = std::chrono::steady_clock::now() +
                             std::chrono::seconds(config_.cache_ttl_seconds);

        std::unique_lock lock(cache_mutex_);

        // Evict the entry closest to expiry when at capacity
        if (cache_.size() >= config_.cache_max_entries) {
            auto oldest_it = cache_.begin();
            for (auto it = cache_.begin(); it != cache_.end(); ++it) {
                if (it->second.expires_at < oldest_it->second.expires_at) {
                    oldest_it = it;
                }
            }
            cache_.erase(oldest_it);
        }

        cache_[key] = {response, expires};
    }

    return response;
}

std::string LlmClient::complete(const std::string& prompt, std::stop_token stop) {
    LlmRequest request;
    request.prompt = prompt;
    auto response = complete(request, stop);
    if (!response.success) {
        throw RefinementError(response.error);
    }
    return std::move(response.content);
}

// ============================================================================
// LLM Response Parsing
// ============================================================================

std::optional<std::string> LlmClient::extract_content(const std::string& body,
                                                      const std::string& provider) {
    const auto json = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }

    if (provider == "anthropic") {
        // {"content":[{"type":"text","text":"..."}]}
        const auto content = json.find("content");
        if (content == json.end() || !content->is_array()) return std::nullopt;
        std::string text;
        for (const auto& block : *content) {
            if (block.is_object() && block.value("type", "") == "text") {
                const auto t = block.find("text");
                if (t != block.end() && t->is_string()) {
                    text += t->get<std::string>();
                }
            }
        }
        return text;
    }

    // {"choices":[{"message":{"content":"..."}}]}
    const auto choices = json.find("choices");
    if (choices == json.end() || !choices->is_array() || choices->empty()) return std::nullopt;
    const auto& first = (*choices)[0];
    if (!first.is_object()) return std::nullopt;
    const auto message = first.find("message");
    if (message == first.end() || !message->is_object()) return std::nullopt;
    const auto content = message->find("content");
    if (content == message->end() || !content->is_string()) return std::nullopt;
    return content->get<std::string>();
}

// ============================================================================
// API Call
// ============================================================================

LlmResponse LlmClient::call_api(
    const std::string& user_prompt,
    const std::string& model,
    double temperature,
    int max_tokens,
    std::stop_token stop) {
    api_calls_.fetch_add(1, std::memory_order_relaxed);

    const auto start = std::chrono::steady_clock::now();

    if (config_.api_key.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {.success = false, .error = "No API key configured", .model_used = model};
    }

    if (config_.endpoint.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {.success = false, .error = "No endpoint configured", .model_used = model};
    }

    const bool anthropic = config_.provider == "anthropic";

    // Build JSON request body
    std::string json_body;
    if (anthropic) {
        json_body = std::format(
            R"({{"model":"{}","max_tokens":{},"temperature":{},"system":"{}","messages":[{{"role":"user","content":"{}"}}]}})",
            utils::escape_json(model), max_tokens, temperature,
            utils::escape_json(system_prompt()),
            utils::escape_json(user_prompt));
    } else {
        json_body = std::format(
            R"({{"model":"{}","temperature":{},"max_tokens":{},"messages":[{{"role":"system","content":"{}"}},{{"role":"user","content":"{}"}}]}})",
            utils::escape_json(model), temperature, max_tokens,
            utils::escape_json(system_prompt()),
            utils::escape_json(user_prompt));
    }

    // HTTP client
    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));

    // Abort the blocking request when the caller cancels
    std::stop_callback on_stop(stop, [&cli] { cli.stop(); });

    httplib::Headers headers;
    std::string path;

    if (anthropic) {
        headers = {
            {"x-api-key", config_.api_key},
            {"anthropic-version", "2023-06-01"},
            {"content-type", "application/json"}
        };
        path = "/v1/messages";
    } else {
        headers = {
            {"Authorization", "Bearer " + config_.api_key},
            {"content-type", "application/json"}
        };
        path = "/v1/chat/completions";
    }

    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (stop.stop_requested()) {
            return {.success = false, .error = "cancelled", .model_used = model,
                    .latency = elapsed_since(start)};
        }

        const auto res = cli.Post(path, headers, json_body, "application/json");

        if (!res) {
            if (stop.stop_requested()) {
                return {.success = false, .error = "cancelled", .model_used = model,
                        .latency = elapsed_since(start)};
            }
            if (attempt < config_.max_retries) continue;
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return {.success = false,
                    .error = std::format("HTTP request failed: {}", httplib::to_string(res.error())),
                    .model_used = model, .latency = elapsed_since(start)};
        }

        if (res->status == httplib::StatusCode::TooManyRequests_429 && attempt < config_.max_retries) {
            if (!sleep_unless_stopped(std::chrono::milliseconds(1000 * (attempt + 1)), stop)) {
                return {.success = false, .error = "cancelled", .model_used = model,
                        .latency = elapsed_since(start)};
            }
            continue;
        }

        if (res->status != httplib::StatusCode::OK_200) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("LLM API error: HTTP {}", res->status));
            return {.success = false,
                    .error = std::format("API error: HTTP {} - {}", res->status, res->body.substr(0, 200)),
                    .model_used = model, .latency = elapsed_since(start)};
        }

        auto content = extract_content(res->body, config_.provider);
        if (!content) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return {.success = false, .error = "Malformed API response body",
                    .model_used = model, .latency = elapsed_since(start)};
        }

        return {.success = true, .content = std::move(*content), .model_used = model,
                .latency = elapsed_since(start)};
    }

    api_errors_.fetch_add(1, std::memory_order_relaxed);
    return {.success = false, .error = "Max retries exceeded", .model_used = model,
            .latency = elapsed_since(start)};
}

// ============================================================================
// Stats
// ============================================================================

LlmClient::Stats LlmClient::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        cache_hits_.load(std::memory_order_relaxed),
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed),
        rate_limited_.load(std::memory_order_relaxed)
    };
}

} // namespace sanitizer
