#include <catch2/catch_test_macros.hpp>
#include "core/llm_client.hpp"
#include "core/error.hpp"

#include <stop_token>

using namespace sanitizer;

static LlmClient::Config enabled_config() {
    LlmClient::Config cfg;
    cfg.enabled = true;
    cfg.endpoint = "http://127.0.0.1:1";
    cfg.api_key = "test-key";
    cfg.default_model = "gpt-4o-mini";
    cfg.timeout_ms = 1000;
    cfg.max_retries = 0;
    cfg.max_requests_per_minute = 60;
    cfg.cache_enabled = true;
    cfg.cache_max_entries = 100;
    cfg.cache_ttl_seconds = 3600;
    return cfg;
}

TEST_CASE("LlmClient", "[llm_client]") {

    SECTION("Disabled returns error") {
        LlmClient client;
        REQUIRE_FALSE(client.is_enabled());

        LlmRequest req;
        req.prompt = "test";
        auto resp = client.complete(req);
        REQUIRE_FALSE(resp.success);
        REQUIRE(resp.error == "LLM client is disabled");
        REQUIRE(client.get_stats().total_requests == 1);
        REQUIRE(client.get_stats().api_calls == 0);
    }

    SECTION("Disabled completer throws RefinementError") {
        LlmClient client;
        try {
            (void)client.complete(std::string("prompt"));
            FAIL("expected RefinementError");
        } catch (const RefinementError& e) {
            REQUIRE(std::string(e.what()) == "LLM client is disabled");
            REQUIRE(e.category() == ErrorCategory::REFINEMENT_ERROR);
        }
    }

    SECTION("Enabled with config") {
        LlmClient client(enabled_config());
        REQUIRE(client.is_enabled());
    }

    SECTION("Missing API key fails without a request") {
        auto cfg = enabled_config();
        cfg.api_key.clear();
        LlmClient client(cfg);

        LlmRequest req;
        req.prompt = "Sanitize <user_error>x</user_error>";
        auto resp = client.complete(req);
        REQUIRE_FALSE(resp.success);
        REQUIRE(resp.error == "No API key configured");
        REQUIRE(resp.model_used == "gpt-4o-mini");

        auto stats = client.get_stats();
        REQUIRE(stats.api_calls == 1);
        REQUIRE(stats.api_errors == 1);
    }

    SECTION("Unreachable endpoint returns error") {
        LlmClient client(enabled_config());

        LlmRequest req;
        req.prompt = "test";
        auto resp = client.complete(req);
        REQUIRE_FALSE(resp.success);
        REQUIRE_FALSE(resp.from_cache);
        REQUIRE(resp.error.starts_with("HTTP request failed"));

        // Failures are never cached
        auto again = client.complete(req);
        REQUIRE_FALSE(again.from_cache);
        REQUIRE(client.get_stats().cache_hits == 0);
        REQUIRE(client.get_stats().api_calls == 2);
    }

    SECTION("Stop before the call reports cancellation") {
        LlmClient client(enabled_config());
        std::stop_source source;
        source.request_stop();

        LlmRequest req;
        req.prompt = "test";
        auto resp = client.complete(req, source.get_token());
        REQUIRE_FALSE(resp.success);
        REQUIRE(resp.error == "cancelled");
    }

    SECTION("Rate limiting") {
        auto cfg = enabled_config();
        cfg.api_key.clear();
        cfg.max_requests_per_minute = 2;
        LlmClient client(cfg);

        LlmRequest req;
        req.prompt = "test";
        (void)client.complete(req);
        (void)client.complete(req);
        auto resp = client.complete(req);
        REQUIRE_FALSE(resp.success);
        REQUIRE(resp.error.find("Rate limited") != std::string::npos);

        auto stats = client.get_stats();
        REQUIRE(stats.total_requests == 3);
        REQUIRE(stats.api_calls == 2);
        REQUIRE(stats.rate_limited == 1);
    }
}

TEST_CASE("LlmClient cache key", "[llm_client]") {

    SECTION("SHA-256 hex digest") {
        const auto key = LlmClient::cache_key("gpt-4o-mini", "prompt");
        REQUIRE(key.size() == 64);
        REQUIRE(key.find_first_not_of("0123456789abcdef") == std::string::npos);
    }

    SECTION("Deterministic") {
        REQUIRE(LlmClient::cache_key("m", "p") == LlmClient::cache_key("m", "p"));
    }

    SECTION("Uniqueness across models") {
        REQUIRE(LlmClient::cache_key("model-a", "same input")
                != LlmClient::cache_key("model-b", "same input"));
    }

    SECTION("Uniqueness across prompts") {
        REQUIRE(LlmClient::cache_key("m", "input A") != LlmClient::cache_key("m", "input B"));
    }

    SECTION("Model and prompt boundary is unambiguous") {
        REQUIRE(LlmClient::cache_key("ab", "c") != LlmClient::cache_key("a", "bc"));
    }
}

TEST_CASE("LlmClient response parsing", "[llm_client]") {

    SECTION("OpenAI chat completion") {
        const auto content = LlmClient::extract_content(
            R"({"choices":[{"message":{"role":"assistant","content":"clean text"}}]})", "openai");
        REQUIRE(content.has_value());
        REQUIRE(*content == "clean text");
    }

    SECTION("Anthropic message joins text blocks") {
        const auto content = LlmClient::extract_content(
            R"({"content":[{"type":"text","text":"part one "},{"type":"tool_use","id":"x"},{"type":"text","text":"part two"}]})",
            "anthropic");
        REQUIRE(content.has_value());
        REQUIRE(*content == "part one part two");
    }

    SECTION("Malformed bodies") {
        REQUIRE_FALSE(LlmClient::extract_content("not json", "openai").has_value());
        REQUIRE_FALSE(LlmClient::extract_content(R"({"choices":[]})", "openai").has_value());
        REQUIRE_FALSE(LlmClient::extract_content(R"({"choices":[{"message":{"content":null}}]})",
                                                 "openai").has_value());
        REQUIRE_FALSE(LlmClient::extract_content(R"({"content":"x"})", "anthropic").has_value());
        REQUIRE_FALSE(LlmClient::extract_content("[1,2]", "anthropic").has_value());
    }

    SECTION("System prompt mentions the task") {
        REQUIRE(LlmClient::system_prompt().find("sanitization") != std::string::npos);
    }
}
