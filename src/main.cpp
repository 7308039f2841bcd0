#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/llm_client.hpp"
#include "core/pipeline.hpp"
#include "core/result_json.hpp"
#include "core/utils.hpp"
#include "refine/llm_refiner.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

using namespace sanitizer;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitBadInput = 2;

// Signal handler only flips this; the stop_source is polled by the watcher
volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int /*signal*/) {
    g_interrupted = 1;
}

struct CliOptions {
    std::optional<std::string> config_file;
    bool quick = false;
    bool no_refine = false;
};

void print_usage(std::string_view program) {
    std::cerr << std::format(
        "Usage: {} [--config path.toml] [--quick] [--no-refine]\n"
        "  Reads a JSON request from stdin and writes the sanitized result to stdout.\n"
        "  --quick      Layer-1 only: raw text in, {{\"sanitized_text\", \"warnings\"}} out\n"
        "  --no-refine  Never call the refinement layer\n",
        program);
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if (arg == "--quick") {
            opts.quick = true;
        } else if (arg == "--no-refine") {
            opts.no_refine = true;
        } else {
            return std::nullopt;
        }
    }
    return opts;
}

std::string read_stdin() {
    return {std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
}

int write_output(const nlohmann::json& j) {
    try {
        std::cout << to_output_string(j) << '\n';
    } catch (const nlohmann::json::exception& e) {
        utils::log::error(std::format("Failed to serialize result: {}", e.what()));
        return kExitBadInput;
    }
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return kExitBadInput;
    }

    // [1/3] Configuration
    SanitizerConfig config;
    if (opts->config_file) {
        auto loaded = ConfigLoader::load_from_file(*opts->config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return kExitConfigError;
        }
        config = std::move(loaded.config);
    }
    utils::log::set_level(config.logging.level);

    if (opts->no_refine) {
        config.refinement.enabled = false;
    }
    if (config.refinement.enabled && !config.llm.enabled) {
        utils::log::warn("refinement.enabled is set but llm.enabled is not, refinement disabled");
        config.refinement.enabled = false;
    }

    // [2/3] Pipeline
    std::shared_ptr<LlmClient> llm_client;
    std::shared_ptr<SanitizationPipeline> pipeline;
    try {
        PipelineBuilder builder;
        builder.with_config(config);
        if (config.refinement.enabled) {
            llm_client = std::make_shared<LlmClient>(config.llm);
            builder.with_refiner(std::make_shared<LlmRefiner>(*llm_client));
            utils::log::info(std::format("Refinement enabled: provider={}, model={}, mode={}",
                                         config.llm.provider, config.llm.default_model,
                                         refinement_mode_to_string(config.refinement.mode)));
        }
        pipeline = builder.build();
    } catch (const SanitizerError& e) {
        utils::log::error(std::format("Fatal ({}): {}", error_category_to_string(e.category()), e.what()));
        return kExitConfigError;
    }

    // [3/3] Process stdin
    const std::string input = read_stdin();

    if (opts->quick) {
        auto [text, warnings] = pipeline->quick_sanitize(input);
        return write_output(nlohmann::json{{"sanitized_text", text}, {"warnings", warnings}});
    }

    SanitizationRequest request;
    request.use_refinement = pipeline->refinement_available();
    try {
        nlohmann::json::parse(input).get_to(request);
    } catch (const nlohmann::json::exception& e) {
        utils::log::error(std::format("Invalid request JSON: {}", e.what()));
        return kExitBadInput;
    } catch (const std::invalid_argument& e) {
        utils::log::error(std::format("Invalid request: {}", e.what()));
        return kExitBadInput;
    }
    request.use_refinement = pipeline->refinement_available() && request.use_refinement;

    // SIGINT/SIGTERM cancel refinement; Layer-1 output is still written
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::stop_source stop_source;
    std::jthread watcher([&stop_source](std::stop_token done) {
        while (!done.stop_requested()) {
            if (g_interrupted) {
                utils::log::warn("Interrupted, cancelling refinement");
                stop_source.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    const auto result = pipeline->try_sanitize(request, stop_source.get_token());
    watcher.request_stop();

    if (result.is_error()) {
        utils::log::error(std::format("Fatal ({}): {}",
                                      error_category_to_string(result.error_category()),
                                      result.error_message()));
        return kExitConfigError;
    }

    return write_output(nlohmann::json(result.value()));
}
