#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace sanitizer {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

// Negative counts collapse to 0 so validation reports them
template<typename T>
T toml_count(const toml::node_view<const toml::node> node, T fallback) {
    const auto v = node.value_or(static_cast<int64_t>(fallback));
    return v < 0 ? T{0} : static_cast<T>(v);
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    const auto level_str = l["level"].value_or("info"s);
    const auto level = ConfigLoader::parse_log_level(level_str);
    if (!level) {
        throw std::runtime_error(std::format("logging.level: unknown level '{}'", level_str));
    }
    cfg.level = *level;
    return cfg;
}

SecretDetector::Config extract_secrets(const toml::table& root) {
    SecretDetector::Config cfg;
    const auto* secrets = root["secrets"].as_table();
    if (!secrets) return cfg;
    const auto& s = *secrets;

    cfg.entropy_threshold = s["entropy_threshold"].value_or(cfg.entropy_threshold);
    cfg.entropy_min_length = toml_count(s["entropy_min_length"], cfg.entropy_min_length);
    return cfg;
}

MRESynthesizer::Config extract_mre(const toml::table& root) {
    MRESynthesizer::Config cfg;
    const auto* mre = root["mre"].as_table();
    if (!mre) return cfg;
    const auto& m = *mre;

    cfg.max_lines = toml_count(m["max_lines"], cfg.max_lines);
    cfg.error_summary_chars = toml_count(m["error_summary_chars"], cfg.error_summary_chars);
    return cfg;
}

RefinementConfig extract_refinement(const toml::table& root) {
    RefinementConfig cfg;
    const auto* refinement = root["refinement"].as_table();
    if (!refinement) return cfg;
    const auto& r = *refinement;

    cfg.enabled = r["enabled"].value_or(false);
    const auto mode_str = r["mode"].value_or("per_field"s);
    const auto mode = parse_refinement_mode(mode_str);
    if (!mode) {
        throw std::runtime_error(std::format(
            "refinement.mode must be 'per_field' or 'batch', got '{}'", mode_str));
    }
    cfg.mode = *mode;
    cfg.parallel = r["parallel"].value_or(false);
    cfg.verify_output = r["verify_output"].value_or(true);
    return cfg;
}

LlmClient::Config extract_llm(const toml::table& root) {
    LlmClient::Config cfg;
    const auto* llm = root["llm"].as_table();
    if (!llm) return cfg;
    const auto& l = *llm;

    cfg.enabled = l["enabled"].value_or(false);
    cfg.provider = l["provider"].value_or(cfg.provider);
    cfg.endpoint = l["endpoint"].value_or(cfg.endpoint);
    cfg.api_key = l["api_key"].value_or(""s);
    cfg.default_model = l["model"].value_or(cfg.default_model);
    cfg.timeout_ms = toml_count(l["timeout_ms"], cfg.timeout_ms);
    cfg.max_retries = toml_count(l["max_retries"], cfg.max_retries);
    cfg.max_requests_per_minute = toml_count(l["max_requests_per_minute"], cfg.max_requests_per_minute);
    cfg.cache_enabled = l["cache_enabled"].value_or(true);
    cfg.cache_max_entries = toml_count(l["cache_max_entries"], cfg.cache_max_entries);
    cfg.cache_ttl_seconds = toml_count(l["cache_ttl_seconds"], cfg.cache_ttl_seconds);
    return cfg;
}

SanitizerConfig extract_all_sections(const toml::table& tbl) {
    SanitizerConfig config;
    config.logging = extract_logging(tbl);
    config.secrets = extract_secrets(tbl);
    config.mre = extract_mre(tbl);
    config.refinement = extract_refinement(tbl);
    config.llm = extract_llm(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::optional<utils::log::Level> ConfigLoader::parse_log_level(const std::string& level_str) {
    const std::string lower = utils::to_lower(level_str);
    if (lower == "debug") return utils::log::Level::DEBUG;
    if (lower == "info") return utils::log::Level::INFO;
    if (lower == "warn" || lower == "warning") return utils::log::Level::WARN;
    if (lower == "error") return utils::log::Level::ERROR;
    return std::nullopt;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(SanitizerConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SanitizerConfig& config) {
    std::vector<std::string> errors;

    if (!(config.secrets.entropy_threshold > 0.0 && config.secrets.entropy_threshold <= 8.0)) {
        errors.push_back(std::format("secrets.entropy_threshold must be in (0, 8], got {}",
                                     config.secrets.entropy_threshold));
    }
    if (config.secrets.entropy_min_length < 8) {
        errors.push_back(std::format("secrets.entropy_min_length must be >= 8, got {}",
                                     config.secrets.entropy_min_length));
    }
    if (config.mre.max_lines < 1) {
        errors.push_back("mre.max_lines must be >= 1");
    }

    if (config.llm.provider != "openai" && config.llm.provider != "anthropic") {
        errors.push_back(std::format("llm.provider must be 'openai' or 'anthropic', got '{}'",
                                     config.llm.provider));
    }
    if (config.refinement.enabled && config.llm.enabled && config.llm.endpoint.empty()) {
        errors.push_back("llm.endpoint required when refinement and llm are enabled");
    }

    return errors;
}

} // namespace sanitizer
