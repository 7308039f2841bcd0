#include "catalog/pattern_catalog.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace sanitizer {

namespace {

/**
 * @brief Sanity check for compressed IPv6 candidates.
 *
 * Rejects forms that show up in source code far more often than as
 * addresses: scope operators ("Foo::bad") and slices ("x[1::2]", "a[::2]").
 * The loopback shorthand "::1" is always accepted.
 */
bool validate_ipv6_compressed(std::string_view match) {
    if (match == "::1") {
        return true;
    }

    bool has_digit = false;
    bool has_hex_letter = false;
    size_t longest_group = 0;
    size_t group = 0;
    for (const char c : match) {
        if (c == ':') {
            longest_group = std::max(longest_group, group);
            group = 0;
            continue;
        }
        ++group;
        if (std::isdigit(static_cast<unsigned char>(c))) {
            has_digit = true;
        } else {
            has_hex_letter = true;
        }
    }
    longest_group = std::max(longest_group, group);

    return has_digit && (has_hex_letter || longest_group >= 3);
}

using enum SecretCategory;

// ============================================================================
// Secret rules
// ============================================================================

constexpr RuleDefinition kSecretRules[] = {
    // Cloud provider keys
    {"aws_access_key", CLOUD_PROVIDER_KEY, R"(AKIA[0-9A-Z]{16})"},
    {"aws_secret_key", CLOUD_PROVIDER_KEY,
     R"re((?:aws[_-]?secret[_-]?(?:access[_-]?)?key|secret[_-]?key)['"]?\s{0,32}[:=]\s{0,32}['"]?([A-Za-z0-9/+=]{40}))re",
     true, 1},
    // Listed before gcp_api_key: equal spans keep the earlier rule
    {"google_ai_key", AI_PROVIDER_KEY, R"(AIzaSy[A-Za-z0-9_-]{33})"},
    {"gcp_api_key", CLOUD_PROVIDER_KEY, R"(AIza[0-9A-Za-z_-]{35})"},
    {"azure_key", CLOUD_PROVIDER_KEY,
     R"re((?:azure|storage)[_-]?(?:account)?[_-]?key['"]?\s{0,32}[:=]\s{0,32}['"]?([A-Za-z0-9+/=]{88}))re",
     true, 1},

    // AI provider keys
    {"openai_key", AI_PROVIDER_KEY, R"(sk-[A-Za-z0-9]{48,512})"},
    {"openai_key_short", AI_PROVIDER_KEY, R"(sk-[A-Za-z0-9]{3,47})"},
    {"anthropic_key", AI_PROVIDER_KEY, R"(sk-ant-[A-Za-z0-9-]{90,512})"},
    {"huggingface_token", AI_PROVIDER_KEY, R"(hf_[A-Za-z0-9]{34,256})"},
    {"replicate_token", AI_PROVIDER_KEY, R"(r8_[A-Za-z0-9]{36,256})"},

    // Version control
    {"github_oauth", VCS_TOKEN, R"(gho_[A-Za-z0-9]{36,255})"},
    {"github_token", VCS_TOKEN, R"(gh[pousr]_[A-Za-z0-9]{36,255})"},
    {"github_token_short", VCS_TOKEN, R"(gh[pousr]_[A-Za-z0-9]{3,35})"},
    {"gitlab_token", VCS_TOKEN, R"(glpat-[A-Za-z0-9-]{20,256})"},
    {"bitbucket_token", VCS_TOKEN, R"(ATBB[A-Za-z0-9]{32,256})"},

    // Chat and webhooks
    {"slack_token", CHAT_TOKEN, R"(xox[baprs]-[A-Za-z0-9-]{1,256})"},
    {"slack_webhook", CHAT_TOKEN,
     R"(https://hooks\.slack\.com/services/T[A-Z0-9]{1,32}/B[A-Z0-9]{1,32}/[A-Za-z0-9]{1,128})"},
    {"discord_token", CHAT_TOKEN,
     R"([MN][A-Za-z0-9]{23,128}\.[A-Za-z0-9_-]{6}\.[A-Za-z0-9_-]{27,256})"},
    {"discord_webhook", CHAT_TOKEN,
     R"(https://discord(?:app)?\.com/api/webhooks/[0-9]{1,32}/[A-Za-z0-9_-]{1,256})"},

    // Connection strings (the whole URL, credentials included)
    {"postgres_url", DATABASE_URL, R"re(postgres(?:ql)?://[^\s"']{1,1024})re", true},
    {"mysql_url", DATABASE_URL, R"re(mysql://[^:]{1,256}:[^@]{1,256}@[^/]{1,256}/[^\s"']{1,1024})re", true},
    {"mongodb_url", DATABASE_URL, R"re(mongodb(?:\+srv)?://[^:]{1,256}:[^@]{1,256}@[^\s"']{1,1024})re", true},
    {"redis_url", DATABASE_URL, R"re(redis://[^:]{0,256}:[^@]{1,256}@[^\s"']{1,1024})re", true},

    // Auth tokens
    {"jwt_token", AUTH_TOKEN, R"(eyJ[A-Za-z0-9_-]{1,1024}\.eyJ[A-Za-z0-9_-]{1,1024}\.[A-Za-z0-9_-]{1,1024})"},
    {"bearer_token", AUTH_TOKEN, R"([Bb]earer\s{1,16}[A-Za-z0-9_.-]{1,1024})"},

    // PEM blocks, matched by their markers
    {"private_key_rsa", PRIVATE_KEY, "RSA PRIVATE KEY",
     false, 0, SpanMode::WHOLE_MATCH, nullptr, MatchKind::PEM_BLOCK},
    {"private_key_ec", PRIVATE_KEY, "EC PRIVATE KEY",
     false, 0, SpanMode::WHOLE_MATCH, nullptr, MatchKind::PEM_BLOCK},
    {"private_key_openssh", PRIVATE_KEY, "OPENSSH PRIVATE KEY",
     false, 0, SpanMode::WHOLE_MATCH, nullptr, MatchKind::PEM_BLOCK},
    {"private_key_generic", PRIVATE_KEY, "PRIVATE KEY",
     false, 0, SpanMode::WHOLE_MATCH, nullptr, MatchKind::PEM_BLOCK},

    // Payment
    {"stripe_secret_key", PAYMENT_KEY, R"(sk_live_[a-zA-Z0-9]{24,256})"},
    {"stripe_publishable_key", PAYMENT_KEY, R"(pk_live_[a-zA-Z0-9]{24,256})"},
    {"stripe_test_secret_key", PAYMENT_KEY, R"(sk_test_[a-zA-Z0-9]{24,256})"},
    {"stripe_test_publishable_key", PAYMENT_KEY, R"(pk_test_[a-zA-Z0-9]{24,256})"},

    // Messaging APIs
    {"twilio_key", MESSAGING_API_KEY, R"(SK[a-f0-9]{32})"},
    {"sendgrid_key", MESSAGING_API_KEY, R"(SG\.[a-zA-Z0-9_-]{22}\.[a-zA-Z0-9_-]{43})"},

    // Package registries
    {"npm_token", PACKAGE_REGISTRY_TOKEN, R"(npm_[a-zA-Z0-9]{36})"},
    {"pypi_token", PACKAGE_REGISTRY_TOKEN, R"(pypi-[a-zA-Z0-9_-]{36,512})"},
    {"docker_hub_token", PACKAGE_REGISTRY_TOKEN, R"(dckr_pat_[a-zA-Z0-9_-]{27,256})"},

    // key=value heuristics
    {"generic_api_key", GENERIC,
     R"re(['"]?api[_-]?key['"]?\s{0,32}[:=]\s{0,32}['"]([^'"]{20,512})['"])re", true, 1},
    {"generic_secret", GENERIC,
     R"re(['"]?(?:secret|password|passwd|pwd)['"]?\s{0,32}[:=]\s{0,32}['"]([^'"]{1,512})['"])re", true, 1},
    {"generic_token", GENERIC,
     R"re(['"]?(?:access[_-]?)?token['"]?\s{0,32}[:=]\s{0,32}['"]([^'"]{20,512})['"])re", true, 1},
};

// ============================================================================
// PII rules
// ============================================================================

constexpr RuleDefinition kPiiRules[] = {
    {"email", PiiCategory::EMAIL, R"([a-zA-Z0-9._%+-]{1,64}@[a-zA-Z0-9.-]{1,253}\.[a-zA-Z]{2,63})"},

    // Only the "/home/<user>" prefix is replaced; the rest of the path stays
    // in the text and is still scanned by the other rules.
    {"unix_home_path", PiiCategory::HOME_PATH, R"(/(?:Users|home)/([a-zA-Z0-9._-]{1,128}))"},
    {"windows_user_path", PiiCategory::HOME_PATH, R"(C:\\Users\\([a-zA-Z0-9._-]{1,128}))", true},

    {"ipv4_address", PiiCategory::IP_ADDRESS,
     R"(\b(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\b)"},
    {"ipv6_address", PiiCategory::IP_ADDRESS, R"(\b(?:[0-9a-fA-F]{1,4}:){7}[0-9a-fA-F]{1,4}\b)"},
    {"ipv6_compressed", PiiCategory::IP_ADDRESS,
     R"((?:\b(?:(?:[0-9a-fA-F]{1,4}:){1,6}:[0-9a-fA-F]{1,4})"
     R"(|(?:[0-9a-fA-F]{1,4}:){1,5}(?::[0-9a-fA-F]{1,4}){1,2})"
     R"(|(?:[0-9a-fA-F]{1,4}:){1,4}(?::[0-9a-fA-F]{1,4}){1,3})"
     R"(|[0-9a-fA-F]{1,4}::(?:[0-9a-fA-F]{1,4}:){0,4}[0-9a-fA-F]{1,4}))"
     R"(|::(?:[0-9a-fA-F]{1,4}:){0,5}[0-9a-fA-F]{1,4})"
     R"(|::1)(?![0-9A-Za-z_:]))",
     false, 0, SpanMode::WHOLE_MATCH, &validate_ipv6_compressed},

    {"internal_url", PiiCategory::INTERNAL_URL,
     R"(https?://(?:localhost|127\.0\.0\.1|0\.0\.0\.0|[a-zA-Z0-9.-]{1,253}\.(?:local|internal|corp|lan))(?::\d{1,5})?(?:/[^\s]{0,1024})?)",
     true},

    {"phone_us", PiiCategory::PHONE,
     R"(\b(?:\+?1[-.\s]?)?\(?[0-9]{3}\)?[-.\s]?[0-9]{3}[-.\s]?[0-9]{4}\b)"},

    {"credit_card", PiiCategory::CREDIT_CARD,
     R"(\b(?:4[0-9]{12}(?:[0-9]{3})?|5[1-5][0-9]{14}|3[47][0-9]{13}|6(?:011|5[0-9]{2})[0-9]{12})\b)"},

    // Keyword-gated: bare 9-digit groups are never SSNs
    {"ssn", PiiCategory::SSN,
     R"(\b(?:ssn|social[- ]?security)[^\d\n]{0,16}(\d{3}-?\d{2}-?\d{4})\b)",
     true, 1, SpanMode::CAPTURE_ONLY},
};

constexpr std::string_view kCatalogVersion = "2.1.0";

} // anonymous namespace

// ============================================================================
// PatternRule
// ============================================================================

namespace {

/**
 * @brief "-----BEGIN <label>-----" ... "-----END <label>-----" spans.
 *
 * Same result as a lazy regex between the two markers: the body is at least
 * one character and ends at the first footer after the header. A header with
 * no footer after it matches nothing.
 */
std::vector<RuleMatch> find_pem_blocks(std::string_view text, std::string_view label) {
    std::vector<RuleMatch> matches;
    const auto header = std::format("-----BEGIN {}-----", label);
    const auto footer = std::format("-----END {}-----", label);

    size_t pos = 0;
    while (pos < text.size()) {
        const auto begin = text.find(header, pos);
        if (begin == std::string_view::npos) {
            break;
        }
        const auto close = text.find(footer, begin + header.size() + 1);
        if (close == std::string_view::npos) {
            break;
        }
        const auto end = close + footer.size();
        matches.push_back(RuleMatch{
            .start = begin,
            .end = end,
            .matched_text = std::string(text.substr(begin, end - begin)),
        });
        pos = end;
    }
    return matches;
}

} // anonymous namespace

std::vector<RuleMatch> PatternRule::find_all(const std::string& text) const {
    std::vector<RuleMatch> matches;
    if (text.empty()) {
        return matches;
    }
    if (kind == MatchKind::PEM_BLOCK) {
        return find_pem_blocks(text, pem_label);
    }

    const auto end = std::sregex_iterator();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), matcher); it != end; ++it) {
        const auto& m = *it;
        if (m.length(0) == 0) {
            continue;
        }

        const bool group_matched = capture_group > 0
            && static_cast<size_t>(capture_group) < m.size()
            && m[capture_group].matched;

        RuleMatch match;
        match.matched_text = group_matched ? m.str(capture_group) : m.str(0);
        if (span == SpanMode::CAPTURE_ONLY && group_matched) {
            match.start = static_cast<size_t>(m.position(capture_group));
            match.end = match.start + static_cast<size_t>(m.length(capture_group));
        } else {
            match.start = static_cast<size_t>(m.position(0));
            match.end = match.start + static_cast<size_t>(m.length(0));
        }

        if (validator && !validator(match.matched_text)) {
            continue;
        }
        matches.emplace_back(std::move(match));
    }
    return matches;
}

// ============================================================================
// PatternCatalog
// ============================================================================

PatternCatalog::PatternCatalog(std::span<const RuleDefinition> secret_definitions,
                               std::span<const RuleDefinition> pii_definitions)
    : secret_rules_(compile(secret_definitions)),
      pii_rules_(compile(pii_definitions)) {}

std::vector<PatternRule> PatternCatalog::compile(std::span<const RuleDefinition> definitions) {
    std::vector<PatternRule> rules;
    rules.reserve(definitions.size());

    for (const auto& def : definitions) {
        if (def.kind == MatchKind::PEM_BLOCK) {
            rules.push_back(PatternRule{
                .name = std::string(def.name),
                .category = def.category,
                .matcher = {},
                .kind = MatchKind::PEM_BLOCK,
                .pem_label = std::string(def.pattern),
            });
            continue;
        }

        auto flags = std::regex::ECMAScript | std::regex::optimize;
        if (def.case_insensitive) {
            flags |= std::regex::icase;
        }

        try {
            rules.push_back(PatternRule{
                .name = std::string(def.name),
                .category = def.category,
                .matcher = std::regex(def.pattern.begin(), def.pattern.end(), flags),
                .capture_group = def.capture_group,
                .span = def.span,
                .validator = def.validator,
                .kind = def.kind,
            });
        } catch (const std::regex_error& e) {
            throw SanitizerError(ErrorCategory::CATALOG_ERROR,
                std::format("Pattern catalog: rule '{}' failed to compile: {}", def.name, e.what()));
        }
    }
    return rules;
}

const PatternCatalog& PatternCatalog::instance() {
    static const PatternCatalog catalog = [] {
        PatternCatalog c(default_secret_definitions(), default_pii_definitions());
        utils::log::info(std::format("Pattern catalog v{}: {} secret rules, {} PII rules",
            kCatalogVersion, c.secret_rules().size(), c.pii_rules().size()));
        return c;
    }();
    return catalog;
}

std::span<const RuleDefinition> PatternCatalog::default_secret_definitions() {
    return kSecretRules;
}

std::span<const RuleDefinition> PatternCatalog::default_pii_definitions() {
    return kPiiRules;
}

const PatternRule* PatternCatalog::find(std::string_view name) const {
    for (const auto* table : {&secret_rules_, &pii_rules_}) {
        const auto it = std::ranges::find(*table, name, &PatternRule::name);
        if (it != table->end()) {
            return &*it;
        }
    }
    return nullptr;
}

std::string_view PatternCatalog::version() {
    return kCatalogVersion;
}

std::string PatternCatalog::secret_placeholder(std::string_view rule_name) {
    return std::format("<{}_REDACTED>", utils::to_upper(rule_name));
}

std::string_view PatternCatalog::pii_prefix(PiiCategory category) {
    switch (category) {
        case PiiCategory::EMAIL:        return "EMAIL";
        case PiiCategory::HOME_PATH:    return "";
        case PiiCategory::IP_ADDRESS:   return "IP";
        case PiiCategory::INTERNAL_URL: return "URL";
        case PiiCategory::PHONE:        return "PHONE";
        case PiiCategory::CREDIT_CARD:  return "CREDIT_CARD";
        case PiiCategory::SSN:          return "SSN";
        default:                        return "PII";
    }
}

} // namespace sanitizer
