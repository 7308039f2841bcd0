#include "mre/name_abstractor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <regex>

namespace sanitizer {

namespace {

constexpr std::array<std::string_view, 12> GENERIC_CLASS_NAMES = {
    "ServiceA", "ServiceB", "ClientA", "ClientB",
    "HandlerA", "HandlerB", "ProcessorA", "ProcessorB",
    "ManagerA", "ManagerB", "ControllerA", "ControllerB"
};

constexpr std::array<std::string_view, 9> GENERIC_FUNCTION_NAMES = {
    "process_item", "handle_request", "validate_data",
    "fetch_data", "update_record", "create_item",
    "delete_item", "get_config", "run_task"
};

constexpr std::array<std::string_view, 8> GENERIC_VARIABLE_NAMES = {
    "item", "data", "result", "config",
    "client", "response", "request", "value"
};

constexpr std::array<std::string_view, 9> SKIPPED_KEYWORDS = {
    "if", "else", "for", "while", "return", "import", "from", "class", "def"
};

// Rule tables are compiled once and shared read-only.
const std::regex& domain_class_regex() {
    static const std::regex re(
        R"(\b([A-Z][a-z]{1,64}(?:User|Customer|Order|Product|Payment|Invoice|)"
        R"(Account|Employee|Company|Project|Task|Service|Handler|Manager|)"
        R"(Controller|Processor|Client|Repository|Factory)[A-Za-z]{0,64})\b)",
        std::regex::ECMAScript | std::regex::optimize);
    return re;
}

const std::regex& domain_class_prefix_regex() {
    static const std::regex re(
        R"(\b((?:User|Customer|Order|Product|Payment|Invoice|Account|)"
        R"(Employee|Company|Project|Task)[A-Z][A-Za-z]{0,64})\b)",
        std::regex::ECMAScript | std::regex::optimize);
    return re;
}

const std::regex& domain_function_regex() {
    static const std::regex re(
        R"(\b((?:get|set|create|update|delete|process|handle|validate|fetch|save|load))"
        R"(_?(?:user|customer|order|product|payment|invoice|account|)"
        R"(employee|company|project|task|service|data|record|item)[_a-z]{0,64})\b)",
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    return re;
}

const std::regex& domain_variable_regex() {
    static const std::regex re(
        R"(\b((?:user|customer|order|product|payment|invoice|account|)"
        R"(employee|company|project|task|service)_?[a-z_]{0,64})\b)",
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    return re;
}

template<typename Fn>
void for_each_capture(const std::string& code, const std::regex& re, Fn&& fn) {
    const auto end = std::sregex_iterator();
    for (auto it = std::sregex_iterator(code.begin(), code.end(), re); it != end; ++it) {
        fn((*it).str(1));
    }
}

} // anonymous namespace

std::string NameAbstractor::next_generic(Kind kind) {
    switch (kind) {
        case Kind::CLASS: {
            const size_t n = class_counter_++;
            return n < GENERIC_CLASS_NAMES.size()
                ? std::string(GENERIC_CLASS_NAMES[n]) : std::format("Class{}", n);
        }
        case Kind::FUNCTION: {
            const size_t n = function_counter_++;
            return n < GENERIC_FUNCTION_NAMES.size()
                ? std::string(GENERIC_FUNCTION_NAMES[n]) : std::format("func_{}", n);
        }
        case Kind::VARIABLE:
        default: {
            const size_t n = variable_counter_++;
            return n < GENERIC_VARIABLE_NAMES.size()
                ? std::string(GENERIC_VARIABLE_NAMES[n]) : std::format("var_{}", n);
        }
    }
}

void NameAbstractor::assign(const std::string& original, Kind kind) {
    if (lookup_.contains(original)) {
        return;
    }
    auto generic = next_generic(kind);
    lookup_.emplace(original, generic);
    replacements_.emplace_back(original, std::move(generic));
}

void NameAbstractor::collect(const std::string& code) {
    if (code.empty()) {
        return;
    }

    for_each_capture(code, domain_class_regex(),
        [this](const std::string& name) { assign(name, Kind::CLASS); });
    for_each_capture(code, domain_class_prefix_regex(),
        [this](const std::string& name) { assign(name, Kind::CLASS); });
    for_each_capture(code, domain_function_regex(),
        [this](const std::string& name) { assign(name, Kind::FUNCTION); });
    for_each_capture(code, domain_variable_regex(), [this](const std::string& name) {
        const auto lower = utils::to_lower(name);
        if (std::ranges::find(SKIPPED_KEYWORDS, lower) != SKIPPED_KEYWORDS.end()) {
            return;
        }
        assign(name, Kind::VARIABLE);
    });
}

std::string NameAbstractor::apply(const std::string& code) const {
    if (replacements_.empty() || code.empty()) {
        return code;
    }

    // One alternation, longest identifier first, so a name never loses to its own prefix
    std::vector<std::string_view> names;
    names.reserve(replacements_.size());
    for (const auto& [original, generic] : replacements_) {
        names.emplace_back(original);
    }
    std::ranges::stable_sort(names, [](std::string_view a, std::string_view b) {
        return a.size() > b.size();
    });

    std::string pattern = "\\b(?:";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) pattern += '|';
        pattern += names[i];  // identifiers only: [A-Za-z_]
    }
    pattern += ")\\b";
    const std::regex re(pattern, std::regex::ECMAScript);

    std::string result;
    result.reserve(code.size());
    size_t last = 0;
    const auto end = std::sregex_iterator();
    for (auto it = std::sregex_iterator(code.begin(), code.end(), re); it != end; ++it) {
        const auto& m = *it;
        const auto pos = static_cast<size_t>(m.position(0));
        result.append(code, last, pos - last);
        result += lookup_.at(m.str(0));
        last = pos + static_cast<size_t>(m.length(0));
    }
    result.append(code, last, std::string::npos);
    return result;
}

} // namespace sanitizer
