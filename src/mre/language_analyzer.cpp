#include "mre/language_analyzer.hpp"
#include "mre/python_analyzer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>

namespace sanitizer {

namespace {

bool contains_any(std::string_view code, std::initializer_list<std::string_view> needles) {
    return std::ranges::any_of(needles, [code](std::string_view n) {
        return code.find(n) != std::string_view::npos;
    });
}

} // anonymous namespace

// ============================================================================
// HeuristicAnalyzer
// ============================================================================

bool HeuristicAnalyzer::detect(std::string_view code) const {
    switch (language_) {
        case Language::GO:
            return contains_any(code, {"func "}) && contains_any(code, {"package "});
        case Language::RUST:
            return contains_any(code, {"fn "}) && contains_any(code, {"let ", "mut "});
        case Language::JAVASCRIPT:
            return contains_any(code, {"const ", "let ", "function ", "=> ", "async "});
        case Language::UNKNOWN:
            return true;
        default:
            return false;
    }
}

CodeAnalysis HeuristicAnalyzer::analyze(const std::string& code) const {
    return CodeAnalysis{.imports = {}, .body = code};
}

std::string HeuristicAnalyzer::filter_import(const std::string& line) const {
    return line;
}

std::optional<std::string> HeuristicAnalyzer::validate(const std::string& /*code*/) const {
    return std::nullopt;
}

std::string_view HeuristicAnalyzer::comment_prefix() const {
    switch (language_) {
        case Language::JAVASCRIPT:
        case Language::GO:
        case Language::RUST:
            return "//";
        default:
            return "#";
    }
}

// ============================================================================
// Detection / dispatch
// ============================================================================

Language detect_language(std::string_view code) {
    static constexpr std::array kDetectionOrder = {
        Language::PYTHON, Language::GO, Language::RUST, Language::JAVASCRIPT
    };
    for (const auto lang : kDetectionOrder) {
        if (analyzer_for(lang).detect(code)) {
            return lang;
        }
    }
    return Language::UNKNOWN;
}

const ILanguageAnalyzer& analyzer_for(Language language) {
    static const PythonAnalyzer python;
    static const HeuristicAnalyzer javascript(Language::JAVASCRIPT);
    static const HeuristicAnalyzer go(Language::GO);
    static const HeuristicAnalyzer rust(Language::RUST);
    static const HeuristicAnalyzer unknown(Language::UNKNOWN);

    switch (language) {
        case Language::PYTHON:     return python;
        case Language::JAVASCRIPT: return javascript;
        case Language::GO:         return go;
        case Language::RUST:       return rust;
        case Language::UNKNOWN:    return unknown;
        default:                   return unknown;
    }
}

} // namespace sanitizer
