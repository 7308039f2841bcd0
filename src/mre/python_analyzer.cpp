#include "mre/python_analyzer.hpp"
#include "mre/python_syntax_checker.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>
#include <string_view>
#include <unordered_set>

namespace sanitizer {

namespace {

const std::unordered_set<std::string_view> STANDARD_MODULES = {
    "json", "os", "sys", "re", "typing", "datetime", "collections",
    "functools", "itertools", "pathlib", "logging", "abc", "math",
    "dataclasses", "enum", "copy", "io", "time", "random", "hashlib",
    "base64", "urllib", "http", "asyncio", "threading", "multiprocessing"
};

const std::unordered_set<std::string_view> COMMON_MODULES = {
    "requests", "httpx", "aiohttp", "numpy", "pandas", "pydantic",
    "fastapi", "flask", "django", "sqlalchemy", "pytest", "unittest",
    "boto3", "google", "azure", "openai", "anthropic", "langchain"
};

std::string_view lstrip(std::string_view s) {
    const auto pos = s.find_first_not_of(" \t");
    return pos == std::string_view::npos ? std::string_view{} : s.substr(pos);
}

// Top-level only: indented imports belong to their enclosing block
bool is_import_line(std::string_view line) {
    return line.starts_with("import ") || line.starts_with("from ");
}

// One physical line that only Python would write
bool is_strong_python_line(std::string_view line) {
    const auto s = lstrip(line);
    if (s.starts_with("def ") || s.starts_with("async def ")) {
        return true;
    }
    if (s.starts_with("class ")) {
        return s.find('{') == std::string_view::npos;
    }
    if (s.starts_with("import ")) {
        return s.find_first_of("\"';{") == std::string_view::npos;
    }
    if (s.starts_with("from ")) {
        return s.find(" import ") != std::string_view::npos;
    }
    if (s.starts_with("elif ") || s.starts_with("try:") || s.starts_with("finally:")) {
        return true;
    }
    return s.starts_with("except:") || s.starts_with("except ");
}

} // anonymous namespace

bool PythonAnalyzer::detect(std::string_view code) const {
    size_t start = 0;
    while (start <= code.size()) {
        auto nl = code.find('\n', start);
        if (nl == std::string_view::npos) nl = code.size();
        if (is_strong_python_line(code.substr(start, nl - start))) {
            return true;
        }
        start = nl + 1;
    }
    return false;
}

CodeAnalysis PythonAnalyzer::analyze(const std::string& code) const {
    CodeAnalysis analysis;
    std::vector<std::string> body_lines;
    for (auto& line : utils::split_lines(code)) {
        if (is_import_line(line)) {
            analysis.imports.emplace_back(std::move(line));
        } else {
            body_lines.emplace_back(std::move(line));
        }
    }
    analysis.body = utils::join_lines(body_lines);
    return analysis;
}

std::string PythonAnalyzer::module_of(std::string_view import_line) {
    auto s = lstrip(import_line);
    size_t keyword_len = 0;
    if (s.starts_with("from")) {
        keyword_len = 4;
    } else if (s.starts_with("import")) {
        keyword_len = 6;
    } else {
        return "";
    }

    // keyword, at least one space, then a word
    size_t i = keyword_len;
    const size_t ws_start = i;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i == ws_start) return "";

    // Relative imports keep their leading dots (".models")
    const size_t name_start = i;
    while (i < s.size() && s[i] == '.') ++i;
    while (i < s.size() && (std::isalnum(static_cast<unsigned char>(s[i])) || s[i] == '_')) ++i;
    return std::string(s.substr(name_start, i - name_start));
}

bool PythonAnalyzer::is_allowed_module(std::string_view module) {
    return STANDARD_MODULES.contains(module) || COMMON_MODULES.contains(module);
}

std::string PythonAnalyzer::filter_import(const std::string& line) const {
    const auto module = module_of(line);
    if (module.empty() || is_allowed_module(module)) {
        return line;
    }
    return std::format("# import {}  # internal module removed", module);
}

std::optional<std::string> PythonAnalyzer::validate(const std::string& code) const {
    return PythonSyntaxChecker::check(code);
}

} // namespace sanitizer
